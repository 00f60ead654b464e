/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: MergeManager.cpp
 * ============================================================================
 */

#include "MergeManager.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace assets {

namespace {

Transaction require(UnitOfWork& uow, const TransactionId& id) {
    std::optional<Transaction> txn = uow.find_transaction(id);
    if (!txn) {
        throw LedgerError(ErrorKind::TransactionNotFound, "Transaction " + id + " does not exist.");
    }
    return *txn;
}

// Row locks in id order so two merges of the same pair cannot deadlock.
void lock_pair(UnitOfWork& uow, const TransactionId& a, const TransactionId& b) {
    if (a < b) {
        uow.lock_transaction(a);
        uow.lock_transaction(b);
    } else {
        uow.lock_transaction(b);
        uow.lock_transaction(a);
    }
}

std::vector<TransactionMatch> rows_between(UnitOfWork& uow, const TransactionId& a, const TransactionId& b) {
    std::vector<TransactionMatch> out;
    if (std::optional<TransactionMatch> m = uow.find_match_pair(a, b)) out.push_back(*m);
    if (std::optional<TransactionMatch> m = uow.find_match_pair(b, a)) out.push_back(*m);
    return out;
}

} // namespace

MergeManager::MergeManager(DuplicateMatcher& matcher) : matcher_(matcher) {}

void MergeManager::merge(UnitOfWork& uow, const TransactionId& primary_id, const TransactionId& duplicate_id) {
    if (primary_id == duplicate_id) {
        throw LedgerError(ErrorKind::SelfMerge, "A transaction cannot be merged into itself.");
    }
    lock_pair(uow, primary_id, duplicate_id);

    Transaction primary = require(uow, primary_id);
    Transaction duplicate = require(uow, duplicate_id);
    if (duplicate.is_duplicate) {
        throw LedgerError(ErrorKind::AlreadyMerged,
                          "Transaction " + duplicate_id + " is already merged into " +
                          duplicate.merged_into.value_or("another transaction") + ".");
    }
    if (primary.is_duplicate) {
        throw LedgerError(ErrorKind::AlreadyMerged,
                          "Primary transaction " + primary_id + " is itself hidden as a duplicate.");
    }

    std::vector<TransactionMatch> rows = rows_between(uow, primary_id, duplicate_id);
    if (rows.empty()) {
        TransactionWithEntries a;
        a.transaction = primary;
        a.entries = uow.entries_of(primary_id);
        TransactionWithEntries b;
        b.transaction = duplicate;
        b.entries = uow.entries_of(duplicate_id);

        TransactionMatch match;
        match.id = LedgerCrypto::generate_uuid();
        match.primary_id = primary_id;
        match.duplicate_id = duplicate_id;
        match.confidence = 1.0;
        match.criteria = matcher_.compare(a, b);
        match.criteria.manual = true;
        match.tier = MatchTier::Exact;
        match.status = MatchStatus::Confirmed;
        match.created_by_merge = true;
        uow.insert_match(match);
    } else {
        for (auto& row : rows) {
            row.status = MatchStatus::Confirmed;
            uow.update_match(row);
        }
    }

    uow.update_transaction_flags(duplicate_id, true, primary_id);
    log("INFO", "Merged " + duplicate_id + " into " + primary_id);
}

void MergeManager::unmerge(UnitOfWork& uow, const TransactionId& id) {
    Transaction txn = require(uow, id);
    if (!txn.is_duplicate) {
        throw LedgerError(ErrorKind::NotMerged, "Transaction " + id + " is not merged.");
    }

    if (txn.merged_into) {
        lock_pair(uow, id, *txn.merged_into);
        for (auto& row : rows_between(uow, id, *txn.merged_into)) {
            if (row.created_by_merge) {
                uow.delete_match(row.id);
            } else {
                row.status = MatchStatus::Pending;
                uow.update_match(row);
            }
        }
    } else {
        uow.lock_transaction(id);
    }

    uow.update_transaction_flags(id, false, std::nullopt);
    log("INFO", "Unmerged " + id + (txn.merged_into ? " from " + *txn.merged_into : std::string()));
}

std::vector<Transaction> MergeManager::hidden_transactions(UnitOfWork& uow) {
    std::vector<Transaction> out;
    for (const auto& txn : uow.query_transactions(TransactionQuery())) {
        if (txn.is_duplicate) out.push_back(txn);
    }
    return out;
}

std::vector<Transaction> MergeManager::merged_into(UnitOfWork& uow, const TransactionId& primary) {
    require(uow, primary);
    return uow.transactions_merged_into(primary);
}

} // namespace assets
