/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: PostingEngine.cpp
 * ============================================================================
 */

#include "PostingEngine.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <set>

namespace assets {

namespace {

money_micro sum_of(const std::vector<EntryInput>& entries) {
    money_micro sum = 0;
    for (const auto& entry : entries) sum = add_money(sum, entry.amount);
    return sum;
}

money_micro sum_of(const std::vector<JournalEntry>& entries) {
    money_micro sum = 0;
    for (const auto& entry : entries) sum = add_money(sum, entry.amount);
    return sum;
}

EntryInput entry(const std::string& account, money_micro amount, AccountType hint) {
    EntryInput e;
    e.account = account;
    e.amount = amount;
    e.type_hint = hint;
    return e;
}

NewTransaction two_entry(const std::string& debit, AccountType debit_type,
                         const std::string& credit, AccountType credit_type,
                         money_micro amount, const std::string& description, const Date& date) {
    if (amount <= 0) {
        throw LedgerError(ErrorKind::InvalidAmount, "Amount must be positive, got " + format_money(amount) + ".");
    }
    NewTransaction request;
    request.description = description;
    request.date = date;
    request.entries.push_back(entry(debit, amount, debit_type));
    request.entries.push_back(entry(credit, -amount, credit_type));
    return request;
}

} // namespace

PostingEngine::PostingEngine(AccountDirectory& directory) : directory_(directory) {}

void PostingEngine::check_entries(const std::vector<EntryInput>& entries) const {
    if (entries.size() < 2) {
        throw LedgerError(ErrorKind::EmptyTransaction,
                          "A transaction needs at least 2 entries, got " + std::to_string(entries.size()) + ".");
    }
    money_micro sum = sum_of(entries);
    if (sum != 0) {
        throw LedgerError(ErrorKind::UnbalancedTransaction,
                          "Entries must sum to zero, got " + format_money(sum) + ".");
    }
}

std::vector<AccountId> PostingEngine::resolve_accounts(UnitOfWork& uow, const NewTransaction& request, bool create) {
    std::vector<AccountId> ids;
    for (const auto& e : request.entries) {
        if (e.account.empty()) {
            throw LedgerError(ErrorKind::InvalidPath, "Entry has no account.");
        }

        std::optional<Account> account = uow.find_account(e.account);
        if (!account) {
            std::optional<AccountId> id;
            if (create) {
                id = directory_.resolve_or_create(uow, e.account, e.type_hint ? *e.type_hint : request.type_hint,
                                                  request.created_by);
            } else {
                id = directory_.resolve(uow, e.account);
            }
            if (!id) {
                throw LedgerError(ErrorKind::AccountNotFound, "Account '" + e.account + "' does not exist.");
            }
            account = directory_.get_account(uow, *id);
        }
        if (!account->is_active) {
            throw LedgerError(ErrorKind::AccountInactive, "Account " + account->full_path + " is inactive.");
        }
        ids.push_back(account->id);
    }
    return ids;
}

void PostingEngine::insert_entries(UnitOfWork& uow, const TransactionId& id, const std::vector<EntryInput>& entries,
                                   const std::vector<AccountId>& accounts) {
    for (size_t i = 0; i < entries.size(); ++i) {
        JournalEntry row;
        row.id = LedgerCrypto::generate_uuid();
        row.transaction_id = id;
        row.account_id = accounts[i];
        row.amount = entries[i].amount;
        row.memo = entries[i].memo;
        row.position = static_cast<int>(i);
        uow.insert_entry(row);
    }

    // Verify what the store now holds, not what was requested.
    std::vector<JournalEntry> stored = uow.entries_of(id);
    money_micro sum = sum_of(stored);
    if (sum != 0 || stored.size() != entries.size()) {
        log("ERROR", "Transaction " + id + " failed the pre-commit balance check (sum " + format_money(sum) + ").");
        throw LedgerError(ErrorKind::UnbalancedTransaction,
                          "Entries must sum to zero, got " + format_money(sum) + ".");
    }
}

Transaction PostingEngine::post(UnitOfWork& uow, const NewTransaction& request) {
    check_entries(request.entries);
    std::vector<AccountId> accounts = resolve_accounts(uow, request, false);

    Transaction txn;
    txn.id = LedgerCrypto::generate_uuid();
    txn.description = request.description;
    txn.reference = request.reference;
    txn.date = request.date;
    txn.import_source = request.import_source;
    txn.import_batch_id = request.import_batch_id;
    txn.external_reference = request.external_reference;
    txn.created_by = request.created_by;
    uow.insert_transaction(txn);
    insert_entries(uow, txn.id, request.entries, accounts);

    log("INFO", "Transaction posted: " + txn.id + " '" + txn.description + "' on " + txn.date.to_string() +
                " (" + std::to_string(request.entries.size()) + " entries)");
    return txn;
}

void PostingEngine::replace_entries(UnitOfWork& uow, const TransactionId& id, const std::vector<EntryInput>& entries) {
    uow.lock_transaction(id);
    if (!uow.find_transaction(id)) {
        throw LedgerError(ErrorKind::TransactionNotFound, "Transaction " + id + " does not exist.");
    }
    check_entries(entries);

    NewTransaction request;
    request.entries = entries;
    std::vector<AccountId> accounts = resolve_accounts(uow, request, false);

    uow.delete_entries(id);
    insert_entries(uow, id, entries, accounts);
    log("INFO", "Transaction entries replaced: " + id + " (" + std::to_string(entries.size()) + " entries)");
}

void PostingEngine::delete_transaction(UnitOfWork& uow, const TransactionId& id) {
    uow.lock_transaction(id);
    if (!uow.find_transaction(id)) {
        throw LedgerError(ErrorKind::TransactionNotFound, "Transaction " + id + " does not exist.");
    }
    std::vector<Transaction> merged = uow.transactions_merged_into(id);
    if (!merged.empty()) {
        throw LedgerError(ErrorKind::TransactionHasMergedDuplicates,
                          "Transaction " + id + " has " + std::to_string(merged.size()) +
                          " merged duplicates; unmerge them first.");
    }
    uow.delete_transaction(id);
    log("WARN", "Transaction deleted: " + id);
}

TransactionWithEntries PostingEngine::get_transaction(UnitOfWork& uow, const TransactionId& id) {
    std::optional<Transaction> txn = uow.find_transaction(id);
    if (!txn) {
        throw LedgerError(ErrorKind::TransactionNotFound, "Transaction " + id + " does not exist.");
    }
    TransactionWithEntries out;
    out.transaction = *txn;
    out.entries = uow.entries_of(id);
    return out;
}

std::vector<TransactionWithEntries> PostingEngine::list_transactions(UnitOfWork& uow,
                                                                     const TransactionFilter& filter) {
    TransactionQuery query;
    query.from = filter.from;
    query.to = filter.to;
    query.import_batch_id = filter.import_batch_id;
    query.include_hidden = filter.include_hidden;

    std::set<AccountId> scope;
    if (filter.account_prefix) {
        for (const auto& account : directory_.subtree_of_path(uow, *filter.account_prefix)) {
            scope.insert(account.id);
        }
        if (scope.empty()) return {};
    }

    std::vector<TransactionWithEntries> out;
    for (const auto& txn : uow.query_transactions(query)) {
        TransactionWithEntries item;
        item.transaction = txn;
        item.entries = uow.entries_of(txn.id);
        if (!scope.empty()) {
            bool touches = false;
            for (const auto& e : item.entries) {
                if (scope.count(e.account_id)) { touches = true; break; }
            }
            if (!touches) continue;
        }
        out.push_back(item);
    }
    return out;
}

money_micro PostingEngine::transaction_amount(UnitOfWork& uow, const TransactionId& id) {
    return get_transaction(uow, id).amount();
}

std::vector<UnbalancedRecord> PostingEngine::audit_balances(UnitOfWork& uow) {
    std::vector<UnbalancedRecord> out;
    TransactionQuery everything;
    for (const auto& txn : uow.query_transactions(everything)) {
        std::vector<JournalEntry> entries = uow.entries_of(txn.id);
        money_micro sum = sum_of(entries);
        if (sum != 0) {
            UnbalancedRecord record;
            record.transaction_id = txn.id;
            record.sum = sum;
            record.entry_count = entries.size();
            out.push_back(record);
            log("ERROR", "Balance audit: transaction " + txn.id + " sums to " + format_money(sum));
        }
    }
    return out;
}

NewTransaction PostingEngine::make_transfer(const std::string& from, const std::string& to, money_micro amount,
                                            const std::string& description, const Date& date) {
    return two_entry(to, AccountType::Asset, from, AccountType::Asset, amount, description, date);
}

NewTransaction PostingEngine::make_income(const std::string& asset, const std::string& income, money_micro amount,
                                          const std::string& description, const Date& date) {
    return two_entry(asset, AccountType::Asset, income, AccountType::Income, amount, description, date);
}

NewTransaction PostingEngine::make_expense(const std::string& asset, const std::string& expense, money_micro amount,
                                           const std::string& description, const Date& date) {
    return two_entry(expense, AccountType::Expense, asset, AccountType::Asset, amount, description, date);
}

} // namespace assets
