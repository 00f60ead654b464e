/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: DuplicateMatcher.cpp
 * ============================================================================
 */

#include "DuplicateMatcher.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "similarity.hpp"
#include <algorithm>
#include <sstream>

namespace assets {

namespace {

TransactionWithEntries load(UnitOfWork& uow, const TransactionId& id) {
    std::optional<Transaction> txn = uow.find_transaction(id);
    if (!txn) {
        throw LedgerError(ErrorKind::TransactionNotFound, "Transaction " + id + " does not exist.");
    }
    TransactionWithEntries out;
    out.transaction = *txn;
    out.entries = uow.entries_of(id);
    return out;
}

bool by_confidence(const TransactionMatch& a, const TransactionMatch& b) {
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    return a.id < b.id;
}

std::string confidence_text(double confidence) {
    std::ostringstream ss;
    ss.precision(2);
    ss << std::fixed << confidence;
    return ss.str();
}

bool transition_allowed(MatchStatus from, MatchStatus to) {
    if (from == MatchStatus::Pending) return to == MatchStatus::Confirmed || to == MatchStatus::Rejected;
    return to == MatchStatus::Pending;
}

} // namespace

DuplicateMatcher::DuplicateMatcher(const MatchingConfig& config) : config_(config) {}

MatchCriteria DuplicateMatcher::compare(const TransactionWithEntries& reference,
                                        const TransactionWithEntries& candidate) const {
    MatchCriteria criteria;
    criteria.amount_diff = abs_money(candidate.amount() - reference.amount());
    criteria.date_diff_days = days_between(reference.transaction.date, candidate.transaction.date);
    criteria.description_similarity = trigram_similarity(reference.transaction.description,
                                                         candidate.transaction.description);
    criteria.same_date = criteria.date_diff_days == 0;
    criteria.same_amount = criteria.amount_diff < config_.exact_amount_delta;
    return criteria;
}

double DuplicateMatcher::score(const MatchCriteria& c, money_micro amount_tolerance, int date_tolerance_days) const {
    bool within_amount = c.amount_diff < amount_tolerance;
    bool within_date = c.date_diff_days <= date_tolerance_days;

    if (c.amount_diff < config_.exact_amount_delta && c.same_date &&
        c.description_similarity > config_.exact_similarity) {
        return config_.exact_confidence;
    }
    if (within_amount && within_date && c.description_similarity > config_.probable_similarity) {
        return config_.probable_confidence;
    }
    if (within_amount && within_date) {
        return config_.possible_confidence;
    }
    return config_.baseline_confidence;
}

MatchTier DuplicateMatcher::tier_for(double confidence) const {
    if (confidence >= config_.exact_confidence) return MatchTier::Exact;
    if (confidence >= config_.probable_confidence) return MatchTier::Probable;
    return MatchTier::Possible;
}

std::vector<MatchCandidate> DuplicateMatcher::find_candidates(UnitOfWork& uow, const TransactionId& id,
                                                              money_micro amount_tolerance,
                                                              int date_tolerance_days) {
    if (amount_tolerance < 0) {
        throw LedgerError(ErrorKind::InvalidAmount, "Amount tolerance cannot be negative.");
    }
    if (date_tolerance_days < 0) {
        throw LedgerError(ErrorKind::InvalidDate, "Date tolerance cannot be negative.");
    }

    TransactionWithEntries reference = load(uow, id);

    TransactionQuery window;
    window.from = reference.transaction.date.add_days(-date_tolerance_days);
    window.to = reference.transaction.date.add_days(date_tolerance_days);

    std::vector<MatchCandidate> out;
    for (const auto& txn : uow.query_transactions(window)) {
        if (txn.id == reference.transaction.id) continue;
        // Same-source duplicates are a different problem; two missing
        // sources count as the same source.
        if (txn.import_source == reference.transaction.import_source) continue;

        TransactionWithEntries candidate;
        candidate.transaction = txn;
        candidate.entries = uow.entries_of(txn.id);

        MatchCriteria criteria = compare(reference, candidate);
        if (criteria.amount_diff > amount_tolerance) continue;

        MatchCandidate c;
        c.transaction = txn;
        c.criteria = criteria;
        c.confidence = score(criteria, amount_tolerance, date_tolerance_days);
        c.tier = tier_for(c.confidence);
        out.push_back(c);
    }

    std::sort(out.begin(), out.end(), [](const MatchCandidate& a, const MatchCandidate& b) {
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        if (a.criteria.date_diff_days != b.criteria.date_diff_days) {
            return a.criteria.date_diff_days < b.criteria.date_diff_days;
        }
        if (a.criteria.amount_diff != b.criteria.amount_diff) return a.criteria.amount_diff < b.criteria.amount_diff;
        return a.transaction.id < b.transaction.id;
    });

    log("DEBUG", "Duplicate scan of " + id + ": " + std::to_string(out.size()) + " candidates");
    return out;
}

TransactionMatch DuplicateMatcher::record_match(UnitOfWork& uow, const TransactionId& primary,
                                                const TransactionId& duplicate, double confidence,
                                                const MatchCriteria& criteria) {
    if (primary == duplicate) {
        throw LedgerError(ErrorKind::SelfMatch, "A transaction cannot duplicate itself.");
    }
    if (!(confidence >= 0.0 && confidence <= 1.0)) {
        throw LedgerError(ErrorKind::InvalidConfidence,
                          "Confidence must be within [0, 1], got " + std::to_string(confidence) + ".");
    }
    load(uow, primary);
    load(uow, duplicate);

    std::optional<TransactionMatch> existing = uow.find_match_pair(primary, duplicate);
    if (existing) {
        existing->confidence = confidence;
        existing->criteria = criteria;
        existing->tier = tier_for(confidence);
        existing->created_by_merge = false;
        uow.update_match(*existing);
        log("INFO", "Match updated: " + primary + " -> " + duplicate + " (" + confidence_text(confidence) + ")");
        return *existing;
    }

    TransactionMatch match;
    match.id = LedgerCrypto::generate_uuid();
    match.primary_id = primary;
    match.duplicate_id = duplicate;
    match.confidence = confidence;
    match.criteria = criteria;
    match.tier = tier_for(confidence);
    match.status = MatchStatus::Pending;
    uow.insert_match(match);
    log("INFO", "Match recorded: " + primary + " -> " + duplicate + " (" + to_string(match.tier) + ", " +
                confidence_text(confidence) + ")");
    return match;
}

void DuplicateMatcher::update_match_status(UnitOfWork& uow, const MatchId& id, MatchStatus status) {
    TransactionMatch match = get_match(uow, id);
    if (match.status == status) return;

    if (!transition_allowed(match.status, status)) {
        throw LedgerError(ErrorKind::InvalidStatusTransition,
                          std::string("Match cannot move from ") + to_string(match.status) + " to " +
                          to_string(status) + ".");
    }

    if (match.status == MatchStatus::Confirmed) {
        uow.lock_transaction(std::min(match.primary_id, match.duplicate_id));
        uow.lock_transaction(std::max(match.primary_id, match.duplicate_id));
        std::optional<Transaction> primary = uow.find_transaction(match.primary_id);
        std::optional<Transaction> duplicate = uow.find_transaction(match.duplicate_id);
        bool merged = (duplicate && duplicate->is_duplicate && duplicate->merged_into == match.primary_id) ||
                      (primary && primary->is_duplicate && primary->merged_into == match.duplicate_id);
        if (merged) {
            throw LedgerError(ErrorKind::InvalidStatusTransition,
                              "The pair is merged; unmerge it instead of changing the match status.");
        }
    }

    match.status = status;
    uow.update_match(match);
    log("INFO", "Match " + id + " is now " + to_string(status));
}

TransactionMatch DuplicateMatcher::get_match(UnitOfWork& uow, const MatchId& id) {
    std::optional<TransactionMatch> match = uow.find_match(id);
    if (!match) {
        throw LedgerError(ErrorKind::MatchNotFound, "Match " + id + " does not exist.");
    }
    return *match;
}

std::vector<TransactionMatch> DuplicateMatcher::matches_for(UnitOfWork& uow, const TransactionId& id) {
    load(uow, id);
    std::vector<TransactionMatch> out = uow.matches_involving(id);
    std::sort(out.begin(), out.end(), by_confidence);
    return out;
}

std::vector<TransactionMatch> DuplicateMatcher::list_matches(UnitOfWork& uow,
                                                             const std::optional<MatchStatus>& status) {
    std::vector<TransactionMatch> out;
    for (const auto& match : uow.all_matches()) {
        if (!status || match.status == *status) out.push_back(match);
    }
    std::sort(out.begin(), out.end(), by_confidence);
    return out;
}

std::vector<TransactionMatch> DuplicateMatcher::detect_duplicates_for_batch(UnitOfWork& uow, const BatchId& batch) {
    TransactionQuery query;
    query.import_batch_id = batch;

    std::vector<TransactionMatch> recorded;
    for (const auto& txn : uow.query_transactions(query)) {
        for (const auto& candidate : find_candidates(uow, txn.id, config_.amount_tolerance,
                                                     config_.date_tolerance_days)) {
            if (candidate.confidence < config_.min_record_confidence) continue;
            recorded.push_back(record_match(uow, txn.id, candidate.transaction.id,
                                            candidate.confidence, candidate.criteria));
        }
    }
    log("INFO", "Batch " + batch + " scanned: " + std::to_string(recorded.size()) + " matches recorded");
    return recorded;
}

} // namespace assets
