/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: DuplicateMatcher.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Finds transactions that plausibly record the same real-world event twice
 * (bank export + payslip, for instance) and keeps a status per directed
 * pair: PENDING -> CONFIRMED | REJECTED, and back to PENDING.
 *
 * Scoring, first rule that holds wins:
 *   exact     amount delta < exact_amount_delta, same date, similarity > exact_similarity
 *   probable  amount delta < tolerance, date within tolerance, similarity > probable_similarity
 *   possible  amount delta < tolerance, date within tolerance
 *   baseline  otherwise (in the pool, not actionable)
 * ============================================================================
 */

#ifndef ASSETS_DUPLICATE_MATCHER_HPP
#define ASSETS_DUPLICATE_MATCHER_HPP

#include "config.hpp"
#include "store.hpp"
#include <vector>

namespace assets {

    struct MatchCandidate {
        Transaction transaction;
        double confidence = 0.0;
        MatchTier tier = MatchTier::Possible;
        MatchCriteria criteria;
    };

    class DuplicateMatcher {
    public:
        explicit DuplicateMatcher(const MatchingConfig& config);

        /**
         * find_candidates
         * Transactions other than `id` dated within `date_tolerance_days`,
         * whose amount is within `amount_tolerance`, and whose import source
         * differs from the reference's (two missing sources are equal).
         * Ordered by confidence desc, date delta asc, amount delta asc.
         */
        std::vector<MatchCandidate> find_candidates(UnitOfWork& uow, const TransactionId& id,
                                                    money_micro amount_tolerance, int date_tolerance_days);

        MatchCriteria compare(const TransactionWithEntries& reference,
                              const TransactionWithEntries& candidate) const;
        double score(const MatchCriteria& criteria, money_micro amount_tolerance, int date_tolerance_days) const;
        MatchTier tier_for(double confidence) const;

        // Idempotent per ordered pair: an existing row keeps its id and
        // status and takes the new confidence, criteria and tier.
        TransactionMatch record_match(UnitOfWork& uow, const TransactionId& primary, const TransactionId& duplicate,
                                      double confidence, const MatchCriteria& criteria);

        void update_match_status(UnitOfWork& uow, const MatchId& id, MatchStatus status);

        TransactionMatch get_match(UnitOfWork& uow, const MatchId& id);
        std::vector<TransactionMatch> matches_for(UnitOfWork& uow, const TransactionId& id);
        std::vector<TransactionMatch> list_matches(UnitOfWork& uow, const std::optional<MatchStatus>& status);

        // Records every candidate of every batch transaction scoring at
        // least min_record_confidence. Returns the recorded rows.
        std::vector<TransactionMatch> detect_duplicates_for_batch(UnitOfWork& uow, const BatchId& batch);

        const MatchingConfig& config() const { return config_; }

    private:
        MatchingConfig config_;
    };

} // namespace assets

#endif // ASSETS_DUPLICATE_MATCHER_HPP
