/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: MergeManager.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Hides a confirmed duplicate from aggregation without deleting it. The
 * hidden flags (is_duplicate, merged_into) and the match status of the pair
 * are always written in the same unit of work. Entries are never touched.
 * ============================================================================
 */

#ifndef ASSETS_MERGE_MANAGER_HPP
#define ASSETS_MERGE_MANAGER_HPP

#include "DuplicateMatcher.hpp"
#include "store.hpp"
#include <vector>

namespace assets {

    class MergeManager {
    public:
        explicit MergeManager(DuplicateMatcher& matcher);

        /**
         * merge
         * Hides `duplicate` behind `primary` and confirms every match row
         * between the two. Without a row in either direction, one is created
         * at confidence 1.0 / EXACT and flagged as created by the merge.
         * @throws SelfMerge, AlreadyMerged, TransactionNotFound
         */
        void merge(UnitOfWork& uow, const TransactionId& primary, const TransactionId& duplicate);

        /**
         * unmerge
         * Exact inverse of merge: clears the flags, returns the pair's match
         * rows to PENDING and drops the row merge created.
         * @throws NotMerged, TransactionNotFound
         */
        void unmerge(UnitOfWork& uow, const TransactionId& id);

        std::vector<Transaction> hidden_transactions(UnitOfWork& uow);
        std::vector<Transaction> merged_into(UnitOfWork& uow, const TransactionId& primary);

    private:
        DuplicateMatcher& matcher_;
    };

} // namespace assets

#endif // ASSETS_MERGE_MANAGER_HPP
