/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: MemoryStore.hpp
 * ============================================================================
 * * DESCRIPTION:
 * In-process ledger store. Units of work are serialised by one mutex; each
 * unit works on a private copy of the state which replaces the shared state
 * on commit, so an abandoned unit leaves nothing behind and no reader ever
 * observes a half-written transaction.
 * ============================================================================
 */

#ifndef ASSETS_MEMORY_STORE_HPP
#define ASSETS_MEMORY_STORE_HPP

#include "../core/store.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <utility>

namespace assets {
namespace storage {

    struct MemoryState {
        std::map<AccountId, Account> accounts;
        std::map<UserId, User> users;
        std::map<std::pair<AccountId, UserId>, OwnershipShare> shares;
        std::map<TransactionId, Transaction> transactions;
        std::map<TransactionId, std::vector<JournalEntry>> entries;
        std::map<MatchId, TransactionMatch> matches;
        std::vector<ImportedFile> imports;      // insertion order
    };

    class MemoryStore : public LedgerStore {
    public:
        MemoryStore();

        std::unique_ptr<UnitOfWork> begin() override;
        std::string backend_name() const override { return "memory"; }

        /**
         * @brief Simulates an outage: begin() and commit() fail with
         * StoreUnavailable while the store is marked unavailable.
         */
        void set_available(bool available) { available_ = available; }
        bool available() const { return available_; }

    private:
        friend class MemoryUnitOfWork;

        std::mutex mutex_;
        MemoryState state_;
        std::atomic<bool> available_;
    };

} // namespace storage
} // namespace assets

#endif // ASSETS_MEMORY_STORE_HPP
