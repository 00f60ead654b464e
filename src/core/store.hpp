/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: store.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Persistence contract of the ledger core.
 *
 * Every core operation runs inside exactly one UnitOfWork. A unit sees its
 * own writes, is isolated from other units' uncommitted writes, and is
 * rolled back in full if it is destroyed without commit(). Backends:
 *
 *  - storage::MemoryStore  in-process, serialised units (tests, embedding)
 *  - storage::PgStore      PostgreSQL through libpqxx
 *
 * The store holds rows only. Every invariant (zero-sum, ownership ceiling,
 * sibling-name uniqueness, match/merge consistency) is checked by the core
 * before it writes, so the rules hold identically on every backend.
 * ============================================================================
 */

#ifndef ASSETS_STORE_HPP
#define ASSETS_STORE_HPP

#include "models.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace assets {

    struct TransactionQuery {
        std::optional<Date> from;           // inclusive
        std::optional<Date> to;             // inclusive
        std::optional<BatchId> import_batch_id;
        bool include_hidden = true;
    };

    class UnitOfWork {
    public:
        virtual ~UnitOfWork() {}

        // --- accounts --------------------------------------------------------
        virtual std::optional<Account> find_account(const AccountId& id) = 0;
        // Accounts named `name` directly under `parent` (roots when empty).
        // The sibling-uniqueness invariant means at most one is ever returned.
        virtual std::vector<Account> find_children_named(const std::optional<AccountId>& parent,
                                                         const std::string& name) = 0;
        virtual std::vector<Account> children_of(const std::optional<AccountId>& parent) = 0;
        virtual std::vector<Account> all_accounts() = 0;
        virtual void insert_account(const Account& account) = 0;
        virtual void update_account(const Account& account) = 0;

        // --- users -----------------------------------------------------------
        virtual std::optional<User> find_user(const UserId& id) = 0;
        virtual std::optional<User> find_user_by_name(const std::string& name) = 0;
        // Ordered by creation sequence.
        virtual std::vector<User> all_users() = 0;
        virtual void insert_user(const User& user) = 0;

        // --- ownership -------------------------------------------------------
        // Blocks concurrent ownership writers of the same account until this
        // unit ends. Must be called before reading shares for a ceiling check.
        virtual void lock_account(const AccountId& id) = 0;
        virtual std::vector<OwnershipShare> shares_of_account(const AccountId& id) = 0;
        virtual std::vector<OwnershipShare> shares_of_user(const UserId& id) = 0;
        virtual void upsert_share(const OwnershipShare& share) = 0;
        virtual void delete_share(const AccountId& account, const UserId& user) = 0;

        // --- transactions ----------------------------------------------------
        // Serialises merge/unmerge and whole-transaction rewrites.
        virtual void lock_transaction(const TransactionId& id) = 0;
        virtual std::optional<Transaction> find_transaction(const TransactionId& id) = 0;
        // Ordered by date, then id.
        virtual std::vector<Transaction> query_transactions(const TransactionQuery& query) = 0;
        virtual std::vector<Transaction> transactions_merged_into(const TransactionId& id) = 0;
        // Ordered by position.
        virtual std::vector<JournalEntry> entries_of(const TransactionId& id) = 0;
        virtual std::vector<JournalEntry> entries_of_account(const AccountId& id) = 0;
        virtual void insert_transaction(const Transaction& txn) = 0;
        virtual void update_transaction_flags(const TransactionId& id, bool is_duplicate,
                                              const std::optional<TransactionId>& merged_into) = 0;
        virtual void insert_entry(const JournalEntry& entry) = 0;
        virtual void delete_entries(const TransactionId& id) = 0;
        // Cascades to the transaction's entries and to every match row
        // that references it.
        virtual void delete_transaction(const TransactionId& id) = 0;

        // --- matches ---------------------------------------------------------
        virtual std::optional<TransactionMatch> find_match(const MatchId& id) = 0;
        virtual std::optional<TransactionMatch> find_match_pair(const TransactionId& primary,
                                                                const TransactionId& duplicate) = 0;
        virtual std::vector<TransactionMatch> matches_involving(const TransactionId& id) = 0;
        virtual std::vector<TransactionMatch> all_matches() = 0;
        virtual void insert_match(const TransactionMatch& match) = 0;
        virtual void update_match(const TransactionMatch& match) = 0;
        virtual void delete_match(const MatchId& id) = 0;

        // --- imported files --------------------------------------------------
        virtual std::optional<ImportedFile> find_import_by_hash(const std::string& hash) = 0;
        virtual std::optional<ImportedFile> find_import_by_path(const std::string& path,
                                                                const std::string& source) = 0;
        // Newest first.
        virtual std::vector<ImportedFile> imported_files() = 0;
        virtual void insert_import(const ImportedFile& file) = 0;

        // Makes every write of this unit visible atomically. A unit that is
        // destroyed without commit() leaves no trace.
        virtual void commit() = 0;
    };

    class LedgerStore {
    public:
        virtual ~LedgerStore() {}

        // Throws LedgerError(StoreUnavailable) when the backend is down.
        virtual std::unique_ptr<UnitOfWork> begin() = 0;

        virtual std::string backend_name() const = 0;
    };

} // namespace assets

#endif // ASSETS_STORE_HPP
