/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ledger.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The contract importers, the CLI and report builders call. Every public
 * operation runs in its own unit of work: it commits in full or leaves no
 * trace. A unit that fails with StoreConflict is retried from scratch up to
 * store.max_retries times.
 *
 * Posting with auto-created accounts uses two units. Accounts are created
 * and committed first (creation is idempotent, so a later failure does not
 * need to undo it); the transaction and its entries follow in a second
 * unit that rolls back as a whole.
 * ============================================================================
 */

#ifndef ASSETS_LEDGER_HPP
#define ASSETS_LEDGER_HPP

#include "AccountDirectory.hpp"
#include "DuplicateMatcher.hpp"
#include "ImportTracker.hpp"
#include "MergeManager.hpp"
#include "OwnershipLedger.hpp"
#include "PostingEngine.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "store.hpp"
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace assets {

    struct BatchDetectionResult {
        std::vector<TransactionMatch> matches;
        std::vector<TransactionMatch> merged;   // EXACT matches merged automatically
    };

    class Ledger {
    public:
        Ledger(std::shared_ptr<LedgerStore> store, const LedgerConfig& config);

        // The engines hold references into sibling members.
        Ledger(const Ledger&) = delete;
        Ledger& operator=(const Ledger&) = delete;

        // Builds the store named by config.store.backend.
        static std::shared_ptr<LedgerStore> open_store(const LedgerConfig& config);

        const LedgerConfig& config() const { return config_; }
        std::string backend_name() const { return store_->backend_name(); }

        // --- Account Directory ----------------------------------------------
        AccountId resolve_or_create_account(const std::string& path, AccountType type_hint,
                                            const std::optional<UserId>& created_by = std::nullopt);
        std::optional<AccountId> resolve_account(const std::string& path);
        Account create_account(const NewAccount& request);
        Account get_account(const AccountId& id);
        std::vector<Account> list_accounts(bool include_inactive = false);
        std::vector<Account> children_of(const AccountId& id);
        // `new_parent` empty moves the account to the roots.
        Account move_or_rename_account(const AccountId& id, const std::string& new_name,
                                       const std::optional<AccountId>& new_parent);
        void deactivate_account(const AccountId& id);
        void reactivate_account(const AccountId& id);

        // --- Users and Ownership Ledger -------------------------------------
        User create_user(const std::string& name, const std::string& display_name = "");
        User get_user(const UserId& id);
        std::optional<User> find_user_by_name(const std::string& name);
        std::vector<User> list_users();

        void set_ownership(const AccountId& account, const UserId& user, double percentage);
        void remove_ownership(const AccountId& account, const UserId& user);
        void replace_ownership(const AccountId& account, const std::vector<std::pair<UserId, double>>& shares);
        double ownership_weight(const AccountId& account, const std::vector<UserId>& users);
        std::vector<OwnershipShare> ownership_of(const AccountId& account);
        std::vector<OwnershipShare> accounts_owned_by(const UserId& user);

        // --- Posting Engine -------------------------------------------------
        TransactionId post_transaction(const NewTransaction& request);
        // Shorthand: entries by path, no auto-creation.
        TransactionId post_transaction(const std::string& description, const Date& date,
                                       const std::vector<EntryInput>& entries);
        TransactionId transfer(const std::string& from, const std::string& to, money_micro amount,
                               const std::string& description, const Date& date, bool auto_create = false);
        TransactionId income(const std::string& asset, const std::string& income_account, money_micro amount,
                             const std::string& description, const Date& date, bool auto_create = false);
        TransactionId expense(const std::string& asset, const std::string& expense_account, money_micro amount,
                              const std::string& description, const Date& date, bool auto_create = false);
        void replace_entries(const TransactionId& id, const std::vector<EntryInput>& entries);
        void delete_transaction(const TransactionId& id);
        TransactionWithEntries get_transaction(const TransactionId& id);
        std::vector<TransactionWithEntries> list_transactions(const TransactionFilter& filter = TransactionFilter());
        money_micro transaction_amount(const TransactionId& id);
        std::vector<UnbalancedRecord> audit_balances();

        // --- Duplicate Matcher ----------------------------------------------
        // Tolerances default to the configured ones.
        std::vector<MatchCandidate> find_duplicate_candidates(const TransactionId& id);
        std::vector<MatchCandidate> find_duplicate_candidates(const TransactionId& id, money_micro amount_tolerance,
                                                              int date_tolerance_days);
        MatchId record_match(const TransactionId& primary, const TransactionId& duplicate, double confidence,
                             const MatchCriteria& criteria);
        void update_match_status(const MatchId& id, MatchStatus status);
        TransactionMatch get_match(const MatchId& id);
        std::vector<TransactionMatch> matches_for(const TransactionId& id);
        std::vector<TransactionMatch> list_matches(const std::optional<MatchStatus>& status = std::nullopt);
        BatchDetectionResult detect_duplicates_for_batch(const BatchId& batch, bool auto_merge_exact);

        // --- Merge Manager --------------------------------------------------
        void merge_transactions(const TransactionId& primary, const TransactionId& duplicate);
        void unmerge_transaction(const TransactionId& id);
        std::vector<Transaction> hidden_transactions();
        std::vector<Transaction> merged_into(const TransactionId& primary);

        // --- Imported files -------------------------------------------------
        std::string hash_file(const std::string& path);
        bool is_imported(const std::string& hash);
        bool is_path_imported(const std::string& path, const std::string& source);
        ImportedFile record_import(const ImportedFile& metadata);
        std::vector<ImportedFile> list_imports(const std::optional<std::string>& source = std::nullopt,
                                               size_t limit = 0);
        ImportedFile prepare_import(const std::string& path, const std::string& source, const BatchId& batch,
                                    const std::optional<UserId>& user, int transaction_count,
                                    const std::optional<std::string>& notes);

    private:
        template <typename Fn>
        auto in_unit(const char* operation, Fn&& fn) -> decltype(fn(std::declval<UnitOfWork&>())) {
            typedef decltype(fn(std::declval<UnitOfWork&>())) Result;
            int attempt = 0;
            while (true) {
                try {
                    std::unique_ptr<UnitOfWork> uow = store_->begin();
                    if constexpr (std::is_void<Result>::value) {
                        fn(*uow);
                        uow->commit();
                        return;
                    } else {
                        Result result = fn(*uow);
                        uow->commit();
                        return result;
                    }
                } catch (const LedgerError& e) {
                    if (e.kind() != ErrorKind::StoreConflict || attempt >= config_.store.max_retries) throw;
                    ++attempt;
                    log("WARN", std::string(operation) + ": store conflict, retry " + std::to_string(attempt) +
                                " of " + std::to_string(config_.store.max_retries));
                }
            }
        }

        std::shared_ptr<LedgerStore> store_;
        LedgerConfig config_;

        OwnershipLedger ownership_;
        AccountDirectory directory_;
        PostingEngine posting_;
        DuplicateMatcher matcher_;
        MergeManager merger_;
        ImportTracker imports_;
    };

} // namespace assets

#endif // ASSETS_LEDGER_HPP
