/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ledger.cpp
 * ============================================================================
 */

#include "ledger.hpp"
#include "../storage/MemoryStore.hpp"
#include "../storage/PgStore.hpp"

namespace assets {

Ledger::Ledger(std::shared_ptr<LedgerStore> store, const LedgerConfig& config)
    : store_(store),
      config_(config),
      ownership_(config.ownership, config.accounts.default_owner),
      directory_(config.accounts, ownership_.default_owner_policy()),
      posting_(directory_),
      matcher_(config.matching),
      merger_(matcher_) {
    config_.validate();
    log("INFO", "Ledger core ready on the " + store_->backend_name() + " store.");
}

std::shared_ptr<LedgerStore> Ledger::open_store(const LedgerConfig& config) {
    if (config.store.backend == "postgres") {
        return std::make_shared<storage::PgStore>(config.store.connection);
    }
    return std::make_shared<storage::MemoryStore>();
}

// ----------------------------------------------------------------------------
// Account Directory
// ----------------------------------------------------------------------------

AccountId Ledger::resolve_or_create_account(const std::string& path, AccountType type_hint,
                                            const std::optional<UserId>& created_by) {
    return in_unit("resolve_or_create_account", [&](UnitOfWork& uow) {
        return directory_.resolve_or_create(uow, path, type_hint, created_by);
    });
}

std::optional<AccountId> Ledger::resolve_account(const std::string& path) {
    return in_unit("resolve_account", [&](UnitOfWork& uow) { return directory_.resolve(uow, path); });
}

Account Ledger::create_account(const NewAccount& request) {
    return in_unit("create_account", [&](UnitOfWork& uow) { return directory_.create_account(uow, request); });
}

Account Ledger::get_account(const AccountId& id) {
    return in_unit("get_account", [&](UnitOfWork& uow) { return directory_.get_account(uow, id); });
}

std::vector<Account> Ledger::list_accounts(bool include_inactive) {
    return in_unit("list_accounts", [&](UnitOfWork& uow) {
        return directory_.list_accounts(uow, include_inactive);
    });
}

std::vector<Account> Ledger::children_of(const AccountId& id) {
    return in_unit("children_of", [&](UnitOfWork& uow) { return directory_.children_of(uow, id); });
}

Account Ledger::move_or_rename_account(const AccountId& id, const std::string& new_name,
                                       const std::optional<AccountId>& new_parent) {
    return in_unit("move_or_rename_account", [&](UnitOfWork& uow) {
        return directory_.move_or_rename(uow, id, new_name, new_parent);
    });
}

void Ledger::deactivate_account(const AccountId& id) {
    in_unit("deactivate_account", [&](UnitOfWork& uow) { directory_.deactivate(uow, id); });
}

void Ledger::reactivate_account(const AccountId& id) {
    in_unit("reactivate_account", [&](UnitOfWork& uow) { directory_.reactivate(uow, id); });
}

// ----------------------------------------------------------------------------
// Users and Ownership Ledger
// ----------------------------------------------------------------------------

User Ledger::create_user(const std::string& name, const std::string& display_name) {
    return in_unit("create_user", [&](UnitOfWork& uow) { return ownership_.create_user(uow, name, display_name); });
}

User Ledger::get_user(const UserId& id) {
    return in_unit("get_user", [&](UnitOfWork& uow) { return ownership_.get_user(uow, id); });
}

std::optional<User> Ledger::find_user_by_name(const std::string& name) {
    return in_unit("find_user_by_name", [&](UnitOfWork& uow) { return ownership_.find_user_by_name(uow, name); });
}

std::vector<User> Ledger::list_users() {
    return in_unit("list_users", [&](UnitOfWork& uow) { return ownership_.list_users(uow); });
}

void Ledger::set_ownership(const AccountId& account, const UserId& user, double percentage) {
    in_unit("set_ownership", [&](UnitOfWork& uow) { ownership_.set_ownership(uow, account, user, percentage); });
}

void Ledger::remove_ownership(const AccountId& account, const UserId& user) {
    in_unit("remove_ownership", [&](UnitOfWork& uow) { ownership_.remove_ownership(uow, account, user); });
}

void Ledger::replace_ownership(const AccountId& account, const std::vector<std::pair<UserId, double>>& shares) {
    in_unit("replace_ownership", [&](UnitOfWork& uow) { ownership_.replace_ownership(uow, account, shares); });
}

double Ledger::ownership_weight(const AccountId& account, const std::vector<UserId>& users) {
    return in_unit("ownership_weight", [&](UnitOfWork& uow) {
        return ownership_.ownership_weight(uow, account, users);
    });
}

std::vector<OwnershipShare> Ledger::ownership_of(const AccountId& account) {
    return in_unit("ownership_of", [&](UnitOfWork& uow) { return ownership_.ownership_of(uow, account); });
}

std::vector<OwnershipShare> Ledger::accounts_owned_by(const UserId& user) {
    return in_unit("accounts_owned_by", [&](UnitOfWork& uow) { return ownership_.accounts_owned_by(uow, user); });
}

// ----------------------------------------------------------------------------
// Posting Engine
// ----------------------------------------------------------------------------

TransactionId Ledger::post_transaction(const NewTransaction& request) {
    // Rejected before any unit of work is opened.
    posting_.check_entries(request.entries);

    if (request.auto_create_accounts) {
        in_unit("post_transaction.accounts", [&](UnitOfWork& uow) {
            posting_.resolve_accounts(uow, request, true);
        });
    }
    return in_unit("post_transaction", [&](UnitOfWork& uow) { return posting_.post(uow, request).id; });
}

TransactionId Ledger::post_transaction(const std::string& description, const Date& date,
                                       const std::vector<EntryInput>& entries) {
    NewTransaction request;
    request.description = description;
    request.date = date;
    request.entries = entries;
    return post_transaction(request);
}

TransactionId Ledger::transfer(const std::string& from, const std::string& to, money_micro amount,
                               const std::string& description, const Date& date, bool auto_create) {
    NewTransaction request = PostingEngine::make_transfer(from, to, amount, description, date);
    request.auto_create_accounts = auto_create;
    return post_transaction(request);
}

TransactionId Ledger::income(const std::string& asset, const std::string& income_account, money_micro amount,
                             const std::string& description, const Date& date, bool auto_create) {
    NewTransaction request = PostingEngine::make_income(asset, income_account, amount, description, date);
    request.auto_create_accounts = auto_create;
    return post_transaction(request);
}

TransactionId Ledger::expense(const std::string& asset, const std::string& expense_account, money_micro amount,
                              const std::string& description, const Date& date, bool auto_create) {
    NewTransaction request = PostingEngine::make_expense(asset, expense_account, amount, description, date);
    request.auto_create_accounts = auto_create;
    return post_transaction(request);
}

void Ledger::replace_entries(const TransactionId& id, const std::vector<EntryInput>& entries) {
    posting_.check_entries(entries);
    in_unit("replace_entries", [&](UnitOfWork& uow) { posting_.replace_entries(uow, id, entries); });
}

void Ledger::delete_transaction(const TransactionId& id) {
    in_unit("delete_transaction", [&](UnitOfWork& uow) { posting_.delete_transaction(uow, id); });
}

TransactionWithEntries Ledger::get_transaction(const TransactionId& id) {
    return in_unit("get_transaction", [&](UnitOfWork& uow) { return posting_.get_transaction(uow, id); });
}

std::vector<TransactionWithEntries> Ledger::list_transactions(const TransactionFilter& filter) {
    return in_unit("list_transactions", [&](UnitOfWork& uow) { return posting_.list_transactions(uow, filter); });
}

money_micro Ledger::transaction_amount(const TransactionId& id) {
    return in_unit("transaction_amount", [&](UnitOfWork& uow) { return posting_.transaction_amount(uow, id); });
}

std::vector<UnbalancedRecord> Ledger::audit_balances() {
    return in_unit("audit_balances", [&](UnitOfWork& uow) { return posting_.audit_balances(uow); });
}

// ----------------------------------------------------------------------------
// Duplicate Matcher
// ----------------------------------------------------------------------------

std::vector<MatchCandidate> Ledger::find_duplicate_candidates(const TransactionId& id) {
    return find_duplicate_candidates(id, config_.matching.amount_tolerance, config_.matching.date_tolerance_days);
}

std::vector<MatchCandidate> Ledger::find_duplicate_candidates(const TransactionId& id, money_micro amount_tolerance,
                                                              int date_tolerance_days) {
    return in_unit("find_duplicate_candidates", [&](UnitOfWork& uow) {
        return matcher_.find_candidates(uow, id, amount_tolerance, date_tolerance_days);
    });
}

MatchId Ledger::record_match(const TransactionId& primary, const TransactionId& duplicate, double confidence,
                             const MatchCriteria& criteria) {
    return in_unit("record_match", [&](UnitOfWork& uow) {
        return matcher_.record_match(uow, primary, duplicate, confidence, criteria).id;
    });
}

void Ledger::update_match_status(const MatchId& id, MatchStatus status) {
    in_unit("update_match_status", [&](UnitOfWork& uow) { matcher_.update_match_status(uow, id, status); });
}

TransactionMatch Ledger::get_match(const MatchId& id) {
    return in_unit("get_match", [&](UnitOfWork& uow) { return matcher_.get_match(uow, id); });
}

std::vector<TransactionMatch> Ledger::matches_for(const TransactionId& id) {
    return in_unit("matches_for", [&](UnitOfWork& uow) { return matcher_.matches_for(uow, id); });
}

std::vector<TransactionMatch> Ledger::list_matches(const std::optional<MatchStatus>& status) {
    return in_unit("list_matches", [&](UnitOfWork& uow) { return matcher_.list_matches(uow, status); });
}

BatchDetectionResult Ledger::detect_duplicates_for_batch(const BatchId& batch, bool auto_merge_exact) {
    return in_unit("detect_duplicates_for_batch", [&](UnitOfWork& uow) {
        BatchDetectionResult result;
        result.matches = matcher_.detect_duplicates_for_batch(uow, batch);
        if (!auto_merge_exact) return result;

        for (auto& match : result.matches) {
            if (match.tier != MatchTier::Exact || match.status != MatchStatus::Pending) continue;
            // A transaction hidden by an earlier merge of this scan stays where it is.
            std::optional<Transaction> primary = uow.find_transaction(match.primary_id);
            std::optional<Transaction> duplicate = uow.find_transaction(match.duplicate_id);
            if (!primary || !duplicate || primary->is_duplicate || duplicate->is_duplicate) continue;

            merger_.merge(uow, match.primary_id, match.duplicate_id);
            match = matcher_.get_match(uow, match.id);
            result.merged.push_back(match);
        }
        log("INFO", "Batch " + batch + ": " + std::to_string(result.merged.size()) + " exact matches merged");
        return result;
    });
}

// ----------------------------------------------------------------------------
// Merge Manager
// ----------------------------------------------------------------------------

void Ledger::merge_transactions(const TransactionId& primary, const TransactionId& duplicate) {
    in_unit("merge_transactions", [&](UnitOfWork& uow) { merger_.merge(uow, primary, duplicate); });
}

void Ledger::unmerge_transaction(const TransactionId& id) {
    in_unit("unmerge_transaction", [&](UnitOfWork& uow) { merger_.unmerge(uow, id); });
}

std::vector<Transaction> Ledger::hidden_transactions() {
    return in_unit("hidden_transactions", [&](UnitOfWork& uow) { return merger_.hidden_transactions(uow); });
}

std::vector<Transaction> Ledger::merged_into(const TransactionId& primary) {
    return in_unit("merged_into", [&](UnitOfWork& uow) { return merger_.merged_into(uow, primary); });
}

// ----------------------------------------------------------------------------
// Imported files
// ----------------------------------------------------------------------------

std::string Ledger::hash_file(const std::string& path) {
    return ImportTracker::hash_file(path);
}

bool Ledger::is_imported(const std::string& hash) {
    return in_unit("is_imported", [&](UnitOfWork& uow) { return imports_.is_imported(uow, hash); });
}

bool Ledger::is_path_imported(const std::string& path, const std::string& source) {
    return in_unit("is_path_imported", [&](UnitOfWork& uow) {
        return imports_.is_path_imported(uow, path, source);
    });
}

ImportedFile Ledger::record_import(const ImportedFile& metadata) {
    return in_unit("record_import", [&](UnitOfWork& uow) { return imports_.record_import(uow, metadata); });
}

std::vector<ImportedFile> Ledger::list_imports(const std::optional<std::string>& source, size_t limit) {
    return in_unit("list_imports", [&](UnitOfWork& uow) { return imports_.list_imports(uow, source, limit); });
}

ImportedFile Ledger::prepare_import(const std::string& path, const std::string& source, const BatchId& batch,
                                    const std::optional<UserId>& user, int transaction_count,
                                    const std::optional<std::string>& notes) {
    return ImportTracker::prepare_metadata(path, source, batch, user, transaction_count, notes);
}

} // namespace assets
