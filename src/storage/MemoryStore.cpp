/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: MemoryStore.cpp
 * ============================================================================
 */

#include "MemoryStore.hpp"
#include "../core/errors.hpp"
#include <algorithm>

namespace assets {
namespace storage {

class MemoryUnitOfWork : public UnitOfWork {
public:
    explicit MemoryUnitOfWork(MemoryStore& store)
        : store_(store), lock_(store.mutex_), working_(store.state_) {}

    // ------------------------------------------------------------------------
    // Accounts
    // ------------------------------------------------------------------------
    std::optional<Account> find_account(const AccountId& id) override {
        auto it = working_.accounts.find(id);
        if (it == working_.accounts.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Account> find_children_named(const std::optional<AccountId>& parent,
                                             const std::string& name) override {
        std::vector<Account> out;
        for (const auto& pair : working_.accounts) {
            if (pair.second.parent_id == parent && pair.second.name == name) {
                out.push_back(pair.second);
            }
        }
        return out;
    }

    std::vector<Account> children_of(const std::optional<AccountId>& parent) override {
        std::vector<Account> out;
        for (const auto& pair : working_.accounts) {
            if (pair.second.parent_id == parent) out.push_back(pair.second);
        }
        return out;
    }

    std::vector<Account> all_accounts() override {
        std::vector<Account> out;
        for (const auto& pair : working_.accounts) out.push_back(pair.second);
        return out;
    }

    void insert_account(const Account& account) override {
        working_.accounts[account.id] = account;
    }

    void update_account(const Account& account) override {
        auto it = working_.accounts.find(account.id);
        if (it == working_.accounts.end()) {
            throw LedgerError(ErrorKind::AccountNotFound, "Account " + account.id + " does not exist.");
        }
        it->second = account;
    }

    // ------------------------------------------------------------------------
    // Users
    // ------------------------------------------------------------------------
    std::optional<User> find_user(const UserId& id) override {
        auto it = working_.users.find(id);
        if (it == working_.users.end()) return std::nullopt;
        return it->second;
    }

    std::optional<User> find_user_by_name(const std::string& name) override {
        for (const auto& pair : working_.users) {
            if (pair.second.name == name) return pair.second;
        }
        return std::nullopt;
    }

    std::vector<User> all_users() override {
        std::vector<User> out;
        for (const auto& pair : working_.users) out.push_back(pair.second);
        std::sort(out.begin(), out.end(),
                  [](const User& a, const User& b) { return a.sequence < b.sequence; });
        return out;
    }

    void insert_user(const User& user) override {
        User stored = user;
        stored.sequence = static_cast<int64_t>(working_.users.size()) + 1;
        working_.users[user.id] = stored;
    }

    // ------------------------------------------------------------------------
    // Ownership
    // ------------------------------------------------------------------------
    void lock_account(const AccountId&) override {
        // Units are already serialised by the store mutex.
    }

    std::vector<OwnershipShare> shares_of_account(const AccountId& id) override {
        std::vector<OwnershipShare> out;
        for (const auto& pair : working_.shares) {
            if (pair.first.first == id) out.push_back(pair.second);
        }
        return out;
    }

    std::vector<OwnershipShare> shares_of_user(const UserId& id) override {
        std::vector<OwnershipShare> out;
        for (const auto& pair : working_.shares) {
            if (pair.first.second == id) out.push_back(pair.second);
        }
        return out;
    }

    void upsert_share(const OwnershipShare& share) override {
        working_.shares[std::make_pair(share.account_id, share.user_id)] = share;
    }

    void delete_share(const AccountId& account, const UserId& user) override {
        working_.shares.erase(std::make_pair(account, user));
    }

    // ------------------------------------------------------------------------
    // Transactions
    // ------------------------------------------------------------------------
    void lock_transaction(const TransactionId&) override {}

    std::optional<Transaction> find_transaction(const TransactionId& id) override {
        auto it = working_.transactions.find(id);
        if (it == working_.transactions.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Transaction> query_transactions(const TransactionQuery& query) override {
        std::vector<Transaction> out;
        for (const auto& pair : working_.transactions) {
            const Transaction& t = pair.second;
            if (query.from && t.date < *query.from) continue;
            if (query.to && t.date > *query.to) continue;
            if (query.import_batch_id && t.import_batch_id != query.import_batch_id) continue;
            if (!query.include_hidden && t.is_duplicate) continue;
            out.push_back(t);
        }
        std::sort(out.begin(), out.end(), [](const Transaction& a, const Transaction& b) {
            if (a.date != b.date) return a.date < b.date;
            return a.id < b.id;
        });
        return out;
    }

    std::vector<Transaction> transactions_merged_into(const TransactionId& id) override {
        std::vector<Transaction> out;
        for (const auto& pair : working_.transactions) {
            if (pair.second.merged_into && *pair.second.merged_into == id) out.push_back(pair.second);
        }
        return out;
    }

    std::vector<JournalEntry> entries_of(const TransactionId& id) override {
        auto it = working_.entries.find(id);
        if (it == working_.entries.end()) return {};
        std::vector<JournalEntry> out = it->second;
        std::sort(out.begin(), out.end(),
                  [](const JournalEntry& a, const JournalEntry& b) { return a.position < b.position; });
        return out;
    }

    std::vector<JournalEntry> entries_of_account(const AccountId& id) override {
        std::vector<JournalEntry> out;
        for (const auto& pair : working_.entries) {
            for (const auto& entry : pair.second) {
                if (entry.account_id == id) out.push_back(entry);
            }
        }
        return out;
    }

    void insert_transaction(const Transaction& txn) override {
        working_.transactions[txn.id] = txn;
    }

    void update_transaction_flags(const TransactionId& id, bool is_duplicate,
                                  const std::optional<TransactionId>& merged_into) override {
        auto it = working_.transactions.find(id);
        if (it == working_.transactions.end()) {
            throw LedgerError(ErrorKind::TransactionNotFound, "Transaction " + id + " does not exist.");
        }
        it->second.is_duplicate = is_duplicate;
        it->second.merged_into = merged_into;
    }

    void insert_entry(const JournalEntry& entry) override {
        if (!working_.transactions.count(entry.transaction_id)) {
            throw LedgerError(ErrorKind::IntegrityViolation,
                              "Journal entry references missing transaction " + entry.transaction_id);
        }
        if (!working_.accounts.count(entry.account_id)) {
            throw LedgerError(ErrorKind::IntegrityViolation,
                              "Journal entry references missing account " + entry.account_id);
        }
        working_.entries[entry.transaction_id].push_back(entry);
    }

    void delete_entries(const TransactionId& id) override {
        working_.entries.erase(id);
    }

    void delete_transaction(const TransactionId& id) override {
        working_.entries.erase(id);
        for (auto it = working_.matches.begin(); it != working_.matches.end();) {
            if (it->second.primary_id == id || it->second.duplicate_id == id) {
                it = working_.matches.erase(it);
            } else {
                ++it;
            }
        }
        working_.transactions.erase(id);
    }

    // ------------------------------------------------------------------------
    // Matches
    // ------------------------------------------------------------------------
    std::optional<TransactionMatch> find_match(const MatchId& id) override {
        auto it = working_.matches.find(id);
        if (it == working_.matches.end()) return std::nullopt;
        return it->second;
    }

    std::optional<TransactionMatch> find_match_pair(const TransactionId& primary,
                                                    const TransactionId& duplicate) override {
        for (const auto& pair : working_.matches) {
            if (pair.second.primary_id == primary && pair.second.duplicate_id == duplicate) {
                return pair.second;
            }
        }
        return std::nullopt;
    }

    std::vector<TransactionMatch> matches_involving(const TransactionId& id) override {
        std::vector<TransactionMatch> out;
        for (const auto& pair : working_.matches) {
            if (pair.second.primary_id == id || pair.second.duplicate_id == id) {
                out.push_back(pair.second);
            }
        }
        return out;
    }

    std::vector<TransactionMatch> all_matches() override {
        std::vector<TransactionMatch> out;
        for (const auto& pair : working_.matches) out.push_back(pair.second);
        return out;
    }

    void insert_match(const TransactionMatch& match) override {
        if (find_match_pair(match.primary_id, match.duplicate_id)) {
            throw LedgerError(ErrorKind::IntegrityViolation,
                              "Match already recorded for " + match.primary_id + " -> " + match.duplicate_id);
        }
        working_.matches[match.id] = match;
    }

    void update_match(const TransactionMatch& match) override {
        auto it = working_.matches.find(match.id);
        if (it == working_.matches.end()) {
            throw LedgerError(ErrorKind::MatchNotFound, "Match " + match.id + " does not exist.");
        }
        it->second = match;
    }

    void delete_match(const MatchId& id) override {
        working_.matches.erase(id);
    }

    // ------------------------------------------------------------------------
    // Imported files
    // ------------------------------------------------------------------------
    std::optional<ImportedFile> find_import_by_hash(const std::string& hash) override {
        for (const auto& file : working_.imports) {
            if (file.file_hash == hash) return file;
        }
        return std::nullopt;
    }

    std::optional<ImportedFile> find_import_by_path(const std::string& path,
                                                    const std::string& source) override {
        for (const auto& file : working_.imports) {
            if (file.file_path == path && file.import_source == source) return file;
        }
        return std::nullopt;
    }

    std::vector<ImportedFile> imported_files() override {
        return std::vector<ImportedFile>(working_.imports.rbegin(), working_.imports.rend());
    }

    void insert_import(const ImportedFile& file) override {
        working_.imports.push_back(file);
    }

    void commit() override {
        if (committed_) {
            throw LedgerError(ErrorKind::StoreFailure, "Unit of work committed twice.");
        }
        if (!store_.available()) {
            throw LedgerError(ErrorKind::StoreUnavailable, "Memory store is unavailable; unit of work rolled back.");
        }
        store_.state_ = std::move(working_);
        committed_ = true;
    }

private:
    MemoryStore& store_;
    std::unique_lock<std::mutex> lock_;
    MemoryState working_;
    bool committed_ = false;
};

MemoryStore::MemoryStore() : available_(true) {}

std::unique_ptr<UnitOfWork> MemoryStore::begin() {
    if (!available_) {
        throw LedgerError(ErrorKind::StoreUnavailable, "Memory store is unavailable.");
    }
    return std::unique_ptr<UnitOfWork>(new MemoryUnitOfWork(*this));
}

} // namespace storage
} // namespace assets
