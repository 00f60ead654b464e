/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: OwnershipLedger.cpp
 * ============================================================================
 */

#include "OwnershipLedger.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <set>
#include <sstream>

namespace assets {

namespace {

std::string pct_text(double fraction) {
    std::ostringstream ss;
    ss << fraction * 100.0 << "%";
    return ss.str();
}

void write_full_share(UnitOfWork& uow, const Account& account, const UserId& user) {
    OwnershipShare share;
    share.account_id = account.id;
    share.user_id = user;
    share.percentage = 1.0;
    uow.upsert_share(share);
}

} // namespace

OwnershipLedger::OwnershipLedger(const OwnershipConfig& config, OwnerPolicy default_owner)
    : config_(config), default_owner_(default_owner) {}

User OwnershipLedger::create_user(UnitOfWork& uow, const std::string& name, const std::string& display_name) {
    if (name.empty()) {
        throw LedgerError(ErrorKind::InvalidUserName, "User name cannot be empty.");
    }
    if (uow.find_user_by_name(name)) {
        throw LedgerError(ErrorKind::DuplicateUserName, "User '" + name + "' already exists.");
    }

    bool first_user = uow.all_users().empty();

    User user;
    user.id = LedgerCrypto::generate_uuid();
    user.name = name;
    user.display_name = display_name.empty() ? name : display_name;
    uow.insert_user(user);

    int backfilled = 0;
    if (first_user && default_owner_ == OwnerPolicy::FirstUser) {
        for (const auto& account : uow.all_accounts()) {
            if (uow.shares_of_account(account.id).empty()) {
                write_full_share(uow, account, user.id);
                ++backfilled;
            }
        }
    }

    // Re-read for the store-assigned creation sequence.
    User stored = get_user(uow, user.id);
    log("INFO", "User created: " + name +
                (backfilled > 0 ? " (owner of " + std::to_string(backfilled) + " existing accounts)" : std::string()));
    return stored;
}

User OwnershipLedger::get_user(UnitOfWork& uow, const UserId& id) {
    std::optional<User> user = uow.find_user(id);
    if (!user) {
        throw LedgerError(ErrorKind::UserNotFound, "User " + id + " does not exist.");
    }
    return *user;
}

std::optional<User> OwnershipLedger::find_user_by_name(UnitOfWork& uow, const std::string& name) {
    return uow.find_user_by_name(name);
}

std::vector<User> OwnershipLedger::list_users(UnitOfWork& uow) {
    return uow.all_users();
}

void OwnershipLedger::check_percentage(double percentage) const {
    // NaN fails both comparisons.
    if (!(percentage > 0.0 && percentage <= 1.0)) {
        throw LedgerError(ErrorKind::InvalidPercentage,
                          "Ownership percentage must be in (0, 1], got " + std::to_string(percentage) + ".");
    }
}

void OwnershipLedger::require_account(UnitOfWork& uow, const AccountId& account) {
    if (!uow.find_account(account)) {
        throw LedgerError(ErrorKind::AccountNotFound, "Account " + account + " does not exist.");
    }
}

void OwnershipLedger::set_ownership(UnitOfWork& uow, const AccountId& account, const UserId& user,
                                    double percentage) {
    check_percentage(percentage);
    require_account(uow, account);
    get_user(uow, user);

    uow.lock_account(account);
    double others = 0.0;
    for (const auto& share : uow.shares_of_account(account)) {
        if (share.user_id != user) others += share.percentage;
    }
    if (others + percentage > 1.0 + config_.epsilon) {
        throw LedgerError(ErrorKind::OwnershipExceeded,
                          "Ownership of account " + account + " would reach " + pct_text(others + percentage) + ".");
    }

    OwnershipShare share;
    share.account_id = account;
    share.user_id = user;
    share.percentage = percentage;
    uow.upsert_share(share);
    log("INFO", "Ownership set: account " + account + " user " + user + " = " + pct_text(percentage));
}

void OwnershipLedger::remove_ownership(UnitOfWork& uow, const AccountId& account, const UserId& user) {
    require_account(uow, account);
    uow.lock_account(account);
    uow.delete_share(account, user);
    log("INFO", "Ownership removed: account " + account + " user " + user);
}

void OwnershipLedger::replace_ownership(UnitOfWork& uow, const AccountId& account,
                                        const std::vector<std::pair<UserId, double>>& shares) {
    require_account(uow, account);

    double total = 0.0;
    std::set<UserId> seen;
    for (const auto& entry : shares) {
        check_percentage(entry.second);
        get_user(uow, entry.first);
        if (!seen.insert(entry.first).second) {
            throw LedgerError(ErrorKind::InvalidPercentage, "User " + entry.first + " is listed twice.");
        }
        total += entry.second;
    }
    if (total > 1.0 + config_.epsilon) {
        throw LedgerError(ErrorKind::OwnershipExceeded,
                          "Ownership of account " + account + " would reach " + pct_text(total) + ".");
    }

    uow.lock_account(account);
    for (const auto& existing : uow.shares_of_account(account)) {
        uow.delete_share(account, existing.user_id);
    }
    for (const auto& entry : shares) {
        OwnershipShare share;
        share.account_id = account;
        share.user_id = entry.first;
        share.percentage = entry.second;
        uow.upsert_share(share);
    }
    log("INFO", "Ownership replaced: account " + account + " now has " + std::to_string(shares.size()) + " owners");
}

double OwnershipLedger::ownership_weight(UnitOfWork& uow, const AccountId& account,
                                         const std::vector<UserId>& users) {
    require_account(uow, account);
    std::set<UserId> wanted(users.begin(), users.end());
    double weight = 0.0;
    for (const auto& share : uow.shares_of_account(account)) {
        if (wanted.count(share.user_id)) weight += share.percentage;
    }
    return weight;
}

std::vector<OwnershipShare> OwnershipLedger::ownership_of(UnitOfWork& uow, const AccountId& account) {
    require_account(uow, account);
    std::vector<OwnershipShare> out = uow.shares_of_account(account);
    std::sort(out.begin(), out.end(), [](const OwnershipShare& a, const OwnershipShare& b) {
        if (a.percentage != b.percentage) return a.percentage > b.percentage;
        return a.user_id < b.user_id;
    });
    return out;
}

std::vector<OwnershipShare> OwnershipLedger::accounts_owned_by(UnitOfWork& uow, const UserId& user) {
    get_user(uow, user);
    return uow.shares_of_user(user);
}

DefaultOwnerPolicy OwnershipLedger::default_owner_policy() const {
    OwnerPolicy policy = default_owner_;
    return [policy](UnitOfWork& uow, const Account& account, const std::optional<UserId>& created_by) {
        switch (policy) {
            case OwnerPolicy::None:
                return;
            case OwnerPolicy::Creator:
                if (created_by) {
                    if (!uow.find_user(*created_by)) {
                        throw LedgerError(ErrorKind::UserNotFound, "User " + *created_by + " does not exist.");
                    }
                    write_full_share(uow, account, *created_by);
                    return;
                }
                break;
            case OwnerPolicy::FirstUser:
                break;
        }
        // First user, also the fallback for an anonymous creator.
        std::vector<User> users = uow.all_users();
        if (!users.empty()) {
            write_full_share(uow, account, users.front().id);
        }
    };
}

} // namespace assets
