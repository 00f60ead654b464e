/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: OwnershipLedger.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Users and their fractional ownership of accounts. For every account the
 * shares of all users add up to at most 1.0 (plus epsilon); an unassigned
 * remainder is allowed, over-allocation never is.
 * ============================================================================
 */

#ifndef ASSETS_OWNERSHIP_LEDGER_HPP
#define ASSETS_OWNERSHIP_LEDGER_HPP

#include "AccountDirectory.hpp"
#include "config.hpp"
#include "store.hpp"
#include <string>
#include <utility>
#include <vector>

namespace assets {

    class OwnershipLedger {
    public:
        OwnershipLedger(const OwnershipConfig& config, OwnerPolicy default_owner);

        // --- users -----------------------------------------------------------

        /**
         * create_user
         * Under the first_user policy the very first user also receives a
         * 100% share of every account that has no owner yet.
         */
        User create_user(UnitOfWork& uow, const std::string& name, const std::string& display_name);
        User get_user(UnitOfWork& uow, const UserId& id);
        std::optional<User> find_user_by_name(UnitOfWork& uow, const std::string& name);
        std::vector<User> list_users(UnitOfWork& uow);

        // --- shares ----------------------------------------------------------

        // Locks the account, then checks the ceiling with the other users'
        // current shares. Throws InvalidPercentage or OwnershipExceeded.
        void set_ownership(UnitOfWork& uow, const AccountId& account, const UserId& user, double percentage);
        void remove_ownership(UnitOfWork& uow, const AccountId& account, const UserId& user);
        void replace_ownership(UnitOfWork& uow, const AccountId& account,
                               const std::vector<std::pair<UserId, double>>& shares);

        // Sum of the shares held by `users` in `account`.
        double ownership_weight(UnitOfWork& uow, const AccountId& account, const std::vector<UserId>& users);

        // Descending percentage.
        std::vector<OwnershipShare> ownership_of(UnitOfWork& uow, const AccountId& account);
        std::vector<OwnershipShare> accounts_owned_by(UnitOfWork& uow, const UserId& user);

        // Policy hook handed to the AccountDirectory.
        DefaultOwnerPolicy default_owner_policy() const;

    private:
        void check_percentage(double percentage) const;
        void require_account(UnitOfWork& uow, const AccountId& account);

        OwnershipConfig config_;
        OwnerPolicy default_owner_;
    };

} // namespace assets

#endif // ASSETS_OWNERSHIP_LEDGER_HPP
