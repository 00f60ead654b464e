/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: AccountDirectory.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Hierarchical chart of accounts addressed by colon-delimited paths
 * ("Assets:Bank1:Checking"). The parent pointer is the source of truth;
 * full_path is a cached value recomputed for the changed subtree whenever a
 * name or parent changes.
 * ============================================================================
 */

#ifndef ASSETS_ACCOUNT_DIRECTORY_HPP
#define ASSETS_ACCOUNT_DIRECTORY_HPP

#include "config.hpp"
#include "store.hpp"
#include <functional>
#include <string>
#include <vector>

namespace assets {

    /**
     * @brief Called once for every account the directory creates, inside the
     * same unit of work, to write its default ownership share.
     * Arguments: the unit, the new account, the requesting user (if any).
     */
    typedef std::function<void(UnitOfWork&, const Account&, const std::optional<UserId>&)> DefaultOwnerPolicy;

    class AccountDirectory {
    public:
        AccountDirectory(const AccountsConfig& config, DefaultOwnerPolicy owner_policy);

        Account create_account(UnitOfWork& uow, const NewAccount& request);

        /**
         * resolve_or_create
         * Walks the path from the roots. Missing segments are created with
         * `type_hint` and the Category subtype under the segment before them.
         * @throws InvalidPath on an empty segment or a too-deep path.
         * @throws IntegrityViolation if a segment matches more than one sibling.
         */
        AccountId resolve_or_create(UnitOfWork& uow, const std::string& path, AccountType type_hint,
                                    const std::optional<UserId>& created_by = std::nullopt);

        // Same walk without creation.
        std::optional<AccountId> resolve(UnitOfWork& uow, const std::string& path);

        Account get_account(UnitOfWork& uow, const AccountId& id);
        // Ordered by full path.
        std::vector<Account> list_accounts(UnitOfWork& uow, bool include_inactive);
        std::vector<Account> children_of(UnitOfWork& uow, const AccountId& id);

        // Accounts whose path equals `prefix` or lies below it.
        std::vector<Account> subtree_of_path(UnitOfWork& uow, const std::string& prefix);

        Account move_or_rename(UnitOfWork& uow, const AccountId& id, const std::string& new_name,
                               const std::optional<AccountId>& new_parent);

        void deactivate(UnitOfWork& uow, const AccountId& id);
        void reactivate(UnitOfWork& uow, const AccountId& id);

        // Splits and trims the segments. Throws InvalidPath.
        static std::vector<std::string> split_path(const std::string& path);

    private:
        std::string validate_name(const std::string& name) const;
        void ensure_unique_sibling(UnitOfWork& uow, const std::optional<AccountId>& parent,
                                   const std::string& name, const AccountId& self) const;
        size_t depth_of(const std::string& full_path) const;
        void refresh_descendant_paths(UnitOfWork& uow, const Account& root);

        AccountsConfig config_;
        DefaultOwnerPolicy owner_policy_;
    };

} // namespace assets

#endif // ASSETS_ACCOUNT_DIRECTORY_HPP
