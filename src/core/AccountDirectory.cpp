/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: AccountDirectory.cpp
 * ============================================================================
 */

#include "AccountDirectory.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <deque>

namespace assets {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

bool by_path(const Account& a, const Account& b) {
    return a.full_path < b.full_path;
}

std::string child_path(const std::optional<Account>& parent, const std::string& name) {
    if (!parent) return name;
    return parent->full_path + PATH_SEPARATOR + name;
}

// At most one sibling may carry a name. More than one means the directory
// was corrupted outside the core.
std::optional<Account> lookup_segment(UnitOfWork& uow, const std::optional<AccountId>& parent,
                                      const std::string& name) {
    std::vector<Account> found = uow.find_children_named(parent, name);
    if (found.size() > 1) {
        std::string where = parent ? "under account " + *parent : std::string("among root accounts");
        log("ERROR", "Ambiguous account name '" + name + "' " + where + " (" +
                     std::to_string(found.size()) + " rows).");
        throw LedgerError(ErrorKind::IntegrityViolation,
                          "Account name '" + name + "' is ambiguous " + where + ".");
    }
    if (found.empty()) return std::nullopt;
    return found.front();
}

} // namespace

AccountDirectory::AccountDirectory(const AccountsConfig& config, DefaultOwnerPolicy owner_policy)
    : config_(config), owner_policy_(owner_policy) {}

std::vector<std::string> AccountDirectory::split_path(const std::string& path) {
    if (trim(path).empty()) {
        throw LedgerError(ErrorKind::InvalidPath, "Account path is empty.");
    }
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        size_t pos = path.find(PATH_SEPARATOR, start);
        std::string segment = trim(path.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (segment.empty()) {
            throw LedgerError(ErrorKind::InvalidPath, "Account path '" + path + "' has an empty segment.");
        }
        segments.push_back(segment);
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return segments;
}

std::string AccountDirectory::validate_name(const std::string& name) const {
    std::string clean = trim(name);
    if (clean.empty()) {
        throw LedgerError(ErrorKind::InvalidAccountName, "Account name cannot be empty.");
    }
    if (clean.find(PATH_SEPARATOR) != std::string::npos) {
        throw LedgerError(ErrorKind::InvalidAccountName,
                          "Account name '" + clean + "' contains the path separator ':'.");
    }
    if (clean.size() > config_.max_name_length) {
        throw LedgerError(ErrorKind::InvalidAccountName,
                          "Account name exceeds " + std::to_string(config_.max_name_length) + " characters.");
    }
    return clean;
}

void AccountDirectory::ensure_unique_sibling(UnitOfWork& uow, const std::optional<AccountId>& parent,
                                             const std::string& name, const AccountId& self) const {
    std::optional<Account> existing = lookup_segment(uow, parent, name);
    if (existing && existing->id != self) {
        throw LedgerError(ErrorKind::DuplicateAccountName,
                          "An account named '" + name + "' already exists at " + existing->full_path + ".");
    }
}

size_t AccountDirectory::depth_of(const std::string& full_path) const {
    return static_cast<size_t>(std::count(full_path.begin(), full_path.end(), PATH_SEPARATOR)) + 1;
}

Account AccountDirectory::create_account(UnitOfWork& uow, const NewAccount& request) {
    std::string name = validate_name(request.name);

    if (!subtype_belongs_to(request.subtype, request.type)) {
        throw LedgerError(ErrorKind::InvalidSubtype,
                          std::string("Subtype ") + to_string(request.subtype) +
                          " does not belong to type " + to_string(request.type) + ".");
    }

    bool has_investment_fields = request.symbol || request.quantity || request.average_cost;
    if (has_investment_fields && !is_investment_subtype(request.subtype)) {
        throw LedgerError(ErrorKind::InvalidInvestmentFields,
                          std::string("Subtype ") + to_string(request.subtype) + " cannot carry investment fields.");
    }
    if ((request.quantity && *request.quantity < 0.0) || (request.average_cost && *request.average_cost < 0)) {
        throw LedgerError(ErrorKind::InvalidInvestmentFields, "Quantity and average cost cannot be negative.");
    }
    if (request.symbol && !is_ticker_symbol(*request.symbol)) {
        throw LedgerError(ErrorKind::InvalidSymbol,
                          "Symbol '" + *request.symbol + "' must be 1-10 characters of A-Z, 0-9 or '.'.");
    }
    std::string currency = request.currency.empty() ? config_.default_currency : request.currency;
    if (!is_currency_code(currency)) {
        throw LedgerError(ErrorKind::InvalidCurrency,
                          "Currency '" + currency + "' is not a three-letter ISO 4217 code.");
    }

    std::optional<Account> parent;
    if (request.parent_id) {
        parent = uow.find_account(*request.parent_id);
        if (!parent) {
            throw LedgerError(ErrorKind::AccountNotFound, "Parent account " + *request.parent_id + " does not exist.");
        }
        if (!parent->is_active) {
            throw LedgerError(ErrorKind::AccountInactive, "Parent account " + parent->full_path + " is inactive.");
        }
        if (parent->type != request.type) {
            throw LedgerError(ErrorKind::InvalidHierarchy,
                              "Account type " + std::string(to_string(request.type)) + " differs from the type " +
                              to_string(parent->type) + " of parent " + parent->full_path + ".");
        }
    }

    Account account;
    account.id = LedgerCrypto::generate_uuid();
    account.name = name;
    account.type = request.type;
    account.subtype = request.subtype;
    account.parent_id = request.parent_id;
    account.full_path = child_path(parent, name);
    account.symbol = request.symbol;
    account.quantity = request.quantity;
    account.average_cost = request.average_cost;
    account.currency = currency;
    account.notes = request.notes;

    if (depth_of(account.full_path) > config_.max_hierarchy_depth) {
        throw LedgerError(ErrorKind::InvalidPath,
                          "Account hierarchy is limited to " + std::to_string(config_.max_hierarchy_depth) + " levels.");
    }
    ensure_unique_sibling(uow, account.parent_id, name, account.id);

    uow.insert_account(account);
    if (owner_policy_) {
        owner_policy_(uow, account, request.created_by);
    }

    log("INFO", "Account created: " + account.full_path + " (" + to_string(account.type) + "/" +
                to_string(account.subtype) + ")");
    return account;
}

AccountId AccountDirectory::resolve_or_create(UnitOfWork& uow, const std::string& path, AccountType type_hint,
                                              const std::optional<UserId>& created_by) {
    std::vector<std::string> segments = split_path(path);
    if (segments.size() > config_.max_hierarchy_depth) {
        throw LedgerError(ErrorKind::InvalidPath, "Account path '" + path + "' is too deep.");
    }

    // The hint types new roots; everything below an existing account takes its type.
    AccountType type = type_hint;
    std::optional<AccountId> parent;
    for (const auto& segment : segments) {
        std::optional<Account> found = lookup_segment(uow, parent, segment);
        if (found) {
            parent = found->id;
            type = found->type;
            continue;
        }
        NewAccount request;
        request.name = segment;
        request.type = type;
        request.subtype = AccountSubtype::Category;
        request.parent_id = parent;
        request.created_by = created_by;
        parent = create_account(uow, request).id;
    }
    return *parent;
}

std::optional<AccountId> AccountDirectory::resolve(UnitOfWork& uow, const std::string& path) {
    std::vector<std::string> segments = split_path(path);
    std::optional<AccountId> parent;
    for (const auto& segment : segments) {
        std::optional<Account> found = lookup_segment(uow, parent, segment);
        if (!found) return std::nullopt;
        parent = found->id;
    }
    return parent;
}

Account AccountDirectory::get_account(UnitOfWork& uow, const AccountId& id) {
    std::optional<Account> account = uow.find_account(id);
    if (!account) {
        throw LedgerError(ErrorKind::AccountNotFound, "Account " + id + " does not exist.");
    }
    return *account;
}

std::vector<Account> AccountDirectory::list_accounts(UnitOfWork& uow, bool include_inactive) {
    std::vector<Account> out;
    for (const auto& account : uow.all_accounts()) {
        if (include_inactive || account.is_active) out.push_back(account);
    }
    std::sort(out.begin(), out.end(), by_path);
    return out;
}

std::vector<Account> AccountDirectory::children_of(UnitOfWork& uow, const AccountId& id) {
    get_account(uow, id);
    std::vector<Account> out = uow.children_of(id);
    std::sort(out.begin(), out.end(), by_path);
    return out;
}

std::vector<Account> AccountDirectory::subtree_of_path(UnitOfWork& uow, const std::string& prefix) {
    std::vector<std::string> segments = split_path(prefix);
    std::string normalized;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) normalized += PATH_SEPARATOR;
        normalized += segments[i];
    }
    std::string below = normalized + PATH_SEPARATOR;

    std::vector<Account> out;
    for (const auto& account : uow.all_accounts()) {
        if (account.full_path == normalized || account.full_path.compare(0, below.size(), below) == 0) {
            out.push_back(account);
        }
    }
    std::sort(out.begin(), out.end(), by_path);
    return out;
}

Account AccountDirectory::move_or_rename(UnitOfWork& uow, const AccountId& id, const std::string& new_name,
                                         const std::optional<AccountId>& new_parent) {
    Account account = get_account(uow, id);
    std::string name = validate_name(new_name);

    std::optional<Account> parent;
    if (new_parent) {
        if (*new_parent == id) {
            throw LedgerError(ErrorKind::CircularReference, "An account cannot be its own parent.");
        }
        parent = uow.find_account(*new_parent);
        if (!parent) {
            throw LedgerError(ErrorKind::AccountNotFound, "Parent account " + *new_parent + " does not exist.");
        }
        if (!parent->is_active) {
            throw LedgerError(ErrorKind::AccountInactive, "Parent account " + parent->full_path + " is inactive.");
        }
        if (parent->type != account.type) {
            throw LedgerError(ErrorKind::InvalidHierarchy,
                              "Cannot move the " + std::string(to_string(account.type)) + " account " +
                              account.full_path + " under the " + to_string(parent->type) + " account " +
                              parent->full_path + ".");
        }
        std::optional<Account> cursor = parent;
        while (cursor && cursor->parent_id) {
            if (*cursor->parent_id == id) {
                throw LedgerError(ErrorKind::CircularReference,
                                  "Cannot move " + account.full_path + " under its own descendant " +
                                  parent->full_path + ".");
            }
            cursor = uow.find_account(*cursor->parent_id);
        }
    }

    std::string old_path = account.full_path;
    std::string new_path = child_path(parent, name);

    size_t subtree_height = 0;
    std::string below = old_path + PATH_SEPARATOR;
    for (const auto& other : uow.all_accounts()) {
        if (other.full_path.compare(0, below.size(), below) == 0) {
            subtree_height = std::max(subtree_height, depth_of(other.full_path) - depth_of(old_path));
        }
    }
    if (depth_of(new_path) + subtree_height > config_.max_hierarchy_depth) {
        throw LedgerError(ErrorKind::InvalidPath,
                          "Moving " + old_path + " would exceed " +
                          std::to_string(config_.max_hierarchy_depth) + " levels.");
    }

    ensure_unique_sibling(uow, new_parent, name, id);

    account.name = name;
    account.parent_id = new_parent;
    account.full_path = new_path;
    uow.update_account(account);
    refresh_descendant_paths(uow, account);

    log("INFO", "Account moved: " + old_path + " -> " + new_path);
    return account;
}

void AccountDirectory::refresh_descendant_paths(UnitOfWork& uow, const Account& root) {
    std::deque<Account> pending;
    pending.push_back(root);
    while (!pending.empty()) {
        Account current = pending.front();
        pending.pop_front();
        for (auto child : uow.children_of(current.id)) {
            child.full_path = current.full_path + PATH_SEPARATOR + child.name;
            uow.update_account(child);
            pending.push_back(child);
        }
    }
}

void AccountDirectory::deactivate(UnitOfWork& uow, const AccountId& id) {
    Account account = get_account(uow, id);
    if (!account.is_active) return;

    for (const auto& child : uow.children_of(id)) {
        if (child.is_active) {
            throw LedgerError(ErrorKind::AccountHasActiveChildren,
                              account.full_path + " still has the active child " + child.full_path + ".");
        }
    }
    account.is_active = false;
    uow.update_account(account);
    log("INFO", "Account deactivated: " + account.full_path);
}

void AccountDirectory::reactivate(UnitOfWork& uow, const AccountId& id) {
    Account account = get_account(uow, id);
    if (account.is_active) return;

    if (account.parent_id) {
        Account parent = get_account(uow, *account.parent_id);
        if (!parent.is_active) {
            throw LedgerError(ErrorKind::AccountInactive,
                              "Parent " + parent.full_path + " must be reactivated first.");
        }
    }
    account.is_active = true;
    uow.update_account(account);
    log("INFO", "Account reactivated: " + account.full_path);
}

} // namespace assets
