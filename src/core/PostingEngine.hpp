/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: PostingEngine.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Creates transactions as balanced sets of journal entries. The zero-sum
 * rule is checked in memory before anything is written and again right
 * before the rows are inserted, so no unit of work ever commits an entry
 * set whose sum is not exactly zero. Entries are never edited one by one:
 * replace_entries() and delete_transaction() work on the whole set.
 * ============================================================================
 */

#ifndef ASSETS_POSTING_ENGINE_HPP
#define ASSETS_POSTING_ENGINE_HPP

#include "AccountDirectory.hpp"
#include "store.hpp"
#include <string>
#include <vector>

namespace assets {

    struct EntryInput {
        std::string account;                // account id or colon-delimited path
        money_micro amount = 0;             // positive = debit, negative = credit
        std::optional<std::string> memo;
        std::optional<AccountType> type_hint;   // overrides NewTransaction::type_hint
    };

    struct NewTransaction {
        std::string description;
        Date date;
        std::optional<std::string> reference;
        std::optional<std::string> import_source;
        std::optional<BatchId> import_batch_id;
        std::optional<std::string> external_reference;
        std::optional<UserId> created_by;
        std::vector<EntryInput> entries;

        bool auto_create_accounts = false;
        AccountType type_hint = AccountType::Asset;
    };

    struct TransactionFilter {
        std::optional<Date> from;
        std::optional<Date> to;
        std::optional<std::string> account_prefix;  // path; matches the subtree
        std::optional<BatchId> import_batch_id;
        bool include_hidden = false;
    };

    struct UnbalancedRecord {
        TransactionId transaction_id;
        money_micro sum = 0;
        size_t entry_count = 0;
    };

    class PostingEngine {
    public:
        explicit PostingEngine(AccountDirectory& directory);

        // Pure input checks: EmptyTransaction, then UnbalancedTransaction.
        void check_entries(const std::vector<EntryInput>& entries) const;

        /**
         * resolve_accounts
         * Maps every entry to an account id. Paths are resolved through the
         * AccountDirectory; with `create` set, missing ones are created.
         * @throws AccountNotFound, AccountInactive
         */
        std::vector<AccountId> resolve_accounts(UnitOfWork& uow, const NewTransaction& request, bool create);

        // Validates, resolves without creating, and inserts header + entries.
        Transaction post(UnitOfWork& uow, const NewTransaction& request);

        void replace_entries(UnitOfWork& uow, const TransactionId& id, const std::vector<EntryInput>& entries);

        // Cascades to entries and match rows. Refused while anything is
        // merged into the transaction.
        void delete_transaction(UnitOfWork& uow, const TransactionId& id);

        TransactionWithEntries get_transaction(UnitOfWork& uow, const TransactionId& id);
        std::vector<TransactionWithEntries> list_transactions(UnitOfWork& uow, const TransactionFilter& filter);
        money_micro transaction_amount(UnitOfWork& uow, const TransactionId& id);

        // Every persisted transaction whose entries do not sum to zero.
        std::vector<UnbalancedRecord> audit_balances(UnitOfWork& uow);

        // Two-entry helpers. `amount` must be positive.
        static NewTransaction make_transfer(const std::string& from, const std::string& to, money_micro amount,
                                            const std::string& description, const Date& date);
        static NewTransaction make_income(const std::string& asset, const std::string& income, money_micro amount,
                                          const std::string& description, const Date& date);
        static NewTransaction make_expense(const std::string& asset, const std::string& expense, money_micro amount,
                                           const std::string& description, const Date& date);

    private:
        void insert_entries(UnitOfWork& uow, const TransactionId& id, const std::vector<EntryInput>& entries,
                            const std::vector<AccountId>& accounts);

        AccountDirectory& directory_;
    };

} // namespace assets

#endif // ASSETS_POSTING_ENGINE_HPP
