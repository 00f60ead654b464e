/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: models.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Rows of the ledger: the chart of accounts, users and their ownership
 * shares, transactions with their journal entries, duplicate matches and
 * the imported-file register. These are plain value types; the rules that
 * keep them consistent live in the components that write them.
 * ============================================================================
 */

#ifndef ASSETS_MODELS_HPP
#define ASSETS_MODELS_HPP

#include "date.hpp"
#include "money.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace assets {

    typedef std::string AccountId;
    typedef std::string UserId;
    typedef std::string TransactionId;
    typedef std::string EntryId;
    typedef std::string MatchId;
    typedef std::string BatchId;

    // Separator of the colon-delimited account path ("Assets:Bank1:Checking").
    constexpr char PATH_SEPARATOR = ':';

    // ------------------------------------------------------------------------
    // Chart of accounts
    // ------------------------------------------------------------------------

    enum class AccountType {
        Asset,
        Liability,
        Equity,
        Income,
        Expense
    };

    enum class AccountSubtype {
        // Asset
        Cash, Checking, Savings, InvestmentAccount, Stocks, Etf, Bonds,
        MutualFund, Crypto, RealEstate, Equipment, OtherAsset,
        // Liability
        CreditCard, Loan, Mortgage, OtherLiability,
        // Equity
        OpeningBalance, RetainedEarnings, OwnerEquity,
        // Income
        Salary, Bonus, Dividend, Interest, Investment, Rental, CapitalGains, OtherIncome,
        // Expense
        Food, Housing, Transportation, Communication, Entertainment, Personal,
        Utilities, Healthcare, Taxes, Fees, OtherExpense,
        // Grouping node, valid under every type
        Category
    };

    const char* to_string(AccountType type);
    const char* to_string(AccountSubtype subtype);
    // Both throw LedgerError(InvalidSubtype) for unknown names.
    AccountType account_type_from_string(const std::string& text);
    AccountSubtype account_subtype_from_string(const std::string& text);

    bool subtype_belongs_to(AccountSubtype subtype, AccountType type);
    bool is_investment_subtype(AccountSubtype subtype);

    // Three uppercase ASCII letters ("EUR", "USD").
    bool is_currency_code(const std::string& code);
    // 1-10 characters from A-Z, 0-9 and '.' ("AAPL", "BRK.B", "CW8").
    bool is_ticker_symbol(const std::string& symbol);

    // Asset and Expense balances grow with debits (positive amounts).
    bool increases_with_debit(AccountType type);

    struct Account {
        AccountId id;
        std::string name;
        AccountType type = AccountType::Asset;
        AccountSubtype subtype = AccountSubtype::Category;
        std::optional<AccountId> parent_id;
        std::string full_path;              // cached, derived from the parent chain

        std::optional<std::string> symbol;  // investment accounts only
        std::optional<double> quantity;
        std::optional<money_micro> average_cost;

        std::string currency = "EUR";
        bool is_active = true;
        std::optional<std::string> notes;
    };

    struct NewAccount {
        std::string name;
        AccountType type = AccountType::Asset;
        AccountSubtype subtype = AccountSubtype::Category;
        std::optional<AccountId> parent_id;
        std::string currency;               // empty: configured default
        std::optional<std::string> symbol;
        std::optional<double> quantity;
        std::optional<money_micro> average_cost;
        std::optional<std::string> notes;
        std::optional<UserId> created_by;   // used by the "creator" owner policy
    };

    // ------------------------------------------------------------------------
    // Users and ownership
    // ------------------------------------------------------------------------

    struct User {
        UserId id;
        std::string name;
        std::string display_name;
        bool is_active = true;
        int64_t sequence = 0;   // creation order; the first user has the lowest
    };

    struct OwnershipShare {
        AccountId account_id;
        UserId user_id;
        double percentage = 0.0;    // fraction in (0, 1]
    };

    // ------------------------------------------------------------------------
    // Transactions
    // ------------------------------------------------------------------------

    struct Transaction {
        TransactionId id;
        std::string description;
        std::optional<std::string> reference;
        Date date;

        std::optional<std::string> import_source;
        std::optional<BatchId> import_batch_id;
        std::optional<std::string> external_reference;

        bool is_duplicate = false;                  // hidden from aggregation
        std::optional<TransactionId> merged_into;

        std::optional<UserId> created_by;
    };

    struct JournalEntry {
        EntryId id;
        TransactionId transaction_id;
        AccountId account_id;
        money_micro amount = 0;     // positive = debit, negative = credit
        std::optional<std::string> memo;
        int position = 0;           // order within the transaction
    };

    struct TransactionWithEntries {
        Transaction transaction;
        std::vector<JournalEntry> entries;

        money_micro sum() const;
        // Sum of the positive (debit) entries: the money that moved.
        money_micro amount() const;
    };

    // ------------------------------------------------------------------------
    // Duplicate matching
    // ------------------------------------------------------------------------

    enum class MatchTier {
        Exact,
        Probable,
        Possible
    };

    enum class MatchStatus {
        Pending,
        Confirmed,
        Rejected
    };

    const char* to_string(MatchTier tier);
    const char* to_string(MatchStatus status);
    // Accept "EXACT"/"Exact"/"exact" style names.
    MatchTier match_tier_from_string(const std::string& text);
    MatchStatus match_status_from_string(const std::string& text);

    /**
     * @brief Why two transactions were proposed as duplicates.
     */
    struct MatchCriteria {
        money_micro amount_diff = 0;
        int32_t date_diff_days = 0;
        double description_similarity = 0.0;
        bool same_date = false;
        bool same_amount = false;
        bool manual = false;        // produced by a human merge, not the matcher
    };

    struct TransactionMatch {
        MatchId id;
        TransactionId primary_id;
        TransactionId duplicate_id;
        double confidence = 0.0;
        MatchCriteria criteria;
        MatchTier tier = MatchTier::Possible;
        MatchStatus status = MatchStatus::Pending;
        bool created_by_merge = false;
    };

    // ------------------------------------------------------------------------
    // Imported files
    // ------------------------------------------------------------------------

    struct ImportedFile {
        std::string id;
        std::string file_path;
        std::string file_name;
        std::string file_hash;      // SHA-256, lowercase hex
        int64_t file_size = 0;
        std::string import_source;
        BatchId batch_id;
        std::optional<UserId> imported_by;
        int transaction_count = 0;
        std::optional<std::string> notes;
        Date imported_on;
    };

} // namespace assets

#endif // ASSETS_MODELS_HPP
