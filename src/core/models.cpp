/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: models.cpp
 * ============================================================================
 */

#include "models.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace assets {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::pair<AccountSubtype, const char*> SUBTYPE_NAMES[] = {
    {AccountSubtype::Cash, "cash"},
    {AccountSubtype::Checking, "checking"},
    {AccountSubtype::Savings, "savings"},
    {AccountSubtype::InvestmentAccount, "investment_account"},
    {AccountSubtype::Stocks, "stocks"},
    {AccountSubtype::Etf, "etf"},
    {AccountSubtype::Bonds, "bonds"},
    {AccountSubtype::MutualFund, "mutual_fund"},
    {AccountSubtype::Crypto, "crypto"},
    {AccountSubtype::RealEstate, "real_estate"},
    {AccountSubtype::Equipment, "equipment"},
    {AccountSubtype::OtherAsset, "other_asset"},
    {AccountSubtype::CreditCard, "credit_card"},
    {AccountSubtype::Loan, "loan"},
    {AccountSubtype::Mortgage, "mortgage"},
    {AccountSubtype::OtherLiability, "other_liability"},
    {AccountSubtype::OpeningBalance, "opening_balance"},
    {AccountSubtype::RetainedEarnings, "retained_earnings"},
    {AccountSubtype::OwnerEquity, "owner_equity"},
    {AccountSubtype::Salary, "salary"},
    {AccountSubtype::Bonus, "bonus"},
    {AccountSubtype::Dividend, "dividend"},
    {AccountSubtype::Interest, "interest"},
    {AccountSubtype::Investment, "investment"},
    {AccountSubtype::Rental, "rental"},
    {AccountSubtype::CapitalGains, "capital_gains"},
    {AccountSubtype::OtherIncome, "other_income"},
    {AccountSubtype::Food, "food"},
    {AccountSubtype::Housing, "housing"},
    {AccountSubtype::Transportation, "transportation"},
    {AccountSubtype::Communication, "communication"},
    {AccountSubtype::Entertainment, "entertainment"},
    {AccountSubtype::Personal, "personal"},
    {AccountSubtype::Utilities, "utilities"},
    {AccountSubtype::Healthcare, "healthcare"},
    {AccountSubtype::Taxes, "taxes"},
    {AccountSubtype::Fees, "fees"},
    {AccountSubtype::OtherExpense, "other_expense"},
    {AccountSubtype::Category, "category"},
};

} // namespace

const char* to_string(AccountType type) {
    switch (type) {
        case AccountType::Asset: return "asset";
        case AccountType::Liability: return "liability";
        case AccountType::Equity: return "equity";
        case AccountType::Income: return "income";
        case AccountType::Expense: return "expense";
    }
    return "asset";
}

const char* to_string(AccountSubtype subtype) {
    for (const auto& entry : SUBTYPE_NAMES) {
        if (entry.first == subtype) return entry.second;
    }
    return "category";
}

AccountType account_type_from_string(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "asset" || t == "assets") return AccountType::Asset;
    if (t == "liability" || t == "liabilities") return AccountType::Liability;
    if (t == "equity") return AccountType::Equity;
    if (t == "income") return AccountType::Income;
    if (t == "expense" || t == "expenses") return AccountType::Expense;
    throw LedgerError(ErrorKind::InvalidSubtype, "Unknown account type: " + text);
}

AccountSubtype account_subtype_from_string(const std::string& text) {
    std::string t = lowercase(text);
    for (const auto& entry : SUBTYPE_NAMES) {
        if (t == entry.second) return entry.first;
    }
    throw LedgerError(ErrorKind::InvalidSubtype, "Unknown account subtype: " + text);
}

bool subtype_belongs_to(AccountSubtype subtype, AccountType type) {
    if (subtype == AccountSubtype::Category) return true;

    switch (type) {
        case AccountType::Asset:
            return subtype >= AccountSubtype::Cash && subtype <= AccountSubtype::OtherAsset;
        case AccountType::Liability:
            return subtype >= AccountSubtype::CreditCard && subtype <= AccountSubtype::OtherLiability;
        case AccountType::Equity:
            return subtype >= AccountSubtype::OpeningBalance && subtype <= AccountSubtype::OwnerEquity;
        case AccountType::Income:
            return subtype >= AccountSubtype::Salary && subtype <= AccountSubtype::OtherIncome;
        case AccountType::Expense:
            return subtype >= AccountSubtype::Food && subtype <= AccountSubtype::OtherExpense;
    }
    return false;
}

bool is_currency_code(const std::string& code) {
    if (code.size() != 3) return false;
    for (char c : code) {
        if (c < 'A' || c > 'Z') return false;
    }
    return true;
}

bool is_ticker_symbol(const std::string& symbol) {
    if (symbol.empty() || symbol.size() > 10) return false;
    for (char c : symbol) {
        if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.')) return false;
    }
    return true;
}

bool is_investment_subtype(AccountSubtype subtype) {
    switch (subtype) {
        case AccountSubtype::InvestmentAccount:
        case AccountSubtype::Stocks:
        case AccountSubtype::Etf:
        case AccountSubtype::Bonds:
        case AccountSubtype::MutualFund:
        case AccountSubtype::Crypto:
            return true;
        default:
            return false;
    }
}

bool increases_with_debit(AccountType type) {
    return type == AccountType::Asset || type == AccountType::Expense;
}

money_micro TransactionWithEntries::sum() const {
    money_micro total = 0;
    for (const auto& entry : entries) total = add_money(total, entry.amount);
    return total;
}

money_micro TransactionWithEntries::amount() const {
    // Debit side of a balanced entry set.
    money_micro total = 0;
    for (const auto& entry : entries) {
        if (entry.amount > 0) total = add_money(total, entry.amount);
    }
    return total;
}

const char* to_string(MatchTier tier) {
    switch (tier) {
        case MatchTier::Exact: return "EXACT";
        case MatchTier::Probable: return "PROBABLE";
        case MatchTier::Possible: return "POSSIBLE";
    }
    return "POSSIBLE";
}

const char* to_string(MatchStatus status) {
    switch (status) {
        case MatchStatus::Pending: return "PENDING";
        case MatchStatus::Confirmed: return "CONFIRMED";
        case MatchStatus::Rejected: return "REJECTED";
    }
    return "PENDING";
}

MatchTier match_tier_from_string(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "exact") return MatchTier::Exact;
    if (t == "probable") return MatchTier::Probable;
    if (t == "possible") return MatchTier::Possible;
    throw LedgerError(ErrorKind::InvalidConfidence, "Unknown match tier: " + text);
}

MatchStatus match_status_from_string(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "pending") return MatchStatus::Pending;
    if (t == "confirmed") return MatchStatus::Confirmed;
    if (t == "rejected") return MatchStatus::Rejected;
    throw LedgerError(ErrorKind::InvalidStatusTransition, "Unknown match status: " + text);
}

} // namespace assets
