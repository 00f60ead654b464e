/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ledger_fixture.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Shared fixture of the unit suites: a Ledger over a fresh MemoryStore,
 * plus shorthands for building entries and two-leg postings.
 * ============================================================================
 */

#ifndef ASSETS_TEST_LEDGER_FIXTURE_HPP
#define ASSETS_TEST_LEDGER_FIXTURE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"
#include "ledger.hpp"
#include "logging.hpp"
#include "MemoryStore.hpp"

namespace assets {
namespace test {

    // BOOST_CHECK_EXCEPTION predicate.
    struct kind_is {
        explicit kind_is(ErrorKind k) : kind(k) {}
        bool operator()(const LedgerError& e) const { return e.kind() == kind; }
        ErrorKind kind;
    };

    inline money_micro m(const std::string& text) {
        return parse_money(text);
    }

    inline EntryInput entry(const std::string& account, const std::string& amount) {
        EntryInput e;
        e.account = account;
        e.amount = parse_money(amount);
        return e;
    }

    struct ledger_fixture {
        LedgerConfig config;
        std::shared_ptr<storage::MemoryStore> store;
        std::unique_ptr<Ledger> ledger;
        Date day;

        ledger_fixture() : day(Date::from_ymd(2025, 6, 14)) {
            set_log_echo(false);
            reopen(config);
        }

        // Fresh, empty store under a new configuration.
        void reopen(const LedgerConfig& next) {
            config = next;
            store = std::make_shared<storage::MemoryStore>();
            ledger.reset(new Ledger(store, config));
        }

        // Debits `to`, credits `from`; both paths must already exist.
        TransactionId post(const std::string& description, const Date& date, const std::string& from,
                           const std::string& to, const std::string& amount,
                           const std::optional<std::string>& source = std::nullopt,
                           const std::optional<BatchId>& batch = std::nullopt) {
            NewTransaction request;
            request.description = description;
            request.date = date;
            request.import_source = source;
            request.import_batch_id = batch;
            request.entries.push_back(entry(to, amount));
            request.entries.push_back(entry(from, "-" + amount));
            return ledger->post_transaction(request);
        }

        void open_accounts(const std::vector<std::string>& paths, AccountType type = AccountType::Asset) {
            for (const auto& path : paths) ledger->resolve_or_create_account(path, type);
        }
    };

} // namespace test
} // namespace assets

#define CHECK_LEDGER_ERROR(expr, k) \
    BOOST_CHECK_EXCEPTION(expr, assets::LedgerError, assets::test::kind_is(assets::ErrorKind::k))

#endif // ASSETS_TEST_LEDGER_FIXTURE_HPP
