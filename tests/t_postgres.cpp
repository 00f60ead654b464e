#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include <cstdlib>
#include <thread>
#include "PgStore.hpp"
#include "ledger_fixture.hpp"

using namespace assets;
using namespace assets::test;

// These cases run against a scratch database named by ASSETS_TEST_DB and
// wipe it first. Without the variable they pass trivially.

namespace {

struct pg_fixture {
  std::shared_ptr<storage::PgStore> store;
  std::unique_ptr<Ledger> ledger;
  Date day;

  pg_fixture() : day(Date::from_ymd(2025, 6, 14)) {
    set_log_echo(false);
    const char* conn = std::getenv("ASSETS_TEST_DB");
    if (!conn) return;

    LedgerConfig config;
    config.store.backend = "postgres";
    config.store.connection = conn;
    config.store.max_retries = 10;
    store = std::make_shared<storage::PgStore>(conn);
    store->truncate_all();
    ledger.reset(new Ledger(store, config));
  }

  bool enabled() const {
    if (!ledger) BOOST_TEST_MESSAGE("ASSETS_TEST_DB not set; skipping PostgreSQL case");
    return static_cast<bool>(ledger);
  }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(postgres_store_tests, pg_fixture)

BOOST_AUTO_TEST_CASE(testPostAndReadBack)
{
  if (!enabled()) return;

  TransactionId id = ledger->income("Assets:Checking", "Income:Salary", m("3000.00"), "Salary", day, true);
  TransactionWithEntries txn = ledger->get_transaction(id);
  BOOST_CHECK(txn.transaction.date == day);
  BOOST_REQUIRE_EQUAL(2u, txn.entries.size());
  BOOST_CHECK_EQUAL(m("3000.00"), txn.entries[0].amount);
  BOOST_CHECK_EQUAL(0, txn.sum());
  BOOST_CHECK(ledger->audit_balances().empty());

  CHECK_LEDGER_ERROR(ledger->post_transaction("Off", day, {entry("Assets:Checking", "0.001"),
                                                           entry("Income:Salary", "0.00")}),
                     UnbalancedTransaction);
  BOOST_CHECK_EQUAL(1u, ledger->list_transactions().size());
}

BOOST_AUTO_TEST_CASE(testAccountTreeAndOwnership)
{
  if (!enabled()) return;

  User alice = ledger->create_user("alice");
  User bob = ledger->create_user("bob");
  AccountId joint = ledger->resolve_or_create_account("Assets:Bank1:Joint", AccountType::Asset);
  BOOST_CHECK_EQUAL(joint, *ledger->resolve_account("Assets:Bank1:Joint"));

  // The first user owns new accounts outright.
  CHECK_LEDGER_ERROR(ledger->set_ownership(joint, bob.id, 0.5), OwnershipExceeded);
  ledger->set_ownership(joint, alice.id, 0.6);
  CHECK_LEDGER_ERROR(ledger->set_ownership(joint, bob.id, 0.5), OwnershipExceeded);
  ledger->set_ownership(joint, bob.id, 0.4);
  BOOST_CHECK_CLOSE(1.0, ledger->ownership_weight(joint, {alice.id, bob.id}), 1e-6);

  AccountId bank = *ledger->resolve_account("Assets:Bank1");
  ledger->move_or_rename_account(bank, "BNP", *ledger->resolve_account("Assets"));
  BOOST_CHECK_EQUAL(std::string("Assets:BNP:Joint"), ledger->get_account(joint).full_path);
}

BOOST_AUTO_TEST_CASE(testMatchAndMergeRoundTrip)
{
  if (!enabled()) return;

  ledger->resolve_or_create_account("Assets:Checking", AccountType::Asset);
  ledger->resolve_or_create_account("Income:Salary", AccountType::Income);

  NewTransaction csv = PostingEngine::make_income("Assets:Checking", "Income:Salary", m("45.00"), "VIR SALAIRE", day);
  csv.import_source = std::string("bank_csv");
  TransactionId a = ledger->post_transaction(csv);

  NewTransaction ofx = PostingEngine::make_income("Assets:Checking", "Income:Salary", m("45.00"),
                                                  "SALAIRE VIREMENT", day);
  ofx.import_source = std::string("ofx");
  ofx.import_batch_id = std::string("batch-pg");
  TransactionId b = ledger->post_transaction(ofx);

  BatchDetectionResult result = ledger->detect_duplicates_for_batch("batch-pg", false);
  BOOST_REQUIRE_EQUAL(1u, result.matches.size());
  BOOST_CHECK(result.matches[0].confidence >= 0.80);

  MatchId id = ledger->record_match(b, a, 0.9, result.matches[0].criteria);
  BOOST_CHECK_EQUAL(result.matches[0].id, id);

  ledger->merge_transactions(b, a);
  BOOST_CHECK(ledger->get_transaction(a).transaction.is_duplicate);
  BOOST_CHECK(ledger->get_match(id).status == MatchStatus::Confirmed);

  ledger->unmerge_transaction(a);
  BOOST_CHECK(!ledger->get_transaction(a).transaction.is_duplicate);
  BOOST_CHECK(ledger->get_match(id).status == MatchStatus::Pending);
}

BOOST_AUTO_TEST_CASE(testConcurrentCreatorsOfOnePathAgree)
{
  if (!enabled()) return;

  // Every unit sees no "Assets:Race:Checking" and inserts it; the losers of
  // the unique key retry and resolve the winner's row.
  const int workers = 4;
  std::vector<AccountId> ids(workers);
  std::vector<std::string> failures(workers);
  std::vector<std::thread> threads;
  for (int i = 0; i < workers; ++i) {
    threads.emplace_back([&, i]() {
      try {
        ids[i] = ledger->resolve_or_create_account("Assets:Race:Checking", AccountType::Asset);
      } catch (const LedgerError& e) {
        failures[i] = error_kind_name(e.kind());
      }
    });
  }
  for (auto& t : threads) t.join();

  for (int i = 0; i < workers; ++i) {
    BOOST_CHECK_EQUAL(std::string(), failures[i]);
    BOOST_CHECK_EQUAL(ids[0], ids[i]);
  }
  BOOST_CHECK_EQUAL(1u, ledger->children_of(*ledger->resolve_account("Assets:Race")).size());
}

BOOST_AUTO_TEST_CASE(testConcurrentRecordMatchKeepsOneRow)
{
  if (!enabled()) return;

  ledger->resolve_or_create_account("Assets:Checking", AccountType::Asset);
  ledger->resolve_or_create_account("Expenses:Rent", AccountType::Expense);
  NewTransaction first = PostingEngine::make_expense("Assets:Checking", "Expenses:Rent", m("950.00"), "LOYER", day);
  first.import_source = std::string("bank_csv");
  NewTransaction second = first;
  second.import_source = std::string("ofx");
  TransactionId a = ledger->post_transaction(first);
  TransactionId b = ledger->post_transaction(second);

  const int workers = 4;
  std::vector<std::string> failures(workers);
  std::vector<std::thread> threads;
  for (int i = 0; i < workers; ++i) {
    threads.emplace_back([&, i]() {
      try {
        ledger->record_match(a, b, 0.95, MatchCriteria());
      } catch (const LedgerError& e) {
        failures[i] = error_kind_name(e.kind());
      }
    });
  }
  for (auto& t : threads) t.join();

  for (const auto& failure : failures) BOOST_CHECK_EQUAL(std::string(), failure);
  BOOST_CHECK_EQUAL(1u, ledger->list_matches().size());
}

BOOST_AUTO_TEST_CASE(testImportRegister)
{
  if (!enabled()) return;

  ImportedFile file;
  file.file_path = "/data/june.csv";
  file.file_hash = "abc123";
  file.import_source = "bank_csv";
  file.batch_id = "batch-1";
  file.imported_on = day;
  ledger->record_import(file);

  BOOST_CHECK(ledger->is_imported("abc123"));
  CHECK_LEDGER_ERROR(ledger->record_import(file), FileAlreadyImported);
  BOOST_REQUIRE_EQUAL(1u, ledger->list_imports().size());
  BOOST_CHECK_EQUAL(std::string("june.csv"), ledger->list_imports()[0].file_name);
}

BOOST_AUTO_TEST_SUITE_END()
