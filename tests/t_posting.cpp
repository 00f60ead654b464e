#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "ledger_fixture.hpp"

using namespace assets;
using namespace assets::test;

namespace {

struct posting_fixture : ledger_fixture {
  posting_fixture() {
    open_accounts({"Assets:Checking", "Assets:Savings"});
    open_accounts({"Income:Salary"}, AccountType::Income);
    open_accounts({"Expenses:Food:Groceries", "Expenses:Rent"}, AccountType::Expense);
  }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(posting_tests, posting_fixture)

// ---------------------------------------------------------------------------
// 1. Balanced postings
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testPostStoresHeaderAndEntries)
{
  NewTransaction request;
  request.description = "Carrefour";
  request.date = day;
  request.reference = std::string("CB-0042");
  request.import_source = std::string("bank_csv");
  request.entries.push_back(entry("Expenses:Food:Groceries", "45.00"));
  request.entries.push_back(entry("Assets:Checking", "-45.00"));
  request.entries[0].memo = std::string("weekly shop");

  TransactionId id = ledger->post_transaction(request);
  TransactionWithEntries txn = ledger->get_transaction(id);

  BOOST_CHECK_EQUAL(std::string("Carrefour"), txn.transaction.description);
  BOOST_CHECK(txn.transaction.date == day);
  BOOST_CHECK(!txn.transaction.is_duplicate);
  BOOST_REQUIRE_EQUAL(2u, txn.entries.size());
  BOOST_CHECK_EQUAL(0, txn.entries[0].position);
  BOOST_CHECK_EQUAL(m("45.00"), txn.entries[0].amount);
  BOOST_CHECK_EQUAL(*ledger->resolve_account("Assets:Checking"), txn.entries[1].account_id);
  BOOST_REQUIRE(txn.entries[0].memo);
  BOOST_CHECK_EQUAL(std::string("weekly shop"), *txn.entries[0].memo);

  BOOST_CHECK_EQUAL(0, txn.sum());
  BOOST_CHECK_EQUAL(m("45.00"), ledger->transaction_amount(id));
}

BOOST_AUTO_TEST_CASE(testEntriesMayReferenceAccountIds)
{
  AccountId checking = *ledger->resolve_account("Assets:Checking");
  AccountId rent = *ledger->resolve_account("Expenses:Rent");

  TransactionId id = ledger->post_transaction("June rent", day, {entry(rent, "950.00"), entry(checking, "-950.00")});
  BOOST_CHECK_EQUAL(rent, ledger->get_transaction(id).entries[0].account_id);
}

BOOST_AUTO_TEST_CASE(testSplitTransaction)
{
  // Gross salary split between checking and savings.
  TransactionId id = ledger->post_transaction("Salary June", day, {
      entry("Assets:Checking", "2500.00"),
      entry("Assets:Savings", "500.00"),
      entry("Income:Salary", "-3000.00")});

  BOOST_CHECK_EQUAL(3u, ledger->get_transaction(id).entries.size());
  BOOST_CHECK_EQUAL(m("3000.00"), ledger->transaction_amount(id));
}

BOOST_AUTO_TEST_CASE(testAutoCreateAccountsWithTypeHints)
{
  reopen(LedgerConfig());

  TransactionId id = ledger->income("Assets:Checking", "Income:Salary", m("3000.00"), "Salary", day, true);

  std::optional<AccountId> checking = ledger->resolve_account("Assets:Checking");
  std::optional<AccountId> salary = ledger->resolve_account("Income:Salary");
  BOOST_REQUIRE(checking);
  BOOST_REQUIRE(salary);
  BOOST_CHECK(ledger->get_account(*checking).type == AccountType::Asset);
  BOOST_CHECK(ledger->get_account(*salary).type == AccountType::Income);
  BOOST_CHECK(ledger->get_account(*ledger->resolve_account("Income")).type == AccountType::Income);

  TransactionWithEntries txn = ledger->get_transaction(id);
  BOOST_REQUIRE_EQUAL(2u, txn.entries.size());
  BOOST_CHECK_EQUAL(m("3000.00"), txn.entries[0].amount);
  BOOST_CHECK_EQUAL(*checking, txn.entries[0].account_id);
  BOOST_CHECK_EQUAL(-m("3000.00"), txn.entries[1].amount);
  BOOST_CHECK_EQUAL(0, txn.sum());
}

BOOST_AUTO_TEST_CASE(testTransferAndExpenseHelpers)
{
  TransactionId t = ledger->transfer("Assets:Checking", "Assets:Savings", m("200.00"), "Save", day);
  TransactionWithEntries transfer = ledger->get_transaction(t);
  BOOST_CHECK_EQUAL(*ledger->resolve_account("Assets:Savings"), transfer.entries[0].account_id);
  BOOST_CHECK_EQUAL(m("200.00"), transfer.entries[0].amount);

  TransactionId e = ledger->expense("Assets:Checking", "Expenses:Rent", m("950.00"), "Rent", day);
  TransactionWithEntries expense = ledger->get_transaction(e);
  BOOST_CHECK_EQUAL(*ledger->resolve_account("Expenses:Rent"), expense.entries[0].account_id);
  BOOST_CHECK_EQUAL(-m("950.00"), expense.entries[1].amount);

  CHECK_LEDGER_ERROR(ledger->expense("Assets:Checking", "Expenses:Rent", 0, "Nothing", day), InvalidAmount);
  CHECK_LEDGER_ERROR(ledger->transfer("Assets:Checking", "Assets:Savings", -m("1.00"), "Back", day), InvalidAmount);
}

// ---------------------------------------------------------------------------
// 2. Rejected postings leave no trace
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testOneThousandthOffIsUnbalanced)
{
  CHECK_LEDGER_ERROR(ledger->post_transaction("Off", day, {entry("Expenses:Rent", "100.001"),
                                                           entry("Assets:Checking", "-100.00")}),
                     UnbalancedTransaction);
  BOOST_CHECK(ledger->list_transactions().empty());
}

BOOST_AUTO_TEST_CASE(testNegativeSumIsUnbalanced)
{
  CHECK_LEDGER_ERROR(ledger->post_transaction("Short", day, {entry("Expenses:Rent", "10.00"),
                                                             entry("Assets:Checking", "-15.00")}),
                     UnbalancedTransaction);
  BOOST_CHECK(ledger->list_transactions().empty());
}

BOOST_AUTO_TEST_CASE(testEntriesThatWrapAroundAreRejected)
{
  // 2 * INT64_MAX + 2 micros is 2^64, which wraps to zero in int64.
  CHECK_LEDGER_ERROR(ledger->post_transaction("Wrap", day, {entry("Expenses:Rent", "9223372036854.775807"),
                                                            entry("Expenses:Rent", "9223372036854.775807"),
                                                            entry("Assets:Checking", "0.000002")}),
                     InvalidAmount);
  BOOST_CHECK(ledger->list_transactions().empty());
  BOOST_CHECK(ledger->audit_balances().empty());
}

BOOST_AUTO_TEST_CASE(testUnbalancedPostingCreatesNoAccounts)
{
  reopen(LedgerConfig());

  NewTransaction request;
  request.description = "Broken import row";
  request.date = day;
  request.auto_create_accounts = true;
  request.entries.push_back(entry("Assets:Checking", "10.00"));
  request.entries.push_back(entry("Income:Misc", "-9.99"));

  CHECK_LEDGER_ERROR(ledger->post_transaction(request), UnbalancedTransaction);
  BOOST_CHECK(ledger->list_accounts().empty());
}

BOOST_AUTO_TEST_CASE(testFewerThanTwoEntries)
{
  CHECK_LEDGER_ERROR(ledger->post_transaction("Nothing", day, {}), EmptyTransaction);
  CHECK_LEDGER_ERROR(ledger->post_transaction("Single", day, {entry("Assets:Checking", "0.00")}),
                     EmptyTransaction);
}

BOOST_AUTO_TEST_CASE(testUnknownAccountWithoutAutoCreate)
{
  CHECK_LEDGER_ERROR(ledger->post_transaction("Gym", day, {entry("Expenses:Sport", "30.00"),
                                                           entry("Assets:Checking", "-30.00")}),
                     AccountNotFound);
  BOOST_CHECK(!ledger->resolve_account("Expenses:Sport"));
  BOOST_CHECK(ledger->list_transactions().empty());
}

BOOST_AUTO_TEST_CASE(testInactiveAccountRefusesPostings)
{
  AccountId savings = *ledger->resolve_account("Assets:Savings");
  ledger->deactivate_account(savings);

  CHECK_LEDGER_ERROR(ledger->transfer("Assets:Checking", "Assets:Savings", m("1.00"), "Save", day),
                     AccountInactive);
  BOOST_CHECK(ledger->list_transactions().empty());
}

// ---------------------------------------------------------------------------
// 3. Editing and deleting
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testReplaceEntries)
{
  TransactionId id = post("Carrefour", day, "Assets:Checking", "Expenses:Food:Groceries", "45.00");

  ledger->replace_entries(id, {entry("Expenses:Food:Groceries", "40.00"),
                               entry("Expenses:Rent", "5.00"),
                               entry("Assets:Checking", "-45.00")});
  BOOST_CHECK_EQUAL(3u, ledger->get_transaction(id).entries.size());

  CHECK_LEDGER_ERROR(ledger->replace_entries(id, {entry("Expenses:Rent", "5.00"),
                                                  entry("Assets:Checking", "-4.00")}),
                     UnbalancedTransaction);
  CHECK_LEDGER_ERROR(ledger->replace_entries(id, {entry("Expenses:Sport", "5.00"),
                                                  entry("Assets:Checking", "-5.00")}),
                     AccountNotFound);
  BOOST_CHECK_EQUAL(3u, ledger->get_transaction(id).entries.size());

  CHECK_LEDGER_ERROR(ledger->replace_entries("missing", {entry("Expenses:Rent", "5.00"),
                                                         entry("Assets:Checking", "-5.00")}),
                     TransactionNotFound);
}

BOOST_AUTO_TEST_CASE(testDeleteCascadesToMatches)
{
  TransactionId a = post("VIR SALAIRE", day, "Income:Salary", "Assets:Checking", "3000.00", std::string("csv"));
  TransactionId b = post("SALAIRE", day, "Income:Salary", "Assets:Checking", "3000.00", std::string("ofx"));
  ledger->record_match(a, b, 0.8, MatchCriteria());

  ledger->delete_transaction(b);
  CHECK_LEDGER_ERROR(ledger->get_transaction(b), TransactionNotFound);
  BOOST_CHECK(ledger->list_matches().empty());
  BOOST_CHECK_EQUAL(1u, ledger->list_transactions().size());
  CHECK_LEDGER_ERROR(ledger->delete_transaction(b), TransactionNotFound);
}

BOOST_AUTO_TEST_CASE(testDeleteRefusedWhileDuplicatesAreMerged)
{
  TransactionId a = post("Rent", day, "Assets:Checking", "Expenses:Rent", "950.00", std::string("csv"));
  TransactionId b = post("Rent", day, "Assets:Checking", "Expenses:Rent", "950.00", std::string("ofx"));
  ledger->merge_transactions(a, b);

  CHECK_LEDGER_ERROR(ledger->delete_transaction(a), TransactionHasMergedDuplicates);
  ledger->unmerge_transaction(b);
  BOOST_CHECK_NO_THROW(ledger->delete_transaction(a));
}

// ---------------------------------------------------------------------------
// 4. Listing and audit
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testListFilters)
{
  TransactionId rent = post("Rent", day, "Assets:Checking", "Expenses:Rent", "950.00", std::string("csv"),
                            std::string("batch-1"));
  TransactionId food = post("Food", day.add_days(2), "Assets:Checking", "Expenses:Food:Groceries", "45.00");
  TransactionId pay = post("Pay", day.add_days(5), "Income:Salary", "Assets:Checking", "3000.00");

  TransactionFilter expenses;
  expenses.account_prefix = std::string("Expenses");
  std::vector<TransactionWithEntries> spent = ledger->list_transactions(expenses);
  BOOST_REQUIRE_EQUAL(2u, spent.size());
  BOOST_CHECK_EQUAL(rent, spent[0].transaction.id);
  BOOST_CHECK_EQUAL(food, spent[1].transaction.id);

  TransactionFilter window;
  window.from = day.add_days(1);
  window.to = day.add_days(5);
  std::vector<TransactionWithEntries> dated = ledger->list_transactions(window);
  BOOST_REQUIRE_EQUAL(2u, dated.size());
  BOOST_CHECK_EQUAL(pay, dated[1].transaction.id);

  TransactionFilter batch;
  batch.import_batch_id = std::string("batch-1");
  BOOST_CHECK_EQUAL(1u, ledger->list_transactions(batch).size());

  TransactionFilter nowhere;
  nowhere.account_prefix = std::string("Liabilities");
  BOOST_CHECK(ledger->list_transactions(nowhere).empty());
}

BOOST_AUTO_TEST_CASE(testHiddenTransactionsAreExcludedByDefault)
{
  TransactionId a = post("Rent", day, "Assets:Checking", "Expenses:Rent", "950.00", std::string("csv"));
  TransactionId b = post("Rent", day, "Assets:Checking", "Expenses:Rent", "950.00", std::string("ofx"));
  ledger->merge_transactions(a, b);

  BOOST_CHECK_EQUAL(1u, ledger->list_transactions().size());
  TransactionFilter all;
  all.include_hidden = true;
  BOOST_CHECK_EQUAL(2u, ledger->list_transactions(all).size());
}

BOOST_AUTO_TEST_CASE(testAuditFindsCorruptedTransactions)
{
  post("Rent", day, "Assets:Checking", "Expenses:Rent", "950.00");
  BOOST_CHECK(ledger->audit_balances().empty());

  // A row written around the engine.
  AccountId checking = *ledger->resolve_account("Assets:Checking");
  {
    std::unique_ptr<UnitOfWork> uow = store->begin();
    Transaction txn;
    txn.id = "corrupt-1";
    txn.description = "Legacy import";
    txn.date = day;
    uow->insert_transaction(txn);

    JournalEntry e;
    e.id = "corrupt-1-0";
    e.transaction_id = txn.id;
    e.account_id = checking;
    e.amount = m("12.50");
    uow->insert_entry(e);
    uow->commit();
  }

  std::vector<UnbalancedRecord> broken = ledger->audit_balances();
  BOOST_REQUIRE_EQUAL(1u, broken.size());
  BOOST_CHECK_EQUAL(std::string("corrupt-1"), broken[0].transaction_id);
  BOOST_CHECK_EQUAL(m("12.50"), broken[0].sum);
  BOOST_CHECK_EQUAL(1u, broken[0].entry_count);
}

BOOST_AUTO_TEST_CASE(testAuditRefusesOverflowingRows)
{
  AccountId checking = *ledger->resolve_account("Assets:Checking");
  {
    std::unique_ptr<UnitOfWork> uow = store->begin();
    Transaction txn;
    txn.id = "corrupt-2";
    txn.description = "Legacy import";
    txn.date = day;
    uow->insert_transaction(txn);

    const char* amounts[] = {"9223372036854.775807", "9223372036854.775807", "0.000002"};
    for (int i = 0; i < 3; ++i) {
      JournalEntry e;
      e.id = "corrupt-2-" + std::to_string(i);
      e.transaction_id = txn.id;
      e.account_id = checking;
      e.amount = m(amounts[i]);
      e.position = i;
      uow->insert_entry(e);
    }
    uow->commit();
  }

  CHECK_LEDGER_ERROR(ledger->audit_balances(), InvalidAmount);
}

BOOST_AUTO_TEST_SUITE_END()
