#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "json_codec.hpp"
#include "ledger_fixture.hpp"

using namespace assets;
using namespace assets::test;

BOOST_FIXTURE_TEST_SUITE(json_codec_tests, ledger_fixture)

BOOST_AUTO_TEST_CASE(testAmountsFromStringsAndNumbers)
{
  BOOST_CHECK_EQUAL(m("45.00"), amount_from_json(json("45.00")));
  BOOST_CHECK_EQUAL(m("3000"), amount_from_json(json(3000)));
  BOOST_CHECK_EQUAL(m("-45.5"), amount_from_json(json(-45.5)));
  BOOST_CHECK_EQUAL(m("0.01"), amount_from_json(json::parse("0.01")));
  BOOST_CHECK_EQUAL(m("100.000001"), amount_from_json(json::parse("100.000001")));
}

BOOST_AUTO_TEST_CASE(testNumericAmountsAreNeverRounded)
{
  // Seven decimals are refused whether they arrive as a number or a string.
  CHECK_LEDGER_ERROR(amount_from_json(json::parse("100.0000004")), InvalidAmount);
  CHECK_LEDGER_ERROR(amount_from_json(json("100.0000004")), InvalidAmount);
  CHECK_LEDGER_ERROR(amount_from_json(json::parse("1e30")), InvalidAmount);
  CHECK_LEDGER_ERROR(amount_from_json(json::parse("18446744073709551615")), InvalidAmount);
  CHECK_LEDGER_ERROR(amount_from_json(json(true)), InvalidAmount);
}

BOOST_AUTO_TEST_CASE(testPostingBodyWithSubMicroAmountIsRefused)
{
  open_accounts({"Assets:Checking"});
  open_accounts({"Expenses:Rent"}, AccountType::Expense);

  json body = json::parse(R"({
    "description": "Rent",
    "date": "2025-06-14",
    "entries": [
      {"account": "Expenses:Rent", "amount": 100.0000004},
      {"account": "Assets:Checking", "amount": -100}
    ]
  })");
  CHECK_LEDGER_ERROR(body.get<NewTransaction>(), InvalidAmount);
  BOOST_CHECK(ledger->list_transactions().empty());

  body["entries"][0]["amount"] = 100;
  NewTransaction request = body.get<NewTransaction>();
  BOOST_CHECK_NO_THROW(ledger->post_transaction(request));
  BOOST_CHECK_EQUAL(1u, ledger->list_transactions().size());
}

BOOST_AUTO_TEST_CASE(testTransactionEncoding)
{
  open_accounts({"Assets:Checking"});
  open_accounts({"Expenses:Rent"}, AccountType::Expense);
  TransactionId id = post("Rent", day, "Assets:Checking", "Expenses:Rent", "950.00", std::string("ofx"));

  json out = ledger->get_transaction(id);
  BOOST_CHECK_EQUAL(std::string("2025-06-14"), out["date"].get<std::string>());
  BOOST_CHECK_EQUAL(std::string("950.00"), out["amount"].get<std::string>());
  BOOST_CHECK_EQUAL(2u, out["entries"].size());
}

BOOST_AUTO_TEST_CASE(testErrorBody)
{
  json body = error_body(LedgerError(ErrorKind::UnbalancedTransaction, "Entries must sum to zero, got 0.001."));
  BOOST_CHECK_EQUAL(std::string("UnbalancedTransaction"), body["error"].get<std::string>());
  BOOST_CHECK_EQUAL(std::string("Entries must sum to zero, got 0.001."), body["message"].get<std::string>());
}

BOOST_AUTO_TEST_SUITE_END()
