#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "AccountDirectory.hpp"
#include "ledger_fixture.hpp"

using namespace assets;
using namespace assets::test;

BOOST_FIXTURE_TEST_SUITE(account_directory_tests, ledger_fixture)

// ---------------------------------------------------------------------------
// 1. Path resolution
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testResolveOrCreateBuildsTheWholeChain)
{
  AccountId id = ledger->resolve_or_create_account("Assets:Bank1:Checking", AccountType::Asset);

  Account checking = ledger->get_account(id);
  BOOST_CHECK_EQUAL(std::string("Checking"), checking.name);
  BOOST_CHECK_EQUAL(std::string("Assets:Bank1:Checking"), checking.full_path);
  BOOST_CHECK(checking.type == AccountType::Asset);
  BOOST_CHECK(checking.subtype == AccountSubtype::Category);
  BOOST_CHECK_EQUAL(std::string("EUR"), checking.currency);
  BOOST_REQUIRE(checking.parent_id);

  Account bank = ledger->get_account(*checking.parent_id);
  BOOST_CHECK_EQUAL(std::string("Assets:Bank1"), bank.full_path);
  BOOST_REQUIRE(bank.parent_id);
  BOOST_CHECK_EQUAL(std::string("Assets"), ledger->get_account(*bank.parent_id).full_path);

  BOOST_CHECK_EQUAL(3u, ledger->list_accounts().size());
}

BOOST_AUTO_TEST_CASE(testResolveOrCreateIsIdempotent)
{
  AccountId first = ledger->resolve_or_create_account("Expenses:Food:Groceries", AccountType::Expense);
  AccountId second = ledger->resolve_or_create_account("Expenses:Food:Groceries", AccountType::Expense);
  BOOST_CHECK_EQUAL(first, second);

  // A sibling reuses the existing parents.
  ledger->resolve_or_create_account("Expenses:Food:Restaurants", AccountType::Expense);
  BOOST_CHECK_EQUAL(4u, ledger->list_accounts().size());
}

BOOST_AUTO_TEST_CASE(testPathSegmentsAreTrimmed)
{
  AccountId id = ledger->resolve_or_create_account("Assets:Cash", AccountType::Asset);
  BOOST_CHECK_EQUAL(id, ledger->resolve_or_create_account(" Assets : Cash ", AccountType::Asset));

  std::vector<std::string> segments = AccountDirectory::split_path("Assets : Bank1 :Checking");
  BOOST_REQUIRE_EQUAL(3u, segments.size());
  BOOST_CHECK_EQUAL(std::string("Bank1"), segments[1]);
}

BOOST_AUTO_TEST_CASE(testEmptySegmentsAreRejected)
{
  CHECK_LEDGER_ERROR(ledger->resolve_or_create_account("", AccountType::Asset), InvalidPath);
  CHECK_LEDGER_ERROR(ledger->resolve_or_create_account("Assets::Checking", AccountType::Asset), InvalidPath);
  CHECK_LEDGER_ERROR(ledger->resolve_or_create_account("Assets:", AccountType::Asset), InvalidPath);
  CHECK_LEDGER_ERROR(ledger->resolve_or_create_account(":Assets", AccountType::Asset), InvalidPath);
  BOOST_CHECK(ledger->list_accounts().empty());
}

BOOST_AUTO_TEST_CASE(testResolveDoesNotCreate)
{
  BOOST_CHECK(!ledger->resolve_account("Assets:Bank1"));
  BOOST_CHECK(ledger->list_accounts().empty());

  AccountId id = ledger->resolve_or_create_account("Assets:Bank1", AccountType::Asset);
  std::optional<AccountId> found = ledger->resolve_account("Assets:Bank1");
  BOOST_REQUIRE(found);
  BOOST_CHECK_EQUAL(id, *found);
}

BOOST_AUTO_TEST_CASE(testHierarchyDepthIsBounded)
{
  LedgerConfig shallow;
  shallow.accounts.max_hierarchy_depth = 3;
  reopen(shallow);

  BOOST_CHECK_NO_THROW(ledger->resolve_or_create_account("A:B:C", AccountType::Asset));
  CHECK_LEDGER_ERROR(ledger->resolve_or_create_account("A:B:C:D", AccountType::Asset), InvalidPath);
  BOOST_CHECK_EQUAL(3u, ledger->list_accounts().size());
}

BOOST_AUTO_TEST_CASE(testAmbiguousSiblingIsAnIntegrityViolation)
{
  // Two roots with the same name can only come from outside the core.
  {
    std::unique_ptr<UnitOfWork> uow = store->begin();
    for (const char* id : {"root-1", "root-2"}) {
      Account account;
      account.id = id;
      account.name = "Assets";
      account.full_path = "Assets";
      uow->insert_account(account);
    }
    uow->commit();
  }
  CHECK_LEDGER_ERROR(ledger->resolve_account("Assets:Checking"), IntegrityViolation);
  CHECK_LEDGER_ERROR(ledger->resolve_or_create_account("Assets:Checking", AccountType::Asset), IntegrityViolation);
}

// ---------------------------------------------------------------------------
// 2. Explicit creation
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testCreateAccountValidatesNameAndSubtype)
{
  NewAccount request;
  request.name = "Bad:Name";
  CHECK_LEDGER_ERROR(ledger->create_account(request), InvalidAccountName);

  request.name = "   ";
  CHECK_LEDGER_ERROR(ledger->create_account(request), InvalidAccountName);

  request.name = std::string(101, 'x');
  CHECK_LEDGER_ERROR(ledger->create_account(request), InvalidAccountName);

  request.name = "Salary";
  request.type = AccountType::Expense;
  request.subtype = AccountSubtype::Salary;
  CHECK_LEDGER_ERROR(ledger->create_account(request), InvalidSubtype);

  request.type = AccountType::Income;
  Account salary = ledger->create_account(request);
  BOOST_CHECK(salary.subtype == AccountSubtype::Salary);
  BOOST_CHECK(!salary.parent_id);
}

BOOST_AUTO_TEST_CASE(testInvestmentFieldsNeedAnInvestmentSubtype)
{
  NewAccount checking;
  checking.name = "Checking";
  checking.subtype = AccountSubtype::Checking;
  checking.symbol = std::string("AAPL");
  CHECK_LEDGER_ERROR(ledger->create_account(checking), InvalidInvestmentFields);

  NewAccount stock;
  stock.name = "AAPL";
  stock.subtype = AccountSubtype::Stocks;
  stock.symbol = std::string("AAPL");
  stock.quantity = -1.0;
  CHECK_LEDGER_ERROR(ledger->create_account(stock), InvalidInvestmentFields);

  stock.quantity = 10.0;
  stock.average_cost = m("150.25");
  stock.currency = "USD";
  Account created = ledger->create_account(stock);
  BOOST_REQUIRE(created.symbol);
  BOOST_CHECK_EQUAL(std::string("AAPL"), *created.symbol);
  BOOST_CHECK_EQUAL(std::string("USD"), created.currency);
  BOOST_REQUIRE(created.average_cost);
  BOOST_CHECK_EQUAL(150250000, *created.average_cost);
}

BOOST_AUTO_TEST_CASE(testChildTypeMustMatchParentType)
{
  AccountId assets_root = ledger->resolve_or_create_account("Assets", AccountType::Asset);

  NewAccount loan;
  loan.name = "Loan";
  loan.type = AccountType::Liability;
  loan.parent_id = assets_root;
  CHECK_LEDGER_ERROR(ledger->create_account(loan), InvalidHierarchy);
  BOOST_CHECK(!ledger->resolve_account("Assets:Loan"));

  loan.type = AccountType::Asset;
  BOOST_CHECK_NO_THROW(ledger->create_account(loan));

  // Segments created under an existing account take its type, not the hint.
  ledger->resolve_or_create_account("Income", AccountType::Income);
  AccountId bonus = ledger->resolve_or_create_account("Income:Bonus:2025", AccountType::Asset);
  BOOST_CHECK(ledger->get_account(bonus).type == AccountType::Income);
  BOOST_CHECK(ledger->get_account(*ledger->resolve_account("Income:Bonus")).type == AccountType::Income);

  // Moves are held to the same rule.
  AccountId card = ledger->resolve_or_create_account("Liabilities:Card", AccountType::Liability);
  CHECK_LEDGER_ERROR(ledger->move_or_rename_account(card, "Card", assets_root), InvalidHierarchy);
  BOOST_CHECK_EQUAL(std::string("Liabilities:Card"), ledger->get_account(card).full_path);
}

BOOST_AUTO_TEST_CASE(testCurrencyMustBeAnIsoCode)
{
  NewAccount request;
  request.name = "Wallet";

  for (const char* bad : {"EURO", "eu", "E1R", "usd", "US"}) {
    request.currency = bad;
    CHECK_LEDGER_ERROR(ledger->create_account(request), InvalidCurrency);
  }
  BOOST_CHECK(ledger->list_accounts(true).empty());

  request.currency = "GBP";
  BOOST_CHECK_EQUAL(std::string("GBP"), ledger->create_account(request).currency);
}

BOOST_AUTO_TEST_CASE(testInvestmentSymbolFormat)
{
  NewAccount etf;
  etf.name = "World";
  etf.subtype = AccountSubtype::Etf;

  for (const char* bad : {"", "cw8", "BRK-B", "ABCDEFGHIJK", "AAPL "}) {
    etf.symbol = std::string(bad);
    CHECK_LEDGER_ERROR(ledger->create_account(etf), InvalidSymbol);
  }

  etf.symbol = std::string("BRK.B");
  BOOST_CHECK_NO_THROW(ledger->create_account(etf));
  etf.name = "MSCI World";
  etf.symbol = std::string("CW8");
  BOOST_CHECK_NO_THROW(ledger->create_account(etf));
  etf.name = "Ten";
  etf.symbol = std::string("ABCDEFGHIJ");
  BOOST_CHECK_NO_THROW(ledger->create_account(etf));
}

BOOST_AUTO_TEST_CASE(testSiblingNamesAreUnique)
{
  AccountId bank1 = ledger->resolve_or_create_account("Assets:Bank1", AccountType::Asset);
  AccountId bank2 = ledger->resolve_or_create_account("Assets:Bank2", AccountType::Asset);

  NewAccount request;
  request.name = "Checking";
  request.parent_id = bank1;
  ledger->create_account(request);
  CHECK_LEDGER_ERROR(ledger->create_account(request), DuplicateAccountName);

  request.parent_id = bank2;
  BOOST_CHECK_EQUAL(std::string("Assets:Bank2:Checking"), ledger->create_account(request).full_path);
}

BOOST_AUTO_TEST_CASE(testParentMustExistAndBeActive)
{
  NewAccount request;
  request.name = "Orphan";
  request.parent_id = std::string("no-such-account");
  CHECK_LEDGER_ERROR(ledger->create_account(request), AccountNotFound);

  AccountId old = ledger->resolve_or_create_account("Assets:OldBank", AccountType::Asset);
  ledger->deactivate_account(old);
  request.parent_id = old;
  CHECK_LEDGER_ERROR(ledger->create_account(request), AccountInactive);
}

// ---------------------------------------------------------------------------
// 3. Moving and renaming
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testRenameRefreshesDescendantPaths)
{
  AccountId checking = ledger->resolve_or_create_account("Assets:Bank1:Checking", AccountType::Asset);
  AccountId savings = ledger->resolve_or_create_account("Assets:Bank1:Savings:Goal", AccountType::Asset);
  AccountId bank = *ledger->resolve_account("Assets:Bank1");
  AccountId assets_root = *ledger->resolve_account("Assets");

  Account renamed = ledger->move_or_rename_account(bank, "BNP", assets_root);
  BOOST_CHECK_EQUAL(std::string("Assets:BNP"), renamed.full_path);
  BOOST_CHECK_EQUAL(std::string("Assets:BNP:Checking"), ledger->get_account(checking).full_path);
  BOOST_CHECK_EQUAL(std::string("Assets:BNP:Savings:Goal"), ledger->get_account(savings).full_path);
  BOOST_CHECK(!ledger->resolve_account("Assets:Bank1"));
}

BOOST_AUTO_TEST_CASE(testMoveToRoot)
{
  AccountId checking = ledger->resolve_or_create_account("Assets:Bank1:Checking", AccountType::Asset);
  AccountId bank = *ledger->resolve_account("Assets:Bank1");

  Account moved = ledger->move_or_rename_account(bank, "Bank1", std::nullopt);
  BOOST_CHECK(!moved.parent_id);
  BOOST_CHECK_EQUAL(std::string("Bank1:Checking"), ledger->get_account(checking).full_path);
  BOOST_CHECK(ledger->children_of(*ledger->resolve_account("Assets")).empty());
}

BOOST_AUTO_TEST_CASE(testMoveUnderOwnDescendantIsCircular)
{
  AccountId checking = ledger->resolve_or_create_account("Assets:Bank1:Checking", AccountType::Asset);
  AccountId bank = *ledger->resolve_account("Assets:Bank1");
  AccountId assets_root = *ledger->resolve_account("Assets");

  CHECK_LEDGER_ERROR(ledger->move_or_rename_account(assets_root, "Assets", checking), CircularReference);
  CHECK_LEDGER_ERROR(ledger->move_or_rename_account(bank, "Bank1", bank), CircularReference);
  BOOST_CHECK_EQUAL(std::string("Assets:Bank1:Checking"), ledger->get_account(checking).full_path);
}

BOOST_AUTO_TEST_CASE(testMoveKeepsSiblingNamesUnique)
{
  ledger->resolve_or_create_account("Assets:Bank1", AccountType::Asset);
  AccountId bank2 = ledger->resolve_or_create_account("Assets:Bank2", AccountType::Asset);
  AccountId assets_root = *ledger->resolve_account("Assets");

  CHECK_LEDGER_ERROR(ledger->move_or_rename_account(bank2, "Bank1", assets_root), DuplicateAccountName);
  // Renaming to its own name is a no-op, not a clash.
  BOOST_CHECK_NO_THROW(ledger->move_or_rename_account(bank2, "Bank2", assets_root));
}

BOOST_AUTO_TEST_CASE(testMoveRespectsDepthOfTheSubtree)
{
  LedgerConfig shallow;
  shallow.accounts.max_hierarchy_depth = 3;
  reopen(shallow);

  ledger->resolve_or_create_account("A:B:C", AccountType::Asset);
  AccountId x = ledger->resolve_or_create_account("X", AccountType::Asset);
  AccountId b = *ledger->resolve_account("A:B");

  // X:B:C would be fine, X:...:B:C is not: B carries a child along.
  BOOST_CHECK_NO_THROW(ledger->move_or_rename_account(b, "B", x));
  AccountId y = ledger->resolve_or_create_account("Y:Z", AccountType::Asset);
  CHECK_LEDGER_ERROR(ledger->move_or_rename_account(b, "B", y), InvalidPath);
}

// ---------------------------------------------------------------------------
// 4. Activation
// ---------------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(testDeactivationNeedsInactiveChildren)
{
  AccountId checking = ledger->resolve_or_create_account("Assets:Bank1:Checking", AccountType::Asset);
  AccountId bank = *ledger->resolve_account("Assets:Bank1");

  CHECK_LEDGER_ERROR(ledger->deactivate_account(bank), AccountHasActiveChildren);

  ledger->deactivate_account(checking);
  ledger->deactivate_account(bank);
  BOOST_CHECK_EQUAL(1u, ledger->list_accounts().size());
  BOOST_CHECK_EQUAL(3u, ledger->list_accounts(true).size());

  // Children come back only after their parent.
  CHECK_LEDGER_ERROR(ledger->reactivate_account(checking), AccountInactive);
  ledger->reactivate_account(bank);
  ledger->reactivate_account(checking);
  BOOST_CHECK(ledger->get_account(checking).is_active);
}

BOOST_AUTO_TEST_CASE(testListIsOrderedByPath)
{
  ledger->resolve_or_create_account("Liabilities:Card", AccountType::Liability);
  ledger->resolve_or_create_account("Assets:Cash", AccountType::Asset);
  ledger->resolve_or_create_account("Assets:Bank1", AccountType::Asset);

  std::vector<Account> all = ledger->list_accounts();
  BOOST_REQUIRE_EQUAL(5u, all.size());
  BOOST_CHECK_EQUAL(std::string("Assets"), all[0].full_path);
  BOOST_CHECK_EQUAL(std::string("Assets:Bank1"), all[1].full_path);
  BOOST_CHECK_EQUAL(std::string("Assets:Cash"), all[2].full_path);
  BOOST_CHECK_EQUAL(std::string("Liabilities"), all[3].full_path);
  BOOST_CHECK(all[4].type == AccountType::Liability);
}

BOOST_AUTO_TEST_CASE(testUnknownAccountIsNotFound)
{
  CHECK_LEDGER_ERROR(ledger->get_account("missing"), AccountNotFound);
  CHECK_LEDGER_ERROR(ledger->children_of("missing"), AccountNotFound);
  CHECK_LEDGER_ERROR(ledger->deactivate_account("missing"), AccountNotFound);
}

BOOST_AUTO_TEST_SUITE_END()
