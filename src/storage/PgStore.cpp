/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: PgStore.cpp
 * ============================================================================
 */

#include "PgStore.hpp"
#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include <pqxx/pqxx>

namespace assets {
namespace storage {

namespace {

const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS users (
    id            TEXT PRIMARY KEY,
    name          TEXT NOT NULL UNIQUE,
    display_name  TEXT NOT NULL,
    is_active     BOOLEAN NOT NULL DEFAULT TRUE,
    seq           BIGSERIAL
);

CREATE TABLE IF NOT EXISTS accounts (
    id                   TEXT PRIMARY KEY,
    name                 TEXT NOT NULL CHECK (name <> '' AND position(':' in name) = 0),
    account_type         TEXT NOT NULL,
    subtype              TEXT NOT NULL,
    parent_id            TEXT REFERENCES accounts(id),
    full_path            TEXT NOT NULL,
    symbol               TEXT,
    quantity             DOUBLE PRECISION,
    average_cost_micros  BIGINT,
    currency             CHAR(3) NOT NULL DEFAULT 'EUR',
    is_active            BOOLEAN NOT NULL DEFAULT TRUE,
    notes                TEXT,
    UNIQUE (parent_id, name)
);
CREATE UNIQUE INDEX IF NOT EXISTS accounts_root_name_idx ON accounts(name) WHERE parent_id IS NULL;

CREATE TABLE IF NOT EXISTS account_ownership (
    account_id  TEXT NOT NULL REFERENCES accounts(id) ON DELETE CASCADE,
    user_id     TEXT NOT NULL REFERENCES users(id) ON DELETE CASCADE,
    percentage  DOUBLE PRECISION NOT NULL CHECK (percentage > 0 AND percentage <= 1),
    PRIMARY KEY (account_id, user_id)
);

CREATE TABLE IF NOT EXISTS transactions (
    id                  TEXT PRIMARY KEY,
    description         TEXT NOT NULL,
    reference           TEXT,
    transaction_date    DATE NOT NULL,
    import_source       TEXT,
    import_batch_id     TEXT,
    external_reference  TEXT,
    is_duplicate        BOOLEAN NOT NULL DEFAULT FALSE,
    merged_into         TEXT REFERENCES transactions(id),
    created_by          TEXT REFERENCES users(id)
);
CREATE INDEX IF NOT EXISTS transactions_date_idx ON transactions(transaction_date);
CREATE INDEX IF NOT EXISTS transactions_batch_idx ON transactions(import_batch_id);

CREATE TABLE IF NOT EXISTS journal_entries (
    id              TEXT PRIMARY KEY,
    transaction_id  TEXT NOT NULL REFERENCES transactions(id) ON DELETE CASCADE,
    account_id      TEXT NOT NULL REFERENCES accounts(id),
    amount_micros   BIGINT NOT NULL,
    memo            TEXT,
    position        INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS journal_entries_txn_idx ON journal_entries(transaction_id);
CREATE INDEX IF NOT EXISTS journal_entries_account_idx ON journal_entries(account_id);

CREATE TABLE IF NOT EXISTS transaction_matches (
    id                      TEXT PRIMARY KEY,
    primary_id              TEXT NOT NULL REFERENCES transactions(id) ON DELETE CASCADE,
    duplicate_id            TEXT NOT NULL REFERENCES transactions(id) ON DELETE CASCADE,
    confidence              DOUBLE PRECISION NOT NULL CHECK (confidence >= 0 AND confidence <= 1),
    amount_diff_micros      BIGINT NOT NULL,
    date_diff_days          INTEGER NOT NULL,
    description_similarity  DOUBLE PRECISION NOT NULL,
    same_date               BOOLEAN NOT NULL,
    same_amount             BOOLEAN NOT NULL,
    manual                  BOOLEAN NOT NULL DEFAULT FALSE,
    tier                    TEXT NOT NULL,
    status                  TEXT NOT NULL DEFAULT 'PENDING',
    created_by_merge        BOOLEAN NOT NULL DEFAULT FALSE,
    UNIQUE (primary_id, duplicate_id),
    CHECK (primary_id <> duplicate_id)
);

CREATE TABLE IF NOT EXISTS imported_files (
    id                 TEXT PRIMARY KEY,
    file_path          TEXT NOT NULL,
    file_name          TEXT NOT NULL,
    file_hash          TEXT NOT NULL UNIQUE,
    file_size          BIGINT NOT NULL,
    import_source      TEXT NOT NULL,
    batch_id           TEXT NOT NULL,
    imported_by        TEXT REFERENCES users(id),
    transaction_count  INTEGER NOT NULL DEFAULT 0,
    notes              TEXT,
    imported_on        DATE NOT NULL,
    seq                BIGSERIAL,
    UNIQUE (file_path, import_source)
);
)SQL";

const char* ACCOUNT_COLUMNS =
    "id, name, account_type, subtype, parent_id, full_path, symbol, quantity, "
    "average_cost_micros, currency, is_active, notes";

const char* TRANSACTION_COLUMNS =
    "id, description, reference, to_char(transaction_date, 'YYYY-MM-DD'), import_source, "
    "import_batch_id, external_reference, is_duplicate, merged_into, created_by";

const char* MATCH_COLUMNS =
    "id, primary_id, duplicate_id, confidence, amount_diff_micros, date_diff_days, "
    "description_similarity, same_date, same_amount, manual, tier, status, created_by_merge";

const char* IMPORT_COLUMNS =
    "id, file_path, file_name, file_hash, file_size, import_source, batch_id, imported_by, "
    "transaction_count, notes, to_char(imported_on, 'YYYY-MM-DD')";

std::optional<std::string> opt_text(const pqxx::field& f) {
    if (f.is_null()) return std::nullopt;
    return f.as<std::string>();
}

const char* sql_bool(bool value) { return value ? "TRUE" : "FALSE"; }

Account read_account(const pqxx::row& row) {
    Account a;
    a.id = row[0].as<std::string>();
    a.name = row[1].as<std::string>();
    a.type = account_type_from_string(row[2].as<std::string>());
    a.subtype = account_subtype_from_string(row[3].as<std::string>());
    a.parent_id = opt_text(row[4]);
    a.full_path = row[5].as<std::string>();
    a.symbol = opt_text(row[6]);
    if (!row[7].is_null()) a.quantity = row[7].as<double>();
    if (!row[8].is_null()) a.average_cost = row[8].as<long long>();
    a.currency = row[9].as<std::string>();
    a.is_active = row[10].as<bool>();
    a.notes = opt_text(row[11]);
    return a;
}

User read_user(const pqxx::row& row) {
    User u;
    u.id = row[0].as<std::string>();
    u.name = row[1].as<std::string>();
    u.display_name = row[2].as<std::string>();
    u.is_active = row[3].as<bool>();
    u.sequence = row[4].as<long long>();
    return u;
}

OwnershipShare read_share(const pqxx::row& row) {
    OwnershipShare s;
    s.account_id = row[0].as<std::string>();
    s.user_id = row[1].as<std::string>();
    s.percentage = row[2].as<double>();
    return s;
}

Transaction read_transaction(const pqxx::row& row) {
    Transaction t;
    t.id = row[0].as<std::string>();
    t.description = row[1].as<std::string>();
    t.reference = opt_text(row[2]);
    t.date = Date::parse(row[3].as<std::string>());
    t.import_source = opt_text(row[4]);
    t.import_batch_id = opt_text(row[5]);
    t.external_reference = opt_text(row[6]);
    t.is_duplicate = row[7].as<bool>();
    t.merged_into = opt_text(row[8]);
    t.created_by = opt_text(row[9]);
    return t;
}

JournalEntry read_entry(const pqxx::row& row) {
    JournalEntry e;
    e.id = row[0].as<std::string>();
    e.transaction_id = row[1].as<std::string>();
    e.account_id = row[2].as<std::string>();
    e.amount = row[3].as<long long>();
    e.memo = opt_text(row[4]);
    e.position = row[5].as<int>();
    return e;
}

TransactionMatch read_match(const pqxx::row& row) {
    TransactionMatch m;
    m.id = row[0].as<std::string>();
    m.primary_id = row[1].as<std::string>();
    m.duplicate_id = row[2].as<std::string>();
    m.confidence = row[3].as<double>();
    m.criteria.amount_diff = row[4].as<long long>();
    m.criteria.date_diff_days = row[5].as<int>();
    m.criteria.description_similarity = row[6].as<double>();
    m.criteria.same_date = row[7].as<bool>();
    m.criteria.same_amount = row[8].as<bool>();
    m.criteria.manual = row[9].as<bool>();
    m.tier = match_tier_from_string(row[10].as<std::string>());
    m.status = match_status_from_string(row[11].as<std::string>());
    m.created_by_merge = row[12].as<bool>();
    return m;
}

ImportedFile read_import(const pqxx::row& row) {
    ImportedFile f;
    f.id = row[0].as<std::string>();
    f.file_path = row[1].as<std::string>();
    f.file_name = row[2].as<std::string>();
    f.file_hash = row[3].as<std::string>();
    f.file_size = row[4].as<long long>();
    f.import_source = row[5].as<std::string>();
    f.batch_id = row[6].as<std::string>();
    f.imported_by = opt_text(row[7]);
    f.transaction_count = row[8].as<int>();
    f.notes = opt_text(row[9]);
    f.imported_on = Date::parse(row[10].as<std::string>());
    return f;
}

// Runs `fn`, translating libpqxx failures into LedgerError.
template <typename Fn>
auto guarded(Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const pqxx::broken_connection& e) {
        log("ERROR", std::string("PostgreSQL connection lost: ") + e.what());
        throw LedgerError(ErrorKind::StoreUnavailable, e.what());
    } catch (const pqxx::transaction_rollback& e) {
        log("WARN", std::string("PostgreSQL rolled back the unit of work: ") + e.what());
        throw LedgerError(ErrorKind::StoreConflict, e.what());
    } catch (const pqxx::unique_violation& e) {
        // A concurrent unit inserted the same key first; a retry reads its row.
        log("WARN", std::string("PostgreSQL unique key taken by a concurrent unit: ") + e.what());
        throw LedgerError(ErrorKind::StoreConflict, e.what());
    } catch (const pqxx::integrity_constraint_violation& e) {
        log("ERROR", std::string("PostgreSQL integrity violation: ") + e.what());
        throw LedgerError(ErrorKind::IntegrityViolation, e.what());
    } catch (const pqxx::sql_error& e) {
        log("ERROR", std::string("PostgreSQL error: ") + e.what() + " | Query: " + e.query());
        throw LedgerError(ErrorKind::StoreFailure, e.what());
    }
}

} // namespace

class PgUnitOfWork : public UnitOfWork {
public:
    explicit PgUnitOfWork(const std::string& conn_str)
        : C_(conn_str), W_(C_) {}

    // --- accounts ------------------------------------------------------------
    std::optional<Account> find_account(const AccountId& id) override {
        return guarded([&]() -> std::optional<Account> {
            pqxx::result R = W_.exec(std::string("SELECT ") + ACCOUNT_COLUMNS +
                                     " FROM accounts WHERE id = " + W_.quote(id));
            if (R.empty()) return std::nullopt;
            return read_account(R[0]);
        });
    }

    std::vector<Account> find_children_named(const std::optional<AccountId>& parent,
                                             const std::string& name) override {
        return accounts_where(parent_clause(parent) + " AND name = " + W_.quote(name));
    }

    std::vector<Account> children_of(const std::optional<AccountId>& parent) override {
        return accounts_where(parent_clause(parent));
    }

    std::vector<Account> all_accounts() override {
        return accounts_where("TRUE");
    }

    void insert_account(const Account& a) override {
        guarded([&]() {
            W_.exec("INSERT INTO accounts (" + std::string(ACCOUNT_COLUMNS) + ") VALUES (" +
                    W_.quote(a.id) + ", " + W_.quote(a.name) + ", " +
                    W_.quote(std::string(to_string(a.type))) + ", " +
                    W_.quote(std::string(to_string(a.subtype))) + ", " +
                    quote_opt(a.parent_id) + ", " + W_.quote(a.full_path) + ", " +
                    quote_opt(a.symbol) + ", " +
                    (a.quantity ? W_.quote(*a.quantity) : std::string("NULL")) + ", " +
                    (a.average_cost ? std::to_string(*a.average_cost) : std::string("NULL")) + ", " +
                    W_.quote(a.currency) + ", " + sql_bool(a.is_active) + ", " +
                    quote_opt(a.notes) + ")");
        });
    }

    void update_account(const Account& a) override {
        guarded([&]() {
            pqxx::result R = W_.exec(
                "UPDATE accounts SET name = " + W_.quote(a.name) +
                ", account_type = " + W_.quote(std::string(to_string(a.type))) +
                ", subtype = " + W_.quote(std::string(to_string(a.subtype))) +
                ", parent_id = " + quote_opt(a.parent_id) +
                ", full_path = " + W_.quote(a.full_path) +
                ", symbol = " + quote_opt(a.symbol) +
                ", quantity = " + (a.quantity ? W_.quote(*a.quantity) : std::string("NULL")) +
                ", average_cost_micros = " + (a.average_cost ? std::to_string(*a.average_cost) : std::string("NULL")) +
                ", currency = " + W_.quote(a.currency) +
                ", is_active = " + sql_bool(a.is_active) +
                ", notes = " + quote_opt(a.notes) +
                " WHERE id = " + W_.quote(a.id));
            if (R.affected_rows() == 0) {
                throw LedgerError(ErrorKind::AccountNotFound, "Account " + a.id + " does not exist.");
            }
        });
    }

    // --- users ---------------------------------------------------------------
    std::optional<User> find_user(const UserId& id) override {
        return first_user("id = " + W_.quote(id));
    }

    std::optional<User> find_user_by_name(const std::string& name) override {
        return first_user("name = " + W_.quote(name));
    }

    std::vector<User> all_users() override {
        return guarded([&]() {
            pqxx::result R = W_.exec("SELECT id, name, display_name, is_active, seq FROM users ORDER BY seq ASC");
            std::vector<User> out;
            for (auto row : R) out.push_back(read_user(row));
            return out;
        });
    }

    void insert_user(const User& u) override {
        guarded([&]() {
            W_.exec("INSERT INTO users (id, name, display_name, is_active) VALUES (" +
                    W_.quote(u.id) + ", " + W_.quote(u.name) + ", " +
                    W_.quote(u.display_name) + ", " + sql_bool(u.is_active) + ")");
        });
    }

    // --- ownership -----------------------------------------------------------
    void lock_account(const AccountId& id) override {
        guarded([&]() {
            W_.exec("SELECT id FROM accounts WHERE id = " + W_.quote(id) + " FOR UPDATE");
        });
    }

    std::vector<OwnershipShare> shares_of_account(const AccountId& id) override {
        return shares_where("account_id = " + W_.quote(id));
    }

    std::vector<OwnershipShare> shares_of_user(const UserId& id) override {
        return shares_where("user_id = " + W_.quote(id));
    }

    void upsert_share(const OwnershipShare& s) override {
        guarded([&]() {
            W_.exec("INSERT INTO account_ownership (account_id, user_id, percentage) VALUES (" +
                    W_.quote(s.account_id) + ", " + W_.quote(s.user_id) + ", " + W_.quote(s.percentage) +
                    ") ON CONFLICT (account_id, user_id) DO UPDATE SET percentage = EXCLUDED.percentage");
        });
    }

    void delete_share(const AccountId& account, const UserId& user) override {
        guarded([&]() {
            W_.exec("DELETE FROM account_ownership WHERE account_id = " + W_.quote(account) +
                    " AND user_id = " + W_.quote(user));
        });
    }

    // --- transactions --------------------------------------------------------
    void lock_transaction(const TransactionId& id) override {
        guarded([&]() {
            W_.exec("SELECT id FROM transactions WHERE id = " + W_.quote(id) + " FOR UPDATE");
        });
    }

    std::optional<Transaction> find_transaction(const TransactionId& id) override {
        std::vector<Transaction> found = transactions_where("id = " + W_.quote(id));
        if (found.empty()) return std::nullopt;
        return found.front();
    }

    std::vector<Transaction> query_transactions(const TransactionQuery& q) override {
        std::string where = "TRUE";
        if (q.from) where += " AND transaction_date >= " + W_.quote(q.from->to_string()) + "::date";
        if (q.to) where += " AND transaction_date <= " + W_.quote(q.to->to_string()) + "::date";
        if (q.import_batch_id) where += " AND import_batch_id = " + W_.quote(*q.import_batch_id);
        if (!q.include_hidden) where += " AND is_duplicate = FALSE";
        return transactions_where(where);
    }

    std::vector<Transaction> transactions_merged_into(const TransactionId& id) override {
        return transactions_where("merged_into = " + W_.quote(id));
    }

    std::vector<JournalEntry> entries_of(const TransactionId& id) override {
        return entries_where("transaction_id = " + W_.quote(id));
    }

    std::vector<JournalEntry> entries_of_account(const AccountId& id) override {
        return entries_where("account_id = " + W_.quote(id));
    }

    void insert_transaction(const Transaction& t) override {
        guarded([&]() {
            W_.exec("INSERT INTO transactions (id, description, reference, transaction_date, import_source, "
                    "import_batch_id, external_reference, is_duplicate, merged_into, created_by) VALUES (" +
                    W_.quote(t.id) + ", " + W_.quote(t.description) + ", " + quote_opt(t.reference) + ", " +
                    W_.quote(t.date.to_string()) + "::date, " + quote_opt(t.import_source) + ", " +
                    quote_opt(t.import_batch_id) + ", " + quote_opt(t.external_reference) + ", " +
                    sql_bool(t.is_duplicate) + ", " + quote_opt(t.merged_into) + ", " +
                    quote_opt(t.created_by) + ")");
        });
    }

    void update_transaction_flags(const TransactionId& id, bool is_duplicate,
                                  const std::optional<TransactionId>& merged_into) override {
        guarded([&]() {
            pqxx::result R = W_.exec("UPDATE transactions SET is_duplicate = " + std::string(sql_bool(is_duplicate)) +
                                     ", merged_into = " + quote_opt(merged_into) +
                                     " WHERE id = " + W_.quote(id));
            if (R.affected_rows() == 0) {
                throw LedgerError(ErrorKind::TransactionNotFound, "Transaction " + id + " does not exist.");
            }
        });
    }

    void insert_entry(const JournalEntry& e) override {
        guarded([&]() {
            W_.exec("INSERT INTO journal_entries (id, transaction_id, account_id, amount_micros, memo, position) VALUES (" +
                    W_.quote(e.id) + ", " + W_.quote(e.transaction_id) + ", " + W_.quote(e.account_id) + ", " +
                    std::to_string(e.amount) + ", " + quote_opt(e.memo) + ", " + std::to_string(e.position) + ")");
        });
    }

    void delete_entries(const TransactionId& id) override {
        guarded([&]() {
            W_.exec("DELETE FROM journal_entries WHERE transaction_id = " + W_.quote(id));
        });
    }

    void delete_transaction(const TransactionId& id) override {
        // Entries and match rows go through ON DELETE CASCADE.
        guarded([&]() {
            W_.exec("DELETE FROM transactions WHERE id = " + W_.quote(id));
        });
    }

    // --- matches -------------------------------------------------------------
    std::optional<TransactionMatch> find_match(const MatchId& id) override {
        std::vector<TransactionMatch> found = matches_where("id = " + W_.quote(id));
        if (found.empty()) return std::nullopt;
        return found.front();
    }

    std::optional<TransactionMatch> find_match_pair(const TransactionId& primary,
                                                    const TransactionId& duplicate) override {
        std::vector<TransactionMatch> found = matches_where("primary_id = " + W_.quote(primary) +
                                                            " AND duplicate_id = " + W_.quote(duplicate));
        if (found.empty()) return std::nullopt;
        return found.front();
    }

    std::vector<TransactionMatch> matches_involving(const TransactionId& id) override {
        return matches_where("primary_id = " + W_.quote(id) + " OR duplicate_id = " + W_.quote(id));
    }

    std::vector<TransactionMatch> all_matches() override {
        return matches_where("TRUE");
    }

    void insert_match(const TransactionMatch& m) override {
        guarded([&]() {
            W_.exec("INSERT INTO transaction_matches (" + std::string(MATCH_COLUMNS) + ") VALUES (" +
                    W_.quote(m.id) + ", " + W_.quote(m.primary_id) + ", " + W_.quote(m.duplicate_id) + ", " +
                    match_values(m) + ")");
        });
    }

    void update_match(const TransactionMatch& m) override {
        guarded([&]() {
            pqxx::result R = W_.exec(
                "UPDATE transaction_matches SET (confidence, amount_diff_micros, date_diff_days, "
                "description_similarity, same_date, same_amount, manual, tier, status, created_by_merge) = (" +
                match_values(m) + ") WHERE id = " + W_.quote(m.id));
            if (R.affected_rows() == 0) {
                throw LedgerError(ErrorKind::MatchNotFound, "Match " + m.id + " does not exist.");
            }
        });
    }

    void delete_match(const MatchId& id) override {
        guarded([&]() {
            W_.exec("DELETE FROM transaction_matches WHERE id = " + W_.quote(id));
        });
    }

    // --- imported files ------------------------------------------------------
    std::optional<ImportedFile> find_import_by_hash(const std::string& hash) override {
        std::vector<ImportedFile> found = imports_where("file_hash = " + W_.quote(hash));
        if (found.empty()) return std::nullopt;
        return found.front();
    }

    std::optional<ImportedFile> find_import_by_path(const std::string& path,
                                                    const std::string& source) override {
        std::vector<ImportedFile> found = imports_where("file_path = " + W_.quote(path) +
                                                        " AND import_source = " + W_.quote(source));
        if (found.empty()) return std::nullopt;
        return found.front();
    }

    std::vector<ImportedFile> imported_files() override {
        return imports_where("TRUE");
    }

    void insert_import(const ImportedFile& f) override {
        guarded([&]() {
            W_.exec("INSERT INTO imported_files (id, file_path, file_name, file_hash, file_size, import_source, "
                    "batch_id, imported_by, transaction_count, notes, imported_on) VALUES (" +
                    W_.quote(f.id) + ", " + W_.quote(f.file_path) + ", " + W_.quote(f.file_name) + ", " +
                    W_.quote(f.file_hash) + ", " + std::to_string(f.file_size) + ", " +
                    W_.quote(f.import_source) + ", " + W_.quote(f.batch_id) + ", " +
                    quote_opt(f.imported_by) + ", " + std::to_string(f.transaction_count) + ", " +
                    quote_opt(f.notes) + ", " + W_.quote(f.imported_on.to_string()) + "::date)");
        });
    }

    void commit() override {
        guarded([&]() { W_.commit(); });
    }

private:
    std::string quote_opt(const std::optional<std::string>& value) {
        return value ? W_.quote(*value) : std::string("NULL");
    }

    std::string parent_clause(const std::optional<AccountId>& parent) {
        return parent ? "parent_id = " + W_.quote(*parent) : std::string("parent_id IS NULL");
    }

    std::string match_values(const TransactionMatch& m) {
        return W_.quote(m.confidence) + ", " + std::to_string(m.criteria.amount_diff) + ", " +
               std::to_string(m.criteria.date_diff_days) + ", " + W_.quote(m.criteria.description_similarity) + ", " +
               sql_bool(m.criteria.same_date) + ", " + sql_bool(m.criteria.same_amount) + ", " +
               sql_bool(m.criteria.manual) + ", " + W_.quote(std::string(to_string(m.tier))) + ", " +
               W_.quote(std::string(to_string(m.status))) + ", " + sql_bool(m.created_by_merge);
    }

    std::vector<Account> accounts_where(const std::string& where) {
        return guarded([&]() {
            pqxx::result R = W_.exec(std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM accounts WHERE " +
                                     where + " ORDER BY full_path ASC");
            std::vector<Account> out;
            for (auto row : R) out.push_back(read_account(row));
            return out;
        });
    }

    std::optional<User> first_user(const std::string& where) {
        return guarded([&]() -> std::optional<User> {
            pqxx::result R = W_.exec("SELECT id, name, display_name, is_active, seq FROM users WHERE " + where);
            if (R.empty()) return std::nullopt;
            return read_user(R[0]);
        });
    }

    std::vector<OwnershipShare> shares_where(const std::string& where) {
        return guarded([&]() {
            pqxx::result R = W_.exec("SELECT account_id, user_id, percentage FROM account_ownership WHERE " + where);
            std::vector<OwnershipShare> out;
            for (auto row : R) out.push_back(read_share(row));
            return out;
        });
    }

    std::vector<Transaction> transactions_where(const std::string& where) {
        return guarded([&]() {
            pqxx::result R = W_.exec(std::string("SELECT ") + TRANSACTION_COLUMNS + " FROM transactions WHERE " +
                                     where + " ORDER BY transaction_date ASC, id ASC");
            std::vector<Transaction> out;
            for (auto row : R) out.push_back(read_transaction(row));
            return out;
        });
    }

    std::vector<JournalEntry> entries_where(const std::string& where) {
        return guarded([&]() {
            pqxx::result R = W_.exec("SELECT id, transaction_id, account_id, amount_micros, memo, position "
                                     "FROM journal_entries WHERE " + where + " ORDER BY transaction_id, position ASC");
            std::vector<JournalEntry> out;
            for (auto row : R) out.push_back(read_entry(row));
            return out;
        });
    }

    std::vector<TransactionMatch> matches_where(const std::string& where) {
        return guarded([&]() {
            pqxx::result R = W_.exec(std::string("SELECT ") + MATCH_COLUMNS + " FROM transaction_matches WHERE " +
                                     where + " ORDER BY confidence DESC, id ASC");
            std::vector<TransactionMatch> out;
            for (auto row : R) out.push_back(read_match(row));
            return out;
        });
    }

    std::vector<ImportedFile> imports_where(const std::string& where) {
        return guarded([&]() {
            pqxx::result R = W_.exec(std::string("SELECT ") + IMPORT_COLUMNS + " FROM imported_files WHERE " +
                                     where + " ORDER BY seq DESC");
            std::vector<ImportedFile> out;
            for (auto row : R) out.push_back(read_import(row));
            return out;
        });
    }

    pqxx::connection C_;
    pqxx::work W_;
};

PgStore::PgStore(const std::string& conn_str) : conn_str_(conn_str) {
    ensure_schema();
}

std::unique_ptr<UnitOfWork> PgStore::begin() {
    return guarded([&]() {
        return std::unique_ptr<UnitOfWork>(new PgUnitOfWork(conn_str_));
    });
}

void PgStore::ensure_schema() {
    guarded([&]() {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        W.exec(SCHEMA_SQL);
        W.commit();
    });
    log("INFO", "PostgreSQL ledger schema verified.");
}

void PgStore::truncate_all() {
    guarded([&]() {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        W.exec("TRUNCATE imported_files, transaction_matches, journal_entries, transactions, "
               "account_ownership, accounts, users RESTART IDENTITY CASCADE");
        W.commit();
    });
    log("WARN", "PostgreSQL ledger tables truncated.");
}

} // namespace storage
} // namespace assets
