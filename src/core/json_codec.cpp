/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: json_codec.cpp
 * ============================================================================
 */

#include "json_codec.hpp"

namespace assets {

namespace {

template <typename T>
json opt(const std::optional<T>& value) {
    if (!value) return nullptr;
    return json(*value);
}

std::optional<std::string> opt_string(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<std::string>();
}

} // namespace

money_micro amount_from_json(const json& node) {
    if (node.is_string()) return parse_money(node.get<std::string>());
    // The serialized number is the shortest text that round-trips, so
    // 100.0000004 stays seven decimals and is refused like the string form.
    if (node.is_number()) return parse_money(node.dump());
    throw LedgerError(ErrorKind::InvalidAmount, "Amount must be a decimal string or a number.");
}

void to_json(json& j, const Date& d) {
    j = d.to_string();
}

void to_json(json& j, const Account& a) {
    j = json{
        {"id", a.id},
        {"name", a.name},
        {"type", to_string(a.type)},
        {"subtype", to_string(a.subtype)},
        {"parent_id", opt(a.parent_id)},
        {"full_path", a.full_path},
        {"symbol", opt(a.symbol)},
        {"quantity", opt(a.quantity)},
        {"average_cost", a.average_cost ? json(format_money(*a.average_cost)) : json(nullptr)},
        {"currency", a.currency},
        {"is_active", a.is_active},
        {"notes", opt(a.notes)}
    };
}

void to_json(json& j, const User& u) {
    j = json{{"id", u.id}, {"name", u.name}, {"display_name", u.display_name}, {"is_active", u.is_active}};
}

void to_json(json& j, const OwnershipShare& s) {
    j = json{{"account_id", s.account_id}, {"user_id", s.user_id}, {"percentage", s.percentage}};
}

void to_json(json& j, const Transaction& t) {
    j = json{
        {"id", t.id},
        {"description", t.description},
        {"reference", opt(t.reference)},
        {"date", t.date.to_string()},
        {"import_source", opt(t.import_source)},
        {"import_batch_id", opt(t.import_batch_id)},
        {"external_reference", opt(t.external_reference)},
        {"is_duplicate", t.is_duplicate},
        {"merged_into", opt(t.merged_into)},
        {"created_by", opt(t.created_by)}
    };
}

void to_json(json& j, const JournalEntry& e) {
    j = json{
        {"id", e.id},
        {"account_id", e.account_id},
        {"amount", format_money(e.amount)},
        {"memo", opt(e.memo)},
        {"position", e.position}
    };
}

void to_json(json& j, const TransactionWithEntries& t) {
    to_json(j, t.transaction);
    j["entries"] = t.entries;
    j["amount"] = format_money(t.amount());
}

void to_json(json& j, const MatchCriteria& c) {
    j = json{
        {"amount_diff", format_money(c.amount_diff)},
        {"date_diff_days", c.date_diff_days},
        {"description_similarity", c.description_similarity},
        {"same_date", c.same_date},
        {"same_amount", c.same_amount},
        {"manual", c.manual}
    };
}

void to_json(json& j, const TransactionMatch& m) {
    j = json{
        {"id", m.id},
        {"primary_id", m.primary_id},
        {"duplicate_id", m.duplicate_id},
        {"confidence", m.confidence},
        {"criteria", m.criteria},
        {"tier", to_string(m.tier)},
        {"status", to_string(m.status)},
        {"created_by_merge", m.created_by_merge}
    };
}

void to_json(json& j, const MatchCandidate& c) {
    j = json{
        {"candidate", c.transaction},
        {"confidence", c.confidence},
        {"tier", to_string(c.tier)},
        {"criteria", c.criteria}
    };
}

void to_json(json& j, const ImportedFile& f) {
    j = json{
        {"id", f.id},
        {"file_path", f.file_path},
        {"file_name", f.file_name},
        {"file_hash", f.file_hash},
        {"file_size", f.file_size},
        {"import_source", f.import_source},
        {"batch_id", f.batch_id},
        {"imported_by", opt(f.imported_by)},
        {"transaction_count", f.transaction_count},
        {"notes", opt(f.notes)},
        {"imported_on", f.imported_on.to_string()}
    };
}

void to_json(json& j, const UnbalancedRecord& r) {
    j = json{{"transaction_id", r.transaction_id}, {"sum", format_money(r.sum)}, {"entry_count", r.entry_count}};
}

void from_json(const json& j, NewAccount& a) {
    a.name = j.at("name").get<std::string>();
    a.type = account_type_from_string(j.at("type").get<std::string>());
    a.subtype = j.contains("subtype") ? account_subtype_from_string(j.at("subtype").get<std::string>())
                                      : AccountSubtype::Category;
    a.parent_id = opt_string(j, "parent_id");
    a.currency = j.value("currency", std::string());
    a.symbol = opt_string(j, "symbol");
    if (j.contains("quantity") && !j.at("quantity").is_null()) a.quantity = j.at("quantity").get<double>();
    if (j.contains("average_cost") && !j.at("average_cost").is_null()) {
        a.average_cost = amount_from_json(j.at("average_cost"));
    }
    a.notes = opt_string(j, "notes");
    a.created_by = opt_string(j, "created_by");
}

void from_json(const json& j, EntryInput& e) {
    e.account = j.at("account").get<std::string>();
    e.amount = amount_from_json(j.at("amount"));
    e.memo = opt_string(j, "memo");
    if (std::optional<std::string> hint = opt_string(j, "type_hint")) {
        e.type_hint = account_type_from_string(*hint);
    }
}

void from_json(const json& j, NewTransaction& t) {
    t.description = j.at("description").get<std::string>();
    t.date = Date::parse(j.at("date").get<std::string>());
    t.reference = opt_string(j, "reference");
    t.import_source = opt_string(j, "import_source");
    t.import_batch_id = opt_string(j, "import_batch_id");
    t.external_reference = opt_string(j, "external_reference");
    t.created_by = opt_string(j, "created_by");
    t.entries = j.at("entries").get<std::vector<EntryInput>>();
    t.auto_create_accounts = j.value("auto_create_accounts", false);
    if (std::optional<std::string> hint = opt_string(j, "type_hint")) {
        t.type_hint = account_type_from_string(*hint);
    }
}

void from_json(const json& j, MatchCriteria& c) {
    c.amount_diff = j.contains("amount_diff") ? amount_from_json(j.at("amount_diff")) : 0;
    c.date_diff_days = j.value("date_diff_days", 0);
    c.description_similarity = j.value("description_similarity", 0.0);
    c.same_date = j.value("same_date", false);
    c.same_amount = j.value("same_amount", false);
    c.manual = j.value("manual", false);
}

void from_json(const json& j, ImportedFile& f) {
    f.file_path = j.at("file_path").get<std::string>();
    f.file_name = j.value("file_name", std::string());
    f.file_hash = j.at("file_hash").get<std::string>();
    f.file_size = j.value("file_size", static_cast<int64_t>(0));
    f.import_source = j.at("import_source").get<std::string>();
    f.batch_id = j.at("batch_id").get<std::string>();
    f.imported_by = opt_string(j, "imported_by");
    f.transaction_count = j.value("transaction_count", 0);
    f.notes = opt_string(j, "notes");
    f.imported_on = j.contains("imported_on") ? Date::parse(j.at("imported_on").get<std::string>()) : Date::today();
}

json error_body(const LedgerError& error) {
    return json{{"error", error_kind_name(error.kind())}, {"message", error.what()}};
}

} // namespace assets
