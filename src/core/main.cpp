/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: main.cpp
 * ============================================================================
 * * DESCRIPTION:
 * assets-engine: JSON over HTTP front end of the ledger core. Handlers only
 * translate between JSON and the Ledger facade; every rule lives in the
 * core. Error categories map to HTTP status codes:
 *   Validation 400, NotFound 404, Invariant 409, Integrity 500, Storage 503
 * ============================================================================
 */

#include <iostream>
#include <string>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "ledger.hpp"
#include "logging.hpp"

using namespace assets;

namespace {

int http_status(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Validation: return 400;
        case ErrorCategory::NotFound: return 404;
        case ErrorCategory::Invariant: return 409;
        case ErrorCategory::Integrity: return 500;
        case ErrorCategory::Storage: return 503;
    }
    return 500;
}

// Runs a handler body and turns its outcome into the response.
void respond(httplib::Response& res, const std::function<json()>& body) {
    try {
        json out = body();
        res.status = 200;
        res.set_content(out.dump(), "application/json");
    } catch (const LedgerError& e) {
        if (e.category() == ErrorCategory::Integrity || e.category() == ErrorCategory::Storage) {
            log("ERROR", std::string(error_kind_name(e.kind())) + ": " + e.what());
        }
        res.status = http_status(e.category());
        res.set_content(error_body(e).dump(), "application/json");
    } catch (const json::exception& e) {
        res.status = 400;
        res.set_content(json{{"error", "BadRequest"}, {"message", e.what()}}.dump(), "application/json");
    } catch (const std::logic_error& e) {
        // std::stoi / std::stoul on a malformed query parameter
        res.status = 400;
        res.set_content(json{{"error", "BadRequest"}, {"message", e.what()}}.dump(), "application/json");
    } catch (const std::exception& e) {
        log("ERROR", std::string("Unhandled engine error: ") + e.what());
        res.status = 500;
        res.set_content(json{{"error", "InternalError"}, {"message", e.what()}}.dump(), "application/json");
    }
}

json ok() {
    return json{{"status", "ok"}};
}

std::optional<std::string> param(const httplib::Request& req, const char* name) {
    if (!req.has_param(name)) return std::nullopt;
    return req.get_param_value(name);
}

bool flag(const httplib::Request& req, const char* name) {
    std::optional<std::string> value = param(req, name);
    return value && (*value == "true" || *value == "1");
}

} // namespace

int main() {
    LedgerConfig config;
    std::shared_ptr<LedgerStore> store;
    try {
        config = load_config_from_environment();
        store = Ledger::open_store(config);
    } catch (const LedgerError& e) {
        log("FATAL", std::string("Engine start-up failed (") + error_kind_name(e.kind()) + "): " + e.what() +
                     ". System halted.");
        return 1;
    }

    Ledger ledger(store, config);

    httplib::Server svr;
    log("INFO", "Assets Ledger Core: Engine Active.");

    svr.set_logger([](const httplib::Request &req, const httplib::Response &res) {
        log("INFO", "API Request: " + req.method + " " + req.path + " -> Status " + std::to_string(res.status));
    });

    // === [SEARCH: SYSTEM] ===
    svr.Get("/api/system/logs", [&](const httplib::Request &, httplib::Response &res) {
        respond(res, [&]() { return json(recent_logs()); });
    });

    svr.Get("/api/system/config", [&](const httplib::Request &, httplib::Response &res) {
        respond(res, [&]() {
            json out = config_to_json(ledger.config());
            out["store"]["active_backend"] = ledger.backend_name();
            return out;
        });
    });

    // === [SEARCH: ACCOUNT DIRECTORY] ===
    svr.Get("/api/accounts", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.list_accounts(flag(req, "include_inactive"))); });
    });

    svr.Post("/api/accounts", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.create_account(json::parse(req.body).get<NewAccount>())); });
    });

    // {"path": "Assets:Bank1:Checking", "type_hint": "asset", "create": true}
    svr.Post("/api/accounts/resolve", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            json in = json::parse(req.body);
            std::string path = in.at("path").get<std::string>();
            if (!in.value("create", true)) {
                std::optional<AccountId> id = ledger.resolve_account(path);
                if (!id) throw LedgerError(ErrorKind::AccountNotFound, "Account '" + path + "' does not exist.");
                return json{{"account_id", *id}};
            }
            AccountType hint = account_type_from_string(in.value("type_hint", std::string("asset")));
            std::optional<UserId> creator;
            if (in.contains("created_by")) creator = in.at("created_by").get<std::string>();
            return json{{"account_id", ledger.resolve_or_create_account(path, hint, creator)}};
        });
    });

    svr.Get(R"(/api/accounts/([^/]+))", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.get_account(req.matches[1])); });
    });

    svr.Get(R"(/api/accounts/([^/]+)/children)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.children_of(req.matches[1])); });
    });

    // {"name": "Checking", "parent_id": "<id>" | null}
    svr.Post(R"(/api/accounts/([^/]+)/move)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            json in = json::parse(req.body);
            std::optional<AccountId> parent;
            if (in.contains("parent_id") && !in.at("parent_id").is_null()) {
                parent = in.at("parent_id").get<std::string>();
            }
            return json(ledger.move_or_rename_account(req.matches[1], in.at("name").get<std::string>(), parent));
        });
    });

    svr.Post(R"(/api/accounts/([^/]+)/deactivate)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { ledger.deactivate_account(req.matches[1]); return ok(); });
    });

    svr.Post(R"(/api/accounts/([^/]+)/reactivate)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { ledger.reactivate_account(req.matches[1]); return ok(); });
    });

    // === [SEARCH: USERS & OWNERSHIP] ===
    svr.Get("/api/users", [&](const httplib::Request &, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.list_users()); });
    });

    svr.Post("/api/users", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            json in = json::parse(req.body);
            return json(ledger.create_user(in.at("name").get<std::string>(),
                                           in.value("display_name", std::string())));
        });
    });

    svr.Get(R"(/api/users/([^/]+)/accounts)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.accounts_owned_by(req.matches[1])); });
    });

    svr.Get(R"(/api/accounts/([^/]+)/ownership)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.ownership_of(req.matches[1])); });
    });

    // {"shares": [{"user_id": "...", "percentage": 0.5}, ...]}
    svr.Put(R"(/api/accounts/([^/]+)/ownership)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            json in = json::parse(req.body);
            std::vector<std::pair<UserId, double>> shares;
            for (const auto& s : in.at("shares")) {
                shares.emplace_back(s.at("user_id").get<std::string>(), s.at("percentage").get<double>());
            }
            ledger.replace_ownership(req.matches[1], shares);
            return ok();
        });
    });

    svr.Post("/api/ownership", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            json in = json::parse(req.body);
            ledger.set_ownership(in.at("account_id").get<std::string>(), in.at("user_id").get<std::string>(),
                                 in.at("percentage").get<double>());
            return ok();
        });
    });

    svr.Post("/api/ownership/remove", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            json in = json::parse(req.body);
            ledger.remove_ownership(in.at("account_id").get<std::string>(), in.at("user_id").get<std::string>());
            return ok();
        });
    });

    svr.Post("/api/ownership/weight", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            json in = json::parse(req.body);
            double weight = ledger.ownership_weight(in.at("account_id").get<std::string>(),
                                                    in.at("user_ids").get<std::vector<std::string>>());
            return json{{"weight", weight}};
        });
    });

    // === [SEARCH: POSTING ENGINE] ===
    svr.Post("/api/transactions", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            TransactionId id = ledger.post_transaction(json::parse(req.body).get<NewTransaction>());
            return json{{"transaction_id", id}};
        });
    });

    svr.Get("/api/transactions", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            TransactionFilter filter;
            if (std::optional<std::string> from = param(req, "from")) filter.from = Date::parse(*from);
            if (std::optional<std::string> to = param(req, "to")) filter.to = Date::parse(*to);
            filter.account_prefix = param(req, "account");
            filter.import_batch_id = param(req, "batch");
            filter.include_hidden = flag(req, "include_hidden");
            return json(ledger.list_transactions(filter));
        });
    });

    svr.Get(R"(/api/transactions/([^/]+))", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.get_transaction(req.matches[1])); });
    });

    svr.Put(R"(/api/transactions/([^/]+)/entries)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            json in = json::parse(req.body);
            ledger.replace_entries(req.matches[1], in.at("entries").get<std::vector<EntryInput>>());
            return ok();
        });
    });

    svr.Delete(R"(/api/transactions/([^/]+))", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { ledger.delete_transaction(req.matches[1]); return ok(); });
    });

    svr.Get("/api/audit/balances", [&](const httplib::Request &, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.audit_balances()); });
    });

    // === [SEARCH: DUPLICATE MATCHER] ===
    svr.Get(R"(/api/transactions/([^/]+)/candidates)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            money_micro tolerance = ledger.config().matching.amount_tolerance;
            int days = ledger.config().matching.date_tolerance_days;
            if (std::optional<std::string> t = param(req, "amount_tolerance")) tolerance = parse_money(*t);
            if (std::optional<std::string> d = param(req, "date_tolerance_days")) days = std::stoi(*d);
            return json(ledger.find_duplicate_candidates(req.matches[1], tolerance, days));
        });
    });

    svr.Get(R"(/api/transactions/([^/]+)/matches)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.matches_for(req.matches[1])); });
    });

    svr.Get("/api/matches", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            std::optional<MatchStatus> status;
            if (std::optional<std::string> s = param(req, "status")) status = match_status_from_string(*s);
            return json(ledger.list_matches(status));
        });
    });

    svr.Post("/api/matches", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            json in = json::parse(req.body);
            MatchCriteria criteria;
            if (in.contains("criteria")) criteria = in.at("criteria").get<MatchCriteria>();
            MatchId id = ledger.record_match(in.at("primary_id").get<std::string>(),
                                             in.at("duplicate_id").get<std::string>(),
                                             in.at("confidence").get<double>(), criteria);
            return json{{"match_id", id}};
        });
    });

    svr.Get(R"(/api/matches/([^/]+))", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.get_match(req.matches[1])); });
    });

    svr.Post(R"(/api/matches/([^/]+)/status)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            json in = json::parse(req.body);
            ledger.update_match_status(req.matches[1], match_status_from_string(in.at("status").get<std::string>()));
            return ok();
        });
    });

    svr.Post(R"(/api/batches/([^/]+)/detect)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            bool auto_merge = false;
            if (!req.body.empty()) auto_merge = json::parse(req.body).value("auto_merge_exact", false);
            BatchDetectionResult result = ledger.detect_duplicates_for_batch(req.matches[1], auto_merge);
            return json{{"matches", result.matches}, {"merged", result.merged}};
        });
    });

    // === [SEARCH: MERGE MANAGER] ===
    svr.Post("/api/merge", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            json in = json::parse(req.body);
            ledger.merge_transactions(in.at("primary_id").get<std::string>(), in.at("duplicate_id").get<std::string>());
            return ok();
        });
    });

    svr.Post(R"(/api/transactions/([^/]+)/unmerge)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { ledger.unmerge_transaction(req.matches[1]); return ok(); });
    });

    svr.Get(R"(/api/transactions/([^/]+)/merged)", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.merged_into(req.matches[1])); });
    });

    svr.Get("/api/hidden", [&](const httplib::Request &, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.hidden_transactions()); });
    });

    // === [SEARCH: IMPORTED FILES] ===
    svr.Get("/api/imports", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            size_t limit = 0;
            if (std::optional<std::string> l = param(req, "limit")) limit = static_cast<size_t>(std::stoul(*l));
            return json(ledger.list_imports(param(req, "source"), limit));
        });
    });

    svr.Post("/api/imports", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() { return json(ledger.record_import(json::parse(req.body).get<ImportedFile>())); });
    });

    // {"file_hash": "..."} or {"file_path": "...", "import_source": "..."}
    svr.Post("/api/imports/check", [&](const httplib::Request &req, httplib::Response &res) {
        respond(res, [&]() {
            json in = json::parse(req.body);
            if (in.contains("file_hash")) {
                return json{{"imported", ledger.is_imported(in.at("file_hash").get<std::string>())}};
            }
            return json{{"imported", ledger.is_path_imported(in.at("file_path").get<std::string>(),
                                                             in.at("import_source").get<std::string>())}};
        });
    });

    log("INFO", "Listening on " + config.server.host + ":" + std::to_string(config.server.port));
    if (!svr.listen(config.server.host.c_str(), config.server.port)) {
        log("FATAL", "Unable to bind " + config.server.host + ":" + std::to_string(config.server.port));
        return 1;
    }
    return 0;
}
