/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.cpp
 * ============================================================================
 */

#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "models.hpp"
#include <cstdlib>
#include <fstream>

namespace assets {

namespace {

const char* DEFAULT_CONFIG_PATH = "config/assets_config.json";

// Amounts may be written as numbers (0.01) or decimal strings ("0.01").
// Numbers go through their JSON text so they are never rounded.
money_micro read_amount(const json& node) {
    if (node.is_string()) return parse_money(node.get<std::string>());
    if (node.is_number()) return parse_money(node.dump());
    throw LedgerError(ErrorKind::InvalidConfig, "Amount must be a number or a decimal string.");
}

void check_fraction(double value, const char* name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw LedgerError(ErrorKind::InvalidConfig,
                          std::string(name) + " must be within [0, 1].");
    }
}

} // namespace

const char* to_string(OwnerPolicy policy) {
    switch (policy) {
        case OwnerPolicy::FirstUser: return "first_user";
        case OwnerPolicy::Creator: return "creator";
        case OwnerPolicy::None: return "none";
    }
    return "first_user";
}

OwnerPolicy owner_policy_from_string(const std::string& text) {
    if (text == "first_user") return OwnerPolicy::FirstUser;
    if (text == "creator") return OwnerPolicy::Creator;
    if (text == "none") return OwnerPolicy::None;
    throw LedgerError(ErrorKind::InvalidConfig, "Unknown default owner policy: " + text);
}

void LedgerConfig::validate() const {
    if (store.backend != "memory" && store.backend != "postgres") {
        throw LedgerError(ErrorKind::InvalidConfig, "store.backend must be 'memory' or 'postgres'.");
    }
    if (store.backend == "postgres" && store.connection.empty()) {
        throw LedgerError(ErrorKind::InvalidConfig, "PostgreSQL backend requires a connection string.");
    }
    if (store.max_retries < 0) {
        throw LedgerError(ErrorKind::InvalidConfig, "store.max_retries cannot be negative.");
    }
    if (server.port <= 0 || server.port > 65535) {
        throw LedgerError(ErrorKind::InvalidConfig, "server.port is out of range.");
    }
    if (!is_currency_code(accounts.default_currency)) {
        throw LedgerError(ErrorKind::InvalidConfig, "accounts.default_currency must be an ISO 4217 code.");
    }
    if (accounts.max_name_length == 0 || accounts.max_hierarchy_depth == 0) {
        throw LedgerError(ErrorKind::InvalidConfig, "accounts limits must be positive.");
    }
    if (!(ownership.epsilon >= 0.0 && ownership.epsilon < 0.01)) {
        throw LedgerError(ErrorKind::InvalidConfig, "ownership.epsilon must be within [0, 0.01).");
    }
    if (matching.amount_tolerance < 0 || matching.exact_amount_delta < 0) {
        throw LedgerError(ErrorKind::InvalidConfig, "matching tolerances cannot be negative.");
    }
    if (matching.date_tolerance_days < 0) {
        throw LedgerError(ErrorKind::InvalidConfig, "matching.date_tolerance_days cannot be negative.");
    }
    check_fraction(matching.exact_confidence, "matching.exact_confidence");
    check_fraction(matching.probable_confidence, "matching.probable_confidence");
    check_fraction(matching.possible_confidence, "matching.possible_confidence");
    check_fraction(matching.baseline_confidence, "matching.baseline_confidence");
    check_fraction(matching.exact_similarity, "matching.exact_similarity");
    check_fraction(matching.probable_similarity, "matching.probable_similarity");
    check_fraction(matching.min_record_confidence, "matching.min_record_confidence");
    if (!(matching.exact_confidence >= matching.probable_confidence &&
          matching.probable_confidence >= matching.possible_confidence &&
          matching.possible_confidence >= matching.baseline_confidence)) {
        throw LedgerError(ErrorKind::InvalidConfig,
                          "matching confidences must be ordered exact >= probable >= possible >= baseline.");
    }
}

LedgerConfig config_from_json(const json& manifest) {
    LedgerConfig config;
    try {
        if (manifest.contains("store")) {
            const json& s = manifest.at("store");
            config.store.backend = s.value("backend", config.store.backend);
            config.store.connection = s.value("connection", config.store.connection);
            config.store.max_retries = s.value("max_retries", config.store.max_retries);
        }
        if (manifest.contains("server")) {
            const json& s = manifest.at("server");
            config.server.host = s.value("host", config.server.host);
            config.server.port = s.value("port", config.server.port);
        }
        if (manifest.contains("accounts")) {
            const json& a = manifest.at("accounts");
            config.accounts.default_currency = a.value("default_currency", config.accounts.default_currency);
            config.accounts.max_name_length = a.value("max_name_length", config.accounts.max_name_length);
            config.accounts.max_hierarchy_depth = a.value("max_hierarchy_depth", config.accounts.max_hierarchy_depth);
            if (a.contains("default_owner")) {
                config.accounts.default_owner = owner_policy_from_string(a.at("default_owner").get<std::string>());
            }
        }
        if (manifest.contains("ownership")) {
            config.ownership.epsilon = manifest.at("ownership").value("epsilon", config.ownership.epsilon);
        }
        if (manifest.contains("matching")) {
            const json& m = manifest.at("matching");
            MatchingConfig& mc = config.matching;
            if (m.contains("amount_tolerance")) mc.amount_tolerance = read_amount(m.at("amount_tolerance"));
            if (m.contains("exact_amount_delta")) mc.exact_amount_delta = read_amount(m.at("exact_amount_delta"));
            mc.date_tolerance_days = m.value("date_tolerance_days", mc.date_tolerance_days);
            mc.exact_confidence = m.value("exact_confidence", mc.exact_confidence);
            mc.probable_confidence = m.value("probable_confidence", mc.probable_confidence);
            mc.possible_confidence = m.value("possible_confidence", mc.possible_confidence);
            mc.baseline_confidence = m.value("baseline_confidence", mc.baseline_confidence);
            mc.exact_similarity = m.value("exact_similarity", mc.exact_similarity);
            mc.probable_similarity = m.value("probable_similarity", mc.probable_similarity);
            mc.min_record_confidence = m.value("min_record_confidence", mc.min_record_confidence);
        }
    } catch (const json::exception& e) {
        throw LedgerError(ErrorKind::InvalidConfig, std::string("Configuration format error: ") + e.what());
    } catch (const LedgerError& e) {
        throw LedgerError(ErrorKind::InvalidConfig, e.what());
    }

    config.validate();
    return config;
}

json config_to_json(const LedgerConfig& config) {
    json out;
    out["store"]["backend"] = config.store.backend;
    out["store"]["max_retries"] = config.store.max_retries;
    out["server"]["host"] = config.server.host;
    out["server"]["port"] = config.server.port;
    out["accounts"]["default_currency"] = config.accounts.default_currency;
    out["accounts"]["max_name_length"] = config.accounts.max_name_length;
    out["accounts"]["max_hierarchy_depth"] = config.accounts.max_hierarchy_depth;
    out["accounts"]["default_owner"] = to_string(config.accounts.default_owner);
    out["ownership"]["epsilon"] = config.ownership.epsilon;

    const MatchingConfig& mc = config.matching;
    out["matching"]["amount_tolerance"] = format_money(mc.amount_tolerance);
    out["matching"]["exact_amount_delta"] = format_money(mc.exact_amount_delta);
    out["matching"]["date_tolerance_days"] = mc.date_tolerance_days;
    out["matching"]["exact_confidence"] = mc.exact_confidence;
    out["matching"]["probable_confidence"] = mc.probable_confidence;
    out["matching"]["possible_confidence"] = mc.possible_confidence;
    out["matching"]["baseline_confidence"] = mc.baseline_confidence;
    out["matching"]["exact_similarity"] = mc.exact_similarity;
    out["matching"]["probable_similarity"] = mc.probable_similarity;
    out["matching"]["min_record_confidence"] = mc.min_record_confidence;
    // The connection string carries credentials and is never echoed.
    return out;
}

LedgerConfig load_config(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        log("WARN", "Config file " + path + " missing. Using system defaults.");
        return LedgerConfig();
    }

    json manifest;
    try {
        manifest = json::parse(ifs);
    } catch (const json::exception& e) {
        log("ERROR", "Config Parse Error: " + std::string(e.what()));
        throw LedgerError(ErrorKind::InvalidConfig, "Configuration file is corrupt: " + path);
    }
    return config_from_json(manifest);
}

void apply_env_overrides(LedgerConfig& config) {
    if (const char* env_store = std::getenv("ASSETS_STORE")) {
        config.store.backend = env_store;
    }
    if (const char* env_db = std::getenv("ASSETS_DB_CONN")) {
        config.store.connection = env_db;
        if (!std::getenv("ASSETS_STORE")) config.store.backend = "postgres";
    }
    if (const char* env_port = std::getenv("ASSETS_PORT")) {
        try {
            config.server.port = std::stoi(env_port);
        } catch (const std::exception&) {
            throw LedgerError(ErrorKind::InvalidConfig, std::string("ASSETS_PORT is not a number: ") + env_port);
        }
    }
    config.validate();
}

LedgerConfig load_config_from_environment() {
    const char* env_path = std::getenv("ASSETS_CONFIG");
    LedgerConfig config = load_config(env_path ? env_path : DEFAULT_CONFIG_PATH);
    apply_env_overrides(config);
    return config;
}

} // namespace assets
