/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Engine configuration. Values come from a JSON manifest
 * (config/assets_config.json unless ASSETS_CONFIG says otherwise), then the
 * environment overrides the deployment-specific ones:
 *
 *   ASSETS_CONFIG    path of the JSON manifest
 *   ASSETS_STORE     "memory" or "postgres"
 *   ASSETS_DB_CONN   PostgreSQL connection string (implies "postgres")
 *   ASSETS_PORT      HTTP listen port
 *
 * The duplicate-matching thresholds are business heuristics, kept here as
 * tunable defaults rather than constants in the matcher.
 * ============================================================================
 */

#ifndef ASSETS_CONFIG_HPP
#define ASSETS_CONFIG_HPP

#include "money.hpp"
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace assets {

    using json = nlohmann::json;

    // Who receives the default 100% share of a newly created account.
    enum class OwnerPolicy {
        FirstUser,  // the earliest created user
        Creator,    // the user passed as NewAccount::created_by
        None        // no default share
    };

    const char* to_string(OwnerPolicy policy);
    OwnerPolicy owner_policy_from_string(const std::string& text);

    struct StoreConfig {
        std::string backend = "memory";
        std::string connection;
        int max_retries = 3;        // retries of a unit of work after StoreConflict
    };

    struct ServerConfig {
        std::string host = "0.0.0.0";
        int port = 8080;
    };

    struct AccountsConfig {
        std::string default_currency = "EUR";
        size_t max_name_length = 100;
        size_t max_hierarchy_depth = 10;
        OwnerPolicy default_owner = OwnerPolicy::FirstUser;
    };

    struct OwnershipConfig {
        double epsilon = 1e-4;      // tolerance on the 100% ceiling
    };

    struct MatchingConfig {
        money_micro amount_tolerance = 10000;       // 0.01
        int date_tolerance_days = 3;

        double exact_confidence = 0.95;
        double probable_confidence = 0.80;
        double possible_confidence = 0.60;
        double baseline_confidence = 0.30;

        double exact_similarity = 0.8;
        double probable_similarity = 0.6;
        money_micro exact_amount_delta = 10000;     // 0.01

        // Batch detection records candidates at or above this confidence.
        double min_record_confidence = 0.60;
    };

    struct LedgerConfig {
        StoreConfig store;
        ServerConfig server;
        AccountsConfig accounts;
        OwnershipConfig ownership;
        MatchingConfig matching;

        // Throws LedgerError(InvalidConfig) on out-of-range values.
        void validate() const;
    };

    // Missing keys keep their defaults. Throws LedgerError(InvalidConfig).
    LedgerConfig config_from_json(const json& manifest);
    json config_to_json(const LedgerConfig& config);

    /**
     * load_config
     * Reads the manifest at `path`. A missing file is not an error: the
     * engine logs a warning and runs on defaults. A corrupt file is.
     */
    LedgerConfig load_config(const std::string& path);

    void apply_env_overrides(LedgerConfig& config);

    // load_config(ASSETS_CONFIG or the default path) + apply_env_overrides.
    LedgerConfig load_config_from_environment();

} // namespace assets

#endif // ASSETS_CONFIG_HPP
