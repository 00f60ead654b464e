/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: PgStore.hpp
 * ============================================================================
 * * DESCRIPTION:
 * PostgreSQL ledger store (libpqxx). One connection and one pqxx::work per
 * unit of work. The schema is created on first use.
 *
 * Failure mapping:
 *   serialization failure, deadlock   -> StoreConflict (retried by Ledger)
 *   broken connection                 -> StoreUnavailable
 *   unique / foreign key violation    -> IntegrityViolation
 *   any other SQL error               -> StoreFailure
 * ============================================================================
 */

#ifndef ASSETS_PG_STORE_HPP
#define ASSETS_PG_STORE_HPP

#include "../core/store.hpp"
#include <string>

namespace assets {
namespace storage {

    class PgStore : public LedgerStore {
    public:
        explicit PgStore(const std::string& conn_str);

        std::unique_ptr<UnitOfWork> begin() override;
        std::string backend_name() const override { return "postgres"; }

        // Creates every table and index that does not exist yet.
        void ensure_schema();

        // Drops every ledger row. Test databases only.
        void truncate_all();

    private:
        std::string conn_str_;
    };

} // namespace storage
} // namespace assets

#endif // ASSETS_PG_STORE_HPP
