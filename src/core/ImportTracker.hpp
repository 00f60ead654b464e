/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ImportTracker.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Remembers which bank export files were already imported, by SHA-256 of
 * their contents and by (path, source), so importers never load the same
 * statement twice.
 * ============================================================================
 */

#ifndef ASSETS_IMPORT_TRACKER_HPP
#define ASSETS_IMPORT_TRACKER_HPP

#include "store.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace assets {

    class ImportTracker {
    public:
        static std::string hash_file(const std::string& path);

        /**
         * prepare_metadata
         * Hashes and measures the file at `path` and fills an ImportedFile
         * ready for record_import(). Throws StoreFailure if it is unreadable.
         */
        static ImportedFile prepare_metadata(const std::string& path, const std::string& source,
                                             const BatchId& batch, const std::optional<UserId>& user,
                                             int transaction_count, const std::optional<std::string>& notes);

        bool is_imported(UnitOfWork& uow, const std::string& hash);
        bool is_path_imported(UnitOfWork& uow, const std::string& path, const std::string& source);
        std::optional<ImportedFile> find_by_hash(UnitOfWork& uow, const std::string& hash);

        // Throws FileAlreadyImported on a known hash or (path, source).
        ImportedFile record_import(UnitOfWork& uow, const ImportedFile& metadata);

        // Newest first.
        std::vector<ImportedFile> list_imports(UnitOfWork& uow, const std::optional<std::string>& source,
                                               size_t limit);
    };

} // namespace assets

#endif // ASSETS_IMPORT_TRACKER_HPP
