/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ImportTracker.cpp
 * ============================================================================
 */

#include "ImportTracker.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <fstream>

namespace assets {

std::string ImportTracker::hash_file(const std::string& path) {
    return LedgerCrypto::sha256_file(path);
}

ImportedFile ImportTracker::prepare_metadata(const std::string& path, const std::string& source,
                                             const BatchId& batch, const std::optional<UserId>& user,
                                             int transaction_count, const std::optional<std::string>& notes) {
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs.is_open()) {
        throw LedgerError(ErrorKind::StoreFailure, "Cannot open import file " + path);
    }

    ImportedFile file;
    file.file_path = path;
    size_t slash = path.find_last_of("/\\");
    file.file_name = slash == std::string::npos ? path : path.substr(slash + 1);
    file.file_size = static_cast<int64_t>(ifs.tellg());
    file.file_hash = hash_file(path);
    file.import_source = source;
    file.batch_id = batch;
    file.imported_by = user;
    file.transaction_count = transaction_count;
    file.notes = notes;
    file.imported_on = Date::today();
    return file;
}

bool ImportTracker::is_imported(UnitOfWork& uow, const std::string& hash) {
    return uow.find_import_by_hash(hash).has_value();
}

bool ImportTracker::is_path_imported(UnitOfWork& uow, const std::string& path, const std::string& source) {
    return uow.find_import_by_path(path, source).has_value();
}

std::optional<ImportedFile> ImportTracker::find_by_hash(UnitOfWork& uow, const std::string& hash) {
    return uow.find_import_by_hash(hash);
}

ImportedFile ImportTracker::record_import(UnitOfWork& uow, const ImportedFile& metadata) {
    if (metadata.file_hash.empty() || metadata.file_path.empty() || metadata.import_source.empty()) {
        throw LedgerError(ErrorKind::InvalidPath, "Import record needs a path, a source and a file hash.");
    }
    if (std::optional<ImportedFile> previous = uow.find_import_by_hash(metadata.file_hash)) {
        throw LedgerError(ErrorKind::FileAlreadyImported,
                          "File content already imported from " + previous->file_path +
                          " on " + previous->imported_on.to_string() + ".");
    }
    if (uow.find_import_by_path(metadata.file_path, metadata.import_source)) {
        throw LedgerError(ErrorKind::FileAlreadyImported,
                          metadata.file_path + " was already imported as " + metadata.import_source + ".");
    }

    ImportedFile file = metadata;
    if (file.id.empty()) file.id = LedgerCrypto::generate_uuid();
    if (file.file_name.empty()) {
        size_t slash = file.file_path.find_last_of("/\\");
        file.file_name = slash == std::string::npos ? file.file_path : file.file_path.substr(slash + 1);
    }
    uow.insert_import(file);
    log("INFO", "Import recorded: " + file.file_name + " (" + file.import_source + ", " +
                std::to_string(file.transaction_count) + " transactions)");
    return file;
}

std::vector<ImportedFile> ImportTracker::list_imports(UnitOfWork& uow, const std::optional<std::string>& source,
                                                      size_t limit) {
    std::vector<ImportedFile> out;
    for (const auto& file : uow.imported_files()) {
        if (source && file.import_source != *source) continue;
        if (limit > 0 && out.size() >= limit) break;
        out.push_back(file);
    }
    return out;
}

} // namespace assets
