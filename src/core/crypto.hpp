/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: crypto.hpp
 * ============================================================================
 * * DESCRIPTION:
 * SHA-256 digests (imported-file fingerprints) and random row identities.
 * ============================================================================
 */

#ifndef ASSETS_CRYPTO_HPP
#define ASSETS_CRYPTO_HPP

#include <string>

namespace assets {

class LedgerCrypto {
public:
    // Lowercase hex SHA-256 of an in-memory buffer.
    static std::string generate_sha256(const std::string& data);

    /**
     * sha256_file
     * Streams a file through SHA-256. Two imports of the same bank export
     * produce the same fingerprint regardless of the path they came from.
     * @throws LedgerError(StoreFailure) if the file cannot be read.
     */
    static std::string sha256_file(const std::string& path);

    /**
     * generate_uuid
     * Random version-4 UUID in canonical 8-4-4-4-12 form. Used for every
     * ledger row identity so rows can be created without a round trip.
     */
    static std::string generate_uuid();
};

} // namespace assets

#endif // ASSETS_CRYPTO_HPP
