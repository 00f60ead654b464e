#include "crypto.hpp"
#include "errors.hpp"
#include <openssl/evp.h> // Modern OpenSSL API
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <vector>

namespace assets {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

typedef std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> DigestContext;

DigestContext new_sha256_context() {
    DigestContext context(EVP_MD_CTX_new());
    if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), NULL) != 1) {
        throw LedgerError(ErrorKind::StoreFailure, "OpenSSL SHA-256 initialisation failed.");
    }
    return context;
}

std::string finish_hex(EVP_MD_CTX* context) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context, hash, &length) != 1) {
        throw LedgerError(ErrorKind::StoreFailure, "OpenSSL SHA-256 finalisation failed.");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

} // namespace

std::string LedgerCrypto::generate_sha256(const std::string& data) {
    DigestContext context = new_sha256_context();
    EVP_DigestUpdate(context.get(), data.c_str(), data.size());
    return finish_hex(context.get());
}

std::string LedgerCrypto::sha256_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw LedgerError(ErrorKind::StoreFailure, "Cannot open file for hashing: " + path);
    }

    DigestContext context = new_sha256_context();
    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0) {
            EVP_DigestUpdate(context.get(), buffer.data(), static_cast<size_t>(got));
        }
    }
    if (file.bad()) {
        throw LedgerError(ErrorKind::StoreFailure, "Read error while hashing: " + path);
    }
    return finish_hex(context.get());
}

std::string LedgerCrypto::generate_uuid() {
    static std::mutex generator_mutex;
    static std::mt19937_64 generator{std::random_device{}()};

    uint64_t hi, lo;
    {
        std::lock_guard<std::mutex> lock(generator_mutex);
        hi = generator();
        lo = generator();
    }

    // Version 4, RFC 4122 variant.
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::stringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (hi >> 32) << '-'
       << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
       << std::setw(4) << (hi & 0xFFFF) << '-'
       << std::setw(4) << (lo >> 48) << '-'
       << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

} // namespace assets
