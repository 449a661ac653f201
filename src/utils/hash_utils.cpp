/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 helpers (OpenSSL)
 *
 * **Error Handling**:
 * - File not found / read errors: throws std::runtime_error
 * - OpenSSL digest failures: throws std::runtime_error
 *
 * @date 2025
 */

#include "stockade/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace stockade {
namespace utils {

namespace {

/**
 * @brief Convert binary data to hexadecimal string
 * @param data Binary data buffer
 * @param length Number of bytes to convert
 * @return Lowercase hexadecimal string representation
 */
std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

} // anonymous namespace

// Compute SHA256 hash (string)
std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

// Compute SHA256 hash (file)
std::string HashUtils::ComputeFileSHA256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    DigestContext context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(context.get(), buffer, static_cast<std::size_t>(file.gcount())) != 1) {
            throw std::runtime_error("SHA-256 update failed for " + file_path.string());
        }
    }

    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path.string());
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context.get(), hash, &length) != 1) {
        throw std::runtime_error("SHA-256 finalization failed for " + file_path.string());
    }

    spdlog::debug("SHA-256 computed for {}", file_path.string());
    return BinaryToHex(hash, length);
}

bool HashUtils::DigestEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool HashUtils::IsSHA256Hex(const std::string& digest) {
    return digest.size() == 2 * SHA256_DIGEST_LENGTH &&
           std::all_of(digest.begin(), digest.end(),
                       [](unsigned char c) { return std::isxdigit(c); });
}

} // namespace utils
} // namespace stockade
