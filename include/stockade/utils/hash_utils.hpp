/**
 * @file hash_utils.hpp
 * @brief SHA-256 hashing for the tamper-evident audit trail
 *
 * Thin wrapper over OpenSSL producing lowercase hexadecimal digests, plus a
 * constant-time comparison used when verifying hash chains.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <filesystem>

namespace stockade {
namespace utils {

/**
 * @class HashUtils
 * @brief Static SHA-256 helpers
 *
 * All methods are thread-safe.
 *
 * **Usage Example**:
 * @code
 * auto digest = HashUtils::ComputeSHA256(previous_hash + line);
 * if (!HashUtils::DigestEquals(digest, recorded)) {
 *     // chain broken
 * }
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a string
     * @return 64 lowercase hex characters
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief SHA-256 of a file, streamed in 8KB chunks
     * @throws std::runtime_error if the file cannot be read
     */
    static std::string ComputeFileSHA256(const std::filesystem::path& file_path);

    /**
     * @brief Compare two hex digests in constant time
     */
    static bool DigestEquals(const std::string& a, const std::string& b);

    /**
     * @brief True if the string looks like a SHA-256 hex digest
     */
    static bool IsSHA256Hex(const std::string& digest);
};

} // namespace utils
} // namespace stockade
