/**
 * @file string_utils.hpp
 * @brief String helpers shared by the runtime client, executor and CLI
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace stockade {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string manipulation helpers
 *
 * **Usage Example**:
 * @code
 * if (StringUtils::IsBlank(command)) {
 *     return;
 * }
 * auto parts = StringUtils::Split("/host:/data:ro", ':');
 * auto when = StringUtils::FormatTimestamp(std::chrono::system_clock::now());
 * @endcode
 */
class StringUtils {
public:
    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief True if the string is empty or whitespace only
     */
    static bool IsBlank(const std::string& str);

    /**
     * @brief Split by delimiter (empty tokens are skipped)
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);

    /**
     * @brief Shorten to max_length characters, ending with suffix
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");

    /**
     * @brief Format as ISO 8601 UTC with millisecond precision
     *        ("2025-01-31T12:00:00.123Z")
     */
    static std::string FormatTimestamp(std::chrono::system_clock::time_point time);
};

} // namespace utils
} // namespace stockade
