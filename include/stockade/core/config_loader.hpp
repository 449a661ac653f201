/**
 * @file config_loader.hpp
 * @brief JSON (de)serialization of SandboxConfig
 *
 * **File Format**:
 * ```json
 * {
 *   "image": "alpine:3.19",
 *   "network_policy": "none",
 *   "timeout_ms": 10000,
 *   "working_dir": "/workspace",
 *   "pull_missing_image": true,
 *   "resource_limits": {
 *     "memory_bytes": 268435456,
 *     "cpu_quota_us": 50000,
 *     "cpu_period_us": 100000,
 *     "pids_limit": 64
 *   },
 *   "environment": { "LANG": "C.UTF-8" },
 *   "mounts": [
 *     { "host_path": "/srv/in", "container_path": "/in", "read_only": true }
 *   ]
 * }
 * ```
 *
 * Every key is optional; missing keys keep the SandboxConfig defaults.
 *
 * @date 2025
 */

#pragma once

#include "stockade/core/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <utility>

namespace stockade {
namespace core {

/**
 * @brief Build a config from a JSON object and validate it
 * @throws std::invalid_argument on wrong types, unknown policy names or
 *         invalid values
 */
SandboxConfig SandboxConfigFromJson(const nlohmann::json& j);

/**
 * @brief Serialize a config; unset optionals are omitted
 */
nlohmann::json SandboxConfigToJson(const SandboxConfig& config);

/**
 * @brief Load and validate a config file
 * @throws std::runtime_error if the file cannot be read
 * @throws std::invalid_argument if the content is malformed or invalid
 */
SandboxConfig LoadSandboxConfig(const std::filesystem::path& path);

/**
 * @brief Parse a `host:container[:ro|rw]` mount; read-only unless `rw`
 * @throws std::invalid_argument on a missing or empty component or an
 *         unknown mode
 */
MountSpec ParseMountSpec(const std::string& text);

/**
 * @brief Split `KEY=VALUE` at the first '='; the value may be empty
 * @throws std::invalid_argument if there is no '=' or the key is empty
 */
std::pair<std::string, std::string> ParseEnvAssignment(const std::string& assignment);

} // namespace core
} // namespace stockade
