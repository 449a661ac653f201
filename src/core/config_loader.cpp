/**
 * @file config_loader.cpp
 * @brief Implementation of SandboxConfig JSON loading
 *
 * @date 2025
 */

#include "stockade/core/config_loader.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace stockade {
namespace core {

namespace {

template <typename T>
void ReadOptional(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j.at(key).is_null()) {
        target = j.at(key).get<T>();
    }
}

template <typename T>
void ReadOptional(const json& j, const char* key, std::optional<T>& target) {
    if (j.contains(key) && !j.at(key).is_null()) {
        target = j.at(key).get<T>();
    }
}

template <typename T>
void WriteOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

ResourceLimits LimitsFromJson(const json& j) {
    ResourceLimits limits;
    ReadOptional(j, "memory_bytes", limits.memory_bytes);
    ReadOptional(j, "memory_swap_bytes", limits.memory_swap_bytes);
    ReadOptional(j, "cpu_quota_us", limits.cpu_quota_us);
    ReadOptional(j, "cpu_period_us", limits.cpu_period_us);
    ReadOptional(j, "pids_limit", limits.pids_limit);
    return limits;
}

MountSpec MountFromJson(const json& j) {
    MountSpec mount;
    mount.host_path = j.at("host_path").get<std::string>();
    mount.container_path = j.at("container_path").get<std::string>();
    ReadOptional(j, "read_only", mount.read_only);
    return mount;
}

} // anonymous namespace

SandboxConfig SandboxConfigFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Sandbox config must be a JSON object");
    }

    SandboxConfig config;
    try {
        ReadOptional(j, "image", config.image);
        ReadOptional(j, "working_dir", config.working_dir);
        ReadOptional(j, "pull_missing_image", config.pull_missing_image);

        if (j.contains("network_policy")) {
            config.network_policy = ParseNetworkPolicy(j.at("network_policy").get<std::string>());
        }

        if (j.contains("timeout_ms")) {
            config.timeout = std::chrono::milliseconds(j.at("timeout_ms").get<std::int64_t>());
        }

        if (j.contains("resource_limits") && !j.at("resource_limits").is_null()) {
            config.resource_limits = LimitsFromJson(j.at("resource_limits"));
        }

        ReadOptional(j, "environment", config.environment);

        if (j.contains("mounts") && !j.at("mounts").is_null()) {
            std::vector<MountSpec> mounts;
            for (const auto& item : j.at("mounts")) {
                mounts.push_back(MountFromJson(item));
            }
            config.mounts = std::move(mounts);
        }
    }
    catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Malformed sandbox config: ") + e.what());
    }

    ValidateConfig(config);
    return config;
}

json SandboxConfigToJson(const SandboxConfig& config) {
    json j = {
        {"image", config.image},
        {"network_policy", ToString(config.network_policy)},
        {"timeout_ms", config.timeout.count()},
        {"working_dir", config.working_dir},
        {"pull_missing_image", config.pull_missing_image}
    };

    if (config.resource_limits) {
        json limits = json::object();
        WriteOptional(limits, "memory_bytes", config.resource_limits->memory_bytes);
        WriteOptional(limits, "memory_swap_bytes", config.resource_limits->memory_swap_bytes);
        WriteOptional(limits, "cpu_quota_us", config.resource_limits->cpu_quota_us);
        WriteOptional(limits, "cpu_period_us", config.resource_limits->cpu_period_us);
        WriteOptional(limits, "pids_limit", config.resource_limits->pids_limit);
        j["resource_limits"] = limits;
    }

    WriteOptional(j, "environment", config.environment);

    if (config.mounts) {
        json mounts = json::array();
        for (const auto& mount : *config.mounts) {
            mounts.push_back({
                {"host_path", mount.host_path},
                {"container_path", mount.container_path},
                {"read_only", mount.read_only}
            });
        }
        j["mounts"] = mounts;
    }

    return j;
}

SandboxConfig LoadSandboxConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    json j;
    try {
        file >> j;
    }
    catch (const json::parse_error& e) {
        throw std::invalid_argument("Config file " + path.string() + " is not valid JSON: " + e.what());
    }

    spdlog::debug("Loaded sandbox config from {}", path.string());
    return SandboxConfigFromJson(j);
}

MountSpec ParseMountSpec(const std::string& text) {
    // Empty fields are kept so that "/a::ro" is rejected rather than shifted
    std::vector<std::string> parts;
    std::string::size_type begin = 0;
    while (true) {
        auto end = text.find(':', begin);
        parts.push_back(text.substr(begin, end - begin));
        if (end == std::string::npos) {
            break;
        }
        begin = end + 1;
    }

    if (parts.size() < 2 || parts.size() > 3) {
        throw std::invalid_argument("Expected host:container[:ro|rw], got '" + text + "'");
    }
    for (const auto& part : parts) {
        if (part.empty()) {
            throw std::invalid_argument("Empty component in mount '" + text + "'");
        }
    }

    MountSpec mount{parts[0], parts[1], true};
    if (parts.size() == 3) {
        if (parts[2] == "rw") {
            mount.read_only = false;
        } else if (parts[2] != "ro") {
            throw std::invalid_argument("Unknown mount mode '" + parts[2] + "'");
        }
    }
    return mount;
}

std::pair<std::string, std::string> ParseEnvAssignment(const std::string& assignment) {
    auto pos = assignment.find('=');
    if (pos == std::string::npos || pos == 0) {
        throw std::invalid_argument("Expected KEY=VALUE, got '" + assignment + "'");
    }
    return {assignment.substr(0, pos), assignment.substr(pos + 1)};
}

} // namespace core
} // namespace stockade
