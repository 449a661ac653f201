/**
 * @file types.cpp
 * @brief Enum conversions and configuration validation
 *
 * @date 2025
 */

#include "stockade/core/types.hpp"

#include <stdexcept>

namespace stockade {
namespace core {

namespace {

void RequirePositive(const std::optional<std::int64_t>& value, const char* field) {
    if (value && *value <= 0) {
        throw std::invalid_argument(std::string("Invalid resource limit: ") + field +
                                    " must be positive (got " + std::to_string(*value) + ")");
    }
}

} // anonymous namespace

std::string ToString(NetworkPolicy policy) {
    switch (policy) {
        case NetworkPolicy::NONE:     return "none";
        case NetworkPolicy::INTERNAL: return "internal";
        case NetworkPolicy::LIMITED:  return "limited";
        case NetworkPolicy::FULL:     return "full";
    }
    return "unknown";
}

std::string ToString(SandboxStatus status) {
    switch (status) {
        case SandboxStatus::IDLE:      return "idle";
        case SandboxStatus::RUNNING:   return "running";
        case SandboxStatus::COMPLETED: return "completed";
        case SandboxStatus::FAILED:    return "failed";
        case SandboxStatus::TIMEOUT:   return "timeout";
        case SandboxStatus::KILLED:    return "killed";
    }
    return "unknown";
}

NetworkPolicy ParseNetworkPolicy(const std::string& name) {
    if (name == "none") return NetworkPolicy::NONE;
    if (name == "internal") return NetworkPolicy::INTERNAL;
    if (name == "limited") return NetworkPolicy::LIMITED;
    if (name == "full") return NetworkPolicy::FULL;
    throw std::invalid_argument("Unknown network policy: " + name);
}

SandboxStatus ParseSandboxStatus(const std::string& name) {
    if (name == "idle") return SandboxStatus::IDLE;
    if (name == "running") return SandboxStatus::RUNNING;
    if (name == "completed") return SandboxStatus::COMPLETED;
    if (name == "failed") return SandboxStatus::FAILED;
    if (name == "timeout") return SandboxStatus::TIMEOUT;
    if (name == "killed") return SandboxStatus::KILLED;
    throw std::invalid_argument("Unknown sandbox status: " + name);
}

void ValidateConfig(const SandboxConfig& config) {
    if (config.timeout.count() <= 0) {
        throw std::invalid_argument("Invalid timeout: must be > 0 ms (got " +
                                    std::to_string(config.timeout.count()) + ")");
    }

    if (config.image.empty()) {
        throw std::invalid_argument("Container image is required");
    }

    if (config.working_dir.empty()) {
        throw std::invalid_argument("Working directory is required");
    }

    if (config.resource_limits) {
        const auto& limits = *config.resource_limits;
        RequirePositive(limits.memory_bytes, "memory");
        RequirePositive(limits.memory_swap_bytes, "memory_swap");
        RequirePositive(limits.cpu_quota_us, "cpu_quota");
        RequirePositive(limits.cpu_period_us, "cpu_period");
        RequirePositive(limits.pids_limit, "pids_limit");
    }

    if (config.mounts) {
        for (const auto& mount : *config.mounts) {
            if (mount.host_path.empty() || mount.container_path.empty()) {
                throw std::invalid_argument("Mount paths must not be empty");
            }
        }
    }

    if (config.environment) {
        for (const auto& var : *config.environment) {
            if (var.first.empty() || var.first.find('=') != std::string::npos) {
                throw std::invalid_argument("Invalid environment variable name: '" + var.first + "'");
            }
        }
    }
}

} // namespace core
} // namespace stockade
