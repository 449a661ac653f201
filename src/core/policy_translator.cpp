/**
 * @file policy_translator.cpp
 * @brief Implementation of the sandbox policy to container spec mapping
 *
 * @date 2025
 */

#include "stockade/core/policy_translator.hpp"

namespace stockade {
namespace core {

std::string PolicyTranslator::NetworkModeFor(NetworkPolicy policy) {
    switch (policy) {
        case NetworkPolicy::NONE:
            return "none";
        // The engine has no finer-grained mode; all three share the default bridge
        case NetworkPolicy::INTERNAL:
        case NetworkPolicy::LIMITED:
        case NetworkPolicy::FULL:
            return "bridge";
    }
    return "none";
}

std::string PolicyTranslator::FormatBind(const MountSpec& mount) {
    return mount.host_path + ":" + mount.container_path + ":" +
           (mount.read_only ? "ro" : "rw");
}

runtime::ContainerSpec PolicyTranslator::BuildContainerSpec(const SandboxConfig& config,
                                                            const std::string& command) {
    runtime::ContainerSpec spec;
    spec.image = config.image;
    spec.cmd = {"/bin/sh", "-c", command};
    spec.working_dir = config.working_dir;

    if (config.environment && !config.environment->empty()) {
        std::vector<std::string> env;
        env.reserve(config.environment->size());
        for (const auto& [key, value] : *config.environment) {
            env.push_back(key + "=" + value);
        }
        spec.env = std::move(env);
    }

    auto& host = spec.host_config;
    host.network_mode = NetworkModeFor(config.network_policy);
    host.readonly_rootfs = true;
    host.auto_remove = false;

    if (config.resource_limits) {
        const auto& limits = *config.resource_limits;
        host.memory = limits.memory_bytes;
        host.memory_swap = limits.memory_swap_bytes;
        host.cpu_quota = limits.cpu_quota_us;
        host.cpu_period = limits.cpu_period_us;
        host.pids_limit = limits.pids_limit;
    }

    if (config.mounts) {
        for (const auto& mount : *config.mounts) {
            host.binds.push_back(FormatBind(mount));
        }
    }

    return spec;
}

} // namespace core
} // namespace stockade
