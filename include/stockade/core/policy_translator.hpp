/**
 * @file policy_translator.hpp
 * @brief Mapping from sandbox policy to a container creation request
 *
 * @date 2025
 */

#pragma once

#include "stockade/core/types.hpp"
#include "stockade/runtime/container_runtime.hpp"

#include <string>

namespace stockade {
namespace core {

/**
 * @class PolicyTranslator
 * @brief Pure translation of SandboxConfig + command into a ContainerSpec
 *
 * **Mapping**:
 * - Command runs as `/bin/sh -c <command>`, never split
 * - NONE -> "none"; INTERNAL, LIMITED, FULL -> "bridge"
 * - Root filesystem is always read-only
 * - Mounts become "host:container:ro|rw" binds
 * - Environment becomes KEY=VALUE, omitted when empty
 * - Auto-remove is off; the executor removes containers itself
 */
class PolicyTranslator {
public:
    /**
     * @brief Build the container spec for one command
     * @param config Sandbox configuration
     * @param command Shell command text
     * @return Container creation request
     */
    static runtime::ContainerSpec BuildContainerSpec(const SandboxConfig& config,
                                                     const std::string& command);

    /**
     * @brief Runtime network mode for a policy
     */
    static std::string NetworkModeFor(NetworkPolicy policy);

    /**
     * @brief Format one bind entry
     */
    static std::string FormatBind(const MountSpec& mount);
};

} // namespace core
} // namespace stockade
