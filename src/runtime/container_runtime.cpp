/**
 * @file container_runtime.cpp
 * @brief Runtime error classification and container spec serialization
 *
 * A ContainerSpec is serialized to the engine's container-create body. Optional
 * fields that are unset are left out of the JSON entirely so the engine
 * applies its own defaults:
 *
 * ```json
 * {
 *   "Image": "stockade-sandbox:latest",
 *   "Cmd": ["/bin/sh", "-c", "echo hi"],
 *   "WorkingDir": "/workspace",
 *   "Tty": false,
 *   "HostConfig": {
 *     "NetworkMode": "none",
 *     "ReadonlyRootfs": true,
 *     "AutoRemove": false,
 *     "Memory": 536870912
 *   }
 * }
 * ```
 *
 * @date 2025
 */

#include "stockade/runtime/container_runtime.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace stockade {
namespace runtime {

std::string ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND:     return "not_found";
        case ErrorKind::CONFLICT:      return "conflict";
        case ErrorKind::BAD_REQUEST:   return "bad_request";
        case ErrorKind::SERVER:        return "server";
        case ErrorKind::CONNECTION:    return "connection";
        case ErrorKind::PROTOCOL:      return "protocol";
        case ErrorKind::PULL_FAILED:   return "pull_failed";
        case ErrorKind::PULL_PROGRESS: return "pull_progress";
    }
    return "unknown";
}

RuntimeError::RuntimeError(ErrorKind kind, const std::string& message,
                           std::optional<long> status_code)
    : std::runtime_error(message)
    , kind_(kind)
    , status_code_(status_code) {
}

ErrorKind ClassifyStatus(long status_code) {
    if (status_code == 404) return ErrorKind::NOT_FOUND;
    if (status_code == 409) return ErrorKind::CONFLICT;
    if (status_code >= 500) return ErrorKind::SERVER;
    if (status_code >= 400) return ErrorKind::BAD_REQUEST;
    return ErrorKind::PROTOCOL;
}

bool HostConfig::operator==(const HostConfig& other) const {
    return network_mode == other.network_mode &&
           memory == other.memory &&
           memory_swap == other.memory_swap &&
           cpu_quota == other.cpu_quota &&
           cpu_period == other.cpu_period &&
           pids_limit == other.pids_limit &&
           readonly_rootfs == other.readonly_rootfs &&
           binds == other.binds &&
           auto_remove == other.auto_remove;
}

bool ContainerSpec::operator==(const ContainerSpec& other) const {
    return image == other.image &&
           cmd == other.cmd &&
           env == other.env &&
           working_dir == other.working_dir &&
           host_config == other.host_config;
}

std::string ToJsonString(const ContainerSpec& spec) {
    const auto& hc = spec.host_config;

    json host_config = {
        {"NetworkMode", hc.network_mode},
        {"ReadonlyRootfs", hc.readonly_rootfs},
        {"AutoRemove", hc.auto_remove}
    };
    if (hc.memory) host_config["Memory"] = *hc.memory;
    if (hc.memory_swap) host_config["MemorySwap"] = *hc.memory_swap;
    if (hc.cpu_quota) host_config["CpuQuota"] = *hc.cpu_quota;
    if (hc.cpu_period) host_config["CpuPeriod"] = *hc.cpu_period;
    if (hc.pids_limit) host_config["PidsLimit"] = *hc.pids_limit;
    if (!hc.binds.empty()) host_config["Binds"] = hc.binds;

    json body = {
        {"Image", spec.image},
        {"Cmd", spec.cmd},
        {"WorkingDir", spec.working_dir},
        // Non-TTY so the log endpoint returns the multiplexed stream
        {"Tty", false},
        {"AttachStdin", false},
        {"OpenStdin", false},
        {"HostConfig", host_config}
    };
    if (spec.env) body["Env"] = *spec.env;

    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace runtime
} // namespace stockade
