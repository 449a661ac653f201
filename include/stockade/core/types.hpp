/**
 * @file types.hpp
 * @brief Shared data model for sandboxed command execution
 *
 * Declares the sandbox configuration (image, network policy, resource limits,
 * mounts, environment, timeout), the per-call execution result, the live
 * status view and the audit entry emitted once per execution.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <cstdint>

namespace stockade {
namespace core {

/**
 * @enum NetworkPolicy
 * @brief Declarative network access granted to a sandboxed process
 */
enum class NetworkPolicy {
    NONE,       ///< No network access
    INTERNAL,   ///< Internal network only
    LIMITED,    ///< Limited external access
    FULL        ///< Unrestricted network access
};

/**
 * @enum SandboxStatus
 * @brief Lifecycle state of a sandbox execution
 *
 * IDLE -> RUNNING -> {COMPLETED, FAILED, TIMEOUT, KILLED} -> (cleanup) -> IDLE
 */
enum class SandboxStatus {
    IDLE,        ///< Nothing in flight
    RUNNING,     ///< Container created or running
    COMPLETED,   ///< Command exited with code 0
    FAILED,      ///< Nonzero exit, rejected input or runtime error
    TIMEOUT,     ///< Killed after exceeding the configured timeout
    KILLED       ///< Killed on request (StopExecution)
};

/// Exit code reported for a container killed with SIGKILL
constexpr int kKilledExitCode = 137;

/**
 * @struct ResourceLimits
 * @brief Optional runtime-enforced resource ceilings
 *
 * Every field is optional. An absent field leaves the runtime default in
 * place. A present field must be positive.
 */
struct ResourceLimits {
    std::optional<std::int64_t> memory_bytes;        ///< Memory limit in bytes
    std::optional<std::int64_t> memory_swap_bytes;   ///< Memory + swap limit in bytes
    std::optional<std::int64_t> cpu_quota_us;        ///< CPU quota (microseconds)
    std::optional<std::int64_t> cpu_period_us;       ///< CPU period (microseconds)
    std::optional<std::int64_t> pids_limit;          ///< Max process count
};

/**
 * @struct MountSpec
 * @brief Host directory bind-mounted into the sandbox
 */
struct MountSpec {
    std::string host_path;         ///< Path on the host
    std::string container_path;    ///< Path inside the container
    bool read_only{true};          ///< Mount read-only
};

/**
 * @struct SandboxConfig
 * @brief Sandbox policy, fixed for the lifetime of an executor
 */
struct SandboxConfig {
    std::string image{"stockade-sandbox:latest"};        ///< Container image reference
    NetworkPolicy network_policy{NetworkPolicy::NONE};   ///< Network isolation level
    std::chrono::milliseconds timeout{30000};            ///< Wall-clock timeout
    std::string working_dir{"/workspace"};               ///< Working directory in container

    std::optional<ResourceLimits> resource_limits;                 ///< Resource ceilings
    std::optional<std::map<std::string, std::string>> environment; ///< Environment variables
    std::optional<std::vector<MountSpec>> mounts;                  ///< Bind mounts

    bool pull_missing_image{false};   ///< Pull the image before creating if absent
};

/**
 * @struct ExecutionResult
 * @brief Outcome of one Execute() call
 */
struct ExecutionResult {
    SandboxStatus status{SandboxStatus::IDLE};   ///< Final status
    std::optional<int> exit_code;                ///< Empty if the process never reported one
    std::string stdout_output;                   ///< Captured standard output
    std::string stderr_output;                   ///< Captured standard error
    std::chrono::milliseconds duration{0};       ///< Wall-clock duration
    std::optional<std::string> container_id;     ///< Runtime container id
    std::optional<std::string> error;            ///< Human-readable error
};

/**
 * @struct SandboxStatusInfo
 * @brief Live view of an executor, overwritten at each phase transition
 */
struct SandboxStatusInfo {
    std::optional<std::string> container_id;
    SandboxStatus status{SandboxStatus::IDLE};
    std::optional<std::string> command;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    std::optional<std::chrono::milliseconds> duration;
};

/**
 * @struct ExecutionContext
 * @brief Caller identity attached to the audit entry
 */
struct ExecutionContext {
    std::optional<std::string> user_id;
    std::optional<std::string> session_id;
};

/**
 * @struct SandboxAuditEntry
 * @brief Summary of one execution, emitted on every path
 */
struct SandboxAuditEntry {
    std::chrono::system_clock::time_point timestamp;   ///< Emission time
    std::string container_id;                          ///< Empty if no container was created
    std::string command;                               ///< Command text as submitted
    SandboxStatus status{SandboxStatus::IDLE};         ///< Final status
    std::optional<int> exit_code;                      ///< Exit code if reported
    std::chrono::milliseconds duration{0};             ///< Wall-clock duration
    std::string stdout_output;                         ///< Captured standard output
    std::string stderr_output;                         ///< Captured standard error
    std::optional<std::string> error;                  ///< Error, if any
    std::optional<std::string> user_id;                ///< Caller user id
    std::optional<std::string> session_id;             ///< Caller session id
};

std::string ToString(NetworkPolicy policy);
std::string ToString(SandboxStatus status);

/**
 * @brief Parse a network policy name ("none", "internal", "limited", "full")
 * @throws std::invalid_argument on unknown names
 */
NetworkPolicy ParseNetworkPolicy(const std::string& name);

/**
 * @brief Parse a status name as produced by ToString(SandboxStatus)
 * @throws std::invalid_argument on unknown names
 */
SandboxStatus ParseSandboxStatus(const std::string& name);

/**
 * @brief Validate a sandbox configuration
 *
 * Checks a positive timeout, a non-empty image and working directory,
 * positive resource limits, non-empty mount paths and non-empty
 * environment keys.
 *
 * @throws std::invalid_argument describing the first invalid field
 */
void ValidateConfig(const SandboxConfig& config);

} // namespace core
} // namespace stockade
