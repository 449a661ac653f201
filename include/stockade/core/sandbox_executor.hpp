/**
 * @file sandbox_executor.hpp
 * @brief Runs shell commands in disposable, isolated containers
 *
 * The executor owns the container lifecycle for one command at a time:
 * validate, probe the runtime, translate policy, create, start, race the
 * container wait against the deadline, collect output, audit, remove.
 *
 * **Lifecycle**:
 * ```
 * IDLE ──Execute──> RUNNING ──┬── exit 0 ────────> COMPLETED
 *                             ├── exit != 0/error -> FAILED
 *                             ├── deadline ───────> TIMEOUT  (kill, 137)
 *                             └── StopExecution ──> KILLED   (kill, 137)
 *                                                      │
 *                                   Cleanup() ─────────┴──> IDLE
 * ```
 *
 * A container is created per call and removed before Execute() returns,
 * whatever the outcome. Execute() never throws; failures are reported in
 * the returned ExecutionResult.
 *
 * @date 2025
 */

#pragma once

#include "stockade/core/types.hpp"
#include "stockade/runtime/container_runtime.hpp"
#include "stockade/audit/audit_sink.hpp"

#include <string>
#include <memory>
#include <mutex>
#include <future>
#include <chrono>

namespace stockade {
namespace core {

/**
 * @class SandboxExecutor
 * @brief Sandboxed command execution with timeout enforcement
 *
 * Not meant for concurrent Execute() calls on one instance; use one executor
 * per in-flight command. GetStatus() and StopExecution() may be called from
 * any thread.
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxBuilder()
 *     .WithImage("alpine:3.19")
 *     .WithTimeout(std::chrono::seconds(10))
 *     .WithMemoryLimit(256 * 1024 * 1024)
 *     .Build();
 *
 * SandboxExecutor executor(config);
 * auto result = executor.Execute("uname -a");
 * if (result.status == SandboxStatus::COMPLETED) {
 *     std::cout << result.stdout_output;
 * }
 * @endcode
 */
class SandboxExecutor {
public:
    /**
     * @brief Construct executor
     * @param config Sandbox policy
     * @param runtime Container runtime (Docker client if null)
     * @param audit_sink Receiver of audit entries (none if null)
     * @throws std::invalid_argument if config is invalid
     */
    explicit SandboxExecutor(SandboxConfig config = {},
                             std::shared_ptr<runtime::ContainerRuntime> runtime = nullptr,
                             std::shared_ptr<audit::AuditSink> audit_sink = nullptr);

    /**
     * @brief Destructor, removes any tracked container
     */
    ~SandboxExecutor();

    SandboxExecutor(const SandboxExecutor&) = delete;
    SandboxExecutor& operator=(const SandboxExecutor&) = delete;

    /**
     * @brief Run a command to completion, timeout or stop
     * @param command Shell command, run as `/bin/sh -c command`
     * @param context Caller identity copied into the audit entry
     * @return Execution result (never throws)
     */
    ExecutionResult Execute(const std::string& command,
                            const ExecutionContext& context = {});

    /**
     * @brief Run Execute() on a background task
     */
    std::future<ExecutionResult> ExecuteAsync(const std::string& command,
                                              const ExecutionContext& context = {});

    /**
     * @brief Kill the in-flight container
     *
     * The pending Execute() returns KILLED with exit code 137.
     *
     * @return false if no container is currently being waited on
     */
    bool StopExecution();

    /**
     * @brief Remove any tracked container and reset status to IDLE
     *
     * Never throws.
     */
    void Cleanup();

    /**
     * @brief Snapshot of the current status
     */
    SandboxStatusInfo GetStatus() const;

    const SandboxConfig& GetConfig() const { return config_; }

private:
    struct RaceState;

    SandboxConfig config_;
    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    std::shared_ptr<audit::AuditSink> audit_sink_;

    mutable std::mutex status_mutex_;
    SandboxStatusInfo status_;
    std::shared_ptr<runtime::Container> current_container_;
    std::shared_ptr<RaceState> current_race_;

    void RunContainer(const std::string& command, ExecutionResult& result);

    SandboxAuditEntry MakeAuditEntry(const std::string& command,
                                     const ExecutionContext& context,
                                     const ExecutionResult& result) const;

    void KillQuietly(const std::string& container_id);
    void RemoveTrackedContainer();
    void EmitAudit(const SandboxAuditEntry& entry);
};

/**
 * @class SandboxBuilder
 * @brief Fluent API for constructing sandbox configurations
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxBuilder()
 *     .WithImage("python:3.12-slim")
 *     .WithNetworkPolicy(NetworkPolicy::NONE)
 *     .WithTimeout(std::chrono::seconds(30))
 *     .WithMemoryLimit(512 * 1024 * 1024)
 *     .WithCpuQuota(50000, 100000)
 *     .WithPidsLimit(64)
 *     .WithEnv("PYTHONUNBUFFERED", "1")
 *     .WithMount("/srv/data", "/data")
 *     .Build();
 * @endcode
 */
class SandboxBuilder {
public:
    SandboxBuilder& WithImage(const std::string& image) {
        config_.image = image;
        return *this;
    }

    SandboxBuilder& WithNetworkPolicy(NetworkPolicy policy) {
        config_.network_policy = policy;
        return *this;
    }

    SandboxBuilder& WithTimeout(std::chrono::milliseconds timeout) {
        config_.timeout = timeout;
        return *this;
    }

    SandboxBuilder& WithWorkingDir(const std::string& dir) {
        config_.working_dir = dir;
        return *this;
    }

    /**
     * @brief Set memory limit
     * @param bytes Memory limit in bytes
     */
    SandboxBuilder& WithMemoryLimit(std::int64_t bytes) {
        Limits().memory_bytes = bytes;
        return *this;
    }

    /**
     * @brief Set memory + swap limit
     * @param bytes Combined limit in bytes
     */
    SandboxBuilder& WithMemorySwapLimit(std::int64_t bytes) {
        Limits().memory_swap_bytes = bytes;
        return *this;
    }

    /**
     * @brief Set CPU bandwidth (quota per period, microseconds)
     */
    SandboxBuilder& WithCpuQuota(std::int64_t quota_us, std::int64_t period_us) {
        Limits().cpu_quota_us = quota_us;
        Limits().cpu_period_us = period_us;
        return *this;
    }

    SandboxBuilder& WithPidsLimit(std::int64_t pids) {
        Limits().pids_limit = pids;
        return *this;
    }

    SandboxBuilder& WithEnv(const std::string& key, const std::string& value) {
        if (!config_.environment) {
            config_.environment.emplace();
        }
        (*config_.environment)[key] = value;
        return *this;
    }

    SandboxBuilder& WithMount(const std::string& host_path,
                              const std::string& container_path,
                              bool read_only = true) {
        if (!config_.mounts) {
            config_.mounts.emplace();
        }
        config_.mounts->push_back(MountSpec{host_path, container_path, read_only});
        return *this;
    }

    SandboxBuilder& PullMissingImage(bool enable = true) {
        config_.pull_missing_image = enable;
        return *this;
    }

    /**
     * @brief Build and validate the configuration
     * @throws std::invalid_argument if a value is invalid
     */
    SandboxConfig Build() const {
        ValidateConfig(config_);
        return config_;
    }

private:
    SandboxConfig config_;

    ResourceLimits& Limits() {
        if (!config_.resource_limits) {
            config_.resource_limits.emplace();
        }
        return *config_.resource_limits;
    }
};

} // namespace core
} // namespace stockade
