/**
 * @file container_runtime.hpp
 * @brief Abstraction over an external container engine
 *
 * Narrow interface covering the container lifecycle needed by the sandbox
 * executor: availability probe, image pull-if-absent, create, start, wait,
 * log retrieval, kill and removal. Implementations must be safe for
 * concurrent use by several executors.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <stdexcept>
#include <cstdint>

namespace stockade {
namespace runtime {

/**
 * @enum ErrorKind
 * @brief Classification of container runtime failures
 */
enum class ErrorKind {
    NOT_FOUND,       ///< Container or image does not exist (HTTP 404)
    CONFLICT,        ///< Operation conflicts with container state (HTTP 409)
    BAD_REQUEST,     ///< Rejected request (other HTTP 4xx)
    SERVER,          ///< Engine internal error (HTTP 5xx)
    CONNECTION,      ///< Engine unreachable / transport failure
    PROTOCOL,        ///< Malformed or unexpected response
    PULL_FAILED,     ///< Image pull request rejected
    PULL_PROGRESS    ///< Error reported inside the pull progress stream
};

std::string ToString(ErrorKind kind);

/**
 * @class RuntimeError
 * @brief Container runtime failure tagged with its kind and HTTP status
 */
class RuntimeError : public std::runtime_error {
public:
    RuntimeError(ErrorKind kind, const std::string& message,
                 std::optional<long> status_code = std::nullopt);

    ErrorKind Kind() const noexcept { return kind_; }
    std::optional<long> StatusCode() const noexcept { return status_code_; }
    bool IsNotFound() const noexcept { return kind_ == ErrorKind::NOT_FOUND; }

private:
    ErrorKind kind_;
    std::optional<long> status_code_;
};

/**
 * @brief Map an HTTP status code to an error kind
 */
ErrorKind ClassifyStatus(long status_code);

/**
 * @struct HostConfig
 * @brief Host-side container settings (isolation, limits, mounts)
 */
struct HostConfig {
    std::string network_mode{"none"};            ///< Runtime network mode
    std::optional<std::int64_t> memory;          ///< Memory limit (bytes)
    std::optional<std::int64_t> memory_swap;     ///< Memory + swap limit (bytes)
    std::optional<std::int64_t> cpu_quota;       ///< CPU quota (us)
    std::optional<std::int64_t> cpu_period;      ///< CPU period (us)
    std::optional<std::int64_t> pids_limit;      ///< Process limit
    bool readonly_rootfs{true};                  ///< Read-only root filesystem
    std::vector<std::string> binds;              ///< "host:container:mode" entries
    bool auto_remove{false};                     ///< Let the engine remove on exit

    bool operator==(const HostConfig& other) const;
    bool operator!=(const HostConfig& other) const { return !(*this == other); }
};

/**
 * @struct ContainerSpec
 * @brief Fully-resolved container creation request
 */
struct ContainerSpec {
    std::string image;                               ///< Image reference
    std::vector<std::string> cmd;                    ///< Command argv
    std::optional<std::vector<std::string>> env;     ///< KEY=VALUE list, absent when empty
    std::string working_dir;                         ///< Working directory
    HostConfig host_config;                          ///< Host configuration block

    bool operator==(const ContainerSpec& other) const;
    bool operator!=(const ContainerSpec& other) const { return !(*this == other); }
};

/**
 * @brief Serialize a spec to the engine's container-create JSON body
 */
std::string ToJsonString(const ContainerSpec& spec);

/// Exit status reported by a finished container
struct WaitResult {
    int exit_code{0};
};

/// Demultiplexed container output
struct LogOutput {
    std::string stdout_output;
    std::string stderr_output;
};

/**
 * @struct ContainerState
 * @brief Snapshot of a container's state as reported by inspect
 */
struct ContainerState {
    bool running{false};
    int exit_code{0};
    std::string started_at;    ///< RFC 3339 timestamp as reported by the engine
    std::string finished_at;   ///< RFC 3339 timestamp as reported by the engine
};

/**
 * @class Container
 * @brief Handle to one created container
 */
class Container {
public:
    virtual ~Container() = default;

    virtual const std::string& Id() const = 0;

    virtual void Start() = 0;

    /**
     * @brief Block until the container's process exits
     * @return Exit status
     */
    virtual WaitResult Wait() = 0;

    /**
     * @brief Retrieve stdout and stderr collected so far
     */
    virtual LogOutput Logs() = 0;

    /**
     * @brief Force-remove the container
     */
    virtual void Remove() = 0;

    virtual ContainerState Inspect() = 0;
};

/**
 * @class ContainerRuntime
 * @brief Client for an external container engine
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /**
     * @brief Ping the engine
     * @return false on any connection failure (never throws)
     */
    virtual bool IsAvailable() = 0;

    /**
     * @brief Pull an image unless it already exists locally
     *
     * Blocks until the pull completes.
     *
     * @throws RuntimeError PULL_FAILED if the pull request fails,
     *         PULL_PROGRESS if the progress stream reports an error
     */
    virtual void PullImage(const std::string& image_ref) = 0;

    /**
     * @brief Create (but do not start) a container
     */
    virtual std::shared_ptr<Container> CreateContainer(const ContainerSpec& spec) = 0;

    /**
     * @brief Force-remove a container by id; not-found is ignored
     */
    virtual void RemoveContainer(const std::string& container_id) = 0;

    /**
     * @brief Kill a container by id; not-found is ignored
     */
    virtual void KillContainer(const std::string& container_id) = 0;
};

} // namespace runtime
} // namespace stockade
