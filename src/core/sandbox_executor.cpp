/**
 * @file sandbox_executor.cpp
 * @brief Implementation of sandboxed command execution
 *
 * **Timeout Race**:
 * ```
 * caller thread                         waiter thread (detached)
 * ─────────────                         ────────────────────────
 * Start()
 * spawn waiter ───────────────────────> container->Wait() (blocks)
 * wait_until(deadline | stop | exit)
 *   │                                     │ exit
 *   │                                     ├─ resolved.exchange(true)
 *   │ <──────────── notify ────────────── └─ store result
 *   │ deadline/stop
 *   ├─ resolved.exchange(true)
 *   └─ KillContainer ──────────────────> Wait() returns, result discarded
 * ```
 *
 * Whichever side flips `resolved` first owns the outcome. The waiter holds
 * shared ownership of the race state and the container handle, so a late
 * completion after Execute() has returned is harmless.
 *
 * @date 2025
 */

#include "stockade/core/sandbox_executor.hpp"
#include "stockade/core/policy_translator.hpp"
#include "stockade/runtime/docker_client.hpp"
#include "stockade/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <thread>

namespace stockade {
namespace core {

namespace {

std::string ShortId(const std::string& container_id) {
    return container_id.substr(0, 12);
}

std::chrono::milliseconds ElapsedSince(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
}

// now + timeout, clamped to time_point::max() instead of overflowing
std::chrono::steady_clock::time_point DeadlineAfter(std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    const auto now = Clock::now();
    const auto headroom =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (timeout >= headroom) {
        return Clock::time_point::max();
    }
    return now + std::chrono::duration_cast<Clock::duration>(timeout);
}

} // anonymous namespace

struct SandboxExecutor::RaceState {
    std::mutex mutex;
    std::condition_variable cv;
    std::atomic<bool> resolved{false};

    // Guarded by mutex
    bool wait_done{false};
    bool stop_requested{false};
    std::optional<runtime::WaitResult> wait_result;
    std::exception_ptr wait_error;
};

// Constructor
SandboxExecutor::SandboxExecutor(SandboxConfig config,
                                 std::shared_ptr<runtime::ContainerRuntime> runtime,
                                 std::shared_ptr<audit::AuditSink> audit_sink)
    : config_(std::move(config))
    , runtime_(std::move(runtime))
    , audit_sink_(std::move(audit_sink)) {

    ValidateConfig(config_);

    if (!runtime_) {
        runtime_ = std::make_shared<runtime::DockerClient>();
    }

    spdlog::debug("Sandbox executor initialized");
    spdlog::debug("Image: {}", config_.image);
    spdlog::debug("Network policy: {}", ToString(config_.network_policy));
    spdlog::debug("Timeout: {}ms", config_.timeout.count());
}

// Destructor
SandboxExecutor::~SandboxExecutor() {
    Cleanup();
}

// Execute command in sandbox
ExecutionResult SandboxExecutor::Execute(const std::string& command,
                                         const ExecutionContext& context) {
    const auto started = std::chrono::steady_clock::now();
    ExecutionResult result;

    if (utils::StringUtils::IsBlank(command)) {
        result.status = SandboxStatus::FAILED;
        result.error = "Command cannot be empty";
        spdlog::warn("Rejected sandbox execution: {}", *result.error);
        result.duration = ElapsedSince(started);
        EmitAudit(MakeAuditEntry(command, context, result));
        return result;
    }

    if (!runtime_->IsAvailable()) {
        result.status = SandboxStatus::FAILED;
        result.error = "Container runtime is not available";
        spdlog::error("{}", *result.error);
        result.duration = ElapsedSince(started);
        EmitAudit(MakeAuditEntry(command, context, result));
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_ = SandboxStatusInfo{};
        status_.status = SandboxStatus::RUNNING;
        status_.command = command;
        status_.start_time = std::chrono::system_clock::now();
    }

    spdlog::info("Executing in sandbox: {}", utils::StringUtils::Truncate(command, 80));

    try {
        RunContainer(command, result);
    }
    catch (const std::exception& e) {
        spdlog::error("Sandbox execution failed: {}", e.what());
        result.status = SandboxStatus::FAILED;
        result.exit_code.reset();
        result.error = e.what();
    }

    result.duration = ElapsedSince(started);

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        current_race_.reset();
        status_.status = result.status;
        status_.end_time = std::chrono::system_clock::now();
        status_.duration = result.duration;
    }

    EmitAudit(MakeAuditEntry(command, context, result));
    RemoveTrackedContainer();

    spdlog::info("Sandbox execution finished: status={} exit_code={} duration={}ms",
                 ToString(result.status),
                 result.exit_code ? std::to_string(*result.exit_code) : "none",
                 result.duration.count());

    return result;
}

// Execute command asynchronously
std::future<ExecutionResult> SandboxExecutor::ExecuteAsync(const std::string& command,
                                                           const ExecutionContext& context) {
    return std::async(std::launch::async, [this, command, context]() {
        return Execute(command, context);
    });
}

void SandboxExecutor::RunContainer(const std::string& command, ExecutionResult& result) {
    auto spec = PolicyTranslator::BuildContainerSpec(config_, command);

    if (config_.pull_missing_image) {
        runtime_->PullImage(config_.image);
    }

    auto container = runtime_->CreateContainer(spec);
    const std::string container_id = container->Id();
    result.container_id = container_id;

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        current_container_ = container;
        status_.container_id = container_id;
    }
    spdlog::info("Container created: {}", ShortId(container_id));

    container->Start();
    spdlog::info("Container started: {}", ShortId(container_id));

    auto race = std::make_shared<RaceState>();
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        current_race_ = race;
    }

    std::thread waiter([race, container]() {
        std::optional<runtime::WaitResult> wait_result;
        std::exception_ptr wait_error;
        try {
            wait_result = container->Wait();
        }
        catch (...) {
            wait_error = std::current_exception();
        }

        // Late completion after a timeout or stop: the caller has moved on
        if (race->resolved.exchange(true)) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(race->mutex);
            race->wait_result = wait_result;
            race->wait_error = wait_error;
            race->wait_done = true;
        }
        race->cv.notify_all();
    });
    waiter.detach();

    const auto deadline = DeadlineAfter(config_.timeout);
    bool exited = false;
    bool stopped = false;
    {
        std::unique_lock<std::mutex> lock(race->mutex);
        race->cv.wait_until(lock, deadline, [&race] {
            return race->wait_done || race->stop_requested;
        });
        exited = race->wait_done;
        stopped = race->stop_requested;
    }

    if (!exited && race->resolved.exchange(true)) {
        // The waiter resolved between the deadline and our exchange
        std::unique_lock<std::mutex> lock(race->mutex);
        race->cv.wait(lock, [&race] { return race->wait_done; });
        exited = true;
    }

    if (exited) {
        if (race->wait_error) {
            std::rethrow_exception(race->wait_error);
        }

        const int exit_code = race->wait_result->exit_code;
        auto logs = container->Logs();

        result.exit_code = exit_code;
        result.stdout_output = std::move(logs.stdout_output);
        result.stderr_output = std::move(logs.stderr_output);
        result.status = exit_code == 0 ? SandboxStatus::COMPLETED : SandboxStatus::FAILED;

        spdlog::info("Container {} exited with code {}", ShortId(container_id), exit_code);
        return;
    }

    if (stopped) {
        spdlog::warn("Stopping sandbox execution: {}", ShortId(container_id));
    } else {
        spdlog::warn("Command exceeded timeout of {}ms, killing {}",
                     config_.timeout.count(), ShortId(container_id));
    }

    KillQuietly(container_id);

    try {
        auto logs = container->Logs();
        result.stdout_output = std::move(logs.stdout_output);
        result.stderr_output = std::move(logs.stderr_output);
    }
    catch (const std::exception& e) {
        spdlog::debug("Log retrieval after kill failed for {}: {}", ShortId(container_id), e.what());
    }

    result.exit_code = kKilledExitCode;
    if (stopped) {
        result.status = SandboxStatus::KILLED;
        result.error = "Execution was stopped";
    } else {
        result.status = SandboxStatus::TIMEOUT;
        result.error = fmt::format("Command exceeded timeout of {}ms", config_.timeout.count());
    }
}

SandboxAuditEntry SandboxExecutor::MakeAuditEntry(const std::string& command,
                                                  const ExecutionContext& context,
                                                  const ExecutionResult& result) const {
    SandboxAuditEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.container_id = result.container_id.value_or("");
    entry.command = command;
    entry.status = result.status;
    entry.exit_code = result.exit_code;
    entry.duration = result.duration;
    entry.stdout_output = result.stdout_output;
    entry.stderr_output = result.stderr_output;
    entry.error = result.error;
    entry.user_id = context.user_id;
    entry.session_id = context.session_id;
    return entry;
}

// Stop currently executing sandbox
bool SandboxExecutor::StopExecution() {
    std::shared_ptr<RaceState> race;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        race = current_race_;
    }

    if (!race || race->resolved.load()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(race->mutex);
        race->stop_requested = true;
    }
    race->cv.notify_all();
    return true;
}

// Clean up sandbox artifacts
void SandboxExecutor::Cleanup() {
    RemoveTrackedContainer();

    std::lock_guard<std::mutex> lock(status_mutex_);
    status_ = SandboxStatusInfo{};
}

SandboxStatusInfo SandboxExecutor::GetStatus() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

void SandboxExecutor::KillQuietly(const std::string& container_id) {
    try {
        runtime_->KillContainer(container_id);
    }
    catch (const std::exception& e) {
        spdlog::warn("Failed to kill container {}: {}", ShortId(container_id), e.what());
    }
}

void SandboxExecutor::RemoveTrackedContainer() {
    std::shared_ptr<runtime::Container> container;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        container.swap(current_container_);
    }

    if (!container) {
        return;
    }

    try {
        runtime_->RemoveContainer(container->Id());
        spdlog::debug("Container removed: {}", ShortId(container->Id()));
    }
    catch (const std::exception& e) {
        spdlog::warn("Failed to remove container {}: {}", ShortId(container->Id()), e.what());
    }
}

void SandboxExecutor::EmitAudit(const SandboxAuditEntry& entry) {
    if (!audit_sink_) {
        return;
    }

    try {
        audit_sink_->Record(entry);
    }
    catch (const std::exception& e) {
        spdlog::warn("Audit sink failed: {}", e.what());
    }
}

} // namespace core
} // namespace stockade
