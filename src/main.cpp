/**
 * @file main.cpp
 * @brief Stockade sandboxed command runner - Command-line interface
 *
 * Entry point for the `stockade` tool. Runs shell commands inside isolated,
 * resource-bounded containers, probes the container runtime and verifies
 * hash-chained audit logs.
 *
 * **Subcommands**:
 * - `run`           Execute a command in a sandbox
 * - `ping`          Check container runtime availability
 * - `verify-audit`  Verify an audit log's hash chain
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "stockade/core/sandbox_executor.hpp"
#include "stockade/core/config_loader.hpp"
#include "stockade/audit/jsonl_audit_log.hpp"
#include "stockade/runtime/docker_client.hpp"
#include "stockade/utils/hash_utils.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

using json = nlohmann::json;

/*******************************************************************************
 * Output Functions
 ******************************************************************************/

json ResultToJson(const stockade::core::ExecutionResult& result) {
    json j = {
        {"status", stockade::core::ToString(result.status)},
        {"exit_code", result.exit_code ? json(*result.exit_code) : json(nullptr)},
        {"stdout", result.stdout_output},
        {"stderr", result.stderr_output},
        {"duration_ms", result.duration.count()},
        {"container_id", result.container_id ? json(*result.container_id) : json(nullptr)},
        {"error", result.error ? json(*result.error) : json(nullptr)}
    };
    return j;
}

void PrintResultSummary(const stockade::core::ExecutionResult& result) {
    std::cout << result.stdout_output;
    std::cerr << result.stderr_output;

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("Status: {}", stockade::core::ToString(result.status));
    if (result.exit_code) {
        spdlog::info("Exit code: {}", *result.exit_code);
    }
    spdlog::info("Duration: {} ms", result.duration.count());
    if (result.container_id) {
        spdlog::info("Container: {}", result.container_id->substr(0, 12));
    }
    if (result.error) {
        spdlog::error("{}", *result.error);
    }
    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Stockade - run shell commands in isolated containers"};
    app.require_subcommand(1);

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // run
    auto* run_cmd = app.add_subcommand("run", "Execute a command in a sandbox");

    std::string command;
    std::string config_path;
    std::optional<std::string> image;
    std::optional<std::string> network;
    std::optional<std::int64_t> timeout_ms;
    std::optional<std::string> workdir;
    std::optional<std::int64_t> memory;
    std::optional<std::int64_t> memory_swap;
    std::optional<std::int64_t> cpu_quota;
    std::optional<std::int64_t> cpu_period;
    std::optional<std::int64_t> pids;
    std::vector<std::string> env_assignments;
    std::vector<std::string> mount_specs;
    bool pull = false;
    std::string audit_path;
    std::optional<std::string> user_id;
    std::optional<std::string> session_id;
    bool json_output = false;

    run_cmd->add_option("command", command, "Shell command to run (/bin/sh -c)")->required();
    run_cmd->add_option("-c,--config", config_path, "Sandbox config file (JSON)")
        ->check(CLI::ExistingFile);
    run_cmd->add_option("--image", image, "Container image");
    run_cmd->add_option("--network", network, "Network policy: none, internal, limited, full");
    run_cmd->add_option("--timeout", timeout_ms, "Timeout in milliseconds");
    run_cmd->add_option("--workdir", workdir, "Working directory inside the container");
    run_cmd->add_option("--memory", memory, "Memory limit in bytes");
    run_cmd->add_option("--memory-swap", memory_swap, "Memory + swap limit in bytes");
    run_cmd->add_option("--cpu-quota", cpu_quota, "CPU quota in microseconds");
    run_cmd->add_option("--cpu-period", cpu_period, "CPU period in microseconds");
    run_cmd->add_option("--pids", pids, "Maximum number of processes");
    run_cmd->add_option("-e,--env", env_assignments, "Environment variable KEY=VALUE");
    run_cmd->add_option("-m,--mount", mount_specs, "Bind mount host:container[:ro|rw]");
    run_cmd->add_flag("--pull", pull, "Pull the image if it is missing");
    run_cmd->add_option("--audit-log", audit_path, "Append an audit entry to this JSONL file");
    run_cmd->add_option("--user", user_id, "User id recorded in the audit entry");
    run_cmd->add_option("--session", session_id, "Session id recorded in the audit entry");
    run_cmd->add_flag("--json", json_output, "Print the result as JSON");

    // ping
    auto* ping_cmd = app.add_subcommand("ping", "Check container runtime availability");

    // verify-audit
    auto* verify_cmd = app.add_subcommand("verify-audit", "Verify an audit log hash chain");
    std::string verify_path;
    verify_cmd->add_option("file", verify_path, "Audit log file")
        ->required()
        ->check(CLI::ExistingFile);

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        if (*ping_cmd) {
            stockade::runtime::DockerClient docker;
            if (!docker.IsAvailable()) {
                spdlog::error("Container runtime is not available at {}",
                              docker.GetOptions().socket_path);
                return 1;
            }
            spdlog::info("Container runtime is available (version {})", docker.GetVersion());
            return 0;
        }

        if (*verify_cmd) {
            auto report = stockade::audit::VerifyAuditLog(verify_path);
            if (!report.valid) {
                spdlog::error("{}", report.message);
                return 1;
            }
            spdlog::info("{}", report.message);
            spdlog::info("File SHA-256: {}",
                         stockade::utils::HashUtils::ComputeFileSHA256(verify_path));
            return 0;
        }

        // run
        stockade::core::SandboxConfig config;
        if (!config_path.empty()) {
            config = stockade::core::LoadSandboxConfig(config_path);
        }

        if (image) config.image = *image;
        if (network) config.network_policy = stockade::core::ParseNetworkPolicy(*network);
        if (timeout_ms) config.timeout = std::chrono::milliseconds(*timeout_ms);
        if (workdir) config.working_dir = *workdir;
        if (pull) config.pull_missing_image = true;

        if (memory || memory_swap || cpu_quota || cpu_period || pids) {
            auto& limits = config.resource_limits ? *config.resource_limits
                                                  : config.resource_limits.emplace();
            if (memory) limits.memory_bytes = memory;
            if (memory_swap) limits.memory_swap_bytes = memory_swap;
            if (cpu_quota) limits.cpu_quota_us = cpu_quota;
            if (cpu_period) limits.cpu_period_us = cpu_period;
            if (pids) limits.pids_limit = pids;
        }

        for (const auto& assignment : env_assignments) {
            auto [key, value] = stockade::core::ParseEnvAssignment(assignment);
            if (!config.environment) {
                config.environment.emplace();
            }
            (*config.environment)[key] = value;
        }

        for (const auto& text : mount_specs) {
            if (!config.mounts) {
                config.mounts.emplace();
            }
            config.mounts->push_back(stockade::core::ParseMountSpec(text));
        }

        std::shared_ptr<stockade::audit::AuditSink> audit_sink;
        if (!audit_path.empty()) {
            audit_sink = std::make_shared<stockade::audit::JsonlAuditLog>(audit_path);
        }

        stockade::core::SandboxExecutor executor(config, nullptr, audit_sink);
        auto result = executor.Execute(command, stockade::core::ExecutionContext{user_id, session_id});

        if (json_output) {
            std::cout << ResultToJson(result).dump(2, ' ', false, json::error_handler_t::replace)
                      << std::endl;
        } else {
            PrintResultSummary(result);
        }

        return result.exit_code ? *result.exit_code : 1;

    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid argument: {}", e.what());
        return 2;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
