/**
 * @file jsonl_audit_log.hpp
 * @brief Append-only, hash-chained JSON Lines audit log
 *
 * Every line is one JSON object describing an execution. Each object carries
 * the hash of the previous line and its own hash, so editing, removing or
 * reordering lines breaks the chain:
 *
 * ```
 * hash(n) = SHA-256( JSON(entry(n) + {"previous_hash": hash(n-1)}) )
 * hash(0 - 1) = ""
 * ```
 *
 * JSON is serialized with keys in sorted order, which makes the hashed text
 * reproducible by the verifier.
 *
 * **Usage Example**:
 * @code
 * auto log = std::make_shared<JsonlAuditLog>("audit.jsonl");
 * SandboxExecutor executor(config, runtime, log);
 * executor.Execute("id");
 *
 * auto report = VerifyAuditLog("audit.jsonl");
 * if (!report.valid) {
 *     spdlog::error("Audit log tampered at line {}", *report.first_invalid_line);
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "stockade/audit/audit_sink.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace stockade {
namespace audit {

/**
 * @brief Serialize an entry (without chain fields)
 *
 * Absent optionals are written as null. Timestamps are ISO 8601 UTC.
 */
nlohmann::json AuditEntryToJson(const core::SandboxAuditEntry& entry);

/**
 * @brief Hash of a line object, ignoring its "hash" field
 */
std::string ComputeEntryHash(const nlohmann::json& line);

/**
 * @class JsonlAuditLog
 * @brief AuditSink appending hash-chained lines to a file
 *
 * Thread-safe. Opening an existing file continues its chain.
 */
class JsonlAuditLog : public AuditSink {
public:
    /**
     * @brief Open (or create) the log
     * @throws std::runtime_error if the file cannot be opened or its last
     *         line is not a chained entry
     */
    explicit JsonlAuditLog(const std::filesystem::path& path);
    ~JsonlAuditLog() override;

    JsonlAuditLog(const JsonlAuditLog&) = delete;
    JsonlAuditLog& operator=(const JsonlAuditLog&) = delete;

    /**
     * @brief Append one entry and flush
     * @throws std::runtime_error on write failure
     */
    void Record(const core::SandboxAuditEntry& entry) override;

    /**
     * @brief Hash of the most recent line ("" for an empty log)
     */
    std::string LastHash() const;

    const std::filesystem::path& GetPath() const { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream out_;
    std::string last_hash_;
    mutable std::mutex mutex_;
};

/**
 * @struct AuditVerification
 * @brief Outcome of a chain verification
 */
struct AuditVerification {
    bool valid{false};
    std::size_t entries{0};                       ///< Lines checked successfully
    std::optional<std::size_t> first_invalid_line; ///< 1-based line number
    std::string message;
};

/**
 * @brief Recompute the chain of an audit log
 *
 * Blank lines are skipped. A missing file is reported as invalid.
 */
AuditVerification VerifyAuditLog(const std::filesystem::path& path);

} // namespace audit
} // namespace stockade
