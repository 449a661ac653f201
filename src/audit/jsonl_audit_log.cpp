/**
 * @file jsonl_audit_log.cpp
 * @brief Implementation of the hash-chained JSON Lines audit log
 *
 * @date 2025
 */

#include "stockade/audit/jsonl_audit_log.hpp"
#include "stockade/utils/hash_utils.hpp"
#include "stockade/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

using json = nlohmann::json;

namespace stockade {
namespace audit {

namespace {

template <typename T>
json OptionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

std::string Dump(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Last non-blank line of a file, empty if none
std::string ReadLastLine(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return {};
    }

    std::string line;
    std::string last;
    while (std::getline(in, line)) {
        if (!utils::StringUtils::IsBlank(line)) {
            last = line;
        }
    }
    return last;
}

} // anonymous namespace

json AuditEntryToJson(const core::SandboxAuditEntry& entry) {
    return json{
        {"timestamp", utils::StringUtils::FormatTimestamp(entry.timestamp)},
        {"container_id", entry.container_id},
        {"command", entry.command},
        {"status", core::ToString(entry.status)},
        {"exit_code", OptionalToJson(entry.exit_code)},
        {"duration_ms", entry.duration.count()},
        {"stdout", entry.stdout_output},
        {"stderr", entry.stderr_output},
        {"error", OptionalToJson(entry.error)},
        {"user_id", OptionalToJson(entry.user_id)},
        {"session_id", OptionalToJson(entry.session_id)}
    };
}

std::string ComputeEntryHash(const json& line) {
    json unhashed = line;
    unhashed.erase("hash");
    return utils::HashUtils::ComputeSHA256(Dump(unhashed));
}

// Constructor
JsonlAuditLog::JsonlAuditLog(const std::filesystem::path& path)
    : path_(path) {

    if (std::filesystem::exists(path_)) {
        const auto last = ReadLastLine(path_);
        if (!last.empty()) {
            try {
                last_hash_ = json::parse(last).at("hash").get<std::string>();
            }
            catch (const json::exception& e) {
                throw std::runtime_error("Audit log " + path_.string() +
                                         " has an unreadable last entry: " + e.what());
            }
        }
    }

    out_.open(path_, std::ios::app);
    if (!out_.is_open()) {
        throw std::runtime_error("Failed to open audit log: " + path_.string());
    }

    spdlog::debug("Audit log opened: {} (chain head '{}')", path_.string(), last_hash_);
}

JsonlAuditLog::~JsonlAuditLog() = default;

void JsonlAuditLog::Record(const core::SandboxAuditEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto line = AuditEntryToJson(entry);
    line["previous_hash"] = last_hash_;
    auto hash = ComputeEntryHash(line);
    line["hash"] = hash;

    out_ << Dump(line) << '\n';
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Failed to write audit log: " + path_.string());
    }

    last_hash_ = std::move(hash);
}

std::string JsonlAuditLog::LastHash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_hash_;
}

AuditVerification VerifyAuditLog(const std::filesystem::path& path) {
    AuditVerification report;

    std::ifstream in(path);
    if (!in.is_open()) {
        report.message = "Cannot open audit log: " + path.string();
        return report;
    }

    auto fail = [&report](std::size_t line_number, const std::string& reason) {
        report.valid = false;
        report.first_invalid_line = line_number;
        report.message = "Line " + std::to_string(line_number) + ": " + reason;
        return report;
    };

    std::string previous_hash;
    std::string text;
    std::size_t line_number = 0;

    while (std::getline(in, text)) {
        ++line_number;
        if (utils::StringUtils::IsBlank(text)) {
            continue;
        }

        json line;
        try {
            line = json::parse(text);
        }
        catch (const json::parse_error& e) {
            return fail(line_number, std::string("not valid JSON (") + e.what() + ")");
        }

        if (!line.is_object() ||
            !line.contains("hash") || !line["hash"].is_string() ||
            !line.contains("previous_hash") || !line["previous_hash"].is_string()) {
            return fail(line_number, "missing chain fields");
        }

        if (line["previous_hash"].get<std::string>() != previous_hash) {
            return fail(line_number, "previous_hash does not match preceding entry");
        }

        const auto recorded = line["hash"].get<std::string>();
        if (!utils::HashUtils::DigestEquals(ComputeEntryHash(line), recorded)) {
            return fail(line_number, "hash mismatch");
        }

        previous_hash = recorded;
        ++report.entries;
    }

    report.valid = true;
    report.message = "Chain intact (" + std::to_string(report.entries) + " entries)";
    return report;
}

} // namespace audit
} // namespace stockade
