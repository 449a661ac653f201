/**
 * @file audit_sink.hpp
 * @brief Destination for per-execution audit entries
 *
 * @date 2025
 */

#pragma once

#include "stockade/core/types.hpp"

#include <functional>
#include <utility>

namespace stockade {
namespace audit {

/**
 * @class AuditSink
 * @brief Receives exactly one entry per execution
 *
 * Implementations may throw; the executor logs and discards the failure.
 * A sink shared between executors must be thread-safe.
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void Record(const core::SandboxAuditEntry& entry) = 0;
};

/**
 * @class CallbackAuditSink
 * @brief Forwards entries to a callable
 */
class CallbackAuditSink : public AuditSink {
public:
    using Callback = std::function<void(const core::SandboxAuditEntry&)>;

    explicit CallbackAuditSink(Callback callback)
        : callback_(std::move(callback)) {}

    void Record(const core::SandboxAuditEntry& entry) override {
        if (callback_) {
            callback_(entry);
        }
    }

private:
    Callback callback_;
};

} // namespace audit
} // namespace stockade
