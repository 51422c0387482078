#pragma once

#include <string>
#include <string_view>

namespace llmshield {

/**
 * @brief Fallback output for audit events the durable store could not take
 *
 * Receives one serialized JSON line per event. May be called from several
 * request threads at once; implementations lock internally.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Write a single JSON-serialized audit event. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view json_line) = 0;

    virtual void flush() = 0;

    /// Human-readable sink name for logging (e.g. "file:/var/log/llmshield/audit.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace llmshield
