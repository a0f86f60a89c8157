#pragma once

#include <string>
#include <string_view>

namespace piishield {

/**
 * @brief Destination for vault audit lines
 *
 * AuditLog hands every sink one newline-terminated JSON object per event,
 * in sequence order, while holding its own lock. A sink therefore never
 * sees two callers at once.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Persist one event line. False (or a throw) counts as a sink failure.
    [[nodiscard]] virtual bool write(std::string_view json_line) = 0;

    virtual void flush() = 0;

    /// Release handles; no writes follow
    virtual void shutdown() = 0;

    /// Shown in log lines, e.g. "file:/var/log/pii/audit.jsonl"
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace piishield
