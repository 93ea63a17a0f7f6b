#pragma once

#include <string>
#include <string_view>

namespace privgate {

/**
 * @brief Abstract interface for audit output destinations
 *
 * AuditWriter serializes calls, so implementations need no locking.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Write already-rendered audit lines. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view data) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Graceful shutdown (flush, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:logs/redactions.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace privgate
