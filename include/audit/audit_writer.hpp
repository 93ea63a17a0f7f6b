#pragma once

#include "audit/audit_exporter.hpp"
#include "audit/audit_record.hpp"
#include "audit/audit_sink.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace privgate {

/**
 * @brief Writes per-submission audit records to a sink
 *
 * Thread-safe: concurrent submissions serialize on an internal mutex.
 * A failed sink write is counted and logged, never propagated, so auditing
 * cannot fail a submission.
 */
class AuditWriter {
public:
    AuditWriter(std::unique_ptr<IAuditSink> sink, AuditFormat format);
    ~AuditWriter();

    AuditWriter(const AuditWriter&) = delete;
    AuditWriter& operator=(const AuditWriter&) = delete;

    void record(const AuditRecord& record);
    void flush();

    [[nodiscard]] AuditFormat format() const { return format_; }

    struct Stats {
        uint64_t records_written = 0;
        uint64_t write_failures = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    std::unique_ptr<IAuditSink> sink_;
    AuditFormat format_;
    std::mutex mutex_;

    std::atomic<uint64_t> records_written_{0};
    std::atomic<uint64_t> write_failures_{0};
};

} // namespace privgate
