#include "audit/audit_writer.hpp"
#include "core/utils.hpp"

#include <format>

namespace privgate {

AuditWriter::AuditWriter(std::unique_ptr<IAuditSink> sink, AuditFormat format)
    : sink_(std::move(sink)), format_(format) {}

AuditWriter::~AuditWriter() {
    if (sink_) {
        sink_->shutdown();
    }
}

void AuditWriter::record(const AuditRecord& record) {
    if (!sink_) return;

    const std::string data = (format_ == AuditFormat::CSV)
        ? AuditExporter::to_csv(record.entries, false)
        : AuditExporter::to_jsonl(record);

    if (data.empty()) return;

    std::lock_guard lock(mutex_);
    if (sink_->write(data)) {
        records_written_.fetch_add(1, std::memory_order_relaxed);
    } else {
        write_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Audit write to {} failed for submission {}",
                                     sink_->name(), record.submission_id));
    }
}

void AuditWriter::flush() {
    std::lock_guard lock(mutex_);
    if (sink_) {
        sink_->flush();
    }
}

AuditWriter::Stats AuditWriter::get_stats() const {
    return {
        records_written_.load(std::memory_order_relaxed),
        write_failures_.load(std::memory_order_relaxed)
    };
}

} // namespace privgate
