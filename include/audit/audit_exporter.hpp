#pragma once

#include "audit/audit_record.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace privgate {

enum class AuditFormat { JSONL, CSV };

/**
 * @brief Renders redaction logs for export collaborators
 *
 * CSV columns: original,mask,type,sensitivity,start,end (RFC 4180 quoting,
 * mask empty when absent). JSON Lines: one object per entry, or one object
 * per submission for to_jsonl(const AuditRecord&).
 */
class AuditExporter {
public:
    static constexpr std::string_view kCsvHeader = "original,mask,type,sensitivity,start,end\n";

    [[nodiscard]] static std::string to_csv(const std::vector<MaskLogEntry>& entries,
                                            bool include_header = true);

    [[nodiscard]] static std::string to_jsonl(const std::vector<MaskLogEntry>& entries);

    /**
     * @brief One JSON line describing a whole submission
     */
    [[nodiscard]] static std::string to_jsonl(const AuditRecord& record);

    [[nodiscard]] static std::string entry_to_json(const MaskLogEntry& entry);

    /**
     * @brief Quote a CSV field when it holds ',', '"', CR or LF
     */
    [[nodiscard]] static std::string csv_field(std::string_view value);
};

} // namespace privgate
