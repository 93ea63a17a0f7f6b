#include "audit/audit_exporter.hpp"
#include "core/utils.hpp"

#include <format>

namespace privgate {

std::string AuditExporter::csv_field(std::string_view value) {
    if (value.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(value);
    }

    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (const char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string AuditExporter::to_csv(const std::vector<MaskLogEntry>& entries, bool include_header) {
    std::string out;
    if (include_header) {
        out += kCsvHeader;
    }
    for (const auto& e : entries) {
        out += std::format("{},{},{},{},{},{}\n",
            csv_field(e.original),
            csv_field(e.mask_token.value_or("")),
            detector_type_to_string(e.type),
            sensitivity_to_string(e.sensitivity),
            e.start, e.end);
    }
    return out;
}

std::string AuditExporter::entry_to_json(const MaskLogEntry& e) {
    const std::string mask = e.mask_token
        ? std::format("\"{}\"", utils::escape_json(*e.mask_token))
        : std::string("null");

    return std::format(
        R"({{"original":"{}","mask":{},"type":"{}","sensitivity":"{}","start":{},"end":{}}})",
        utils::escape_json(e.original), mask,
        detector_type_to_string(e.type), sensitivity_to_string(e.sensitivity),
        e.start, e.end);
}

std::string AuditExporter::to_jsonl(const std::vector<MaskLogEntry>& entries) {
    std::string out;
    for (const auto& e : entries) {
        out += entry_to_json(e);
        out += '\n';
    }
    return out;
}

std::string AuditExporter::to_jsonl(const AuditRecord& r) {
    std::string out;
    out.reserve(256 + r.entries.size() * 128);

    out += '{';
    out += std::format("\"submission_id\":\"{}\",\"timestamp\":\"{}\",",
                       r.submission_id, utils::format_timestamp(r.timestamp));
    out += std::format("\"policy\":\"{}\",\"blocked\":{},\"corrected\":{},\"span_count\":{},",
                       mask_policy_to_string(r.policy), utils::booltostr(r.blocked),
                       utils::booltostr(r.corrected), r.span_count);
    out += "\"entries\":[";
    for (size_t i = 0; i < r.entries.size(); ++i) {
        if (i > 0) out += ',';
        out += entry_to_json(r.entries[i]);
    }
    out += "]}\n";
    return out;
}

} // namespace privgate
