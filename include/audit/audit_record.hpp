#pragma once

#include "core/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace privgate {

// ============================================================================
// Audit Record - one processed submission
// ============================================================================

struct AuditRecord {
    std::string submission_id;          // UUID
    std::chrono::system_clock::time_point timestamp;
    MaskPolicy policy = MaskPolicy::REPLACE;
    bool blocked = false;
    bool corrected = false;             // Grammar correction changed the text
    size_t span_count = 0;              // Spans in the final DetectionResult
    std::vector<MaskLogEntry> entries;  // Masking log, in span order
};

} // namespace privgate
