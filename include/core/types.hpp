#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace privgate {

// ============================================================================
// Basic Enums
// ============================================================================

/**
 * @brief Kind of sensitive span a detector reports.
 *
 * Open set: adding a value only requires a label below and a tier in
 * SensitivityClassifier. The merger never switches on it.
 */
enum class DetectorType : uint8_t {
    EMAIL,
    URL,
    CREDIT_CARD,
    NATIONAL_ID,
    LONG_NUMBER,
    PHONE,
    PERSON,
    GEO_POLITICAL_ENTITY,
    LOCATION,
    ORGANIZATION
};

/**
 * @brief Sensitivity tier. Declaration order is the total order (LOW < HIGH).
 */
enum class SensitivityTier : uint8_t {
    LOW,
    MEDIUM,
    HIGH
};

enum class MaskPolicy : uint8_t {
    REPLACE,
    WARN,
    BLOCK
};

// Canonical upper-case label, used in mask tokens and exports
[[nodiscard]] inline constexpr std::string_view detector_type_to_string(DetectorType t) noexcept {
    switch (t) {
        case DetectorType::EMAIL:                return "EMAIL";
        case DetectorType::URL:                  return "URL";
        case DetectorType::CREDIT_CARD:          return "CREDIT_CARD";
        case DetectorType::NATIONAL_ID:          return "SSN";
        case DetectorType::LONG_NUMBER:          return "LONG_NUMBER";
        case DetectorType::PHONE:                return "PHONE";
        case DetectorType::PERSON:               return "PERSON";
        case DetectorType::GEO_POLITICAL_ENTITY: return "GPE";
        case DetectorType::LOCATION:             return "LOC";
        case DetectorType::ORGANIZATION:         return "ORG";
    }
    return "UNKNOWN";
}

[[nodiscard]] inline constexpr std::string_view sensitivity_to_string(SensitivityTier s) noexcept {
    switch (s) {
        case SensitivityTier::LOW:    return "low";
        case SensitivityTier::MEDIUM: return "medium";
        case SensitivityTier::HIGH:   return "high";
    }
    return "unknown";
}

[[nodiscard]] inline constexpr std::string_view mask_policy_to_string(MaskPolicy p) noexcept {
    switch (p) {
        case MaskPolicy::REPLACE: return "replace";
        case MaskPolicy::WARN:    return "warn";
        case MaskPolicy::BLOCK:   return "block";
    }
    return "unknown";
}

// ============================================================================
// Spans
// ============================================================================

/**
 * @brief A flagged region of one text version.
 *
 * [start, end) are byte offsets into the UTF-8 text the span was detected
 * in, and text == source.substr(start, end - start).
 */
struct Span {
    DetectorType type = DetectorType::EMAIL;
    size_t start = 0;
    size_t end = 0;
    std::string text;
    SensitivityTier sensitivity = SensitivityTier::LOW;

    Span() = default;
    Span(DetectorType t, size_t s, size_t e, std::string txt,
         SensitivityTier sens = SensitivityTier::LOW)
        : type(t), start(s), end(e), text(std::move(txt)), sensitivity(sens) {}

    [[nodiscard]] size_t length() const { return end - start; }

    bool operator==(const Span&) const = default;
};

/**
 * @brief Merged, non-overlapping, start-ascending spans for one text version
 */
struct DetectionResult {
    std::vector<Span> spans;

    [[nodiscard]] bool empty() const { return spans.empty(); }
    [[nodiscard]] size_t size() const { return spans.size(); }

    bool operator==(const DetectionResult&) const = default;
};

// ============================================================================
// Audit Log Records
// ============================================================================

struct MaskLogEntry {
    std::string original;
    std::optional<std::string> mask_token;  // Absent under WARN / BLOCK
    DetectorType type = DetectorType::EMAIL;
    SensitivityTier sensitivity = SensitivityTier::LOW;
    size_t start = 0;
    size_t end = 0;

    bool operator==(const MaskLogEntry&) const = default;
};

/**
 * @brief Masking output. Text and log always travel together since the log
 * encodes the exact substitutions that produced the text.
 */
struct MaskOutcome {
    std::string text;
    std::vector<MaskLogEntry> log;
};

} // namespace privgate
