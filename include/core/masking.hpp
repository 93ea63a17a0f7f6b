#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace privgate {

/**
 * @brief Masking engine - applies a MaskPolicy to a text and its spans
 *
 * Policies:
 * - REPLACE: each span becomes "<TYPE_REDACTED_n>", n counting from 1 per call
 * - WARN:    text unchanged, one log entry per span without a mask token
 * - BLOCK:   text unchanged, empty log. The caller refuses to forward when
 *            the DetectionResult is non-empty; the engine has no side effect.
 *
 * The result must come from SpanMerger for this exact text version.
 */
class MaskingEngine {
public:
    /**
     * @brief Apply a policy
     * @param text Text the spans were detected in
     * @param detection Merged spans for text
     * @param policy Redaction policy
     * @return Output text together with its log
     */
    [[nodiscard]] static MaskOutcome apply(
        std::string_view text,
        const DetectionResult& detection,
        MaskPolicy policy);

    /**
     * @brief Build the mask token for a span type and sequence number
     */
    [[nodiscard]] static std::string mask_token(DetectorType type, size_t n);

    /**
     * @brief True when BLOCK would forbid forwarding this result
     */
    [[nodiscard]] static bool is_block_eligible(const DetectionResult& detection) {
        return !detection.empty();
    }

private:
    static MaskOutcome apply_warn(std::string_view text, const DetectionResult& detection);
    static MaskOutcome apply_replace(std::string_view text, const DetectionResult& detection);
};

/**
 * @brief Parse "replace" / "warn" / "block" (case-insensitive)
 * @return INVALID_POLICY error for anything else
 */
[[nodiscard]] Result<MaskPolicy> parse_mask_policy(std::string_view name);

} // namespace privgate
