#include "core/masking.hpp"
#include "core/utils.hpp"

#include <format>

namespace privgate {

std::string MaskingEngine::mask_token(DetectorType type, size_t n) {
    return std::format("<{}_REDACTED_{}>", detector_type_to_string(type), n);
}

MaskOutcome MaskingEngine::apply(
    std::string_view text,
    const DetectionResult& detection,
    MaskPolicy policy) {

    switch (policy) {
        case MaskPolicy::BLOCK:
            return {std::string(text), {}};

        case MaskPolicy::WARN:
            return apply_warn(text, detection);

        case MaskPolicy::REPLACE:
            return apply_replace(text, detection);
    }
    return {std::string(text), {}};
}

MaskOutcome MaskingEngine::apply_warn(std::string_view text, const DetectionResult& detection) {
    MaskOutcome outcome;
    outcome.text = std::string(text);
    outcome.log.reserve(detection.size());

    for (const auto& span : detection.spans) {
        outcome.log.push_back({span.text, std::nullopt, span.type, span.sensitivity,
                               span.start, span.end});
    }
    return outcome;
}

MaskOutcome MaskingEngine::apply_replace(std::string_view text, const DetectionResult& detection) {
    MaskOutcome outcome;
    outcome.log.reserve(detection.size());
    outcome.text.reserve(text.size());

    size_t cursor = 0;
    size_t n = 0;

    for (const auto& span : detection.spans) {
        // Residual overlap or stale offsets: impossible after a correct merge
        if (span.start < cursor || span.end < span.start || span.end > text.size()) {
            utils::log::warn(std::format("Masking skipped {} span [{}, {}) at cursor {}",
                detector_type_to_string(span.type), span.start, span.end, cursor));
            continue;
        }

        outcome.text.append(text.substr(cursor, span.start - cursor));

        auto token = mask_token(span.type, ++n);
        outcome.text.append(token);
        outcome.log.push_back({span.text, std::move(token), span.type, span.sensitivity,
                               span.start, span.end});
        cursor = span.end;
    }
    outcome.text.append(text.substr(cursor));

    return outcome;
}

Result<MaskPolicy> parse_mask_policy(std::string_view name) {
    const std::string lower = utils::to_lower(utils::trim(std::string(name)));

    if (lower == "replace") return Result<MaskPolicy>::ok(MaskPolicy::REPLACE);
    if (lower == "warn")    return Result<MaskPolicy>::ok(MaskPolicy::WARN);
    if (lower == "block")   return Result<MaskPolicy>::ok(MaskPolicy::BLOCK);

    return Result<MaskPolicy>::error(ErrorCategory::INVALID_POLICY,
        std::format("Invalid mask policy '{}' (expected replace, warn or block)", name));
}

} // namespace privgate
