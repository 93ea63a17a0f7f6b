#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace privgate {

/**
 * @brief Interface for sensitive-span detectors
 *
 * Implementations are pure for identical input and keep no per-call state,
 * so one instance may be called from several threads at once. A detector
 * must not emit self-overlapping spans for a single match. Sensitivity is
 * assigned later by SensitivityClassifier; detectors only set the type.
 */
class IDetector {
public:
    virtual ~IDetector() = default;

    /**
     * @brief Find candidate spans in text
     * @param text Text version to scan (offsets refer to it)
     * @return Candidates with type, offsets and verbatim text filled in
     */
    [[nodiscard]] virtual std::vector<Span> detect(std::string_view text) const = 0;

    /// Detector name for logging (e.g. "regex:email", "entity:gazetteer")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace privgate
