#pragma once

#include "core/types.hpp"

namespace privgate {

/**
 * @brief Maps a detector type to its sensitivity tier.
 *
 * Single source of truth for tier assignment. Detectors only tag the type;
 * the registry stamps the tier through this class.
 *
 *   HIGH:   EMAIL, PHONE, CREDIT_CARD, SSN, PERSON
 *   MEDIUM: GPE, LOC, ORG, LONG_NUMBER
 *   LOW:    URL
 */
class SensitivityClassifier {
public:
    [[nodiscard]] static SensitivityTier classify(DetectorType type) noexcept;
};

} // namespace privgate
