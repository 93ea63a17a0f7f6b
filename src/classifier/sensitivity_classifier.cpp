#include "classifier/sensitivity_classifier.hpp"

namespace privgate {

SensitivityTier SensitivityClassifier::classify(DetectorType type) noexcept {
    switch (type) {
        case DetectorType::EMAIL:
        case DetectorType::PHONE:
        case DetectorType::CREDIT_CARD:
        case DetectorType::NATIONAL_ID:
        case DetectorType::PERSON:
            return SensitivityTier::HIGH;

        case DetectorType::GEO_POLITICAL_ENTITY:
        case DetectorType::LOCATION:
        case DetectorType::ORGANIZATION:
        case DetectorType::LONG_NUMBER:
            return SensitivityTier::MEDIUM;

        case DetectorType::URL:
            return SensitivityTier::LOW;
    }
    return SensitivityTier::LOW;
}

} // namespace privgate
