#pragma once

#include "detector/idetector.hpp"

#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace privgate {

/**
 * @brief Regex-backed detector for one DetectorType
 *
 * The pattern is compiled once at construction. An optional validator
 * filters matches (Luhn for card numbers, SSN range rules). Every match
 * becomes one span; std::regex_iterator never yields overlapping matches.
 */
class PatternDetector : public IDetector {
public:
    using Validator = std::function<bool(std::string_view)>;

    PatternDetector(DetectorType type,
                    std::string label,
                    const std::string& pattern,
                    std::regex::flag_type flags = std::regex::ECMAScript,
                    Validator validator = nullptr);

    [[nodiscard]] std::vector<Span> detect(std::string_view text) const override;
    [[nodiscard]] std::string name() const override { return "regex:" + label_; }

    [[nodiscard]] DetectorType type() const { return type_; }

private:
    DetectorType type_;
    std::string label_;
    std::regex regex_;
    Validator validator_;
};

/**
 * @brief Which pattern detectors to build
 */
struct PatternDetectorOptions {
    bool email = true;
    bool url = true;
    bool credit_card = true;
    bool national_id = true;
    bool long_number = true;
    bool luhn_check = false;      // Drop card-like matches failing Luhn
    bool validate_ssn = false;    // Drop SSN-like matches with impossible ranges
};

/**
 * @brief Build the enabled pattern detectors in a fixed order
 */
[[nodiscard]] std::vector<std::unique_ptr<IDetector>> make_pattern_detectors(
    const PatternDetectorOptions& options = {});

namespace validation {

/**
 * @brief Luhn checksum over the digits in value (13-19 digits required)
 */
[[nodiscard]] bool luhn_validate(std::string_view value);

/**
 * @brief SSN cannot start with 000, 666, or 900-999; group != 00; serial != 0000
 */
[[nodiscard]] bool validate_ssn(std::string_view value);

} // namespace validation

} // namespace privgate
