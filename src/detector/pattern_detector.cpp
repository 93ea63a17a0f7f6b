#include "detector/pattern_detector.hpp"

#include <cctype>

namespace privgate {

namespace {

// Patterns are matched against raw bytes; offsets are byte offsets.
// Every quantifier is bounded: the std::regex matcher recurses once per
// repeated character, so an unbounded repeat over a long token exhausts
// the stack.
constexpr const char* kEmailPattern =
    R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,255}\.[A-Za-z]{2,63}\b)";

constexpr const char* kUrlPattern =
    R"(\b(?:https?://|www\.)\S{1,2048}\b)";

// Crude card match: 13-16 digits with optional space/dash separators
constexpr const char* kCreditCardPattern =
    R"(\b(?:\d[ -]{0,2}?){13,16}\b)";

// US SSN layout
constexpr const char* kNationalIdPattern =
    R"(\b\d{3}-\d{2}-\d{4}\b)";

// Other national identifiers and account numbers
constexpr const char* kLongNumberPattern =
    R"(\b\d{9,16}\b)";

std::string digits_only(std::string_view value) {
    std::string digits;
    digits.reserve(value.size());
    for (const char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    return digits;
}

int to_int(std::string_view digits) {
    int v = 0;
    for (const char c : digits) {
        v = v * 10 + (c - '0');
    }
    return v;
}

} // anonymous namespace

// ============================================================================
// Validators
// ============================================================================

namespace validation {

bool luhn_validate(std::string_view value) {
    const std::string digits = digits_only(value);

    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (int i = static_cast<int>(digits.size()) - 1; i >= 0; --i) {
        int digit = digits[i] - '0';

        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }

        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

bool validate_ssn(std::string_view value) {
    const std::string digits = digits_only(value);
    if (digits.size() != 9) {
        return false;
    }

    const std::string_view d(digits);
    const int area = to_int(d.substr(0, 3));
    if (area == 0 || area == 666 || area >= 900) {
        return false;
    }
    if (to_int(d.substr(3, 2)) == 0) {
        return false;
    }
    return to_int(d.substr(5, 4)) != 0;
}

} // namespace validation

// ============================================================================
// PatternDetector
// ============================================================================

PatternDetector::PatternDetector(DetectorType type,
                                 std::string label,
                                 const std::string& pattern,
                                 std::regex::flag_type flags,
                                 Validator validator)
    : type_(type),
      label_(std::move(label)),
      regex_(pattern, flags),
      validator_(std::move(validator)) {}

std::vector<Span> PatternDetector::detect(std::string_view text) const {
    std::vector<Span> spans;
    if (text.empty()) return spans;

    const char* begin = text.data();
    const char* end = text.data() + text.size();

    for (std::cregex_iterator it(begin, end, regex_), last; it != last; ++it) {
        const auto& m = *it;
        if (m.length(0) == 0) continue;

        const auto start = static_cast<size_t>(m.position(0));
        const auto len = static_cast<size_t>(m.length(0));
        const std::string_view match = text.substr(start, len);

        if (validator_ && !validator_(match)) continue;

        spans.emplace_back(type_, start, start + len, std::string(match));
    }
    return spans;
}

std::vector<std::unique_ptr<IDetector>> make_pattern_detectors(
    const PatternDetectorOptions& options) {

    std::vector<std::unique_ptr<IDetector>> detectors;

    if (options.email) {
        detectors.push_back(std::make_unique<PatternDetector>(
            DetectorType::EMAIL, "email", kEmailPattern));
    }
    if (options.url) {
        detectors.push_back(std::make_unique<PatternDetector>(
            DetectorType::URL, "url", kUrlPattern,
            std::regex::ECMAScript | std::regex::icase));
    }
    if (options.credit_card) {
        PatternDetector::Validator v;
        if (options.luhn_check) v = validation::luhn_validate;
        detectors.push_back(std::make_unique<PatternDetector>(
            DetectorType::CREDIT_CARD, "credit_card", kCreditCardPattern,
            std::regex::ECMAScript, std::move(v)));
    }
    if (options.national_id) {
        PatternDetector::Validator v;
        if (options.validate_ssn) v = validation::validate_ssn;
        detectors.push_back(std::make_unique<PatternDetector>(
            DetectorType::NATIONAL_ID, "national_id", kNationalIdPattern,
            std::regex::ECMAScript, std::move(v)));
    }
    if (options.long_number) {
        detectors.push_back(std::make_unique<PatternDetector>(
            DetectorType::LONG_NUMBER, "long_number", kLongNumberPattern));
    }

    return detectors;
}

} // namespace privgate
