#pragma once

#include "detector/idetector.hpp"

#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace privgate {

struct PhoneMatch {
    size_t start = 0;
    size_t end = 0;
};

/**
 * @brief Phone-number grammar collaborator
 *
 * Reports [start, end) byte ranges of phone numbers. Implementations must be
 * safe for concurrent calls.
 */
class IPhoneNumberFinder {
public:
    virtual ~IPhoneNumberFinder() = default;

    [[nodiscard]] virtual std::vector<PhoneMatch> find_phone_numbers(std::string_view text) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Default finder for North American and '+'-prefixed international numbers
 *
 * North American layout: optional +1 / 1 country prefix, optional
 * parenthesized area code, '-', '.' or whitespace separators. International
 * layout: '+', a 1-3 digit country code, then digit groups with the same
 * separators, 8 to 15 digits in total (E.164). An international match that
 * overlaps a North American one is dropped. Matches never start on a
 * separator, so the surrounding text is left intact.
 */
class RegexPhoneNumberFinder : public IPhoneNumberFinder {
public:
    RegexPhoneNumberFinder();

    [[nodiscard]] std::vector<PhoneMatch> find_phone_numbers(std::string_view text) const override;
    [[nodiscard]] std::string name() const override { return "regex"; }

private:
    std::regex phone_regex_;
    std::regex international_regex_;
};

/**
 * @brief Detector adapter over an IPhoneNumberFinder
 *
 * Fills the span text from the source slice. Ranges the finder reports
 * outside the text are dropped here rather than passed on.
 */
class PhoneDetector : public IDetector {
public:
    explicit PhoneDetector(std::shared_ptr<const IPhoneNumberFinder> finder =
                               std::make_shared<RegexPhoneNumberFinder>());

    [[nodiscard]] std::vector<Span> detect(std::string_view text) const override;
    [[nodiscard]] std::string name() const override { return "phone:" + finder_->name(); }

private:
    std::shared_ptr<const IPhoneNumberFinder> finder_;
};

} // namespace privgate
