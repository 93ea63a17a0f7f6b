#include "detector/phone_detector.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace privgate {

namespace {

constexpr size_t kMinE164Digits = 8;
constexpr size_t kMaxE164Digits = 15;

size_t count_digits(std::string_view s) {
    size_t n = 0;
    for (const char c : s) {
        if (c >= '0' && c <= '9') ++n;
    }
    return n;
}

bool overlaps_any(const std::vector<PhoneMatch>& matches, size_t start, size_t end) {
    for (const auto& m : matches) {
        if (start < m.end && m.start < end) return true;
    }
    return false;
}

} // anonymous namespace

RegexPhoneNumberFinder::RegexPhoneNumberFinder()
    : phone_regex_(
          R"((?:\+?1[-.\s]?)?(?:\(\d{3}\)|\b\d{3})[-.\s]?\d{3}[-.\s]?\d{4}\b)"),
      international_regex_(
          R"(\+[1-9]\d{0,2}(?:[-.\s]?\d{1,4}){1,6}\b)") {}

std::vector<PhoneMatch> RegexPhoneNumberFinder::find_phone_numbers(std::string_view text) const {
    std::vector<PhoneMatch> matches;
    const char* begin = text.data();
    const char* end = text.data() + text.size();

    for (std::cregex_iterator it(begin, end, phone_regex_), last; it != last; ++it) {
        const auto start = static_cast<size_t>(it->position(0));
        const auto len = static_cast<size_t>(it->length(0));
        if (len == 0) continue;
        matches.push_back({start, start + len});
    }

    // International matches never overlap each other, so this only checks the
    // North American ones already collected
    for (std::cregex_iterator it(begin, end, international_regex_), last; it != last; ++it) {
        const auto start = static_cast<size_t>(it->position(0));
        const auto len = static_cast<size_t>(it->length(0));
        const auto digits = count_digits(text.substr(start, len));
        if (digits < kMinE164Digits || digits > kMaxE164Digits) continue;

        if (overlaps_any(matches, start, start + len)) continue;
        matches.push_back({start, start + len});
    }

    std::sort(matches.begin(), matches.end(),
              [](const PhoneMatch& a, const PhoneMatch& b) { return a.start < b.start; });
    return matches;
}

PhoneDetector::PhoneDetector(std::shared_ptr<const IPhoneNumberFinder> finder)
    : finder_(std::move(finder)) {}

std::vector<Span> PhoneDetector::detect(std::string_view text) const {
    std::vector<Span> spans;
    if (text.empty()) return spans;

    for (const auto& m : finder_->find_phone_numbers(text)) {
        if (m.start >= m.end || m.end > text.size()) {
            utils::log::warn(std::format("{}: dropping out-of-range phone match [{}, {})",
                                         name(), m.start, m.end));
            continue;
        }
        spans.emplace_back(DetectorType::PHONE, m.start, m.end,
                           std::string(text.substr(m.start, m.end - m.start)));
    }
    return spans;
}

} // namespace privgate
