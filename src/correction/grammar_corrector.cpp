#include "correction/grammar_corrector.hpp"
#include "core/utils.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <format>
#include <stdexcept>

using json = nlohmann::json;

namespace privgate {

namespace {

bool overlaps_protected(size_t start, size_t end, const std::vector<Span>& protected_spans) {
    return std::any_of(protected_spans.begin(), protected_spans.end(), [&](const Span& p) {
        return start < p.end && p.start < end;
    });
}

// Length in bytes of the UTF-8 sequence starting with lead byte c
size_t utf8_sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;  // Stray continuation byte: count as one unit
}

} // anonymous namespace

std::string apply_corrections(std::string_view text,
                              std::vector<Correction> corrections,
                              const std::vector<Span>& protected_spans) {
    std::sort(corrections.begin(), corrections.end(), [](const Correction& a, const Correction& b) {
        return a.offset < b.offset;
    });

    std::string out;
    out.reserve(text.size());
    size_t last = 0;

    for (const auto& c : corrections) {
        const size_t end = c.offset + c.length;
        if (end > text.size() || c.offset < last) continue;
        if (overlaps_protected(c.offset, end, protected_spans)) continue;

        out.append(text.substr(last, c.offset - last));
        out.append(c.replacement);
        last = end;
    }
    out.append(text.substr(last));
    return out;
}

size_t utf16_to_byte_offset(std::string_view text, size_t utf16_offset) {
    size_t units = 0;
    size_t pos = 0;
    while (pos < text.size() && units < utf16_offset) {
        const size_t len = utf8_sequence_length(static_cast<unsigned char>(text[pos]));
        units += (len == 4) ? 2 : 1;
        pos = std::min(pos + len, text.size());
    }
    return pos;
}

// ============================================================================
// LanguageToolCorrector
// ============================================================================

LanguageToolCorrector::LanguageToolCorrector(Config config)
    : config_(std::move(config)) {}

std::vector<Correction> LanguageToolCorrector::parse_matches(std::string_view text,
                                                             const std::string& body) {
    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::format("LanguageTool response is not JSON: {}", e.what()));
    }

    std::vector<Correction> corrections;
    if (!doc.contains("matches") || !doc["matches"].is_array()) {
        return corrections;
    }

    try {
        for (const auto& m : doc["matches"]) {
            const auto& repls = m.value("replacements", json::array());
            if (!repls.is_array() || repls.empty()) continue;

            const size_t off16 = m.value("offset", size_t{0});
            const size_t len16 = m.value("length", size_t{0});
            const size_t start = utf16_to_byte_offset(text, off16);
            const size_t end = utf16_to_byte_offset(text, off16 + len16);

            corrections.push_back({start, end - start, repls.front().value("value", std::string{})});
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::format("Malformed LanguageTool match: {}", e.what()));
    }
    return corrections;
}

std::string LanguageToolCorrector::correct(std::string_view text,
                                           const std::vector<Span>& protected_spans) const {
    if (text.empty()) return std::string(text);

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));

    const httplib::Params params = {
        {"text", std::string(text)},
        {"language", config_.language},
    };
    const auto res = cli.Post("/v2/check", params);

    if (!res) {
        throw std::runtime_error(std::format("LanguageTool {} unreachable: {}",
            config_.endpoint, httplib::to_string(res.error())));
    }
    if (res->status != httplib::StatusCode::OK_200) {
        throw std::runtime_error(std::format("LanguageTool returned HTTP {}", res->status));
    }

    auto corrections = parse_matches(text, res->body);
    utils::log::debug(std::format("LanguageTool suggested {} corrections", corrections.size()));
    return apply_corrections(text, std::move(corrections), protected_spans);
}

} // namespace privgate
