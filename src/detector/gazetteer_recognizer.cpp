#include "detector/gazetteer_recognizer.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>

namespace privgate {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool on_word_boundaries(std::string_view text, size_t start, size_t end) {
    if (start > 0 && is_word_char(text[start - 1]) && is_word_char(text[start])) return false;
    if (end < text.size() && is_word_char(text[end - 1]) && is_word_char(text[end])) return false;
    return true;
}

bool overlaps_any(const std::vector<RecognizedEntity>& taken, size_t start, size_t end) {
    return std::any_of(taken.begin(), taken.end(), [&](const RecognizedEntity& e) {
        return start < e.end && e.start < end;
    });
}

} // anonymous namespace

GazetteerEntityRecognizer::GazetteerEntityRecognizer(std::vector<Entry> entries, bool name_heuristic)
    : entries_(std::move(entries)),
      name_heuristic_(name_heuristic),
      name_regex_(R"(\b[A-Z][a-z]{1,40} [A-Z][a-z]{1,40}\b)") {
    std::erase_if(entries_, [](const Entry& e) { return e.phrase.empty(); });
}

std::vector<GazetteerEntityRecognizer::Entry> GazetteerEntityRecognizer::load_file(const std::string& path) {
    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw std::runtime_error(std::format("Failed to parse gazetteer {}: {}",
                                             path, e.description()));
    }

    std::vector<Entry> entries;
    for (const auto& [key, node] : tbl) {
        const auto* arr = node.as_array();
        if (!arr) continue;
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                entries.push_back({std::string(key.str()), s->get()});
            }
        }
    }
    utils::log::info(std::format("Loaded {} gazetteer entries from {}", entries.size(), path));
    return entries;
}

std::vector<RecognizedEntity> GazetteerEntityRecognizer::recognize(std::string_view text) const {
    std::vector<RecognizedEntity> found;

    for (const auto& entry : entries_) {
        size_t pos = text.find(entry.phrase);
        while (pos != std::string_view::npos) {
            const size_t end = pos + entry.phrase.size();
            if (on_word_boundaries(text, pos, end)) {
                found.push_back({entry.label, pos, end, entry.phrase});
            }
            pos = text.find(entry.phrase, pos + 1);
        }
    }

    // Longest match at each start wins; later overlapping matches are dropped
    std::sort(found.begin(), found.end(), [](const RecognizedEntity& a, const RecognizedEntity& b) {
        if (a.start != b.start) return a.start < b.start;
        if (a.end != b.end) return a.end > b.end;
        return a.label < b.label;
    });

    std::vector<RecognizedEntity> result;
    result.reserve(found.size());
    for (auto& e : found) {
        if (!result.empty() && e.start < result.back().end) continue;
        result.push_back(std::move(e));
    }

    if (name_heuristic_) {
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        std::vector<RecognizedEntity> names;
        for (std::cregex_iterator it(begin, end, name_regex_), last; it != last; ++it) {
            const auto start = static_cast<size_t>(it->position(0));
            const auto stop = start + static_cast<size_t>(it->length(0));
            if (overlaps_any(result, start, stop)) continue;
            names.push_back({"PERSON", start, stop, it->str(0)});
        }
        result.insert(result.end(), names.begin(), names.end());
        std::sort(result.begin(), result.end(), [](const RecognizedEntity& a, const RecognizedEntity& b) {
            return a.start < b.start;
        });
    }

    return result;
}

} // namespace privgate
