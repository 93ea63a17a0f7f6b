#pragma once

#include "detector/entity_detector.hpp"

#include <regex>
#include <string>
#include <vector>

namespace privgate {

/**
 * @brief Rule-based entity recognizer
 *
 * Matches a fixed phrase list (case-sensitive, whole words only) and,
 * optionally, the "Firstname Lastname" capitalization heuristic for PERSON.
 * Output is non-overlapping: at each position the longest phrase wins, and
 * heuristic names never overlap a phrase match.
 *
 * Gazetteer file format (TOML), one array per label:
 *
 *   PERSON = ["Jane Doe"]
 *   ORG    = ["Acme Corp", "Globex"]
 *   GPE    = ["Paris"]
 *   LOC    = ["Lake Tahoe"]
 */
class GazetteerEntityRecognizer : public IEntityRecognizer {
public:
    struct Entry {
        std::string label;
        std::string phrase;
    };

    explicit GazetteerEntityRecognizer(std::vector<Entry> entries, bool name_heuristic = false);

    /**
     * @brief Load entries from a TOML gazetteer file
     * @throws std::runtime_error on I/O or parse failure
     */
    [[nodiscard]] static std::vector<Entry> load_file(const std::string& path);

    [[nodiscard]] std::vector<RecognizedEntity> recognize(std::string_view text) const override;
    [[nodiscard]] std::string name() const override { return "gazetteer"; }

    [[nodiscard]] size_t entry_count() const { return entries_.size(); }

private:
    std::vector<Entry> entries_;
    bool name_heuristic_;
    std::regex name_regex_;
};

} // namespace privgate
