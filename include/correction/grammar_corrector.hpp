#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace privgate {

/**
 * @brief One suggested edit, in byte offsets of the checked text
 */
struct Correction {
    size_t offset = 0;
    size_t length = 0;
    std::string replacement;
};

/**
 * @brief Grammar/spelling correction collaborator
 *
 * Corrected text is a new text version: offsets of spans found before
 * correction are not valid in it, and callers must detect again.
 * protected_spans are regions of the input the corrector must leave alone.
 * Implementations throw std::runtime_error when the service fails.
 */
class IGrammarCorrector {
public:
    virtual ~IGrammarCorrector() = default;

    [[nodiscard]] virtual std::string correct(std::string_view text,
                                              const std::vector<Span>& protected_spans) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Apply non-overlapping corrections left to right
 *
 * Corrections that overlap a protected span, fall outside the text, or
 * overlap an earlier accepted correction are skipped.
 */
[[nodiscard]] std::string apply_corrections(std::string_view text,
                                            std::vector<Correction> corrections,
                                            const std::vector<Span>& protected_spans);

/**
 * @brief Convert a UTF-16 code unit offset into a UTF-8 byte offset of text.
 * Offsets past the end clamp to text.size().
 */
[[nodiscard]] size_t utf16_to_byte_offset(std::string_view text, size_t utf16_offset);

/**
 * @brief LanguageTool HTTP API client (POST /v2/check)
 *
 * Takes the first replacement of every match. LanguageTool reports offsets
 * in UTF-16 code units; they are converted to byte offsets before applying.
 */
class LanguageToolCorrector : public IGrammarCorrector {
public:
    struct Config {
        std::string endpoint = "http://localhost:8081";
        std::string language = "en-US";
        uint32_t timeout_ms = 5000;
    };

    explicit LanguageToolCorrector(Config config);

    [[nodiscard]] std::string correct(std::string_view text,
                                      const std::vector<Span>& protected_spans) const override;
    [[nodiscard]] std::string name() const override { return "languagetool:" + config_.endpoint; }

    /**
     * @brief Decode a /v2/check response into byte-offset corrections
     * @throws std::runtime_error on malformed JSON
     */
    [[nodiscard]] static std::vector<Correction> parse_matches(std::string_view text,
                                                               const std::string& body);

private:
    Config config_;
};

} // namespace privgate
