#pragma once

#include "detector/entity_detector.hpp"

#include <cstdint>
#include <string>

namespace privgate {

/**
 * @brief Entity recognizer backed by an NER HTTP service
 *
 * Request:  POST {path} {"text": "..."}
 * Response: {"entities": [{"label": "PERSON", "start": 0, "end": 10, "text": "..."}]}
 *
 * Offsets in the response must be byte offsets into the posted text. Any
 * transport error, non-200 status or malformed body raises
 * DetectorUnavailableError.
 */
class HttpEntityRecognizer : public IEntityRecognizer {
public:
    struct Config {
        std::string endpoint = "http://localhost:8090";
        std::string path = "/ner";
        uint32_t timeout_ms = 2000;
    };

    explicit HttpEntityRecognizer(Config config);

    [[nodiscard]] std::vector<RecognizedEntity> recognize(std::string_view text) const override;
    [[nodiscard]] std::string name() const override { return "http:" + config_.endpoint; }

    /**
     * @brief Decode a service response body
     * @throws DetectorUnavailableError if the body is not the expected shape
     */
    [[nodiscard]] static std::vector<RecognizedEntity> parse_response(const std::string& body);

private:
    Config config_;
};

} // namespace privgate
