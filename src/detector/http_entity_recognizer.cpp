#include "detector/http_entity_recognizer.hpp"
#include "core/error.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <format>

using json = nlohmann::json;

namespace privgate {

HttpEntityRecognizer::HttpEntityRecognizer(Config config)
    : config_(std::move(config)) {}

std::vector<RecognizedEntity> HttpEntityRecognizer::parse_response(const std::string& body) {
    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::parse_error& e) {
        throw DetectorUnavailableError(std::format("NER response is not JSON: {}", e.what()));
    }

    if (!doc.is_object() || !doc.contains("entities") || !doc["entities"].is_array()) {
        throw DetectorUnavailableError("NER response missing 'entities' array");
    }

    std::vector<RecognizedEntity> entities;
    entities.reserve(doc["entities"].size());
    try {
        for (const auto& e : doc["entities"]) {
            RecognizedEntity ent;
            ent.label = e.at("label").get<std::string>();
            ent.start = e.at("start").get<size_t>();
            ent.end = e.at("end").get<size_t>();
            ent.text = e.value("text", std::string{});
            entities.push_back(std::move(ent));
        }
    } catch (const json::exception& e) {
        throw DetectorUnavailableError(std::format("Malformed NER entity: {}", e.what()));
    }
    return entities;
}

std::vector<RecognizedEntity> HttpEntityRecognizer::recognize(std::string_view text) const {
    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));

    std::string payload;
    try {
        payload = json{{"text", std::string(text)}}.dump();
    } catch (const json::type_error& e) {
        // Invalid UTF-8 cannot be posted without shifting offsets
        throw DetectorUnavailableError(std::format("Cannot encode text for NER: {}", e.what()));
    }

    const auto res = cli.Post(config_.path, payload, "application/json");

    if (!res) {
        throw DetectorUnavailableError(std::format("NER service {} unreachable: {}",
            config_.endpoint, httplib::to_string(res.error())));
    }
    if (res->status != httplib::StatusCode::OK_200) {
        throw DetectorUnavailableError(std::format("NER service returned HTTP {}", res->status));
    }

    auto entities = parse_response(res->body);

    // Fill in missing text from the posted version
    for (auto& ent : entities) {
        if (ent.text.empty() && ent.start <= ent.end && ent.end <= text.size()) {
            ent.text = std::string(text.substr(ent.start, ent.end - ent.start));
        }
    }
    return entities;
}

} // namespace privgate
