#include "core/llm_client.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>
#include <thread>

using json = nlohmann::json;

namespace privgate {

// ============================================================================
// Construction
// ============================================================================

LlmClient::LlmClient() = default;

LlmClient::LlmClient(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// Rate Limiting
// ============================================================================

bool LlmClient::check_rate_limit() {
    std::lock_guard lock(rate_mutex_);
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        now - minute_start_);

    if (elapsed.count() >= 60) {
        // New minute window
        minute_start_ = now;
        requests_this_minute_ = 0;
    }

    if (requests_this_minute_ >= config_.max_requests_per_minute) {
        return false;
    }

    ++requests_this_minute_;
    return true;
}

// ============================================================================
// Core API
// ============================================================================

LlmResponse LlmClient::complete(const LlmRequest& request) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (!config_.enabled) {
        return {false, "", "LLM client is disabled", "", {}};
    }

    if (!check_rate_limit()) {
        rate_limited_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "Rate limited: too many LLM API requests", "", {}};
    }

    const auto model = request.model.empty() ? config_.default_model : request.model;
    return call_api(request, model);
}

// ============================================================================
// Request / Response Bodies
// ============================================================================

std::string LlmClient::build_body(const LlmRequest& request, const std::string& model) const {
    json body;
    body["model"] = model;
    body["max_tokens"] = request.max_tokens;

    if (config_.provider == "anthropic") {
        // Anthropic: system prompt is a top-level field
        if (!request.system_prompt.empty()) {
            body["system"] = request.system_prompt;
        }
        body["messages"] = json::array({{{"role", "user"}, {"content", request.prompt}}});
    } else {
        body["temperature"] = request.temperature;
        json messages = json::array();
        if (!request.system_prompt.empty()) {
            messages.push_back({{"role", "system"}, {"content", request.system_prompt}});
        }
        messages.push_back({{"role", "user"}, {"content", request.prompt}});
        body["messages"] = std::move(messages);
    }
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string LlmClient::extract_content(const std::string& body, const std::string& provider) {
    const auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return "";
    }

    if (provider == "anthropic") {
        // {"content":[{"type":"text","text":"..."}]}
        if (doc.contains("content") && doc["content"].is_array()) {
            std::string out;
            for (const auto& block : doc["content"]) {
                if (block.is_object() && block.value("type", "") == "text") {
                    out += block.value("text", "");
                }
            }
            return out;
        }
        return "";
    }

    // OpenAI: {"choices":[{"message":{"content":"..."}}]}
    if (doc.contains("choices") && doc["choices"].is_array() && !doc["choices"].empty()) {
        const auto& choice = doc["choices"].front();
        if (choice.is_object() && choice.contains("message") && choice["message"].is_object()) {
            const auto& content = choice["message"]["content"];
            if (content.is_string()) {
                return utils::trim(content.get<std::string>());
            }
        }
    }
    return "";
}

// ============================================================================
// API Call
// ============================================================================

LlmResponse LlmClient::call_api(const LlmRequest& request, const std::string& model) {
    api_calls_.fetch_add(1, std::memory_order_relaxed);

    const auto start = std::chrono::steady_clock::now();
    auto elapsed_since_start = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };

    if (config_.api_key.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "No API key configured", model, {}};
    }

    if (config_.endpoint.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "No endpoint configured", model, {}};
    }

    const std::string json_body = build_body(request, model);

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));

    httplib::Headers headers;
    std::string path;

    if (config_.provider == "anthropic") {
        headers = {
            {"x-api-key", config_.api_key},
            {"anthropic-version", "2023-06-01"}
        };
        path = "/v1/messages";
    } else {
        headers = {
            {"Authorization", "Bearer " + config_.api_key}
        };
        path = "/v1/chat/completions";
    }

    // Retry loop
    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        const auto res = cli.Post(path, headers, json_body, "application/json");

        if (!res) {
            if (attempt < config_.max_retries) continue;
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return {false, "", "HTTP request failed: connection error", model, elapsed_since_start()};
        }

        if (res->status == httplib::StatusCode::TooManyRequests_429) {
            if (attempt < config_.max_retries) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1000 * (attempt + 1)));
                continue;
            }
        }

        if (res->status != httplib::StatusCode::OK_200) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return {false, "", std::format("API error: HTTP {} - {}", res->status,
                    res->body.substr(0, 200)), model, elapsed_since_start()};
        }

        auto content = extract_content(res->body, config_.provider);
        if (content.empty()) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return {false, "", "API response has no completion content", model, elapsed_since_start()};
        }

        return {true, std::move(content), "", model, elapsed_since_start()};
    }

    api_errors_.fetch_add(1, std::memory_order_relaxed);
    return {false, "", "Max retries exceeded", model, elapsed_since_start()};
}

// ============================================================================
// Stats
// ============================================================================

LlmClient::Stats LlmClient::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed),
        rate_limited_.load(std::memory_order_relaxed)
    };
}

} // namespace privgate
