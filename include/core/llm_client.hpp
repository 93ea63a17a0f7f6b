#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace privgate {

struct LlmRequest {
    std::string prompt;          // Outbound text, already masked by the gate
    std::string system_prompt;   // Optional
    std::string model;           // Empty = Config::default_model
    double temperature = 0.2;
    int max_tokens = 800;
};

struct LlmResponse {
    bool success = false;
    std::string content;
    std::string error;
    std::string model_used;
    std::chrono::milliseconds latency{0};
};

/**
 * @brief Downstream LLM completion client.
 *
 * Speaks the OpenAI chat-completions format (or Anthropic messages when
 * provider = "anthropic") via httplib::Client.
 * Features:
 * - Retry on connection errors and HTTP 429
 * - Per-minute rate limiting on API calls
 * - Graceful degradation: failures come back as LlmResponse errors
 *
 * The client never sees raw text: PrivacyGate only passes the outbound
 * text of the active policy.
 */
class LlmClient {
public:
    struct Config {
        bool enabled = false;
        std::string provider = "openai";
        std::string endpoint = "https://api.openai.com";
        std::string api_key;
        std::string default_model = "gpt-4o-mini";
        uint32_t timeout_ms = 30000;
        uint32_t max_retries = 2;
        uint32_t max_requests_per_minute = 60;
    };

    LlmClient();
    explicit LlmClient(Config config);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    [[nodiscard]] LlmResponse complete(const LlmRequest& request);

    /**
     * @brief Build the JSON request body for the configured provider
     */
    [[nodiscard]] std::string build_body(const LlmRequest& request, const std::string& model) const;

    /**
     * @brief Extract the completion text from a provider response body
     * @return Empty string if the body has no completion
     */
    [[nodiscard]] static std::string extract_content(const std::string& body,
                                                     const std::string& provider);

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
        uint64_t rate_limited = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] LlmResponse call_api(const LlmRequest& request, const std::string& model);

    [[nodiscard]] bool check_rate_limit();

    Config config_;

    // Rate limiting
    uint32_t requests_this_minute_ = 0;
    std::chrono::steady_clock::time_point minute_start_ =
        std::chrono::steady_clock::now();
    std::mutex rate_mutex_;

    // Stats
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
    std::atomic<uint64_t> rate_limited_{0};
};

} // namespace privgate
