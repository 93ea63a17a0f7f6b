#include <catch2/catch_test_macros.hpp>
#include "core/llm_client.hpp"

#include <nlohmann/json.hpp>

using namespace privgate;

static LlmClient::Config enabled_config() {
    LlmClient::Config cfg;
    cfg.enabled = true;
    cfg.endpoint = "http://127.0.0.1:1";
    cfg.api_key = "test-key";
    cfg.default_model = "gpt-4o-mini";
    cfg.timeout_ms = 1000;
    cfg.max_retries = 0;
    cfg.max_requests_per_minute = 60;
    return cfg;
}

TEST_CASE("LlmClient", "[llm_client]") {

    SECTION("Disabled returns error") {
        LlmClient client;
        REQUIRE_FALSE(client.is_enabled());

        LlmRequest req;
        req.prompt = "test";
        auto resp = client.complete(req);
        REQUIRE_FALSE(resp.success);
        REQUIRE(resp.error.find("disabled") != std::string::npos);

        auto stats = client.get_stats();
        REQUIRE(stats.total_requests == 1);
        REQUIRE(stats.api_calls == 0);
    }

    SECTION("API call to unreachable endpoint returns error") {
        LlmClient client(enabled_config());
        REQUIRE(client.is_enabled());

        LlmRequest req;
        req.prompt = "Contact me at <EMAIL_REDACTED_1>";
        auto resp = client.complete(req);
        REQUIRE_FALSE(resp.success);
        REQUIRE(resp.error.find("connection error") != std::string::npos);
        REQUIRE(resp.model_used == "gpt-4o-mini");

        auto stats = client.get_stats();
        REQUIRE(stats.total_requests == 1);
        REQUIRE(stats.api_calls == 1);
        REQUIRE(stats.api_errors == 1);
    }

    SECTION("Request model overrides the default") {
        LlmClient client(enabled_config());
        LlmRequest req;
        req.prompt = "x";
        req.model = "custom-model";
        REQUIRE(client.complete(req).model_used == "custom-model");
    }

    SECTION("No API key returns error") {
        auto cfg = enabled_config();
        cfg.api_key = "";
        LlmClient client(cfg);

        LlmRequest req;
        req.prompt = "test";
        auto resp = client.complete(req);
        REQUIRE_FALSE(resp.success);
        REQUIRE(resp.error.find("API key") != std::string::npos);
    }

    SECTION("Rate limiting") {
        auto cfg = enabled_config();
        cfg.api_key = "";  // Fail fast after passing the rate limit
        cfg.max_requests_per_minute = 2;
        LlmClient client(cfg);

        LlmRequest req;
        req.prompt = "q";
        (void)client.complete(req);
        (void)client.complete(req);

        auto resp = client.complete(req);
        REQUIRE_FALSE(resp.success);
        REQUIRE(resp.error.find("Rate limited") != std::string::npos);

        auto stats = client.get_stats();
        REQUIRE(stats.rate_limited == 1);
        REQUIRE(stats.api_calls == 2);
    }
}

TEST_CASE("LlmClient request body", "[llm_client]") {
    LlmRequest req;
    req.prompt = "Summarize <PERSON_REDACTED_1>'s note";
    req.system_prompt = "Be brief.";
    req.temperature = 0.5;
    req.max_tokens = 100;

    SECTION("OpenAI chat format") {
        LlmClient client(enabled_config());
        const auto body = nlohmann::json::parse(client.build_body(req, "m1"));

        REQUIRE(body["model"] == "m1");
        REQUIRE(body["max_tokens"] == 100);
        REQUIRE(body["temperature"] == 0.5);
        REQUIRE(body["messages"].size() == 2);
        REQUIRE(body["messages"][0]["role"] == "system");
        REQUIRE(body["messages"][1]["role"] == "user");
        REQUIRE(body["messages"][1]["content"] == req.prompt);
    }

    SECTION("Anthropic messages format") {
        auto cfg = enabled_config();
        cfg.provider = "anthropic";
        LlmClient client(cfg);
        const auto body = nlohmann::json::parse(client.build_body(req, "m2"));

        REQUIRE(body["system"] == "Be brief.");
        REQUIRE_FALSE(body.contains("temperature"));
        REQUIRE(body["messages"].size() == 1);
        REQUIRE(body["messages"][0]["content"] == req.prompt);
    }

    SECTION("No system prompt") {
        req.system_prompt.clear();
        LlmClient client(enabled_config());
        const auto body = nlohmann::json::parse(client.build_body(req, "m1"));
        REQUIRE(body["messages"].size() == 1);
    }
}

TEST_CASE("LlmClient response extraction", "[llm_client]") {
    SECTION("OpenAI") {
        const std::string body =
            R"({"choices":[{"message":{"role":"assistant","content":"  Hello there \n"}}]})";
        REQUIRE(LlmClient::extract_content(body, "openai") == "Hello there");
    }

    SECTION("Anthropic concatenates text blocks") {
        const std::string body =
            R"({"content":[{"type":"text","text":"Hello "},{"type":"tool_use"},{"type":"text","text":"world"}]})";
        REQUIRE(LlmClient::extract_content(body, "anthropic") == "Hello world");
    }

    SECTION("Malformed or empty bodies") {
        REQUIRE(LlmClient::extract_content("not json", "openai").empty());
        REQUIRE(LlmClient::extract_content(R"({"choices":[]})", "openai").empty());
        REQUIRE(LlmClient::extract_content(R"({"content":"text"})", "anthropic").empty());
    }
}
