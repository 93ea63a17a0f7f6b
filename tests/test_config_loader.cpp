#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace privgate;

TEST_CASE("Config: empty document yields defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.default_policy == MaskPolicy::REPLACE);
    CHECK(cfg.detectors.patterns.email);
    CHECK(cfg.detectors.phone);
    CHECK(cfg.detectors.entities);
    CHECK(cfg.detectors.parallel);
    CHECK_FALSE(cfg.detectors.patterns.luhn_check);
    CHECK(cfg.entity_recognizer.kind == RecognizerKind::NONE);
    CHECK_FALSE(cfg.correction.enabled);
    CHECK(cfg.correction.preserve_pii);
    CHECK_FALSE(cfg.llm.client.enabled);
    CHECK_FALSE(cfg.audit.enabled);
    CHECK(cfg.audit.format == AuditFormat::JSONL);
}

TEST_CASE("Config: full document", "[config]") {
    const std::string toml = R"(
[logging]
level = "debug"

[masking]
default_policy = "Block"

[detectors]
url = false
long_number = false
luhn_check = true
validate_ssn = true
parallel = false

[entity_recognizer]
kind = "gazetteer"
name_heuristic = true

[[entity_recognizer.entries]]
label = "ORG"
text = "Acme Corp"

[[entity_recognizer.entries]]
label = "GPE"
text = "Paris"

[[entity_recognizer.entries]]
label = "PERSON"

[correction]
enabled = true
endpoint = "http://lt:8010"
language = "en-GB"
preserve_pii = false

[llm]
enabled = true
provider = "Anthropic"
endpoint = "https://api.anthropic.com"
api_key = "k"
model = "claude-test"
max_retries = 1
temperature = 0.7
max_tokens = 256
system_prompt = "Answer briefly."

[audit]
enabled = true
output_file = "/tmp/privgate-audit.csv"
format = "csv"
max_files = 3
)";

    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.default_policy == MaskPolicy::BLOCK);

    CHECK_FALSE(cfg.detectors.patterns.url);
    CHECK_FALSE(cfg.detectors.patterns.long_number);
    CHECK(cfg.detectors.patterns.email);
    CHECK(cfg.detectors.patterns.luhn_check);
    CHECK(cfg.detectors.patterns.validate_ssn);
    CHECK_FALSE(cfg.detectors.parallel);

    CHECK(cfg.entity_recognizer.kind == RecognizerKind::GAZETTEER);
    CHECK(cfg.entity_recognizer.name_heuristic);
    REQUIRE(cfg.entity_recognizer.entries.size() == 2);
    CHECK(cfg.entity_recognizer.entries[0].label == "ORG");
    CHECK(cfg.entity_recognizer.entries[0].phrase == "Acme Corp");

    CHECK(cfg.correction.enabled);
    CHECK_FALSE(cfg.correction.preserve_pii);
    CHECK(cfg.correction.languagetool.endpoint == "http://lt:8010");
    CHECK(cfg.correction.languagetool.language == "en-GB");

    CHECK(cfg.llm.client.enabled);
    CHECK(cfg.llm.client.provider == "anthropic");
    CHECK(cfg.llm.client.default_model == "claude-test");
    CHECK(cfg.llm.client.max_retries == 1);
    CHECK(cfg.llm.temperature == 0.7);
    CHECK(cfg.llm.max_tokens == 256);
    CHECK(cfg.llm.system_prompt == "Answer briefly.");

    CHECK(cfg.audit.enabled);
    CHECK(cfg.audit.format == AuditFormat::CSV);
    CHECK(cfg.audit.output_file == "/tmp/privgate-audit.csv");
    CHECK(cfg.audit.max_files == 3);
}

TEST_CASE("Config: http recognizer", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[entity_recognizer]
kind = "http"
endpoint = "http://ner:9000"
path = "/v1/entities"
timeout_ms = 750
)");
    REQUIRE(result.success);
    const auto& er = result.config.entity_recognizer;
    CHECK(er.kind == RecognizerKind::HTTP);
    CHECK(er.http.endpoint == "http://ner:9000");
    CHECK(er.http.path == "/v1/entities");
    CHECK(er.http.timeout_ms == 750);
}

TEST_CASE("Config: invalid values are rejected", "[config]") {
    SECTION("Unknown policy") {
        const auto r = ConfigLoader::load_from_string("[masking]\ndefault_policy = \"redact\"\n");
        REQUIRE_FALSE(r.success);
        CHECK(r.error_message.find("default_policy") != std::string::npos);
    }

    SECTION("Unknown log level") {
        CHECK_FALSE(ConfigLoader::load_from_string("[logging]\nlevel = \"loud\"\n").success);
    }

    SECTION("Unknown recognizer kind") {
        const auto r = ConfigLoader::load_from_string("[entity_recognizer]\nkind = \"spacy\"\n");
        REQUIRE_FALSE(r.success);
        CHECK(r.error_message.find("spacy") != std::string::npos);
    }

    SECTION("Http recognizer without endpoint") {
        CHECK_FALSE(ConfigLoader::load_from_string(
            "[entity_recognizer]\nkind = \"http\"\nendpoint = \"\"\n").success);
    }

    SECTION("Unknown provider") {
        CHECK_FALSE(ConfigLoader::load_from_string("[llm]\nprovider = \"other\"\n").success);
    }

    SECTION("Unknown audit format") {
        CHECK_FALSE(ConfigLoader::load_from_string("[audit]\nformat = \"pdf\"\n").success);
    }

    SECTION("Negative counts") {
        const auto r = ConfigLoader::load_from_string("[llm]\nmax_retries = -1\n");
        REQUIRE_FALSE(r.success);
        CHECK(r.error_message.find("llm.max_retries") != std::string::npos);
        CHECK(r.error_message.find("-1") != std::string::npos);

        CHECK_FALSE(ConfigLoader::load_from_string("[correction]\ntimeout_ms = -5\n").success);
        CHECK_FALSE(ConfigLoader::load_from_string("[audit]\nmax_files = -2\n").success);
        CHECK_FALSE(ConfigLoader::load_from_string("[audit]\nmax_file_size_bytes = -1\n").success);
    }

    SECTION("Counts too large for their field") {
        const auto r = ConfigLoader::load_from_string("[llm]\ntimeout_ms = 5000000000\n");
        REQUIRE_FALSE(r.success);
        CHECK(r.error_message.find("llm.timeout_ms") != std::string::npos);
    }

    SECTION("Zero is accepted") {
        const auto r = ConfigLoader::load_from_string("[llm]\nmax_retries = 0\n");
        REQUIRE(r.success);
        CHECK(r.config.llm.client.max_retries == 0);
    }

    SECTION("Syntax error reports the line") {
        const auto r = ConfigLoader::load_from_string("[masking]\ndefault_policy = \n");
        REQUIRE_FALSE(r.success);
        CHECK(r.error_message.find("line 2") != std::string::npos);
    }
}

TEST_CASE("Config: environment variable expansion", "[config][env]") {
    ::setenv("PRIVGATE_TEST_KEY", "sk-123", 1);
    ::unsetenv("PRIVGATE_TEST_MISSING");

    const auto result = ConfigLoader::load_from_string(R"(
[llm]
api_key = "${PRIVGATE_TEST_KEY}"
system_prompt = "a${PRIVGATE_TEST_MISSING}b"
)");
    REQUIRE(result.success);
    CHECK(result.config.llm.client.api_key == "sk-123");
    CHECK(result.config.llm.system_prompt == "ab");

    SECTION("Unclosed reference") {
        const auto r = ConfigLoader::load_from_string("[llm]\napi_key = \"${OOPS\"\n");
        REQUIRE_FALSE(r.success);
        CHECK(r.error_message.find("Unclosed env var") != std::string::npos);
    }

    ::unsetenv("PRIVGATE_TEST_KEY");
}

TEST_CASE("Config: load from file", "[config]") {
    const std::string path = "/tmp/privgate_test_config.toml";
    {
        std::ofstream out(path);
        out << "[masking]\ndefault_policy = \"warn\"\n";
    }

    const auto result = ConfigLoader::load_from_file(path);
    REQUIRE(result.success);
    CHECK(result.config.default_policy == MaskPolicy::WARN);

    const auto missing = ConfigLoader::load_from_file("/nonexistent/privgate.toml");
    CHECK_FALSE(missing.success);
    CHECK(missing.error_message.find("/nonexistent/privgate.toml") != std::string::npos);

    std::filesystem::remove(path);
}
