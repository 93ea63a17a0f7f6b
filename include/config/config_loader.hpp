#pragma once

#include "audit/audit_exporter.hpp"
#include "core/llm_client.hpp"
#include "core/types.hpp"
#include "correction/grammar_corrector.hpp"
#include "detector/gazetteer_recognizer.hpp"
#include "detector/http_entity_recognizer.hpp"
#include "detector/pattern_detector.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace privgate {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Detector Config
// ============================================================================

struct DetectorConfig {
    PatternDetectorOptions patterns;
    bool phone = true;
    bool entities = true;
    bool parallel = true;
};

enum class RecognizerKind { NONE, GAZETTEER, HTTP };

struct EntityRecognizerConfig {
    RecognizerKind kind = RecognizerKind::NONE;
    std::string gazetteer_file;
    std::vector<GazetteerEntityRecognizer::Entry> entries;  // Inline [[entity_recognizer.entries]]
    bool name_heuristic = false;
    HttpEntityRecognizer::Config http;
};

// ============================================================================
// Correction Config
// ============================================================================

struct CorrectionConfig {
    bool enabled = false;
    bool preserve_pii = true;  // Never edit inside detected spans
    LanguageToolCorrector::Config languagetool;
};

// ============================================================================
// LLM Config (forwarding)
// ============================================================================

struct ForwardingConfig {
    LlmClient::Config client;
    std::string system_prompt;
    double temperature = 0.2;
    int max_tokens = 800;
};

// ============================================================================
// Audit Config
// ============================================================================

struct AuditConfig {
    bool enabled = false;
    std::string output_file = "logs/redactions.jsonl";
    AuditFormat format = AuditFormat::JSONL;
    size_t max_file_size_bytes = 10ULL * 1024 * 1024;
    int max_files = 5;
};

// ============================================================================
// GateConfig - Complete parsed configuration
// ============================================================================

struct GateConfig {
    LoggingConfig logging;
    MaskPolicy default_policy = MaskPolicy::REPLACE;
    DetectorConfig detectors;
    EntityRecognizerConfig entity_recognizer;
    CorrectionConfig correction;
    ForwardingConfig llm;
    AuditConfig audit;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML (toml++)
// ============================================================================

/**
 * Missing sections and keys fall back to the defaults above. String values
 * may reference environment variables as ${VAR_NAME}.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GateConfig config;

        static LoadResult ok(GateConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to privgate.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Expand ${VAR_NAME} references from the environment
     * @throws std::runtime_error on an unclosed ${
     */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);
};

} // namespace privgate
