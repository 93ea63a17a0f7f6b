#include "config/config_loader.hpp"
#include "core/masking.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>
#include <unordered_map>

using namespace std::string_literals;

namespace privgate {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = ConfigLoader::expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// Integer setting that must fit [0, max]; toml++ hands back int64_t and a
// plain cast to an unsigned field wraps negatives
int64_t read_count(const toml::table& tbl, std::string_view section, std::string_view key,
                   int64_t fallback,
                   int64_t max = std::numeric_limits<uint32_t>::max()) {
    const int64_t value = tbl[key].value_or(fallback);
    if (value < 0 || value > max) {
        throw std::runtime_error(std::format("{}.{} must be between 0 and {} (got {})",
                                             section, key, max, value));
    }
    return value;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    if (!utils::log::parse_level(cfg.level)) {
        throw std::runtime_error(std::format("Invalid logging.level '{}'", cfg.level));
    }
    return cfg;
}

MaskPolicy extract_default_policy(const toml::table& root) {
    const auto* masking = root["masking"].as_table();
    if (!masking) return MaskPolicy::REPLACE;

    const std::string name = (*masking)["default_policy"].value_or("replace"s);
    const auto policy = parse_mask_policy(name);
    if (policy.is_error()) {
        throw std::runtime_error("masking.default_policy: " + policy.error_message());
    }
    return policy.value();
}

DetectorConfig extract_detectors(const toml::table& root) {
    DetectorConfig cfg;
    const auto* detectors = root["detectors"].as_table();
    if (!detectors) return cfg;
    const auto& d = *detectors;

    cfg.patterns.email = d["email"].value_or(true);
    cfg.patterns.url = d["url"].value_or(true);
    cfg.patterns.credit_card = d["credit_card"].value_or(true);
    cfg.patterns.national_id = d["national_id"].value_or(true);
    cfg.patterns.long_number = d["long_number"].value_or(true);
    cfg.patterns.luhn_check = d["luhn_check"].value_or(false);
    cfg.patterns.validate_ssn = d["validate_ssn"].value_or(false);
    cfg.phone = d["phone"].value_or(true);
    cfg.entities = d["entities"].value_or(true);
    cfg.parallel = d["parallel"].value_or(true);
    return cfg;
}

EntityRecognizerConfig extract_entity_recognizer(const toml::table& root) {
    EntityRecognizerConfig cfg;
    const auto* section = root["entity_recognizer"].as_table();
    if (!section) return cfg;
    const auto& s = *section;

    static const std::unordered_map<std::string, RecognizerKind> kinds = {
        {"none",      RecognizerKind::NONE},
        {"gazetteer", RecognizerKind::GAZETTEER},
        {"http",      RecognizerKind::HTTP},
    };
    const std::string kind = utils::to_lower(s["kind"].value_or("none"s));
    const auto it = kinds.find(kind);
    if (it == kinds.end()) {
        throw std::runtime_error(std::format(
            "Invalid entity_recognizer.kind '{}' (expected none, gazetteer or http)", kind));
    }
    cfg.kind = it->second;

    cfg.gazetteer_file = s["gazetteer_file"].value_or(""s);
    cfg.name_heuristic = s["name_heuristic"].value_or(false);

    if (const auto* arr = s["entries"].as_array()) {
        for (const auto& elem : *arr) {
            const auto* e = elem.as_table();
            if (!e) continue;
            std::string label = (*e)["label"].value_or(""s);
            std::string text = (*e)["text"].value_or(""s);
            if (label.empty() || text.empty()) continue;
            cfg.entries.push_back({std::move(label), std::move(text)});
        }
    }

    cfg.http.endpoint = s["endpoint"].value_or(cfg.http.endpoint);
    cfg.http.path = s["path"].value_or(cfg.http.path);
    cfg.http.timeout_ms = static_cast<uint32_t>(read_count(s, "entity_recognizer", "timeout_ms", 2000));

    if (cfg.kind == RecognizerKind::HTTP && cfg.http.endpoint.empty()) {
        throw std::runtime_error("entity_recognizer.endpoint is required for kind = \"http\"");
    }
    return cfg;
}

CorrectionConfig extract_correction(const toml::table& root) {
    CorrectionConfig cfg;
    const auto* section = root["correction"].as_table();
    if (!section) return cfg;
    const auto& c = *section;

    cfg.enabled = c["enabled"].value_or(false);
    cfg.preserve_pii = c["preserve_pii"].value_or(true);
    cfg.languagetool.endpoint = c["endpoint"].value_or(cfg.languagetool.endpoint);
    cfg.languagetool.language = c["language"].value_or(cfg.languagetool.language);
    cfg.languagetool.timeout_ms = static_cast<uint32_t>(read_count(c, "correction", "timeout_ms", 5000));
    return cfg;
}

ForwardingConfig extract_llm(const toml::table& root) {
    ForwardingConfig cfg;
    const auto* section = root["llm"].as_table();
    if (!section) return cfg;
    const auto& l = *section;

    cfg.client.enabled = l["enabled"].value_or(false);
    cfg.client.provider = utils::to_lower(l["provider"].value_or("openai"s));
    cfg.client.endpoint = l["endpoint"].value_or(cfg.client.endpoint);
    cfg.client.api_key = l["api_key"].value_or(""s);
    cfg.client.default_model = l["model"].value_or(cfg.client.default_model);
    cfg.client.timeout_ms = static_cast<uint32_t>(read_count(l, "llm", "timeout_ms", 30000));
    cfg.client.max_retries = static_cast<uint32_t>(read_count(l, "llm", "max_retries", 2));
    cfg.client.max_requests_per_minute =
        static_cast<uint32_t>(read_count(l, "llm", "max_requests_per_minute", 60));
    cfg.system_prompt = l["system_prompt"].value_or(""s);
    cfg.temperature = l["temperature"].value_or(0.2);
    cfg.max_tokens = static_cast<int>(
        read_count(l, "llm", "max_tokens", 800, std::numeric_limits<int>::max()));

    if (cfg.client.provider != "openai" && cfg.client.provider != "anthropic") {
        throw std::runtime_error(std::format(
            "Invalid llm.provider '{}' (expected openai or anthropic)", cfg.client.provider));
    }
    return cfg;
}

AuditConfig extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* section = root["audit"].as_table();
    if (!section) return cfg;
    const auto& a = *section;

    cfg.enabled = a["enabled"].value_or(false);
    cfg.output_file = a["output_file"].value_or(cfg.output_file);
    cfg.max_file_size_bytes = static_cast<size_t>(read_count(a, "audit", "max_file_size_bytes",
        static_cast<int64_t>(cfg.max_file_size_bytes), std::numeric_limits<int64_t>::max()));
    cfg.max_files = static_cast<int>(
        read_count(a, "audit", "max_files", 5, std::numeric_limits<int>::max()));

    const std::string format = utils::to_lower(a["format"].value_or("jsonl"s));
    if (format == "jsonl") {
        cfg.format = AuditFormat::JSONL;
    } else if (format == "csv") {
        cfg.format = AuditFormat::CSV;
    } else {
        throw std::runtime_error(std::format("Invalid audit.format '{}' (expected jsonl or csv)", format));
    }
    return cfg;
}

GateConfig extract_all(const toml::table& root) {
    GateConfig cfg;
    cfg.logging = extract_logging(root);
    cfg.default_policy = extract_default_policy(root);
    cfg.detectors = extract_detectors(root);
    cfg.entity_recognizer = extract_entity_recognizer(root);
    cfg.correction = extract_correction(root);
    cfg.llm = extract_llm(root);
    cfg.audit = extract_audit(root);
    return cfg;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto root = toml::parse_file(config_path);
        expand_env_vars_recursive(root);
        return LoadResult::ok(extract_all(root));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse {}: {} (line {})",
            config_path, e.description(), e.source().begin.line));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Invalid config {}: {}", config_path, e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto root = toml::parse(toml_content);
        expand_env_vars_recursive(root);
        return LoadResult::ok(extract_all(root));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {} (line {})",
            e.description(), e.source().begin.line));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Invalid config: {}", e.what()));
    }
}

} // namespace privgate
