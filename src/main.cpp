#include "audit/audit_exporter.hpp"
#include "config/config_loader.hpp"
#include "core/masking.hpp"
#include "core/privacy_gate.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace privgate;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitBlocked = 3;

constexpr const char* kDefaultConfigFile = "config/privgate.toml";

struct CliOptions {
    std::optional<std::string> config_file;
    std::optional<std::string> policy;
    std::optional<AuditFormat> export_format;
    bool forward = false;
    std::vector<std::string> words;
};

void print_usage(const char* prog) {
    std::cerr << std::format(
        "Usage: {} [--config FILE] [--policy replace|warn|block] [--forward]\n"
        "          [--export csv|jsonl] [TEXT...]\n"
        "Reads TEXT from the arguments, or from stdin when none are given.\n", prog);
}

// Returns nullopt after printing the reason
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << std::format("Missing value for {}\n", arg);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.config_file = std::move(*v);
        } else if (arg == "--policy") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.policy = std::move(*v);
        } else if (arg == "--forward") {
            opts.forward = true;
        } else if (arg == "--export") {
            auto v = next();
            if (!v) return std::nullopt;
            const auto fmt = utils::to_lower(*v);
            if (fmt == "csv") {
                opts.export_format = AuditFormat::CSV;
            } else if (fmt == "jsonl") {
                opts.export_format = AuditFormat::JSONL;
            } else {
                std::cerr << std::format("Unknown export format '{}'\n", *v);
                return std::nullopt;
            }
        } else if (arg == "--") {
            for (++i; i < argc; ++i) opts.words.emplace_back(argv[i]);
        } else if (arg.starts_with("--")) {
            std::cerr << std::format("Unknown option {}\n", arg);
            return std::nullopt;
        } else {
            opts.words.push_back(arg);
        }
    }
    return opts;
}

std::string read_input(const std::vector<std::string>& words) {
    if (words.empty()) {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }
    std::string text;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) text += ' ';
        text += words[i];
    }
    return text;
}

nlohmann::json span_to_json(const Span& span) {
    return {
        {"type", detector_type_to_string(span.type)},
        {"start", span.start},
        {"end", span.end},
        {"text", span.text},
        {"sensitivity", sensitivity_to_string(span.sensitivity)},
    };
}

nlohmann::json log_entry_to_json(const MaskLogEntry& entry) {
    nlohmann::json j = {
        {"original", entry.original},
        {"mask", nullptr},
        {"type", detector_type_to_string(entry.type)},
        {"sensitivity", sensitivity_to_string(entry.sensitivity)},
        {"start", entry.start},
        {"end", entry.end},
    };
    if (entry.mask_token) j["mask"] = *entry.mask_token;
    return j;
}

nlohmann::json response_to_json(const GateResponse& r) {
    nlohmann::json j;
    j["submission_id"] = r.submission_id;
    j["policy"] = mask_policy_to_string(r.policy);
    j["text"] = r.final_text;
    j["corrected"] = r.corrected;
    j["outbound_text"] = r.outbound_text;
    j["blocked"] = r.blocked;

    j["spans"] = nlohmann::json::array();
    for (const auto& span : r.detection.spans) {
        j["spans"].push_back(span_to_json(span));
    }
    j["log"] = nlohmann::json::array();
    for (const auto& entry : r.masked.log) {
        j["log"].push_back(log_entry_to_json(entry));
    }
    j["warnings"] = r.warnings;

    if (r.llm_response) {
        j["llm_response"] = {
            {"success", r.llm_response->success},
            {"content", r.llm_response->content},
            {"error", r.llm_response->error},
            {"model", r.llm_response->model_used},
            {"latency_ms", r.llm_response->latency.count()},
        };
    }
    return j;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    // Configuration
    GateConfig config;
    const std::string config_file = opts->config_file.value_or(kDefaultConfigFile);
    if (opts->config_file || std::filesystem::exists(config_file)) {
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(std::format("{}: {}",
                error_category_to_string(ErrorCategory::CONFIG_ERROR), config_result.error_message));
            return kExitConfigError;
        }
        config = std::move(config_result.config);
    } else {
        utils::log::debug(std::format("{} not found, using defaults", config_file));
    }

    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    std::shared_ptr<PrivacyGate> gate;
    try {
        gate = GateBuilder::from_config(config);
    } catch (const std::exception& e) {
        utils::log::error(std::format("{}: Failed to initialize privacy gate: {}",
            error_category_to_string(ErrorCategory::CONFIG_ERROR), e.what()));
        return kExitConfigError;
    }

    GateRequest request;
    request.text = read_input(opts->words);
    request.policy = opts->policy.value_or(std::string(mask_policy_to_string(config.default_policy)));
    request.forward = opts->forward;

    auto result = gate->process(request);
    if (result.is_error()) {
        std::cerr << std::format("{}: {}\n",
            error_category_to_string(result.error_category()), result.error_message());
        return kExitUsage;
    }

    const auto& response = result.value();
    if (opts->export_format == AuditFormat::CSV) {
        std::cout << AuditExporter::to_csv(response.masked.log);
    } else if (opts->export_format == AuditFormat::JSONL) {
        std::cout << AuditExporter::to_jsonl(response.masked.log);
    } else {
        // Replace invalid UTF-8 rather than throwing on user input
        std::cout << response_to_json(response).dump(2, ' ', false,
            nlohmann::json::error_handler_t::replace) << '\n';
    }

    return response.blocked ? kExitBlocked : kExitOk;
}
