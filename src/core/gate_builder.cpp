#include "core/gate_builder.hpp"
#include "audit/audit_writer.hpp"
#include "audit/file_sink.hpp"
#include "config/config_loader.hpp"
#include "core/privacy_gate.hpp"
#include "core/utils.hpp"
#include "detector/detector_registry.hpp"
#include "detector/entity_detector.hpp"
#include "detector/phone_detector.hpp"

#include <format>
#include <stdexcept>

namespace privgate {

namespace {

std::shared_ptr<const IEntityRecognizer> make_recognizer(const EntityRecognizerConfig& cfg) {
    switch (cfg.kind) {
        case RecognizerKind::NONE:
            return nullptr;
        case RecognizerKind::GAZETTEER: {
            auto entries = cfg.entries;
            if (!cfg.gazetteer_file.empty()) {
                auto from_file = GazetteerEntityRecognizer::load_file(cfg.gazetteer_file);
                entries.insert(entries.end(),
                    std::make_move_iterator(from_file.begin()),
                    std::make_move_iterator(from_file.end()));
            }
            return std::make_shared<GazetteerEntityRecognizer>(std::move(entries), cfg.name_heuristic);
        }
        case RecognizerKind::HTTP:
            return std::make_shared<HttpEntityRecognizer>(cfg.http);
    }
    return nullptr;
}

std::shared_ptr<DetectorRegistry> make_registry(const GateConfig& config) {
    const auto& d = config.detectors;
    auto registry = std::make_shared<DetectorRegistry>(d.parallel);

    for (auto& detector : make_pattern_detectors(d.patterns)) {
        registry->add(std::move(detector));
    }
    if (d.phone) {
        registry->add(std::make_shared<PhoneDetector>());
    }
    if (d.entities) {
        auto recognizer = make_recognizer(config.entity_recognizer);
        if (recognizer) {
            if (!EntityModel::instance().initialize(std::move(recognizer))) {
                utils::log::debug("Entity recognizer already initialized, keeping existing one");
            }
        }
        registry->add(std::make_shared<EntityDetector>());
    }
    return registry;
}

} // anonymous namespace

std::shared_ptr<PrivacyGate> GateBuilder::build() {
    if (!c_.detectors) throw std::runtime_error("GateBuilder: detectors are required");

    return std::make_shared<PrivacyGate>(std::move(c_));
}

std::shared_ptr<PrivacyGate> GateBuilder::from_config(const GateConfig& config) {
    GateBuilder builder;

    auto registry = make_registry(config);
    utils::log::info(std::format("Detectors registered: {} ({})",
        registry->size(), registry->parallel() ? "parallel" : "sequential"));
    builder.with_detectors(std::move(registry));

    if (config.correction.enabled) {
        builder.with_corrector(std::make_shared<LanguageToolCorrector>(config.correction.languagetool))
               .with_preserve_pii(config.correction.preserve_pii);
        utils::log::info(std::format("Grammar correction enabled: {}", config.correction.languagetool.endpoint));
    }

    if (config.llm.client.enabled) {
        builder.with_llm_client(std::make_shared<LlmClient>(config.llm.client))
               .with_system_prompt(config.llm.system_prompt)
               .with_temperature(config.llm.temperature)
               .with_max_tokens(config.llm.max_tokens);
        utils::log::info(std::format("LLM forwarding enabled: {} ({})",
            config.llm.client.provider, config.llm.client.default_model));
    }

    if (config.audit.enabled) {
        FileSink::Config sink_cfg;
        sink_cfg.output_file = config.audit.output_file;
        sink_cfg.max_file_size_bytes = config.audit.max_file_size_bytes;
        sink_cfg.max_files = config.audit.max_files;
        if (config.audit.format == AuditFormat::CSV) {
            sink_cfg.header = std::string(AuditExporter::kCsvHeader);
        }
        builder.with_audit_writer(std::make_shared<AuditWriter>(
            std::make_unique<FileSink>(sink_cfg), config.audit.format));
        utils::log::info(std::format("Audit log: {}", config.audit.output_file));
    }

    return builder.build();
}

} // namespace privgate
