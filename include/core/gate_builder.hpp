#pragma once

#include <memory>
#include <string>

namespace privgate {

// Forward declarations
class DetectorRegistry;
class IGrammarCorrector;
class LlmClient;
class AuditWriter;
class PrivacyGate;
struct GateConfig;

/**
 * @brief All components that PrivacyGate needs, grouped in a single struct.
 */
struct GateComponents {
    // Required
    std::shared_ptr<const DetectorRegistry> detectors;

    // Optional (nullptr = disabled)
    std::shared_ptr<const IGrammarCorrector> corrector;
    std::shared_ptr<LlmClient> llm_client;
    std::shared_ptr<AuditWriter> audit_writer;

    // Feature flags
    bool preserve_pii_on_correction = true;

    // Forwarding request parameters
    std::string system_prompt;
    double temperature = 0.2;
    int max_tokens = 800;
};

/**
 * @brief Builder pattern for PrivacyGate construction.
 *
 * Usage:
 *   auto gate = GateBuilder()
 *       .with_detectors(registry)
 *       .with_corrector(corrector)   // optional
 *       .with_llm_client(client)     // optional
 *       .build();
 */
class GateBuilder {
public:
    GateBuilder& with_detectors(std::shared_ptr<const DetectorRegistry> p)    { c_.detectors = std::move(p); return *this; }
    GateBuilder& with_corrector(std::shared_ptr<const IGrammarCorrector> p)   { c_.corrector = std::move(p); return *this; }
    GateBuilder& with_llm_client(std::shared_ptr<LlmClient> p)                { c_.llm_client = std::move(p); return *this; }
    GateBuilder& with_audit_writer(std::shared_ptr<AuditWriter> p)            { c_.audit_writer = std::move(p); return *this; }
    GateBuilder& with_preserve_pii(bool enabled)                              { c_.preserve_pii_on_correction = enabled; return *this; }
    GateBuilder& with_system_prompt(std::string prompt)                       { c_.system_prompt = std::move(prompt); return *this; }
    GateBuilder& with_temperature(double t)                                   { c_.temperature = t; return *this; }
    GateBuilder& with_max_tokens(int n)                                       { c_.max_tokens = n; return *this; }

    /**
     * @brief Build the PrivacyGate from accumulated components.
     * @throws std::runtime_error if required components are missing.
     */
    [[nodiscard]] std::shared_ptr<PrivacyGate> build();

    /**
     * @brief Wire every component described by a loaded config
     *
     * Installs the configured entity recognizer into EntityModel (once per
     * process) and opens the audit sink.
     * @throws std::runtime_error if a component cannot be created
     */
    [[nodiscard]] static std::shared_ptr<PrivacyGate> from_config(const GateConfig& config);

private:
    GateComponents c_;
};

} // namespace privgate
