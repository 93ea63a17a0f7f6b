#include "core/privacy_gate.hpp"
#include "audit/audit_writer.hpp"
#include "core/masking.hpp"
#include "core/utils.hpp"
#include "correction/grammar_corrector.hpp"
#include "detector/detector_registry.hpp"

#include <format>

namespace privgate {

PrivacyGate::PrivacyGate(GateComponents components)
    : c_(std::move(components)) {}

Result<GateResponse> PrivacyGate::process(const GateRequest& request) {
    total_submissions_.fetch_add(1, std::memory_order_relaxed);

    // Stage 1: Policy
    const auto policy = parse_mask_policy(request.policy);
    if (policy.is_error()) {
        utils::log::warn(std::format("Rejected submission: {}", policy.error_message()));
        return Result<GateResponse>::error(policy.error_category(), policy.error_message());
    }

    GateResponse response;
    response.submission_id = utils::generate_uuid();
    response.policy = policy.value();
    response.original_text = request.text;
    response.final_text = request.text;

    // Stage 2: Detect on the raw text
    auto report = c_.detectors->detect(response.original_text);
    response.detection = std::move(report.result);
    response.warnings = std::move(report.warnings);

    // Stage 3: Correct, then detect again on the new text version
    if (c_.corrector) {
        correct_and_redetect(response);
    }

    // Stage 4: Mask the final text version
    response.masked = MaskingEngine::apply(response.final_text, response.detection, response.policy);
    spans_detected_.fetch_add(response.detection.size(), std::memory_order_relaxed);

    // Stage 5: Block decision
    response.blocked = response.policy == MaskPolicy::BLOCK &&
                       MaskingEngine::is_block_eligible(response.detection);

    if (response.blocked) {
        submissions_blocked_.fetch_add(1, std::memory_order_relaxed);
        utils::log::info(std::format("Submission {} blocked: {} sensitive span(s)",
            response.submission_id, response.detection.size()));
    } else if (response.policy == MaskPolicy::REPLACE) {
        response.outbound_text = response.masked.text;
    } else {
        response.outbound_text = response.final_text;
    }

    // Stage 6: Forward
    if (request.forward) {
        if (response.blocked) {
            response.warnings.push_back(std::format("{}: Forwarding skipped, submission blocked",
                error_category_to_string(ErrorCategory::BLOCKED)));
        } else {
            forward(response);
        }
    }

    // Stage 7: Audit
    emit_audit(response);

    utils::log::debug(std::format("Submission {} processed: policy={} spans={} blocked={}",
        response.submission_id, mask_policy_to_string(response.policy),
        response.detection.size(), utils::booltostr(response.blocked)));

    return Result<GateResponse>::ok(std::move(response));
}

void PrivacyGate::correct_and_redetect(GateResponse& response) {
    static const std::vector<Span> kNoProtection;
    const auto& protected_spans = c_.preserve_pii_on_correction
        ? response.detection.spans
        : kNoProtection;

    std::string corrected;
    try {
        corrected = c_.corrector->correct(response.original_text, protected_spans);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Correction via {} failed: {}", c_.corrector->name(), e.what()));
        response.warnings.push_back(std::format("{}: Correction skipped: {}",
            error_category_to_string(ErrorCategory::UPSTREAM_ERROR), e.what()));
        return;
    }

    if (corrected == response.original_text) {
        return;
    }

    // Spans of the raw text do not apply to the corrected text
    response.corrected = true;
    response.final_text = std::move(corrected);

    auto report = c_.detectors->detect(response.final_text);
    response.detection = std::move(report.result);
    response.warnings.insert(response.warnings.end(),
        std::make_move_iterator(report.warnings.begin()),
        std::make_move_iterator(report.warnings.end()));
}

void PrivacyGate::forward(GateResponse& response) {
    if (!c_.llm_client || !c_.llm_client->is_enabled()) {
        response.warnings.push_back(std::format("{}: Forwarding skipped, LLM client is disabled",
            error_category_to_string(ErrorCategory::UPSTREAM_ERROR)));
        return;
    }

    LlmRequest llm_request;
    llm_request.prompt = response.outbound_text;
    llm_request.system_prompt = c_.system_prompt;
    llm_request.temperature = c_.temperature;
    llm_request.max_tokens = c_.max_tokens;

    auto llm_response = c_.llm_client->complete(llm_request);
    if (llm_response.success) {
        forwarded_.fetch_add(1, std::memory_order_relaxed);
    } else {
        response.warnings.push_back(std::format("{}: Forwarding failed: {}",
            error_category_to_string(ErrorCategory::UPSTREAM_ERROR), llm_response.error));
    }
    response.llm_response = std::move(llm_response);
}

void PrivacyGate::emit_audit(const GateResponse& response) {
    if (!c_.audit_writer) return;

    AuditRecord record;
    record.submission_id = response.submission_id;
    record.timestamp = std::chrono::system_clock::now();
    record.policy = response.policy;
    record.blocked = response.blocked;
    record.corrected = response.corrected;
    record.span_count = response.detection.size();
    record.entries = response.masked.log;
    c_.audit_writer->record(record);
}

} // namespace privgate
