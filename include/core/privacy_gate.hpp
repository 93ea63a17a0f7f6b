#pragma once

#include "core/error.hpp"
#include "core/gate_builder.hpp"
#include "core/llm_client.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace privgate {

/**
 * @brief One submission to the gate
 */
struct GateRequest {
    std::string text;
    std::string policy = "replace";  // replace | warn | block (case-insensitive)
    bool forward = false;            // Send outbound text to the LLM client
};

struct GateResponse {
    std::string submission_id;
    MaskPolicy policy = MaskPolicy::REPLACE;

    std::string original_text;
    std::string final_text;          // After correction (== original_text when off)
    bool corrected = false;

    DetectionResult detection;       // Spans of final_text
    MaskOutcome masked;              // Policy applied to final_text

    bool blocked = false;
    std::string outbound_text;       // What may leave the gate; empty when blocked

    std::optional<LlmResponse> llm_response;
    std::vector<std::string> warnings;
};

/**
 * @brief Privacy gate coordinator
 *
 * Stages:
 * 1. Policy parse (INVALID_POLICY stops here)
 * 2. Detect on the raw text
 * 3. Correct (optional), then detect again on the corrected text
 * 4. Mask the final text version
 * 5. Block decision
 * 6. Forward outbound text (optional, never raw text)
 * 7. Audit
 *
 * Every span, mask and log entry in the response refers to final_text.
 * Thread-safe: a submission only touches its own locals and the shared,
 * read-only components.
 */
class PrivacyGate {
public:
    explicit PrivacyGate(GateComponents components);

    /**
     * @brief Process one submission
     * @return Response, or INVALID_POLICY
     */
    [[nodiscard]] Result<GateResponse> process(const GateRequest& request);

    struct Stats {
        uint64_t total_submissions;
        uint64_t submissions_blocked;
        uint64_t spans_detected;
        uint64_t forwarded;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_submissions = total_submissions_.load(std::memory_order_relaxed),
            .submissions_blocked = submissions_blocked_.load(std::memory_order_relaxed),
            .spans_detected = spans_detected_.load(std::memory_order_relaxed),
            .forwarded = forwarded_.load(std::memory_order_relaxed),
        };
    }

private:
    void correct_and_redetect(GateResponse& response);
    void forward(GateResponse& response);
    void emit_audit(const GateResponse& response);

    GateComponents c_;

    mutable std::atomic<uint64_t> total_submissions_{0};
    mutable std::atomic<uint64_t> submissions_blocked_{0};
    mutable std::atomic<uint64_t> spans_detected_{0};
    mutable std::atomic<uint64_t> forwarded_{0};
};

} // namespace privgate
