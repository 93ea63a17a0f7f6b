#pragma once

#include "detector/idetector.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace privgate {

/**
 * @brief Candidates gathered from all detectors for one text version
 */
struct CandidateSet {
    std::vector<Span> candidates;       // Validated, tier-tagged
    std::vector<std::string> warnings;  // Detector failures and rejected spans
    size_t rejected = 0;
};

/**
 * @brief Output of one full detection pass
 */
struct DetectionReport {
    DetectionResult result;
    std::vector<std::string> warnings;
    size_t candidate_count = 0;
    size_t rejected = 0;
};

/**
 * @brief Runs every registered detector over a text version
 *
 * Detectors run concurrently (one std::async task each) when parallel mode
 * is on and more than one detector is registered; collect() joins all of
 * them before returning, so the merger always sees the full candidate set.
 *
 * Failure isolation:
 * - A detector that throws contributes nothing for that call.
 * - A candidate that is empty, out of bounds, or whose text differs from
 *   the source slice is dropped.
 * Both cases are logged and reported as warnings; the pass continues.
 */
class DetectorRegistry {
public:
    explicit DetectorRegistry(bool parallel = true) : parallel_(parallel) {}

    void add(std::shared_ptr<const IDetector> detector);

    [[nodiscard]] size_t size() const { return detectors_.size(); }
    [[nodiscard]] bool parallel() const { return parallel_; }
    [[nodiscard]] std::vector<std::string> detector_names() const;

    /**
     * @brief Run all detectors, validate and tag their candidates
     */
    [[nodiscard]] CandidateSet collect(std::string_view text) const;

    /**
     * @brief collect() followed by SpanMerger::merge()
     */
    [[nodiscard]] DetectionReport detect(std::string_view text) const;

    /**
     * @brief Check a candidate against the text it claims to come from
     */
    [[nodiscard]] static bool is_valid_candidate(std::string_view text, const Span& span);

private:
    struct DetectorOutput {
        std::vector<Span> spans;
        bool failed = false;
        std::string error;
    };

    [[nodiscard]] static DetectorOutput run_one(const IDetector& detector, std::string_view text);

    std::vector<std::shared_ptr<const IDetector>> detectors_;
    bool parallel_;
};

} // namespace privgate
