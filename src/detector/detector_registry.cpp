#include "detector/detector_registry.hpp"
#include "classifier/sensitivity_classifier.hpp"
#include "merger/span_merger.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>
#include <future>

namespace privgate {

void DetectorRegistry::add(std::shared_ptr<const IDetector> detector) {
    if (detector) {
        detectors_.push_back(std::move(detector));
    }
}

std::vector<std::string> DetectorRegistry::detector_names() const {
    std::vector<std::string> names;
    names.reserve(detectors_.size());
    for (const auto& d : detectors_) {
        names.push_back(d->name());
    }
    return names;
}

bool DetectorRegistry::is_valid_candidate(std::string_view text, const Span& span) {
    if (span.start >= span.end || span.end > text.size()) {
        return false;
    }
    return text.substr(span.start, span.end - span.start) == span.text;
}

DetectorRegistry::DetectorOutput DetectorRegistry::run_one(const IDetector& detector,
                                                           std::string_view text) {
    DetectorOutput out;
    try {
        out.spans = detector.detect(text);
    } catch (const std::exception& e) {
        out.failed = true;
        out.error = e.what();
    } catch (...) {
        out.failed = true;
        out.error = "unknown exception";
    }
    return out;
}

CandidateSet DetectorRegistry::collect(std::string_view text) const {
    CandidateSet set;

    std::vector<DetectorOutput> outputs;
    outputs.reserve(detectors_.size());

    if (parallel_ && detectors_.size() > 1) {
        std::vector<std::future<DetectorOutput>> futures;
        futures.reserve(detectors_.size());
        for (const auto& d : detectors_) {
            futures.push_back(std::async(std::launch::async, run_one, std::cref(*d), text));
        }
        // Barrier: every detector finishes before merging
        for (auto& f : futures) {
            outputs.push_back(f.get());
        }
    } else {
        for (const auto& d : detectors_) {
            outputs.push_back(run_one(*d, text));
        }
    }

    for (size_t i = 0; i < outputs.size(); ++i) {
        auto& out = outputs[i];
        const auto name = detectors_[i]->name();

        if (out.failed) {
            auto msg = std::format("{}: detector {} failed: {}",
                error_category_to_string(ErrorCategory::DETECTOR_UNAVAILABLE), name, out.error);
            utils::log::warn(msg);
            set.warnings.push_back(std::move(msg));
            continue;
        }

        for (auto& span : out.spans) {
            if (!is_valid_candidate(text, span)) {
                auto msg = std::format("{}: detector {} returned invalid {} span [{}, {}), skipped",
                    error_category_to_string(ErrorCategory::OFFSET_INVARIANT_VIOLATION), name,
                    detector_type_to_string(span.type), span.start, span.end);
                utils::log::warn(msg);
                set.warnings.push_back(std::move(msg));
                ++set.rejected;
                continue;
            }
            span.sensitivity = SensitivityClassifier::classify(span.type);
            set.candidates.push_back(std::move(span));
        }
    }

    return set;
}

DetectionReport DetectorRegistry::detect(std::string_view text) const {
    auto set = collect(text);

    DetectionReport report;
    report.candidate_count = set.candidates.size();
    report.rejected = set.rejected;
    report.warnings = std::move(set.warnings);
    report.result = SpanMerger::merge(text, set.candidates);

    utils::log::debug(std::format("Detection: {} candidates, {} rejected, {} merged spans",
        report.candidate_count, report.rejected, report.result.size()));
    return report;
}

} // namespace privgate
