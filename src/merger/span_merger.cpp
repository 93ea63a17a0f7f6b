#include "merger/span_merger.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace privgate {

bool SpanMerger::sweep_order(const Span& a, const Span& b) {
    if (a.start != b.start) return a.start < b.start;
    if (a.end != b.end) return a.end > b.end;
    if (a.sensitivity != b.sensitivity) return a.sensitivity > b.sensitivity;
    return a.type < b.type;
}

DetectionResult SpanMerger::merge(std::string_view source,
                                  const std::vector<Span>& candidates) {
    DetectionResult result;
    if (candidates.empty()) {
        return result;
    }

    std::vector<Span> sorted;
    sorted.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (c.start >= c.end || c.end > source.size()) {
            utils::log::warn(std::format("Span merger dropping invalid {} span [{}, {})",
                detector_type_to_string(c.type), c.start, c.end));
            continue;
        }
        sorted.push_back(c);
    }
    if (sorted.empty()) {
        return result;
    }

    std::sort(sorted.begin(), sorted.end(), sweep_order);

    auto slice = [source](size_t start, size_t end) {
        return std::string(source.substr(start, end - start));
    };

    Span current = sorted.front();
    current.text = slice(current.start, current.end);

    for (size_t i = 1; i < sorted.size(); ++i) {
        const Span& next = sorted[i];

        if (next.start <= current.end) {
            if (next.end > current.end) {
                current.end = next.end;
                current.text = slice(current.start, current.end);
            }
            if (next.sensitivity > current.sensitivity) {
                current.sensitivity = next.sensitivity;
                current.type = next.type;
            }
        } else {
            result.spans.push_back(std::move(current));
            current = next;
            current.text = slice(current.start, current.end);
        }
    }
    result.spans.push_back(std::move(current));

    return result;
}

} // namespace privgate
