#pragma once

#include "core/types.hpp"

#include <string_view>
#include <vector>

namespace privgate {

/**
 * @brief Collapses overlapping candidate spans into one canonical set
 *
 * Candidates are ordered by (start asc, end desc) so the longest span at a
 * position becomes the anchor, then swept left to right:
 * - candidate.start <= current.end (overlap or adjacency): fold. The end
 *   grows to the max, the text is re-sliced from the source, and the
 *   sensitivity becomes the max. The type follows the candidate only on a
 *   strict tier upgrade; on a tie the earlier type stays.
 * - otherwise current is closed and the candidate starts a new one.
 *
 * Ranges that compare equal are further ordered by sensitivity desc, then
 * type, so the output does not depend on the order candidates arrive in.
 */
class SpanMerger {
public:
    /**
     * @brief Merge candidates detected in source
     * @param source Text version the candidates refer to
     * @param candidates All detectors' spans (read-only)
     * @return Non-overlapping, start-ascending result
     */
    [[nodiscard]] static DetectionResult merge(std::string_view source,
                                               const std::vector<Span>& candidates);

    /**
     * @brief Sort key used before the sweep
     */
    [[nodiscard]] static bool sweep_order(const Span& a, const Span& b);
};

} // namespace privgate
