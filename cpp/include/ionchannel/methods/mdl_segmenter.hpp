#pragma once

/**
 * @file mdl_segmenter.hpp
 * @brief Minimum description length change-point search
 *
 * Indices are 0-based sample positions. A change point k means a new
 * segment starts at sample k, so change points {k1, k2} split a region
 * of N samples into [0, k1), [k1, k2) and [k2, N).
 */

#include "ionchannel/methods/method_types.hpp"
#include <cstddef>
#include <span>
#include <vector>

namespace ionchannel {

/// Which detector detect_breaks() runs
enum class BreakSearch {
    Single,  ///< One change point, O(n)
    Double   ///< Two change points, O(n^2)
};

/// Change points surviving the jump filter and the segment levels
struct JumpFilterResult {
    std::vector<size_t> kept;          ///< Surviving change points
    std::vector<double> step_values;   ///< Mean of every input segment
};

/**
 * Description length of a piecewise-constant model:
 * p log N + 0.5 sum(log len_s) + (N / 2) log(RSS / N), p = segments - 1.
 *
 * Change points outside (0, N) and duplicates are ignored.
 * @return +infinity when RSS <= 0
 */
double mdl_score(std::span<const float> segment, const std::vector<size_t>& change_points);

/**
 * True when the candidate shortens the description of the segment.
 * Always false for an empty candidate. An exact fit (zero residual) of a
 * segment that has residual variance on its own is accepted.
 */
bool accept_breakpoints(std::span<const float> segment, const std::vector<size_t>& candidate);

/**
 * Best single split by incremental (Welford) left/right updates.
 * Both sides keep at least min_seg samples.
 * @return {k}, or empty when the data is shorter than 2 * min_seg
 * @throws ConfigurationError when min_seg == 0
 */
std::vector<size_t> detect_single_breakpoint(std::span<const float> data, size_t min_seg);

/**
 * Best pair of splits using prefix sums of the mean-centred data.
 * All three partitions keep at least min_seg samples.
 * @return {i, j} with i < j, or empty when the data is shorter than 3 * min_seg
 * @throws ConfigurationError when min_seg == 0
 */
std::vector<size_t> detect_double_breakpoint(std::span<const float> data, size_t min_seg);

/// Run one detector and keep its result only if accept_breakpoints() agrees
std::vector<size_t> detect_breaks(std::span<const float> segment, BreakSearch variant,
                                  size_t min_seg);

/**
 * Recursive change-point search over the whole trace.
 *
 * Every accepted split re-queues all of its sub-regions, so each region
 * is searched until neither detector finds an accepted split. The double
 * detector is tried when the single one fails on a region longer than
 * 3 * min_seg.
 *
 * @return Sorted change points
 */
std::vector<size_t> find_mdl_breakpoints(std::span<const float> data, size_t min_seg,
                                         bool verbose = false);

/**
 * Segment means (over the interior, one sample trimmed at each edge, or
 * the whole segment when that is empty) and the change points whose
 * adjacent means differ by more than jump_threshold.
 */
JumpFilterResult filter_by_jump(std::span<const float> data,
                                const std::vector<size_t>& change_points,
                                double jump_threshold);

/**
 * MDL idealization: change-point search, jump filter, breakpoints at k * dt.
 * The initial state compares the first sample with the histogram trough
 * and the state alternates at every kept change point.
 *
 * @throws InvalidInputError on an empty trace
 * @throws ConfigurationError on dt <= 0, min_seg == 0, a negative jump
 *         threshold or a non-positive bin count
 */
MethodResult mdl_method(const std::vector<float>& samples, double dt,
                        const MDLConfig& config = MDLConfig());

} // namespace ionchannel
