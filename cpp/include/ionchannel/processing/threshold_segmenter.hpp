#pragma once

#include "ionchannel/core/types.hpp"
#include <cstddef>
#include <vector>

namespace ionchannel {

/**
 * Single forward pass threshold-crossing segmentation.
 *
 * The initial state is 0 when the first sample lies below the band
 * centre, otherwise 1; scanning starts at the second sample. Samples
 * strictly inside (x1, x2) buffer their timestamps. Leaving the zone
 * beyond the edge opposite to the current state records the median
 * buffered timestamp as a breakpoint and flips the state; any other exit
 * clears the buffer. Without buffered samples a breakpoint is recorded at
 * the current sample when it and the previous sample lie beyond opposite
 * edges. A zero-width band is therefore a plain threshold.
 *
 * No transition yields empty breakpoints and dwell times.
 *
 * @param samples Trace amplitudes; sample i sits at time i * dt
 * @param dt      Sample interval (seconds, > 0)
 * @param band    Canonical threshold band
 * @throws ConfigurationError on dt <= 0 or an inverted / non-finite band
 */
Segmentation segment_by_threshold(const std::vector<float>& samples, double dt,
                                  const ThresholdBand& band);

/**
 * Class-change scan of a per-sample label sequence.
 * A breakpoint is recorded at the time of every sample whose label
 * differs from its predecessor.
 */
Segmentation extract_transitions(const std::vector<StateLabel>& labels, double dt);

/**
 * Dwell times from breakpoints: the first dwell is the first breakpoint,
 * then successive differences. An empty input returns an empty result.
 *
 * @throws DegenerateResultError when the breakpoints are not strictly increasing
 */
std::vector<double> dwell_times_from_breakpoints(const std::vector<double>& breakpoints);

/// Dwell times including the final (censored) dwell up to the end of the trace
std::vector<double> dwell_times_with_tail(const Segmentation& segmentation,
                                          double duration);

/**
 * Per-sample labels from breakpoint times.
 *
 * The state flips at sample round(t / dt), every run keeps at least one
 * sample, and the sequence is truncated or padded with the last state to
 * exactly n samples.
 */
std::vector<StateLabel> idealize_from_breakpoints(const std::vector<double>& breakpoints,
                                                  StateLabel initial_state,
                                                  size_t n, double dt);

/// Map labels to amplitude levels (0 -> low, 1 -> high)
std::vector<float> levels_from_labels(const std::vector<StateLabel>& labels,
                                      double low, double high);

} // namespace ionchannel
