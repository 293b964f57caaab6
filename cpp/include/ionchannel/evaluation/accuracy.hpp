#pragma once

#include "ionchannel/core/types.hpp"
#include <cstddef>
#include <vector>

namespace ionchannel {

/**
 * Per-sample ground truth from annotated dwell times.
 *
 * States alternate from initial_state, each dwell lasting round(d / dt)
 * samples (at least one). The sequence is truncated, or padded with the
 * state following the last dwell, to exactly n samples.
 *
 * @throws ConfigurationError on dt <= 0
 */
std::vector<StateLabel> reconstruct_ground_truth(const std::vector<double>& dwell_times,
                                                 StateLabel initial_state,
                                                 size_t n, double dt);

/// Bitwise complement of a two-state sequence
std::vector<StateLabel> complement(const std::vector<StateLabel>& labels);

/**
 * Fraction of matching samples. The approximation is complemented first
 * when the two sequences disagree on the first label, since state
 * numbering of a method is arbitrary.
 *
 * @throws InvalidInputError on empty input or a length mismatch
 */
double accuracy(const std::vector<StateLabel>& ground_truth,
                const std::vector<StateLabel>& approx);

} // namespace ionchannel
