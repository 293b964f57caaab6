#pragma once

#include "ionchannel/methods/method_types.hpp"
#include <vector>

namespace ionchannel {

/**
 * Threshold-band idealization tuned by noise normality.
 *
 * Starts from the detected trough with a zero-width band. Phase 1 moves
 * the trough one bin at a time towards the peak with the larger mass
 * between it and the trough (stopping before the peak), Phase 2 sweeps
 * the band width epsilon_step..epsilon_max around the best trough. Every
 * candidate is scored with noise_normality_score() and replaces the best
 * one only with a strictly higher score (NaN never wins), so the result
 * never scores below the initial configuration.
 *
 * Idealized levels are the two peak amplitudes.
 *
 * @throws InsufficientDataError when the trace is shorter than one batch
 * @throws ConfigurationError on invalid parameters or dt <= 0
 */
MethodResult run_threshold_optimizer(const std::vector<float>& samples, double dt,
                                     const ThresholdBandConfig& config = ThresholdBandConfig());

} // namespace ionchannel
