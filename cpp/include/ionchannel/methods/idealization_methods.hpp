#pragma once

#include "ionchannel/methods/method_types.hpp"
#include <vector>

namespace ionchannel {

/**
 * Plain threshold at the histogram trough (zero-width band).
 * A constant trace yields no transitions and a single repeated state.
 */
MethodResult naive_method(const std::vector<float>& samples, double dt,
                          const NaiveConfig& config = NaiveConfig());

/**
 * Running-mean deviation detector.
 *
 * The running mean of the trace is frozen while the signal deviates from
 * it, i.e. while |x - mean| - delta > lambda. Entering or leaving that
 * regime is a transition at the current sample. The initial state
 * compares the first sample with the trace mean.
 */
MethodResult mean_deviation_method(const std::vector<float>& samples, double dt,
                                   const MeanDeviationConfig& config = MeanDeviationConfig());

/**
 * Per-sample labels from an external classifier, then extract_transitions().
 * The classifier receives the trace scaled to [0, 1].
 *
 * @throws ConfigurationError when no model is set
 * @throws InvalidInputError when the model returns the wrong number of
 *         labels or a label outside {0, 1}
 */
MethodResult classifier_method(const std::vector<float>& samples, double dt,
                               const ClassifierConfig& config);

/**
 * Run the configured method on one trace.
 * @throws ConfigurationError on dt <= 0 or an unset configuration
 */
MethodResult run_method(const MethodConfig& config, const std::vector<float>& samples,
                        double dt);

} // namespace ionchannel
