#pragma once

#include "ionchannel/core/types.hpp"
#include "ionchannel/methods/method_types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ionchannel {

/// Evaluation run settings
struct EvaluationOptions {
    double dt = constants::DEFAULT_DT;             ///< Sample interval of traces loaded from disk
    size_t data_size = 0;                          ///< Samples per trace (0 = all)
    bool normalize = true;                         ///< Z-score each trace before idealization
    int dwell_bins = constants::DEFAULT_DWELL_BINS; ///< Bins of the dwell-time comparison
    bool parallel = true;                          ///< Evaluate traces with OpenMP when available
    bool verbose = false;                          ///< Per-trace progress on stdout

    EvaluationOptions() = default;
};

/// Result row of one trace
struct TraceEvaluation {
    std::string name;
    std::string method;
    bool ok;                 ///< false when the method or scoring raised
    std::string error;       ///< Error message of a failed trace
    double mse;              ///< Dwell-time histogram MSE (NaN without transitions)
    double accuracy;         ///< Fraction of correctly labelled samples
    size_t transitions;      ///< Detected breakpoints
    size_t true_transitions; ///< Annotated dwell times
    int64_t elapsed_ms;

    TraceEvaluation()
        : ok(false), mse(0.0), accuracy(0.0)
        , transitions(0), true_transitions(0), elapsed_ms(0)
    {}
};

/// Aggregate of a batch run
struct EvaluationSummary {
    std::string method;
    std::vector<TraceEvaluation> traces;  ///< One row per input trace, input order
    double mean_mse;       ///< Over succeeded traces with a finite MSE (NaN if none)
    double mean_accuracy;  ///< Over succeeded traces (NaN if none)
    size_t succeeded;
    size_t failed;
    int64_t elapsed_ms;

    EvaluationSummary()
        : mean_mse(0.0), mean_accuracy(0.0)
        , succeeded(0), failed(0), elapsed_ms(0)
    {}
};

/**
 * Idealize one annotated trace and score it against its ground truth.
 *
 * The trace is truncated to options.data_size and optionally z-scored
 * before the method runs. Errors propagate to the caller.
 */
TraceEvaluation evaluate_trace(const LabeledTrace& trace, const MethodConfig& config,
                               const EvaluationOptions& options = EvaluationOptions());

/**
 * Evaluate a method over many traces.
 *
 * Traces are independent and run in parallel when built with OpenMP.
 * A trace that raises is recorded with its error message and left out
 * of the averages; the batch itself never aborts.
 */
EvaluationSummary batch_evaluate(const std::vector<LabeledTrace>& traces,
                                 const MethodConfig& config,
                                 const EvaluationOptions& options = EvaluationOptions());

} // namespace ionchannel
