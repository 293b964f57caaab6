#include "ionchannel/evaluation/batch_evaluator.hpp"
#include "ionchannel/core/errors.hpp"
#include "ionchannel/core/log_utils.hpp"
#include "ionchannel/data/trace_io.hpp"
#include "ionchannel/evaluation/accuracy.hpp"
#include "ionchannel/methods/idealization_methods.hpp"
#include "ionchannel/processing/statistics_engine.hpp"
#include "ionchannel/statistics/noise_evaluator.hpp"
#include <chrono>
#include <cmath>
#include <exception>
#include <iomanip>
#include <limits>
#include <sstream>

#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace ionchannel {

namespace {

int64_t elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start).count();
}

std::string describe(const TraceEvaluation& row) {
    std::ostringstream oss;
    oss << row.name << ": accuracy " << std::fixed << std::setprecision(4)
        << row.accuracy << ", mse " << row.mse << ", "
        << row.transitions << "/" << row.true_transitions << " transitions ("
        << log_utils::format_duration_ms(row.elapsed_ms) << ")";
    return oss.str();
}

} // namespace

TraceEvaluation evaluate_trace(const LabeledTrace& trace, const MethodConfig& config,
                               const EvaluationOptions& options) {
    auto start_time = std::chrono::steady_clock::now();

    if (options.dwell_bins <= 0) {
        throw ConfigurationError("dwell-time comparison needs a positive bin count");
    }

    const LabeledTrace input = truncate_trace(trace, options.data_size);
    const double dt = input.trace.dt;
    const std::vector<float> samples = options.normalize
        ? StatisticsEngine::zscore(input.trace.samples)
        : input.trace.samples;

    MethodResult result = run_method(config, samples, dt);

    TraceEvaluation row;
    row.name = input.trace.name;
    row.method = result.method;
    row.transitions = result.transitions();
    row.true_transitions = input.dwell_times.size();

    const std::vector<StateLabel> truth = reconstruct_ground_truth(
        input.dwell_times, input.initial_state, samples.size(), dt);
    row.accuracy = accuracy(truth, result.labels);

    // Without transitions on either side there is no dwell distribution to compare
    row.mse = result.dwell_times.empty() || input.dwell_times.empty()
        ? std::numeric_limits<double>::quiet_NaN()
        : mean_squared_error(input.dwell_times, result.dwell_times,
                             options.dwell_bins).mse;

    row.ok = true;
    row.elapsed_ms = elapsed_ms_since(start_time);
    return row;
}

EvaluationSummary batch_evaluate(const std::vector<LabeledTrace>& traces,
                                 const MethodConfig& config,
                                 const EvaluationOptions& options) {
    auto start_time = std::chrono::steady_clock::now();

    EvaluationSummary summary;
    summary.method = method_name(config);
    summary.traces.resize(traces.size());

    const int64_t count = static_cast<int64_t>(traces.size());
    int threads = 1;
#ifdef HAVE_OPENMP
    const bool parallel = options.parallel && count > 1;
    if (parallel) {
        threads = omp_get_max_threads();
    }
#endif

    if (options.verbose) {
        log_utils::info("EVAL", summary.method + " on " +
                                    std::to_string(traces.size()) + " traces, " +
                                    std::to_string(threads) + " threads");
    }

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 1) if(parallel)
#endif
    for (int64_t i = 0; i < count; ++i) {
        TraceEvaluation& row = summary.traces[i];
        try {
            row = evaluate_trace(traces[i], config, options);
        } catch (const std::exception& e) {
            row = TraceEvaluation();
            row.name = traces[i].trace.name;
            row.method = summary.method;
            row.ok = false;
            row.error = e.what();
        }

#ifdef HAVE_OPENMP
        #pragma omp critical
#endif
        {
            if (!row.ok) {
                log_utils::warn("EVAL", row.name + " failed: " + row.error);
            } else if (options.verbose) {
                log_utils::info("EVAL", describe(row));
            }
        }
    }

    double mse_sum = 0.0;
    size_t mse_count = 0;
    double accuracy_sum = 0.0;
    for (const TraceEvaluation& row : summary.traces) {
        if (!row.ok) {
            ++summary.failed;
            continue;
        }
        ++summary.succeeded;
        accuracy_sum += row.accuracy;
        if (std::isfinite(row.mse)) {
            mse_sum += row.mse;
            ++mse_count;
        }
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    summary.mean_accuracy = summary.succeeded > 0
        ? accuracy_sum / static_cast<double>(summary.succeeded) : nan;
    summary.mean_mse = mse_count > 0 ? mse_sum / static_cast<double>(mse_count) : nan;
    summary.elapsed_ms = elapsed_ms_since(start_time);

    if (options.verbose) {
        std::ostringstream oss;
        oss << summary.succeeded << " ok, " << summary.failed << " failed, "
            << "mean accuracy " << std::fixed << std::setprecision(4)
            << summary.mean_accuracy << ", mean mse " << summary.mean_mse
            << " in " << log_utils::format_duration_ms(summary.elapsed_ms);
        log_utils::info("EVAL", oss.str());
    }
    return summary;
}

} // namespace ionchannel
