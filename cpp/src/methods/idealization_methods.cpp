#include "ionchannel/methods/idealization_methods.hpp"
#include "ionchannel/core/errors.hpp"
#include "ionchannel/methods/mdl_segmenter.hpp"
#include "ionchannel/methods/threshold_optimizer.hpp"
#include "ionchannel/processing/histogram.hpp"
#include "ionchannel/processing/peak_analysis.hpp"
#include "ionchannel/processing/statistics_engine.hpp"
#include "ionchannel/processing/threshold_segmenter.hpp"
#include <cmath>
#include <string>
#include <type_traits>
#include <utility>

namespace ionchannel {

namespace {

void check_trace(const std::vector<float> &samples, double dt) {
  if (!(dt > 0.0)) {
    throw ConfigurationError("sample interval must be positive, got " +
                             std::to_string(dt));
  }
  if (samples.empty()) {
    throw InvalidInputError("cannot idealize an empty trace");
  }
}

MethodResult from_segmentation(std::string method, Segmentation segmentation,
                               size_t n, double dt) {
  MethodResult result;
  result.method = std::move(method);
  result.initial_state = segmentation.initial_state;
  result.labels = idealize_from_breakpoints(
      segmentation.breakpoints, segmentation.initial_state, n, dt);
  result.breakpoints = std::move(segmentation.breakpoints);
  result.dwell_times = std::move(segmentation.dwell_times);
  return result;
}

} // namespace

std::string method_name(const MethodConfig &config) {
  return std::visit(
      [](const auto &c) -> std::string {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, NaiveConfig>) {
          return "naive";
        } else if constexpr (std::is_same_v<T, ThresholdBandConfig>) {
          return "threshold_band";
        } else if constexpr (std::is_same_v<T, MDLConfig>) {
          return "mdl";
        } else if constexpr (std::is_same_v<T, MeanDeviationConfig>) {
          return "mean_deviation";
        } else if constexpr (std::is_same_v<T, ClassifierConfig>) {
          return "classifier";
        } else {
          return "unset";
        }
      },
      config);
}

MethodResult naive_method(const std::vector<float> &samples, double dt,
                          const NaiveConfig &config) {
  check_trace(samples, dt);
  if (config.bins <= 0) {
    throw ConfigurationError("naive method needs a positive bin count");
  }

  // Constant trace: one state, nothing to threshold
  const SampleStatistics stats = summarize_trace(samples);
  if (!(stats.range() > 0.0)) {
    ThresholdBand flat(stats.max, stats.max, stats.max);
    return from_segmentation("naive", segment_by_threshold(samples, dt, flat),
                             samples.size(), dt);
  }

  PeakAnalysis analysis =
      analyze_peaks(to_probability(build_histogram(samples, config.bins)));
  ThresholdBand band = threshold_band(analysis, 0.0);
  return from_segmentation("naive", segment_by_threshold(samples, dt, band),
                           samples.size(), dt);
}

MethodResult mean_deviation_method(const std::vector<float> &samples, double dt,
                                   const MeanDeviationConfig &config) {
  check_trace(samples, dt);
  if (!std::isfinite(config.delta) || !std::isfinite(config.lambda)) {
    throw ConfigurationError("mean deviation parameters must be finite");
  }

  const SampleStatistics stats = summarize_trace(samples);

  MethodResult result;
  result.method = "mean_deviation";
  result.initial_state = samples[0] < stats.mean ? 0 : 1;
  result.labels.reserve(samples.size());
  result.labels.push_back(result.initial_state);

  StateLabel state = result.initial_state;
  double running_sum = samples[0];
  double running_count = 1.0;
  double running_mean = samples[0];
  bool deviating = false;

  for (size_t i = 1; i < samples.size(); ++i) {
    if (!deviating) {
      running_sum += samples[i];
      running_count += 1.0;
      running_mean = running_sum / running_count;
    }

    const double deviation = std::abs(samples[i] - running_mean) - config.delta;
    const bool now_deviating = deviation > config.lambda;
    if (now_deviating != deviating) {
      result.breakpoints.push_back(static_cast<double>(i) * dt);
      state = static_cast<StateLabel>(1 - state);
    }
    deviating = now_deviating;
    result.labels.push_back(state);
  }

  result.dwell_times = dwell_times_from_breakpoints(result.breakpoints);
  return result;
}

MethodResult classifier_method(const std::vector<float> &samples, double dt,
                               const ClassifierConfig &config) {
  check_trace(samples, dt);
  if (!config.model) {
    throw ConfigurationError("classifier method has no model");
  }

  std::vector<StateLabel> labels =
      config.model->predict(StatisticsEngine::unit_range(samples));
  if (labels.size() != samples.size()) {
    throw InvalidInputError("classifier returned " +
                            std::to_string(labels.size()) + " labels for " +
                            std::to_string(samples.size()) + " samples");
  }
  for (StateLabel label : labels) {
    if (label > 1) {
      throw InvalidInputError("classifier returned label " +
                              std::to_string(label) + ", expected 0 or 1");
    }
  }

  Segmentation segmentation = extract_transitions(labels, dt);

  MethodResult result;
  result.method = "classifier";
  result.initial_state = segmentation.initial_state;
  result.breakpoints = std::move(segmentation.breakpoints);
  result.dwell_times = std::move(segmentation.dwell_times);
  result.labels = std::move(labels);
  return result;
}

MethodResult run_method(const MethodConfig &config,
                        const std::vector<float> &samples, double dt) {
  if (!(dt > 0.0)) {
    throw ConfigurationError("sample interval must be positive, got " +
                             std::to_string(dt));
  }

  return std::visit(
      [&](const auto &c) -> MethodResult {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, NaiveConfig>) {
          return naive_method(samples, dt, c);
        } else if constexpr (std::is_same_v<T, ThresholdBandConfig>) {
          return run_threshold_optimizer(samples, dt, c);
        } else if constexpr (std::is_same_v<T, MDLConfig>) {
          return mdl_method(samples, dt, c);
        } else if constexpr (std::is_same_v<T, MeanDeviationConfig>) {
          return mean_deviation_method(samples, dt, c);
        } else if constexpr (std::is_same_v<T, ClassifierConfig>) {
          return classifier_method(samples, dt, c);
        } else {
          throw ConfigurationError("no idealization method configured");
        }
      },
      config);
}

} // namespace ionchannel
