#include "ionchannel/processing/statistics_engine.hpp"
#include "ionchannel/core/errors.hpp"
#include "ionchannel/processing/arrow_utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/compute/api.h>
#endif

namespace ionchannel {

double StatisticsEngine::calculate_mean(const double *data, size_t length) {
  if (length == 0) {
    return 0.0;
  }

  // Kahan summation, traces reach 1e6 samples
  double sum = 0.0;
  double compensation = 0.0;
  for (size_t i = 0; i < length; ++i) {
    double y = data[i] - compensation;
    double t = sum + y;
    compensation = (t - sum) - y;
    sum = t;
  }
  return sum / static_cast<double>(length);
}

double StatisticsEngine::calculate_std_dev(const double *data, size_t length,
                                           double mean) {
  if (length < 2) {
    return 0.0;
  }

  double sum_sq = 0.0;
  for (size_t i = 0; i < length; ++i) {
    double d = data[i] - mean;
    sum_sq += d * d;
  }
  return std::sqrt(sum_sq / static_cast<double>(length - 1));
}

void StatisticsEngine::calculate_min_max(const double *data, size_t length,
                                         double &min, double &max) {
  if (length == 0) {
    min = max = std::numeric_limits<double>::quiet_NaN();
    return;
  }

  min = data[0];
  max = data[0];
  for (size_t i = 1; i < length; ++i) {
    if (data[i] < min)
      min = data[i];
    if (data[i] > max)
      max = data[i];
  }
}

SampleStatistics StatisticsEngine::calculate(const std::vector<double> &data) {
  SampleStatistics stats;
  stats.count = data.size();
  if (data.empty()) {
    return stats;
  }

#ifdef HAVE_ARROW
  // Priority: Arrow Compute > Scalar
  if (data.size() >= arrow_utils::ARROW_THRESHOLD &&
      arrow_utils::is_arrow_available()) {
    auto arrow_array = arrow_utils::wrap_vector_as_arrow(data);
    arrow::compute::ExecContext ctx;
    arrow::compute::VarianceOptions variance_options(/*ddof=*/1);

    auto mean_result = arrow::compute::CallFunction("mean", {arrow_array}, &ctx);
    auto stddev_result = arrow::compute::CallFunction(
        "stddev", {arrow_array}, &variance_options, &ctx);
    auto minmax_result =
        arrow::compute::CallFunction("min_max", {arrow_array}, &ctx);

    if (mean_result.ok() && stddev_result.ok() && minmax_result.ok()) {
      stats.mean =
          mean_result.ValueOrDie().scalar_as<arrow::DoubleScalar>().value;
      stats.std_dev =
          stddev_result.ValueOrDie().scalar_as<arrow::DoubleScalar>().value;
      const auto &minmax_scalar =
          minmax_result.ValueOrDie().scalar_as<arrow::StructScalar>();
      stats.min = std::static_pointer_cast<arrow::DoubleScalar>(
                      minmax_scalar.value[0])
                      ->value;
      stats.max = std::static_pointer_cast<arrow::DoubleScalar>(
                      minmax_scalar.value[1])
                      ->value;
      return stats;
    }
    // Arrow compute failed, fall through to scalar
  }
#endif

  stats.mean = calculate_mean(data.data(), data.size());
  stats.std_dev = calculate_std_dev(data.data(), data.size(), stats.mean);
  calculate_min_max(data.data(), data.size(), stats.min, stats.max);
  return stats;
}

SampleStatistics StatisticsEngine::calculate(const std::vector<float> &data) {
  std::vector<double> widened(data.begin(), data.end());
  return calculate(widened);
}

double StatisticsEngine::quantile(std::vector<double> values, double q) {
  if (values.empty()) {
    throw InvalidInputError("quantile of an empty sample");
  }
  if (!(q >= 0.0 && q <= 1.0)) {
    throw ConfigurationError("quantile must be in [0, 1], got " +
                             std::to_string(q));
  }

  // h = (n - 1) q, interpolate between the floor and ceil order statistics
  const double h = static_cast<double>(values.size() - 1) * q;
  const size_t lo = static_cast<size_t>(std::floor(h));
  const size_t hi = std::min(lo + 1, values.size() - 1);

  std::nth_element(values.begin(), values.begin() + lo, values.end());
  const double lo_value = values[lo];
  if (hi == lo) {
    return lo_value;
  }
  // The (lo+1)-th order statistic is the minimum of the upper partition
  const double hi_value = *std::min_element(values.begin() + lo + 1, values.end());
  return lo_value + (h - static_cast<double>(lo)) * (hi_value - lo_value);
}

double StatisticsEngine::iqr(const std::vector<double> &values) {
  return quantile(values, 0.75) - quantile(values, 0.25);
}

double StatisticsEngine::median(std::vector<double> values) {
  return quantile(std::move(values), 0.5);
}

std::vector<float> StatisticsEngine::zscore(const std::vector<float> &samples) {
  SampleStatistics stats = calculate(samples);
  const double scale = stats.std_dev > 0.0 ? stats.std_dev : 1.0;

  std::vector<float> normalized;
  normalized.reserve(samples.size());
  for (float x : samples) {
    normalized.push_back(static_cast<float>((x - stats.mean) / scale));
  }
  return normalized;
}

std::vector<float> StatisticsEngine::unit_range(const std::vector<float> &samples) {
  std::vector<float> scaled(samples.size(), 0.0f);
  if (samples.empty()) {
    return scaled;
  }

  auto [lo, hi] = std::minmax_element(samples.begin(), samples.end());
  const double range = static_cast<double>(*hi) - static_cast<double>(*lo);
  if (range <= 0.0) {
    return scaled;
  }
  for (size_t i = 0; i < samples.size(); ++i) {
    scaled[i] = static_cast<float>((samples[i] - *lo) / range);
  }
  return scaled;
}

} // namespace ionchannel
