#include "ionchannel/statistics/noise_evaluator.hpp"
#include "ionchannel/core/errors.hpp"
#include "ionchannel/processing/histogram.hpp"
#include "ionchannel/processing/statistics_engine.hpp"
#include "ionchannel/statistics/shapiro_wilk.hpp"
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace ionchannel {

namespace {

/// Count histogram of a dwell-time set over its own range.
/// A set without spread puts everything in the first bin.
Histogram dwell_histogram(const std::vector<double> &values, int bins) {
  double min = 0.0;
  double max = 0.0;
  StatisticsEngine::calculate_min_max(values.data(), values.size(), min, max);
  if (max > min) {
    return build_histogram(values, bins);
  }

  Histogram hist;
  hist.edges.assign(bins + 1, min);
  hist.weights.assign(bins, 0.0);
  hist.weights[0] = static_cast<double>(values.size());
  return hist;
}

} // namespace

Noise compute_noise(const std::vector<float> &raw,
                    const std::vector<float> &idealized) {
  if (raw.empty()) {
    throw InvalidInputError("cannot compute noise of an empty trace");
  }
  if (raw.size() != idealized.size()) {
    throw InvalidInputError("raw trace has " + std::to_string(raw.size()) +
                            " samples, idealization has " +
                            std::to_string(idealized.size()));
  }

  Noise noise;
  noise.residuals.resize(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    noise.residuals[i] =
        static_cast<double>(raw[i]) - static_cast<double>(idealized[i]);
  }

  noise.mean = StatisticsEngine::calculate_mean(noise.residuals.data(),
                                                noise.residuals.size());
  noise.std_dev = StatisticsEngine::calculate_std_dev(
      noise.residuals.data(), noise.residuals.size(), noise.mean);
  return noise;
}

double noise_normality_score(const Noise &noise, size_t batch_size) {
  if (batch_size < 3) {
    throw ConfigurationError("normality batch size must be at least 3, got " +
                             std::to_string(batch_size));
  }

  const size_t num_batches = noise.residuals.size() / batch_size;
  double sum = 0.0;
  size_t scored = 0;

  for (size_t b = 0; b < num_batches; ++b) {
    auto first = noise.residuals.begin() + b * batch_size;
    std::vector<double> batch(first, first + batch_size);

    double min = 0.0;
    double max = 0.0;
    StatisticsEngine::calculate_min_max(batch.data(), batch.size(), min, max);
    if (!(max > min)) {
      continue;
    }

    sum += shapiro_wilk(std::move(batch)).p_value;
    ++scored;
  }

  if (scored == 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return sum / static_cast<double>(scored);
}

double exponential_scale(const std::vector<double> &dwell_times) {
  return StatisticsEngine::calculate_mean(dwell_times.data(),
                                          dwell_times.size());
}

DwellTimeComparison mean_squared_error(const std::vector<double> &true_dwells,
                                       const std::vector<double> &approx_dwells,
                                       int bins) {
  if (bins <= 0) {
    throw ConfigurationError("dwell-time histogram needs a positive bin count");
  }
  if (true_dwells.empty() || approx_dwells.empty()) {
    throw InvalidInputError("dwell-time comparison needs two non-empty sets");
  }

  DwellTimeComparison result;
  result.hist_true = dwell_histogram(true_dwells, bins);
  result.hist_approx = dwell_histogram(approx_dwells, bins);

  double sum_sq = 0.0;
  for (int i = 0; i < bins; ++i) {
    const double d = result.hist_true.weights[i] - result.hist_approx.weights[i];
    sum_sq += d * d;
  }
  result.mse = sum_sq / bins;

  result.scale_true = exponential_scale(true_dwells);
  result.scale_approx = exponential_scale(approx_dwells);
  return result;
}

NormalFit fit_normal_to_noise(const Noise &noise, int bins) {
  NormalFit fit;
  fit.mean = noise.mean;
  fit.std_dev = noise.std_dev;
  fit.histogram = to_probability(build_histogram(noise.residuals, bins));

  fit.pdf.reserve(fit.histogram.bins());
  for (size_t i = 0; i < fit.histogram.bins(); ++i) {
    fit.pdf.push_back(fit.std_dev > 0.0
                          ? normal_pdf(fit.histogram.centre(i), fit.mean,
                                       fit.std_dev)
                          : 0.0);
  }
  return fit;
}

double fit_mse(const NormalFit &fit) {
  const size_t n = fit.histogram.bins();
  if (n == 0 || fit.pdf.size() != n) {
    throw InvalidInputError("normal fit has no bins to compare");
  }

  double sum_sq = 0.0;
  for (size_t i = 0; i < n; ++i) {
    const double d = fit.histogram.density(i) - fit.pdf[i];
    sum_sq += d * d;
  }
  return sum_sq / static_cast<double>(n);
}

} // namespace ionchannel
