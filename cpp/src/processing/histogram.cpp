#include "ionchannel/processing/histogram.hpp"
#include "ionchannel/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace ionchannel {

namespace {

Histogram build_from_doubles(const std::vector<double> &values, int bins) {
  if (values.empty()) {
    throw InvalidInputError("cannot build a histogram of an empty sample");
  }
  for (double v : values) {
    if (!std::isfinite(v)) {
      throw InvalidInputError("histogram input contains non-finite values");
    }
  }

  double min = 0.0;
  double max = 0.0;
  StatisticsEngine::calculate_min_max(values.data(), values.size(), min, max);
  if (!(max > min)) {
    throw InvalidInputError("histogram input has zero range");
  }

  const int n_bins = bins > 0 ? bins : freedman_diaconis_bins(values, min, max);

  Histogram hist;
  hist.bin_width = (max - min) / n_bins;
  hist.edges.resize(n_bins + 1);
  for (int i = 0; i <= n_bins; ++i) {
    hist.edges[i] = min + i * hist.bin_width;
  }
  hist.edges.back() = max;
  hist.weights.assign(n_bins, 0.0);

  for (double v : values) {
    auto bin = static_cast<long>((v - min) / hist.bin_width);
    // Right edge is closed: max lands in the last bin
    bin = std::clamp<long>(bin, 0, n_bins - 1);
    hist.weights[bin] += 1.0;
  }

  return hist;
}

} // namespace

int freedman_diaconis_bins(const std::vector<double> &values, double min,
                           double max) {
  const double n = static_cast<double>(values.size());
  const double iqr = StatisticsEngine::iqr(values);
  const double range = max - min;

  if (iqr > 0.0 && range > 0.0) {
    const double width = 2.0 * iqr / std::cbrt(n);
    const double count = std::round(range / width);
    if (std::isfinite(count) && count >= 1.0) {
      // A narrow IQR over a wide range asks for more bins than samples
      const double cap = std::min(
          n, static_cast<double>(std::numeric_limits<int>::max()));
      return static_cast<int>(std::min(count, cap));
    }
  }

  // Sturges
  return static_cast<int>(std::ceil(std::log2(std::max(n, 1.0)))) + 1;
}

Histogram build_histogram(const std::vector<float> &samples, int bins) {
  return build_from_doubles(std::vector<double>(samples.begin(), samples.end()),
                            bins);
}

Histogram build_histogram(const std::vector<double> &values, int bins) {
  return build_from_doubles(values, bins);
}

Histogram to_probability(const Histogram &histogram) {
  const double total = histogram.total();
  if (!(total > 0.0)) {
    throw InvalidInputError("histogram has zero total weight");
  }

  Histogram prob = histogram;
  for (double &w : prob.weights) {
    w /= total;
  }
  return prob;
}

SampleStatistics summarize_trace(const std::vector<float> &samples) {
  return StatisticsEngine::calculate(samples);
}

} // namespace ionchannel
