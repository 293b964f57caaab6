#include "ionchannel/processing/peak_analysis.hpp"
#include "ionchannel/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ionchannel {

namespace {

/// Index of the first maximum in weights[first, last]
size_t argmax_in(const std::vector<double> &weights, size_t first, size_t last) {
  size_t best = first;
  for (size_t i = first + 1; i <= last; ++i) {
    if (weights[i] > weights[best]) {
      best = i;
    }
  }
  return best;
}

} // namespace

Line line_through(const Point &p, const Point &q) {
  const double slope = (q.y - p.y) / (q.x - p.x);
  return Line(slope, p.y - slope * p.x);
}

PeakAnalysis analyze_peaks(const Histogram &prob_histogram) {
  const std::vector<double> &w = prob_histogram.weights;
  if (w.empty() || prob_histogram.edges.size() != w.size() + 1) {
    throw InvalidInputError("peak analysis needs a non-empty histogram");
  }

  const long n = static_cast<long>(w.size());
  const size_t p = argmax_in(w, 0, w.size() - 1);

  // Left half test on 1-based positions, round half to even
  const double half = std::nearbyint((n + 1) / 2.0);
  const bool left_half = static_cast<double>(p + 1) < half;

  long midpoint = 0;
  size_t q = p;
  if (left_half) {
    midpoint = (static_cast<long>(p) + n) / 2;
    if (midpoint + 1 <= n - 1) {
      q = argmax_in(w, static_cast<size_t>(midpoint + 1), w.size() - 1);
    }
  } else {
    midpoint = (static_cast<long>(p) + 1) / 2 - 1;
    if (midpoint >= 0) {
      q = argmax_in(w, 0, static_cast<size_t>(midpoint));
    }
  }

  PeakAnalysis analysis;
  analysis.edges = prob_histogram.edges;
  analysis.weights = w;
  analysis.midpoint = static_cast<size_t>(std::max<long>(midpoint, 0));

  analysis.pmax1_index = std::min(p, q);
  analysis.pmax2_index = std::max(p, q);
  analysis.pmax1 = w[analysis.pmax1_index];
  analysis.pmax2 = w[analysis.pmax2_index];

  // First minimum strictly between the peaks, left peak when adjacent
  analysis.pmin_index = analysis.pmax1_index;
  if (analysis.pmax2_index > analysis.pmax1_index + 1) {
    size_t best = analysis.pmax1_index + 1;
    for (size_t i = best + 1; i < analysis.pmax2_index; ++i) {
      if (w[i] < w[best]) {
        best = i;
      }
    }
    analysis.pmin_index = best;
  }
  analysis.pmin = w[analysis.pmin_index];

  return analysis;
}

Point peak_point(const PeakAnalysis &analysis, size_t index) {
  return Point(analysis.edges[index], analysis.weights[index]);
}

ThresholdBand threshold_band_at(const PeakAnalysis &analysis,
                                size_t trough_index, double epsilon) {
  if (!(epsilon >= 0.0 && epsilon <= 1.0)) {
    throw ConfigurationError("band epsilon must be in [0, 1], got " +
                             std::to_string(epsilon));
  }
  if (trough_index >= analysis.weights.size()) {
    throw ConfigurationError("trough index " + std::to_string(trough_index) +
                             " outside histogram of " +
                             std::to_string(analysis.weights.size()) +
                             " bins");
  }

  const Point left = peak_point(analysis, analysis.pmax1_index);
  const Point right = peak_point(analysis, analysis.pmax2_index);
  const Point trough = peak_point(analysis, trough_index);
  const double centre = trough.x;

  const double a1 = std::abs(line_through(left, trough).slope);
  const double a2 = std::abs(line_through(right, trough).slope);

  double w_left = 0.5;
  double w_right = 0.5;
  const double slope_sum = a1 + a2;
  if (std::isfinite(a1) && std::isfinite(a2) && slope_sum > 0.0) {
    // Steeper side pulls less
    w_left = a2 / slope_sum;
    w_right = a1 / slope_sum;
  }

  const double pull_left = std::min(1.0, 2.0 * epsilon * w_left);
  const double pull_right = std::min(1.0, 2.0 * epsilon * w_right);

  const double x1 = centre - pull_left * (centre - left.x);
  const double x2 = centre + pull_right * (right.x - centre);

  return ThresholdBand(centre, std::min(x1, centre), std::max(x2, centre));
}

ThresholdBand threshold_band(const PeakAnalysis &analysis, double epsilon) {
  return threshold_band_at(analysis, analysis.pmin_index, epsilon);
}

} // namespace ionchannel
