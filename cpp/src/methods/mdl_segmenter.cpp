#include "ionchannel/methods/mdl_segmenter.hpp"
#include "ionchannel/core/errors.hpp"
#include "ionchannel/core/log_utils.hpp"
#include "ionchannel/processing/histogram.hpp"
#include "ionchannel/processing/peak_analysis.hpp"
#include "ionchannel/processing/threshold_segmenter.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace ionchannel {

namespace {

void check_min_seg(size_t min_seg) {
  if (min_seg == 0) {
    throw ConfigurationError("minimum segment length must be positive");
  }
}

/// Sum of squared deviations from the mean of data[first, last)
double segment_sse(std::span<const float> data, size_t first, size_t last,
                   double &mean) {
  const size_t n = last - first;
  double sum = 0.0;
  for (size_t i = first; i < last; ++i) {
    sum += data[i];
  }
  mean = sum / static_cast<double>(n);

  double sse = 0.0;
  for (size_t i = first; i < last; ++i) {
    const double d = data[i] - mean;
    sse += d * d;
  }
  return sse;
}

/// Sorted, unique change points strictly inside (0, n)
std::vector<size_t> interior_points(const std::vector<size_t> &points,
                                    size_t n) {
  std::vector<size_t> interior;
  interior.reserve(points.size());
  for (size_t k : points) {
    if (k > 0 && k < n) {
      interior.push_back(k);
    }
  }
  std::sort(interior.begin(), interior.end());
  interior.erase(std::unique(interior.begin(), interior.end()), interior.end());
  return interior;
}

struct RegionFit {
  double rss = 0.0;
  double score = 0.0;
};

RegionFit fit_region(std::span<const float> segment,
                     const std::vector<size_t> &change_points) {
  const size_t n = segment.size();
  std::vector<size_t> bounds = interior_points(change_points, n);
  bounds.insert(bounds.begin(), 0);
  bounds.push_back(n);

  RegionFit fit;
  double length_cost = 0.0;
  for (size_t s = 1; s < bounds.size(); ++s) {
    double mean = 0.0;
    fit.rss += segment_sse(segment, bounds[s - 1], bounds[s], mean);
    length_cost += std::log(static_cast<double>(bounds[s] - bounds[s - 1]));
  }

  const double big_n = static_cast<double>(n);
  const double p = static_cast<double>(bounds.size() - 2);
  fit.score = fit.rss > 0.0 ? p * std::log(big_n) + 0.5 * length_cost +
                                  0.5 * big_n * std::log(fit.rss / big_n)
                            : std::numeric_limits<double>::infinity();
  return fit;
}

} // namespace

double mdl_score(std::span<const float> segment,
                 const std::vector<size_t> &change_points) {
  if (segment.empty()) {
    return std::numeric_limits<double>::infinity();
  }
  return fit_region(segment, change_points).score;
}

bool accept_breakpoints(std::span<const float> segment,
                        const std::vector<size_t> &candidate) {
  if (candidate.empty() || segment.empty()) {
    return false;
  }

  const RegionFit without = fit_region(segment, {});
  const RegionFit with = fit_region(segment, candidate);

  // Exact piecewise-constant fit of a segment that is not constant
  if (with.rss <= 0.0 && without.rss > 0.0) {
    return true;
  }
  return without.score > with.score;
}

std::vector<size_t> detect_single_breakpoint(std::span<const float> data,
                                             size_t min_seg) {
  check_min_seg(min_seg);
  const size_t n = data.size();
  if (n < 2 * min_seg) {
    return {};
  }

  // Left holds [0, k), right holds [k, n)
  double n1 = 0.0;
  double mean1 = 0.0;
  double ss1 = 0.0;
  for (size_t i = 0; i < min_seg; ++i) {
    n1 += 1.0;
    const double d = data[i] - mean1;
    mean1 += d / n1;
    ss1 += d * (data[i] - mean1);
  }

  double mean2 = 0.0;
  double n2 = static_cast<double>(n - min_seg);
  double ss2 = segment_sse(data, min_seg, n, mean2);

  size_t best_k = min_seg;
  double best_sse = ss1 + ss2;

  for (size_t k = min_seg + 1; k <= n - min_seg; ++k) {
    const double x = data[k - 1];

    // Welford add to the left
    n1 += 1.0;
    const double d1 = x - mean1;
    mean1 += d1 / n1;
    ss1 += d1 * (x - mean1);

    // Welford remove from the right
    const double old_mean2 = mean2;
    n2 -= 1.0;
    mean2 = old_mean2 - (x - old_mean2) / n2;
    ss2 -= (x - mean2) * (x - old_mean2);
    ss1 = std::max(ss1, 0.0);
    ss2 = std::max(ss2, 0.0);

    const double total = ss1 + ss2;
    if (total < best_sse) {
      best_sse = total;
      best_k = k;
    }
  }

  return {best_k};
}

std::vector<size_t> detect_double_breakpoint(std::span<const float> data,
                                             size_t min_seg) {
  check_min_seg(min_seg);
  const size_t n = data.size();
  if (n < 3 * min_seg) {
    return {};
  }

  // Prefix sums of the centred signal keep the subtraction well conditioned
  double mean = 0.0;
  for (float x : data) {
    mean += x;
  }
  mean /= static_cast<double>(n);

  std::vector<double> s(n + 1, 0.0);
  std::vector<double> q(n + 1, 0.0);
  for (size_t i = 0; i < n; ++i) {
    const double c = data[i] - mean;
    s[i + 1] = s[i] + c;
    q[i + 1] = q[i] + c * c;
  }

  auto sse = [&](size_t a, size_t b) {
    const double sum = s[b] - s[a];
    const double value = (q[b] - q[a]) - sum * sum / static_cast<double>(b - a);
    return value > 0.0 ? value : 0.0;
  };

  size_t best_i = 0;
  size_t best_j = 0;
  double best_sse = std::numeric_limits<double>::infinity();

  for (size_t i = min_seg; i + 2 * min_seg <= n; ++i) {
    const double sse1 = sse(0, i);
    for (size_t j = i + min_seg; j + min_seg <= n; ++j) {
      const double total = sse1 + sse(i, j) + sse(j, n);
      if (total < best_sse) {
        best_sse = total;
        best_i = i;
        best_j = j;
      }
    }
  }

  return {best_i, best_j};
}

std::vector<size_t> detect_breaks(std::span<const float> segment,
                                  BreakSearch variant, size_t min_seg) {
  std::vector<size_t> candidate = variant == BreakSearch::Single
                                      ? detect_single_breakpoint(segment, min_seg)
                                      : detect_double_breakpoint(segment, min_seg);
  if (!accept_breakpoints(segment, candidate)) {
    return {};
  }
  return candidate;
}

std::vector<size_t> find_mdl_breakpoints(std::span<const float> data,
                                         size_t min_seg, bool verbose) {
  check_min_seg(min_seg);

  std::vector<size_t> found;
  std::vector<std::pair<size_t, size_t>> pending;
  pending.emplace_back(0, data.size());
  size_t regions_searched = 0;

  while (!pending.empty()) {
    auto [first, last] = pending.back();
    pending.pop_back();
    ++regions_searched;

    auto region = data.subspan(first, last - first);
    std::vector<size_t> breaks =
        detect_breaks(region, BreakSearch::Single, min_seg);
    if (breaks.empty() && region.size() > 3 * min_seg) {
      breaks = detect_breaks(region, BreakSearch::Double, min_seg);
    }
    if (breaks.empty()) {
      continue;
    }

    size_t start = first;
    for (size_t k : breaks) {
      found.push_back(first + k);
      pending.emplace_back(start, first + k);
      start = first + k;
    }
    pending.emplace_back(start, last);
  }

  std::sort(found.begin(), found.end());

  if (verbose) {
    log_utils::info("MDL", std::to_string(found.size()) +
                               " change points from " +
                               std::to_string(regions_searched) +
                               " regions (min_seg " + std::to_string(min_seg) +
                               ")");
  }
  return found;
}

JumpFilterResult filter_by_jump(std::span<const float> data,
                                const std::vector<size_t> &change_points,
                                double jump_threshold) {
  JumpFilterResult result;
  if (data.empty()) {
    return result;
  }

  std::vector<size_t> points = interior_points(change_points, data.size());
  std::vector<size_t> bounds = points;
  bounds.insert(bounds.begin(), 0);
  bounds.push_back(data.size());

  result.step_values.reserve(bounds.size() - 1);
  for (size_t s = 1; s < bounds.size(); ++s) {
    size_t first = bounds[s - 1] + 1;
    size_t last = bounds[s] - 1;
    if (last <= first) {
      first = bounds[s - 1];
      last = bounds[s];
    }
    double mean = 0.0;
    segment_sse(data, first, last, mean);
    result.step_values.push_back(mean);
  }

  for (size_t i = 0; i < points.size(); ++i) {
    const double jump = result.step_values[i + 1] - result.step_values[i];
    if (std::abs(jump) > jump_threshold) {
      result.kept.push_back(points[i]);
    }
  }
  return result;
}

MethodResult mdl_method(const std::vector<float> &samples, double dt,
                        const MDLConfig &config) {
  if (!(dt > 0.0)) {
    throw ConfigurationError("sample interval must be positive");
  }
  check_min_seg(config.min_seg);
  if (!(config.jump_threshold >= 0.0)) {
    throw ConfigurationError("jump threshold must be non-negative");
  }
  if (config.bins <= 0) {
    throw ConfigurationError("MDL method needs a positive bin count");
  }
  if (samples.empty()) {
    throw InvalidInputError("cannot idealize an empty trace");
  }

  auto start_time = std::chrono::steady_clock::now();
  std::span<const float> data(samples);

  MDLExtras extras;
  extras.raw_break_indices = find_mdl_breakpoints(data, config.min_seg, config.verbose);
  JumpFilterResult filtered =
      filter_by_jump(data, extras.raw_break_indices, config.jump_threshold);
  extras.kept_break_indices = std::move(filtered.kept);
  extras.step_values = std::move(filtered.step_values);

  MethodResult result;
  result.method = "mdl";
  for (size_t k : extras.kept_break_indices) {
    result.breakpoints.push_back(static_cast<double>(k) * dt);
  }
  result.dwell_times = dwell_times_from_breakpoints(result.breakpoints);

  // A constant trace has no trough, it stays in the lower state
  const SampleStatistics stats = summarize_trace(samples);
  if (stats.range() > 0.0) {
    PeakAnalysis analysis =
        analyze_peaks(to_probability(build_histogram(samples, config.bins)));
    result.initial_state = samples[0] < analysis.trough_level() ? 0 : 1;
  }

  result.labels.resize(samples.size());
  StateLabel state = result.initial_state;
  size_t next = 0;
  for (size_t i = 0; i < samples.size(); ++i) {
    while (next < extras.kept_break_indices.size() &&
           extras.kept_break_indices[next] == i) {
      state = static_cast<StateLabel>(1 - state);
      ++next;
    }
    result.labels[i] = state;
  }
  result.mdl = std::move(extras);

  if (config.verbose) {
    auto end_time = std::chrono::steady_clock::now();
    log_utils::info("MDL", std::to_string(result.mdl->raw_break_indices.size()) +
                               " raw, " + std::to_string(result.transitions()) +
                               " kept after jump filter in " +
                               log_utils::format_elapsed(start_time, end_time));
  }
  return result;
}

} // namespace ionchannel
