#include "ionchannel/processing/threshold_segmenter.hpp"
#include "ionchannel/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ionchannel {

namespace {

void check_dt(double dt) {
  if (!(dt > 0.0) || !std::isfinite(dt)) {
    throw ConfigurationError("sample interval must be positive, got " +
                             std::to_string(dt));
  }
}

/// Median of an ascending buffer
double sorted_median(const std::vector<double> &sorted) {
  const size_t n = sorted.size();
  if (n % 2 == 1) {
    return sorted[n / 2];
  }
  return 0.5 * (sorted[n / 2 - 1] + sorted[n / 2]);
}

} // namespace

std::vector<double>
dwell_times_from_breakpoints(const std::vector<double> &breakpoints) {
  std::vector<double> dwell_times;
  dwell_times.reserve(breakpoints.size());

  double previous = 0.0;
  for (size_t i = 0; i < breakpoints.size(); ++i) {
    if (i > 0 && !(breakpoints[i] > previous)) {
      throw DegenerateResultError("breakpoint " + std::to_string(i) + " (" +
                                  std::to_string(breakpoints[i]) +
                                  ") does not follow " +
                                  std::to_string(previous));
    }
    dwell_times.push_back(breakpoints[i] - previous);
    previous = breakpoints[i];
  }
  return dwell_times;
}

std::vector<double> dwell_times_with_tail(const Segmentation &segmentation,
                                          double duration) {
  std::vector<double> dwell_times = segmentation.dwell_times;
  const double last =
      segmentation.breakpoints.empty() ? 0.0 : segmentation.breakpoints.back();
  if (duration > last) {
    dwell_times.push_back(duration - last);
  }
  return dwell_times;
}

Segmentation segment_by_threshold(const std::vector<float> &samples, double dt,
                                  const ThresholdBand &band) {
  check_dt(dt);
  if (!std::isfinite(band.x1) || !std::isfinite(band.x2) ||
      !std::isfinite(band.threshold_centre)) {
    throw ConfigurationError("threshold band has non-finite bounds");
  }
  if (band.x1 > band.x2) {
    throw ConfigurationError("inverted threshold band [" +
                             std::to_string(band.x1) + ", " +
                             std::to_string(band.x2) + "]");
  }

  Segmentation result;
  if (samples.empty()) {
    return result;
  }

  StateLabel state = samples[0] < band.threshold_centre ? 0 : 1;
  result.initial_state = state;

  // Timestamps are generated in order, the buffer stays sorted
  std::vector<double> zone_times;

  // The first sample only fixes the initial state
  for (size_t i = 1; i < samples.size(); ++i) {
    const double value = samples[i];
    const double time = static_cast<double>(i) * dt;

    if (value > band.x1 && value < band.x2) {
      zone_times.push_back(time);
      continue;
    }

    const bool above = value > band.x2;
    const bool below = value < band.x1;

    if (!zone_times.empty()) {
      if ((state == 0 && above) || (state == 1 && below)) {
        result.breakpoints.push_back(sorted_median(zone_times));
        state = static_cast<StateLabel>(1 - state);
      }
      zone_times.clear();
      continue;
    }

    // Direct jump across the whole band between two samples
    const double previous = samples[i - 1];
    if ((state == 0 && previous < band.x1 && above) ||
        (state == 1 && previous > band.x2 && below)) {
      result.breakpoints.push_back(time);
      state = static_cast<StateLabel>(1 - state);
    }
  }

  result.dwell_times = dwell_times_from_breakpoints(result.breakpoints);
  return result;
}

Segmentation extract_transitions(const std::vector<StateLabel> &labels,
                                 double dt) {
  check_dt(dt);

  Segmentation result;
  if (labels.empty()) {
    return result;
  }

  result.initial_state = labels[0];
  for (size_t i = 1; i < labels.size(); ++i) {
    if (labels[i] != labels[i - 1]) {
      result.breakpoints.push_back(static_cast<double>(i) * dt);
    }
  }

  result.dwell_times = dwell_times_from_breakpoints(result.breakpoints);
  return result;
}

std::vector<StateLabel>
idealize_from_breakpoints(const std::vector<double> &breakpoints,
                          StateLabel initial_state, size_t n, double dt) {
  check_dt(dt);

  std::vector<StateLabel> labels;
  labels.reserve(n);

  StateLabel state = initial_state;
  for (double t : breakpoints) {
    const double rounded = std::round(t / dt);
    size_t flip = rounded > 0.0 ? static_cast<size_t>(rounded) : 0;
    // At least one sample per run
    flip = std::max(flip, labels.size() + 1);
    if (flip > n) {
      flip = n;
    }
    labels.resize(flip, state);
    state = static_cast<StateLabel>(1 - state);
    if (labels.size() >= n) {
      break;
    }
  }

  labels.resize(n, state);
  return labels;
}

std::vector<float> levels_from_labels(const std::vector<StateLabel> &labels,
                                      double low, double high) {
  std::vector<float> levels;
  levels.reserve(labels.size());
  for (StateLabel label : labels) {
    levels.push_back(static_cast<float>(label == 0 ? low : high));
  }
  return levels;
}

} // namespace ionchannel
