#include "ionchannel/evaluation/accuracy.hpp"
#include "ionchannel/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ionchannel {

std::vector<StateLabel> reconstruct_ground_truth(const std::vector<double> &dwell_times,
                                                 StateLabel initial_state,
                                                 size_t n, double dt) {
  if (!(dt > 0.0)) {
    throw ConfigurationError("sample interval must be positive, got " +
                             std::to_string(dt));
  }

  std::vector<StateLabel> labels;
  labels.reserve(n);

  StateLabel state = initial_state;
  for (double dwell : dwell_times) {
    if (labels.size() >= n) {
      break;
    }
    const double rounded = std::round(dwell / dt);
    const size_t run = rounded >= 1.0 ? static_cast<size_t>(rounded) : 1;
    labels.resize(std::min(n, labels.size() + run), state);
    state = static_cast<StateLabel>(1 - state);
  }

  // The channel has left the state of the last annotated dwell
  labels.resize(n, state);
  return labels;
}

std::vector<StateLabel> complement(const std::vector<StateLabel> &labels) {
  std::vector<StateLabel> flipped;
  flipped.reserve(labels.size());
  for (StateLabel label : labels) {
    flipped.push_back(static_cast<StateLabel>(label == 0 ? 1 : 0));
  }
  return flipped;
}

double accuracy(const std::vector<StateLabel> &ground_truth,
                const std::vector<StateLabel> &approx) {
  if (ground_truth.empty()) {
    throw InvalidInputError("accuracy of an empty idealization");
  }
  if (ground_truth.size() != approx.size()) {
    throw InvalidInputError("ground truth has " +
                            std::to_string(ground_truth.size()) +
                            " samples, idealization has " +
                            std::to_string(approx.size()));
  }

  const bool flip = ground_truth[0] != approx[0];
  size_t matches = 0;
  for (size_t i = 0; i < ground_truth.size(); ++i) {
    const StateLabel label =
        flip ? static_cast<StateLabel>(approx[i] == 0 ? 1 : 0) : approx[i];
    if (label == ground_truth[i]) {
      ++matches;
    }
  }
  return static_cast<double>(matches) / static_cast<double>(ground_truth.size());
}

} // namespace ionchannel
