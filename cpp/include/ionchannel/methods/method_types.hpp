#pragma once

/**
 * @file method_types.hpp
 * @brief Idealization method configurations and results
 *
 * Each configuration is a plain parameter holder. MethodConfig is the
 * closed set of methods; run_method() dispatches every alternative to
 * exactly one algorithm.
 */

#include "ionchannel/core/types.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ionchannel {

// ============================================================================
// Configurations
// ============================================================================

/// Plain trough threshold
struct NaiveConfig {
    int bins = constants::DEFAULT_HISTOGRAM_BINS;  ///< Histogram bins

    NaiveConfig() = default;
};

/// Threshold band tuned by noise normality
struct ThresholdBandConfig {
    int bins = constants::DEFAULT_HISTOGRAM_BINS;            ///< Histogram bins
    double epsilon_max = constants::EPSILON_MAX;             ///< Widest band tried
    double epsilon_step = constants::EPSILON_STEP;           ///< Band sweep step
    size_t batch_size = constants::NORMALITY_BATCH_SIZE;     ///< Shapiro-Wilk batch
    bool verbose = false;                                    ///< Log search progress

    ThresholdBandConfig() = default;
};

/// Minimum description length change-point search
struct MDLConfig {
    size_t min_seg = constants::DEFAULT_MIN_SEGMENT;         ///< Shortest segment (samples)
    double jump_threshold = constants::DEFAULT_JUMP_THRESHOLD; ///< Minimum level change
    int bins = constants::DEFAULT_HISTOGRAM_BINS;            ///< Bins for the initial state
    bool verbose = false;

    MDLConfig() = default;
};

/// Running-mean deviation detector
struct MeanDeviationConfig {
    double delta = 0.0;   ///< Deviation allowance added to the running mean
    double lambda = 1.0;  ///< Detection threshold

    MeanDeviationConfig() = default;
};

/**
 * Pre-trained per-sample state classifier supplied by the caller.
 * Receives the trace scaled to [0, 1] and returns one label per sample.
 */
class StateClassifier {
public:
    virtual ~StateClassifier() = default;

    virtual std::vector<StateLabel> predict(const std::vector<float>& scaled_samples) = 0;
};

/// Labels produced by an external classifier
struct ClassifierConfig {
    std::shared_ptr<StateClassifier> model;

    ClassifierConfig() = default;
    explicit ClassifierConfig(std::shared_ptr<StateClassifier> m) : model(std::move(m)) {}
};

/// Closed set of idealization methods; std::monostate is "not configured"
using MethodConfig = std::variant<std::monostate,
                                  NaiveConfig,
                                  ThresholdBandConfig,
                                  MDLConfig,
                                  MeanDeviationConfig,
                                  ClassifierConfig>;

/// Short method name for logs and result rows
std::string method_name(const MethodConfig& config);

// ============================================================================
// Results
// ============================================================================

/// Threshold-band specific outputs
struct ThresholdBandExtras {
    std::vector<float> levels;  ///< Idealized amplitude per sample
    Noise noise;                ///< Residuals of the chosen idealization
    ThresholdBand band;         ///< Chosen band
    size_t trough_index;        ///< Histogram bin of the chosen threshold
    double score;               ///< Noise normality score of the chosen band
    double initial_score;       ///< Score of the detected trough with a zero-width band

    ThresholdBandExtras() : trough_index(0), score(0.0), initial_score(0.0) {}
};

/// MDL specific outputs
struct MDLExtras {
    std::vector<double> step_values;        ///< Segment means between the raw change points
    std::vector<size_t> raw_break_indices;  ///< Change points before jump filtering
    std::vector<size_t> kept_break_indices; ///< Change points after jump filtering
};

/**
 * Output of one idealization method on one trace.
 *
 * breakpoints and dwell_times follow the Segmentation invariants,
 * labels has exactly one entry per input sample.
 */
struct MethodResult {
    std::string method;
    std::vector<double> breakpoints;   ///< Transition times (seconds)
    std::vector<double> dwell_times;   ///< Dwell times (seconds)
    std::vector<StateLabel> labels;    ///< Idealized state per sample
    StateLabel initial_state;

    std::optional<ThresholdBandExtras> threshold_band;  ///< Threshold-band method only
    std::optional<MDLExtras> mdl;                       ///< MDL method only

    MethodResult() : initial_state(0) {}

    size_t transitions() const { return breakpoints.size(); }
};

} // namespace ionchannel
