#pragma once

/**
 * @file types.hpp
 * @brief Core data types for the ionchannel idealization engine
 *
 * Plain value types shared by the histogram, segmentation and
 * evaluation layers. Everything here is created fresh per analysis
 * run; nothing is mutated across traces.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ionchannel {

// ============================================================================
// Signal Types
// ============================================================================

/// Per-sample two-state label (0 = lower/closed, 1 = upper/open)
using StateLabel = uint8_t;

/**
 * @brief Uniformly sampled current recording
 *
 * Sample i sits at time i * dt. Amplitudes are stored as float32, all
 * accumulation downstream is done in double.
 */
struct Trace {
    std::string name;            ///< Identifier (usually the source file name)
    std::vector<float> samples;  ///< Amplitude samples
    double dt;                   ///< Sample interval (seconds)

    Trace() : dt(1e-4) {}

    Trace(std::string n, std::vector<float> s, double interval)
        : name(std::move(n)), samples(std::move(s)), dt(interval) {}

    /// Number of samples
    size_t size() const { return samples.size(); }

    /// Check if trace is empty
    bool empty() const { return samples.empty(); }

    /// Recording duration in seconds
    double duration() const { return static_cast<double>(samples.size()) * dt; }
};

/**
 * @brief Trace with its ground-truth annotation
 *
 * Dwell times alternate states starting from initial_state.
 */
struct LabeledTrace {
    Trace trace;
    std::vector<double> dwell_times;  ///< True dwell times (seconds)
    StateLabel initial_state;         ///< State of the first dwell

    LabeledTrace() : initial_state(0) {}
};

// ============================================================================
// Histogram Types
// ============================================================================

/**
 * @brief Fixed-width histogram over [edges.front(), edges.back()]
 *
 * weights holds counts, or probabilities summing to 1 after
 * to_probability(). The PDF form is weight / bin_width.
 */
struct Histogram {
    std::vector<double> edges;    ///< N + 1 bin edges
    std::vector<double> weights;  ///< N bin weights
    double bin_width;             ///< Uniform bin width

    Histogram() : bin_width(0.0) {}

    /// Number of bins
    size_t bins() const { return weights.size(); }

    /// Sum of all weights
    double total() const {
        double sum = 0.0;
        for (double w : weights) sum += w;
        return sum;
    }

    /// Density of bin i (PDF normalization)
    double density(size_t i) const {
        return bin_width > 0.0 ? weights[i] / bin_width : 0.0;
    }

    /// Bin centre amplitude
    double centre(size_t i) const { return 0.5 * (edges[i] + edges[i + 1]); }
};

/**
 * @brief Peaks and trough of a bimodal probability histogram
 *
 * pmax1_index is always the left peak after canonicalization. The
 * trough lies between the two peaks whenever the histogram is bimodal.
 */
struct PeakAnalysis {
    std::vector<double> edges;
    std::vector<double> weights;
    double pmax1;        ///< Weight of the left peak
    size_t pmax1_index;  ///< Bin index of the left peak
    double pmax2;        ///< Weight of the right peak
    size_t pmax2_index;  ///< Bin index of the right peak
    size_t midpoint;     ///< Index between the dominant peak and the histogram edge
    double pmin;         ///< Weight of the trough
    size_t pmin_index;   ///< Bin index of the trough

    PeakAnalysis()
        : pmax1(0.0), pmax1_index(0)
        , pmax2(0.0), pmax2_index(0)
        , midpoint(0)
        , pmin(0.0), pmin_index(0)
    {}

    /// Amplitude of the left (lower) peak
    double lower_level() const { return edges[pmax1_index]; }

    /// Amplitude of the right (upper) peak
    double upper_level() const { return edges[pmax2_index]; }

    /// Amplitude of the trough (discrimination threshold)
    double trough_level() const { return edges[pmin_index]; }
};

/**
 * @brief Discrimination threshold with an asymmetric hysteresis band
 *
 * Canonical form satisfies x1 <= threshold_centre <= x2. x1 == x2 is the
 * plain threshold.
 */
struct ThresholdBand {
    double threshold_centre;
    double x1;  ///< Lower band edge
    double x2;  ///< Upper band edge

    ThresholdBand() : threshold_centre(0.0), x1(0.0), x2(0.0) {}

    ThresholdBand(double centre, double lower, double upper)
        : threshold_centre(centre), x1(lower), x2(upper) {}

    /// Band width
    double width() const { return x2 - x1; }
};

// ============================================================================
// Segmentation Types
// ============================================================================

/**
 * @brief Transition times and dwell times produced by a segmenter
 *
 * breakpoints[0] == dwell_times[0] and
 * breakpoints[i] == breakpoints[i - 1] + dwell_times[i].
 */
struct Segmentation {
    std::vector<double> breakpoints;  ///< Transition times (seconds)
    std::vector<double> dwell_times;  ///< Dwell times (seconds)
    StateLabel initial_state;         ///< State before the first breakpoint

    Segmentation() : initial_state(0) {}

    /// Number of detected transitions
    size_t transitions() const { return breakpoints.size(); }
};

/**
 * @brief Residuals between a raw trace and its idealization
 */
struct Noise {
    std::vector<double> residuals;  ///< raw - idealized
    double mean;
    double std_dev;                 ///< Sample standard deviation

    Noise() : mean(0.0), std_dev(0.0) {}

    size_t size() const { return residuals.size(); }
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    /// Default histogram bin count for the threshold methods
    constexpr int DEFAULT_HISTOGRAM_BINS = 100;

    /// Samples per Shapiro-Wilk batch in the noise normality score
    constexpr size_t NORMALITY_BATCH_SIZE = 50;

    /// Default band-width sweep for the threshold optimizer
    constexpr double EPSILON_STEP = 0.01;
    constexpr double EPSILON_MAX = 0.20;

    /// Default MDL parameters
    constexpr size_t DEFAULT_MIN_SEGMENT = 300;
    constexpr double DEFAULT_JUMP_THRESHOLD = 0.8;

    /// Default sample interval of the reference recordings (seconds)
    constexpr double DEFAULT_DT = 1e-4;

    /// Bins used when comparing dwell-time distributions
    constexpr int DEFAULT_DWELL_BINS = 100;
}

} // namespace ionchannel
