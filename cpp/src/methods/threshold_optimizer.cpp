#include "ionchannel/methods/threshold_optimizer.hpp"
#include "ionchannel/core/errors.hpp"
#include "ionchannel/core/log_utils.hpp"
#include "ionchannel/processing/histogram.hpp"
#include "ionchannel/processing/peak_analysis.hpp"
#include "ionchannel/processing/threshold_segmenter.hpp"
#include "ionchannel/statistics/noise_evaluator.hpp"
#include <chrono>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>

namespace ionchannel {

namespace {

/// One scored threshold configuration
struct Candidate {
    ThresholdBand band;
    size_t trough_index = 0;
    Segmentation segmentation;
    std::vector<StateLabel> labels;
    std::vector<float> levels;
    Noise noise;
    double score = 0.0;
};

Candidate evaluate(const std::vector<float>& samples, double dt,
                   const PeakAnalysis& analysis, size_t trough_index,
                   double epsilon, size_t batch_size) {
    Candidate c;
    c.trough_index = trough_index;
    c.band = threshold_band_at(analysis, trough_index, epsilon);
    c.segmentation = segment_by_threshold(samples, dt, c.band);
    c.labels = idealize_from_breakpoints(c.segmentation.breakpoints,
                                         c.segmentation.initial_state,
                                         samples.size(), dt);
    c.levels = levels_from_labels(c.labels, analysis.lower_level(),
                                  analysis.upper_level());
    c.noise = compute_noise(samples, c.levels);
    c.score = noise_normality_score(c.noise, batch_size);
    return c;
}

/// Strictly better, NaN never wins and is always beaten
bool improves(double score, double best) {
    if (std::isnan(score)) return false;
    if (std::isnan(best)) return true;
    return score > best;
}

double mass_between(const std::vector<double>& weights, size_t first, size_t last) {
    double sum = 0.0;
    for (size_t i = first; i <= last; ++i) sum += weights[i];
    return sum;
}

MethodResult to_result(Candidate best, double initial_score) {
    MethodResult result;
    result.method = "threshold_band";
    result.breakpoints = std::move(best.segmentation.breakpoints);
    result.dwell_times = std::move(best.segmentation.dwell_times);
    result.initial_state = best.segmentation.initial_state;
    result.labels = std::move(best.labels);

    ThresholdBandExtras extras;
    extras.levels = std::move(best.levels);
    extras.noise = std::move(best.noise);
    extras.band = best.band;
    extras.trough_index = best.trough_index;
    extras.score = best.score;
    extras.initial_score = initial_score;
    result.threshold_band = std::move(extras);

    return result;
}

/// Single-state idealization of a trace without any spread
MethodResult flat_result(const std::vector<float>& samples, double dt,
                         double level, size_t batch_size) {
    Candidate c;
    c.band = ThresholdBand(level, level, level);
    c.segmentation = segment_by_threshold(samples, dt, c.band);
    c.labels = idealize_from_breakpoints(c.segmentation.breakpoints,
                                         c.segmentation.initial_state,
                                         samples.size(), dt);
    c.levels = levels_from_labels(c.labels, level, level);
    c.noise = compute_noise(samples, c.levels);
    c.score = noise_normality_score(c.noise, batch_size);
    const double score = c.score;
    return to_result(std::move(c), score);
}

} // namespace

MethodResult run_threshold_optimizer(const std::vector<float>& samples, double dt,
                                     const ThresholdBandConfig& config) {
    if (!(dt > 0.0)) {
        throw ConfigurationError("sample interval must be positive");
    }
    if (config.bins <= 0) {
        throw ConfigurationError("threshold band method needs a positive bin count");
    }
    if (!(config.epsilon_step > 0.0) || !(config.epsilon_max >= 0.0 && config.epsilon_max <= 1.0)) {
        throw ConfigurationError("band sweep needs epsilon_step > 0 and epsilon_max in [0, 1]");
    }
    if (config.batch_size < 3) {
        throw ConfigurationError("normality batch size must be at least 3");
    }
    if (samples.size() < config.batch_size) {
        throw InsufficientDataError("trace of " + std::to_string(samples.size()) +
                                    " samples is shorter than one normality batch of " +
                                    std::to_string(config.batch_size));
    }

    // Constant trace: one state, nothing to search
    const SampleStatistics stats = summarize_trace(samples);
    if (!(stats.range() > 0.0)) {
        return flat_result(samples, dt, stats.max, config.batch_size);
    }

    auto start_time = std::chrono::steady_clock::now();

    Histogram prob = to_probability(build_histogram(samples, config.bins));
    PeakAnalysis analysis = analyze_peaks(prob);

    Candidate best = evaluate(samples, dt, analysis, analysis.pmin_index, 0.0,
                              config.batch_size);
    const double initial_score = best.score;

    // Phase 1: move the trough towards the heavier side
    const double left_mass = mass_between(analysis.weights, analysis.pmax1_index,
                                          analysis.pmin_index);
    const double right_mass = mass_between(analysis.weights, analysis.pmin_index,
                                           analysis.pmax2_index);
    const bool towards_left = left_mass > right_mass;

    size_t phase1_candidates = 0;
    if (towards_left) {
        for (size_t i = analysis.pmin_index; i > analysis.pmax1_index + 1; --i) {
            Candidate c = evaluate(samples, dt, analysis, i - 1, 0.0, config.batch_size);
            ++phase1_candidates;
            if (improves(c.score, best.score)) best = std::move(c);
        }
    } else {
        for (size_t i = analysis.pmin_index + 1; i < analysis.pmax2_index; ++i) {
            Candidate c = evaluate(samples, dt, analysis, i, 0.0, config.batch_size);
            ++phase1_candidates;
            if (improves(c.score, best.score)) best = std::move(c);
        }
    }

    // Phase 2: widen the band around the best trough
    const size_t best_trough = best.trough_index;
    const auto steps = static_cast<size_t>(
        std::floor(config.epsilon_max / config.epsilon_step + 1e-9));
    for (size_t k = 1; k <= steps; ++k) {
        const double epsilon = static_cast<double>(k) * config.epsilon_step;
        Candidate c = evaluate(samples, dt, analysis, best_trough, epsilon,
                               config.batch_size);
        if (improves(c.score, best.score)) best = std::move(c);
    }

    if (config.verbose) {
        auto end_time = std::chrono::steady_clock::now();
        std::ostringstream msg;
        msg << "trough " << analysis.pmin_index << " -> " << best.trough_index
            << " (" << phase1_candidates << " tried "
            << (towards_left ? "left" : "right") << "), band ["
            << best.band.x1 << ", " << best.band.x2 << "], score "
            << initial_score << " -> " << best.score << " in "
            << log_utils::format_elapsed(start_time, end_time);
        log_utils::info("OPT", msg.str());
    }

    return to_result(std::move(best), initial_score);
}

} // namespace ionchannel
