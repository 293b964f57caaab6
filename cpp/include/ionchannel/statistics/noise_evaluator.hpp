#pragma once

#include "ionchannel/core/types.hpp"
#include <cstddef>
#include <vector>

namespace ionchannel {

/// Comparison of a true and an estimated dwell-time distribution
struct DwellTimeComparison {
    double mse;               ///< Mean squared difference of bin weights
    Histogram hist_true;      ///< Histogram of the true dwell times
    Histogram hist_approx;    ///< Histogram of the estimated dwell times
    double scale_true;        ///< Exponential MLE scale (mean dwell) of the true set
    double scale_approx;      ///< Exponential MLE scale of the estimated set

    DwellTimeComparison() : mse(0.0), scale_true(0.0), scale_approx(0.0) {}
};

/// Normal distribution fitted to idealization residuals
struct NormalFit {
    Histogram histogram;         ///< Residual histogram (probability weights)
    std::vector<double> pdf;     ///< Fitted density at each bin centre
    double mean;
    double std_dev;

    NormalFit() : mean(0.0), std_dev(0.0) {}
};

/**
 * Residuals between the raw trace and its idealization.
 * @throws InvalidInputError on empty input or a length mismatch
 */
Noise compute_noise(const std::vector<float>& raw, const std::vector<float>& idealized);

/**
 * Mean Shapiro-Wilk p-value over complete, non-overlapping batches of
 * the residuals; the trailing remainder is discarded. Batches without
 * spread are skipped.
 *
 * @return Mean p-value, or NaN when no batch could be scored
 */
double noise_normality_score(const Noise& noise,
                             size_t batch_size = constants::NORMALITY_BATCH_SIZE);

/**
 * Fixed-bin histograms of both dwell-time sets (each over its own range)
 * and the mean squared difference of their bin weights:
 * mse = sum((w_true - w_approx)^2) / bins.
 *
 * A set without spread (single value) gets all its weight in the first bin.
 *
 * @throws InvalidInputError when either set is empty
 * @throws ConfigurationError when bins <= 0
 */
DwellTimeComparison mean_squared_error(const std::vector<double>& true_dwells,
                                       const std::vector<double>& approx_dwells,
                                       int bins = constants::DEFAULT_DWELL_BINS);

/// Exponential MLE scale (the sample mean); 0 for an empty set
double exponential_scale(const std::vector<double>& dwell_times);

/// Probability histogram of the residuals and the normal density fitted to them
NormalFit fit_normal_to_noise(const Noise& noise,
                              int bins = constants::DEFAULT_HISTOGRAM_BINS);

/// Mean squared difference between the residual density and the fitted density
double fit_mse(const NormalFit& fit);

} // namespace ionchannel
