#pragma once

#include <vector>

namespace ionchannel {

/// Result of a Shapiro-Wilk normality test
struct ShapiroWilkResult {
    double w;        ///< W statistic in (0, 1]
    double p_value;  ///< Probability of W under normality

    ShapiroWilkResult() : w(0.0), p_value(0.0) {}
    ShapiroWilkResult(double stat, double p) : w(stat), p_value(p) {}
};

/// Inverse of the standard normal CDF (Acklam's rational approximation,
/// relative error below 1.2e-9). Returns -inf / +inf at 0 / 1.
double normal_quantile(double p);

/// Upper tail probability P(Z > z) of the standard normal
double normal_upper_tail(double z);

/// Normal density with the given mean and standard deviation
double normal_pdf(double x, double mean, double std_dev);

/**
 * Shapiro-Wilk W test (Royston 1995, algorithm AS R94).
 *
 * @param sample Observations, 3 <= n <= 5000
 * @throws InvalidInputError outside that size range or when the sample
 *         has no spread
 */
ShapiroWilkResult shapiro_wilk(std::vector<double> sample);

} // namespace ionchannel
