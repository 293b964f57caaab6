#pragma once

#include <cstddef>
#include <vector>

namespace ionchannel {

/// Summary statistics of a sample buffer
struct SampleStatistics {
    double mean;        ///< Arithmetic mean
    double std_dev;     ///< Sample standard deviation (n - 1)
    double min;         ///< Minimum value
    double max;         ///< Maximum value
    size_t count;       ///< Number of values

    SampleStatistics()
        : mean(0.0), std_dev(0.0), min(0.0), max(0.0), count(0)
    {}

    /// Peak-to-peak range
    double range() const { return max - min; }
};

/// Descriptive statistics used throughout the idealization pipeline
class StatisticsEngine {
public:
    StatisticsEngine() = delete;  // Static class, no instances

    /// Mean, standard deviation and extrema in one call.
    /// Uses Arrow Compute for large buffers when built with HAVE_ARROW.
    static SampleStatistics calculate(const std::vector<double>& data);

    /// Same as calculate() for float32 trace samples
    static SampleStatistics calculate(const std::vector<float>& data);

    /// Arithmetic mean (0 for an empty buffer)
    static double calculate_mean(const double* data, size_t length);

    /// Sample standard deviation around a known mean (0 for fewer than 2 values)
    static double calculate_std_dev(const double* data, size_t length, double mean);

    /// Minimum and maximum (NaN for an empty buffer)
    static void calculate_min_max(const double* data, size_t length, double& min, double& max);

    /// Linearly interpolated quantile (q in [0, 1]), Hyndman-Fan type 7
    static double quantile(std::vector<double> values, double q);

    /// Interquartile range q(0.75) - q(0.25)
    static double iqr(const std::vector<double>& values);

    /// Median of a buffer (average of the two middle values for even sizes)
    static double median(std::vector<double> values);

    /// Z-score normalization (x - mean) / std. A constant trace is only centred.
    static std::vector<float> zscore(const std::vector<float>& samples);

    /// Min-max scaling to [0, 1]. A constant trace maps to zeros.
    static std::vector<float> unit_range(const std::vector<float>& samples);
};

} // namespace ionchannel
