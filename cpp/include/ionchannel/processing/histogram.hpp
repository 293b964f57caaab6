#pragma once

#include "ionchannel/core/types.hpp"
#include "ionchannel/processing/statistics_engine.hpp"
#include <vector>

namespace ionchannel {

/**
 * Fixed-width amplitude histogram of a trace.
 *
 * Edges are uniform over [min, max]; the maximum sample is counted in
 * the last bin. bins <= 0 selects the Freedman-Diaconis rule
 * (width = 2 IQR / n^(1/3)), falling back to Sturges when the IQR is 0.
 *
 * @param samples Trace amplitudes (all finite)
 * @param bins    Number of bins, or <= 0 for automatic
 * @return Count histogram
 * @throws InvalidInputError on empty, non-finite or zero-range input
 */
Histogram build_histogram(const std::vector<float>& samples, int bins = 0);

/// Same as build_histogram() for double buffers (dwell times, residuals)
Histogram build_histogram(const std::vector<double>& values, int bins = 0);

/**
 * Normalize weights so they sum to 1.
 * bin_width is kept, Histogram::density() gives the PDF form.
 *
 * @throws InvalidInputError when the total weight is zero
 */
Histogram to_probability(const Histogram& histogram);

/// Freedman-Diaconis bin count capped at the sample count, Sturges fallback (always >= 1)
int freedman_diaconis_bins(const std::vector<double>& values, double min, double max);

/// Mean, deviation and extrema of a trace (Arrow accelerated when available)
SampleStatistics summarize_trace(const std::vector<float>& samples);

} // namespace ionchannel
