#pragma once

#include "ionchannel/core/types.hpp"
#include <cstddef>

namespace ionchannel {

/// Point in (amplitude, weight) space
struct Point {
    double x;
    double y;

    Point() : x(0.0), y(0.0) {}
    Point(double px, double py) : x(px), y(py) {}
};

/// Straight line y = slope * x + intercept
struct Line {
    double slope;
    double intercept;

    Line() : slope(0.0), intercept(0.0) {}
    Line(double a, double b) : slope(a), intercept(b) {}

    double at(double x) const { return slope * x + intercept; }
};

/// Line through two points. A vertical line yields a non-finite slope.
Line line_through(const Point& p, const Point& q);

/**
 * Locate the two conductance peaks and the trough between them.
 *
 * The global maximum is pmax1. If it lies in the left half of the bin
 * range, the second maximum is searched right of the midpoint between
 * pmax1 and the last bin, otherwise left of the midpoint between the
 * first bin and pmax1. The result is canonicalized so pmax1 is the left
 * peak. The trough is the first minimum strictly between the peaks.
 *
 * A unimodal histogram degrades to the boundary extremum of the search
 * range; this is not corrected.
 *
 * @param prob_histogram Probability histogram (see to_probability())
 * @throws InvalidInputError on an empty histogram
 */
PeakAnalysis analyze_peaks(const Histogram& prob_histogram);

/// (amplitude, weight) of a bin edge
Point peak_point(const PeakAnalysis& analysis, size_t index);

/**
 * Threshold band around an explicit trough index.
 *
 * The centre is the amplitude of the trough edge. Lines from each peak
 * through the trough give slopes a1 (left) and a2 (right); the band
 * extends from the centre towards each peak by a fraction 2*eps*w of the
 * peak distance, with w_left = |a2| / (|a1| + |a2|) and
 * w_right = |a1| / (|a1| + |a2|), capped at the peak itself. A
 * non-finite slope or a zero slope sum uses w = 0.5 on both sides.
 *
 * @throws ConfigurationError when eps is outside [0, 1] or the index is
 *         outside the histogram
 */
ThresholdBand threshold_band_at(const PeakAnalysis& analysis,
                                size_t trough_index, double epsilon);

/// Threshold band around the detected trough
ThresholdBand threshold_band(const PeakAnalysis& analysis, double epsilon);

} // namespace ionchannel
