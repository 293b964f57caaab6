// tests/test_threshold_segmenter.cpp
//
// Threshold-crossing segmentation, dwell times and label reconstruction.

#include "ionchannel/core/errors.hpp"
#include "ionchannel/processing/threshold_segmenter.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool near(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

using namespace ionchannel;

std::vector<float> step_trace(size_t low, size_t high) {
    std::vector<float> trace(low, 0.0f);
    trace.insert(trace.end(), high, 1.0f);
    return trace;
}

int test_single_step() {
    std::cout << "[segment] one upward step\n";
    int failed = 0;

    const double dt = 0.01;
    const std::vector<float> trace = step_trace(50, 50);
    const Segmentation seg = segment_by_threshold(trace, dt, ThresholdBand(0.5, 0.5, 0.5));

    expect(seg.initial_state == 0, "starts low", failed);
    expect(seg.transitions() == 1, "one transition", failed);
    expect(seg.transitions() == 1 && near(seg.breakpoints[0], 0.5), "breakpoint at sample 50", failed);
    expect(seg.dwell_times.size() == 1 && near(seg.dwell_times[0], 0.5), "dwell of the first state", failed);

    const std::vector<double> with_tail = dwell_times_with_tail(seg, 100 * dt);
    expect(with_tail.size() == 2 && near(with_tail[0], 0.5) && near(with_tail[1], 0.5),
           "censored final dwell appended", failed);

    const std::vector<StateLabel> labels =
        idealize_from_breakpoints(seg.breakpoints, seg.initial_state, trace.size(), dt);
    expect(labels.size() == trace.size(), "one label per sample", failed);
    expect(labels[49] == 0 && labels[50] == 1, "labels flip at the breakpoint", failed);

    return failed;
}

int test_hysteresis_band() {
    std::cout << "[segment] crossing time is the median of the uncertain zone\n";
    int failed = 0;

    // Samples 2..4 sit inside (0.3, 0.7) before the crossing at sample 5
    const std::vector<float> trace = {0.0f, 0.0f, 0.4f, 0.5f, 0.6f, 1.0f, 1.0f,
                                      0.5f, 1.0f, 0.0f, 0.0f};
    const Segmentation seg = segment_by_threshold(trace, 1.0, ThresholdBand(0.5, 0.3, 0.7));

    expect(seg.initial_state == 0, "starts low", failed);
    expect(seg.transitions() == 2, "up and down", failed);
    if (seg.transitions() == 2) {
        expect(near(seg.breakpoints[0], 3.0), "median of {2, 3, 4}", failed);
        // The excursion at sample 7 returns to the upper side and is discarded
        expect(near(seg.breakpoints[1], 9.0), "crossing without buffered samples", failed);
        expect(near(seg.dwell_times[1], 6.0), "second dwell", failed);
    }

    return failed;
}

int test_zone_edges() {
    std::cout << "[segment] band edges are outside the uncertain zone\n";
    int failed = 0;
    // Edges exactly representable as float samples
    const ThresholdBand band(0.5, 0.25, 0.75);

    // Sample 1 sits exactly on x1 and is not buffered
    const Segmentation on_edge =
        segment_by_threshold({0.0f, 0.25f, 0.5f, 1.0f, 1.0f}, 1.0, band);
    expect(on_edge.transitions() == 1 && near(on_edge.breakpoints[0], 2.0),
           "only the sample strictly inside is buffered", failed);

    // The first sample fixes the state but is never buffered
    const Segmentation first_inside = segment_by_threshold({0.4f, 0.5f, 1.0f}, 1.0, band);
    expect(first_inside.initial_state == 0, "first sample below the centre", failed);
    expect(first_inside.transitions() == 1 && near(first_inside.breakpoints[0], 1.0),
           "buffer starts at the second sample", failed);

    // Leaving exactly on x2 is not a crossing
    const Segmentation stalled =
        segment_by_threshold({0.0f, 0.5f, 0.75f, 0.75f}, 1.0, band);
    expect(stalled.transitions() == 0, "exit onto the edge keeps the state", failed);

    return failed;
}

int test_no_activity() {
    std::cout << "[segment] constant trace has no transitions\n";
    int failed = 0;

    const std::vector<float> flat(100, 0.2f);
    const Segmentation seg = segment_by_threshold(flat, 0.01, ThresholdBand(0.5, 0.5, 0.5));
    expect(seg.breakpoints.empty() && seg.dwell_times.empty(), "empty result", failed);
    expect(seg.initial_state == 0, "below the centre", failed);

    const auto labels = idealize_from_breakpoints({}, 1, 10, 0.01);
    expect(labels.size() == 10 && labels[0] == 1 && labels[9] == 1,
           "no breakpoints keeps the initial state", failed);

    const Segmentation empty = segment_by_threshold({}, 0.01, ThresholdBand());
    expect(empty.transitions() == 0, "empty trace", failed);

    return failed;
}

int test_extract_transitions() {
    std::cout << "[segment] label changes\n";
    int failed = 0;

    const std::vector<StateLabel> labels = {1, 1, 0, 0, 0, 1};
    const Segmentation seg = extract_transitions(labels, 0.5);
    expect(seg.initial_state == 1, "initial state is the first label", failed);
    expect(seg.transitions() == 2, "two changes", failed);
    if (seg.transitions() == 2) {
        expect(near(seg.breakpoints[0], 1.0) && near(seg.breakpoints[1], 2.5),
               "breakpoints at the changed samples", failed);
        expect(near(seg.dwell_times[0], 1.0) && near(seg.dwell_times[1], 1.5), "dwells", failed);
    }

    const auto round_trip = idealize_from_breakpoints(seg.breakpoints, seg.initial_state,
                                                      labels.size(), 0.5);
    expect(round_trip == labels, "labels rebuilt from breakpoints", failed);

    return failed;
}

int test_dwell_times() {
    std::cout << "[segment] dwell times from breakpoints\n";
    int failed = 0;

    const auto dwells = dwell_times_from_breakpoints({0.2, 0.5, 1.0});
    expect(dwells.size() == 3 && near(dwells[0], 0.2) && near(dwells[1], 0.3) &&
               near(dwells[2], 0.5),
           "successive differences", failed);
    expect(dwell_times_from_breakpoints({}).empty(), "empty input", failed);

    bool threw = false;
    try {
        dwell_times_from_breakpoints({0.5, 0.5});
    } catch (const DegenerateResultError&) {
        threw = true;
    }
    expect(threw, "repeated breakpoint raises", failed);

    const auto levels = levels_from_labels({0, 1, 0}, -1.0, 2.0);
    expect(levels[0] == -1.0f && levels[1] == 2.0f, "levels from labels", failed);

    return failed;
}

int test_invalid_configuration() {
    std::cout << "[segment] invalid parameters\n";
    int failed = 0;

    const std::vector<float> trace = step_trace(5, 5);

    auto raises = [&](double dt, const ThresholdBand& band) {
        try {
            segment_by_threshold(trace, dt, band);
        } catch (const ConfigurationError&) {
            return true;
        }
        return false;
    };

    expect(raises(0.0, ThresholdBand(0.5, 0.5, 0.5)), "dt == 0", failed);
    expect(raises(-1.0, ThresholdBand(0.5, 0.5, 0.5)), "negative dt", failed);
    expect(raises(0.1, ThresholdBand(0.5, 0.7, 0.3)), "inverted band", failed);
    expect(raises(0.1, ThresholdBand(0.5, std::nan(""), 0.3)), "non-finite band", failed);

    return failed;
}

} // anonymous namespace

int main() {
    int total = 0;
    total += test_single_step();
    total += test_hysteresis_band();
    total += test_zone_edges();
    total += test_no_activity();
    total += test_extract_transitions();
    total += test_dwell_times();
    total += test_invalid_configuration();

    if (total == 0) {
        std::cout << "\nAll threshold segmenter tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
