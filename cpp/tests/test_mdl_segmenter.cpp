// tests/test_mdl_segmenter.cpp
//
// MDL change-point search: description length, detectors, recursion and
// the jump filter.

#include "ionchannel/core/errors.hpp"
#include "ionchannel/methods/mdl_segmenter.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <random>
#include <span>
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

/// Concatenated constant levels, each block_len samples long
std::vector<float> levels_trace(const std::vector<float>& levels, size_t block_len) {
    std::vector<float> trace;
    for (float level : levels) {
        trace.insert(trace.end(), block_len, level);
    }
    return trace;
}

std::vector<float> with_noise(std::vector<float> trace, double sigma, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(0.0, sigma);
    for (float& x : trace) {
        x = static_cast<float>(x + noise(rng));
    }
    return trace;
}

bool within(size_t value, size_t target, size_t tol) {
    return (value > target ? value - target : target - value) <= tol;
}

int test_mdl_score() {
    std::cout << "[mdl] description length\n";
    int failed = 0;

    const std::vector<float> step = {0.0f, 0.0f, 1.0f, 1.0f};
    const std::span<const float> data(step);

    // RSS 1 over 4 samples, no change points
    const double expected = 0.5 * std::log(4.0) + 2.0 * std::log(0.25);
    expect(near(mdl_score(data, {}), expected, 1e-12), "score without change points", failed);
    expect(std::isinf(mdl_score(data, {2})), "exact fit has infinite score", failed);
    expect(near(mdl_score(data, {0, 4}), expected, 1e-12), "boundary points ignored", failed);
    expect(std::isinf(mdl_score(std::span<const float>(), {})), "empty segment", failed);

    return failed;
}

int test_acceptance() {
    std::cout << "[mdl] breakpoint acceptance\n";
    int failed = 0;

    const std::vector<float> step = levels_trace({0.0f, 5.0f}, 300);
    const std::span<const float> data(step);

    expect(!accept_breakpoints(data, {}), "empty candidate is never accepted", failed);
    expect(accept_breakpoints(data, {300}), "exact step is accepted", failed);

    const std::vector<float> flat(600, 2.0f);
    expect(!accept_breakpoints(std::span<const float>(flat), {300}),
           "split of a constant segment is rejected", failed);

    const std::vector<float> noisy = with_noise(std::vector<float>(600, 0.0f), 1.0, 4);
    expect(!accept_breakpoints(std::span<const float>(noisy), {10, 590}),
           "split of pure noise is rejected", failed);

    return failed;
}

int test_single_detector() {
    std::cout << "[mdl] single change point\n";
    int failed = 0;

    const std::vector<float> step = levels_trace({0.0f, 5.0f}, 300);
    const auto k = detect_single_breakpoint(std::span<const float>(step), 50);
    expect(k.size() == 1 && k[0] == 300, "split at the step", failed);

    const auto too_short = detect_single_breakpoint(std::span<const float>(step).first(99), 50);
    expect(too_short.empty(), "shorter than 2 * min_seg", failed);

    const std::vector<float> near_edge = levels_trace({0.0f, 5.0f}, 30);
    const auto clamped = detect_single_breakpoint(std::span<const float>(near_edge), 25);
    expect(clamped.size() == 1 && clamped[0] >= 25 && clamped[0] <= 35,
           "both sides keep min_seg samples", failed);

    bool threw = false;
    try {
        detect_single_breakpoint(std::span<const float>(step), 0);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    expect(threw, "min_seg 0 raises", failed);

    return failed;
}

int test_double_detector() {
    std::cout << "[mdl] double change point\n";
    int failed = 0;

    const std::vector<float> pulse = levels_trace({0.0f, 5.0f, 0.0f}, 100);
    const auto ij = detect_double_breakpoint(std::span<const float>(pulse), 50);
    expect(ij.size() == 2 && ij[0] == 100 && ij[1] == 200, "pulse edges", failed);

    // Every partition keeps min_seg samples even when the pulse is narrower
    const std::vector<float> narrow = [] {
        std::vector<float> t(150, 0.0f);
        for (size_t i = 70; i < 80; ++i) t[i] = 5.0f;
        return t;
    }();
    const size_t min_seg = 40;
    const auto bounded = detect_double_breakpoint(std::span<const float>(narrow), min_seg);
    expect(bounded.size() == 2, "two change points", failed);
    if (bounded.size() == 2) {
        expect(bounded[0] >= min_seg, "first partition", failed);
        expect(bounded[1] - bounded[0] >= min_seg, "middle partition", failed);
        expect(narrow.size() - bounded[1] >= min_seg, "last partition", failed);
    }

    const auto too_short = detect_double_breakpoint(std::span<const float>(narrow).first(119), 40);
    expect(too_short.empty(), "shorter than 3 * min_seg", failed);

    return failed;
}

int test_recursive_search() {
    std::cout << "[mdl] recursive search\n";
    int failed = 0;

    const std::vector<float> step = levels_trace({0.0f, 5.0f}, 300);
    const auto single = find_mdl_breakpoints(std::span<const float>(step), 50);
    expect(single.size() == 1 && single[0] == 300, "one step", failed);

    const std::vector<float> pulse = levels_trace({0.0f, 5.0f, 0.0f}, 100);
    const auto both = find_mdl_breakpoints(std::span<const float>(pulse), 50, true);
    expect(both.size() == 2 && both[0] == 100 && both[1] == 200, "both pulse edges", failed);

    const std::vector<float> noisy =
        with_noise(levels_trace({0.0f, 5.0f, 0.0f, 5.0f}, 400), 0.3, 8);
    const auto found = find_mdl_breakpoints(std::span<const float>(noisy), 50);
    expect(found.size() >= 3, "at least the three true change points", failed);
    for (size_t i = 1; i < found.size(); ++i) {
        expect(found[i] > found[i - 1], "sorted and unique", failed);
    }

    return failed;
}

int test_jump_filter() {
    std::cout << "[mdl] jump filter\n";
    int failed = 0;

    const std::vector<float> trace = levels_trace({0.0f, 0.5f, 3.0f}, 10);
    const JumpFilterResult r = filter_by_jump(std::span<const float>(trace), {10, 20}, 0.8);

    expect(r.step_values.size() == 3, "one mean per segment", failed);
    expect(r.step_values.size() == 3 && near(r.step_values[1], 0.5, 1e-6) &&
               near(r.step_values[2], 3.0, 1e-6),
           "segment means", failed);
    expect(r.kept.size() == 1 && r.kept[0] == 20, "small jump removed", failed);

    const JumpFilterResult none = filter_by_jump(std::span<const float>(trace), {}, 0.8);
    expect(none.kept.empty() && none.step_values.size() == 1, "no change points", failed);

    return failed;
}

int test_mdl_method() {
    std::cout << "[mdl] idealization\n";
    int failed = 0;

    const std::vector<float> noisy =
        with_noise(levels_trace({0.0f, 5.0f, 0.0f, 5.0f}, 400), 0.3, 21);
    MDLConfig config;
    config.min_seg = 50;
    const MethodResult result = mdl_method(noisy, 1e-3, config);

    expect(result.method == "mdl", "method name", failed);
    expect(result.mdl.has_value(), "MDL extras present", failed);
    expect(result.transitions() == 3, "three transitions survive the jump filter", failed);
    if (result.mdl && result.mdl->kept_break_indices.size() == 3) {
        const auto& kept = result.mdl->kept_break_indices;
        expect(within(kept[0], 400, 2) && within(kept[1], 800, 2) && within(kept[2], 1200, 2),
               "change points at the level changes", failed);
        expect(result.mdl->raw_break_indices.size() >= kept.size(), "raw superset", failed);
        expect(near(result.breakpoints[0], kept[0] * 1e-3, 1e-12), "breakpoint is k * dt", failed);
    }
    expect(result.initial_state == 0, "starts in the lower state", failed);
    expect(result.labels.size() == noisy.size(), "one label per sample", failed);
    expect(result.labels.size() == noisy.size() && result.labels[100] == 0 &&
               result.labels[600] == 1 && result.labels[1000] == 0 && result.labels[1400] == 1,
           "labels alternate", failed);

    const MethodResult flat = mdl_method(std::vector<float>(1000, 1.0f), 1e-3, config);
    expect(flat.breakpoints.empty() && flat.dwell_times.empty(), "constant trace", failed);
    expect(flat.initial_state == 0 && flat.labels.size() == 1000 && flat.labels[999] == 0,
           "constant trace stays in state 0", failed);

    bool threw = false;
    try {
        mdl_method({}, 1e-3, config);
    } catch (const InvalidInputError&) {
        threw = true;
    }
    expect(threw, "empty trace raises", failed);

    threw = false;
    try {
        MDLConfig negative;
        negative.jump_threshold = -1.0;
        mdl_method(noisy, 1e-3, negative);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    expect(threw, "negative jump threshold raises", failed);

    return failed;
}

} // anonymous namespace

int main() {
    int total = 0;
    total += test_mdl_score();
    total += test_acceptance();
    total += test_single_detector();
    total += test_double_detector();
    total += test_recursive_search();
    total += test_jump_filter();
    total += test_mdl_method();

    if (total == 0) {
        std::cout << "\nAll MDL tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
