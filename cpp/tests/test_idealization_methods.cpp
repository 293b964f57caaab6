// tests/test_idealization_methods.cpp
//
// Naive threshold, mean-deviation detector, external classifier and the
// MethodConfig dispatch.

#include "ionchannel/core/errors.hpp"
#include "ionchannel/methods/idealization_methods.hpp"

#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
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

/// Labels every scaled sample above one half as open
class HalfThresholdModel : public StateClassifier {
public:
    std::vector<StateLabel> predict(const std::vector<float>& scaled) override {
        ++calls;
        last_input = scaled;
        std::vector<StateLabel> labels;
        for (float x : scaled) labels.push_back(x > 0.5f ? 1 : 0);
        return labels;
    }

    int calls = 0;
    std::vector<float> last_input;
};

/// Returns a fixed label sequence whatever the input
class FixedModel : public StateClassifier {
public:
    explicit FixedModel(std::vector<StateLabel> labels) : labels_(std::move(labels)) {}

    std::vector<StateLabel> predict(const std::vector<float>&) override {
        return labels_;
    }

private:
    std::vector<StateLabel> labels_;
};

int test_naive() {
    std::cout << "[methods] naive trough threshold\n";
    int failed = 0;

    const double dt = 0.01;
    const MethodResult r = naive_method(step_trace(50, 50), dt);
    expect(r.method == "naive", "method name", failed);
    expect(r.initial_state == 0, "starts low", failed);
    expect(r.transitions() == 1 && near(r.breakpoints[0], 0.5), "one step at 0.5 s", failed);
    expect(r.dwell_times.size() == 1 && near(r.dwell_times[0], 0.5), "dwell", failed);
    expect(r.labels.size() == 100 && r.labels[49] == 0 && r.labels[50] == 1, "labels", failed);
    expect(!r.threshold_band && !r.mdl, "no method extras", failed);

    const MethodResult flat = naive_method(std::vector<float>(40, 3.0f), dt);
    expect(flat.breakpoints.empty() && flat.dwell_times.empty(), "constant trace", failed);
    bool single_state = flat.labels.size() == 40;
    for (StateLabel label : flat.labels) single_state = single_state && label == flat.labels[0];
    expect(single_state, "constant trace keeps one state", failed);

    bool threw = false;
    try {
        NaiveConfig config;
        config.bins = 0;
        naive_method(step_trace(5, 5), dt, config);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    expect(threw, "zero bins raises", failed);

    return failed;
}

int test_mean_deviation() {
    std::cout << "[methods] running-mean deviation\n";
    int failed = 0;

    std::vector<float> trace(100, 0.0f);
    trace.insert(trace.end(), 50, 10.0f);
    trace.insert(trace.end(), 100, 0.0f);

    const double dt = 0.001;
    const MethodResult r = mean_deviation_method(trace, dt);
    expect(r.method == "mean_deviation", "method name", failed);
    expect(r.initial_state == 0, "first sample below the trace mean", failed);
    expect(r.transitions() == 2, "enter and leave the deviation", failed);
    if (r.transitions() == 2) {
        expect(near(r.breakpoints[0], 0.1) && near(r.breakpoints[1], 0.15),
               "transitions at samples 100 and 150", failed);
        expect(near(r.dwell_times[1], 0.05, 1e-12), "deviation dwell", failed);
    }
    expect(r.labels.size() == trace.size() && r.labels[99] == 0 && r.labels[100] == 1 &&
               r.labels[149] == 1 && r.labels[150] == 0,
           "labels follow the regime", failed);

    MeanDeviationConfig tolerant;
    tolerant.delta = 20.0;
    const MethodResult quiet = mean_deviation_method(trace, dt, tolerant);
    expect(quiet.breakpoints.empty(), "deviation below delta + lambda", failed);

    return failed;
}

int test_classifier() {
    std::cout << "[methods] external classifier\n";
    int failed = 0;

    std::vector<float> trace(30, -2.0f);
    trace.insert(trace.end(), 20, 6.0f);

    auto model = std::make_shared<HalfThresholdModel>();
    const MethodResult r = classifier_method(trace, 0.1, ClassifierConfig(model));
    expect(model->calls == 1, "model called once", failed);
    expect(model->last_input.size() == trace.size() && model->last_input[0] == 0.0f &&
               model->last_input.back() == 1.0f,
           "model sees the trace scaled to [0, 1]", failed);
    expect(r.method == "classifier", "method name", failed);
    expect(r.transitions() == 1 && near(r.breakpoints[0], 3.0), "transition at sample 30", failed);
    expect(r.labels.size() == trace.size() && r.labels[30] == 1, "model labels kept", failed);

    auto raises_invalid = [&](std::vector<StateLabel> labels) {
        try {
            classifier_method(trace, 0.1,
                              ClassifierConfig(std::make_shared<FixedModel>(std::move(labels))));
        } catch (const InvalidInputError&) {
            return true;
        }
        return false;
    };
    expect(raises_invalid(std::vector<StateLabel>(10, 0)), "wrong label count", failed);
    expect(raises_invalid(std::vector<StateLabel>(trace.size(), 2)), "label outside {0, 1}", failed);

    bool threw = false;
    try {
        classifier_method(trace, 0.1, ClassifierConfig());
    } catch (const ConfigurationError&) {
        threw = true;
    }
    expect(threw, "missing model raises", failed);

    return failed;
}

int test_dispatch() {
    std::cout << "[methods] MethodConfig dispatch\n";
    int failed = 0;

    expect(method_name(NaiveConfig()) == "naive", "naive name", failed);
    expect(method_name(ThresholdBandConfig()) == "threshold_band", "threshold band name", failed);
    expect(method_name(MDLConfig()) == "mdl", "mdl name", failed);
    expect(method_name(MeanDeviationConfig()) == "mean_deviation", "mean deviation name", failed);
    expect(method_name(ClassifierConfig()) == "classifier", "classifier name", failed);
    expect(method_name(MethodConfig()) == "unset", "unset name", failed);

    const std::vector<float> trace = step_trace(50, 50);
    const MethodResult direct = naive_method(trace, 0.01);
    const MethodResult dispatched = run_method(NaiveConfig(), trace, 0.01);
    expect(dispatched.method == "naive" && dispatched.breakpoints == direct.breakpoints &&
               dispatched.labels == direct.labels,
           "run_method matches the direct call", failed);

    MDLConfig mdl;
    mdl.min_seg = 20;
    expect(run_method(mdl, trace, 0.01).method == "mdl", "mdl dispatch", failed);

    auto raises_config = [&](const MethodConfig& config, double dt) {
        try {
            run_method(config, trace, dt);
        } catch (const ConfigurationError&) {
            return true;
        }
        return false;
    };
    expect(raises_config(MethodConfig(), 0.01), "unset configuration raises", failed);
    expect(raises_config(NaiveConfig(), 0.0), "dt == 0 raises", failed);
    expect(raises_config(MeanDeviationConfig(), -0.1), "negative dt raises", failed);

    bool threw = false;
    try {
        run_method(NaiveConfig(), {}, 0.01);
    } catch (const InvalidInputError&) {
        threw = true;
    }
    expect(threw, "empty trace raises", failed);

    return failed;
}

} // anonymous namespace

int main() {
    int total = 0;
    total += test_naive();
    total += test_mean_deviation();
    total += test_classifier();
    total += test_dispatch();

    if (total == 0) {
        std::cout << "\nAll idealization method tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
