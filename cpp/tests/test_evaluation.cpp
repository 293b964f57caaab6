// tests/test_evaluation.cpp
//
// Ground-truth reconstruction, state-invariant accuracy and batch evaluation.

#include "ionchannel/core/errors.hpp"
#include "ionchannel/evaluation/accuracy.hpp"
#include "ionchannel/evaluation/batch_evaluator.hpp"

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

LabeledTrace step_labeled(const std::string& name) {
    std::vector<float> samples(50, 0.0f);
    samples.insert(samples.end(), 50, 1.0f);

    LabeledTrace labeled;
    labeled.trace = Trace(name, samples, 0.01);
    labeled.dwell_times = {0.5};
    labeled.initial_state = 0;
    return labeled;
}

int test_ground_truth() {
    std::cout << "[eval] ground truth from dwell times\n";
    int failed = 0;

    const auto truth = reconstruct_ground_truth({0.3, 0.2}, 1, 10, 0.1);
    const std::vector<StateLabel> expected = {1, 1, 1, 0, 0, 1, 1, 1, 1, 1};
    expect(truth == expected, "runs then padding with the state after the last dwell", failed);

    const auto tiny = reconstruct_ground_truth({0.01, 0.01}, 0, 4, 0.1);
    const std::vector<StateLabel> tiny_expected = {0, 1, 0, 0};
    expect(tiny == tiny_expected, "every dwell keeps at least one sample", failed);

    const auto none = reconstruct_ground_truth({}, 1, 5, 0.1);
    expect(none == std::vector<StateLabel>(5, 1), "no dwells keeps the initial state", failed);

    const auto cut = reconstruct_ground_truth({0.5, 0.5}, 0, 3, 0.1);
    expect(cut == std::vector<StateLabel>(3, 0), "truncated to n samples", failed);

    bool threw = false;
    try {
        reconstruct_ground_truth({0.1}, 0, 5, 0.0);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    expect(threw, "dt == 0 raises", failed);

    return failed;
}

int test_accuracy() {
    std::cout << "[eval] accuracy is invariant to state numbering\n";
    int failed = 0;

    const std::vector<StateLabel> truth = {0, 0, 1, 1};
    expect(near(accuracy(truth, truth), 1.0), "identical", failed);
    expect(near(accuracy(truth, complement(truth)), 1.0), "complement", failed);
    expect(near(accuracy(truth, {0, 1, 1, 1}), 0.75), "one mismatch", failed);
    expect(near(accuracy(truth, {1, 0, 0, 0}), 0.75), "one mismatch, flipped numbering", failed);
    expect(complement({0, 1}) == std::vector<StateLabel>({1, 0}), "complement", failed);

    bool threw = false;
    try {
        accuracy({}, {});
    } catch (const InvalidInputError&) {
        threw = true;
    }
    expect(threw, "empty input raises", failed);

    threw = false;
    try {
        accuracy(truth, {0, 1});
    } catch (const InvalidInputError&) {
        threw = true;
    }
    expect(threw, "length mismatch raises", failed);

    return failed;
}

int test_evaluate_trace() {
    std::cout << "[eval] single trace\n";
    int failed = 0;

    const TraceEvaluation row = evaluate_trace(step_labeled("step"), NaiveConfig());
    expect(row.ok, "evaluation succeeded", failed);
    expect(row.name == "step" && row.method == "naive", "row identity", failed);
    expect(near(row.accuracy, 1.0), "perfect labels", failed);
    expect(row.transitions == 1 && row.true_transitions == 1, "transition counts", failed);
    expect(near(row.mse, 0.0), "identical dwell distributions", failed);

    EvaluationOptions truncated;
    truncated.data_size = 40;
    const TraceEvaluation early = evaluate_trace(step_labeled("early"), MeanDeviationConfig(),
                                                 truncated);
    expect(early.true_transitions == 0, "dwell beyond the window dropped", failed);
    expect(std::isnan(early.mse), "no transitions gives NaN mse", failed);

    bool threw = false;
    try {
        EvaluationOptions bad;
        bad.dwell_bins = 0;
        evaluate_trace(step_labeled("bad"), NaiveConfig(), bad);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    expect(threw, "zero dwell bins raises", failed);

    return failed;
}

int test_batch() {
    std::cout << "[eval] batch with a failing trace\n";
    int failed = 0;

    std::vector<LabeledTrace> traces;
    traces.push_back(step_labeled("a"));
    LabeledTrace empty;
    empty.trace.name = "broken";
    traces.push_back(empty);
    traces.push_back(step_labeled("c"));

    EvaluationOptions options;
    options.verbose = true;
    const EvaluationSummary summary = batch_evaluate(traces, NaiveConfig(), options);

    expect(summary.method == "naive", "method name", failed);
    expect(summary.traces.size() == 3, "one row per trace", failed);
    expect(summary.succeeded == 2 && summary.failed == 1, "counts", failed);
    if (summary.traces.size() == 3) {
        expect(summary.traces[0].name == "a" && summary.traces[1].name == "broken" &&
                   summary.traces[2].name == "c",
               "input order kept", failed);
        expect(!summary.traces[1].ok && !summary.traces[1].error.empty(),
               "failure recorded with its message", failed);
    }
    expect(near(summary.mean_accuracy, 1.0), "mean over succeeded traces", failed);
    expect(near(summary.mean_mse, 0.0), "mean mse", failed);

    options.parallel = false;
    const EvaluationSummary unset = batch_evaluate(traces, MethodConfig(), options);
    expect(unset.failed == 3 && unset.succeeded == 0, "unset method fails every trace", failed);
    expect(std::isnan(unset.mean_accuracy) && std::isnan(unset.mean_mse), "no averages", failed);

    LabeledTrace flat;
    flat.trace = Trace("flat", std::vector<float>(500, 1.0f), 1e-3);
    flat.initial_state = 1;
    const EvaluationSummary quiet = batch_evaluate({flat}, ThresholdBandConfig(), options);
    expect(quiet.succeeded == 1 && quiet.failed == 0, "flat trace is a valid threshold-band input",
           failed);
    expect(quiet.traces.size() == 1 && near(quiet.traces[0].accuracy, 1.0),
           "flat trace idealized as one state", failed);

    const EvaluationSummary nothing = batch_evaluate({}, NaiveConfig());
    expect(nothing.traces.empty() && nothing.failed == 0, "empty batch", failed);

    return failed;
}

} // anonymous namespace

int main() {
    int total = 0;
    total += test_ground_truth();
    total += test_accuracy();
    total += test_evaluate_trace();
    total += test_batch();

    if (total == 0) {
        std::cout << "\nAll evaluation tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
