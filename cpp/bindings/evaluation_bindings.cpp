/**
 * @file evaluation_bindings.cpp
 * @brief Python bindings for ground-truth scoring and batch evaluation
 */

#include "ionchannel/evaluation/accuracy.hpp"
#include "ionchannel/evaluation/batch_evaluator.hpp"
#include "ionchannel/methods/method_types.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace ionchannel;

namespace {

/// batch_evaluate() for one configuration type. The GIL is released so
/// OpenMP workers can run; a Python classifier reacquires it per call.
template <typename Config>
void def_batch_evaluate(py::module_ &m) {
  m.def(
      "batch_evaluate",
      [](const std::vector<LabeledTrace> &traces, const Config &config,
         const EvaluationOptions &options) {
        return batch_evaluate(traces, MethodConfig(config), options);
      },
      py::arg("traces"), py::arg("config"),
      py::arg("options") = EvaluationOptions(),
      py::call_guard<py::gil_scoped_release>());

  m.def(
      "evaluate_trace",
      [](const LabeledTrace &trace, const Config &config,
         const EvaluationOptions &options) {
        return evaluate_trace(trace, MethodConfig(config), options);
      },
      py::arg("trace"), py::arg("config"),
      py::arg("options") = EvaluationOptions());
}

} // namespace

void bind_evaluation(py::module_ &m) {
  py::class_<EvaluationOptions>(m, "EvaluationOptions")
      .def(py::init<>())
      .def_readwrite("dt", &EvaluationOptions::dt,
                     "Sample interval of traces loaded from disk")
      .def_readwrite("data_size", &EvaluationOptions::data_size,
                     "Samples per trace (0 = all)")
      .def_readwrite("normalize", &EvaluationOptions::normalize,
                     "Z-score each trace before idealization")
      .def_readwrite("dwell_bins", &EvaluationOptions::dwell_bins)
      .def_readwrite("parallel", &EvaluationOptions::parallel)
      .def_readwrite("verbose", &EvaluationOptions::verbose)
      .def("__repr__", [](const EvaluationOptions &o) {
        return "<EvaluationOptions dt=" + std::to_string(o.dt) +
               " data_size=" + std::to_string(o.data_size) +
               " normalize=" + (o.normalize ? "True" : "False") + ">";
      });

  py::class_<TraceEvaluation>(m, "TraceEvaluation")
      .def(py::init<>())
      .def_readonly("name", &TraceEvaluation::name)
      .def_readonly("method", &TraceEvaluation::method)
      .def_readonly("ok", &TraceEvaluation::ok)
      .def_readonly("error", &TraceEvaluation::error)
      .def_readonly("mse", &TraceEvaluation::mse,
                    "Dwell-time histogram MSE (NaN without transitions)")
      .def_readonly("accuracy", &TraceEvaluation::accuracy)
      .def_readonly("transitions", &TraceEvaluation::transitions)
      .def_readonly("true_transitions", &TraceEvaluation::true_transitions)
      .def_readonly("elapsed_ms", &TraceEvaluation::elapsed_ms)
      .def("__repr__", [](const TraceEvaluation &r) {
        if (!r.ok) {
          return "<TraceEvaluation " + r.name + " failed: " + r.error + ">";
        }
        return "<TraceEvaluation " + r.name +
               " accuracy=" + std::to_string(r.accuracy) +
               " mse=" + std::to_string(r.mse) + ">";
      });

  py::class_<EvaluationSummary>(m, "EvaluationSummary")
      .def(py::init<>())
      .def_readonly("method", &EvaluationSummary::method)
      .def_readonly("traces", &EvaluationSummary::traces,
                    "One row per input trace")
      .def_readonly("mean_mse", &EvaluationSummary::mean_mse)
      .def_readonly("mean_accuracy", &EvaluationSummary::mean_accuracy)
      .def_readonly("succeeded", &EvaluationSummary::succeeded)
      .def_readonly("failed", &EvaluationSummary::failed)
      .def_readonly("elapsed_ms", &EvaluationSummary::elapsed_ms)
      .def("__repr__", [](const EvaluationSummary &s) {
        return "<EvaluationSummary " + s.method + " " +
               std::to_string(s.succeeded) + " ok, " +
               std::to_string(s.failed) + " failed, accuracy=" +
               std::to_string(s.mean_accuracy) + ">";
      });

  m.def("reconstruct_ground_truth", &reconstruct_ground_truth,
        py::arg("dwell_times"), py::arg("initial_state"), py::arg("n"),
        py::arg("dt"),
        R"pbdoc(
            Per-sample ground truth from annotated dwell times.

            States alternate from initial_state; each dwell lasts
            round(d / dt) samples, padded to n with the final state.
        )pbdoc");

  m.def("complement", &complement, py::arg("labels"));

  m.def("accuracy", &accuracy, py::arg("ground_truth"), py::arg("approx"),
        "Fraction of matching samples, invariant to state numbering");

  def_batch_evaluate<NaiveConfig>(m);
  def_batch_evaluate<ThresholdBandConfig>(m);
  def_batch_evaluate<MDLConfig>(m);
  def_batch_evaluate<MeanDeviationConfig>(m);
  def_batch_evaluate<ClassifierConfig>(m);
}
