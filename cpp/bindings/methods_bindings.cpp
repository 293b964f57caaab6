/**
 * @file methods_bindings.cpp
 * @brief Python bindings for the idealization methods
 *
 * Each configuration type selects its method; run_method() is overloaded
 * per configuration instead of exposing the variant itself.
 */

#include "ionchannel/methods/idealization_methods.hpp"
#include "ionchannel/methods/mdl_segmenter.hpp"
#include "ionchannel/methods/method_types.hpp"
#include "ionchannel/methods/threshold_optimizer.hpp"
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <algorithm>
#include <memory>
#include <span>

namespace py = pybind11;
using namespace ionchannel;

namespace {

/// Lets Python subclasses of StateClassifier act as models
class PyStateClassifier : public StateClassifier {
public:
  using StateClassifier::StateClassifier;

  std::vector<StateLabel>
  predict(const std::vector<float> &scaled_samples) override {
    PYBIND11_OVERRIDE_PURE(std::vector<StateLabel>, StateClassifier, predict,
                           scaled_samples);
  }
};

template <typename Config>
void def_run_method(py::module_ &m) {
  m.def(
      "run_method",
      [](const Config &config, const std::vector<float> &samples, double dt) {
        return run_method(MethodConfig(config), samples, dt);
      },
      py::arg("config"), py::arg("samples"), py::arg("dt"));
}

} // namespace

void bind_methods(py::module_ &m) {
  // ===== CONFIGURATIONS =====

  py::class_<NaiveConfig>(m, "NaiveConfig")
      .def(py::init<>())
      .def_readwrite("bins", &NaiveConfig::bins, "Histogram bins")
      .def("__repr__", [](const NaiveConfig &c) {
        return "<NaiveConfig bins=" + std::to_string(c.bins) + ">";
      });

  py::class_<ThresholdBandConfig>(m, "ThresholdBandConfig")
      .def(py::init<>())
      .def_readwrite("bins", &ThresholdBandConfig::bins)
      .def_readwrite("epsilon_max", &ThresholdBandConfig::epsilon_max,
                     "Widest band tried")
      .def_readwrite("epsilon_step", &ThresholdBandConfig::epsilon_step,
                     "Band sweep step")
      .def_readwrite("batch_size", &ThresholdBandConfig::batch_size,
                     "Shapiro-Wilk batch size")
      .def_readwrite("verbose", &ThresholdBandConfig::verbose)
      .def("__repr__", [](const ThresholdBandConfig &c) {
        return "<ThresholdBandConfig bins=" + std::to_string(c.bins) +
               " eps_max=" + std::to_string(c.epsilon_max) +
               " eps_step=" + std::to_string(c.epsilon_step) + ">";
      });

  py::class_<MDLConfig>(m, "MDLConfig")
      .def(py::init<>())
      .def_readwrite("min_seg", &MDLConfig::min_seg,
                     "Shortest segment (samples)")
      .def_readwrite("jump_threshold", &MDLConfig::jump_threshold,
                     "Minimum level change between segments")
      .def_readwrite("bins", &MDLConfig::bins)
      .def_readwrite("verbose", &MDLConfig::verbose)
      .def("__repr__", [](const MDLConfig &c) {
        return "<MDLConfig min_seg=" + std::to_string(c.min_seg) +
               " jump_threshold=" + std::to_string(c.jump_threshold) + ">";
      });

  py::class_<MeanDeviationConfig>(m, "MeanDeviationConfig")
      .def(py::init<>())
      .def_readwrite("delta", &MeanDeviationConfig::delta)
      .def_readwrite("lambda_", &MeanDeviationConfig::lambda,
                     "Detection threshold")
      .def("__repr__", [](const MeanDeviationConfig &c) {
        return "<MeanDeviationConfig delta=" + std::to_string(c.delta) +
               " lambda=" + std::to_string(c.lambda) + ">";
      });

  py::class_<StateClassifier, PyStateClassifier,
             std::shared_ptr<StateClassifier>>(m, "StateClassifier",
                                               R"pbdoc(
            Base class for pre-trained per-sample classifiers.

            Subclasses implement predict(scaled_samples) returning one
            0/1 label per sample of a trace scaled to [0, 1].
        )pbdoc")
      .def(py::init<>())
      .def("predict", &StateClassifier::predict, py::arg("scaled_samples"));

  py::class_<ClassifierConfig>(m, "ClassifierConfig")
      .def(py::init<>())
      // The config keeps the Python model object alive
      .def(py::init<std::shared_ptr<StateClassifier>>(), py::arg("model"),
           py::keep_alive<1, 2>())
      .def_readonly("model", &ClassifierConfig::model);

  // ===== RESULTS =====

  py::class_<ThresholdBandExtras>(m, "ThresholdBandExtras")
      .def_readonly("levels", &ThresholdBandExtras::levels,
                    "Idealized amplitude per sample")
      .def_readonly("noise", &ThresholdBandExtras::noise)
      .def_readonly("band", &ThresholdBandExtras::band)
      .def_readonly("trough_index", &ThresholdBandExtras::trough_index)
      .def_readonly("score", &ThresholdBandExtras::score,
                    "Noise normality score of the chosen band")
      .def_readonly("initial_score", &ThresholdBandExtras::initial_score);

  py::class_<MDLExtras>(m, "MDLExtras")
      .def_readonly("step_values", &MDLExtras::step_values)
      .def_readonly("raw_break_indices", &MDLExtras::raw_break_indices)
      .def_readonly("kept_break_indices", &MDLExtras::kept_break_indices);

  py::class_<MethodResult>(m, "MethodResult")
      .def_readonly("method", &MethodResult::method)
      .def_readonly("breakpoints", &MethodResult::breakpoints,
                    "Transition times (seconds)")
      .def_readonly("dwell_times", &MethodResult::dwell_times)
      .def_readonly("labels", &MethodResult::labels,
                    "Idealized state per sample")
      .def_readonly("initial_state", &MethodResult::initial_state)
      .def_readonly("threshold_band", &MethodResult::threshold_band,
                    "Threshold-band outputs, or None")
      .def_readonly("mdl", &MethodResult::mdl, "MDL outputs, or None")
      .def("transitions", &MethodResult::transitions)
      .def("labels_numpy",
           [](const MethodResult &r) {
             py::array_t<uint8_t> out(r.labels.size());
             std::copy(r.labels.begin(), r.labels.end(), out.mutable_data());
             return out;
           },
           "Labels as a NumPy uint8 array")
      .def("__repr__", [](const MethodResult &r) {
        return "<MethodResult " + r.method + " " +
               std::to_string(r.transitions()) + " transitions, " +
               std::to_string(r.labels.size()) + " samples>";
      });

  // ===== METHODS =====

  m.def("naive_method", &naive_method, py::arg("samples"), py::arg("dt"),
        py::arg("config") = NaiveConfig(),
        "Plain threshold at the histogram trough");

  m.def("run_threshold_optimizer", &run_threshold_optimizer,
        py::arg("samples"), py::arg("dt"),
        py::arg("config") = ThresholdBandConfig(),
        R"pbdoc(
            Threshold-band idealization tuned by noise normality.

            Moves the trough towards the heavier peak, then widens the band,
            keeping a candidate only when its Shapiro-Wilk score improves.

            Raises:
                InsufficientDataError: trace shorter than one batch
        )pbdoc");

  m.def("mdl_method", &mdl_method, py::arg("samples"), py::arg("dt"),
        py::arg("config") = MDLConfig(),
        R"pbdoc(
            Minimum description length change-point idealization.

            Recursive single/double change-point search followed by a
            jump filter on the segment means.
        )pbdoc");

  m.def("mean_deviation_method", &mean_deviation_method, py::arg("samples"),
        py::arg("dt"), py::arg("config") = MeanDeviationConfig(),
        "Running-mean deviation detector");

  m.def("classifier_method", &classifier_method, py::arg("samples"),
        py::arg("dt"), py::arg("config"),
        "Labels from a StateClassifier, then transitions at label changes");

  def_run_method<NaiveConfig>(m);
  def_run_method<ThresholdBandConfig>(m);
  def_run_method<MDLConfig>(m);
  def_run_method<MeanDeviationConfig>(m);
  def_run_method<ClassifierConfig>(m);

  // ===== MDL BUILDING BLOCKS =====

  m.def(
      "mdl_score",
      [](const std::vector<float> &segment,
         const std::vector<size_t> &change_points) {
        return mdl_score(std::span<const float>(segment), change_points);
      },
      py::arg("segment"), py::arg("change_points"),
      "Description length of a piecewise-constant model");

  m.def(
      "find_mdl_breakpoints",
      [](const std::vector<float> &data, size_t min_seg, bool verbose) {
        return find_mdl_breakpoints(std::span<const float>(data), min_seg,
                                    verbose);
      },
      py::arg("data"), py::arg("min_seg"), py::arg("verbose") = false,
      "Sorted change points of the recursive MDL search");
}
