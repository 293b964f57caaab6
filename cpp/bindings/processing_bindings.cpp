/**
 * @file processing_bindings.cpp
 * @brief Python bindings for histograms, peak analysis and threshold segmentation
 */

#include "ionchannel/core/types.hpp"
#include "ionchannel/processing/arrow_utils.hpp"
#include "ionchannel/processing/histogram.hpp"
#include "ionchannel/processing/peak_analysis.hpp"
#include "ionchannel/processing/statistics_engine.hpp"
#include "ionchannel/processing/threshold_segmenter.hpp"
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <algorithm>

namespace py = pybind11;
using namespace ionchannel;

void bind_processing(py::module_ &m) {
  // ===== CORE TYPES =====

  py::class_<Trace>(m, "Trace")
      .def(py::init<>())
      .def(py::init<std::string, std::vector<float>, double>(),
           py::arg("name"), py::arg("samples"), py::arg("dt"))
      .def_readwrite("name", &Trace::name)
      .def_readwrite("samples", &Trace::samples, "Amplitude samples")
      .def_readwrite("dt", &Trace::dt, "Sample interval (seconds)")
      .def("size", &Trace::size)
      .def("duration", &Trace::duration, "Recording duration in seconds")
      .def("__len__", &Trace::size)
      .def("__repr__", [](const Trace &t) {
        return "<Trace '" + t.name + "' " + std::to_string(t.size()) +
               " samples, dt=" + std::to_string(t.dt) + ">";
      });

  py::class_<LabeledTrace>(m, "LabeledTrace")
      .def(py::init<>())
      .def_readwrite("trace", &LabeledTrace::trace)
      .def_readwrite("dwell_times", &LabeledTrace::dwell_times,
                     "True dwell times (seconds)")
      .def_readwrite("initial_state", &LabeledTrace::initial_state,
                     "State of the first dwell")
      .def("__repr__", [](const LabeledTrace &t) {
        return "<LabeledTrace '" + t.trace.name + "' " +
               std::to_string(t.trace.size()) + " samples, " +
               std::to_string(t.dwell_times.size()) + " dwells>";
      });

  py::class_<Histogram>(m, "Histogram")
      .def(py::init<>())
      .def_readonly("edges", &Histogram::edges, "N + 1 bin edges")
      .def_readonly("weights", &Histogram::weights, "N bin weights")
      .def_readonly("bin_width", &Histogram::bin_width)
      .def("bins", &Histogram::bins)
      .def("total", &Histogram::total, "Sum of all weights")
      .def("density", &Histogram::density, py::arg("i"),
           "Density of bin i (PDF normalization)")
      .def("centre", &Histogram::centre, py::arg("i"))
      .def("__repr__", [](const Histogram &h) {
        return "<Histogram bins=" + std::to_string(h.bins()) +
               " width=" + std::to_string(h.bin_width) +
               " total=" + std::to_string(h.total()) + ">";
      });

  py::class_<PeakAnalysis>(m, "PeakAnalysis")
      .def(py::init<>())
      .def_readonly("edges", &PeakAnalysis::edges)
      .def_readonly("weights", &PeakAnalysis::weights)
      .def_readonly("pmax1", &PeakAnalysis::pmax1, "Weight of the left peak")
      .def_readonly("pmax1_index", &PeakAnalysis::pmax1_index)
      .def_readonly("pmax2", &PeakAnalysis::pmax2, "Weight of the right peak")
      .def_readonly("pmax2_index", &PeakAnalysis::pmax2_index)
      .def_readonly("midpoint", &PeakAnalysis::midpoint)
      .def_readonly("pmin", &PeakAnalysis::pmin, "Weight of the trough")
      .def_readonly("pmin_index", &PeakAnalysis::pmin_index)
      .def("lower_level", &PeakAnalysis::lower_level)
      .def("upper_level", &PeakAnalysis::upper_level)
      .def("trough_level", &PeakAnalysis::trough_level)
      .def("__repr__", [](const PeakAnalysis &p) {
        return "<PeakAnalysis peaks=(" + std::to_string(p.pmax1_index) + ", " +
               std::to_string(p.pmax2_index) +
               ") trough=" + std::to_string(p.pmin_index) + ">";
      });

  py::class_<ThresholdBand>(m, "ThresholdBand")
      .def(py::init<>())
      .def(py::init<double, double, double>(), py::arg("threshold_centre"),
           py::arg("x1"), py::arg("x2"))
      .def_readwrite("threshold_centre", &ThresholdBand::threshold_centre)
      .def_readwrite("x1", &ThresholdBand::x1, "Lower band edge")
      .def_readwrite("x2", &ThresholdBand::x2, "Upper band edge")
      .def("width", &ThresholdBand::width)
      .def("__repr__", [](const ThresholdBand &b) {
        return "<ThresholdBand centre=" + std::to_string(b.threshold_centre) +
               " [" + std::to_string(b.x1) + ", " + std::to_string(b.x2) +
               "]>";
      });

  py::class_<Segmentation>(m, "Segmentation")
      .def(py::init<>())
      .def_readonly("breakpoints", &Segmentation::breakpoints,
                    "Transition times (seconds)")
      .def_readonly("dwell_times", &Segmentation::dwell_times)
      .def_readonly("initial_state", &Segmentation::initial_state)
      .def("transitions", &Segmentation::transitions)
      .def("__repr__", [](const Segmentation &s) {
        return "<Segmentation transitions=" +
               std::to_string(s.transitions()) +
               " initial_state=" + std::to_string(s.initial_state) + ">";
      });

  py::class_<SampleStatistics>(m, "SampleStatistics")
      .def(py::init<>())
      .def_readonly("mean", &SampleStatistics::mean)
      .def_readonly("std_dev", &SampleStatistics::std_dev,
                    "Sample standard deviation (n - 1)")
      .def_readonly("min", &SampleStatistics::min)
      .def_readonly("max", &SampleStatistics::max)
      .def_readonly("count", &SampleStatistics::count)
      .def("range", &SampleStatistics::range)
      .def("__repr__", [](const SampleStatistics &s) {
        return "<SampleStatistics mean=" + std::to_string(s.mean) +
               " std=" + std::to_string(s.std_dev) +
               " count=" + std::to_string(s.count) + ">";
      });

  // ===== HISTOGRAM AND PEAKS =====

  m.def("build_histogram",
        py::overload_cast<const std::vector<float> &, int>(&build_histogram),
        py::arg("samples"), py::arg("bins") = 0,
        R"pbdoc(
            Fixed-width amplitude histogram of a trace.

            Args:
                samples: Trace amplitudes (all finite)
                bins: Number of bins, or 0 for the Freedman-Diaconis rule

            Returns:
                Count histogram over [min, max]

            Raises:
                InvalidInputError: empty, non-finite or zero-range input
        )pbdoc");

  m.def("to_probability", &to_probability, py::arg("histogram"),
        "Normalize histogram weights to sum to 1");

  m.def("summarize_trace", &summarize_trace, py::arg("samples"),
        "Mean, standard deviation and extrema of a trace");

  m.def("analyze_peaks", &analyze_peaks, py::arg("prob_histogram"),
        R"pbdoc(
            Locate both conductance peaks and the trough between them.

            The result is canonicalized so pmax1 is the left peak.

            Args:
                prob_histogram: Probability histogram (see to_probability)
        )pbdoc");

  m.def("threshold_band", &threshold_band, py::arg("analysis"),
        py::arg("epsilon"), "Threshold band around the detected trough");

  m.def("threshold_band_at", &threshold_band_at, py::arg("analysis"),
        py::arg("trough_index"), py::arg("epsilon"),
        "Threshold band around an explicit trough bin");

  // ===== SEGMENTATION =====

  m.def("segment_by_threshold", &segment_by_threshold, py::arg("samples"),
        py::arg("dt"), py::arg("band"),
        R"pbdoc(
            Single-pass threshold-crossing segmentation with hysteresis.

            Samples in (x1, x2) are uncertain; a crossing is placed at the
            median time of the uncertain samples preceding it.

            Returns:
                Segmentation with breakpoints, dwell times and initial state
        )pbdoc");

  m.def("extract_transitions", &extract_transitions, py::arg("labels"),
        py::arg("dt"), "Breakpoints at every label change");

  m.def("dwell_times_from_breakpoints", &dwell_times_from_breakpoints,
        py::arg("breakpoints"));

  m.def("dwell_times_with_tail", &dwell_times_with_tail,
        py::arg("segmentation"), py::arg("duration"),
        "Dwell times including the final censored dwell");

  m.def("idealize_from_breakpoints", &idealize_from_breakpoints,
        py::arg("breakpoints"), py::arg("initial_state"), py::arg("n"),
        py::arg("dt"), "Per-sample labels from breakpoint times");

  m.def("levels_from_labels", &levels_from_labels, py::arg("labels"),
        py::arg("low"), py::arg("high"));

  // ===== NORMALIZATION =====

  m.def("zscore", &StatisticsEngine::zscore, py::arg("samples"),
        "Z-score normalization (a constant trace is only centred)");
  m.def("unit_range", &StatisticsEngine::unit_range, py::arg("samples"),
        "Min-max scaling to [0, 1]");

  m.def(
      "zscore_numpy",
      [](py::array_t<float, py::array::c_style | py::array::forcecast> samples) {
        py::buffer_info buf = samples.request();
        if (buf.ndim != 1) {
          throw std::runtime_error("Array must be 1-dimensional");
        }
        const float *ptr = static_cast<const float *>(buf.ptr);
        std::vector<float> normalized =
            StatisticsEngine::zscore(std::vector<float>(ptr, ptr + buf.size));

        py::array_t<float> out(normalized.size());
        std::copy(normalized.begin(), normalized.end(), out.mutable_data());
        return out;
      },
      py::arg("samples"), "Z-score a NumPy array, returning a new array");

  // ===== ARROW INTEGRATION UTILITIES =====

  m.def("is_arrow_available", &arrow_utils::is_arrow_available,
        "Check if Arrow Compute is available for SIMD acceleration\n"
        "Returns True if Arrow was compiled in, False otherwise.");
}
