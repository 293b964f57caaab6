/**
 * @file statistics_bindings.cpp
 * @brief Python bindings for normality testing and noise scoring
 */

#include "ionchannel/core/types.hpp"
#include "ionchannel/statistics/noise_evaluator.hpp"
#include "ionchannel/statistics/shapiro_wilk.hpp"
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace ionchannel;

void bind_statistics(py::module_ &m) {
  py::class_<ShapiroWilkResult>(m, "ShapiroWilkResult")
      .def(py::init<>())
      .def_readonly("w", &ShapiroWilkResult::w, "W statistic in (0, 1]")
      .def_readonly("p_value", &ShapiroWilkResult::p_value,
                    "Probability of W under normality")
      .def("__repr__", [](const ShapiroWilkResult &r) {
        return "<ShapiroWilkResult w=" + std::to_string(r.w) +
               " p=" + std::to_string(r.p_value) + ">";
      });

  py::class_<Noise>(m, "Noise")
      .def(py::init<>())
      .def_readonly("residuals", &Noise::residuals, "raw - idealized")
      .def_readonly("mean", &Noise::mean)
      .def_readonly("std_dev", &Noise::std_dev)
      .def("__len__", &Noise::size)
      .def("__repr__", [](const Noise &n) {
        return "<Noise " + std::to_string(n.size()) +
               " residuals mean=" + std::to_string(n.mean) +
               " std=" + std::to_string(n.std_dev) + ">";
      });

  py::class_<DwellTimeComparison>(m, "DwellTimeComparison")
      .def(py::init<>())
      .def_readonly("mse", &DwellTimeComparison::mse,
                    "Mean squared difference of bin weights")
      .def_readonly("hist_true", &DwellTimeComparison::hist_true)
      .def_readonly("hist_approx", &DwellTimeComparison::hist_approx)
      .def_readonly("scale_true", &DwellTimeComparison::scale_true,
                    "Exponential scale (mean dwell) of the true set")
      .def_readonly("scale_approx", &DwellTimeComparison::scale_approx)
      .def("__repr__", [](const DwellTimeComparison &c) {
        return "<DwellTimeComparison mse=" + std::to_string(c.mse) +
               " scale_true=" + std::to_string(c.scale_true) +
               " scale_approx=" + std::to_string(c.scale_approx) + ">";
      });

  py::class_<NormalFit>(m, "NormalFit")
      .def(py::init<>())
      .def_readonly("histogram", &NormalFit::histogram)
      .def_readonly("pdf", &NormalFit::pdf, "Fitted density at each bin centre")
      .def_readonly("mean", &NormalFit::mean)
      .def_readonly("std_dev", &NormalFit::std_dev);

  m.def("shapiro_wilk", &shapiro_wilk, py::arg("sample"),
        R"pbdoc(
            Shapiro-Wilk W test (Royston 1995, AS R94).

            Args:
                sample: 3 to 5000 observations

            Returns:
                ShapiroWilkResult with w and p_value
        )pbdoc");

  m.def("normal_quantile", &normal_quantile, py::arg("p"),
        "Inverse of the standard normal CDF");

  m.def("compute_noise", &compute_noise, py::arg("raw"), py::arg("idealized"),
        "Residuals between a trace and its idealization");

  m.def("noise_normality_score", &noise_normality_score, py::arg("noise"),
        py::arg("batch_size") = constants::NORMALITY_BATCH_SIZE,
        R"pbdoc(
            Mean Shapiro-Wilk p-value over complete batches of the residuals.

            Returns:
                Mean p-value, NaN when no batch could be scored
        )pbdoc");

  m.def("mean_squared_error", &mean_squared_error, py::arg("true_dwells"),
        py::arg("approx_dwells"),
        py::arg("bins") = constants::DEFAULT_DWELL_BINS,
        "Compare two dwell-time distributions by their fixed-bin histograms");

  m.def("exponential_scale", &exponential_scale, py::arg("dwell_times"));

  m.def("fit_normal_to_noise", &fit_normal_to_noise, py::arg("noise"),
        py::arg("bins") = constants::DEFAULT_HISTOGRAM_BINS);

  m.def("fit_mse", &fit_mse, py::arg("fit"),
        "Mean squared difference between the residual and fitted densities");
}
