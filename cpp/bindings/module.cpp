#include "ionchannel/core/errors.hpp"
#include "ionchannel/core/version.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations for binding functions
void bind_processing(py::module_ &m);
void bind_statistics(py::module_ &m);
void bind_methods(py::module_ &m);
void bind_evaluation(py::module_ &m);
void bind_data(py::module_ &m);

/// Main Python module definition
PYBIND11_MODULE(ion_channel_cpp, m) {
  m.doc() = "Ion channel trace idealization - threshold, MDL and "
            "classifier methods with dwell-time evaluation";

  // Version information
  m.attr("__version__") = ionchannel::Version::get_version_string();
  m.def("get_version", &ionchannel::Version::get_version_string,
        "Get library version string");

  // Error hierarchy. Bad inputs and bad parameters are ValueErrors.
  auto base_error = py::register_exception<ionchannel::IonChannelError>(
      m, "IonChannelError", PyExc_RuntimeError);
  py::register_exception<ionchannel::InvalidInputError>(
      m, "InvalidInputError", PyExc_ValueError);
  py::register_exception<ionchannel::ConfigurationError>(
      m, "ConfigurationError", PyExc_ValueError);
  py::register_exception<ionchannel::InsufficientDataError>(
      m, "InsufficientDataError", base_error.ptr());
  py::register_exception<ionchannel::DegenerateResultError>(
      m, "DegenerateResultError", base_error.ptr());

  // Histogram, peaks, threshold segmentation
  bind_processing(m);

  // Shapiro-Wilk and noise scoring
  bind_statistics(m);

  // Idealization methods and their configurations
  bind_methods(m);

  // Ground truth, accuracy, batch evaluation
  bind_evaluation(m);

  // Trace files and datasets
  bind_data(m);
}
