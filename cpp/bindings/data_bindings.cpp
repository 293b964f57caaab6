/**
 * @file data_bindings.cpp
 * @brief Python bindings for trace files and dataset discovery
 */

#include "ionchannel/data/trace_io.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

namespace py = pybind11;
using namespace ionchannel;

void bind_data(py::module_ &m) {
  py::class_<DatasetEntry>(m, "DatasetEntry")
      .def(py::init<>())
      .def_readonly("name", &DatasetEntry::name)
      .def_readonly("group", &DatasetEntry::group,
                    "Sampling subdirectory (voltage)")
      .def_readonly("data_path", &DatasetEntry::data_path)
      .def_readonly("dwell_path", &DatasetEntry::dwell_path)
      .def("__repr__", [](const DatasetEntry &e) {
        return "<DatasetEntry " + e.group + "/" + e.name + ">";
      });

  py::class_<Dataset>(m, "Dataset")
      .def(py::init<>())
      .def_readonly("root", &Dataset::root)
      .def_readonly("initial_states_path", &Dataset::initial_states_path)
      .def_readonly("entries", &Dataset::entries)
      .def("__len__", [](const Dataset &d) { return d.entries.size(); })
      .def("__repr__", [](const Dataset &d) {
        return "<Dataset " + d.root.string() + " " +
               std::to_string(d.entries.size()) + " traces>";
      });

  m.def("read_values", &read_values, py::arg("path"),
        "One value per line, blank lines skipped");

  m.def("read_trace", &read_trace, py::arg("data_path"),
        py::arg("dwell_path"), py::arg("dt") = constants::DEFAULT_DT,
        py::arg("initial_state") = 0,
        "Trace samples and ground-truth dwell times");

  m.def("read_initial_states", &read_initial_states, py::arg("path"),
        "Map of trace file name to initial state");

  m.def("discover_dataset", &discover_dataset, py::arg("root"),
        R"pbdoc(
            Pair every root/sampling/<group>/ceN.txt with its dwell-time file.

            Example:
                >>> dataset = discover_dataset("data")
                >>> traces = load_dataset(dataset, 1e-4)
        )pbdoc");

  m.def("load_dataset", &load_dataset, py::arg("dataset"),
        py::arg("dt") = constants::DEFAULT_DT,
        py::call_guard<py::gil_scoped_release>());

  m.def("truncate_trace", &truncate_trace, py::arg("trace"),
        py::arg("data_size"));

  m.def("time_axis", &time_axis, py::arg("n"), py::arg("dt"));

  m.def("write_idealizations", &write_idealizations, py::arg("path"),
        py::arg("idealizations"),
        "Write name and comma-joined labels for every trace");
}
