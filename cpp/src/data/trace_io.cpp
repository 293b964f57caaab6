#include "ionchannel/data/trace_io.hpp"
#include "ionchannel/core/errors.hpp"
#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ionchannel {

namespace {

std::string trim(const std::string &s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

bool try_parse_double(const std::string &str, double &out) {
  if (str.empty()) {
    return false;
  }

  try {
    size_t pos;
    out = std::stod(str, &pos);
    // Check if entire string was consumed
    return pos == str.size();
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }
}

/// ceN.txt -> ceNdwell_timesy.txt
std::string dwell_file_name(const std::string &data_file) {
  const auto dot = data_file.find('.');
  if (dot == std::string::npos) {
    return data_file + "dwell_timesy";
  }
  return data_file.substr(0, dot) + "dwell_timesy" + data_file.substr(dot);
}

} // namespace

std::vector<double> read_values(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw IonChannelError("Cannot open file: " + path.string());
  }

  std::vector<double> values;
  std::string line;
  size_t line_number = 0;
  while (std::getline(file, line)) {
    ++line_number;
    const std::string field = trim(line);
    // Skip empty lines
    if (field.empty()) {
      continue;
    }

    double value = 0.0;
    if (!try_parse_double(field, value)) {
      throw InvalidInputError(path.string() + ":" + std::to_string(line_number) +
                              ": not a number: '" + field + "'");
    }
    values.push_back(value);
  }
  return values;
}

LabeledTrace read_trace(const fs::path &data_path, const fs::path &dwell_path,
                        double dt, StateLabel initial_state) {
  if (!(dt > 0.0)) {
    throw ConfigurationError("sample interval must be positive");
  }

  const std::vector<double> samples = read_values(data_path);

  LabeledTrace labeled;
  labeled.trace = Trace(data_path.filename().string(),
                        std::vector<float>(samples.begin(), samples.end()), dt);
  labeled.dwell_times = read_values(dwell_path);
  labeled.initial_state = initial_state;
  return labeled;
}

std::map<std::string, StateLabel> read_initial_states(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw IonChannelError("Cannot open file: " + path.string());
  }

  std::map<std::string, StateLabel> states;
  std::string line;
  size_t line_number = 0;
  while (std::getline(file, line)) {
    ++line_number;
    if (trim(line).empty()) {
      continue;
    }

    const auto comma = line.find(',');
    if (comma == std::string::npos) {
      throw InvalidInputError(path.string() + ":" + std::to_string(line_number) +
                              ": expected 'filename,state'");
    }
    const std::string name = trim(line.substr(0, comma));
    const std::string state = trim(line.substr(comma + 1));
    if (name.empty() || (state != "0" && state != "1")) {
      throw InvalidInputError(path.string() + ":" + std::to_string(line_number) +
                              ": invalid entry '" + trim(line) + "'");
    }
    states[name] = static_cast<StateLabel>(state == "1" ? 1 : 0);
  }
  return states;
}

Dataset discover_dataset(const fs::path &root) {
  const fs::path sampling = root / "sampling";
  if (!fs::is_directory(sampling)) {
    throw IonChannelError("Dataset has no sampling directory: " +
                          sampling.string());
  }

  static const std::regex trace_name(R"(^ce\d+\.txt$)");

  Dataset dataset;
  dataset.root = root;
  dataset.initial_states_path = root / "first.txt";

  for (const auto &group_dir : fs::directory_iterator(sampling)) {
    if (!group_dir.is_directory()) {
      continue;
    }
    const std::string group = group_dir.path().filename().string();

    for (const auto &file : fs::directory_iterator(group_dir.path())) {
      const std::string name = file.path().filename().string();
      if (!file.is_regular_file() || !std::regex_match(name, trace_name)) {
        continue;
      }

      DatasetEntry entry;
      entry.name = name;
      entry.group = group;
      entry.data_path = file.path();
      entry.dwell_path = root / "dwell_times" / group / dwell_file_name(name);
      dataset.entries.push_back(std::move(entry));
    }
  }

  // directory_iterator order is unspecified
  std::sort(dataset.entries.begin(), dataset.entries.end(),
            [](const DatasetEntry &a, const DatasetEntry &b) {
              if (a.group != b.group) return a.group < b.group;
              return a.name < b.name;
            });
  return dataset;
}

std::vector<LabeledTrace> load_dataset(const Dataset &dataset, double dt) {
  const std::map<std::string, StateLabel> initial_states =
      read_initial_states(dataset.initial_states_path);

  std::vector<LabeledTrace> traces;
  traces.reserve(dataset.entries.size());
  for (const DatasetEntry &entry : dataset.entries) {
    auto it = initial_states.find(entry.name);
    if (it == initial_states.end()) {
      throw InvalidInputError("No initial state recorded for " + entry.name);
    }
    LabeledTrace labeled =
        read_trace(entry.data_path, entry.dwell_path, dt, it->second);
    labeled.trace.name = entry.group + "/" + entry.name;
    traces.push_back(std::move(labeled));
  }
  return traces;
}

LabeledTrace truncate_trace(const LabeledTrace &trace, size_t data_size) {
  const size_t n = trace.trace.size();
  if (data_size == 0 || data_size >= n) {
    return trace;
  }

  LabeledTrace truncated;
  truncated.initial_state = trace.initial_state;
  truncated.trace.name = trace.trace.name;
  truncated.trace.dt = trace.trace.dt;
  truncated.trace.samples.assign(trace.trace.samples.begin(),
                                 trace.trace.samples.begin() + data_size);

  const double max_time = static_cast<double>(data_size) * trace.trace.dt;
  double elapsed = 0.0;
  for (double dwell : trace.dwell_times) {
    elapsed += dwell;
    if (elapsed > max_time) {
      break;
    }
    truncated.dwell_times.push_back(dwell);
  }
  return truncated;
}

std::vector<double> time_axis(size_t n, double dt) {
  std::vector<double> times(n);
  for (size_t i = 0; i < n; ++i) {
    times[i] = static_cast<double>(i) * dt;
  }
  return times;
}

void write_idealizations(const fs::path &path,
                         const std::vector<NamedLabels> &idealizations) {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw IonChannelError("Cannot open file for writing: " + path.string());
  }

  for (const auto &[name, labels] : idealizations) {
    file << name << "\n";
    for (size_t i = 0; i < labels.size(); ++i) {
      if (i > 0) file << ",";
      file << static_cast<int>(labels[i]);
    }
    file << "\n";
  }

  if (!file) {
    throw IonChannelError("Failed to write file: " + path.string());
  }
}

} // namespace ionchannel
