#pragma once

/**
 * @file trace_io.hpp
 * @brief Plain-text trace files and dataset discovery
 *
 * Dataset layout:
 *   root/first.txt                               "ceN.txt,state" per line
 *   root/sampling/<group>/ceN.txt                one amplitude per line
 *   root/dwell_times/<group>/ceNdwell_timesy.txt one dwell time (s) per line
 */

#include "ionchannel/core/types.hpp"
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ionchannel {

/// One trace file and its dwell-time annotation
struct DatasetEntry {
    std::string name;                  ///< Data file name, e.g. "ce3.txt"
    std::string group;                 ///< Sampling subdirectory (voltage)
    std::filesystem::path data_path;
    std::filesystem::path dwell_path;
};

/// All traces below a dataset root
struct Dataset {
    std::filesystem::path root;
    std::filesystem::path initial_states_path;  ///< root/first.txt
    std::vector<DatasetEntry> entries;          ///< Sorted by group, then name
};

/// Labels of one idealized trace, in output order
using NamedLabels = std::pair<std::string, std::vector<StateLabel>>;

/**
 * One value per line, blank lines skipped.
 * @throws IonChannelError when the file cannot be opened
 * @throws InvalidInputError on an unparsable line
 */
std::vector<double> read_values(const std::filesystem::path& path);

/**
 * Trace samples and ground-truth dwell times.
 * The trace is named after the data file.
 */
LabeledTrace read_trace(const std::filesystem::path& data_path,
                        const std::filesystem::path& dwell_path,
                        double dt = constants::DEFAULT_DT,
                        StateLabel initial_state = 0);

/**
 * "filename,state" lines mapped to the initial state of each trace.
 * @throws InvalidInputError on a malformed line or a state outside {0, 1}
 */
std::map<std::string, StateLabel> read_initial_states(const std::filesystem::path& path);

/**
 * Pair every root/sampling/<group>/ceN.txt with its dwell-time file.
 * @throws IonChannelError when root/sampling does not exist
 */
Dataset discover_dataset(const std::filesystem::path& root);

/**
 * Load every trace of a dataset with its initial state from first.txt.
 * @throws InvalidInputError when a trace has no recorded initial state
 */
std::vector<LabeledTrace> load_dataset(const Dataset& dataset,
                                       double dt = constants::DEFAULT_DT);

/**
 * First data_size samples of a trace (all when 0 or larger than the
 * trace), keeping the dwell times whose cumulative sum fits in
 * data_size * dt.
 */
LabeledTrace truncate_trace(const LabeledTrace& trace, size_t data_size);

/// Sample times i * dt
std::vector<double> time_axis(size_t n, double dt);

/**
 * Write "name\n" followed by comma-joined labels for every trace.
 * @throws IonChannelError when the file cannot be written
 */
void write_idealizations(const std::filesystem::path& path,
                         const std::vector<NamedLabels>& idealizations);

} // namespace ionchannel
