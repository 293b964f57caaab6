#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace ionchannel {
namespace log_utils {

inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t minutes = total_seconds / 60;
    return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

/// Tagged progress line on stdout, e.g. "[EVAL] 12 traces"
inline void info(const char* tag, const std::string& message) {
    std::cout << "[" << tag << "] " << message << std::endl;
}

/// Tagged warning line on stderr
inline void warn(const char* tag, const std::string& message) {
    std::cerr << "[" << tag << "] WARNING: " << message << std::endl;
}

}  // namespace log_utils
}  // namespace ionchannel
