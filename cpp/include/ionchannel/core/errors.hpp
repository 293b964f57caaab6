#pragma once

#include <stdexcept>
#include <string>

namespace ionchannel {

/// Base class for all errors raised by the idealization engine
class IonChannelError : public std::runtime_error {
public:
    explicit IonChannelError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Empty or degenerate input arrays (zero range, mismatched lengths, zero weight)
class InvalidInputError : public IonChannelError {
public:
    explicit InvalidInputError(const std::string& what)
        : IonChannelError(what) {}
};

/// Trace too short for the requested detector or score
class InsufficientDataError : public IonChannelError {
public:
    explicit InsufficientDataError(const std::string& what)
        : IonChannelError(what) {}
};

/// Breakpoint sequence that cannot be turned into dwell times (not increasing).
/// An empty sequence is a valid "no activity" result and never raises this.
class DegenerateResultError : public IonChannelError {
public:
    explicit DegenerateResultError(const std::string& what)
        : IonChannelError(what) {}
};

/// Invalid method parameters: non-positive dt or bins, inverted band, unknown method
class ConfigurationError : public IonChannelError {
public:
    explicit ConfigurationError(const std::string& what)
        : IonChannelError(what) {}
};

} // namespace ionchannel
