#ifndef MONITOR_ERRORS_H
#define MONITOR_ERRORS_H

#include <stdexcept>
#include <string>

// Base for every error raised at a component boundary.
class MonitorError : public std::runtime_error {
public:
    explicit MonitorError(const std::string& what) : std::runtime_error(what) {}
};

// Not enough reference data to compute a statistic (e.g. baseline < 2 points).
class InsufficientDataError : public MonitorError {
public:
    explicit InsufficientDataError(const std::string& what) : MonitorError(what) {}
};

// Unsupported mode string or out-of-range parameter.
class InvalidConfigurationError : public MonitorError {
public:
    explicit InvalidConfigurationError(const std::string& what) : MonitorError(what) {}
};

// Non-finite or missing sample value.
class InvalidInputError : public MonitorError {
public:
    explicit InvalidInputError(const std::string& what) : MonitorError(what) {}
};

#endif  // MONITOR_ERRORS_H
