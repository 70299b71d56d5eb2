#pragma once
#include <stdexcept>

namespace payroll {

// Mapping file or run options are unusable.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The fill itself cannot proceed (e.g. duplicate labels under DuplicatePolicy::Error).
class FillError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace payroll
