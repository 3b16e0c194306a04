#pragma once

#include <stdexcept>
#include <string>

namespace gesture {

// Rejected configuration (thrown at construction, values are never clamped)
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed per-frame input; callers treat it as "no hand"
class InvalidInput : public std::runtime_error {
public:
    explicit InvalidInput(const std::string& what) : std::runtime_error(what) {}
};

} // namespace gesture
