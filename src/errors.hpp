#pragma once

#include <stdexcept>
#include <string>

namespace building_sim {

// Invalid building, controller or heat-pump configuration.
// Raised at construction or first use, never silently defaulted.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string &msg)
      : std::runtime_error(msg) {}
};

// Simulation inputs that do not satisfy the run's preconditions
// (series length, non-finite samples). Raised before any computation.
class ValidationError : public std::runtime_error {
public:
  explicit ValidationError(const std::string &msg)
      : std::runtime_error(msg) {}
};

} // namespace building_sim
