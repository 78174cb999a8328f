#pragma once

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace polyBench {
namespace ErrorHandling {

// Caller supplied a value the generator cannot work with (delta, ranges,
// tunable parameters, command-line text)
class InputError : public std::invalid_argument {
public:
  explicit InputError(const std::string &message)
      : std::invalid_argument(message) {}
};

// A derived (m, n) shape is not feasible for the requested difficulty
class ShapeError : public std::runtime_error {
public:
  explicit ShapeError(const std::string &message)
      : std::runtime_error(message) {}
};

// A composition or distribution was requested with impossible totals
class BudgetError : public std::invalid_argument {
public:
  explicit BudgetError(const std::string &message)
      : std::invalid_argument(message) {}
};

// Assembled instance violates an invariant. Always a defect, never user input.
class ConsistencyError : public std::logic_error {
public:
  explicit ConsistencyError(const std::string &message)
      : std::logic_error(message) {}
};

// Common validation functions
inline void validate_positive(int64_t value, const std::string &param_name) {
  if (value < 1) {
    throw InputError(param_name + " must be positive, got " +
                     std::to_string(value));
  }
}

inline void validate_interval(double min_val, double max_val,
                              const std::string &param_name) {
  if (!std::isfinite(min_val) || !std::isfinite(max_val) || min_val <= 0.0 ||
      min_val >= max_val) {
    throw InputError(param_name + " must satisfy 0 < min < max, got [" +
                     std::to_string(min_val) + ", " + std::to_string(max_val) +
                     "]");
  }
}

} // namespace ErrorHandling
} // namespace polyBench
