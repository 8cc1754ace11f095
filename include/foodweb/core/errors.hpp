#pragma once

/**
 * @file errors.hpp
 * @brief Exception types raised by model construction and simulation runs.
 */

#include <stdexcept>
#include <string>

namespace foodweb {

/**
 * @brief A precondition on the model or the run was violated.
 *
 * Raised before any integration happens (bad indices, wrong pool counts,
 * mismatched state length, empty time span).
 */
class ValidationError : public std::invalid_argument {
public:
  explicit ValidationError(const std::string &what)
      : std::invalid_argument(what) {}
};

/**
 * @brief A run reached the integrator but did not produce a usable result.
 */
class SimulationError : public std::runtime_error {
public:
  explicit SimulationError(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace foodweb
