#pragma once

/**
 * @file trajectory.hpp
 * @brief Sampled solution of a simulation run.
 */

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include <foodweb/model/flux.hpp>

namespace foodweb {
namespace sim {

using model::State;

/**
 * @brief Time-indexed sequence of state vectors.
 *
 * states[k] is the state at times[k]; every state has the length of the
 * ecosystem it was produced from.
 */
struct Trajectory {
  std::vector<double> times;
  std::vector<State> states;

  size_t size() const { return times.size(); }

  void append(double t, const State &state);

  const State &final_state() const { return states.back(); }

  // Value of one compartment at every sampled time.
  std::vector<double> series(size_t compartment) const;

  bool all_finite() const;

  /**
   * @brief Write as CSV: header "t,<label0>,<label1>,..." then one row per
   * sample. Labels default to c0, c1, ...
   */
  void write_csv(std::ostream &out,
                 const std::vector<std::string> &labels = {}) const;
  bool write_csv(const std::string &path,
                 const std::vector<std::string> &labels = {}) const;
};

} // namespace sim
} // namespace foodweb
