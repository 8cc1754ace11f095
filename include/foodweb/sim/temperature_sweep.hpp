#pragma once

/**
 * @file temperature_sweep.hpp
 * @brief Independent runs of one food web across a range of temperatures.
 */

#include <vector>

#include <foodweb/sim/simulation.hpp>

namespace foodweb {
namespace sim {

/**
 * @brief Outcome of one run in a sweep.
 */
struct SweepResult {
  double temperature = 0.0;
  Trajectory trajectory;
};

/**
 * @brief Run the model once per temperature, in parallel.
 *
 * Every run uses ctx.with_temperature(T) and the same initial state and time
 * grid. Results come back in the order of `temperatures`.
 *
 * @throws ValidationError before any run if the shared preconditions fail
 * @throws the first failure of any run, after all runs have finished
 */
std::vector<SweepResult>
run_temperature_sweep(const model::ModelContext &ctx, const State &u0,
                      const std::vector<double> &temperatures,
                      double start = constants::DEFAULT_START,
                      double stop = constants::DEFAULT_STOP,
                      double interval = constants::DEFAULT_SAMPLE_INTERVAL,
                      const SolverConfig &config = SolverConfig{});

} // namespace sim
} // namespace foodweb
