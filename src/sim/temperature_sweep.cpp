/**
 * @file temperature_sweep.cpp
 * @brief OpenMP-parallel temperature sweep.
 */

#include <exception>
#include <iostream>

#include <foodweb/sim/temperature_sweep.hpp>
#include <omp.h>

namespace foodweb {
namespace sim {

std::vector<SweepResult>
run_temperature_sweep(const model::ModelContext &ctx, const State &u0,
                      const std::vector<double> &temperatures, double start,
                      double stop, double interval,
                      const SolverConfig &config) {
  validate_run(ctx, u0, start, stop, interval);

  // Contexts are built up front so bad temperatures fail before any run
  std::vector<model::ModelContext> contexts;
  contexts.reserve(temperatures.size());
  for (double T : temperatures) {
    contexts.push_back(ctx.with_temperature(T));
  }

  const int n_runs = static_cast<int>(temperatures.size());
  std::vector<SweepResult> results(temperatures.size());
  std::vector<std::exception_ptr> errors(temperatures.size());

  // Runs share nothing mutable; each thread owns its Simulator
#pragma omp parallel for schedule(dynamic, 1)
  for (int r = 0; r < n_runs; ++r) {
    try {
      Simulator simulator(config);
      results[r].temperature = temperatures[r];
      results[r].trajectory =
          simulator.run(contexts[r], u0, start, stop, interval);
    } catch (const std::exception &) {
      errors[r] = std::current_exception();
    }
  }

  for (int r = 0; r < n_runs; ++r) {
    if (errors[r]) {
      std::cerr << "[SIM] Run at T = " << temperatures[r]
                << " K failed, aborting sweep" << std::endl;
      std::rethrow_exception(errors[r]);
    }
  }

  return results;
}

} // namespace sim
} // namespace foodweb
