#pragma once

/**
 * @file simulation.hpp
 * @brief Simulation driver over Boost.Odeint.
 *
 * Validates a run, builds the sample grid and integrates the food web with a
 * step-size controlled Dormand-Prince 5(4) stepper.
 */

#include <vector>

#include "entt/entt.hpp"
#include <foodweb/core/constants.hpp>
#include <foodweb/model/context.hpp>
#include <foodweb/model/derivative.hpp>
#include <foodweb/sim/trajectory.hpp>

namespace foodweb {
namespace sim {

/**
 * @brief Integrator configuration.
 */
struct SolverConfig {
  double max_dt = constants::DEFAULT_MAX_DT; // upper bound on internal steps
  double initial_dt = 0.01;
  double abs_tol = 1e-8;
  double rel_tol = 1e-6;
  int max_steps = 100000; // internal steps allowed between two samples
};

/**
 * @brief Sample times start, start + interval, ... not exceeding stop.
 * @throws ValidationError if the grid would hold more than
 *         constants::MAX_SAMPLES points or its size is not finite
 */
std::vector<double> make_sample_times(double start, double stop,
                                      double interval);

/**
 * @brief Check every precondition of a run.
 * @throws ValidationError if stop <= start, interval <= 0, the sample grid
 *         is too large, the initial state
 *         length differs from the compartment count, the ecosystem does not
 *         hold exactly one carbon and one nutrient pool, or a compartment
 *         parameter is out of range
 */
void validate_run(const model::ModelContext &ctx, const State &u0,
                  double start, double stop, double interval);

/**
 * @brief Runs food web integrations with a fixed solver configuration.
 *
 * Observers connected to on_sample() are notified with (t, state) at every
 * sample time, in order, while the run progresses.
 */
class Simulator {
public:
  using SampleSignal = entt::sigh<void(double, const State &)>;

  explicit Simulator(const SolverConfig &config = SolverConfig{});

  /**
   * @brief Integrate from u0 over [start, stop], sampling every interval.
   * @throws ValidationError before integrating if a precondition fails
   * @throws SimulationError if the solution became non-finite
   *
   * Integrator failures (boost::numeric::odeint::odeint_error, step budget
   * overflow) propagate unchanged.
   */
  Trajectory run(const model::ModelContext &ctx, const State &u0,
                 double start = constants::DEFAULT_START,
                 double stop = constants::DEFAULT_STOP,
                 double interval = constants::DEFAULT_SAMPLE_INTERVAL);

  auto on_sample() { return entt::sink{sample_signal_}; }

  const SolverConfig &config() const { return config_; }

private:
  SolverConfig config_;
  SampleSignal sample_signal_;
};

/**
 * @brief One-shot run with a default Simulator.
 */
Trajectory simulate(const model::ModelContext &ctx, const State &u0,
                    double start = constants::DEFAULT_START,
                    double stop = constants::DEFAULT_STOP,
                    double interval = constants::DEFAULT_SAMPLE_INTERVAL,
                    const SolverConfig &config = SolverConfig{});

} // namespace sim
} // namespace foodweb
