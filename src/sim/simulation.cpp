/**
 * @file simulation.cpp
 * @brief Run validation and integration.
 */

#include <algorithm>
#include <cmath>
#include <string>

#include <boost/numeric/odeint.hpp>

#include <foodweb/core/errors.hpp>
#include <foodweb/sim/simulation.hpp>

namespace foodweb {
namespace sim {

namespace odeint = boost::numeric::odeint;

namespace {

// Number of intervals between start and stop, bounded by MAX_SAMPLES.
size_t interval_count(double start, double stop, double interval) {
  // Tolerate rounding in (stop - start) / interval so the end point is kept
  const double span = std::floor((stop - start) / interval + 1e-9);
  if (!std::isfinite(span) || span < 0.0 ||
      span + 1.0 > constants::MAX_SAMPLES) {
    throw ValidationError("time span [" + std::to_string(start) + ", " +
                          std::to_string(stop) + "] at interval " +
                          std::to_string(interval) +
                          " does not give a usable number of samples");
  }
  return static_cast<size_t>(span);
}

} // namespace

std::vector<double> make_sample_times(double start, double stop,
                                      double interval) {
  const size_t n = interval_count(start, stop, interval);

  std::vector<double> times;
  times.reserve(n + 1);
  for (size_t k = 0; k <= n; ++k) {
    times.push_back(start + static_cast<double>(k) * interval);
  }
  return times;
}

void validate_run(const model::ModelContext &ctx, const State &u0,
                  double start, double stop, double interval) {
  if (!std::isfinite(start) || !std::isfinite(stop) || !(stop > start)) {
    throw ValidationError("stop time (" + std::to_string(stop) +
                          ") must be greater than start time (" +
                          std::to_string(start) + ")");
  }
  if (!std::isfinite(interval) || !(interval > 0.0)) {
    throw ValidationError("sample interval must be positive (got " +
                          std::to_string(interval) + ")");
  }
  interval_count(start, stop, interval);

  const model::Ecosystem &eco = ctx.ecosystem();
  if (u0.size() != eco.size()) {
    throw ValidationError("initial state has " + std::to_string(u0.size()) +
                          " entries but the ecosystem has " +
                          std::to_string(eco.size()) + " compartments");
  }

  eco.validate_pools();
  eco.validate_parameters();
}

Simulator::Simulator(const SolverConfig &config) : config_(config) {
  if (!(config_.max_dt > 0.0) || !(config_.initial_dt > 0.0)) {
    throw ValidationError("solver step sizes must be positive");
  }
  if (config_.max_steps <= 0) {
    throw ValidationError("solver step budget must be positive");
  }
}

Trajectory Simulator::run(const model::ModelContext &ctx, const State &u0,
                          double start, double stop, double interval) {
  validate_run(ctx, u0, start, stop, interval);

  const std::vector<double> times = make_sample_times(start, stop, interval);

  Trajectory trajectory;
  trajectory.times.reserve(times.size());
  trajectory.states.reserve(times.size());

  auto observer = [&trajectory, this](const State &x, double t) {
    trajectory.append(t, x);
    sample_signal_.publish(t, x);
  };

  auto stepper = odeint::make_controlled(
      config_.abs_tol, config_.rel_tol, config_.max_dt,
      odeint::runge_kutta_dopri5<State>());

  State x = u0;
  model::FoodWebSystem system(ctx);
  const double dt = std::min(config_.initial_dt, config_.max_dt);

  odeint::integrate_times(stepper, system, x, times.begin(), times.end(), dt,
                          observer, odeint::max_step_checker(config_.max_steps));

  if (!trajectory.all_finite()) {
    size_t k = 0;
    while (k < trajectory.size()) {
      const State &s = trajectory.states[k];
      if (!std::all_of(s.begin(), s.end(),
                       [](double v) { return std::isfinite(v); }))
        break;
      ++k;
    }
    double t_bad = k < trajectory.size() ? trajectory.times[k] : stop;
    throw SimulationError("solution became non-finite at t = " +
                          std::to_string(t_bad));
  }

  return trajectory;
}

Trajectory simulate(const model::ModelContext &ctx, const State &u0,
                    double start, double stop, double interval,
                    const SolverConfig &config) {
  Simulator simulator(config);
  return simulator.run(ctx, u0, start, stop, interval);
}

} // namespace sim
} // namespace foodweb
