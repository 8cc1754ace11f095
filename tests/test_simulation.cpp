/**
 * @file test_simulation.cpp
 * @brief Tests for the simulation driver and temperature sweeps.
 */

#include <cassert>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <boost/numeric/odeint.hpp>

#include <foodweb/core/errors.hpp>
#include <foodweb/model/context.hpp>
#include <foodweb/model/ecosystem.hpp>
#include <foodweb/sim/simulation.hpp>
#include <foodweb/sim/temperature_sweep.hpp>

using namespace foodweb;

namespace {

model::Autotroph make_autotroph() {
  model::Autotroph sp;
  sp.epsilon = 0.5;
  sp.ks = 1.0;
  sp.P = {1.0, 0.0, 293.0};
  sp.R = {1.0, 0.0, 293.0};
  sp.D = 0.01;
  sp.a = 0.001;
  return sp;
}

model::Ecosystem single_species() {
  model::Ecosystem eco;
  eco.add(make_autotroph());
  eco.add(model::CarbonPool{false});
  eco.add(model::NutrientPool{1.0});
  return eco;
}

model::Ecosystem mixed_web() {
  model::Ecosystem eco;
  model::Autotroph producer = make_autotroph();
  producer.P = {1.5, 0.32, 293.0};
  producer.R = {0.1, 0.65, 293.0};
  eco.add(producer);

  model::Heterotroph consumer;
  consumer.epsilon = 0.4;
  consumer.ks = 1.0;
  consumer.kc = 2.0;
  consumer.mu = {0.8, 0.65, 293.0};
  consumer.R = {0.1, 0.65, 293.0};
  consumer.D = 0.02;
  consumer.a = 0.01;
  eco.add(consumer);

  eco.add(model::CarbonPool{true});
  eco.add(model::NutrientPool{1.0});
  return eco;
}

struct SampleCounter {
  int count = 0;
  std::vector<double> times;

  void on_sample(double t, const sim::State &) {
    ++count;
    times.push_back(t);
  }
};

} // namespace

void test_sample_times() {
  std::cout << "Testing sample time grid..." << std::endl;

  auto times = sim::make_sample_times(0.0, 10.0, 1.0);
  assert(times.size() == 11);
  for (size_t k = 0; k < times.size(); ++k)
    assert(times[k] == static_cast<double>(k));

  // Rounding in the span must not drop the end point
  auto fine = sim::make_sample_times(0.0, 1.0, 0.1);
  assert(fine.size() == 11);
  assert(std::abs(fine.back() - 1.0) < 1e-12);

  // Interval not dividing the span stops short of stop
  auto coarse = sim::make_sample_times(0.0, 10.0, 3.0);
  assert(coarse.size() == 4);
  assert(coarse.back() == 9.0);

  // A grid too large to represent is rejected, not truncated
  bool threw = false;
  try {
    sim::make_sample_times(0.0, 1e300, 1e-10);
  } catch (const ValidationError &) {
    threw = true;
  }
  assert(threw);

  std::cout << "  Sample times: PASS" << std::endl;
}

void test_simulate_samples() {
  std::cout << "Testing simulate output shape..." << std::endl;

  model::Ecosystem eco = single_species();
  model::ModelContext ctx = model::make_context(eco, 293.0);
  sim::State u0 = {1.0, 0.0, 5.0};

  sim::Trajectory traj = sim::simulate(ctx, u0, 0.0, 10.0, 1.0);
  assert(traj.size() == 11);
  for (size_t k = 0; k < traj.size(); ++k) {
    assert(std::abs(traj.times[k] - static_cast<double>(k)) < 1e-12);
    assert(traj.states[k].size() == u0.size());
  }

  // Initial sample is the initial condition
  for (size_t i = 0; i < u0.size(); ++i)
    assert(traj.states.front()[i] == u0[i]);

  // Unlinked carbon pool never moves
  for (double v : traj.series(1))
    assert(v == 0.0);

  // Autotroph declines (respiration exceeds retained uptake at this state)
  assert(traj.final_state()[0] < u0[0]);
  assert(traj.all_finite());

  std::cout << "  Simulate samples: PASS" << std::endl;
}

void test_pool_only_analytic() {
  std::cout << "Testing nutrient supply against closed form..." << std::endl;

  // With no living biomass the nutrient pool grows linearly at R
  model::Ecosystem eco = single_species();
  model::ModelContext ctx = model::make_context(eco, 293.0);
  sim::State u0 = {0.0, 0.0, 2.0};

  sim::Trajectory traj = sim::simulate(ctx, u0, 0.0, 20.0, 2.0);
  assert(traj.size() == 11);
  for (size_t k = 0; k < traj.size(); ++k) {
    assert(traj.states[k][0] == 0.0);
    assert(std::abs(traj.states[k][2] - (2.0 + traj.times[k])) < 1e-6);
  }

  std::cout << "  Closed form: PASS" << std::endl;
}

void test_validation_failures() {
  std::cout << "Testing run validation..." << std::endl;

  model::Ecosystem eco = single_species();
  model::ModelContext ctx = model::make_context(eco, 293.0);

  sim::Simulator simulator;
  SampleCounter counter;
  simulator.on_sample().connect<&SampleCounter::on_sample>(counter);

  int failures = 0;

  // State length mismatch
  try {
    simulator.run(ctx, {1.0, 0.0}, 0.0, 10.0, 1.0);
  } catch (const ValidationError &) {
    ++failures;
  }

  // stop <= start
  try {
    simulator.run(ctx, {1.0, 0.0, 5.0}, 10.0, 10.0, 1.0);
  } catch (const ValidationError &) {
    ++failures;
  }

  // Non-positive interval
  try {
    simulator.run(ctx, {1.0, 0.0, 5.0}, 0.0, 10.0, 0.0);
  } catch (const ValidationError &) {
    ++failures;
  }

  // Two carbon pools
  model::Ecosystem two_carbon = single_species();
  two_carbon.add(model::CarbonPool{true});
  model::ModelContext ctx_two(two_carbon, 293.0, 2, 1);
  try {
    simulator.run(ctx_two, {1.0, 0.0, 5.0, 0.0}, 0.0, 10.0, 1.0);
  } catch (const ValidationError &) {
    ++failures;
  }

  // No nutrient pool
  model::Ecosystem no_nutrient;
  no_nutrient.add(make_autotroph());
  no_nutrient.add(make_autotroph());
  no_nutrient.add(model::CarbonPool{true});
  model::ModelContext ctx_none(no_nutrient, 293.0, 1, 2);
  try {
    simulator.run(ctx_none, {1.0, 1.0, 0.0}, 0.0, 10.0, 1.0);
  } catch (const ValidationError &) {
    ++failures;
  }

  // Sample grid too large
  try {
    simulator.run(ctx, {1.0, 0.0, 5.0}, 0.0, 1e300, 1e-10);
  } catch (const ValidationError &) {
    ++failures;
  }

  assert(failures == 6);
  // Nothing reached the integrator
  assert(counter.count == 0);

  std::cout << "  Validation: PASS" << std::endl;
}

void test_sample_signal() {
  std::cout << "Testing sample signal..." << std::endl;

  model::Ecosystem eco = mixed_web();
  model::ModelContext ctx = model::make_context(eco, 293.0);

  sim::Simulator simulator;
  SampleCounter counter;
  simulator.on_sample().connect<&SampleCounter::on_sample>(counter);

  sim::Trajectory traj =
      simulator.run(ctx, {1.0, 0.5, 2.0, 4.0}, 0.0, 50.0, 5.0);
  assert(counter.count == 11);
  assert(counter.times.size() == traj.size());
  for (size_t k = 0; k < traj.size(); ++k)
    assert(counter.times[k] == traj.times[k]);

  simulator.on_sample().disconnect<&SampleCounter::on_sample>(counter);
  simulator.run(ctx, {1.0, 0.5, 2.0, 4.0}, 0.0, 10.0, 5.0);
  assert(counter.count == 11);

  std::cout << "  Sample signal: PASS" << std::endl;
}

void test_non_finite_run() {
  std::cout << "Testing non-finite run detection..." << std::endl;

  // ks = 0 with an empty nutrient pool gives 0/0 in the limitation term
  model::Ecosystem eco;
  model::Autotroph sp = make_autotroph();
  sp.ks = 0.0;
  eco.add(sp);
  eco.add(model::CarbonPool{true});
  eco.add(model::NutrientPool{0.0});
  model::ModelContext ctx = model::make_context(eco, 293.0);

  bool threw = false;
  try {
    sim::simulate(ctx, {1.0, 0.0, 0.0}, 0.0, 5.0, 1.0);
  } catch (const SimulationError &) {
    threw = true;
  }
  assert(threw);

  std::cout << "  Non-finite run: PASS" << std::endl;
}

void test_step_budget() {
  std::cout << "Testing integrator step budget..." << std::endl;

  model::Ecosystem eco = single_species();
  model::ModelContext ctx = model::make_context(eco, 293.0);

  sim::SolverConfig config;
  config.max_dt = 1e-3;
  config.initial_dt = 1e-3;
  config.max_steps = 10;

  bool threw = false;
  try {
    sim::simulate(ctx, {1.0, 0.0, 5.0}, 0.0, 10.0, 1.0, config);
  } catch (const boost::numeric::odeint::odeint_error &) {
    threw = true;
  }
  assert(threw);

  std::cout << "  Step budget: PASS" << std::endl;
}

void test_csv_export() {
  std::cout << "Testing CSV export..." << std::endl;

  model::Ecosystem eco = single_species();
  model::ModelContext ctx = model::make_context(eco, 293.0);
  sim::Trajectory traj = sim::simulate(ctx, {1.0, 0.0, 5.0}, 0.0, 2.0, 1.0);

  std::ostringstream out;
  traj.write_csv(out);
  std::istringstream in(out.str());
  std::string line;
  std::getline(in, line);
  assert(line == "t,c0,c1,c2");

  int rows = 0;
  while (std::getline(in, line))
    ++rows;
  assert(rows == 3);

  std::ostringstream labelled;
  traj.write_csv(labelled, {"algae", "carbon", "nutrient"});
  assert(labelled.str().rfind("t,algae,carbon,nutrient\n", 0) == 0);

  std::cout << "  CSV export: PASS" << std::endl;
}

void test_temperature_sweep() {
  std::cout << "Testing temperature sweep..." << std::endl;

  model::Ecosystem eco = mixed_web();
  model::ModelContext ctx = model::make_context(eco, 293.0);
  sim::State u0 = {1.0, 0.5, 2.0, 4.0};

  std::vector<double> temperatures = {303.0, 283.0, 293.0, 298.0};
  auto results =
      sim::run_temperature_sweep(ctx, u0, temperatures, 0.0, 20.0, 2.0);

  assert(results.size() == temperatures.size());
  for (size_t r = 0; r < results.size(); ++r) {
    assert(results[r].temperature == temperatures[r]);
    assert(results[r].trajectory.size() == 11);
  }

  // Each run matches a serial run at the same temperature
  sim::Trajectory serial = sim::simulate(ctx, u0, 0.0, 20.0, 2.0);
  const sim::State &a = results[2].trajectory.final_state();
  const sim::State &b = serial.final_state();
  for (size_t i = 0; i < a.size(); ++i)
    assert(std::abs(a[i] - b[i]) < 1e-12);

  // Warmer runs differ from colder ones
  assert(results[0].trajectory.final_state()[0] !=
         results[1].trajectory.final_state()[0]);

  // A bad temperature fails before any run
  bool threw = false;
  try {
    sim::run_temperature_sweep(ctx, u0, {293.0, -1.0}, 0.0, 20.0, 2.0);
  } catch (const ValidationError &) {
    threw = true;
  }
  assert(threw);

  std::cout << "  Temperature sweep: PASS" << std::endl;
}

int main() {
  std::cout << "=== Running Simulation Tests ===" << std::endl;

  test_sample_times();
  test_simulate_samples();
  test_pool_only_analytic();
  test_validation_failures();
  test_sample_signal();
  test_non_finite_run();
  test_step_budget();
  test_csv_export();
  test_temperature_sweep();

  std::cout << std::endl;
  std::cout << "All tests PASSED!" << std::endl;
  return 0;
}
