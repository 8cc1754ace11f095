/**
 * @file main.cpp
 * @brief Entry point for the foodweb demo: builds a reference food web,
 * integrates it and runs a temperature sweep.
 */

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <foodweb/core/constants.hpp>
#include <foodweb/core/errors.hpp>
#include <foodweb/model/context.hpp>
#include <foodweb/model/derivative.hpp>
#include <foodweb/model/ecosystem.hpp>
#include <foodweb/sim/simulation.hpp>
#include <foodweb/sim/temperature_sweep.hpp>

using namespace foodweb;

namespace {

// Two producers, one consumer and both pools.
model::Ecosystem build_reference_ecosystem() {
  model::Ecosystem eco;

  model::Autotroph fast;
  fast.epsilon = 0.6;
  fast.ks = 1.0;
  fast.P = {1.2, 0.32, constants::REFERENCE_TEMP};
  fast.R = {0.2, 0.65, constants::REFERENCE_TEMP};
  fast.D = 0.02;
  fast.a = 0.01;
  eco.add(fast);

  model::Autotroph slow;
  slow.epsilon = 0.7;
  slow.ks = 0.5;
  slow.P = {0.6, 0.32, constants::REFERENCE_TEMP};
  slow.R = {0.08, 0.65, constants::REFERENCE_TEMP};
  slow.D = 0.01;
  slow.a = 0.005;
  eco.add(slow);

  model::Heterotroph decomposer;
  decomposer.epsilon = 0.4;
  decomposer.ks = 1.0;
  decomposer.kc = 2.0;
  decomposer.mu = {0.9, 0.65, constants::REFERENCE_TEMP};
  decomposer.R = {0.15, 0.65, constants::REFERENCE_TEMP};
  decomposer.D = 0.02;
  decomposer.a = 0.01;
  eco.add(decomposer);

  eco.add(model::CarbonPool{true});
  eco.add(model::NutrientPool{1.0});

  return eco;
}

struct SampleMonitor {
  size_t samples = 0;
  double last_t = 0.0;

  void on_sample(double t, const sim::State &) {
    ++samples;
    last_t = t;
  }
};

} // namespace

int main(int argc, char **argv) {
  std::cout << "=== foodweb: metabolic food web model ===" << std::endl;

  const std::string csv_path = argc > 1 ? argv[1] : "";

  try {
    model::Ecosystem eco = build_reference_ecosystem();
    eco.validate_parameters();
    eco.validate_pools();

    std::vector<std::string> labels;
    for (const auto &c : eco.compartments()) {
      labels.push_back(model::kind_name(c) + "_" + std::to_string(labels.size()));
    }
    std::cout << "[OK] Ecosystem: " << eco.size() << " compartments"
              << std::endl;

    model::ModelContext ctx = model::make_context(eco, constants::ROOM_TEMP);
    std::cout << "[OK] Context: T = " << ctx.temperature()
              << " K, resource index " << ctx.resource_index()
              << ", consumer index " << ctx.consumer_index() << std::endl;

    const sim::State u0 = {1.0, 1.0, 0.5, 2.0, 5.0};

    sim::State dCdt = model::derivative(u0, ctx);
    std::cout << "[OK] Initial derivative:";
    for (double v : dCdt)
      std::cout << " " << std::setprecision(4) << v;
    std::cout << std::endl;

    sim::SolverConfig solver;
    sim::Simulator simulator(solver);
    SampleMonitor monitor;
    simulator.on_sample().connect<&SampleMonitor::on_sample>(monitor);

    auto t0 = std::chrono::high_resolution_clock::now();
    sim::Trajectory trajectory = simulator.run(ctx, u0, 0.0, 200.0, 1.0);
    auto t1 = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    std::cout << "[OK] Simulation: " << monitor.samples << " samples to t = "
              << monitor.last_t << " in " << std::fixed
              << std::setprecision(2) << ms << " ms" << std::endl;

    const sim::State &final_state = trajectory.final_state();
    for (size_t i = 0; i < final_state.size(); ++i) {
      std::cout << "  " << std::left << std::setw(16) << labels[i]
                << std::right << std::setw(12) << std::setprecision(5)
                << final_state[i] << std::endl;
    }

    if (!csv_path.empty()) {
      if (trajectory.write_csv(csv_path, labels)) {
        std::cout << "[OK] Trajectory written to " << csv_path << std::endl;
      } else {
        std::cerr << "[WARN] Could not write " << csv_path << std::endl;
      }
    }

    // Warming experiment
    std::vector<double> temperatures = {283.15, 288.15, 293.15, 298.15,
                                        303.15};
    auto sweep = sim::run_temperature_sweep(ctx, u0, temperatures, 0.0, 200.0,
                                            10.0, solver);
    std::cout << "[OK] Temperature sweep: " << sweep.size() << " runs"
              << std::endl;
    for (const auto &result : sweep) {
      double living = 0.0;
      const sim::State &end = result.trajectory.final_state();
      for (size_t i = 0; i < end.size(); ++i) {
        if (model::is_living(eco[i]))
          living += end[i];
      }
      std::cout << "  T = " << std::setprecision(2) << result.temperature
                << " K  living biomass = " << std::setprecision(4) << living
                << std::endl;
    }
  } catch (const ValidationError &e) {
    std::cerr << "[ERROR] Invalid setup: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] Simulation failed: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "Done." << std::endl;
  return 0;
}
