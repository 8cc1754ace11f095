/**
 * @file trajectory.cpp
 * @brief Trajectory queries and CSV export.
 */

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <system_error>

#include <foodweb/sim/trajectory.hpp>

namespace foodweb {
namespace sim {

void Trajectory::append(double t, const State &state) {
  times.push_back(t);
  states.push_back(state);
}

std::vector<double> Trajectory::series(size_t compartment) const {
  std::vector<double> values;
  values.reserve(states.size());
  for (const auto &state : states) {
    values.push_back(state.at(compartment));
  }
  return values;
}

bool Trajectory::all_finite() const {
  for (size_t k = 0; k < times.size(); ++k) {
    if (!std::isfinite(times[k]))
      return false;
    for (double v : states[k]) {
      if (!std::isfinite(v))
        return false;
    }
  }
  return true;
}

void Trajectory::write_csv(std::ostream &out,
                           const std::vector<std::string> &labels) const {
  const size_t n = states.empty() ? labels.size() : states.front().size();

  out << "t";
  for (size_t i = 0; i < n; ++i) {
    if (i < labels.size())
      out << "," << labels[i];
    else
      out << ",c" << i;
  }
  out << "\n";

  out << std::setprecision(std::numeric_limits<double>::max_digits10);
  for (size_t k = 0; k < times.size(); ++k) {
    out << times[k];
    for (double v : states[k]) {
      out << "," << v;
    }
    out << "\n";
  }
}

bool Trajectory::write_csv(const std::string &path,
                           const std::vector<std::string> &labels) const {
  // Ensure directory exists
  std::filesystem::path dir = std::filesystem::path(path).parent_path();
  if (!dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
  }

  std::ofstream file(path);
  if (!file) {
    std::cerr << "Failed to write trajectory: " << path << std::endl;
    return false;
  }

  write_csv(file, labels);
  return static_cast<bool>(file);
}

} // namespace sim
} // namespace foodweb
