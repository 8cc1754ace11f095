/**
 * @file ecosystem.cpp
 * @brief Ecosystem construction and validation.
 */

#include <string>

#include <foodweb/core/errors.hpp>
#include <foodweb/model/ecosystem.hpp>

namespace foodweb {
namespace model {

namespace {

void check_non_negative(double value, const char *name, size_t i) {
  if (!(value >= 0.0)) {
    throw ValidationError("compartment " + std::to_string(i) + ": " + name +
                          " must be non-negative (got " +
                          std::to_string(value) + ")");
  }
}

void check_thermal(const ThermalParams &p, const char *name, size_t i) {
  check_non_negative(p.B0, name, i);
  if (!(p.Tr > 0.0)) {
    throw ValidationError("compartment " + std::to_string(i) + ": " + name +
                          " reference temperature must be positive");
  }
}

void check_efficiency(double epsilon, size_t i) {
  if (!(epsilon >= 0.0 && epsilon <= 1.0)) {
    throw ValidationError("compartment " + std::to_string(i) +
                          ": epsilon must lie in [0, 1] (got " +
                          std::to_string(epsilon) + ")");
  }
}

// Per-kind parameter range checks.
struct ParameterCheck {
  size_t i;

  void operator()(const Autotroph &sp) const {
    check_efficiency(sp.epsilon, i);
    check_non_negative(sp.ks, "ks", i);
    check_non_negative(sp.D, "D", i);
    check_non_negative(sp.a, "a", i);
    check_thermal(sp.P, "P", i);
    check_thermal(sp.R, "R", i);
  }

  void operator()(const Heterotroph &sp) const {
    check_efficiency(sp.epsilon, i);
    check_non_negative(sp.ks, "ks", i);
    check_non_negative(sp.kc, "kc", i);
    check_non_negative(sp.D, "D", i);
    check_non_negative(sp.a, "a", i);
    check_thermal(sp.mu, "mu", i);
    check_thermal(sp.R, "R", i);
  }

  void operator()(const CarbonPool &) const {}

  void operator()(const NutrientPool &pool) const {
    check_non_negative(pool.R, "R", i);
  }
};

} // namespace

size_t Ecosystem::add(const Compartment &compartment) {
  compartments_.push_back(compartment);
  return compartments_.size() - 1;
}

void Ecosystem::validate_parameters() const {
  for (size_t i = 0; i < compartments_.size(); ++i) {
    std::visit(ParameterCheck{i}, compartments_[i]);
  }
}

void Ecosystem::validate_pools() const {
  size_t n_carbon = count<CarbonPool>();
  size_t n_nutrient = count<NutrientPool>();

  if (n_carbon != 1) {
    throw ValidationError("ecosystem must contain exactly one carbon pool (found " +
                          std::to_string(n_carbon) + ")");
  }
  if (n_nutrient != 1) {
    throw ValidationError(
        "ecosystem must contain exactly one nutrient pool (found " +
        std::to_string(n_nutrient) + ")");
  }
}

} // namespace model
} // namespace foodweb
