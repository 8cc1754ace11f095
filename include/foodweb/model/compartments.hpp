#pragma once

/**
 * @file compartments.hpp
 * @brief Compartment kinds of the food web.
 */

#include <string>
#include <variant>

#include <foodweb/metabolism/kinetics.hpp>

namespace foodweb {
namespace model {

using metabolism::ThermalParams;

/**
 * @brief Primary producer limited by the shared resource only.
 */
struct Autotroph {
  double epsilon = 0.5; // fraction of uptake retained
  double ks = 1.0;      // half-saturation for the shared resource
  ThermalParams P;      // photosynthesis
  ThermalParams R;      // respiration
  double D = 0.0;       // density-independent loss
  double a = 0.0;       // density-dependent loss
};

/**
 * @brief Consumer limited by the shared resource and the consumed resource.
 */
struct Heterotroph {
  double epsilon = 0.5;
  double ks = 1.0;
  double kc = 1.0; // half-saturation for the consumed resource
  ThermalParams mu; // consumption
  ThermalParams R;
  double D = 0.0;
  double a = 0.0;
};

/**
 * @brief Carbon reservoir fed by exudation and mortality.
 */
struct CarbonPool {
  bool linked = true; // unlinked pools have zero flux
};

/**
 * @brief Nutrient reservoir with a constant external supply.
 */
struct NutrientPool {
  double R = 0.0; // supply rate
};

using Compartment =
    std::variant<Autotroph, Heterotroph, CarbonPool, NutrientPool>;

/**
 * @brief Human readable compartment kind, used in reports and CSV headers.
 */
std::string kind_name(const Compartment &c);

/**
 * @brief True for autotrophs and heterotrophs.
 */
inline bool is_living(const Compartment &c) {
  return std::holds_alternative<Autotroph>(c) ||
         std::holds_alternative<Heterotroph>(c);
}

} // namespace model
} // namespace foodweb
