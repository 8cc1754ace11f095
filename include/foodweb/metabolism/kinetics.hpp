#pragma once

/**
 * @file kinetics.hpp
 * @brief Temperature scaling and resource limitation of metabolic rates.
 *
 * Features:
 * - Boltzmann-Arrhenius thermal response
 * - Michaelis-Menten saturating limitation
 */

#include <cmath>

#include <foodweb/core/constants.hpp>

namespace foodweb {
namespace metabolism {

/**
 * @brief Thermal performance curve parameters.
 */
struct ThermalParams {
  double B0 = 1.0;                        // rate at Tr
  double E = 0.0;                         // eV
  double Tr = constants::REFERENCE_TEMP;  // K
};

/**
 * @brief Metabolic rate at absolute temperature T.
 *
 * B0 * exp(-E/k * (1/T - 1/Tr)). Returns B0 at T == Tr. T must be > 0,
 * otherwise the result is not finite.
 */
inline double boltzmann(const ThermalParams &p, double T) {
  return p.B0 * std::exp((-p.E / constants::BOLTZMANN_EV) *
                         ((1.0 / T) - (1.0 / p.Tr)));
}

/**
 * @brief Michaelis-Menten limitation term in [0, 1).
 *
 * Exactly 0 when N == 0. Undefined when N and kN are both 0.
 */
inline double limitation(double N, double kN) { return N / (N + kN); }

} // namespace metabolism
} // namespace foodweb
