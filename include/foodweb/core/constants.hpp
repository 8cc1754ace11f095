#pragma once

/**
 * @file constants.hpp
 * @brief Physical constants and default simulation parameters for foodweb.
 */

namespace foodweb {
namespace constants {

// === Physical Constants ===
constexpr double BOLTZMANN_EV = 8.617333262e-5; // eV/K (metabolic theory form)

// === Temperature References ===
constexpr double WATER_FREEZE = 273.15; // K
constexpr double ROOM_TEMP = 293.15;    // K (20°C)
constexpr double REFERENCE_TEMP = 293.0; // K, default Tr for thermal curves

// === Integration Defaults ===
constexpr double DEFAULT_START = 0.0;
constexpr double DEFAULT_STOP = 500.0;
constexpr double DEFAULT_SAMPLE_INTERVAL = 1.0;
constexpr double DEFAULT_MAX_DT = 1.0;
constexpr double MAX_SAMPLES = 1e8; // upper bound on sample points per run

} // namespace constants
} // namespace foodweb
