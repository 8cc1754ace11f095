#pragma once

/**
 * @file flux.hpp
 * @brief Net rate of change of each compartment kind.
 *
 * Living compartments gain from resource uptake and lose to respiration,
 * constant mortality and crowding. The pools aggregate what the living
 * compartments export to them or draw from them.
 */

#include <cstddef>
#include <vector>

#include <foodweb/model/compartments.hpp>
#include <foodweb/model/context.hpp>

namespace foodweb {
namespace model {

// Biomass or pool size per compartment, in ecosystem order.
using State = std::vector<double>;

/**
 * @brief Net flux (gain - loss) of the compartment at index i.
 * @param compartment Compartment stored at index i
 * @param ctx Temperature and resource indices
 * @param C Current state
 * @param i Index of the compartment in C
 */
double flux(const Compartment &compartment, const ModelContext &ctx,
            const State &C, size_t i);

/**
 * @brief Carbon returned to the carbon pool by compartment j: the unretained
 * part of its uptake plus its constant mortality. Zero for pools.
 */
double carbon_out(const Compartment &compartment, const ModelContext &ctx,
                  const State &C, size_t j);

/**
 * @brief Nutrient drawn from the nutrient pool by compartment j: its gross
 * uptake regardless of efficiency. Zero for pools.
 */
double nutrient_out(const Compartment &compartment, const ModelContext &ctx,
                    const State &C, size_t j);

/**
 * @brief Per-biomass uptake rate of a living compartment.
 *
 * lim(C[s_i], ks) * boltz(P, T) for autotrophs, and
 * lim(C[s_i], ks) * boltz(mu, T) * lim(C[c_i], kc) for heterotrophs.
 */
double specific_uptake(const Autotroph &sp, const ModelContext &ctx,
                       const State &C);
double specific_uptake(const Heterotroph &sp, const ModelContext &ctx,
                       const State &C);

} // namespace model
} // namespace foodweb
