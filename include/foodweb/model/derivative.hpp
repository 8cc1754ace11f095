#pragma once

/**
 * @file derivative.hpp
 * @brief Assembly of per-compartment fluxes into the system derivative.
 */

#include <foodweb/model/context.hpp>
#include <foodweb/model/flux.hpp>

namespace foodweb {
namespace model {

/**
 * @brief dC/dt for every compartment.
 * @return Vector of ecosystem size, entry i = flux(sp[i], ctx, C, i)
 * @throws ValidationError if C does not have one entry per compartment
 */
State derivative(const State &C, const ModelContext &ctx);

/**
 * @brief In-place variant; dCdt is resized to the ecosystem size.
 * @throws ValidationError if C does not have one entry per compartment
 */
void derivative(const State &C, State &dCdt, const ModelContext &ctx);

/**
 * @brief Odeint system functor over a fixed context.
 *
 * Holds a copy of the context. The ecosystem it refers to must outlive
 * every integration that uses this functor.
 */
class FoodWebSystem {
public:
  explicit FoodWebSystem(const ModelContext &ctx) : ctx_(ctx) {}

  void operator()(const State &x, State &dxdt, double /*t*/) const {
    derivative(x, dxdt, ctx_);
  }

private:
  ModelContext ctx_;
};

} // namespace model
} // namespace foodweb
