/**
 * @file derivative.cpp
 * @brief Derivative assembly.
 */

#include <string>

#include <foodweb/core/errors.hpp>
#include <foodweb/model/derivative.hpp>

namespace foodweb {
namespace model {

State derivative(const State &C, const ModelContext &ctx) {
  State dCdt;
  derivative(C, dCdt, ctx);
  return dCdt;
}

void derivative(const State &C, State &dCdt, const ModelContext &ctx) {
  const Ecosystem &eco = ctx.ecosystem();
  if (C.size() != eco.size()) {
    throw ValidationError("state has " + std::to_string(C.size()) +
                          " entries but the ecosystem has " +
                          std::to_string(eco.size()) + " compartments");
  }
  dCdt.resize(eco.size());

  for (size_t i = 0; i < eco.size(); ++i) {
    dCdt[i] = flux(eco[i], ctx, C, i);
  }
}

} // namespace model
} // namespace foodweb
