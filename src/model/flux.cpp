/**
 * @file flux.cpp
 * @brief Flux rules for living compartments and pools.
 */

#include <foodweb/metabolism/kinetics.hpp>
#include <foodweb/model/flux.hpp>

namespace foodweb {
namespace model {

using metabolism::boltzmann;
using metabolism::limitation;

namespace {

// Respiration, constant mortality and crowding. Same form for both living kinds.
template <typename Living>
double living_loss(const Living &sp, double T, double Ci) {
  return (Ci * boltzmann(sp.R, T)) + (Ci * sp.D) + (Ci * Ci * sp.a);
}

struct FluxRule {
  const ModelContext &ctx;
  const State &C;
  size_t i;

  double operator()(const Autotroph &sp) const {
    double gain = C[i] * sp.epsilon * specific_uptake(sp, ctx, C);
    return gain - living_loss(sp, ctx.temperature(), C[i]);
  }

  double operator()(const Heterotroph &sp) const {
    double gain = C[i] * sp.epsilon * specific_uptake(sp, ctx, C);
    return gain - living_loss(sp, ctx.temperature(), C[i]);
  }

  double operator()(const CarbonPool &pool) const {
    if (!pool.linked)
      return 0.0;

    const Ecosystem &eco = ctx.ecosystem();
    const size_t s_i = ctx.resource_index();
    const size_t c_i = ctx.consumer_index();

    double in = 0.0;
    double out = 0.0;
    for (size_t j = 0; j < eco.size(); ++j) {
      if (j == s_i || j == c_i)
        continue;

      in += carbon_out(eco[j], ctx, C, j);

      // Heterotroph uptake is drawn from this pool
      if (const auto *het = std::get_if<Heterotroph>(&eco[j])) {
        out += C[j] * specific_uptake(*het, ctx, C);
      }
    }
    return in - out;
  }

  double operator()(const NutrientPool &pool) const {
    const Ecosystem &eco = ctx.ecosystem();
    const size_t s_i = ctx.resource_index();
    const size_t c_i = ctx.consumer_index();

    double out = 0.0;
    for (size_t j = 0; j < eco.size(); ++j) {
      if (j == s_i || j == c_i)
        continue;
      out += nutrient_out(eco[j], ctx, C, j);
    }
    return pool.R - out;
  }
};

struct CarbonExport {
  const ModelContext &ctx;
  const State &C;
  size_t j;

  template <typename Living> double living(const Living &sp) const {
    return (C[j] * (1.0 - sp.epsilon) * specific_uptake(sp, ctx, C)) +
           (C[j] * sp.D);
  }

  double operator()(const Autotroph &sp) const { return living(sp); }
  double operator()(const Heterotroph &sp) const { return living(sp); }
  double operator()(const CarbonPool &) const { return 0.0; }
  double operator()(const NutrientPool &) const { return 0.0; }
};

struct NutrientExport {
  const ModelContext &ctx;
  const State &C;
  size_t j;

  double operator()(const Autotroph &sp) const {
    return C[j] * specific_uptake(sp, ctx, C);
  }
  double operator()(const Heterotroph &sp) const {
    return C[j] * specific_uptake(sp, ctx, C);
  }
  double operator()(const CarbonPool &) const { return 0.0; }
  double operator()(const NutrientPool &) const { return 0.0; }
};

} // namespace

double specific_uptake(const Autotroph &sp, const ModelContext &ctx,
                       const State &C) {
  return limitation(C[ctx.resource_index()], sp.ks) *
         boltzmann(sp.P, ctx.temperature());
}

double specific_uptake(const Heterotroph &sp, const ModelContext &ctx,
                       const State &C) {
  return limitation(C[ctx.resource_index()], sp.ks) *
         boltzmann(sp.mu, ctx.temperature()) *
         limitation(C[ctx.consumer_index()], sp.kc);
}

double flux(const Compartment &compartment, const ModelContext &ctx,
            const State &C, size_t i) {
  return std::visit(FluxRule{ctx, C, i}, compartment);
}

double carbon_out(const Compartment &compartment, const ModelContext &ctx,
                  const State &C, size_t j) {
  return std::visit(CarbonExport{ctx, C, j}, compartment);
}

double nutrient_out(const Compartment &compartment, const ModelContext &ctx,
                    const State &C, size_t j) {
  return std::visit(NutrientExport{ctx, C, j}, compartment);
}

} // namespace model
} // namespace foodweb
