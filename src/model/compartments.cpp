/**
 * @file compartments.cpp
 * @brief Compartment kind naming.
 */

#include <foodweb/model/compartments.hpp>

namespace foodweb {
namespace model {

namespace {

struct KindName {
  std::string operator()(const Autotroph &) const { return "autotroph"; }
  std::string operator()(const Heterotroph &) const { return "heterotroph"; }
  std::string operator()(const CarbonPool &) const { return "carbon_pool"; }
  std::string operator()(const NutrientPool &) const { return "nutrient_pool"; }
};

} // namespace

std::string kind_name(const Compartment &c) { return std::visit(KindName{}, c); }

} // namespace model
} // namespace foodweb
