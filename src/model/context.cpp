/**
 * @file context.cpp
 * @brief Parameter context validation.
 */

#include <cmath>
#include <string>

#include <foodweb/core/errors.hpp>
#include <foodweb/model/context.hpp>

namespace foodweb {
namespace model {

namespace {

void check_temperature(double temperature) {
  if (!std::isfinite(temperature) || temperature <= 0.0) {
    throw ValidationError("temperature must be a positive absolute value (got " +
                          std::to_string(temperature) + " K)");
  }
}

} // namespace

ModelContext::ModelContext(const Ecosystem &ecosystem, double temperature,
                           size_t resource_index, size_t consumer_index)
    : ecosystem_(&ecosystem), temperature_(temperature),
      resource_index_(resource_index), consumer_index_(consumer_index) {
  check_temperature(temperature_);

  const size_t n = ecosystem.size();
  if (resource_index_ >= n) {
    throw ValidationError("resource index " + std::to_string(resource_index_) +
                          " out of range for " + std::to_string(n) +
                          " compartments");
  }
  if (consumer_index_ >= n) {
    throw ValidationError("consumer index " + std::to_string(consumer_index_) +
                          " out of range for " + std::to_string(n) +
                          " compartments");
  }
  if (resource_index_ == consumer_index_) {
    throw ValidationError("resource and consumer indices must differ (both " +
                          std::to_string(resource_index_) + ")");
  }
}

ModelContext ModelContext::with_temperature(double temperature) const {
  return ModelContext(*ecosystem_, temperature, resource_index_,
                      consumer_index_);
}

ModelContext make_context(const Ecosystem &ecosystem, double temperature) {
  ecosystem.validate_pools();
  return ModelContext(ecosystem, temperature,
                      ecosystem.index_of<NutrientPool>(),
                      ecosystem.index_of<CarbonPool>());
}

} // namespace model
} // namespace foodweb
