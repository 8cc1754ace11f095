#pragma once

/**
 * @file context.hpp
 * @brief Read-only parameter bundle shared by every flux evaluation.
 */

#include <cstddef>

#include <foodweb/model/ecosystem.hpp>

namespace foodweb {
namespace model {

/**
 * @brief Temperature, resource indices and the ecosystem they refer to.
 *
 * Validated at construction, immutable afterwards. The ecosystem is held by
 * reference and must outlive the context.
 */
class ModelContext {
public:
  /**
   * @param ecosystem Food web the indices refer to
   * @param temperature Absolute temperature in K, must be > 0
   * @param resource_index Compartment holding the shared resource (s_i)
   * @param consumer_index Compartment holding the consumed resource (c_i)
   * @throws ValidationError on a non-positive temperature, an index out of
   *         range, or resource_index == consumer_index
   */
  ModelContext(const Ecosystem &ecosystem, double temperature,
               size_t resource_index, size_t consumer_index);

  double temperature() const { return temperature_; }
  size_t resource_index() const { return resource_index_; }
  size_t consumer_index() const { return consumer_index_; }
  const Ecosystem &ecosystem() const { return *ecosystem_; }

  // Same ecosystem and indices at another temperature.
  ModelContext with_temperature(double temperature) const;

private:
  const Ecosystem *ecosystem_;
  double temperature_;
  size_t resource_index_;
  size_t consumer_index_;
};

/**
 * @brief Context whose resource is the nutrient pool and whose consumed
 * resource is the carbon pool.
 * @throws ValidationError if the ecosystem does not hold exactly one of each
 */
ModelContext make_context(const Ecosystem &ecosystem, double temperature);

} // namespace model
} // namespace foodweb
