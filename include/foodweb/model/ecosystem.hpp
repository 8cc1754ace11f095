#pragma once

/**
 * @file ecosystem.hpp
 * @brief Ordered collection of compartments making up one food web.
 */

#include <cstddef>
#include <variant>
#include <vector>

#include <foodweb/model/compartments.hpp>

namespace foodweb {
namespace model {

/**
 * @brief The food web: compartments in state-vector order.
 *
 * Compartment i owns entry i of every state and derivative vector.
 */
class Ecosystem {
public:
  // Building
  size_t add(const Compartment &compartment);

  // Access
  size_t size() const { return compartments_.size(); }
  const Compartment &operator[](size_t i) const { return compartments_[i]; }
  const std::vector<Compartment> &compartments() const { return compartments_; }

  // Queries
  template <typename Kind> size_t count() const;
  template <typename Kind> size_t index_of() const;

  /**
   * @brief Check parameter ranges of every compartment.
   * @throws ValidationError on a negative rate or half-saturation, or an
   *         efficiency outside [0, 1].
   */
  void validate_parameters() const;

  /**
   * @brief Check that exactly one carbon pool and one nutrient pool exist.
   * @throws ValidationError otherwise
   */
  void validate_pools() const;

private:
  std::vector<Compartment> compartments_;
};

// === Inline implementations ===

template <typename Kind> size_t Ecosystem::count() const {
  size_t n = 0;
  for (const auto &c : compartments_) {
    if (std::holds_alternative<Kind>(c))
      ++n;
  }
  return n;
}

/**
 * Index of the first compartment of the given kind, or size() if absent.
 */
template <typename Kind> size_t Ecosystem::index_of() const {
  for (size_t i = 0; i < compartments_.size(); ++i) {
    if (std::holds_alternative<Kind>(compartments_[i]))
      return i;
  }
  return compartments_.size();
}

} // namespace model
} // namespace foodweb
