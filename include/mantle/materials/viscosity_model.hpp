#pragma once
#include "material.hpp"
#include "rheology.hpp"
#include <expected>
#include <span>
#include <vector>

namespace mantle::materials {

/**
 * @brief Per-element viscosity from material volume fractions and local state
 *
 * Fractions are stored element-major: fractions[e * n_materials + m].
 */
class ElementViscosityModel {
private:
  std::span<const Material> materials_;
  std::vector<double> fractions_;
  std::vector<double> temperature_;
  ViscosityLimits limits_;
  ViscosityAveraging averaging_;

public:
  ElementViscosityModel(std::span<const Material> materials, std::vector<double> fractions,
                        std::vector<double> element_temperature, ViscosityLimits limits,
                        ViscosityAveraging averaging = ViscosityAveraging::Arithmetic)
      : materials_(materials), fractions_(std::move(fractions)), temperature_(std::move(element_temperature)),
        limits_(limits), averaging_(averaging) {}

  [[nodiscard]] auto element_count() const noexcept -> std::size_t { return temperature_.size(); }
  [[nodiscard]] auto material_count() const noexcept -> std::size_t { return materials_.size(); }

  [[nodiscard]] auto fractions(std::size_t element) const noexcept -> std::span<const double> {
    return std::span<const double>(fractions_).subspan(element * materials_.size(), materials_.size());
  }

  // When true a single Stokes pass is exact
  [[nodiscard]] auto is_velocity_independent() const noexcept -> bool;

  /**
   * @brief Evaluate the viscosity of every element
   * @param strain_rate Second invariant of the strain rate per element
   * @param pressure Pressure per element (element centroid)
   */
  [[nodiscard]] auto evaluate(std::span<const double> strain_rate, std::span<const double> pressure) const
      -> std::expected<std::vector<double>, solver::SolverError>;
};

} // namespace mantle::materials
