#pragma once
#include "../core/containers.hpp"
#include "../fields/boundary_conditions.hpp"
#include "../fields/nodal_field.hpp"
#include "../materials/viscosity_model.hpp"
#include "../mesh/structured_mesh.hpp"
#include "element_matrices.hpp"
#include "stokes_types.hpp"
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace mantle::stokes {

/**
 * @brief Incompressible variable-viscosity Stokes solver on the structured mesh
 *
 * Equal-order bilinear velocity and pressure with pressure-gradient stabilisation. The unknowns
 * are interleaved per node as (ux, uy, p). Non-linear rheologies are handled by Picard iteration
 * on the element viscosity.
 */
class StokesSolver {
private:
  const mesh::StructuredMesh& mesh_;
  StokesSettings settings_;
  StokesElementMatrices reference_;
  std::vector<std::optional<double>> constraints_; // one entry per global dof
  bool pressure_pinned_ = false;

  struct LinearSystem {
    core::SparseMatrix matrix;
    core::MathVector<double> rhs;
  };

  struct PicardChange {
    double viscosity = 0.0;
    double velocity = 0.0;

    [[nodiscard]] auto residual() const noexcept -> double { return viscosity < velocity ? viscosity : velocity; }
  };

  [[nodiscard]] static constexpr auto dof(std::size_t node, int component) noexcept -> std::size_t {
    return constants::discretisation::stokes_dofs_per_node * node + static_cast<std::size_t>(component);
  }

  [[nodiscard]] auto assemble(std::span<const double> viscosity, std::span<const double> density,
                              const core::Point& gravity) const -> LinearSystem;

  [[nodiscard]] auto unpack(const core::MathVector<double>& x) const -> std::pair<fields::VectorField, fields::ScalarField>;

  auto remove_mean_pressure(fields::ScalarField& pressure) const -> void;

public:
  StokesSolver(const mesh::StructuredMesh& mesh, const fields::BoundaryConditionSet& bc, StokesSettings settings = {});

  [[nodiscard]] auto settings() const noexcept -> const StokesSettings& { return settings_; }
  [[nodiscard]] auto pressure_pinned() const noexcept -> bool { return pressure_pinned_; }

  /**
   * @brief Solve for velocity and pressure under body force density * gravity
   * @param model Element viscosity as a function of strain rate, pressure and temperature
   * @param density Per-element density
   * @param strain_rate_guess Per-element strain-rate invariant seeding the first Picard pass;
   *        empty means the reference strain rate everywhere
   * @param pressure_guess Per-element pressure seeding the first viscosity evaluation; empty means zero
   * @return Converged solution, or the failure with the last iterate when Picard stalls
   */
  [[nodiscard]] auto solve(const materials::ElementViscosityModel& model, std::span<const double> density,
                           const core::Point& gravity, std::span<const double> strain_rate_guess = {},
                           std::span<const double> pressure_guess = {}) const
      -> std::expected<StokesSolution, StokesFailure>;
};

// Second invariant sqrt(0.5 (exx^2 + eyy^2) + exy^2) of the strain rate at each element centroid
[[nodiscard]] auto element_strain_rates(const mesh::StructuredMesh& mesh, const fields::VectorField& velocity)
    -> std::vector<double>;

// Net outflow through the domain boundary, the integral of div(u) over the domain
[[nodiscard]] auto integrated_divergence(const mesh::StructuredMesh& mesh, const fields::VectorField& velocity)
    -> double;

} // namespace mantle::stokes
