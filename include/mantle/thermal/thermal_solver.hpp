#pragma once
#include "../core/constants.hpp"
#include "../fields/boundary_conditions.hpp"
#include "../fields/nodal_field.hpp"
#include "../mesh/structured_mesh.hpp"
#include "../solver/linear_solver.hpp"
#include "../solver/solver_errors.hpp"
#include <expected>
#include <optional>
#include <vector>

namespace mantle::thermal {

struct ThermalSettings {
  double theta = constants::discretisation::default_theta; // 1 = backward Euler, 0.5 = Crank-Nicolson
  bool supg = true;                                        // streamline-upwind stabilisation of advection
  solver::LinearSolverSettings linear{.kind = solver::LinearSolverKind::BiCGSTAB};
  bool verbose = false;
};

struct ThermalResult {
  fields::ScalarField temperature;
  int iterations = 0;
  double residual = 0.0;
};

struct ThermalFailure {
  solver::SolverError error;
  std::optional<fields::ScalarField> last_iterate;
};

/**
 * @brief Implicit advection-diffusion of temperature, dT/dt + u.grad(T) = kappa lap(T)
 *
 * Walls with a prescribed temperature are Dirichlet; every other wall is insulating.
 */
class ThermalSolver {
private:
  const mesh::StructuredMesh& mesh_;
  double diffusivity_;
  ThermalSettings settings_;
  std::vector<std::optional<double>> constraints_;

public:
  ThermalSolver(const mesh::StructuredMesh& mesh, const fields::BoundaryConditionSet& bc, double diffusivity,
                ThermalSettings settings = {});

  [[nodiscard]] auto diffusivity() const noexcept -> double { return diffusivity_; }
  [[nodiscard]] auto settings() const noexcept -> const ThermalSettings& { return settings_; }

  /**
   * @brief Advance the temperature by one step of length dt in the given velocity field
   * @return New temperature, or the failure with the last iterate of a stalled iterative solve
   */
  [[nodiscard]] auto solve(const fields::ScalarField& temperature, const fields::VectorField& velocity, double dt) const
      -> std::expected<ThermalResult, ThermalFailure>;
};

// Streamline-upwind parameter for one element; zero when the element is at rest
[[nodiscard]] auto supg_parameter(const core::Point& velocity, double dx, double dy, double diffusivity) noexcept
    -> double;

// Integral of the temperature over the domain
[[nodiscard]] auto total_heat(const mesh::StructuredMesh& mesh, const fields::ScalarField& temperature) -> double;

} // namespace mantle::thermal
