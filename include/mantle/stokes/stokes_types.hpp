#pragma once
#include "../core/constants.hpp"
#include "../fields/nodal_field.hpp"
#include "../solver/linear_solver.hpp"
#include "../solver/solver_errors.hpp"
#include <optional>
#include <vector>

namespace mantle::stokes {

struct StokesSettings {
  double tolerance = constants::tolerance::standard;                       // Picard relative change
  int max_iterations = constants::iteration_limits::picard_max;            // Picard cap
  double relaxation = 1.0;                                                 // viscosity under-relaxation in (0, 1]
  double reference_strain_rate = constants::rheology::default_reference_strain_rate;
  double pressure_stabilisation = constants::discretisation::default_pressure_stabilisation;
  solver::LinearSolverSettings linear{};
  bool verbose = false;
};

struct StokesSolution {
  fields::VectorField velocity;
  fields::ScalarField pressure;
  std::vector<double> element_viscosity;
  std::vector<double> element_strain_rate;
  int iterations = 0;
  double residual = 0.0;
  bool converged = false;
};

// Picard cap exceeded or a sub-step failed; carries the best iterate when one exists
struct StokesFailure {
  solver::SolverError error;
  std::optional<StokesSolution> last_iterate;
};

} // namespace mantle::stokes
