#pragma once
#include "../core/constants.hpp"
#include "../core/containers.hpp"
#include "../fields/boundary_conditions.hpp"
#include "../materials/material.hpp"
#include "../materials/rheology.hpp"
#include "../stokes/stokes_types.hpp"
#include "../swarm/swarm.hpp"
#include "../thermal/thermal_solver.hpp"
#include <array>
#include <functional>
#include <variant>
#include <vector>

namespace mantle::simulation {

enum class StokesFailurePolicy { Abort, AcceptBestEffort };

enum class ThermalFailurePolicy { Abort, AcceptBestEffort, HalveTimestep };

struct NumericalSettings {
  stokes::StokesSettings stokes{};
  thermal::ThermalSettings thermal{};

  double cfl_factor = constants::discretisation::default_cfl_factor; // in (0, 1]
  double max_timestep = constants::discretisation::default_max_timestep;

  materials::ViscosityLimits viscosity_limits{};
  materials::ViscosityAveraging viscosity_averaging = materials::ViscosityAveraging::Arithmetic;

  swarm::AdvectionScheme advection_scheme = swarm::AdvectionScheme::RungeKutta2;
  swarm::OutflowPolicy outflow_policy = swarm::OutflowPolicy::Deactivate;

  StokesFailurePolicy stokes_failure_policy = StokesFailurePolicy::Abort;
  ThermalFailurePolicy thermal_failure_policy = ThermalFailurePolicy::Abort;
  int max_timestep_halvings = constants::iteration_limits::timestep_halvings_max;

  bool verbose = false;
};

struct MeshSpec {
  std::array<int, 2> resolution = {32, 32};
  core::Point min = core::Point(0.0, 0.0);
  core::Point max = core::Point(1.0, 1.0);
};

// ================================================================================================
// INITIAL TEMPERATURE
// ================================================================================================

struct UniformTemperature {
  double value = 0.0;
};

// Linear from bottom to top plus A cos(k pi x') sin(pi y'), with x', y' normalised to [0, 1]
struct LinearTemperature {
  double bottom = 1.0;
  double top = 0.0;
  double perturbation_amplitude = 0.0;
  int perturbation_wavenumber = 1;
};

// low where the coordinate along axis is below position, high elsewhere
struct StepTemperature {
  int axis = 0;
  double position = 0.0;
  double low = 0.0;
  double high = 1.0;
};

struct CustomTemperature {
  std::function<double(const core::Point&)> function;
};

using InitialTemperature = std::variant<UniformTemperature, LinearTemperature, StepTemperature, CustomTemperature>;

/**
 * @brief Complete description of a model run
 *
 * Everything the driver needs is stated here up front; nothing is attached to the simulation
 * after it has been initialised.
 */
struct SimulationSetup {
  MeshSpec mesh{};
  std::vector<materials::Material> materials;
  swarm::SwarmLayout swarm{};
  fields::BoundaryConditionSet boundary_conditions = fields::BoundaryConditionSet::free_slip();
  core::Point gravity = core::Point(0.0, -1.0);
  double diffusivity = 1.0;
  NumericalSettings numerical{};
  InitialTemperature initial_temperature = UniformTemperature{};
};

// ================================================================================================
// STEP OUTPUT
// ================================================================================================

struct SolverDiagnostics {
  int iterations = 0;
  double residual = 0.0;
  bool converged = false;

  [[nodiscard]] auto operator==(const SolverDiagnostics&) const -> bool = default;
};

struct StepResult {
  std::size_t step = 0;
  double time = 0.0;
  double dt = 0.0;
  SolverDiagnostics stokes{};
  SolverDiagnostics thermal{};
  std::size_t active_particles = 0;
  std::size_t deactivated_particles = 0; // during this step
  double max_displacement = 0.0;
  int timestep_halvings = 0;

  [[nodiscard]] auto operator==(const StepResult&) const -> bool = default;
};

// Opaque arrays for external checkpointing and output, node- or element-major
struct SimulationSnapshot {
  std::size_t step = 0;
  double time = 0.0;
  std::array<std::size_t, 2> element_resolution{};
  std::vector<double> node_coordinates; // x0, y0, x1, y1, ...
  std::vector<double> velocity;         // ux0, uy0, ux1, uy1, ...
  std::vector<double> pressure;
  std::vector<double> temperature;
  std::vector<double> nodal_viscosity;
  std::vector<double> element_viscosity;
  std::vector<double> element_strain_rate;
  std::vector<double> particle_positions;
  std::vector<int> particle_materials;
  std::vector<int> particle_active;
  std::vector<double> particle_strain_rate; // history cache, zero before the first step
  std::vector<double> particle_stress;
};

} // namespace mantle::simulation
