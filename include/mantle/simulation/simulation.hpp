#pragma once
#include "../core/exceptions.hpp"
#include "../fields/boundary_conditions.hpp"
#include "../fields/nodal_field.hpp"
#include "../materials/material.hpp"
#include "../mesh/structured_mesh.hpp"
#include "../solver/solver_errors.hpp"
#include "../swarm/swarm.hpp"
#include "simulation_types.hpp"
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace mantle::simulation {

/**
 * @brief Coupled Stokes / thermal / swarm time stepping
 *
 * A Simulation is a plain value: copying it copies the whole model state, so a copy stepped
 * with the same settings produces the same StepResult. A step commits nothing unless every
 * stage succeeds.
 */
class Simulation {
private:
  mesh::StructuredMesh mesh_;
  std::vector<materials::Material> materials_;
  swarm::Swarm swarm_;
  fields::BoundaryConditionSet boundary_conditions_;
  core::Point gravity_;
  double diffusivity_;
  NumericalSettings settings_;

  fields::VectorField velocity_;
  fields::ScalarField pressure_;
  fields::ScalarField temperature_;
  std::vector<double> element_viscosity_;
  std::vector<double> element_strain_rate_; // empty until the first flow solve
  std::vector<double> element_pressure_;

  double time_ = 0.0;
  std::size_t step_ = 0;
  double last_dt_ = 0.0;

  Simulation(mesh::StructuredMesh mesh, std::vector<materials::Material> materials, swarm::Swarm swarm,
             fields::BoundaryConditionSet boundary_conditions, core::Point gravity, double diffusivity,
             NumericalSettings settings, fields::ScalarField temperature);

  // One step; when end_time is set the step is shortened so the clock lands on it exactly
  [[nodiscard]] auto advance(std::optional<double> end_time) -> std::expected<StepResult, solver::SolverError>;

public:
  [[nodiscard]] static auto initialize(const SimulationSetup& setup)
      -> std::expected<Simulation, core::MantleException>;

  [[nodiscard]] static auto initialize(mesh::StructuredMesh mesh, std::vector<materials::Material> materials,
                                       swarm::Swarm swarm, fields::BoundaryConditionSet boundary_conditions,
                                       core::Point gravity, double diffusivity, NumericalSettings settings = {},
                                       const InitialTemperature& initial_temperature = UniformTemperature{})
      -> std::expected<Simulation, core::MantleException>;

  [[nodiscard]] auto step() -> std::expected<StepResult, solver::SolverError>;

  // Single step that does not overshoot end_time
  [[nodiscard]] auto step_toward(double end_time) -> std::expected<StepResult, solver::SolverError>;

  [[nodiscard]] auto run(std::size_t n_steps) -> std::expected<std::vector<StepResult>, solver::SolverError>;

  // Steps until the clock reaches end_time; the last step is shortened to land on it
  [[nodiscard]] auto run_until(double end_time) -> std::expected<std::vector<StepResult>, solver::SolverError>;

  [[nodiscard]] auto mesh() const noexcept -> const mesh::StructuredMesh& { return mesh_; }
  [[nodiscard]] auto materials() const noexcept -> std::span<const materials::Material> { return materials_; }
  [[nodiscard]] auto swarm() const noexcept -> const swarm::Swarm& { return swarm_; }
  [[nodiscard]] auto boundary_conditions() const noexcept -> const fields::BoundaryConditionSet& {
    return boundary_conditions_;
  }
  [[nodiscard]] auto settings() const noexcept -> const NumericalSettings& { return settings_; }

  [[nodiscard]] auto velocity() const noexcept -> const fields::VectorField& { return velocity_; }
  [[nodiscard]] auto pressure() const noexcept -> const fields::ScalarField& { return pressure_; }
  [[nodiscard]] auto temperature() const noexcept -> const fields::ScalarField& { return temperature_; }
  [[nodiscard]] auto element_viscosity() const noexcept -> std::span<const double> { return element_viscosity_; }
  [[nodiscard]] auto element_strain_rate() const noexcept -> std::span<const double> { return element_strain_rate_; }
  [[nodiscard]] auto nodal_viscosity() const -> fields::ScalarField;

  [[nodiscard]] auto velocity_at(const core::Point& point) const -> std::expected<core::Point, mesh::OutOfDomainError>;
  [[nodiscard]] auto pressure_at(const core::Point& point) const -> std::expected<double, mesh::OutOfDomainError>;
  [[nodiscard]] auto temperature_at(const core::Point& point) const -> std::expected<double, mesh::OutOfDomainError>;

  [[nodiscard]] auto time() const noexcept -> double { return time_; }
  [[nodiscard]] auto step_index() const noexcept -> std::size_t { return step_; }
  [[nodiscard]] auto last_timestep() const noexcept -> double { return last_dt_; }

  [[nodiscard]] auto snapshot() const -> SimulationSnapshot;
};

} // namespace mantle::simulation
