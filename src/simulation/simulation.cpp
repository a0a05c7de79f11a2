#include "mantle/simulation/simulation.hpp"
#include "mantle/materials/viscosity_model.hpp"
#include "mantle/simulation/element_properties.hpp"
#include "mantle/simulation/timestep.hpp"
#include "mantle/solver/expected_utils.hpp"
#include "mantle/stokes/stokes_solver.hpp"
#include "mantle/thermal/thermal_solver.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace mantle::simulation {

namespace {

[[nodiscard]] auto validate_settings(const NumericalSettings& s) -> std::expected<void, core::ValidationError> {
  if (!(s.cfl_factor > 0.0 && s.cfl_factor <= 1.0)) {
    return std::unexpected(core::ValidationError("cfl_factor", std::format("must lie in (0, 1], got {}", s.cfl_factor)));
  }
  if (!(s.max_timestep > 0.0) || !std::isfinite(s.max_timestep)) {
    return std::unexpected(core::ValidationError("max_timestep", "must be positive and finite"));
  }
  if (!(s.stokes.tolerance > 0.0)) {
    return std::unexpected(core::ValidationError("stokes.tolerance", "must be positive"));
  }
  if (s.stokes.max_iterations < 1) {
    return std::unexpected(core::ValidationError("stokes.max_iterations", "must be at least 1"));
  }
  if (!(s.stokes.relaxation > 0.0 && s.stokes.relaxation <= 1.0)) {
    return std::unexpected(core::ValidationError("stokes.relaxation", "must lie in (0, 1]"));
  }
  if (!(s.stokes.reference_strain_rate > 0.0) || !std::isfinite(s.stokes.reference_strain_rate)) {
    return std::unexpected(core::ValidationError("stokes.reference_strain_rate", "must be positive and finite"));
  }
  if (!(s.stokes.pressure_stabilisation > 0.0)) {
    return std::unexpected(core::ValidationError("stokes.pressure_stabilisation", "must be positive"));
  }
  if (!(s.thermal.theta >= 0.5 && s.thermal.theta <= 1.0)) {
    return std::unexpected(core::ValidationError("thermal.theta", "must lie in [0.5, 1]"));
  }
  if (!(s.viscosity_limits.min > 0.0) || !(s.viscosity_limits.min <= s.viscosity_limits.max)) {
    return std::unexpected(core::ValidationError("viscosity_limits", "require 0 < min <= max"));
  }
  if (s.max_timestep_halvings < 0) {
    return std::unexpected(core::ValidationError("max_timestep_halvings", "must not be negative"));
  }
  return {};
}

[[nodiscard]] auto to_diagnostics(const stokes::StokesSolution& solution) noexcept -> SolverDiagnostics {
  return SolverDiagnostics{solution.iterations, solution.residual, solution.converged};
}

} // namespace

Simulation::Simulation(mesh::StructuredMesh mesh, std::vector<materials::Material> materials, swarm::Swarm swarm,
                       fields::BoundaryConditionSet boundary_conditions, core::Point gravity, double diffusivity,
                       NumericalSettings settings, fields::ScalarField temperature)
    : mesh_(std::move(mesh)), materials_(std::move(materials)), swarm_(std::move(swarm)),
      boundary_conditions_(std::move(boundary_conditions)), gravity_(gravity), diffusivity_(diffusivity),
      settings_(std::move(settings)), velocity_(fields::VectorField::for_mesh(mesh_)),
      pressure_(fields::ScalarField::for_mesh(mesh_)), temperature_(std::move(temperature)),
      element_pressure_(mesh_.element_count(), 0.0) {

  settings_.stokes.verbose = settings_.stokes.verbose || settings_.verbose;
  settings_.thermal.verbose = settings_.thermal.verbose || settings_.verbose;
}

auto Simulation::initialize(const SimulationSetup& setup) -> std::expected<Simulation, core::MantleException> {
  auto mesh = mesh::StructuredMesh::create(setup.mesh.resolution, setup.mesh.min, setup.mesh.max);
  if (!mesh) {
    return std::unexpected<core::MantleException>(mesh.error());
  }

  if (auto valid = materials::validate_materials(setup.materials); !valid) {
    return std::unexpected<core::MantleException>(valid.error());
  }

  auto swarm = swarm::Swarm::populate(mesh.value(), setup.materials, setup.swarm);
  if (!swarm) {
    return std::unexpected<core::MantleException>(swarm.error());
  }

  return initialize(std::move(mesh.value()), setup.materials, std::move(swarm.value()), setup.boundary_conditions,
                    setup.gravity, setup.diffusivity, setup.numerical, setup.initial_temperature);
}

auto Simulation::initialize(mesh::StructuredMesh mesh, std::vector<materials::Material> materials, swarm::Swarm swarm,
                            fields::BoundaryConditionSet boundary_conditions, core::Point gravity, double diffusivity,
                            NumericalSettings settings, const InitialTemperature& initial_temperature)
    -> std::expected<Simulation, core::MantleException> {

  MANTLE_TRY_VOID(materials::validate_materials(materials));
  MANTLE_TRY_VOID(validate_settings(settings));
  if (!gravity.allFinite()) {
    return std::unexpected<core::MantleException>(core::ValidationError("gravity", "must be finite"));
  }
  if (!std::isfinite(diffusivity) || diffusivity < 0.0) {
    return std::unexpected<core::MantleException>(
        core::ValidationError("diffusivity", std::format("must be finite and non-negative, got {}", diffusivity)));
  }
  if (swarm.active_count() == 0) {
    return std::unexpected<core::MantleException>(core::ValidationError("swarm", "holds no active particle"));
  }
  for (std::size_t p = 0; p < swarm.size(); ++p) {
    const int m = swarm.material(p);
    if (m < 0 || static_cast<std::size_t>(m) >= materials.size()) {
      return std::unexpected<core::MantleException>(
          core::ValidationError("swarm", std::format("particle {} refers to unknown material {}", p, m)));
    }
  }

  auto temperature = evaluate_initial_temperature(mesh, initial_temperature);
  for (std::size_t node = 0; node < mesh.node_count(); ++node) {
    if (const auto fixed = boundary_conditions.temperature_constraint(mesh, node)) {
      temperature.set(node, fixed.value());
    }
  }

  Simulation simulation(std::move(mesh), std::move(materials), std::move(swarm), std::move(boundary_conditions),
                        gravity, diffusivity, std::move(settings), std::move(temperature));

  // Viscosity at the reference strain rate, so nodal viscosity is meaningful before the first step
  const auto props =
      compute_element_properties(simulation.mesh_, simulation.materials_, simulation.swarm_, simulation.temperature_);
  const materials::ElementViscosityModel model(simulation.materials_, props.fractions, props.temperature,
                                               simulation.settings_.viscosity_limits,
                                               simulation.settings_.viscosity_averaging);
  const std::vector<double> reference(simulation.mesh_.element_count(),
                                      simulation.settings_.stokes.reference_strain_rate);
  auto viscosity = model.evaluate(reference, simulation.element_pressure_);
  if (!viscosity) {
    return std::unexpected<core::MantleException>(viscosity.error());
  }
  simulation.element_viscosity_ = std::move(viscosity.value());

  if (simulation.settings_.verbose) {
    std::cout << std::format("[DRIVER] Initialised {}x{} elements, {} materials, {} particles",
                             simulation.mesh_.elements_x(), simulation.mesh_.elements_y(), simulation.materials_.size(),
                             simulation.swarm_.active_count())
              << std::endl;
  }

  return simulation;
}

auto Simulation::step() -> std::expected<StepResult, solver::SolverError> { return advance(std::nullopt); }

auto Simulation::step_toward(double end_time) -> std::expected<StepResult, solver::SolverError> {
  if (!std::isfinite(end_time) || end_time <= time_) {
    return std::unexpected(
        solver::SolverError(std::format("Cannot step toward {} from model time {}", end_time, time_)));
  }
  return advance(end_time);
}

auto Simulation::advance(std::optional<double> end_time) -> std::expected<StepResult, solver::SolverError> {
  const std::size_t step_number = step_ + 1;

  // a. Material properties from the swarm
  const auto props = compute_element_properties(mesh_, materials_, swarm_, temperature_);
  const materials::ElementViscosityModel model(materials_, props.fractions, props.temperature,
                                               settings_.viscosity_limits, settings_.viscosity_averaging);

  // b. Flow
  const stokes::StokesSolver stokes_solver(mesh_, boundary_conditions_, settings_.stokes);
  auto stokes_result =
      stokes_solver.solve(model, props.density, gravity_, element_strain_rate_, element_pressure_);

  stokes::StokesSolution flow;
  if (stokes_result) {
    flow = std::move(stokes_result.value());
  } else {
    auto& failure = stokes_result.error();
    const bool recoverable = failure.error.kind() == solver::SolverError::Kind::NonConvergence &&
                             failure.last_iterate.has_value();
    if (settings_.stokes_failure_policy == StokesFailurePolicy::AcceptBestEffort && recoverable) {
      std::cerr << std::format("[DRIVER] Step {}: accepting unconverged flow ({})", step_number,
                               failure.error.message())
                << std::endl;
      flow = std::move(failure.last_iterate.value());
    } else {
      auto error = failure.error;
      error.add_context(std::format("time step {}", step_number));
      return std::unexpected(std::move(error));
    }
  }

  // c. Timestep
  double dt = compute_cfl_timestep(mesh_, flow.velocity, settings_.cfl_factor, settings_.max_timestep);
  bool lands_on_end = false;
  if (end_time && dt >= end_time.value() - time_) {
    dt = end_time.value() - time_;
    lands_on_end = true;
  }

  // d. Heat
  const thermal::ThermalSolver thermal_solver(mesh_, boundary_conditions_, diffusivity_, settings_.thermal);
  fields::ScalarField new_temperature;
  SolverDiagnostics thermal_diagnostics;
  int halvings = 0;

  while (true) {
    auto thermal_result = thermal_solver.solve(temperature_, flow.velocity, dt);
    if (thermal_result) {
      new_temperature = std::move(thermal_result->temperature);
      thermal_diagnostics = SolverDiagnostics{thermal_result->iterations, thermal_result->residual, true};
      break;
    }

    auto& failure = thermal_result.error();
    const bool stalled = failure.error.kind() == solver::SolverError::Kind::NonConvergence;

    if (settings_.thermal_failure_policy == ThermalFailurePolicy::HalveTimestep && stalled &&
        halvings < settings_.max_timestep_halvings) {
      dt *= 0.5;
      lands_on_end = false;
      ++halvings;
      std::cerr << std::format("[DRIVER] Step {}: thermal solve stalled, retrying with dt={:.4e}", step_number, dt)
                << std::endl;
      continue;
    }
    if (settings_.thermal_failure_policy == ThermalFailurePolicy::AcceptBestEffort && stalled &&
        failure.last_iterate.has_value()) {
      std::cerr << std::format("[DRIVER] Step {}: accepting unconverged temperature ({})", step_number,
                               failure.error.message())
                << std::endl;
      new_temperature = std::move(failure.last_iterate.value());
      thermal_diagnostics = SolverDiagnostics{failure.error.iterations(), failure.error.residual(), false};
      break;
    }

    auto error = failure.error;
    error.add_context(std::format("time step {} (dt={:.4e})", step_number, dt));
    return std::unexpected(std::move(error));
  }

  // e, f. Particles
  swarm::Swarm new_swarm = swarm_;
  new_swarm.update_history(mesh_, flow.element_strain_rate, flow.element_viscosity);
  const auto report = new_swarm.advect(mesh_, flow.velocity, dt, settings_.advection_scheme, settings_.outflow_policy);

  // Commit
  element_pressure_ = fields::element_centroid_values(mesh_, flow.pressure);
  element_viscosity_ = std::move(flow.element_viscosity);
  element_strain_rate_ = std::move(flow.element_strain_rate);
  velocity_ = std::move(flow.velocity);
  pressure_ = std::move(flow.pressure);
  temperature_ = std::move(new_temperature);
  swarm_ = std::move(new_swarm);
  time_ = lands_on_end ? end_time.value() : time_ + dt;
  step_ = step_number;
  last_dt_ = dt;

  StepResult result;
  result.step = step_;
  result.time = time_;
  result.dt = dt;
  result.stokes = to_diagnostics(flow);
  result.thermal = thermal_diagnostics;
  result.active_particles = swarm_.active_count();
  result.deactivated_particles = report.deactivated;
  result.max_displacement = report.max_displacement;
  result.timestep_halvings = halvings;

  if (settings_.verbose) {
    std::cout << std::format("[DRIVER] Step {:5d}  t={:.6e}  dt={:.4e}  Stokes {} it ({:.3e})  thermal {} it  "
                             "particles {}",
                             result.step, result.time, result.dt, result.stokes.iterations, result.stokes.residual,
                             result.thermal.iterations, result.active_particles)
              << std::endl;
  }

  return result;
}

auto Simulation::run(std::size_t n_steps) -> std::expected<std::vector<StepResult>, solver::SolverError> {
  std::vector<StepResult> results;
  results.reserve(n_steps);
  for (std::size_t i = 0; i < n_steps; ++i) {
    StepResult result;
    MANTLE_TRY_ASSIGN(result, step());
    results.push_back(result);
  }
  return results;
}

auto Simulation::run_until(double end_time) -> std::expected<std::vector<StepResult>, solver::SolverError> {
  std::vector<StepResult> results;
  if (!std::isfinite(end_time)) {
    return std::unexpected(solver::SolverError(std::format("run_until needs a finite end time, got {}", end_time)));
  }
  while (time_ < end_time) {
    StepResult result;
    MANTLE_TRY_ASSIGN(result, advance(end_time));
    results.push_back(result);
  }
  return results;
}

auto Simulation::nodal_viscosity() const -> fields::ScalarField {
  return fields::node_average_from_elements(mesh_, element_viscosity_);
}

auto Simulation::velocity_at(const core::Point& point) const -> std::expected<core::Point, mesh::OutOfDomainError> {
  return velocity_.interpolate(mesh_, point);
}

auto Simulation::pressure_at(const core::Point& point) const -> std::expected<double, mesh::OutOfDomainError> {
  return pressure_.interpolate(mesh_, point);
}

auto Simulation::temperature_at(const core::Point& point) const -> std::expected<double, mesh::OutOfDomainError> {
  return temperature_.interpolate(mesh_, point);
}

auto Simulation::snapshot() const -> SimulationSnapshot {
  SimulationSnapshot snap;
  snap.step = step_;
  snap.time = time_;
  snap.element_resolution = {mesh_.elements_x(), mesh_.elements_y()};

  snap.node_coordinates.reserve(2 * mesh_.node_count());
  for (std::size_t node = 0; node < mesh_.node_count(); ++node) {
    const auto x = mesh_.node_coordinates(node);
    snap.node_coordinates.push_back(x.x());
    snap.node_coordinates.push_back(x.y());
  }

  const auto to_vector = [](std::span<const double> values) { return std::vector<double>(values.begin(), values.end()); };
  snap.velocity = to_vector(velocity_.data());
  snap.pressure = to_vector(pressure_.data());
  snap.temperature = to_vector(temperature_.data());
  snap.nodal_viscosity = to_vector(nodal_viscosity().data());
  snap.element_viscosity = element_viscosity_;
  snap.element_strain_rate = element_strain_rate_;
  snap.particle_positions = swarm_.position_snapshot();
  snap.particle_materials = swarm_.material_snapshot();
  snap.particle_active = swarm_.active_snapshot();
  snap.particle_strain_rate = swarm_.strain_rate_snapshot();
  snap.particle_stress = swarm_.stress_snapshot();
  return snap;
}

} // namespace mantle::simulation
