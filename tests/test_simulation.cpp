#include "mantle/simulation/element_properties.hpp"
#include "mantle/simulation/simulation.hpp"
#include "mantle/simulation/timestep.hpp"
#include <cmath>
#include <format>
#include <gtest/gtest.h>

namespace mantle::simulation {
namespace {

using core::Point;
using mesh::Wall;

auto couette_bc() -> fields::BoundaryConditionSet {
  fields::BoundaryConditionSet bc;
  bc.set_velocity(Wall::Bottom, 0.0, 0.0)
      .set_velocity(Wall::Top, 1.0, 0.0)
      .set_velocity(Wall::Left, std::nullopt, 0.0)
      .set_velocity(Wall::Right, std::nullopt, 0.0);
  return bc;
}

auto single_material(const materials::Rheology& rheology = materials::ConstantViscosity{1.0})
    -> std::vector<materials::Material> {
  std::vector<materials::Material> materials(1);
  materials[0].name = "fluid";
  materials[0].rheology = rheology;
  return materials;
}

// Couette cell over [-1, 1] x [0, 1] with a regular 2x2 swarm
auto make_couette(int nx, int ny, NumericalSettings settings = {},
                  const materials::Rheology& rheology = materials::ConstantViscosity{1.0}) -> Simulation {
  auto mesh = mesh::StructuredMesh::create({nx, ny}, Point(-1.0, 0.0), Point(1.0, 1.0)).value();
  auto materials = single_material(rheology);
  auto swarm = swarm::Swarm::populate(mesh, materials, swarm::SwarmLayout{swarm::ParticleLayout::Regular, 2, 1}).value();
  auto simulation = Simulation::initialize(std::move(mesh), std::move(materials), std::move(swarm), couette_bc(),
                                           Point::Zero(), 1.0, settings);
  EXPECT_TRUE(simulation) << simulation.error().full_message();
  return std::move(simulation.value());
}

// Couette cell with a temperature front at x = 0 and a thermal solve capped at one iteration
auto make_stalling_thermal(ThermalFailurePolicy policy) -> Simulation {
  NumericalSettings settings;
  settings.thermal.linear.kind = solver::LinearSolverKind::BiCGSTAB;
  settings.thermal.linear.max_iterations = 1;
  settings.thermal.linear.tolerance = 1e-300;
  settings.thermal_failure_policy = policy;
  settings.max_timestep_halvings = 2;

  auto mesh = mesh::StructuredMesh::create({8, 4}, Point(-1.0, 0.0), Point(1.0, 1.0)).value();
  auto materials = single_material();
  auto swarm = swarm::Swarm::populate(mesh, materials, swarm::SwarmLayout{swarm::ParticleLayout::Regular, 2, 1}).value();
  auto simulation = Simulation::initialize(std::move(mesh), std::move(materials), std::move(swarm), couette_bc(),
                                           Point::Zero(), 1.0, settings, StepTemperature{0, 0.0, 0.0, 1.0});
  EXPECT_TRUE(simulation) << simulation.error().full_message();
  return std::move(simulation.value());
}

TEST(SimulationTest, CouetteVelocityAtMidHeight) {
  auto simulation = make_couette(128, 64);

  auto result = simulation.step();
  ASSERT_TRUE(result) << result.error().full_message();
  EXPECT_TRUE(result->stokes.converged);

  auto velocity = simulation.velocity_at(Point(0.0, 0.5));
  ASSERT_TRUE(velocity);
  EXPECT_NEAR(velocity->x(), 0.5, 0.5e-3);
  EXPECT_NEAR(velocity->y(), 0.0, 1e-10);
}

TEST(SimulationTest, TimestepHonoursCflBound) {
  NumericalSettings settings;
  settings.cfl_factor = 0.5;
  auto simulation = make_couette(16, 8, settings);
  const auto h = simulation.mesh().characteristic_length();

  auto result = simulation.step();
  ASSERT_TRUE(result);

  // Top wall speed is 1
  EXPECT_NEAR(result->dt, 0.5 * h, 1e-12);
  EXPECT_LE(result->max_displacement, 0.5 * h + 1e-12);
  EXPECT_GT(result->max_displacement, 0.0);
  EXPECT_DOUBLE_EQ(simulation.time(), result->dt);
  EXPECT_DOUBLE_EQ(simulation.last_timestep(), result->dt);
  EXPECT_EQ(simulation.step_index(), 1u);
}

TEST(SimulationTest, CopiesStepIdentically) {
  auto simulation = make_couette(16, 8);
  ASSERT_TRUE(simulation.step());

  auto copy = simulation;
  auto first = simulation.step();
  auto second = copy.step();
  ASSERT_TRUE(first && second);

  EXPECT_EQ(first.value(), second.value());
  EXPECT_EQ(simulation.velocity(), copy.velocity());
  EXPECT_EQ(simulation.temperature(), copy.temperature());
  EXPECT_TRUE(simulation.swarm() == copy.swarm());
}

TEST(SimulationTest, FluidAtRestStaysAtRest) {
  auto mesh = mesh::StructuredMesh::create({8, 8}, Point(0.0, 0.0), Point(1.0, 1.0)).value();
  auto materials = single_material();
  auto swarm = swarm::Swarm::populate(mesh, materials, swarm::SwarmLayout{}).value();
  const auto positions = swarm.position_snapshot();

  NumericalSettings settings;
  settings.max_timestep = 0.25;
  auto simulation = Simulation::initialize(std::move(mesh), std::move(materials), std::move(swarm),
                                           fields::BoundaryConditionSet::no_slip(), Point::Zero(), 1.0, settings)
                        .value();

  auto result = simulation.step();
  ASSERT_TRUE(result);
  EXPECT_DOUBLE_EQ(result->dt, 0.25);
  EXPECT_DOUBLE_EQ(result->max_displacement, 0.0);
  EXPECT_EQ(result->deactivated_particles, 0u);
  EXPECT_DOUBLE_EQ(max_nodal_speed(simulation.velocity()), 0.0);
  EXPECT_EQ(simulation.swarm().position_snapshot(), positions);
}

TEST(SimulationTest, RunUntilLandsOnEndTime) {
  auto simulation = make_couette(16, 8);
  const double end_time = 0.2;

  auto results = simulation.run_until(end_time);
  ASSERT_TRUE(results) << results.error().full_message();
  ASSERT_EQ(results->size(), 4u);
  EXPECT_EQ(simulation.time(), end_time);
  EXPECT_EQ(results->back().time, end_time);
  EXPECT_NEAR(results->back().dt, end_time - 3 * 0.0625, 1e-12);
  EXPECT_EQ(simulation.step_index(), 4u);

  // Already there
  auto nothing = simulation.run_until(end_time);
  ASSERT_TRUE(nothing);
  EXPECT_TRUE(nothing->empty());
}

TEST(SimulationTest, StepTowardShortensTheStep) {
  auto simulation = make_couette(16, 8);

  auto result = simulation.step_toward(0.05);
  ASSERT_TRUE(result);
  EXPECT_DOUBLE_EQ(result->dt, 0.05);
  EXPECT_EQ(simulation.time(), 0.05);

  // A target beyond one CFL step is not reached in one call
  auto partial = simulation.step_toward(1.0);
  ASSERT_TRUE(partial);
  EXPECT_NEAR(partial->dt, 0.0625, 1e-12);

  EXPECT_FALSE(simulation.step_toward(0.01));
  EXPECT_FALSE(simulation.step_toward(std::nan("")));
}

TEST(SimulationTest, RunReturnsOneResultPerStep) {
  auto simulation = make_couette(8, 4);
  auto results = simulation.run(3);
  ASSERT_TRUE(results);
  ASSERT_EQ(results->size(), 3u);
  for (std::size_t i = 0; i < results->size(); ++i) {
    EXPECT_EQ((*results)[i].step, i + 1);
  }
}

TEST(SimulationTest, StokesFailurePolicy) {
  NumericalSettings settings;
  settings.stokes.max_iterations = 1;

  auto strict = make_couette(8, 4, settings, materials::PowerLaw{1.0, 3.0});
  auto failed = strict.step();
  ASSERT_FALSE(failed);
  EXPECT_EQ(failed.error().kind(), solver::SolverError::Kind::NonConvergence);
  EXPECT_EQ(strict.step_index(), 0u);
  EXPECT_EQ(strict.time(), 0.0);

  settings.stokes_failure_policy = StokesFailurePolicy::AcceptBestEffort;
  auto lenient = make_couette(8, 4, settings, materials::PowerLaw{1.0, 3.0});
  auto accepted = lenient.step();
  ASSERT_TRUE(accepted);
  EXPECT_FALSE(accepted->stokes.converged);
  EXPECT_EQ(accepted->stokes.iterations, 1);
  EXPECT_EQ(lenient.step_index(), 1u);
}

TEST(SimulationTest, ThermalStallWithHalvingGivesUpAndKeepsState) {
  auto simulation = make_stalling_thermal(ThermalFailurePolicy::HalveTimestep);
  const auto temperature = simulation.temperature();
  const auto positions = simulation.swarm().position_snapshot();

  auto result = simulation.step();
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), solver::SolverError::Kind::NonConvergence);
  EXPECT_EQ(result.error().iterations(), 1);

  // Full step 0.5 h, then two halvings
  const double last_dt = 0.5 * simulation.mesh().characteristic_length() / 4.0;
  const auto& context = result.error().call_stack();
  ASSERT_FALSE(context.empty());
  EXPECT_NE(context.back().find(std::format("dt={:.4e}", last_dt)), std::string::npos) << context.back();

  EXPECT_EQ(simulation.step_index(), 0u);
  EXPECT_EQ(simulation.time(), 0.0);
  EXPECT_EQ(simulation.temperature(), temperature);
  EXPECT_EQ(simulation.swarm().position_snapshot(), positions);
}

TEST(SimulationTest, ThermalStallAcceptedAsBestEffort) {
  auto simulation = make_stalling_thermal(ThermalFailurePolicy::AcceptBestEffort);
  const auto temperature = simulation.temperature();

  auto result = simulation.step();
  ASSERT_TRUE(result) << result.error().full_message();
  EXPECT_FALSE(result->thermal.converged);
  EXPECT_EQ(result->thermal.iterations, 1);
  EXPECT_GT(result->thermal.residual, 0.0);
  EXPECT_TRUE(result->stokes.converged);
  EXPECT_EQ(result->timestep_halvings, 0);

  EXPECT_EQ(simulation.step_index(), 1u);
  EXPECT_DOUBLE_EQ(simulation.time(), result->dt);
  EXPECT_NE(simulation.temperature(), temperature);
}

TEST(SimulationTest, ThermalStallAbortsWithoutCommitting) {
  auto simulation = make_stalling_thermal(ThermalFailurePolicy::Abort);
  const auto temperature = simulation.temperature();
  const auto velocity = simulation.velocity();

  auto result = simulation.step();
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), solver::SolverError::Kind::NonConvergence);

  EXPECT_EQ(simulation.step_index(), 0u);
  EXPECT_EQ(simulation.time(), 0.0);
  EXPECT_EQ(simulation.temperature(), temperature);
  EXPECT_EQ(simulation.velocity(), velocity);
}

TEST(SimulationTest, ParticlesCarryStressHistory) {
  auto simulation = make_couette(16, 8, {}, materials::ConstantViscosity{2.0});
  ASSERT_TRUE(simulation.step());

  // Simple shear u = (y, 0): edot_II = 1/2 everywhere, sigma_II = 2 eta edot_II = 2
  const auto snapshot = simulation.snapshot();
  ASSERT_EQ(snapshot.particle_strain_rate.size(), simulation.swarm().size());
  ASSERT_EQ(snapshot.particle_stress.size(), simulation.swarm().size());
  for (std::size_t p = 0; p < simulation.swarm().size(); ++p) {
    EXPECT_NEAR(snapshot.particle_strain_rate[p], 0.5, 1e-8);
    EXPECT_NEAR(snapshot.particle_stress[p], 2.0, 1e-8);
  }
}

TEST(SimulationTest, DirichletTemperatureAppliedAtStart) {
  auto mesh = mesh::StructuredMesh::create({8, 8}, Point(0.0, 0.0), Point(1.0, 1.0)).value();
  auto materials = single_material();
  auto swarm = swarm::Swarm::populate(mesh, materials, swarm::SwarmLayout{}).value();
  auto bc = fields::BoundaryConditionSet::free_slip();
  bc.set_temperature(Wall::Bottom, 1.0).set_temperature(Wall::Top, 0.0);

  auto simulation = Simulation::initialize(std::move(mesh), std::move(materials), std::move(swarm), bc,
                                           Point(0.0, -1.0), 1.0, {}, UniformTemperature{0.5})
                        .value();

  EXPECT_DOUBLE_EQ(simulation.temperature_at(Point(0.5, 0.0)).value(), 1.0);
  EXPECT_DOUBLE_EQ(simulation.temperature_at(Point(0.5, 1.0)).value(), 0.0);
  EXPECT_DOUBLE_EQ(simulation.temperature_at(Point(0.5, 0.5)).value(), 0.5);
  EXPECT_FALSE(simulation.temperature_at(Point(0.5, 1.5)));
}

TEST(SimulationTest, InitializeRejectsInvalidModels) {
  auto mesh = mesh::StructuredMesh::create({4, 4}, Point(0.0, 0.0), Point(1.0, 1.0)).value();
  auto materials = single_material();
  auto swarm = swarm::Swarm::populate(mesh, materials, swarm::SwarmLayout{}).value();

  EXPECT_FALSE(Simulation::initialize(mesh, materials, swarm, couette_bc(), Point::Zero(), -1.0));

  NumericalSettings settings;
  settings.cfl_factor = 1.5;
  auto bad_cfl = Simulation::initialize(mesh, materials, swarm, couette_bc(), Point::Zero(), 1.0, settings);
  ASSERT_FALSE(bad_cfl);
  EXPECT_NE(bad_cfl.error().message().find("cfl_factor"), std::string::npos);

  auto stray = swarm;
  stray.add_particle(Point(0.5, 0.5), 3);
  EXPECT_FALSE(Simulation::initialize(mesh, materials, stray, couette_bc(), Point::Zero(), 1.0));

  SimulationSetup setup;
  setup.mesh.resolution = {4, 4};
  EXPECT_FALSE(Simulation::initialize(setup));

  setup.materials = single_material();
  EXPECT_TRUE(Simulation::initialize(setup));

  setup.mesh.max = Point(-1.0, 1.0);
  EXPECT_FALSE(Simulation::initialize(setup));
}

TEST(SimulationTest, SnapshotShapes) {
  auto simulation = make_couette(8, 4);
  ASSERT_TRUE(simulation.step());

  const auto snapshot = simulation.snapshot();
  const auto n_nodes = simulation.mesh().node_count();
  const auto n_elements = simulation.mesh().element_count();

  EXPECT_EQ(snapshot.step, 1u);
  EXPECT_EQ(snapshot.element_resolution[0], 8u);
  EXPECT_EQ(snapshot.element_resolution[1], 4u);
  EXPECT_EQ(snapshot.node_coordinates.size(), 2 * n_nodes);
  EXPECT_EQ(snapshot.velocity.size(), 2 * n_nodes);
  EXPECT_EQ(snapshot.pressure.size(), n_nodes);
  EXPECT_EQ(snapshot.temperature.size(), n_nodes);
  EXPECT_EQ(snapshot.nodal_viscosity.size(), n_nodes);
  EXPECT_EQ(snapshot.element_viscosity.size(), n_elements);
  EXPECT_EQ(snapshot.element_strain_rate.size(), n_elements);
  EXPECT_EQ(snapshot.particle_positions.size(), 2 * simulation.swarm().size());
  EXPECT_EQ(snapshot.particle_materials.size(), simulation.swarm().size());
}

TEST(TimestepTest, CflFormula) {
  const auto mesh = mesh::StructuredMesh::create({10, 5}, Point(0.0, 0.0), Point(1.0, 1.0)).value();
  auto velocity = fields::VectorField::for_mesh(mesh);
  EXPECT_DOUBLE_EQ(compute_cfl_timestep(mesh, velocity, 0.5, 2.0), 2.0);

  velocity.set(3, Point(3.0, 4.0));
  EXPECT_DOUBLE_EQ(max_nodal_speed(velocity), 5.0);
  EXPECT_DOUBLE_EQ(compute_cfl_timestep(mesh, velocity, 0.5, 2.0), 0.5 * 0.1 / 5.0);
}

TEST(ElementPropertiesTest, InitialTemperatureProfiles) {
  const auto mesh = mesh::StructuredMesh::create({4, 4}, Point(0.0, 0.0), Point(2.0, 1.0)).value();

  const auto linear = evaluate_initial_temperature(mesh, LinearTemperature{1.0, 0.0, 0.0, 1});
  for (std::size_t n = 0; n < mesh.node_count(); ++n) {
    EXPECT_NEAR(linear.value(n), 1.0 - mesh.node_coordinates(n).y(), 1e-14);
  }

  const auto step = evaluate_initial_temperature(mesh, StepTemperature{0, 1.0, -1.0, 1.0});
  EXPECT_DOUBLE_EQ(step.value(mesh.node_index(0, 0)), -1.0);
  EXPECT_DOUBLE_EQ(step.value(mesh.node_index(4, 0)), 1.0);

  const auto custom = evaluate_initial_temperature(mesh, CustomTemperature{[](const Point& x) { return x.x() * x.y(); }});
  EXPECT_DOUBLE_EQ(custom.value(mesh.node_index(4, 4)), 2.0);
}

TEST(ElementPropertiesTest, BuoyancyFollowsMaterialsAndTemperature) {
  const auto mesh = mesh::StructuredMesh::create({2, 2}, Point(0.0, 0.0), Point(1.0, 1.0)).value();
  std::vector<materials::Material> materials(2);
  materials[0].density = 1.0;
  materials[1].density = 3.0;
  materials[1].thermal_expansivity = 0.1;
  materials[1].shape = materials::Layer{0.0, 0.5};

  const auto swarm = swarm::Swarm::populate(mesh, materials, swarm::SwarmLayout{}).value();
  const auto temperature = fields::ScalarField::for_mesh(mesh, 1.0);

  const auto props = compute_element_properties(mesh, materials, swarm, temperature);
  ASSERT_EQ(props.density.size(), 4u);
  EXPECT_NEAR(props.density[mesh.element_index(0, 0)], 3.0 * 0.9, 1e-12);
  EXPECT_NEAR(props.density[mesh.element_index(1, 1)], 1.0, 1e-12);
  EXPECT_NEAR(props.temperature[0], 1.0, 1e-12);
  EXPECT_DOUBLE_EQ(props.fractions[mesh.element_index(0, 0) * 2 + 1], 1.0);
}

} // namespace
} // namespace mantle::simulation
