#include "mantle/thermal/thermal_solver.hpp"
#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <limits>

namespace mantle::thermal {
namespace {

using core::Point;
using mesh::Wall;

auto make_mesh(int nx, int ny, const Point& min, const Point& max) -> mesh::StructuredMesh {
  return mesh::StructuredMesh::create({nx, ny}, min, max).value();
}

TEST(ThermalSolverTest, InsulatedDiffusionConservesHeat) {
  const auto mesh = make_mesh(16, 16, Point(0.0, 0.0), Point(1.0, 1.0));
  const ThermalSolver solver(mesh, fields::BoundaryConditionSet::free_slip(), 1.0);

  auto temperature = fields::ScalarField::for_mesh(mesh);
  for (std::size_t n = 0; n < mesh.node_count(); ++n) {
    const auto x = mesh.node_coordinates(n);
    temperature.set(n, std::exp(-20.0 * (x - Point(0.3, 0.6)).squaredNorm()));
  }
  const auto velocity = fields::VectorField::for_mesh(mesh);
  const double initial_heat = total_heat(mesh, temperature);

  for (int step = 0; step < 5; ++step) {
    auto result = solver.solve(temperature, velocity, 0.01);
    ASSERT_TRUE(result) << result.error().error.full_message();
    temperature = std::move(result->temperature);
  }

  EXPECT_NEAR(total_heat(mesh, temperature), initial_heat, 1e-9 * initial_heat);

  // Diffusion only flattens the profile
  double peak = 0.0;
  for (const double t : temperature.data()) {
    peak = std::max(peak, t);
  }
  EXPECT_LT(peak, 1.0);
}

TEST(ThermalSolverTest, StepProfileFollowsErrorFunction) {
  const double kappa = 1.0;
  const double t0 = 0.0025;
  const double t_end = 0.01;
  const double dt = 5e-5;

  const auto mesh = make_mesh(200, 2, Point(-1.0, 0.0), Point(1.0, 0.02));
  const ThermalSolver solver(mesh, fields::BoundaryConditionSet{}, kappa);

  auto exact = [&](double x, double t) { return 0.5 * std::erfc(x / (2.0 * std::sqrt(kappa * t))); };

  auto temperature = fields::ScalarField::for_mesh(mesh);
  for (std::size_t n = 0; n < mesh.node_count(); ++n) {
    temperature.set(n, exact(mesh.node_coordinates(n).x(), t0));
  }
  const auto velocity = fields::VectorField::for_mesh(mesh);

  const int steps = static_cast<int>(std::lround((t_end - t0) / dt));
  for (int step = 0; step < steps; ++step) {
    auto result = solver.solve(temperature, velocity, dt);
    ASSERT_TRUE(result) << result.error().error.full_message();
    temperature = std::move(result->temperature);
  }

  double max_error = 0.0;
  for (std::size_t n = 0; n < mesh.node_count(); ++n) {
    const auto x = mesh.node_coordinates(n);
    max_error = std::max(max_error, std::abs(temperature.value(n) - exact(x.x(), t_end)));
  }
  EXPECT_LT(max_error, 5e-3);
}

TEST(ThermalSolverTest, SharpStepRelaxesToErrorFunction) {
  const double kappa = 1.0;
  const double t_end = 0.01;
  const double dt = 2.5e-5;
  // Between two nodes, so the initial field has no node on the jump
  const double step_x = 0.005;

  const auto mesh = make_mesh(200, 2, Point(-1.0, 0.0), Point(1.0, 0.02));
  const ThermalSolver solver(mesh, fields::BoundaryConditionSet{}, kappa);

  auto temperature = fields::ScalarField::for_mesh(mesh);
  for (std::size_t n = 0; n < mesh.node_count(); ++n) {
    temperature.set(n, mesh.node_coordinates(n).x() < step_x ? 1.0 : 0.0);
  }
  const auto velocity = fields::VectorField::for_mesh(mesh);
  const double initial_heat = total_heat(mesh, temperature);

  const int steps = static_cast<int>(std::lround(t_end / dt));
  for (int step = 0; step < steps; ++step) {
    auto result = solver.solve(temperature, velocity, dt);
    ASSERT_TRUE(result) << result.error().error.full_message();
    temperature = std::move(result->temperature);
  }

  double max_error = 0.0;
  for (std::size_t n = 0; n < mesh.node_count(); ++n) {
    const double x = mesh.node_coordinates(n).x();
    const double exact = 0.5 * std::erfc((x - step_x) / (2.0 * std::sqrt(kappa * t_end)));
    max_error = std::max(max_error, std::abs(temperature.value(n) - exact));
  }
  EXPECT_LT(max_error, 1e-2);
  EXPECT_NEAR(total_heat(mesh, temperature), initial_heat, 1e-9 * initial_heat);
}

TEST(ThermalSolverTest, DirichletWallsReachConductiveProfile) {
  const auto mesh = make_mesh(8, 8, Point(0.0, 0.0), Point(1.0, 1.0));
  fields::BoundaryConditionSet bc;
  bc.set_temperature(Wall::Bottom, 1.0).set_temperature(Wall::Top, 0.0);
  const ThermalSolver solver(mesh, bc, 1.0);

  auto temperature = fields::ScalarField::for_mesh(mesh, 0.5);
  const auto velocity = fields::VectorField::for_mesh(mesh);

  for (int step = 0; step < 50; ++step) {
    auto result = solver.solve(temperature, velocity, 0.1);
    ASSERT_TRUE(result);
    temperature = std::move(result->temperature);
  }

  for (std::size_t n = 0; n < mesh.node_count(); ++n) {
    const auto x = mesh.node_coordinates(n);
    EXPECT_NEAR(temperature.value(n), 1.0 - x.y(), 1e-8);
  }
  for (const auto node : mesh.wall_nodes(Wall::Bottom)) {
    EXPECT_NEAR(temperature.value(node), 1.0, 1e-10);
  }
}

TEST(ThermalSolverTest, AdvectionPreservesUniformTemperature) {
  const auto mesh = make_mesh(8, 8, Point(0.0, 0.0), Point(1.0, 1.0));
  const ThermalSolver solver(mesh, fields::BoundaryConditionSet{}, 0.0);

  const auto temperature = fields::ScalarField::for_mesh(mesh, 1.0);
  auto velocity = fields::VectorField::for_mesh(mesh);
  velocity.fill(Point(1.0, 0.5));

  auto result = solver.solve(temperature, velocity, 0.05);
  ASSERT_TRUE(result);
  for (const double t : result->temperature.data()) {
    EXPECT_NEAR(t, 1.0, 1e-10);
  }
}

TEST(ThermalSolverTest, InvalidInputsAreRejected) {
  const auto mesh = make_mesh(4, 4, Point(0.0, 0.0), Point(1.0, 1.0));
  const ThermalSolver solver(mesh, fields::BoundaryConditionSet{}, 1.0);
  const auto temperature = fields::ScalarField::for_mesh(mesh);
  const auto velocity = fields::VectorField::for_mesh(mesh);

  for (const double dt : {0.0, -1.0, std::numeric_limits<double>::quiet_NaN()}) {
    auto result = solver.solve(temperature, velocity, dt);
    ASSERT_FALSE(result);
    EXPECT_FALSE(result.error().last_iterate.has_value());
  }

  const auto other = make_mesh(2, 2, Point(0.0, 0.0), Point(1.0, 1.0));
  EXPECT_FALSE(solver.solve(fields::ScalarField::for_mesh(other), velocity, 0.1));

  const ThermalSolver negative(mesh, fields::BoundaryConditionSet{}, -1.0);
  EXPECT_FALSE(negative.solve(temperature, velocity, 0.1));
}

TEST(SupgParameterTest, LimitingCases) {
  EXPECT_DOUBLE_EQ(supg_parameter(Point::Zero(), 0.1, 0.1, 1.0), 0.0);

  // Pure advection: tau = h / (2 |u|)
  EXPECT_NEAR(supg_parameter(Point(1.0, 0.0), 0.1, 0.2, 0.0), 0.05, 1e-14);
  EXPECT_NEAR(supg_parameter(Point(0.0, 2.0), 0.1, 0.2, 0.0), 0.05, 1e-14);

  // Diffusion dominated: tau -> h^2 / (12 kappa)
  EXPECT_NEAR(supg_parameter(Point(1.0, 0.0), 0.1, 0.1, 100.0), 0.01 / 1200.0, 1e-10);

  const double moderate = supg_parameter(Point(1.0, 0.0), 0.1, 0.1, 0.05);
  EXPECT_GT(moderate, 0.0);
  EXPECT_LT(moderate, 0.05);
}

TEST(TotalHeatTest, IntegratesAffineFieldExactly) {
  const auto mesh = make_mesh(5, 3, Point(0.0, 0.0), Point(2.0, 1.0));
  auto temperature = fields::ScalarField::for_mesh(mesh);
  for (std::size_t n = 0; n < mesh.node_count(); ++n) {
    const auto x = mesh.node_coordinates(n);
    temperature.set(n, 1.0 + x.x() + 2.0 * x.y());
  }
  // Integral of 1 + x + 2y over [0,2]x[0,1]
  EXPECT_NEAR(total_heat(mesh, temperature), 2.0 + 2.0 + 2.0, 1e-12);
}

} // namespace
} // namespace mantle::thermal
