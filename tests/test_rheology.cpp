#include "mantle/materials/material.hpp"
#include "mantle/materials/rheology.hpp"
#include "mantle/materials/viscosity_model.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>

namespace mantle::materials {
namespace {

using core::Point;

constexpr ViscosityLimits limits{1e-3, 1e3};

TEST(RheologyTest, ConstantViscosityIsNotClipped) {
  auto eta = evaluate_viscosity(ConstantViscosity{1e9}, RheologyInput{0.5, 0.0, 0.0}, limits);
  ASSERT_TRUE(eta);
  EXPECT_DOUBLE_EQ(eta.value(), 1e9);
}

TEST(RheologyTest, PowerLawFollowsStressExponent) {
  // eta = A^(-1/n) edot^((1-n)/n) = 8^(-2/3) for A = 1, n = 3
  auto eta = evaluate_viscosity(PowerLaw{1.0, 3.0}, RheologyInput{8.0, 0.0, 0.0}, limits);
  ASSERT_TRUE(eta);
  EXPECT_NEAR(eta.value(), 0.25, 1e-12);

  // n = 1 is Newtonian with eta = 1/A, whatever the strain rate
  for (const double edot : {0.0, 1e-6, 1.0, 42.0}) {
    auto newtonian = evaluate_viscosity(PowerLaw{0.5, 1.0}, RheologyInput{edot, 0.0, 0.0}, limits);
    ASSERT_TRUE(newtonian);
    EXPECT_DOUBLE_EQ(newtonian.value(), 2.0);
  }
}

TEST(RheologyTest, PowerLawIsClippedToLimits) {
  auto at_rest = evaluate_viscosity(PowerLaw{1.0, 3.0}, RheologyInput{0.0, 0.0, 0.0}, limits);
  ASSERT_TRUE(at_rest);
  EXPECT_DOUBLE_EQ(at_rest.value(), limits.max);

  auto fast = evaluate_viscosity(PowerLaw{1.0, 3.0}, RheologyInput{1e12, 0.0, 0.0}, limits);
  ASSERT_TRUE(fast);
  EXPECT_DOUBLE_EQ(fast.value(), limits.min);
}

TEST(RheologyTest, MalformedStrainRateIsRejected) {
  for (const double edot : {-1.0, std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity()}) {
    auto eta = evaluate_viscosity(PowerLaw{1.0, 3.0}, RheologyInput{edot, 0.0, 0.0}, limits);
    ASSERT_FALSE(eta);
    EXPECT_EQ(eta.error().kind(), solver::SolverError::Kind::RheologyDomain);
  }
}

TEST(RheologyTest, TemperatureDependentLaw) {
  const TemperatureDependent law{1.0, std::log(10.0), 0.0};

  auto cold = evaluate_viscosity(law, RheologyInput{1.0, 0.0, 0.0}, limits);
  auto hot = evaluate_viscosity(law, RheologyInput{1.0, 0.0, 1.0}, limits);
  auto very_cold = evaluate_viscosity(law, RheologyInput{1.0, 0.0, -10.0}, limits);
  ASSERT_TRUE(cold && hot && very_cold);

  EXPECT_NEAR(cold.value(), 1.0, 1e-12);
  EXPECT_NEAR(hot.value(), 0.1, 1e-12);
  EXPECT_DOUBLE_EQ(very_cold.value(), limits.max);

  EXPECT_TRUE(is_velocity_independent(law));
  EXPECT_FALSE(is_velocity_independent(PowerLaw{}));
  EXPECT_STREQ(rheology_name(law), "temperature_dependent");
}

TEST(RheologyTest, AveragingSchemes) {
  const std::vector<double> fractions = {0.5, 0.5};
  const std::vector<double> viscosities = {1.0, 100.0};

  EXPECT_NEAR(average_viscosity(fractions, viscosities, ViscosityAveraging::Arithmetic), 50.5, 1e-12);
  EXPECT_NEAR(average_viscosity(fractions, viscosities, ViscosityAveraging::Harmonic), 200.0 / 101.0, 1e-12);
  EXPECT_NEAR(average_viscosity(fractions, viscosities, ViscosityAveraging::Geometric), 10.0, 1e-12);

  // Absent materials do not contribute, even with a meaningless viscosity
  const std::vector<double> only_first = {1.0, 0.0};
  const std::vector<double> with_zero = {3.0, 0.0};
  EXPECT_DOUBLE_EQ(average_viscosity(only_first, with_zero, ViscosityAveraging::Harmonic), 3.0);
}

TEST(MaterialTest, ShapesContainPoints) {
  EXPECT_TRUE(contains(Everywhere{}, Point(1e6, -1e6)));
  EXPECT_TRUE(contains(Box{Point(0.0, 0.0), Point(1.0, 0.5)}, Point(1.0, 0.25)));
  EXPECT_FALSE(contains(Box{Point(0.0, 0.0), Point(1.0, 0.5)}, Point(0.5, 0.6)));
  EXPECT_TRUE(contains(Circle{Point(0.5, 0.5), 0.2}, Point(0.6, 0.6)));
  EXPECT_FALSE(contains(Circle{Point(0.5, 0.5), 0.2}, Point(0.7, 0.7)));
  EXPECT_TRUE(contains(Layer{0.2, 0.4}, Point(-3.0, 0.3)));

  const Polygon triangle{{Point(0.0, 0.0), Point(1.0, 0.0), Point(0.0, 1.0)}};
  EXPECT_TRUE(contains(triangle, Point(0.2, 0.2)));
  EXPECT_FALSE(contains(triangle, Point(0.8, 0.8)));

  const CustomShape upper_half{[](const Point& p) { return p.y() > 0.5; }};
  EXPECT_TRUE(contains(upper_half, Point(0.0, 0.9)));
  EXPECT_FALSE(contains(CustomShape{}, Point(0.0, 0.9)));
}

TEST(MaterialTest, BoussinesqDensity) {
  Material material{.name = "rock", .density = 3300.0, .thermal_expansivity = 1e-3, .reference_temperature = 0.0};
  EXPECT_DOUBLE_EQ(material.density_at(0.0), 3300.0);
  EXPECT_NEAR(material.density_at(100.0), 3300.0 * 0.9, 1e-9);
}

TEST(MaterialTest, ValidationRejectsNonPhysicalParameters) {
  EXPECT_FALSE(validate_materials({}));

  std::vector<Material> materials(1);
  materials[0].name = "bad";
  materials[0].density = -1.0;
  EXPECT_FALSE(validate_materials(materials));

  materials[0].density = 1.0;
  materials[0].rheology = PowerLaw{1.0, 0.0};
  auto result = validate_materials(materials);
  ASSERT_FALSE(result);
  EXPECT_NE(result.error().message().find("materials.bad.rheology"), std::string::npos);

  const double inf = std::numeric_limits<double>::infinity();
  for (const auto& rheology : {Rheology{PowerLaw{inf, 3.0}}, Rheology{PowerLaw{1.0, inf}},
                               Rheology{TemperatureDependent{inf, 1.0, 0.0}}}) {
    materials[0].rheology = rheology;
    auto rejected = validate_materials(materials);
    ASSERT_FALSE(rejected) << rheology_name(rheology);
    EXPECT_EQ(rejected.error().field_name(), "materials.bad.rheology");
  }

  materials[0].rheology = ConstantViscosity{1.0};
  EXPECT_TRUE(validate_materials(materials));
}

TEST(ElementViscosityModelTest, EvaluatesEveryElement) {
  std::vector<Material> materials(2);
  materials[0].rheology = ConstantViscosity{1.0};
  materials[1].rheology = PowerLaw{1.0, 3.0};

  // Element 0 pure material 0, element 1 pure material 1, element 2 half/half
  std::vector<double> fractions = {1.0, 0.0, 0.0, 1.0, 0.5, 0.5};
  ElementViscosityModel model(materials, fractions, {0.0, 0.0, 0.0}, limits, ViscosityAveraging::Arithmetic);

  EXPECT_FALSE(model.is_velocity_independent());
  EXPECT_EQ(model.element_count(), 3u);

  const std::vector<double> strain_rate = {8.0, 8.0, 8.0};
  const std::vector<double> pressure = {0.0, 0.0, 0.0};
  auto eta = model.evaluate(strain_rate, pressure);
  ASSERT_TRUE(eta);
  EXPECT_DOUBLE_EQ((*eta)[0], 1.0);
  EXPECT_NEAR((*eta)[1], 0.25, 1e-12);
  EXPECT_NEAR((*eta)[2], 0.625, 1e-12);

  const std::vector<double> negative = {1.0, -1.0, 1.0};
  auto failed = model.evaluate(negative, pressure);
  ASSERT_FALSE(failed);
  EXPECT_EQ(failed.error().kind(), solver::SolverError::Kind::RheologyDomain);
  ASSERT_FALSE(failed.error().call_stack().empty());
  EXPECT_NE(failed.error().call_stack().front().find("element 1"), std::string::npos);
}

} // namespace
} // namespace mantle::materials
