#include "mantle/fields/nodal_field.hpp"
#include "mantle/fields/shape_functions.hpp"
#include <gtest/gtest.h>
#include <numeric>

namespace mantle::fields {
namespace {

using core::Point;

class NodalFieldTest : public ::testing::Test {
protected:
  mesh::StructuredMesh mesh_ = mesh::StructuredMesh::create({8, 4}, Point(-1.0, 0.0), Point(1.0, 1.0)).value();

  // Fills a scalar field with an affine function of position
  auto affine_field(double a, double b, double c) const -> ScalarField {
    auto field = ScalarField::for_mesh(mesh_);
    for (std::size_t n = 0; n < mesh_.node_count(); ++n) {
      const auto x = mesh_.node_coordinates(n);
      field.set(n, a + b * x.x() + c * x.y());
    }
    return field;
  }
};

TEST(ShapeFunctionTest, PartitionOfUnity) {
  for (const double xi : {-1.0, -0.3, 0.0, 0.7, 1.0}) {
    for (const double eta : {-1.0, 0.25, 1.0}) {
      const auto n = shape::values(xi, eta);
      EXPECT_NEAR(std::accumulate(n.begin(), n.end(), 0.0), 1.0, 1e-14);

      const auto grad = shape::gradients(xi, eta, 0.5, 0.25);
      Point sum = Point::Zero();
      for (const auto& g : grad) {
        sum += g;
      }
      EXPECT_NEAR(sum.norm(), 0.0, 1e-13);
    }
  }
}

TEST_F(NodalFieldTest, InterpolationIsExactForAffineFields) {
  const auto field = affine_field(0.5, 2.0, -3.0);

  for (const auto& point : {Point(0.0, 0.0), Point(-0.93, 0.41), Point(0.333, 0.777), Point(1.0, 1.0)}) {
    auto value = field.interpolate(mesh_, point);
    ASSERT_TRUE(value);
    EXPECT_NEAR(value.value(), 0.5 + 2.0 * point.x() - 3.0 * point.y(), 1e-12);
  }
}

TEST_F(NodalFieldTest, InterpolationHitsNodalValues) {
  auto field = ScalarField::for_mesh(mesh_);
  for (std::size_t n = 0; n < mesh_.node_count(); ++n) {
    field.set(n, static_cast<double>(n * n % 17));
  }

  for (std::size_t n = 0; n < mesh_.node_count(); ++n) {
    auto value = field.interpolate(mesh_, mesh_.node_coordinates(n));
    ASSERT_TRUE(value);
    EXPECT_NEAR(value.value(), field.value(n), 1e-12);
  }
}

TEST_F(NodalFieldTest, VectorFieldInterpolatesComponentwise) {
  auto velocity = VectorField::for_mesh(mesh_);
  for (std::size_t n = 0; n < mesh_.node_count(); ++n) {
    const auto x = mesh_.node_coordinates(n);
    velocity.set(n, Point(x.y(), -x.x()));
  }

  auto value = velocity.interpolate(mesh_, Point(0.3, 0.6));
  ASSERT_TRUE(value);
  EXPECT_NEAR(value->x(), 0.6, 1e-12);
  EXPECT_NEAR(value->y(), -0.3, 1e-12);
  EXPECT_EQ(velocity.data().size(), 2 * mesh_.node_count());
}

TEST_F(NodalFieldTest, InterpolationOutsideDomainFails) {
  const auto field = affine_field(1.0, 0.0, 0.0);
  auto value = field.interpolate(mesh_, Point(-1.5, 0.5));
  EXPECT_FALSE(value);
}

TEST_F(NodalFieldTest, ElementAverageOfConstantIsConstant) {
  const std::vector<double> element_values(mesh_.element_count(), 4.2);
  const auto nodal = node_average_from_elements(mesh_, element_values);

  for (std::size_t n = 0; n < mesh_.node_count(); ++n) {
    EXPECT_DOUBLE_EQ(nodal.value(n), 4.2);
  }
}

TEST_F(NodalFieldTest, CentroidValuesAndProfiles) {
  const auto field = affine_field(0.0, 1.0, 1.0);

  const auto centroids = element_centroid_values(mesh_, field);
  ASSERT_EQ(centroids.size(), mesh_.element_count());
  for (std::size_t e = 0; e < mesh_.element_count(); ++e) {
    const auto c = mesh_.element_centroid(e);
    EXPECT_NEAR(centroids[e], c.x() + c.y(), 1e-12);
  }

  auto profile = sample_profile(mesh_, field, Point(0.0, 0.0), Point(0.0, 1.0), 5);
  ASSERT_TRUE(profile);
  ASSERT_EQ(profile->size(), 5u);
  EXPECT_NEAR(profile->front(), 0.0, 1e-12);
  EXPECT_NEAR((*profile)[2], 0.5, 1e-12);
  EXPECT_NEAR(profile->back(), 1.0, 1e-12);

  EXPECT_FALSE(sample_profile(mesh_, field, Point(0.0, 0.0), Point(0.0, 2.0), 3));
}

} // namespace
} // namespace mantle::fields
