#include "mantle/swarm/swarm.hpp"
#include <algorithm>
#include <gtest/gtest.h>

namespace mantle::swarm {
namespace {

using core::Point;

class SwarmTest : public ::testing::Test {
protected:
  mesh::StructuredMesh mesh_ = mesh::StructuredMesh::create({4, 2}, Point(0.0, 0.0), Point(2.0, 1.0)).value();
  std::vector<materials::Material> materials_;

  void SetUp() override {
    materials_.resize(2);
    materials_[0].name = "mantle";
    materials_[1].name = "lower";
    materials_[1].shape = materials::Layer{0.0, 0.5};
  }

  auto regular_swarm(int per_axis = 2) const -> Swarm {
    return Swarm::populate(mesh_, materials_, SwarmLayout{ParticleLayout::Regular, per_axis, 1}).value();
  }

  auto uniform_velocity(const Point& v) const -> fields::VectorField {
    auto velocity = fields::VectorField::for_mesh(mesh_);
    velocity.fill(v);
    return velocity;
  }
};

TEST_F(SwarmTest, RegularLayoutFillsEveryCell) {
  const auto swarm = regular_swarm(3);
  EXPECT_EQ(swarm.size(), mesh_.element_count() * 9);
  EXPECT_EQ(swarm.active_count(), swarm.size());

  for (std::size_t p = 0; p < swarm.size(); ++p) {
    EXPECT_TRUE(mesh_.contains(swarm.position(p)));
  }
}

TEST_F(SwarmTest, LastContainingMaterialWins) {
  const auto swarm = regular_swarm();
  for (std::size_t p = 0; p < swarm.size(); ++p) {
    const int expected = swarm.position(p).y() <= 0.5 ? 1 : 0;
    EXPECT_EQ(swarm.material(p), expected) << "particle " << p;
  }
}

TEST_F(SwarmTest, UncoveredSamplesAreSkipped) {
  std::vector<materials::Material> block(1);
  block[0].shape = materials::Box{Point(0.0, 0.0), Point(1.0, 1.0)};

  auto swarm = Swarm::populate(mesh_, block, SwarmLayout{ParticleLayout::Regular, 2, 1});
  ASSERT_TRUE(swarm);
  EXPECT_EQ(swarm->size(), mesh_.element_count() * 4 / 2);

  block[0].shape = materials::Circle{Point(10.0, 10.0), 0.1};
  EXPECT_FALSE(Swarm::populate(mesh_, block, SwarmLayout{ParticleLayout::Regular, 2, 1}));
}

TEST_F(SwarmTest, InvalidLayoutIsRejected) {
  auto swarm = Swarm::populate(mesh_, materials_, SwarmLayout{ParticleLayout::Regular, 0, 1});
  ASSERT_FALSE(swarm);
  EXPECT_EQ(swarm.error().field_name(), "swarm.particles_per_cell");
}

TEST_F(SwarmTest, RandomLayoutIsReproducibleForSeed) {
  const SwarmLayout layout{ParticleLayout::Random, 3, 42};
  const auto first = Swarm::populate(mesh_, materials_, layout).value();
  const auto second = Swarm::populate(mesh_, materials_, layout).value();
  EXPECT_TRUE(first == second);
  EXPECT_EQ(first.size(), mesh_.element_count() * 9);

  const auto other = Swarm::populate(mesh_, materials_, SwarmLayout{ParticleLayout::Random, 3, 43}).value();
  EXPECT_FALSE(first == other);
}

TEST_F(SwarmTest, MaterialFractionsPerElement) {
  auto swarm = regular_swarm();
  const auto fractions = swarm.material_fractions(mesh_, materials_.size());
  ASSERT_EQ(fractions.size(), mesh_.element_count() * 2);

  for (std::size_t i = 0; i < mesh_.elements_x(); ++i) {
    const auto bottom = mesh_.element_index(i, 0);
    const auto top = mesh_.element_index(i, 1);
    EXPECT_DOUBLE_EQ(fractions[bottom * 2 + 1], 1.0);
    EXPECT_DOUBLE_EQ(fractions[top * 2 + 0], 1.0);
    EXPECT_DOUBLE_EQ(fractions[top * 2 + 1], 0.0);
  }

  // Emptied elements take the material of the nearest remaining particle
  const auto corner = mesh_.element_index(0, 0);
  const auto above = mesh_.element_index(0, 1);
  for (std::size_t p = 0; p < swarm.size(); ++p) {
    const auto e = mesh_.locate(swarm.position(p))->element;
    if (e == corner || e == above) {
      swarm.deactivate(p);
    }
  }
  const auto emptied = swarm.material_fractions(mesh_, materials_.size());
  EXPECT_DOUBLE_EQ(emptied[corner * 2 + 0], 0.0);
  EXPECT_DOUBLE_EQ(emptied[corner * 2 + 1], 1.0);
  EXPECT_DOUBLE_EQ(emptied[above * 2 + 0], 1.0);
  EXPECT_DOUBLE_EQ(emptied[above * 2 + 1], 0.0);
}

TEST_F(SwarmTest, NearestMaterialWithoutActiveParticles) {
  auto swarm = regular_swarm();
  EXPECT_EQ(swarm.nearest_material(Point(1.0, 0.1)), 1);
  EXPECT_EQ(swarm.nearest_material(Point(1.0, 0.9)), 0);

  for (std::size_t p = 0; p < swarm.size(); ++p) {
    swarm.deactivate(p);
  }
  EXPECT_EQ(swarm.nearest_material(Point(1.0, 0.1)), 0);
  const auto fractions = swarm.material_fractions(mesh_, materials_.size());
  EXPECT_DOUBLE_EQ(fractions[0], 1.0);
}

TEST_F(SwarmTest, ZeroVelocityLeavesParticlesInPlace) {
  auto swarm = regular_swarm();
  const auto before = swarm.position_snapshot();

  for (const auto scheme : {AdvectionScheme::ForwardEuler, AdvectionScheme::RungeKutta2}) {
    const auto report = swarm.advect(mesh_, uniform_velocity(Point::Zero()), 0.5, scheme, OutflowPolicy::Deactivate);
    EXPECT_EQ(report.deactivated, 0u);
    EXPECT_DOUBLE_EQ(report.max_displacement, 0.0);
  }
  EXPECT_EQ(swarm.position_snapshot(), before);
}

TEST_F(SwarmTest, UniformTranslation) {
  auto swarm = regular_swarm();
  const auto start = swarm.position(0);

  const auto report =
      swarm.advect(mesh_, uniform_velocity(Point(1.0, 0.0)), 0.1, AdvectionScheme::RungeKutta2, OutflowPolicy::Deactivate);
  EXPECT_EQ(report.deactivated, 0u);
  EXPECT_NEAR(report.max_displacement, 0.1, 1e-14);
  EXPECT_NEAR(swarm.position(0).x(), start.x() + 0.1, 1e-14);
  EXPECT_DOUBLE_EQ(swarm.position(0).y(), start.y());
}

TEST_F(SwarmTest, ExitingParticlesAreDeactivated) {
  auto swarm = regular_swarm();
  const auto total = swarm.size();

  // Only the sub-column at x = 1.875 crosses x = 2
  const auto report =
      swarm.advect(mesh_, uniform_velocity(Point(1.0, 0.0)), 0.2, AdvectionScheme::ForwardEuler, OutflowPolicy::Deactivate);
  EXPECT_EQ(report.deactivated, 4u);
  EXPECT_EQ(swarm.active_count(), total - 4);
  EXPECT_EQ(swarm.size(), total);

  const auto active = swarm.active_snapshot();
  for (std::size_t p = 0; p < swarm.size(); ++p) {
    if (!swarm.is_active(p)) {
      EXPECT_EQ(active[p], 0);
      EXPECT_NEAR(swarm.position(p).x(), 1.875, 1e-14);
    }
  }

  // Inactive particles are not moved again
  const auto snapshot = swarm.position_snapshot();
  swarm.advect(mesh_, uniform_velocity(Point(-1.0, 0.0)), 0.0, AdvectionScheme::ForwardEuler, OutflowPolicy::Deactivate);
  EXPECT_EQ(swarm.position_snapshot(), snapshot);
}

TEST_F(SwarmTest, ClampPolicyKeepsParticlesOnTheWall) {
  auto swarm = regular_swarm();

  const auto report =
      swarm.advect(mesh_, uniform_velocity(Point(1.0, 0.0)), 0.2, AdvectionScheme::ForwardEuler, OutflowPolicy::Clamp);
  EXPECT_EQ(report.deactivated, 0u);
  EXPECT_EQ(swarm.active_count(), swarm.size());

  double max_x = 0.0;
  for (std::size_t p = 0; p < swarm.size(); ++p) {
    max_x = std::max(max_x, swarm.position(p).x());
  }
  EXPECT_DOUBLE_EQ(max_x, 2.0);
}

TEST_F(SwarmTest, HistoryFollowsElementValues) {
  auto swarm = regular_swarm();
  std::vector<double> strain_rate(mesh_.element_count());
  std::vector<double> viscosity(mesh_.element_count(), 3.0);
  for (std::size_t e = 0; e < strain_rate.size(); ++e) {
    strain_rate[e] = 0.1 * static_cast<double>(e + 1);
  }

  swarm.update_history(mesh_, strain_rate, viscosity);

  for (std::size_t p = 0; p < swarm.size(); ++p) {
    const auto e = mesh_.locate(swarm.position(p))->element;
    EXPECT_DOUBLE_EQ(swarm.strain_rate(p), strain_rate[e]);
    EXPECT_DOUBLE_EQ(swarm.stress(p), 2.0 * 3.0 * strain_rate[e]);
  }
}

} // namespace
} // namespace mantle::swarm
