#include "mantle/io/output/hdf5_writer.hpp"
#include "mantle/simulation/simulation.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <gtest/gtest.h>
#include <optional>

namespace mantle::io::output {
namespace {

using core::Point;

class HDF5WriterTest : public ::testing::Test {
protected:
  std::filesystem::path directory_;
  std::optional<simulation::Simulation> simulation_;

  void SetUp() override {
    ASSERT_TRUE(hdf5::initialize());
    directory_ = std::filesystem::temp_directory_path() /
                 std::format("mantle_hdf5_{}", ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::create_directories(directory_);

    auto mesh = mesh::StructuredMesh::create({8, 4}, Point(0.0, 0.0), Point(2.0, 1.0)).value();
    std::vector<materials::Material> materials(2);
    materials[0].name = "ambient";
    materials[1].name = "block";
    materials[1].density = 1.5;
    materials[1].shape = materials::Box{Point(0.75, 0.25), Point(1.25, 0.75)};
    auto swarm = swarm::Swarm::populate(mesh, materials, swarm::SwarmLayout{}).value();

    auto simulation = simulation::Simulation::initialize(std::move(mesh), std::move(materials), std::move(swarm),
                                                         fields::BoundaryConditionSet::free_slip(), Point(0.0, -1.0),
                                                         1.0, {}, simulation::LinearTemperature{});
    ASSERT_TRUE(simulation) << simulation.error().full_message();
    simulation_.emplace(std::move(simulation.value()));
  }

  void TearDown() override { std::filesystem::remove_all(directory_); }
};

TEST_F(HDF5WriterTest, SnapshotRoundTrip) {
  auto step = simulation_->step();
  ASSERT_TRUE(step) << step.error().full_message();

  const auto path = directory_ / "state.h5";
  const auto snapshot = simulation_->snapshot();
  SnapshotMetadata metadata;
  metadata.case_name = "sinking_block";
  metadata.step_result = step.value();

  const HDF5Writer writer;
  auto written = writer.write_snapshot(path, snapshot, metadata);
  ASSERT_TRUE(written) << written.error().message();
  EXPECT_TRUE(hdf5::validate_file(path));

  const HDF5Reader reader(path);
  EXPECT_EQ(reader.read_string_attribute("metadata", "case_name").value(), "sinking_block");
  EXPECT_EQ(reader.read_string_attribute("metadata", "mantle_version").value(), "1.0.0");
  EXPECT_DOUBLE_EQ(reader.read_scalar("metadata/time").value(), simulation_->time());
  EXPECT_DOUBLE_EQ(reader.read_scalar("metadata/step").value(), 1.0);
  EXPECT_DOUBLE_EQ(reader.read_scalar("metadata/diagnostics/dt").value(), step->dt);
  EXPECT_DOUBLE_EQ(reader.read_scalar("metadata/diagnostics/stokes_converged").value(), 1.0);

  EXPECT_EQ(reader.read_int_vector("mesh/element_resolution").value(), (std::vector<int>{8, 4}));
  EXPECT_EQ(reader.read_vector("mesh/nodes").value(), snapshot.node_coordinates);
  EXPECT_EQ(reader.read_vector("fields/velocity").value(), snapshot.velocity);
  EXPECT_EQ(reader.read_vector("fields/temperature").value(), snapshot.temperature);
  EXPECT_EQ(reader.read_vector("fields/pressure").value(), snapshot.pressure);
  EXPECT_EQ(reader.read_vector("elements/viscosity").value(), snapshot.element_viscosity);
  EXPECT_EQ(reader.read_vector("elements/strain_rate").value(), snapshot.element_strain_rate);

  EXPECT_EQ(reader.read_vector("swarm/positions").value(), snapshot.particle_positions);
  EXPECT_EQ(reader.read_int_vector("swarm/material").value(), snapshot.particle_materials);
  EXPECT_EQ(reader.read_int_vector("swarm/active").value(), snapshot.particle_active);

  const auto strain_rate = reader.read_vector("swarm/strain_rate").value();
  const auto stress = reader.read_vector("swarm/stress").value();
  EXPECT_EQ(strain_rate, snapshot.particle_strain_rate);
  EXPECT_EQ(stress, snapshot.particle_stress);
  ASSERT_EQ(stress.size(), snapshot.particle_materials.size());
  EXPECT_GT(*std::ranges::max_element(stress), 0.0);
}

TEST_F(HDF5WriterTest, InitialStateWithoutSwarm) {
  const auto path = directory_ / "initial.h5";
  const auto snapshot = simulation_->snapshot();

  HDF5Config config;
  config.compression_level = 0;
  const HDF5Writer writer(config);
  ASSERT_TRUE(writer.write_snapshot(path, snapshot, SnapshotMetadata{}, SnapshotOptions{false}));

  const HDF5Reader reader(path);
  EXPECT_TRUE(reader.has_object("fields/temperature"));
  EXPECT_FALSE(reader.has_object("swarm"));
  EXPECT_FALSE(reader.has_object("swarm/positions"));
  EXPECT_FALSE(reader.has_object("metadata/diagnostics"));

  // No flow solve yet, so no strain rate either
  EXPECT_FALSE(reader.has_object("elements/strain_rate"));
  EXPECT_EQ(reader.read_vector("fields/temperature").value().size(), simulation_->mesh().node_count());
  EXPECT_DOUBLE_EQ(reader.read_scalar("metadata/step").value(), 0.0);
  EXPECT_EQ(reader.read_string_attribute("metadata", "case_name").value(), "simulation");
}

TEST_F(HDF5WriterTest, MissingDataIsReported) {
  const auto path = directory_ / "state.h5";
  const HDF5Writer writer;
  ASSERT_TRUE(writer.write_snapshot(path, simulation_->snapshot(), SnapshotMetadata{}));

  const HDF5Reader reader(path);
  EXPECT_FALSE(reader.read_vector("fields/density"));
  EXPECT_FALSE(reader.read_scalar("fields/temperature"));
  EXPECT_FALSE(reader.read_string_attribute("metadata", "author"));
}

TEST_F(HDF5WriterTest, UnwritableLocationFails) {
  const HDF5Writer writer;
  auto written =
      writer.write_snapshot(directory_ / "missing" / "state.h5", simulation_->snapshot(), SnapshotMetadata{});
  ASSERT_FALSE(written);
  EXPECT_NE(written.error().message().find("state.h5"), std::string::npos);
}

TEST_F(HDF5WriterTest, FileValidation) {
  EXPECT_FALSE(hdf5::validate_file(directory_ / "absent.h5"));

  const auto text = directory_ / "notes.txt";
  std::ofstream(text) << "not an HDF5 file\n";
  EXPECT_FALSE(hdf5::validate_file(text));

  EXPECT_THROW(HDF5Reader{text}, OutputError);

  auto version = hdf5::check_version();
  ASSERT_TRUE(version);
  EXPECT_NE(version->find('.'), std::string::npos);
}

} // namespace
} // namespace mantle::io::output
