#include "mantle/io/output/hdf5_writer.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <vector>

namespace mantle::io::output {

auto HDF5Writer::write_snapshot(const std::filesystem::path& file_path, const simulation::SimulationSnapshot& snapshot,
                                const SnapshotMetadata& metadata,
                                SnapshotOptions options) const -> std::expected<void, OutputError> {
  try {
    auto file_result = create_file(file_path);
    if (!file_result) {
      return std::unexpected(file_result.error());
    }
    auto file = std::move(file_result.value());

    if (auto result = write_metadata(file, snapshot, metadata); !result) {
      return std::unexpected(result.error());
    }
    if (auto result = write_mesh(file, snapshot); !result) {
      return std::unexpected(result.error());
    }
    if (auto result = write_fields(file, snapshot); !result) {
      return std::unexpected(result.error());
    }
    if (options.write_swarm) {
      if (auto result = write_swarm(file, snapshot); !result) {
        return std::unexpected(result.error());
      }
    }

    if (H5Fflush(file, H5F_SCOPE_GLOBAL) < 0) {
      return std::unexpected(FileWriteError(file_path, "flush failed"));
    }
    return {};

  } catch (const std::exception& e) {
    return std::unexpected(OutputError(std::format("HDF5 write failed: {}", e.what())));
  }
}

auto HDF5Writer::create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError> {
  auto fapl = H5Pcreate(H5P_FILE_ACCESS);
  if (fapl < 0) {
    return std::unexpected(OutputError("Failed to create file access property list"));
  }
  H5Pset_fclose_degree(fapl, H5F_CLOSE_STRONG);

  auto file_id = H5Fcreate(file_path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, fapl);
  H5Pclose(fapl);

  if (file_id < 0) {
    return std::unexpected(FileWriteError(file_path, "failed to create HDF5 file"));
  }

  try {
    return FileHandle(file_id);
  } catch (const std::exception& e) {
    H5Fclose(file_id);
    return std::unexpected(OutputError(e.what()));
  }
}

auto HDF5Writer::write_metadata(FileHandle& file, const simulation::SimulationSnapshot& snapshot,
                                const SnapshotMetadata& metadata) const -> std::expected<void, OutputError> {
  auto group_result = create_group(file, "metadata");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  if (auto result = write_string(group, "mantle_version", metadata.mantle_version); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_string(group, "case_name", metadata.case_name); !result) {
    return std::unexpected(result.error());
  }

  auto time_t = std::chrono::system_clock::to_time_t(metadata.creation_time);
  auto tm = *std::gmtime(&time_t);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  if (auto result = write_string(group, "creation_time", oss.str()); !result) {
    return std::unexpected(result.error());
  }

  if (auto result = write_scalar(group, "step", static_cast<double>(snapshot.step), "", "Completed time steps");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_scalar(group, "time", snapshot.time, "", "Model time"); !result) {
    return std::unexpected(result.error());
  }

  if (!metadata.step_result) {
    return {};
  }

  const auto& step = *metadata.step_result;
  auto diag_result = create_group(group, "diagnostics");
  if (!diag_result) {
    return std::unexpected(diag_result.error());
  }
  auto diagnostics = std::move(diag_result.value());

  const std::vector<std::pair<std::string, double>> values = {
      {"dt", step.dt},
      {"stokes_iterations", static_cast<double>(step.stokes.iterations)},
      {"stokes_residual", step.stokes.residual},
      {"stokes_converged", step.stokes.converged ? 1.0 : 0.0},
      {"thermal_iterations", static_cast<double>(step.thermal.iterations)},
      {"thermal_residual", step.thermal.residual},
      {"thermal_converged", step.thermal.converged ? 1.0 : 0.0},
      {"active_particles", static_cast<double>(step.active_particles)},
      {"deactivated_particles", static_cast<double>(step.deactivated_particles)},
      {"max_displacement", step.max_displacement},
      {"timestep_halvings", static_cast<double>(step.timestep_halvings)}};

  for (const auto& [name, value] : values) {
    if (auto result = write_scalar(diagnostics, name, value); !result) {
      return std::unexpected(result.error());
    }
  }
  return {};
}

auto HDF5Writer::write_mesh(FileHandle& file,
                            const simulation::SimulationSnapshot& snapshot) const -> std::expected<void, OutputError> {
  auto group_result = create_group(file, "mesh");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  const std::vector<int> resolution = {static_cast<int>(snapshot.element_resolution[0]),
                                       static_cast<int>(snapshot.element_resolution[1])};
  if (auto result = write_int_vector(group, "element_resolution", resolution, "Elements in x and y"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_table(group, "nodes", snapshot.node_coordinates, 2, "Node coordinates, row-major by node");
      !result) {
    return std::unexpected(result.error());
  }
  return {};
}

auto HDF5Writer::write_fields(FileHandle& file, const simulation::SimulationSnapshot& snapshot) const
    -> std::expected<void, OutputError> {
  auto nodal_result = create_group(file, "fields");
  if (!nodal_result) {
    return std::unexpected(nodal_result.error());
  }
  auto nodal = std::move(nodal_result.value());

  if (auto result = write_table(nodal, "velocity", snapshot.velocity, 2, "Nodal velocity (ux, uy)"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(nodal, "pressure", snapshot.pressure, "", "Nodal pressure, zero mean"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(nodal, "temperature", snapshot.temperature, "", "Nodal temperature"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(nodal, "viscosity", snapshot.nodal_viscosity, "", "Viscosity averaged to nodes");
      !result) {
    return std::unexpected(result.error());
  }

  auto element_result = create_group(file, "elements");
  if (!element_result) {
    return std::unexpected(element_result.error());
  }
  auto elements = std::move(element_result.value());

  if (auto result = write_vector(elements, "viscosity", snapshot.element_viscosity, "", "Effective element viscosity");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result =
          write_vector(elements, "strain_rate", snapshot.element_strain_rate, "", "Second strain-rate invariant");
      !result) {
    return std::unexpected(result.error());
  }
  return {};
}

auto HDF5Writer::write_swarm(FileHandle& file,
                             const simulation::SimulationSnapshot& snapshot) const -> std::expected<void, OutputError> {
  auto group_result = create_group(file, "swarm");
  if (!group_result) {
    return std::unexpected(group_result.error());
  }
  auto group = std::move(group_result.value());

  if (auto result = write_table(group, "positions", snapshot.particle_positions, 2, "Particle positions"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_int_vector(group, "material", snapshot.particle_materials, "Material index"); !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_int_vector(group, "active", snapshot.particle_active, "1 while inside the domain");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(group, "strain_rate", snapshot.particle_strain_rate, "",
                                 "Second strain-rate invariant of the last converged flow");
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = write_vector(group, "stress", snapshot.particle_stress, "", "Second stress invariant 2 eta edot");
      !result) {
    return std::unexpected(result.error());
  }
  return {};
}

auto HDF5Writer::create_group(hid_t parent, const std::string& name) const -> std::expected<GroupHandle, OutputError> {
  auto group_id = H5Gcreate2(parent, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (group_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create group '{}'", name)));
  }

  try {
    return GroupHandle(group_id);
  } catch (const std::exception& e) {
    H5Gclose(group_id);
    return std::unexpected(OutputError(e.what()));
  }
}

auto HDF5Writer::write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                              const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {
  if (data.empty()) {
    return {};
  }

  hsize_t dims = data.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_dataset_properties(1, &dims);
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  if (H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write data for '{}'", name)));
  }

  if (!units.empty()) {
    if (auto result = write_string(dataset, "units", units); !result) {
      return std::unexpected(result.error());
    }
  }
  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }
  return {};
}

auto HDF5Writer::write_table(hid_t parent, const std::string& name, const std::vector<double>& data,
                             std::size_t columns,
                             const std::string& description) const -> std::expected<void, OutputError> {
  if (data.empty()) {
    return {};
  }
  if (columns == 0 || data.size() % columns != 0) {
    return std::unexpected(
        OutputError(std::format("Dataset '{}' has {} values, not a multiple of {}", name, data.size(), columns)));
  }

  hsize_t dims[2] = {static_cast<hsize_t>(data.size() / columns), static_cast<hsize_t>(columns)};
  auto space_id = H5Screate_simple(2, dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for table '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_dataset_properties(2, dims);
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  // Snapshot arrays are already row-major
  if (H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write table data for '{}'", name)));
  }

  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }
  return {};
}

auto HDF5Writer::write_int_vector(hid_t parent, const std::string& name, const std::vector<int>& data,
                                  const std::string& description) const -> std::expected<void, OutputError> {
  if (data.empty()) {
    return {};
  }

  hsize_t dims = data.size();
  auto space_id = H5Screate_simple(1, &dims, nullptr);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto prop_result = create_dataset_properties(1, &dims);
  if (!prop_result) {
    return std::unexpected(prop_result.error());
  }
  auto props = std::move(prop_result.value());

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_INT, space, H5P_DEFAULT, props, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  if (H5Dwrite(dataset, H5T_NATIVE_INT, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write data for '{}'", name)));
  }

  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }
  return {};
}

auto HDF5Writer::write_scalar(hid_t parent, const std::string& name, double value, const std::string& units,
                              const std::string& description) const -> std::expected<void, OutputError> {
  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataspace for '{}'", name)));
  }
  DataspaceHandle space(space_id);

  auto dataset_id = H5Dcreate2(parent, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (dataset_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create scalar dataset '{}'", name)));
  }
  DatasetHandle dataset(dataset_id);

  if (H5Dwrite(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, &value) < 0) {
    return std::unexpected(OutputError(std::format("Failed to write scalar value for '{}'", name)));
  }

  if (!units.empty()) {
    if (auto result = write_string(dataset, "units", units); !result) {
      return std::unexpected(result.error());
    }
  }
  if (!description.empty()) {
    if (auto result = write_string(dataset, "description", description); !result) {
      return std::unexpected(result.error());
    }
  }
  return {};
}

auto HDF5Writer::write_string(hid_t parent, const std::string& name,
                              const std::string& value) const -> std::expected<void, OutputError> {
  auto str_type = H5Tcopy(H5T_C_S1);
  if (str_type < 0) {
    return std::unexpected(OutputError("Failed to create string type"));
  }
  TypeHandle string_type(str_type);
  // Zero-sized string types are rejected by HDF5
  H5Tset_size(string_type, std::max<std::size_t>(value.length(), 1));
  H5Tset_strpad(string_type, H5T_STR_NULLTERM);

  auto space_id = H5Screate(H5S_SCALAR);
  if (space_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create dataspace for string '{}'", name)));
  }
  DataspaceHandle space(space_id);

  const H5I_type_t obj_type = H5Iget_type(parent);
  if (obj_type != H5I_DATASET && obj_type != H5I_GROUP) {
    return std::unexpected(OutputError(std::format("String attribute '{}' needs a group or dataset", name)));
  }

  auto attr_id = H5Acreate2(parent, name.c_str(), string_type, space, H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to create string attribute '{}'", name)));
  }
  std::string buffer = value.empty() ? std::string(1, '\0') : value;
  auto status = H5Awrite(attr_id, string_type, buffer.c_str());
  H5Aclose(attr_id);
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to write string attribute '{}'", name)));
  }
  return {};
}

auto HDF5Writer::create_dataset_properties(std::size_t rank, const hsize_t* dims) const
    -> std::expected<PropertyHandle, OutputError> {
  auto plist_id = H5Pcreate(H5P_DATASET_CREATE);
  if (plist_id < 0) {
    return std::unexpected(OutputError("Failed to create dataset property list"));
  }
  PropertyHandle props(plist_id);

  // Filters need a chunked layout
  if (!hdf5_config_.use_chunking || hdf5_config_.compression_level <= 0) {
    return props;
  }

  // Chunk extents must not exceed the data extents
  std::vector<hsize_t> chunk_dims(rank);
  for (std::size_t d = 0; d < rank; ++d) {
    chunk_dims[d] = std::max<hsize_t>(std::min<hsize_t>(dims[d], hdf5_config_.chunk_size), 1);
  }
  if (H5Pset_chunk(props, static_cast<int>(rank), chunk_dims.data()) < 0) {
    return std::unexpected(OutputError("Failed to set chunking"));
  }

  if (hdf5_config_.use_shuffle_filter) {
    H5Pset_shuffle(props);
  }
  H5Pset_deflate(props, static_cast<unsigned>(hdf5_config_.compression_level));
  if (hdf5_config_.use_fletcher32) {
    H5Pset_fletcher32(props);
  }
  return props;
}

// HDF5Reader implementation
HDF5Reader::HDF5Reader(const std::filesystem::path& file_path)
    : file_(H5Fopen(file_path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT)) {}

auto HDF5Reader::has_object(const std::string& path) const -> bool {
  // H5Lexists fails on missing intermediate groups, so walk the path one link at a time
  std::string prefix;
  std::istringstream stream(path);
  std::string part;
  while (std::getline(stream, part, '/')) {
    if (part.empty()) {
      continue;
    }
    prefix += prefix.empty() ? part : "/" + part;
    if (H5Lexists(file_, prefix.c_str(), H5P_DEFAULT) <= 0) {
      return false;
    }
  }
  return !prefix.empty();
}

auto HDF5Reader::read_vector(const std::string& dataset_path) const -> std::expected<std::vector<double>, OutputError> {
  if (!has_object(dataset_path)) {
    return std::unexpected(OutputError(std::format("Dataset '{}' not found", dataset_path)));
  }
  DatasetHandle dataset(H5Dopen2(file_, dataset_path.c_str(), H5P_DEFAULT));
  DataspaceHandle space(H5Dget_space(dataset));

  const auto count = H5Sget_simple_extent_npoints(space);
  if (count < 0) {
    return std::unexpected(OutputError(std::format("Failed to query size of '{}'", dataset_path)));
  }
  std::vector<double> data(static_cast<std::size_t>(count));
  if (count > 0 && H5Dread(dataset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to read '{}'", dataset_path)));
  }
  return data;
}

auto HDF5Reader::read_int_vector(const std::string& dataset_path) const -> std::expected<std::vector<int>, OutputError> {
  if (!has_object(dataset_path)) {
    return std::unexpected(OutputError(std::format("Dataset '{}' not found", dataset_path)));
  }
  DatasetHandle dataset(H5Dopen2(file_, dataset_path.c_str(), H5P_DEFAULT));
  DataspaceHandle space(H5Dget_space(dataset));

  const auto count = H5Sget_simple_extent_npoints(space);
  if (count < 0) {
    return std::unexpected(OutputError(std::format("Failed to query size of '{}'", dataset_path)));
  }
  std::vector<int> data(static_cast<std::size_t>(count));
  if (count > 0 && H5Dread(dataset, H5T_NATIVE_INT, H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data()) < 0) {
    return std::unexpected(OutputError(std::format("Failed to read '{}'", dataset_path)));
  }
  return data;
}

auto HDF5Reader::read_scalar(const std::string& dataset_path) const -> std::expected<double, OutputError> {
  auto values = read_vector(dataset_path);
  if (!values) {
    return std::unexpected(values.error());
  }
  if (values->size() != 1) {
    return std::unexpected(OutputError(std::format("Dataset '{}' is not a scalar", dataset_path)));
  }
  return values->front();
}

auto HDF5Reader::read_string_attribute(const std::string& object_path, const std::string& name) const
    -> std::expected<std::string, OutputError> {
  if (!has_object(object_path) || H5Aexists_by_name(file_, object_path.c_str(), name.c_str(), H5P_DEFAULT) <= 0) {
    return std::unexpected(OutputError(std::format("Attribute '{}' not found on '{}'", name, object_path)));
  }

  auto attr_id = H5Aopen_by_name(file_, object_path.c_str(), name.c_str(), H5P_DEFAULT, H5P_DEFAULT);
  if (attr_id < 0) {
    return std::unexpected(OutputError(std::format("Failed to open attribute '{}'", name)));
  }
  TypeHandle type(H5Aget_type(attr_id));
  const auto size = H5Tget_size(type);

  std::vector<char> buffer(size + 1, '\0');
  auto status = H5Aread(attr_id, type, buffer.data());
  H5Aclose(attr_id);
  if (status < 0) {
    return std::unexpected(OutputError(std::format("Failed to read attribute '{}'", name)));
  }
  return std::string(buffer.data());
}

namespace hdf5 {

auto initialize() -> std::expected<void, OutputError> {
  if (H5open() < 0) {
    return std::unexpected(OutputError("Failed to initialize HDF5 library"));
  }
  return {};
}

auto finalize() -> void { H5close(); }

auto check_version() -> std::expected<std::string, OutputError> {
  unsigned majnum, minnum, relnum;
  if (H5get_libversion(&majnum, &minnum, &relnum) < 0) {
    return std::unexpected(OutputError("Failed to get HDF5 version"));
  }
  return std::format("{}.{}.{}", majnum, minnum, relnum);
}

auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError> {
  if (!std::filesystem::exists(file_path)) {
    return std::unexpected(OutputError(std::format("File does not exist: {}", file_path.string())));
  }
  if (H5Fis_hdf5(file_path.c_str()) <= 0) {
    return std::unexpected(OutputError(std::format("Not a valid HDF5 file: {}", file_path.string())));
  }
  return {};
}

} // namespace hdf5

} // namespace mantle::io::output
