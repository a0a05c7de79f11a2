#pragma once
#include "../../core/constants.hpp"
#include "output_types.hpp"
#include <expected>
#include <filesystem>
#include <hdf5.h>
#include <string>
#include <vector>

namespace mantle::io::output {

struct HDF5Config {
  int compression_level = constants::io::default_hdf5_compression; // 0-9, 0 disables deflate
  bool use_chunking = true;
  bool use_shuffle_filter = true;
  bool use_fletcher32 = false;
  std::size_t chunk_size = constants::io::default_hdf5_chunk_size;
};

// RAII wrapper for HDF5 handles
template <typename HandleType, auto CloseFunc> class HDF5Handle {
private:
  HandleType handle_;

public:
  explicit HDF5Handle(HandleType handle) : handle_(handle) {
    if (handle_ < 0) {
      throw OutputError("Invalid HDF5 handle");
    }
  }

  ~HDF5Handle() {
    if (handle_ >= 0) {
      CloseFunc(handle_);
    }
  }

  HDF5Handle(HDF5Handle&& other) noexcept : handle_(other.handle_) { other.handle_ = -1; }

  HDF5Handle& operator=(HDF5Handle&& other) noexcept {
    if (this != &other) {
      if (handle_ >= 0) {
        CloseFunc(handle_);
      }
      handle_ = other.handle_;
      other.handle_ = -1;
    }
    return *this;
  }

  HDF5Handle(const HDF5Handle&) = delete;
  HDF5Handle& operator=(const HDF5Handle&) = delete;

  [[nodiscard]] auto get() const noexcept -> HandleType { return handle_; }
  [[nodiscard]] auto valid() const noexcept -> bool { return handle_ >= 0; }

  operator HandleType() const noexcept { return handle_; }
};

using FileHandle = HDF5Handle<hid_t, H5Fclose>;
using GroupHandle = HDF5Handle<hid_t, H5Gclose>;
using DatasetHandle = HDF5Handle<hid_t, H5Dclose>;
using DataspaceHandle = HDF5Handle<hid_t, H5Sclose>;
using PropertyHandle = HDF5Handle<hid_t, H5Pclose>;
using TypeHandle = HDF5Handle<hid_t, H5Tclose>;

/**
 * @brief Writes one model state per file
 *
 * Layout: /metadata (attributes and step diagnostics), /mesh, /fields (nodal), /elements
 * (per-element) and optionally /swarm. Interleaved vector data is stored as an N x 2 dataset.
 */
class HDF5Writer {
private:
  HDF5Config hdf5_config_;

  [[nodiscard]] auto
  create_file(const std::filesystem::path& file_path) const -> std::expected<FileHandle, OutputError>;

  [[nodiscard]] auto write_metadata(FileHandle& file, const simulation::SimulationSnapshot& snapshot,
                                    const SnapshotMetadata& metadata) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_mesh(FileHandle& file,
                                const simulation::SimulationSnapshot& snapshot) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_fields(FileHandle& file, const simulation::SimulationSnapshot& snapshot) const
      -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_swarm(FileHandle& file,
                                 const simulation::SimulationSnapshot& snapshot) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto create_group(hid_t parent,
                                  const std::string& name) const -> std::expected<GroupHandle, OutputError>;

  [[nodiscard]] auto write_vector(hid_t parent, const std::string& name, const std::vector<double>& data,
                                  const std::string& units = "",
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  // Row-major data with `columns` entries per row
  [[nodiscard]] auto write_table(hid_t parent, const std::string& name, const std::vector<double>& data,
                                 std::size_t columns,
                                 const std::string& description = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_int_vector(hid_t parent, const std::string& name, const std::vector<int>& data,
                                      const std::string& description = "") const -> std::expected<void, OutputError>;

  [[nodiscard]] auto write_scalar(hid_t parent, const std::string& name, double value, const std::string& units = "",
                                  const std::string& description = "") const -> std::expected<void, OutputError>;

  // String attribute on a group or dataset
  [[nodiscard]] auto write_string(hid_t parent, const std::string& name,
                                  const std::string& value) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto create_dataset_properties(std::size_t rank, const hsize_t* dims) const
      -> std::expected<PropertyHandle, OutputError>;

public:
  explicit HDF5Writer(HDF5Config config = {}) : hdf5_config_(config) {}

  [[nodiscard]] auto write_snapshot(const std::filesystem::path& file_path,
                                    const simulation::SimulationSnapshot& snapshot, const SnapshotMetadata& metadata,
                                    SnapshotOptions options = {}) const -> std::expected<void, OutputError>;

  [[nodiscard]] auto get_extension() const noexcept -> std::string_view { return ".h5"; }

  auto set_hdf5_config(HDF5Config config) noexcept -> void { hdf5_config_ = config; }

  [[nodiscard]] auto get_hdf5_config() const noexcept -> const HDF5Config& { return hdf5_config_; }
};

// Read-back of datasets written by HDF5Writer, used for post-processing and restarts
class HDF5Reader {
private:
  FileHandle file_;

public:
  explicit HDF5Reader(const std::filesystem::path& file_path);

  // Flattened contents of a double dataset, e.g. "fields/temperature"
  [[nodiscard]] auto read_vector(const std::string& dataset_path) const -> std::expected<std::vector<double>, OutputError>;

  [[nodiscard]] auto read_int_vector(const std::string& dataset_path) const
      -> std::expected<std::vector<int>, OutputError>;

  [[nodiscard]] auto read_scalar(const std::string& dataset_path) const -> std::expected<double, OutputError>;

  [[nodiscard]] auto read_string_attribute(const std::string& object_path, const std::string& name) const
      -> std::expected<std::string, OutputError>;

  [[nodiscard]] auto has_object(const std::string& path) const -> bool;
};

namespace hdf5 {

// Call once at program start
auto initialize() -> std::expected<void, OutputError>;

auto finalize() -> void;

[[nodiscard]] auto check_version() -> std::expected<std::string, OutputError>;

[[nodiscard]] auto validate_file(const std::filesystem::path& file_path) -> std::expected<void, OutputError>;

} // namespace hdf5

} // namespace mantle::io::output
