#include "mantle/core/output_manager.hpp"
#include "mantle/core/constants.hpp"
#include <chrono>
#include <format>
#include <iomanip>
#include <iostream>
#include <system_error>

namespace mantle::core {

auto OutputManager::initialize_output_system(const io::Configuration& config, const std::string& case_name)
    -> std::expected<void, ApplicationError> {
  output_config_ = config.output;
  case_name_ = case_name;

  if (!output_config_.enabled) {
    std::cout << "\nOutput disabled" << std::endl;
    return {};
  }

  std::cout << "\nInitializing output system..." << std::endl;

  if (auto hdf5_init = initialize_hdf5(); !hdf5_init) {
    return std::unexpected(hdf5_init.error());
  }

  std::error_code ec;
  std::filesystem::create_directories(output_config_.output_directory, ec);
  if (ec) {
    return std::unexpected(ApplicationError{std::format("Cannot create output directory '{}': {}",
                                                        output_config_.output_directory, ec.message()),
                                            constants::exit_codes::failure});
  }

  io::output::HDF5Config hdf5_config;
  hdf5_config.compression_level = output_config_.compression_level;
  writer_.set_hdf5_config(hdf5_config);
  initialized_ = true;

  std::cout << constants::string_processing::colors::green << "✓ Output system configured"
            << constants::string_processing::colors::reset << std::endl;
  std::cout << "  Snapshots: " << snapshot_path(0).parent_path().string() << " (every " << output_config_.interval
            << " steps)" << std::endl;

  return {};
}

auto OutputManager::should_write(std::size_t step) const noexcept -> bool {
  return initialized_ && output_config_.interval > 0 && step % output_config_.interval == 0;
}

auto OutputManager::snapshot_path(std::size_t step) const -> std::filesystem::path {
  return std::filesystem::path(output_config_.output_directory) /
         std::format("{}_step_{:06d}{}", case_name_, step, writer_.get_extension());
}

auto OutputManager::write_snapshot(const simulation::Simulation& simulation,
                                   const std::optional<simulation::StepResult>& step_result,
                                   PerformanceMetrics& metrics) -> std::expected<std::filesystem::path, ApplicationError> {
  if (!initialized_) {
    return std::unexpected(ApplicationError{"Output system not initialized", constants::exit_codes::failure});
  }

  const auto output_start = std::chrono::high_resolution_clock::now();

  io::output::SnapshotMetadata metadata;
  metadata.case_name = case_name_;
  metadata.creation_time = std::chrono::system_clock::now();
  metadata.step_result = step_result;

  const auto path = snapshot_path(simulation.step_index());
  auto result = writer_.write_snapshot(path, simulation.snapshot(), metadata,
                                       io::output::SnapshotOptions{.write_swarm = output_config_.write_swarm});

  const auto output_end = std::chrono::high_resolution_clock::now();
  metrics.output_time += std::chrono::duration_cast<std::chrono::milliseconds>(output_end - output_start);

  if (!result) {
    return std::unexpected(
        ApplicationError{"Failed to write output: " + result.error().message(), constants::exit_codes::failure});
  }

  metrics.output_files.push_back(path);
  return path;
}

auto OutputManager::display_output_summary(const PerformanceMetrics& metrics) const -> void {
  if (metrics.output_files.empty()) {
    return;
  }

  std::cout << "\nGenerated files: " << metrics.output_files.size() << std::endl;
  std::uintmax_t total_size = 0;
  for (const auto& file_path : metrics.output_files) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(file_path, ec);
    if (!ec) {
      total_size += size;
    }
  }
  std::cout << "  Last: " << metrics.output_files.back().filename().string() << std::endl;
  std::cout << "  Total size: " << std::setprecision(constants::string_processing::float_precision_2) << std::fixed
            << (static_cast<double>(total_size) / constants::io::bytes_to_kb) << " KB" << std::endl;
  std::cout << "  Output time: " << metrics.output_time.count() << " ms" << std::endl;
}

auto OutputManager::initialize_hdf5() -> std::expected<void, ApplicationError> {
  if (auto hdf5_init = io::output::hdf5::initialize(); !hdf5_init) {
    return std::unexpected(ApplicationError{"Failed to initialize HDF5: " + hdf5_init.error().message(),
                                            constants::exit_codes::failure});
  }
  if (auto version = io::output::hdf5::check_version()) {
    std::cout << constants::string_processing::colors::green
              << "✓ HDF5 library version: " << constants::string_processing::colors::reset << version.value()
              << std::endl;
  }
  return {};
}

} // namespace mantle::core
