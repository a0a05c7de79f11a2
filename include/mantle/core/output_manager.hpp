#pragma once
#include "../io/config_types.hpp"
#include "../io/output/hdf5_writer.hpp"
#include "../simulation/simulation.hpp"
#include "application_types.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace mantle::core {

// Writes one HDF5 snapshot per output interval into the configured directory
class OutputManager {
public:
  [[nodiscard]] auto initialize_output_system(const io::Configuration& config, const std::string& case_name)
      -> std::expected<void, ApplicationError>;

  // True when the given completed step falls on the output interval
  [[nodiscard]] auto should_write(std::size_t step) const noexcept -> bool;

  [[nodiscard]] auto write_snapshot(const simulation::Simulation& simulation,
                                    const std::optional<simulation::StepResult>& step_result,
                                    PerformanceMetrics& metrics) -> std::expected<std::filesystem::path, ApplicationError>;

  [[nodiscard]] auto snapshot_path(std::size_t step) const -> std::filesystem::path;

  auto display_output_summary(const PerformanceMetrics& metrics) const -> void;

private:
  io::OutputConfig output_config_{};
  std::string case_name_ = "simulation";
  io::output::HDF5Writer writer_{};
  bool initialized_ = false;

  [[nodiscard]] auto initialize_hdf5() -> std::expected<void, ApplicationError>;
};

} // namespace mantle::core
