#pragma once
#include "../../core/exceptions.hpp"
#include "../../simulation/simulation_types.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace mantle::io::output {

// Descriptive data stored next to the fields of a snapshot file
struct SnapshotMetadata {
  std::string mantle_version = "1.0.0";
  std::string case_name = "simulation";
  std::chrono::system_clock::time_point creation_time = std::chrono::system_clock::now();
  std::optional<simulation::StepResult> step_result; // absent for the initial state
};

struct SnapshotOptions {
  bool write_swarm = true;
};

class OutputError : public core::MantleException {
public:
  explicit OutputError(std::string_view message, std::source_location location = std::source_location::current())
      : MantleException(std::format("Output Error: {}", message), location) {}
};

class FileWriteError : public OutputError {
private:
  std::filesystem::path file_path_;

public:
  explicit FileWriteError(const std::filesystem::path& path, std::string_view message,
                          std::source_location location = std::source_location::current())
      : OutputError(std::format("File '{}': {}", path.string(), message), location), file_path_(path) {}

  [[nodiscard]] auto file_path() const noexcept -> const std::filesystem::path& { return file_path_; }
};

} // namespace mantle::io::output
