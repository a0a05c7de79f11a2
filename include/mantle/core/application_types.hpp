#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace mantle::core {

struct ApplicationError {
  std::string message;
  int exit_code;
};

struct ApplicationResult {
  bool success;
  int exit_code;
  std::string message;
};

// mantle [--check] <config.yaml> [case_name]
struct CommandLineArgs {
  std::string config_file;
  std::string case_name = "simulation";
  bool help_requested = false;
  bool check_only = false; // load and initialise the model, then stop
};

struct PerformanceMetrics {
  std::chrono::milliseconds total_time{0};
  std::chrono::milliseconds setup_time{0};
  std::chrono::milliseconds solve_time{0};
  std::chrono::milliseconds output_time{0};
  std::size_t steps_taken = 0;
  std::vector<std::filesystem::path> output_files;
};

} // namespace mantle::core
