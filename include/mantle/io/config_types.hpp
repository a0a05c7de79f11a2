#pragma once
#include "../core/constants.hpp"
#include "../simulation/simulation_types.hpp"
#include <optional>
#include <string>

namespace mantle::io {

// Exactly one of steps / end_time is set after parsing
struct RunConfig {
  std::optional<std::size_t> steps;
  std::optional<double> end_time;
};

struct OutputConfig {
  bool enabled = true;
  std::string output_directory = constants::io::default_output_directory;
  std::size_t interval = 1; // write every n-th step
  bool write_swarm = true;
  int compression_level = constants::io::default_hdf5_compression;
};

struct Configuration {
  simulation::SimulationSetup setup{};
  RunConfig run{};
  OutputConfig output{};
};

} // namespace mantle::io
