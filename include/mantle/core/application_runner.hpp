#pragma once
#include "../io/config_types.hpp"
#include "../simulation/simulation.hpp"
#include "application_types.hpp"
#include "configuration_loader.hpp"
#include "output_manager.hpp"
#include "simulation_runner.hpp"
#include <expected>
#include <memory>
#include <string>

namespace mantle::core {

/**
 * @brief Command-line front end: configuration, model set-up, time loop and snapshot output
 *
 * Every failure is turned into an ApplicationResult carrying the process exit code.
 */
class ApplicationRunner {
public:
  ApplicationRunner();
  ~ApplicationRunner();

  [[nodiscard]] auto run(int argc, char* argv[]) -> ApplicationResult;

private:
  std::unique_ptr<ConfigurationLoader> config_loader_;
  std::unique_ptr<OutputManager> output_manager_;
  std::unique_ptr<SimulationRunner> simulation_runner_;

  [[nodiscard]] static auto
  parse_command_line(int argc, char* argv[]) -> std::expected<CommandLineArgs, ApplicationError>;

  [[nodiscard]] static auto
  build_model(const io::Configuration& config) -> std::expected<simulation::Simulation, ApplicationError>;

  auto display_usage(const std::string& program_name) const -> void;
  auto display_model_summary(const simulation::Simulation& simulation, const io::Configuration& config) const -> void;
  auto display_performance_summary(const PerformanceMetrics& metrics) const -> void;

  auto handle_error(const ApplicationError& error) -> ApplicationResult;
};

} // namespace mantle::core
