#pragma once
#include "../io/config_types.hpp"
#include "../simulation/simulation.hpp"
#include "application_types.hpp"
#include "output_manager.hpp"
#include <expected>
#include <vector>

namespace mantle::core {

class SimulationRunner {
public:
  struct RunSummary {
    std::vector<simulation::StepResult> steps;
    double final_time = 0.0;
    std::size_t active_particles = 0;
  };

  // Advances the model by the configured step count or to the configured end time,
  // writing snapshots through the output manager as it goes
  [[nodiscard]] auto run_simulation(simulation::Simulation& simulation, const io::Configuration& config,
                                    OutputManager& output_manager,
                                    PerformanceMetrics& metrics) -> std::expected<RunSummary, ApplicationError>;

  auto display_simulation_results(const RunSummary& summary, const PerformanceMetrics& metrics) const -> void;

private:
  [[nodiscard]] auto record_step(const simulation::Simulation& simulation, const simulation::StepResult& result,
                                 OutputManager& output_manager, RunSummary& summary,
                                 PerformanceMetrics& metrics) -> std::expected<void, ApplicationError>;

  auto display_step(const simulation::StepResult& result) const -> void;
};

} // namespace mantle::core
