#include "mantle/core/simulation_runner.hpp"
#include "mantle/core/constants.hpp"
#include <chrono>
#include <format>
#include <iomanip>
#include <iostream>

namespace mantle::core {

auto SimulationRunner::run_simulation(simulation::Simulation& simulation, const io::Configuration& config,
                                      OutputManager& output_manager,
                                      PerformanceMetrics& metrics) -> std::expected<RunSummary, ApplicationError> {
  std::cout << "\n=== STARTING TIME INTEGRATION ===" << std::endl;

  RunSummary summary;
  summary.active_particles = simulation.swarm().active_count();

  if (output_manager.should_write(simulation.step_index())) {
    if (auto written = output_manager.write_snapshot(simulation, std::nullopt, metrics); !written) {
      return std::unexpected(written.error());
    }
  }

  const auto output_before = metrics.output_time;
  const auto solve_start = std::chrono::high_resolution_clock::now();

  if (config.run.steps) {
    for (std::size_t i = 0; i < *config.run.steps; ++i) {
      auto result = simulation.step();
      if (!result) {
        return std::unexpected(
            ApplicationError{"Simulation failed: " + result.error().full_message(), constants::exit_codes::failure});
      }
      if (auto recorded = record_step(simulation, result.value(), output_manager, summary, metrics); !recorded) {
        return std::unexpected(recorded.error());
      }
    }
  } else if (config.run.end_time) {
    const double end_time = *config.run.end_time;
    while (simulation.time() < end_time) {
      auto result = simulation.step_toward(end_time);
      if (!result) {
        return std::unexpected(
            ApplicationError{"Simulation failed: " + result.error().full_message(), constants::exit_codes::failure});
      }
      if (auto recorded = record_step(simulation, result.value(), output_manager, summary, metrics); !recorded) {
        return std::unexpected(recorded.error());
      }
    }
  } else {
    return std::unexpected(ApplicationError{"Run section names neither steps nor end_time",
                                            constants::exit_codes::failure});
  }

  const auto solve_end = std::chrono::high_resolution_clock::now();
  // Output time is accounted separately
  metrics.solve_time = std::chrono::duration_cast<std::chrono::milliseconds>(solve_end - solve_start) -
                       (metrics.output_time - output_before);

  // The final state is always on disk, even off the output interval
  if (!summary.steps.empty() && !output_manager.should_write(simulation.step_index()) &&
      config.output.enabled) {
    if (auto written = output_manager.write_snapshot(simulation, summary.steps.back(), metrics); !written) {
      return std::unexpected(written.error());
    }
  }

  summary.final_time = simulation.time();
  std::cout << constants::string_processing::colors::green << "✓ Time integration completed"
            << constants::string_processing::colors::reset << std::endl;
  return summary;
}

auto SimulationRunner::record_step(const simulation::Simulation& simulation, const simulation::StepResult& result,
                                   OutputManager& output_manager, RunSummary& summary,
                                   PerformanceMetrics& metrics) -> std::expected<void, ApplicationError> {
  summary.steps.push_back(result);
  summary.active_particles = result.active_particles;
  metrics.steps_taken = summary.steps.size();
  display_step(result);

  if (output_manager.should_write(result.step)) {
    if (auto written = output_manager.write_snapshot(simulation, result, metrics); !written) {
      return std::unexpected(written.error());
    }
  }
  return {};
}

auto SimulationRunner::display_step(const simulation::StepResult& result) const -> void {
  std::cout << std::format("[STEP {:5}] t = {:.6e}  dt = {:.3e}  picard = {:3} ({:.2e})  thermal = {:3}  "
                           "particles = {}",
                           result.step, result.time, result.dt, result.stokes.iterations, result.stokes.residual,
                           result.thermal.iterations, result.active_particles);
  if (result.deactivated_particles > 0) {
    std::cout << std::format("  (-{} left domain)", result.deactivated_particles);
  }
  if (result.timestep_halvings > 0) {
    std::cout << std::format("  [dt halved {}x]", result.timestep_halvings);
  }
  std::cout << std::endl;
}

auto SimulationRunner::display_simulation_results(const RunSummary& summary,
                                                  const PerformanceMetrics& metrics) const -> void {
  std::cout << "\n=== RUN SUMMARY ===" << std::endl;
  std::cout << "Steps taken: " << summary.steps.size() << std::endl;
  std::cout << "Final time: " << std::scientific << std::setprecision(constants::string_processing::float_precision_4)
            << summary.final_time << std::defaultfloat << std::endl;
  std::cout << "Active particles: " << summary.active_particles << std::endl;

  if (!summary.steps.empty()) {
    int total_picard = 0;
    for (const auto& step : summary.steps) {
      total_picard += step.stokes.iterations;
    }
    std::cout << "Picard iterations: " << total_picard << " (mean "
              << std::setprecision(constants::string_processing::float_precision_2) << std::fixed
              << static_cast<double>(total_picard) / static_cast<double>(summary.steps.size()) << ")"
              << std::defaultfloat << std::endl;
  }
  std::cout << "Solve time: " << metrics.solve_time.count() << " ms" << std::endl;
}

} // namespace mantle::core
