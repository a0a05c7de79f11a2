#include "mantle/core/application_runner.hpp"
#include "mantle/core/constants.hpp"
#include "mantle/io/output/hdf5_writer.hpp"
#include "mantle/materials/rheology.hpp"
#include <chrono>
#include <format>
#include <iostream>
#include <string_view>
#include <vector>

namespace mantle::core {

ApplicationRunner::ApplicationRunner()
    : config_loader_(std::make_unique<ConfigurationLoader>()), output_manager_(std::make_unique<OutputManager>()),
      simulation_runner_(std::make_unique<SimulationRunner>()) {}

ApplicationRunner::~ApplicationRunner() = default;

auto ApplicationRunner::run(int argc, char* argv[]) -> ApplicationResult {
  using clock = std::chrono::steady_clock;
  const auto start_time = clock::now();
  PerformanceMetrics metrics;

  try {
    auto args_result = parse_command_line(argc, argv);
    if (!args_result) {
      display_usage(argc > 0 ? argv[0] : "mantle");
      return handle_error(args_result.error());
    }
    const auto args = args_result.value();

    if (args.help_requested) {
      display_usage(argv[0]);
      return {true, constants::exit_codes::success, "Help displayed"};
    }

    std::cout << "=== Mantle Convection Solver ===" << std::endl;
    std::cout << "Loading configuration from: " << args.config_file << std::endl;

    auto config_result = config_loader_->load_configuration(args.config_file);
    if (!config_result) {
      return handle_error(config_result.error());
    }
    const auto config = std::move(config_result.value());

    auto simulation_result = build_model(config);
    if (!simulation_result) {
      return handle_error(simulation_result.error());
    }
    auto simulation = std::move(simulation_result.value());
    metrics.setup_time = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start_time);
    display_model_summary(simulation, config);

    if (args.check_only) {
      std::cout << "\nConfiguration check passed, no time steps taken." << std::endl;
      return {true, constants::exit_codes::success, "Configuration valid"};
    }

    if (auto output_init = output_manager_->initialize_output_system(config, args.case_name); !output_init) {
      return handle_error(output_init.error());
    }

    auto run_result = simulation_runner_->run_simulation(simulation, config, *output_manager_, metrics);
    if (!run_result) {
      return handle_error(run_result.error());
    }

    metrics.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start_time);

    simulation_runner_->display_simulation_results(run_result.value(), metrics);
    output_manager_->display_output_summary(metrics);
    display_performance_summary(metrics);

    io::output::hdf5::finalize();
    std::cout << "\n=== RUN COMPLETED ===" << std::endl;
    return {true, constants::exit_codes::success, "Success"};

  } catch (const std::exception& e) {
    return handle_error(
        ApplicationError{"Unexpected error: " + std::string(e.what()), constants::exit_codes::failure});
  }
}

auto ApplicationRunner::parse_command_line(int argc, char* argv[]) -> std::expected<CommandLineArgs, ApplicationError> {
  CommandLineArgs args;
  std::vector<std::string_view> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      args.help_requested = true;
      return args;
    }
    if (arg == "--check") {
      args.check_only = true;
    } else if (arg.starts_with("-")) {
      return std::unexpected(ApplicationError{std::format("Unknown option '{}'", arg), constants::exit_codes::failure});
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty() || positional.size() > 2) {
    return std::unexpected(ApplicationError{"Expected a configuration file and an optional case name",
                                            constants::exit_codes::failure});
  }

  args.config_file = std::string(positional[0]);
  if (positional.size() == 2) {
    args.case_name = std::string(positional[1]);
  }
  return args;
}

auto ApplicationRunner::build_model(const io::Configuration& config)
    -> std::expected<simulation::Simulation, ApplicationError> {
  std::cout << "\nInitializing model..." << std::endl;
  auto simulation = simulation::Simulation::initialize(config.setup);
  if (!simulation) {
    return std::unexpected(ApplicationError{"Failed to initialize model: " + simulation.error().message(),
                                            constants::exit_codes::failure});
  }
  return std::move(simulation.value());
}

auto ApplicationRunner::display_usage(const std::string& program_name) const -> void {
  std::cerr << "Usage: " << program_name << " [--check] <config_file.yaml> [case_name]\n"
            << "  --check   load the configuration and build the model without stepping\n";
}

auto ApplicationRunner::display_model_summary(const simulation::Simulation& simulation,
                                              const io::Configuration& config) const -> void {
  const auto& mesh = simulation.mesh();
  const auto& layout = config.setup.mesh;

  std::cout << std::format("  Mesh: {} x {} elements over [{}, {}] x [{}, {}] ({} nodes)", layout.resolution[0],
                           layout.resolution[1], layout.min.x(), layout.max.x(), layout.min.y(), layout.max.y(),
                           mesh.node_count())
            << std::endl;
  std::cout << std::format("  Particles: {}", simulation.swarm().size()) << std::endl;
  std::cout << "  Materials:" << std::endl;
  for (const auto& material : simulation.materials()) {
    std::cout << std::format("    - {:<16} rho0={:<10.4g} {}", material.name, material.density,
                             materials::rheology_name(material.rheology))
              << std::endl;
  }
  std::cout << std::format("  Diffusivity: {:.4g}  gravity: ({:.4g}, {:.4g})", config.setup.diffusivity,
                           config.setup.gravity.x(), config.setup.gravity.y())
            << std::endl;
}

auto ApplicationRunner::display_performance_summary(const PerformanceMetrics& metrics) const -> void {
  std::cout << "\n=== PERFORMANCE SUMMARY ===" << std::endl;
  std::cout << "Total runtime: " << metrics.total_time.count() << " ms" << std::endl;
  if (metrics.total_time.count() <= 0) {
    return;
  }

  const auto share = [&](std::chrono::milliseconds part) {
    return 100.0 * static_cast<double>(part.count()) / static_cast<double>(metrics.total_time.count());
  };
  std::cout << std::format("  Set-up: {} ms ({:.1f}%)", metrics.setup_time.count(), share(metrics.setup_time))
            << std::endl;
  std::cout << std::format("  Solution: {} ms ({:.1f}%)", metrics.solve_time.count(), share(metrics.solve_time))
            << std::endl;
  std::cout << std::format("  Output: {} ms ({:.1f}%)", metrics.output_time.count(), share(metrics.output_time))
            << std::endl;
}

auto ApplicationRunner::handle_error(const ApplicationError& error) -> ApplicationResult {
  std::cerr << "Error: " << error.message << std::endl;
  io::output::hdf5::finalize();
  return {false, error.exit_code, error.message};
}

} // namespace mantle::core
