#include "mantle/core/configuration_loader.hpp"
#include "mantle/core/constants.hpp"
#include "mantle/io/config_manager.hpp"
#include "mantle/materials/rheology.hpp"
#include <format>
#include <iomanip>
#include <iostream>

namespace mantle::core {

auto ConfigurationLoader::load_configuration(const std::string& config_file)
    -> std::expected<io::Configuration, ApplicationError> {

  io::ConfigurationManager config_manager;
  auto config_result = config_manager.load(config_file);

  if (!config_result) {
    return std::unexpected(
        ApplicationError{"Failed to load config: " + config_result.error().message(), constants::exit_codes::failure});
  }

  std::cout << constants::string_processing::colors::green << "✓ Configuration loaded successfully"
            << constants::string_processing::colors::reset << std::endl;

  auto config = std::move(config_result.value());
  display_configuration_info(config);
  return config;
}

auto ConfigurationLoader::display_configuration_info(const io::Configuration& config) const -> void {
  display_model_info(config);
  display_materials(config);
  display_run_info(config);
}

auto ConfigurationLoader::display_model_info(const io::Configuration& config) const -> void {
  const auto& setup = config.setup;

  std::cout << "\n"
            << constants::string_processing::colors::cyan << "┌─ MODEL SETUP ─────────────────────────────┐" << constants::string_processing::colors::reset
            << std::endl;
  std::cout << "│ Elements        : " << std::setw(20) << std::left
            << std::format("{} x {}", setup.mesh.resolution[0], setup.mesh.resolution[1]) << " │" << std::endl;
  std::cout << "│ Domain          : " << std::setw(20) << std::left
            << std::format("[{}, {}] x [{}, {}]", setup.mesh.min.x(), setup.mesh.max.x(), setup.mesh.min.y(),
                           setup.mesh.max.y())
            << " │" << std::endl;
  std::cout << "│ Gravity         : " << std::setw(20) << std::left
            << std::format("({}, {})", setup.gravity.x(), setup.gravity.y()) << " │" << std::endl;
  std::cout << "│ Diffusivity     : " << std::setw(20) << std::left << setup.diffusivity << " │" << std::endl;
  std::cout << "│ Particles/cell  : " << std::setw(20) << std::left
            << setup.swarm.particles_per_cell * setup.swarm.particles_per_cell << " │" << std::endl;
  std::cout << "│ CFL factor      : " << std::setw(20) << std::left << setup.numerical.cfl_factor << " │"
            << std::endl;
  std::cout << "│ Picard tol      : " << std::setw(20) << std::left << setup.numerical.stokes.tolerance << " │"
            << std::endl;
  std::cout << constants::string_processing::colors::cyan << "└───────────────────────────────────────────┘" << constants::string_processing::colors::reset
            << std::endl;
}

auto ConfigurationLoader::display_materials(const io::Configuration& config) const -> void {
  std::cout << "\nMaterials:" << std::endl;
  for (std::size_t i = 0; i < config.setup.materials.size(); ++i) {
    const auto& material = config.setup.materials[i];
    std::cout << std::format("  [{:2}] {:<16} rho0 = {:<10g} rheology: {}", i, material.name, material.density,
                             materials::rheology_name(material.rheology))
              << std::endl;
  }
}

auto ConfigurationLoader::display_run_info(const io::Configuration& config) const -> void {
  if (config.run.steps) {
    std::cout << "\nRun: " << *config.run.steps << " time steps" << std::endl;
  } else if (config.run.end_time) {
    std::cout << "\nRun: until t = " << *config.run.end_time << std::endl;
  }
}

} // namespace mantle::core
