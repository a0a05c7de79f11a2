#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include <algorithm>
#include <cctype>
#include <concepts>
#include <expected>
#include <format>
#include <optional>
#include <source_location>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace mantle::io {

// Lower-case copy; bytes outside ASCII are passed through unchanged
[[nodiscard]] inline auto to_lower(std::string text) -> std::string {
  std::ranges::transform(text, text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

class YamlParser {
private:
  YAML::Node root_;
  std::string file_path_;

  template <typename T>
  [[nodiscard]] auto extract_value(const YAML::Node& node,
                                   std::string_view key) const -> std::expected<T, core::ConfigurationError>;

  // Returns fallback when the key is absent
  template <typename T>
  [[nodiscard]] auto extract_optional(const YAML::Node& node, std::string_view key, T fallback) const
      -> std::expected<T, core::ConfigurationError>;

  template <typename EnumType>
  [[nodiscard]] auto extract_enum(const YAML::Node& node, std::string_view key,
                                  const std::unordered_map<std::string, EnumType>& mapping) const
      -> std::expected<EnumType, core::ConfigurationError>;

  [[nodiscard]] auto extract_point(const YAML::Node& node,
                                   std::string_view key) const -> std::expected<core::Point, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_mesh_config(const YAML::Node& node) const -> std::expected<simulation::MeshSpec, core::ConfigurationError>;

  [[nodiscard]] auto parse_physics_config(const YAML::Node& node, simulation::SimulationSetup& setup) const
      -> std::expected<void, core::ConfigurationError>;

  [[nodiscard]] auto parse_materials_config(const YAML::Node& node) const
      -> std::expected<std::vector<materials::Material>, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_rheology_config(const YAML::Node& node) const -> std::expected<materials::Rheology, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_shape_config(const YAML::Node& node) const -> std::expected<materials::Shape, core::ConfigurationError>;

  [[nodiscard]] auto parse_boundary_conditions_config(const YAML::Node& node) const
      -> std::expected<fields::BoundaryConditionSet, core::ConfigurationError>;

  [[nodiscard]] auto parse_initial_temperature_config(const YAML::Node& node) const
      -> std::expected<simulation::InitialTemperature, core::ConfigurationError>;

  [[nodiscard]] auto parse_numerical_config(const YAML::Node& node) const
      -> std::expected<simulation::NumericalSettings, core::ConfigurationError>;

  [[nodiscard]] auto parse_linear_solver_config(const YAML::Node& node, solver::LinearSolverSettings defaults) const
      -> std::expected<solver::LinearSolverSettings, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_swarm_config(const YAML::Node& node) const -> std::expected<swarm::SwarmLayout, core::ConfigurationError>;

  [[nodiscard]] auto parse_run_config(const YAML::Node& node) const -> std::expected<RunConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_output_config(const YAML::Node& node) const -> std::expected<OutputConfig, core::ConfigurationError>;

public:
  explicit YamlParser(std::string file_path) : file_path_(std::move(file_path)) {}

  [[nodiscard]] auto load() -> std::expected<void, core::FileError>;

  // Parse YAML text directly instead of a file
  [[nodiscard]] auto load_from_string(const std::string& content) -> std::expected<void, core::FileError>;

  [[nodiscard]] auto parse() const -> std::expected<Configuration, core::ConfigurationError>;
};

// Implementation of template methods
template <typename T>
auto YamlParser::extract_value(const YAML::Node& node,
                               std::string_view key) const -> std::expected<T, core::ConfigurationError> {
  try {
    if (!node[std::string(key)]) {
      return std::unexpected(core::ConfigurationError(std::format("Required field '{}' is missing", key)));
    }

    if constexpr (std::same_as<T, std::vector<double>>) {
      auto sequence = node[std::string(key)];
      std::vector<double> result;
      result.reserve(sequence.size());

      for (const auto& item : sequence) {
        result.push_back(item.as<double>());
      }
      return result;
    } else {
      return node[std::string(key)].as<T>();
    }
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("Failed to parse field '{}': {}", key, e.what())));
  }
}

template <typename T>
auto YamlParser::extract_optional(const YAML::Node& node, std::string_view key, T fallback) const
    -> std::expected<T, core::ConfigurationError> {
  if (!node || !node[std::string(key)]) {
    return fallback;
  }
  return extract_value<T>(node, key);
}

template <typename EnumType>
auto YamlParser::extract_enum(const YAML::Node& node, std::string_view key,
                              const std::unordered_map<std::string, EnumType>& mapping) const
    -> std::expected<EnumType, core::ConfigurationError> {
  auto str_result = extract_value<std::string>(node, key);
  if (!str_result) {
    return std::unexpected(str_result.error());
  }

  const auto str_value = to_lower(str_result.value());

  auto it = mapping.find(str_value);
  if (it == mapping.end()) {
    std::string valid_options;
    for (const auto& [option, _] : mapping) {
      valid_options += option + ", ";
    }
    valid_options = valid_options.substr(0, valid_options.length() - 2);

    return std::unexpected(core::ConfigurationError(
        std::format("Invalid value '{}' for field '{}'. Valid options: {}", str_value, key, valid_options)));
  }

  return it->second;
}

// Enum mappings
namespace enum_mappings {

enum class RheologyType { Constant, PowerLaw, TemperatureDependent };
enum class ShapeType { Everywhere, Box, Circle, Layer, Polygon };
enum class InitialTemperatureType { Uniform, Linear, Step };

inline const std::unordered_map<std::string, RheologyType> rheology_types = {
    {"constant", RheologyType::Constant},
    {"newtonian", RheologyType::Constant},
    {"power_law", RheologyType::PowerLaw},
    {"powerlaw", RheologyType::PowerLaw},
    {"temperature_dependent", RheologyType::TemperatureDependent},
    {"frank_kamenetskii", RheologyType::TemperatureDependent}};

inline const std::unordered_map<std::string, ShapeType> shape_types = {
    {"everywhere", ShapeType::Everywhere},
    {"box", ShapeType::Box},
    {"circle", ShapeType::Circle},
    {"layer", ShapeType::Layer},
    {"polygon", ShapeType::Polygon}};

inline const std::unordered_map<std::string, InitialTemperatureType> initial_temperature_types = {
    {"uniform", InitialTemperatureType::Uniform},
    {"linear", InitialTemperatureType::Linear},
    {"step", InitialTemperatureType::Step}};

inline const std::unordered_map<std::string, solver::LinearSolverKind> linear_solvers = {
    {"sparse_lu", solver::LinearSolverKind::SparseLU},
    {"lu", solver::LinearSolverKind::SparseLU},
    {"bicgstab", solver::LinearSolverKind::BiCGSTAB}};

inline const std::unordered_map<std::string, materials::ViscosityAveraging> viscosity_averaging = {
    {"arithmetic", materials::ViscosityAveraging::Arithmetic},
    {"harmonic", materials::ViscosityAveraging::Harmonic},
    {"geometric", materials::ViscosityAveraging::Geometric}};

inline const std::unordered_map<std::string, swarm::AdvectionScheme> advection_schemes = {
    {"euler", swarm::AdvectionScheme::ForwardEuler},
    {"forward_euler", swarm::AdvectionScheme::ForwardEuler},
    {"rk2", swarm::AdvectionScheme::RungeKutta2},
    {"runge_kutta_2", swarm::AdvectionScheme::RungeKutta2},
    {"midpoint", swarm::AdvectionScheme::RungeKutta2}};

inline const std::unordered_map<std::string, swarm::OutflowPolicy> outflow_policies = {
    {"deactivate", swarm::OutflowPolicy::Deactivate},
    {"clamp", swarm::OutflowPolicy::Clamp}};

inline const std::unordered_map<std::string, swarm::ParticleLayout> particle_layouts = {
    {"regular", swarm::ParticleLayout::Regular},
    {"random", swarm::ParticleLayout::Random}};

inline const std::unordered_map<std::string, simulation::StokesFailurePolicy> stokes_failure_policies = {
    {"abort", simulation::StokesFailurePolicy::Abort},
    {"accept_best_effort", simulation::StokesFailurePolicy::AcceptBestEffort}};

inline const std::unordered_map<std::string, simulation::ThermalFailurePolicy> thermal_failure_policies = {
    {"abort", simulation::ThermalFailurePolicy::Abort},
    {"accept_best_effort", simulation::ThermalFailurePolicy::AcceptBestEffort},
    {"halve_timestep", simulation::ThermalFailurePolicy::HalveTimestep}};

} // namespace enum_mappings

} // namespace mantle::io
