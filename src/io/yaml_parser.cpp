#include "mantle/io/yaml_parser.hpp"
#include "mantle/core/constants.hpp"
#include "mantle/core/exceptions.hpp"

#include <cctype>
#include <iostream>

namespace mantle::io {

namespace {

// Message without the "Configuration Error: " prefix, for nesting into an outer error
[[nodiscard]] auto detail(const core::ConfigurationError& error) -> std::string_view {
  constexpr std::string_view prefix = "Configuration Error: ";
  std::string_view text = error.message();
  if (text.starts_with(prefix)) {
    text.remove_prefix(prefix.size());
  }
  return text;
}

[[nodiscard]] auto in_section(std::string_view section, const core::ConfigurationError& error)
    -> core::ConfigurationError {
  return core::ConfigurationError(std::format("In '{}' section: {}", section, detail(error)));
}

[[nodiscard]] auto wall_from_key(std::string_view key) -> std::optional<mesh::Wall> {
  for (const auto wall : mesh::all_walls) {
    if (key == mesh::wall_name(wall)) {
      return wall;
    }
  }
  return std::nullopt;
}

} // namespace

auto YamlParser::load() -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::LoadFile(file_path_);
    return {};
  } catch (const YAML::BadFile& e) {
    return std::unexpected(core::FileError{"Failed to open YAML file", file_path_});
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  } catch (const std::exception& e) {
    return std::unexpected(core::FileError{std::format("Unexpected error during YAML load: {}", e.what()), file_path_});
  }
}

auto YamlParser::load_from_string(const std::string& content) -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::Load(content);
    return {};
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  }
}

auto YamlParser::parse() const -> std::expected<Configuration, core::ConfigurationError> {
  if (!root_ || root_.IsNull()) {
    return std::unexpected(core::ConfigurationError("No YAML content loaded. Call load() first."));
  }

  for (const auto* section : {"mesh", "materials", "run"}) {
    if (!root_[section]) {
      return std::unexpected(core::ConfigurationError(std::format("Missing required '{}' section.", section)));
    }
  }

  Configuration config;

  auto mesh_result = parse_mesh_config(root_["mesh"]);
  if (!mesh_result) {
    return std::unexpected(in_section("mesh", mesh_result.error()));
  }
  config.setup.mesh = mesh_result.value();

  if (auto physics_result = parse_physics_config(root_["physics"], config.setup); !physics_result) {
    return std::unexpected(in_section("physics", physics_result.error()));
  }

  auto materials_result = parse_materials_config(root_["materials"]);
  if (!materials_result) {
    return std::unexpected(in_section("materials", materials_result.error()));
  }
  config.setup.materials = std::move(materials_result.value());

  if (root_["boundary_conditions"]) {
    auto bc_result = parse_boundary_conditions_config(root_["boundary_conditions"]);
    if (!bc_result) {
      return std::unexpected(in_section("boundary_conditions", bc_result.error()));
    }
    config.setup.boundary_conditions = bc_result.value();
  }

  if (root_["initial_temperature"]) {
    auto temperature_result = parse_initial_temperature_config(root_["initial_temperature"]);
    if (!temperature_result) {
      return std::unexpected(in_section("initial_temperature", temperature_result.error()));
    }
    config.setup.initial_temperature = temperature_result.value();
  }

  auto numerical_result = parse_numerical_config(root_["numerical"]);
  if (!numerical_result) {
    return std::unexpected(in_section("numerical", numerical_result.error()));
  }
  config.setup.numerical = numerical_result.value();

  auto swarm_result = parse_swarm_config(root_["swarm"]);
  if (!swarm_result) {
    return std::unexpected(in_section("swarm", swarm_result.error()));
  }
  config.setup.swarm = swarm_result.value();

  auto run_result = parse_run_config(root_["run"]);
  if (!run_result) {
    return std::unexpected(in_section("run", run_result.error()));
  }
  config.run = run_result.value();

  if (root_["output"]) {
    auto output_result = parse_output_config(root_["output"]);
    if (!output_result) {
      return std::unexpected(in_section("output", output_result.error()));
    }
    config.output = output_result.value();
  } else {
    config.output.enabled = false;
  }

  return config;
}

auto YamlParser::extract_point(const YAML::Node& node, std::string_view key) const
    -> std::expected<core::Point, core::ConfigurationError> {
  auto values = extract_value<std::vector<double>>(node, key);
  if (!values) {
    return std::unexpected(values.error());
  }
  if (values->size() != 2) {
    return std::unexpected(
        core::ConfigurationError(std::format("Field '{}' must hold exactly 2 values, got {}", key, values->size())));
  }
  return core::Point((*values)[0], (*values)[1]);
}

auto YamlParser::parse_mesh_config(const YAML::Node& node) const
    -> std::expected<simulation::MeshSpec, core::ConfigurationError> {

  simulation::MeshSpec mesh;

  auto resolution = extract_value<std::vector<int>>(node, "resolution");
  if (!resolution)
    return std::unexpected(resolution.error());
  if (resolution->size() != 2) {
    return std::unexpected(core::ConfigurationError("Field 'resolution' must hold [nx, ny]"));
  }
  mesh.resolution = {(*resolution)[0], (*resolution)[1]};

  auto min = extract_point(node, "min");
  if (!min)
    return std::unexpected(min.error());
  mesh.min = min.value();

  auto max = extract_point(node, "max");
  if (!max)
    return std::unexpected(max.error());
  mesh.max = max.value();

  return mesh;
}

auto YamlParser::parse_physics_config(const YAML::Node& node, simulation::SimulationSetup& setup) const
    -> std::expected<void, core::ConfigurationError> {
  if (!node) {
    return {};
  }

  if (node["gravity"]) {
    auto gravity = extract_point(node, "gravity");
    if (!gravity)
      return std::unexpected(gravity.error());
    setup.gravity = gravity.value();
  }

  auto diffusivity = extract_optional<double>(node, "diffusivity", setup.diffusivity);
  if (!diffusivity)
    return std::unexpected(diffusivity.error());
  setup.diffusivity = diffusivity.value();

  return {};
}

auto YamlParser::parse_materials_config(const YAML::Node& node) const
    -> std::expected<std::vector<materials::Material>, core::ConfigurationError> {

  if (!node.IsSequence() || node.size() == 0) {
    return std::unexpected(core::ConfigurationError("Expected a non-empty list of materials"));
  }

  std::vector<materials::Material> result;
  result.reserve(node.size());

  for (std::size_t i = 0; i < node.size(); ++i) {
    const YAML::Node entry = node[i];
    materials::Material material;

    auto name = extract_optional<std::string>(entry, "name", std::format("material_{}", i));
    if (!name)
      return std::unexpected(name.error());
    material.name = name.value();

    auto density = extract_value<double>(entry, "density");
    if (!density)
      return std::unexpected(density.error());
    material.density = density.value();

    auto alpha = extract_optional<double>(entry, "thermal_expansivity", 0.0);
    if (!alpha)
      return std::unexpected(alpha.error());
    material.thermal_expansivity = alpha.value();

    auto t_ref = extract_optional<double>(entry, "reference_temperature", 0.0);
    if (!t_ref)
      return std::unexpected(t_ref.error());
    material.reference_temperature = t_ref.value();

    if (!entry["rheology"]) {
      return std::unexpected(
          core::ConfigurationError(std::format("Material '{}': required field 'rheology' is missing", material.name)));
    }
    auto rheology = parse_rheology_config(entry["rheology"]);
    if (!rheology) {
      return std::unexpected(core::ConfigurationError(
          std::format("Material '{}' rheology: {}", material.name, detail(rheology.error()))));
    }
    material.rheology = rheology.value();

    if (entry["shape"]) {
      auto shape = parse_shape_config(entry["shape"]);
      if (!shape) {
        return std::unexpected(core::ConfigurationError(
            std::format("Material '{}' shape: {}", material.name, detail(shape.error()))));
      }
      material.shape = std::move(shape.value());
    }

    result.push_back(std::move(material));
  }

  return result;
}

auto YamlParser::parse_rheology_config(const YAML::Node& node) const
    -> std::expected<materials::Rheology, core::ConfigurationError> {

  auto type = extract_enum(node, "type", enum_mappings::rheology_types);
  if (!type)
    return std::unexpected(type.error());

  switch (type.value()) {
  case enum_mappings::RheologyType::Constant: {
    auto eta0 = extract_value<double>(node, "viscosity");
    if (!eta0)
      return std::unexpected(eta0.error());
    return materials::ConstantViscosity{eta0.value()};
  }
  case enum_mappings::RheologyType::PowerLaw: {
    auto prefactor = extract_value<double>(node, "prefactor");
    if (!prefactor)
      return std::unexpected(prefactor.error());
    auto exponent = extract_value<double>(node, "exponent");
    if (!exponent)
      return std::unexpected(exponent.error());
    return materials::PowerLaw{prefactor.value(), exponent.value()};
  }
  case enum_mappings::RheologyType::TemperatureDependent: {
    auto eta0 = extract_value<double>(node, "viscosity");
    if (!eta0)
      return std::unexpected(eta0.error());
    auto gamma = extract_value<double>(node, "gamma");
    if (!gamma)
      return std::unexpected(gamma.error());
    auto t_ref = extract_optional<double>(node, "reference_temperature", 0.0);
    if (!t_ref)
      return std::unexpected(t_ref.error());
    return materials::TemperatureDependent{eta0.value(), gamma.value(), t_ref.value()};
  }
  }
  return std::unexpected(core::ConfigurationError("Unhandled rheology type"));
}

auto YamlParser::parse_shape_config(const YAML::Node& node) const
    -> std::expected<materials::Shape, core::ConfigurationError> {

  auto type = extract_enum(node, "type", enum_mappings::shape_types);
  if (!type)
    return std::unexpected(type.error());

  switch (type.value()) {
  case enum_mappings::ShapeType::Everywhere:
    return materials::Everywhere{};

  case enum_mappings::ShapeType::Box: {
    auto min = extract_point(node, "min");
    if (!min)
      return std::unexpected(min.error());
    auto max = extract_point(node, "max");
    if (!max)
      return std::unexpected(max.error());
    return materials::Box{min.value(), max.value()};
  }

  case enum_mappings::ShapeType::Circle: {
    auto centre = extract_point(node, "centre");
    if (!centre)
      return std::unexpected(centre.error());
    auto radius = extract_value<double>(node, "radius");
    if (!radius)
      return std::unexpected(radius.error());
    return materials::Circle{centre.value(), radius.value()};
  }

  case enum_mappings::ShapeType::Layer: {
    auto y_min = extract_value<double>(node, "y_min");
    if (!y_min)
      return std::unexpected(y_min.error());
    auto y_max = extract_value<double>(node, "y_max");
    if (!y_max)
      return std::unexpected(y_max.error());
    return materials::Layer{y_min.value(), y_max.value()};
  }

  case enum_mappings::ShapeType::Polygon: {
    if (!node["vertices"] || !node["vertices"].IsSequence()) {
      return std::unexpected(core::ConfigurationError("Required field 'vertices' is missing"));
    }
    materials::Polygon polygon;
    try {
      for (const auto& vertex : node["vertices"]) {
        const auto xy = vertex.as<std::vector<double>>();
        if (xy.size() != 2) {
          return std::unexpected(core::ConfigurationError("Each polygon vertex must hold [x, y]"));
        }
        polygon.vertices.emplace_back(xy[0], xy[1]);
      }
    } catch (const YAML::Exception& e) {
      return std::unexpected(core::ConfigurationError(std::format("Failed to parse field 'vertices': {}", e.what())));
    }
    if (polygon.vertices.size() < 3) {
      return std::unexpected(core::ConfigurationError("A polygon needs at least 3 vertices"));
    }
    return polygon;
  }
  }
  return std::unexpected(core::ConfigurationError("Unhandled shape type"));
}

auto YamlParser::parse_boundary_conditions_config(const YAML::Node& node) const
    -> std::expected<fields::BoundaryConditionSet, core::ConfigurationError> {

  fields::BoundaryConditionSet bc = fields::BoundaryConditionSet::free_slip();

  try {
    if (node["preset"]) {
      auto preset = extract_value<std::string>(node, "preset");
      if (!preset)
        return std::unexpected(preset.error());
      const auto name = to_lower(preset.value());
      if (name == "no_slip") {
        bc = fields::BoundaryConditionSet::no_slip();
      } else if (name != "free_slip") {
        return std::unexpected(core::ConfigurationError(
            std::format("Invalid value '{}' for field 'preset'. Valid options: free_slip, no_slip", name)));
      }
    }

    for (const auto& item : node) {
      const auto key = item.first.as<std::string>();
      if (key == "preset") {
        continue;
      }
      const auto wall = wall_from_key(key);
      if (!wall) {
        return std::unexpected(core::ConfigurationError(
            std::format("Unknown wall '{}'. Valid options: bottom, top, left, right, preset", key)));
      }
      const YAML::Node wall_node = item.second;

      if (wall_node["velocity"]) {
        const YAML::Node velocity = wall_node["velocity"];
        if (!velocity.IsSequence() || velocity.size() != 2) {
          return std::unexpected(
              core::ConfigurationError(std::format("Wall '{}': velocity must be [vx, vy], each a number or 'free'", key)));
        }
        for (std::size_t c = 0; c < 2; ++c) {
          const YAML::Node component = velocity[c];
          const auto text = to_lower(component.as<std::string>());
          if (text == "free") {
            bc.set_velocity_component(wall.value(), static_cast<int>(c), std::nullopt);
            continue;
          }
          try {
            bc.set_velocity_component(wall.value(), static_cast<int>(c), component.as<double>());
          } catch (const YAML::Exception& e) {
            return std::unexpected(core::ConfigurationError(
                std::format("Wall '{}': velocity component {} must be a number or 'free', got '{}'", key, c, text)));
          }
        }
      }

      if (wall_node["temperature"]) {
        const YAML::Node temperature = wall_node["temperature"];
        const auto text = to_lower(temperature.as<std::string>());
        if (text == "insulating") {
          bc.set_temperature(wall.value(), std::nullopt);
        } else {
          try {
            bc.set_temperature(wall.value(), temperature.as<double>());
          } catch (const YAML::Exception& e) {
            return std::unexpected(core::ConfigurationError(
                std::format("Wall '{}': temperature must be a number or 'insulating', got '{}'", key, text)));
          }
        }
      }
    }

    return bc;
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("Malformed boundary condition entry: {}", e.what())));
  }
}

auto YamlParser::parse_initial_temperature_config(const YAML::Node& node) const
    -> std::expected<simulation::InitialTemperature, core::ConfigurationError> {

  auto type = extract_enum(node, "type", enum_mappings::initial_temperature_types);
  if (!type)
    return std::unexpected(type.error());

  switch (type.value()) {
  case enum_mappings::InitialTemperatureType::Uniform: {
    auto value = extract_value<double>(node, "value");
    if (!value)
      return std::unexpected(value.error());
    return simulation::UniformTemperature{value.value()};
  }

  case enum_mappings::InitialTemperatureType::Linear: {
    simulation::LinearTemperature linear;
    auto bottom = extract_value<double>(node, "bottom");
    if (!bottom)
      return std::unexpected(bottom.error());
    linear.bottom = bottom.value();
    auto top = extract_value<double>(node, "top");
    if (!top)
      return std::unexpected(top.error());
    linear.top = top.value();

    if (const YAML::Node perturbation = node["perturbation"]) {
      auto amplitude = extract_value<double>(perturbation, "amplitude");
      if (!amplitude)
        return std::unexpected(amplitude.error());
      linear.perturbation_amplitude = amplitude.value();
      auto wavenumber = extract_optional<int>(perturbation, "wavenumber", 1);
      if (!wavenumber)
        return std::unexpected(wavenumber.error());
      linear.perturbation_wavenumber = wavenumber.value();
    }
    return linear;
  }

  case enum_mappings::InitialTemperatureType::Step: {
    simulation::StepTemperature step;
    auto axis = extract_optional<std::string>(node, "axis", "x");
    if (!axis)
      return std::unexpected(axis.error());
    if (axis.value() != "x" && axis.value() != "y") {
      return std::unexpected(core::ConfigurationError(
          std::format("Invalid value '{}' for field 'axis'. Valid options: x, y", axis.value())));
    }
    step.axis = (axis.value() == "x") ? 0 : 1;

    auto position = extract_value<double>(node, "position");
    if (!position)
      return std::unexpected(position.error());
    step.position = position.value();
    auto low = extract_value<double>(node, "low");
    if (!low)
      return std::unexpected(low.error());
    step.low = low.value();
    auto high = extract_value<double>(node, "high");
    if (!high)
      return std::unexpected(high.error());
    step.high = high.value();
    return step;
  }
  }
  return std::unexpected(core::ConfigurationError("Unhandled initial temperature type"));
}

auto YamlParser::parse_linear_solver_config(const YAML::Node& node, solver::LinearSolverSettings defaults) const
    -> std::expected<solver::LinearSolverSettings, core::ConfigurationError> {

  solver::LinearSolverSettings settings = defaults;

  if (node["linear_solver"]) {
    auto kind = extract_enum(node, "linear_solver", enum_mappings::linear_solvers);
    if (!kind)
      return std::unexpected(kind.error());
    settings.kind = kind.value();
  }

  auto max_iterations = extract_optional<int>(node, "linear_max_iterations", settings.max_iterations);
  if (!max_iterations)
    return std::unexpected(max_iterations.error());
  settings.max_iterations = max_iterations.value();

  auto tolerance = extract_optional<double>(node, "linear_tolerance", settings.tolerance);
  if (!tolerance)
    return std::unexpected(tolerance.error());
  settings.tolerance = tolerance.value();

  return settings;
}

auto YamlParser::parse_numerical_config(const YAML::Node& node) const
    -> std::expected<simulation::NumericalSettings, core::ConfigurationError> {

  simulation::NumericalSettings settings;
  if (!node) {
    return settings;
  }

  if (const YAML::Node stokes = node["stokes"]) {
    auto tolerance = extract_optional<double>(stokes, "tolerance", settings.stokes.tolerance);
    if (!tolerance)
      return std::unexpected(tolerance.error());
    settings.stokes.tolerance = tolerance.value();

    auto max_iterations = extract_optional<int>(stokes, "max_iterations", settings.stokes.max_iterations);
    if (!max_iterations)
      return std::unexpected(max_iterations.error());
    settings.stokes.max_iterations = max_iterations.value();

    auto relaxation = extract_optional<double>(stokes, "relaxation", settings.stokes.relaxation);
    if (!relaxation)
      return std::unexpected(relaxation.error());
    settings.stokes.relaxation = relaxation.value();

    auto reference = extract_optional<double>(stokes, "reference_strain_rate", settings.stokes.reference_strain_rate);
    if (!reference)
      return std::unexpected(reference.error());
    settings.stokes.reference_strain_rate = reference.value();

    auto alpha = extract_optional<double>(stokes, "pressure_stabilisation", settings.stokes.pressure_stabilisation);
    if (!alpha)
      return std::unexpected(alpha.error());
    settings.stokes.pressure_stabilisation = alpha.value();

    auto linear = parse_linear_solver_config(stokes, settings.stokes.linear);
    if (!linear)
      return std::unexpected(linear.error());
    settings.stokes.linear = linear.value();
  }

  if (const YAML::Node thermal = node["thermal"]) {
    auto theta = extract_optional<double>(thermal, "theta", settings.thermal.theta);
    if (!theta)
      return std::unexpected(theta.error());
    settings.thermal.theta = theta.value();

    auto supg = extract_optional<bool>(thermal, "supg", settings.thermal.supg);
    if (!supg)
      return std::unexpected(supg.error());
    settings.thermal.supg = supg.value();

    auto linear = parse_linear_solver_config(thermal, settings.thermal.linear);
    if (!linear)
      return std::unexpected(linear.error());
    settings.thermal.linear = linear.value();
  }

  auto cfl = extract_optional<double>(node, "cfl_factor", settings.cfl_factor);
  if (!cfl)
    return std::unexpected(cfl.error());
  settings.cfl_factor = cfl.value();

  auto max_dt = extract_optional<double>(node, "max_timestep", settings.max_timestep);
  if (!max_dt)
    return std::unexpected(max_dt.error());
  settings.max_timestep = max_dt.value();

  auto eta_min = extract_optional<double>(node, "viscosity_min", settings.viscosity_limits.min);
  if (!eta_min)
    return std::unexpected(eta_min.error());
  settings.viscosity_limits.min = eta_min.value();

  auto eta_max = extract_optional<double>(node, "viscosity_max", settings.viscosity_limits.max);
  if (!eta_max)
    return std::unexpected(eta_max.error());
  settings.viscosity_limits.max = eta_max.value();

  if (node["viscosity_averaging"]) {
    auto averaging = extract_enum(node, "viscosity_averaging", enum_mappings::viscosity_averaging);
    if (!averaging)
      return std::unexpected(averaging.error());
    settings.viscosity_averaging = averaging.value();
  }

  if (node["advection_scheme"]) {
    auto scheme = extract_enum(node, "advection_scheme", enum_mappings::advection_schemes);
    if (!scheme)
      return std::unexpected(scheme.error());
    settings.advection_scheme = scheme.value();
  }

  if (node["outflow_policy"]) {
    auto outflow = extract_enum(node, "outflow_policy", enum_mappings::outflow_policies);
    if (!outflow)
      return std::unexpected(outflow.error());
    settings.outflow_policy = outflow.value();
  }

  if (node["stokes_failure_policy"]) {
    auto policy = extract_enum(node, "stokes_failure_policy", enum_mappings::stokes_failure_policies);
    if (!policy)
      return std::unexpected(policy.error());
    settings.stokes_failure_policy = policy.value();
  }

  if (node["thermal_failure_policy"]) {
    auto policy = extract_enum(node, "thermal_failure_policy", enum_mappings::thermal_failure_policies);
    if (!policy)
      return std::unexpected(policy.error());
    settings.thermal_failure_policy = policy.value();
  }

  auto halvings = extract_optional<int>(node, "max_timestep_halvings", settings.max_timestep_halvings);
  if (!halvings)
    return std::unexpected(halvings.error());
  settings.max_timestep_halvings = halvings.value();

  auto verbose = extract_optional<bool>(node, "verbose", settings.verbose);
  if (!verbose)
    return std::unexpected(verbose.error());
  settings.verbose = verbose.value();

  return settings;
}

auto YamlParser::parse_swarm_config(const YAML::Node& node) const
    -> std::expected<swarm::SwarmLayout, core::ConfigurationError> {

  swarm::SwarmLayout layout;
  if (!node) {
    return layout;
  }

  if (node["layout"]) {
    auto kind = extract_enum(node, "layout", enum_mappings::particle_layouts);
    if (!kind)
      return std::unexpected(kind.error());
    layout.layout = kind.value();
  }

  auto per_cell = extract_optional<int>(node, "particles_per_cell", layout.particles_per_cell);
  if (!per_cell)
    return std::unexpected(per_cell.error());
  if (per_cell.value() < 1) {
    return std::unexpected(core::ConfigurationError("Field 'particles_per_cell' must be at least 1"));
  }
  layout.particles_per_cell = per_cell.value();

  auto seed = extract_optional<std::uint64_t>(node, "seed", layout.seed);
  if (!seed)
    return std::unexpected(seed.error());
  layout.seed = seed.value();

  return layout;
}

auto YamlParser::parse_run_config(const YAML::Node& node) const -> std::expected<RunConfig, core::ConfigurationError> {
  RunConfig run;

  const bool has_steps = static_cast<bool>(node["steps"]);
  const bool has_end_time = static_cast<bool>(node["end_time"]);
  if (has_steps == has_end_time) {
    return std::unexpected(core::ConfigurationError("Specify exactly one of 'steps' or 'end_time'"));
  }

  if (has_steps) {
    auto steps = extract_value<int>(node, "steps");
    if (!steps)
      return std::unexpected(steps.error());
    if (steps.value() < 0) {
      return std::unexpected(core::ConfigurationError("Field 'steps' must not be negative"));
    }
    run.steps = static_cast<std::size_t>(steps.value());
  } else {
    auto end_time = extract_value<double>(node, "end_time");
    if (!end_time)
      return std::unexpected(end_time.error());
    if (!(end_time.value() >= 0.0)) {
      return std::unexpected(core::ConfigurationError("Field 'end_time' must not be negative"));
    }
    run.end_time = end_time.value();
  }

  return run;
}

auto YamlParser::parse_output_config(const YAML::Node& node) const
    -> std::expected<OutputConfig, core::ConfigurationError> {

  OutputConfig config;

  auto enabled = extract_optional<bool>(node, "enabled", config.enabled);
  if (!enabled)
    return std::unexpected(enabled.error());
  config.enabled = enabled.value();

  auto directory = extract_optional<std::string>(node, "directory", config.output_directory);
  if (!directory)
    return std::unexpected(directory.error());
  config.output_directory = directory.value();

  auto interval = extract_optional<int>(node, "interval", static_cast<int>(config.interval));
  if (!interval)
    return std::unexpected(interval.error());
  if (interval.value() < 1) {
    return std::unexpected(core::ConfigurationError("Field 'interval' must be at least 1"));
  }
  config.interval = static_cast<std::size_t>(interval.value());

  auto write_swarm = extract_optional<bool>(node, "write_swarm", config.write_swarm);
  if (!write_swarm)
    return std::unexpected(write_swarm.error());
  config.write_swarm = write_swarm.value();

  auto compression = extract_optional<int>(node, "compression_level", config.compression_level);
  if (!compression)
    return std::unexpected(compression.error());
  if (compression.value() < 0 || compression.value() > 9) {
    return std::unexpected(core::ConfigurationError("Field 'compression_level' must lie in 0-9"));
  }
  config.compression_level = compression.value();

  return config;
}

} // namespace mantle::io
