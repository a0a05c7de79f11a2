#pragma once
#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include "rheology.hpp"
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace mantle::materials {

// ================================================================================================
// SHAPES (used only to assign particles at initialisation)
// ================================================================================================

struct Everywhere {};

struct Box {
  core::Point min;
  core::Point max;
};

struct Circle {
  core::Point centre;
  double radius = 0.0;
};

// Horizontal band y_min <= y <= y_max
struct Layer {
  double y_min = 0.0;
  double y_max = 0.0;
};

// Simple polygon, even-odd rule
struct Polygon {
  std::vector<core::Point> vertices;
};

struct CustomShape {
  std::function<bool(const core::Point&)> predicate;
};

using Shape = std::variant<Everywhere, Box, Circle, Layer, Polygon, CustomShape>;

[[nodiscard]] auto contains(const Shape& shape, const core::Point& point) -> bool;

// ================================================================================================
// MATERIAL
// ================================================================================================

struct Material {
  std::string name;
  Rheology rheology = ConstantViscosity{};
  double density = 1.0;
  double thermal_expansivity = 0.0;
  double reference_temperature = 0.0;
  Shape shape = Everywhere{};

  // Boussinesq density rho0 (1 - alpha (T - T_ref))
  [[nodiscard]] auto density_at(double temperature) const noexcept -> double {
    return density * (1.0 - thermal_expansivity * (temperature - reference_temperature));
  }
};

// Rejects empty lists and non-physical parameters before any particle is created
[[nodiscard]] auto validate_materials(std::span<const Material> materials) -> std::expected<void, core::ValidationError>;

} // namespace mantle::materials
