#include "mantle/materials/material.hpp"
#include "mantle/core/overloaded.hpp"
#include <cmath>
#include <format>

namespace mantle::materials {

namespace {

[[nodiscard]] auto polygon_contains(const std::vector<core::Point>& vertices, const core::Point& point) -> bool {
  bool inside = false;
  const std::size_t n = vertices.size();
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const auto& a = vertices[i];
    const auto& b = vertices[j];
    const bool crosses = (a.y() > point.y()) != (b.y() > point.y());
    if (crosses && point.x() < (b.x() - a.x()) * (point.y() - a.y()) / (b.y() - a.y()) + a.x()) {
      inside = !inside;
    }
  }
  return inside;
}

[[nodiscard]] auto validate_rheology(const Material& material) -> std::expected<void, core::ValidationError> {
  return std::visit(
      core::overloaded{[&](const ConstantViscosity& law) -> std::expected<void, core::ValidationError> {
                   if (!(law.eta0 > 0.0) || !std::isfinite(law.eta0)) {
                     return std::unexpected(core::ValidationError(
                         std::format("materials.{}.rheology.viscosity", material.name), "must be positive"));
                   }
                   return {};
                 },
                 [&](const PowerLaw& law) -> std::expected<void, core::ValidationError> {
                   if (!(law.prefactor > 0.0) || !(law.exponent > 0.0) || !std::isfinite(law.prefactor) ||
                       !std::isfinite(law.exponent)) {
                     return std::unexpected(core::ValidationError(
                         std::format("materials.{}.rheology", material.name),
                         std::format("power law needs finite prefactor > 0 and exponent > 0 (got A={}, n={})",
                                     law.prefactor, law.exponent)));
                   }
                   return {};
                 },
                 [&](const TemperatureDependent& law) -> std::expected<void, core::ValidationError> {
                   if (!(law.eta0 > 0.0) || !std::isfinite(law.eta0) || !std::isfinite(law.gamma)) {
                     return std::unexpected(core::ValidationError(
                         std::format("materials.{}.rheology", material.name),
                         "temperature-dependent law needs viscosity > 0 and a finite gamma"));
                   }
                   return {};
                 }},
      material.rheology);
}

} // namespace

auto contains(const Shape& shape, const core::Point& point) -> bool {
  return std::visit(
      core::overloaded{[](const Everywhere&) { return true; },
                 [&](const Box& box) {
                   return point.x() >= box.min.x() && point.x() <= box.max.x() && point.y() >= box.min.y() &&
                          point.y() <= box.max.y();
                 },
                 [&](const Circle& circle) { return (point - circle.centre).squaredNorm() <= circle.radius * circle.radius; },
                 [&](const Layer& layer) { return point.y() >= layer.y_min && point.y() <= layer.y_max; },
                 [&](const Polygon& polygon) {
                   return polygon.vertices.size() >= 3 && polygon_contains(polygon.vertices, point);
                 },
                 [&](const CustomShape& custom) { return custom.predicate && custom.predicate(point); }},
      shape);
}

auto validate_materials(std::span<const Material> materials) -> std::expected<void, core::ValidationError> {
  if (materials.empty()) {
    return std::unexpected(core::ValidationError("materials", "at least one material is required"));
  }

  for (const auto& material : materials) {
    if (!(material.density > 0.0) || !std::isfinite(material.density)) {
      return std::unexpected(
          core::ValidationError(std::format("materials.{}.density", material.name), "must be positive"));
    }
    if (auto result = validate_rheology(material); !result) {
      return std::unexpected(result.error());
    }
  }

  return {};
}

} // namespace mantle::materials
