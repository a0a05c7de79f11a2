#include "mantle/fields/boundary_conditions.hpp"

namespace mantle::fields {

namespace {

// Bottom/top take precedence over left/right at corners
constexpr std::array<mesh::Wall, 4> precedence = {mesh::Wall::Bottom, mesh::Wall::Top, mesh::Wall::Left,
                                                  mesh::Wall::Right};

} // namespace

auto BoundaryConditionSet::no_slip() -> BoundaryConditionSet {
  BoundaryConditionSet bc;
  for (const auto wall : mesh::all_walls) {
    bc.set_velocity(wall, 0.0, 0.0);
  }
  return bc;
}

auto BoundaryConditionSet::free_slip() -> BoundaryConditionSet {
  BoundaryConditionSet bc;
  for (const auto wall : mesh::all_walls) {
    bc.set_velocity_component(wall, normal_component(wall), 0.0);
  }
  return bc;
}

auto BoundaryConditionSet::set_velocity_component(mesh::Wall wall, int component, std::optional<double> value)
    -> BoundaryConditionSet& {
  walls_[slot(wall)].velocity[static_cast<std::size_t>(component)] = value;
  return *this;
}

auto BoundaryConditionSet::set_velocity(mesh::Wall wall, std::optional<double> vx, std::optional<double> vy)
    -> BoundaryConditionSet& {
  walls_[slot(wall)].velocity = {vx, vy};
  return *this;
}

auto BoundaryConditionSet::set_temperature(mesh::Wall wall, std::optional<double> value) -> BoundaryConditionSet& {
  walls_[slot(wall)].temperature = value;
  return *this;
}

auto BoundaryConditionSet::velocity_constraint(const mesh::StructuredMesh& mesh, std::size_t node,
                                               int component) const -> std::optional<double> {
  for (const auto wall : precedence) {
    if (!mesh.is_on_wall(node, wall)) {
      continue;
    }
    const auto& value = walls_[slot(wall)].velocity[static_cast<std::size_t>(component)];
    if (value) {
      return value;
    }
  }
  return std::nullopt;
}

auto BoundaryConditionSet::temperature_constraint(const mesh::StructuredMesh& mesh, std::size_t node) const
    -> std::optional<double> {
  for (const auto wall : precedence) {
    if (mesh.is_on_wall(node, wall) && walls_[slot(wall)].temperature) {
      return walls_[slot(wall)].temperature;
    }
  }
  return std::nullopt;
}

auto BoundaryConditionSet::has_free_normal_velocity() const noexcept -> bool {
  for (const auto wall : mesh::all_walls) {
    if (!walls_[slot(wall)].velocity[static_cast<std::size_t>(normal_component(wall))]) {
      return true;
    }
  }
  return false;
}

} // namespace mantle::fields
