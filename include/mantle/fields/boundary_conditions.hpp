#pragma once
#include "../mesh/structured_mesh.hpp"
#include <array>
#include <optional>

namespace mantle::fields {

// An empty component is free (zero traction); a value is a Dirichlet prescription
struct WallCondition {
  std::array<std::optional<double>, 2> velocity{};
  std::optional<double> temperature{}; // empty = insulating

  [[nodiscard]] auto operator==(const WallCondition&) const -> bool = default;
};

/**
 * @brief Per-wall, per-component velocity and temperature conditions
 *
 * Corner nodes resolve per component: a bottom/top prescription wins over left/right; when
 * bottom/top leaves the component free, a left/right prescription applies.
 */
class BoundaryConditionSet {
private:
  std::array<WallCondition, 4> walls_{};

  [[nodiscard]] static constexpr auto slot(mesh::Wall wall) noexcept -> std::size_t {
    return static_cast<std::size_t>(wall);
  }

public:
  BoundaryConditionSet() = default;

  // Zero velocity on every wall, all walls insulating
  [[nodiscard]] static auto no_slip() -> BoundaryConditionSet;

  // Zero normal velocity, free tangential velocity on every wall, all walls insulating
  [[nodiscard]] static auto free_slip() -> BoundaryConditionSet;

  auto set_velocity_component(mesh::Wall wall, int component, std::optional<double> value) -> BoundaryConditionSet&;
  auto set_velocity(mesh::Wall wall, std::optional<double> vx, std::optional<double> vy) -> BoundaryConditionSet&;
  auto set_temperature(mesh::Wall wall, std::optional<double> value) -> BoundaryConditionSet&;

  [[nodiscard]] auto wall(mesh::Wall wall) const noexcept -> const WallCondition& { return walls_[slot(wall)]; }

  [[nodiscard]] auto velocity_constraint(const mesh::StructuredMesh& mesh, std::size_t node, int component) const
      -> std::optional<double>;

  [[nodiscard]] auto temperature_constraint(const mesh::StructuredMesh& mesh, std::size_t node) const
      -> std::optional<double>;

  // True when at least one wall lets flow through its normal direction
  [[nodiscard]] auto has_free_normal_velocity() const noexcept -> bool;

  [[nodiscard]] auto operator==(const BoundaryConditionSet&) const -> bool = default;
};

[[nodiscard]] constexpr auto normal_component(mesh::Wall wall) noexcept -> int {
  return (wall == mesh::Wall::Bottom || wall == mesh::Wall::Top) ? 1 : 0;
}

} // namespace mantle::fields
