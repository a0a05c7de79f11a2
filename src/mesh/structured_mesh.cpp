#include "mantle/mesh/structured_mesh.hpp"
#include <algorithm>
#include <cmath>

namespace mantle::mesh {

auto wall_name(Wall wall) noexcept -> const char* {
  switch (wall) {
  case Wall::Bottom:
    return "bottom";
  case Wall::Top:
    return "top";
  case Wall::Left:
    return "left";
  case Wall::Right:
    return "right";
  }
  return "unknown";
}

auto StructuredMesh::create(const std::array<int, 2>& element_resolution, const core::Point& min_coord,
                            const core::Point& max_coord) -> std::expected<StructuredMesh, core::GeometryError> {

  if (element_resolution[0] < 1 || element_resolution[1] < 1) {
    return std::unexpected(core::GeometryError(std::format("element resolution must be at least 1x1, got {}x{}",
                                                           element_resolution[0], element_resolution[1])));
  }

  if (!min_coord.allFinite() || !max_coord.allFinite()) {
    return std::unexpected(core::GeometryError("domain bounds must be finite"));
  }

  if (min_coord.x() >= max_coord.x() || min_coord.y() >= max_coord.y()) {
    return std::unexpected(core::GeometryError(std::format("domain minimum ({}, {}) must be below maximum ({}, {})",
                                                           min_coord.x(), min_coord.y(), max_coord.x(),
                                                           max_coord.y())));
  }

  return StructuredMesh(static_cast<std::size_t>(element_resolution[0]),
                        static_cast<std::size_t>(element_resolution[1]), min_coord, max_coord);
}

auto StructuredMesh::node_coordinates(std::size_t node) const noexcept -> core::Point {
  const auto i = node % (nx_ + 1);
  const auto j = node / (nx_ + 1);

  // Pin the last row/column to the exact bound so walls are not shifted by round-off
  const double x = (i == nx_) ? max_.x() : min_.x() + static_cast<double>(i) * dx_;
  const double y = (j == ny_) ? max_.y() : min_.y() + static_cast<double>(j) * dy_;
  return {x, y};
}

auto StructuredMesh::element_nodes(std::size_t element) const noexcept -> std::array<std::size_t, 4> {
  const auto i = element % nx_;
  const auto j = element / nx_;
  return {node_index(i, j), node_index(i + 1, j), node_index(i + 1, j + 1), node_index(i, j + 1)};
}

auto StructuredMesh::element_centroid(std::size_t element) const noexcept -> core::Point {
  const auto i = element % nx_;
  const auto j = element / nx_;
  return {min_.x() + (static_cast<double>(i) + 0.5) * dx_, min_.y() + (static_cast<double>(j) + 0.5) * dy_};
}

auto StructuredMesh::is_on_wall(std::size_t node, Wall wall) const noexcept -> bool {
  const auto i = node % (nx_ + 1);
  const auto j = node / (nx_ + 1);
  switch (wall) {
  case Wall::Bottom:
    return j == 0;
  case Wall::Top:
    return j == ny_;
  case Wall::Left:
    return i == 0;
  case Wall::Right:
    return i == nx_;
  }
  return false;
}

auto StructuredMesh::wall_nodes(Wall wall) const -> std::vector<std::size_t> {
  std::vector<std::size_t> nodes;
  switch (wall) {
  case Wall::Bottom:
  case Wall::Top: {
    const std::size_t j = (wall == Wall::Bottom) ? 0 : ny_;
    nodes.reserve(nx_ + 1);
    for (std::size_t i = 0; i <= nx_; ++i) {
      nodes.push_back(node_index(i, j));
    }
    break;
  }
  case Wall::Left:
  case Wall::Right: {
    const std::size_t i = (wall == Wall::Left) ? 0 : nx_;
    nodes.reserve(ny_ + 1);
    for (std::size_t j = 0; j <= ny_; ++j) {
      nodes.push_back(node_index(i, j));
    }
    break;
  }
  }
  return nodes;
}

auto StructuredMesh::contains(const core::Point& point) const noexcept -> bool {
  return point.x() >= min_.x() && point.x() <= max_.x() && point.y() >= min_.y() && point.y() <= max_.y();
}

auto StructuredMesh::clamp(const core::Point& point) const noexcept -> core::Point {
  return {std::clamp(point.x(), min_.x(), max_.x()), std::clamp(point.y(), min_.y(), max_.y())};
}

auto StructuredMesh::locate(const core::Point& point) const -> std::expected<ElementLocation, OutOfDomainError> {

  // NaN fails every comparison in contains(), so it is rejected here as well
  if (!contains(point)) {
    return std::unexpected(OutOfDomainError(
        std::format("point ({}, {}) outside [{}, {}] x [{}, {}]", point.x(), point.y(), min_.x(), max_.x(), min_.y(),
                    max_.y())));
  }

  const double sx = (point.x() - min_.x()) / dx_;
  const double sy = (point.y() - min_.y()) / dy_;

  const auto i = std::min(static_cast<std::size_t>(std::floor(sx)), nx_ - 1);
  const auto j = std::min(static_cast<std::size_t>(std::floor(sy)), ny_ - 1);

  // Local coordinates from the uniform spacing; always in [-1, 1] up to round-off
  const double xi = std::clamp(2.0 * (sx - static_cast<double>(i)) - 1.0, -1.0, 1.0);
  const double eta = std::clamp(2.0 * (sy - static_cast<double>(j)) - 1.0, -1.0, 1.0);

  return ElementLocation{element_index(i, j), xi, eta};
}

} // namespace mantle::mesh
