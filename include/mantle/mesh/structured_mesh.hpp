#pragma once
#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include <array>
#include <cstddef>
#include <expected>
#include <vector>

namespace mantle::mesh {

class OutOfDomainError : public core::MantleException {
public:
  explicit OutOfDomainError(std::string_view message, std::source_location location = std::source_location::current())
      : MantleException(std::format("Out of domain: {}", message), location) {}
};

enum class Wall { Bottom, Top, Left, Right };

inline constexpr std::array<Wall, 4> all_walls = {Wall::Bottom, Wall::Top, Wall::Left, Wall::Right};

[[nodiscard]] auto wall_name(Wall wall) noexcept -> const char*;

// Containing element and local coordinates (xi, eta) in [-1, 1]^2
struct ElementLocation {
  std::size_t element = 0;
  double xi = 0.0;
  double eta = 0.0;
};

/**
 * @brief Uniform structured quadrilateral mesh over a rectangle
 *
 * Node n = j*(nx+1) + i sits at (min_x + i*dx, min_y + j*dy). Element e = j*nx + i owns the
 * nodes (i,j), (i+1,j), (i+1,j+1), (i,j+1) in counter-clockwise order.
 */
class StructuredMesh {
private:
  std::size_t nx_;
  std::size_t ny_;
  core::Point min_;
  core::Point max_;
  double dx_;
  double dy_;

  StructuredMesh(std::size_t nx, std::size_t ny, const core::Point& min, const core::Point& max) noexcept
      : nx_(nx), ny_(ny), min_(min), max_(max), dx_((max.x() - min.x()) / static_cast<double>(nx)),
        dy_((max.y() - min.y()) / static_cast<double>(ny)) {}

public:
  [[nodiscard]] static auto create(const std::array<int, 2>& element_resolution, const core::Point& min_coord,
                                   const core::Point& max_coord) -> std::expected<StructuredMesh, core::GeometryError>;

  [[nodiscard]] auto elements_x() const noexcept -> std::size_t { return nx_; }
  [[nodiscard]] auto elements_y() const noexcept -> std::size_t { return ny_; }
  [[nodiscard]] auto nodes_x() const noexcept -> std::size_t { return nx_ + 1; }
  [[nodiscard]] auto nodes_y() const noexcept -> std::size_t { return ny_ + 1; }
  [[nodiscard]] auto node_count() const noexcept -> std::size_t { return (nx_ + 1) * (ny_ + 1); }
  [[nodiscard]] auto element_count() const noexcept -> std::size_t { return nx_ * ny_; }

  [[nodiscard]] auto min_corner() const noexcept -> const core::Point& { return min_; }
  [[nodiscard]] auto max_corner() const noexcept -> const core::Point& { return max_; }

  [[nodiscard]] auto dx() const noexcept -> double { return dx_; }
  [[nodiscard]] auto dy() const noexcept -> double { return dy_; }
  [[nodiscard]] auto element_size() const noexcept -> core::Point { return core::Point(dx_, dy_); }
  [[nodiscard]] auto element_area() const noexcept -> double { return dx_ * dy_; }
  [[nodiscard]] auto domain_area() const noexcept -> double {
    return (max_.x() - min_.x()) * (max_.y() - min_.y());
  }

  // Smallest edge length of an element
  [[nodiscard]] auto characteristic_length() const noexcept -> double { return dx_ < dy_ ? dx_ : dy_; }

  [[nodiscard]] auto node_index(std::size_t i, std::size_t j) const noexcept -> std::size_t {
    return j * (nx_ + 1) + i;
  }
  [[nodiscard]] auto element_index(std::size_t i, std::size_t j) const noexcept -> std::size_t { return j * nx_ + i; }

  [[nodiscard]] auto node_coordinates(std::size_t node) const noexcept -> core::Point;
  [[nodiscard]] auto element_nodes(std::size_t element) const noexcept -> std::array<std::size_t, 4>;
  [[nodiscard]] auto element_centroid(std::size_t element) const noexcept -> core::Point;

  [[nodiscard]] auto is_on_wall(std::size_t node, Wall wall) const noexcept -> bool;
  [[nodiscard]] auto wall_nodes(Wall wall) const -> std::vector<std::size_t>;

  [[nodiscard]] auto contains(const core::Point& point) const noexcept -> bool;
  [[nodiscard]] auto clamp(const core::Point& point) const noexcept -> core::Point;

  // Points on the upper bounds belong to the last element along that axis
  [[nodiscard]] auto locate(const core::Point& point) const -> std::expected<ElementLocation, OutOfDomainError>;
};

} // namespace mantle::mesh
