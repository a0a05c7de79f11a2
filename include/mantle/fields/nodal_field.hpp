#pragma once
#include "../core/containers.hpp"
#include "../mesh/structured_mesh.hpp"
#include "shape_functions.hpp"
#include <expected>
#include <span>
#include <type_traits>
#include <vector>

namespace mantle::fields {

/**
 * @brief One value per mesh node, scalar (Components == 1) or vector (Components == 2)
 *
 * Storage is flat and node-major (node * Components + component) so the raw array can be
 * handed out as an opaque snapshot.
 */
template <int Components>
class NodalField {
  static_assert(Components == 1 || Components == 2, "Nodal fields are scalar or 2-vector");

public:
  using Value = std::conditional_t<Components == 1, double, core::Point>;

private:
  std::vector<double> data_;

public:
  NodalField() = default;
  explicit NodalField(std::size_t node_count, double fill_value = 0.0)
      : data_(node_count * Components, fill_value) {}

  [[nodiscard]] static auto for_mesh(const mesh::StructuredMesh& mesh, double fill_value = 0.0) -> NodalField {
    return NodalField(mesh.node_count(), fill_value);
  }

  [[nodiscard]] static constexpr auto components() noexcept -> int { return Components; }
  [[nodiscard]] auto node_count() const noexcept -> std::size_t { return data_.size() / Components; }

  [[nodiscard]] auto value(std::size_t node) const noexcept -> Value {
    if constexpr (Components == 1) {
      return data_[node];
    } else {
      return core::Point(data_[2 * node], data_[2 * node + 1]);
    }
  }

  auto set(std::size_t node, const Value& value) noexcept -> void {
    if constexpr (Components == 1) {
      data_[node] = value;
    } else {
      data_[2 * node] = value.x();
      data_[2 * node + 1] = value.y();
    }
  }

  [[nodiscard]] auto component(std::size_t node, int c) const noexcept -> double {
    return data_[node * Components + static_cast<std::size_t>(c)];
  }
  auto component(std::size_t node, int c) noexcept -> double& {
    return data_[node * Components + static_cast<std::size_t>(c)];
  }

  auto fill(const Value& value) noexcept -> void {
    for (std::size_t n = 0; n < node_count(); ++n) {
      set(n, value);
    }
  }

  [[nodiscard]] auto data() const noexcept -> std::span<const double> { return data_; }
  [[nodiscard]] auto data() noexcept -> std::span<double> { return data_; }

  // Bilinear interpolation inside an already-located element
  [[nodiscard]] auto interpolate(const mesh::StructuredMesh& mesh, const mesh::ElementLocation& location) const noexcept
      -> Value {
    const auto nodes = mesh.element_nodes(location.element);
    const auto n = shape::values(location.xi, location.eta);
    Value result{};
    if constexpr (Components == 1) {
      result = 0.0;
    } else {
      result.setZero();
    }
    for (std::size_t a = 0; a < 4; ++a) {
      result += n[a] * value(nodes[a]);
    }
    return result;
  }

  [[nodiscard]] auto interpolate(const mesh::StructuredMesh& mesh, const core::Point& point) const
      -> std::expected<Value, mesh::OutOfDomainError> {
    auto location = mesh.locate(point);
    if (!location) {
      return std::unexpected(location.error());
    }
    return interpolate(mesh, location.value());
  }

  [[nodiscard]] auto operator==(const NodalField&) const -> bool = default;
};

using ScalarField = NodalField<1>;
using VectorField = NodalField<2>;

// Area-weighted nodal average of a per-element quantity
[[nodiscard]] auto node_average_from_elements(const mesh::StructuredMesh& mesh, std::span<const double> element_values)
    -> ScalarField;

// Per-element value of a scalar field at the element centroid
[[nodiscard]] auto element_centroid_values(const mesh::StructuredMesh& mesh, const ScalarField& field)
    -> std::vector<double>;

// Samples `samples` evenly spaced points on the segment [from, to]
[[nodiscard]] auto sample_profile(const mesh::StructuredMesh& mesh, const ScalarField& field, const core::Point& from,
                                  const core::Point& to, std::size_t samples)
    -> std::expected<std::vector<double>, mesh::OutOfDomainError>;

} // namespace mantle::fields
