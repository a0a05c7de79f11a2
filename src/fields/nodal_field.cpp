#include "mantle/fields/nodal_field.hpp"

namespace mantle::fields {

auto node_average_from_elements(const mesh::StructuredMesh& mesh, std::span<const double> element_values)
    -> ScalarField {

  ScalarField result = ScalarField::for_mesh(mesh);
  std::vector<double> weight(mesh.node_count(), 0.0);

  // Every element has the same area so plain counting is the area weight
  for (std::size_t e = 0; e < mesh.element_count(); ++e) {
    for (const auto node : mesh.element_nodes(e)) {
      result.component(node, 0) += element_values[e];
      weight[node] += 1.0;
    }
  }

  for (std::size_t n = 0; n < mesh.node_count(); ++n) {
    result.component(n, 0) /= weight[n];
  }

  return result;
}

auto element_centroid_values(const mesh::StructuredMesh& mesh, const ScalarField& field) -> std::vector<double> {
  std::vector<double> values(mesh.element_count(), 0.0);
  for (std::size_t e = 0; e < mesh.element_count(); ++e) {
    values[e] = field.interpolate(mesh, mesh::ElementLocation{e, 0.0, 0.0});
  }
  return values;
}

auto sample_profile(const mesh::StructuredMesh& mesh, const ScalarField& field, const core::Point& from,
                    const core::Point& to, std::size_t samples)
    -> std::expected<std::vector<double>, mesh::OutOfDomainError> {

  std::vector<double> profile;
  profile.reserve(samples);

  for (std::size_t k = 0; k < samples; ++k) {
    const double t = (samples > 1) ? static_cast<double>(k) / static_cast<double>(samples - 1) : 0.0;
    const core::Point point = from + t * (to - from);

    auto value = field.interpolate(mesh, point);
    if (!value) {
      return std::unexpected(value.error());
    }
    profile.push_back(value.value());
  }

  return profile;
}

} // namespace mantle::fields
