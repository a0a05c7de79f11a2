#include "mantle/simulation/element_properties.hpp"
#include "mantle/core/constants.hpp"
#include "mantle/core/overloaded.hpp"
#include <cmath>

namespace mantle::simulation {

auto compute_element_properties(const mesh::StructuredMesh& mesh, std::span<const materials::Material> materials,
                                const swarm::Swarm& swarm, const fields::ScalarField& temperature)
    -> ElementProperties {

  ElementProperties props;
  props.fractions = swarm.material_fractions(mesh, materials.size());
  props.temperature = fields::element_centroid_values(mesh, temperature);
  props.density.assign(mesh.element_count(), 0.0);

  const auto n_materials = materials.size();
  for (std::size_t e = 0; e < mesh.element_count(); ++e) {
    double rho = 0.0;
    for (std::size_t m = 0; m < n_materials; ++m) {
      const double f = props.fractions[e * n_materials + m];
      if (f > 0.0) {
        rho += f * materials[m].density_at(props.temperature[e]);
      }
    }
    props.density[e] = rho;
  }

  return props;
}

auto evaluate_initial_temperature(const mesh::StructuredMesh& mesh, const InitialTemperature& initial)
    -> fields::ScalarField {

  const core::Point origin = mesh.min_corner();
  const core::Point extent = mesh.max_corner() - mesh.min_corner();

  const auto profile = std::visit(
      core::overloaded{
          [](const UniformTemperature& t) -> std::function<double(const core::Point&)> {
            return [value = t.value](const core::Point&) { return value; };
          },
          [&](const LinearTemperature& t) -> std::function<double(const core::Point&)> {
            return [t, origin, extent](const core::Point& x) {
              const double xn = (x.x() - origin.x()) / extent.x();
              const double yn = (x.y() - origin.y()) / extent.y();
              const double k = static_cast<double>(t.perturbation_wavenumber);
              return t.bottom + (t.top - t.bottom) * yn +
                     t.perturbation_amplitude * std::cos(k * constants::math::pi * xn) *
                         std::sin(constants::math::pi * yn);
            };
          },
          [](const StepTemperature& t) -> std::function<double(const core::Point&)> {
            return [t](const core::Point& x) { return (x[t.axis == 0 ? 0 : 1] < t.position) ? t.low : t.high; };
          },
          [](const CustomTemperature& t) -> std::function<double(const core::Point&)> { return t.function; }},
      initial);

  auto field = fields::ScalarField::for_mesh(mesh);
  for (std::size_t node = 0; node < mesh.node_count(); ++node) {
    field.set(node, profile(mesh.node_coordinates(node)));
  }
  return field;
}

} // namespace mantle::simulation
