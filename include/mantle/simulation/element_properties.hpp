#pragma once
#include "../fields/nodal_field.hpp"
#include "../materials/material.hpp"
#include "../mesh/structured_mesh.hpp"
#include "../swarm/swarm.hpp"
#include "simulation_types.hpp"
#include <span>
#include <vector>

namespace mantle::simulation {

// Per-element inputs of the Stokes solve
struct ElementProperties {
  std::vector<double> fractions; // element-major, one entry per material
  std::vector<double> temperature;
  std::vector<double> density;
};

[[nodiscard]] auto compute_element_properties(const mesh::StructuredMesh& mesh,
                                              std::span<const materials::Material> materials,
                                              const swarm::Swarm& swarm, const fields::ScalarField& temperature)
    -> ElementProperties;

[[nodiscard]] auto evaluate_initial_temperature(const mesh::StructuredMesh& mesh,
                                                const InitialTemperature& initial) -> fields::ScalarField;

} // namespace mantle::simulation
