#pragma once
#include "../fields/nodal_field.hpp"
#include "../mesh/structured_mesh.hpp"

namespace mantle::simulation {

[[nodiscard]] auto max_nodal_speed(const fields::VectorField& velocity) noexcept -> double;

/**
 * @brief Courant-limited timestep cfl_factor * h / max|u|, with h the element characteristic length
 *
 * Interpolated speeds never exceed the largest nodal speed, so no particle moves further than
 * cfl_factor * h in one step. Returns max_timestep when the flow is at rest or slower.
 */
[[nodiscard]] auto compute_cfl_timestep(const mesh::StructuredMesh& mesh, const fields::VectorField& velocity,
                                        double cfl_factor, double max_timestep) noexcept -> double;

} // namespace mantle::simulation
