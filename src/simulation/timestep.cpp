#include "mantle/simulation/timestep.hpp"
#include <algorithm>
#include <cmath>

namespace mantle::simulation {

auto max_nodal_speed(const fields::VectorField& velocity) noexcept -> double {
  double speed = 0.0;
  for (std::size_t node = 0; node < velocity.node_count(); ++node) {
    speed = std::max(speed, velocity.value(node).norm());
  }
  return speed;
}

auto compute_cfl_timestep(const mesh::StructuredMesh& mesh, const fields::VectorField& velocity, double cfl_factor,
                          double max_timestep) noexcept -> double {
  const double speed = max_nodal_speed(velocity);
  if (speed <= 0.0) {
    return max_timestep;
  }
  return std::min(cfl_factor * mesh.characteristic_length() / speed, max_timestep);
}

} // namespace mantle::simulation
