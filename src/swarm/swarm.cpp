#include "mantle/swarm/swarm.hpp"
#include <algorithm>
#include <limits>
#include <random>

namespace mantle::swarm {

namespace {

[[nodiscard]] auto assign_material(std::span<const materials::Material> materials, const core::Point& point) -> int {
  int owner = -1;
  for (std::size_t m = 0; m < materials.size(); ++m) {
    if (materials::contains(materials[m].shape, point)) {
      owner = static_cast<int>(m);
    }
  }
  return owner;
}

} // namespace

auto Swarm::populate(const mesh::StructuredMesh& mesh, std::span<const materials::Material> materials,
                     const SwarmLayout& layout) -> std::expected<Swarm, core::ValidationError> {

  if (layout.particles_per_cell < 1) {
    return std::unexpected(core::ValidationError("swarm.particles_per_cell", "must be at least 1"));
  }
  if (materials.empty()) {
    return std::unexpected(core::ValidationError("materials", "at least one material is required"));
  }

  const auto ppc = static_cast<std::size_t>(layout.particles_per_cell);
  const double dx = mesh.dx();
  const double dy = mesh.dy();

  std::mt19937_64 generator(layout.seed);
  std::uniform_real_distribution<double> unit(0.0, 1.0);

  Swarm swarm;
  const auto capacity = mesh.element_count() * ppc * ppc;
  swarm.positions_.reserve(capacity);
  swarm.material_.reserve(capacity);
  swarm.active_.reserve(capacity);
  swarm.strain_rate_.reserve(capacity);
  swarm.stress_.reserve(capacity);

  for (std::size_t j = 0; j < mesh.elements_y(); ++j) {
    for (std::size_t i = 0; i < mesh.elements_x(); ++i) {
      const core::Point origin = mesh.node_coordinates(mesh.node_index(i, j));

      for (std::size_t q = 0; q < ppc; ++q) {
        for (std::size_t r = 0; r < ppc; ++r) {
          double sx = 0.0;
          double sy = 0.0;
          if (layout.layout == ParticleLayout::Regular) {
            sx = (static_cast<double>(r) + 0.5) / static_cast<double>(ppc);
            sy = (static_cast<double>(q) + 0.5) / static_cast<double>(ppc);
          } else {
            sx = unit(generator);
            sy = unit(generator);
          }

          const core::Point point(origin.x() + sx * dx, origin.y() + sy * dy);
          const int owner = assign_material(materials, point);
          if (owner >= 0) {
            swarm.add_particle(point, owner);
          }
        }
      }
    }
  }

  if (swarm.size() == 0) {
    return std::unexpected(core::ValidationError("materials", "no particle falls inside any material shape"));
  }

  return swarm;
}

auto Swarm::add_particle(const core::Point& position, int material) -> std::size_t {
  positions_.push_back(position);
  material_.push_back(material);
  active_.push_back(1);
  strain_rate_.push_back(0.0);
  stress_.push_back(0.0);
  return positions_.size() - 1;
}

auto Swarm::active_count() const noexcept -> std::size_t {
  return static_cast<std::size_t>(std::ranges::count(active_, std::uint8_t{1}));
}

auto Swarm::nearest_material(const core::Point& point) const -> int {
  int material = 0;
  double best = std::numeric_limits<double>::infinity();
  for (std::size_t p = 0; p < positions_.size(); ++p) {
    if (!active_[p]) {
      continue;
    }
    const double distance = (positions_[p] - point).squaredNorm();
    if (distance < best) {
      best = distance;
      material = material_[p];
    }
  }
  return material;
}

auto Swarm::material_fractions(const mesh::StructuredMesh& mesh, std::size_t n_materials) const
    -> std::vector<double> {

  const auto n_elements = mesh.element_count();
  std::vector<double> fractions(n_elements * n_materials, 0.0);
  std::vector<std::size_t> counts(n_elements, 0);

  for (std::size_t p = 0; p < positions_.size(); ++p) {
    if (!active_[p]) {
      continue;
    }
    auto location = mesh.locate(positions_[p]);
    if (!location) {
      continue; // active particles are kept inside the domain by advect()
    }
    const auto e = location->element;
    fractions[e * n_materials + static_cast<std::size_t>(material_[p])] += 1.0;
    ++counts[e];
  }

  for (std::size_t e = 0; e < n_elements; ++e) {
    if (counts[e] == 0) {
      fractions[e * n_materials + static_cast<std::size_t>(nearest_material(mesh.element_centroid(e)))] = 1.0;
      continue;
    }
    const double inv = 1.0 / static_cast<double>(counts[e]);
    for (std::size_t m = 0; m < n_materials; ++m) {
      fractions[e * n_materials + m] *= inv;
    }
  }

  return fractions;
}

auto Swarm::update_history(const mesh::StructuredMesh& mesh, std::span<const double> element_strain_rate,
                           std::span<const double> element_viscosity) -> void {
  for (std::size_t p = 0; p < positions_.size(); ++p) {
    if (!active_[p]) {
      continue;
    }
    if (auto location = mesh.locate(positions_[p])) {
      const auto e = location->element;
      strain_rate_[p] = element_strain_rate[e];
      stress_[p] = 2.0 * element_viscosity[e] * element_strain_rate[e];
    }
  }
}

auto Swarm::advect(const mesh::StructuredMesh& mesh, const fields::VectorField& velocity, double dt,
                   AdvectionScheme scheme, OutflowPolicy policy) -> AdvectionReport {

  AdvectionReport report;

  for (std::size_t p = 0; p < positions_.size(); ++p) {
    if (!active_[p]) {
      continue;
    }

    const core::Point start = positions_[p];
    auto start_location = mesh.locate(start);
    if (!start_location) {
      active_[p] = 0;
      ++report.deactivated;
      continue;
    }

    core::Point v = velocity.interpolate(mesh, start_location.value());
    if (scheme == AdvectionScheme::RungeKutta2) {
      // The midpoint is only a sampling location, so it is clamped rather than rejected
      auto midpoint = mesh.locate(mesh.clamp(start + 0.5 * dt * v));
      if (!midpoint) {
        active_[p] = 0;
        ++report.deactivated;
        continue;
      }
      v = velocity.interpolate(mesh, midpoint.value());
    }

    core::Point end = start + dt * v;

    if (!mesh.contains(end)) {
      if (policy == OutflowPolicy::Deactivate || !end.allFinite()) {
        active_[p] = 0;
        ++report.deactivated;
        continue;
      }
      end = mesh.clamp(end);
    }

    report.max_displacement = std::max(report.max_displacement, (end - start).norm());
    positions_[p] = end;
  }

  return report;
}

auto Swarm::position_snapshot() const -> std::vector<double> {
  std::vector<double> flat;
  flat.reserve(2 * positions_.size());
  for (const auto& position : positions_) {
    flat.push_back(position.x());
    flat.push_back(position.y());
  }
  return flat;
}

auto Swarm::active_snapshot() const -> std::vector<int> {
  return std::vector<int>(active_.begin(), active_.end());
}

auto Swarm::operator==(const Swarm& other) const -> bool {
  if (positions_.size() != other.positions_.size()) {
    return false;
  }
  for (std::size_t p = 0; p < positions_.size(); ++p) {
    if (positions_[p] != other.positions_[p]) {
      return false;
    }
  }
  return material_ == other.material_ && active_ == other.active_ && strain_rate_ == other.strain_rate_ &&
         stress_ == other.stress_;
}

} // namespace mantle::swarm
