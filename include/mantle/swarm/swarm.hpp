#pragma once
#include "../core/constants.hpp"
#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include "../fields/nodal_field.hpp"
#include "../materials/material.hpp"
#include "../mesh/structured_mesh.hpp"
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace mantle::swarm {

enum class ParticleLayout { Regular, Random };

// Held fixed for a whole run
enum class AdvectionScheme { ForwardEuler, RungeKutta2 };

// What happens to a particle whose new position leaves the domain
enum class OutflowPolicy { Deactivate, Clamp };

struct SwarmLayout {
  ParticleLayout layout = ParticleLayout::Regular;
  int particles_per_cell = constants::discretisation::default_particles_per_cell; // per axis
  std::uint64_t seed = constants::swarm::default_seed;
};

struct AdvectionReport {
  std::size_t deactivated = 0;
  double max_displacement = 0.0;
};

/**
 * @brief Material tracer particles in structure-of-arrays storage
 *
 * Indices are stable for the lifetime of the swarm: particles leaving the domain are marked
 * inactive, never erased. Per-particle loops only write their own slot.
 */
class Swarm {
private:
  std::vector<core::Point> positions_;
  std::vector<int> material_;
  std::vector<std::uint8_t> active_;
  std::vector<double> strain_rate_; // edot_II from the last converged solve
  std::vector<double> stress_;      // sigma_II = 2 eta edot_II

public:
  Swarm() = default;

  /**
   * @brief Fill the mesh with particles and tag them with the last material whose shape contains them
   *
   * Sample points covered by no shape are skipped.
   */
  [[nodiscard]] static auto populate(const mesh::StructuredMesh& mesh, std::span<const materials::Material> materials,
                                     const SwarmLayout& layout) -> std::expected<Swarm, core::ValidationError>;

  auto add_particle(const core::Point& position, int material) -> std::size_t;

  [[nodiscard]] auto size() const noexcept -> std::size_t { return positions_.size(); }
  [[nodiscard]] auto active_count() const noexcept -> std::size_t;

  [[nodiscard]] auto position(std::size_t p) const noexcept -> const core::Point& { return positions_[p]; }
  [[nodiscard]] auto material(std::size_t p) const noexcept -> int { return material_[p]; }
  [[nodiscard]] auto is_active(std::size_t p) const noexcept -> bool { return active_[p] != 0; }
  [[nodiscard]] auto strain_rate(std::size_t p) const noexcept -> double { return strain_rate_[p]; }
  [[nodiscard]] auto stress(std::size_t p) const noexcept -> double { return stress_[p]; }

  auto deactivate(std::size_t p) noexcept -> void { active_[p] = 0; }

  // Material of the active particle closest to point (first one on ties), 0 without active particles
  [[nodiscard]] auto nearest_material(const core::Point& point) const -> int;

  template <typename Visitor>
  auto for_each_active(Visitor&& visitor) const -> void {
    for (std::size_t p = 0; p < positions_.size(); ++p) {
      if (active_[p]) {
        visitor(p, positions_[p], material_[p]);
      }
    }
  }

  /**
   * @brief Volume fraction of each material per element, element-major
   *
   * An element holding no active particle takes the material of the active particle nearest to
   * its centroid, or material 0 when the swarm has no active particle left.
   */
  [[nodiscard]] auto material_fractions(const mesh::StructuredMesh& mesh, std::size_t n_materials) const
      -> std::vector<double>;

  // Copy element strain-rate and stress into the particle history cache
  auto update_history(const mesh::StructuredMesh& mesh, std::span<const double> element_strain_rate,
                      std::span<const double> element_viscosity) -> void;

  // x = x0 + dt * v(x0) or the midpoint rule, with out-of-domain handling per policy
  auto advect(const mesh::StructuredMesh& mesh, const fields::VectorField& velocity, double dt,
              AdvectionScheme scheme, OutflowPolicy policy) -> AdvectionReport;

  // Flattened (x0, y0, x1, y1, ...) positions of every particle, active or not
  [[nodiscard]] auto position_snapshot() const -> std::vector<double>;
  [[nodiscard]] auto material_snapshot() const -> std::vector<int> { return material_; }
  [[nodiscard]] auto active_snapshot() const -> std::vector<int>;
  [[nodiscard]] auto strain_rate_snapshot() const -> std::vector<double> { return strain_rate_; }
  [[nodiscard]] auto stress_snapshot() const -> std::vector<double> { return stress_; }

  [[nodiscard]] auto operator==(const Swarm& other) const -> bool;
};

} // namespace mantle::swarm
