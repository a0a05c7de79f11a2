#include "mantle/thermal/thermal_solver.hpp"
#include "mantle/fields/shape_functions.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace mantle::thermal {

ThermalSolver::ThermalSolver(const mesh::StructuredMesh& mesh, const fields::BoundaryConditionSet& bc,
                             double diffusivity, ThermalSettings settings)
    : mesh_(mesh), diffusivity_(diffusivity), settings_(std::move(settings)), constraints_(mesh.node_count()) {
  for (std::size_t node = 0; node < mesh_.node_count(); ++node) {
    constraints_[node] = bc.temperature_constraint(mesh_, node);
  }
}

auto ThermalSolver::solve(const fields::ScalarField& temperature, const fields::VectorField& velocity,
                          double dt) const -> std::expected<ThermalResult, ThermalFailure> {

  const auto n_nodes = mesh_.node_count();

  if (!std::isfinite(dt) || dt <= 0.0) {
    return std::unexpected(ThermalFailure{solver::SolverError(std::format("invalid timestep {}", dt)), std::nullopt});
  }
  if (!std::isfinite(diffusivity_) || diffusivity_ < 0.0) {
    return std::unexpected(
        ThermalFailure{solver::SolverError(std::format("invalid thermal diffusivity {}", diffusivity_)), std::nullopt});
  }
  if (temperature.node_count() != n_nodes || velocity.node_count() != n_nodes) {
    return std::unexpected(ThermalFailure{
        solver::SolverError(std::format("thermal inputs must hold one value per node ({} nodes)", n_nodes)),
        std::nullopt});
  }

  const double theta = settings_.theta;
  const double dx = mesh_.dx();
  const double dy = mesh_.dy();
  const double detj = fields::shape::jacobian(dx, dy);

  std::vector<core::Triplet> triplets;
  triplets.reserve(mesh_.element_count() * 16 + n_nodes);
  core::MathVector<double> rhs = core::MathVector<double>::Zero(static_cast<Eigen::Index>(n_nodes));

  core::FixedMathMatrix<4, 4> mass;
  core::FixedMathMatrix<4, 4> transport; // advection + diffusion
  core::FixedMathVector<double, 4> t_old;

  for (std::size_t e = 0; e < mesh_.element_count(); ++e) {
    const auto nodes = mesh_.element_nodes(e);

    std::array<core::Point, 4> u_nodes;
    core::Point u_centroid = core::Point::Zero();
    for (std::size_t a = 0; a < 4; ++a) {
      u_nodes[a] = velocity.value(nodes[a]);
      u_centroid += 0.25 * u_nodes[a];
      t_old[static_cast<Eigen::Index>(a)] = temperature.value(nodes[a]);
    }
    const double tau = settings_.supg ? supg_parameter(u_centroid, dx, dy, diffusivity_) : 0.0;

    mass.setZero();
    transport.setZero();

    for (const auto& qp : fields::shape::gauss_2x2) {
      const auto n = fields::shape::values(qp.xi, qp.eta);
      const auto grad = fields::shape::gradients(qp.xi, qp.eta, dx, dy);
      const double w = qp.weight * detj;

      core::Point u_q = core::Point::Zero();
      for (std::size_t a = 0; a < 4; ++a) {
        u_q += n[a] * u_nodes[a];
      }

      for (std::size_t a = 0; a < 4; ++a) {
        const double test = n[a] + tau * u_q.dot(grad[a]);
        for (std::size_t b = 0; b < 4; ++b) {
          mass(a, b) += w * test * n[b];
          transport(a, b) += w * (test * u_q.dot(grad[b]) + diffusivity_ * grad[a].dot(grad[b]));
        }
      }
    }

    const core::FixedMathMatrix<4, 4> lhs_e = mass + theta * dt * transport;
    const core::FixedMathVector<double, 4> rhs_e = (mass - (1.0 - theta) * dt * transport) * t_old;

    for (std::size_t a = 0; a < 4; ++a) {
      const auto row = nodes[a];
      if (constraints_[row]) {
        continue;
      }
      rhs[static_cast<Eigen::Index>(row)] += rhs_e[static_cast<Eigen::Index>(a)];
      for (std::size_t b = 0; b < 4; ++b) {
        const auto col = nodes[b];
        if (const auto& fixed = constraints_[col]) {
          rhs[static_cast<Eigen::Index>(row)] -= lhs_e(a, b) * fixed.value();
        } else {
          triplets.emplace_back(static_cast<int>(row), static_cast<int>(col), lhs_e(a, b));
        }
      }
    }
  }

  for (std::size_t node = 0; node < n_nodes; ++node) {
    if (const auto& fixed = constraints_[node]) {
      triplets.emplace_back(static_cast<int>(node), static_cast<int>(node), 1.0);
      rhs[static_cast<Eigen::Index>(node)] = fixed.value();
    }
  }

  core::SparseMatrix matrix(static_cast<Eigen::Index>(n_nodes), static_cast<Eigen::Index>(n_nodes));
  matrix.setFromTriplets(triplets.begin(), triplets.end());

  const Eigen::Map<const core::MathVector<double>> guess_view(temperature.data().data(),
                                                               static_cast<Eigen::Index>(n_nodes));
  const core::MathVector<double> guess = guess_view;

  auto to_field = [&](const core::MathVector<double>& x) {
    auto field = fields::ScalarField::for_mesh(mesh_);
    for (std::size_t node = 0; node < n_nodes; ++node) {
      field.set(node, x[static_cast<Eigen::Index>(node)]);
    }
    return field;
  };

  auto linear = solver::solve_linear_system(matrix, rhs, settings_.linear, &guess);
  if (!linear) {
    auto failure = std::move(linear.error());
    failure.error.add_context(std::format("thermal step dt={:.4e}", dt));
    std::optional<fields::ScalarField> last_iterate;
    if (failure.last_iterate.size() == static_cast<Eigen::Index>(n_nodes) && failure.last_iterate.allFinite()) {
      last_iterate = to_field(failure.last_iterate);
    }
    return std::unexpected(ThermalFailure{std::move(failure.error), std::move(last_iterate)});
  }

  if (settings_.verbose) {
    std::cout << std::format("[THERMAL] linear solve: {} iterations, residual {:.3e}", linear->iterations,
                             linear->residual)
              << std::endl;
  }

  return ThermalResult{to_field(linear->x), linear->iterations, linear->residual};
}

auto supg_parameter(const core::Point& velocity, double dx, double dy, double diffusivity) noexcept -> double {
  const double speed = velocity.norm();
  if (speed == 0.0) {
    return 0.0;
  }

  // Element length along the streamline
  const double h = speed / std::max(std::abs(velocity.x()) / dx, std::abs(velocity.y()) / dy);
  if (diffusivity == 0.0) {
    return h / (2.0 * speed);
  }

  const double peclet = speed * h / (2.0 * diffusivity);
  const double upwind = (peclet < constants::tolerance::small_peclet)
                            ? peclet / 3.0 - peclet * peclet * peclet / 45.0
                            : 1.0 / std::tanh(peclet) - 1.0 / peclet;
  return h / (2.0 * speed) * upwind;
}

auto total_heat(const mesh::StructuredMesh& mesh, const fields::ScalarField& temperature) -> double {
  const double weight = 0.25 * mesh.element_area();
  double heat = 0.0;
  for (std::size_t e = 0; e < mesh.element_count(); ++e) {
    for (const auto node : mesh.element_nodes(e)) {
      heat += weight * temperature.value(node);
    }
  }
  return heat;
}

} // namespace mantle::thermal
