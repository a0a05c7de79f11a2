#include "mantle/stokes/stokes_solver.hpp"
#include "mantle/fields/shape_functions.hpp"
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <format>
#include <iostream>
#include <limits>

namespace mantle::stokes {

namespace {

[[nodiscard]] auto relative_change(std::span<const double> updated, std::span<const double> previous) -> double {
  const Eigen::Map<const core::MathVector<double>> a(updated.data(), static_cast<Eigen::Index>(updated.size()));
  const Eigen::Map<const core::MathVector<double>> b(previous.data(), static_cast<Eigen::Index>(previous.size()));
  return (a - b).norm() / std::max(a.norm(), DBL_MIN);
}

} // namespace

StokesSolver::StokesSolver(const mesh::StructuredMesh& mesh, const fields::BoundaryConditionSet& bc,
                           StokesSettings settings)
    : mesh_(mesh), settings_(std::move(settings)), reference_(StokesElementMatrices::build(mesh.dx(), mesh.dy())),
      constraints_(constants::discretisation::stokes_dofs_per_node * mesh.node_count()) {

  for (std::size_t node = 0; node < mesh_.node_count(); ++node) {
    for (int c = 0; c < 2; ++c) {
      constraints_[dof(node, c)] = bc.velocity_constraint(mesh_, node, c);
    }
  }

  // Enclosed flow determines pressure only up to a constant
  if (!bc.has_free_normal_velocity()) {
    constraints_[dof(0, 2)] = 0.0;
    pressure_pinned_ = true;
  }
}

auto StokesSolver::assemble(std::span<const double> viscosity, std::span<const double> density,
                            const core::Point& gravity) const -> LinearSystem {

  const auto n_dofs = constraints_.size();
  const double h = std::max(mesh_.dx(), mesh_.dy());

  std::vector<core::Triplet> triplets;
  triplets.reserve(mesh_.element_count() * 144 + n_dofs);

  LinearSystem system;
  system.rhs = core::MathVector<double>::Zero(static_cast<Eigen::Index>(n_dofs));

  core::FixedMathMatrix<12, 12> ke;
  core::FixedMathVector<double, 12> fe;

  for (std::size_t e = 0; e < mesh_.element_count(); ++e) {
    const auto nodes = mesh_.element_nodes(e);
    const double eta = viscosity[e];
    const double tau = settings_.pressure_stabilisation * h * h / eta;
    const core::Point body_force = density[e] * gravity;

    ke.setZero();
    fe.setZero();

    for (std::size_t a = 0; a < 4; ++a) {
      for (std::size_t b = 0; b < 4; ++b) {
        for (std::size_t c = 0; c < 2; ++c) {
          for (std::size_t d = 0; d < 2; ++d) {
            ke(3 * a + c, 3 * b + d) = eta * reference_.viscous(2 * a + c, 2 * b + d);
          }
          ke(3 * a + c, 3 * b + 2) = reference_.gradient(2 * a + c, b);
          ke(3 * b + 2, 3 * a + c) = reference_.gradient(2 * a + c, b);
        }
        ke(3 * a + 2, 3 * b + 2) = -tau * reference_.laplacian(a, b);
      }
      fe(3 * a) = body_force.x() * reference_.shape_integral[a];
      fe(3 * a + 1) = body_force.y() * reference_.shape_integral[a];
      fe(3 * a + 2) = -tau * body_force.dot(reference_.gradient_integral[a]);
    }

    // Scatter, moving prescribed columns to the right-hand side
    for (std::size_t r = 0; r < 12; ++r) {
      const auto row = dof(nodes[r / 3], static_cast<int>(r % 3));
      if (constraints_[row]) {
        continue;
      }
      for (std::size_t s = 0; s < 12; ++s) {
        const auto col = dof(nodes[s / 3], static_cast<int>(s % 3));
        if (const auto& fixed = constraints_[col]) {
          system.rhs[static_cast<Eigen::Index>(row)] -= ke(r, s) * fixed.value();
        } else {
          triplets.emplace_back(static_cast<int>(row), static_cast<int>(col), ke(r, s));
        }
      }
      system.rhs[static_cast<Eigen::Index>(row)] += fe(r);
    }
  }

  for (std::size_t i = 0; i < n_dofs; ++i) {
    if (const auto& fixed = constraints_[i]) {
      triplets.emplace_back(static_cast<int>(i), static_cast<int>(i), 1.0);
      system.rhs[static_cast<Eigen::Index>(i)] = fixed.value();
    }
  }

  system.matrix.resize(static_cast<Eigen::Index>(n_dofs), static_cast<Eigen::Index>(n_dofs));
  system.matrix.setFromTriplets(triplets.begin(), triplets.end());
  return system;
}

auto StokesSolver::unpack(const core::MathVector<double>& x) const
    -> std::pair<fields::VectorField, fields::ScalarField> {

  auto velocity = fields::VectorField::for_mesh(mesh_);
  auto pressure = fields::ScalarField::for_mesh(mesh_);
  for (std::size_t node = 0; node < mesh_.node_count(); ++node) {
    velocity.set(node, core::Point(x[static_cast<Eigen::Index>(dof(node, 0))],
                                   x[static_cast<Eigen::Index>(dof(node, 1))]));
    pressure.set(node, x[static_cast<Eigen::Index>(dof(node, 2))]);
  }
  return {std::move(velocity), std::move(pressure)};
}

auto StokesSolver::remove_mean_pressure(fields::ScalarField& pressure) const -> void {
  double integral = 0.0;
  for (std::size_t e = 0; e < mesh_.element_count(); ++e) {
    const auto nodes = mesh_.element_nodes(e);
    for (std::size_t a = 0; a < 4; ++a) {
      integral += reference_.shape_integral[a] * pressure.value(nodes[a]);
    }
  }
  const double mean = integral / mesh_.domain_area();
  for (auto& p : pressure.data()) {
    p -= mean;
  }
}

auto StokesSolver::solve(const materials::ElementViscosityModel& model, std::span<const double> density,
                         const core::Point& gravity, std::span<const double> strain_rate_guess,
                         std::span<const double> pressure_guess) const
    -> std::expected<StokesSolution, StokesFailure> {

  const auto n_elements = mesh_.element_count();

  if (model.element_count() != n_elements || density.size() != n_elements ||
      (!strain_rate_guess.empty() && strain_rate_guess.size() != n_elements) ||
      (!pressure_guess.empty() && pressure_guess.size() != n_elements)) {
    return std::unexpected(StokesFailure{
        solver::SolverError(std::format("Stokes inputs must hold one value per element ({} elements)", n_elements)),
        std::nullopt});
  }

  std::vector<double> strain_rate = strain_rate_guess.empty()
                                        ? std::vector<double>(n_elements, settings_.reference_strain_rate)
                                        : std::vector<double>(strain_rate_guess.begin(), strain_rate_guess.end());
  std::vector<double> element_pressure = pressure_guess.empty()
                                             ? std::vector<double>(n_elements, 0.0)
                                             : std::vector<double>(pressure_guess.begin(), pressure_guess.end());

  auto initial_viscosity = model.evaluate(strain_rate, element_pressure);
  if (!initial_viscosity) {
    auto error = initial_viscosity.error();
    error.add_context("initial viscosity evaluation");
    return std::unexpected(StokesFailure{std::move(error), std::nullopt});
  }
  std::vector<double> eta_used = std::move(initial_viscosity.value());

  const bool single_pass = model.is_velocity_independent();
  std::optional<StokesSolution> last_iterate;

  for (int iter = 1; iter <= settings_.max_iterations; ++iter) {
    const auto system = assemble(eta_used, density, gravity);

    auto linear = solver::solve_linear_system(system.matrix, system.rhs, settings_.linear);
    if (!linear) {
      auto error = linear.error().error;
      error.add_context(std::format("Stokes Picard iteration {}", iter));
      return std::unexpected(StokesFailure{std::move(error), std::move(last_iterate)});
    }

    auto [velocity, pressure] = unpack(linear->x);
    if (pressure_pinned_) {
      remove_mean_pressure(pressure);
    }

    StokesSolution candidate;
    candidate.element_strain_rate = element_strain_rates(mesh_, velocity);
    candidate.iterations = iter;

    if (single_pass) {
      candidate.velocity = std::move(velocity);
      candidate.pressure = std::move(pressure);
      candidate.element_viscosity = std::move(eta_used);
      candidate.residual = linear->residual;
      candidate.converged = true;
      return candidate;
    }

    element_pressure = fields::element_centroid_values(mesh_, pressure);
    auto updated = model.evaluate(candidate.element_strain_rate, element_pressure);
    if (!updated) {
      auto error = updated.error();
      error.add_context(std::format("Stokes Picard iteration {}", iter));
      return std::unexpected(StokesFailure{std::move(error), std::move(last_iterate)});
    }
    std::vector<double> eta_new = std::move(updated.value());

    PicardChange change;
    change.viscosity = relative_change(eta_new, eta_used);
    change.velocity = last_iterate ? relative_change(velocity.data(), last_iterate->velocity.data())
                                   : std::numeric_limits<double>::infinity();

    if (settings_.verbose) {
      std::cout << std::format("[STOKES] Picard {:3d}: viscosity change {:.3e}, velocity change {:.3e}", iter,
                               change.viscosity, change.velocity)
                << std::endl;
    }

    candidate.velocity = std::move(velocity);
    candidate.pressure = std::move(pressure);
    candidate.element_viscosity = eta_new;
    candidate.residual = change.residual();
    candidate.converged = candidate.residual < settings_.tolerance;

    if (candidate.converged) {
      return candidate;
    }

    for (std::size_t e = 0; e < n_elements; ++e) {
      eta_used[e] += settings_.relaxation * (eta_new[e] - eta_used[e]);
    }
    last_iterate = std::move(candidate);
  }

  const double residual = last_iterate ? last_iterate->residual : std::numeric_limits<double>::infinity();
  return std::unexpected(StokesFailure{
      solver::NonConvergenceError("Stokes Picard iteration", settings_.max_iterations, residual),
      std::move(last_iterate)});
}

auto element_strain_rates(const mesh::StructuredMesh& mesh, const fields::VectorField& velocity)
    -> std::vector<double> {

  const auto grad = fields::shape::gradients(0.0, 0.0, mesh.dx(), mesh.dy());
  std::vector<double> strain_rate(mesh.element_count(), 0.0);

  for (std::size_t e = 0; e < mesh.element_count(); ++e) {
    const auto nodes = mesh.element_nodes(e);
    double dux_dx = 0.0, dux_dy = 0.0, duy_dx = 0.0, duy_dy = 0.0;
    for (std::size_t a = 0; a < 4; ++a) {
      const auto u = velocity.value(nodes[a]);
      dux_dx += grad[a].x() * u.x();
      dux_dy += grad[a].y() * u.x();
      duy_dx += grad[a].x() * u.y();
      duy_dy += grad[a].y() * u.y();
    }
    const double exy = 0.5 * (dux_dy + duy_dx);
    strain_rate[e] = std::sqrt(0.5 * (dux_dx * dux_dx + duy_dy * duy_dy) + exy * exy);
  }

  return strain_rate;
}

auto integrated_divergence(const mesh::StructuredMesh& mesh, const fields::VectorField& velocity) -> double {
  // The integral of grad N_a over an element is exact for bilinear shape functions
  std::array<core::Point, 4> gradient_integral{};
  for (auto& g : gradient_integral) {
    g.setZero();
  }
  const double detj = fields::shape::jacobian(mesh.dx(), mesh.dy());
  for (const auto& qp : fields::shape::gauss_2x2) {
    const auto grad = fields::shape::gradients(qp.xi, qp.eta, mesh.dx(), mesh.dy());
    for (std::size_t a = 0; a < 4; ++a) {
      gradient_integral[a] += qp.weight * detj * grad[a];
    }
  }

  double total = 0.0;
  for (std::size_t e = 0; e < mesh.element_count(); ++e) {
    const auto nodes = mesh.element_nodes(e);
    for (std::size_t a = 0; a < 4; ++a) {
      total += gradient_integral[a].dot(velocity.value(nodes[a]));
    }
  }
  return total;
}

} // namespace mantle::stokes
