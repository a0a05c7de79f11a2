#pragma once
#include "../core/constants.hpp"
#include "../core/containers.hpp"
#include <array>

namespace mantle::fields::shape {

// Reference coordinates of the four element nodes, counter-clockwise from (-1,-1)
inline constexpr std::array<double, 4> xi_nodes = {-1.0, 1.0, 1.0, -1.0};
inline constexpr std::array<double, 4> eta_nodes = {-1.0, -1.0, 1.0, 1.0};

struct QuadraturePoint {
  double xi;
  double eta;
  double weight;
};

// 2x2 Gauss rule, exact for the bilinear products assembled here
inline constexpr std::array<QuadraturePoint, 4> gauss_2x2 = {
    QuadraturePoint{-constants::math::gauss_2pt_abscissa, -constants::math::gauss_2pt_abscissa, 1.0},
    QuadraturePoint{constants::math::gauss_2pt_abscissa, -constants::math::gauss_2pt_abscissa, 1.0},
    QuadraturePoint{constants::math::gauss_2pt_abscissa, constants::math::gauss_2pt_abscissa, 1.0},
    QuadraturePoint{-constants::math::gauss_2pt_abscissa, constants::math::gauss_2pt_abscissa, 1.0}};

// N_a = (1 + xi_a xi)(1 + eta_a eta) / 4
[[nodiscard]] inline auto values(double xi, double eta) noexcept -> std::array<double, 4> {
  std::array<double, 4> n{};
  for (std::size_t a = 0; a < 4; ++a) {
    n[a] = 0.25 * (1.0 + xi_nodes[a] * xi) * (1.0 + eta_nodes[a] * eta);
  }
  return n;
}

// Physical-space gradients on an axis-aligned dx-by-dy element
[[nodiscard]] inline auto gradients(double xi, double eta, double dx, double dy) noexcept
    -> std::array<core::Point, 4> {
  std::array<core::Point, 4> grad{};
  for (std::size_t a = 0; a < 4; ++a) {
    const double dn_dxi = 0.25 * xi_nodes[a] * (1.0 + eta_nodes[a] * eta);
    const double dn_deta = 0.25 * eta_nodes[a] * (1.0 + xi_nodes[a] * xi);
    grad[a] = core::Point(dn_dxi * 2.0 / dx, dn_deta * 2.0 / dy);
  }
  return grad;
}

// Jacobian determinant of the reference-to-physical map
[[nodiscard]] inline constexpr auto jacobian(double dx, double dy) noexcept -> double { return 0.25 * dx * dy; }

} // namespace mantle::fields::shape
