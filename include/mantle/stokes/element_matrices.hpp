#pragma once
#include "../core/containers.hpp"
#include <array>

namespace mantle::stokes {

/**
 * @brief Reference Q1-Q1 element operators for a dx-by-dy element
 *
 * Velocity dofs are ordered 2a + c (node a, component c), pressure dofs by node a. Every element
 * of a uniform mesh shares these matrices; only the viscosity scaling and the stabilisation
 * parameter vary per element.
 */
struct StokesElementMatrices {
  core::FixedMathMatrix<8, 8> viscous;   // int B^T diag(2, 2, 1) B, unit viscosity
  core::FixedMathMatrix<8, 4> gradient;  // G_(a,c),b = -int dN_a/dx_c N_b
  core::FixedMathMatrix<4, 4> laplacian; // int grad N_a . grad N_b
  std::array<double, 4> shape_integral{};
  std::array<core::Point, 4> gradient_integral{};

  [[nodiscard]] static auto build(double dx, double dy) -> StokesElementMatrices;
};

} // namespace mantle::stokes
