#include "mantle/stokes/element_matrices.hpp"
#include "mantle/fields/shape_functions.hpp"

namespace mantle::stokes {

auto StokesElementMatrices::build(double dx, double dy) -> StokesElementMatrices {
  namespace shape = fields::shape;

  StokesElementMatrices m;
  m.viscous.setZero();
  m.gradient.setZero();
  m.laplacian.setZero();
  for (std::size_t a = 0; a < 4; ++a) {
    m.shape_integral[a] = 0.0;
    m.gradient_integral[a].setZero();
  }

  const double detj = shape::jacobian(dx, dy);

  for (const auto& qp : shape::gauss_2x2) {
    const auto n = shape::values(qp.xi, qp.eta);
    const auto grad = shape::gradients(qp.xi, qp.eta, dx, dy);
    const double w = qp.weight * detj;

    // Strain-rate operator rows: edot_xx, edot_yy, gamma_xy
    core::FixedMathMatrix<3, 8> B = core::FixedMathMatrix<3, 8>::Zero();
    for (std::size_t a = 0; a < 4; ++a) {
      B(0, 2 * a) = grad[a].x();
      B(1, 2 * a + 1) = grad[a].y();
      B(2, 2 * a) = grad[a].y();
      B(2, 2 * a + 1) = grad[a].x();
    }
    const Eigen::Vector3d D(2.0, 2.0, 1.0);
    m.viscous.noalias() += w * B.transpose() * D.asDiagonal() * B;

    for (std::size_t a = 0; a < 4; ++a) {
      for (std::size_t b = 0; b < 4; ++b) {
        m.gradient(2 * a, b) -= w * grad[a].x() * n[b];
        m.gradient(2 * a + 1, b) -= w * grad[a].y() * n[b];
        m.laplacian(a, b) += w * grad[a].dot(grad[b]);
      }
      m.shape_integral[a] += w * n[a];
      m.gradient_integral[a] += w * grad[a];
    }
  }

  return m;
}

} // namespace mantle::stokes
