#pragma once
#include <Eigen/Dense>
#include <Eigen/Sparse>

namespace mantle::core {

template <typename Scalar = double>
using MathVector = Eigen::Vector<Scalar, Eigen::Dynamic>;

template <typename Scalar = double, int Size = Eigen::Dynamic>
using FixedMathVector = Eigen::Vector<Scalar, Size>;

template <typename Scalar = double>
using MathMatrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

template <int Rows, int Cols, typename Scalar = double>
using FixedMathMatrix = Eigen::Matrix<Scalar, Rows, Cols>;

// World coordinate / 2-vector
using Point = Eigen::Vector2d;

using SparseMatrix = Eigen::SparseMatrix<double>;
using Triplet = Eigen::Triplet<double>;

} // namespace mantle::core
