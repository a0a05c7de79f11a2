#pragma once
#include "../core/constants.hpp"
#include "../core/containers.hpp"
#include "solver_errors.hpp"
#include <expected>

namespace mantle::solver {

enum class LinearSolverKind {
  SparseLU, // direct, for the indefinite Stokes system
  BiCGSTAB  // iterative with incomplete LU, capped at max_iterations
};

struct LinearSolverSettings {
  LinearSolverKind kind = LinearSolverKind::SparseLU;
  int max_iterations = constants::iteration_limits::linear_solver_max;
  double tolerance = constants::tolerance::linear_solve;
};

struct LinearSolution {
  core::MathVector<double> x;
  int iterations = 0;
  double residual = 0.0; // ||Ax - b|| / ||b||
};

// Iterate reached before the failure, empty when the solver produced none
struct LinearSolveFailure {
  SolverError error;
  core::MathVector<double> last_iterate;
};

/**
 * @brief Solve A x = b
 * @param guess Starting iterate for BiCGSTAB, ignored by the direct solver
 * @return Solution, or a failure carrying NonConvergenceError when BiCGSTAB hits its cap, or LinearSolveError on a
 *         singular factorisation
 */
[[nodiscard]] auto solve_linear_system(const core::SparseMatrix& A, const core::MathVector<double>& b,
                                       const LinearSolverSettings& settings,
                                       const core::MathVector<double>* guess = nullptr)
    -> std::expected<LinearSolution, LinearSolveFailure>;

} // namespace mantle::solver
