#include "mantle/solver/linear_solver.hpp"
#include <Eigen/IterativeLinearSolvers>
#include <Eigen/SparseLU>
#include <cmath>
#include <format>

namespace mantle::solver {

namespace {

[[nodiscard]] auto relative_residual(const core::SparseMatrix& A, const core::MathVector<double>& x,
                                     const core::MathVector<double>& b) -> double {
  const double b_norm = b.norm();
  const double r_norm = (A * x - b).norm();
  return (b_norm > 0.0) ? r_norm / b_norm : r_norm;
}

[[nodiscard]] auto solve_direct(const core::SparseMatrix& A, const core::MathVector<double>& b)
    -> std::expected<LinearSolution, LinearSolveFailure> {

  Eigen::SparseLU<core::SparseMatrix, Eigen::COLAMDOrdering<int>> lu;
  lu.analyzePattern(A);
  lu.factorize(A);
  if (lu.info() != Eigen::Success) {
    return std::unexpected(LinearSolveFailure{
        LinearSolveError(std::format("sparse LU factorisation failed: {}", lu.lastErrorMessage())), {}});
  }

  LinearSolution solution;
  solution.x = lu.solve(b);
  if (lu.info() != Eigen::Success || !solution.x.allFinite()) {
    return std::unexpected(LinearSolveFailure{LinearSolveError("sparse LU back-substitution failed"), {}});
  }
  solution.iterations = 1;
  solution.residual = relative_residual(A, solution.x, b);
  return solution;
}

[[nodiscard]] auto solve_iterative(const core::SparseMatrix& A, const core::MathVector<double>& b,
                                   const LinearSolverSettings& settings, const core::MathVector<double>* guess)
    -> std::expected<LinearSolution, LinearSolveFailure> {

  Eigen::BiCGSTAB<core::SparseMatrix, Eigen::IncompleteLUT<double>> bicgstab;
  bicgstab.setMaxIterations(settings.max_iterations);
  bicgstab.setTolerance(settings.tolerance);
  bicgstab.compute(A);
  if (bicgstab.info() != Eigen::Success) {
    return std::unexpected(LinearSolveFailure{LinearSolveError("incomplete LU preconditioner could not be built"), {}});
  }

  LinearSolution solution;
  solution.x = (guess != nullptr) ? core::MathVector<double>(bicgstab.solveWithGuess(b, *guess))
                                  : core::MathVector<double>(bicgstab.solve(b));
  solution.iterations = static_cast<int>(bicgstab.iterations());
  solution.residual = bicgstab.error();

  if (bicgstab.info() != Eigen::Success || !solution.x.allFinite()) {
    return std::unexpected(LinearSolveFailure{
        NonConvergenceError("BiCGSTAB did not reach the requested tolerance", solution.iterations, solution.residual),
        std::move(solution.x)});
  }
  return solution;
}

} // namespace

auto solve_linear_system(const core::SparseMatrix& A, const core::MathVector<double>& b,
                         const LinearSolverSettings& settings, const core::MathVector<double>* guess)
    -> std::expected<LinearSolution, LinearSolveFailure> {

  if (b.size() == 0) {
    return LinearSolution{};
  }

  switch (settings.kind) {
  case LinearSolverKind::SparseLU:
    return solve_direct(A, b);
  case LinearSolverKind::BiCGSTAB:
    return solve_iterative(A, b, settings, guess);
  }
  return std::unexpected(LinearSolveFailure{LinearSolveError("unknown linear solver"), {}});
}

} // namespace mantle::solver
