#pragma once
#include "../core/exceptions.hpp"
#include <source_location>
#include <string_view>

namespace mantle::solver {

class SolverError : public core::MantleException {
public:
  enum class Kind { General, NonConvergence, RheologyDomain, LinearSolve, OutOfDomain };

private:
  Kind kind_ = Kind::General;
  int iterations_ = 0;
  double residual_ = 0.0;

protected:
  SolverError(Kind kind, std::string_view message, int iterations, double residual, std::source_location location)
      : MantleException(std::format("Solver Error: {}", message), location), kind_(kind), iterations_(iterations),
        residual_(residual) {}

public:
  explicit SolverError(std::string_view message, std::source_location location = std::source_location::current())
      : MantleException(std::format("Solver Error: {}", message), location) {}

  [[nodiscard]] auto kind() const noexcept -> Kind { return kind_; }
  [[nodiscard]] auto iterations() const noexcept -> int { return iterations_; }
  [[nodiscard]] auto residual() const noexcept -> double { return residual_; }
};

// Iteration cap exceeded (Picard loop or iterative linear solve)
class NonConvergenceError : public SolverError {
public:
  NonConvergenceError(std::string_view message, int iterations, double residual,
                      std::source_location location = std::source_location::current())
      : SolverError(Kind::NonConvergence,
                    std::format("Non-convergence: {} (iterations={}, residual={:.3e})", message, iterations, residual),
                    iterations, residual, location) {}
};

// Malformed strain-rate input to the rheology evaluator
class RheologyDomainError : public SolverError {
public:
  explicit RheologyDomainError(std::string_view message,
                               std::source_location location = std::source_location::current())
      : SolverError(Kind::RheologyDomain, std::format("Rheology domain error: {}", message), 0, 0.0, location) {}
};

class LinearSolveError : public SolverError {
public:
  explicit LinearSolveError(std::string_view message, std::source_location location = std::source_location::current())
      : SolverError(Kind::LinearSolve, std::format("Linear solve failed: {}", message), 0, 0.0, location) {}
};

// A point or particle left the mesh and the caller chose not to recover
class DomainExitError : public SolverError {
public:
  explicit DomainExitError(std::string_view message, std::source_location location = std::source_location::current())
      : SolverError(Kind::OutOfDomain, std::format("Out of domain: {}", message), 0, 0.0, location) {}
};

} // namespace mantle::solver
