#pragma once
#include "../core/constants.hpp"
#include "../solver/solver_errors.hpp"
#include <expected>
#include <span>
#include <variant>

namespace mantle::materials {

struct ConstantViscosity {
  double eta0 = 1.0;
};

// eta = A^(-1/n) * edot_II^((1-n)/n)
struct PowerLaw {
  double prefactor = 1.0; // A
  double exponent = 1.0;  // n
};

// Frank-Kamenetskii law: eta = eta0 * exp(-gamma (T - T_ref))
struct TemperatureDependent {
  double eta0 = 1.0;
  double gamma = 0.0;
  double reference_temperature = 0.0;
};

using Rheology = std::variant<ConstantViscosity, PowerLaw, TemperatureDependent>;

struct RheologyInput {
  double strain_rate_ii = 0.0; // second invariant of the strain rate, non-negative
  double pressure = 0.0;
  double temperature = 0.0;
};

struct ViscosityLimits {
  double min = constants::rheology::default_eta_min;
  double max = constants::rheology::default_eta_max;
};

enum class ViscosityAveraging { Arithmetic, Harmonic, Geometric };

/**
 * @brief Effective viscosity of one rheology law at one point
 *
 * Constant viscosity is returned unclipped. Stress and temperature dependent laws are clipped
 * to [limits.min, limits.max].
 * @return Viscosity or RheologyDomainError when the strain rate is negative or non-finite
 */
[[nodiscard]] auto evaluate_viscosity(const Rheology& rheology, const RheologyInput& input,
                                      const ViscosityLimits& limits) -> std::expected<double, solver::SolverError>;

// True when the law does not depend on the velocity solution
[[nodiscard]] auto is_velocity_independent(const Rheology& rheology) noexcept -> bool;

[[nodiscard]] auto rheology_name(const Rheology& rheology) -> const char*;

// Combine per-material viscosities weighted by volume fraction
[[nodiscard]] auto average_viscosity(std::span<const double> fractions, std::span<const double> viscosities,
                                     ViscosityAveraging averaging) noexcept -> double;

} // namespace mantle::materials
