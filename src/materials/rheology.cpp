#include "mantle/materials/rheology.hpp"
#include "mantle/core/overloaded.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace mantle::materials {

auto evaluate_viscosity(const Rheology& rheology, const RheologyInput& input, const ViscosityLimits& limits)
    -> std::expected<double, solver::SolverError> {

  if (!std::isfinite(input.strain_rate_ii) || input.strain_rate_ii < 0.0) {
    return std::unexpected(solver::RheologyDomainError(
        std::format("strain rate invariant must be a finite non-negative magnitude, got {}", input.strain_rate_ii)));
  }

  return std::visit(
      core::overloaded{
          [](const ConstantViscosity& law) -> std::expected<double, solver::SolverError> { return law.eta0; },

          [&](const PowerLaw& law) -> std::expected<double, solver::SolverError> {
            const double n = law.exponent;
            // pow(0, negative) is +inf and is clipped to the upper limit below
            const double eta = std::pow(law.prefactor, -1.0 / n) * std::pow(input.strain_rate_ii, (1.0 - n) / n);
            if (std::isnan(eta)) {
              return std::unexpected(solver::RheologyDomainError(
                  std::format("power law (A={}, n={}) undefined at strain rate {}", law.prefactor, n,
                              input.strain_rate_ii)));
            }
            return std::clamp(eta, limits.min, limits.max);
          },

          [&](const TemperatureDependent& law) -> std::expected<double, solver::SolverError> {
            if (!std::isfinite(input.temperature)) {
              return std::unexpected(solver::RheologyDomainError(
                  std::format("temperature must be finite, got {}", input.temperature)));
            }
            const double eta = law.eta0 * std::exp(-law.gamma * (input.temperature - law.reference_temperature));
            return std::clamp(eta, limits.min, limits.max);
          }},
      rheology);
}

auto is_velocity_independent(const Rheology& rheology) noexcept -> bool {
  return !std::holds_alternative<PowerLaw>(rheology);
}

auto rheology_name(const Rheology& rheology) -> const char* {
  return std::visit(core::overloaded{[](const ConstantViscosity&) { return "constant"; },
                               [](const PowerLaw&) { return "power_law"; },
                               [](const TemperatureDependent&) { return "temperature_dependent"; }},
                    rheology);
}

auto average_viscosity(std::span<const double> fractions, std::span<const double> viscosities,
                       ViscosityAveraging averaging) noexcept -> double {

  double accumulated = 0.0;
  switch (averaging) {
  case ViscosityAveraging::Arithmetic:
    for (std::size_t m = 0; m < fractions.size(); ++m) {
      if (fractions[m] > 0.0) {
        accumulated += fractions[m] * viscosities[m];
      }
    }
    return accumulated;

  case ViscosityAveraging::Harmonic:
    for (std::size_t m = 0; m < fractions.size(); ++m) {
      if (fractions[m] > 0.0) {
        accumulated += fractions[m] / viscosities[m];
      }
    }
    return 1.0 / accumulated;

  case ViscosityAveraging::Geometric:
    for (std::size_t m = 0; m < fractions.size(); ++m) {
      if (fractions[m] > 0.0) {
        accumulated += fractions[m] * std::log(viscosities[m]);
      }
    }
    return std::exp(accumulated);
  }
  return accumulated;
}

} // namespace mantle::materials
