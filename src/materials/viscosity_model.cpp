#include "mantle/materials/viscosity_model.hpp"
#include <algorithm>
#include <format>

namespace mantle::materials {

auto ElementViscosityModel::is_velocity_independent() const noexcept -> bool {
  return std::ranges::all_of(materials_, [](const Material& m) { return materials::is_velocity_independent(m.rheology); });
}

auto ElementViscosityModel::evaluate(std::span<const double> strain_rate, std::span<const double> pressure) const
    -> std::expected<std::vector<double>, solver::SolverError> {

  const auto n_elements = element_count();
  const auto n_materials = material_count();

  std::vector<double> viscosity(n_elements, 0.0);
  std::vector<double> per_material(n_materials, 0.0);

  for (std::size_t e = 0; e < n_elements; ++e) {
    const auto f = fractions(e);
    const RheologyInput input{strain_rate[e], pressure[e], temperature_[e]};

    for (std::size_t m = 0; m < n_materials; ++m) {
      if (f[m] <= 0.0) {
        continue;
      }
      auto eta = evaluate_viscosity(materials_[m].rheology, input, limits_);
      if (!eta) {
        auto error = eta.error();
        error.add_context(std::format("element {} material '{}'", e, materials_[m].name));
        return std::unexpected(std::move(error));
      }
      per_material[m] = eta.value();
    }

    viscosity[e] = average_viscosity(f, per_material, averaging_);
  }

  return viscosity;
}

} // namespace mantle::materials
