#pragma once

#include <cstddef>
#include <cstdint>

namespace mantle::constants {

// ================================================================================================
// MATHEMATICAL CONSTANTS
// ================================================================================================

namespace math {
/// Mathematical constant π
inline constexpr double pi = 3.14159265358979323846;

/// 1/sqrt(3), abscissa of the two-point Gauss rule
inline constexpr double gauss_2pt_abscissa = 0.57735026918962576451;
}  // namespace math

// ================================================================================================
// NUMERICAL TOLERANCES
// ================================================================================================

namespace tolerance {
/// Standard convergence tolerance for Picard iterations
inline constexpr double standard = 1e-6;

/// Relative residual target for iterative linear solves
inline constexpr double linear_solve = 1e-12;

/// Below this Peclet number the SUPG coth expansion is used
inline constexpr double small_peclet = 1e-3;
}  // namespace tolerance

// ================================================================================================
// ITERATION LIMITS
// ================================================================================================

namespace iteration_limits {
/// Default maximum Picard iterations for the non-linear Stokes solve
inline constexpr int picard_max = 50;

/// Default maximum iterations of an iterative linear solve
inline constexpr int linear_solver_max = 2000;

/// Default number of timestep halvings before a thermal failure is final
inline constexpr int timestep_halvings_max = 4;
}  // namespace iteration_limits

// ================================================================================================
// RHEOLOGY DEFAULTS
// ================================================================================================

namespace rheology {
/// Lower viscosity clip applied to stress-dependent laws
inline constexpr double default_eta_min = 1e-5;

/// Upper viscosity clip applied to stress-dependent laws
inline constexpr double default_eta_max = 1e5;

/// Strain-rate invariant used to seed the first Picard iteration
inline constexpr double default_reference_strain_rate = 1.0;
}  // namespace rheology

// ================================================================================================
// DISCRETISATION DEFAULTS
// ================================================================================================

namespace discretisation {
/// Pressure stabilisation coefficient alpha in tau = alpha h^2 / eta
inline constexpr double default_pressure_stabilisation = 1.0 / 12.0;

/// Backward Euler
inline constexpr double default_theta = 1.0;

/// Courant factor applied to the element crossing time
inline constexpr double default_cfl_factor = 0.5;

/// Upper bound on the time step when the flow is (nearly) at rest
inline constexpr double default_max_timestep = 1.0;

/// Particles per cell along each axis
inline constexpr int default_particles_per_cell = 3;

/// Velocity components + pressure per node in the Stokes system
inline constexpr std::size_t stokes_dofs_per_node = 3;
}  // namespace discretisation

// ================================================================================================
// SWARM DEFAULTS
// ================================================================================================

namespace swarm {
/// Seed used for random particle layouts when none is given
inline constexpr std::uint64_t default_seed = 5489u;
}  // namespace swarm

// ================================================================================================
// INPUT/OUTPUT
// ================================================================================================

namespace io {
/// HDF5 default compression level (0-9, higher = better compression)
inline constexpr int default_hdf5_compression = 6;

/// Default HDF5 chunk size for datasets
inline constexpr std::size_t default_hdf5_chunk_size = 1024;

/// Bytes to KB conversion factor
inline constexpr double bytes_to_kb = 1024.0;

/// Default output directory
inline constexpr const char* default_output_directory = "mantle_outputs";
}  // namespace io

// ================================================================================================
// APPLICATION
// ================================================================================================

namespace exit_codes {
inline constexpr int success = 0;
inline constexpr int failure = 1;
}  // namespace exit_codes

namespace string_processing {
/// Format precision for floating point display
inline constexpr int float_precision_2 = 2;
inline constexpr int float_precision_4 = 4;

namespace colors {
inline constexpr const char* reset = "\033[0m";
inline constexpr const char* green = "\033[32m";
inline constexpr const char* cyan = "\033[36m";
}  // namespace colors
}  // namespace string_processing

}  // namespace mantle::constants
