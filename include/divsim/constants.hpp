#pragma once

#include <cstddef>

/// @file include/divsim/constants.hpp
/// @brief Numerical and policy constants for the divsim simulator.
///
/// Every tunable default used by the engine, the sampler and the solver
/// lives here so configuration structs can reference a single source.

namespace divsim::constants {

// ─── Age Dependence ───────────────────────────────────────────────────────────

/// Smallest accepted Weibull shape. Shapes below this produce hazards that
/// blow up near age zero and are rejected as degenerate.
static constexpr double MIN_WEIBULL_SHAPE = 0.01;

/// Number of grid points used to probe a time-varying shape over [0, tMax]
/// at engine construction.
static constexpr std::size_t SHAPE_PROBE_POINTS = 1001;

// ─── Retry Policy ─────────────────────────────────────────────────────────────

/// Maximum number of simulation attempts before giving up on the
/// acceptance constraints.
static constexpr std::size_t MAX_ATTEMPTS = 100'000;

/// When true extinction times are requested, extinction clocks of extant
/// lineages are followed for at most this many multiples of tMax past the
/// present.
static constexpr double TRUE_EXTINCTION_HORIZON_FACTOR = 100.0;

// ─── Quadrature ───────────────────────────────────────────────────────────────

/// Order of the Gauss–Legendre rule used for hazard integration.
static constexpr int QUADRATURE_ORDER = 10;

/// Absolute error target for adaptive integration of one panel.
static constexpr double QUADRATURE_ABS_TOL = 1e-13;

/// Relative error target for adaptive integration of one panel.
static constexpr double QUADRATURE_REL_TOL = 1e-11;

/// Maximum bisection depth of adaptive integration.
static constexpr int QUADRATURE_MAX_DEPTH = 40;

/// Largest error an integral may carry in cells cut off by the depth cap,
/// absolute below 1 and relative above. Beyond it the estimate is reported
/// as not converged.
static constexpr double QUADRATURE_CAP_TOL = 1e-9;

// ─── Event Solver ─────────────────────────────────────────────────────────────

/// Number of panels the horizon is split into while accumulating hazard.
static constexpr int HAZARD_PANELS = 32;

/// Iteration cap for the Newton/bisection root search inside one panel.
static constexpr int ROOT_MAX_ITERATIONS = 200;

/// Relative bracket width at which the root search stops.
static constexpr double ROOT_TOLERANCE = 1e-12;

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

} // namespace divsim::constants
