#pragma once
/**
 * @file  event_solver.hpp
 * @brief Next-event time solver for arbitrary hazard functions.
 *
 * Module:  src/solver/
 *
 * Responsibility
 * --------------
 * Given a hazard h(u) ≥ 0 on [0, horizon] and a target E > 0, find s with
 *
 *   H(s) = ∫₀ˢ h(u) du = E
 *
 * For E ~ Exp(1) this s is a draw of the next event time of a
 * non-homogeneous Poisson process with intensity h. This is the only place
 * in divsim where floating-point non-convergence can occur.
 *
 * Method
 * ------
 *   1. Split [0, horizon] into `panels` equal panels and accumulate H
 *      panel by panel with adaptive Gauss–Legendre.
 *   2. If H(horizon) < E: no event before the horizon.
 *   3. Otherwise the root lies in the first panel where the running sum
 *      reaches E. Inside it, run Newton steps (H' = h) safeguarded by
 *      bisection of the sign-change bracket. The integral is advanced
 *      incrementally between iterates.
 *
 * Design Constraints
 * ------------------
 *   • Always terminates: at most `max_iterations` root iterations.
 *   • Never returns a time built on an unconverged integral: a panel or
 *     increment whose quadrature hits the depth cap with more than
 *     `cap_tol` of error left yields NonConvergence.
 *   • Deterministic: same hazard, horizon and target give the same answer.
 *   • Does not validate hazard values; callers wrap their hazard with the
 *     checks they need (the sampler throws on negative rates).
 */

#include "divsim/constants.hpp"
#include "divsim/quadrature.hpp"

#include <variant>

namespace divsim {

// ── Solver result ─────────────────────────────────────────────────────────────

/// The event happens `offset` time units after the start of the horizon.
struct EventTime {
    double offset;
};

/// The cumulative hazard over the whole horizon stays below the target.
struct NoEventBeforeHorizon {};

/// The root search ran out of budget, or a hazard integral was NaN or was
/// cut short by the quadrature depth cap.
struct NonConvergence {
    int    iterations;     ///< root iterations spent
    double bracket_width;  ///< width of the last sign-change bracket
};

using EventSolution = std::variant<EventTime, NoEventBeforeHorizon, NonConvergence>;

// ── Budget ────────────────────────────────────────────────────────────────────

/// Effort limits for one solve.
struct SolverBudget {
    int                 panels         = constants::HAZARD_PANELS;
    int                 max_iterations = constants::ROOT_MAX_ITERATIONS;
    double              tolerance      = constants::ROOT_TOLERANCE;
    QuadratureTolerance quadrature{};
};

// ── solve_next_event ──────────────────────────────────────────────────────────

/**
 * @brief Solve ∫₀ˢ hazard = target for s ∈ [0, horizon].
 *
 * @param hazard   Intensity as a function of offset u from the start.
 * @param horizon  Length of the window; ≤ 0 always yields no event.
 * @param target   Cumulative hazard to reach; ≤ 0 yields an event at 0.
 * @param budget   Panel count, iteration cap and tolerances.
 */
[[nodiscard]] EventSolution
solve_next_event(const Integrand& hazard,
                 double horizon,
                 double target,
                 const SolverBudget& budget = SolverBudget{});

} // namespace divsim
