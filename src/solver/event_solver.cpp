/**
 * @file  event_solver.cpp
 * @brief Panel accumulation and safeguarded Newton root search.
 *
 * See event_solver.hpp for the full module contract.
 */

#include "divsim/event_solver.hpp"

#include <algorithm>
#include <cmath>

namespace divsim {

namespace {

/// Root of ∫_a^x h = deficit inside [a, b], where ∫_a^b h = mass ≥ deficit.
EventSolution
root_in_panel(const Integrand&      hazard,
              const GaussLegendre&  rule,
              double                a,
              double                b,
              double                deficit,
              double                mass,
              const SolverBudget&   budget) {
    double lo = a;
    double hi = b;

    // Start from the linear interpolation of the cumulative hazard.
    double x = std::isfinite(mass) && mass > 0.0
                 ? a + (b - a) * (deficit / mass)
                 : 0.5 * (a + b);
    x = std::clamp(x, a, b);

    const QuadratureEstimate first = rule.adaptive_estimate(hazard, a, x, budget.quadrature);
    if (!first.converged) {
        return NonConvergence{0, hi - lo};
    }
    double gx = first.value - deficit;
    double last_width = hi - lo;
    bool   force_bisect = false;

    for (int it = 1; it <= budget.max_iterations; ++it) {
        if (std::isnan(gx)) {
            return NonConvergence{it, hi - lo};
        }
        if (gx == 0.0) {
            return EventTime{x};
        }
        if (gx < 0.0) lo = x; else hi = x;

        const double scale = std::max(1.0, std::abs(x));
        if (hi - lo <= budget.tolerance * scale) {
            return EventTime{0.5 * (lo + hi)};
        }

        // Newton step on H(x) − deficit; H' is the hazard itself.
        const double h = hazard(x);
        double next = 0.5 * (lo + hi);
        if (!force_bisect && std::isfinite(h) && h > 0.0) {
            const double newton = x - gx / h;
            if (newton > lo && newton < hi) {
                next = newton;
            }
        }

        // Bisect next time if this step failed to halve the bracket.
        const double width = hi - lo;
        force_bisect = width > 0.5 * last_width;
        last_width = width;

        const double step = next - x;
        const QuadratureEstimate piece = rule.adaptive_estimate(hazard, x, next, budget.quadrature);
        if (!piece.converged) {
            return NonConvergence{it, hi - lo};
        }
        gx += piece.value;
        x = next;

        if (std::abs(step) <= budget.tolerance * std::max(1.0, std::abs(x))) {
            return EventTime{x};
        }
    }

    return NonConvergence{budget.max_iterations, hi - lo};
}

} // namespace

// ── solve_next_event ──────────────────────────────────────────────────────────

EventSolution
solve_next_event(const Integrand&    hazard,
                 double              horizon,
                 double              target,
                 const SolverBudget& budget) {
    if (!(horizon > 0.0)) {
        return NoEventBeforeHorizon{};
    }
    if (std::isnan(target)) {
        return NonConvergence{0, horizon};
    }
    if (target <= 0.0) {
        return EventTime{0.0};
    }

    const GaussLegendre& rule = GaussLegendre::standard();
    const int    panels = std::max(1, budget.panels);
    const double width  = horizon / static_cast<double>(panels);

    double cumulative = 0.0;
    for (int k = 0; k < panels; ++k) {
        const double a = static_cast<double>(k) * width;
        const double b = (k + 1 == panels) ? horizon : static_cast<double>(k + 1) * width;

        const QuadratureEstimate panel = rule.adaptive_estimate(hazard, a, b, budget.quadrature);
        const double mass = panel.value;
        if (std::isnan(mass) || !panel.converged) {
            return NonConvergence{0, b - a};
        }
        if (cumulative + mass >= target) {
            return root_in_panel(hazard, rule, a, b, target - cumulative, mass, budget);
        }
        cumulative += mass;
    }

    return NoEventBeforeHorizon{};
}

} // namespace divsim
