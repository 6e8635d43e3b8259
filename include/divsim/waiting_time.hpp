#pragma once

/// @file include/divsim/waiting_time.hpp
/// @brief Waiting-Time Sampler — time to a lineage's next event.
///
/// # Module: Waiting-Time Sampler
///
/// ## Responsibility
/// Draw how long a lineage of a given age waits, from a given time, before
/// its next speciation (or extinction) event.
///
/// ## Hazards
/// Age-independent clock with rate r(t):
///   h(u) = r(now + u)
///
/// Age-dependent clock with Weibull scale σ(t) and shape k(t):
///   h(u) = k/σ · ((age + u)/σ)^(k − 1),   σ, k evaluated at now + u
///
/// With k = 1 this is an exponential clock of rate 1/σ. For k < 1 the
/// hazard diverges at age 0, so the numeric path integrates in w with
/// age = w^(1/k), which turns that singularity into a bounded integrand.
///
/// ## Strategy
///   | Clock                                  | Method                     |
///   |----------------------------------------|----------------------------|
///   | constant rate                          | s = E / r                  |
///   | step-function rate                     | exact piecewise inversion  |
///   | constant scale and shape               | closed-form Weibull        |
///   | anything else                          | solve_next_event           |
///
/// where E ~ Exp(1).
///
/// ## Errors
/// - Negative or non-finite rate, non-positive scale → InvalidRate
/// - Shape below MIN_WEIBULL_SHAPE                   → DegenerateShape
/// - Root search out of budget                       → NonConvergence
/// All are thrown as `DivsimError`.

#include "divsim/event_solver.hpp"
#include "divsim/rate.hpp"

#include <optional>
#include <random>

namespace divsim {

/// One event process of a lineage: a rate (or Weibull scale when `shape`
/// is set) and an optional age-dependence shape.
struct EventClock {
    Rate                rate;
    std::optional<Rate> shape;

    [[nodiscard]] bool age_dependent() const noexcept { return shape.has_value(); }
};

class WaitingTimeSampler {
public:
    explicit WaitingTimeSampler(SolverBudget budget = SolverBudget{}) noexcept
        : budget_(budget) {}

    /// Draw the wait until the next event of `clock`.
    ///
    /// # Arguments
    /// * `now` — current clade-relative time
    /// * `age` — time since the lineage's birth (ignored without a shape)
    /// * `end` — absolute time limit; events at or after it do not occur
    /// * `rng` — source of the unit exponential draw
    ///
    /// # Returns
    /// The wait s > 0 with now + s < end, or `nullopt` if no event occurs
    /// before `end`.
    [[nodiscard]] std::optional<double>
    sample(const EventClock& clock, double now, double age, double end,
           std::mt19937_64& rng) const;

    /// Deterministic part of `sample` for a given unit exponential `draw`.
    [[nodiscard]] std::optional<double>
    wait_for_draw(const EventClock& clock, double now, double age, double end,
                  double draw) const;

    [[nodiscard]] const SolverBudget& budget() const noexcept { return budget_; }

private:
    [[nodiscard]] std::optional<double>
    constant_wait(double rate, double horizon, double draw) const;

    [[nodiscard]] std::optional<double>
    piecewise_wait(const Rate& rate, double now, double end, double draw) const;

    [[nodiscard]] std::optional<double>
    weibull_wait(const EventClock& clock, double now, double age,
                 double horizon, double draw) const;

    [[nodiscard]] std::optional<double>
    numeric_wait(const Integrand& hazard, double horizon, double draw) const;

    SolverBudget budget_;
};

} // namespace divsim
