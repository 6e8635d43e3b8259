/// @file src/sampler/waiting_time.cpp
/// @brief WaitingTimeSampler — closed-form, piecewise and numeric waits.

#include "divsim/waiting_time.hpp"
#include "divsim/constants.hpp"
#include "divsim/error.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace divsim {

namespace {

double checked_rate(double value, double t) {
    if (!std::isfinite(value) || value < 0.0) {
        throw DivsimError(ErrorCode::InvalidRate,
                          fmt::format("rate evaluated to {} at t = {}", value, t));
    }
    return value;
}

double checked_scale(double value, double t) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw DivsimError(ErrorCode::InvalidRate,
                          fmt::format("Weibull scale evaluated to {} at t = {}", value, t));
    }
    return value;
}

double checked_shape(double value, double t) {
    if (!std::isfinite(value)) {
        throw DivsimError(ErrorCode::InvalidRate,
                          fmt::format("Weibull shape evaluated to {} at t = {}", value, t));
    }
    if (value < constants::MIN_WEIBULL_SHAPE) {
        throw DivsimError(ErrorCode::DegenerateShape,
                          fmt::format("Weibull shape {} at t = {} is below {}",
                                      value, t, constants::MIN_WEIBULL_SHAPE));
    }
    return value;
}

/// Weibull hazard at lifetime `a` for scale `sigma` and shape `k`.
double weibull_hazard(double a, double sigma, double k) {
    if (a <= 0.0) {
        if (k < 1.0)  return std::numeric_limits<double>::infinity();
        if (k == 1.0) return 1.0 / sigma;
        return 0.0;
    }
    return (k / sigma) * std::pow(a / sigma, k - 1.0);
}

} // namespace

// ─── WaitingTimeSampler::sample ───────────────────────────────────────────────

std::optional<double>
WaitingTimeSampler::sample(const EventClock& clock, double now, double age,
                           double end, std::mt19937_64& rng) const {
    std::exponential_distribution<double> unit(1.0);
    return wait_for_draw(clock, now, age, end, unit(rng));
}

// ─── WaitingTimeSampler::wait_for_draw ────────────────────────────────────────

std::optional<double>
WaitingTimeSampler::wait_for_draw(const EventClock& clock, double now, double age,
                                  double end, double draw) const {
    const double horizon = end - now;
    if (!(horizon > 0.0)) {
        return std::nullopt;
    }

    if (clock.age_dependent()) {
        return weibull_wait(clock, now, age, horizon, draw);
    }

    const Rate& rate = clock.rate;
    switch (rate.kind()) {
        case Rate::Kind::Constant:
            return constant_wait(checked_rate(*rate.constant_value(), now), horizon, draw);
        case Rate::Kind::Piecewise:
            return piecewise_wait(rate, now, end, draw);
        case Rate::Kind::Function:
            break;
    }

    return numeric_wait(
        [&rate, now](double u) {
            const double t = now + u;
            return checked_rate(rate(t), t);
        },
        horizon, draw);
}

// ─── WaitingTimeSampler::constant_wait ────────────────────────────────────────

std::optional<double>
WaitingTimeSampler::constant_wait(double rate, double horizon, double draw) const {
    if (rate == 0.0) {
        return std::nullopt;
    }
    const double s = draw / rate;
    if (s < horizon) {
        return s;
    }
    return std::nullopt;
}

// ─── WaitingTimeSampler::piecewise_wait ───────────────────────────────────────

std::optional<double>
WaitingTimeSampler::piecewise_wait(const Rate& rate, double now, double end,
                                   double draw) const {
    const auto starts = rate.shift_times();
    const auto levels = rate.levels();
    const std::size_t n = levels.size();

    // Walk the segments from `now`, spending the draw on each one's mass.
    double remaining = draw;
    double t = now;
    for (std::size_t idx = rate.segment_at(now); idx < n; ++idx) {
        const double seg_end = std::min(idx + 1 < n ? starts[idx + 1] : end, end);
        if (seg_end > t) {
            const double level = checked_rate(levels[idx], t);
            const double mass = level * (seg_end - t);
            if (level > 0.0 && mass >= remaining) {
                const double s = (t - now) + remaining / level;
                if (s < end - now) {
                    return s;
                }
                return std::nullopt;
            }
            remaining -= mass;
            t = seg_end;
        }
        if (t >= end) {
            break;
        }
    }
    return std::nullopt;
}

// ─── WaitingTimeSampler::weibull_wait ─────────────────────────────────────────

std::optional<double>
WaitingTimeSampler::weibull_wait(const EventClock& clock, double now, double age,
                                 double horizon, double draw) const {
    const Rate& scale = clock.rate;
    const Rate& shape = *clock.shape;
    const double lifetime = std::max(age, 0.0);

    if (scale.kind() == Rate::Kind::Constant && shape.kind() == Rate::Kind::Constant) {
        // H(s) = ((a + s)/σ)^k − (a/σ)^k, inverted directly.
        const double sigma = checked_scale(*scale.constant_value(), now);
        const double k     = checked_shape(*shape.constant_value(), now);
        const double base  = std::pow(lifetime / sigma, k);
        const double s = std::max(0.0, sigma * std::pow(base + draw, 1.0 / k) - lifetime);
        if (s < horizon) {
            return s;
        }
        return std::nullopt;
    }

    const double k_now = checked_shape(shape(now), now);
    if (k_now >= 1.0) {
        return numeric_wait(
            [&scale, &shape, now, lifetime](double u) {
                const double t = now + u;
                const double sigma = checked_scale(scale(t), t);
                const double k     = checked_shape(shape(t), t);
                return weibull_hazard(lifetime + u, sigma, k);
            },
            horizon, draw);
    }

    // k < 1 diverges at age 0. Integrate in w with age = w^p, p = 1/k(now):
    // the hazard becomes p·k·σ^(−k)·w^(pk − 1), bounded near w = 0.
    const double p     = 1.0 / k_now;
    const double w0    = std::pow(lifetime, k_now);
    const double w_end = std::pow(lifetime + horizon, k_now);
    const auto offset = numeric_wait(
        [&scale, &shape, now, lifetime, w0, p](double x) {
            const double w = w0 + x;
            const double t = now + (std::pow(w, p) - lifetime);
            const double sigma = checked_scale(scale(t), t);
            const double k     = checked_shape(shape(t), t);
            return p * k * std::pow(sigma, -k) * std::pow(w, p * k - 1.0);
        },
        w_end - w0, draw);
    if (!offset) {
        return std::nullopt;
    }
    const double s = std::max(0.0, std::pow(w0 + *offset, p) - lifetime);
    if (s < horizon) {
        return s;
    }
    return std::nullopt;
}

// ─── WaitingTimeSampler::numeric_wait ─────────────────────────────────────────

std::optional<double>
WaitingTimeSampler::numeric_wait(const Integrand& hazard, double horizon,
                                 double draw) const {
    const EventSolution solution = solve_next_event(hazard, horizon, draw, budget_);

    if (const auto* event = std::get_if<EventTime>(&solution)) {
        if (event->offset < horizon) {
            return event->offset;
        }
        return std::nullopt;
    }
    if (const auto* failure = std::get_if<NonConvergence>(&solution)) {
        throw DivsimError(ErrorCode::NonConvergence,
                          fmt::format("root search stopped after {} iterations "
                                      "with bracket width {}",
                                      failure->iterations, failure->bracket_width));
    }
    return std::nullopt;
}

} // namespace divsim
