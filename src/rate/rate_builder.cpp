/// @file src/rate/rate_builder.cpp
/// @brief Rate evaluation and RateBuilder normalization routines.

#include "divsim/rate.hpp"
#include "divsim/error.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace divsim {

// ─── Rate factories ───────────────────────────────────────────────────────────

Rate Rate::constant(double value) {
    Rate r(Kind::Constant);
    r.constant_ = value;
    return r;
}

Rate Rate::piecewise(std::vector<double> starts, std::vector<double> levels) {
    Rate r(Kind::Piecewise);
    r.starts_ = std::move(starts);
    r.levels_ = std::move(levels);
    return r;
}

Rate Rate::function(TimeRateFn fn) {
    Rate r(Kind::Function);
    r.fn_ = std::move(fn);
    return r;
}

// ─── Rate evaluation ──────────────────────────────────────────────────────────

double Rate::operator()(double t) const {
    switch (kind_) {
        case Kind::Constant:  return constant_;
        case Kind::Piecewise: return levels_[segment_at(t)];
        case Kind::Function:  return fn_(t);
    }
    return constant_;
}

std::optional<double> Rate::constant_value() const noexcept {
    if (kind_ == Kind::Constant) {
        return constant_;
    }
    return std::nullopt;
}

std::size_t Rate::segment_at(double t) const noexcept {
    // Greatest start ≤ t; times before the first shift use segment 0.
    const auto it = std::upper_bound(starts_.begin(), starts_.end(), t);
    if (it == starts_.begin()) {
        return 0;
    }
    return static_cast<std::size_t>(it - starts_.begin()) - 1;
}

// ─── RateBuilder::build ───────────────────────────────────────────────────────

Rate RateBuilder::build(const RateSpec& spec,
                        double t_max,
                        std::shared_ptr<const EnvironmentTable> environment,
                        std::span<const double> shift_times) {
    if (!std::isfinite(t_max) || t_max <= 0.0) {
        throw DivsimError(ErrorCode::InvalidArgument,
                          fmt::format("tMax must be finite and positive, got {}", t_max));
    }

    const bool is_step = std::holds_alternative<StepRate>(spec);
    if (!is_step && !shift_times.empty()) {
        throw DivsimError(ErrorCode::UnsupportedCombination,
                          "shift times are only meaningful for a step-vector rate");
    }
    if (is_step && environment) {
        throw DivsimError(ErrorCode::UnsupportedCombination,
                          "a step-vector rate cannot be combined with an environment table");
    }

    if (const auto* c = std::get_if<ConstantRate>(&spec)) {
        return from_constant(*c);
    }
    if (const auto* f = std::get_if<TimeRate>(&spec)) {
        if (!f->fn) {
            throw DivsimError(ErrorCode::InvalidArgument, "empty time-rate function");
        }
        return Rate::function(f->fn);
    }
    if (const auto* e = std::get_if<EnvRate>(&spec)) {
        return from_environment(*e, std::move(environment));
    }
    return from_steps(std::get<StepRate>(spec), t_max, shift_times);
}

// ─── RateBuilder::from_constant ───────────────────────────────────────────────

Rate RateBuilder::from_constant(const ConstantRate& spec) {
    if (!std::isfinite(spec.value) || spec.value < 0.0) {
        throw DivsimError(ErrorCode::InvalidRate,
                          fmt::format("constant rate must be finite and >= 0, got {}",
                                      spec.value));
    }
    return Rate::constant(spec.value);
}

// ─── RateBuilder::from_environment ────────────────────────────────────────────

Rate RateBuilder::from_environment(const EnvRate& spec,
                                   std::shared_ptr<const EnvironmentTable> environment) {
    if (!environment) {
        throw DivsimError(ErrorCode::MissingEnvironment,
                          "a time+environment rate needs an environment table");
    }
    if (!spec.fn) {
        throw DivsimError(ErrorCode::InvalidArgument, "empty environment-rate function");
    }

    // The closure shares ownership of the table; it stays read-only.
    return Rate::function(
        [fn = spec.fn, env = std::move(environment)](double t) {
            return fn(t, env->at(t));
        });
}

// ─── RateBuilder::from_steps ──────────────────────────────────────────────────

Rate RateBuilder::from_steps(const StepRate& spec, double t_max,
                             std::span<const double> shift_times) {
    const auto& values = spec.values;
    if (values.empty()) {
        throw DivsimError(ErrorCode::InvalidRate, "step-vector rate has no values");
    }
    for (const double v : values) {
        if (!std::isfinite(v) || v < 0.0) {
            throw DivsimError(ErrorCode::InvalidRate,
                              fmt::format("step rate values must be finite and >= 0, got {}", v));
        }
    }

    // A lone value without shifts is just a constant.
    if (values.size() == 1 && shift_times.empty()) {
        return Rate::constant(values.front());
    }

    if (shift_times.size() != values.size()) {
        throw DivsimError(ErrorCode::ShiftLengthMismatch,
                          fmt::format("{} rate values but {} shift times",
                                      values.size(), shift_times.size()));
    }

    std::vector<double> starts(shift_times.begin(), shift_times.end());
    for (const double s : starts) {
        if (!std::isfinite(s)) {
            throw DivsimError(ErrorCode::InvalidShifts, "shift times must be finite");
        }
    }

    // Descending input counts back from the present; reflect it.
    if (starts.size() > 1 && starts.front() > starts.back()) {
        for (double& s : starts) {
            s = t_max - s;
        }
    }

    for (std::size_t i = 1; i < starts.size(); ++i) {
        if (!(starts[i] > starts[i - 1])) {
            throw DivsimError(ErrorCode::InvalidShifts,
                              "shift times must be strictly monotone");
        }
    }

    return Rate::piecewise(std::move(starts), values);
}

} // namespace divsim
