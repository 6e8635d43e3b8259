#pragma once

/// @file include/divsim/rate.hpp
/// @brief Rate specifications and the Rate Builder.
///
/// # Module: Rate Builder
///
/// ## Responsibility
/// Turn any of the four accepted rate specifications into one normalized
/// callable `Rate`, a function of clade-relative time t ∈ [0, tMax]:
///
///   | Specification | Normalized rate                          |
///   |---------------|------------------------------------------|
///   | ConstantRate  | t ↦ value                                |
///   | TimeRate      | t ↦ f(t)                                 |
///   | EnvRate       | t ↦ f(t, env.at(t))                      |
///   | StepRate      | t ↦ value of the greatest shift ≤ t      |
///
/// The same machinery normalizes Weibull shapes, which are also allowed to
/// vary in time.
///
/// ## Time Convention
/// Time runs from the clade origin (0) to the present (tMax). Step shift
/// times may be given either way: a descending sequence is read as "time
/// before present" and reflected to tMax − shift.
///
/// ## Guarantees
/// - Constant and step rates are validated eagerly (finite, ≥ 0)
/// - Function rates are validated lazily by the sampler
/// - A built Rate is immutable and safe to call from several threads as
///   long as the wrapped user function is

#include "divsim/environment.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace divsim {

// ─── Rate Specifications ──────────────────────────────────────────────────────

/// Rate as a function of clade-relative time.
using TimeRateFn = std::function<double(double)>;

/// Rate as a function of time and the interpolated environment value.
using EnvRateFn = std::function<double(double, double)>;

/// Constant rate.
struct ConstantRate {
    double value;
};

/// Rate varying with time only.
struct TimeRate {
    TimeRateFn fn;
};

/// Rate varying with time and an environmental variable.
struct EnvRate {
    EnvRateFn fn;
};

/// Step function: `values[i]` applies from shift time i onwards.
struct StepRate {
    std::vector<double> values;
};

/// Any accepted rate specification.
using RateSpec = std::variant<ConstantRate, TimeRate, EnvRate, StepRate>;

// ─── Rate ─────────────────────────────────────────────────────────────────────

/// A normalized rate t ↦ r(t). Remembers whether it is constant or
/// piecewise constant so callers can integrate it exactly.
class Rate {
public:
    enum class Kind {
        Constant,   ///< same value everywhere
        Piecewise,  ///< right-continuous step function
        Function,   ///< arbitrary callable
    };

    /// Constant rate. No validation; use RateBuilder for checked input.
    [[nodiscard]] static Rate constant(double value);

    /// Step function from ascending start times and their levels.
    /// Precondition: equal, non-zero lengths; starts strictly ascending.
    [[nodiscard]] static Rate piecewise(std::vector<double> starts,
                                        std::vector<double> levels);

    /// Arbitrary function of time.
    [[nodiscard]] static Rate function(TimeRateFn fn);

    /// Evaluate the rate at clade-relative time `t`.
    [[nodiscard]] double operator()(double t) const;

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    /// The value when kind() == Constant, `nullopt` otherwise.
    [[nodiscard]] std::optional<double> constant_value() const noexcept;

    /// Start times of the step segments (empty unless Piecewise).
    [[nodiscard]] std::span<const double> shift_times() const noexcept { return starts_; }

    /// Level of each step segment (empty unless Piecewise).
    [[nodiscard]] std::span<const double> levels() const noexcept { return levels_; }

    /// Index of the step segment containing `t`, clamped to the first and
    /// last segments. Precondition: kind() == Piecewise.
    [[nodiscard]] std::size_t segment_at(double t) const noexcept;

private:
    explicit Rate(Kind kind) noexcept : kind_(kind) {}

    Kind                kind_;
    double              constant_ = 0.0;
    std::vector<double> starts_;
    std::vector<double> levels_;
    TimeRateFn          fn_;
};

// ─── RateBuilder ──────────────────────────────────────────────────────────────

/// Normalizes rate specifications. Stateless.
class RateBuilder {
public:
    /// Build a normalized rate.
    ///
    /// # Arguments
    /// * `spec`        — rate specification
    /// * `t_max`       — simulation length; must be finite and > 0
    /// * `environment` — required for EnvRate, rejected with StepRate,
    ///                   unused otherwise
    /// * `shift_times` — required for StepRate (same length as its values,
    ///                   unless it holds a single value), rejected otherwise
    ///
    /// # Throws
    /// `DivsimError` with MissingEnvironment, ShiftLengthMismatch,
    /// UnsupportedCombination, InvalidShifts, InvalidRate or InvalidArgument.
    [[nodiscard]] static Rate
    build(const RateSpec& spec,
          double t_max,
          std::shared_ptr<const EnvironmentTable> environment = nullptr,
          std::span<const double> shift_times = {});

private:
    [[nodiscard]] static Rate from_constant(const ConstantRate& spec);

    [[nodiscard]] static Rate
    from_environment(const EnvRate& spec,
                     std::shared_ptr<const EnvironmentTable> environment);

    [[nodiscard]] static Rate
    from_steps(const StepRate& spec, double t_max,
               std::span<const double> shift_times);
};

} // namespace divsim
