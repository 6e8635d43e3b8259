/// @file src/environment/environment.cpp
/// @brief EnvironmentTable construction and interpolation.

#include "divsim/environment.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace divsim {

// ─── EnvironmentTable constructor ─────────────────────────────────────────────

EnvironmentTable::EnvironmentTable(std::vector<double> times,
                                   std::vector<double> values) noexcept
    : times_(std::move(times))
    , values_(std::move(values))
{}

// ─── EnvironmentTable::from_columns ───────────────────────────────────────────

std::optional<EnvironmentTable>
EnvironmentTable::from_columns(std::vector<double> times,
                               std::vector<double> values) {
    if (times.empty() || times.size() != values.size()) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i < times.size(); ++i) {
        if (!std::isfinite(times[i]) || !std::isfinite(values[i])) {
            return std::nullopt;
        }
        if (i > 0 && !(times[i] > times[i - 1])) {
            return std::nullopt;
        }
    }

    return EnvironmentTable(std::move(times), std::move(values));
}

// ─── EnvironmentTable::at ─────────────────────────────────────────────────────

double EnvironmentTable::at(double t) const noexcept {
    if (std::isnan(t)) {
        return t;
    }
    if (t <= times_.front()) return values_.front();
    if (t >= times_.back())  return values_.back();

    // First row strictly after t; the bracketing pair is (hi - 1, hi).
    const auto it = std::upper_bound(times_.begin(), times_.end(), t);
    const auto hi = static_cast<std::size_t>(it - times_.begin());
    const auto lo = hi - 1;

    const double span = times_[hi] - times_[lo];
    const double frac = (t - times_[lo]) / span;
    return values_[lo] + frac * (values_[hi] - values_[lo]);
}

} // namespace divsim
