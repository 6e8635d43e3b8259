#pragma once

/// @file include/divsim/environment.hpp
/// @brief Environment Table — immutable (time, value) series with linear
///        interpolation.
///
/// # Module: Environment Table
///
/// ## Responsibility
/// Hold an environmental variable (temperature, CO2, available niches...)
/// sampled at ascending clade-relative times, and answer "what was the
/// value at time t" for the Rate Builder.
///
/// ## Interpolation
/// For t between rows i and i+1:
///   value(t) = v_i + (v_{i+1} − v_i) · (t − t_i) / (t_{i+1} − t_i)
///
/// ## Edge Cases
/// - t below the first row: clamps to the first value
/// - t above the last row: clamps to the last value
/// - single-row table: constant
/// - NaN query: returns NaN (the sampler rejects it as an invalid rate)
///
/// ## Guarantees
/// - Immutable after construction; safe to share across threads
/// - Rows strictly ascending in time, all finite, at least one row

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace divsim {

class EnvironmentTable {
public:
    /// Build a table from parallel time and value columns.
    ///
    /// # Returns
    /// `nullopt` if the columns differ in length, are empty, contain a
    /// non-finite entry, or the times are not strictly ascending.
    [[nodiscard]] static std::optional<EnvironmentTable>
    from_columns(std::vector<double> times, std::vector<double> values);

    /// Interpolated value at clade-relative time `t`, clamped at the ends.
    [[nodiscard]] double at(double t) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return times_.size(); }
    [[nodiscard]] std::span<const double> times() const noexcept { return times_; }
    [[nodiscard]] std::span<const double> values() const noexcept { return values_; }

    /// First and last time covered by the table.
    [[nodiscard]] double start_time() const noexcept { return times_.front(); }
    [[nodiscard]] double end_time() const noexcept { return times_.back(); }

private:
    EnvironmentTable(std::vector<double> times, std::vector<double> values) noexcept;

    std::vector<double> times_;
    std::vector<double> values_;
};

} // namespace divsim
