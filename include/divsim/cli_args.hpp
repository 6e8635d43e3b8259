#pragma once

/// @file include/divsim/cli_args.hpp
/// @brief Command-line value parsing for the divsim executable.
///
/// # Module: CLI Arguments
///
/// ## Responsibility
/// Turn flag values into engine configuration. Parsers return
/// `std::nullopt` for text they cannot accept; `to_rate_input` throws
/// `DivsimError(InvalidArgument)` for flag combinations it cannot honour.
///
/// ## Guarantees
/// - Counts and seeds are whole, non-negative and representable in the
///   target type; anything else is rejected rather than cast
/// - An environment-driven rate never silently drops explicit values

#include "divsim/engine.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace divsim::cli {

/// Comma-separated numbers. "inf" is accepted, NaN and trailing text are not.
[[nodiscard]] std::optional<std::vector<double>> parse_list(const std::string& text);

/// `v` as an unsigned count, or nullopt if it is negative, fractional,
/// non-finite or larger than `T` can hold.
template <typename T>
[[nodiscard]] std::optional<T> to_count(double v) {
    // max() rounds up to 2^digits as a double, so equality is out of range.
    if (!std::isfinite(v) || v < 0.0 || std::floor(v) != v ||
        v >= static_cast<double>(std::numeric_limits<T>::max())) {
        return std::nullopt;
    }
    return static_cast<T>(v);
}

/// A single whole number of type `T`.
template <typename T>
[[nodiscard]] std::optional<T> parse_count(const std::string& text) {
    const auto values = parse_list(text);
    if (!values || values->size() != 1) {
        return std::nullopt;
    }
    return to_count<T>(values->front());
}

/// "min,max" where max may be "inf".
[[nodiscard]] std::optional<CountRange> parse_range(const std::string& text);

/// Per-rate flag state before it becomes a RateInput.
struct RateArgs {
    std::vector<double>   values{0.0};
    bool                  values_given = false;  ///< --lambda / --mu seen
    std::vector<double>   shifts;
    std::optional<double> shape;
    std::string           env_path;
    std::vector<double>   env_coef;
};

/// Build the RateInput for one process. `name` is "lambda" or "mu".
/// An environment path yields `a·exp(b·env)` and loads the table.
[[nodiscard]] RateInput to_rate_input(const RateArgs& args, const std::string& name);

} // namespace divsim::cli
