#pragma once

/// @file include/divsim/error.hpp
/// @brief Error taxonomy for the divsim simulator.
///
/// # Module: Errors
///
/// ## Responsibility
/// Name every fatal condition the simulator can hit and carry it in one
/// exception type. Expected outcomes (no event before the horizon, retry cap
/// reached, unreadable input file) are NOT errors: they travel as
/// `std::optional` or `std::variant` values.
///
/// ## Categories
///   - Construction: bad rate specification or engine configuration,
///     raised before any simulation work starts.
///   - Runtime: a user rate function produced an invalid value while
///     being sampled.
///   - Numerical: the event-time root search did not converge.

#include <stdexcept>
#include <string>

namespace divsim {

/// Specific failure reason.
enum class ErrorCode {
    MissingEnvironment,      ///< time+environment rate without a table
    ShiftLengthMismatch,     ///< step values and shift times differ in length
    UnsupportedCombination,  ///< e.g. step vector together with an environment
    InvalidShifts,           ///< shift times non-finite or not monotone
    DegenerateShape,         ///< Weibull shape below MIN_WEIBULL_SHAPE
    InvalidRate,             ///< negative, non-finite or zero-scale rate value
    InvalidArgument,         ///< bad engine parameter (n0, tMax, ranges)
    NonConvergence,          ///< root search exhausted its budget
};

/// Broad class of an ErrorCode.
enum class ErrorCategory {
    Construction,
    Runtime,
    Numerical,
};

/// Human-readable name of an ErrorCode.
[[nodiscard]] const char* to_string(ErrorCode code) noexcept;

/// Category an ErrorCode belongs to. InvalidRate is a runtime error even
/// when a constant rate is rejected at build time. DegenerateShape is a
/// construction error that may also surface while sampling.
[[nodiscard]] ErrorCategory category(ErrorCode code) noexcept;

/// The single exception type thrown by divsim.
class DivsimError : public std::runtime_error {
public:
    DivsimError(ErrorCode code, const std::string& detail);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] bool is_construction_error() const noexcept {
        return category(code_) == ErrorCategory::Construction;
    }

private:
    ErrorCode code_;
};

} // namespace divsim
