/// @file src/core/error.cpp
/// @brief ErrorCode names and DivsimError construction.

#include "divsim/error.hpp"

#include <fmt/core.h>

namespace divsim {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::MissingEnvironment:     return "MissingEnvironment";
        case ErrorCode::ShiftLengthMismatch:    return "ShiftLengthMismatch";
        case ErrorCode::UnsupportedCombination: return "UnsupportedCombination";
        case ErrorCode::InvalidShifts:          return "InvalidShifts";
        case ErrorCode::DegenerateShape:        return "DegenerateShape";
        case ErrorCode::InvalidRate:            return "InvalidRate";
        case ErrorCode::InvalidArgument:        return "InvalidArgument";
        case ErrorCode::NonConvergence:         return "NonConvergence";
    }
    return "Unknown";
}

ErrorCategory category(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NonConvergence:
            return ErrorCategory::Numerical;
        case ErrorCode::MissingEnvironment:
        case ErrorCode::ShiftLengthMismatch:
        case ErrorCode::UnsupportedCombination:
        case ErrorCode::InvalidShifts:
        case ErrorCode::DegenerateShape:
        case ErrorCode::InvalidArgument:
            return ErrorCategory::Construction;
        case ErrorCode::InvalidRate:
            return ErrorCategory::Runtime;
    }
    return ErrorCategory::Runtime;
}

DivsimError::DivsimError(ErrorCode code, const std::string& detail)
    : std::runtime_error(fmt::format("{}: {}", to_string(code), detail))
    , code_(code)
{}

} // namespace divsim
