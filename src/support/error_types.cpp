// SPDX-License-Identifier: MIT
#include "src/support/error_types.hpp"

namespace rootfind {

std::string_view to_string(RootFindingErrorCode code) noexcept {
    switch (code) {
        case RootFindingErrorCode::InvalidBracket:
            return "InvalidBracket";
        case RootFindingErrorCode::DegenerateSecant:
            return "DegenerateSecant";
        case RootFindingErrorCode::DegenerateInterpolation:
            return "DegenerateInterpolation";
        case RootFindingErrorCode::InvalidTolerance:
            return "InvalidTolerance";
        case RootFindingErrorCode::NumericalInstability:
            return "NumericalInstability";
    }
    return "Unknown";
}

std::string_view to_string(StopReason reason) noexcept {
    switch (reason) {
        case StopReason::Converged:
            return "Converged";
        case StopReason::ExactRoot:
            return "ExactRoot";
        case StopReason::IterationLimitExceeded:
            return "IterationLimitExceeded";
        case StopReason::StabilityGuardTriggered:
            return "StabilityGuardTriggered";
        case StopReason::ResolutionLimit:
            return "ResolutionLimit";
    }
    return "Unknown";
}

std::string_view describe(RootFindingErrorCode code) noexcept {
    switch (code) {
        case RootFindingErrorCode::InvalidBracket:
            return "f(a) and f(b) must have opposite signs, no root is guaranteed in the interval";
        case RootFindingErrorCode::DegenerateSecant:
            return "division by zero, f(x1) and f(x0) are equal";
        case RootFindingErrorCode::DegenerateInterpolation:
            return "division by zero, f(b) and f(a) are equal";
        case RootFindingErrorCode::InvalidTolerance:
            return "tolerance must be finite and strictly positive";
        case RootFindingErrorCode::NumericalInstability:
            return "function returned a non-finite value (NaN or Inf)";
    }
    return "unknown error";
}

std::ostream& operator<<(std::ostream& os, RootFindingErrorCode code) {
    return os << to_string(code);
}

std::ostream& operator<<(std::ostream& os, StopReason reason) {
    return os << to_string(reason);
}

std::ostream& operator<<(std::ostream& os, const RootFindingError& err) {
    os << "RootFindingError{code=" << err.code
       << ", iterations=" << err.iterations
       << ", final_error=" << err.final_error;
    if (err.last_value) {
        os << ", last_value=" << *err.last_value;
    }
    os << "}";
    return os;
}

}  // namespace rootfind
