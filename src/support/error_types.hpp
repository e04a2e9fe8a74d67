// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>

namespace rootfind {

/// Hard failure categories surfaced through the expected error path
enum class RootFindingErrorCode {
    InvalidBracket,           ///< f(a) and f(b) do not straddle a sign change
    DegenerateSecant,         ///< f(x1) == f(x0): secant step undefined
    DegenerateInterpolation,  ///< f(b) == f(a): interpolation step undefined
    InvalidTolerance,         ///< Tolerance not finite and strictly positive
    NumericalInstability      ///< Callable returned NaN or Inf
};

/// Why an iteration loop stopped without a hard failure
enum class StopReason {
    Converged,                ///< Method-specific stopping tolerance met
    ExactRoot,                ///< f(c) == 0 exactly (bisection)
    IterationLimitExceeded,   ///< max_iter reached, best estimate returned
    StabilityGuardTriggered,  ///< Aitken denominator vanished (Steffensen)
    ResolutionLimit           ///< Bracket cannot shrink further in floating point
};

/// Detailed root-finding error with diagnostics
struct RootFindingError {
    /// Error code identifying the failure type
    RootFindingErrorCode code;

    /// Number of completed iterations before failure
    size_t iterations = 0;

    /// Error measure at the failure point (method-dependent)
    double final_error = 0.0;

    /// Last value tried before failure, when one exists
    std::optional<double> last_value;
};

std::string_view to_string(RootFindingErrorCode code) noexcept;
std::string_view to_string(StopReason reason) noexcept;

/// Human-readable explanation of a failure, for console summaries
std::string_view describe(RootFindingErrorCode code) noexcept;

/// True for the stop reasons reported with converged == true
constexpr bool is_converged(StopReason reason) noexcept {
    return reason == StopReason::Converged || reason == StopReason::ExactRoot;
}

std::ostream& operator<<(std::ostream& os, RootFindingErrorCode code);
std::ostream& operator<<(std::ostream& os, StopReason reason);
std::ostream& operator<<(std::ostream& os, const RootFindingError& err);

}  // namespace rootfind
