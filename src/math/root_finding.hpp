// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/iteration_record.hpp"
#include "src/support/error_types.hpp"
#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <expected>
#include <limits>
#include <optional>

namespace rootfind {

/// Configuration for all root-finding methods
///
/// Unified configuration shared by the six scalar root finders.
/// Each method uses only its relevant parameters, and each method's
/// documentation states what `tolerance` is compared against:
///
/// | method        | stopping test              |
/// |---------------|----------------------------|
/// | bisection     | b - a <= tolerance         |
/// | regula falsi  | |f(c)| < tolerance         |
/// | Illinois      | |f(c)| < tolerance         |
/// | secant        | |c - x1| < tolerance       |
/// | fixed point   | |x_{k+1} - x_k| < tolerance |
/// | Steffensen    | |x_new - x| < tolerance    |
struct RootFindingConfig {
    /// Maximum iterations (ignored by bisection, which halves the bracket)
    size_t max_iter = 100;

    /// Stopping tolerance, must be finite and > 0
    double tolerance = 1e-6;

    // Steffensen-specific parameters
    double stability_guard_ulps = 10.0;  ///< Aitken denominator guard, in ulps of x
};

/// Outcome of a root-finding call that did not fail hard
///
/// Soft stops (iteration exhaustion, Steffensen stability guard, bisection
/// resolution limit) are reported here with `converged == false`.
struct RootEstimate {
    /// Final (or best available) approximation
    double root;

    /// True if the method-specific tolerance was met
    bool converged;

    /// Number of completed iterations (equals the number of records emitted)
    size_t iterations;

    /// Residual at the returned approximation (method-dependent, see each method)
    double residual;

    /// Why the loop stopped
    StopReason stop_reason;
};

/// Result from any root-finding method
///
/// Uses std::expected for type-safe error handling without exceptions.
/// The error case is reserved for hard mathematical failures: bad bracket,
/// undefined interpolation step, invalid tolerance, or non-finite values.
using RootFindingResult = std::expected<RootEstimate, RootFindingError>;

/// Concept for objective functions (scalar functions f: R -> R)
///
/// Works with any callable that takes a double and returns a double.
/// This includes lambdas, function objects, function pointers, and std::function.
template<typename F>
concept ObjectiveFunction = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Concept for fixed-point iteration functions g: R -> R
///
/// Same signature as ObjectiveFunction but semantically x -> g(x).
template<typename G>
concept IterationFunction = requires(G g, double x) {
    { g(x) } -> std::convertible_to<double>;
};

/// Check the configuration shared by every method
///
/// A tolerance that is zero, negative, or not finite would make width- and
/// step-based loops run forever, so it is rejected before any evaluation.
///
/// @return InvalidTolerance error, or std::nullopt if the config is usable
[[nodiscard]] inline std::optional<RootFindingError>
validate_config(const RootFindingConfig& config) noexcept {
    if (!std::isfinite(config.tolerance) || config.tolerance <= 0.0) {
        return RootFindingError{
            .code = RootFindingErrorCode::InvalidTolerance,
            .iterations = 0,
            .final_error = config.tolerance,
            .last_value = std::nullopt
        };
    }
    if (!std::isfinite(config.stability_guard_ulps) || config.stability_guard_ulps < 0.0) {
        return RootFindingError{
            .code = RootFindingErrorCode::InvalidTolerance,
            .iterations = 0,
            .final_error = config.stability_guard_ulps,
            .last_value = std::nullopt
        };
    }
    return std::nullopt;
}

/// Distance from |x| to the next representable double
///
/// Matches the spacing used to scale the Steffensen stability guard.
inline double ulp(double x) noexcept {
    const double ax = std::abs(x);
    return std::nextafter(ax, std::numeric_limits<double>::infinity()) - ax;
}

namespace detail {

/// Strict sign change between two function values
///
/// Equivalent to fa * fb < 0 but immune to the product underflowing to zero.
constexpr bool opposite_signs(double fa, double fb) noexcept {
    return (fa < 0.0 && fb > 0.0) || (fa > 0.0 && fb < 0.0);
}

/// Validate the cached endpoint values of a bracket [a, b]
///
/// NaN is reported as NumericalInstability; any pair whose product is
/// non-negative (including a zero endpoint) is an InvalidBracket.
[[nodiscard]] inline std::optional<RootFindingError>
check_bracket(double fa, double fb) noexcept {
    if (std::isnan(fa) || std::isnan(fb)) {
        return RootFindingError{
            .code = RootFindingErrorCode::NumericalInstability,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::quiet_NaN(),
            .last_value = std::nullopt
        };
    }
    if (!opposite_signs(fa, fb)) {
        return RootFindingError{
            .code = RootFindingErrorCode::InvalidBracket,
            .iterations = 0,
            .final_error = std::min(std::abs(fa), std::abs(fb)),
            .last_value = std::nullopt
        };
    }
    if (!std::isfinite(fa) || !std::isfinite(fb)) {
        return RootFindingError{
            .code = RootFindingErrorCode::NumericalInstability,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::infinity(),
            .last_value = std::nullopt
        };
    }
    return std::nullopt;
}

/// Error for a callable that produced NaN or Inf mid-iteration
inline RootFindingError non_finite_error(size_t completed, double last_value) noexcept {
    return RootFindingError{
        .code = RootFindingErrorCode::NumericalInstability,
        .iterations = completed,
        .final_error = std::numeric_limits<double>::quiet_NaN(),
        .last_value = last_value
    };
}

}  // namespace detail

}  // namespace rootfind
