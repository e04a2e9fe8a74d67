// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/root_finding.hpp"
#include "src/support/rootfind_trace.h"
#include <cmath>
#include <cstddef>

namespace rootfind {

/// Find root using the secant method
///
/// Starts from two points with no bracketing requirement and steps to the
/// root of the line through the two most recent iterates:
///
///     c = x1 - f(x1) * (x1 - x0) / (f(x1) - f(x0))
///
/// After each step the pair shifts (x0 <- x1, x1 <- c) and the cached values
/// shift with it, so every iteration evaluates f exactly once.
///
/// **Properties:**
/// - Superlinear convergence (order ~1.618) near a simple root
/// - No bracket, so no convergence guarantee far from the root
///
/// **Stopping test:** step size, `|c - x1| < tolerance` (not the residual).
///
/// @param f Function to find root of
/// @param x0 First initial point
/// @param x1 Second initial point
/// @param config Root-finding configuration (uses max_iter, tolerance)
/// @param sink Receives {k, x0, x1, c, f(c)}
/// @return Estimate with residual f(c), or DegenerateSecant as soon as
///         f(x1) == f(x0), or InvalidTolerance / NumericalInstability
template<ObjectiveFunction F, IterationSink S = NullIterationSink>
RootFindingResult secant_find_root(F&& f, double x0, double x1,
                                   const RootFindingConfig& config,
                                   S&& sink = {}) {
    if (auto err = validate_config(config)) {
        ROOTFIND_TRACE_VALIDATION_ERROR(MODULE_SECANT, static_cast<int>(err->code),
                                        config.tolerance, 0.0);
        return std::unexpected(*err);
    }

    double fx0 = f(x0);
    double fx1 = f(x1);

    if (!std::isfinite(fx0) || !std::isfinite(fx1)) {
        ROOTFIND_TRACE_VALIDATION_ERROR(MODULE_SECANT,
            static_cast<int>(RootFindingErrorCode::NumericalInstability), fx0, fx1);
        return std::unexpected(RootFindingError{
            .code = RootFindingErrorCode::NumericalInstability,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::quiet_NaN(),
            .last_value = std::nullopt
        });
    }

    ROOTFIND_TRACE_ALGO_START(MODULE_SECANT, config.max_iter, config.tolerance, x1);

    double c = x1;
    double fc = fx1;

    for (size_t iter = 1; iter <= config.max_iter; ++iter) {
        if (fx1 - fx0 == 0.0) {
            ROOTFIND_TRACE_RUNTIME_ERROR(MODULE_SECANT,
                static_cast<int>(RootFindingErrorCode::DegenerateSecant), iter);
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::DegenerateSecant,
                .iterations = iter - 1,
                .final_error = std::abs(fx1),
                .last_value = x1
            });
        }

        c = x1 - fx1 * (x1 - x0) / (fx1 - fx0);
        fc = f(c);

        if (!std::isfinite(fc)) {
            ROOTFIND_TRACE_RUNTIME_ERROR(MODULE_SECANT,
                static_cast<int>(RootFindingErrorCode::NumericalInstability), iter);
            return std::unexpected(detail::non_finite_error(iter - 1, c));
        }

        sink(IterationRecord{iter, x0, x1, c, fc});
        ROOTFIND_TRACE_CONVERGENCE_ITER(MODULE_SECANT, iter, c, fc);

        if (std::abs(c - x1) < config.tolerance) {
            ROOTFIND_TRACE_CONVERGENCE_SUCCESS(MODULE_SECANT, iter, c);
            return RootEstimate{
                .root = c,
                .converged = true,
                .iterations = iter,
                .residual = fc,
                .stop_reason = StopReason::Converged
            };
        }

        x0 = x1;
        fx0 = fx1;
        x1 = c;
        fx1 = fc;
    }

    // Max iterations reached
    ROOTFIND_TRACE_CONVERGENCE_FAILED(MODULE_SECANT, config.max_iter,
                                      static_cast<int>(StopReason::IterationLimitExceeded));
    return RootEstimate{
        .root = c,
        .converged = false,
        .iterations = config.max_iter,
        .residual = fc,
        .stop_reason = StopReason::IterationLimitExceeded
    };
}

}  // namespace rootfind
