// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/root_finding.hpp"
#include "src/support/rootfind_trace.h"
#include <cmath>
#include <cstddef>

namespace rootfind {

/// Steffensen's method: fixed-point iteration with Aitken Δ² acceleration
///
/// Each iteration evaluates g twice and combines the three iterates:
///
///     x1 = g(x),  x2 = g(x1)
///     denom = x2 - 2*x1 + x
///     x_new = x - (x1 - x)^2 / denom
///
/// Converges quadratically where plain fixed-point iteration is linear.
///
/// **Stability guard:** when |denom| <= stability_guard_ulps * ulp(x) the
/// acceleration is inapplicable (absolute test only, since denom itself
/// approaches zero near the fixed point). The loop stops and returns the last
/// stable x with converged == false and StopReason::StabilityGuardTriggered.
/// This is a soft stop, not an error.
///
/// **Stopping test:** step size, `|x_new - x| < tolerance`.
///
/// @param g Iteration function
/// @param f Residual function used for reporting, zero at the fixed point
/// @param x0 Initial guess
/// @param config Root-finding configuration (uses max_iter, tolerance,
///               stability_guard_ulps)
/// @param sink Receives {k, x, g(x), x_new, f(x_new)}
/// @return Estimate with residual f(root), or InvalidTolerance /
///         NumericalInstability
template<IterationFunction G, ObjectiveFunction F, IterationSink S = NullIterationSink>
RootFindingResult steffensen_solve(G&& g, F&& f, double x0,
                                   const RootFindingConfig& config,
                                   S&& sink = {}) {
    if (auto err = validate_config(config)) {
        ROOTFIND_TRACE_VALIDATION_ERROR(MODULE_STEFFENSEN, static_cast<int>(err->code),
                                        config.tolerance, config.stability_guard_ulps);
        return std::unexpected(*err);
    }

    ROOTFIND_TRACE_ALGO_START(MODULE_STEFFENSEN, config.max_iter, config.tolerance, x0);

    double x = x0;

    for (size_t k = 1; k <= config.max_iter; ++k) {
        const double x1 = g(x);
        const double x2 = g(x1);

        if (!std::isfinite(x1) || !std::isfinite(x2)) {
            ROOTFIND_TRACE_RUNTIME_ERROR(MODULE_STEFFENSEN,
                static_cast<int>(RootFindingErrorCode::NumericalInstability), k);
            return std::unexpected(detail::non_finite_error(k - 1, x));
        }

        const double denom = x2 - 2.0 * x1 + x;
        if (std::abs(denom) <= config.stability_guard_ulps * ulp(x)) {
            ROOTFIND_TRACE_STABILITY_GUARD(k, x, denom);
            ROOTFIND_TRACE_CONVERGENCE_FAILED(MODULE_STEFFENSEN, k - 1,
                static_cast<int>(StopReason::StabilityGuardTriggered));
            return RootEstimate{
                .root = x,
                .converged = false,
                .iterations = k - 1,
                .residual = f(x),
                .stop_reason = StopReason::StabilityGuardTriggered
            };
        }

        const double dx = x1 - x;
        const double x_new = x - dx * dx / denom;
        if (!std::isfinite(x_new)) {
            ROOTFIND_TRACE_RUNTIME_ERROR(MODULE_STEFFENSEN,
                static_cast<int>(RootFindingErrorCode::NumericalInstability), k);
            return std::unexpected(detail::non_finite_error(k - 1, x));
        }

        const double err = f(x_new);
        sink(IterationRecord{k, x, x1, x_new, err});
        ROOTFIND_TRACE_CONVERGENCE_ITER(MODULE_STEFFENSEN, k, x_new, err);

        if (std::abs(x_new - x) < config.tolerance) {
            ROOTFIND_TRACE_CONVERGENCE_SUCCESS(MODULE_STEFFENSEN, k, x_new);
            return RootEstimate{
                .root = x_new,
                .converged = true,
                .iterations = k,
                .residual = err,
                .stop_reason = StopReason::Converged
            };
        }

        x = x_new;
    }

    // Max iterations reached
    ROOTFIND_TRACE_CONVERGENCE_FAILED(MODULE_STEFFENSEN, config.max_iter,
                                      static_cast<int>(StopReason::IterationLimitExceeded));
    return RootEstimate{
        .root = x,
        .converged = false,
        .iterations = config.max_iter,
        .residual = f(x),
        .stop_reason = StopReason::IterationLimitExceeded
    };
}

}  // namespace rootfind
