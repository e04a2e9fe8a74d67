// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/root_finding.hpp"
#include "src/support/rootfind_trace.h"
#include <cmath>
#include <cstddef>

namespace rootfind {

/// Find root using regula falsi (false position)
///
/// Replaces the bisection midpoint with the root of the chord through
/// (a, f(a)) and (b, f(b)):
///
///     c = (a*f(b) - b*f(a)) / (f(b) - f(a))
///
/// Both endpoint values are cached; only the endpoint that moves is refreshed.
/// Convergence is linear and can stall when one endpoint never moves; see
/// illinois_find_root for the damped variant.
///
/// **Stopping test:** function value, `|f(c)| < tolerance` (not bracket width).
///
/// **Precondition:** f(a) and f(b) must have opposite signs.
///
/// @param f Function to find root of
/// @param a Left bracket
/// @param b Right bracket
/// @param config Root-finding configuration (uses max_iter, tolerance)
/// @param sink Receives {k, a, b, c, f(c)} with the bracket before the update
/// @return Estimate (converged == false with the last c on exhaustion), or
///         InvalidBracket / InvalidTolerance / NumericalInstability
template<ObjectiveFunction F, IterationSink S = NullIterationSink>
RootFindingResult regula_falsi_find_root(F&& f, double a, double b,
                                         const RootFindingConfig& config,
                                         S&& sink = {}) {
    if (auto err = validate_config(config)) {
        ROOTFIND_TRACE_VALIDATION_ERROR(MODULE_REGULA_FALSI, static_cast<int>(err->code),
                                        config.tolerance, 0.0);
        return std::unexpected(*err);
    }

    double fa = f(a);
    double fb = f(b);

    if (auto err = detail::check_bracket(fa, fb)) {
        ROOTFIND_TRACE_VALIDATION_ERROR(MODULE_REGULA_FALSI, static_cast<int>(err->code), fa, fb);
        return std::unexpected(*err);
    }

    ROOTFIND_TRACE_ALGO_START(MODULE_REGULA_FALSI, config.max_iter, config.tolerance, (b - a));

    double c = a;
    double fc = fa;

    for (size_t iter = 1; iter <= config.max_iter; ++iter) {
        c = (a * fb - b * fa) / (fb - fa);
        fc = f(c);

        if (!std::isfinite(fc)) {
            ROOTFIND_TRACE_RUNTIME_ERROR(MODULE_REGULA_FALSI,
                static_cast<int>(RootFindingErrorCode::NumericalInstability), iter);
            return std::unexpected(detail::non_finite_error(iter - 1, c));
        }

        sink(IterationRecord{iter, a, b, c, fc});
        ROOTFIND_TRACE_CONVERGENCE_ITER(MODULE_REGULA_FALSI, iter, c, fc);

        if (std::abs(fc) < config.tolerance) {
            ROOTFIND_TRACE_CONVERGENCE_SUCCESS(MODULE_REGULA_FALSI, iter, c);
            return RootEstimate{
                .root = c,
                .converged = true,
                .iterations = iter,
                .residual = fc,
                .stop_reason = StopReason::Converged
            };
        }

        if (detail::opposite_signs(fa, fc)) {
            b = c;
            fb = fc;
        } else {
            a = c;
            fa = fc;
        }
    }

    // Max iterations reached
    ROOTFIND_TRACE_CONVERGENCE_FAILED(MODULE_REGULA_FALSI, config.max_iter,
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
