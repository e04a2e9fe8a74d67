// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/root_finding.hpp"
#include "src/support/rootfind_trace.h"
#include <cmath>
#include <cstddef>
#include <utility>

namespace rootfind {

/// Find root using the bisection method
///
/// Halves the bracket [a, b] until its width is at most `config.tolerance`.
/// Only f(a) is cached across iterations; it is refreshed from f(c) when the
/// left endpoint moves, so each iteration costs exactly one evaluation.
///
/// **Stopping test:** bracket width, `b - a <= tolerance`.
/// `config.max_iter` is ignored: the width halves every iteration.
///
/// **Soft stops:**
/// - `f(c) == 0` exactly: converged with StopReason::ExactRoot
/// - the midpoint is no longer strictly inside the bracket (tolerance below
///   floating-point resolution): converged == false, StopReason::ResolutionLimit
///
/// **Precondition:** f(a) and f(b) must have opposite signs. Endpoints given
/// in reverse order are swapped.
///
/// @tparam F Function type satisfying ObjectiveFunction
/// @tparam S Iteration sink, receives {k, a, b, c, f(c)} before the update
/// @param f Function to find root of
/// @param a Left bracket
/// @param b Right bracket
/// @param config Root-finding configuration (uses tolerance)
/// @param sink Per-iteration record consumer
/// @return Estimate with residual f(c), or InvalidBracket / InvalidTolerance /
///         NumericalInstability
template<ObjectiveFunction F, IterationSink S = NullIterationSink>
RootFindingResult bisection_find_root(F&& f, double a, double b,
                                      const RootFindingConfig& config,
                                      S&& sink = {}) {
    if (auto err = validate_config(config)) {
        ROOTFIND_TRACE_VALIDATION_ERROR(MODULE_BISECTION, static_cast<int>(err->code),
                                        config.tolerance, 0.0);
        return std::unexpected(*err);
    }

    double fa = f(a);
    double fb = f(b);

    if (auto err = detail::check_bracket(fa, fb)) {
        ROOTFIND_TRACE_VALIDATION_ERROR(MODULE_BISECTION, static_cast<int>(err->code), fa, fb);
        return std::unexpected(*err);
    }

    if (a > b) {
        std::swap(a, b);
        std::swap(fa, fb);
    }

    ROOTFIND_TRACE_ALGO_START(MODULE_BISECTION, 0, config.tolerance, (b - a));

    double c = a;
    double fc = fa;
    size_t iterations = 0;
    StopReason reason = StopReason::Converged;

    while ((b - a) > config.tolerance) {
        const double mid = (a + b) / 2.0;
        if (!(a < mid && mid < b)) {
            reason = StopReason::ResolutionLimit;
            break;
        }

        c = mid;
        fc = f(c);
        if (!std::isfinite(fc)) {
            ROOTFIND_TRACE_RUNTIME_ERROR(MODULE_BISECTION,
                static_cast<int>(RootFindingErrorCode::NumericalInstability), iterations + 1);
            return std::unexpected(detail::non_finite_error(iterations, c));
        }
        ++iterations;

        sink(IterationRecord{iterations, a, b, c, fc});
        ROOTFIND_TRACE_CONVERGENCE_ITER(MODULE_BISECTION, iterations, c, fc);

        if (fc == 0.0) {
            reason = StopReason::ExactRoot;
            break;
        }

        // [a, c] keeps the sign change: fa stays valid
        if (detail::opposite_signs(fa, fc)) {
            b = c;
        } else {
            a = c;
            fa = fc;
        }
    }

    if (is_converged(reason)) {
        ROOTFIND_TRACE_CONVERGENCE_SUCCESS(MODULE_BISECTION, iterations, c);
    } else {
        ROOTFIND_TRACE_CONVERGENCE_FAILED(MODULE_BISECTION, iterations, static_cast<int>(reason));
    }

    return RootEstimate{
        .root = c,
        .converged = is_converged(reason),
        .iterations = iterations,
        .residual = fc,
        .stop_reason = reason
    };
}

}  // namespace rootfind
