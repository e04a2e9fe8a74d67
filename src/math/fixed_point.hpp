// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/root_finding.hpp"
#include "src/support/rootfind_trace.h"
#include <cmath>
#include <cstddef>
#include <utility>

namespace rootfind {

/// Fixed-point iteration x_{k+1} = g(x_k)
///
/// Solves x = g(x). The residual function f (whose zero coincides with the
/// fixed point) is used for diagnostics only: each record carries
/// |f(x_{k+1})| and the estimate carries f(p) at the returned point.
///
/// **Stopping test:** step size, `|x_{k+1} - x_k| < tolerance`.
///
/// Non-convergence within max_iter is an expected outcome, reported as
/// converged == false with the last iterate, never as an error.
///
/// @tparam G Iteration function type
/// @tparam F Residual function type
/// @param g Iteration function
/// @param f Residual function, zero at the fixed point
/// @param x0 Initial guess
/// @param config Root-finding configuration (uses max_iter, tolerance)
/// @param sink Receives {k, x_k, g(x_k), x_{k+1}, |f(x_{k+1})|}
/// @return Estimate {p, converged, iterations, f(p)}, or InvalidTolerance /
///         NumericalInstability if g leaves the finite range
template<IterationFunction G, ObjectiveFunction F, IterationSink S = NullIterationSink>
RootFindingResult fixed_point_solve(G&& g, F&& f, double x0,
                                    const RootFindingConfig& config,
                                    S&& sink = {}) {
    if (auto err = validate_config(config)) {
        ROOTFIND_TRACE_VALIDATION_ERROR(MODULE_FIXED_POINT, static_cast<int>(err->code),
                                        config.tolerance, 0.0);
        return std::unexpected(*err);
    }

    ROOTFIND_TRACE_ALGO_START(MODULE_FIXED_POINT, config.max_iter, config.tolerance, x0);

    double xk = x0;
    size_t k = 0;
    bool converged = false;

    while (k < config.max_iter) {
        const double xkp1 = g(xk);
        if (!std::isfinite(xkp1)) {
            ROOTFIND_TRACE_RUNTIME_ERROR(MODULE_FIXED_POINT,
                static_cast<int>(RootFindingErrorCode::NumericalInstability), k + 1);
            return std::unexpected(detail::non_finite_error(k, xk));
        }
        ++k;

        const double err = std::abs(f(xkp1));
        sink(IterationRecord{k, xk, xkp1, xkp1, err});
        ROOTFIND_TRACE_CONVERGENCE_ITER(MODULE_FIXED_POINT, k, xkp1, err);

        const double step = std::abs(xkp1 - xk);
        xk = xkp1;
        if (step < config.tolerance) {
            converged = true;
            break;
        }
    }

    if (converged) {
        ROOTFIND_TRACE_CONVERGENCE_SUCCESS(MODULE_FIXED_POINT, k, xk);
    } else {
        ROOTFIND_TRACE_CONVERGENCE_FAILED(MODULE_FIXED_POINT, k,
                                          static_cast<int>(StopReason::IterationLimitExceeded));
    }

    return RootEstimate{
        .root = xk,
        .converged = converged,
        .iterations = k,
        .residual = f(xk),
        .stop_reason = converged ? StopReason::Converged : StopReason::IterationLimitExceeded
    };
}

/// Fixed-point iteration with the default residual f(x) = g(x) - x
///
/// @see fixed_point_solve(G&&, F&&, double, const RootFindingConfig&, S&&)
template<IterationFunction G, IterationSink S = NullIterationSink>
RootFindingResult fixed_point_solve(G&& g, double x0,
                                    const RootFindingConfig& config,
                                    S&& sink = {}) {
    auto residual = [&g](double x) { return g(x) - x; };
    return fixed_point_solve(g, residual, x0, config, std::forward<S>(sink));
}

}  // namespace rootfind
