// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/root_finding.hpp"
#include "src/support/rootfind_trace.h"
#include <cmath>
#include <cstddef>

namespace rootfind {

/// Which bracket endpoint was retained unchanged by the previous Illinois step
enum class Stagnation {
    None,           ///< No step taken yet
    LeftStagnant,   ///< a stayed put (root was in [a, c])
    RightStagnant   ///< b stayed put (root was in [c, b])
};

/// Find root using the Illinois variant of regula falsi
///
/// Same chord update as regula_falsi_find_root, plus a stagnation penalty:
/// when the same endpoint is retained for a second consecutive step, its
/// cached function value is halved before the new endpoint value is stored.
/// This pulls the next chord towards the stagnant side and restores
/// superlinear convergence where plain regula falsi crawls.
///
/// The tracker only ever switches between LeftStagnant and RightStagnant;
/// retaining the other endpoint flips it, it is never cleared.
///
/// **Stopping test:** function value, `|f(c)| < tolerance`.
///
/// **Precondition:** f(a) and f(b) must have opposite signs.
///
/// @param f Function to find root of
/// @param a Left bracket
/// @param b Right bracket
/// @param config Root-finding configuration (uses max_iter, tolerance)
/// @param sink Receives {k, a, b, c, f(c)} with the bracket before the update
/// @return Estimate (converged == false with the last c on exhaustion), or
///         InvalidBracket / DegenerateInterpolation / InvalidTolerance /
///         NumericalInstability
template<ObjectiveFunction F, IterationSink S = NullIterationSink>
RootFindingResult illinois_find_root(F&& f, double a, double b,
                                     const RootFindingConfig& config,
                                     S&& sink = {}) {
    if (auto err = validate_config(config)) {
        ROOTFIND_TRACE_VALIDATION_ERROR(MODULE_ILLINOIS, static_cast<int>(err->code),
                                        config.tolerance, 0.0);
        return std::unexpected(*err);
    }

    double fa = f(a);
    double fb = f(b);

    if (auto err = detail::check_bracket(fa, fb)) {
        ROOTFIND_TRACE_VALIDATION_ERROR(MODULE_ILLINOIS, static_cast<int>(err->code), fa, fb);
        return std::unexpected(*err);
    }

    ROOTFIND_TRACE_ALGO_START(MODULE_ILLINOIS, config.max_iter, config.tolerance, (b - a));

    double c = a;
    double fc = fa;
    Stagnation stagnant = Stagnation::None;

    for (size_t iter = 1; iter <= config.max_iter; ++iter) {
        if (fb - fa == 0.0) {
            ROOTFIND_TRACE_RUNTIME_ERROR(MODULE_ILLINOIS,
                static_cast<int>(RootFindingErrorCode::DegenerateInterpolation), iter);
            return std::unexpected(RootFindingError{
                .code = RootFindingErrorCode::DegenerateInterpolation,
                .iterations = iter - 1,
                .final_error = std::abs(fc),
                .last_value = c
            });
        }

        c = (a * fb - b * fa) / (fb - fa);
        fc = f(c);

        if (!std::isfinite(fc)) {
            ROOTFIND_TRACE_RUNTIME_ERROR(MODULE_ILLINOIS,
                static_cast<int>(RootFindingErrorCode::NumericalInstability), iter);
            return std::unexpected(detail::non_finite_error(iter - 1, c));
        }

        sink(IterationRecord{iter, a, b, c, fc});
        ROOTFIND_TRACE_CONVERGENCE_ITER(MODULE_ILLINOIS, iter, c, fc);

        if (std::abs(fc) < config.tolerance) {
            ROOTFIND_TRACE_CONVERGENCE_SUCCESS(MODULE_ILLINOIS, iter, c);
            return RootEstimate{
                .root = c,
                .converged = true,
                .iterations = iter,
                .residual = fc,
                .stop_reason = StopReason::Converged
            };
        }

        if (detail::opposite_signs(fa, fc)) {
            // Root in [a, c]: a is retained
            b = c;
            if (stagnant == Stagnation::LeftStagnant) {
                fa /= 2.0;
                ROOTFIND_TRACE_ILLINOIS_PENALTY(iter, ILLINOIS_SIDE_LEFT, fa);
            }
            fb = fc;
            stagnant = Stagnation::LeftStagnant;
        } else {
            // Root in [c, b]: b is retained
            a = c;
            if (stagnant == Stagnation::RightStagnant) {
                fb /= 2.0;
                ROOTFIND_TRACE_ILLINOIS_PENALTY(iter, ILLINOIS_SIDE_RIGHT, fb);
            }
            fa = fc;
            stagnant = Stagnation::RightStagnant;
        }
    }

    // Max iterations reached
    ROOTFIND_TRACE_CONVERGENCE_FAILED(MODULE_ILLINOIS, config.max_iter,
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
