// SPDX-License-Identifier: MIT
/**
 * @file rootfind_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the rootfind library
 *
 * This header provides zero-overhead tracing points that can be dynamically
 * enabled at runtime using tools like bpftrace, systemtap, or perf.
 *
 * When tracing is disabled (default), probes compile to single NOP instructions.
 * When enabled via tracing tools, probes capture structured data without
 * modifying the library binary.
 *
 * Every root finder fires the same lifecycle probes, tagged with its
 * MODULE_* identifier, so one script can watch all six methods.
 *
 * Example usage with bpftrace:
 *   # Trace every iteration of every method
 *   sudo bpftrace -e 'usdt:./example_root_finders:rootfind:convergence_iter {
 *       printf("module=%d iter=%d\n", arg0, arg1); }'
 *
 *   # Watch Steffensen soft stops
 *   sudo bpftrace -e 'usdt:./example_root_finders:rootfind:stability_guard { ... }'
 */

#ifndef ROOTFIND_TRACE_H
#define ROOTFIND_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
// Fallback: define empty macros when SDT is not available
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all rootfind library probes
 */
#define ROOTFIND_PROVIDER rootfind

/**
 * Module identifiers for multi-module tracing
 * These are passed as the first parameter to many probes
 */
#define MODULE_BISECTION     1
#define MODULE_REGULA_FALSI  2
#define MODULE_SECANT        3
#define MODULE_ILLINOIS      4
#define MODULE_FIXED_POINT   5
#define MODULE_STEFFENSEN    6

/**
 * Illinois stagnant side identifiers
 */
#define ILLINOIS_SIDE_LEFT   1
#define ILLINOIS_SIDE_RIGHT  2

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when a root finder begins execution
 * @param module_id: Module identifier (MODULE_* constant)
 * @param max_iter: Iteration budget (0 for bisection)
 * @param tolerance: Stopping tolerance
 * @param extent: Initial bracket width or starting point
 */
#define ROOTFIND_TRACE_ALGO_START(module_id, max_iter, tolerance, extent) \
    DTRACE_PROBE4(ROOTFIND_PROVIDER, algo_start, module_id, max_iter, tolerance, extent)

/**
 * ============================================================================
 * Convergence Tracking Probes
 * ============================================================================
 */

/**
 * Fired on each iteration of a convergence loop
 * @param module_id: Module identifier
 * @param iter: Current iteration number (1-based)
 * @param x: New approximation
 * @param error: Current error metric
 */
#define ROOTFIND_TRACE_CONVERGENCE_ITER(module_id, iter, x, error) \
    DTRACE_PROBE4(ROOTFIND_PROVIDER, convergence_iter, module_id, iter, x, error)

/**
 * Fired when the stopping tolerance is met
 * @param module_id: Module identifier
 * @param final_iter: Number of iterations required
 * @param root: Converged approximation
 */
#define ROOTFIND_TRACE_CONVERGENCE_SUCCESS(module_id, final_iter, root) \
    DTRACE_PROBE3(ROOTFIND_PROVIDER, convergence_success, module_id, final_iter, root)

/**
 * Fired when a loop stops without meeting its tolerance
 * @param module_id: Module identifier
 * @param iterations: Iterations completed
 * @param stop_reason: StopReason cast to int
 */
#define ROOTFIND_TRACE_CONVERGENCE_FAILED(module_id, iterations, stop_reason) \
    DTRACE_PROBE3(ROOTFIND_PROVIDER, convergence_failed, module_id, iterations, stop_reason)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails before any iteration
 * @param module_id: Module identifier
 * @param error_code: RootFindingErrorCode cast to int
 * @param param1: Relevant parameter value (e.g. f(a), tolerance)
 * @param param2: Relevant parameter value (e.g. f(b))
 */
#define ROOTFIND_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(ROOTFIND_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * Fired when an iteration cannot proceed
 * @param module_id: Module identifier
 * @param error_code: RootFindingErrorCode cast to int
 * @param iter: Iteration at which the failure occurred
 */
#define ROOTFIND_TRACE_RUNTIME_ERROR(module_id, error_code, iter) \
    DTRACE_PROBE3(ROOTFIND_PROVIDER, runtime_error, module_id, error_code, iter)

/**
 * ============================================================================
 * Module-Specific Probes
 * ============================================================================
 */

/**
 * Fired when Illinois halves the cached value of a stagnant endpoint
 * @param iter: Iteration number
 * @param side: ILLINOIS_SIDE_LEFT or ILLINOIS_SIDE_RIGHT
 * @param halved_value: Cached function value after halving
 */
#define ROOTFIND_TRACE_ILLINOIS_PENALTY(iter, side, halved_value) \
    DTRACE_PROBE3(ROOTFIND_PROVIDER, illinois_penalty, iter, side, halved_value)

/**
 * Fired when the Steffensen denominator guard stops the loop
 * @param iter: Iteration at which the guard fired
 * @param x: Last stable estimate (returned to the caller)
 * @param denom: Second finite difference that vanished
 */
#define ROOTFIND_TRACE_STABILITY_GUARD(iter, x, denom) \
    DTRACE_PROBE3(ROOTFIND_PROVIDER, stability_guard, iter, x, denom)

#endif // ROOTFIND_TRACE_H
