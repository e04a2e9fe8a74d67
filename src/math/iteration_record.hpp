// SPDX-License-Identifier: MIT
#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <vector>

namespace rootfind {

/// Per-iteration diagnostic state emitted by every root finder
///
/// The meaning of `first` and `second` depends on the method:
/// - bisection, regula falsi, Illinois: bracket [a, b] before the update
/// - secant: the point pair (x0, x1) used for the step
/// - fixed point: x_k and g(x_k)
/// - Steffensen: x and g(x)
struct IterationRecord {
    size_t index;          ///< 1-based iteration number
    double first;          ///< Lower bound or first point
    double second;         ///< Upper bound or second point
    double approximation;  ///< New approximation produced by this iteration
    double error;          ///< Method-specific error metric

    bool operator==(const IterationRecord&) const = default;
};

/// Concept for iteration sinks
///
/// Any callable taking a record works: lambdas, function objects,
/// std::function, or IterationLog below.
template<typename S>
concept IterationSink = std::invocable<S&, const IterationRecord&>;

/// Sink that discards every record (headless use)
struct NullIterationSink {
    void operator()(const IterationRecord&) const noexcept {}
};

/// Sink that keeps every record in order
class IterationLog {
public:
    void operator()(const IterationRecord& record) { records_.push_back(record); }

    std::span<const IterationRecord> records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    const IterationRecord& operator[](size_t i) const { return records_[i]; }
    const IterationRecord& back() const { return records_.back(); }

    void clear() { records_.clear(); }

private:
    std::vector<IterationRecord> records_;
};

}  // namespace rootfind
