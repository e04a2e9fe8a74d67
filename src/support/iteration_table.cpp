// SPDX-License-Identifier: MIT
#include "src/support/iteration_table.hpp"
#include <format>
#include <utility>

namespace rootfind {

namespace {

/// Digits used for the root in the closing summary
int summary_precision(TableLayout layout) {
    switch (layout) {
        case TableLayout::Bracket:
        case TableLayout::PointPair:
            return 7;
        case TableLayout::FixedPoint:
        case TableLayout::Steffensen:
            return 12;
    }
    return 7;
}

std::string_view stop_message(StopReason reason) {
    switch (reason) {
        case StopReason::Converged:
        case StopReason::ExactRoot:
            return "Convergence reached.";
        case StopReason::IterationLimitExceeded:
            return "Maximum number of iterations reached without meeting the tolerance.";
        case StopReason::StabilityGuardTriggered:
            return "Denominator ~ 0: acceleration not applicable, returning the last stable estimate.";
        case StopReason::ResolutionLimit:
            return "Bracket reached floating-point resolution before the tolerance.";
    }
    return "";
}

}  // namespace

std::string_view table_header(TableLayout layout) noexcept {
    switch (layout) {
        case TableLayout::Bracket:
            return "Iteration | Lower bound | Upper bound | Approx root | error";
        case TableLayout::PointPair:
            return "Iteration |     x0      |     x1      | Approx root | error";
        case TableLayout::FixedPoint:
            return "Iteration |      x_k       |   x_{k+1}=g(x_k)   |    error";
        case TableLayout::Steffensen:
            return "Iteration|           x_k            |         x_{k+1}          |    error";
    }
    return "";
}

std::string format_row(TableLayout layout, const IterationRecord& record) {
    switch (layout) {
        case TableLayout::Bracket:
        case TableLayout::PointPair:
            return std::format("{:9d} | {:11.7f} | {:11.7f} | {:11.7f} | {:.4e}",
                               record.index, record.first, record.second,
                               record.approximation, record.error);
        case TableLayout::FixedPoint:
            return std::format("{:9d} | {:14.7f} | {:18.7f} | {:12.4e}",
                               record.index, record.first, record.approximation,
                               record.error);
        case TableLayout::Steffensen:
            return std::format("{:8d} | {:24.12f} | {:24.12f} | {:13.6e}",
                               record.index, record.first, record.approximation,
                               record.error);
    }
    return {};
}

IterationTable::IterationTable(std::ostream& os, TableLayout layout, std::string title)
    : os_(&os)
    , layout_(layout)
    , title_(std::move(title))
{}

void IterationTable::operator()(const IterationRecord& record) {
    if (!header_written_) {
        write_header();
    }
    *os_ << format_row(layout_, record) << '\n';
    ++rows_;
}

void IterationTable::write_header() {
    if (!title_.empty()) {
        *os_ << "--- " << title_ << " ---\n";
    }
    *os_ << table_header(layout_) << '\n';
    write_rule();
    header_written_ = true;
}

void IterationTable::write_rule() {
    *os_ << std::string(table_header(layout_).size() + 8, '-') << '\n';
}

void IterationTable::write_summary(const RootFindingResult& result) {
    if (header_written_) {
        write_rule();
    }

    if (!result) {
        const RootFindingError& err = result.error();
        *os_ << std::format("Error ({}): {}.\n", to_string(err.code), describe(err.code));
        return;
    }

    const int precision = summary_precision(layout_);
    *os_ << '\n' << stop_message(result->stop_reason) << '\n';
    *os_ << std::format("Approximate root: {:.{}f}\n", result->root, precision);
    *os_ << std::format("f(root):          {:e}\n", result->residual);
    *os_ << std::format("Iterations:       {}\n", result->iterations);
}

}  // namespace rootfind
