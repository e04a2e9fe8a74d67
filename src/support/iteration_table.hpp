// SPDX-License-Identifier: MIT
#pragma once

#include "src/math/iteration_record.hpp"
#include "src/math/root_finding.hpp"
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace rootfind {

/// Column layout of an iteration table
enum class TableLayout {
    Bracket,     ///< k | lower bound | upper bound | approx root | f(c)
    PointPair,   ///< k | x0 | x1 | approx root | f(c)
    FixedPoint,  ///< k | x_k | x_{k+1} | |f(x_{k+1})|
    Steffensen   ///< k | x_k | x_{k+1} | f(x_{k+1})
};

/// Column titles for a layout (no trailing newline)
std::string_view table_header(TableLayout layout) noexcept;

/// Format one record as a fixed-width table row (no trailing newline)
std::string format_row(TableLayout layout, const IterationRecord& record);

/// Iteration sink rendering records as a console table
///
/// The title, column header and rule are written before the first row, so
/// a call that fails before iterating prints nothing. Use as an lvalue sink:
///
/// ```cpp
/// rootfind::IterationTable table(std::cout, rootfind::TableLayout::Bracket, "Bisection");
/// auto result = rootfind::bisection_find_root(f, 0.0, 1.0, config, table);
/// table.write_summary(result);
/// ```
class IterationTable {
public:
    IterationTable(std::ostream& os, TableLayout layout, std::string title = {});

    void operator()(const IterationRecord& record);

    /// Close the table and print the outcome of the call
    ///
    /// Converged and soft-stopped estimates print the root, residual and
    /// iteration count; hard failures print the error and its description.
    void write_summary(const RootFindingResult& result);

    size_t rows() const { return rows_; }
    TableLayout layout() const { return layout_; }

private:
    void write_header();
    void write_rule();

    std::ostream* os_;
    TableLayout layout_;
    std::string title_;
    bool header_written_ = false;
    size_t rows_ = 0;
};

}  // namespace rootfind
