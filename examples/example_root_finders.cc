// SPDX-License-Identifier: MIT
#include "src/math/root_finders.hpp"
#include "src/support/iteration_table.hpp"
#include <cmath>
#include <iostream>

int main() {
    // Bisection: e^{-x} - x = 0 on [0, 1], root ≈ 0.5671433
    {
        auto f = [](double x) { return std::exp(-x) - x; };
        rootfind::RootFindingConfig config{.tolerance = 1e-6};

        rootfind::IterationTable table(std::cout, rootfind::TableLayout::Bracket, "Bisection");
        auto result = rootfind::bisection_find_root(f, 0.0, 1.0, config, table);
        table.write_summary(result);
        std::cout << "\n";
    }

    // x^3 - x - 1 = 0, root ≈ 1.3247180
    auto cubic = [](double x) { return x * x * x - x - 1.0; };
    rootfind::RootFindingConfig cubic_config{.max_iter = 100, .tolerance = 1e-6};

    {
        rootfind::IterationTable table(std::cout, rootfind::TableLayout::Bracket, "Regula falsi");
        auto result = rootfind::regula_falsi_find_root(cubic, 1.0, 2.0, cubic_config, table);
        table.write_summary(result);
        std::cout << "\n";
    }

    {
        rootfind::IterationTable table(std::cout, rootfind::TableLayout::PointPair, "Secant");
        auto result = rootfind::secant_find_root(cubic, 1.0, 2.0, cubic_config, table);
        table.write_summary(result);
        std::cout << "\n";
    }

    {
        rootfind::IterationTable table(std::cout, rootfind::TableLayout::Bracket, "Illinois");
        auto result = rootfind::illinois_find_root(cubic, 1.0, 2.0, cubic_config, table);
        table.write_summary(result);
        std::cout << "\n";
    }

    // Fixed point of g(x) = cos(x), i.e. the root of f(x) = cos(x) - x
    auto g = [](double x) { return std::cos(x); };
    auto f = [](double x) { return std::cos(x) - x; };

    {
        rootfind::RootFindingConfig config{.max_iter = 100, .tolerance = 1e-8};
        rootfind::IterationTable table(std::cout, rootfind::TableLayout::FixedPoint, "Fixed-point iteration");
        auto result = rootfind::fixed_point_solve(g, f, 0.5, config, table);
        table.write_summary(result);
        std::cout << "\n";
    }

    {
        rootfind::RootFindingConfig config{.max_iter = 100, .tolerance = 1e-6};
        rootfind::IterationTable table(std::cout, rootfind::TableLayout::Steffensen, "Steffensen");
        auto result = rootfind::steffensen_solve(g, f, 0.5, config, table);
        table.write_summary(result);
    }

    return 0;
}
