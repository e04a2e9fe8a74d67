// SPDX-License-Identifier: MIT
#include "src/math/root_finders.hpp"
#include <gtest/gtest.h>
#include <bit>
#include <cmath>
#include <cstdint>
#include <functional>
#include <thread>
#include <vector>

namespace {

double cubic(double x) { return x * x * x - x - 1.0; }
double g_cos(double x) { return std::cos(x); }
double f_cos(double x) { return std::cos(x) - x; }

/// Run one method and keep its full trace
using Runner = std::function<rootfind::RootFindingResult(rootfind::IterationLog&)>;

std::vector<Runner> all_methods() {
    const rootfind::RootFindingConfig config{.max_iter = 100, .tolerance = 1e-10};
    return {
        [config](rootfind::IterationLog& log) {
            return rootfind::bisection_find_root(cubic, 1.0, 2.0, config, log);
        },
        [config](rootfind::IterationLog& log) {
            return rootfind::regula_falsi_find_root(cubic, 1.0, 2.0, config, log);
        },
        [config](rootfind::IterationLog& log) {
            return rootfind::secant_find_root(cubic, 1.0, 2.0, config, log);
        },
        [config](rootfind::IterationLog& log) {
            return rootfind::illinois_find_root(cubic, 1.0, 2.0, config, log);
        },
        [config](rootfind::IterationLog& log) {
            return rootfind::fixed_point_solve(g_cos, f_cos, 0.5, config, log);
        },
        [config](rootfind::IterationLog& log) {
            return rootfind::steffensen_solve(g_cos, f_cos, 0.5, config, log);
        },
    };
}

std::vector<uint64_t> trace_bits(const rootfind::RootFindingResult& result,
                                 const rootfind::IterationLog& log) {
    std::vector<uint64_t> bits;
    for (const auto& rec : log.records()) {
        bits.push_back(rec.index);
        bits.push_back(std::bit_cast<uint64_t>(rec.first));
        bits.push_back(std::bit_cast<uint64_t>(rec.second));
        bits.push_back(std::bit_cast<uint64_t>(rec.approximation));
        bits.push_back(std::bit_cast<uint64_t>(rec.error));
    }
    if (result) {
        bits.push_back(std::bit_cast<uint64_t>(result->root));
        bits.push_back(std::bit_cast<uint64_t>(result->residual));
        bits.push_back(result->iterations);
        bits.push_back(static_cast<uint64_t>(result->stop_reason));
    }
    return bits;
}

}  // namespace

TEST(DeterminismTest, RepeatedRunsAreBitIdentical) {
    const auto methods = all_methods();

    for (size_t m = 0; m < methods.size(); ++m) {
        rootfind::IterationLog first_log;
        rootfind::IterationLog second_log;

        auto first = methods[m](first_log);
        auto second = methods[m](second_log);

        ASSERT_TRUE(first.has_value()) << "method " << m;
        ASSERT_TRUE(second.has_value()) << "method " << m;
        EXPECT_FALSE(first_log.empty()) << "method " << m;
        EXPECT_EQ(trace_bits(first, first_log), trace_bits(second, second_log)) << "method " << m;
    }
}

TEST(DeterminismTest, ConcurrentRunsMatchSerialRun) {
    // No shared state between calls: each thread gets its own log
    const auto methods = all_methods();
    constexpr size_t kThreads = 4;

    for (size_t m = 0; m < methods.size(); ++m) {
        rootfind::IterationLog serial_log;
        auto serial = methods[m](serial_log);
        const auto expected = trace_bits(serial, serial_log);

        std::vector<std::vector<uint64_t>> observed(kThreads);
        std::vector<std::thread> threads;
        for (size_t t = 0; t < kThreads; ++t) {
            threads.emplace_back([&methods, &observed, m, t] {
                rootfind::IterationLog log;
                auto result = methods[m](log);
                observed[t] = trace_bits(result, log);
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        for (size_t t = 0; t < kThreads; ++t) {
            EXPECT_EQ(observed[t], expected) << "method " << m << ", thread " << t;
        }
    }
}
