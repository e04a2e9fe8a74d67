// SPDX-License-Identifier: MIT
#include "src/math/illinois.hpp"
#include "src/math/regula_falsi.hpp"
#include <gtest/gtest.h>
#include <cmath>

namespace {

constexpr double kCubicRoot = 1.3247179572447460;

double cubic(double x) { return x * x * x - x - 1.0; }

}  // namespace

class IllinoisTest : public ::testing::Test {
protected:
    rootfind::RootFindingConfig config{.max_iter = 100, .tolerance = 1e-6};
};

TEST_F(IllinoisTest, CubicOnUnitBracket) {
    auto result = rootfind::illinois_find_root(cubic, 1.0, 2.0, config);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->converged);
    EXPECT_NEAR(result->root, kCubicRoot, 1e-6);
    EXPECT_LT(std::abs(result->residual), config.tolerance);
    EXPECT_EQ(result->iterations, 7u);
}

TEST_F(IllinoisTest, NeverSlowerThanRegulaFalsi) {
    auto illinois = rootfind::illinois_find_root(cubic, 1.0, 2.0, config);
    auto falsi = rootfind::regula_falsi_find_root(cubic, 1.0, 2.0, config);

    ASSERT_TRUE(illinois.has_value());
    ASSERT_TRUE(falsi.has_value());
    EXPECT_LE(illinois->iterations, falsi->iterations);
}

TEST_F(IllinoisTest, RescuesStagnatingRegulaFalsi) {
    // x^10 - 1 on [0, 1.3]: plain regula falsi crawls in from the left
    auto f = [](double x) { return std::pow(x, 10) - 1.0; };
    rootfind::RootFindingConfig wide{.max_iter = 1000, .tolerance = 1e-6};

    auto illinois = rootfind::illinois_find_root(f, 0.0, 1.3, wide);
    auto falsi = rootfind::regula_falsi_find_root(f, 0.0, 1.3, wide);

    ASSERT_TRUE(illinois.has_value());
    ASSERT_TRUE(falsi.has_value());
    EXPECT_TRUE(illinois->converged);
    EXPECT_TRUE(falsi->converged);
    EXPECT_NEAR(illinois->root, 1.0, 1e-6);
    EXPECT_LT(illinois->iterations, 20u);
    EXPECT_GT(falsi->iterations, 3 * illinois->iterations);
}

TEST_F(IllinoisTest, MatchesRegulaFalsiUntilSecondStagnation) {
    // The penalty only applies once the same endpoint is retained twice,
    // so the first two steps coincide with plain regula falsi
    rootfind::IterationLog illinois_log;
    rootfind::IterationLog falsi_log;

    auto illinois = rootfind::illinois_find_root(cubic, 1.0, 2.0, config, illinois_log);
    auto falsi = rootfind::regula_falsi_find_root(cubic, 1.0, 2.0, config, falsi_log);

    ASSERT_TRUE(illinois.has_value());
    ASSERT_TRUE(falsi.has_value());
    ASSERT_GE(illinois_log.size(), 3u);
    EXPECT_EQ(illinois_log[0], falsi_log[0]);
    EXPECT_EQ(illinois_log[1], falsi_log[1]);

    // Third chord uses f(b)/2 and jumps past the root
    EXPECT_NE(illinois_log[2].approximation, falsi_log[2].approximation);
    EXPECT_GT(illinois_log[2].approximation, kCubicRoot);
}

TEST_F(IllinoisTest, BracketKeepsSignChange) {
    rootfind::IterationLog log;
    auto result = rootfind::illinois_find_root(cubic, 1.0, 2.0, config, log);

    ASSERT_TRUE(result.has_value());
    for (const auto& rec : log.records()) {
        EXPECT_LT(cubic(rec.first) * cubic(rec.second), 0.0);
        EXPECT_GT(rec.approximation, rec.first);
        EXPECT_LT(rec.approximation, rec.second);
    }
}

TEST_F(IllinoisTest, OneEvaluationPerIteration) {
    int calls = 0;
    auto f = [&calls](double x) { ++calls; return cubic(x); };

    auto result = rootfind::illinois_find_root(f, 1.0, 2.0, config);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(calls, 2 + static_cast<int>(result->iterations));
}

TEST_F(IllinoisTest, ExhaustionReturnsLastEstimate) {
    rootfind::RootFindingConfig short_config{.max_iter = 3, .tolerance = 1e-12};

    auto result = rootfind::illinois_find_root(cubic, 1.0, 2.0, short_config);

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->converged);
    EXPECT_EQ(result->stop_reason, rootfind::StopReason::IterationLimitExceeded);
    EXPECT_EQ(result->iterations, 3u);
    EXPECT_NEAR(result->root, 1.329631399159399, 1e-12);
}

TEST_F(IllinoisTest, InvalidBracketPerformsNoIteration) {
    int calls = 0;
    auto f = [&calls](double x) { ++calls; return cubic(x); };

    auto result = rootfind::illinois_find_root(f, -1.0, 1.0, config);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, rootfind::RootFindingErrorCode::InvalidBracket);
    EXPECT_EQ(calls, 2);
}
