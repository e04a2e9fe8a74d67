// SPDX-License-Identifier: MIT
#include "src/math/root_finding.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

}  // namespace

TEST(RootFindingConfigTest, Defaults) {
    rootfind::RootFindingConfig config;

    EXPECT_EQ(config.max_iter, 100u);
    EXPECT_DOUBLE_EQ(config.tolerance, 1e-6);
    EXPECT_DOUBLE_EQ(config.stability_guard_ulps, 10.0);
    EXPECT_FALSE(rootfind::validate_config(config).has_value());
}

TEST(RootFindingConfigTest, ZeroIterationBudgetIsValid) {
    rootfind::RootFindingConfig config{.max_iter = 0};

    EXPECT_FALSE(rootfind::validate_config(config).has_value());
}

TEST(RootFindingConfigTest, RejectsBadTolerance) {
    for (double tol : {0.0, -1e-6, kInf, -kInf, kNaN}) {
        rootfind::RootFindingConfig config{.tolerance = tol};

        auto err = rootfind::validate_config(config);

        ASSERT_TRUE(err.has_value()) << "tolerance " << tol;
        EXPECT_EQ(err->code, rootfind::RootFindingErrorCode::InvalidTolerance);
        EXPECT_EQ(err->iterations, 0u);
        EXPECT_FALSE(err->last_value.has_value());
    }
}

TEST(RootFindingConfigTest, RejectsBadStabilityGuard) {
    for (double ulps : {-1.0, kInf, kNaN}) {
        rootfind::RootFindingConfig config{.stability_guard_ulps = ulps};

        auto err = rootfind::validate_config(config);

        ASSERT_TRUE(err.has_value()) << "stability_guard_ulps " << ulps;
        EXPECT_EQ(err->code, rootfind::RootFindingErrorCode::InvalidTolerance);
    }
}

TEST(RootFindingConfigTest, ZeroStabilityGuardIsValid) {
    rootfind::RootFindingConfig config{.stability_guard_ulps = 0.0};

    EXPECT_FALSE(rootfind::validate_config(config).has_value());
}

TEST(RootFindingConfigTest, UlpMatchesMachineEpsilonAtOne) {
    EXPECT_EQ(rootfind::ulp(1.0), std::numeric_limits<double>::epsilon());
    EXPECT_EQ(rootfind::ulp(-1.0), std::numeric_limits<double>::epsilon());
    EXPECT_EQ(rootfind::ulp(2.0), 2.0 * std::numeric_limits<double>::epsilon());
    EXPECT_EQ(rootfind::ulp(0.0), std::numeric_limits<double>::denorm_min());
}

// ============================================================================
// Bracket helpers
// ============================================================================

TEST(BracketHelpersTest, OppositeSigns) {
    EXPECT_TRUE(rootfind::detail::opposite_signs(-1.0, 1.0));
    EXPECT_TRUE(rootfind::detail::opposite_signs(2.0, -3.0));
    EXPECT_FALSE(rootfind::detail::opposite_signs(1.0, 1.0));
    EXPECT_FALSE(rootfind::detail::opposite_signs(0.0, 1.0));
    EXPECT_FALSE(rootfind::detail::opposite_signs(-1.0, 0.0));
}

TEST(BracketHelpersTest, OppositeSignsSurvivesUnderflow) {
    // The product of these underflows to -0.0
    EXPECT_TRUE(rootfind::detail::opposite_signs(1e-200, -1e-200));
}

TEST(BracketHelpersTest, CheckBracketAcceptsSignChange) {
    EXPECT_FALSE(rootfind::detail::check_bracket(-1.0, 5.0).has_value());
}

TEST(BracketHelpersTest, CheckBracketRejectsSameSign) {
    auto err = rootfind::detail::check_bracket(2.0, 0.5);

    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, rootfind::RootFindingErrorCode::InvalidBracket);
    EXPECT_DOUBLE_EQ(err->final_error, 0.5);
}

TEST(BracketHelpersTest, CheckBracketRejectsZeroEndpoint) {
    auto err = rootfind::detail::check_bracket(0.0, 1.0);

    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, rootfind::RootFindingErrorCode::InvalidBracket);
}

TEST(BracketHelpersTest, CheckBracketReportsNaN) {
    auto err = rootfind::detail::check_bracket(kNaN, 1.0);

    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, rootfind::RootFindingErrorCode::NumericalInstability);
}

TEST(BracketHelpersTest, SignTestRunsBeforeFinitenessTest) {
    auto same_sign = rootfind::detail::check_bracket(kInf, 1.0);
    auto straddling = rootfind::detail::check_bracket(-kInf, 1.0);

    ASSERT_TRUE(same_sign.has_value());
    EXPECT_EQ(same_sign->code, rootfind::RootFindingErrorCode::InvalidBracket);
    ASSERT_TRUE(straddling.has_value());
    EXPECT_EQ(straddling->code, rootfind::RootFindingErrorCode::NumericalInstability);
}
