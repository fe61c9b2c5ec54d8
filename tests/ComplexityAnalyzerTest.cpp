#include <gtest/gtest.h>
#include <cmath>
#include <boost/math/constants/constants.hpp>
#include "analysis/ComplexityAnalyzer.hpp"
#include "expression/FunctionExpression.hpp"
#include "utils/ParameterValidator.hpp"
#include "utils/Utils.hpp"

using analysis::ComplexityAnalyzer;
using expression::FunctionExpression;
using traits::ComplexityLevel;

class ComplexityAnalyzerTest : public ::testing::Test {
protected:
    const double pi = boost::math::constants::pi<double>();
    ComplexityAnalyzer<double> analyzer;
};

// ============================================================================
// Whole-function analysis
// ============================================================================

TEST_F(ComplexityAnalyzerTest, SignHasOneJumpAtTheOrigin) {
    const auto result = analyzer.analyze(FunctionExpression("sign(x)"), pi);
    ASSERT_FALSE(result.is_degenerate());
    ASSERT_EQ(result.discontinuity_count(), 1);
    EXPECT_NEAR(result.discontinuity_positions->front(), 0.0, 0.01);
    EXPECT_LT(result.high_frequency_ratio, 0.1);
    EXPECT_GT(result.smoothness, 0.8);
    EXPECT_EQ(result.level, ComplexityLevel::High);
}

TEST_F(ComplexityAnalyzerTest, SquareWaveHasTwoJumps) {
    const auto result = analyzer.analyze(FunctionExpression("1 if x % (2*pi) < pi else -1"), pi);
    EXPECT_EQ(result.discontinuity_count(), 2);
    EXPECT_EQ(result.level, ComplexityLevel::High);
}

TEST_F(ComplexityAnalyzerTest, SmoothFunctionIsSimple) {
    const auto result = analyzer.analyze(FunctionExpression("exp(-x**2)"), pi);
    EXPECT_EQ(result.discontinuity_count(), 0);
    EXPECT_GT(result.smoothness, 0.5);
    EXPECT_LT(result.high_frequency_ratio, 0.1);
    EXPECT_EQ(result.level, ComplexityLevel::Simple);
}

TEST_F(ComplexityAnalyzerTest, FunctionFailingEverywhereIsDegenerate) {
    const auto result = analyzer.analyze(FunctionExpression("log(x - 10)"), pi);
    EXPECT_TRUE(result.is_degenerate());
    EXPECT_EQ(result.discontinuity_count(), -1);
    EXPECT_DOUBLE_EQ(result.high_frequency_ratio, 1.0);
    EXPECT_DOUBLE_EQ(result.smoothness, 0.0);
    EXPECT_EQ(result.level, ComplexityLevel::Extreme);
}

TEST_F(ComplexityAnalyzerTest, PartialFailuresAreZeroFilled) {
    const auto result = analyzer.analyze(FunctionExpression("log(x)"), pi);
    EXPECT_FALSE(result.is_degenerate());
    EXPECT_GE(result.discontinuity_count(), 0);
}

TEST_F(ComplexityAnalyzerTest, RejectsTooFewSamples) {
    ComplexityAnalyzer<double>::Config config;
    config.samples = 1;
    EXPECT_THROW(ComplexityAnalyzer<double>(config).analyze(FunctionExpression("x"), pi),
                 Utils::ParameterDomainError);
}

// ============================================================================
// Individual measures
// ============================================================================

TEST_F(ComplexityAnalyzerTest, HighFrequencyRatio) {
    const auto x = Utils::linspace<double>(-pi, pi, 2000);
    EXPECT_GT(analyzer.high_frequency_ratio((600.0 * x).sin()), 0.9);
    EXPECT_LT(analyzer.high_frequency_ratio((40.0 * x).sin()), 0.01);
    EXPECT_DOUBLE_EQ(analyzer.high_frequency_ratio(Utils::Array<double>::Zero(2000)), 0.0);
}

TEST_F(ComplexityAnalyzerTest, Smoothness) {
    EXPECT_NEAR(analyzer.smoothness(Utils::linspace<double>(0.0, 5.0, 100)), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(analyzer.smoothness(Utils::Array<double>::Zero(2)), 1.0);

    Utils::Array<double> alternating(100);
    for (Eigen::Index i = 0; i < alternating.size(); ++i) {
        alternating(i) = i % 2 == 0 ? 10.0 : -10.0;
    }
    EXPECT_LT(analyzer.smoothness(alternating), 0.3);
}

TEST_F(ComplexityAnalyzerTest, DetectsAndMergesJumps) {
    const auto x = Utils::linspace<double>(0.0, 1.0, 101);
    Utils::Array<double> step(101);
    for (Eigen::Index i = 0; i < step.size(); ++i) {
        step(i) = i < 50 ? 0.0 : 1.0;
    }
    const auto positions = analyzer.detect_discontinuities(x, step, 1.0);
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_NEAR(positions.front(), x(49), 1e-15);

    // A second jump one sample later lies within the merge distance.
    Utils::Array<double> double_step = step;
    for (Eigen::Index i = 51; i < double_step.size(); ++i) {
        double_step(i) = 2.0;
    }
    EXPECT_EQ(analyzer.detect_discontinuities(x, double_step, 100.0).size(), 1u);
    EXPECT_EQ(analyzer.detect_discontinuities(x, double_step, 0.5).size(), 2u);
}

TEST_F(ComplexityAnalyzerTest, ClassificationBuckets) {
    EXPECT_EQ(analyzer.classify(0, 0.0, 1.0), ComplexityLevel::Simple);
    EXPECT_EQ(analyzer.classify(0, 0.35, 0.6), ComplexityLevel::Medium);
    EXPECT_EQ(analyzer.classify(1, 0.0, 0.99), ComplexityLevel::High);
    EXPECT_EQ(analyzer.classify(3, 0.0, 0.99), ComplexityLevel::High);
    EXPECT_EQ(analyzer.classify(3, 0.15, 0.99), ComplexityLevel::Extreme);
    EXPECT_EQ(analyzer.classify(6, 0.6, 0.1), ComplexityLevel::Extreme);
}
