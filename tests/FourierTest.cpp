#include <gtest/gtest.h>
#include <boost/math/constants/constants.hpp>
#include "expression/ExpressionErrors.hpp"
#include "series/Fourier.hpp"
#include "utils/ParameterValidator.hpp"
#include "utils/Utils.hpp"

class FourierTest : public ::testing::Test {
protected:
    const double pi = boost::math::constants::pi<double>();
    const double two_pi = boost::math::constants::two_pi<double>();
};

TEST_F(FourierTest, ComputeAllFromText) {
    const auto cs = series::compute_all("x**2", two_pi, 10);
    EXPECT_EQ(cs.size(), 10);
    EXPECT_EQ(cs.method, traits::ComputationMethod::KnownSeries);
    EXPECT_DOUBLE_EQ(cs.half_period(), pi);
    EXPECT_NEAR(cs.an(0), -4.0, 1e-12);
}

TEST_F(FourierTest, ComputeAllWithConfig) {
    series::CoefficientEngine::Config config;
    config.use_known_series = false;
    const auto cs = series::compute_all("x**2", two_pi, 10, config);
    EXPECT_EQ(cs.method, traits::ComputationMethod::Integrated);
    EXPECT_NEAR(cs.an(0), -4.0, 1e-9);
}

TEST_F(FourierTest, EvaluateAndCompareWithTheFunction) {
    const auto cs = series::compute_all("sin(x) + 0.5*sin(3*x)", two_pi, 5);
    const series::Array xs = Utils::linspace<double>(-pi, pi, 64);
    const series::Array values = series::evaluate_series(cs, xs, 5);
    const series::Array expected = xs.sin() + 0.5 * (3.0 * xs).sin();
    EXPECT_TRUE(values.isApprox(expected, 1e-10));

    const auto error = series::compute_error(cs, "sin(x) + 0.5*sin(3*x)", xs);
    EXPECT_LT(error.max_abs, 1e-10);
}

TEST_F(FourierTest, AnalyzeAndRecommend) {
    const auto complexity = series::analyze_complexity("sign(x)", two_pi);
    EXPECT_EQ(complexity.level, traits::ComplexityLevel::High);
    EXPECT_EQ(complexity.discontinuity_count(), 1);
    EXPECT_EQ(series::recommend(complexity).term_count, 115);

    const auto degenerate = series::analyze_complexity("log(x - 10)", two_pi);
    EXPECT_TRUE(degenerate.is_degenerate());
    EXPECT_EQ(series::recommend(degenerate).term_count, 215);
}

TEST_F(FourierTest, InvalidInput) {
    EXPECT_THROW(series::compute_all("x +", two_pi, 10), expression::ParseError);
    EXPECT_THROW(series::compute_all("import os", two_pi, 10), expression::ParseError);
    EXPECT_THROW(series::compute_all("x", 0.0, 10), Utils::ParameterDomainError);
    EXPECT_THROW(series::compute_all("x", -two_pi, 10), Utils::ParameterDomainError);
    EXPECT_THROW(series::compute_all("x", two_pi, 0), Utils::ParameterDomainError);
    EXPECT_THROW(series::analyze_complexity("x", 0.0), Utils::ParameterDomainError);
    EXPECT_THROW(series::analyze_complexity("y", two_pi), expression::ParseError);
}
