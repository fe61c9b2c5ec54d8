#include <gtest/gtest.h>
#include <cmath>
#include <boost/math/constants/constants.hpp>
#include "expression/FunctionExpression.hpp"
#include "series/CoefficientEngine.hpp"
#include "series/SeriesEvaluator.hpp"
#include "utils/Utils.hpp"

using series::CoefficientSet;
using series::PeriodSpec;
using Evaluator = series::SeriesEvaluator<double>;
using Array = Evaluator::Array;

class SeriesEvaluatorTest : public ::testing::Test {
protected:
    const double pi = boost::math::constants::pi<double>();
    CoefficientSet<double> cs{PeriodSpec<double>(boost::math::constants::two_pi<double>()), 2};

    // 1 + cos(x) + sin(2x)
    void SetUp() override {
        cs.a0 = 2.0;
        cs.an(0) = 1.0;
        cs.bn(1) = 1.0;
    }
};

TEST_F(SeriesEvaluatorTest, PartialSums) {
    Array xs(3);
    xs << 0.0, pi / 4.0, pi;
    const Array full = Evaluator::evaluate(cs, xs);
    EXPECT_NEAR(full(0), 2.0, 1e-12);
    EXPECT_NEAR(full(1), 1.0 + std::cos(pi / 4.0) + 1.0, 1e-12);
    EXPECT_NEAR(full(2), 0.0, 1e-12);

    const Array first = Evaluator::evaluate(cs, xs, 1);
    EXPECT_NEAR(first(1), 1.0 + std::cos(pi / 4.0), 1e-12);
}

TEST_F(SeriesEvaluatorTest, TermCountIsClamped) {
    const Array xs = Utils::linspace<double>(-pi, pi, 17);
    EXPECT_TRUE(Evaluator::evaluate(cs, xs, 0).isApprox(Array::Constant(17, 1.0)));
    EXPECT_TRUE(Evaluator::evaluate(cs, xs, -5).isApprox(Array::Constant(17, 1.0)));
    EXPECT_TRUE(Evaluator::evaluate(cs, xs, 100).isApprox(Evaluator::evaluate(cs, xs)));
}

TEST_F(SeriesEvaluatorTest, EmptyInput) {
    EXPECT_EQ(Evaluator::evaluate(cs, Array()).size(), 0);
}

TEST_F(SeriesEvaluatorTest, ExactSeriesHasNoError) {
    const expression::FunctionExpression f("1 + cos(x) + sin(2*x)");
    const auto report = Evaluator::compute_error(cs, f, Utils::linspace<double>(-pi, pi, 101));
    EXPECT_EQ(report.pointwise.size(), 101);
    EXPECT_LT(report.max_abs, 1e-12);
    EXPECT_LT(report.mse, 1e-24);
    EXPECT_LT(report.mae, 1e-12);
}

TEST_F(SeriesEvaluatorTest, ErrorSignIsExactMinusSeries) {
    const expression::FunctionExpression f("2 + cos(x) + sin(2*x)");
    const auto report = Evaluator::compute_error(cs, f, Utils::linspace<double>(-1.0, 1.0, 5));
    EXPECT_NEAR(report.pointwise.minCoeff(), 1.0, 1e-12);
    EXPECT_NEAR(report.mse, 1.0, 1e-12);
    EXPECT_NEAR(report.mae, 1.0, 1e-12);
    EXPECT_NEAR(report.max_abs, 1.0, 1e-12);
}

TEST_F(SeriesEvaluatorTest, ParabolaConvergence) {
    const PeriodSpec<double> period(2.0 * pi);
    const expression::FunctionExpression f("x**2");
    const auto coefficients = series::CoefficientEngine().compute_all(f, period, 50);
    const Array xs = Utils::linspace<double>(-pi, pi, 1001);

    const auto report = Evaluator::compute_error(coefficients, f, xs);
    EXPECT_LT(report.mse, 1e-4);
    EXPECT_LT(report.max_abs, 0.1);

    const auto coarse = Evaluator::compute_error(series::CoefficientEngine().compute_all(f, period, 5), f, xs);
    EXPECT_GT(coarse.mse, report.mse);
}
