#include <gtest/gtest.h>
#include <boost/math/constants/constants.hpp>
#include "expression/FunctionExpression.hpp"
#include "series/PeriodSpec.hpp"
#include "series/SymmetryDetector.hpp"
#include "utils/ParameterValidator.hpp"

using expression::FunctionExpression;
using traits::SymmetryClass;

class SymmetryDetectorTest : public ::testing::Test {
protected:
    const double pi = boost::math::constants::pi<double>();
    series::SymmetryDetector<double> detector;

    SymmetryClass classify(const std::string& text, double half_period) const {
        return detector.classify(FunctionExpression(text), half_period);
    }
};

TEST_F(SymmetryDetectorTest, EvenFunctions) {
    EXPECT_EQ(classify("x**2", pi), SymmetryClass::Even);
    EXPECT_EQ(classify("cos(3*x) + abs(x)", pi), SymmetryClass::Even);
    EXPECT_EQ(classify("exp(-x**2)", 2.0), SymmetryClass::Even);
}

TEST_F(SymmetryDetectorTest, OddFunctions) {
    EXPECT_EQ(classify("x", pi), SymmetryClass::Odd);
    EXPECT_EQ(classify("sin(x) + 0.5*sin(3*x)", pi), SymmetryClass::Odd);
    EXPECT_EQ(classify("sign(x)", pi), SymmetryClass::Odd);
    EXPECT_EQ(classify("1 if x % (2*pi) < pi else -1", pi), SymmetryClass::Odd);
}

TEST_F(SymmetryDetectorTest, HalfWaveFunction) {
    // Neither even nor odd, but f(x + pi) == -f(x).
    EXPECT_EQ(classify("sin(x) + cos(3*x)", pi), SymmetryClass::HalfWave);
}

TEST_F(SymmetryDetectorTest, NoSymmetry) {
    EXPECT_EQ(classify("exp(x)", pi), SymmetryClass::None);
    EXPECT_EQ(classify("x + 1", pi), SymmetryClass::None);
}

TEST_F(SymmetryDetectorTest, EvaluationFailureMeansNoSymmetry) {
    EXPECT_EQ(classify("log(x)", pi), SymmetryClass::None);
}

TEST_F(SymmetryDetectorTest, SmallPeriodsAreSampledInsideTheInterval) {
    EXPECT_EQ(classify("x**2", 0.01), SymmetryClass::Even);
    EXPECT_EQ(classify("x**3", 0.01), SymmetryClass::Odd);
}

TEST_F(SymmetryDetectorTest, TolerancesAreConfigurable) {
    series::SymmetryDetector<double>::Config loose;
    loose.rtol = 0.1;
    loose.atol = 0.1;
    const series::SymmetryDetector<double> tolerant(loose);
    EXPECT_EQ(tolerant.config().rtol, 0.1);
    EXPECT_EQ(tolerant.classify(FunctionExpression("x**2 + 0.01*x"), pi), SymmetryClass::Even);
    EXPECT_EQ(detector.classify(FunctionExpression("x**2 + 0.01*x"), pi), SymmetryClass::None);
}

TEST(PeriodSpecTest, HalfPeriodAndFundamentalFrequency) {
    const double pi = boost::math::constants::pi<double>();
    const series::PeriodSpec<double> spec(2.0 * pi);
    EXPECT_DOUBLE_EQ(spec.period(), 2.0 * pi);
    EXPECT_DOUBLE_EQ(spec.half_period(), pi);
    EXPECT_DOUBLE_EQ(spec.fundamental_frequency(), 1.0);
}

TEST(PeriodSpecTest, RejectsNonPositivePeriods) {
    EXPECT_THROW(series::PeriodSpec<double>(0.0), Utils::ParameterDomainError);
    EXPECT_THROW(series::PeriodSpec<double>(-1.0), Utils::ParameterDomainError);
}
