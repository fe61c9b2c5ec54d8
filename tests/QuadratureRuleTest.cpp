#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <boost/math/constants/constants.hpp>
#include "quadrature/HarmonicProjector.hpp"
#include "quadrature/QuadratureRule.hpp"
#include "quadrature/QuadratureRuleHolder.hpp"
#include "quadrature/QuadratureWrappers.hpp"
#include "utils/Utils.hpp"

using namespace quadrature;
using traits::CoefficientKind;
using traits::QuadratureMethod;

class QuadratureRuleTest : public ::testing::Test {
protected:
    const double pi = boost::math::constants::pi<double>();
};

// ============================================================================
// Rules
// ============================================================================

TEST_F(QuadratureRuleTest, TrapezoidalRule) {
    const TrapezoidalQuadrature<double> rule;
    EXPECT_EQ(rule.samples(), 2000);
    EXPECT_NEAR(rule.integrate([](double x) { return x * x; }, -1.0, 1.0), 2.0 / 3.0, 1e-5);
    EXPECT_NEAR(rule.integrate([](double x) { return std::sin(x); }, 0.0, pi), 2.0, 1e-5);
    EXPECT_THROW(TrapezoidalQuadrature<double>(1), std::invalid_argument);
}

TEST_F(QuadratureRuleTest, TrapezoidalSamplesAreExactForLinearData) {
    TrapezoidalQuadrature<double>::Array values(3);
    values << 0.0, 1.0, 2.0;
    EXPECT_DOUBLE_EQ(TrapezoidalQuadrature<double>::integrate_samples(values, 0.0, 2.0), 2.0);
}

TEST_F(QuadratureRuleTest, TanhSinhRule) {
    const BoostTanhSinhQuadrature<double> rule;
    EXPECT_NEAR(rule.integrate([](double x) { return std::exp(x); }, 0.0, 1.0), std::exp(1.0) - 1.0, 1e-10);
    EXPECT_DOUBLE_EQ(rule.integrate([](double x) { return x; }, 1.0, 1.0), 0.0);
}

TEST_F(QuadratureRuleTest, GslAdaptiveRule) {
    const GSLQuadrature<double> rule;
    EXPECT_NEAR(rule.integrate([](double x) { return std::cos(x); }, 0.0, pi / 2.0), 1.0, 1e-9);
}

// ============================================================================
// Holder
// ============================================================================

TEST_F(QuadratureRuleTest, HolderSelectsBackendByMethod) {
    EXPECT_EQ(QuadratureRuleHolder<double>(QuadratureMethod::Trapezoidal).name(), "trapezoidal");
    EXPECT_EQ(QuadratureRuleHolder<double>(QuadratureMethod::TanhSinh).name(), "tanh_sinh");
    EXPECT_EQ(QuadratureRuleHolder<double>(QuadratureMethod::QAG).name(), "gsl_qag");
}

TEST_F(QuadratureRuleTest, HolderCopiesAreIndependent) {
    const auto original = QuadratureRuleHolder<double>::make(QuadratureMethod::Trapezoidal, 500);
    const QuadratureRuleHolder<double> copy(original);
    EXPECT_TRUE(copy.is_initialized());
    EXPECT_NEAR(copy.integrate([](double x) { return 3.0 * x * x; }, 0.0, 1.0), 1.0, 1e-5);
}

TEST_F(QuadratureRuleTest, EmptyHolderRefusesToIntegrate) {
    const QuadratureRuleHolder<double> empty;
    EXPECT_FALSE(empty.is_initialized());
    EXPECT_EQ(empty.name(), "uninitialized");
    EXPECT_THROW(empty.integrate([](double x) { return x; }, 0.0, 1.0), std::runtime_error);
    EXPECT_THROW(QuadratureRuleHolder<double>(std::unique_ptr<IQuadratureRule<double>>()), std::invalid_argument);
}

// ============================================================================
// Harmonic projection
// ============================================================================

TEST_F(QuadratureRuleTest, HarmonicFrequencyAndWeights) {
    EXPECT_DOUBLE_EQ(harmonic_frequency(3u, pi), 3.0);
    EXPECT_DOUBLE_EQ(harmonic_frequency(1u, 2.0), pi / 2.0);
    EXPECT_DOUBLE_EQ(harmonic_weight<double>(CoefficientKind::Constant, 4u, pi)(1.3), 1.0);
    EXPECT_NEAR(harmonic_weight<double>(CoefficientKind::Cosine, 2u, pi)(pi / 2.0), -1.0, 1e-15);
    EXPECT_NEAR(harmonic_weight<double>(CoefficientKind::Sine, 1u, pi)(pi / 2.0), 1.0, 1e-15);
}

TEST_F(QuadratureRuleTest, ProjectorRecoversSineCoefficients) {
    const QuadratureRuleHolder<double> holder(QuadratureMethod::TanhSinh);
    const HarmonicProjector<double> projector(holder, [](double x) { return 2.0 * std::sin(3.0 * x); }, pi);
    EXPECT_NEAR(projector.project(CoefficientKind::Sine, 3), 2.0, 1e-8);
    EXPECT_NEAR(projector.project(CoefficientKind::Sine, 2), 0.0, 1e-8);
    EXPECT_NEAR(projector.project(CoefficientKind::Cosine, 3), 0.0, 1e-8);
    EXPECT_EQ(projector.get_integrator().name(), "tanh_sinh");
}

TEST_F(QuadratureRuleTest, ProjectorRequiresInitializedHolder) {
    EXPECT_THROW(HarmonicProjector<double>(QuadratureRuleHolder<double>(), [](double x) { return x; }, pi),
                 std::invalid_argument);
}

TEST_F(QuadratureRuleTest, SampledProjectorMatchesParabolaCoefficients) {
    const auto grid = Utils::linspace<double>(-pi, pi, 4001);
    const SampledHarmonicProjector<double> projector(grid, grid * grid, pi);
    EXPECT_NEAR(projector.project(CoefficientKind::Constant, 0), 2.0 * pi * pi / 3.0, 1e-4);
    EXPECT_NEAR(projector.project(CoefficientKind::Cosine, 1), -4.0, 1e-4);
    EXPECT_NEAR(projector.project(CoefficientKind::Cosine, 2), 1.0, 1e-4);
    EXPECT_NEAR(projector.project(CoefficientKind::Sine, 1), 0.0, 1e-10);
}

TEST_F(QuadratureRuleTest, SampledProjectorRejectsMismatchedGrids) {
    using Array = SampledHarmonicProjector<double>::Array;
    EXPECT_THROW(SampledHarmonicProjector<double>(Array::Zero(4), Array::Zero(5), pi), std::invalid_argument);
    EXPECT_THROW(SampledHarmonicProjector<double>(Array::Zero(1), Array::Zero(1), pi), std::invalid_argument);
}
