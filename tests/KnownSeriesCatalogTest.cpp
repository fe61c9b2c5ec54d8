#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <boost/math/constants/constants.hpp>
#include "expression/ExpressionErrors.hpp"
#include "expression/ExpressionParser.hpp"
#include "series/KnownSeriesCatalog.hpp"

using series::ClosedFormSeries;
using series::KnownSeriesCatalog;
using traits::SymmetryClass;

class KnownSeriesCatalogTest : public ::testing::Test {
protected:
    const double pi = boost::math::constants::pi<double>();
    KnownSeriesCatalog catalog;
};

TEST_F(KnownSeriesCatalogTest, DefaultKeys) {
    const std::vector<std::string> expected{"abs(x)", "cos(x)", "sign(x)", "sin(x)", "x", "x**2", "x^2"};
    EXPECT_EQ(catalog.keys(), expected);
}

TEST_F(KnownSeriesCatalogTest, RampSeries) {
    const auto entry = catalog.lookup("x", pi);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->symmetry, SymmetryClass::Odd);
    EXPECT_DOUBLE_EQ(entry->a0, 0.0);
    const auto bn = KnownSeriesCatalog::evaluate_formula(entry->bn, 4);
    EXPECT_NEAR(bn(0), 2.0, 1e-12);
    EXPECT_NEAR(bn(1), -1.0, 1e-12);
    EXPECT_NEAR(bn(2), 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(KnownSeriesCatalog::evaluate_formula(entry->an, 4).cwiseAbs().maxCoeff(), 0.0, 1e-15);
}

TEST_F(KnownSeriesCatalogTest, AbsoluteValueSeries) {
    const auto entry = catalog.lookup("abs(x)", pi);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->symmetry, SymmetryClass::Even);
    EXPECT_DOUBLE_EQ(entry->a0, pi);
    const auto an = KnownSeriesCatalog::evaluate_formula(entry->an, 3);
    EXPECT_NEAR(an(0), -4.0 / pi, 1e-12);
    EXPECT_NEAR(an(1), 0.0, 1e-15);
    EXPECT_NEAR(an(2), -4.0 / (9.0 * pi), 1e-12);
}

TEST_F(KnownSeriesCatalogTest, ParabolaSeriesScalesWithPeriod) {
    const double L = 2.0;
    for (const char* key : {"x**2", "x^2"}) {
        const auto entry = catalog.lookup(key, L);
        ASSERT_TRUE(entry.has_value()) << key;
        EXPECT_NEAR(entry->a0, 2.0 * L * L / 3.0, 1e-12);
        const auto an = KnownSeriesCatalog::evaluate_formula(entry->an, 2);
        EXPECT_NEAR(an(0), -4.0 * L * L / (pi * pi), 1e-12);
        EXPECT_NEAR(an(1), 4.0 * L * L / (4.0 * pi * pi), 1e-12);
    }
}

TEST_F(KnownSeriesCatalogTest, SignSeries) {
    const auto entry = catalog.lookup("sign(x)", 5.0);
    ASSERT_TRUE(entry.has_value());
    const auto bn = KnownSeriesCatalog::evaluate_formula(entry->bn, 3);
    EXPECT_NEAR(bn(0), 4.0 / pi, 1e-12);
    EXPECT_NEAR(bn(1), 0.0, 1e-15);
    EXPECT_NEAR(bn(2), 4.0 / (3.0 * pi), 1e-12);
}

TEST_F(KnownSeriesCatalogTest, SinusoidsOnlyApplyToHarmonicPeriods) {
    const auto standard = catalog.lookup("sin(x)", pi);
    ASSERT_TRUE(standard.has_value());
    const auto bn = KnownSeriesCatalog::evaluate_formula(standard->bn, 3);
    EXPECT_DOUBLE_EQ(bn(0), 1.0);
    EXPECT_DOUBLE_EQ(bn(1), 0.0);

    // On [-2 pi, 2 pi] cos(x) is the second harmonic.
    const auto doubled = catalog.lookup("cos(x)", 2.0 * pi);
    ASSERT_TRUE(doubled.has_value());
    const auto an = KnownSeriesCatalog::evaluate_formula(doubled->an, 3);
    EXPECT_DOUBLE_EQ(an(0), 0.0);
    EXPECT_DOUBLE_EQ(an(1), 1.0);

    EXPECT_FALSE(catalog.lookup("sin(x)", 1.0).has_value());
    EXPECT_FALSE(catalog.lookup("cos(x)", 0.5 * pi).has_value());
}

TEST_F(KnownSeriesCatalogTest, MatchingIsLiteral) {
    EXPECT_FALSE(catalog.lookup("x + 0", pi).has_value());
    EXPECT_FALSE(catalog.lookup("x*x", pi).has_value());
    EXPECT_FALSE(catalog.lookup("sin(2*x)", pi).has_value());
}

TEST_F(KnownSeriesCatalogTest, CustomEntriesCanBeRegistered) {
    const expression::ExpressionParser parser({"n"});
    catalog.add("1", [&](double) {
        return std::optional<ClosedFormSeries>(
            ClosedFormSeries{"1", 2.0, parser.parse("0"), parser.parse("0"), SymmetryClass::Even});
    });
    EXPECT_EQ(catalog.keys().size(), 8u);
    const auto entry = catalog.lookup("1", pi);
    ASSERT_TRUE(entry.has_value());
    EXPECT_DOUBLE_EQ(entry->a0, 2.0);
}

TEST_F(KnownSeriesCatalogTest, FormulaEvaluationPropagatesErrors) {
    const expression::ExpressionParser parser({"n"});
    EXPECT_THROW(KnownSeriesCatalog::evaluate_formula(parser.parse("1/(n - 2)"), 3), expression::EvaluationError);
}
