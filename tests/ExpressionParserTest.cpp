#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include <boost/math/constants/constants.hpp>
#include "expression/Evaluator.hpp"
#include "expression/ExpressionErrors.hpp"
#include "expression/ExpressionNode.hpp"
#include "expression/ExpressionParser.hpp"

using namespace expression;

class ExpressionParserTest : public ::testing::Test {
protected:
    ExpressionParser parser;
    Evaluator evaluator;

    double eval(const std::string& text, double x = 0.0) const {
        return evaluator.evaluate(parser.parse(text), x);
    }
};

// ============================================================================
// Grammar
// ============================================================================

TEST_F(ExpressionParserTest, ArithmeticPrecedence) {
    EXPECT_DOUBLE_EQ(eval("1 + 2*3"), 7.0);
    EXPECT_DOUBLE_EQ(eval("(1 + 2)*3"), 9.0);
    EXPECT_DOUBLE_EQ(eval("2*x + 1", 3.0), 7.0);
    EXPECT_DOUBLE_EQ(eval("x/4", 2.0), 0.5);
}

TEST_F(ExpressionParserTest, PowerIsRightAssociativeAndBindsTighterThanUnaryMinus) {
    EXPECT_DOUBLE_EQ(eval("2**3**2"), 512.0);
    EXPECT_DOUBLE_EQ(eval("-2**2"), -4.0);
    EXPECT_DOUBLE_EQ(eval("2**-1"), 0.5);
}

TEST_F(ExpressionParserTest, CaretIsAcceptedAsPower) {
    EXPECT_DOUBLE_EQ(eval("2^3"), 8.0);
    EXPECT_DOUBLE_EQ(eval("x^2", 3.0), 9.0);
}

TEST_F(ExpressionParserTest, ModuloIsFloored) {
    EXPECT_DOUBLE_EQ(eval("7 % 3"), 1.0);
    EXPECT_DOUBLE_EQ(eval("-7 % 3"), 2.0);
    EXPECT_DOUBLE_EQ(eval("x % (2*pi)", -1.0), 2.0 * boost::math::constants::pi<double>() - 1.0);
}

TEST_F(ExpressionParserTest, ConstantsAndFunctions) {
    const double pi = boost::math::constants::pi<double>();
    EXPECT_DOUBLE_EQ(eval("pi"), pi);
    EXPECT_DOUBLE_EQ(eval("2*e"), 2.0 * std::exp(1.0));
    EXPECT_NEAR(eval("sin(pi/2)"), 1.0, 1e-15);
    EXPECT_DOUBLE_EQ(eval("abs(x)", -3.0), 3.0);
    EXPECT_DOUBLE_EQ(eval("sign(x)", -3.0), -1.0);
    EXPECT_DOUBLE_EQ(eval("sign(0)"), 0.0);
    EXPECT_DOUBLE_EQ(eval("floor(2.7) + ceil(2.2)"), 5.0);
    EXPECT_DOUBLE_EQ(eval("log10(1000)"), 3.0);
    EXPECT_DOUBLE_EQ(eval("sqrt(16)"), 4.0);
}

TEST_F(ExpressionParserTest, ScientificNotation) {
    EXPECT_DOUBLE_EQ(eval("1e3"), 1000.0);
    EXPECT_DOUBLE_EQ(eval("2.5E-1"), 0.25);
    EXPECT_DOUBLE_EQ(eval(".5"), 0.5);
}

TEST_F(ExpressionParserTest, ChainedComparisonIsConjunction) {
    EXPECT_DOUBLE_EQ(eval("0 < x < 1", 0.5), 1.0);
    EXPECT_DOUBLE_EQ(eval("0 < x < 1", 2.0), 0.0);
    EXPECT_DOUBLE_EQ(eval("0 < x < 1", -1.0), 0.0);
}

TEST_F(ExpressionParserTest, LogicalOperators) {
    EXPECT_DOUBLE_EQ(eval("x > 0 and x < 1", 0.5), 1.0);
    EXPECT_DOUBLE_EQ(eval("x < 0 or x > 1", 0.5), 0.0);
    EXPECT_DOUBLE_EQ(eval("not x > 1", 0.0), 1.0);
}

TEST_F(ExpressionParserTest, TernaryIsLazyAndRightAssociative) {
    EXPECT_DOUBLE_EQ(eval("1 if x > 0 else -1", 2.0), 1.0);
    EXPECT_DOUBLE_EQ(eval("1 if x > 0 else -1", -2.0), -1.0);
    EXPECT_DOUBLE_EQ(eval("1 if x > 1 else 2 if x > 0 else 3", 0.5), 2.0);
    EXPECT_DOUBLE_EQ(eval("1/x if x != 0 else 0", 0.0), 0.0);
}

TEST_F(ExpressionParserTest, PrintsWithInputSyntax) {
    EXPECT_EQ(to_string(parser.parse("x**2+1")), "x**2 + 1");
    EXPECT_EQ(to_string(parser.parse("(x + 1)*2")), "(x + 1)*2");
    EXPECT_EQ(to_string(parser.parse("x^2")), "x**2");
    EXPECT_EQ(to_string(parser.parse("sin(2*x)")), "sin(2*x)");
}

TEST_F(ExpressionParserTest, StructuralEquality) {
    EXPECT_TRUE(structurally_equal(parser.parse("1 if x>0 else -1"), parser.parse("1 if x > 0 else -1")));
    EXPECT_FALSE(structurally_equal(parser.parse("x + 1"), parser.parse("1 + x")));
}

TEST_F(ExpressionParserTest, Queries) {
    EXPECT_TRUE(contains_conditional(parser.parse("2 * (1 if x > 0 else 0)")));
    EXPECT_TRUE(contains_conditional(parser.parse("x > 0")));
    EXPECT_FALSE(contains_conditional(parser.parse("sin(x) + x**2")));
    EXPECT_TRUE(depends_on(parser.parse("sin(x)"), "x"));
    EXPECT_FALSE(depends_on(parser.parse("sin(pi)"), "x"));
}

// ============================================================================
// Rejected input
// ============================================================================

TEST_F(ExpressionParserTest, RejectsUnknownIdentifier) {
    try {
        parser.parse("x + y");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.position(), 4u);
    }
    EXPECT_THROW(parser.parse("import os"), ParseError);
}

TEST_F(ExpressionParserTest, RejectsHostLanguageConstructs) {
    EXPECT_THROW(parser.parse("__import__('os')"), ParseError);
    EXPECT_THROW(parser.parse("x.real"), ParseError);
    EXPECT_THROW(parser.parse("x; 1"), ParseError);
    EXPECT_THROW(parser.parse("lambda: 1"), ParseError);
}

TEST_F(ExpressionParserTest, RejectsUnknownFunctionAndBadCalls) {
    EXPECT_THROW(parser.parse("arcsin(x)"), ParseError);
    EXPECT_THROW(parser.parse("sin x"), ParseError);
    EXPECT_THROW(parser.parse("sin()"), ParseError);
    EXPECT_THROW(parser.parse("sin(x, 2)"), ParseError);
}

TEST_F(ExpressionParserTest, RejectsSyntaxErrors) {
    EXPECT_THROW(parser.parse(""), ParseError);
    EXPECT_THROW(parser.parse("   "), ParseError);
    EXPECT_THROW(parser.parse("x +"), ParseError);
    EXPECT_THROW(parser.parse("(x"), ParseError);
    EXPECT_THROW(parser.parse("x)"), ParseError);
    EXPECT_THROW(parser.parse("1 if x > 0"), ParseError);
    EXPECT_THROW(parser.parse("1e999"), ParseError);
}

TEST_F(ExpressionParserTest, NestingDepthIsBounded) {
    const std::string shallow = std::string(50, '(') + "x" + std::string(50, ')');
    EXPECT_DOUBLE_EQ(eval(shallow, 2.0), 2.0);
    EXPECT_DOUBLE_EQ(eval(std::string(20, '-') + "x", 2.0), 2.0);

    const std::size_t deep = 50000;
    EXPECT_THROW(parser.parse(std::string(deep, '(') + "x" + std::string(deep, ')')), ParseError);
    EXPECT_THROW(parser.parse(std::string(deep, '-') + "x"), ParseError);
    EXPECT_THROW(parser.parse("sin(" + std::string(deep, '(') + "x"), ParseError);
}

TEST_F(ExpressionParserTest, VariablesAreConfigurable) {
    ExpressionParser n_parser({"n"});
    EXPECT_THROW(n_parser.parse("x"), ParseError);
    EXPECT_DOUBLE_EQ(Evaluator("n").evaluate(n_parser.parse("(-1)**n/n"), 3.0), -1.0 / 3.0);
}

// ============================================================================
// Evaluation errors
// ============================================================================

TEST_F(ExpressionParserTest, DomainErrorsThrowEvaluationError) {
    EXPECT_THROW(eval("1/x", 0.0), EvaluationError);
    EXPECT_THROW(eval("x % 0", 1.0), EvaluationError);
    EXPECT_THROW(eval("log(x)", 0.0), EvaluationError);
    EXPECT_THROW(eval("log10(x)", -1.0), EvaluationError);
    EXPECT_THROW(eval("sqrt(x)", -1.0), EvaluationError);
    EXPECT_THROW(eval("x**0.5", -1.0), EvaluationError);
    EXPECT_THROW(eval("x**-1", 0.0), EvaluationError);
}
