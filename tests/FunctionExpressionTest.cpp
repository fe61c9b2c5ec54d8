#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "expression/ExpressionErrors.hpp"
#include "expression/ExpressionNode.hpp"
#include "expression/ExpressionParser.hpp"
#include "expression/FunctionExpression.hpp"
#include "expression/IdiomTable.hpp"
#include "utils/Utils.hpp"

using namespace expression;
using Array = FunctionExpression::Array;

TEST(FunctionExpressionTest, SmoothExpressionIsSymbolic) {
    const FunctionExpression f("x**2 + sin(x)");
    EXPECT_TRUE(f.is_symbolic());
    ASSERT_TRUE(f.symbolic_ast().has_value());
    EXPECT_TRUE(structurally_equal(*f.symbolic_ast(), f.parsed_ast()));
}

TEST(FunctionExpressionTest, KnownIdiomIsRewrittenToSymbolicForm) {
    const FunctionExpression f("1 if x > 0 else -1");
    ASSERT_TRUE(f.is_symbolic());
    EXPECT_EQ(to_string(*f.symbolic_ast()), "sign(x)");
    // Numeric evaluation keeps the text as written.
    EXPECT_DOUBLE_EQ(f.evaluate(0.0), -1.0);
    EXPECT_DOUBLE_EQ(f.evaluate(2.0), 1.0);
}

TEST(FunctionExpressionTest, UnknownPiecewiseIsNumeric) {
    const FunctionExpression f("1 if abs(x) < pi/4 else 0");
    EXPECT_FALSE(f.is_symbolic());
    EXPECT_FALSE(f.symbolic_ast().has_value());
    EXPECT_TRUE(std::holds_alternative<NumericForm>(f.representation()));
    EXPECT_DOUBLE_EQ(f.evaluate(0.1), 1.0);
    EXPECT_DOUBLE_EQ(f.evaluate(1.0), 0.0);
}

TEST(FunctionExpressionTest, NormalizedTextDropsWhitespace) {
    const FunctionExpression f("  x ** 2\t+ 1 ");
    EXPECT_EQ(f.normalized_text(), "x**2+1");
    EXPECT_EQ(f.text(), "  x ** 2\t+ 1 ");
}

TEST(FunctionExpressionTest, ConstructionRejectsMalformedText) {
    EXPECT_THROW(FunctionExpression("x +"), ParseError);
    EXPECT_THROW(FunctionExpression("exec(x)"), ParseError);
    EXPECT_THROW(FunctionExpression(""), ParseError);
}

TEST(FunctionExpressionTest, PointEvaluationThrowsOnDomainErrors) {
    const FunctionExpression f("1/x");
    EXPECT_THROW(f.evaluate(0.0), EvaluationError);
    EXPECT_DOUBLE_EQ(f.evaluate(4.0), 0.25);
    EXPECT_THROW(FunctionExpression("exp(x)").evaluate(1000.0), EvaluationError);
}

TEST(FunctionExpressionTest, VectorEvaluationMatchesPointEvaluation) {
    const FunctionExpression f("cos(3*x) + x");
    const Array xs = Utils::linspace<double>(-3.0, 3.0, 257);
    const Array ys = f.evaluate_vector(xs);
    ASSERT_EQ(ys.size(), xs.size());
    for (Eigen::Index i = 0; i < xs.size(); ++i) {
        EXPECT_DOUBLE_EQ(ys(i), std::cos(3.0 * xs(i)) + xs(i));
    }
}

TEST(FunctionExpressionTest, FailingSamplesAreZeroFilledAndReportedInOrder) {
    const FunctionExpression f("1/x");
    Array xs(5);
    xs << -1.0, 0.0, 2.0, 0.0, 4.0;

    std::vector<EvaluationDiagnostic> diagnostics;
    const Array ys = f.evaluate_vector(xs, diagnostics);

    EXPECT_DOUBLE_EQ(ys(0), -1.0);
    EXPECT_DOUBLE_EQ(ys(1), 0.0);
    EXPECT_DOUBLE_EQ(ys(2), 0.5);
    EXPECT_DOUBLE_EQ(ys(3), 0.0);
    EXPECT_DOUBLE_EQ(ys(4), 0.25);

    ASSERT_EQ(diagnostics.size(), 2u);
    EXPECT_EQ(diagnostics[0].index, 1u);
    EXPECT_EQ(diagnostics[1].index, 3u);
    EXPECT_DOUBLE_EQ(diagnostics[0].x, 0.0);
    EXPECT_FALSE(diagnostics[0].message.empty());
}

TEST(FunctionExpressionTest, UnreachableBranchIsNeverEvaluated) {
    const FunctionExpression f("1/(x - 100) if x > 100 else 0");
    std::vector<EvaluationDiagnostic> diagnostics;
    const Array ys = f.evaluate_vector(Utils::linspace<double>(-1.0, 1.0, 11), diagnostics);
    EXPECT_TRUE(diagnostics.empty());
    EXPECT_DOUBLE_EQ(ys.abs().maxCoeff(), 0.0);
}

TEST(IdiomTableTest, DefaultIdiomsAndCustomEntries) {
    IdiomTable table;
    EXPECT_EQ(table.size(), 14u);

    ExpressionParser parser;
    const auto rewritten = table.rewrite(parser.parse("2*(x if x >= 0 else -x) + 1"));
    EXPECT_EQ(to_string(rewritten), "2*abs(x) + 1");
    EXPECT_FALSE(contains_conditional(rewritten));

    table.add("0 if x > 0 else 1", "(1 - sign(x))/2");
    EXPECT_EQ(table.size(), 15u);
    EXPECT_FALSE(contains_conditional(table.rewrite(parser.parse("0 if x > 0 else 1"))));

    const auto untouched = parser.parse("x + 1");
    EXPECT_EQ(table.rewrite(untouched), untouched);
}
