/**
 * @file FunctionExpression.cpp
 * @brief Construction and evaluation of FunctionExpression.
 */
#include "expression/FunctionExpression.hpp"

#include <algorithm>
#include <cmath>
#include <execution>
#include <iostream>
#include <numeric>
#include <sstream>
#include <utility>
#include <vector>

#include "expression/Evaluator.hpp"
#include "expression/ExpressionParser.hpp"
#include "expression/IdiomTable.hpp"
#include "utils/Utils.hpp"

namespace expression {

namespace {

const IdiomTable& default_idioms()
{
    static const IdiomTable table;
    return table;
}

Representation classify(const ExprPtr& parsed)
{
    if (!contains_conditional(parsed)) {
        return SymbolicForm{parsed};
    }
    ExprPtr rewritten = default_idioms().rewrite(parsed);
    if (!contains_conditional(rewritten)) {
        return SymbolicForm{rewritten};
    }
    return NumericForm{parsed};
}

} // namespace

FunctionExpression::FunctionExpression(std::string text)
    : text_(std::move(text)),
      parsed_(ExpressionParser({"x"}).parse(text_)),
      representation_(classify(parsed_))
{
}

std::string FunctionExpression::normalized_text() const
{
    return Utils::strip_whitespace(text_);
}

std::optional<ExprPtr> FunctionExpression::symbolic_ast() const
{
    if (const auto* symbolic = std::get_if<SymbolicForm>(&representation_)) {
        return symbolic->ast;
    }
    return std::nullopt;
}

double FunctionExpression::evaluate(double x) const
{
    const double y = Evaluator("x").evaluate(parsed_, x);
    if (!std::isfinite(y)) {
        throw EvaluationError("non-finite value at x = " + std::to_string(x));
    }
    return y;
}

FunctionExpression::Array FunctionExpression::evaluate_vector(const Array& xs,
                                                              std::vector<EvaluationDiagnostic>& diagnostics) const
{
    const std::size_t count = static_cast<std::size_t>(xs.size());
    Array ys(xs.size());
    std::vector<std::optional<std::string>> failures(count);
    std::vector<std::size_t> indices(count);
    std::iota(indices.begin(), indices.end(), std::size_t{0});

    std::for_each(std::execution::par,
                  indices.begin(), indices.end(),
                  [this, &xs, &ys, &failures](std::size_t i) {
                      const auto k = static_cast<Eigen::Index>(i);
                      try {
                          ys(k) = evaluate(xs(k));
                      } catch (const EvaluationError& e) {
                          ys(k) = 0.0;
                          failures[i] = e.what();
                      }
                  });

    for (std::size_t i = 0; i < failures.size(); ++i) {
        if (failures[i]) {
            diagnostics.push_back({i, xs(static_cast<Eigen::Index>(i)), std::move(*failures[i])});
        }
    }
    return ys;
}

FunctionExpression::Array FunctionExpression::evaluate_vector(const Array& xs) const
{
    std::vector<EvaluationDiagnostic> diagnostics;
    Array ys = evaluate_vector(xs, diagnostics);
    if (!diagnostics.empty()) {
        std::ostringstream message;
        message << "Warning: " << diagnostics.size() << " of " << xs.size()
                << " samples of '" << text_ << "' failed to evaluate and were set to 0 (first at x = "
                << diagnostics.front().x << ": " << diagnostics.front().message << ")\n";
        std::cerr << message.str();
    }
    return ys;
}

} // namespace expression
