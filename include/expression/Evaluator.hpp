/**
 * @file Evaluator.hpp
 * @brief Numeric evaluation of expression trees for a single bound variable.
 *
 * Evaluation follows the semantics of the input grammar: `%` is the floored modulo,
 * comparisons and logical operators yield 1 or 0, and a conditional only evaluates
 * the branch it selects. Every failure raises EvaluationError.
 */
#ifndef EXPRESSION_EVALUATOR_HPP
#define EXPRESSION_EVALUATOR_HPP

#include <string>
#include <string_view>
#include <utility>
#include "ExpressionErrors.hpp"
#include "ExpressionNode.hpp"

namespace expression {

/**
 * @brief Applies a whitelisted function to a value.
 * @throws EvaluationError for log/log10 of a non-positive value and sqrt of a negative value.
 */
double apply_function(Function function, double value);

class Evaluator {
public:
    /**
     * @param variable Name of the variable bound at every evaluation.
     */
    explicit Evaluator(std::string variable = "x") : variable_(std::move(variable)) {}

    /**
     * @brief Evaluates the tree with the variable bound to `value`.
     * @throws EvaluationError on any arithmetic or domain failure, or if the tree uses another variable.
     */
    double evaluate(const ExprPtr& node, double value) const;

    const std::string& variable() const noexcept { return variable_; }

private:
    std::string variable_;
};

} // namespace expression

#endif // EXPRESSION_EVALUATOR_HPP
