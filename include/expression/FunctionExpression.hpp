/**
 * @file FunctionExpression.hpp
 * @brief Dual representation of a user-supplied periodic function.
 *
 * A FunctionExpression is built once from the expression text and is immutable afterwards.
 * It always carries a numeric evaluator; its representation tag tells downstream code whether
 * the function may also be treated symbolically:
 * - SymbolicForm: no conditional constructs (possibly after idiom rewriting); eligible for
 *   closed-form integration.
 * - NumericForm: piecewise/conditional definition; integrated by quadrature only.
 *
 * Usage Example:
 * @code
 * expression::FunctionExpression f("x**2 + 1");
 * double y = f.evaluate(0.5);
 * auto ys = f.evaluate_vector(Utils::linspace(-M_PI, M_PI, 100));
 * @endcode
 */
#ifndef FUNCTION_EXPRESSION_HPP
#define FUNCTION_EXPRESSION_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "ExpressionErrors.hpp"
#include "ExpressionNode.hpp"
#include "../traits/FSEA_traits.hpp"

namespace expression {

struct SymbolicForm {
    ExprPtr ast;
};

struct NumericForm {
    ExprPtr ast;
};

using Representation = std::variant<SymbolicForm, NumericForm>;

/**
 * @brief A sample that failed during a bulk evaluation.
 */
struct EvaluationDiagnostic {
    std::size_t index;
    double x;
    std::string message;
};

class FunctionExpression {
public:
    using Array = traits::DataType::StoringArray;

    /**
     * @brief Parses the text and builds both representations.
     * @throws ParseError if the text is malformed or uses a disallowed name.
     */
    explicit FunctionExpression(std::string text);

    const std::string& text() const noexcept { return text_; }

    /**
     * @brief The text with all whitespace removed.
     */
    std::string normalized_text() const;

    const Representation& representation() const noexcept { return representation_; }

    bool is_symbolic() const noexcept { return std::holds_alternative<SymbolicForm>(representation_); }

    /**
     * @brief The tree used for symbolic work, if the representation is symbolic.
     */
    std::optional<ExprPtr> symbolic_ast() const;

    /**
     * @brief The tree exactly as parsed, used for numeric evaluation.
     */
    const ExprPtr& parsed_ast() const noexcept { return parsed_; }

    /**
     * @brief Evaluates the function at a single point.
     * @throws EvaluationError on division by zero, log/sqrt domain errors or a non-finite result.
     */
    double evaluate(double x) const;

    /**
     * @brief Evaluates element-wise; failing samples become 0.
     *
     * A one-line summary of the failures is written to the warning log.
     */
    Array evaluate_vector(const Array& xs) const;

    /**
     * @brief Evaluates element-wise; failing samples become 0 and are reported in `diagnostics`.
     */
    Array evaluate_vector(const Array& xs, std::vector<EvaluationDiagnostic>& diagnostics) const;

private:
    std::string text_;
    ExprPtr parsed_;
    Representation representation_;
};

} // namespace expression

#endif // FUNCTION_EXPRESSION_HPP
