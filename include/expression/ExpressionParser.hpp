/**
 * @file ExpressionParser.hpp
 * @brief Recursive-descent parser for the whitelisted function grammar.
 *
 * Grammar (lowest to highest precedence):
 * @code
 * ternary    := or_expr [ 'if' or_expr 'else' ternary ]
 * or_expr    := and_expr ( 'or' and_expr )*
 * and_expr   := not_expr ( 'and' not_expr )*
 * not_expr   := 'not' not_expr | comparison
 * comparison := arith ( ('<' | '<=' | '>' | '>=' | '==' | '!=') arith )*
 * arith      := term ( ('+' | '-') term )*
 * term       := unary ( ('*' | '/' | '%') unary )*
 * unary      := ('+' | '-') unary | power
 * power      := primary [ ('**' | '^') unary ]
 * primary    := number | variable | constant | function '(' ternary ')' | '(' ternary ')'
 * @endcode
 *
 * Names are resolved against fixed whitelists: the configured variables, the constants
 * `pi` and `e`, and the functions `sin cos tan exp log log10 sqrt abs sign floor ceil`.
 * Any other name is rejected with a ParseError.
 */
#ifndef EXPRESSION_PARSER_HPP
#define EXPRESSION_PARSER_HPP

#include <string>
#include <string_view>
#include <vector>
#include "ExpressionErrors.hpp"
#include "ExpressionNode.hpp"

namespace expression {

class ExpressionParser {
public:
    /**
     * @param variables Names accepted as free variables (default: `x`).
     */
    explicit ExpressionParser(std::vector<std::string> variables = {"x"});

    /**
     * @brief Parses a complete expression.
     * @param text Expression text.
     * @return Root of the parsed tree.
     * @throws ParseError if the text is empty, malformed or uses a name outside the whitelists.
     */
    ExprPtr parse(std::string_view text) const;

    const std::vector<std::string>& variables() const noexcept { return variables_; }

private:
    std::vector<std::string> variables_;
};

} // namespace expression

#endif // EXPRESSION_PARSER_HPP
