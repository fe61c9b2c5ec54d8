/**
 * @file IdiomTable.hpp
 * @brief Rewrites common conditional idioms into equivalent closed-form expressions.
 *
 * Piecewise definitions such as `1 if x > 0 else -1` cannot be integrated symbolically,
 * but many of them are spelled-out versions of `sign` or `abs`. The table holds pairs of
 * (pattern, replacement) trees; any subtree structurally equal to a pattern is replaced.
 */
#ifndef EXPRESSION_IDIOM_TABLE_HPP
#define EXPRESSION_IDIOM_TABLE_HPP

#include <string_view>
#include <utility>
#include <vector>
#include "ExpressionNode.hpp"
#include "ExpressionParser.hpp"

namespace expression {

class IdiomTable {
public:
    /**
     * @brief Builds the table with the default sign/abs/ramp/step idioms in variable `x`.
     */
    IdiomTable();

    /**
     * @brief Registers an idiom; both texts are parsed with the table's parser.
     * @throws ParseError if either text is malformed.
     */
    void add(std::string_view pattern, std::string_view replacement);

    /**
     * @brief Replaces every subtree matching a registered pattern.
     * @return The rewritten tree (the input itself when nothing matched).
     */
    ExprPtr rewrite(const ExprPtr& node) const;

    std::size_t size() const noexcept { return idioms_.size(); }

private:
    ExpressionParser parser_;
    std::vector<std::pair<ExprPtr, ExprPtr>> idioms_;
};

} // namespace expression

#endif // EXPRESSION_IDIOM_TABLE_HPP
