/**
 * @file IdiomTable.cpp
 * @brief Default idioms and the bottom-up rewriting pass.
 */
#include "expression/IdiomTable.hpp"

#include "utils/Utils.hpp"

namespace expression {

namespace {

// The variants differ from the replacement at x = 0 only.
constexpr std::pair<std::string_view, std::string_view> kDefaultIdioms[] = {
    {"1 if x > 0 else -1", "sign(x)"},
    {"1 if x >= 0 else -1", "sign(x)"},
    {"-1 if x < 0 else 1", "sign(x)"},
    {"-1 if x <= 0 else 1", "sign(x)"},
    {"x if x >= 0 else -x", "abs(x)"},
    {"x if x > 0 else -x", "abs(x)"},
    {"-x if x < 0 else x", "abs(x)"},
    {"-x if x <= 0 else x", "abs(x)"},
    {"x if x > 0 else 0", "(x + abs(x))/2"},
    {"x if x >= 0 else 0", "(x + abs(x))/2"},
    {"0 if x < 0 else x", "(x + abs(x))/2"},
    {"1 if x > 0 else 0", "(1 + sign(x))/2"},
    {"1 if x >= 0 else 0", "(1 + sign(x))/2"},
    {"0 if x < 0 else 1", "(1 + sign(x))/2"},
};

} // namespace

IdiomTable::IdiomTable()
    : parser_({"x"})
{
    for (const auto& [pattern, replacement] : kDefaultIdioms) {
        add(pattern, replacement);
    }
}

void IdiomTable::add(std::string_view pattern, std::string_view replacement)
{
    idioms_.emplace_back(parser_.parse(pattern), parser_.parse(replacement));
}

ExprPtr IdiomTable::rewrite(const ExprPtr& node) const
{
    for (const auto& [pattern, replacement] : idioms_) {
        if (structurally_equal(node, pattern)) {
            return replacement;
        }
    }

    return std::visit(Utils::Overloaded{
        [&](const Number&) { return node; },
        [&](const Variable&) { return node; },
        [&](const Constant&) { return node; },
        [&](const Unary& u) {
            ExprPtr operand = rewrite(u.operand);
            return operand == u.operand ? node : make_unary(u.op, std::move(operand));
        },
        [&](const Binary& b) {
            ExprPtr lhs = rewrite(b.lhs);
            ExprPtr rhs = rewrite(b.rhs);
            return (lhs == b.lhs && rhs == b.rhs) ? node : make_binary(b.op, std::move(lhs), std::move(rhs));
        },
        [&](const Call& c) {
            ExprPtr argument = rewrite(c.argument);
            return argument == c.argument ? node : make_call(c.function, std::move(argument));
        },
        [&](const Compare&) { return node; },
        [&](const Logical&) { return node; },
        [&](const Not&) { return node; },
        [&](const Conditional& c) {
            ExprPtr if_true = rewrite(c.if_true);
            ExprPtr if_false = rewrite(c.if_false);
            if (if_true == c.if_true && if_false == c.if_false) {
                return node;
            }
            return make_conditional(c.condition, std::move(if_true), std::move(if_false));
        },
    }, node->data);
}

} // namespace expression
