/**
 * @file ExpressionNode.cpp
 * @brief Node factories, printing and structural queries of the expression tree.
 */
#include "expression/ExpressionNode.hpp"

#include <array>
#include <iomanip>
#include <sstream>
#include <utility>

#include "utils/Utils.hpp"

namespace expression {

ExprPtr make_number(double value)
{
    return std::make_shared<const Node>(Node{Number{value}});
}

ExprPtr make_variable(std::string name)
{
    return std::make_shared<const Node>(Node{Variable{std::move(name)}});
}

ExprPtr make_constant(std::string name, double value)
{
    return std::make_shared<const Node>(Node{Constant{std::move(name), value}});
}

ExprPtr make_unary(UnaryOp op, ExprPtr operand)
{
    return std::make_shared<const Node>(Node{Unary{op, std::move(operand)}});
}

ExprPtr make_binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs)
{
    return std::make_shared<const Node>(Node{Binary{op, std::move(lhs), std::move(rhs)}});
}

ExprPtr make_call(Function function, ExprPtr argument)
{
    return std::make_shared<const Node>(Node{Call{function, std::move(argument)}});
}

ExprPtr make_compare(std::vector<CompareOp> ops, std::vector<ExprPtr> operands)
{
    return std::make_shared<const Node>(Node{Compare{std::move(ops), std::move(operands)}});
}

ExprPtr make_logical(LogicalOp op, ExprPtr lhs, ExprPtr rhs)
{
    return std::make_shared<const Node>(Node{Logical{op, std::move(lhs), std::move(rhs)}});
}

ExprPtr make_not(ExprPtr operand)
{
    return std::make_shared<const Node>(Node{Not{std::move(operand)}});
}

ExprPtr make_conditional(ExprPtr condition, ExprPtr if_true, ExprPtr if_false)
{
    return std::make_shared<const Node>(Node{Conditional{std::move(condition), std::move(if_true), std::move(if_false)}});
}

namespace {

constexpr std::array<std::pair<Function, std::string_view>, 11> kFunctionNames{{
    {Function::Sin, "sin"},
    {Function::Cos, "cos"},
    {Function::Tan, "tan"},
    {Function::Exp, "exp"},
    {Function::Log, "log"},
    {Function::Log10, "log10"},
    {Function::Sqrt, "sqrt"},
    {Function::Abs, "abs"},
    {Function::Sign, "sign"},
    {Function::Floor, "floor"},
    {Function::Ceil, "ceil"},
}};

// Binding strength used when printing; larger binds tighter.
enum Precedence : int {
    kConditional = 0,
    kOr = 1,
    kAnd = 2,
    kNot = 3,
    kCompare = 4,
    kAdditive = 5,
    kMultiplicative = 6,
    kUnary = 7,
    kPower = 8,
    kAtom = 9
};

int precedence(const ExprPtr& node)
{
    return std::visit(Utils::Overloaded{
        [](const Number& n) { return n.value < 0 ? int(kUnary) : int(kAtom); },
        [](const Variable&) { return int(kAtom); },
        [](const Constant&) { return int(kAtom); },
        [](const Call&) { return int(kAtom); },
        [](const Unary&) { return int(kUnary); },
        [](const Binary& b) {
            switch (b.op) {
                case BinaryOp::Add:
                case BinaryOp::Sub: return int(kAdditive);
                case BinaryOp::Pow: return int(kPower);
                default:            return int(kMultiplicative);
            }
        },
        [](const Compare&) { return int(kCompare); },
        [](const Logical& l) { return l.op == LogicalOp::Or ? int(kOr) : int(kAnd); },
        [](const Not&) { return int(kNot); },
        [](const Conditional&) { return int(kConditional); },
    }, node->data);
}

std::string_view binary_symbol(BinaryOp op)
{
    switch (op) {
        case BinaryOp::Add: return " + ";
        case BinaryOp::Sub: return " - ";
        case BinaryOp::Mul: return "*";
        case BinaryOp::Div: return "/";
        case BinaryOp::Mod: return " % ";
        case BinaryOp::Pow: return "**";
    }
    return "?";
}

std::string_view compare_symbol(CompareOp op)
{
    switch (op) {
        case CompareOp::Less:         return " < ";
        case CompareOp::LessEqual:    return " <= ";
        case CompareOp::Greater:      return " > ";
        case CompareOp::GreaterEqual: return " >= ";
        case CompareOp::Equal:        return " == ";
        case CompareOp::NotEqual:     return " != ";
    }
    return "?";
}

void print(std::ostringstream& out, const ExprPtr& node, int min_precedence);

void print_child(std::ostringstream& out, const ExprPtr& child, int min_precedence)
{
    if (precedence(child) < min_precedence) {
        out << '(';
        print(out, child, kConditional);
        out << ')';
    } else {
        print(out, child, min_precedence);
    }
}

void print(std::ostringstream& out, const ExprPtr& node, int)
{
    std::visit(Utils::Overloaded{
        [&](const Number& n) { out << std::setprecision(15) << n.value; },
        [&](const Variable& v) { out << v.name; },
        [&](const Constant& c) { out << c.name; },
        [&](const Unary& u) {
            out << (u.op == UnaryOp::Minus ? "-" : "+");
            print_child(out, u.operand, kUnary);
        },
        [&](const Binary& b) {
            if (b.op == BinaryOp::Pow) {
                print_child(out, b.lhs, kAtom);
                out << binary_symbol(b.op);
                print_child(out, b.rhs, kUnary);
                return;
            }
            const int own = precedence(node);
            print_child(out, b.lhs, own);
            out << binary_symbol(b.op);
            print_child(out, b.rhs, own + 1);
        },
        [&](const Call& c) {
            out << function_name(c.function) << '(';
            print(out, c.argument, kConditional);
            out << ')';
        },
        [&](const Compare& c) {
            print_child(out, c.operands.front(), kAdditive);
            for (std::size_t i = 0; i < c.ops.size(); ++i) {
                out << compare_symbol(c.ops[i]);
                print_child(out, c.operands[i + 1], kAdditive);
            }
        },
        [&](const Logical& l) {
            const int own = precedence(node);
            print_child(out, l.lhs, own);
            out << (l.op == LogicalOp::Or ? " or " : " and ");
            print_child(out, l.rhs, own + 1);
        },
        [&](const Not& n) {
            out << "not ";
            print_child(out, n.operand, kNot);
        },
        [&](const Conditional& c) {
            print_child(out, c.if_true, kOr);
            out << " if ";
            print_child(out, c.condition, kOr);
            out << " else ";
            print_child(out, c.if_false, kConditional);
        },
    }, node->data);
}

} // namespace

std::string_view function_name(Function function)
{
    for (const auto& [fn, name] : kFunctionNames) {
        if (fn == function) {
            return name;
        }
    }
    return "?";
}

std::optional<Function> lookup_function(std::string_view name)
{
    for (const auto& [fn, fn_name] : kFunctionNames) {
        if (fn_name == name) {
            return fn;
        }
    }
    return std::nullopt;
}

std::string to_string(const ExprPtr& node)
{
    std::ostringstream out;
    print(out, node, kConditional);
    return out.str();
}

bool structurally_equal(const ExprPtr& lhs, const ExprPtr& rhs)
{
    if (lhs == rhs) {
        return true;
    }
    if (!lhs || !rhs || lhs->data.index() != rhs->data.index()) {
        return false;
    }

    return std::visit(Utils::Overloaded{
        [&](const Number& a) { return a.value == std::get<Number>(rhs->data).value; },
        [&](const Variable& a) { return a.name == std::get<Variable>(rhs->data).name; },
        [&](const Constant& a) { return a.name == std::get<Constant>(rhs->data).name; },
        [&](const Unary& a) {
            const auto& b = std::get<Unary>(rhs->data);
            return a.op == b.op && structurally_equal(a.operand, b.operand);
        },
        [&](const Binary& a) {
            const auto& b = std::get<Binary>(rhs->data);
            return a.op == b.op && structurally_equal(a.lhs, b.lhs) && structurally_equal(a.rhs, b.rhs);
        },
        [&](const Call& a) {
            const auto& b = std::get<Call>(rhs->data);
            return a.function == b.function && structurally_equal(a.argument, b.argument);
        },
        [&](const Compare& a) {
            const auto& b = std::get<Compare>(rhs->data);
            if (a.ops != b.ops || a.operands.size() != b.operands.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.operands.size(); ++i) {
                if (!structurally_equal(a.operands[i], b.operands[i])) {
                    return false;
                }
            }
            return true;
        },
        [&](const Logical& a) {
            const auto& b = std::get<Logical>(rhs->data);
            return a.op == b.op && structurally_equal(a.lhs, b.lhs) && structurally_equal(a.rhs, b.rhs);
        },
        [&](const Not& a) { return structurally_equal(a.operand, std::get<Not>(rhs->data).operand); },
        [&](const Conditional& a) {
            const auto& b = std::get<Conditional>(rhs->data);
            return structurally_equal(a.condition, b.condition)
                && structurally_equal(a.if_true, b.if_true)
                && structurally_equal(a.if_false, b.if_false);
        },
    }, lhs->data);
}

bool contains_conditional(const ExprPtr& node)
{
    return std::visit(Utils::Overloaded{
        [](const Number&) { return false; },
        [](const Variable&) { return false; },
        [](const Constant&) { return false; },
        [](const Unary& u) { return contains_conditional(u.operand); },
        [](const Binary& b) { return contains_conditional(b.lhs) || contains_conditional(b.rhs); },
        [](const Call& c) { return contains_conditional(c.argument); },
        [](const Compare&) { return true; },
        [](const Logical&) { return true; },
        [](const Not&) { return true; },
        [](const Conditional&) { return true; },
    }, node->data);
}

bool depends_on(const ExprPtr& node, std::string_view variable)
{
    return std::visit(Utils::Overloaded{
        [](const Number&) { return false; },
        [&](const Variable& v) { return v.name == variable; },
        [](const Constant&) { return false; },
        [&](const Unary& u) { return depends_on(u.operand, variable); },
        [&](const Binary& b) { return depends_on(b.lhs, variable) || depends_on(b.rhs, variable); },
        [&](const Call& c) { return depends_on(c.argument, variable); },
        [&](const Compare& c) {
            for (const auto& operand : c.operands) {
                if (depends_on(operand, variable)) {
                    return true;
                }
            }
            return false;
        },
        [&](const Logical& l) { return depends_on(l.lhs, variable) || depends_on(l.rhs, variable); },
        [&](const Not& n) { return depends_on(n.operand, variable); },
        [&](const Conditional& c) {
            return depends_on(c.condition, variable) || depends_on(c.if_true, variable)
                || depends_on(c.if_false, variable);
        },
    }, node->data);
}

} // namespace expression
