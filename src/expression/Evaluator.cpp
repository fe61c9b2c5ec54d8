/**
 * @file Evaluator.cpp
 * @brief Tree-walking evaluator for the whitelisted expression grammar.
 */
#include "expression/Evaluator.hpp"

#include <cmath>

#include "utils/Utils.hpp"

namespace expression {

double apply_function(Function function, double value)
{
    switch (function) {
        case Function::Sin:   return std::sin(value);
        case Function::Cos:   return std::cos(value);
        case Function::Tan:   return std::tan(value);
        case Function::Exp:   return std::exp(value);
        case Function::Log:
            if (!(value > 0.0)) {
                throw EvaluationError("log of non-positive value " + std::to_string(value));
            }
            return std::log(value);
        case Function::Log10:
            if (!(value > 0.0)) {
                throw EvaluationError("log10 of non-positive value " + std::to_string(value));
            }
            return std::log10(value);
        case Function::Sqrt:
            if (value < 0.0) {
                throw EvaluationError("sqrt of negative value " + std::to_string(value));
            }
            return std::sqrt(value);
        case Function::Abs:   return std::abs(value);
        case Function::Sign:  return value > 0.0 ? 1.0 : (value < 0.0 ? -1.0 : 0.0);
        case Function::Floor: return std::floor(value);
        case Function::Ceil:  return std::ceil(value);
    }
    throw EvaluationError("unknown function");
}

namespace {

double power(double base, double exponent)
{
    if (base == 0.0 && exponent < 0.0) {
        throw EvaluationError("zero raised to a negative power");
    }
    if (base < 0.0 && exponent != std::floor(exponent)) {
        throw EvaluationError("negative base raised to a fractional power");
    }
    return std::pow(base, exponent);
}

bool compare(CompareOp op, double lhs, double rhs)
{
    switch (op) {
        case CompareOp::Less:         return lhs < rhs;
        case CompareOp::LessEqual:    return lhs <= rhs;
        case CompareOp::Greater:      return lhs > rhs;
        case CompareOp::GreaterEqual: return lhs >= rhs;
        case CompareOp::Equal:        return lhs == rhs;
        case CompareOp::NotEqual:     return lhs != rhs;
    }
    return false;
}

} // namespace

double Evaluator::evaluate(const ExprPtr& node, double value) const
{
    return std::visit(Utils::Overloaded{
        [](const Number& n) { return n.value; },
        [&](const Variable& v) -> double {
            if (v.name != variable_) {
                throw EvaluationError("unbound variable '" + v.name + "'");
            }
            return value;
        },
        [](const Constant& c) { return c.value; },
        [&](const Unary& u) {
            const double operand = evaluate(u.operand, value);
            return u.op == UnaryOp::Minus ? -operand : operand;
        },
        [&](const Binary& b) -> double {
            const double lhs = evaluate(b.lhs, value);
            const double rhs = evaluate(b.rhs, value);
            switch (b.op) {
                case BinaryOp::Add: return lhs + rhs;
                case BinaryOp::Sub: return lhs - rhs;
                case BinaryOp::Mul: return lhs * rhs;
                case BinaryOp::Div:
                    if (rhs == 0.0) {
                        throw EvaluationError("division by zero");
                    }
                    return lhs / rhs;
                case BinaryOp::Mod:
                    if (rhs == 0.0) {
                        throw EvaluationError("modulo by zero");
                    }
                    return lhs - rhs * std::floor(lhs / rhs);
                case BinaryOp::Pow: return power(lhs, rhs);
            }
            throw EvaluationError("unknown operator");
        },
        [&](const Call& c) { return apply_function(c.function, evaluate(c.argument, value)); },
        [&](const Compare& c) {
            double lhs = evaluate(c.operands.front(), value);
            for (std::size_t i = 0; i < c.ops.size(); ++i) {
                const double rhs = evaluate(c.operands[i + 1], value);
                if (!compare(c.ops[i], lhs, rhs)) {
                    return 0.0;
                }
                lhs = rhs;
            }
            return 1.0;
        },
        [&](const Logical& l) {
            const bool lhs = evaluate(l.lhs, value) != 0.0;
            if (l.op == LogicalOp::And && !lhs) {
                return 0.0;
            }
            if (l.op == LogicalOp::Or && lhs) {
                return 1.0;
            }
            return evaluate(l.rhs, value) != 0.0 ? 1.0 : 0.0;
        },
        [&](const Not& n) { return evaluate(n.operand, value) != 0.0 ? 0.0 : 1.0; },
        [&](const Conditional& c) {
            return evaluate(c.condition, value) != 0.0 ? evaluate(c.if_true, value)
                                                       : evaluate(c.if_false, value);
        },
    }, node->data);
}

} // namespace expression
