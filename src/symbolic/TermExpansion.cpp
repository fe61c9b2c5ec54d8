/**
 * @file TermExpansion.cpp
 * @brief Rewriting of expression trees into exponential-polynomial term sums.
 */
#include "symbolic/TermExpansion.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "expression/Evaluator.hpp"
#include "utils/Utils.hpp"

namespace symbolic {

using namespace expression;

namespace {

constexpr double kRateTolerance = 1e-12;

bool same_rate(const Complex& lhs, const Complex& rhs)
{
    return std::abs(lhs - rhs) <= kRateTolerance * std::max(1.0, std::abs(lhs));
}

bool is_real(const Complex& value)
{
    return std::abs(value.imag()) <= kRateTolerance * std::max(1.0, std::abs(value.real()));
}

// a + b*x, when the sum is a polynomial of degree at most one.
std::optional<std::pair<Complex, Complex>> as_linear(const TermSum& terms)
{
    Complex offset{0.0, 0.0};
    Complex slope{0.0, 0.0};
    for (const Term& term : terms) {
        if (term.signed_factor || term.rate != Complex(0.0, 0.0) || term.power > 1) {
            return std::nullopt;
        }
        (term.power == 0 ? offset : slope) += term.coefficient;
    }
    return std::make_pair(offset, slope);
}

std::optional<TermSum> exp_of(const TermSum& argument)
{
    auto linear = as_linear(argument);
    if (!linear) {
        return std::nullopt;
    }
    return TermSum{Term{std::exp(linear->first), 0, false, linear->second}};
}

TermSum scaled(TermSum terms, const Complex& factor)
{
    for (Term& term : terms) {
        term.coefficient *= factor;
    }
    return terms;
}

} // namespace

TermSum simplify(TermSum terms)
{
    TermSum merged;
    merged.reserve(terms.size());
    for (const Term& term : terms) {
        auto match = std::find_if(merged.begin(), merged.end(), [&](const Term& other) {
            return other.power == term.power && other.signed_factor == term.signed_factor
                && same_rate(other.rate, term.rate);
        });
        if (match == merged.end()) {
            merged.push_back(term);
        } else {
            match->coefficient += term.coefficient;
        }
    }
    merged.erase(std::remove_if(merged.begin(), merged.end(),
                                [](const Term& term) { return term.coefficient == Complex(0.0, 0.0); }),
                 merged.end());
    return merged;
}

std::optional<Complex> as_constant(const TermSum& terms)
{
    if (terms.empty()) {
        return Complex(0.0, 0.0);
    }
    if (terms.size() == 1 && terms.front().is_constant()) {
        return terms.front().coefficient;
    }
    return std::nullopt;
}

TermExpander::TermExpander() : TermExpander(Config{})
{
}

TermExpander::TermExpander(Config config, std::string variable)
    : config_(config), variable_(std::move(variable))
{
}

bool TermExpander::within_limits(const TermSum& sum) const
{
    if (sum.size() > config_.max_terms) {
        return false;
    }
    return std::all_of(sum.begin(), sum.end(),
                       [this](const Term& term) { return term.power <= config_.max_power; });
}

std::optional<TermSum> TermExpander::expand(const ExprPtr& node) const
{
    if (!depends_on(node, variable_)) {
        try {
            const double value = Evaluator(variable_).evaluate(node, 0.0);
            if (!std::isfinite(value)) {
                return std::nullopt;
            }
            return simplify(TermSum{Term{Complex(value, 0.0)}});
        } catch (const EvaluationError&) {
            return std::nullopt;
        }
    }

    return std::visit(Utils::Overloaded{
        [](const Number&) -> std::optional<TermSum> { return std::nullopt; },
        [](const Constant&) -> std::optional<TermSum> { return std::nullopt; },
        [&](const Variable& v) -> std::optional<TermSum> {
            if (v.name != variable_) {
                return std::nullopt;
            }
            return TermSum{Term{Complex(1.0, 0.0), 1}};
        },
        [&](const Unary& u) -> std::optional<TermSum> {
            auto operand = expand(u.operand);
            if (!operand || u.op == UnaryOp::Plus) {
                return operand;
            }
            return scaled(std::move(*operand), Complex(-1.0, 0.0));
        },
        [&](const Binary& b) -> std::optional<TermSum> {
            if (b.op == BinaryOp::Pow) {
                return power(b.lhs, b.rhs);
            }
            if (b.op == BinaryOp::Mod) {
                return std::nullopt;
            }
            auto lhs = expand(b.lhs);
            if (!lhs) {
                return std::nullopt;
            }
            auto rhs = expand(b.rhs);
            if (!rhs) {
                return std::nullopt;
            }
            switch (b.op) {
                case BinaryOp::Add:
                case BinaryOp::Sub: {
                    TermSum sum = std::move(*lhs);
                    const Complex factor = b.op == BinaryOp::Add ? Complex(1.0, 0.0) : Complex(-1.0, 0.0);
                    for (const Term& term : *rhs) {
                        sum.push_back(Term{term.coefficient * factor, term.power, term.signed_factor, term.rate});
                    }
                    sum = simplify(std::move(sum));
                    if (!within_limits(sum)) {
                        return std::nullopt;
                    }
                    return sum;
                }
                case BinaryOp::Mul:
                    return multiply(*lhs, *rhs);
                case BinaryOp::Div: {
                    // Only single terms free of powers of x can be inverted.
                    if (rhs->size() != 1 || rhs->front().power != 0 || rhs->front().coefficient == Complex(0.0, 0.0)) {
                        return std::nullopt;
                    }
                    const Term& divisor = rhs->front();
                    TermSum inverse{Term{Complex(1.0, 0.0) / divisor.coefficient, 0, divisor.signed_factor, -divisor.rate}};
                    return multiply(*lhs, inverse);
                }
                default:
                    return std::nullopt;
            }
        },
        [&](const Call& c) -> std::optional<TermSum> { return call(c.function, c.argument); },
        [](const Compare&) -> std::optional<TermSum> { return std::nullopt; },
        [](const Logical&) -> std::optional<TermSum> { return std::nullopt; },
        [](const Not&) -> std::optional<TermSum> { return std::nullopt; },
        [](const Conditional&) -> std::optional<TermSum> { return std::nullopt; },
    }, node->data);
}

std::optional<TermSum> TermExpander::multiply(const TermSum& lhs, const TermSum& rhs) const
{
    if (lhs.size() * rhs.size() > 8 * config_.max_terms) {
        return std::nullopt;
    }
    TermSum product;
    product.reserve(lhs.size() * rhs.size());
    for (const Term& a : lhs) {
        for (const Term& b : rhs) {
            const unsigned power = a.power + b.power;
            if (power > config_.max_power) {
                return std::nullopt;
            }
            // sign(x)^2 == 1 away from the origin
            product.push_back(Term{a.coefficient * b.coefficient, power, a.signed_factor != b.signed_factor, a.rate + b.rate});
        }
    }
    product = simplify(std::move(product));
    if (!within_limits(product)) {
        return std::nullopt;
    }
    return product;
}

std::optional<TermSum> TermExpander::power(const ExprPtr& base, const ExprPtr& exponent) const
{
    if (depends_on(exponent, variable_)) {
        // b**(a + c*x) == exp(log(b)*(a + c*x)) for a positive constant base.
        if (depends_on(base, variable_)) {
            return std::nullopt;
        }
        auto base_terms = expand(base);
        auto exponent_terms = expand(exponent);
        if (!base_terms || !exponent_terms) {
            return std::nullopt;
        }
        auto b = as_constant(*base_terms);
        if (!b || !is_real(*b) || b->real() <= 0.0) {
            return std::nullopt;
        }
        return exp_of(scaled(std::move(*exponent_terms), Complex(std::log(b->real()), 0.0)));
    }

    auto exponent_terms = expand(exponent);
    auto base_terms = expand(base);
    if (!exponent_terms || !base_terms) {
        return std::nullopt;
    }
    auto e = as_constant(*exponent_terms);
    if (!e || !is_real(*e)) {
        return std::nullopt;
    }
    const double value = e->real();
    if (value != std::floor(value) || std::abs(value) > config_.max_power) {
        return std::nullopt;
    }
    const int n = static_cast<int>(value);

    if (base_terms->size() == 1 && base_terms->front().power == 0) {
        const Term& t = base_terms->front();
        if (t.coefficient == Complex(0.0, 0.0) && n < 0) {
            return std::nullopt;
        }
        return TermSum{Term{std::pow(t.coefficient, n), 0, t.signed_factor && (n % 2 != 0), t.rate * static_cast<double>(n)}};
    }
    if (n < 0) {
        return std::nullopt;
    }

    TermSum result{Term{Complex(1.0, 0.0)}};
    for (int i = 0; i < n; ++i) {
        auto next = multiply(result, *base_terms);
        if (!next) {
            return std::nullopt;
        }
        result = std::move(*next);
    }
    return result;
}

std::optional<TermSum> TermExpander::call(Function function, const ExprPtr& argument) const
{
    auto terms = expand(argument);
    if (!terms) {
        return std::nullopt;
    }

    switch (function) {
        case Function::Exp:
            return exp_of(*terms);
        case Function::Sin:
        case Function::Cos: {
            auto linear = as_linear(*terms);
            if (!linear || !is_real(linear->first) || !is_real(linear->second)) {
                return std::nullopt;
            }
            const Complex i(0.0, 1.0);
            const double offset = linear->first.real();
            const double slope = linear->second.real();
            const Complex up = std::exp(i * offset);
            const Complex down = std::exp(-i * offset);
            if (function == Function::Sin) {
                return simplify(TermSum{Term{up / (2.0 * i), 0, false, i * slope},
                                        Term{-down / (2.0 * i), 0, false, -i * slope}});
            }
            return simplify(TermSum{Term{up / 2.0, 0, false, i * slope},
                                    Term{down / 2.0, 0, false, -i * slope}});
        }
        case Function::Abs:
        case Function::Sign: {
            if (terms->size() != 1) {
                return std::nullopt;
            }
            const Term& t = terms->front();
            if (t.rate != Complex(0.0, 0.0) || !is_real(t.coefficient) || t.coefficient.real() == 0.0) {
                return std::nullopt;
            }
            const double c = t.coefficient.real();
            const bool odd = ((t.power + (t.signed_factor ? 1u : 0u)) % 2u) == 1u;
            if (function == Function::Abs) {
                // |c x^k sign^s| == |c| x^k sign^k
                return TermSum{Term{Complex(std::abs(c), 0.0), t.power, t.power % 2u == 1u}};
            }
            return TermSum{Term{Complex(c > 0.0 ? 1.0 : -1.0, 0.0), 0, odd}};
        }
        default:
            return std::nullopt;
    }
}

} // namespace symbolic
