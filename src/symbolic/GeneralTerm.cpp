/**
 * @file GeneralTerm.cpp
 * @brief Tabular integration by parts and harmonic bookkeeping for coefficient formulas.
 */
#include "symbolic/GeneralTerm.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <vector>

#include <boost/math/constants/constants.hpp>

namespace symbolic {

using namespace expression;

namespace {

constexpr double kTolerance = 1e-12;
constexpr double kHarmonicTolerance = 1e-9;

bool negligible_imag(const Complex& value)
{
    return std::abs(value.imag()) <= kTolerance * std::max(1.0, std::abs(value));
}

bool negligible_real(const Complex& value)
{
    return std::abs(value.real()) <= kTolerance * std::max(1.0, std::abs(value));
}

// P (-1)^n / n^m + Q / n^m
struct PowerSeriesPart {
    double alternating = 0.0;
    double constant = 0.0;
};

struct RealExponential {
    double coefficient;
    double rate;
};

// Contributions to one coefficient family (an or bn).
struct FormulaParts {
    std::map<unsigned, PowerSeriesPart> powers;
    std::vector<RealExponential> exponentials;
    std::map<long, double> harmonics;
};

ExprPtr n_variable()
{
    return make_variable("n");
}

ExprPtr alternating_sign()
{
    return make_binary(BinaryOp::Pow, make_unary(UnaryOp::Minus, make_number(1.0)), n_variable());
}

ExprPtr n_power(unsigned m)
{
    if (m == 1) {
        return n_variable();
    }
    return make_binary(BinaryOp::Pow, n_variable(), make_number(static_cast<double>(m)));
}

// x^k sign^s against cos/sin over [-L, L], written as sum_m (P_m (-1)^n + Q_m) / n^m.
void add_polynomial_term(double c, unsigned k, bool signed_factor, double L,
                         FormulaParts& an, FormulaParts& bn)
{
    const double pi = boost::math::constants::pi<double>();
    const bool even = ((k + (signed_factor ? 1u : 0u)) % 2u) == 0u;
    FormulaParts& target = even ? an : bn;
    const double scale = 2.0 * c / L;

    // int_0^L x^k e^{i w x} dx with w = n pi / L, and 1/(i w)^m = (-i)^m (L/pi)^m / n^m
    const Complex minus_i(0.0, -1.0);
    Complex factor = minus_i * (L / pi);  // (-i)^m (L/pi)^m
    double falling = 1.0;                 // k!/(k-j)!
    for (unsigned j = 0; j <= k; ++j) {
        const unsigned m = j + 1;
        const double sign = (j % 2u == 0u) ? 1.0 : -1.0;
        const Complex A = sign * falling * std::pow(L, static_cast<double>(k - j)) * factor;
        PowerSeriesPart& part = target.powers[m];
        part.alternating += scale * (even ? A.real() : A.imag());
        if (j == k) {
            // lower limit: only the x^0 term survives at x = 0
            const Complex B = -sign * falling * factor;
            part.constant += scale * (even ? B.real() : B.imag());
        }
        falling *= static_cast<double>(k - j);
        factor *= minus_i * (L / pi);
    }
}

ExprPtr sum_of(std::vector<ExprPtr> parts)
{
    if (parts.empty()) {
        return make_number(0.0);
    }
    ExprPtr sum = parts.front();
    for (std::size_t i = 1; i < parts.size(); ++i) {
        sum = make_binary(BinaryOp::Add, sum, parts[i]);
    }
    return sum;
}

ExprPtr build_formula(const FormulaParts& parts, double L, bool sine)
{
    const double pi = boost::math::constants::pi<double>();
    std::vector<ExprPtr> pieces;

    for (const auto& [m, part] : parts.powers) {
        if (part.alternating != 0.0) {
            pieces.push_back(make_binary(BinaryOp::Div,
                make_binary(BinaryOp::Mul, make_number(part.alternating), alternating_sign()), n_power(m)));
        }
        if (part.constant != 0.0) {
            pieces.push_back(make_binary(BinaryOp::Div, make_number(part.constant), n_power(m)));
        }
    }

    for (const RealExponential& e : parts.exponentials) {
        const double w1 = pi / L;
        ExprPtr denominator = make_binary(BinaryOp::Add, make_number(e.rate * e.rate),
                                          make_binary(BinaryOp::Mul, make_number(w1 * w1), n_power(2)));
        const double s = std::sinh(e.rate * L);
        ExprPtr numerator;
        if (sine) {
            numerator = make_binary(BinaryOp::Mul,
                make_binary(BinaryOp::Mul, make_number(-e.coefficient * 2.0 * w1 * s / L), alternating_sign()),
                n_variable());
        } else {
            numerator = make_binary(BinaryOp::Mul, make_number(e.coefficient * 2.0 * e.rate * s / L),
                                    alternating_sign());
        }
        pieces.push_back(make_binary(BinaryOp::Div, numerator, denominator));
    }

    for (const auto& [m, value] : parts.harmonics) {
        if (value == 0.0) {
            continue;
        }
        ExprPtr condition = make_compare({CompareOp::Equal}, {n_variable(), make_number(static_cast<double>(m))});
        pieces.push_back(make_conditional(condition, make_number(value), make_number(0.0)));
    }

    return sum_of(std::move(pieces));
}

} // namespace

std::optional<GeneralTermFormulas> derive_general_terms(const TermSum& terms, double half_period)
{
    const double L = half_period;
    const double pi = boost::math::constants::pi<double>();
    FormulaParts an;
    FormulaParts bn;

    for (const Term& term : terms) {
        const bool no_rate = term.rate == Complex(0.0, 0.0);

        if (no_rate) {
            if (!negligible_imag(term.coefficient)) {
                return std::nullopt;
            }
            add_polynomial_term(term.coefficient.real(), term.power, term.signed_factor, L, an, bn);
            continue;
        }

        if (term.power != 0 || term.signed_factor) {
            return std::nullopt;
        }

        if (negligible_imag(term.rate)) {
            if (!negligible_imag(term.coefficient)) {
                return std::nullopt;
            }
            an.exponentials.push_back({term.coefficient.real(), term.rate.real()});
            bn.exponentials.push_back({term.coefficient.real(), term.rate.real()});
            continue;
        }

        if (negligible_real(term.rate)) {
            const double harmonic = term.rate.imag() * L / pi;
            const double rounded = std::round(harmonic);
            if (std::abs(harmonic - rounded) > kHarmonicTolerance || rounded == 0.0) {
                return std::nullopt;
            }
            const long m = static_cast<long>(rounded);
            const double direction = m > 0 ? 1.0 : -1.0;
            an.harmonics[std::labs(m)] += term.coefficient.real();
            bn.harmonics[std::labs(m)] -= direction * term.coefficient.imag();
            continue;
        }

        return std::nullopt;
    }

    return GeneralTermFormulas{build_formula(an, L, false), build_formula(bn, L, true)};
}

} // namespace symbolic
