/**
 * @file ClosedFormIntegrator.cpp
 * @brief Antiderivatives of x^k e^{ax} and their evaluation over an interval.
 */
#include "symbolic/ClosedFormIntegrator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace symbolic {

namespace {

constexpr unsigned kMaxSeriesTerms = 200;

// Taylor antiderivative of x^k e^{ax}: sum_m a^m x^{k+m+1} / (m! (k+m+1)).
Complex series_antiderivative(unsigned k, const Complex& alpha, double x)
{
    const double z = std::abs(alpha) * std::abs(x);
    Complex sum(0.0, 0.0);
    Complex power = Complex(std::pow(x, static_cast<double>(k + 1)), 0.0); // a^m x^{k+m+1} / m!
    for (unsigned m = 0; m < kMaxSeriesTerms; ++m) {
        const Complex term = power / static_cast<double>(k + m + 1);
        sum += term;
        if (static_cast<double>(m) > z && std::abs(term) <= std::numeric_limits<double>::epsilon() * std::abs(sum)) {
            break;
        }
        power *= alpha * x / static_cast<double>(m + 1);
    }
    return sum;
}

// Closed form e^{ax} sum_j (-1)^j k!/(k-j)! x^{k-j} / a^{j+1}, stable once |a| x >= k + 1.
Complex exponential_antiderivative(unsigned k, const Complex& alpha, double x)
{
    Complex sum(0.0, 0.0);
    double falling = 1.0;          // k! / (k-j)!
    Complex alpha_power = alpha;   // alpha^(j+1)
    for (unsigned j = 0; j <= k; ++j) {
        const double sign = (j % 2u == 0u) ? 1.0 : -1.0;
        sum += sign * falling * std::pow(x, static_cast<double>(k - j)) / alpha_power;
        falling *= static_cast<double>(k - j);
        alpha_power *= alpha;
    }
    return std::exp(alpha * x) * sum;
}

// The branch depends on the interval scale only, so every evaluation of one term agrees.
Complex antiderivative(const Term& term, double x, double scale)
{
    if (std::abs(term.rate) * scale < static_cast<double>(term.power + 1)) {
        return series_antiderivative(term.power, term.rate, x);
    }
    return exponential_antiderivative(term.power, term.rate, x);
}

Complex integrate_term(const Term& term, double lower, double upper)
{
    const double scale = std::max(std::abs(lower), std::abs(upper));
    auto G = [&](double x) { return antiderivative(term, x, scale); };

    if (!term.signed_factor) {
        return term.coefficient * (G(upper) - G(lower));
    }
    if (lower >= 0.0) {
        return term.coefficient * (G(upper) - G(lower));
    }
    if (upper <= 0.0) {
        return -term.coefficient * (G(upper) - G(lower));
    }
    // sign(x) flips at the origin: int_0^b - int_a^0
    return term.coefficient * (G(upper) - 2.0 * G(0.0) + G(lower));
}

} // namespace

TermSum apply_weight(const TermSum& terms, traits::CoefficientKind weight, double omega)
{
    if (weight == traits::CoefficientKind::Constant) {
        return terms;
    }

    const Complex i(0.0, 1.0);
    // cos(wx) = (e^{iwx} + e^{-iwx})/2,  sin(wx) = (e^{iwx} - e^{-iwx})/(2i)
    const Complex up_factor = weight == traits::CoefficientKind::Cosine ? Complex(0.5, 0.0) : 1.0 / (2.0 * i);
    const Complex down_factor = weight == traits::CoefficientKind::Cosine ? Complex(0.5, 0.0) : -1.0 / (2.0 * i);

    TermSum weighted;
    weighted.reserve(2 * terms.size());
    for (const Term& term : terms) {
        weighted.push_back(Term{term.coefficient * up_factor, term.power, term.signed_factor, term.rate + i * omega});
        weighted.push_back(Term{term.coefficient * down_factor, term.power, term.signed_factor, term.rate - i * omega});
    }
    return weighted;
}

std::optional<ClosedFormIntegrator> ClosedFormIntegrator::from_expression(const expression::ExprPtr& node,
                                                                          TermExpander::Config config)
{
    auto terms = TermExpander(config).expand(node);
    if (!terms) {
        return std::nullopt;
    }
    return ClosedFormIntegrator(std::move(*terms));
}

std::optional<double> ClosedFormIntegrator::integrate(double lower, double upper,
                                                      traits::CoefficientKind weight, double omega) const
{
    Complex total(0.0, 0.0);
    for (const Term& term : apply_weight(terms_, weight, omega)) {
        total += integrate_term(term, lower, upper);
    }
    const double value = total.real();
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace symbolic
