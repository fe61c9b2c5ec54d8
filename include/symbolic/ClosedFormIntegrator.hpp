/**
 * @file ClosedFormIntegrator.hpp
 * @brief Exact integration of exponential-polynomial term sums against Fourier weights.
 *
 * For a term \f$c\,x^k\,\mathrm{sign}(x)^s\,e^{\alpha x}\f$ the antiderivative is
 * \f[ G(x) = e^{\alpha x} \sum_{j=0}^{k} (-1)^j \frac{k!}{(k-j)!} \frac{x^{k-j}}{\alpha^{j+1}} \f]
 * when \f$|\alpha| \max(|a|,|b|) \ge k + 1\f$. Below that the series
 * \f$\sum_m \alpha^m x^{k+m+1} / (m!\,(k+m+1))\f$ is used instead, which also covers \f$\alpha = 0\f$.
 * Terms carrying sign(x) are split at the origin.
 * The weights cos(wx) and sin(wx) are folded into the rates before integrating.
 */
#ifndef CLOSED_FORM_INTEGRATOR_HPP
#define CLOSED_FORM_INTEGRATOR_HPP

#include <optional>
#include <utility>
#include "TermExpansion.hpp"
#include "../traits/FSEA_traits.hpp"

namespace symbolic {

class ClosedFormIntegrator {
public:
    explicit ClosedFormIntegrator(TermSum terms) : terms_(std::move(terms)) {}

    /**
     * @brief Expands the tree and builds an integrator for it.
     * @return std::nullopt if the expression is not closed-form integrable.
     */
    static std::optional<ClosedFormIntegrator> from_expression(const expression::ExprPtr& node,
                                                               TermExpander::Config config = {});

    /**
     * @brief Integral of f(x) * weight(omega * x) over [lower, upper].
     *
     * @param lower Lower limit.
     * @param upper Upper limit.
     * @param weight Constant (1), Cosine (cos(omega x)) or Sine (sin(omega x)).
     * @param omega Angular frequency of the weight.
     * @return The real value, or std::nullopt if the result is not finite.
     */
    std::optional<double> integrate(double lower, double upper,
                                    traits::CoefficientKind weight = traits::CoefficientKind::Constant,
                                    double omega = 0.0) const;

    const TermSum& terms() const noexcept { return terms_; }

private:
    TermSum terms_;
};

/**
 * @brief Weighted term sum f(x)*cos(omega x) or f(x)*sin(omega x) (f itself for Constant).
 */
TermSum apply_weight(const TermSum& terms, traits::CoefficientKind weight, double omega);

} // namespace symbolic

#endif // CLOSED_FORM_INTEGRATOR_HPP
