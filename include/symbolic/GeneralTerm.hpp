/**
 * @file GeneralTerm.hpp
 * @brief Derivation of the general Fourier coefficients an(n) and bn(n) as expressions in n.
 *
 * Three shapes of terms have a formula:
 * - polynomial terms c x^k sign(x)^s, integrated by parts into sums of
 *   (P (-1)^n + Q) / n^m;
 * - real exponentials c e^{ax}, giving (-1)^n sinh(aL) / (a^2 + (n pi / L)^2) forms;
 * - sinusoids whose frequency is a harmonic m of the period, giving `(A if n == m else 0)`.
 *
 * A sum containing any other term has no formula.
 */
#ifndef GENERAL_TERM_HPP
#define GENERAL_TERM_HPP

#include <optional>
#include "TermExpansion.hpp"
#include "../expression/ExpressionNode.hpp"

namespace symbolic {

/**
 * @brief Coefficient formulas in the variable `n`, already divided by the half-period.
 */
struct GeneralTermFormulas {
    expression::ExprPtr an;
    expression::ExprPtr bn;
};

/**
 * @brief Derives an(n) and bn(n) for f given as a term sum, on [-L, L].
 * @param terms Expanded function.
 * @param half_period L.
 * @return The formulas, or std::nullopt if some term has no closed general form.
 */
std::optional<GeneralTermFormulas> derive_general_terms(const TermSum& terms, double half_period);

} // namespace symbolic

#endif // GENERAL_TERM_HPP
