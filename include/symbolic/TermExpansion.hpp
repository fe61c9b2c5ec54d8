/**
 * @file TermExpansion.hpp
 * @brief Expansion of an expression tree into a finite sum of exponential-polynomial terms.
 *
 * Every supported expression is rewritten as
 * \f[ f(x) = \sum_j c_j \, x^{k_j} \, \mathrm{sign}(x)^{s_j} \, e^{\alpha_j x} \f]
 * with complex \f$c_j, \alpha_j\f$, integer \f$k_j \ge 0\f$ and \f$s_j \in \{0, 1\}\f$.
 * Sines and cosines of linear arguments become pairs of complex exponentials, so products
 * of trigonometric, exponential and polynomial factors stay inside the class.
 *
 * Anything outside the class (division by a non-constant, fractional powers of x,
 * logarithms of x, conditionals, ...) makes `expand` return std::nullopt.
 */
#ifndef TERM_EXPANSION_HPP
#define TERM_EXPANSION_HPP

#include <complex>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "../expression/ExpressionNode.hpp"

namespace symbolic {

using Complex = std::complex<double>;

/**
 * @brief One term c * x^power * sign(x)^signed_factor * exp(rate * x).
 */
struct Term {
    Complex coefficient;
    unsigned power = 0;
    bool signed_factor = false;
    Complex rate{0.0, 0.0};

    bool is_constant() const noexcept { return power == 0 && !signed_factor && rate == Complex(0.0, 0.0); }
};

using TermSum = std::vector<Term>;

class TermExpander {
public:
    struct Config {
        std::size_t max_terms = 512; ///< Abort when a sum grows beyond this many terms.
        unsigned max_power = 12;     ///< Largest polynomial degree and integer exponent accepted.
    };

    TermExpander();

    explicit TermExpander(Config config, std::string variable = "x");

    /**
     * @brief Expands the tree.
     * @return The merged term sum, or std::nullopt if the expression is outside the class.
     */
    std::optional<TermSum> expand(const expression::ExprPtr& node) const;

private:
    Config config_;
    std::string variable_;

    std::optional<TermSum> multiply(const TermSum& lhs, const TermSum& rhs) const;
    std::optional<TermSum> call(expression::Function function, const expression::ExprPtr& argument) const;
    std::optional<TermSum> power(const expression::ExprPtr& base, const expression::ExprPtr& exponent) const;
    bool within_limits(const TermSum& sum) const;
};

/**
 * @brief Merges terms with equal shape and drops zero coefficients.
 */
TermSum simplify(TermSum terms);

/**
 * @brief The value of a sum that is a single constant (or empty), if it is one.
 */
std::optional<Complex> as_constant(const TermSum& terms);

} // namespace symbolic

#endif // TERM_EXPANSION_HPP
