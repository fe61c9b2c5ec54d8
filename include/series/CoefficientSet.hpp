/**
 * @file CoefficientSet.hpp
 * @brief Result of a coefficient computation and its text/table renderings.
 *
 * A CoefficientSet holds a0 and the vectors an, bn (index i is harmonic n = i + 1),
 * optional general-term formulas in n, the period it was computed for, the detected
 * symmetry and the method used. Consumers treat it as read-only.
 */
#ifndef COEFFICIENT_SET_HPP
#define COEFFICIENT_SET_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include "PeriodSpec.hpp"
#include "../expression/ExpressionNode.hpp"
#include "../traits/FSEA_traits.hpp"

namespace series {

template <typename R = traits::DataType::SeriesField>
struct CoefficientSet {
    using Vector = Eigen::Matrix<R, Eigen::Dynamic, 1>;

    CoefficientSet(PeriodSpec<R> period_spec, Eigen::Index n_terms)
        : period(period_spec),
          an(Vector::Zero(n_terms)),
          bn(Vector::Zero(n_terms)) {}

    PeriodSpec<R> period;
    R a0 = R(0);
    Vector an;
    Vector bn;
    std::optional<expression::ExprPtr> an_formula;
    std::optional<expression::ExprPtr> bn_formula;
    traits::SymmetryClass symmetry = traits::SymmetryClass::None;
    traits::ComputationMethod method = traits::ComputationMethod::Integrated;

    Eigen::Index size() const noexcept { return an.size(); }

    R half_period() const noexcept { return period.half_period(); }

    bool has_formulas() const noexcept { return an_formula.has_value() && bn_formula.has_value(); }
};

/**
 * @brief Truncated series as text: `a0/2 + an*cos(nπx/L) + bn*sin(nπx/L) ...`.
 *
 * Coefficients of magnitude 1e-10 or less are skipped; values use four decimals and L two.
 *
 * @param coefficients Coefficient set.
 * @param n_terms Number of harmonics to include (clamped to the set size).
 */
template <typename R>
std::string series_expression(const CoefficientSet<R>& coefficients, Eigen::Index n_terms)
{
    constexpr R kThreshold = R(1e-10);
    const Eigen::Index count = std::min(n_terms, coefficients.size());

    std::ostringstream out;
    out << std::fixed << std::setprecision(4) << coefficients.a0 / R(2);

    std::ostringstream half_period;
    half_period << std::fixed << std::setprecision(2) << coefficients.half_period();

    for (Eigen::Index i = 0; i < count; ++i) {
        const Eigen::Index n = i + 1;
        if (std::abs(coefficients.an(i)) > kThreshold) {
            out << " + " << coefficients.an(i) << "*cos(" << n << "πx/" << half_period.str() << ")";
        }
        if (std::abs(coefficients.bn(i)) > kThreshold) {
            out << " + " << coefficients.bn(i) << "*sin(" << n << "πx/" << half_period.str() << ")";
        }
    }
    return out.str();
}

template <typename R>
std::string series_expression(const CoefficientSet<R>& coefficients)
{
    return series_expression(coefficients, coefficients.size());
}

/**
 * @brief Table with columns (n, an, bn, amplitude); row 0 is (0, a0, 0, |a0|).
 */
template <typename R>
Eigen::Matrix<R, Eigen::Dynamic, 4, Eigen::RowMajor> coefficient_table(const CoefficientSet<R>& coefficients)
{
    const Eigen::Index n_terms = coefficients.size();
    Eigen::Matrix<R, Eigen::Dynamic, 4, Eigen::RowMajor> table(n_terms + 1, 4);
    table.row(0) << R(0), coefficients.a0, R(0), std::abs(coefficients.a0);
    for (Eigen::Index i = 0; i < n_terms; ++i) {
        const R an = coefficients.an(i);
        const R bn = coefficients.bn(i);
        table.row(i + 1) << static_cast<R>(i + 1), an, bn, std::sqrt(an * an + bn * bn);
    }
    return table;
}

} // namespace series

#endif // COEFFICIENT_SET_HPP
