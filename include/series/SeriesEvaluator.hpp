/**
 * @file SeriesEvaluator.hpp
 * @brief Vectorized evaluation of truncated Fourier series and approximation error metrics.
 *
 * The partial sum
 *   S_K(x) = a0/2 + sum_{k=1}^{K} [ a_k cos(k pi x / L) + b_k sin(k pi x / L) ]
 * is evaluated for all sample points at once: the angles k pi x / L form a K x M outer-product
 * matrix, and the sum over k is a matrix-vector product with the coefficient vectors.
 */
#ifndef SERIES_EVALUATOR_HPP
#define SERIES_EVALUATOR_HPP

#include <algorithm>
#include "CoefficientSet.hpp"
#include "../expression/FunctionExpression.hpp"
#include "../traits/FSEA_traits.hpp"
#include "../utils/Utils.hpp"

namespace series {

/**
 * @brief Pointwise error f(x) - S_N(x) and its aggregates.
 */
template <typename R = traits::DataType::SeriesField>
struct ErrorReport {
    Utils::Array<R> pointwise;
    R mse;
    R mae;
    R max_abs;
};

template <typename R = traits::DataType::SeriesField>
class SeriesEvaluator {
public:
    using Array = Utils::Array<R>;
    using Matrix = Eigen::Matrix<R, Eigen::Dynamic, Eigen::Dynamic>;

    /**
     * @brief Evaluates the partial sum with the first n_terms harmonics.
     *
     * @param coefficients Coefficient set.
     * @param xs Sample points.
     * @param n_terms Harmonics to include; clamped to the set size, 0 gives a0/2 everywhere.
     */
    static Array evaluate(const CoefficientSet<R>& coefficients, const Array& xs, Eigen::Index n_terms)
    {
        const Eigen::Index K = std::clamp<Eigen::Index>(n_terms, 0, coefficients.size());
        Array result = Array::Constant(xs.size(), coefficients.a0 / R(2));
        if (K == 0 || xs.size() == 0) {
            return result;
        }

        const R omega = coefficients.period.fundamental_frequency();
        const auto k = Eigen::Matrix<R, Eigen::Dynamic, 1>::LinSpaced(K, R(1), static_cast<R>(K));
        const Matrix angles = (omega * k) * xs.matrix().transpose();

        result += (coefficients.an.head(K).transpose() * angles.array().cos().matrix()).transpose().array();
        result += (coefficients.bn.head(K).transpose() * angles.array().sin().matrix()).transpose().array();
        return result;
    }

    static Array evaluate(const CoefficientSet<R>& coefficients, const Array& xs)
    {
        return evaluate(coefficients, xs, coefficients.size());
    }

    /**
     * @brief Error of the full series against the function on the given points.
     *
     * Samples where f fails to evaluate count as 0, as in FunctionExpression::evaluate_vector.
     */
    static ErrorReport<R> compute_error(const CoefficientSet<R>& coefficients,
                                        const expression::FunctionExpression& function,
                                        const Array& xs)
    {
        const Array exact = function.evaluate_vector(xs.template cast<double>()).template cast<R>();
        ErrorReport<R> report{exact - evaluate(coefficients, xs), R(0), R(0), R(0)};
        if (report.pointwise.size() > 0) {
            report.mse = report.pointwise.square().mean();
            report.mae = report.pointwise.abs().mean();
            report.max_abs = report.pointwise.abs().maxCoeff();
        }
        return report;
    }
};

} // namespace series

#endif // SERIES_EVALUATOR_HPP
