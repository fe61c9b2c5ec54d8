/**
 * @file Fourier.hpp
 * @brief Entry points taking expression text: coefficients, partial sums, errors and recommendations.
 *
 * These free functions are what the demo executable and the Python module call. Each one builds
 * the FunctionExpression and PeriodSpec it needs, so only expression::ParseError and
 * Utils::ParameterDomainError can escape them.
 *
 * Usage Example:
 * @code
 * auto coefficients = series::compute_all("x**2", 2 * M_PI, 10);
 * auto values = series::evaluate_series(coefficients, Utils::linspace(-M_PI, M_PI, 500), 10);
 * auto analysis = series::analyze_complexity("sign(x)", 2 * M_PI);
 * auto recommendation = series::recommend(analysis);
 * @endcode
 */
#ifndef FOURIER_HPP
#define FOURIER_HPP

#include <string_view>
#include "CoefficientEngine.hpp"
#include "CoefficientSet.hpp"
#include "SeriesEvaluator.hpp"
#include "../analysis/ComplexityAnalyzer.hpp"
#include "../analysis/ParameterRecommender.hpp"
#include "../traits/FSEA_traits.hpp"

namespace series {

using Real = traits::DataType::SeriesField;
using Array = traits::DataType::StoringArray;

/**
 * @brief Coefficients of the expression over one period with the default engine.
 * @throws expression::ParseError for a malformed expression.
 * @throws Utils::ParameterDomainError for period <= 0 or n_terms < 1.
 */
CoefficientSet<Real> compute_all(std::string_view expression_text, Real period, long long n_terms);

CoefficientSet<Real> compute_all(std::string_view expression_text, Real period, long long n_terms,
                                 const CoefficientEngine::Config& config);

Array evaluate_series(const CoefficientSet<Real>& coefficients, const Array& xs, Eigen::Index n_terms);

ErrorReport<Real> compute_error(const CoefficientSet<Real>& coefficients, std::string_view expression_text,
                                const Array& xs);

/**
 * @brief Complexity analysis with the default analyzer; never throws for evaluation failures.
 */
analysis::ComplexityAnalysis<Real> analyze_complexity(std::string_view expression_text, Real period);

analysis::Recommendation recommend(const analysis::ComplexityAnalysis<Real>& complexity);

} // namespace series

#endif // FOURIER_HPP
