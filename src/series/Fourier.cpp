/**
 * @file Fourier.cpp
 * @brief Text-based entry points.
 */
#include "series/Fourier.hpp"

#include <string>

#include "expression/FunctionExpression.hpp"

namespace series {

CoefficientSet<Real> compute_all(std::string_view expression_text, Real period, long long n_terms)
{
    return compute_all(expression_text, period, n_terms, CoefficientEngine::Config());
}

CoefficientSet<Real> compute_all(std::string_view expression_text, Real period, long long n_terms,
                                 const CoefficientEngine::Config& config)
{
    const PeriodSpec<Real> period_spec(period);
    const expression::FunctionExpression function{std::string(expression_text)};
    return CoefficientEngine(config).compute_all(function, period_spec, n_terms);
}

Array evaluate_series(const CoefficientSet<Real>& coefficients, const Array& xs, Eigen::Index n_terms)
{
    return SeriesEvaluator<Real>::evaluate(coefficients, xs, n_terms);
}

ErrorReport<Real> compute_error(const CoefficientSet<Real>& coefficients, std::string_view expression_text,
                                const Array& xs)
{
    const expression::FunctionExpression function{std::string(expression_text)};
    return SeriesEvaluator<Real>::compute_error(coefficients, function, xs);
}

analysis::ComplexityAnalysis<Real> analyze_complexity(std::string_view expression_text, Real period)
{
    const PeriodSpec<Real> period_spec(period);
    const expression::FunctionExpression function{std::string(expression_text)};
    return analysis::ComplexityAnalyzer<Real>().analyze(function, period_spec.half_period());
}

analysis::Recommendation recommend(const analysis::ComplexityAnalysis<Real>& complexity)
{
    return analysis::ParameterRecommender<Real>().recommend(complexity);
}

} // namespace series
