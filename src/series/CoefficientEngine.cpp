/**
 * @file CoefficientEngine.cpp
 * @brief Known-series shortcut, symmetry-driven job planning and parallel coefficient integration.
 */
#include "series/CoefficientEngine.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "symbolic/GeneralTerm.hpp"
#include "utils/ParameterValidator.hpp"
#include "utils/Utils.hpp"

namespace series {

using traits::CoefficientKind;
using traits::SymmetryClass;

CoefficientEngine::CoefficientEngine() : config_(), catalog_()
{
}

CoefficientEngine::CoefficientEngine(Config config) : config_(config), catalog_()
{
}

CoefficientSet<CoefficientEngine::R> CoefficientEngine::compute_all(const expression::FunctionExpression& function,
                                                                    const PeriodSpec<R>& period,
                                                                    long long n_terms) const
{
    const auto N = static_cast<Eigen::Index>(
        Utils::ParameterValidator<Utils::TermCount>(Utils::TermCount(n_terms)).getValue<Utils::TermCount>());

    if (config_.use_known_series) {
        if (auto known = from_catalog(function, period, N)) {
            return std::move(*known);
        }
    }

    const R L = period.half_period();
    CoefficientSet<R> result(period, N);
    result.symmetry = SymmetryDetector<R>(config_.symmetry).classify(function, L);
    result.method = traits::ComputationMethod::Integrated;

    const Plan plan = make_plan(function, L);
    const std::vector<Job> jobs = make_jobs(result.symmetry, N);
    const std::vector<R> values = run_jobs(plan, jobs, N);

    for (const Job& job : jobs) {
        const R value = values[job.slot];
        switch (job.kind) {
            case CoefficientKind::Constant:
                result.a0 = value;
                break;
            case CoefficientKind::Cosine:
                result.an(job.n - 1) = value;
                break;
            case CoefficientKind::Sine:
                result.bn(job.n - 1) = value;
                break;
        }
    }

    if (plan.closed_form && static_cast<std::size_t>(N) <= config_.formula_term_limit) {
        if (auto formulas = symbolic::derive_general_terms(plan.closed_form->terms(), L)) {
            result.an_formula = formulas->an;
            result.bn_formula = formulas->bn;
        }
    }
    return result;
}

std::optional<CoefficientSet<CoefficientEngine::R>> CoefficientEngine::from_catalog(
    const expression::FunctionExpression& function,
    const PeriodSpec<R>& period,
    Eigen::Index n_terms) const
{
    auto entry = catalog_.lookup(function.normalized_text(), period.half_period());
    if (!entry) {
        return std::nullopt;
    }

    CoefficientSet<R> result(period, n_terms);
    try {
        result.an = KnownSeriesCatalog::evaluate_formula(entry->an, n_terms);
        result.bn = KnownSeriesCatalog::evaluate_formula(entry->bn, n_terms);
    } catch (const expression::EvaluationError& e) {
        std::cerr << "Warning: known series '" << entry->key << "' could not be evaluated ("
                  << e.what() << "), integrating instead\n";
        return std::nullopt;
    }
    result.a0 = entry->a0;
    result.symmetry = entry->symmetry;
    result.method = traits::ComputationMethod::KnownSeries;
    if (static_cast<std::size_t>(n_terms) <= config_.formula_term_limit) {
        result.an_formula = entry->an;
        result.bn_formula = entry->bn;
    }
    return result;
}

CoefficientEngine::Plan CoefficientEngine::make_plan(const expression::FunctionExpression& function, R half_period) const
{
    auto closed_form = std::visit(
        Utils::Overloaded{
            [this](const expression::SymbolicForm& symbolic) {
                return symbolic::ClosedFormIntegrator::from_expression(symbolic.ast, config_.expansion);
            },
            [](const expression::NumericForm&) {
                return std::optional<symbolic::ClosedFormIntegrator>();
            }},
        function.representation());

    std::optional<quadrature::HarmonicProjector<R>> projector;
    if (config_.quadrature != traits::QuadratureMethod::Trapezoidal) {
        projector.emplace(quadrature::QuadratureRuleHolder<R>::make(config_.quadrature, config_.trapezoid_samples),
                          [&function](R x) { return static_cast<R>(function.evaluate(static_cast<double>(x))); },
                          half_period);
    }

    Utils::Array<R> grid = Utils::linspace<R>(-half_period, half_period, config_.trapezoid_samples);
    Utils::Array<R> values = function.evaluate_vector(grid);

    return Plan{function,
                half_period,
                std::move(closed_form),
                std::move(projector),
                quadrature::SampledHarmonicProjector<R>(std::move(grid), std::move(values), half_period)};
}

std::vector<CoefficientEngine::Job> CoefficientEngine::make_jobs(SymmetryClass symmetry, Eigen::Index n_terms)
{
    const bool needs_constant = symmetry != SymmetryClass::Odd;
    const bool needs_cosine = symmetry != SymmetryClass::Odd;
    const bool needs_sine = symmetry != SymmetryClass::Even;
    const bool odd_only = symmetry == SymmetryClass::HalfWave;

    std::vector<Job> jobs;
    jobs.reserve(static_cast<std::size_t>(2 * n_terms + 1));
    if (needs_constant) {
        jobs.push_back({CoefficientKind::Constant, 0u, jobs.size()});
    }
    for (Eigen::Index i = 0; i < n_terms; ++i) {
        const auto n = static_cast<unsigned>(i + 1);
        if (odd_only && n % 2 == 0) {
            continue;
        }
        if (needs_cosine) {
            jobs.push_back({CoefficientKind::Cosine, n, jobs.size()});
        }
        if (needs_sine) {
            jobs.push_back({CoefficientKind::Sine, n, jobs.size()});
        }
    }
    return jobs;
}

std::vector<CoefficientEngine::R> CoefficientEngine::run_jobs(const Plan& plan,
                                                              const std::vector<Job>& jobs,
                                                              Eigen::Index n_terms) const
{
    std::vector<R> values(jobs.size(), R(0));

    auto run_range = [this, &plan, &jobs, &values](std::size_t begin, std::size_t end) {
        for (std::size_t j = begin; j < end; ++j) {
            values[jobs[j].slot] = coefficient(plan, jobs[j].kind, jobs[j].n);
        }
    };

    const std::size_t workers = std::min(std::max<std::size_t>(config_.worker_count, 1), jobs.size());
    if (static_cast<std::size_t>(n_terms) <= config_.parallel_threshold || workers <= 1) {
        run_range(0, jobs.size());
        return values;
    }

    const std::size_t chunk = (jobs.size() + workers - 1) / workers;
    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (std::size_t begin = 0; begin < jobs.size(); begin += chunk) {
        futures.push_back(std::async(std::launch::async, run_range, begin, std::min(begin + chunk, jobs.size())));
    }
    for (auto& future : futures) {
        future.get();
    }
    return values;
}

CoefficientEngine::R CoefficientEngine::coefficient(const Plan& plan, CoefficientKind kind, unsigned n) const
{
    if (plan.closed_form) {
        const R omega = quadrature::harmonic_frequency<R>(n, plan.half_period);
        if (auto integral = plan.closed_form->integrate(-plan.half_period, plan.half_period, kind, omega)) {
            return static_cast<R>(*integral) / plan.half_period;
        }
    }
    return numeric_coefficient(plan, kind, n);
}

CoefficientEngine::R CoefficientEngine::numeric_coefficient(const Plan& plan, CoefficientKind kind, unsigned n) const
{
    if (plan.projector) {
        try {
            const R value = plan.projector->project(kind, n);
            if (std::isfinite(value)) {
                return value;
            }
            std::cerr << "Warning: " << plan.projector->get_integrator().name() << " returned a non-finite value for '"
                      << plan.function.text() << "' (n = " << n << "), using the trapezoidal rule\n";
        } catch (const std::runtime_error& e) {
            std::cerr << "Warning: " << plan.projector->get_integrator().name() << " failed for '"
                      << plan.function.text() << "' (n = " << n << "): " << e.what()
                      << ", using the trapezoidal rule\n";
        }
    }
    return plan.sampled.project(kind, n);
}

} // namespace series
