/**
 * @file CoefficientEngine.hpp
 * @brief Computation of the Fourier coefficients a0, an, bn of a function over [-L, L].
 *
 * The engine runs, in order:
 * 1. The known-series shortcut: a catalog hit gives every coefficient from its general-term
 *    formulas, with no integration.
 * 2. Symmetry detection, which selects the coefficients that need to be integrated
 *    (even: a0 and an; odd: bn; half-wave: a0 and odd harmonics; none: everything).
 * 3. One integral per selected coefficient: closed form when the representation is symbolic and
 *    the expansion succeeds, otherwise the configured quadrature, with the trapezoidal rule on
 *    a fixed grid as last resort.
 * 4. Parallel dispatch of the per-coefficient integrals over a bounded number of std::async
 *    workers once the term count exceeds a threshold. Every job writes to a pre-allocated slot,
 *    so serial and parallel runs give identical results.
 * 5. General-term formulas an(n), bn(n) for symbolic inputs and small term counts.
 *
 * Usage Example:
 * @code
 * series::CoefficientEngine engine;
 * expression::FunctionExpression f("x**2");
 * auto coefficients = engine.compute_all(f, series::PeriodSpec<>(2 * M_PI), 10);
 * @endcode
 */
#ifndef COEFFICIENT_ENGINE_HPP
#define COEFFICIENT_ENGINE_HPP

#include <cstddef>
#include <optional>
#include <vector>
#include "CoefficientSet.hpp"
#include "KnownSeriesCatalog.hpp"
#include "PeriodSpec.hpp"
#include "SymmetryDetector.hpp"
#include "../expression/FunctionExpression.hpp"
#include "../quadrature/HarmonicProjector.hpp"
#include "../symbolic/ClosedFormIntegrator.hpp"
#include "../symbolic/TermExpansion.hpp"
#include "../traits/FSEA_traits.hpp"

namespace series {

class CoefficientEngine {
public:
    using R = traits::DataType::SeriesField;

    struct Config {
        std::size_t parallel_threshold = 20;  ///< Run in parallel when n_terms exceeds this.
        std::size_t worker_count = 4;         ///< Upper bound on concurrent workers.
        std::size_t formula_term_limit = 50;  ///< Derive formulas only up to this many terms.
        traits::QuadratureMethod quadrature = traits::QuadratureMethod::Trapezoidal;
        Eigen::Index trapezoid_samples = 2000;
        bool use_known_series = true;
        SymmetryDetector<R>::Config symmetry{};
        symbolic::TermExpander::Config expansion{};
    };

    CoefficientEngine();

    explicit CoefficientEngine(Config config);

    /**
     * @brief Computes a0 and the first n_terms harmonics of f.
     *
     * @param function The function.
     * @param period Period of the expansion.
     * @param n_terms Number of harmonics N.
     * @return CoefficientSet with an and bn of length N.
     * @throws Utils::ParameterDomainError if n_terms < 1.
     */
    CoefficientSet<R> compute_all(const expression::FunctionExpression& function,
                                  const PeriodSpec<R>& period,
                                  long long n_terms) const;

    const Config& config() const noexcept { return config_; }

    KnownSeriesCatalog& catalog() noexcept { return catalog_; }
    const KnownSeriesCatalog& catalog() const noexcept { return catalog_; }

private:
    /// One coefficient integral; `slot` indexes the result buffer.
    struct Job {
        traits::CoefficientKind kind;
        unsigned n;
        std::size_t slot;
    };

    /// Integration state shared read-only by every job of one computation.
    struct Plan {
        const expression::FunctionExpression& function;
        R half_period;
        std::optional<symbolic::ClosedFormIntegrator> closed_form;
        std::optional<quadrature::HarmonicProjector<R>> projector;
        quadrature::SampledHarmonicProjector<R> sampled;
    };

    std::optional<CoefficientSet<R>> from_catalog(const expression::FunctionExpression& function,
                                                  const PeriodSpec<R>& period,
                                                  Eigen::Index n_terms) const;

    Plan make_plan(const expression::FunctionExpression& function, R half_period) const;

    static std::vector<Job> make_jobs(traits::SymmetryClass symmetry, Eigen::Index n_terms);

    std::vector<R> run_jobs(const Plan& plan, const std::vector<Job>& jobs, Eigen::Index n_terms) const;

    R coefficient(const Plan& plan, traits::CoefficientKind kind, unsigned n) const;

    R numeric_coefficient(const Plan& plan, traits::CoefficientKind kind, unsigned n) const;

    Config config_;
    KnownSeriesCatalog catalog_;
};

} // namespace series

#endif // COEFFICIENT_ENGINE_HPP
