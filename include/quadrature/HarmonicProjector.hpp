/**
 * @file HarmonicProjector.hpp
 * @brief Projection of a function onto the Fourier basis 1, cos(n pi x / L), sin(n pi x / L).
 *
 * Both projectors compute
 *   (1/L) * Integral(-L, L, f(x) * w_n(x) dx)
 * for the weight w_n selected by `traits::CoefficientKind`:
 * - HarmonicProjector integrates the callable f with any rule held by a QuadratureRuleHolder.
 * - SampledHarmonicProjector works on values of f sampled once on a uniform grid and applies
 *   the trapezoidal rule, so every harmonic reuses the same samples.
 *
 * Dependencies:
 * - QuadratureRuleHolder.hpp: For the quadrature rule implementation.
 */
#ifndef HARMONIC_PROJECTOR_HPP
#define HARMONIC_PROJECTOR_HPP

#include <cmath>
#include <functional>
#include <stdexcept>
#include <utility>
#include <boost/math/constants/constants.hpp>
#include "QuadratureRuleHolder.hpp"
#include "../traits/FSEA_traits.hpp"

namespace quadrature {

/**
 * @brief Angular frequency n pi / L of harmonic n.
 */
template <typename R>
inline R harmonic_frequency(unsigned n, R half_period)
{
    return static_cast<R>(n) * boost::math::constants::pi<R>() / half_period;
}

/**
 * @brief The basis weight w_n(x) for a coefficient kind.
 */
template <typename R>
inline std::function<R(R)> harmonic_weight(traits::CoefficientKind kind, unsigned n, R half_period)
{
    const R omega = harmonic_frequency(n, half_period);
    switch (kind) {
        case traits::CoefficientKind::Cosine:
            return [omega](R x) { return std::cos(omega * x); };
        case traits::CoefficientKind::Sine:
            return [omega](R x) { return std::sin(omega * x); };
        case traits::CoefficientKind::Constant:
        default:
            return [](R) { return R(1); };
    }
}

template <typename R>
class HarmonicProjector {
private:
    std::function<R(R)> function_;
    R half_period_;
    quadrature::QuadratureRuleHolder<R> integrator_;

public:
    /**
     * @param integrator An initialized QuadratureRuleHolder (copied).
     * @param function The function to project.
     * @param half_period L, the integration runs over [-L, L].
     */
    HarmonicProjector(const quadrature::QuadratureRuleHolder<R>& integrator,
                      std::function<R(R)> function,
                      R half_period)
        : function_(std::move(function)),
          half_period_(half_period),
          integrator_(integrator)
    {
        if (!integrator_.is_initialized()) {
            throw std::invalid_argument("HarmonicProjector requires an initialized QuadratureRuleHolder.");
        }
        if (!function_) {
            throw std::invalid_argument("HarmonicProjector requires a valid function.");
        }
    }

    /**
     * @brief (1/L) * Integral(-L, L, f(x) * w_n(x) dx).
     * @throws std::runtime_error if the integrator fails.
     */
    R project(traits::CoefficientKind kind, unsigned n) const
    {
        auto weight = harmonic_weight<R>(kind, n, half_period_);
        auto integrand = [this, &weight](R x) -> R { return function_(x) * weight(x); };
        return integrator_.integrate(integrand, -half_period_, half_period_) / half_period_;
    }

    const quadrature::QuadratureRuleHolder<R>& get_integrator() const { return integrator_; }
};

template <typename R>
class SampledHarmonicProjector {
public:
    using Array = Eigen::Array<R, Eigen::Dynamic, 1>;

private:
    Array grid_;
    Array values_;
    R half_period_;

public:
    /**
     * @param grid Uniform grid over [-L, L], ends included.
     * @param values f sampled on the grid.
     * @param half_period L.
     */
    SampledHarmonicProjector(Array grid, Array values, R half_period)
        : grid_(std::move(grid)), values_(std::move(values)), half_period_(half_period)
    {
        if (grid_.size() != values_.size() || grid_.size() < 2) {
            throw std::invalid_argument("SampledHarmonicProjector requires matching grids of at least 2 samples.");
        }
    }

    R project(traits::CoefficientKind kind, unsigned n) const
    {
        const R omega = harmonic_frequency(n, half_period_);
        Array integrand;
        switch (kind) {
            case traits::CoefficientKind::Cosine:
                integrand = values_ * (omega * grid_).cos();
                break;
            case traits::CoefficientKind::Sine:
                integrand = values_ * (omega * grid_).sin();
                break;
            case traits::CoefficientKind::Constant:
            default:
                integrand = values_;
                break;
        }
        return TrapezoidalQuadrature<R>::integrate_samples(integrand, -half_period_, half_period_) / half_period_;
    }

    const Array& grid() const noexcept { return grid_; }
    const Array& values() const noexcept { return values_; }
};

} // namespace quadrature
#endif // HARMONIC_PROJECTOR_HPP
