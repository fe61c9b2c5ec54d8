/**
 * @file QuadratureRule.hpp
 * @brief Provides generic quadrature (numerical integration) adapters over finite intervals.
 *
 * This header defines three quadrature classes:
 * - quadrature::TrapezoidalQuadrature: composite trapezoidal rule on a uniform Eigen grid.
 * - quadrature::BoostTanhSinhQuadrature: Adapter for Boost.Math's tanh_sinh quadrature.
 * - quadrature::GSLQuadrature: Adapter for GSL's adaptive Gauss-Kronrod routine (QAG) with workspace management.
 *
 * Features:
 * - Type-generic (templated on floating-point type R).
 * - Error control via absolute and relative tolerances for the adaptive backends.
 * - Exception-safe resource management for GSL workspaces.
 * - Exceptions raised by the integrand are reported as std::runtime_error, also across the GSL C boundary.
 *
 * Usage Example:
 * @code
 * #include "QuadratureRule.hpp"
 *
 * quadrature::TrapezoidalQuadrature<double> trapz(2000);
 * double area = trapz.integrate([](double x) { return x * x; }, -1.0, 1.0);
 *
 * quadrature::GSLQuadrature<double> gsl_quad;
 * double gsl_result = gsl_quad.integrate([](double x) { return std::sin(x); }, 0.0, M_PI);
 * @endcode
 */
#ifndef QUADRATURE_RULE_HPP
#define QUADRATURE_RULE_HPP

#include <exception>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <cmath>
#include <stdexcept>
#include <string>
#include <boost/math/quadrature/tanh_sinh.hpp>
#include <gsl/gsl_integration.h>
#include <gsl/gsl_errno.h>
#include "../traits/FSEA_traits.hpp"
#include "../utils/Utils.hpp"

namespace quadrature {

/**
 * @brief Composite trapezoidal rule over `samples` equally spaced points (ends included).
 */
template<typename R = traits::DataType::SeriesField>
class TrapezoidalQuadrature {
    Eigen::Index samples_;

public:
    using Array = Eigen::Array<R, Eigen::Dynamic, 1>;

    /**
     * @param samples Number of grid points, at least 2.
     */
    explicit TrapezoidalQuadrature(Eigen::Index samples = 2000)
        : samples_(samples)
    {
        if (samples_ < 2) {
            throw std::invalid_argument("TrapezoidalQuadrature needs at least 2 samples.");
        }
    }

    Eigen::Index samples() const noexcept { return samples_; }

    /**
     * @brief Trapezoidal sum of already sampled values on a uniform grid over [lower, upper].
     */
    static R integrate_samples(const Array& values, R lower_bound, R upper_bound)
    {
        const Eigen::Index n = values.size();
        if (n < 2) {
            return R(0);
        }
        const R step = (upper_bound - lower_bound) / static_cast<R>(n - 1);
        return step * (values.sum() - R(0.5) * (values(0) + values(n - 1)));
    }

    R integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const
    {
        const Array grid = Utils::linspace<R>(lower_bound, upper_bound, samples_);
        Array values(samples_);
        for (Eigen::Index i = 0; i < samples_; ++i) {
            values(i) = integrand(grid(i));
        }
        return integrate_samples(values, lower_bound, upper_bound);
    }
};

template<typename R = traits::DataType::SeriesField>
class BoostTanhSinhQuadrature {
    R target_relative_error_;
    std::size_t max_refinements_;

public:
    /**
     * @brief Constructor for Boost tanh_sinh adapter.
     * @param relative_error Target relative error for the integration.
     * @param max_refinements Maximum number of refinement levels.
     */
    explicit BoostTanhSinhQuadrature(R relative_error = std::sqrt(std::numeric_limits<R>::epsilon()),
                                     std::size_t max_refinements = 15)
        : target_relative_error_(relative_error), max_refinements_(max_refinements) {}

    /**
     * @brief Integrates using Boost.Math's tanh_sinh quadrature.
     * @param integrand The function to integrate.
     * @param lower_bound Lower integration limit.
     * @param upper_bound Upper integration limit.
     * @return The approximate value of the definite integral.
     */
    R integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const
    {
        if (lower_bound >= upper_bound) {
            return static_cast<R>(0.0);
        }

        boost::math::quadrature::tanh_sinh<R> integrator(max_refinements_);

        R result = 0;
        R error_estimate = 0;
        R L1_norm = 0;

        try {
            result = integrator.integrate(integrand, lower_bound, upper_bound, target_relative_error_, &error_estimate, &L1_norm);
        } catch (const std::exception& e) {
            throw std::runtime_error(std::string("Boost quadrature failed: ") + e.what());
        }

        if (!std::isfinite(result)) {
            throw std::runtime_error("Boost quadrature produced a non-finite result");
        }
        return result;
    }
};


// --- C-style wrapper for GSL ---
template<typename R = traits::DataType::SeriesField>
struct GSLIntegrationWrapper {
    /// Integrand plus the first exception it raised; GSL cannot unwind C++ exceptions.
    struct Params {
        const std::function<R(R)>* integrand;
        std::exception_ptr error;
    };

    static double gsl_func_adapter(double x, void* params)
    {
        auto* p = static_cast<Params*>(params);
        if (p->error) {
            return 0.0;
        }
        try {
            return static_cast<double>((*p->integrand)(static_cast<R>(x)));
        } catch (const std::exception&) {
            p->error = std::current_exception();
            return 0.0;
        }
    }
};


template<typename R = traits::DataType::SeriesField>
class GSLQuadrature {
private:
    size_t workspace_size_;
    R target_absolute_error_;
    R target_relative_error_;
    int key_;

    // RAII wrapper for gsl_integration_workspace
    using GSLWorkspacePtr = std::unique_ptr<gsl_integration_workspace, decltype(&gsl_integration_workspace_free)>;

    GSLWorkspacePtr create_workspace() const {
        gsl_integration_workspace* ws = gsl_integration_workspace_alloc(workspace_size_);
        if (!ws) {
            throw std::runtime_error("Failed to allocate GSL workspace");
        }
        return GSLWorkspacePtr(ws, gsl_integration_workspace_free);
    }

    // GSL aborts on errors unless its handler is switched off; statuses are checked instead.
    static void disable_abort_handler() {
        static std::once_flag flag;
        std::call_once(flag, [] { gsl_set_error_handler_off(); });
    }

public:
    /**
     * @brief Constructor for GSL adaptive quadrature adapter.
     * @param absolute_error Target absolute error.
     * @param relative_error Target relative error.
     * @param workspace_limit Max number of subintervals for the workspace.
     * @param key Gauss-Kronrod rule (GSL_INTEG_GAUSS15 ... GSL_INTEG_GAUSS61).
     */
    explicit GSLQuadrature(
        R absolute_error = 1e-9,
        R relative_error = 1e-9,
        size_t workspace_limit = 1000,
        int key = GSL_INTEG_GAUSS61)
        :
        workspace_size_(workspace_limit),
        target_absolute_error_(absolute_error),
        target_relative_error_(relative_error),
        key_(key)
    {
        disable_abort_handler();
    }

    /**
     * @brief Integrates over a finite interval using GSL's QAG routine.
     * @param integrand The function to integrate.
     * @param lower_bound Lower integration limit.
     * @param upper_bound Upper integration limit.
     * @return The approximate value of the definite integral.
     * @throws std::runtime_error on a GSL failure status or if the integrand threw.
     */
    R integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const
    {
        const double lb = static_cast<double>(lower_bound);
        const double ub = static_cast<double>(upper_bound);

        if (lb >= ub) return static_cast<R>(0.0);

        typename GSLIntegrationWrapper<R>::Params params{&integrand, nullptr};
        gsl_function F;
        F.function = &GSLIntegrationWrapper<R>::gsl_func_adapter;
        F.params = &params;

        double result = 0.0;
        double error_estimate = 0.0;

        // Allocate workspace per call for thread safety
        GSLWorkspacePtr workspace = create_workspace();

        const int status = gsl_integration_qag(&F, lb, ub,
                                               static_cast<double>(target_absolute_error_),
                                               static_cast<double>(target_relative_error_),
                                               workspace_size_, key_,
                                               workspace.get(),
                                               &result, &error_estimate);

        if (params.error) {
            try {
                std::rethrow_exception(params.error);
            } catch (const std::exception& e) {
                throw std::runtime_error(std::string("GSL integrand failed: ") + e.what());
            }
        }
        if (status != GSL_SUCCESS) {
            throw std::runtime_error(std::string("GSL integration failed: ") + gsl_strerror(status));
        }

        return static_cast<R>(result);
    }
};

} // namespace quadrature
#endif // QUADRATURE_RULE_HPP
