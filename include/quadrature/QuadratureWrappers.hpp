/**
 * @file QuadratureWrappers.hpp
 * @brief Provides wrapper classes for the different quadrature (numerical integration) backends.
 *
 * This header defines wrapper classes for the trapezoidal, Boost and GSL quadrature rules, allowing
 * them to be used through a common interface. The wrappers own the underlying rule objects
 * and provide methods for integration and cloning.
 *
 * Dependencies:
 * - QuadratureRule.hpp: Concrete quadrature rules.
 * - QuadratureRuleAbstract.hpp: Abstract interface for quadrature rules.
 */
#ifndef QUADRATURE_WRAPPERS_HPP
#define QUADRATURE_WRAPPERS_HPP

#include <cmath>
#include <functional>
#include <memory>
#include <string_view>
#include "QuadratureRule.hpp"
#include "QuadratureRuleAbstract.hpp"

namespace quadrature {

/**
 * @class TrapezoidalQuadratureWrapper
 * @tparam R The floating-point type used for integration (e.g., double).
 * @brief Wrapper exposing the composite trapezoidal rule through `IQuadratureRule`.
 */
template<typename R = traits::DataType::SeriesField>
class TrapezoidalQuadratureWrapper final : public IQuadratureRule<R> {
    TrapezoidalQuadrature<R> rule_;
public:
    explicit TrapezoidalQuadratureWrapper(const TrapezoidalQuadrature<R>& rule)
        : rule_(rule) {}

    explicit TrapezoidalQuadratureWrapper(Eigen::Index samples = 2000)
        : rule_(samples) {}

    R integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const override {
        return rule_.integrate(integrand, lower_bound, upper_bound);
    }

    std::unique_ptr<IQuadratureRule<R>> clone() const override {
        return std::make_unique<TrapezoidalQuadratureWrapper<R>>(rule_);
    }

    std::string_view name() const override { return "trapezoidal"; }
};

/**
 * @class BoostQuadratureWrapper
 * @tparam R The floating-point type used for integration (e.g., double).
 * @brief Wrapper for the Boost Tanh-Sinh quadrature rule.
 *
 * This class wraps a `BoostTanhSinhQuadrature` instance and exposes it through the `IQuadratureRule` interface.
 * It supports construction from an existing rule or by specifying the desired relative error.
 */
template<typename R = traits::DataType::SeriesField>
class BoostQuadratureWrapper final : public IQuadratureRule<R> {
    BoostTanhSinhQuadrature<R> rule_;
public:
    explicit BoostQuadratureWrapper(const BoostTanhSinhQuadrature<R>& rule)
        : rule_(rule) {}

    explicit BoostQuadratureWrapper(R relative_error = std::sqrt(std::numeric_limits<R>::epsilon()))
        : rule_(relative_error) {}

    R integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const override {
        return rule_.integrate(integrand, lower_bound, upper_bound);
    }

    std::unique_ptr<IQuadratureRule<R>> clone() const override {
        return std::make_unique<BoostQuadratureWrapper<R>>(rule_);
    }

    std::string_view name() const override { return "tanh_sinh"; }
};

/**
 * @class GSLQuadratureWrapper
 * @tparam R The floating-point type used for integration (e.g., double).
 * @brief Wrapper for the GSL adaptive quadrature rule.
 *
 * The wrapped rule allocates its workspace per call, so copies are cheap and independent.
 */
template<typename R = traits::DataType::SeriesField>
class GSLQuadratureWrapper final : public IQuadratureRule<R> {
     GSLQuadrature<R> rule_;
 public:
     explicit GSLQuadratureWrapper(const GSLQuadrature<R>& rule)
         : rule_(rule) {}

    explicit GSLQuadratureWrapper(
        R absolute_error = 1e-9,
        R relative_error = 1e-9,
        size_t workspace_limit = 1000)
        : rule_(absolute_error, relative_error, workspace_limit) {}

     R integrate(
         const std::function<R(R)>& integrand,
         R lower_bound,
         R upper_bound) const override {
         return rule_.integrate(integrand, lower_bound, upper_bound);
     }

     std::unique_ptr<IQuadratureRule<R>> clone() const override {
          return std::make_unique<GSLQuadratureWrapper<R>>(rule_);
     }

     std::string_view name() const override { return "gsl_qag"; }
};

} // namespace quadrature
#endif // QUADRATURE_WRAPPERS_HPP
