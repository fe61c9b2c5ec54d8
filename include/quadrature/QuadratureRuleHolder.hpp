/**
 * @file QuadratureRuleHolder.hpp
 * @brief Defines the QuadratureRuleHolder class, a type-erased holder for various quadrature rule implementations.
 *
 * The holder is a runtime-polymorphic wrapper for the trapezoidal, Boost tanh-sinh and GSL QAG rules.
 * It enables selection of a rule from `traits::QuadratureMethod`, supports deep copies through
 * `clone()`, and performs integration via a uniform method.
 */
#ifndef QUADRATURE_RULE_HOLDER_HPP
#define QUADRATURE_RULE_HOLDER_HPP

#include <functional>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>
#include "QuadratureWrappers.hpp"
#include "../traits/FSEA_traits.hpp"

namespace quadrature {
using QuadratureType = traits::QuadratureMethod;

/**
 * @brief A holder class for different numerical quadrature rules.
 *
 * @tparam R The floating-point type used for integration (e.g., float, double).
 */
template<typename R>
class QuadratureRuleHolder {
private:
    std::unique_ptr<IQuadratureRule<R>> p_rule_;

public:
    /**
     * @brief Constructor selecting rule based on enum. Uses default parameters for rules.
     *
     * @param type The enum value specifying which quadrature rule to use.
     * @throws std::invalid_argument If an unsupported quadrature type is specified.
     */
    explicit QuadratureRuleHolder(QuadratureType type) {
        switch (type) {
            case QuadratureType::Trapezoidal:
                p_rule_ = std::make_unique<TrapezoidalQuadratureWrapper<R>>();
                break;
            case QuadratureType::TanhSinh:
                p_rule_ = std::make_unique<BoostQuadratureWrapper<R>>();
                break;
            case QuadratureType::QAG:
                p_rule_ = std::make_unique<GSLQuadratureWrapper<R>>();
                break;
            default:
                throw std::invalid_argument("Unsupported QuadratureType specified.");
        }
    }

    /**
     * @brief Takes ownership of an already configured rule.
     * @throws std::invalid_argument If the pointer is null.
     */
    explicit QuadratureRuleHolder(std::unique_ptr<IQuadratureRule<R>> rule)
        : p_rule_(std::move(rule)) {
        if (!p_rule_) {
            throw std::invalid_argument("QuadratureRuleHolder requires a non-null rule.");
        }
    }

    /**
     * @brief Builds the rule for `type`, with `trapezoid_samples` grid points when it is the trapezoidal rule.
     */
    static QuadratureRuleHolder make(QuadratureType type, Eigen::Index trapezoid_samples) {
        if (type == QuadratureType::Trapezoidal) {
            return QuadratureRuleHolder(std::make_unique<TrapezoidalQuadratureWrapper<R>>(trapezoid_samples));
        }
        return QuadratureRuleHolder(type);
    }

    QuadratureRuleHolder(const QuadratureRuleHolder& other)
        : p_rule_(other.p_rule_ ? other.p_rule_->clone() : nullptr) {}

    QuadratureRuleHolder& operator=(const QuadratureRuleHolder& other) {
        if (this != &other) {
             p_rule_ = other.p_rule_ ? other.p_rule_->clone() : nullptr;
        }
        return *this;
    }

    QuadratureRuleHolder(QuadratureRuleHolder&& other) noexcept = default;

    QuadratureRuleHolder& operator=(QuadratureRuleHolder&& other) noexcept = default;

    /**
     * @brief Default constructor. Leaves the internal rule uninitialized.
     */
    QuadratureRuleHolder() = default;

    /**
     * @brief Integrates the given function over the specified interval using the held quadrature rule.
     *
     * @throws std::runtime_error If no quadrature rule has been initialized, or the rule fails.
     */
    R integrate(
        const std::function<R(R)>& integrand,
        R lower_bound,
        R upper_bound) const
    {
        if (!p_rule_) {
            throw std::runtime_error("QuadratureRuleHolder is not initialized with a rule.");
        }
        return p_rule_->integrate(integrand, lower_bound, upper_bound);
    }

    bool is_initialized() const {
        return p_rule_ != nullptr;
    }

    std::string_view name() const {
        return p_rule_ ? p_rule_->name() : std::string_view("uninitialized");
    }
};

} // namespace quadrature
#endif // QUADRATURE_RULE_HOLDER_HPP
