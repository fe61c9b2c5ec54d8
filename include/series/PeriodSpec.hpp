/**
 * @file PeriodSpec.hpp
 * @brief Validated period of the function being expanded.
 */
#ifndef PERIOD_SPEC_HPP
#define PERIOD_SPEC_HPP

#include <boost/math/constants/constants.hpp>
#include "../traits/FSEA_traits.hpp"
#include "../utils/ParameterValidator.hpp"

namespace series {

/**
 * @brief Period T and half-period L = T/2 of the expansion interval [-L, L].
 *
 * @tparam R Scalar type.
 */
template <typename R = traits::DataType::SeriesField>
class PeriodSpec {
private:
    R period_;

public:
    /**
     * @throws Utils::ParameterDomainError if the period is not a finite positive number.
     */
    explicit PeriodSpec(R period)
        : period_(Utils::ParameterValidator<Utils::PeriodLength<R>>(Utils::PeriodLength<R>(period))
                      .template getValue<Utils::PeriodLength<R>>())
    {
    }

    R period() const noexcept { return period_; }

    R half_period() const noexcept { return period_ / R(2); }

    /**
     * @brief Angular frequency of the fundamental harmonic, pi / L.
     */
    R fundamental_frequency() const noexcept { return boost::math::constants::pi<R>() / half_period(); }
};

} // namespace series

#endif // PERIOD_SPEC_HPP
