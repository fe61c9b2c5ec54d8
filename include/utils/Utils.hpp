/*!
 * @file Utils.hpp
 * @brief Utility functions for uniform grids, sample statistics and tolerance checks.
 *
 * This header provides a collection of small templates shared by the series and analysis modules:
 * - `linspace` building an inclusive uniform grid as an Eigen array.
 * - `mean` and `population_stddev` over Eigen arrays.
 * - `allclose` comparing two arrays with a relative and an absolute tolerance.
 * - `strip_whitespace` used to normalize expression text.
 * - `Overloaded`, the visitor helper for `std::visit`.
 *
 * Dependencies:
 * - Eigen for array operations.
 * - FSEA_traits.hpp for type definitions.
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <cctype>
#include <cmath>
#include <string>
#include <string_view>
#include "../traits/FSEA_traits.hpp"

namespace Utils
{

/**
 * @brief Visitor built from a set of lambdas, one per alternative of a variant.
 */
template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

/**
 * @brief Alias for a dynamic Eigen column array of scalar type R.
 */
template <typename R = traits::DataType::SeriesField>
using Array = Eigen::Array<R, Eigen::Dynamic, 1>;

/**
 * @brief Builds `count` equally spaced points from `lower` to `upper`, both included.
 *
 * @tparam R Scalar type.
 * @param lower First point.
 * @param upper Last point.
 * @param count Number of points.
 * @return Eigen array with the grid.
 */
template <typename R = traits::DataType::SeriesField>
inline Array<R> linspace(R lower, R upper, Eigen::Index count)
{
    return Array<R>::LinSpaced(count, lower, upper);
}

/**
 * @brief Arithmetic mean of an array; 0 for an empty array.
 */
template <typename R = traits::DataType::SeriesField>
inline R mean(const Array<R>& values)
{
    return values.size() == 0 ? R(0) : values.mean();
}

/**
 * @brief Population standard deviation (divides by the sample count).
 */
template <typename R = traits::DataType::SeriesField>
inline R population_stddev(const Array<R>& values)
{
    if (values.size() == 0) {
        return R(0);
    }
    const R centre = values.mean();
    return std::sqrt((values - centre).square().mean());
}

/**
 * @brief Element-wise closeness test `|a - b| <= atol + rtol * |b|` over whole arrays.
 *
 * Non-finite entries never compare close.
 *
 * @param lhs First array.
 * @param rhs Reference array (the relative tolerance scales with it).
 * @param rtol Relative tolerance.
 * @param atol Absolute tolerance.
 * @return true if every pair is close.
 */
template <typename R = traits::DataType::SeriesField>
inline bool allclose(const Array<R>& lhs, const Array<R>& rhs, R rtol, R atol)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    if (!lhs.allFinite() || !rhs.allFinite()) {
        return false;
    }
    return ((lhs - rhs).abs() <= atol + rtol * rhs.abs()).all();
}

/**
 * @brief Removes every whitespace character from the text.
 */
inline std::string strip_whitespace(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result.push_back(c);
        }
    }
    return result;
}

} // namespace Utils

#endif // UTILS_HPP
