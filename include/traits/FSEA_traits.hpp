/*!
 * @file FSEA_traits.hpp
 * @brief Defines core type traits, enumerations, and data structures for the FSEA library.
 *
 * This header provides the type definitions and enumerations used throughout FSEA
 * (Fourier Series Expansion & Analysis): Eigen based storage types for samples and
 * coefficient vectors, the scalar field of the series, and the enums describing
 * symmetry classes, quadrature backends, complexity levels and recommendations.
 */

#ifndef FSEA_TRAITS_HPP
#define FSEA_TRAITS_HPP

#include <Eigen/Dense>
#include <complex>
#include <string_view>
#include <vector>

namespace traits
/*!
 * @namespace traits
 * @brief Contains all type traits, type aliases, and enumerations used across the FSEA library.
 */
{

/*!
 * @struct DataType
 * @brief Central container of type aliases for the sample arrays and coefficient vectors of FSEA.
 *
 * These types are based on Eigen and are dynamically sized, so that the same aliases serve
 * a 2000-sample grid and a 300-term coefficient vector alike.
 */
struct DataType
{
public:
    using SeriesField = double;  ///< Scalar field of samples, coefficients and periods (default: double).

    using StoringVector = Eigen::Matrix<SeriesField, Eigen::Dynamic, 1>; ///< Dynamic-size column vector type (coefficients).

    using StoringArray  = Eigen::Array<SeriesField, Eigen::Dynamic, 1>; ///< Dynamic-size array for element-wise operations (samples).

    using ComplexArray  = Eigen::Array<std::complex<SeriesField>, Eigen::Dynamic, 1>; ///< Array of complex numbers (spectra).
};

/*!
 * @enum QuadratureMethod
 * @brief Numerical integration backends used when closed-form integration is unavailable.
 */
enum class QuadratureMethod
{
    Trapezoidal, ///< Composite trapezoidal rule over a uniform grid.
    TanhSinh,    ///< Boost.Math tanh-sinh quadrature.
    QAG          ///< GSL adaptive Gauss-Kronrod quadrature on a finite interval.
};

/*!
 * @enum CoefficientKind
 * @brief Identifies which weight a coefficient integral carries.
 */
enum class CoefficientKind
{
    Constant, ///< a0: weight 1.
    Cosine,   ///< an: weight cos(n pi x / L).
    Sine      ///< bn: weight sin(n pi x / L).
};

/*!
 * @enum SymmetryClass
 * @brief Symmetry of a function over its fundamental interval.
 */
enum class SymmetryClass
{
    Even,     ///< f(-x) = f(x): only cosine terms.
    Odd,      ///< f(-x) = -f(x): only sine terms.
    HalfWave, ///< f(x + L) = -f(x): only odd harmonics.
    None      ///< No exploitable symmetry.
};

/*!
 * @enum ComputationMethod
 * @brief How the coefficients of a CoefficientSet were obtained.
 */
enum class ComputationMethod
{
    KnownSeries, ///< Looked up in the closed-form catalog.
    Integrated   ///< Closed-form or numeric integration per coefficient.
};

/*!
 * @enum ComplexityLevel
 * @brief Difficulty classes reported by the complexity analysis.
 */
enum class ComplexityLevel
{
    Simple,
    Medium,
    High,
    Extreme
};

/*!
 * @enum AnimationSpeed
 * @brief Playback speed suggested for the epicycle animation.
 */
enum class AnimationSpeed
{
    Slow,
    Normal,
    Fast,
    VeryFast
};

/*!
 * @enum WindowType
 * @brief Spectral window suggested against Gibbs-type overshoot.
 */
enum class WindowType
{
    Rectangular,
    Hann,
    Hamming
};

/*!
 * @enum Difficulty
 * @brief Difficulty tag of a preset in the function library.
 */
enum class Difficulty
{
    Easy,
    Medium,
    Advanced
};

inline std::string_view to_string(SymmetryClass symmetry)
{
    switch (symmetry) {
        case SymmetryClass::Even:     return "even";
        case SymmetryClass::Odd:      return "odd";
        case SymmetryClass::HalfWave: return "half_wave";
        case SymmetryClass::None:     return "none";
    }
    return "none";
}

inline std::string_view to_string(ComplexityLevel level)
{
    switch (level) {
        case ComplexityLevel::Simple:  return "simple";
        case ComplexityLevel::Medium:  return "medium";
        case ComplexityLevel::High:    return "high";
        case ComplexityLevel::Extreme: return "extreme";
    }
    return "extreme";
}

inline std::string_view to_string(AnimationSpeed speed)
{
    switch (speed) {
        case AnimationSpeed::Slow:     return "slow";
        case AnimationSpeed::Normal:   return "normal";
        case AnimationSpeed::Fast:     return "fast";
        case AnimationSpeed::VeryFast: return "very_fast";
    }
    return "normal";
}

inline std::string_view to_string(WindowType window)
{
    switch (window) {
        case WindowType::Rectangular: return "rectangular";
        case WindowType::Hann:        return "hann";
        case WindowType::Hamming:     return "hamming";
    }
    return "rectangular";
}

inline std::string_view to_string(Difficulty difficulty)
{
    switch (difficulty) {
        case Difficulty::Easy:     return "easy";
        case Difficulty::Medium:   return "medium";
        case Difficulty::Advanced: return "advanced";
    }
    return "medium";
}

} // namespace traits

#endif // FSEA_TRAITS_HPP
