/**
 * @file SymmetryDetector.hpp
 * @brief Numerical classification of even, odd and half-wave symmetry.
 *
 * The function is sampled at test points t in (0, 0.95 L] and compared against its reflection:
 * - Even:      f(-t) == f(t)
 * - Odd:       f(-t) == -f(t)
 * - Half-wave: f(t + L) == -f(t) for t in [-L/2, 0]
 *
 * Comparisons use Utils::allclose with the tolerances of the Config. Even and odd take priority
 * over half-wave. A failing evaluation while sampling yields SymmetryClass::None.
 */
#ifndef SYMMETRY_DETECTOR_HPP
#define SYMMETRY_DETECTOR_HPP

#include <algorithm>
#include <iostream>
#include "../expression/FunctionExpression.hpp"
#include "../traits/FSEA_traits.hpp"
#include "../utils/Utils.hpp"

namespace series {

template <typename R = traits::DataType::SeriesField>
class SymmetryDetector {
public:
    struct Config {
        Eigen::Index sample_count = 25;           ///< Test points for even/odd.
        R lower_bound = R(0.1);                   ///< First test point (clamped for small L).
        R upper_fraction = R(0.95);               ///< Last test point as a fraction of L.
        Eigen::Index half_wave_sample_count = 15; ///< Test points for half-wave.
        R rtol = R(1e-4);
        R atol = R(1e-6);
    };

    SymmetryDetector() : config_() {}

    explicit SymmetryDetector(Config config) : config_(config) {}

    /**
     * @brief Classifies f over [-L, L].
     * @param function The function.
     * @param half_period L.
     */
    traits::SymmetryClass classify(const expression::FunctionExpression& function, R half_period) const
    {
        using Array = Utils::Array<R>;

        const R upper = config_.upper_fraction * half_period;
        const R lower = std::min(config_.lower_bound, upper / static_cast<R>(config_.sample_count));
        const Array t = Utils::linspace<R>(lower, upper, config_.sample_count);

        try {
            const Array positive = sample(function, t);
            const Array negative = sample(function, -t);

            if (Utils::allclose<R>(negative, positive, config_.rtol, config_.atol)) {
                return traits::SymmetryClass::Even;
            }
            if (Utils::allclose<R>(negative, Array(-positive), config_.rtol, config_.atol)) {
                return traits::SymmetryClass::Odd;
            }

            const Array s = Utils::linspace<R>(-half_period / R(2), R(0), config_.half_wave_sample_count);
            const Array shifted = sample(function, Array(s + half_period));
            const Array base = sample(function, s);
            if (Utils::allclose<R>(shifted, Array(-base), config_.rtol, config_.atol)) {
                return traits::SymmetryClass::HalfWave;
            }
        } catch (const expression::EvaluationError& e) {
            std::cerr << "Warning: symmetry detection for '" << function.text()
                      << "' skipped: " << e.what() << "\n";
        }
        return traits::SymmetryClass::None;
    }

    const Config& config() const noexcept { return config_; }

private:
    static Utils::Array<R> sample(const expression::FunctionExpression& function, const Utils::Array<R>& xs)
    {
        Utils::Array<R> ys(xs.size());
        for (Eigen::Index i = 0; i < xs.size(); ++i) {
            ys(i) = static_cast<R>(function.evaluate(static_cast<double>(xs(i))));
        }
        return ys;
    }

    Config config_;
};

} // namespace series

#endif // SYMMETRY_DETECTOR_HPP
