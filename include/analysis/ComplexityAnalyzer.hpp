/**
 * @file ComplexityAnalyzer.hpp
 * @brief Discontinuity, spectral and smoothness analysis of a sampled function.
 *
 * The function is sampled on a uniform grid over [-L, L] and three measures are extracted:
 * - Discontinuities: forward differences |dy / (dx + eps)| above mean + sigma * stddev,
 *   with flagged points closer than a fraction of the period merged.
 * - High-frequency ratio: share of the DFT power (FFTW) in the upper half of the positive band.
 * - Smoothness: 1 / (1 + stddev(second differences) / scale).
 *
 * Each measure falls into a weighted bucket; the sum of the weights selects the complexity level.
 * A function that cannot be evaluated at any sample is reported as degenerate.
 *
 * Dependencies:
 * - FFTW.hpp: For the power spectrum.
 * - FunctionExpression.hpp: For sampling the function.
 */
#ifndef COMPLEXITY_ANALYZER_HPP
#define COMPLEXITY_ANALYZER_HPP

#include <array>
#include <cmath>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>
#include "../expression/FunctionExpression.hpp"
#include "../traits/FSEA_traits.hpp"
#include "../utils/FFTW.hpp"
#include "../utils/ParameterValidator.hpp"
#include "../utils/Utils.hpp"

namespace analysis {

template <typename R = traits::DataType::SeriesField>
struct ComplexityAnalysis {
    traits::ComplexityLevel level;
    std::optional<std::vector<R>> discontinuity_positions; ///< std::nullopt for a degenerate function.
    R high_frequency_ratio;                                ///< In [0, 1].
    R smoothness;                                          ///< In [0, 1].

    /**
     * @brief Number of discontinuities, or -1 for a degenerate function.
     */
    long discontinuity_count() const noexcept
    {
        return discontinuity_positions ? static_cast<long>(discontinuity_positions->size()) : -1L;
    }

    bool is_degenerate() const noexcept { return !discontinuity_positions.has_value(); }
};

template <typename R = traits::DataType::SeriesField>
class ComplexityAnalyzer {
public:
    using Array = Utils::Array<R>;

    struct Config {
        Eigen::Index samples = 2000;
        R outlier_sigma = R(5);           ///< Jump threshold in standard deviations above the mean.
        R derivative_epsilon = R(1e-10);  ///< Added to dx in the difference quotient.
        R merge_fraction = R(0.01);       ///< Jumps closer than merge_fraction * period are merged.
        R power_floor = R(1e-10);         ///< Below this total power the ratio is 0.
        R smoothness_scale = R(10);

        /// Upper limits of the 0, 1-2 and 3-5 discontinuity buckets; larger counts use the last weight.
        std::array<long, 3> discontinuity_limits{0, 2, 5};
        std::array<int, 4> discontinuity_weights{0, 6, 8, 9};

        /// The ratio is below frequency_limits[i] for weight i.
        std::array<R, 3> frequency_limits{R(0.1), R(0.3), R(0.5)};
        std::array<int, 4> frequency_weights{0, 1, 2, 3};

        /// Smoothness is above smoothness_limits[i] for weight i.
        std::array<R, 3> smoothness_limits{R(0.8), R(0.5), R(0.3)};
        std::array<int, 4> smoothness_weights{0, 1, 2, 3};

        /// Highest score of Simple, Medium and High; anything above is Extreme.
        std::array<int, 3> level_limits{2, 5, 8};
    };

    ComplexityAnalyzer() : config_() {}

    explicit ComplexityAnalyzer(Config config) : config_(config) {}

    /**
     * @brief Analyzes f over [-L, L].
     *
     * Evaluation failures never propagate: failing samples count as 0, and a function failing
     * everywhere yields a degenerate Extreme analysis.
     *
     * @param function The function.
     * @param half_period L.
     * @throws Utils::ParameterDomainError if fewer than 2 samples are configured.
     */
    ComplexityAnalysis<R> analyze(const expression::FunctionExpression& function, R half_period) const
    {
        const Eigen::Index samples = static_cast<Eigen::Index>(
            Utils::ParameterValidator<Utils::SampleCount>(Utils::SampleCount(config_.samples))
                .template getValue<Utils::SampleCount>());

        const Array x = Utils::linspace<R>(-half_period, half_period, samples);
        std::vector<expression::EvaluationDiagnostic> diagnostics;
        const Array y = function.evaluate_vector(x.template cast<double>(), diagnostics).template cast<R>();

        if (diagnostics.size() == static_cast<std::size_t>(samples)) {
            std::cerr << "Warning: '" << function.text() << "' could not be evaluated at any sample, "
                      << "reporting extreme complexity\n";
            return {traits::ComplexityLevel::Extreme, std::nullopt, R(1), R(0)};
        }

        std::vector<R> positions = detect_discontinuities(x, y, R(2) * half_period);
        const R high_frequency = high_frequency_ratio(y);
        const R smooth = smoothness(y);
        const auto level = classify(static_cast<long>(positions.size()), high_frequency, smooth);
        return {level, std::move(positions), high_frequency, smooth};
    }

    /**
     * @brief Positions x_i where |dy/dx| jumps above mean + sigma * stddev, merged within
     * merge_fraction * period.
     */
    std::vector<R> detect_discontinuities(const Array& x, const Array& y, R period) const
    {
        std::vector<R> merged;
        const Eigen::Index n = x.size();
        if (n < 2) {
            return merged;
        }

        const Array dy = y.tail(n - 1) - y.head(n - 1);
        const Array dx = x.tail(n - 1) - x.head(n - 1);
        const Array derivative = (dy / (dx + config_.derivative_epsilon)).abs();
        const R threshold = Utils::mean<R>(derivative) + config_.outlier_sigma * Utils::population_stddev<R>(derivative);

        const R merge_distance = period * config_.merge_fraction;
        for (Eigen::Index i = 0; i < derivative.size(); ++i) {
            if (derivative(i) > threshold) {
                if (merged.empty() || std::abs(x(i) - merged.back()) > merge_distance) {
                    merged.push_back(x(i));
                }
            }
        }
        return merged;
    }

    /**
     * @brief Share of the power in bins [mid/2, mid) relative to [0, mid), mid = len/2.
     */
    R high_frequency_ratio(const Array& y) const
    {
        const Array power = Utils::powerSpectrum<R>(y);
        const Eigen::Index mid = power.size() / 2;
        const R low = power.head(mid / 2).sum();
        const R high = power.segment(mid / 2, mid - mid / 2).sum();
        const R total = low + high;
        if (total < config_.power_floor) {
            return R(0);
        }
        return high / total;
    }

    /**
     * @brief 1 / (1 + stddev(second differences) / scale); 1 for fewer than 3 samples.
     */
    R smoothness(const Array& y) const
    {
        const Eigen::Index n = y.size();
        if (n < 3) {
            return R(1);
        }
        const Array d2y = y.tail(n - 2) - R(2) * y.segment(1, n - 2) + y.head(n - 2);
        return R(1) / (R(1) + Utils::population_stddev<R>(d2y) / config_.smoothness_scale);
    }

    traits::ComplexityLevel classify(long discontinuities, R high_frequency, R smooth) const
    {
        int score = config_.discontinuity_weights[3];
        for (std::size_t i = 0; i < config_.discontinuity_limits.size(); ++i) {
            if (discontinuities <= config_.discontinuity_limits[i]) {
                score = config_.discontinuity_weights[i];
                break;
            }
        }

        int frequency_score = config_.frequency_weights[3];
        for (std::size_t i = 0; i < config_.frequency_limits.size(); ++i) {
            if (high_frequency < config_.frequency_limits[i]) {
                frequency_score = config_.frequency_weights[i];
                break;
            }
        }

        int smoothness_score = config_.smoothness_weights[3];
        for (std::size_t i = 0; i < config_.smoothness_limits.size(); ++i) {
            if (smooth > config_.smoothness_limits[i]) {
                smoothness_score = config_.smoothness_weights[i];
                break;
            }
        }

        score += frequency_score + smoothness_score;
        if (score <= config_.level_limits[0]) {
            return traits::ComplexityLevel::Simple;
        }
        if (score <= config_.level_limits[1]) {
            return traits::ComplexityLevel::Medium;
        }
        if (score <= config_.level_limits[2]) {
            return traits::ComplexityLevel::High;
        }
        return traits::ComplexityLevel::Extreme;
    }

    const Config& config() const noexcept { return config_; }

private:
    Config config_;
};

} // namespace analysis

#endif // COMPLEXITY_ANALYZER_HPP
