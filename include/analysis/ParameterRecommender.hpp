/**
 * @file ParameterRecommender.hpp
 * @brief Maps a ComplexityAnalysis to a suggested term count, animation speed and window.
 *
 * term count = base(level) + per_discontinuity * count + high-frequency bonus, clamped;
 * the animation speed follows from the term count and the window from the discontinuity count.
 */
#ifndef PARAMETER_RECOMMENDER_HPP
#define PARAMETER_RECOMMENDER_HPP

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>
#include <string>
#include "ComplexityAnalyzer.hpp"
#include "../traits/FSEA_traits.hpp"

namespace analysis {

struct Recommendation {
    int term_count;
    traits::AnimationSpeed animation_speed;
    traits::WindowType window;
    std::string rationale;
};

template <typename R = traits::DataType::SeriesField>
class ParameterRecommender {
public:
    struct Config {
        /// Base term count for Simple, Medium, High and Extreme.
        std::array<int, 4> base_terms{20, 50, 100, 200};
        int per_discontinuity = 15;
        R strong_high_frequency = R(0.5);
        int strong_high_frequency_bonus = 30;
        R mild_high_frequency = R(0.3);
        int mild_high_frequency_bonus = 15;
        int min_terms = 10;
        int max_terms = 300;
        /// Term counts below these limits animate Slow, Normal and Fast; the rest VeryFast.
        std::array<int, 3> speed_limits{20, 50, 100};
    };

    ParameterRecommender() : config_() {}

    explicit ParameterRecommender(Config config) : config_(config) {}

    /**
     * @brief Recommendation for an analysis.
     *
     * A degenerate analysis contributes its discontinuity count of -1 as is.
     */
    Recommendation recommend(const ComplexityAnalysis<R>& analysis) const
    {
        const int terms = term_count(analysis);
        const auto speed = animation_speed(terms);
        const auto window = window_type(analysis.discontinuity_count());
        return {terms, speed, window, rationale(analysis, terms, speed, window)};
    }

    int term_count(const ComplexityAnalysis<R>& analysis) const
    {
        long terms = config_.base_terms[static_cast<std::size_t>(analysis.level)];
        terms += config_.per_discontinuity * analysis.discontinuity_count();
        if (analysis.high_frequency_ratio > config_.strong_high_frequency) {
            terms += config_.strong_high_frequency_bonus;
        } else if (analysis.high_frequency_ratio > config_.mild_high_frequency) {
            terms += config_.mild_high_frequency_bonus;
        }
        return static_cast<int>(std::clamp<long>(terms, config_.min_terms, config_.max_terms));
    }

    traits::AnimationSpeed animation_speed(int terms) const
    {
        if (terms < config_.speed_limits[0]) return traits::AnimationSpeed::Slow;
        if (terms < config_.speed_limits[1]) return traits::AnimationSpeed::Normal;
        if (terms < config_.speed_limits[2]) return traits::AnimationSpeed::Fast;
        return traits::AnimationSpeed::VeryFast;
    }

    static traits::WindowType window_type(long discontinuities)
    {
        if (discontinuities == 0) return traits::WindowType::Rectangular;
        if (discontinuities <= 2) return traits::WindowType::Hann;
        return traits::WindowType::Hamming;
    }

    /**
     * @brief One-line summary: terms, speed, window, complexity and discontinuity count.
     */
    static std::string summary(const ComplexityAnalysis<R>& analysis, const Recommendation& recommendation)
    {
        std::ostringstream out;
        out << "Recommendation: " << recommendation.term_count << " terms | speed: "
            << traits::to_string(recommendation.animation_speed) << " | window: "
            << traits::to_string(recommendation.window) << " | complexity: "
            << traits::to_string(analysis.level) << " | discontinuities: " << analysis.discontinuity_count();
        return out.str();
    }

    const Config& config() const noexcept { return config_; }

private:
    static std::string rationale(const ComplexityAnalysis<R>& analysis, int terms,
                                 traits::AnimationSpeed speed, traits::WindowType window)
    {
        std::ostringstream out;
        out << std::fixed << std::setprecision(1)
            << "Complexity: " << traits::to_string(analysis.level) << "\n"
            << "Discontinuities: " << analysis.discontinuity_count() << "\n"
            << "High-frequency content: " << analysis.high_frequency_ratio * R(100) << "%\n"
            << "Smoothness: " << analysis.smoothness * R(100) << "%\n"
            << "Suggested terms: " << terms << ", animation speed: " << traits::to_string(speed)
            << ", window: " << traits::to_string(window) << "\n";

        switch (analysis.level) {
            case traits::ComplexityLevel::Simple:
                out << terms << " terms are enough for this smooth function; more terms will not improve it noticeably.\n";
                break;
            case traits::ComplexityLevel::Medium:
                out << terms << " terms balance accuracy and speed for this moderately complex function.\n";
                break;
            case traits::ComplexityLevel::High:
                out << terms << " terms are needed to capture the detail and discontinuities of this function.\n";
                break;
            case traits::ComplexityLevel::Extreme:
                out << terms << " terms are the minimum for a reasonable approximation; consider simplifying the function.\n";
                break;
        }

        switch (window) {
            case traits::WindowType::Rectangular:
                out << "Rectangular window: no discontinuities, no window needed.\n";
                break;
            case traits::WindowType::Hann:
                out << "Hann window: gently reduces the Gibbs overshoot.\n";
                break;
            case traits::WindowType::Hamming:
                out << "Hamming window: stronger Gibbs reduction for several discontinuities.\n";
                break;
        }

        if (analysis.discontinuity_count() > 0) {
            out << "Gibbs phenomenon expected: " << analysis.discontinuity_count()
                << " discontinuity(ies) cause an overshoot of about 9%.\n";
        }
        if (analysis.high_frequency_ratio > R(0.5)) {
            out << "High frequency content: the function changes quickly and needs many terms.\n";
        }
        return out.str();
    }

    Config config_;
};

} // namespace analysis

#endif // PARAMETER_RECOMMENDER_HPP
