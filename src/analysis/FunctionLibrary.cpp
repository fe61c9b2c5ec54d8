/**
 * @file FunctionLibrary.cpp
 * @brief The preset table.
 */
#include "analysis/FunctionLibrary.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <boost/math/constants/constants.hpp>

namespace analysis {

namespace {

const double kPi = boost::math::constants::pi<double>();
const double kTwoPi = boost::math::constants::two_pi<double>();

} // namespace

FunctionLibrary::FunctionLibrary()
    : entries_{
          {"square_wave", "Square Wave", "sign(x)", kTwoPi,
           "Classic square wave alternating between +1 and -1.",
           {"Only odd sine terms", "bn = 4/(n pi) for odd n", "Slow convergence (1/n)",
            "Gibbs phenomenon at the jumps"},
           "Digital electronics, clocks, PWM", 50, traits::Difficulty::Medium, "Basic Waves"},
          {"triangular_wave", "Triangular Wave", "abs(x) - pi/2", kTwoPi,
           "Symmetric triangular wave.",
           {"Only odd cosine terms", "Fast convergence (1/n^2)", "Continuous function",
            "Its derivative is a square wave"},
           "Audio synthesis, signal generators", 20, traits::Difficulty::Medium, "Basic Waves"},
          {"sawtooth_wave", "Sawtooth Wave", "x", kTwoPi,
           "Periodic linear ramp.",
           {"All sine terms", "bn = (-1)^(n+1) * 2/n", "Moderate convergence (1/n)", "Rich in harmonics"},
           "Sound synthesis, oscillators", 30, traits::Difficulty::Easy, "Basic Waves"},
          {"pulse_train", "Pulse Train", "1 if abs(x) < pi/4 else 0", kTwoPi,
           "Sequence of rectangular pulses.",
           {"Sinc-shaped spectrum", "Every harmonic present", "Pronounced Gibbs phenomenon"},
           "Digital communications, sampling", 40, traits::Difficulty::Medium, "Pulses"},
          {"parabola", "Parabola", "x**2", kTwoPi,
           "Periodic quadratic function.",
           {"Even function: cosines only", "Very fast convergence", "Smooth and continuous",
            "Its derivative is linear"},
           "Trajectories, physics", 10, traits::Difficulty::Easy, "Smooth"},
          {"gaussian", "Periodic Gaussian", "exp(-x**2/4)", kTwoPi,
           "Periodic Gaussian bell.",
           {"Even function: cosines only", "Very smooth", "Excellent convergence", "Gaussian spectrum"},
           "Probability, signal processing", 15, traits::Difficulty::Medium, "Smooth"},
          {"am_signal", "AM Signal", "(1 + 0.5*cos(x))*cos(5*x)", kTwoPi,
           "Amplitude modulated carrier.",
           {"Carrier plus side bands", "Spectrum with 3 main peaks", "Envelope demodulation"},
           "AM radio, telecommunications", 25, traits::Difficulty::Advanced, "Modulated"},
          {"beat_signal", "Beat", "cos(9*x) + cos(11*x)", kTwoPi,
           "Sum of two close frequencies.",
           {"Low frequency envelope", "Only 2 spectral components", "Audible beat pattern"},
           "Acoustics, instrument tuning", 15, traits::Difficulty::Medium, "Modulated"},
          {"rectified_sine", "Rectified Sine", "abs(sin(x))", kPi,
           "Absolute value of a sine (full-wave rectification).",
           {"Only even cosine terms", "The period is pi, not 2 pi", "Used in rectifiers"},
           "Power supplies, rectifiers", 20, traits::Difficulty::Medium, "Special"},
          {"chirp", "Linear Chirp", "sin(x**2/2)", kTwoPi,
           "Variable frequency (chirp).",
           {"Varying instantaneous frequency", "Spread spectrum", "Not harmonic"},
           "Radar, sonar, time-frequency analysis", 50, traits::Difficulty::Advanced, "Special"},
          {"abs_x", "Absolute Value", "abs(x)", kTwoPi,
           "Periodic absolute value.",
           {"Even function: cosines only", "Continuous, not differentiable at 0", "Good convergence"},
           "Rectifiers, distortion", 25, traits::Difficulty::Easy, "Classic"},
          {"cubic", "Cubic", "x**3", kTwoPi,
           "Periodic cubic function.",
           {"Odd function: sines only", "Very fast convergence", "Smooth"},
           "Mathematics, modelling", 12, traits::Difficulty::Easy, "Classic"}}
{
}

std::optional<LibraryEntry> FunctionLibrary::get(std::string_view key) const
{
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [key](const LibraryEntry& entry) { return entry.key == key; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<std::string> FunctionLibrary::keys() const
{
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        result.push_back(entry.key);
    }
    return result;
}

std::vector<std::string> FunctionLibrary::names() const
{
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        result.push_back(entry.name);
    }
    return result;
}

std::vector<std::string> FunctionLibrary::by_difficulty(traits::Difficulty difficulty) const
{
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        if (entry.difficulty == difficulty) {
            result.push_back(entry.key);
        }
    }
    return result;
}

std::vector<std::pair<std::string, std::vector<std::string>>> FunctionLibrary::categories() const
{
    std::vector<std::pair<std::string, std::vector<std::string>>> result;
    for (const auto& entry : entries_) {
        auto it = std::find_if(result.begin(), result.end(),
                               [&entry](const auto& group) { return group.first == entry.category; });
        if (it == result.end()) {
            result.push_back({entry.category, {entry.key}});
        } else {
            it->second.push_back(entry.key);
        }
    }
    return result;
}

std::string FunctionLibrary::info_text(std::string_view key) const
{
    auto entry = get(key);
    if (!entry) {
        return "Function not found";
    }

    std::ostringstream out;
    out << entry->name << "\n"
        << "Function: " << entry->expression << "\n"
        << "Period: " << std::fixed << std::setprecision(4) << entry->period << "\n\n"
        << "Description:\n" << entry->description << "\n\n"
        << "Fourier series properties:\n";
    for (const auto& property : entry->properties) {
        out << "  - " << property << "\n";
    }
    out << "\nApplications:\n" << entry->applications << "\n\n"
        << "Recommended terms: " << entry->recommended_terms << "\n"
        << "Difficulty: " << traits::to_string(entry->difficulty) << "\n";
    return out.str();
}

} // namespace analysis
