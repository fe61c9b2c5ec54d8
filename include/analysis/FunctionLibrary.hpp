/**
 * @file FunctionLibrary.hpp
 * @brief Presets of classic periodic functions with their Fourier properties.
 */
#ifndef FUNCTION_LIBRARY_HPP
#define FUNCTION_LIBRARY_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "../traits/FSEA_traits.hpp"

namespace analysis {

struct LibraryEntry {
    std::string key;
    std::string name;
    std::string expression;               ///< Text accepted by expression::FunctionExpression.
    double period;
    std::string description;
    std::vector<std::string> properties;  ///< Notable features of the series.
    std::string applications;
    int recommended_terms;
    traits::Difficulty difficulty;
    std::string category;
};

/**
 * @brief Read-only catalog of presets, in a fixed display order.
 *
 * Categories: Basic Waves, Pulses, Smooth, Modulated, Special and Classic.
 */
class FunctionLibrary {
public:
    FunctionLibrary();

    std::optional<LibraryEntry> get(std::string_view key) const;

    const std::vector<LibraryEntry>& entries() const noexcept { return entries_; }

    std::vector<std::string> keys() const;

    std::vector<std::string> names() const;

    std::vector<std::string> by_difficulty(traits::Difficulty difficulty) const;

    /**
     * @brief Keys grouped by category, categories in display order.
     */
    std::vector<std::pair<std::string, std::vector<std::string>>> categories() const;

    /**
     * @brief Multi-line description of a preset, or "Function not found".
     */
    std::string info_text(std::string_view key) const;

private:
    std::vector<LibraryEntry> entries_;
};

} // namespace analysis

#endif // FUNCTION_LIBRARY_HPP
