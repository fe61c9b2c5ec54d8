/**
 * @file KnownSeriesCatalog.hpp
 * @brief Lookup table of functions whose Fourier series is known in closed form.
 *
 * Entries are keyed by the whitespace-stripped expression text. An entry yields a0 and the
 * general-term formulas an(n), bn(n) for a given half-period L; coefficient values are obtained
 * by evaluating the formulas, without any integration. Some entries only apply to particular
 * periods (e.g. `sin(x)` needs L to be an integer multiple of pi) and decline otherwise.
 */
#ifndef KNOWN_SERIES_CATALOG_HPP
#define KNOWN_SERIES_CATALOG_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../expression/ExpressionNode.hpp"
#include "../traits/FSEA_traits.hpp"

namespace series {

/**
 * @brief Closed-form series of a catalog entry for one half-period.
 */
struct ClosedFormSeries {
    std::string key;
    double a0;
    expression::ExprPtr an; ///< an(n), expression in `n`.
    expression::ExprPtr bn; ///< bn(n), expression in `n`.
    traits::SymmetryClass symmetry;
};

class KnownSeriesCatalog {
public:
    /// Builds the entry for a half-period, or std::nullopt if the entry does not apply to it.
    using Builder = std::function<std::optional<ClosedFormSeries>(double half_period)>;

    /**
     * @brief Catalog with the default entries: sin(x), cos(x), abs(x), x**2, x^2, x, sign(x).
     */
    KnownSeriesCatalog();

    /**
     * @brief Looks up a normalized (whitespace-free) expression.
     * @param normalized_text Expression text without whitespace.
     * @param half_period L.
     */
    std::optional<ClosedFormSeries> lookup(std::string_view normalized_text, double half_period) const;

    /**
     * @brief Registers or replaces an entry.
     */
    void add(std::string key, Builder builder);

    std::vector<std::string> keys() const;

    /**
     * @brief Evaluates a formula in `n` at n = 1..count.
     * @throws expression::EvaluationError if the formula cannot be evaluated.
     */
    static traits::DataType::StoringVector evaluate_formula(const expression::ExprPtr& formula, Eigen::Index count);

private:
    std::map<std::string, Builder, std::less<>> entries_;
};

} // namespace series

#endif // KNOWN_SERIES_CATALOG_HPP
