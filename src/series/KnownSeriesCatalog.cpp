/**
 * @file KnownSeriesCatalog.cpp
 * @brief Default closed-form entries of the known-series catalog.
 */
#include "series/KnownSeriesCatalog.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

#include <boost/math/constants/constants.hpp>

#include "expression/Evaluator.hpp"
#include "expression/ExpressionParser.hpp"

namespace series {

namespace {

std::string literal(double value)
{
    std::ostringstream out;
    out << std::setprecision(17) << value;
    return "(" + out.str() + ")";
}

expression::ExprPtr formula(const std::string& text)
{
    static const expression::ExpressionParser parser({"n"});
    return parser.parse(text);
}

// Harmonic m with L = m*pi, if L is an integer multiple of pi.
std::optional<long> harmonic_of_period(double half_period)
{
    const double ratio = half_period / boost::math::constants::pi<double>();
    const double rounded = std::round(ratio);
    if (rounded < 1.0 || std::abs(ratio - rounded) > 1e-9 * std::max(1.0, ratio)) {
        return std::nullopt;
    }
    return static_cast<long>(rounded);
}

std::optional<ClosedFormSeries> sine_entry(double L)
{
    auto m = harmonic_of_period(L);
    if (!m) {
        return std::nullopt;
    }
    return ClosedFormSeries{"sin(x)", 0.0, formula("0"),
                            formula("1 if n == " + std::to_string(*m) + " else 0"),
                            traits::SymmetryClass::Odd};
}

std::optional<ClosedFormSeries> cosine_entry(double L)
{
    auto m = harmonic_of_period(L);
    if (!m) {
        return std::nullopt;
    }
    return ClosedFormSeries{"cos(x)", 0.0,
                            formula("1 if n == " + std::to_string(*m) + " else 0"), formula("0"),
                            traits::SymmetryClass::Even};
}

std::optional<ClosedFormSeries> absolute_entry(double L)
{
    return ClosedFormSeries{"abs(x)", L,
                            formula("-4*" + literal(L) + "/(pi**2*n**2) if n % 2 == 1 else 0"), formula("0"),
                            traits::SymmetryClass::Even};
}

std::optional<ClosedFormSeries> square_entry(double L)
{
    return ClosedFormSeries{"x**2", 2.0 * L * L / 3.0,
                            formula("4*" + literal(L) + "**2*(-1)**n/(pi**2*n**2)"), formula("0"),
                            traits::SymmetryClass::Even};
}

std::optional<ClosedFormSeries> ramp_entry(double L)
{
    return ClosedFormSeries{"x", 0.0, formula("0"),
                            formula("2*" + literal(L) + "*(-1)**(n + 1)/(pi*n)"),
                            traits::SymmetryClass::Odd};
}

std::optional<ClosedFormSeries> sign_entry(double)
{
    return ClosedFormSeries{"sign(x)", 0.0, formula("0"),
                            formula("4/(pi*n) if n % 2 == 1 else 0"),
                            traits::SymmetryClass::Odd};
}

} // namespace

KnownSeriesCatalog::KnownSeriesCatalog()
{
    add("sin(x)", sine_entry);
    add("cos(x)", cosine_entry);
    add("abs(x)", absolute_entry);
    add("x**2", square_entry);
    add("x^2", square_entry);
    add("x", ramp_entry);
    add("sign(x)", sign_entry);
}

void KnownSeriesCatalog::add(std::string key, Builder builder)
{
    entries_[std::move(key)] = std::move(builder);
}

std::optional<ClosedFormSeries> KnownSeriesCatalog::lookup(std::string_view normalized_text, double half_period) const
{
    auto it = entries_.find(normalized_text);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second(half_period);
}

std::vector<std::string> KnownSeriesCatalog::keys() const
{
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, builder] : entries_) {
        result.push_back(key);
    }
    return result;
}

traits::DataType::StoringVector KnownSeriesCatalog::evaluate_formula(const expression::ExprPtr& formula, Eigen::Index count)
{
    const expression::Evaluator evaluator("n");
    traits::DataType::StoringVector values(count);
    for (Eigen::Index i = 0; i < count; ++i) {
        values(i) = evaluator.evaluate(formula, static_cast<double>(i + 1));
    }
    return values;
}

} // namespace series
