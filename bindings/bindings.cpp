/*
    bindings.cpp - Pybind11 bindings for the Fourier series computation and analysis core.

    This module exposes the text-based entry points and their result types to Python, so that
    a plotting or GUI front end can compute coefficients, evaluate partial sums and get
    parameter recommendations without reimplementing any numerics.

    Main Features:
    --------------
    - Coefficients:
        * compute_all(expression, period, n_terms[, config]) returning a CoefficientSet.
        * CoefficientSet exposes a0, an, bn (NumPy arrays), the formulas as text, the detected
          symmetry, the computation method, the rendered series and the coefficient table.
        * EngineConfig selects the quadrature backend, the parallel threshold and worker count.

    - Evaluation:
        * evaluate_series(coefficients, xs, n_terms) for vectorized partial sums.
        * compute_error(coefficients, expression, xs) returning pointwise error, MSE, MAE, max.

    - Analysis:
        * analyze_complexity(expression, period) returning a ComplexityAnalysis.
        * recommend(analysis) returning a Recommendation (terms, speed, window, rationale).
        * FunctionLibrary with the preset periodic functions.

    - Exceptions:
        * ParseError (ValueError subclass) for malformed or disallowed expressions.
        * ParameterDomainError (ValueError subclass) for period <= 0 or n_terms < 1.

    Usage:
    ------
    Import the module in Python as `fsea`.
    Example:
        import fsea, numpy as np
        cs = fsea.compute_all("x**2", 2*np.pi, 10)
        y = fsea.evaluate_series(cs, np.linspace(-np.pi, np.pi, 500), 10)
        rec = fsea.recommend(fsea.analyze_complexity("sign(x)", 2*np.pi))

*/
#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include <optional>
#include <string>

#include "../include/analysis/FunctionLibrary.hpp"
#include "../include/expression/ExpressionErrors.hpp"
#include "../include/expression/ExpressionNode.hpp"
#include "../include/series/Fourier.hpp"
#include "../include/traits/FSEA_traits.hpp"
#include "../include/utils/ParameterValidator.hpp"

namespace py = pybind11;

// Short-hands
using Real   = traits::DataType::SeriesField;
using Vector = traits::DataType::StoringVector;
using Array  = traits::DataType::StoringArray;
using CoefficientSet = series::CoefficientSet<Real>;

/**
 * @brief Prints an optional formula, or returns None.
 */
static std::optional<std::string> formula_text(const std::optional<expression::ExprPtr>& formula) {
    if (!formula) {
        return std::nullopt;
    }
    return expression::to_string(*formula);
}

PYBIND11_MODULE(fsea, m) {
    m.doc() = "Fourier series coefficients, partial sums and complexity analysis (pybind11)";

    // ----- Exceptions -----
    py::register_exception<expression::ParseError>(m, "ParseError", PyExc_ValueError);
    py::register_exception<Utils::ParameterDomainError>(m, "ParameterDomainError", PyExc_ValueError);

    // ----- Enums -----
    /**
     * @brief Numerical integration backends used when closed-form integration is unavailable.
     *
     * ### Values
     * - `QuadratureMethod.Trapezoidal` : composite trapezoidal rule on a fixed grid (default).
     * - `QuadratureMethod.TanhSinh` : Boost tanh-sinh quadrature.
     * - `QuadratureMethod.QAG` : GSL adaptive Gauss-Kronrod quadrature.
     */
    py::enum_<traits::QuadratureMethod>(m, "QuadratureMethod")
    .value("Trapezoidal", traits::QuadratureMethod::Trapezoidal)
    .value("TanhSinh", traits::QuadratureMethod::TanhSinh)
    .value("QAG", traits::QuadratureMethod::QAG)
    .export_values();

    py::enum_<traits::SymmetryClass>(m, "SymmetryClass")
    .value("Even", traits::SymmetryClass::Even)
    .value("Odd", traits::SymmetryClass::Odd)
    .value("HalfWave", traits::SymmetryClass::HalfWave)
    .value("NoSymmetry", traits::SymmetryClass::None);

    py::enum_<traits::ComputationMethod>(m, "ComputationMethod")
    .value("KnownSeries", traits::ComputationMethod::KnownSeries)
    .value("Integrated", traits::ComputationMethod::Integrated);

    py::enum_<traits::ComplexityLevel>(m, "ComplexityLevel")
    .value("Simple", traits::ComplexityLevel::Simple)
    .value("Medium", traits::ComplexityLevel::Medium)
    .value("High", traits::ComplexityLevel::High)
    .value("Extreme", traits::ComplexityLevel::Extreme);

    py::enum_<traits::AnimationSpeed>(m, "AnimationSpeed")
    .value("Slow", traits::AnimationSpeed::Slow)
    .value("Normal", traits::AnimationSpeed::Normal)
    .value("Fast", traits::AnimationSpeed::Fast)
    .value("VeryFast", traits::AnimationSpeed::VeryFast);

    py::enum_<traits::WindowType>(m, "WindowType")
    .value("Rectangular", traits::WindowType::Rectangular)
    .value("Hann", traits::WindowType::Hann)
    .value("Hamming", traits::WindowType::Hamming);

    py::enum_<traits::Difficulty>(m, "Difficulty")
    .value("Easy", traits::Difficulty::Easy)
    .value("Medium", traits::Difficulty::Medium)
    .value("Advanced", traits::Difficulty::Advanced);

    // ----- Coefficients -----

    py::class_<series::CoefficientEngine::Config>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("parallel_threshold", &series::CoefficientEngine::Config::parallel_threshold)
        .def_readwrite("worker_count", &series::CoefficientEngine::Config::worker_count)
        .def_readwrite("formula_term_limit", &series::CoefficientEngine::Config::formula_term_limit)
        .def_readwrite("quadrature", &series::CoefficientEngine::Config::quadrature)
        .def_readwrite("trapezoid_samples", &series::CoefficientEngine::Config::trapezoid_samples)
        .def_readwrite("use_known_series", &series::CoefficientEngine::Config::use_known_series);

    py::class_<CoefficientSet>(m, "CoefficientSet")
        .def_readonly("a0", &CoefficientSet::a0)
        .def_readonly("an", &CoefficientSet::an)
        .def_readonly("bn", &CoefficientSet::bn)
        .def_readonly("symmetry", &CoefficientSet::symmetry)
        .def_readonly("method", &CoefficientSet::method)
        .def_property_readonly("period", [](const CoefficientSet& self) { return self.period.period(); })
        .def_property_readonly("half_period", &CoefficientSet::half_period)
        .def_property_readonly("an_formula", [](const CoefficientSet& self) { return formula_text(self.an_formula); })
        .def_property_readonly("bn_formula", [](const CoefficientSet& self) { return formula_text(self.bn_formula); })
        .def("__len__", &CoefficientSet::size)
        .def("series_expression",
             [](const CoefficientSet& self, std::optional<Eigen::Index> n_terms) {
                 return series::series_expression(self, n_terms.value_or(self.size()));
             },
             py::arg("n_terms") = std::nullopt,
             "Truncated series as text.")
        .def("table", [](const CoefficientSet& self) { return series::coefficient_table(self); },
             "Rows (n, an, bn, amplitude), row 0 holding a0.");

    m.def("compute_all",
          py::overload_cast<std::string_view, Real, long long>(&series::compute_all),
          py::arg("expression"), py::arg("period"), py::arg("n_terms"),
          "Fourier coefficients of the expression over one period.");
    m.def("compute_all",
          py::overload_cast<std::string_view, Real, long long, const series::CoefficientEngine::Config&>(&series::compute_all),
          py::arg("expression"), py::arg("period"), py::arg("n_terms"), py::arg("config"));

    // ----- Evaluation -----

    py::class_<series::ErrorReport<Real>>(m, "ErrorReport")
        .def_readonly("pointwise", &series::ErrorReport<Real>::pointwise)
        .def_readonly("mse", &series::ErrorReport<Real>::mse)
        .def_readonly("mae", &series::ErrorReport<Real>::mae)
        .def_readonly("max_abs", &series::ErrorReport<Real>::max_abs);

    m.def("evaluate_series", &series::evaluate_series,
          py::arg("coefficients"), py::arg("xs"), py::arg("n_terms"),
          "Partial sum with the first n_terms harmonics at the given points.");
    m.def("compute_error", &series::compute_error,
          py::arg("coefficients"), py::arg("expression"), py::arg("xs"));

    // ----- Analysis -----

    py::class_<analysis::ComplexityAnalysis<Real>>(m, "ComplexityAnalysis")
        .def_readonly("level", &analysis::ComplexityAnalysis<Real>::level)
        .def_readonly("discontinuity_positions", &analysis::ComplexityAnalysis<Real>::discontinuity_positions)
        .def_readonly("high_frequency_ratio", &analysis::ComplexityAnalysis<Real>::high_frequency_ratio)
        .def_readonly("smoothness", &analysis::ComplexityAnalysis<Real>::smoothness)
        .def_property_readonly("discontinuities", &analysis::ComplexityAnalysis<Real>::discontinuity_count)
        .def_property_readonly("is_degenerate", &analysis::ComplexityAnalysis<Real>::is_degenerate);

    py::class_<analysis::Recommendation>(m, "Recommendation")
        .def_readonly("term_count", &analysis::Recommendation::term_count)
        .def_readonly("animation_speed", &analysis::Recommendation::animation_speed)
        .def_readonly("window", &analysis::Recommendation::window)
        .def_readonly("rationale", &analysis::Recommendation::rationale);

    m.def("analyze_complexity", &series::analyze_complexity, py::arg("expression"), py::arg("period"));
    m.def("recommend", &series::recommend, py::arg("analysis"));
    m.def("summary", &analysis::ParameterRecommender<Real>::summary, py::arg("analysis"), py::arg("recommendation"));

    // ----- Function library -----

    py::class_<analysis::LibraryEntry>(m, "LibraryEntry")
        .def_readonly("key", &analysis::LibraryEntry::key)
        .def_readonly("name", &analysis::LibraryEntry::name)
        .def_readonly("expression", &analysis::LibraryEntry::expression)
        .def_readonly("period", &analysis::LibraryEntry::period)
        .def_readonly("description", &analysis::LibraryEntry::description)
        .def_readonly("properties", &analysis::LibraryEntry::properties)
        .def_readonly("applications", &analysis::LibraryEntry::applications)
        .def_readonly("recommended_terms", &analysis::LibraryEntry::recommended_terms)
        .def_readonly("difficulty", &analysis::LibraryEntry::difficulty)
        .def_readonly("category", &analysis::LibraryEntry::category);

    py::class_<analysis::FunctionLibrary>(m, "FunctionLibrary")
        .def(py::init<>())
        .def("get", &analysis::FunctionLibrary::get, py::arg("key"))
        .def("keys", &analysis::FunctionLibrary::keys)
        .def("names", &analysis::FunctionLibrary::names)
        .def("by_difficulty", &analysis::FunctionLibrary::by_difficulty, py::arg("difficulty"))
        .def("categories", &analysis::FunctionLibrary::categories)
        .def("info_text", &analysis::FunctionLibrary::info_text, py::arg("key"));
}
