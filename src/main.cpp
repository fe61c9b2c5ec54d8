#include <Eigen/Dense>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <boost/math/constants/constants.hpp>
#include "../include/expression/ExpressionErrors.hpp"
#include "../include/expression/ExpressionNode.hpp"
#include "../include/series/Fourier.hpp"
#include "../include/utils/ParameterValidator.hpp"
#include "../include/utils/Utils.hpp"

using R = double;

// usage: fsea_demo [expression] [period] [n_terms]
int main(int argc, char** argv) {
    const std::string text = argc > 1 ? argv[1] : "sign(x)";
    const R period = argc > 2 ? std::strtod(argv[2], nullptr) : boost::math::constants::two_pi<R>();
    const long long n_terms = argc > 3 ? std::strtoll(argv[3], nullptr, 10) : 10;

    try {
        auto coefficients = series::compute_all(text, period, n_terms);

        std::cout << "f(x) = " << text << ", period = " << period << ", N = " << n_terms << std::endl;
        std::cout << "Symmetry: " << traits::to_string(coefficients.symmetry)
                  << ", method: "
                  << (coefficients.method == traits::ComputationMethod::KnownSeries ? "known series" : "integrated")
                  << std::endl;

        std::cout << std::setw(4) << "n" << std::setw(14) << "an" << std::setw(14) << "bn"
                  << std::setw(14) << "amplitude" << std::endl;
        const auto table = series::coefficient_table(coefficients);
        for (Eigen::Index i = 0; i < table.rows(); ++i) {
            std::cout << std::setw(4) << static_cast<int>(table(i, 0)) << std::fixed << std::setprecision(6)
                      << std::setw(14) << table(i, 1) << std::setw(14) << table(i, 2)
                      << std::setw(14) << table(i, 3) << std::endl;
        }

        if (coefficients.has_formulas()) {
            std::cout << "an(n) = " << expression::to_string(*coefficients.an_formula) << std::endl;
            std::cout << "bn(n) = " << expression::to_string(*coefficients.bn_formula) << std::endl;
        }
        std::cout << "Series: " << series::series_expression(coefficients) << std::endl;

        const R L = coefficients.half_period();
        const auto error = series::compute_error(coefficients, text, Utils::linspace<R>(-L, L, 1000));
        std::cout << std::scientific << std::setprecision(3)
                  << "MSE: " << error.mse << ", MAE: " << error.mae << ", max: " << error.max_abs << std::endl;

        const auto complexity = series::analyze_complexity(text, period);
        const auto recommendation = series::recommend(complexity);
        std::cout << analysis::ParameterRecommender<R>::summary(complexity, recommendation) << std::endl;
        std::cout << recommendation.rationale;
    } catch (const expression::ParseError& e) {
        std::cerr << "Invalid expression: " << e.what() << std::endl;
        return 1;
    } catch (const Utils::ParameterDomainError& e) {
        std::cerr << e.what();
        return 1;
    }
    return 0;
}
