/**
 * @file ParameterValidator.hpp
 * @brief Provides utilities for validating the numeric parameters of a series computation.
 *
 * This header defines the exception hierarchy for domain violations and a small
 * parameter framework used before any work is started:
 *   - DomainError / ParameterDomainError exception types.
 *   - Parameter base structure with an (exclusive, inclusive] range.
 *   - Specific parameters: period length, number of terms, sample count.
 *   - ParameterValidator class template validating a tuple of parameters at once.
 */
#ifndef PARAMETER_VALIDATOR_HPP
#define PARAMETER_VALIDATOR_HPP

#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

namespace Utils {

/**
 * @brief Base class for all domain-related exceptions.
 */
class DomainError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * @brief Exception for parameter validation errors.
 */
class ParameterDomainError : public DomainError {
    using DomainError::DomainError;
};

/**
 * @brief A generic parameter with value range validation.
 *
 * @tparam T Value type.
 */
template <typename T>
struct Parameter {
    T value;                ///< The parameter's current value.
    std::pair<T, T> range;  ///< The valid domain for the parameter.
    const char* name;       ///< Human-readable name for error messages.

    Parameter(T val, std::pair<T, T> range, const char* name)
        : value(val), range(range), name(name) {}

    /**
     * @brief Validates if the value lies in (range.first, range.second].
     *
     * NaN never validates.
     */
    bool isValid() const {
        return value > range.first && value <= range.second;
    }

    /**
     * @brief Returns the domain constraint as a human-readable string.
     */
    std::string getDomain() const {
        std::ostringstream out;
        out << range.first << " < " << name << " <= " << range.second;
        return out.str();
    }
};

/// @brief Period of the function: 0 < period, finite.
template <typename R>
struct PeriodLength : Parameter<R> {
    PeriodLength(R val) : Parameter<R>{val, {R(0), std::numeric_limits<R>::max()}, "period"} {}
};

/// @brief Number of harmonics: n_terms >= 1.
struct TermCount : Parameter<long long> {
    TermCount(long long val) : Parameter<long long>{val, {0, std::numeric_limits<int>::max()}, "n_terms"} {}
};

/// @brief Number of grid samples: at least 2.
struct SampleCount : Parameter<long long> {
    SampleCount(long long val) : Parameter<long long>{val, {1, std::numeric_limits<int>::max()}, "samples"} {}
};

/**
 * @brief Utility to validate multiple parameters at once.
 *
 * @tparam Params List of parameter types (must be derived from Parameter<T>)
 */
template <typename... Params>
class ParameterValidator {
private:
    std::tuple<Params...> parameters_;

public:
    /**
     * @brief Constructs the validator and performs initial validation.
     *
     * @param params Variadic list of parameters.
     * @throws ParameterDomainError listing every parameter outside its domain.
     */
    explicit ParameterValidator(Params... params)
        : parameters_(std::make_tuple(params...)) {
        validateParameters();
    }

    void validateParameters() const {
        bool allValid = std::apply([](const auto&... params) {
            return (params.isValid() && ...);
        }, parameters_);

        if (!allValid) {
            throw ParameterDomainError(buildErrorMessage());
        }
    }

    template <typename P>
    auto getValue() const {
        return std::get<P>(parameters_).value;
    }

private:
    std::string buildErrorMessage() const {
        std::string errorDetail = "Parameter validation failed:\n";

        std::apply([&errorDetail](const auto&... params) {
            (
                [&]() {
                    if (!params.isValid()) {
                        std::ostringstream value;
                        value << params.value;
                        errorDetail += " - Parameter \"" + std::string(params.name) + "\" is invalid (value: "
                                       + value.str() + "). Expected: " + params.getDomain() + ".\n";
                    }
                }(),
                ...
            );
        }, parameters_);

        return errorDetail;
    }
};

} // namespace Utils

#endif // PARAMETER_VALIDATOR_HPP
