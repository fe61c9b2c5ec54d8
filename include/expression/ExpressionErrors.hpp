/**
 * @file ExpressionErrors.hpp
 * @brief Exception types raised while parsing and evaluating function expressions.
 */
#ifndef EXPRESSION_ERRORS_HPP
#define EXPRESSION_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace expression {

/**
 * @brief The expression text is malformed or uses a name outside the whitelist.
 *
 * Carries the character offset at which the problem was detected.
 */
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, std::size_t position)
        : std::runtime_error(message + " (at position " + std::to_string(position) + ")"),
          position_(position) {}

    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

/**
 * @brief A single evaluation failed (division by zero, domain error, non-finite result).
 */
class EvaluationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace expression

#endif // EXPRESSION_ERRORS_HPP
