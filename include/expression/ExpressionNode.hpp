/**
 * @file ExpressionNode.hpp
 * @brief Immutable abstract syntax tree of the whitelisted expression grammar.
 *
 * Nodes are shared, immutable and therefore safe to evaluate concurrently. Each node holds
 * one alternative of a `std::variant`; consumers dispatch with `std::visit`.
 *
 * Besides the node types, the header declares:
 * - factory functions building nodes (`make_number`, `make_binary`, ...),
 * - `to_string` printing an expression with the input grammar's syntax,
 * - `structurally_equal` comparing two trees node by node,
 * - `contains_conditional` / `depends_on` queries used to route expressions.
 */
#ifndef EXPRESSION_NODE_HPP
#define EXPRESSION_NODE_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace expression {

struct Node;

using ExprPtr = std::shared_ptr<const Node>;

enum class UnaryOp { Plus, Minus };

enum class BinaryOp { Add, Sub, Mul, Div, Mod, Pow };

enum class CompareOp { Less, LessEqual, Greater, GreaterEqual, Equal, NotEqual };

enum class LogicalOp { And, Or };

/**
 * @brief Whitelisted one-argument functions.
 */
enum class Function { Sin, Cos, Tan, Exp, Log, Log10, Sqrt, Abs, Sign, Floor, Ceil };

struct Number {
    double value;
};

struct Variable {
    std::string name;
};

/// Named constant (`pi`, `e`) with its value.
struct Constant {
    std::string name;
    double value;
};

struct Unary {
    UnaryOp op;
    ExprPtr operand;
};

struct Binary {
    BinaryOp op;
    ExprPtr lhs;
    ExprPtr rhs;
};

struct Call {
    Function function;
    ExprPtr argument;
};

/// Chained comparison `a < b <= c`, true when every link holds.
struct Compare {
    std::vector<CompareOp> ops;
    std::vector<ExprPtr> operands;
};

struct Logical {
    LogicalOp op;
    ExprPtr lhs;
    ExprPtr rhs;
};

struct Not {
    ExprPtr operand;
};

/// `if_true if condition else if_false`
struct Conditional {
    ExprPtr condition;
    ExprPtr if_true;
    ExprPtr if_false;
};

struct Node {
    std::variant<Number, Variable, Constant, Unary, Binary, Call, Compare, Logical, Not, Conditional> data;
};

ExprPtr make_number(double value);
ExprPtr make_variable(std::string name);
ExprPtr make_constant(std::string name, double value);
ExprPtr make_unary(UnaryOp op, ExprPtr operand);
ExprPtr make_binary(BinaryOp op, ExprPtr lhs, ExprPtr rhs);
ExprPtr make_call(Function function, ExprPtr argument);
ExprPtr make_compare(std::vector<CompareOp> ops, std::vector<ExprPtr> operands);
ExprPtr make_logical(LogicalOp op, ExprPtr lhs, ExprPtr rhs);
ExprPtr make_not(ExprPtr operand);
ExprPtr make_conditional(ExprPtr condition, ExprPtr if_true, ExprPtr if_false);

/**
 * @brief Name of a whitelisted function as written in expressions.
 */
std::string_view function_name(Function function);

/**
 * @brief Looks a function up by name.
 * @return The function, or std::nullopt if the name is not whitelisted.
 */
std::optional<Function> lookup_function(std::string_view name);

/**
 * @brief Prints the expression with the input syntax, adding parentheses only where precedence requires.
 */
std::string to_string(const ExprPtr& node);

/**
 * @brief Node-by-node comparison; numbers compare exactly.
 */
bool structurally_equal(const ExprPtr& lhs, const ExprPtr& rhs);

/**
 * @brief True if the tree contains a conditional, comparison or logical construct.
 */
bool contains_conditional(const ExprPtr& node);

/**
 * @brief True if the variable appears anywhere in the tree.
 */
bool depends_on(const ExprPtr& node, std::string_view variable);

} // namespace expression

#endif // EXPRESSION_NODE_HPP
