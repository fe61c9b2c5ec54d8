/**
 * @file ExpressionParser.cpp
 * @brief Tokenizer and recursive-descent parser of the whitelisted grammar.
 *
 * The text is first split into tokens, then each grammar rule consumes tokens from a
 * cursor and builds the corresponding nodes. Errors report the character offset of the
 * offending token.
 */
#include "expression/ExpressionParser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <utility>

#include <boost/math/constants/constants.hpp>

namespace expression {

namespace {

enum class TokenKind { Number, Identifier, Operator, LeftParen, RightParen, End };

struct Token {
    TokenKind kind;
    std::string text;
    std::size_t position;
    double value = 0.0;
};

bool is_identifier_start(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::vector<Token> tokenize(std::string_view text)
{
    static constexpr std::string_view kTwoCharOperators[] = {"**", "<=", ">=", "==", "!="};
    static constexpr std::string_view kOneCharOperators = "+-*/%^<>";

    std::vector<Token> tokens;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const char c = text[pos];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos;
            continue;
        }

        const std::size_t start = pos;
        if (is_digit(c) || (c == '.' && pos + 1 < text.size() && is_digit(text[pos + 1]))) {
            while (pos < text.size() && is_digit(text[pos])) ++pos;
            if (pos < text.size() && text[pos] == '.') {
                ++pos;
                while (pos < text.size() && is_digit(text[pos])) ++pos;
            }
            // Exponent only when digits follow, so "2*e" keeps its constant.
            if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
                std::size_t look = pos + 1;
                if (look < text.size() && (text[look] == '+' || text[look] == '-')) ++look;
                if (look < text.size() && is_digit(text[look])) {
                    pos = look;
                    while (pos < text.size() && is_digit(text[pos])) ++pos;
                }
            }
            std::string literal(text.substr(start, pos - start));
            double value = 0.0;
            try {
                value = std::stod(literal);
            } catch (const std::out_of_range&) {
                throw ParseError("Number '" + literal + "' is out of range", start);
            }
            tokens.push_back({TokenKind::Number, literal, start, value});
            continue;
        }

        if (is_identifier_start(c)) {
            while (pos < text.size() && is_identifier_char(text[pos])) ++pos;
            tokens.push_back({TokenKind::Identifier, std::string(text.substr(start, pos - start)), start});
            continue;
        }

        if (c == '(') {
            tokens.push_back({TokenKind::LeftParen, "(", start});
            ++pos;
            continue;
        }
        if (c == ')') {
            tokens.push_back({TokenKind::RightParen, ")", start});
            ++pos;
            continue;
        }

        bool matched = false;
        for (std::string_view op : kTwoCharOperators) {
            if (text.substr(pos, 2) == op) {
                tokens.push_back({TokenKind::Operator, std::string(op), start});
                pos += 2;
                matched = true;
                break;
            }
        }
        if (matched) {
            continue;
        }
        if (kOneCharOperators.find(c) != std::string_view::npos) {
            tokens.push_back({TokenKind::Operator, std::string(1, c), start});
            ++pos;
            continue;
        }

        throw ParseError(std::string("Unexpected character '") + c + "'", start);
    }
    tokens.push_back({TokenKind::End, "", text.size()});
    return tokens;
}

bool is_keyword(std::string_view name)
{
    return name == "if" || name == "else" || name == "and" || name == "or" || name == "not";
}

std::optional<CompareOp> compare_op(const Token& token)
{
    if (token.kind != TokenKind::Operator) return std::nullopt;
    if (token.text == "<")  return CompareOp::Less;
    if (token.text == "<=") return CompareOp::LessEqual;
    if (token.text == ">")  return CompareOp::Greater;
    if (token.text == ">=") return CompareOp::GreaterEqual;
    if (token.text == "==") return CompareOp::Equal;
    if (token.text == "!=") return CompareOp::NotEqual;
    return std::nullopt;
}

constexpr std::size_t kMaxNestingDepth = 256;

class Cursor {
public:
    Cursor(std::vector<Token> tokens, const std::vector<std::string>& variables)
        : tokens_(std::move(tokens)), variables_(variables) {}

    ExprPtr parse_all()
    {
        if (peek().kind == TokenKind::End) {
            throw ParseError("Empty expression", 0);
        }
        ExprPtr root = ternary();
        if (peek().kind != TokenKind::End) {
            throw ParseError("Unexpected token '" + peek().text + "'", peek().position);
        }
        return root;
    }

private:
    std::vector<Token> tokens_;
    const std::vector<std::string>& variables_;
    std::size_t index_ = 0;
    std::size_t depth_ = 0;

    // Bounds nesting of parentheses, calls, unary signs and conditionals.
    class DepthGuard {
    public:
        explicit DepthGuard(Cursor& cursor) : cursor_(cursor)
        {
            if (++cursor_.depth_ > kMaxNestingDepth) {
                --cursor_.depth_;
                throw ParseError("Expression nested too deeply", cursor_.peek().position);
            }
        }
        ~DepthGuard() { --cursor_.depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Cursor& cursor_;
    };

    const Token& peek() const { return tokens_[index_]; }

    const Token& advance() { return tokens_[index_++]; }

    bool accept_operator(std::string_view op)
    {
        if (peek().kind == TokenKind::Operator && peek().text == op) {
            ++index_;
            return true;
        }
        return false;
    }

    bool accept_keyword(std::string_view keyword)
    {
        if (peek().kind == TokenKind::Identifier && peek().text == keyword) {
            ++index_;
            return true;
        }
        return false;
    }

    void expect_keyword(std::string_view keyword)
    {
        if (!accept_keyword(keyword)) {
            throw ParseError("Expected '" + std::string(keyword) + "'", peek().position);
        }
    }

    ExprPtr ternary()
    {
        const DepthGuard guard(*this);
        ExprPtr value = or_expr();
        if (accept_keyword("if")) {
            ExprPtr condition = or_expr();
            expect_keyword("else");
            ExprPtr otherwise = ternary();
            return make_conditional(std::move(condition), std::move(value), std::move(otherwise));
        }
        return value;
    }

    ExprPtr or_expr()
    {
        ExprPtr lhs = and_expr();
        while (accept_keyword("or")) {
            lhs = make_logical(LogicalOp::Or, std::move(lhs), and_expr());
        }
        return lhs;
    }

    ExprPtr and_expr()
    {
        ExprPtr lhs = not_expr();
        while (accept_keyword("and")) {
            lhs = make_logical(LogicalOp::And, std::move(lhs), not_expr());
        }
        return lhs;
    }

    ExprPtr not_expr()
    {
        const DepthGuard guard(*this);
        if (accept_keyword("not")) {
            return make_not(not_expr());
        }
        return comparison();
    }

    ExprPtr comparison()
    {
        ExprPtr first = arith();
        std::vector<CompareOp> ops;
        std::vector<ExprPtr> operands{first};
        while (auto op = compare_op(peek())) {
            ++index_;
            ops.push_back(*op);
            operands.push_back(arith());
        }
        if (ops.empty()) {
            return first;
        }
        return make_compare(std::move(ops), std::move(operands));
    }

    ExprPtr arith()
    {
        ExprPtr lhs = term();
        while (true) {
            if (accept_operator("+")) {
                lhs = make_binary(BinaryOp::Add, std::move(lhs), term());
            } else if (accept_operator("-")) {
                lhs = make_binary(BinaryOp::Sub, std::move(lhs), term());
            } else {
                return lhs;
            }
        }
    }

    ExprPtr term()
    {
        ExprPtr lhs = unary();
        while (true) {
            if (accept_operator("*")) {
                lhs = make_binary(BinaryOp::Mul, std::move(lhs), unary());
            } else if (accept_operator("/")) {
                lhs = make_binary(BinaryOp::Div, std::move(lhs), unary());
            } else if (accept_operator("%")) {
                lhs = make_binary(BinaryOp::Mod, std::move(lhs), unary());
            } else {
                return lhs;
            }
        }
    }

    ExprPtr unary()
    {
        const DepthGuard guard(*this);
        if (accept_operator("-")) {
            return make_unary(UnaryOp::Minus, unary());
        }
        if (accept_operator("+")) {
            return make_unary(UnaryOp::Plus, unary());
        }
        return power();
    }

    ExprPtr power()
    {
        ExprPtr base = primary();
        if (accept_operator("**") || accept_operator("^")) {
            return make_binary(BinaryOp::Pow, std::move(base), unary());
        }
        return base;
    }

    ExprPtr primary()
    {
        const Token& token = peek();
        switch (token.kind) {
            case TokenKind::Number:
                advance();
                return make_number(token.value);
            case TokenKind::LeftParen: {
                advance();
                ExprPtr inner = ternary();
                if (peek().kind != TokenKind::RightParen) {
                    throw ParseError("Expected ')'", peek().position);
                }
                advance();
                return inner;
            }
            case TokenKind::Identifier:
                return name();
            case TokenKind::End:
                throw ParseError("Unexpected end of expression", token.position);
            default:
                throw ParseError("Unexpected token '" + token.text + "'", token.position);
        }
    }

    ExprPtr name()
    {
        const Token token = advance();
        if (is_keyword(token.text)) {
            throw ParseError("Unexpected keyword '" + token.text + "'", token.position);
        }

        if (auto function = lookup_function(token.text)) {
            if (peek().kind != TokenKind::LeftParen) {
                throw ParseError("Function '" + token.text + "' must be called", token.position);
            }
            advance();
            if (peek().kind == TokenKind::RightParen) {
                throw ParseError("Function '" + token.text + "' expects one argument", peek().position);
            }
            ExprPtr argument = ternary();
            if (peek().kind != TokenKind::RightParen) {
                throw ParseError("Function '" + token.text + "' expects one argument", peek().position);
            }
            advance();
            return make_call(*function, std::move(argument));
        }

        if (peek().kind == TokenKind::LeftParen) {
            throw ParseError("Unknown function '" + token.text + "'", token.position);
        }
        if (token.text == "pi") {
            return make_constant("pi", boost::math::constants::pi<double>());
        }
        if (token.text == "e") {
            return make_constant("e", boost::math::constants::e<double>());
        }
        if (std::find(variables_.begin(), variables_.end(), token.text) != variables_.end()) {
            return make_variable(token.text);
        }
        throw ParseError("Unknown identifier '" + token.text + "'", token.position);
    }
};

} // namespace

ExpressionParser::ExpressionParser(std::vector<std::string> variables)
    : variables_(std::move(variables))
{
}

ExprPtr ExpressionParser::parse(std::string_view text) const
{
    Cursor cursor(tokenize(text), variables_);
    return cursor.parse_all();
}

} // namespace expression
