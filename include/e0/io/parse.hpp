// include/e0/io/parse.hpp - Expression parser and calculator front door.

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <e0/core/arithmetic.hpp>
#include <e0/core/budget.hpp>
#include <e0/core/natural.hpp>
#include <e0/core/ordinal.hpp>

namespace e0::io {

class parse_error : public std::invalid_argument {
public:
    parse_error(const std::string& message, std::size_t position)
        : std::invalid_argument(message + " at position " + std::to_string(position)),
          position_(position) {}

    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

namespace detail {

enum class token_kind { number, omega, epsilon, plus, times, caret, double_caret, open, close, end };

struct token {
    token_kind kind;
    std::string_view text;
    std::size_t position;
};

inline bool is_digit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

inline std::vector<token> tokenize(std::string_view text) {
    std::vector<token> tokens;
    std::size_t index = 0;
    while (index < text.size()) {
        const char ch = text[index];
        if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r') {
            ++index;
            continue;
        }
        const std::size_t start = index;
        if (is_digit(ch)) {
            while (index < text.size() && is_digit(text[index])) {
                ++index;
            }
            tokens.push_back({token_kind::number, text.substr(start, index - start), start});
            continue;
        }
        if (text.substr(index, 3) == "e_0") {
            tokens.push_back({token_kind::epsilon, text.substr(index, 3), start});
            index += 3;
            continue;
        }
        if (text.substr(index, 2) == "^^") {
            tokens.push_back({token_kind::double_caret, text.substr(index, 2), start});
            index += 2;
            continue;
        }
        token_kind kind = token_kind::end;
        switch (ch) {
        case 'w':
            kind = token_kind::omega;
            break;
        case '+':
            kind = token_kind::plus;
            break;
        case '*':
            kind = token_kind::times;
            break;
        case '^':
            kind = token_kind::caret;
            break;
        case '(':
            kind = token_kind::open;
            break;
        case ')':
            kind = token_kind::close;
            break;
        default:
            throw parse_error(std::string("unexpected character '") + ch + "'", start);
        }
        tokens.push_back({kind, text.substr(index, 1), start});
        ++index;
    }
    tokens.push_back({token_kind::end, {}, text.size()});
    return tokens;
}

// Precedence, loosest first: '+' (left), '*' (left), '^' (right), '^^' (right).
class expression_parser {
public:
    expression_parser(std::vector<token> tokens, e0::core::operation_budget& budget)
        : tokens_(std::move(tokens)), budget_(budget) {}

    e0::core::ordinal parse() {
        if (peek().kind == token_kind::end) {
            return e0::core::cnf_ordinal::zero();
        }
        e0::core::ordinal result = parse_sum();
        if (peek().kind != token_kind::end) {
            throw parse_error("unexpected token '" + std::string(peek().text) + "'", peek().position);
        }
        return result;
    }

private:
    const token& peek() const noexcept { return tokens_[cursor_]; }

    const token& advance() noexcept { return tokens_[cursor_++]; }

    bool accept(token_kind kind) noexcept {
        if (peek().kind != kind) {
            return false;
        }
        ++cursor_;
        return true;
    }

    e0::core::ordinal parse_sum() {
        e0::core::ordinal result = parse_product();
        while (accept(token_kind::plus)) {
            budget_.consume();
            result = e0::core::add(result, parse_product(), budget_);
        }
        return result;
    }

    e0::core::ordinal parse_product() {
        e0::core::ordinal result = parse_power();
        while (accept(token_kind::times)) {
            budget_.consume();
            result = e0::core::multiply(result, parse_power(), budget_);
        }
        return result;
    }

    e0::core::ordinal parse_power() {
        e0::core::ordinal base = parse_tetration();
        if (accept(token_kind::caret)) {
            e0::core::ordinal exponent = parse_power();
            budget_.consume();
            return e0::core::power(base, exponent, budget_);
        }
        return base;
    }

    e0::core::ordinal parse_tetration() {
        e0::core::ordinal base = parse_atom();
        if (accept(token_kind::double_caret)) {
            e0::core::ordinal height = parse_tetration();
            budget_.consume();
            return e0::core::tetrate(base, height, budget_);
        }
        return base;
    }

    e0::core::ordinal parse_atom() {
        const token& current = advance();
        switch (current.kind) {
        case token_kind::number:
            return e0::core::cnf_ordinal(e0::core::natural::from_string(current.text));
        case token_kind::omega:
            return e0::core::cnf_ordinal::omega();
        case token_kind::epsilon:
            return e0::core::ordinal::epsilon();
        case token_kind::open: {
            e0::core::ordinal inner = parse_sum();
            if (!accept(token_kind::close)) {
                throw parse_error("expected ')'", peek().position);
            }
            return inner;
        }
        case token_kind::end:
            throw parse_error("unexpected end of expression", current.position);
        default:
            throw parse_error("unexpected token '" + std::string(current.text) + "'", current.position);
        }
    }

    std::vector<token> tokens_;
    std::size_t cursor_ = 0;
    e0::core::operation_budget& budget_;
};

} // namespace detail

inline e0::core::ordinal parse_ordinal(std::string_view text, e0::core::operation_budget& budget) {
    detail::expression_parser parser(detail::tokenize(text), budget);
    return parser.parse();
}

// Evaluates one expression under a fresh budget.
inline e0::core::ordinal calculate(std::string_view text,
                                   std::uint64_t budget_limit = e0::core::operation_budget::DEFAULT_LIMIT) {
    e0::core::operation_budget budget(budget_limit);
    return parse_ordinal(text, budget);
}

} // namespace e0::io
