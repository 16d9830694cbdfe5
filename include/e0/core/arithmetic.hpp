// include/e0/core/arithmetic.hpp - Ordinal addition, multiplication, exponentiation and tetration.

#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <utility>
#include <variant>
#include <vector>

#include <e0/core/budget.hpp>
#include <e0/core/compare.hpp>
#include <e0/core/detail/overloaded.hpp>
#include <e0/core/errors.hpp>
#include <e0/core/natural.hpp>
#include <e0/core/ordinal.hpp>

namespace e0::core {

namespace detail {

inline constexpr std::uint64_t EXHAUSTED = std::numeric_limits<std::uint64_t>::max();

// Repetition counts that do not fit in 64 bits cannot finish under any budget.
inline std::uint64_t repetition_count(const natural& count, operation_budget& budget) {
    if (!count.fits<std::uint64_t>()) {
        budget.consume(EXHAUSTED);
    }
    return static_cast<std::uint64_t>(count);
}

// Exact base^exponent; charged by the number of limbs the result may occupy.
inline natural natural_power(const natural& base, const natural& exponent, operation_budget& budget) {
    const std::uint64_t count = repetition_count(exponent, budget);
    const std::uint64_t digits = base.decimal_digits();
    if (count > EXHAUSTED / digits) {
        budget.consume(EXHAUSTED);
    }
    budget.consume(1 + count * digits / detail::NATURAL_BASE_DIGITS);
    return natural::pow(base, count);
}

} // namespace detail

inline cnf_ordinal add(const cnf_ordinal& lhs, const cnf_ordinal& rhs, operation_budget& budget) {
    budget.consume();
    if (rhs.is_zero()) {
        return lhs;
    }
    if (lhs.is_zero()) {
        return rhs;
    }
    if (lhs.is_finite() && rhs.is_finite()) {
        return cnf_ordinal(lhs.finite_part() + rhs.finite_part());
    }
    if (lhs.is_finite()) {
        return rhs;
    }
    const auto lhs_terms = lhs.terms();
    std::vector<cnf_term> terms;
    if (rhs.is_finite()) {
        terms.assign(lhs_terms.begin(), lhs_terms.end());
        if (terms.back().exponent.is_zero()) {
            terms.back().coefficient += rhs.finite_part();
        } else {
            terms.push_back(cnf_term{cnf_ordinal::zero(), rhs.finite_part()});
        }
        return cnf_ordinal::from_normalized_terms(std::move(terms));
    }

    const cnf_term& lead = rhs.leading_term();
    const auto rhs_terms = rhs.terms();
    std::size_t index = 0;
    auto order = std::strong_ordering::less;
    for (; index < lhs_terms.size(); ++index) {
        order = compare(lhs_terms[index].exponent, lead.exponent, budget);
        if (order != std::strong_ordering::greater) {
            break;
        }
        terms.push_back(lhs_terms[index]);
    }
    std::size_t start = 0;
    if (index < lhs_terms.size() && order == std::strong_ordering::equal) {
        terms.push_back(cnf_term{lead.exponent, lhs_terms[index].coefficient + lead.coefficient});
        start = 1;
    }
    terms.insert(terms.end(), rhs_terms.begin() + static_cast<std::ptrdiff_t>(start), rhs_terms.end());
    return cnf_ordinal::from_normalized_terms(std::move(terms));
}

inline cnf_ordinal multiply(const cnf_ordinal& lhs, const cnf_ordinal& rhs, operation_budget& budget) {
    budget.consume();
    if (lhs.is_zero() || rhs.is_zero()) {
        return cnf_ordinal::zero();
    }
    if (lhs.is_one()) {
        return rhs;
    }
    if (rhs.is_one()) {
        return lhs;
    }
    cnf_ordinal total;
    for (const auto& term : rhs.terms()) {
        cnf_ordinal product;
        if (!term.exponent.is_zero()) {
            if (lhs.is_finite()) {
                product = cnf_ordinal::omega_power(term.exponent, term.coefficient);
            } else {
                product = cnf_ordinal::omega_power(
                    add(lhs.leading_term().exponent, term.exponent, budget), term.coefficient);
            }
        } else if (lhs.is_finite()) {
            product = cnf_ordinal(lhs.finite_part() * term.coefficient);
        } else {
            std::vector<cnf_term> scaled(lhs.terms().begin(), lhs.terms().end());
            scaled.front().coefficient *= term.coefficient;
            product = cnf_ordinal::from_normalized_terms(std::move(scaled));
        }
        budget.consume();
        total = add(total, product, budget);
    }
    return total;
}

// Exponent of the w-power divided out of w^value: n -> n-1, successors drop
// their trailing unit and limits map to themselves.
inline cnf_ordinal exponent_predecessor(const cnf_ordinal& value, operation_budget& budget) {
    budget.consume();
    if (value.is_zero()) {
        return value;
    }
    if (value.is_finite()) {
        return cnf_ordinal(value.finite_part() - natural::one());
    }
    if (value.is_limit()) {
        return value;
    }
    std::vector<cnf_term> terms(value.terms().begin(), value.terms().end());
    if (terms.back().coefficient.is_one()) {
        terms.pop_back();
    } else {
        terms.back().coefficient -= natural::one();
    }
    return cnf_ordinal::from_normalized_terms(std::move(terms));
}

// The xi with w * xi equal to the limit part of value. A finite exponent n
// becomes n-1; an infinite exponent e stays, since 1 + e = e.
inline cnf_ordinal divide_by_omega(const cnf_ordinal& value, operation_budget& budget) {
    budget.consume();
    if (value.is_finite()) {
        return cnf_ordinal::zero();
    }
    std::vector<cnf_term> terms;
    terms.reserve(value.term_count());
    for (const auto& term : value.terms()) {
        if (term.exponent.is_zero()) {
            continue;
        }
        if (term.exponent.is_finite()) {
            terms.push_back(cnf_term{exponent_predecessor(term.exponent, budget), term.coefficient});
        } else {
            budget.consume();
            terms.push_back(term);
        }
    }
    return cnf_ordinal::from_terms(std::move(terms));
}

namespace detail {

inline cnf_ordinal power_by_natural(const cnf_ordinal& base, const natural& exponent,
                                    operation_budget& budget) {
    if (exponent.is_zero()) {
        return cnf_ordinal::one();
    }
    if (exponent.is_one()) {
        return base;
    }
    if (base.term_count() == 1) {
        const cnf_term& lead = base.leading_term();
        return cnf_ordinal::omega_power(multiply(lead.exponent, cnf_ordinal(exponent), budget),
                                        lead.coefficient);
    }
    const std::uint64_t count = repetition_count(exponent, budget);
    cnf_ordinal result = base;
    for (std::uint64_t step = 1; step < count; ++step) {
        budget.consume();
        result = multiply(result, base, budget);
    }
    return result;
}

} // namespace detail

inline cnf_ordinal power(const cnf_ordinal& base, const cnf_ordinal& exponent, operation_budget& budget) {
    budget.consume();
    if (exponent.is_zero()) {
        return cnf_ordinal::one();
    }
    if (base.is_zero()) {
        return cnf_ordinal::zero();
    }
    if (base.is_one()) {
        return cnf_ordinal::one();
    }
    if (exponent.is_one()) {
        return base;
    }
    if (base.is_finite() && exponent.is_finite()) {
        return cnf_ordinal(detail::natural_power(base.finite_part(), exponent.finite_part(), budget));
    }
    if (base.is_finite()) {
        // k^(w*xi + r) = w^xi * k^r
        const natural remainder = exponent.finite_part();
        budget.consume(2);
        const cnf_ordinal xi = divide_by_omega(exponent.limit_part(), budget);
        const cnf_ordinal scale =
            remainder.is_zero()
                ? cnf_ordinal::one()
                : cnf_ordinal(detail::natural_power(base.finite_part(), remainder, budget));
        return multiply(cnf_ordinal::omega_power(xi), scale, budget);
    }
    if (exponent.is_finite()) {
        return detail::power_by_natural(base, exponent.finite_part(), budget);
    }
    // a^(B + m) = w^(a1 * B) * a^m for a limit B
    const cnf_ordinal head = cnf_ordinal::omega_power(
        multiply(base.leading_term().exponent, exponent.limit_part(), budget));
    const natural remainder = exponent.finite_part();
    if (remainder.is_zero()) {
        return head;
    }
    return multiply(head, detail::power_by_natural(base, remainder, budget), budget);
}

inline ordinal tetrate(const cnf_ordinal& base, const cnf_ordinal& height, operation_budget& budget) {
    budget.consume();
    if (height.is_zero()) {
        return cnf_ordinal::one();
    }
    if (height.is_one()) {
        return base;
    }
    if (base.is_zero()) {
        if (!height.is_finite()) {
            throw unsupported_operation("0 ^^ x is undefined for infinite x");
        }
        return height.finite_part().is_even() ? cnf_ordinal::one() : cnf_ordinal::zero();
    }
    if (base.is_one()) {
        return cnf_ordinal::one();
    }
    if (height.is_finite()) {
        const std::uint64_t levels = detail::repetition_count(height.finite_part(), budget);
        cnf_ordinal result = base;
        for (std::uint64_t level = 1; level < levels; ++level) {
            budget.consume();
            result = power(base, result, budget);
        }
        return result;
    }
    if (base.is_finite()) {
        return cnf_ordinal::omega();
    }
    return ordinal::epsilon();
}

namespace detail {

using operand = std::variant<cnf_ordinal, epsilon_naught>;

inline operand resolve(const ordinal& value, operation_budget& budget) {
    return std::visit(overloaded{
                          [](const cnf_ordinal& cnf) -> operand { return cnf; },
                          [](epsilon_naught epsilon) -> operand { return epsilon; },
                          [&](omega_tower tower) -> operand { return to_cnf(tower, budget); },
                      },
                      value.value());
}

} // namespace detail

inline ordinal add(const ordinal& lhs, const ordinal& rhs, operation_budget& budget) {
    const auto a = detail::resolve(lhs, budget);
    const auto b = detail::resolve(rhs, budget);
    return std::visit(
        detail::overloaded{
            [&](const cnf_ordinal& x, const cnf_ordinal& y) -> ordinal { return add(x, y, budget); },
            [&](const cnf_ordinal&, epsilon_naught) -> ordinal {
                budget.consume();
                return ordinal::epsilon();
            },
            [&](epsilon_naught, const cnf_ordinal& y) -> ordinal {
                budget.consume();
                if (y.is_zero()) {
                    return ordinal::epsilon();
                }
                throw unsupported_operation("e_0 + x is beyond e_0 for x > 0");
            },
            [&](epsilon_naught, epsilon_naught) -> ordinal {
                throw unsupported_operation("e_0 + e_0 is beyond e_0");
            },
        },
        a, b);
}

inline ordinal multiply(const ordinal& lhs, const ordinal& rhs, operation_budget& budget) {
    const auto a = detail::resolve(lhs, budget);
    const auto b = detail::resolve(rhs, budget);
    return std::visit(
        detail::overloaded{
            [&](const cnf_ordinal& x, const cnf_ordinal& y) -> ordinal {
                return multiply(x, y, budget);
            },
            [&](const cnf_ordinal& x, epsilon_naught) -> ordinal {
                budget.consume();
                if (x.is_zero()) {
                    return cnf_ordinal::zero();
                }
                return ordinal::epsilon();
            },
            [&](epsilon_naught, const cnf_ordinal& y) -> ordinal {
                budget.consume();
                if (y.is_zero()) {
                    return cnf_ordinal::zero();
                }
                if (y.is_one()) {
                    return ordinal::epsilon();
                }
                throw unsupported_operation("e_0 * x is beyond e_0 for x > 1");
            },
            [&](epsilon_naught, epsilon_naught) -> ordinal {
                throw unsupported_operation("e_0 * e_0 is beyond e_0");
            },
        },
        a, b);
}

inline ordinal power(const ordinal& lhs, const ordinal& rhs, operation_budget& budget) {
    const auto a = detail::resolve(lhs, budget);
    const auto b = detail::resolve(rhs, budget);
    return std::visit(
        detail::overloaded{
            [&](const cnf_ordinal& x, const cnf_ordinal& y) -> ordinal { return power(x, y, budget); },
            [&](const cnf_ordinal& x, epsilon_naught) -> ordinal {
                budget.consume();
                if (x.is_zero() || x.is_one()) {
                    return x;
                }
                return ordinal::epsilon();
            },
            [&](epsilon_naught, const cnf_ordinal& y) -> ordinal {
                budget.consume();
                if (y.is_zero()) {
                    return cnf_ordinal::one();
                }
                if (y.is_one()) {
                    return ordinal::epsilon();
                }
                throw unsupported_operation("e_0 ^ x is beyond e_0 for x > 1");
            },
            [&](epsilon_naught, epsilon_naught) -> ordinal {
                throw unsupported_operation("e_0 ^ e_0 is beyond e_0");
            },
        },
        a, b);
}

inline ordinal tetrate(const ordinal& lhs, const ordinal& rhs, operation_budget& budget) {
    const auto a = detail::resolve(lhs, budget);
    const auto b = detail::resolve(rhs, budget);
    return std::visit(
        detail::overloaded{
            [&](const cnf_ordinal& x, const cnf_ordinal& y) -> ordinal { return tetrate(x, y, budget); },
            [&](const cnf_ordinal& x, epsilon_naught) -> ordinal {
                budget.consume();
                if (x.is_zero()) {
                    throw unsupported_operation("0 ^^ e_0 is undefined");
                }
                if (x.is_one()) {
                    return x;
                }
                if (x.is_finite()) {
                    return cnf_ordinal::omega();
                }
                return ordinal::epsilon();
            },
            [&](epsilon_naught, const cnf_ordinal& y) -> ordinal {
                budget.consume();
                if (y.is_zero()) {
                    return cnf_ordinal::one();
                }
                if (y.is_one()) {
                    return ordinal::epsilon();
                }
                throw unsupported_operation("e_0 ^^ x is beyond e_0 for x > 1");
            },
            [&](epsilon_naught, epsilon_naught) -> ordinal {
                throw unsupported_operation("e_0 ^^ e_0 is beyond e_0");
            },
        },
        a, b);
}

// Any value below e_0 in CNF; e_0 itself has no CNF below e_0.
inline cnf_ordinal to_cnf(const ordinal& value, operation_budget& budget) {
    const auto resolved = detail::resolve(value, budget);
    if (const auto* cnf = std::get_if<cnf_ordinal>(&resolved)) {
        return *cnf;
    }
    throw unsupported_operation("e_0 has no Cantor normal form below e_0");
}

} // namespace e0::core
