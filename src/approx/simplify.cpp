// src/approx/simplify.cpp - Complexity measure and the simplification ladder.

#include <e0/approx/simplify.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>
#include <variant>
#include <vector>

#include <e0/core/compare.hpp>
#include <e0/core/detail/overloaded.hpp>
#include <e0/core/natural.hpp>

namespace e0::approx {

namespace {

using e0::core::cnf_ordinal;
using e0::core::cnf_term;
using e0::core::epsilon_naught;
using e0::core::natural;
using e0::core::omega_tower;
using e0::core::operation_budget;
using e0::core::ordinal;

constexpr std::size_t OMEGA_COST = 1;
constexpr std::size_t OMEGA_TIMES_COST = 2;
constexpr std::size_t POWER_COST = 4;
constexpr std::size_t POWER_TIMES_COST = 5;
constexpr std::size_t SUM_COST = 1;
constexpr std::size_t EPSILON_COST = 3;
constexpr std::size_t TOWER_COST = 3;

std::size_t term_complexity(const cnf_term& term, operation_budget& budget) {
    budget.consume();
    const auto& exponent = term.exponent;
    const std::size_t digits = term.coefficient.decimal_digits();
    if (exponent.is_zero()) {
        return digits;
    }
    const bool unit = term.coefficient.is_one();
    if (exponent.is_one()) {
        return unit ? OMEGA_COST : digits + OMEGA_TIMES_COST;
    }
    const std::size_t inner = complexity(exponent, budget);
    return unit ? inner + POWER_COST : inner + digits + POWER_TIMES_COST;
}

std::size_t tower_complexity(std::uint64_t height) {
    return (height == 0 ? 0 : e0::core::detail::decimal_digit_count(height)) + TOWER_COST;
}

natural largest_with_digits(std::size_t digits) {
    if (digits == 0) {
        return natural::zero();
    }
    return natural::pow(natural(10U), digits) - natural::one();
}

std::uint64_t largest_height_with_digits(std::size_t digits) {
    constexpr std::size_t MAX_DIGITS = std::numeric_limits<std::uint64_t>::digits10;
    if (digits > MAX_DIGITS) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    std::uint64_t value = 0;
    for (std::size_t index = 0; index < digits; ++index) {
        value = value * 10 + 9;
    }
    return value;
}

bool fits_below(const cnf_ordinal& candidate, const cnf_ordinal& value, std::size_t limit,
                operation_budget& budget) {
    return complexity(candidate, budget) <= limit &&
           e0::core::compare(candidate, value, budget) != std::strong_ordering::greater;
}

// Tallest w-tower of height <= height costing at most limit. The compact
// w^^h notation is only used at top level; exponents get w^w^...^w.
ordinal tower_fallback(std::uint64_t height, std::size_t limit, bool allow_tower,
                       operation_budget& budget) {
    budget.consume();
    const std::uint64_t cnf_height = std::min<std::uint64_t>(height, (limit + 3) / POWER_COST);
    if (allow_tower && limit > TOWER_COST) {
        const std::uint64_t compact =
            std::min(height, largest_height_with_digits(limit - TOWER_COST));
        if (compact > cnf_height) {
            return omega_tower{compact};
        }
    }
    if (cnf_height == 0) {
        return cnf_ordinal::zero();
    }
    return e0::core::to_cnf(omega_tower{cnf_height}, budget);
}

ordinal simplify_cnf(const cnf_ordinal& value, std::size_t limit, bool allow_tower,
                     operation_budget& budget);

cnf_ordinal simplify_exponent(const cnf_ordinal& exponent, std::size_t limit,
                              operation_budget& budget) {
    cnf_ordinal reduced = simplify_cnf(exponent, limit, false, budget).as_cnf();
    if (reduced.is_zero()) {
        return cnf_ordinal::one();
    }
    return reduced;
}

// Largest term below term that fits in available; only called when the whole
// term does not fit.
cnf_term shrink_term(const cnf_term& term, std::size_t available, operation_budget& budget) {
    if (term.exponent.is_zero()) {
        return cnf_term{cnf_ordinal::zero(), largest_with_digits(available)};
    }
    cnf_ordinal exponent = term.exponent;
    if (!exponent.is_one()) {
        exponent = available > POWER_COST ? simplify_exponent(exponent, available - POWER_COST, budget)
                                          : cnf_ordinal::one();
    }
    if (e0::core::compare(exponent, term.exponent, budget) != std::strong_ordering::equal) {
        return cnf_term{std::move(exponent), natural::one()};
    }
    const std::size_t base_cost =
        exponent.is_one() ? OMEGA_COST : complexity(exponent, budget) + POWER_COST;
    const std::size_t room = available - base_cost;
    if (room < 2) {
        return cnf_term{std::move(exponent), natural::one()};
    }
    return cnf_term{std::move(exponent), largest_with_digits(room - 1)};
}

ordinal simplify_cnf(const cnf_ordinal& value, std::size_t limit, bool allow_tower,
                     operation_budget& budget) {
    budget.consume();
    if (complexity(value, budget) <= limit) {
        return value;
    }
    if (value.is_finite()) {
        return cnf_ordinal(largest_with_digits(limit));
    }

    // Pure power chain of the leading exponent: w^(w^(...^F)).
    const cnf_term& lead = value.leading_term();
    std::uint64_t depth = 0;
    const cnf_ordinal* cursor = &lead.exponent;
    while (!cursor->is_finite()) {
        budget.consume();
        ++depth;
        cursor = &cursor->leading_term().exponent;
    }
    cnf_ordinal skeleton(cursor->finite_part());
    for (std::uint64_t level = 0; level < depth; ++level) {
        skeleton = cnf_ordinal::omega_power(std::move(skeleton));
    }
    if (complexity(cnf_ordinal::omega_power(std::move(skeleton)), budget) > limit) {
        return tower_fallback(depth + 1, limit, allow_tower, budget);
    }

    std::vector<cnf_term> kept;
    std::size_t remaining = limit;
    for (const auto& term : value.terms()) {
        budget.consume();
        const std::size_t separator = kept.empty() ? 0 : SUM_COST;
        if (remaining <= separator) {
            break;
        }
        const std::size_t available = remaining - separator;
        const std::size_t cost = term_complexity(term, budget);
        if (cost <= available) {
            kept.push_back(term);
            remaining = available - cost;
            continue;
        }
        kept.push_back(shrink_term(term, available, budget));
        break;
    }
    const cnf_ordinal candidate = cnf_ordinal::from_terms(std::move(kept));
    if (fits_below(candidate, value, limit, budget)) {
        return candidate;
    }

    if (limit > POWER_COST) {
        const cnf_ordinal head =
            cnf_ordinal::omega_power(simplify_exponent(lead.exponent, limit - POWER_COST, budget));
        if (fits_below(head, value, limit, budget)) {
            return head;
        }
    }
    return cnf_ordinal::zero();
}

} // namespace

std::size_t complexity(const cnf_ordinal& value, operation_budget& budget) {
    budget.consume();
    std::size_t total = 0;
    for (const auto& term : value.terms()) {
        if (total != 0) {
            total += SUM_COST;
        }
        total += term_complexity(term, budget);
    }
    return total;
}

std::size_t complexity(const ordinal& value, operation_budget& budget) {
    return std::visit(e0::core::detail::overloaded{
                          [&](const cnf_ordinal& cnf) { return complexity(cnf, budget); },
                          [&](epsilon_naught) {
                              budget.consume();
                              return EPSILON_COST;
                          },
                          [&](omega_tower tower) {
                              budget.consume();
                              return tower_complexity(tower.height);
                          },
                      },
                      value.value());
}

simplification simplify(const ordinal& value, std::size_t max_complexity, operation_budget& budget) {
    simplification result;
    result.original_complexity = complexity(value, budget);
    result.value = std::visit(
        e0::core::detail::overloaded{
            [&](const cnf_ordinal& cnf) { return simplify_cnf(cnf, max_complexity, true, budget); },
            [&](epsilon_naught epsilon) -> ordinal {
                budget.consume();
                if (max_complexity >= EPSILON_COST) {
                    return epsilon;
                }
                return tower_fallback(std::numeric_limits<std::uint64_t>::max(), max_complexity,
                                      true, budget);
            },
            [&](omega_tower tower) -> ordinal {
                budget.consume();
                if (tower_complexity(tower.height) <= max_complexity) {
                    return tower;
                }
                if (tower.height <= 1) {
                    return simplify_cnf(e0::core::to_cnf(tower, budget), max_complexity, true, budget);
                }
                return tower_fallback(tower.height, max_complexity, true, budget);
            },
        },
        value.value());
    result.complexity = complexity(result.value, budget);
    return result;
}

} // namespace e0::approx
