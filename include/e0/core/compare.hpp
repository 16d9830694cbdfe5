// include/e0/core/compare.hpp - Budgeted total order over CNF, e_0 and omega-tower values.

#pragma once

#include <compare>
#include <cstdint>
#include <utility>
#include <variant>

#include <e0/core/budget.hpp>
#include <e0/core/detail/overloaded.hpp>
#include <e0/core/ordinal.hpp>

namespace e0::core {

// w^^height written out in CNF; consumes one unit per level.
inline cnf_ordinal to_cnf(const omega_tower& tower, operation_budget& budget) {
    cnf_ordinal result = cnf_ordinal::one();
    for (std::uint64_t level = 0; level < tower.height; ++level) {
        budget.consume();
        result = cnf_ordinal::omega_power(std::move(result));
    }
    return result;
}

inline std::strong_ordering compare(const cnf_ordinal& lhs,
                                    const cnf_ordinal& rhs,
                                    operation_budget& budget) {
    return detail::compare_cnf(lhs, rhs, &budget);
}

inline std::strong_ordering compare(const ordinal& lhs, const ordinal& rhs, operation_budget& budget) {
    return std::visit(
        detail::overloaded{
            [&](const cnf_ordinal& a, const cnf_ordinal& b) { return compare(a, b, budget); },
            [&](const cnf_ordinal&, epsilon_naught) {
                budget.consume();
                return std::strong_ordering::less;
            },
            [&](epsilon_naught, const cnf_ordinal&) {
                budget.consume();
                return std::strong_ordering::greater;
            },
            [&](epsilon_naught, epsilon_naught) {
                budget.consume();
                return std::strong_ordering::equal;
            },
            [&](omega_tower a, omega_tower b) {
                budget.consume();
                return a.height <=> b.height;
            },
            [&](omega_tower, epsilon_naught) {
                budget.consume();
                return std::strong_ordering::less;
            },
            [&](epsilon_naught, omega_tower) {
                budget.consume();
                return std::strong_ordering::greater;
            },
            [&](omega_tower a, const cnf_ordinal& b) { return compare(to_cnf(a, budget), b, budget); },
            [&](const cnf_ordinal& a, omega_tower b) { return compare(a, to_cnf(b, budget), budget); },
        },
        lhs.value(), rhs.value());
}

inline bool less(const ordinal& lhs, const ordinal& rhs, operation_budget& budget) {
    return compare(lhs, rhs, budget) == std::strong_ordering::less;
}

inline bool equal(const ordinal& lhs, const ordinal& rhs, operation_budget& budget) {
    return compare(lhs, rhs, budget) == std::strong_ordering::equal;
}

inline std::strong_ordering operator<=>(const ordinal& lhs, const ordinal& rhs) {
    operation_budget budget;
    return compare(lhs, rhs, budget);
}

inline bool operator==(const ordinal& lhs, const ordinal& rhs) {
    operation_budget budget;
    return compare(lhs, rhs, budget) == std::strong_ordering::equal;
}

} // namespace e0::core
