// include/e0/approx/simplify.hpp - Structural complexity and budgeted downward simplification.

#pragma once

#include <cstddef>

#include <e0/core/budget.hpp>
#include <e0/core/ordinal.hpp>

namespace e0::approx {

inline constexpr std::size_t DEFAULT_COMPLEXITY_LIMIT = 1000;

struct simplification {
    e0::core::ordinal value;
    std::size_t complexity = 0;
    std::size_t original_complexity = 0;

    bool changed() const noexcept { return complexity != original_complexity; }
};

// Size of the canonical notation: digits of every coefficient plus a fixed
// cost for each w, power, product and sum.
std::size_t complexity(const e0::core::cnf_ordinal& value, e0::core::operation_budget& budget);
std::size_t complexity(const e0::core::ordinal& value, e0::core::operation_budget& budget);

// Largest value found that is <= the input and whose complexity is at most
// max_complexity. May answer with an omega tower when the input is a tall
// power tower.
simplification simplify(const e0::core::ordinal& value,
                        std::size_t max_complexity,
                        e0::core::operation_budget& budget);

} // namespace e0::approx
