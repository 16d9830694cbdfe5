// include/e0/mapping/real_rep.hpp - Shape of an ordinal as seen by the real embedding.

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

#include <e0/core/budget.hpp>
#include <e0/core/natural.hpp>
#include <e0/core/ordinal.hpp>

namespace e0::mapping {

struct real_rep;
using rep_ptr = std::shared_ptr<const real_rep>;

struct rep_epsilon {};

// w^exponent
struct rep_power {
    rep_ptr exponent;
};

// w^exponent * coefficient + remainder, remainder < w^exponent
struct rep_sum {
    rep_ptr exponent;
    e0::core::natural coefficient;
    rep_ptr remainder;
};

// w^^height, height >= 2
struct rep_tower {
    std::uint64_t height = 0;
};

struct real_rep {
    std::variant<e0::core::natural, rep_epsilon, rep_power, rep_sum, rep_tower> value;
};

rep_ptr make_finite(e0::core::natural value);
rep_ptr make_epsilon();
rep_ptr make_power(rep_ptr exponent);
rep_ptr make_sum(rep_ptr exponent, e0::core::natural coefficient, rep_ptr remainder);
// Heights 0 and 1 become the finite 1 and w.
rep_ptr make_tower(std::uint64_t height);

bool is_zero(const real_rep& value) noexcept;
bool is_epsilon(const real_rep& value) noexcept;

// value + 1
rep_ptr successor(const rep_ptr& value);

// Canonical text used as the memo key ("P(1)", "S(1,3,7)", "T5", "E").
std::string cache_key(const real_rep& value);

rep_ptr to_real_rep(const e0::core::cnf_ordinal& value);
rep_ptr to_real_rep(const e0::core::ordinal& value);

e0::core::ordinal to_ordinal(const real_rep& value, e0::core::operation_budget& budget);

} // namespace e0::mapping
