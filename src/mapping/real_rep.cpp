// src/mapping/real_rep.cpp - Conversions between ordinals and embedding representations.

#include <e0/mapping/real_rep.hpp>

#include <utility>

#include <e0/core/arithmetic.hpp>
#include <e0/core/compare.hpp>
#include <e0/core/detail/overloaded.hpp>
#include <e0/core/errors.hpp>

namespace e0::mapping {

namespace {

using e0::core::cnf_ordinal;
using e0::core::natural;
using e0::core::ordinal;
using e0::core::detail::overloaded;

cnf_ordinal to_cnf_value(const real_rep& value, e0::core::operation_budget& budget) {
    budget.consume();
    return std::visit(
        overloaded{
            [](const natural& finite) { return cnf_ordinal(finite); },
            [](rep_epsilon) -> cnf_ordinal {
                throw e0::core::unsupported_operation("e_0 cannot appear inside a Cantor normal form");
            },
            [&](const rep_power& power) {
                if (is_zero(*power.exponent)) {
                    return cnf_ordinal::one();
                }
                return cnf_ordinal::omega_power(to_cnf_value(*power.exponent, budget));
            },
            [&](const rep_sum& sum) {
                return e0::core::add(cnf_ordinal::omega_power(to_cnf_value(*sum.exponent, budget),
                                                              sum.coefficient),
                                     to_cnf_value(*sum.remainder, budget), budget);
            },
            [&](rep_tower tower) { return e0::core::to_cnf(e0::core::omega_tower{tower.height}, budget); },
        },
        value.value);
}

} // namespace

rep_ptr make_finite(natural value) {
    return std::make_shared<const real_rep>(real_rep{std::move(value)});
}

rep_ptr make_epsilon() { return std::make_shared<const real_rep>(real_rep{rep_epsilon{}}); }

rep_ptr make_power(rep_ptr exponent) {
    return std::make_shared<const real_rep>(real_rep{rep_power{std::move(exponent)}});
}

rep_ptr make_sum(rep_ptr exponent, natural coefficient, rep_ptr remainder) {
    return std::make_shared<const real_rep>(
        real_rep{rep_sum{std::move(exponent), std::move(coefficient), std::move(remainder)}});
}

rep_ptr make_tower(std::uint64_t height) {
    if (height == 0) {
        return make_finite(natural::one());
    }
    if (height == 1) {
        return make_power(make_finite(natural::one()));
    }
    return std::make_shared<const real_rep>(real_rep{rep_tower{height}});
}

bool is_zero(const real_rep& value) noexcept {
    const auto* finite = std::get_if<natural>(&value.value);
    return finite != nullptr && finite->is_zero();
}

bool is_epsilon(const real_rep& value) noexcept {
    return std::holds_alternative<rep_epsilon>(value.value);
}

rep_ptr successor(const rep_ptr& value) {
    const auto one = [] { return make_finite(natural::one()); };
    return std::visit(
        overloaded{
            [&](const natural& finite) { return make_finite(finite + natural::one()); },
            [](rep_epsilon) -> rep_ptr {
                throw e0::core::unsupported_operation("e_0 + 1 is beyond e_0");
            },
            [&](const rep_power& power) {
                if (is_zero(*power.exponent)) {
                    return make_finite(natural(2U));
                }
                return make_sum(power.exponent, natural::one(), one());
            },
            [&](const rep_sum& sum) {
                return make_sum(sum.exponent, sum.coefficient, successor(sum.remainder));
            },
            [&](rep_tower tower) {
                return make_sum(make_tower(tower.height - 1), natural::one(), one());
            },
        },
        value->value);
}

std::string cache_key(const real_rep& value) {
    return std::visit(overloaded{
                          [](const natural& finite) { return finite.to_string(); },
                          [](rep_epsilon) { return std::string("E"); },
                          [](const rep_power& power) {
                              return "P(" + cache_key(*power.exponent) + ")";
                          },
                          [](const rep_sum& sum) {
                              return "S(" + cache_key(*sum.exponent) + "," +
                                     sum.coefficient.to_string() + "," +
                                     cache_key(*sum.remainder) + ")";
                          },
                          [](rep_tower tower) { return "T" + std::to_string(tower.height); },
                      },
                      value.value);
}

rep_ptr to_real_rep(const cnf_ordinal& value) {
    if (value.is_finite()) {
        return make_finite(value.finite_part());
    }
    const auto& lead = value.leading_term();
    if (value.term_count() == 1 && lead.coefficient.is_one()) {
        return make_power(to_real_rep(lead.exponent));
    }
    return make_sum(to_real_rep(lead.exponent), lead.coefficient, to_real_rep(value.rest()));
}

rep_ptr to_real_rep(const ordinal& value) {
    return std::visit(overloaded{
                          [](const cnf_ordinal& cnf) { return to_real_rep(cnf); },
                          [](e0::core::epsilon_naught) { return make_epsilon(); },
                          [](e0::core::omega_tower tower) { return make_tower(tower.height); },
                      },
                      value.value());
}

ordinal to_ordinal(const real_rep& value, e0::core::operation_budget& budget) {
    if (is_epsilon(value)) {
        return ordinal::epsilon();
    }
    if (const auto* tower = std::get_if<rep_tower>(&value.value)) {
        return ordinal::tower(tower->height);
    }
    if (const auto* power = std::get_if<rep_power>(&value.value); power && is_epsilon(*power->exponent)) {
        // w^e_0 = e_0
        return ordinal::epsilon();
    }
    return to_cnf_value(value, budget);
}

} // namespace e0::mapping
