// src/mapping/embedding.cpp - Forward evaluation of the embedding f.

#include <e0/mapping/embedding.hpp>

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <variant>

#include <e0/core/detail/overloaded.hpp>

namespace e0::mapping {

namespace {

constexpr double MIN_POLE_DISTANCE = 1e-9;

} // namespace

double scaled_fraction(double n, double scale) noexcept {
    if (!(n > 0.0)) {
        return 0.0;
    }
    if (std::isinf(n)) {
        return 1.0;
    }
    return n / (n + scale);
}

double embedding::f(const e0::core::ordinal& value, e0::core::operation_budget& budget) {
    return f(*to_real_rep(value), budget);
}

double embedding::f(const real_rep& value, e0::core::operation_budget& budget) {
    budget.consume();
    if (is_epsilon(value)) {
        return params_.upper();
    }
    std::string key = cache_key(value);
    if (const auto found = memo_.find(key); found != memo_.end()) {
        return found->second;
    }
    const double result = std::visit(
        e0::core::detail::overloaded{
            [&](const e0::core::natural& finite) {
                return scaled_fraction(finite.to_double(), params_.scale_add());
            },
            [&](rep_epsilon) { return params_.upper(); },
            [&](const rep_power& power) { return power_value(*power.exponent, budget); },
            [&](const rep_sum& sum) { return sum_value(sum, budget); },
            [&](rep_tower tower) { return tower_value(tower.height); },
        },
        value.value);
    if (memo_.size() >= cache_limit_) {
        memo_.clear();
    }
    if (cache_limit_ > 0) {
        memo_.emplace(std::move(key), result);
    }
    return result;
}

double embedding::tower_value(std::uint64_t height) const noexcept {
    if (height == 0) {
        return scaled_fraction(1.0, params_.scale_add());
    }
    return 1.0 + params_.tet_span() *
                     scaled_fraction(static_cast<double>(height - 1), params_.scale_tet());
}

// f(w^exponent)
double embedding::power_value(const real_rep& exponent, e0::core::operation_budget& budget) {
    if (const auto* finite = std::get_if<e0::core::natural>(&exponent.value)) {
        if (finite->is_zero()) {
            return scaled_fraction(1.0, params_.scale_add());
        }
        return 1.0 + params_.exp_span() * scaled_fraction(finite->to_double() - 1.0, params_.scale_exp());
    }
    const double inner = f(exponent, budget);
    const double denominator = params_.mobius_pole() - inner;
    if (denominator < MIN_POLE_DISTANCE) {
        throw std::domain_error("embedding evaluated too close to its pole");
    }
    return (params_.mobius_constant() + params_.mobius_linear() * inner) / denominator;
}

// f(w^b*c + d) interpolates between f(w^b*c) and f(w^b*(c+1)) by f(d) / f(w^b).
double embedding::sum_value(const rep_sum& value, e0::core::operation_budget& budget) {
    const double low = power_value(*value.exponent, budget);
    const double high = power_value(*successor(value.exponent), budget);
    const double span = high - low;
    const double coefficient = value.coefficient.to_double();
    const double scale = params_.scale_mult();
    const double at_coefficient = low + span * scaled_fraction(coefficient - 1.0, scale);
    if (is_zero(*value.remainder)) {
        return at_coefficient;
    }
    const double at_next = low + span * scaled_fraction(coefficient, scale);
    return at_coefficient + (at_next - at_coefficient) * f(*value.remainder, budget) / low;
}

e0::core::ordinal embedding::inverse_ordinal(double x, e0::core::operation_budget& budget,
                                             const inverse_limits& limits) {
    return to_ordinal(*f_inverse(x, budget, limits), budget);
}

} // namespace e0::mapping
