// include/e0/core/ordinal.hpp - Cantor normal form ordinals and the e_0 / omega-tower variants.

#pragma once

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <e0/core/budget.hpp>
#include <e0/core/errors.hpp>
#include <e0/core/natural.hpp>

namespace e0::core {

class cnf_ordinal;
struct cnf_term;

namespace detail {

std::strong_ordering compare_cnf(const cnf_ordinal& lhs,
                                 const cnf_ordinal& rhs,
                                 operation_budget* budget);

} // namespace detail

// Sum of terms w^exponent * coefficient with strictly decreasing exponents and
// positive coefficients. Term storage is immutable and shared between copies;
// a null storage pointer is zero.
class cnf_ordinal {
public:
    cnf_ordinal() noexcept = default;

    explicit cnf_ordinal(natural value);

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    explicit cnf_ordinal(Int value) : cnf_ordinal(natural(value)) {}

    static cnf_ordinal zero() noexcept { return {}; }
    static cnf_ordinal one();
    static cnf_ordinal omega();
    static cnf_ordinal omega_power(cnf_ordinal exponent, natural coefficient = natural::one());

    // Drops zero coefficients, sorts by descending exponent and merges equal exponents.
    static cnf_ordinal from_terms(std::vector<cnf_term> terms);

    // Takes terms that are already in normal form; throws invariant_violation otherwise.
    static cnf_ordinal from_normalized_terms(std::vector<cnf_term> terms);

    cnf_ordinal clone() const { return *this; }

    bool is_zero() const noexcept { return terms_ == nullptr; }
    bool is_finite() const noexcept;
    bool is_limit() const noexcept;
    bool is_successor() const noexcept;
    bool is_one() const noexcept;
    bool is_omega() const noexcept;
    bool is_omega_power() const noexcept;

    std::size_t term_count() const noexcept;
    std::span<const cnf_term> terms() const noexcept;
    const cnf_term& term_at(std::size_t index) const;
    const cnf_term& leading_term() const;
    const cnf_term& trailing_term() const;

    natural finite_part() const;
    cnf_ordinal limit_part() const;
    cnf_ordinal rest() const;

    bool shares_storage(const cnf_ordinal& other) const noexcept {
        return terms_ != nullptr && terms_ == other.terms_;
    }

    friend std::strong_ordering operator<=>(const cnf_ordinal& lhs, const cnf_ordinal& rhs);
    friend bool operator==(const cnf_ordinal& lhs, const cnf_ordinal& rhs);

private:
    using storage = std::vector<cnf_term>;

    static cnf_ordinal adopt(storage terms);

    std::shared_ptr<const storage> terms_;
};

struct cnf_term {
    cnf_ordinal exponent;
    natural coefficient;
};

struct epsilon_naught {
    friend constexpr bool operator==(epsilon_naught, epsilon_naught) noexcept { return true; }
};

struct omega_tower {
    std::uint64_t height = 0;

    friend constexpr bool operator==(omega_tower, omega_tower) noexcept = default;
};

class ordinal {
public:
    using value_type = std::variant<cnf_ordinal, epsilon_naught, omega_tower>;

    ordinal() = default;
    ordinal(cnf_ordinal value) : value_(std::move(value)) {}
    ordinal(epsilon_naught value) noexcept : value_(value) {}
    ordinal(omega_tower value) noexcept : value_(value) {}

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    explicit ordinal(Int value) : value_(cnf_ordinal(value)) {}

    static ordinal epsilon() noexcept { return ordinal(epsilon_naught{}); }
    static ordinal tower(std::uint64_t height) noexcept { return ordinal(omega_tower{height}); }

    bool is_cnf() const noexcept { return std::holds_alternative<cnf_ordinal>(value_); }
    bool is_epsilon_naught() const noexcept { return std::holds_alternative<epsilon_naught>(value_); }
    bool is_tower() const noexcept { return std::holds_alternative<omega_tower>(value_); }

    bool is_zero() const noexcept { return is_cnf() && std::get<cnf_ordinal>(value_).is_zero(); }

    bool is_finite() const noexcept {
        if (const auto* cnf = std::get_if<cnf_ordinal>(&value_)) {
            return cnf->is_finite();
        }
        if (const auto* tower = std::get_if<omega_tower>(&value_)) {
            return tower->height == 0;
        }
        return false;
    }

    const cnf_ordinal& as_cnf() const { return std::get<cnf_ordinal>(value_); }
    std::uint64_t tower_height() const { return std::get<omega_tower>(value_).height; }
    const value_type& value() const noexcept { return value_; }

private:
    value_type value_;
};

namespace detail {

inline std::strong_ordering compare_cnf(const cnf_ordinal& lhs,
                                        const cnf_ordinal& rhs,
                                        operation_budget* budget) {
    if (budget != nullptr) {
        budget->consume();
    }
    if (lhs.shares_storage(rhs) || (lhs.is_zero() && rhs.is_zero())) {
        return std::strong_ordering::equal;
    }
    const auto lhs_terms = lhs.terms();
    const auto rhs_terms = rhs.terms();
    const std::size_t common = std::min(lhs_terms.size(), rhs_terms.size());
    for (std::size_t index = 0; index < common; ++index) {
        const auto exponent_cmp =
            compare_cnf(lhs_terms[index].exponent, rhs_terms[index].exponent, budget);
        if (exponent_cmp != std::strong_ordering::equal) {
            return exponent_cmp;
        }
        const auto coefficient_cmp = lhs_terms[index].coefficient <=> rhs_terms[index].coefficient;
        if (coefficient_cmp != std::strong_ordering::equal) {
            return coefficient_cmp;
        }
    }
    return lhs_terms.size() <=> rhs_terms.size();
}

} // namespace detail

inline cnf_ordinal::cnf_ordinal(natural value) {
    if (!value.is_zero()) {
        terms_ = std::make_shared<const storage>(storage{cnf_term{cnf_ordinal{}, std::move(value)}});
    }
}

inline cnf_ordinal cnf_ordinal::one() { return cnf_ordinal(natural::one()); }

inline cnf_ordinal cnf_ordinal::omega() { return omega_power(one()); }

inline cnf_ordinal cnf_ordinal::omega_power(cnf_ordinal exponent, natural coefficient) {
    if (coefficient.is_zero()) {
        return zero();
    }
    return adopt(storage{cnf_term{std::move(exponent), std::move(coefficient)}});
}

inline cnf_ordinal cnf_ordinal::adopt(storage terms) {
    cnf_ordinal result;
    if (!terms.empty()) {
        result.terms_ = std::make_shared<const storage>(std::move(terms));
    }
    return result;
}

inline cnf_ordinal cnf_ordinal::from_terms(std::vector<cnf_term> terms) {
    std::erase_if(terms, [](const cnf_term& term) { return term.coefficient.is_zero(); });
    std::stable_sort(terms.begin(), terms.end(), [](const cnf_term& lhs, const cnf_term& rhs) {
        return detail::compare_cnf(lhs.exponent, rhs.exponent, nullptr) ==
               std::strong_ordering::greater;
    });
    storage merged;
    merged.reserve(terms.size());
    for (auto& term : terms) {
        if (!merged.empty() && merged.back().exponent == term.exponent) {
            merged.back().coefficient += term.coefficient;
        } else {
            merged.push_back(std::move(term));
        }
    }
    return adopt(std::move(merged));
}

inline cnf_ordinal cnf_ordinal::from_normalized_terms(std::vector<cnf_term> terms) {
    for (std::size_t index = 0; index < terms.size(); ++index) {
        if (terms[index].coefficient.is_zero()) {
            throw invariant_violation("cnf term coefficient must be positive");
        }
        if (index > 0 && detail::compare_cnf(terms[index - 1].exponent, terms[index].exponent,
                                             nullptr) != std::strong_ordering::greater) {
            throw invariant_violation("cnf exponents must be strictly decreasing");
        }
    }
    return adopt(std::move(terms));
}

inline std::size_t cnf_ordinal::term_count() const noexcept {
    return terms_ ? terms_->size() : 0;
}

inline std::span<const cnf_term> cnf_ordinal::terms() const noexcept {
    if (!terms_) {
        return {};
    }
    return {terms_->data(), terms_->size()};
}

inline const cnf_term& cnf_ordinal::term_at(std::size_t index) const {
    if (index >= term_count()) {
        throw std::out_of_range("cnf term index out of range");
    }
    return (*terms_)[index];
}

inline const cnf_term& cnf_ordinal::leading_term() const {
    if (is_zero()) {
        throw std::out_of_range("zero has no leading term");
    }
    return terms_->front();
}

inline const cnf_term& cnf_ordinal::trailing_term() const {
    if (is_zero()) {
        throw std::out_of_range("zero has no trailing term");
    }
    return terms_->back();
}

inline bool cnf_ordinal::is_finite() const noexcept {
    return is_zero() || (terms_->size() == 1 && terms_->front().exponent.is_zero());
}

inline bool cnf_ordinal::is_limit() const noexcept {
    return !is_zero() && !terms_->back().exponent.is_zero();
}

inline bool cnf_ordinal::is_successor() const noexcept {
    return !is_zero() && terms_->back().exponent.is_zero();
}

inline bool cnf_ordinal::is_one() const noexcept {
    return is_finite() && !is_zero() && terms_->front().coefficient.is_one();
}

inline bool cnf_ordinal::is_omega() const noexcept {
    return term_count() == 1 && terms_->front().exponent.is_one() &&
           terms_->front().coefficient.is_one();
}

inline bool cnf_ordinal::is_omega_power() const noexcept {
    return term_count() == 1 && terms_->front().coefficient.is_one();
}

inline natural cnf_ordinal::finite_part() const {
    if (is_successor()) {
        return terms_->back().coefficient;
    }
    return natural::zero();
}

inline cnf_ordinal cnf_ordinal::limit_part() const {
    if (!is_successor()) {
        return *this;
    }
    return adopt(storage(terms_->begin(), terms_->end() - 1));
}

inline cnf_ordinal cnf_ordinal::rest() const {
    if (term_count() <= 1) {
        return zero();
    }
    return adopt(storage(terms_->begin() + 1, terms_->end()));
}

inline std::strong_ordering operator<=>(const cnf_ordinal& lhs, const cnf_ordinal& rhs) {
    return detail::compare_cnf(lhs, rhs, nullptr);
}

inline bool operator==(const cnf_ordinal& lhs, const cnf_ordinal& rhs) {
    return detail::compare_cnf(lhs, rhs, nullptr) == std::strong_ordering::equal;
}

} // namespace e0::core
