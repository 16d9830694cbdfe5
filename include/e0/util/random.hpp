// include/e0/util/random.hpp - Random naturals and CNF ordinals for property tests.

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <e0/core/natural.hpp>
#include <e0/core/ordinal.hpp>

namespace e0::util {

inline e0::core::natural random_natural(std::mt19937_64& generator, std::size_t max_digits,
                                        bool allow_zero = true) {
    std::uniform_int_distribution<std::size_t> length_dist(1, max_digits == 0 ? 1 : max_digits);
    std::uniform_int_distribution<int> digit_dist(0, 9);
    const std::size_t length = length_dist(generator);
    std::string digits;
    digits.reserve(length);
    for (std::size_t index = 0; index < length; ++index) {
        digits.push_back(static_cast<char>('0' + digit_dist(generator)));
    }
    auto value = e0::core::natural::from_string(digits);
    if (!allow_zero && value.is_zero()) {
        return e0::core::natural::one();
    }
    return value;
}

// Unnormalized terms are fed through cnf_ordinal::from_terms, so the result is
// always in normal form. depth bounds the nesting of exponents.
inline e0::core::cnf_ordinal random_cnf(std::mt19937_64& generator, std::size_t depth,
                                        std::size_t max_terms = 3, std::size_t max_digits = 2) {
    std::uniform_int_distribution<std::size_t> term_dist(0, max_terms);
    const std::size_t count = term_dist(generator);
    std::vector<e0::core::cnf_term> terms;
    terms.reserve(count);
    for (std::size_t index = 0; index < count; ++index) {
        e0::core::cnf_ordinal exponent =
            depth == 0 ? e0::core::cnf_ordinal(random_natural(generator, 1))
                       : random_cnf(generator, depth - 1, max_terms, max_digits);
        terms.push_back({std::move(exponent), random_natural(generator, max_digits)});
    }
    return e0::core::cnf_ordinal::from_terms(std::move(terms));
}

} // namespace e0::util
