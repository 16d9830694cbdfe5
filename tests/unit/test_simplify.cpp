// tests/unit/test_simplify.cpp - Unit tests for the complexity measure and downward simplification.

#include <e0/e0lib.hpp>

#include <cstddef>
#include <iostream>
#include <random>
#include <string>
#include <string_view>

namespace {

using e0::core::cnf_ordinal;
using e0::core::natural;
using e0::core::ordinal;

bool expect_complexity(std::string_view expression, std::size_t expected) {
    e0::core::operation_budget budget;
    const ordinal value = e0::io::parse_ordinal(expression, budget);
    const std::size_t measured = e0::approx::complexity(value, budget);
    if (measured == expected) {
        return true;
    }
    std::cerr << "complexity(" << expression << ") = " << measured << ", expected " << expected << "\n";
    return false;
}

bool expect_simplified(std::string_view expression, std::size_t limit, std::string_view expected) {
    e0::core::operation_budget budget;
    const ordinal value = e0::io::parse_ordinal(expression, budget);
    const auto result = e0::approx::simplify(value, limit, budget);
    const std::string text = e0::io::to_string(result.value);
    if (text == expected && result.complexity <= limit) {
        return true;
    }
    std::cerr << "simplify(" << expression << ", " << limit << ") = " << text << " (complexity "
              << result.complexity << "), expected " << expected << "\n";
    return false;
}

bool test_complexity() {
    bool ok = true;
    ok &= expect_complexity("0", 0);
    ok &= expect_complexity("123", 3);
    ok &= expect_complexity("w", 1);
    ok &= expect_complexity("w*12", 4);
    ok &= expect_complexity("w^2", 5);
    ok &= expect_complexity("w^w", 5);
    ok &= expect_complexity("w^2*3", 7);
    ok &= expect_complexity("w+1", 3);
    ok &= expect_complexity("e_0", 3);
    ok &= expect_complexity("w^w^w^w^w", 17);

    e0::core::operation_budget budget;
    if (e0::approx::complexity(ordinal::tower(12), budget) != 5) {
        std::cerr << "complexity of w^^12\n";
        ok = false;
    }
    return ok;
}

bool test_fixed_cases() {
    bool ok = true;
    ok &= expect_simplified("w^w^w^w^w", 17, "w^(w^(w^(w^w)))");
    ok &= expect_simplified("w^w^w^w^w", 5, "w^^5");
    ok &= expect_simplified("123456", 3, "999");
    ok &= expect_simplified("w*12345", 4, "w*99");
    ok &= expect_simplified("w^2+w*5+7", 7, "w^2+w");
    ok &= expect_simplified("w^2+w*5+7", 20, "w^2+w*5+7");
    ok &= expect_simplified("e_0", 3, "e_0");
    ok &= expect_simplified("e_0", 2, "w");
    ok &= expect_simplified("w^w", 0, "0");
    ok &= expect_simplified("w^w", 4, "w^^2");

    e0::core::operation_budget budget;
    const auto unchanged = e0::approx::simplify(ordinal::tower(7), 4, budget);
    if (unchanged.changed() || unchanged.value != ordinal::tower(7)) {
        std::cerr << "w^^7 should survive a budget of 4\n";
        ok = false;
    }
    return ok;
}

bool test_random_bounds(std::mt19937_64& rng) {
    e0::core::operation_budget budget(500'000'000);
    for (int iteration = 0; iteration < 150; ++iteration) {
        const cnf_ordinal value = e0::util::random_cnf(rng, 2, 3, 4);
        for (std::size_t limit = 0; limit <= 30; limit += 3) {
            const auto result = e0::approx::simplify(value, limit, budget);
            if (result.complexity > limit) {
                std::cerr << "simplify(" << e0::io::to_string(value) << ", " << limit
                          << ") exceeded its limit with " << e0::io::to_string(result.value) << "\n";
                return false;
            }
            if (e0::core::less(value, result.value, budget)) {
                std::cerr << "simplify(" << e0::io::to_string(value) << ", " << limit
                          << ") grew to " << e0::io::to_string(result.value) << "\n";
                return false;
            }
            if (result.original_complexity <= limit && result.value != ordinal(value)) {
                std::cerr << "simplify changed a value that already fit\n";
                return false;
            }
        }
    }
    return true;
}

} // namespace

int main() {
    std::mt19937_64 rng(0xfeedbeef);
    bool all_good = true;
    all_good &= test_complexity();
    all_good &= test_fixed_cases();
    all_good &= test_random_bounds(rng);
    if (!all_good) {
        return 1;
    }
    std::cout << "simplify tests passed\n";
    return 0;
}
