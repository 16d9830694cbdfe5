// tests/unit/test_ordinal_arithmetic.cpp - Unit tests for ordinal +, *, ^ and ^^ including e_0.

#include <e0/e0lib.hpp>

#include <functional>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using e0::core::cnf_ordinal;
using e0::core::natural;
using e0::core::ordinal;

using binary_op = std::function<ordinal(const ordinal&, const ordinal&, e0::core::operation_budget&)>;

bool check_text(const ordinal& value, std::string_view expected, std::string_view label) {
    const std::string text = e0::io::to_string(value);
    if (text == expected) {
        return true;
    }
    std::cerr << label << ": " << text << " != " << expected << "\n";
    return false;
}

bool check_expression(std::string_view expression, std::string_view expected) {
    return check_text(e0::io::calculate(expression), expected, expression);
}

bool test_basic_laws() {
    bool ok = true;
    ok &= check_expression("1+w", "w");
    ok &= check_expression("w+1", "w+1");
    ok &= check_expression("(w+1)*2", "w*2+1");
    ok &= check_expression("2*w", "w");
    ok &= check_expression("w*2", "w*2");
    ok &= check_expression("(w*3+5)*(w+2)", "w^2+w*6+5");
    ok &= check_expression("w^2*3+w+w^2", "w^2*4");
    ok &= check_expression("w*5+w^3", "w^3");
    ok &= check_expression("2^w", "w");
    ok &= check_expression("2^(w+1)", "w*2");
    ok &= check_expression("3^(w^2+w*2+5)", "w^(w+2)*243");
    ok &= check_expression("2^(w^w)", "w^(w^w)");
    ok &= check_expression("2^(w^(w+1))", "w^(w^(w+1))");
    ok &= check_expression("2^(w^w*2)", "w^(w^w*2)");
    ok &= check_expression("5^(w^(w*2+3)*2+w^4+2)", "w^(w^(w*2+3)*2+w^3)*25");
    if (!(e0::io::calculate("(2^(w^w))^w") == e0::io::calculate("2^(w^(w+1))"))) {
        std::cerr << "(2^(w^w))^w != 2^(w^(w+1))\n";
        ok = false;
    }
    ok &= check_expression("(w+1)^2", "w^2+w+1");
    ok &= check_expression("(w*2)^2", "w^2*2");
    ok &= check_expression("(w+1)^w", "w^w");
    ok &= check_expression("(w+1)^(w+1)", "w^(w+1)+w^w");
    ok &= check_expression("w^(w+1)", "w^(w+1)");
    ok &= check_expression("0^w", "0");
    ok &= check_expression("1^w", "1");
    ok &= check_expression("w^0", "1");
    ok &= check_expression("7^3", "343");
    return ok;
}

bool test_tetration() {
    bool ok = true;
    ok &= check_expression("w^^2", "w^w");
    ok &= check_expression("w^^3", "w^(w^w)");
    ok &= check_expression("2^^3", "16");
    ok &= check_expression("3^^2", "27");
    ok &= check_expression("w^^w", "e_0");
    ok &= check_expression("(w+1)^^w", "e_0");
    ok &= check_expression("3^^w", "w");
    ok &= check_expression("1^^w", "1");
    ok &= check_expression("w^^0", "1");
    ok &= check_expression("w^^1", "w");
    ok &= check_expression("0^^3", "0");
    ok &= check_expression("0^^4", "1");
    try {
        (void)e0::io::calculate("0^^w");
        std::cerr << "0^^w did not throw\n";
        ok = false;
    } catch (const e0::core::unsupported_operation&) {
    }

    e0::core::operation_budget budget;
    for (std::uint64_t height = 0; height <= 8; ++height) {
        const ordinal tetrated = e0::core::tetrate(cnf_ordinal::omega(), cnf_ordinal(height), budget);
        const cnf_ordinal written = e0::core::to_cnf(e0::core::omega_tower{height}, budget);
        if (tetrated != ordinal(written)) {
            std::cerr << "w^^" << height << " does not match its tower form\n";
            ok = false;
        }
    }
    return ok;
}

bool test_helpers() {
    e0::core::operation_budget budget;
    const cnf_ordinal omega = cnf_ordinal::omega();
    const cnf_ordinal omega_plus = e0::core::add(omega, cnf_ordinal(3), budget);
    bool ok = true;
    ok &= check_text(e0::core::exponent_predecessor(cnf_ordinal(5), budget), "4", "pred 5");
    ok &= check_text(e0::core::exponent_predecessor(omega_plus, budget), "w+2", "pred w+3");
    ok &= check_text(e0::core::exponent_predecessor(omega, budget), "w", "pred w");
    ok &= check_text(e0::core::exponent_predecessor(cnf_ordinal::zero(), budget), "0", "pred 0");
    const cnf_ordinal value = e0::core::add(cnf_ordinal::omega_power(cnf_ordinal(3), natural(2U)),
                                            e0::core::add(omega, cnf_ordinal(4), budget), budget);
    ok &= check_text(e0::core::divide_by_omega(value, budget), "w^2*2+1", "divide_by_omega");
    ok &= check_text(e0::core::divide_by_omega(cnf_ordinal(9), budget), "0", "divide_by_omega finite");
    const cnf_ordinal infinite_exponents = e0::core::add(
        cnf_ordinal::omega_power(omega_plus, natural(2U)), cnf_ordinal::omega_power(omega), budget);
    ok &= check_text(e0::core::divide_by_omega(infinite_exponents, budget), "w^(w+3)*2+w^w",
                     "divide_by_omega infinite exponents");
    return ok;
}

bool test_epsilon_rules() {
    bool ok = true;
    ok &= check_expression("3+e_0", "e_0");
    ok &= check_expression("w^w+e_0", "e_0");
    ok &= check_expression("e_0+0", "e_0");
    ok &= check_expression("2*e_0", "e_0");
    ok &= check_expression("0*e_0", "0");
    ok &= check_expression("e_0*0", "0");
    ok &= check_expression("e_0*1", "e_0");
    ok &= check_expression("e_0^0", "1");
    ok &= check_expression("e_0^1", "e_0");
    ok &= check_expression("2^e_0", "e_0");
    ok &= check_expression("w^e_0", "e_0");
    ok &= check_expression("0^e_0", "0");
    ok &= check_expression("1^e_0", "1");
    ok &= check_expression("e_0^^0", "1");
    ok &= check_expression("e_0^^1", "e_0");
    ok &= check_expression("1^^e_0", "1");
    ok &= check_expression("5^^e_0", "w");
    ok &= check_expression("w^^e_0", "e_0");
    ok &= check_expression("w^^4+e_0", "e_0");

    const std::string_view unsupported[] = {"e_0+1", "e_0+e_0", "e_0*2", "e_0*e_0", "e_0^2",
                                            "e_0^e_0", "e_0^^2", "0^^e_0", "e_0^^e_0"};
    for (const auto expression : unsupported) {
        try {
            (void)e0::io::calculate(expression);
            std::cerr << expression << " did not throw\n";
            ok = false;
        } catch (const e0::core::unsupported_operation&) {
        }
    }
    try {
        e0::core::operation_budget budget;
        (void)e0::core::to_cnf(ordinal::epsilon(), budget);
        std::cerr << "e_0 converted to CNF\n";
        ok = false;
    } catch (const e0::core::unsupported_operation&) {
    }
    return ok;
}

bool test_towers_as_operands() {
    bool ok = true;
    e0::core::operation_budget budget;
    const ordinal sum = e0::core::add(ordinal::tower(3), cnf_ordinal(1), budget);
    ok &= check_text(sum, "w^(w^w)+1", "w^^3 + 1");
    const ordinal absorbed = e0::core::add(cnf_ordinal::omega(), ordinal::tower(2), budget);
    ok &= check_text(absorbed, "w^w", "w + w^^2");
    return ok;
}

bool check_identity(const ordinal& lhs, const ordinal& rhs, std::string_view law, const cnf_ordinal& a,
                    const cnf_ordinal& b, const cnf_ordinal& c) {
    if (lhs == rhs) {
        return true;
    }
    std::cerr << law << " fails for a=" << e0::io::to_string(a) << " b=" << e0::io::to_string(b)
              << " c=" << e0::io::to_string(c) << "\n";
    return false;
}

bool test_random_identities(std::mt19937_64& rng) {
    const binary_op add = [](const ordinal& x, const ordinal& y, e0::core::operation_budget& budget) {
        return e0::core::add(x, y, budget);
    };
    const binary_op multiply = [](const ordinal& x, const ordinal& y, e0::core::operation_budget& budget) {
        return e0::core::multiply(x, y, budget);
    };
    const binary_op power = [](const ordinal& x, const ordinal& y, e0::core::operation_budget& budget) {
        return e0::core::power(x, y, budget);
    };

    for (int iteration = 0; iteration < 150; ++iteration) {
        e0::core::operation_budget budget(50'000'000);
        const cnf_ordinal a = e0::util::random_cnf(rng, 1, 2, 1);
        const cnf_ordinal b = e0::util::random_cnf(rng, 1, 2, 1);
        const cnf_ordinal c = e0::util::random_cnf(rng, 1, 2, 1);
        if (!check_identity(add(add(a, b, budget), c, budget), add(a, add(b, c, budget), budget),
                            "associativity of +", a, b, c)) {
            return false;
        }
        if (!check_identity(multiply(multiply(a, b, budget), c, budget),
                            multiply(a, multiply(b, c, budget), budget), "associativity of *", a, b, c)) {
            return false;
        }
        if (!check_identity(multiply(a, add(b, c, budget), budget),
                            add(multiply(a, b, budget), multiply(a, c, budget), budget),
                            "left distributivity", a, b, c)) {
            return false;
        }
        if (!check_identity(power(a, add(b, c, budget), budget),
                            multiply(power(a, b, budget), power(a, c, budget), budget),
                            "a^(b+c) = a^b * a^c", a, b, c)) {
            return false;
        }
        if (!(ordinal(a) <= add(a, b, budget)) || !(ordinal(b) <= add(a, b, budget))) {
            std::cerr << "sum below an operand\n";
            return false;
        }
    }
    return true;
}

// Finite bases reach w^xi through divide_by_omega, so exponents here carry
// infinite successor exponents of their own.
bool test_random_power_laws(std::mt19937_64& rng) {
    std::uniform_int_distribution<int> base_dist(2, 9);
    int checked = 0;
    for (int iteration = 0; iteration < 200; ++iteration) {
        e0::core::operation_budget budget(5'000'000);
        const cnf_ordinal a =
            iteration % 2 == 0 ? cnf_ordinal(base_dist(rng)) : e0::util::random_cnf(rng, 1, 2, 1);
        const cnf_ordinal b = e0::util::random_cnf(rng, 2, 2, 1);
        const cnf_ordinal c = e0::util::random_cnf(rng, 2, 2, 1);
        try {
            if (!check_identity(e0::core::power(e0::core::power(a, b, budget), c, budget),
                                e0::core::power(a, e0::core::multiply(b, c, budget), budget),
                                "(a^b)^c = a^(b*c)", a, b, c)) {
                return false;
            }
            if (!check_identity(e0::core::power(a, e0::core::add(b, c, budget), budget),
                                e0::core::multiply(e0::core::power(a, b, budget),
                                                   e0::core::power(a, c, budget), budget),
                                "a^(b+c) = a^b * a^c", a, b, c)) {
                return false;
            }
            const auto order = e0::core::compare(b, c, budget);
            const cnf_ordinal low = order < 0 ? b : c;
            const cnf_ordinal high = order < 0 ? c : b;
            if (!a.is_zero() && !a.is_one() &&
                !(e0::core::power(a, low, budget) <= e0::core::power(a, high, budget))) {
                std::cerr << "a^x not monotone for a=" << e0::io::to_string(a) << " x="
                          << e0::io::to_string(low) << " y=" << e0::io::to_string(high) << "\n";
                return false;
            }
            ++checked;
        } catch (const e0::core::budget_exceeded&) {
            continue;
        }
    }
    if (checked < 50) {
        std::cerr << "only " << checked << " power law samples fit the budget\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    std::mt19937_64 rng(0xfeedbeef);
    bool all_good = true;
    all_good &= test_basic_laws();
    all_good &= test_tetration();
    all_good &= test_helpers();
    all_good &= test_epsilon_rules();
    all_good &= test_towers_as_operands();
    all_good &= test_random_identities(rng);
    all_good &= test_random_power_laws(rng);
    if (!all_good) {
        return 1;
    }
    std::cout << "ordinal_arithmetic tests passed\n";
    return 0;
}
