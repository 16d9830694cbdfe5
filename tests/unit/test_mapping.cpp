// tests/unit/test_mapping.cpp - Unit tests for the real embedding f and its numeric inverse.

#include <e0/e0lib.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using e0::core::cnf_ordinal;
using e0::core::ordinal;
using e0::core::operation_budget;
using e0::mapping::embedding;
using e0::mapping::mapping_params;

ordinal parse(std::string_view expression) {
    operation_budget budget;
    return e0::io::parse_ordinal(expression, budget);
}

double f(embedding& map, std::string_view expression) {
    operation_budget budget;
    return map.f(parse(expression), budget);
}

bool expect_near(double actual, double expected, std::string_view label) {
    if (std::abs(actual - expected) <= 1e-12 * std::max(1.0, std::abs(expected))) {
        return true;
    }
    std::cerr.precision(17);
    std::cerr << label << ": " << actual << " != " << expected << "\n";
    return false;
}

bool test_closed_forms() {
    embedding legacy(mapping_params::legacy());
    bool ok = true;
    ok &= expect_near(f(legacy, "0"), 0.0, "legacy f(0)");
    ok &= expect_near(f(legacy, "1"), 0.5, "legacy f(1)");
    ok &= expect_near(f(legacy, "w"), 1.0, "legacy f(w)");
    ok &= expect_near(f(legacy, "w^2"), 2.0, "legacy f(w^2)");
    ok &= expect_near(f(legacy, "w^w"), 3.0, "legacy f(w^w)");
    ok &= expect_near(f(legacy, "w^w^w"), 11.0 / 3.0, "legacy f(w^w^w)");
    ok &= expect_near(f(legacy, "w*2+1"), 19.0 / 12.0, "legacy f(w*2+1)");
    ok &= expect_near(f(legacy, "w^2+w"), 25.0 / 12.0, "legacy f(w^2+w)");
    ok &= expect_near(f(legacy, "e_0"), 5.0, "legacy f(e_0)");

    embedding standard;
    ok &= expect_near(f(standard, "7"), 0.7, "f(7)");
    ok &= expect_near(f(standard, "w+1"), 1.1875, "f(w+1)");
    ok &= expect_near(f(standard, "w*3+7"), 2.41, "f(w*3+7)");
    ok &= expect_near(f(standard, "w^2"), 4.0, "f(w^2)");
    ok &= expect_near(f(standard, "w^w"), 13.0, "f(w^w)");
    ok &= expect_near(f(standard, "e_0"), 49.0, "f(e_0)");
    ok &= expect_near(standard.params().upper(), 49.0, "U");

    operation_budget budget;
    ok &= expect_near(standard.f(ordinal::tower(3), budget), f(standard, "w^w^w"), "tower 3 vs CNF");
    ok &= expect_near(standard.f(ordinal::tower(2), budget), 13.0, "tower 2");
    return ok;
}

bool test_monotone_chain() {
    embedding map;
    const std::vector<ordinal> chain = {parse("0"),       parse("1"),     parse("2"),
                                        parse("w"),       parse("w+1"),   parse("w*2"),
                                        parse("w^2"),     parse("w^w"),   parse("w^(w+1)"),
                                        ordinal::tower(3), ordinal::tower(10), ordinal::tower(1000),
                                        ordinal::epsilon()};
    operation_budget budget;
    double previous = -1.0;
    for (const auto& value : chain) {
        const double image = map.f(value, budget);
        if (!(image > previous) || image > map.params().upper()) {
            std::cerr << "f is not increasing at " << e0::io::to_string(value) << "\n";
            return false;
        }
        previous = image;
    }
    return true;
}

bool test_random_monotone(std::mt19937_64& rng) {
    embedding map;
    for (int iteration = 0; iteration < 300; ++iteration) {
        operation_budget budget;
        const cnf_ordinal a = e0::util::random_cnf(rng, 1, 3, 2);
        const cnf_ordinal b = e0::util::random_cnf(rng, 1, 3, 2);
        const auto order = e0::core::compare(a, b, budget);
        const double fa = map.f(a, budget);
        const double fb = map.f(b, budget);
        if ((order < 0 && !(fa < fb)) || (order > 0 && !(fa > fb)) || (order == 0 && fa != fb)) {
            std::cerr << "f disagrees with the order of " << e0::io::to_string(a) << " and "
                      << e0::io::to_string(b) << "\n";
            return false;
        }
    }
    return true;
}

bool test_exact_round_trips() {
    embedding map;
    const std::string_view samples[] = {"0",   "1",         "7",     "w",       "w*3+7", "w^2",
                                        "w^2*2+w", "w^w", "w^w*2", "w^(w+1)", "e_0"};
    for (const auto expression : samples) {
        operation_budget budget;
        const ordinal value = parse(expression);
        const double image = map.f(value, budget);
        const ordinal recovered = map.inverse_ordinal(image, budget);
        if (recovered != value) {
            std::cerr << "f_inverse(f(" << expression << ")) = " << e0::io::to_string(recovered) << "\n";
            return false;
        }
    }
    operation_budget budget;
    const double tall = map.f(ordinal::tower(150), budget);
    const ordinal recovered = map.inverse_ordinal(tall, budget);
    if (!recovered.is_tower() || recovered.tower_height() != 150) {
        std::cerr << "f_inverse of a tall tower gave " << e0::io::to_string(recovered) << "\n";
        return false;
    }
    return true;
}

bool test_inverse_is_a_floor(std::mt19937_64& rng) {
    embedding map;
    std::uniform_real_distribution<double> dist(0.0, map.params().upper());
    for (int iteration = 0; iteration < 200; ++iteration) {
        const double x = dist(rng);
        operation_budget budget;
        const auto shape = map.f_inverse(x, budget);
        const double image = map.f(*shape, budget);
        if (image > x + 1e-6 || image < 0.0) {
            std::cerr.precision(17);
            std::cerr << "f(f_inverse(" << x << ")) = " << image << "\n";
            return false;
        }
    }
    return true;
}

bool test_failures() {
    embedding map;
    bool ok = true;
    const double outside[] = {-1.0, 50.0, std::numeric_limits<double>::quiet_NaN()};
    for (const double x : outside) {
        try {
            operation_budget budget;
            (void)map.f_inverse(x, budget);
            std::cerr << "f_inverse(" << x << ") did not throw\n";
            ok = false;
        } catch (const std::out_of_range&) {
        }
    }
    try {
        operation_budget budget;
        const double x = f(map, "w^(w^2)");
        (void)map.f_inverse(x, budget, e0::mapping::inverse_limits{1e-12, 0});
        std::cerr << "depth cap of zero was not enforced\n";
        ok = false;
    } catch (const e0::core::regression_limit& error) {
        if (error.depth() != 0) {
            std::cerr << "regression_limit reports depth " << error.depth() << "\n";
            ok = false;
        }
    }
    try {
        operation_budget budget;
        (void)map.f_inverse(1.0, budget, e0::mapping::inverse_limits{0.0, 8});
        std::cerr << "zero threshold accepted\n";
        ok = false;
    } catch (const std::invalid_argument&) {
    }
    try {
        (void)mapping_params(0.0, 1.0, 1.0, 1.0);
        std::cerr << "zero scale accepted\n";
        ok = false;
    } catch (const std::invalid_argument&) {
    }
    try {
        (void)mapping_params(1.0, std::numeric_limits<double>::infinity(), 1.0, 1.0);
        std::cerr << "infinite scale accepted\n";
        ok = false;
    } catch (const std::invalid_argument&) {
    }
    return ok;
}

bool test_representation_conversions() {
    bool ok = true;
    for (const std::string_view expression : {"0", "12", "w", "w^2*3+7", "w^(w+1)*2+w^w+5", "e_0"}) {
        operation_budget budget;
        const ordinal value = parse(expression);
        const ordinal back = e0::mapping::to_ordinal(*e0::mapping::to_real_rep(value), budget);
        if (!(back == value)) {
            std::cerr << "real_rep conversion changed " << expression << "\n";
            ok = false;
        }
    }

    operation_budget budget;
    const ordinal tall = e0::mapping::to_ordinal(*e0::mapping::to_real_rep(ordinal::tower(40)), budget);
    if (!tall.is_tower() || tall.tower_height() != 40) {
        std::cerr << "tower did not survive the real_rep conversion\n";
        ok = false;
    }

    const ordinal next = e0::mapping::to_ordinal(*e0::mapping::successor(e0::mapping::make_tower(5)), budget);
    const ordinal expected = e0::core::add(ordinal::tower(5), ordinal(cnf_ordinal(1U)), budget);
    if (!(next == expected)) {
        std::cerr << "successor of w^^5 is wrong\n";
        ok = false;
    }

    embedding map;
    ok &= expect_near(map.f(ordinal::tower(100), budget), map.params().tower_region(), "f(w^^100)");
    return ok;
}

bool test_cache() {
    embedding map;
    (void)f(map, "w^w*3+w^5+2");
    if (map.cache_size() == 0) {
        std::cerr << "memo stayed empty\n";
        return false;
    }
    map.clear_cache();
    if (map.cache_size() != 0) {
        std::cerr << "clear_cache left entries\n";
        return false;
    }
    return true;
}

bool test_cache_limit() {
    embedding bounded(mapping_params{}, 8);
    embedding unbounded;
    bool ok = true;
    for (int index = 1; index <= 40; ++index) {
        const std::string expression = "w^" + std::to_string(index) + "*3+" + std::to_string(index);
        ok &= expect_near(f(bounded, expression), f(unbounded, expression), expression);
        if (bounded.cache_size() > bounded.cache_limit()) {
            std::cerr << "memo grew past its limit: " << bounded.cache_size() << "\n";
            return false;
        }
    }
    embedding uncached(mapping_params{}, 0);
    ok &= expect_near(f(uncached, "w^w*2+5"), f(unbounded, "w^w*2+5"), "uncached f");
    if (uncached.cache_size() != 0) {
        std::cerr << "a zero cache limit still stored entries\n";
        ok = false;
    }
    return ok;
}

} // namespace

int main() {
    std::mt19937_64 rng(0xfeedbeef);
    bool all_good = true;
    all_good &= test_closed_forms();
    all_good &= test_monotone_chain();
    all_good &= test_random_monotone(rng);
    all_good &= test_exact_round_trips();
    all_good &= test_inverse_is_a_floor(rng);
    all_good &= test_failures();
    all_good &= test_representation_conversions();
    all_good &= test_cache();
    all_good &= test_cache_limit();
    if (!all_good) {
        return 1;
    }
    std::cout << "mapping tests passed\n";
    return 0;
}
