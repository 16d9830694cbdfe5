// examples/example_calculator.cpp - Evaluates ordinal expressions and prints CNF, simplified form and f.

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <e0/e0lib.hpp>

using e0::io::operator<<;

int
main(int argc, char **argv) {
    std::vector<std::string> expressions;
    for (int index = 1; index < argc; ++index) {
        expressions.emplace_back(argv[index]);
    }
    if (expressions.empty()) {
        expressions = {"(w+1)*2", "2^(w+1)", "(w+1)^(w+1)", "w^^w", "w^^3^^2", "9^^9", "e_0+1"};
    }

    e0::mapping::embedding map;
    int failures = 0;
    for (const auto &expression : expressions) {
        std::cout << expression << '\n';
        try {
            const auto result = e0::evaluate(expression);
            std::cout << "  CNF:        " << result.value << '\n';
            std::cout << "  operations: " << result.operations << '\n';

            e0::core::operation_budget budget;
            const auto simplified =
                e0::approx::simplify(result.value, e0::approx::DEFAULT_COMPLEXITY_LIMIT, budget);
            if (simplified.changed()) {
                std::cout << "  simplified: " << simplified.value << '\n';
            }
            std::cout << "  complexity: " << simplified.complexity << " / "
                      << simplified.original_complexity << '\n';
            std::cout << "  f:          " << map.f(simplified.value, budget) << '\n';
        } catch (const e0::core::budget_exceeded &err) {
            std::cout << "  " << err.what() << '\n';
            ++failures;
        } catch (const e0::core::unsupported_operation &err) {
            std::cout << "  unsupported: " << err.what() << '\n';
            ++failures;
        } catch (const e0::io::parse_error &err) {
            std::cout << "  parse error: " << err.what() << '\n';
            ++failures;
        }
    }
    return failures == static_cast<int>(expressions.size()) ? 1 : 0;
}
