// examples/example_mapping.cpp - Walks sample ordinals through f and back through f_inverse.

#include <iomanip>
#include <iostream>
#include <string_view>

#include <e0/e0lib.hpp>

using e0::io::operator<<;

int
main() {
    using e0::mapping::embedding;
    using e0::mapping::mapping_params;

    const std::string_view samples[] = {"0", "5", "w", "w*3+7", "w^2+w", "w^w", "w^(w+1)*4+w^5", "w^^4",
                                        "e_0"};

    embedding map;
    std::cout << std::setprecision(15);
    std::cout << "U = " << map.params().upper() << ", f(w^w) = " << map.params().omega_omega_value()
              << '\n';
    for (const auto expression : samples) {
        e0::core::operation_budget budget;
        const auto value = e0::io::parse_ordinal(expression, budget);
        const double image = map.f(value, budget);
        const auto recovered = map.inverse_ordinal(image, budget);
        std::cout << std::setw(16) << expression << "  f = " << std::setw(20) << image
                  << "  f^-1 = " << recovered << '\n';
    }

    // Points between images land on the largest shape below them.
    for (const double x : {0.55, 1.5, 7.25, 13.5, 30.0, 48.5}) {
        e0::core::operation_budget budget;
        const auto shape = map.f_inverse(x, budget);
        std::cout << "f^-1(" << x << ") = ";
        e0::util::dump(std::cout, *shape) << " -> " << e0::mapping::to_ordinal(*shape, budget) << '\n';
    }

    embedding legacy(mapping_params::legacy());
    e0::core::operation_budget budget;
    std::cout << "legacy f(w^w^w) = " << legacy.f(e0::io::parse_ordinal("w^w^w", budget), budget)
              << " (11/3)\n";
    return 0;
}
