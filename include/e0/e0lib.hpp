// include/e0/e0lib.hpp - Umbrella header that exposes e0lib components.

#pragma once

// Umbrella header for e0lib.
// Users should generally include only this file.

#include <e0/approx/simplify.hpp>
#include <e0/core/arithmetic.hpp>
#include <e0/core/budget.hpp>
#include <e0/core/compare.hpp>
#include <e0/core/errors.hpp>
#include <e0/core/natural.hpp>
#include <e0/core/ordinal.hpp>
#include <e0/io/format.hpp>
#include <e0/io/parse.hpp>
#include <e0/mapping/embedding.hpp>
#include <e0/mapping/params.hpp>
#include <e0/mapping/real_rep.hpp>
#include <e0/util/debug.hpp>
#include <e0/util/random.hpp>

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace e0 {

    using Natural = core::natural;
    using Ordinal = core::ordinal;

    // Result of one calculator run together with the operations it spent.
    struct evaluation {
        Ordinal value;
        std::uint64_t operations = 0;
    };

    inline evaluation evaluate(std::string_view expression,
                               std::uint64_t budget_limit = core::operation_budget::DEFAULT_LIMIT) {
        core::operation_budget budget(budget_limit);
        Ordinal value = io::parse_ordinal(expression, budget);
        return {std::move(value), budget.count()};
    }

    inline constexpr int E0LIB_VERSION_MAJOR = 0;
    inline constexpr int E0LIB_VERSION_MINOR = 1;
    inline constexpr int E0LIB_VERSION_PATCH = 0;

} // namespace e0

namespace std {

    template <> struct formatter<e0::core::ordinal, char> : std::formatter<std::string_view, char> {
        template <typename FormatContext>
        auto format(const e0::core::ordinal &value, FormatContext &ctx) const {
            const std::string text = e0::io::to_string(value);
            return std::formatter<std::string_view, char>::format(text, ctx);
        }
    };

    template <>
    struct formatter<e0::core::cnf_ordinal, char> : std::formatter<std::string_view, char> {
        template <typename FormatContext>
        auto format(const e0::core::cnf_ordinal &value, FormatContext &ctx) const {
            const std::string text = e0::io::to_string(value);
            return std::formatter<std::string_view, char>::format(text, ctx);
        }
    };

} // namespace std
