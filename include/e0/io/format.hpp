// include/e0/io/format.hpp - Canonical text for ordinals ("w^(w+1)*3+w+2", "e_0", "w^^5").

#pragma once

#include <ostream>
#include <string>
#include <variant>

#include <e0/core/detail/overloaded.hpp>
#include <e0/core/natural.hpp>
#include <e0/core/ordinal.hpp>

namespace e0::io {

    inline std::string to_string(const e0::core::natural &value) { return value.to_string(); }

    inline std::string to_string(const e0::core::cnf_ordinal &value) {
        if (value.is_zero()) {
            return "0";
        }
        std::string text;
        for (const auto &term : value.terms()) {
            if (!text.empty()) {
                text += '+';
            }
            const auto &exponent = term.exponent;
            if (exponent.is_zero()) {
                text += term.coefficient.to_string();
                continue;
            }
            if (exponent.is_one()) {
                text += 'w';
            } else {
                const bool wrap = exponent.term_count() > 1 ||
                                  (!exponent.is_finite() && !exponent.is_omega());
                text += "w^";
                text += wrap ? "(" + to_string(exponent) + ")" : to_string(exponent);
            }
            if (!term.coefficient.is_one()) {
                text += '*';
                text += term.coefficient.to_string();
            }
        }
        return text;
    }

    inline std::string to_string(const e0::core::ordinal &value) {
        return std::visit(e0::core::detail::overloaded{
                              [](const e0::core::cnf_ordinal &cnf) { return to_string(cnf); },
                              [](e0::core::epsilon_naught) { return std::string("e_0"); },
                              [](e0::core::omega_tower tower) {
                                  return "w^^" + std::to_string(tower.height);
                              },
                          },
                          value.value());
    }

    inline std::ostream &operator<<(std::ostream &os, const e0::core::natural &value) {
        return os << to_string(value);
    }

    inline std::ostream &operator<<(std::ostream &os, const e0::core::cnf_ordinal &value) {
        return os << to_string(value);
    }

    inline std::ostream &operator<<(std::ostream &os, const e0::core::ordinal &value) {
        return os << to_string(value);
    }

} // namespace e0::io
