// include/e0/util/debug.hpp - Diagnostic dump helpers for ordinals, budgets and embedding shapes.

#pragma once

#include <ostream>

#include <e0/core/budget.hpp>
#include <e0/core/natural.hpp>
#include <e0/core/ordinal.hpp>
#include <e0/io/format.hpp>
#include <e0/mapping/real_rep.hpp>

namespace e0::util {

inline std::ostream& dump(std::ostream& os, const e0::core::natural& value) {
    return os << "natural(" << e0::io::to_string(value) << ')';
}

inline std::ostream& dump(std::ostream& os, const e0::core::cnf_ordinal& value) {
    return os << "cnf(" << e0::io::to_string(value) << ", terms=" << value.term_count() << ')';
}

inline std::ostream& dump(std::ostream& os, const e0::core::ordinal& value) {
    return os << "ordinal(" << e0::io::to_string(value) << ')';
}

inline std::ostream& dump(std::ostream& os, const e0::core::operation_budget& budget) {
    return os << "budget(" << budget.count() << '/' << budget.limit() << ')';
}

inline std::ostream& dump(std::ostream& os, const e0::mapping::real_rep& value) {
    return os << "real_rep(" << e0::mapping::cache_key(value) << ')';
}

} // namespace e0::util
