// include/e0/core/detail/overloaded.hpp - Overload-set helper for exhaustive std::visit dispatch.

#pragma once

namespace e0::core::detail {

template <typename... Fns>
struct overloaded : Fns... {
    using Fns::operator()...;
};

template <typename... Fns>
overloaded(Fns...) -> overloaded<Fns...>;

} // namespace e0::core::detail
