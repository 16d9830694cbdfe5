// include/e0/mapping/embedding.hpp - Strictly increasing map f from [0, e_0] onto [0, U] and its inverse.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

#include <e0/core/budget.hpp>
#include <e0/core/natural.hpp>
#include <e0/core/ordinal.hpp>
#include <e0/mapping/params.hpp>
#include <e0/mapping/real_rep.hpp>

namespace e0::mapping {

// n / (n + scale), zero for n <= 0 and one for an infinite n.
double scaled_fraction(double n, double scale) noexcept;

// The memo of f values lives as long as the instance. It holds at most
// cache_limit() entries and starts over once full; clear_cache() empties it.
class embedding {
public:
    static constexpr std::size_t DEFAULT_CACHE_LIMIT = 4096;

    explicit embedding(mapping_params params = mapping_params{},
                       std::size_t cache_limit = DEFAULT_CACHE_LIMIT)
        : params_(params), cache_limit_(cache_limit) {}

    const mapping_params& params() const noexcept { return params_; }

    double f(const e0::core::ordinal& value, e0::core::operation_budget& budget);
    double f(const real_rep& value, e0::core::operation_budget& budget);

    // Largest representable shape whose image does not exceed x (up to the
    // threshold). Throws std::out_of_range outside [0, U] and
    // e0::core::regression_limit when the search nests deeper than allowed.
    rep_ptr f_inverse(double x, e0::core::operation_budget& budget,
                      const inverse_limits& limits = inverse_limits{});

    e0::core::ordinal inverse_ordinal(double x, e0::core::operation_budget& budget,
                                      const inverse_limits& limits = inverse_limits{});

    std::size_t cache_size() const noexcept { return memo_.size(); }
    std::size_t cache_limit() const noexcept { return cache_limit_; }
    void clear_cache() noexcept { memo_.clear(); }

private:
    double tower_value(std::uint64_t height) const noexcept;
    double power_value(const real_rep& exponent, e0::core::operation_budget& budget);
    double sum_value(const rep_sum& value, e0::core::operation_budget& budget);

    mapping_params params_;
    std::size_t cache_limit_;
    std::unordered_map<std::string, double> memo_;
};

} // namespace e0::mapping
