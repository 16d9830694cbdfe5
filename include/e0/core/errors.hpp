// include/e0/core/errors.hpp - Exception types raised by ordinal computations.

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace e0::core {

class budget_exceeded : public std::runtime_error {
public:
    budget_exceeded(std::uint64_t limit, std::uint64_t count)
        : std::runtime_error("computation too complex (budget of " + std::to_string(limit) +
                             " operations exceeded at " + std::to_string(count) + ")"),
          limit_(limit),
          count_(count) {}

    std::uint64_t limit() const noexcept { return limit_; }
    std::uint64_t count() const noexcept { return count_; }

private:
    std::uint64_t limit_;
    std::uint64_t count_;
};

// The operation is defined mathematically but has no representation below e_0,
// or it is undefined (for example 0 ^^ w).
class unsupported_operation : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

class regression_limit : public std::runtime_error {
public:
    explicit regression_limit(std::size_t depth)
        : std::runtime_error("inverse search exceeded recursion depth " + std::to_string(depth)),
          depth_(depth) {}

    std::size_t depth() const noexcept { return depth_; }

private:
    std::size_t depth_;
};

class invariant_violation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace e0::core
