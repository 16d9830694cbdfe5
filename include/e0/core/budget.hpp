// include/e0/core/budget.hpp - Operation counter shared by one top-level calculation.

#pragma once

#include <cstdint>
#include <limits>

#include <e0/core/errors.hpp>

namespace e0::core {

class operation_budget {
public:
    static constexpr std::uint64_t DEFAULT_LIMIT = 1'000'000;

    explicit operation_budget(std::uint64_t limit = DEFAULT_LIMIT) noexcept : limit_(limit) {}

    operation_budget(const operation_budget&) = delete;
    operation_budget& operator=(const operation_budget&) = delete;

    // Throws budget_exceeded once the running count passes the limit.
    void consume(std::uint64_t amount = 1) {
        if (amount > std::numeric_limits<std::uint64_t>::max() - count_) {
            count_ = std::numeric_limits<std::uint64_t>::max();
        } else {
            count_ += amount;
        }
        if (count_ > limit_) {
            throw budget_exceeded(limit_, count_);
        }
    }

    std::uint64_t count() const noexcept { return count_; }
    std::uint64_t limit() const noexcept { return limit_; }
    std::uint64_t remaining() const noexcept { return count_ >= limit_ ? 0 : limit_ - count_; }

private:
    std::uint64_t limit_;
    std::uint64_t count_ = 0;
};

} // namespace e0::core
