// include/e0/core/natural.hpp - Arbitrary-precision natural numbers used for CNF coefficients.

#pragma once

#include <algorithm>
#include <cmath>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace e0::core {

namespace detail {

inline constexpr std::uint32_t NATURAL_BASE = 1'000'000'000U;
inline constexpr std::size_t NATURAL_BASE_DIGITS = 9;
inline constexpr std::size_t KARATSUBA_THRESHOLD = 48;

constexpr std::size_t decimal_digit_count(std::uint64_t value) noexcept {
    std::size_t count = 1;
    while (value >= 10) {
        value /= 10;
        ++count;
    }
    return count;
}

} // namespace detail

// Non-negative integer stored as little-endian base 10^9 limbs. The empty limb
// vector is zero and the most significant limb is never zero.
class natural {
public:
    natural() noexcept = default;
    natural(const natural&) = default;
    natural(natural&&) noexcept = default;
    natural& operator=(const natural&) = default;
    natural& operator=(natural&&) noexcept = default;

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    explicit natural(Int value) {
        if constexpr (std::is_signed_v<Int>) {
            if (value < 0) {
                throw std::domain_error("natural cannot hold a negative value");
            }
        }
        auto cursor = static_cast<unsigned long long>(value);
        while (cursor != 0) {
            limbs_.push_back(static_cast<std::uint32_t>(cursor % detail::NATURAL_BASE));
            cursor /= detail::NATURAL_BASE;
        }
    }

    static natural zero() noexcept { return {}; }
    static natural one() { return natural(1U); }

    static natural from_string(std::string_view text) {
        if (text.empty()) {
            throw std::invalid_argument("natural literal is empty");
        }
        for (const char ch : text) {
            if (ch < '0' || ch > '9') {
                throw std::invalid_argument("natural literal contains a non-digit");
            }
        }
        natural result;
        std::size_t end = text.size();
        while (end > 0) {
            const std::size_t begin =
                end > detail::NATURAL_BASE_DIGITS ? end - detail::NATURAL_BASE_DIGITS : 0;
            std::uint32_t chunk = 0;
            for (std::size_t index = begin; index < end; ++index) {
                chunk = chunk * 10U + static_cast<std::uint32_t>(text[index] - '0');
            }
            result.limbs_.push_back(chunk);
            end = begin;
        }
        result.normalize();
        return result;
    }

    // Floor of a finite non-negative double.
    static natural from_double(double value) {
        if (!std::isfinite(value) || value < 0.0) {
            throw std::domain_error("natural::from_double requires a finite non-negative value");
        }
        value = std::floor(value);
        if (value < 18446744073709551616.0) {
            return natural(static_cast<std::uint64_t>(value));
        }
        int exponent = 0;
        const double mantissa = std::frexp(value, &exponent);
        const auto scaled = static_cast<std::uint64_t>(std::ldexp(mantissa, 53));
        return natural(scaled) * pow(natural(2U), static_cast<std::uint64_t>(exponent - 53));
    }

    bool is_zero() const noexcept { return limbs_.empty(); }
    bool is_one() const noexcept { return limbs_.size() == 1 && limbs_[0] == 1U; }
    bool is_even() const noexcept { return limbs_.empty() || (limbs_[0] & 1U) == 0; }
    std::size_t limb_count() const noexcept { return limbs_.size(); }

    std::size_t decimal_digits() const noexcept {
        if (limbs_.empty()) {
            return 1;
        }
        return (limbs_.size() - 1) * detail::NATURAL_BASE_DIGITS +
               detail::decimal_digit_count(limbs_.back());
    }

    std::string to_string() const {
        if (limbs_.empty()) {
            return "0";
        }
        std::string text = std::to_string(limbs_.back());
        text.reserve(limbs_.size() * detail::NATURAL_BASE_DIGITS);
        for (std::size_t index = limbs_.size() - 1; index-- > 0;) {
            const std::string chunk = std::to_string(limbs_[index]);
            text.append(detail::NATURAL_BASE_DIGITS - chunk.size(), '0');
            text += chunk;
        }
        return text;
    }

    // Lossy; saturates to +infinity beyond the double range.
    double to_double() const noexcept {
        double value = 0.0;
        for (std::size_t index = limbs_.size(); index-- > 0;) {
            value = value * static_cast<double>(detail::NATURAL_BASE) + limbs_[index];
        }
        return value;
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    bool fits() const noexcept {
        const auto max_value = static_cast<unsigned long long>(std::numeric_limits<Int>::max());
        if (limbs_.size() > 3) {
            return false;
        }
        unsigned long long value = 0;
        for (std::size_t index = limbs_.size(); index-- > 0;) {
            if (value > (std::numeric_limits<unsigned long long>::max() - limbs_[index]) /
                            detail::NATURAL_BASE) {
                return false;
            }
            value = value * detail::NATURAL_BASE + limbs_[index];
        }
        return value <= max_value;
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    explicit operator Int() const {
        if (!fits<Int>()) {
            throw std::overflow_error("natural does not fit in target type");
        }
        unsigned long long value = 0;
        for (std::size_t index = limbs_.size(); index-- > 0;) {
            value = value * detail::NATURAL_BASE + limbs_[index];
        }
        return static_cast<Int>(value);
    }

    natural& operator+=(const natural& other) {
        limbs_ = add_magnitude(limbs_, other.limbs_);
        return *this;
    }

    natural& operator-=(const natural& other) {
        if (compare_magnitude_vectors(limbs_, other.limbs_) == std::strong_ordering::less) {
            throw std::domain_error("natural subtraction would underflow");
        }
        limbs_ = subtract_magnitude(limbs_, other.limbs_);
        normalize();
        return *this;
    }

    natural& operator*=(const natural& other) {
        limbs_ = multiply_karatsuba(limbs_, other.limbs_);
        normalize();
        return *this;
    }

    friend natural operator+(natural lhs, const natural& rhs) {
        lhs += rhs;
        return lhs;
    }

    friend natural operator-(natural lhs, const natural& rhs) {
        lhs -= rhs;
        return lhs;
    }

    friend natural operator*(natural lhs, const natural& rhs) {
        lhs *= rhs;
        return lhs;
    }

    static natural pow(natural base, std::uint64_t exponent) {
        natural result = one();
        while (exponent != 0) {
            if ((exponent & 1U) != 0) {
                result *= base;
            }
            exponent >>= 1U;
            if (exponent != 0) {
                base *= base;
            }
        }
        return result;
    }

    friend std::strong_ordering operator<=>(const natural& lhs, const natural& rhs) noexcept {
        return compare_magnitude_vectors(lhs.limbs_, rhs.limbs_);
    }

    friend bool operator==(const natural& lhs, const natural& rhs) noexcept {
        return lhs.limbs_ == rhs.limbs_;
    }

private:
    using digits_t = std::vector<std::uint32_t>;

    static void normalize_magnitude(digits_t& digits) {
        while (!digits.empty() && digits.back() == 0) {
            digits.pop_back();
        }
    }

    static std::strong_ordering compare_magnitude_vectors(const digits_t& lhs,
                                                          const digits_t& rhs) noexcept {
        if (lhs.size() != rhs.size()) {
            return lhs.size() < rhs.size() ? std::strong_ordering::less
                                           : std::strong_ordering::greater;
        }
        for (std::size_t index = lhs.size(); index-- > 0;) {
            const auto cmp = lhs[index] <=> rhs[index];
            if (cmp != std::strong_ordering::equal) {
                return cmp;
            }
        }
        return std::strong_ordering::equal;
    }

    static digits_t add_magnitude(const digits_t& lhs, const digits_t& rhs) {
        const std::size_t max_len = std::max(lhs.size(), rhs.size());
        digits_t result;
        result.reserve(max_len + 1);
        std::uint64_t carry = 0;
        for (std::size_t index = 0; index < max_len; ++index) {
            std::uint64_t sum = carry;
            if (index < lhs.size()) {
                sum += lhs[index];
            }
            if (index < rhs.size()) {
                sum += rhs[index];
            }
            result.push_back(static_cast<std::uint32_t>(sum % detail::NATURAL_BASE));
            carry = sum / detail::NATURAL_BASE;
        }
        if (carry != 0) {
            result.push_back(static_cast<std::uint32_t>(carry));
        }
        return result;
    }

    // Requires lhs >= rhs.
    static digits_t subtract_magnitude(const digits_t& lhs, const digits_t& rhs) {
        digits_t result;
        result.reserve(lhs.size());
        std::int64_t borrow = 0;
        for (std::size_t index = 0; index < lhs.size(); ++index) {
            std::int64_t value = static_cast<std::int64_t>(lhs[index]) - borrow;
            if (index < rhs.size()) {
                value -= rhs[index];
            }
            borrow = 0;
            if (value < 0) {
                value += detail::NATURAL_BASE;
                borrow = 1;
            }
            result.push_back(static_cast<std::uint32_t>(value));
        }
        normalize_magnitude(result);
        return result;
    }

    static digits_t multiply_schoolbook(const digits_t& lhs, const digits_t& rhs) {
        if (lhs.empty() || rhs.empty()) {
            return {};
        }
        std::vector<std::uint64_t> accumulation(lhs.size() + rhs.size(), 0);
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            std::uint64_t carry = 0;
            const std::uint64_t lhs_digit = lhs[i];
            for (std::size_t j = 0; j < rhs.size(); ++j) {
                const std::uint64_t current = accumulation[i + j] + lhs_digit * rhs[j] + carry;
                accumulation[i + j] = current % detail::NATURAL_BASE;
                carry = current / detail::NATURAL_BASE;
            }
            std::size_t index = i + rhs.size();
            while (carry != 0) {
                const std::uint64_t current = accumulation[index] + carry;
                accumulation[index] = current % detail::NATURAL_BASE;
                carry = current / detail::NATURAL_BASE;
                ++index;
            }
        }
        digits_t result(accumulation.begin(), accumulation.end());
        normalize_magnitude(result);
        return result;
    }

    static void accumulate_shifted(digits_t& target, const digits_t& digits, std::size_t offset) {
        if (digits.empty()) {
            return;
        }
        if (target.size() < offset + digits.size() + 1) {
            target.resize(offset + digits.size() + 1, 0);
        }
        std::uint64_t carry = 0;
        std::size_t index = 0;
        for (; index < digits.size(); ++index) {
            const std::uint64_t sum = std::uint64_t{target[offset + index]} + digits[index] + carry;
            target[offset + index] = static_cast<std::uint32_t>(sum % detail::NATURAL_BASE);
            carry = sum / detail::NATURAL_BASE;
        }
        while (carry != 0) {
            if (offset + index >= target.size()) {
                target.push_back(0);
            }
            const std::uint64_t sum = std::uint64_t{target[offset + index]} + carry;
            target[offset + index] = static_cast<std::uint32_t>(sum % detail::NATURAL_BASE);
            carry = sum / detail::NATURAL_BASE;
            ++index;
        }
    }

    static digits_t multiply_karatsuba(const digits_t& lhs, const digits_t& rhs) {
        if (lhs.empty() || rhs.empty()) {
            return {};
        }
        if (std::min(lhs.size(), rhs.size()) < detail::KARATSUBA_THRESHOLD) {
            return multiply_schoolbook(lhs, rhs);
        }
        const std::size_t half = std::max(lhs.size(), rhs.size()) / 2;
        const auto split = [half](const digits_t& digits) {
            const auto middle = digits.begin() + static_cast<std::ptrdiff_t>(std::min(half, digits.size()));
            digits_t low(digits.begin(), middle);
            digits_t high(middle, digits.end());
            normalize_magnitude(low);
            return std::pair{std::move(low), std::move(high)};
        };
        const auto [lhs_low, lhs_high] = split(lhs);
        const auto [rhs_low, rhs_high] = split(rhs);
        const auto z0 = multiply_karatsuba(lhs_low, rhs_low);
        const auto z2 = multiply_karatsuba(lhs_high, rhs_high);
        const auto z1 = subtract_magnitude(
            subtract_magnitude(multiply_karatsuba(add_magnitude(lhs_low, lhs_high),
                                                  add_magnitude(rhs_low, rhs_high)),
                               z0),
            z2);
        digits_t result;
        accumulate_shifted(result, z0, 0);
        accumulate_shifted(result, z1, half);
        accumulate_shifted(result, z2, 2 * half);
        normalize_magnitude(result);
        return result;
    }

    void normalize() { normalize_magnitude(limbs_); }

    digits_t limbs_;
};

} // namespace e0::core
