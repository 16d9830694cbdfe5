// src/mapping/inverse.cpp - Numeric inverse of the embedding by closed-form region search.

#include <e0/mapping/embedding.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

#include <e0/core/errors.hpp>

namespace e0::mapping {

namespace {

using e0::core::natural;

// Each region of [0, U] is the image of one shape (finite, w^j*m + d with
// finite j, w^k*m + r with infinite k, tall towers). The search inverts the
// closed form of that region, rounds down, and recurses on the remainder with
// the threshold scaled by the local slope of the inverse.
class inverse_search {
public:
    inverse_search(embedding& owner, e0::core::operation_budget& budget, const inverse_limits& limits)
        : owner_(owner), params_(owner.params()), budget_(budget), limits_(limits) {}

    rep_ptr run(double x, double threshold, std::size_t depth) {
        if (depth > limits_.max_depth) {
            throw e0::core::regression_limit(limits_.max_depth);
        }
        budget_.consume();
        const double upper = params_.upper();
        if (!std::isfinite(x) || x < -threshold || x > upper + threshold) {
            throw std::out_of_range("f_inverse argument lies outside [0, U]");
        }
        if (std::abs(x) <= threshold) {
            return make_finite(natural::zero());
        }
        if (std::abs(x - upper) <= threshold) {
            return make_epsilon();
        }
        if (x > params_.tower_region() && x < upper - threshold) {
            return find_tower(x, threshold);
        }
        if (std::abs(x - params_.omega_value()) <= threshold) {
            return make_power(make_finite(natural::one()));
        }
        if (std::abs(x - params_.omega_omega_value()) <= threshold) {
            return make_power(make_power(make_finite(natural::one())));
        }
        if (x < params_.omega_value()) {
            return find_finite(x, threshold);
        }
        if (x < params_.omega_omega_value()) {
            return find_omega_power(x, threshold, depth);
        }
        return find_higher_power(x, threshold, depth);
    }

private:
    double tower_height_at(double x) const {
        return (params_.tet_span() + (params_.scale_tet() - 1.0) * (x - 1.0)) / (params_.upper() - x);
    }

    rep_ptr find_tower(double x, double threshold) const {
        double height = std::floor(tower_height_at(x));
        if (height < 1.0) {
            return make_epsilon();
        }
        const double nudged = x + threshold;
        if (nudged < params_.upper() && tower_height_at(nudged) >= height + 1.0) {
            height += 1.0;
        }
        return make_tower(static_cast<std::uint64_t>(height));
    }

    rep_ptr find_finite(double x, double threshold) const {
        const double scale = params_.scale_add();
        double n = std::floor(scale * x / (1.0 - x));
        if (scaled_fraction(n + 1.0, scale) < x + threshold) {
            n += 1.0;
        }
        return make_finite(natural::from_double(n));
    }

    // f(w^j) for finite j >= 1
    double omega_power_value(double j) const {
        return 1.0 + params_.exp_span() * scaled_fraction(j - 1.0, params_.scale_exp());
    }

    // f(w^j * m)
    double omega_power_value(double j, double m) const {
        const double low = omega_power_value(j);
        return low + (omega_power_value(j + 1.0) - low) * scaled_fraction(m - 1.0, params_.scale_mult());
    }

    double find_exponent_index(double x, double threshold) const {
        const double distance = params_.omega_omega_value() - x;
        if (std::abs(x - 1.0) <= threshold || distance <= 0.0) {
            return 1.0;
        }
        double j = std::max(1.0, 1.0 + std::floor(params_.scale_exp() * (x - 1.0) / distance));
        if (omega_power_value(j + 1.0) < x + threshold) {
            j += 1.0;
        }
        return j;
    }

    // Coefficient m in [1, inf) with f(w^b * m) <= x given the endpoints
    // f(w^b) = low and f(w^(b+1)) = high.
    double find_coefficient(double x, double low, double high, double threshold) const {
        const double span = high - low;
        if (x - low < threshold || span <= 0.0) {
            return 1.0;
        }
        const double t = (x - low) / span;
        if (t < threshold || t >= 1.0 - 1e-15) {
            return 1.0;
        }
        const double scale = params_.scale_mult();
        double m = std::max(1.0, 1.0 + std::floor(scale * t / (1.0 - t)));
        const double at_m = low + span * scaled_fraction(m - 1.0, scale);
        const double at_next = low + span * scaled_fraction(m, scale);
        if (at_next < x + threshold) {
            return m + 1.0;
        }
        if (at_m > x + threshold && m > 1.0) {
            return m - 1.0;
        }
        return m;
    }

    // Remainder d < w^b of x = f(w^b*m + d), given f(w^b), f(w^b*m), f(w^b*(m+1)).
    rep_ptr find_remainder(double x, double base, double at_m, double at_next, double threshold,
                           std::size_t depth) {
        const double gap = at_next - at_m;
        if (gap <= 0.0 || x - at_m <= threshold) {
            return make_finite(natural::zero());
        }
        const double target = (x - at_m) * base / gap;
        if (target >= base) {
            return make_finite(natural::zero());
        }
        return run(target, threshold * std::max(1.0, base / gap), depth + 1);
    }

    rep_ptr find_omega_power(double x, double threshold, std::size_t depth) {
        const double j = find_exponent_index(x, threshold);
        const double m = find_coefficient(x, omega_power_value(j), omega_power_value(j + 1.0), threshold);
        const rep_ptr remainder = find_remainder(x, omega_power_value(j), omega_power_value(j, m),
                                                 omega_power_value(j, m + 1.0), threshold, depth);
        const rep_ptr exponent = make_finite(natural::from_double(j));
        if (m == 1.0 && is_zero(*remainder)) {
            return make_power(exponent);
        }
        return make_sum(exponent, natural::from_double(m), remainder);
    }

    rep_ptr find_higher_power(double x, double threshold, std::size_t depth) {
        const double pole = params_.mobius_pole();
        const double inner = (pole * x - params_.mobius_constant()) / (x + params_.mobius_linear());
        const double slope = std::max(1.0, (pole - inner) * (pole - inner) / params_.mobius_determinant());
        const rep_ptr exponent = run(inner, threshold * slope, depth + 1);
        if (is_epsilon(*exponent)) {
            return exponent;
        }
        const double low = owner_.f(*make_power(exponent), budget_);
        const double high = owner_.f(*make_power(successor(exponent)), budget_);
        const double m = find_coefficient(x, low, high, threshold);
        const double scale = params_.scale_mult();
        const double at_m = low + (high - low) * scaled_fraction(m - 1.0, scale);
        const double at_next = low + (high - low) * scaled_fraction(m, scale);
        const rep_ptr remainder = find_remainder(x, low, at_m, at_next, threshold, depth);
        if (m == 1.0 && is_zero(*remainder)) {
            return make_power(exponent);
        }
        return make_sum(exponent, natural::from_double(m), remainder);
    }

    embedding& owner_;
    const mapping_params& params_;
    e0::core::operation_budget& budget_;
    const inverse_limits& limits_;
};

} // namespace

rep_ptr embedding::f_inverse(double x, e0::core::operation_budget& budget, const inverse_limits& limits) {
    if (!(limits.threshold > 0.0)) {
        throw std::invalid_argument("inverse threshold must be positive");
    }
    inverse_search search(*this, budget, limits);
    return search.run(x, limits.threshold, 0);
}

} // namespace e0::mapping
