// include/e0/mapping/params.hpp - Scale constants of the real embedding and their derived boundaries.

#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace e0::mapping {

// The four scales control how quickly f approaches its limit inside each
// arithmetic level; every derived constant follows from them.
class mapping_params {
public:
    mapping_params() : mapping_params(3.0, 3.0, 3.0, 3.0) {}

    mapping_params(double scale_add, double scale_mult, double scale_exp, double scale_tet)
        : scale_add_(checked(scale_add, "scale_add")),
          scale_mult_(checked(scale_mult, "scale_mult")),
          scale_exp_(checked(scale_exp, "scale_exp")),
          scale_tet_(checked(scale_tet, "scale_tet")) {
        exp_span_ = scale_mult_ * (1.0 + scale_exp_);
        omega_omega_value_ = 1.0 + exp_span_;
        tet_span_ = (1.0 + scale_tet_) * exp_span_;
        upper_ = 1.0 + tet_span_;
        mobius_constant_ = upper_ * upper_;
        mobius_linear_ = exp_span_ * (scale_tet_ * scale_tet_ - 1.0) - 1.0;
        mobius_pole_ = 1.0 + exp_span_ * (1.0 + scale_tet_) * (1.0 + scale_tet_);
        mobius_determinant_ = mobius_constant_ + mobius_linear_ * mobius_pole_;
        tower_region_ = 1.0 + 99.0 * tet_span_ / (99.0 + scale_tet_);
    }

    // All scales 1: f(w^2) = 2, f(w^w) = 3, f(e_0) = 5.
    static mapping_params legacy() { return mapping_params(1.0, 1.0, 1.0, 1.0); }

    double scale_add() const noexcept { return scale_add_; }
    double scale_mult() const noexcept { return scale_mult_; }
    double scale_exp() const noexcept { return scale_exp_; }
    double scale_tet() const noexcept { return scale_tet_; }

    double omega_value() const noexcept { return 1.0; }
    double omega_omega_value() const noexcept { return omega_omega_value_; }
    double upper() const noexcept { return upper_; }
    double tower_region() const noexcept { return tower_region_; }

    double exp_span() const noexcept { return exp_span_; }
    double tet_span() const noexcept { return tet_span_; }

    // f(w^k) = (constant + linear * f(k)) / (pole - f(k)) for infinite k.
    double mobius_constant() const noexcept { return mobius_constant_; }
    double mobius_linear() const noexcept { return mobius_linear_; }
    double mobius_pole() const noexcept { return mobius_pole_; }
    double mobius_determinant() const noexcept { return mobius_determinant_; }

private:
    static double checked(double value, const char* name) {
        if (!std::isfinite(value) || value <= 0.0) {
            throw std::invalid_argument(std::string("mapping_params: ") + name +
                                        " must be positive and finite");
        }
        return value;
    }

    double scale_add_;
    double scale_mult_;
    double scale_exp_;
    double scale_tet_;
    double exp_span_ = 0.0;
    double omega_omega_value_ = 0.0;
    double tet_span_ = 0.0;
    double upper_ = 0.0;
    double mobius_constant_ = 0.0;
    double mobius_linear_ = 0.0;
    double mobius_pole_ = 0.0;
    double mobius_determinant_ = 0.0;
    double tower_region_ = 0.0;
};

struct inverse_limits {
    double threshold = 1e-12;
    std::size_t max_depth = 512;
};

} // namespace e0::mapping
