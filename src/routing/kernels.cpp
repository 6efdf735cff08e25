/**
 * @file kernels.cpp
 * @brief Per-segment Muskingum-Cunge kernels
 */

#include "ddr/routing/kernels.hpp"
#include <algorithm>
#include <cmath>

namespace ddr {
namespace kernels {

Hydraulics hydraulics(
    const Vector& discharge,
    const SpatialParameters& physical,
    const Vector& slope,
    const Vector& width,
    const RoutingConfig& config
) {
    const Index n = discharge.size();

    Hydraulics h;
    h.power_base = Vector::Zero(n);
    h.depth_raw.resize(n);
    h.depth.resize(n);
    h.velocity_raw.resize(n);
    h.velocity.resize(n);
    h.celerity.resize(n);

    for (Index i = 0; i < n; ++i) {
        const Real n_i = physical.n(i);
        const Real q_i = physical.q_spatial(i);
        const Real p_i = physical.p_spatial(i);
        const Real sqrt_s = std::sqrt(slope(i));

        Real depth_raw;
        if (config.depth_method == DepthMethod::PowerLaw) {
            const Real base = discharge(i) * n_i * (q_i + 1.0) / (p_i * sqrt_s);
            h.power_base(i) = base;
            depth_raw = std::pow(base, 3.0 / (5.0 + 3.0 * q_i));
        } else {
            depth_raw = std::log(width(i) / p_i) / std::log(q_i);
        }
        h.depth_raw(i) = depth_raw;

        // NaN (e.g. 0/0 at q = 1) falls back to the floor like any shallow reach
        const Real depth = std::isnan(depth_raw) ? config.depth_floor
                                                 : std::max(depth_raw, config.depth_floor);
        h.depth(i) = depth;

        const Real v = std::pow(depth, constants::MANNING_DEPTH_EXPONENT) * sqrt_s / n_i;
        h.velocity_raw(i) = v;

        const Real v_clamped = std::isnan(v)
            ? config.velocity_lower_bound
            : std::clamp(v, config.velocity_lower_bound, config.velocity_upper_bound);
        h.velocity(i) = v_clamped;
        h.celerity(i) = constants::KINEMATIC_CELERITY_FACTOR * v_clamped;
    }

    return h;
}

MuskingumCoefficients muskingum_coefficients(
    const Vector& length,
    const Vector& celerity,
    Real x_storage,
    Real dt
) {
    MuskingumCoefficients m;
    m.k = length.cwiseQuotient(celerity);

    const auto k = m.k.array();
    m.denom = (2.0 * k * (1.0 - x_storage) + dt).matrix();

    const auto denom = m.denom.array();
    m.c1 = ((dt - 2.0 * k * x_storage) / denom).matrix();
    m.c2 = ((dt + 2.0 * k * x_storage) / denom).matrix();
    m.c3 = ((2.0 * k * (1.0 - x_storage) - dt) / denom).matrix();
    m.c4 = ((2.0 * dt) / denom).matrix();
    return m;
}

Vector coefficient_gradient_k(
    const MuskingumCoefficients& coeffs,
    const Vector& grad_c1,
    const Vector& grad_c2,
    const Vector& grad_c3,
    const Vector& grad_c4,
    Real x_storage,
    Real dt
) {
    const auto inv_d2 = coeffs.denom.array().square().inverse();

    const auto dc1 = -2.0 * dt * inv_d2;
    const auto dc2 = 2.0 * dt * (2.0 * x_storage - 1.0) * inv_d2;
    const auto dc3 = 4.0 * dt * (1.0 - x_storage) * inv_d2;
    const auto dc4 = -dc3;

    return (grad_c1.array() * dc1 + grad_c2.array() * dc2 +
            grad_c3.array() * dc3 + grad_c4.array() * dc4).matrix();
}

Vector clamp_min(const Vector& v, Real floor) {
    return v.cwiseMax(floor);
}

} // namespace kernels
} // namespace ddr
