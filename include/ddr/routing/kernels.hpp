/**
 * @file kernels.hpp
 * @brief Per-segment Muskingum-Cunge kernels
 *
 * Hydraulics (depth -> Manning velocity -> celerity) and the Muskingum
 * coefficients derived from the wave travel time. All operations are
 * element-wise over segments; the clamps are applied here and their raw
 * inputs are kept so the reverse pass knows where a clamp was active.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../core/parameters.hpp"

namespace ddr {
namespace kernels {

/**
 * @brief Hydraulic state of every segment at one timestep
 */
struct Hydraulics {
    Vector power_base;      ///< PowerLaw only: Q n (q+1) / (p √S)
    Vector depth_raw;       ///< Depth before the depth floor [m]
    Vector depth;           ///< max(depth_raw, depth_floor) [m]
    Vector velocity_raw;    ///< Manning velocity before clamping [m/s]
    Vector velocity;        ///< Clamped to [lower, upper] [m/s]
    Vector celerity;        ///< 5/3 * velocity [m/s]
};

/**
 * @brief Depth, velocity and celerity from Manning's equation
 *
 * PowerLaw:    depth = (Q n (q+1) / (p √S))^(3 / (5 + 3q))
 * WidthRating: depth = ln(width / p) / ln(q)
 * Then v = depth^(2/3) √S / n, clamped, and c = 5/3 v.
 *
 * @param discharge Current discharge [m³/s]
 * @param physical Denormalized parameters
 * @param slope Channel slope, already floored
 * @param width Channel width [m] (WidthRating only)
 */
Hydraulics hydraulics(
    const Vector& discharge,
    const SpatialParameters& physical,
    const Vector& slope,
    const Vector& width,
    const RoutingConfig& config
);

/**
 * @brief Muskingum routing coefficients of every segment
 *
 * With k = L / c and D = 2k(1-X) + Δt:
 *   c1 = (Δt - 2kX) / D      c2 = (Δt + 2kX) / D
 *   c3 = (2k(1-X) - Δt) / D  c4 = 2Δt / D
 * c1 + c2 + c3 = 1.
 */
struct MuskingumCoefficients {
    Vector k;
    Vector denom;
    Vector c1;
    Vector c2;
    Vector c3;
    Vector c4;
};

MuskingumCoefficients muskingum_coefficients(
    const Vector& length,
    const Vector& celerity,
    Real x_storage,
    Real dt
);

/**
 * @brief Partial derivatives of c1..c4 with respect to k
 *
 * dc1/dk = -2Δt / D²          dc2/dk = 2Δt(2X - 1) / D²
 * dc3/dk = 4Δt(1 - X) / D²    dc4/dk = -4Δt(1 - X) / D²
 */
Vector coefficient_gradient_k(
    const MuskingumCoefficients& coeffs,
    const Vector& grad_c1,
    const Vector& grad_c2,
    const Vector& grad_c3,
    const Vector& grad_c4,
    Real x_storage,
    Real dt
);

/// max(v, floor) element-wise
Vector clamp_min(const Vector& v, Real floor);

} // namespace kernels
} // namespace ddr
