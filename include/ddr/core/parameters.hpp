/**
 * @file parameters.hpp
 * @brief Learned routing parameters
 *
 * The parameter estimator emits per-segment values in [0, 1]. They are
 * rescaled into physical ranges before routing:
 *   value * (max - min) + min
 */

#pragma once

#include "types.hpp"
#include "config.hpp"

namespace ddr {

/**
 * @brief Per-segment parameters, either normalized or physical
 */
struct SpatialParameters {
    Vector n;               ///< Manning's roughness
    Vector q_spatial;       ///< Channel shape exponent
    Vector p_spatial;       ///< Channel width coefficient

    /// Same value on every segment
    static SpatialParameters uniform(Index n_segments, Real n_val, Real q_val, Real p_val);

    /// @throws StructuralError if any vector is not of length n_segments
    void check_size(Index n_segments) const;
};

/**
 * @brief Rescale a [0, 1] value into [range.min, range.max]
 */
inline Real denormalize(Real value, const ParameterRange& range) {
    return value * range.span() + range.min;
}

Vector denormalize(const Vector& value, const ParameterRange& range);

/**
 * @brief Rescale all three learned parameters
 */
SpatialParameters denormalize(const SpatialParameters& normalized,
                              const ParameterRanges& ranges);

/**
 * @brief Gradients returned by the routing reverse pass
 *
 * Parameter gradients are with respect to the normalized inputs.
 */
struct ParameterGradients {
    SpatialParameters params;
    Matrix lateral_inflow;  ///< dL/dq' with the layout of the input series (T x N)
};

} // namespace ddr
