/**
 * @file parameters.cpp
 * @brief Learned parameter helpers
 */

#include "ddr/core/parameters.hpp"
#include "ddr/core/errors.hpp"
#include <string>

namespace ddr {

SpatialParameters SpatialParameters::uniform(Index n_segments, Real n_val,
                                             Real q_val, Real p_val) {
    SpatialParameters params;
    params.n = Vector::Constant(n_segments, n_val);
    params.q_spatial = Vector::Constant(n_segments, q_val);
    params.p_spatial = Vector::Constant(n_segments, p_val);
    return params;
}

void SpatialParameters::check_size(Index n_segments) const {
    const auto check = [n_segments](const Vector& v, const char* name) {
        if (v.size() != n_segments) {
            throw StructuralError(std::string(name) + " has " + std::to_string(v.size()) +
                                  " entries for " + std::to_string(n_segments) + " segments");
        }
    };
    check(n, "n");
    check(q_spatial, "q_spatial");
    check(p_spatial, "p_spatial");
}

Vector denormalize(const Vector& value, const ParameterRange& range) {
    return (value.array() * range.span() + range.min).matrix();
}

SpatialParameters denormalize(const SpatialParameters& normalized,
                              const ParameterRanges& ranges) {
    SpatialParameters physical;
    physical.n = denormalize(normalized.n, ranges.n);
    physical.q_spatial = denormalize(normalized.q_spatial, ranges.q_spatial);
    physical.p_spatial = denormalize(normalized.p_spatial, ranges.p_spatial);
    return physical;
}

} // namespace ddr
