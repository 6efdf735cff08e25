/**
 * @file config.hpp
 * @brief Runtime configuration for ddr routing
 *
 * Defines:
 * - Muskingum-Cunge timestep and storage weighting
 * - Attribute floors and velocity bounds (numerical clamps)
 * - Physical ranges used to denormalize learned parameters
 */

#pragma once

#include "types.hpp"
#include <string>
#include <filesystem>
#include <iosfwd>

namespace ddr {

/**
 * @brief Physical bounds [min, max] of a learned parameter
 */
struct ParameterRange {
    Real min = 0.0;
    Real max = 1.0;

    /// Width of the range, i.e. d(physical)/d(normalized)
    Real span() const { return max - min; }
};

/**
 * @brief Physical bounds for every learned parameter
 *
 * Defaults follow the Juniata River Basin training configuration.
 */
struct ParameterRanges {
    ParameterRange n{0.01, 0.35};           ///< Manning's roughness [s/m^(1/3)]
    ParameterRange q_spatial{0.0, 3.0};     ///< Channel shape exponent [-]
    ParameterRange p_spatial{0.0, 42.0};    ///< Channel width coefficient [-]
};

/**
 * @brief Complete routing configuration
 */
class RoutingConfig {
public:
    RoutingConfig() = default;

    // Load from YAML-style file
    static RoutingConfig from_file(const std::filesystem::path& filepath);

    // Save to YAML-style file
    void to_file(const std::filesystem::path& filepath) const;

    /// True if all options are consistent
    bool validate() const;

    /// Throws std::invalid_argument naming the first inconsistent option
    void check() const;

    // Print summary
    void print_summary(std::ostream& os) const;

    // Muskingum-Cunge
    Real timestep_duration = 3600.0;    ///< [s]
    Real storage_weighting_x = 0.3;     ///< Muskingum X [-]

    // Clamps (numerical floors, never raised as errors)
    Real velocity_lower_bound = 0.3;    ///< [m/s], before the 5/3 celerity scale
    Real velocity_upper_bound = 15.0;   ///< [m/s]
    Real discharge_floor = 1e-4;        ///< [m³/s]
    Real slope_floor = 1e-4;            ///< [-]
    Real depth_floor = 0.01;            ///< [m]

    DepthMethod depth_method = DepthMethod::PowerLaw;

    /// Reservoir routing is not provided; validation rejects true
    bool use_reservoir_branch = false;

    /// Keep per-timestep contexts so backward() can run
    bool record_gradients = true;

    /// Progress and failure reports on std::cerr
    bool verbose = false;

    ParameterRanges parameter_ranges;
};

// ============================================================================
// Parser Helpers
// ============================================================================

namespace config_io {

/// Convert enum to string
std::string to_string(DepthMethod dm);
std::string to_string(Orientation o);

/// Convert string to enum
DepthMethod depth_method_from_string(const std::string& s);

/// Parse "[min, max]"
ParameterRange range_from_string(const std::string& s);

/// Parse "true"/"false"
bool bool_from_string(const std::string& s);

} // namespace config_io

} // namespace ddr
