/**
 * @file config.cpp
 * @brief Configuration parsing and validation
 */

#include "ddr/core/config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <iostream>
#include <cmath>

namespace ddr {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string range_to_string(const ParameterRange& r) {
    std::ostringstream oss;
    oss << "[" << r.min << ", " << r.max << "]";
    return oss.str();
}

} // namespace

// ============================================================================
// RoutingConfig
// ============================================================================

RoutingConfig RoutingConfig::from_file(const std::filesystem::path& filepath) {
    RoutingConfig config;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filepath.string());
    }

    // Simple key-value parser (no YAML library dependency)
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        // Strip comments
        auto comment_pos = line.find('#');
        if (comment_pos != std::string::npos) {
            line = line.substr(0, comment_pos);
        }

        line = trim(line);
        if (line.empty()) continue;

        auto colon_pos = line.find(':');
        if (colon_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, colon_pos));
        std::string value = trim(line.substr(colon_pos + 1));

        // Section header
        if (value.empty()) {
            current_section = key;
            continue;
        }

        // Quoted keys ('n': [0.01, 0.35])
        if (key.size() >= 2 && (key.front() == '\'' || key.front() == '"')) {
            key = key.substr(1, key.size() - 2);
        }

        if (current_section == "routing" || current_section.empty()) {
            if (key == "timestep_duration")
                config.timestep_duration = std::stod(value);
            else if (key == "storage_weighting_x")
                config.storage_weighting_x = std::stod(value);
            else if (key == "velocity_lower_bound")
                config.velocity_lower_bound = std::stod(value);
            else if (key == "velocity_upper_bound")
                config.velocity_upper_bound = std::stod(value);
            else if (key == "discharge_floor")
                config.discharge_floor = std::stod(value);
            else if (key == "slope_floor")
                config.slope_floor = std::stod(value);
            else if (key == "depth_floor")
                config.depth_floor = std::stod(value);
            else if (key == "depth_method")
                config.depth_method = config_io::depth_method_from_string(value);
            else if (key == "use_reservoir_branch")
                config.use_reservoir_branch = config_io::bool_from_string(value);
            else if (key == "record_gradients")
                config.record_gradients = config_io::bool_from_string(value);
            else if (key == "verbose")
                config.verbose = config_io::bool_from_string(value);
        } else if (current_section == "attribute_minimums") {
            // Naming used by the training configuration
            if (key == "velocity")
                config.velocity_lower_bound = std::stod(value);
            else if (key == "discharge")
                config.discharge_floor = std::stod(value);
            else if (key == "slope")
                config.slope_floor = std::stod(value);
            else if (key == "depth")
                config.depth_floor = std::stod(value);
        } else if (current_section == "parameter_ranges") {
            if (key == "n")
                config.parameter_ranges.n = config_io::range_from_string(value);
            else if (key == "q_spatial")
                config.parameter_ranges.q_spatial = config_io::range_from_string(value);
            else if (key == "p_spatial")
                config.parameter_ranges.p_spatial = config_io::range_from_string(value);
        }
    }

    return config;
}

void RoutingConfig::to_file(const std::filesystem::path& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write config file: " + filepath.string());
    }

    file << "# ddr Routing Configuration File\n\n";

    file << "routing:\n";
    file << "  timestep_duration: " << timestep_duration << "\n";
    file << "  storage_weighting_x: " << storage_weighting_x << "\n";
    file << "  velocity_lower_bound: " << velocity_lower_bound << "\n";
    file << "  velocity_upper_bound: " << velocity_upper_bound << "\n";
    file << "  discharge_floor: " << discharge_floor << "\n";
    file << "  slope_floor: " << slope_floor << "\n";
    file << "  depth_floor: " << depth_floor << "\n";
    file << "  depth_method: " << config_io::to_string(depth_method) << "\n";
    file << "  use_reservoir_branch: " << (use_reservoir_branch ? "true" : "false") << "\n";
    file << "  record_gradients: " << (record_gradients ? "true" : "false") << "\n";
    file << "  verbose: " << (verbose ? "true" : "false") << "\n\n";

    file << "parameter_ranges:\n";
    file << "  n: " << range_to_string(parameter_ranges.n) << "\n";
    file << "  q_spatial: " << range_to_string(parameter_ranges.q_spatial) << "\n";
    file << "  p_spatial: " << range_to_string(parameter_ranges.p_spatial) << "\n";
}

bool RoutingConfig::validate() const {
    try {
        check();
    } catch (const std::invalid_argument&) {
        return false;
    }
    return true;
}

void RoutingConfig::check() const {
    if (!(timestep_duration > 0.0)) {
        throw std::invalid_argument("timestep_duration must be > 0");
    }
    if (storage_weighting_x < 0.0 || storage_weighting_x > 0.5) {
        throw std::invalid_argument("storage_weighting_x must be in [0, 0.5]");
    }
    if (!(velocity_lower_bound > 0.0)) {
        throw std::invalid_argument("velocity_lower_bound must be > 0");
    }
    if (velocity_upper_bound < velocity_lower_bound) {
        throw std::invalid_argument("velocity_upper_bound must be >= velocity_lower_bound");
    }
    if (!(discharge_floor > 0.0)) {
        throw std::invalid_argument("discharge_floor must be > 0");
    }
    if (!(slope_floor > 0.0)) {
        throw std::invalid_argument("slope_floor must be > 0");
    }
    if (!(depth_floor > 0.0)) {
        throw std::invalid_argument("depth_floor must be > 0");
    }
    if (use_reservoir_branch) {
        throw std::invalid_argument("use_reservoir_branch: reservoir routing is not available");
    }

    const auto check_range = [](const ParameterRange& r, const char* name) {
        if (!std::isfinite(r.min) || !std::isfinite(r.max) || r.max < r.min) {
            throw std::invalid_argument(std::string("parameter range ") + name +
                                        " must satisfy min <= max");
        }
    };
    check_range(parameter_ranges.n, "n");
    check_range(parameter_ranges.q_spatial, "q_spatial");
    check_range(parameter_ranges.p_spatial, "p_spatial");

    if (!(parameter_ranges.n.min > 0.0)) {
        throw std::invalid_argument("parameter range n must be strictly positive");
    }
    if (parameter_ranges.q_spatial.min < 0.0) {
        throw std::invalid_argument("parameter range q_spatial must be non-negative");
    }
}

void RoutingConfig::print_summary(std::ostream& os) const {
    os << "=== ddr Routing Configuration ===\n";
    os << "Muskingum-Cunge:\n";
    os << "  dt:          " << timestep_duration << " s\n";
    os << "  X:           " << storage_weighting_x << "\n";
    os << "  Depth:       " << config_io::to_string(depth_method) << "\n";
    os << "Clamps:\n";
    os << "  Velocity:    [" << velocity_lower_bound << ", " << velocity_upper_bound << "]\n";
    os << "  Discharge >= " << discharge_floor << "\n";
    os << "  Slope     >= " << slope_floor << "\n";
    os << "  Depth     >= " << depth_floor << "\n";
    os << "Parameter ranges:\n";
    os << "  n:           " << range_to_string(parameter_ranges.n) << "\n";
    os << "  q_spatial:   " << range_to_string(parameter_ranges.q_spatial) << "\n";
    os << "  p_spatial:   " << range_to_string(parameter_ranges.p_spatial) << "\n";
    os << "=================================\n";
}

// ============================================================================
// config_io helpers
// ============================================================================

namespace config_io {

std::string to_string(DepthMethod dm) {
    switch (dm) {
        case DepthMethod::PowerLaw: return "PowerLaw";
        case DepthMethod::WidthRating: return "WidthRating";
        default: return "Unknown";
    }
}

std::string to_string(Orientation o) {
    switch (o) {
        case Orientation::Lower: return "Lower";
        case Orientation::Upper: return "Upper";
        default: return "Unknown";
    }
}

DepthMethod depth_method_from_string(const std::string& s) {
    if (s == "PowerLaw") return DepthMethod::PowerLaw;
    if (s == "WidthRating") return DepthMethod::WidthRating;
    throw std::invalid_argument("Unknown depth method: " + s);
}

ParameterRange range_from_string(const std::string& s) {
    std::string body = trim(s);
    if (body.size() < 2 || body.front() != '[' || body.back() != ']') {
        throw std::invalid_argument("Expected [min, max], got: " + s);
    }
    body = body.substr(1, body.size() - 2);

    auto comma = body.find(',');
    if (comma == std::string::npos) {
        throw std::invalid_argument("Expected [min, max], got: " + s);
    }

    ParameterRange range;
    range.min = std::stod(trim(body.substr(0, comma)));
    range.max = std::stod(trim(body.substr(comma + 1)));
    return range;
}

bool bool_from_string(const std::string& s) {
    if (s == "true" || s == "True") return true;
    if (s == "false" || s == "False") return false;
    throw std::invalid_argument("Expected true/false, got: " + s);
}

} // namespace config_io

} // namespace ddr
