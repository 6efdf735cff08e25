#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "ddr/core/config.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace ddr;
using Catch::Approx;

namespace {

std::filesystem::path temp_config(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("ddr_test_" + name + ".yaml");
}

} // namespace

TEST_CASE("Default configuration", "[config]") {
    RoutingConfig config;

    REQUIRE(config.timestep_duration == 3600.0);
    REQUIRE(config.storage_weighting_x == 0.3);
    REQUIRE(config.velocity_lower_bound == 0.3);
    REQUIRE(config.velocity_upper_bound == 15.0);
    REQUIRE(config.depth_method == DepthMethod::PowerLaw);
    REQUIRE(config.parameter_ranges.n.min == 0.01);
    REQUIRE(config.parameter_ranges.p_spatial.max == 42.0);
    REQUIRE(config.validate());
}

TEST_CASE("Configuration file round trip", "[config]") {
    RoutingConfig config;
    config.timestep_duration = 900.0;
    config.storage_weighting_x = 0.2;
    config.velocity_lower_bound = 0.05;
    config.depth_method = DepthMethod::WidthRating;
    config.verbose = true;
    config.parameter_ranges.q_spatial = {0.5, 2.5};

    const auto path = temp_config("roundtrip");
    config.to_file(path);
    RoutingConfig loaded = RoutingConfig::from_file(path);
    std::filesystem::remove(path);

    REQUIRE(loaded.timestep_duration == Approx(900.0));
    REQUIRE(loaded.storage_weighting_x == Approx(0.2));
    REQUIRE(loaded.velocity_lower_bound == Approx(0.05));
    REQUIRE(loaded.depth_method == DepthMethod::WidthRating);
    REQUIRE(loaded.verbose);
    REQUIRE(loaded.record_gradients);
    REQUIRE(loaded.parameter_ranges.q_spatial.min == Approx(0.5));
    REQUIRE(loaded.parameter_ranges.q_spatial.max == Approx(2.5));
}

TEST_CASE("Training-style configuration sections", "[config]") {
    const auto path = temp_config("training");
    {
        std::ofstream out(path);
        out << "# experiment settings\n"
            << "routing:\n"
            << "  timestep_duration: 3600   # hourly\n"
            << "\n"
            << "attribute_minimums:\n"
            << "  velocity: 0.01\n"
            << "  discharge: 0.001\n"
            << "  slope: 0.0001\n"
            << "  depth: 0.02\n"
            << "\n"
            << "parameter_ranges:\n"
            << "  'n': [0.015, 0.25]\n"
            << "  \"p_spatial\": [1.0, 200.0]\n";
    }

    RoutingConfig config = RoutingConfig::from_file(path);
    std::filesystem::remove(path);

    REQUIRE(config.velocity_lower_bound == Approx(0.01));
    REQUIRE(config.discharge_floor == Approx(0.001));
    REQUIRE(config.depth_floor == Approx(0.02));
    REQUIRE(config.parameter_ranges.n.min == Approx(0.015));
    REQUIRE(config.parameter_ranges.n.max == Approx(0.25));
    REQUIRE(config.parameter_ranges.p_spatial.span() == Approx(199.0));
    REQUIRE(config.parameter_ranges.q_spatial.max == Approx(3.0));
    REQUIRE(config.validate());
}

TEST_CASE("Configuration validation", "[config][errors]") {
    RoutingConfig config;

    SECTION("storage weighting outside [0, 0.5]") {
        config.storage_weighting_x = 0.6;
        REQUIRE_FALSE(config.validate());
        REQUIRE_THROWS_AS(config.check(), std::invalid_argument);
    }

    SECTION("inverted velocity bounds") {
        config.velocity_upper_bound = 0.1;
        REQUIRE_FALSE(config.validate());
    }

    SECTION("non-positive timestep") {
        config.timestep_duration = 0.0;
        REQUIRE_FALSE(config.validate());
    }

    SECTION("inverted parameter range") {
        config.parameter_ranges.n = {0.3, 0.1};
        REQUIRE_FALSE(config.validate());
    }

    SECTION("reservoir branch") {
        config.use_reservoir_branch = true;
        REQUIRE_FALSE(config.validate());
    }
}

TEST_CASE("Configuration parse errors", "[config][errors]") {
    REQUIRE_THROWS_AS(RoutingConfig::from_file(temp_config("does_not_exist")),
                      std::runtime_error);

    REQUIRE(config_io::depth_method_from_string("WidthRating") == DepthMethod::WidthRating);
    REQUIRE_THROWS_AS(config_io::depth_method_from_string("Trapezoid"), std::invalid_argument);
    REQUIRE_THROWS_AS(config_io::range_from_string("0.1, 0.2"), std::invalid_argument);
    REQUIRE_THROWS_AS(config_io::bool_from_string("yes"), std::invalid_argument);

    ParameterRange r = config_io::range_from_string(" [ -1.5 , 2 ] ");
    REQUIRE(r.min == -1.5);
    REQUIRE(r.max == 2.0);
}

TEST_CASE("Configuration summary", "[config]") {
    RoutingConfig config;
    std::ostringstream oss;
    config.print_summary(oss);

    REQUIRE(oss.str().find("PowerLaw") != std::string::npos);
    REQUIRE(oss.str().find("[0.01, 0.35]") != std::string::npos);
}
