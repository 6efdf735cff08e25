#include <catch2/catch_test_macros.hpp>
#include "ddr/core/network.hpp"
#include "ddr/core/parameters.hpp"
#include "ddr/core/errors.hpp"

using namespace ddr;

namespace {

Vector ones(Index n) { return Vector::Ones(n); }

} // namespace

TEST_CASE("Network from a downstream list", "[network]") {
    auto net = RiverNetwork::from_downstream({2, 2, 3, -1}, ones(4), ones(4), ones(4));

    REQUIRE(net.n_segments() == 4);
    REQUIRE(net.n_edges() == 3);
    REQUIRE(net.orientation() == Orientation::Lower);

    REQUIRE(net.adjacency().coeff(2, 0) == 1.0);
    REQUIRE(net.adjacency().coeff(2, 1) == 1.0);
    REQUIRE(net.adjacency().coeff(3, 2) == 1.0);
    REQUIRE(net.adjacency().coeff(0, 2) == 0.0);

    REQUIRE(net.upstream_of(2) == std::vector<Index>{0, 1});
    REQUIRE(net.upstream_of(3) == std::vector<Index>{2});
    REQUIRE(net.upstream_of(0).empty());
}

TEST_CASE("Network orientation", "[network]") {
    SECTION("reverse numbering gives an upper system") {
        auto net = RiverNetwork::from_downstream({-1, 0, 0}, ones(3), ones(3), ones(3));
        REQUIRE(net.orientation() == Orientation::Upper);
        REQUIRE(net.upstream_of(0) == std::vector<Index>{1, 2});
    }

    SECTION("no edges counts as lower") {
        auto net = RiverNetwork::from_downstream({-1, -1}, ones(2), ones(2), ones(2));
        REQUIRE(net.n_edges() == 0);
        REQUIRE(net.orientation() == Orientation::Lower);
    }

    SECTION("couplings on both sides are rejected") {
        // 0 -> 2 sits below the diagonal, 1 -> 0 above it
        REQUIRE_THROWS_AS(
            RiverNetwork::from_downstream({2, 0, -1}, ones(3), ones(3), ones(3)),
            StructuralError);
    }

    SECTION("self-loops are rejected") {
        Matrix dense = Matrix::Zero(2, 2);
        dense(1, 1) = 1.0;
        REQUIRE_THROWS_AS(RiverNetwork::from_dense(dense, ones(2), ones(2), ones(2)),
                          StructuralError);
    }
}

TEST_CASE("Network from a dense adjacency", "[network]") {
    Matrix dense = Matrix::Zero(3, 3);
    dense(1, 0) = 1.0;
    dense(2, 1) = 1.0;

    auto net = RiverNetwork::from_dense(dense, ones(3), ones(3), ones(3));
    REQUIRE(net.n_edges() == 2);
    REQUIRE(net.orientation() == Orientation::Lower);
}

TEST_CASE("Network validation", "[network][errors]") {
    SECTION("downstream index out of range") {
        REQUIRE_THROWS_AS(RiverNetwork::from_downstream({5, -1}, ones(2), ones(2), ones(2)),
                          StructuralError);
    }

    SECTION("attribute sizes differ") {
        REQUIRE_THROWS_AS(RiverNetwork::from_downstream({1, -1}, ones(2), ones(3), ones(2)),
                          StructuralError);
    }

    SECTION("adjacency not matching the segment count") {
        SparseMatrix adjacency(3, 3);
        REQUIRE_THROWS_AS(RiverNetwork(adjacency, ones(2), ones(2), ones(2)), StructuralError);
    }

    SECTION("non-positive length") {
        Vector length = ones(2);
        length(1) = 0.0;
        REQUIRE_THROWS_AS(RiverNetwork::from_downstream({1, -1}, length, ones(2), ones(2)),
                          StructuralError);
    }
}

TEST_CASE("Gauges", "[network]") {
    auto net = RiverNetwork::from_downstream({2, 2, -1}, ones(3), ones(3), ones(3));

    // One gauge per segment by default
    REQUIRE(net.n_gauges() == 3);
    REQUIRE(net.gauges()[1] == std::vector<Index>{1});

    net.set_gauges({{2}, {0, 1}});
    REQUIRE(net.n_gauges() == 2);
    REQUIRE(net.gauges()[1] == std::vector<Index>{0, 1});

    REQUIRE_THROWS_AS(net.set_gauges({{3}}), StructuralError);
    REQUIRE_THROWS_AS(net.set_gauges({{}}), StructuralError);
    REQUIRE(net.n_gauges() == 2);
}

TEST_CASE("Starting discharge", "[network]") {
    auto net = RiverNetwork::from_downstream({1, -1}, ones(2), ones(2), ones(2));
    REQUIRE(net.starting_discharge().size() == 0);

    net.set_starting_discharge(Vector::Constant(2, 3.0));
    REQUIRE(net.starting_discharge()(1) == 3.0);

    REQUIRE_THROWS_AS(net.set_starting_discharge(Vector::Ones(3)), StructuralError);

    net.set_starting_discharge(Vector());
    REQUIRE(net.starting_discharge().size() == 0);
}

TEST_CASE("Parameter denormalization", "[network][parameters]") {
    ParameterRanges ranges;
    auto normalized = SpatialParameters::uniform(2, 0.0, 0.5, 1.0);
    auto physical = denormalize(normalized, ranges);

    REQUIRE(physical.n(0) == ranges.n.min);
    REQUIRE(physical.q_spatial(1) == 1.5);
    REQUIRE(physical.p_spatial(0) == 42.0);

    REQUIRE_NOTHROW(normalized.check_size(2));
    REQUIRE_THROWS_AS(normalized.check_size(3), StructuralError);
}
