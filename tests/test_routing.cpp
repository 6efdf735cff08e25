/**
 * @file test_routing.cpp
 * @brief Muskingum-Cunge recurrence: kernels, forward behaviour and failure modes
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <ddr/ddr.hpp>
#include <cmath>
#include <limits>

using namespace ddr;
using Catch::Approx;

namespace {

// Segment 1 drains into segment 0 (the outlet)
Ptr<RiverNetwork> two_segment_chain() {
    Vector length = Vector::Constant(2, 20000.0);
    Vector slope = Vector::Constant(2, 0.001);
    Vector width = Vector::Constant(2, 10.0);
    return std::make_shared<RiverNetwork>(
        RiverNetwork::from_downstream({-1, 0}, length, slope, width));
}

RoutingInputs constant_inputs(Index n_segments, Index n_steps, Real q_prime) {
    RoutingInputs inputs;
    inputs.params = SpatialParameters::uniform(n_segments, 0.5, 0.5, 0.5);
    inputs.lateral_inflow = Matrix::Constant(n_steps, n_segments, q_prime);
    return inputs;
}

} // namespace

// ============================================================================
// Kernels
// ============================================================================

TEST_CASE("Muskingum coefficients are consistent", "[routing][kernels]") {
    Vector length(3), celerity(3);
    length << 1000.0, 20000.0, 150000.0;
    celerity << 0.5, 1.5, 25.0;

    auto mc = kernels::muskingum_coefficients(length, celerity, 0.3, 3600.0);

    for (Index i = 0; i < 3; ++i) {
        REQUIRE(mc.k(i) == Approx(length(i) / celerity(i)));
        REQUIRE(mc.c1(i) + mc.c2(i) + mc.c3(i) == Approx(1.0));
        REQUIRE(mc.c4(i) == Approx(mc.c1(i) + mc.c2(i)));
    }
}

TEST_CASE("Hydraulics respect the clamps", "[routing][kernels]") {
    RoutingConfig config;
    const Index n = 4;

    Vector q(n);
    q << 1e-4, 0.5, 50.0, 5000.0;
    Vector slope = Vector::Constant(n, 0.002);
    Vector width = Vector::Constant(n, 20.0);
    SpatialParameters phys = denormalize(SpatialParameters::uniform(n, 0.4, 0.5, 0.5),
                                         config.parameter_ranges);

    auto h = kernels::hydraulics(q, phys, slope, width, config);

    for (Index i = 0; i < n; ++i) {
        REQUIRE(h.depth(i) >= config.depth_floor);
        REQUIRE(h.velocity(i) >= config.velocity_lower_bound);
        REQUIRE(h.velocity(i) <= config.velocity_upper_bound);
        REQUIRE(h.celerity(i) == Approx(h.velocity(i) * 5.0 / 3.0));
    }

    // Deeper water for more discharge
    REQUIRE(h.depth_raw(3) > h.depth_raw(2));
    REQUIRE(h.depth_raw(2) > h.depth_raw(1));

    SECTION("velocity pinned to the lower bound for a trickle") {
        REQUIRE(h.velocity(0) == Approx(config.velocity_lower_bound));
    }
}

TEST_CASE("Width-rating depth falls back to the floor when undefined", "[routing][kernels]") {
    RoutingConfig config;
    config.depth_method = DepthMethod::WidthRating;

    const Index n = 2;
    Vector q = Vector::Constant(n, 5.0);
    Vector slope = Vector::Constant(n, 0.001);
    Vector width(n);
    width << 12.0, 30.0;

    SpatialParameters phys;
    phys.n = Vector::Constant(n, 0.05);
    phys.q_spatial.resize(n);
    phys.q_spatial << 1.0, 1.8;     // log(1) = 0
    phys.p_spatial.resize(n);
    phys.p_spatial << 12.0, 15.0;   // width == p on segment 0 gives 0/0

    auto h = kernels::hydraulics(q, phys, slope, width, config);

    REQUIRE(h.depth(0) == Approx(config.depth_floor));
    REQUIRE(h.depth(1) == Approx(std::log(30.0 / 15.0) / std::log(1.8)));
    REQUIRE(h.velocity.allFinite());
}

// ============================================================================
// System assembly
// ============================================================================

TEST_CASE("Routing system matches I - diag(c1) N", "[routing][assembly]") {
    Vector length = Vector::Constant(4, 5000.0);
    Vector slope = Vector::Constant(4, 0.001);
    Vector width = Vector::Constant(4, 10.0);
    auto net = std::make_shared<RiverNetwork>(
        RiverNetwork::from_downstream({2, 2, 3, -1}, length, slope, width));

    MuskingumCungeRouter router;
    router.set_network(net);

    const PatternMapper& mapper = router.mapper();
    REQUIRE(mapper.dimension() == 5);
    REQUIRE(mapper.nnz() == 4 + 3);

    Vector c1(4);
    c1 << 0.1, -0.2, 0.3, -0.4;
    Vector coeffs = MuskingumCungeRouter::assemble_coefficients(c1);
    REQUIRE(coeffs(0) == 1.0);
    REQUIRE(coeffs(3) == -0.3);

    Matrix A = mapper.to_dense(mapper.map(coeffs));
    Matrix N = net->adjacency().toDense();
    Matrix expected = Matrix::Identity(4, 4) - c1.asDiagonal() * N;
    REQUIRE((A - expected).cwiseAbs().maxCoeff() < 1e-15);
}

// ============================================================================
// Forward
// ============================================================================

TEST_CASE("Two-segment chain", "[routing]") {
    auto net = two_segment_chain();
    REQUIRE(net->orientation() == Orientation::Upper);

    MuskingumCungeRouter router;
    router.set_network(net);

    RoutingOutput out = router.forward(constant_inputs(2, 5, 10.0));

    REQUIRE(out.runoff.rows() == 2);
    REQUIRE(out.runoff.cols() == 5);

    // Headwater in equilibrium with its own lateral inflow
    for (Index t = 0; t < 5; ++t) {
        REQUIRE(out.runoff(1, t) == Approx(10.0));
    }

    // Outlet fills towards headwater + lateral
    REQUIRE(out.runoff(0, 0) == Approx(10.0));
    REQUIRE(out.runoff(0, 1) == Approx(11.208053691275168));
    REQUIRE(out.runoff(0, 4) == Approx(14.024969741332914));
    for (Index t = 1; t < 5; ++t) {
        REQUIRE(out.runoff(0, t) > out.runoff(0, t - 1));
        REQUIRE(out.runoff(0, t) <= 20.0);
    }

    REQUIRE(out.final_discharge.size() == 2);
    REQUIRE(out.final_discharge(0) == Approx(out.runoff(0, 4)));
    REQUIRE(router.discharge()(0) == Approx(out.runoff(0, 4)));
}

TEST_CASE("Chain approaches steady state", "[routing]") {
    MuskingumCungeRouter router;
    router.set_network(two_segment_chain());

    RoutingOutput out = router.forward(constant_inputs(2, 300, 10.0));
    REQUIRE(out.runoff(0, 299) == Approx(20.0).epsilon(1e-6));
}

TEST_CASE("Segment order does not change the physics", "[routing]") {
    Vector length = Vector::Constant(2, 20000.0);
    Vector slope = Vector::Constant(2, 0.001);
    Vector width = Vector::Constant(2, 10.0);

    // Same chain numbered the other way round: lower-triangular system
    auto net = std::make_shared<RiverNetwork>(
        RiverNetwork::from_downstream({1, -1}, length, slope, width));
    REQUIRE(net->orientation() == Orientation::Lower);

    MuskingumCungeRouter lower_router;
    lower_router.set_network(net);
    RoutingOutput lower_out = lower_router.forward(constant_inputs(2, 5, 10.0));

    MuskingumCungeRouter upper_router;
    upper_router.set_network(two_segment_chain());
    RoutingOutput upper_out = upper_router.forward(constant_inputs(2, 5, 10.0));

    for (Index t = 0; t < 5; ++t) {
        REQUIRE(lower_out.runoff(1, t) == Approx(upper_out.runoff(0, t)));
        REQUIRE(lower_out.runoff(0, t) == Approx(upper_out.runoff(1, t)));
    }
}

TEST_CASE("Discharge never drops below the floor", "[routing]") {
    Vector length(3), slope(3), width(3);
    length << 3000.0, 4000.0, 9000.0;
    slope << 0.0, 0.01, 0.002;         // zero slope hits the slope floor
    width << 5.0, 5.0, 10.0;
    auto net = std::make_shared<RiverNetwork>(
        RiverNetwork::from_downstream({2, 2, -1}, length, slope, width));

    MuskingumCungeRouter router;
    router.set_network(net);

    RoutingInputs inputs = constant_inputs(3, 12, 0.0);
    inputs.lateral_inflow(3, 0) = -5.0;
    inputs.lateral_inflow(6, 1) = 2.0;

    RoutingOutput out = router.forward(inputs);

    REQUIRE(out.runoff.allFinite());
    REQUIRE(out.runoff.minCoeff() >= router.config().discharge_floor);
}

TEST_CASE("Initial state", "[routing]") {
    auto net = two_segment_chain();
    MuskingumCungeRouter router;

    RoutingInputs inputs = constant_inputs(2, 3, 10.0);
    inputs.lateral_inflow(0, 0) = 4.0;
    inputs.lateral_inflow(0, 1) = 6.0;

    SECTION("cold start uses the first lateral-inflow row") {
        router.set_network(net);
        RoutingOutput out = router.forward(inputs);
        REQUIRE(out.runoff(0, 0) == Approx(4.0));
        REQUIRE(out.runoff(1, 0) == Approx(6.0));
    }

    SECTION("explicit starting discharge") {
        Vector q0(2);
        q0 << 30.0, 25.0;
        net->set_starting_discharge(q0);
        router.set_network(net);
        RoutingOutput out = router.forward(inputs);
        REQUIRE(out.runoff(0, 0) == Approx(30.0));
        REQUIRE(out.runoff(1, 0) == Approx(25.0));
    }
}

TEST_CASE("Gauges sum their segments", "[routing]") {
    auto net = two_segment_chain();
    net->set_gauges({{0, 1}, {1}});

    MuskingumCungeRouter router;
    router.set_network(net);
    RoutingOutput out = router.forward(constant_inputs(2, 4, 10.0));

    REQUIRE(out.runoff.rows() == 2);
    REQUIRE(out.runoff(0, 0) == Approx(20.0));
    REQUIRE(out.runoff(0, 1) == Approx(21.208053691275168));
    REQUIRE(out.runoff(0, 3) == Approx(out.final_discharge.sum()));
    for (Index t = 0; t < 4; ++t) {
        REQUIRE(out.runoff(1, t) == Approx(10.0));
    }
}

TEST_CASE("Batch boundaries", "[routing]") {
    MuskingumCungeRouter router;
    router.set_network(two_segment_chain());

    router.forward(constant_inputs(2, 3, 10.0));
    REQUIRE(router.has_state());

    SECTION("carry continues from the previous batch") {
        RoutingInputs next = constant_inputs(2, 3, 10.0);
        next.boundary = BatchBoundary::Carry;
        RoutingOutput out = router.forward(next);

        REQUIRE(out.runoff(0, 0) == Approx(12.270168010449979));
        REQUIRE(out.runoff(0, 2) == Approx(14.024969741332914));
    }

    SECTION("reset starts over") {
        RoutingOutput out = router.forward(constant_inputs(2, 3, 10.0));
        REQUIRE(out.runoff(0, 0) == Approx(10.0));
        REQUIRE(out.runoff(0, 1) == Approx(11.208053691275168));
    }

    SECTION("carry without state falls back to a cold start") {
        router.reset_state();
        REQUIRE_FALSE(router.has_state());

        RoutingInputs next = constant_inputs(2, 3, 10.0);
        next.boundary = BatchBoundary::Carry;
        RoutingOutput out = router.forward(next);
        REQUIRE(out.runoff(0, 0) == Approx(10.0));
    }
}

TEST_CASE("Upstream inflows override segment state", "[routing]") {
    MuskingumCungeRouter router;
    router.set_network(two_segment_chain());

    RoutingOutput baseline = router.forward(constant_inputs(2, 5, 10.0));

    RoutingInputs inputs = constant_inputs(2, 5, 10.0);
    inputs.upstream.segments = {1};
    inputs.upstream.series = Matrix::Constant(1, 5, 5.0);

    RoutingOutput out = router.forward(inputs);

    for (Index t = 1; t < 5; ++t) {
        REQUIRE(out.runoff(1, t) == Approx(5.0));
        REQUIRE(out.runoff(0, t) < baseline.runoff(0, t));
    }
    REQUIRE(out.runoff(0, 1) == Approx(10.604026845637584));
    REQUIRE(out.runoff(0, 4) == Approx(12.01248487066646));

    // Imposed segments receive no lateral-inflow gradient past the start
    ParameterGradients grads = router.backward(Matrix::Ones(2, 5));
    for (Index t = 1; t < 5; ++t) {
        REQUIRE(grads.lateral_inflow(t, 1) == 0.0);
    }
    REQUIRE(grads.lateral_inflow(0, 0) != 0.0);
}

// ============================================================================
// Failure modes
// ============================================================================

TEST_CASE("Router rejects inconsistent input", "[routing][errors]") {
    MuskingumCungeRouter router;

    SECTION("no network") {
        REQUIRE_THROWS_AS(router.forward(constant_inputs(2, 3, 1.0)), StructuralError);
        REQUIRE_THROWS_AS(router.set_network(nullptr), StructuralError);
    }

    router.set_network(two_segment_chain());

    SECTION("lateral inflow with the wrong segment count") {
        REQUIRE_THROWS_AS(router.forward(constant_inputs(3, 3, 1.0)), StructuralError);
    }

    SECTION("parameters with the wrong length") {
        RoutingInputs inputs = constant_inputs(2, 3, 1.0);
        inputs.params.n = Vector::Constant(3, 0.5);
        REQUIRE_THROWS_AS(router.forward(inputs), StructuralError);
    }

    SECTION("empty series") {
        RoutingInputs inputs = constant_inputs(2, 3, 1.0);
        inputs.lateral_inflow.resize(0, 2);
        REQUIRE_THROWS_AS(router.forward(inputs), StructuralError);
    }

    SECTION("upstream series of the wrong length") {
        RoutingInputs inputs = constant_inputs(2, 3, 1.0);
        inputs.upstream.segments = {1};
        inputs.upstream.series = Matrix::Ones(1, 2);
        REQUIRE_THROWS_AS(router.forward(inputs), StructuralError);
    }
}

TEST_CASE("Reservoir branch is rejected", "[routing][errors]") {
    RoutingConfig config;
    config.use_reservoir_branch = true;
    REQUIRE_THROWS_AS(MuskingumCungeRouter(config), std::invalid_argument);
}

TEST_CASE("Solve failure reports the timestep", "[routing][errors]") {
    MuskingumCungeRouter router;
    router.set_network(two_segment_chain());

    RoutingInputs inputs = constant_inputs(2, 6, 10.0);
    inputs.lateral_inflow(2, 0) = std::numeric_limits<Real>::infinity();

    try {
        router.forward(inputs);
        FAIL("expected TimestepError");
    } catch (const TimestepError& e) {
        REQUIRE(e.timestep() == 3);
        REQUIRE(e.dimension() == 2);
    }

    REQUIRE_FALSE(router.has_recording());
    REQUIRE_THROWS_AS(router.backward(Matrix::Ones(2, 6)), StructuralError);
}

TEST_CASE("Backward consumes the recording", "[routing][errors]") {
    MuskingumCungeRouter router;
    router.set_network(two_segment_chain());
    router.forward(constant_inputs(2, 4, 10.0));
    REQUIRE(router.has_recording());

    SECTION("wrong gradient shape") {
        REQUIRE_THROWS_AS(router.backward(Matrix::Ones(2, 3)), StructuralError);
        REQUIRE(router.has_recording());
    }

    SECTION("second call needs a new forward") {
        REQUIRE_NOTHROW(router.backward(Matrix::Ones(2, 4)));
        REQUIRE_FALSE(router.has_recording());
        REQUIRE_THROWS_AS(router.backward(Matrix::Ones(2, 4)), StructuralError);
    }
}

TEST_CASE("Recording can be switched off", "[routing]") {
    RoutingConfig config;
    config.record_gradients = false;

    MuskingumCungeRouter router(config);
    router.set_network(two_segment_chain());

    RoutingOutput out = router.forward(constant_inputs(2, 5, 10.0));
    REQUIRE(out.runoff(0, 1) == Approx(11.208053691275168));
    REQUIRE_FALSE(router.has_recording());
    REQUIRE_THROWS_AS(router.backward(Matrix::Ones(2, 5)), StructuralError);
}

TEST_CASE("Verbose routing", "[routing]") {
    RoutingConfig config;
    config.verbose = true;

    MuskingumCungeRouter router(config);
    router.set_network(two_segment_chain());
    RoutingOutput out = router.forward(constant_inputs(2, 3, 10.0));
    REQUIRE(out.runoff(0, 1) == Approx(11.208053691275168));
}
