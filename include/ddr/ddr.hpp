/**
 * @file ddr.hpp
 * @brief Umbrella header for ddr
 *
 * ddr routes discharge through a river network with a differentiable
 * Muskingum-Cunge scheme. The network system is solved as one sparse
 * triangular solve per timestep, with a hand-written adjoint so that the
 * roughness and channel-shape parameters can be learned.
 *
 * Example usage:
 * @code
 * auto net = std::make_shared<RiverNetwork>(
 *     RiverNetwork::from_downstream(downstream, length, slope, width));
 *
 * MuskingumCungeRouter router(RoutingConfig::from_file("routing.yaml"));
 * router.set_network(net);
 *
 * RoutingInputs inputs;
 * inputs.params = normalized_params;     // from the parameter estimator
 * inputs.lateral_inflow = q_prime;       // T x N
 *
 * RoutingOutput out = router.forward(inputs);
 * ParameterGradients grads = router.backward(dL_drunoff);
 * @endcode
 */

#pragma once

// Core includes
#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/config.hpp"
#include "core/network.hpp"
#include "core/parameters.hpp"

// Sparse machinery
#include "sparse/pattern_mapper.hpp"
#include "solvers/triangular_solve.hpp"

// Routing
#include "routing/kernels.hpp"
#include "routing/muskingum_cunge.hpp"

namespace ddr {

constexpr const char* VERSION = "0.1.0";

} // namespace ddr
