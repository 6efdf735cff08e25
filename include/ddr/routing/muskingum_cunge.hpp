/**
 * @file muskingum_cunge.hpp
 * @brief Differentiable Muskingum-Cunge routing over a river network
 *
 * Each timestep solves the implicit network system
 *
 *   Q_t[i] - c1[i] Σ_j N[i,j] Q_t[j] = c2[i] (N Q_{t-1})[i] + c3[i] Q_{t-1}[i] + c4[i] q_l[i]
 *
 * where N is the adjacency. With segments in topological order the system
 * matrix I - diag(c1) N is triangular and its nonzero pattern never changes,
 * so it is probed once (PatternMapper) and only the values are refreshed.
 *
 * The reverse pass is written by hand: backward() replays the recorded
 * timesteps in reverse and returns dL/d(normalized parameters) and
 * dL/d(lateral inflow) for a given dL/d(runoff).
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../core/network.hpp"
#include "../core/parameters.hpp"
#include "../sparse/pattern_mapper.hpp"
#include "../solvers/triangular_solve.hpp"
#include "kernels.hpp"

namespace ddr {

/**
 * @brief Discharge imposed at selected segments (upstream sub-basins)
 *
 * At step t the state of each listed segment is replaced by series(k, t-1)
 * before routing, and its lateral inflow by series(k, t). Imposed values are
 * constants for the reverse pass.
 */
struct UpstreamInflows {
    std::vector<Index> segments;
    Matrix series;                  ///< segments.size() x T

    bool empty() const { return segments.empty(); }
};

/**
 * @brief Everything one forward call consumes
 */
struct RoutingInputs {
    SpatialParameters params;       ///< Normalized to [0, 1]
    Matrix lateral_inflow;          ///< q', T x N [m³/s]
    UpstreamInflows upstream;
    BatchBoundary boundary = BatchBoundary::Reset;
};

/**
 * @brief Routed discharge at the gauges
 */
struct RoutingOutput {
    Matrix runoff;                  ///< n_gauges x T [m³/s]
    Vector final_discharge;         ///< State after the last step
};

/**
 * @brief Muskingum-Cunge router with an explicit reverse pass
 *
 * Example usage:
 * @code
 * MuskingumCungeRouter router(config);
 * router.set_network(network);
 *
 * auto out = router.forward(inputs);
 * Matrix dL_dout = 2.0 * (out.runoff - observed);
 * ParameterGradients grads = router.backward(dL_dout);
 * @endcode
 */
class MuskingumCungeRouter {
public:
    /// @throws std::invalid_argument if the configuration is inconsistent
    explicit MuskingumCungeRouter(RoutingConfig config = {});

    /**
     * @brief Attach the network and probe the system pattern once
     */
    void set_network(Ptr<const RiverNetwork> network);

    /**
     * @brief Route all timesteps of the lateral inflow series
     *
     * @throws StructuralError on inconsistent input sizes
     * @throws TimestepError if a solve fails; carries the timestep index
     * @throws ResourceExhaustion if memory runs out during a solve
     */
    RoutingOutput forward(const RoutingInputs& inputs);

    /**
     * @brief Reverse pass of the last forward()
     *
     * Consumes the recorded timesteps; a second call needs a new forward().
     *
     * @param grad_runoff dL/d(runoff), n_gauges x T
     * @throws StructuralError without a recorded forward or on size mismatch
     */
    ParameterGradients backward(const Matrix& grad_runoff);

    // ========================================================================
    // System assembly
    // ========================================================================

    /**
     * @brief Fill function of the routing system: v[0] I + diag(v[1..N]) N
     *
     * Slot 0 is the pivot on the diagonal; slot i+1 carries the implicit
     * inflow coefficient of segment i.
     */
    static SparseMatrix fill_operator(const SparseMatrix& adjacency, const Vector& v);

    /**
     * @brief Coefficient vector [1, -c1_0, ..., -c1_{N-1}]
     */
    static Vector assemble_coefficients(const Vector& c1);

    // ========================================================================
    // State
    // ========================================================================

    const Vector& discharge() const { return discharge_; }
    bool has_state() const { return discharge_.size() != 0; }
    void reset_state() { discharge_.resize(0); }

    /// True once forward() has recorded timesteps that backward() can use
    bool has_recording() const { return recorded_; }

    // ========================================================================
    // Access
    // ========================================================================

    const RoutingConfig& config() const { return config_; }
    const RiverNetwork& network() const;
    const PatternMapper& mapper() const;

private:
    /// Everything the reverse pass needs from one timestep
    struct StepRecord {
        Vector discharge_prev;      ///< Q_{t-1} after upstream overrides
        Vector lateral_raw;         ///< q'_{t-1}
        Vector lateral;             ///< Clamped, overridden q_l
        kernels::Hydraulics hydraulics;
        kernels::MuskingumCoefficients coeffs;
        Vector inflow;              ///< N Q_{t-1}
        TriangularSolveContext solve;
    };

    RoutingConfig config_;
    Ptr<const RiverNetwork> network_;
    UniquePtr<PatternMapper> mapper_;
    bool lower_ = true;

    Vector discharge_;

    // Tape of the last forward
    bool recorded_ = false;
    std::vector<StepRecord> records_;
    SpatialParameters physical_;
    Vector slope_;
    Vector initial_gauge_sums_;
    bool initial_from_lateral_ = false;
    UpstreamInflows upstream_;
    Index n_timesteps_ = 0;

    void check_inputs(const RoutingInputs& inputs) const;

    /// Sum of discharge over each gauge's segments
    Vector gauge_sums(const Vector& discharge) const;

    /// Adds dL/d(gauge output) onto the segments of each gauge
    void scatter_gauge_gradient(const Vector& grad_gauges, Vector& grad_discharge) const;
};

} // namespace ddr
