/**
 * @file muskingum_cunge.cpp
 * @brief Muskingum-Cunge recurrence and its reverse pass
 */

#include "ddr/routing/muskingum_cunge.hpp"
#include "ddr/core/errors.hpp"
#include <cmath>
#include <iostream>
#include <string>

namespace ddr {

// ============================================================================
// Construction
// ============================================================================

MuskingumCungeRouter::MuskingumCungeRouter(RoutingConfig config)
    : config_(std::move(config)) {
    config_.check();
}

void MuskingumCungeRouter::set_network(Ptr<const RiverNetwork> network) {
    if (!network) {
        throw StructuralError("set_network: null network");
    }
    network_ = std::move(network);
    lower_ = network_->orientation() == Orientation::Lower;

    const SparseMatrix& adjacency = network_->adjacency();
    const Index n = network_->n_segments();
    mapper_ = std::make_unique<PatternMapper>(PatternMapper::build(
        [&adjacency](const Vector& v) { return fill_operator(adjacency, v); },
        n + 1));

    discharge_.resize(0);
    records_.clear();
    recorded_ = false;

    if (config_.verbose) {
        std::cerr << "ddr: network with " << n << " segments, "
                  << network_->n_edges() << " edges, system nnz = " << mapper_->nnz()
                  << " (" << config_io::to_string(network_->orientation()) << ")\n";
    }
}

const RiverNetwork& MuskingumCungeRouter::network() const {
    if (!network_) {
        throw StructuralError("router has no network");
    }
    return *network_;
}

const PatternMapper& MuskingumCungeRouter::mapper() const {
    if (!mapper_) {
        throw StructuralError("router has no network");
    }
    return *mapper_;
}

SparseMatrix MuskingumCungeRouter::fill_operator(const SparseMatrix& adjacency, const Vector& v) {
    const Index n = adjacency.rows();
    SparseMatrix identity(n, n);
    identity.setIdentity();

    SparseMatrix A = v(0) * identity;
    A += v.tail(n).asDiagonal() * adjacency;
    return A;
}

Vector MuskingumCungeRouter::assemble_coefficients(const Vector& c1) {
    Vector coeffs(c1.size() + 1);
    coeffs(0) = 1.0;  // pivot
    coeffs.tail(c1.size()) = -c1;
    return coeffs;
}

// ============================================================================
// Forward
// ============================================================================

void MuskingumCungeRouter::check_inputs(const RoutingInputs& inputs) const {
    const Index n = network().n_segments();

    inputs.params.check_size(n);

    if (inputs.lateral_inflow.rows() == 0) {
        throw StructuralError("lateral inflow has no timesteps");
    }
    if (inputs.lateral_inflow.cols() != n) {
        throw StructuralError("lateral inflow has " +
                              std::to_string(inputs.lateral_inflow.cols()) +
                              " columns for " + std::to_string(n) + " segments");
    }

    const UpstreamInflows& up = inputs.upstream;
    if (!up.empty()) {
        if (up.series.rows() != static_cast<Index>(up.segments.size()) ||
            up.series.cols() != inputs.lateral_inflow.rows()) {
            throw StructuralError("upstream inflow series must be " +
                                  std::to_string(up.segments.size()) + " x " +
                                  std::to_string(inputs.lateral_inflow.rows()));
        }
        for (Index s : up.segments) {
            if (s < 0 || s >= n) {
                throw StructuralError("upstream inflow segment " + std::to_string(s) +
                                      " out of range");
            }
        }
    }
}

Vector MuskingumCungeRouter::gauge_sums(const Vector& discharge) const {
    const auto& gauges = network_->gauges();
    Vector sums(static_cast<Index>(gauges.size()));
    for (Size g = 0; g < gauges.size(); ++g) {
        Real total = 0.0;
        for (Index s : gauges[g]) {
            total += discharge(s);
        }
        sums(static_cast<Index>(g)) = total;
    }
    return sums;
}

void MuskingumCungeRouter::scatter_gauge_gradient(const Vector& grad_gauges,
                                                  Vector& grad_discharge) const {
    const auto& gauges = network_->gauges();
    for (Size g = 0; g < gauges.size(); ++g) {
        for (Index s : gauges[g]) {
            grad_discharge(s) += grad_gauges(static_cast<Index>(g));
        }
    }
}

RoutingOutput MuskingumCungeRouter::forward(const RoutingInputs& inputs) {
    check_inputs(inputs);

    const RiverNetwork& net = *network_;
    const Index n = net.n_segments();
    const Index n_steps = inputs.lateral_inflow.rows();
    const Real dt = config_.timestep_duration;
    const Real x_storage = config_.storage_weighting_x;
    const Real floor_q = config_.discharge_floor;

    records_.clear();
    recorded_ = false;

    SpatialParameters physical = denormalize(inputs.params, config_.parameter_ranges);
    Vector slope = net.slope().cwiseMax(config_.slope_floor);

    // Initial state
    Vector q_t;
    bool from_lateral = false;
    if (inputs.boundary == BatchBoundary::Carry && has_state()) {
        q_t = discharge_;
    } else if (net.starting_discharge().size() != 0) {
        q_t = net.starting_discharge();
    } else {
        q_t = inputs.lateral_inflow.row(0).transpose();
        from_lateral = true;
    }

    RoutingOutput output;
    output.runoff.resize(net.n_gauges(), n_steps);
    Vector sums0 = gauge_sums(q_t);
    output.runoff.col(0) = kernels::clamp_min(sums0, floor_q);

    if (config_.verbose) {
        std::cerr << "ddr: routing " << n_steps << " timesteps over " << n << " segments\n";
    }

    const bool record = config_.record_gradients;
    if (record) {
        records_.reserve(static_cast<Size>(n_steps > 0 ? n_steps - 1 : 0));
    }

    const UpstreamInflows& up = inputs.upstream;
    const PatternMapper& mapper = *mapper_;

    for (Index t = 1; t < n_steps; ++t) {
        StepRecord rec;

        for (Size k = 0; k < up.segments.size(); ++k) {
            q_t(up.segments[k]) = up.series(static_cast<Index>(k), t - 1);
        }

        Vector lateral_raw = inputs.lateral_inflow.row(t - 1).transpose();
        Vector q_l = kernels::clamp_min(lateral_raw, floor_q);
        for (Size k = 0; k < up.segments.size(); ++k) {
            q_l(up.segments[k]) = up.series(static_cast<Index>(k), t);
        }

        kernels::Hydraulics hyd = kernels::hydraulics(q_t, physical, slope, net.width(), config_);
        kernels::MuskingumCoefficients mc =
            kernels::muskingum_coefficients(net.length(), hyd.celerity, x_storage, dt);

        Vector i_t = net.adjacency() * q_t;
        Vector b = mc.c2.cwiseProduct(i_t) + mc.c3.cwiseProduct(q_t) + mc.c4.cwiseProduct(q_l);

        Vector values = mapper.map(assemble_coefficients(mc.c1));

        Vector x;
        try {
            x = TriangularSparseSolve::forward(values, mapper.pattern(), b, lower_, false,
                                               record ? &rec.solve : nullptr);
        } catch (const SolverError& e) {
            records_.clear();
            if (config_.verbose) {
                std::cerr << "ddr: solve failed at timestep " << t << ": " << e.what() << "\n";
            }
            throw TimestepError(e, t);
        }

        Vector q_next = kernels::clamp_min(x, floor_q);
        output.runoff.col(t) = gauge_sums(q_next);

        if (record) {
            rec.discharge_prev = std::move(q_t);
            rec.lateral_raw = std::move(lateral_raw);
            rec.lateral = std::move(q_l);
            rec.hydraulics = std::move(hyd);
            rec.coeffs = std::move(mc);
            rec.inflow = std::move(i_t);
            records_.push_back(std::move(rec));
        }

        q_t = std::move(q_next);
    }

    discharge_ = q_t;
    output.final_discharge = q_t;

    if (record) {
        physical_ = std::move(physical);
        slope_ = std::move(slope);
        initial_gauge_sums_ = std::move(sums0);
        initial_from_lateral_ = from_lateral;
        upstream_ = up;
        n_timesteps_ = n_steps;
        recorded_ = true;
    }

    return output;
}

// ============================================================================
// Backward
// ============================================================================

ParameterGradients MuskingumCungeRouter::backward(const Matrix& grad_runoff) {
    if (!recorded_) {
        throw StructuralError("backward() needs a recorded forward(); "
                              "enable record_gradients and run forward() first");
    }

    const RiverNetwork& net = *network_;
    const Index n = net.n_segments();
    const Index n_gauges = net.n_gauges();
    if (grad_runoff.rows() != n_gauges || grad_runoff.cols() != n_timesteps_) {
        throw StructuralError("runoff gradient must be " + std::to_string(n_gauges) + " x " +
                              std::to_string(n_timesteps_));
    }

    const Real dt = config_.timestep_duration;
    const Real x_storage = config_.storage_weighting_x;
    const Real floor_q = config_.discharge_floor;
    const Real floor_depth = config_.depth_floor;
    const Real v_lo = config_.velocity_lower_bound;
    const Real v_hi = config_.velocity_upper_bound;
    const PatternMapper& mapper = *mapper_;
    const SpatialParameters& phys = physical_;

    Vector grad_n = Vector::Zero(n);
    Vector grad_q = Vector::Zero(n);
    Vector grad_p = Vector::Zero(n);
    Matrix grad_lateral = Matrix::Zero(n_timesteps_, n);

    // dL/dQ_t flowing back from step t+1
    Vector lambda = Vector::Zero(n);

    for (Index t = n_timesteps_ - 1; t >= 1; --t) {
        StepRecord& rec = records_[static_cast<Size>(t - 1)];
        const kernels::Hydraulics& hyd = rec.hydraulics;
        const kernels::MuskingumCoefficients& mc = rec.coeffs;

        // Gauge sums and the discharge floor
        Vector grad_q_next = lambda;
        scatter_gauge_gradient(grad_runoff.col(t), grad_q_next);
        Vector grad_x = (rec.solve.x.array() >= floor_q).select(grad_q_next.array(), 0.0).matrix();

        // Triangular solve
        TriangularSolveGradients sg = TriangularSparseSolve::backward(rec.solve, grad_x);
        Vector grad_coeffs = mapper.map_adjoint(sg.values);
        Vector grad_c1 = -grad_coeffs.tail(n);

        // b = c2 i_t + c3 Q + c4 q_l
        const Vector& gb = sg.b;
        Vector grad_c2 = gb.cwiseProduct(rec.inflow);
        Vector grad_c3 = gb.cwiseProduct(rec.discharge_prev);
        Vector grad_c4 = gb.cwiseProduct(rec.lateral);
        Vector grad_prev = gb.cwiseProduct(mc.c3) +
                           net.adjacency().transpose() * gb.cwiseProduct(mc.c2);
        Vector grad_ql = gb.cwiseProduct(mc.c4);

        // Coefficients -> travel time -> celerity -> Manning
        Vector grad_k = kernels::coefficient_gradient_k(mc, grad_c1, grad_c2, grad_c3, grad_c4,
                                                        x_storage, dt);

        for (Index i = 0; i < n; ++i) {
            const Real v_raw = hyd.velocity_raw(i);
            if (!(v_raw >= v_lo && v_raw <= v_hi)) continue;  // clamp active

            const Real c = hyd.celerity(i);
            const Real grad_c = -grad_k(i) * net.length()(i) / (c * c);
            const Real grad_v = grad_c * constants::KINEMATIC_CELERITY_FACTOR;

            const Real n_i = phys.n(i);
            grad_n(i) -= grad_v * v_raw / n_i;

            const Real h = hyd.depth_raw(i);
            if (!(std::isfinite(h) && h >= floor_depth)) continue;  // depth floor active

            const Real grad_h = grad_v * constants::MANNING_DEPTH_EXPONENT * v_raw / h;
            const Real q_i = phys.q_spatial(i);
            const Real p_i = phys.p_spatial(i);

            if (config_.depth_method == DepthMethod::PowerLaw) {
                const Real e = 3.0 / (5.0 + 3.0 * q_i);
                const Real z = hyd.power_base(i);
                const Real common = grad_h * e * h;  // dL/dz * z

                grad_prev(i) += common / rec.discharge_prev(i);
                grad_n(i) += common / n_i;
                grad_p(i) -= common / p_i;
                grad_q(i) += common / (q_i + 1.0) -
                             grad_h * h * std::log(z) * 9.0 / ((5.0 + 3.0 * q_i) * (5.0 + 3.0 * q_i));
            } else {
                const Real log_q = std::log(q_i);
                grad_p(i) -= grad_h / (p_i * log_q);
                grad_q(i) -= grad_h * h / (q_i * log_q);
            }
        }

        // Imposed values cut the chain
        for (Index s : upstream_.segments) {
            grad_prev(s) = 0.0;
            grad_ql(s) = 0.0;
        }

        Vector grad_lateral_raw =
            (rec.lateral_raw.array() >= floor_q).select(grad_ql.array(), 0.0).matrix();
        grad_lateral.row(t - 1) += grad_lateral_raw.transpose();

        lambda = std::move(grad_prev);
        rec.solve.clear();
    }

    // Initial state and output column 0
    Vector grad_gauge0 =
        (initial_gauge_sums_.array() >= floor_q).select(grad_runoff.col(0).array(), 0.0).matrix();
    scatter_gauge_gradient(grad_gauge0, lambda);
    if (initial_from_lateral_) {
        grad_lateral.row(0) += lambda.transpose();
    }

    records_.clear();
    recorded_ = false;

    const ParameterRanges& ranges = config_.parameter_ranges;
    ParameterGradients grads;
    grads.params.n = grad_n * ranges.n.span();
    grads.params.q_spatial = grad_q * ranges.q_spatial.span();
    grads.params.p_spatial = grad_p * ranges.p_spatial.span();
    grads.lateral_inflow = std::move(grad_lateral);
    return grads;
}

} // namespace ddr
