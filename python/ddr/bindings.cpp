/**
 * @file bindings.cpp
 * @brief Python bindings for ddr using pybind11
 *
 * Provides Python interface for:
 * - Configuration and network setup
 * - Forward routing and the explicit reverse pass
 * - The pattern mapper and triangular solve as standalone operators,
 *   so a training framework can wrap them in its own custom gradient
 */

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>

#include "ddr/ddr.hpp"
#include <cstring>
#include <memory>

namespace py = pybind11;
using namespace ddr;

// ============================================================================
// Helper Functions
// ============================================================================

/// Convert Eigen Vector to NumPy array
py::array_t<double> vector_to_numpy(const Vector& vec) {
    return py::array_t<double>(vec.size(), vec.data());
}

/// Convert NumPy array to Eigen Vector
Vector numpy_to_vector(py::array_t<double, py::array::c_style | py::array::forcecast> arr) {
    py::buffer_info buf = arr.request();
    Vector vec(buf.size);
    std::memcpy(vec.data(), buf.ptr, buf.size * sizeof(double));
    return vec;
}

/// Solve context owned on the Python side between forward and backward
struct SolveHandle {
    SparsePattern pattern;
    TriangularSolveContext ctx;
};

// ============================================================================
// Python Module Definition
// ============================================================================

PYBIND11_MODULE(ddr_py, m) {
    m.doc() = R"pbdoc(
        ddr: Differentiable Muskingum-Cunge Routing
        ===========================================

        Routes lateral inflow through a river network, one sparse
        triangular solve per timestep, with a hand-written reverse pass.

        Example:
            >>> import ddr_py as ddr
            >>> net = ddr.RiverNetwork.from_downstream([2, 2, -1], length, slope, width)
            >>> router = ddr.MuskingumCungeRouter(ddr.RoutingConfig.from_file("routing.yaml"))
            >>> router.set_network(net)
            >>> out = router.forward(inputs)
            >>> grads = router.backward(dL_drunoff)
    )pbdoc";

    // ========================================================================
    // Errors
    // ========================================================================

    py::register_exception<StructuralError>(m, "StructuralError", PyExc_ValueError);
    auto solver_error = py::register_exception<SolverError>(m, "SolverError", PyExc_RuntimeError);
    py::register_exception<TimestepError>(m, "TimestepError", solver_error.ptr());
    py::register_exception<ResourceExhaustion>(m, "ResourceExhaustion", PyExc_MemoryError);

    // ========================================================================
    // Enums
    // ========================================================================

    py::enum_<DepthMethod>(m, "DepthMethod")
        .value("PowerLaw", DepthMethod::PowerLaw)
        .value("WidthRating", DepthMethod::WidthRating)
        .export_values();

    py::enum_<Orientation>(m, "Orientation")
        .value("Lower", Orientation::Lower)
        .value("Upper", Orientation::Upper)
        .export_values();

    py::enum_<BatchBoundary>(m, "BatchBoundary")
        .value("Reset", BatchBoundary::Reset)
        .value("Carry", BatchBoundary::Carry)
        .export_values();

    // ========================================================================
    // Configuration
    // ========================================================================

    py::class_<ParameterRange>(m, "ParameterRange")
        .def(py::init<>())
        .def(py::init([](Real lo, Real hi) { return ParameterRange{lo, hi}; }))
        .def_readwrite("min", &ParameterRange::min)
        .def_readwrite("max", &ParameterRange::max)
        .def("span", &ParameterRange::span);

    py::class_<ParameterRanges>(m, "ParameterRanges")
        .def(py::init<>())
        .def_readwrite("n", &ParameterRanges::n)
        .def_readwrite("q_spatial", &ParameterRanges::q_spatial)
        .def_readwrite("p_spatial", &ParameterRanges::p_spatial);

    py::class_<RoutingConfig>(m, "RoutingConfig")
        .def(py::init<>())
        .def_static("from_file", [](const std::string& path) {
            return RoutingConfig::from_file(path);
        })
        .def("to_file", [](const RoutingConfig& c, const std::string& path) {
            c.to_file(path);
        })
        .def("validate", &RoutingConfig::validate)
        .def("check", &RoutingConfig::check)
        .def_readwrite("timestep_duration", &RoutingConfig::timestep_duration)
        .def_readwrite("storage_weighting_x", &RoutingConfig::storage_weighting_x)
        .def_readwrite("velocity_lower_bound", &RoutingConfig::velocity_lower_bound)
        .def_readwrite("velocity_upper_bound", &RoutingConfig::velocity_upper_bound)
        .def_readwrite("discharge_floor", &RoutingConfig::discharge_floor)
        .def_readwrite("slope_floor", &RoutingConfig::slope_floor)
        .def_readwrite("depth_floor", &RoutingConfig::depth_floor)
        .def_readwrite("depth_method", &RoutingConfig::depth_method)
        .def_readwrite("use_reservoir_branch", &RoutingConfig::use_reservoir_branch)
        .def_readwrite("record_gradients", &RoutingConfig::record_gradients)
        .def_readwrite("verbose", &RoutingConfig::verbose)
        .def_readwrite("parameter_ranges", &RoutingConfig::parameter_ranges);

    // ========================================================================
    // Network and Parameters
    // ========================================================================

    py::class_<RiverNetwork, Ptr<RiverNetwork>>(m, "RiverNetwork")
        .def_static("from_downstream", [](const std::vector<Index>& downstream,
                                          const Vector& length, const Vector& slope,
                                          const Vector& width) {
            return std::make_shared<RiverNetwork>(
                RiverNetwork::from_downstream(downstream, length, slope, width));
        }, py::arg("downstream"), py::arg("length"), py::arg("slope"), py::arg("width"))
        .def_static("from_dense", [](const Matrix& adjacency, const Vector& length,
                                     const Vector& slope, const Vector& width) {
            return std::make_shared<RiverNetwork>(
                RiverNetwork::from_dense(adjacency, length, slope, width));
        }, py::arg("adjacency"), py::arg("length"), py::arg("slope"), py::arg("width"))
        .def("n_segments", &RiverNetwork::n_segments)
        .def("n_edges", &RiverNetwork::n_edges)
        .def("n_gauges", &RiverNetwork::n_gauges)
        .def("orientation", &RiverNetwork::orientation)
        .def("upstream_of", &RiverNetwork::upstream_of)
        .def("set_gauges", &RiverNetwork::set_gauges)
        .def("gauges", &RiverNetwork::gauges)
        .def("set_starting_discharge", [](RiverNetwork& self, py::array_t<double> q0) {
            self.set_starting_discharge(numpy_to_vector(q0));
        })
        .def("length", [](const RiverNetwork& self) { return vector_to_numpy(self.length()); })
        .def("slope", [](const RiverNetwork& self) { return vector_to_numpy(self.slope()); })
        .def("width", [](const RiverNetwork& self) { return vector_to_numpy(self.width()); });

    py::class_<SpatialParameters>(m, "SpatialParameters")
        .def(py::init<>())
        .def_static("uniform", &SpatialParameters::uniform)
        .def_readwrite("n", &SpatialParameters::n)
        .def_readwrite("q_spatial", &SpatialParameters::q_spatial)
        .def_readwrite("p_spatial", &SpatialParameters::p_spatial);

    py::class_<ParameterGradients>(m, "ParameterGradients")
        .def_readonly("params", &ParameterGradients::params)
        .def_readonly("lateral_inflow", &ParameterGradients::lateral_inflow);

    m.def("denormalize",
          py::overload_cast<const SpatialParameters&, const ParameterRanges&>(&denormalize),
          "Map normalized parameters onto their physical ranges");

    // ========================================================================
    // Router
    // ========================================================================

    py::class_<UpstreamInflows>(m, "UpstreamInflows")
        .def(py::init<>())
        .def_readwrite("segments", &UpstreamInflows::segments)
        .def_readwrite("series", &UpstreamInflows::series);

    py::class_<RoutingInputs>(m, "RoutingInputs")
        .def(py::init<>())
        .def_readwrite("params", &RoutingInputs::params)
        .def_readwrite("lateral_inflow", &RoutingInputs::lateral_inflow)
        .def_readwrite("upstream", &RoutingInputs::upstream)
        .def_readwrite("boundary", &RoutingInputs::boundary);

    py::class_<RoutingOutput>(m, "RoutingOutput")
        .def_readonly("runoff", &RoutingOutput::runoff)
        .def_readonly("final_discharge", &RoutingOutput::final_discharge);

    py::class_<MuskingumCungeRouter>(m, "MuskingumCungeRouter")
        .def(py::init<RoutingConfig>(), py::arg("config") = RoutingConfig())
        .def("set_network", [](MuskingumCungeRouter& self, Ptr<RiverNetwork> net) {
            self.set_network(std::move(net));
        })
        .def("forward", &MuskingumCungeRouter::forward,
             "Route all timesteps; records the tape for backward()")
        .def("backward", &MuskingumCungeRouter::backward,
             "Reverse pass of the last forward() for dL/d(runoff)")
        .def("discharge", [](const MuskingumCungeRouter& self) {
            return vector_to_numpy(self.discharge());
        })
        .def("has_state", &MuskingumCungeRouter::has_state)
        .def("reset_state", &MuskingumCungeRouter::reset_state)
        .def("has_recording", &MuskingumCungeRouter::has_recording)
        .def("config", &MuskingumCungeRouter::config, py::return_value_policy::reference_internal);

    // ========================================================================
    // Sparse operators
    // ========================================================================

    py::class_<PatternMapper>(m, "PatternMapper")
        .def_static("build_dense", &PatternMapper::build_dense,
                    py::arg("fill"), py::arg("dimension"))
        .def("map", &PatternMapper::map)
        .def("map_adjoint", &PatternMapper::map_adjoint)
        .def("dimension", &PatternMapper::dimension)
        .def("nnz", &PatternMapper::nnz)
        .def("coo_indices", &PatternMapper::coo_indices)
        .def("crow_indices", [](const PatternMapper& self) { return self.pattern().row_ptr; })
        .def("col_indices", [](const PatternMapper& self) { return self.pattern().col_idx; })
        .def("to_dense", &PatternMapper::to_dense);

    py::class_<SolveHandle, std::shared_ptr<SolveHandle>>(m, "SolveHandle");

    m.def("triangular_solve_fwd",
        [](const PatternMapper& mapper, const Vector& values, const Vector& b,
           bool lower, bool unit_diagonal) {
            auto handle = std::make_shared<SolveHandle>();
            handle->pattern = mapper.pattern();
            Vector x = TriangularSparseSolve::forward(values, handle->pattern, b,
                                                      lower, unit_diagonal, &handle->ctx);
            return std::make_tuple(x, handle);
        },
        py::arg("mapper"), py::arg("values"), py::arg("b"),
        py::arg("lower") = true, py::arg("unit_diagonal") = false,
        "Forward solve; returns (x, handle) for triangular_solve_bwd");

    m.def("triangular_solve_bwd",
        [](const std::shared_ptr<SolveHandle>& handle, const Vector& grad_x) {
            TriangularSolveGradients g = TriangularSparseSolve::backward(handle->ctx, grad_x);
            handle->ctx.clear();
            return std::make_tuple(g.values, g.b);
        },
        py::arg("handle"), py::arg("grad_x"),
        "Backward solve; returns (dL/dvalues, dL/db)");

    // ========================================================================
    // Version Info
    // ========================================================================

    m.attr("__version__") = VERSION;
}
