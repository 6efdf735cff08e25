/**
 * @file network.cpp
 * @brief River network construction and validation
 */

#include "ddr/core/network.hpp"
#include "ddr/core/errors.hpp"
#include <cmath>
#include <string>

namespace ddr {

RiverNetwork::RiverNetwork(SparseMatrix adjacency, Vector length, Vector slope, Vector width)
    : adjacency_(std::move(adjacency)),
      length_(std::move(length)),
      slope_(std::move(slope)),
      width_(std::move(width)) {
    adjacency_.makeCompressed();
    validate();

    // Every segment is its own gauge until told otherwise
    const Index n = n_segments();
    gauges_.resize(n);
    for (Index i = 0; i < n; ++i) {
        gauges_[i] = {i};
    }
}

RiverNetwork RiverNetwork::from_downstream(const std::vector<Index>& downstream,
                                           Vector length, Vector slope, Vector width) {
    const Index n = static_cast<Index>(downstream.size());

    std::vector<SparseTriplet> triplets;
    triplets.reserve(downstream.size());
    for (Index j = 0; j < n; ++j) {
        const Index i = downstream[j];
        if (i < 0) continue;  // outlet
        if (i >= n) {
            throw StructuralError("downstream index " + std::to_string(i) +
                                  " of segment " + std::to_string(j) +
                                  " out of range for " + std::to_string(n) + " segments");
        }
        triplets.emplace_back(static_cast<int>(i), static_cast<int>(j), 1.0);
    }

    SparseMatrix adjacency(n, n);
    adjacency.setFromTriplets(triplets.begin(), triplets.end());

    return RiverNetwork(std::move(adjacency), std::move(length),
                        std::move(slope), std::move(width));
}

RiverNetwork RiverNetwork::from_dense(const Matrix& adjacency,
                                      Vector length, Vector slope, Vector width) {
    SparseMatrix sparse = adjacency.sparseView();
    return RiverNetwork(std::move(sparse), std::move(length),
                        std::move(slope), std::move(width));
}

void RiverNetwork::validate() {
    const Index n = n_segments();

    if (adjacency_.rows() != n || adjacency_.cols() != n) {
        throw StructuralError("adjacency is " + std::to_string(adjacency_.rows()) + "x" +
                              std::to_string(adjacency_.cols()) + " but there are " +
                              std::to_string(n) + " segments");
    }
    if (slope_.size() != n || width_.size() != n) {
        throw StructuralError("length/slope/width sizes differ (" +
                              std::to_string(n) + ", " + std::to_string(slope_.size()) +
                              ", " + std::to_string(width_.size()) + ")");
    }

    bool has_lower = false;
    bool has_upper = false;
    for (int k = 0; k < adjacency_.outerSize(); ++k) {
        for (SparseMatrix::InnerIterator it(adjacency_, k); it; ++it) {
            if (it.value() == 0.0) continue;
            if (it.row() == it.col()) {
                throw StructuralError("self-loop on segment " + std::to_string(it.row()) +
                                      "; the diagonal is reserved for the pivot term");
            }
            if (it.row() > it.col()) {
                has_lower = true;
            } else {
                has_upper = true;
            }
        }
    }

    if (has_lower && has_upper) {
        throw StructuralError("adjacency has couplings on both sides of the diagonal; "
                              "segments are not topologically ordered");
    }
    orientation_ = has_upper ? Orientation::Upper : Orientation::Lower;

    for (Index i = 0; i < n; ++i) {
        if (!(length_(i) > 0.0) || !std::isfinite(length_(i))) {
            throw StructuralError("segment " + std::to_string(i) + " has non-positive length");
        }
    }
}

std::vector<Index> RiverNetwork::upstream_of(Index i) const {
    std::vector<Index> upstream;
    for (SparseMatrix::InnerIterator it(adjacency_, static_cast<int>(i)); it; ++it) {
        if (it.value() != 0.0) {
            upstream.push_back(it.col());
        }
    }
    return upstream;
}

void RiverNetwork::set_gauges(std::vector<std::vector<Index>> gauges) {
    const Index n = n_segments();
    for (Size g = 0; g < gauges.size(); ++g) {
        if (gauges[g].empty()) {
            throw StructuralError("gauge " + std::to_string(g) + " maps to no segment");
        }
        for (Index s : gauges[g]) {
            if (s < 0 || s >= n) {
                throw StructuralError("gauge " + std::to_string(g) + " maps to segment " +
                                      std::to_string(s) + ", outside [0, " +
                                      std::to_string(n) + ")");
            }
        }
    }
    gauges_ = std::move(gauges);
}

void RiverNetwork::set_starting_discharge(Vector q0) {
    if (q0.size() != 0 && q0.size() != n_segments()) {
        throw StructuralError("starting discharge has " + std::to_string(q0.size()) +
                              " entries for " + std::to_string(n_segments()) + " segments");
    }
    starting_discharge_ = std::move(q0);
}

} // namespace ddr
