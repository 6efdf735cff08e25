/**
 * @file network.hpp
 * @brief River network consumed by the routing core
 *
 * Holds the drainage topology and the per-segment channel attributes:
 * - Adjacency: entry (i, j) = 1 when segment j drains into segment i
 * - Length, slope, width per segment
 * - Gauge -> segment(s) mapping
 * - Optional starting discharge
 *
 * Segments must be numbered in topological order so that every upstream
 * coupling sits on the same side of the diagonal. That side decides whether
 * the routing system is lower or upper triangular.
 */

#pragma once

#include "types.hpp"

namespace ddr {

class RiverNetwork {
public:
    /**
     * @brief Build from an adjacency matrix
     *
     * @throws StructuralError on shape mismatch, self-loops or a topology
     *         that is not triangular
     */
    RiverNetwork(SparseMatrix adjacency, Vector length, Vector slope, Vector width);

    /**
     * @brief Build from a downstream list
     *
     * @param downstream downstream[j] is the segment j drains into, or -1
     */
    static RiverNetwork from_downstream(const std::vector<Index>& downstream,
                                        Vector length, Vector slope, Vector width);

    /**
     * @brief Build from a dense 0/1 adjacency
     */
    static RiverNetwork from_dense(const Matrix& adjacency,
                                   Vector length, Vector slope, Vector width);

    // ========================================================================
    // Topology
    // ========================================================================

    Index n_segments() const { return static_cast<Index>(length_.size()); }
    Index n_edges() const { return static_cast<Index>(adjacency_.nonZeros()); }
    const SparseMatrix& adjacency() const { return adjacency_; }
    Orientation orientation() const { return orientation_; }

    /// Segments draining directly into segment i
    std::vector<Index> upstream_of(Index i) const;

    // ========================================================================
    // Channel attributes
    // ========================================================================

    const Vector& length() const { return length_; }
    const Vector& slope() const { return slope_; }
    const Vector& width() const { return width_; }

    // ========================================================================
    // Gauges and initial condition
    // ========================================================================

    /**
     * @brief Set the segment(s) summed into each gauge's output
     *
     * @throws StructuralError if a gauge is empty or an index is out of range
     */
    void set_gauges(std::vector<std::vector<Index>> gauges);
    const std::vector<std::vector<Index>>& gauges() const { return gauges_; }
    Index n_gauges() const { return static_cast<Index>(gauges_.size()); }

    /// Empty vector means cold start
    void set_starting_discharge(Vector q0);
    const Vector& starting_discharge() const { return starting_discharge_; }

private:
    SparseMatrix adjacency_;
    Vector length_;
    Vector slope_;
    Vector width_;
    Orientation orientation_ = Orientation::Lower;

    std::vector<std::vector<Index>> gauges_;
    Vector starting_discharge_;

    void validate();
};

} // namespace ddr
