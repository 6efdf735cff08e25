/**
 * @file pattern_mapper.hpp
 * @brief Fixed sparse nonzero pattern and coefficient scatter
 *
 * A PatternMapper is built once from the network topology and reused every
 * timestep. It answers one question: given a dense coefficient vector c,
 * what is the values array of the sparse matrix whose structure is fixed?
 *
 *   values[p] = c[source[p]]        (equivalently values = Mᵀ c)
 *
 * where M is a (dimension x nnz) 0/1 matrix with exactly one 1 per column.
 * The map is linear, so its adjoint is the scatter-add with Mᵀ swapped for M.
 *
 * The pattern is discovered by probing: the fill function is called with
 * [1, 2, ..., dimension] and each nonzero it produces holds the 1-based index
 * of the coefficient that belongs there. Indices are 1-based because a 0 would
 * be pruned along with the structural zeros.
 */

#pragma once

#include "../core/types.hpp"
#include <utility>

namespace ddr {

/**
 * @brief Compressed-row nonzero pattern (values live elsewhere)
 */
struct SparsePattern {
    Index rows = 0;
    Index cols = 0;
    IndexArray row_ptr;     ///< rows + 1 offsets into col_idx
    IndexArray col_idx;     ///< column of each nonzero, sorted within a row

    Index nnz() const { return static_cast<Index>(col_idx.size()); }

    /// Row of every nonzero (COO expansion of row_ptr)
    IndexArray row_indices() const;

    /// Position of (row, col) in the values array, or -1 if structurally zero
    Index find(Index row, Index col) const;

    /// Wrap a values array as an Eigen matrix with this structure (copies)
    SparseMatrix assemble(const Vector& values) const;

    /// @throws StructuralError if the arrays are not a valid CSR structure
    void check() const;
};

/// Fill function: probe vector -> sparse matrix carrying 1-based indices
using FillFunction = std::function<SparseMatrix(const Vector& probe)>;

/// Dense variant of FillFunction
using DenseFillFunction = std::function<Matrix(const Vector& probe)>;

class PatternMapper {
public:
    /**
     * @brief Probe the fill function and derive pattern + scatter
     *
     * @param fill Fill function
     * @param dimension Length of the coefficient vectors that will be mapped
     * @throws StructuralError if a probe value is not an integer in [1, dimension]
     */
    static PatternMapper build(const FillFunction& fill, Index dimension);

    /// Same as build() for fill functions that return a dense matrix
    static PatternMapper build_dense(const DenseFillFunction& fill, Index dimension);

    /**
     * @brief Gather coefficients into pattern order
     *
     * @throws StructuralError if coefficients.size() != dimension()
     */
    Vector map(const Vector& coefficients) const;

    /**
     * @brief Adjoint of map(): scatter-add value gradients onto coefficients
     *
     * @throws StructuralError if grad_values.size() != nnz()
     */
    Vector map_adjoint(const Vector& grad_values) const;

    // Accessors
    const SparsePattern& pattern() const { return pattern_; }
    const SparseMatrix& scatter_operator() const { return scatter_; }
    const IndexArray& source_index() const { return source_; }
    Index dimension() const { return dimension_; }
    Index nnz() const { return pattern_.nnz(); }

    /// Explicit (row, col) of every nonzero
    std::pair<IndexArray, IndexArray> coo_indices() const;

    /// Dense embedding of a values array (inspection and tests)
    Matrix to_dense(const Vector& values) const;

private:
    PatternMapper() = default;

    SparsePattern pattern_;
    IndexArray source_;         ///< coefficient index feeding each nonzero
    SparseMatrix scatter_;      ///< dimension x nnz, one 1 per column
    Index dimension_ = 0;
};

} // namespace ddr
