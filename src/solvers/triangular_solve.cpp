/**
 * @file triangular_solve.cpp
 * @brief Sparse triangular solve and its adjoint
 */

#include "ddr/solvers/triangular_solve.hpp"
#include "ddr/core/errors.hpp"
#include <new>
#include <string>

namespace ddr {

namespace {

/// Diagonal entries must exist and be nonzero unless the diagonal is implicit
void check_diagonal(const Vector& values, const SparsePattern& pattern, Index rhs_size) {
    for (Index i = 0; i < pattern.rows; ++i) {
        const Index p = pattern.find(i, i);
        if (p < 0) {
            throw SolverError("triangular solve: missing diagonal at row " + std::to_string(i),
                              pattern.rows, pattern.nnz(), rhs_size);
        }
        if (values(p) == 0.0) {
            throw SolverError("triangular solve: zero diagonal at row " + std::to_string(i),
                              pattern.rows, pattern.nnz(), rhs_size);
        }
    }
}

/// Only entries on the solved side of the diagonal (and the diagonal) matter
bool in_triangle(Index row, Index col, bool lower) {
    return lower ? col <= row : col >= row;
}

} // namespace

// ============================================================================
// TriangularSolveContext
// ============================================================================

void TriangularSolveContext::clear() {
    values.resize(0);
    x.resize(0);
    b.resize(0);
    pattern = nullptr;
}

// ============================================================================
// TriangularSparseSolve
// ============================================================================

Vector TriangularSparseSolve::forward(
    const Vector& values,
    const SparsePattern& pattern,
    const Vector& b,
    bool lower,
    bool unit_diagonal,
    TriangularSolveContext* ctx
) {
    const Index n = pattern.rows;
    const Index nnz = pattern.nnz();

    if (pattern.cols != n) {
        throw StructuralError("triangular solve needs a square pattern, got " +
                              std::to_string(n) + "x" + std::to_string(pattern.cols));
    }
    if (values.size() != nnz) {
        throw StructuralError("triangular solve: " + std::to_string(values.size()) +
                              " values for a pattern with nnz=" + std::to_string(nnz));
    }
    if (b.size() != n) {
        throw StructuralError("triangular solve: rhs has " + std::to_string(b.size()) +
                              " entries for n=" + std::to_string(n));
    }

    if (!unit_diagonal) {
        check_diagonal(values, pattern, b.size());
    }

    Vector x;
    try {
        Eigen::Map<const SparseMatrix> A(n, n, nnz, pattern.row_ptr.data(),
                                         pattern.col_idx.data(), values.data());
        x = b;

        // The other triangle is dropped so it can never leak into the solve
        if (lower) {
            SparseMatrix L = A.triangularView<Eigen::Lower>();
            if (unit_diagonal) {
                L.triangularView<Eigen::UnitLower>().solveInPlace(x);
            } else {
                L.triangularView<Eigen::Lower>().solveInPlace(x);
            }
        } else {
            SparseMatrix U = A.triangularView<Eigen::Upper>();
            if (unit_diagonal) {
                U.triangularView<Eigen::UnitUpper>().solveInPlace(x);
            } else {
                U.triangularView<Eigen::Upper>().solveInPlace(x);
            }
        }
    } catch (const std::bad_alloc&) {
        throw ResourceExhaustion("out of memory in triangular solve (n=" + std::to_string(n) +
                                 ", nnz=" + std::to_string(nnz) + ")");
    }

    if (!x.allFinite()) {
        throw SolverError("triangular solve produced a non-finite solution", n, nnz, b.size());
    }

    if (ctx != nullptr) {
        ctx->values = values;
        ctx->pattern = &pattern;
        ctx->x = x;
        ctx->b = b;
        ctx->lower = lower;
        ctx->unit_diagonal = unit_diagonal;
    }

    return x;
}

TriangularSolveGradients TriangularSparseSolve::backward(
    const TriangularSolveContext& ctx,
    const Vector& grad_x
) {
    if (!ctx.saved()) {
        throw StructuralError("triangular solve backward called without a saved context");
    }
    const SparsePattern& pattern = *ctx.pattern;
    const Index n = pattern.rows;
    if (grad_x.size() != n) {
        throw StructuralError("triangular solve backward: gradient has " +
                              std::to_string(grad_x.size()) + " entries for n=" +
                              std::to_string(n));
    }

    // Aᵀ gb = g, solved with the same routine on the transposed pattern
    TransposedPattern transposed = transpose(pattern);
    const Index nnz = pattern.nnz();
    Vector values_t(nnz);
    for (Index q = 0; q < nnz; ++q) {
        values_t(q) = ctx.values(transposed.permutation[q]);
    }

    TriangularSolveGradients grads;
    grads.b = forward(values_t, transposed.pattern, grad_x,
                      !ctx.lower, ctx.unit_diagonal);

    grads.values = Vector::Zero(nnz);
    for (Index i = 0; i < n; ++i) {
        for (StorageIndex p = pattern.row_ptr[i]; p < pattern.row_ptr[i + 1]; ++p) {
            const Index j = pattern.col_idx[p];
            if (!in_triangle(i, j, ctx.lower)) continue;
            if (ctx.unit_diagonal && i == j) continue;
            grads.values(p) = -grads.b(i) * ctx.x(j);
        }
    }

    return grads;
}

TransposedPattern TriangularSparseSolve::transpose(const SparsePattern& pattern) {
    const Index nnz = pattern.nnz();

    TransposedPattern result;
    SparsePattern& t = result.pattern;
    t.rows = pattern.cols;
    t.cols = pattern.rows;
    t.row_ptr.assign(static_cast<Size>(t.rows + 1), 0);
    t.col_idx.resize(static_cast<Size>(nnz));
    result.permutation.resize(static_cast<Size>(nnz));

    // Count entries per column, then prefix-sum into row pointers
    for (Index p = 0; p < nnz; ++p) {
        ++t.row_ptr[pattern.col_idx[p] + 1];
    }
    for (Index c = 0; c < t.rows; ++c) {
        t.row_ptr[c + 1] += t.row_ptr[c];
    }

    // Rows visited in order keep the transposed columns sorted
    IndexArray next(t.row_ptr.begin(), t.row_ptr.end() - 1);
    for (Index i = 0; i < pattern.rows; ++i) {
        for (StorageIndex p = pattern.row_ptr[i]; p < pattern.row_ptr[i + 1]; ++p) {
            const StorageIndex q = next[pattern.col_idx[p]]++;
            t.col_idx[q] = static_cast<StorageIndex>(i);
            result.permutation[q] = p;
        }
    }

    return result;
}

} // namespace ddr
