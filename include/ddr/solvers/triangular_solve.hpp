/**
 * @file triangular_solve.hpp
 * @brief Differentiable sparse triangular solve
 *
 * Forward:  A x = b, A triangular with a fixed CSR pattern.
 * Backward: given g = dL/dx,
 *   Aᵀ gb = g                       (transposed solve, opposite triangle)
 *   dL/dA[i, j] = -gb[i] * x[j]     (only at pattern positions)
 *   dL/db = gb
 *
 * The pattern and the flags are structural and receive no gradient.
 * The solve runs in double precision whatever the input scalar type.
 */

#pragma once

#include "../core/types.hpp"
#include "../sparse/pattern_mapper.hpp"

namespace ddr {

/**
 * @brief What the forward pass saves for one backward pass
 *
 * Owned by a single forward/backward pair. The pattern is not copied; it must
 * outlive the context (it belongs to the PatternMapper).
 */
struct TriangularSolveContext {
    Vector values;
    const SparsePattern* pattern = nullptr;
    Vector x;
    Vector b;
    bool lower = true;
    bool unit_diagonal = false;

    bool saved() const { return pattern != nullptr; }
    void clear();
};

struct TriangularSolveGradients {
    Vector values;  ///< dL/dA at each pattern position
    Vector b;       ///< dL/db
};

/**
 * @brief Transposed pattern plus the value permutation
 *
 * Transposed position q holds the entry at position permutation[q] of the input.
 */
struct TransposedPattern {
    SparsePattern pattern;
    IndexArray permutation;
};

class TriangularSparseSolve {
public:
    /**
     * @brief Solve A x = b
     *
     * @param values Nonzero values in pattern order
     * @param pattern Square CSR pattern
     * @param b Right-hand side
     * @param lower Solve with the lower (true) or upper (false) triangle
     * @param unit_diagonal Treat the diagonal as 1 without reading it
     * @param ctx If non-null, filled for backward()
     *
     * @throws StructuralError on size mismatch
     * @throws SolverError on a zero/missing diagonal or non-finite solution
     * @throws ResourceExhaustion if memory runs out
     */
    static Vector forward(
        const Vector& values,
        const SparsePattern& pattern,
        const Vector& b,
        bool lower,
        bool unit_diagonal,
        TriangularSolveContext* ctx = nullptr
    );

    /**
     * @brief Reduced-precision inputs: promoted to double, result cast back
     */
    template<typename Scalar>
    static Eigen::Matrix<Scalar, Eigen::Dynamic, 1> forward(
        const Eigen::Matrix<Scalar, Eigen::Dynamic, 1>& values,
        const SparsePattern& pattern,
        const Eigen::Matrix<Scalar, Eigen::Dynamic, 1>& b,
        bool lower,
        bool unit_diagonal,
        TriangularSolveContext* ctx = nullptr
    ) {
        Vector x = forward(Vector(values.template cast<Real>()), pattern,
                           Vector(b.template cast<Real>()), lower, unit_diagonal, ctx);
        return x.template cast<Scalar>();
    }

    /**
     * @brief Adjoint of forward()
     *
     * Any failure here is fatal for the step; nothing is caught.
     *
     * @throws StructuralError if ctx was not saved or grad_x has the wrong size
     */
    static TriangularSolveGradients backward(
        const TriangularSolveContext& ctx,
        const Vector& grad_x
    );

    /**
     * @brief Swap rows and columns, re-compressed to row form
     */
    static TransposedPattern transpose(const SparsePattern& pattern);
};

} // namespace ddr
