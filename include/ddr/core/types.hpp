/**
 * @file types.hpp
 * @brief Core type definitions for ddr
 *
 * This file defines the fundamental types used throughout ddr,
 * including scalar types, array types, and configuration enums.
 */

#pragma once

#include <Eigen/Core>
#include <Eigen/Sparse>
#include <cstdint>
#include <memory>
#include <vector>
#include <functional>
#include <string>

namespace ddr {

// ============================================================================
// Scalar Types
// ============================================================================

using Real = double;
using Index = int64_t;
using Size = size_t;

// ============================================================================
// Array Types (Eigen-based)
// ============================================================================

// Dense vectors
using Vector = Eigen::VectorXd;
using VectorF = Eigen::VectorXf;
using VectorI = Eigen::VectorXi;

// Dense matrices
using Matrix = Eigen::MatrixXd;

// Sparse matrices (CSR format, int storage index to match the pattern arrays)
using SparseMatrix = Eigen::SparseMatrix<Real, Eigen::RowMajor, int>;
using SparseTriplet = Eigen::Triplet<Real, int>;

/// Storage index of the compressed pattern arrays
using StorageIndex = int;
using IndexArray = std::vector<StorageIndex>;

// ============================================================================
// Routing Decision Enums
// ============================================================================

/**
 * @brief How flow depth is obtained before Manning's equation
 */
enum class DepthMethod {
    PowerLaw,       ///< depth from discharge via the power-law channel shape
    WidthRating,    ///< depth = log_q(width / p), independent of discharge
};

/**
 * @brief Which triangle of the routing system holds the upstream couplings
 */
enum class Orientation {
    Lower,          ///< upstream segments have smaller indices
    Upper,          ///< upstream segments have larger indices
};

/**
 * @brief Whether the discharge state survives between forward calls
 *
 * Decided by the caller's batch/epoch bookkeeping.
 */
enum class BatchBoundary {
    Reset,          ///< start from starting discharge / first lateral row
    Carry,          ///< continue from the previous forward's final state
};

// ============================================================================
// Forward Declarations
// ============================================================================

class RiverNetwork;
class RoutingConfig;
class PatternMapper;
class TriangularSparseSolve;
class MuskingumCungeRouter;

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

template<typename T>
using Ptr = std::shared_ptr<T>;

template<typename T>
using UniquePtr = std::unique_ptr<T>;

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    constexpr Real KINEMATIC_CELERITY_FACTOR = 5.0 / 3.0;  ///< c = 5/3 v (wide channel)
    constexpr Real MANNING_DEPTH_EXPONENT = 2.0 / 3.0;
}

} // namespace ddr
