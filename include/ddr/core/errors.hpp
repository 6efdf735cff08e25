/**
 * @file errors.hpp
 * @brief Exception types raised by the routing core
 *
 * - StructuralError: pattern/dimension/topology mismatch (programming error)
 * - SolverError: triangular solve failed (singular or degenerate diagonal)
 * - TimestepError: SolverError raised while routing a given timestep
 * - ResourceExhaustion: memory exhausted during a solve
 *
 * Physically implausible intermediate values are clamped, never raised.
 */

#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

namespace ddr {

class StructuralError : public std::logic_error {
public:
    explicit StructuralError(const std::string& what)
        : std::logic_error(what) {}
};

/**
 * @brief Failure of a sparse triangular solve
 *
 * Carries the system shape so the caller can diagnose without re-deriving it.
 */
class SolverError : public std::runtime_error {
public:
    SolverError(const std::string& what, Index n, Index nnz, Index rhs_size)
        : std::runtime_error(what + " (n=" + std::to_string(n) +
                             ", nnz=" + std::to_string(nnz) +
                             ", rhs=" + std::to_string(rhs_size) + ")"),
          reason_(what), n_(n), nnz_(nnz), rhs_size_(rhs_size) {}

    /// Message without the shape suffix
    const std::string& reason() const { return reason_; }
    Index dimension() const { return n_; }
    Index nonzeros() const { return nnz_; }
    Index rhs_size() const { return rhs_size_; }

private:
    std::string reason_;
    Index n_;
    Index nnz_;
    Index rhs_size_;
};

/**
 * @brief SolverError annotated with the routing timestep that failed
 */
class TimestepError : public SolverError {
public:
    TimestepError(const SolverError& cause, Index timestep)
        : SolverError("timestep " + std::to_string(timestep) + ": " + cause.reason(),
                      cause.dimension(), cause.nonzeros(), cause.rhs_size()),
          timestep_(timestep) {}

    Index timestep() const { return timestep_; }

private:
    Index timestep_;
};

/**
 * @brief Out of memory while assembling or solving a system
 *
 * Kept apart from SolverError so callers can shrink the batch and retry.
 */
class ResourceExhaustion : public std::runtime_error {
public:
    explicit ResourceExhaustion(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace ddr
