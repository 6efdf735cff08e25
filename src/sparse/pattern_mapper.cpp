/**
 * @file pattern_mapper.cpp
 * @brief Sparse pattern probing and coefficient scatter
 */

#include "ddr/sparse/pattern_mapper.hpp"
#include "ddr/core/errors.hpp"
#include <cmath>
#include <string>

namespace ddr {

// ============================================================================
// SparsePattern
// ============================================================================

IndexArray SparsePattern::row_indices() const {
    IndexArray rows_out;
    rows_out.reserve(col_idx.size());
    for (Index i = 0; i < rows; ++i) {
        for (StorageIndex p = row_ptr[i]; p < row_ptr[i + 1]; ++p) {
            rows_out.push_back(static_cast<StorageIndex>(i));
        }
    }
    return rows_out;
}

Index SparsePattern::find(Index row, Index col) const {
    if (row < 0 || row >= rows) return -1;
    for (StorageIndex p = row_ptr[row]; p < row_ptr[row + 1]; ++p) {
        if (col_idx[p] == col) return p;
    }
    return -1;
}

SparseMatrix SparsePattern::assemble(const Vector& values) const {
    if (values.size() != nnz()) {
        throw StructuralError("values array has " + std::to_string(values.size()) +
                              " entries, pattern has " + std::to_string(nnz()));
    }

    Eigen::Map<const SparseMatrix> view(rows, cols, nnz(), row_ptr.data(),
                                        col_idx.data(), values.data());
    return SparseMatrix(view);
}

void SparsePattern::check() const {
    if (static_cast<Index>(row_ptr.size()) != rows + 1) {
        throw StructuralError("row pointer has " + std::to_string(row_ptr.size()) +
                              " entries for " + std::to_string(rows) + " rows");
    }
    if (row_ptr.front() != 0 || row_ptr.back() != nnz()) {
        throw StructuralError("row pointer does not span the " + std::to_string(nnz()) +
                              " column indices");
    }
    for (Index i = 0; i < rows; ++i) {
        if (row_ptr[i + 1] < row_ptr[i]) {
            throw StructuralError("row pointer decreases at row " + std::to_string(i));
        }
        for (StorageIndex p = row_ptr[i]; p < row_ptr[i + 1]; ++p) {
            if (col_idx[p] < 0 || col_idx[p] >= cols) {
                throw StructuralError("column index " + std::to_string(col_idx[p]) +
                                      " out of range in row " + std::to_string(i));
            }
            if (p > row_ptr[i] && col_idx[p] <= col_idx[p - 1]) {
                throw StructuralError("column indices not strictly increasing in row " +
                                      std::to_string(i));
            }
        }
    }
}

// ============================================================================
// PatternMapper
// ============================================================================

PatternMapper PatternMapper::build(const FillFunction& fill, Index dimension) {
    if (dimension <= 0) {
        throw StructuralError("pattern mapper dimension must be positive");
    }

    // 1-based probe so that no real position collapses into a structural zero
    Vector probe = Vector::LinSpaced(dimension, 1.0, static_cast<Real>(dimension));
    SparseMatrix filled = fill(probe);

    // Canonical compressed form: explicit zeros dropped, columns sorted
    std::vector<SparseTriplet> triplets;
    triplets.reserve(static_cast<Size>(filled.nonZeros()));
    for (int k = 0; k < filled.outerSize(); ++k) {
        for (SparseMatrix::InnerIterator it(filled, k); it; ++it) {
            if (it.value() != 0.0) {
                triplets.emplace_back(static_cast<int>(it.row()),
                                      static_cast<int>(it.col()), it.value());
            }
        }
    }
    SparseMatrix A(filled.rows(), filled.cols());
    A.setFromTriplets(triplets.begin(), triplets.end());
    A.makeCompressed();

    PatternMapper mapper;
    mapper.dimension_ = dimension;

    SparsePattern& pattern = mapper.pattern_;
    pattern.rows = A.rows();
    pattern.cols = A.cols();
    pattern.row_ptr.assign(A.outerIndexPtr(), A.outerIndexPtr() + A.outerSize() + 1);
    pattern.col_idx.assign(A.innerIndexPtr(), A.innerIndexPtr() + A.nonZeros());

    // Inverse index: values[p] comes from coefficient source[p]
    const Index nnz = A.nonZeros();
    mapper.source_.resize(static_cast<Size>(nnz));
    const Real* values = A.valuePtr();
    for (Index p = 0; p < nnz; ++p) {
        const Real v = values[p];
        const Real r = std::round(v);
        if (std::abs(v - r) > 1e-6 || r < 1.0 || r > static_cast<Real>(dimension)) {
            throw StructuralError("fill function produced probe value " + std::to_string(v) +
                                  " at nonzero " + std::to_string(p) +
                                  "; expected an integer in [1, " +
                                  std::to_string(dimension) + "]");
        }
        mapper.source_[p] = static_cast<StorageIndex>(r) - 1;
    }

    std::vector<SparseTriplet> ones;
    ones.reserve(static_cast<Size>(nnz));
    for (Index p = 0; p < nnz; ++p) {
        ones.emplace_back(mapper.source_[p], static_cast<int>(p), 1.0);
    }
    mapper.scatter_.resize(dimension, nnz);
    mapper.scatter_.setFromTriplets(ones.begin(), ones.end());
    mapper.scatter_.makeCompressed();

    return mapper;
}

PatternMapper PatternMapper::build_dense(const DenseFillFunction& fill, Index dimension) {
    return build([&fill](const Vector& probe) -> SparseMatrix {
        Matrix dense = fill(probe);
        return dense.sparseView();
    }, dimension);
}

Vector PatternMapper::map(const Vector& coefficients) const {
    if (coefficients.size() != dimension_) {
        throw StructuralError("coefficient vector has " + std::to_string(coefficients.size()) +
                              " entries, mapper was built for " + std::to_string(dimension_));
    }

    const Index nnz = pattern_.nnz();
    Vector values(nnz);
    for (Index p = 0; p < nnz; ++p) {
        values(p) = coefficients(source_[p]);
    }
    return values;
}

Vector PatternMapper::map_adjoint(const Vector& grad_values) const {
    const Index nnz = pattern_.nnz();
    if (grad_values.size() != nnz) {
        throw StructuralError("value gradient has " + std::to_string(grad_values.size()) +
                              " entries, pattern has " + std::to_string(nnz));
    }

    Vector grad_coefficients = Vector::Zero(dimension_);
    for (Index p = 0; p < nnz; ++p) {
        grad_coefficients(source_[p]) += grad_values(p);
    }
    return grad_coefficients;
}

std::pair<IndexArray, IndexArray> PatternMapper::coo_indices() const {
    return {pattern_.row_indices(), pattern_.col_idx};
}

Matrix PatternMapper::to_dense(const Vector& values) const {
    return pattern_.assemble(values).toDense();
}

} // namespace ddr
