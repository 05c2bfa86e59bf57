// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_SPARSE_UTILS_HPP
#define QPIF_SPARSE_UTILS_HPP

#include "qpif/typedefs.hpp"

namespace qpif
{

namespace sparse
{

// compressed sparse row storage, row i spans [beg(i), beg(i + 1))
template<typename T, typename I>
struct RowSparse
{
    Vec<I> beg;
    Vec<I> ind;
    Vec<T> val;

    isize rows() const { return beg.size() > 0 ? beg.size() - 1 : 0; }
    isize non_zeros() const { return val.size(); }
};

template<typename T, typename I>
RowSparse<T, I> to_row_sparse(const SparseMat<T, I>& M)
{
    SparseMatRowMajor<T, I> M_rows = M;
    M_rows.makeCompressed();

    RowSparse<T, I> csr;
    csr.beg = Eigen::Map<const Vec<I>>(M_rows.outerIndexPtr(), M_rows.outerSize() + 1);
    csr.ind = Eigen::Map<const Vec<I>>(M_rows.innerIndexPtr(), M_rows.nonZeros());
    csr.val = Eigen::Map<const Vec<T>>(M_rows.valuePtr(), M_rows.nonZeros());
    return csr;
}

/*
 * Builds the row sparse representation of [top; bottom].
 * Rows of top come first, followed by the rows of bottom, each in their original order.
 */
template<typename T, typename I>
RowSparse<T, I> stack_rows(const SparseMat<T, I>& top, const SparseMat<T, I>& bottom)
{
    eigen_assert(top.cols() == bottom.cols() && "top and bottom must have the same number of columns");

    RowSparse<T, I> top_csr = to_row_sparse(top);
    RowSparse<T, I> bottom_csr = to_row_sparse(bottom);

    isize rows = top_csr.rows() + bottom_csr.rows();
    isize nnz_top = top_csr.non_zeros();
    isize nnz = nnz_top + bottom_csr.non_zeros();

    RowSparse<T, I> csr;
    csr.beg.resize(rows + 1);
    csr.ind.resize(nnz);
    csr.val.resize(nnz);

    csr.beg.head(top_csr.rows() + 1) = top_csr.beg;
    csr.beg.tail(bottom_csr.rows() + 1) = bottom_csr.beg.array() + I(nnz_top);
    csr.ind.head(nnz_top) = top_csr.ind;
    csr.ind.tail(bottom_csr.non_zeros()) = bottom_csr.ind;
    csr.val.head(nnz_top) = top_csr.val;
    csr.val.tail(bottom_csr.non_zeros()) = bottom_csr.val;

    return csr;
}

template<typename T, typename I>
Vec<I> row_counts(const RowSparse<T, I>& csr)
{
    isize rows = csr.rows();
    Vec<I> cnt(rows);
    for (isize i = 0; i < rows; i++) {
        cnt(i) = csr.beg(i + 1) - csr.beg(i);
    }
    return cnt;
}

} // namespace sparse

} // namespace qpif

#endif //QPIF_SPARSE_UTILS_HPP
