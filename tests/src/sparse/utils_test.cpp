// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#include "qpif/sparse/utils.hpp"
#include "qpif/utils/random_utils.hpp"

#include "gtest/gtest.h"
#include "utils.hpp"

using namespace qpif;

using T = double;
using I = int;

/*
 * M = [1 0 2]
 *     [0 0 0]
 *     [0 3 4]
 */
TEST(SparseUtils, ToRowSparse)
{
    SparseMat<T, I> M(3, 3);
    M.insert(0, 0) = 1;
    M.insert(0, 2) = 2;
    M.insert(2, 1) = 3;
    M.insert(2, 2) = 4;
    M.makeCompressed();

    sparse::RowSparse<T, I> csr = sparse::to_row_sparse(M);

    ASSERT_EQ(csr.rows(), 3);
    ASSERT_EQ(csr.non_zeros(), 4);
    ASSERT_EQ(to_std_vector(csr.beg), std::vector<I>({0, 2, 2, 4}));
    ASSERT_EQ(to_std_vector(csr.ind), std::vector<I>({0, 2, 1, 2}));
    ASSERT_EQ(to_std_vector(csr.val), std::vector<T>({1, 2, 3, 4}));
    ASSERT_EQ(to_std_vector(sparse::row_counts(csr)), std::vector<I>({2, 0, 2}));
}

/*
 * A = [1 1]      G = [ 1 0]
 *                    [ 0 0]
 *                    [-1 2]
 */
TEST(SparseUtils, StackRowsKeepsEqualityRowsFirst)
{
    SparseMat<T, I> A(1, 2);
    A.insert(0, 0) = 1;
    A.insert(0, 1) = 1;
    A.makeCompressed();

    SparseMat<T, I> G(3, 2);
    G.insert(0, 0) = 1;
    G.insert(2, 0) = -1;
    G.insert(2, 1) = 2;
    G.makeCompressed();

    sparse::RowSparse<T, I> csr = sparse::stack_rows(A, G);

    ASSERT_EQ(csr.rows(), 4);
    ASSERT_EQ(csr.non_zeros(), 5);
    ASSERT_EQ(to_std_vector(csr.beg), std::vector<I>({0, 2, 3, 3, 5}));
    ASSERT_EQ(to_std_vector(csr.ind), std::vector<I>({0, 1, 0, 0, 1}));
    ASSERT_EQ(to_std_vector(csr.val), std::vector<T>({1, 1, 1, -1, 2}));
}

TEST(SparseUtils, StackRowsWithEmptyBlocks)
{
    SparseMat<T, I> empty(0, 3);
    SparseMat<T, I> G(2, 3);
    G.insert(1, 2) = 5;
    G.makeCompressed();

    sparse::RowSparse<T, I> top_empty = sparse::stack_rows(empty, G);
    ASSERT_EQ(top_empty.rows(), 2);
    ASSERT_EQ(to_std_vector(top_empty.beg), std::vector<I>({0, 0, 1}));
    ASSERT_EQ(to_std_vector(top_empty.ind), std::vector<I>({2}));

    sparse::RowSparse<T, I> bottom_empty = sparse::stack_rows(G, empty);
    ASSERT_EQ(bottom_empty.rows(), 2);
    ASSERT_EQ(to_std_vector(bottom_empty.beg), std::vector<I>({0, 0, 1}));

    sparse::RowSparse<T, I> both_empty = sparse::stack_rows(empty, empty);
    ASSERT_EQ(both_empty.rows(), 0);
    ASSERT_EQ(both_empty.non_zeros(), 0);
}

TEST(SparseUtils, StackRowsMatchesVerticalConcatenation)
{
    SparseMat<T, I> A = rand::sparse_matrix_rand<T, I>(5, 8, 0.3);
    SparseMat<T, I> G = rand::sparse_matrix_rand<T, I>(7, 8, 0.3);

    sparse::RowSparse<T, I> csr = sparse::stack_rows(A, G);

    Mat<T> stacked(12, 8);
    stacked << Mat<T>(A), Mat<T>(G);

    Mat<T> rebuilt = Mat<T>::Zero(12, 8);
    for (isize i = 0; i < csr.rows(); i++) {
        for (I k = csr.beg(i); k < csr.beg(i + 1); k++) {
            rebuilt(i, csr.ind(k)) = csr.val(k);
        }
    }

    ASSERT_EQ(rebuilt, stacked);
}
