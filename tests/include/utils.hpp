// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_TESTS_UTILS_HPP
#define QPIF_TESTS_UTILS_HPP

#include <vector>

#include "qpif/qpif.hpp"
#include "gtest/gtest.h"

template<typename T, typename I>
void assert_sparse_matrices_equal(qpif::SparseMat<T, I>& A, qpif::SparseMat<T, I>& B)
{
    A.makeCompressed();
    B.makeCompressed();
    ASSERT_EQ(A.rows(), B.rows());
    ASSERT_EQ(A.cols(), B.cols());
    ASSERT_EQ(A.nonZeros(), B.nonZeros());
    ASSERT_EQ(Eigen::Map<qpif::Vec<I>>(A.outerIndexPtr(), A.outerSize() + 1),
              Eigen::Map<qpif::Vec<I>>(B.outerIndexPtr(), B.outerSize() + 1));
    ASSERT_EQ(Eigen::Map<qpif::Vec<I>>(A.innerIndexPtr(), A.nonZeros()),
              Eigen::Map<qpif::Vec<I>>(B.innerIndexPtr(), B.nonZeros()));
    ASSERT_EQ(Eigen::Map<qpif::Vec<T>>(A.valuePtr(), A.nonZeros()),
              Eigen::Map<qpif::Vec<T>>(B.valuePtr(), B.nonZeros()));
}

template<typename T>
std::vector<T> to_std_vector(const qpif::Vec<T>& v)
{
    return std::vector<T>(v.data(), v.data() + v.size());
}

#endif //QPIF_TESTS_UTILS_HPP
