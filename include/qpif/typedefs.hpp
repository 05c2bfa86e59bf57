// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_TYPEDEFS_HPP
#define QPIF_TYPEDEFS_HPP

#include <Eigen/Dense>
#include <Eigen/Sparse>

namespace qpif
{
namespace meta
{

template<typename T>
struct make_signed;
template<>
struct make_signed<unsigned int>
{
    using type = signed int;
};
template<>
struct make_signed<unsigned long>
{
    using type = signed long;
};
template<>
struct make_signed<unsigned long long>
{
    using type = signed long long;
};

} // namespace meta

using usize = decltype(sizeof(0));
using isize = meta::make_signed<usize>::type;

template<typename T, typename I>
using SparseMat = Eigen::SparseMatrix<T, Eigen::ColMajor, I>;
template<typename T, typename I>
using SparseMatRowMajor = Eigen::SparseMatrix<T, Eigen::RowMajor, I>;

template<typename T>
using Vec = Eigen::Matrix<T, Eigen::Dynamic, 1>;
template<typename T>
using VecRef = Eigen::Ref<Eigen::Matrix<T, Eigen::Dynamic, 1>>;
template<typename T>
using CVecRef = Eigen::Ref<const Eigen::Matrix<T, Eigen::Dynamic, 1>>;

template<typename T>
using Mat = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;
template<typename T>
using CMatRef = Eigen::Ref<const Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>>;

} // namespace qpif

#endif //QPIF_TYPEDEFS_HPP
