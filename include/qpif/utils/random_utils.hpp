// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_UTILS_RANDOM_UTILS_HPP
#define QPIF_UTILS_RANDOM_UTILS_HPP

#include <cmath>
#include <limits>
#include <random>

#include "qpif/typedefs.hpp"
#include "qpif/problem.hpp"

namespace qpif
{

namespace rand
{

inline std::mt19937& generator()
{
    static std::mt19937 gen(42);
    return gen;
}

inline double uniform()
{
    static std::uniform_real_distribution<double> uniform_dist(0.0, 1.0);
    return uniform_dist(generator());
}

inline double normal()
{
    static std::normal_distribution<double> normal_dist;
    return normal_dist(generator());
}

template<typename T>
Vec<T> vector_rand(isize n)
{
    Vec<T> v(n);
    for (isize i = 0; i < n; i++) {
        v(i) = T(normal());
    }
    return v;
}

template<typename T, typename I>
SparseMat<T, I> sparse_matrix_rand(isize n, isize m, T p)
{
    SparseMat<T, I> A(n, m);
    for (isize i = 0; i < n; i++) {
        for (isize j = 0; j < m; ++j) {
            if (uniform() < p) {
                A.insert(i, j) = T(normal());
            }
        }
    }
    A.makeCompressed();
    return A;
}

// symmetric positive definite matrix with both triangular parts stored,
// the diagonal is shifted to make it strictly diagonally dominant
template<typename T, typename I>
SparseMat<T, I> sparse_positive_definite_rand(isize n, T p, T rho = T(1e-2))
{
    SparseMat<T, I> P_utri(n, n);
    for (isize j = 0; j < n; j++) {
        for (isize i = 0; i < j; i++) {
            if (uniform() < p) {
                P_utri.insert(i, j) = T(normal());
            }
        }
    }

    SparseMat<T, I> P = P_utri.template selfadjointView<Eigen::Upper>();

    Vec<T> row_sum = Vec<T>::Zero(n);
    for (isize j = 0; j < n; j++) {
        for (typename SparseMat<T, I>::InnerIterator it(P, j); it; ++it) {
            row_sum(it.row()) += std::abs(it.value());
        }
    }
    for (isize i = 0; i < n; i++) {
        P.coeffRef(i, i) += row_sum(i) + rho;
    }

    // the transposed copy has sorted inner indices, P is symmetric
    SparseMat<T, I> P_sorted = P.transpose();
    return P_sorted;
}

/*
 * Feasible strongly convex problem with n variables, p equality and m inequality constraints.
 * About inf_perc of the bounds are infinite.
 */
template<typename T, typename I>
Problem<T, I> sparse_strongly_convex_problem(isize n, isize p, isize m, T sparsity_factor,
                                             T inf_perc = T(0.3), T strong_convexity_factor = T(1e-2))
{
    SparseMat<T, I> P = sparse_positive_definite_rand<T, I>(n, sparsity_factor, strong_convexity_factor);
    SparseMat<T, I> A = sparse_matrix_rand<T, I>(p, n, sparsity_factor);
    SparseMat<T, I> G = sparse_matrix_rand<T, I>(m, n, sparsity_factor);

    Vec<T> x_sol = vector_rand<T>(n);
    Vec<T> c = vector_rand<T>(n);

    Vec<T> b = A * x_sol;
    Vec<T> h = G * x_sol;
    for (isize i = 0; i < m; i++) {
        h(i) += T(uniform());
    }

    Vec<T> x_l(n);
    Vec<T> x_u(n);
    for (isize i = 0; i < n; i++) {
        x_l(i) = uniform() < inf_perc ? -std::numeric_limits<T>::infinity() : x_sol(i) - T(uniform());
        x_u(i) = uniform() < inf_perc ? std::numeric_limits<T>::infinity() : x_sol(i) + T(uniform());
    }

    return Problem<T, I>(P, c, A, b, G, h, x_l, x_u);
}

} // namespace rand

} // namespace qpif

#endif //QPIF_UTILS_RANDOM_UTILS_HPP
