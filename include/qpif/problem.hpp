// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_PROBLEM_HPP
#define QPIF_PROBLEM_HPP

#include <limits>

#include "qpif/fwd.hpp"
#include "qpif/typedefs.hpp"

namespace qpif
{

/*
 * min 1/2 x^T P x + c^T x
 * s.t. A x = b, G x <= h, x_l <= x <= x_u
 *
 * P has to be symmetric with both triangular parts stored.
 * Entries of x_l and x_u may be +-infinity.
 */
template<typename T_, typename I_>
struct Problem
{
    using T = T_;
    using I = I_;

    SparseMat<T, I> P;
    SparseMat<T, I> A;
    SparseMat<T, I> G;

    Vec<T> c;
    Vec<T> b;
    Vec<T> h;
    Vec<T> x_l;
    Vec<T> x_u;

    Problem() = default;

    Problem(const SparseMat<T, I>& P,
            const CVecRef<T>& c,
            const SparseMat<T, I>& A,
            const CVecRef<T>& b,
            const SparseMat<T, I>& G,
            const CVecRef<T>& h,
            const CVecRef<T>& x_l,
            const CVecRef<T>& x_u)
      : P(P), A(A), G(G), c(c), b(b), h(h), x_l(x_l), x_u(x_u) {}

    // problem without bounds on the variables
    Problem(const SparseMat<T, I>& P,
            const CVecRef<T>& c,
            const SparseMat<T, I>& A,
            const CVecRef<T>& b,
            const SparseMat<T, I>& G,
            const CVecRef<T>& h)
      : P(P), A(A), G(G), c(c), b(b), h(h),
        x_l(Vec<T>::Constant(P.rows(), -std::numeric_limits<T>::infinity())),
        x_u(Vec<T>::Constant(P.rows(), std::numeric_limits<T>::infinity())) {}

    isize n() const { return P.rows(); }
    isize p() const { return A.rows(); }
    isize m() const { return G.rows(); }

    bool verify_dimensions() const
    {
        bool ok = true;
        isize n = this->n();

        if (P.cols() != n) { qpif_eprint("P must be square\n"); ok = false; }
        if (c.size() != n) { qpif_eprint("c must have correct dimensions\n"); ok = false; }
        if (A.cols() != n) { qpif_eprint("A must have correct dimensions\n"); ok = false; }
        if (b.size() != A.rows()) { qpif_eprint("b must have correct dimensions\n"); ok = false; }
        if (G.cols() != n) { qpif_eprint("G must have correct dimensions\n"); ok = false; }
        if (h.size() != G.rows()) { qpif_eprint("h must have correct dimensions\n"); ok = false; }
        if (x_l.size() != n) { qpif_eprint("x_l must have correct dimensions\n"); ok = false; }
        if (x_u.size() != n) { qpif_eprint("x_u must have correct dimensions\n"); ok = false; }

        return ok;
    }
};

} // namespace qpif

#endif //QPIF_PROBLEM_HPP
