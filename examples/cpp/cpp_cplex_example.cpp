// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#include <iostream>
#include <limits>
#include "qpif/qpif.hpp"

int main()
{
    int n = 2;
    int p = 1;
    int m = 2;

    Eigen::SparseMatrix<double, Eigen::ColMajor, int> P(n, n);
    P.insert(0, 0) = 6;
    P.insert(1, 1) = 4;
    P.makeCompressed();
    Eigen::VectorXd c(n); c << -1, -4;

    Eigen::SparseMatrix<double, Eigen::ColMajor, int> A(p, n);
    A.insert(0, 0) = 1;
    A.insert(0, 1) = -2;
    A.makeCompressed();
    Eigen::VectorXd b(p); b << 1;

    Eigen::SparseMatrix<double, Eigen::ColMajor, int> G(m, n);
    G.insert(0, 0) = 1;
    G.insert(0, 1) = -1;
    G.insert(1, 0) = 2;
    G.makeCompressed();
    Eigen::VectorXd h(m); h << 0.2, -1;

    Eigen::VectorXd x_l(n); x_l << -1, -std::numeric_limits<double>::infinity();
    Eigen::VectorXd x_u(n); x_u << 1, std::numeric_limits<double>::infinity();

    qpif::Problem<double, int> problem(P, c, A, b, G, h, x_l, x_u);

    qpif::CplexSolver<double, int> solver;
    solver.settings().verbose = true;
    solver.settings().compute_timings = true;

    qpif::Result<double> result = solver.solve(problem);

    std::cout << "status = " << qpif::status_to_string(result.info.status) << std::endl;
    std::cout << "x = " << result.x.transpose() << std::endl;
    std::cout << "y_eq = " << result.y_eq.transpose() << std::endl;
    std::cout << "y_ineq = " << result.y_ineq.transpose() << std::endl;

    return 0;
}
