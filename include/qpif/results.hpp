// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_RESULTS_HPP
#define QPIF_RESULTS_HPP

#include <limits>

#include "qpif/typedefs.hpp"

namespace qpif
{

enum Status
{
    QPIF_OPTIMAL = 1,
    QPIF_OPTIMAL_INACCURATE = 2,
    QPIF_INFEASIBLE = -2,
    QPIF_UNBOUNDED = -3,
    QPIF_SOLVER_ERROR = -8,
    QPIF_INVALID_PROBLEM = -9,
    QPIF_INVALID_SETTINGS = -10
};

constexpr const char* status_to_string(Status status)
{
    switch (status)
    {
        case Status::QPIF_OPTIMAL: return "optimal";
        case Status::QPIF_OPTIMAL_INACCURATE: return "optimal inaccurate";
        case Status::QPIF_INFEASIBLE: return "infeasible";
        case Status::QPIF_UNBOUNDED: return "unbounded";
        case Status::QPIF_SOLVER_ERROR: return "solver error";
        case Status::QPIF_INVALID_PROBLEM: return "invalid problem";
        case Status::QPIF_INVALID_SETTINGS: return "invalid settings";
        default: return "unknown";
    }
}

template<typename T>
struct Info
{
    Status status = Status::QPIF_SOLVER_ERROR;
    int raw_status = 0; // status code reported by the backend library

    T obj_val = std::numeric_limits<T>::quiet_NaN();
    isize iter = 0;

    T setup_time = 0;
    T solve_time = 0; // measured by the backend library around the solve call
    T run_time = 0;
};

template<typename T>
struct Result
{
    Vec<T> x;
    Vec<T> y_eq;
    Vec<T> y_ineq;
    Vec<T> z_l;
    Vec<T> z_u;

    Info<T> info;

    void resize(isize n, isize p, isize m)
    {
        x.resize(n);
        y_eq.resize(p);
        y_ineq.resize(m);
        z_l.resize(n);
        z_u.resize(n);
    }

    void set_nan()
    {
        x.setConstant(std::numeric_limits<T>::quiet_NaN());
        y_eq.setConstant(std::numeric_limits<T>::quiet_NaN());
        y_ineq.setConstant(std::numeric_limits<T>::quiet_NaN());
        z_l.setConstant(std::numeric_limits<T>::quiet_NaN());
        z_u.setConstant(std::numeric_limits<T>::quiet_NaN());
        info.obj_val = std::numeric_limits<T>::quiet_NaN();
    }
};

} // namespace qpif

#endif //QPIF_RESULTS_HPP
