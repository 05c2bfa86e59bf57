// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_SOLVER_INTERFACE_HPP
#define QPIF_SOLVER_INTERFACE_HPP

#include "qpif/typedefs.hpp"
#include "qpif/problem.hpp"
#include "qpif/results.hpp"

namespace qpif
{

template<typename T, typename I>
class SolverInterface
{
public:
    virtual ~SolverInterface() = default;

    virtual const char* name() const = 0;

    // the bound vectors of problem may be rewritten to the backend's infinity sentinel
    virtual Result<T> solve(Problem<T, I>& problem) = 0;
};

} // namespace qpif

#endif //QPIF_SOLVER_INTERFACE_HPP
