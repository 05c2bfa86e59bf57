// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_CPLEX_STATUS_HPP
#define QPIF_CPLEX_STATUS_HPP

#include "qpif/results.hpp"

namespace qpif
{

namespace cplex
{

struct StatusMapEntry
{
    int code;
    Status status;
};

// CPX_STAT_* solution status codes, see CPXgetstat
constexpr StatusMapEntry status_map[] = {
    {1, Status::QPIF_OPTIMAL},            // CPX_STAT_OPTIMAL
    {2, Status::QPIF_UNBOUNDED},          // CPX_STAT_UNBOUNDED
    {3, Status::QPIF_INFEASIBLE},         // CPX_STAT_INFEASIBLE
    {6, Status::QPIF_OPTIMAL_INACCURATE}  // CPX_STAT_NUM_BEST
};

// codes missing in the table are reported as solver error
inline Status map_status(int code) noexcept
{
    for (const StatusMapEntry& entry : status_map) {
        if (entry.code == code) {
            return entry.status;
        }
    }
    return Status::QPIF_SOLVER_ERROR;
}

} // namespace cplex

} // namespace qpif

#endif //QPIF_CPLEX_STATUS_HPP
