// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#include <string>

#include "qpif/cplex/status.hpp"

#include "gtest/gtest.h"

using namespace qpif;

TEST(CplexStatusMap, MappedCodes)
{
    ASSERT_EQ(cplex::map_status(1), Status::QPIF_OPTIMAL);
    ASSERT_EQ(cplex::map_status(2), Status::QPIF_UNBOUNDED);
    ASSERT_EQ(cplex::map_status(3), Status::QPIF_INFEASIBLE);
    ASSERT_EQ(cplex::map_status(6), Status::QPIF_OPTIMAL_INACCURATE);
}

TEST(CplexStatusMap, UnmappedCodesAreSolverError)
{
    // 0: no solution, 4: infeasible or unbounded, 5: optimal with unscaled infeasibilities,
    // 10/11: iteration/time limit, 101: MIP optimal, 1000+: unknown
    for (int code : {0, 4, 5, 7, 10, 11, 20, 21, 22, 101, 1000, -1}) {
        ASSERT_EQ(cplex::map_status(code), Status::QPIF_SOLVER_ERROR) << "code " << code;
    }
}

TEST(CplexStatusMap, TableHasNoDuplicates)
{
    const std::size_t n = sizeof(cplex::status_map) / sizeof(cplex::status_map[0]);
    ASSERT_EQ(n, 4u);
    for (std::size_t i = 0; i < n; i++) {
        for (std::size_t j = i + 1; j < n; j++) {
            ASSERT_NE(cplex::status_map[i].code, cplex::status_map[j].code);
        }
    }
}

TEST(Status, ToString)
{
    ASSERT_EQ(std::string(status_to_string(Status::QPIF_OPTIMAL)), "optimal");
    ASSERT_EQ(std::string(status_to_string(Status::QPIF_OPTIMAL_INACCURATE)), "optimal inaccurate");
    ASSERT_EQ(std::string(status_to_string(Status::QPIF_INFEASIBLE)), "infeasible");
    ASSERT_EQ(std::string(status_to_string(Status::QPIF_UNBOUNDED)), "unbounded");
    ASSERT_EQ(std::string(status_to_string(Status::QPIF_SOLVER_ERROR)), "solver error");
    ASSERT_EQ(std::string(status_to_string(Status::QPIF_INVALID_PROBLEM)), "invalid problem");
    ASSERT_EQ(std::string(status_to_string(Status::QPIF_INVALID_SETTINGS)), "invalid settings");
}
