// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#include <cstring>
#include <exception>
#include <string>

#include "qpif/qpif.hpp"
#include "qpif/utils/io_utils.hpp"

static void print_usage(const char* program)
{
    qpif_eprint("usage: %s <problem.mat> [--verbose]\n", program);
}

int main(int argc, char** argv)
{
    if (argc < 2 || argc > 3) {
        print_usage(argv[0]);
        return 2;
    }

    bool verbose = false;
    if (argc == 3) {
        if (std::strcmp(argv[2], "--verbose") != 0) {
            print_usage(argv[0]);
            return 2;
        }
        verbose = true;
    }

    try {
        qpif::Problem<double, int> problem = qpif::load_problem<double, int>(argv[1]);

        qpif::CplexSolver<double, int> solver;
        solver.settings().verbose = verbose;
        solver.settings().compute_timings = true;

        qpif::Result<double> result = solver.solve(problem);

        qpif_print("problem:     %s\n", argv[1]);
        qpif_print("size:        n = %zd, p = %zd, m = %zd\n", problem.n(), problem.p(), problem.m());
        qpif_print("status:      %s (cplex %d)\n", qpif::status_to_string(result.info.status), result.info.raw_status);
        qpif_print("objective:   %.10e\n", result.info.obj_val);
        qpif_print("solve time:  %.3es\n", result.info.solve_time);
        qpif_print("setup time:  %.3es\n", result.info.setup_time);

        return result.info.status == qpif::Status::QPIF_OPTIMAL ? 0 : 1;
    } catch (const std::exception& e) {
        qpif_eprint("%s\n", e.what());
        return 1;
    }
}
