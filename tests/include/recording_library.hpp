// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_TESTS_RECORDING_LIBRARY_HPP
#define QPIF_TESTS_RECORDING_LIBRARY_HPP

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

#include "qpif/settings.hpp"
#include "qpif/cplex/error.hpp"

/*
 * Stands in for cplex::Environment in CplexSolver.
 * It records everything the solver passes in and replays scripted outputs.
 */
class RecordingLibrary
{
public:
    // recorded inputs
    std::vector<std::string> calls;
    bool verbose = false;
    int threads = -1;
    qpif::QPMethod qp_method = qpif::QPMethod::automatic;
    std::vector<double> obj;
    std::vector<double> lb;
    std::vector<double> ub;
    std::vector<double> rhs;
    std::string sense;
    std::vector<int> rmatbeg;
    std::vector<int> rmatind;
    std::vector<double> rmatval;
    std::vector<int> qmatbeg;
    std::vector<int> qmatcnt;
    std::vector<int> qmatind;
    std::vector<double> qmatval;

    // scripted outputs
    int status_code = 1;
    bool solution_available = true;
    double obj_val = 0;
    int iter = 0;
    std::vector<double> x;
    std::vector<double> pi;
    std::vector<double> dj;
    double clock = 0;
    double tick = 0.25;
    bool fail_on_solve = false;
    bool fail_on_add_rows = false;
    int index_limit = std::numeric_limits<int>::max();

    static double infinity() noexcept { return 1e20; }

    int max_index() const noexcept { return index_limit; }

    void set_verbose(bool verbose_) { calls.emplace_back("set_verbose"); verbose = verbose_; }
    void set_threads(int threads_) { calls.emplace_back("set_threads"); threads = threads_; }
    void set_qp_method(qpif::QPMethod qp_method_) { calls.emplace_back("set_qp_method"); qp_method = qp_method_; }

    void new_problem()
    {
        calls.emplace_back("new_problem");
        obj.clear(); lb.clear(); ub.clear();
        rhs.clear(); sense.clear();
        rmatbeg.clear(); rmatind.clear(); rmatval.clear();
        qmatbeg.clear(); qmatcnt.clear(); qmatind.clear(); qmatval.clear();
    }

    void add_variables(int n, const double* obj_, const double* lb_, const double* ub_)
    {
        calls.emplace_back("add_variables");
        obj.assign(obj_, obj_ + n);
        lb.assign(lb_, lb_ + n);
        ub.assign(ub_, ub_ + n);
    }

    void add_rows(int rows, int nnz, const double* rhs_, const char* sense_,
                  const int* beg, const int* ind, const double* val)
    {
        calls.emplace_back("add_rows");
        if (fail_on_add_rows) {
            throw qpif::cplex::CplexError(1224, "CPXaddrows failed with error 1224");
        }
        rhs.assign(rhs_, rhs_ + rows);
        sense.assign(sense_, sense_ + rows);
        rmatbeg.assign(beg, beg + rows);
        rmatind.assign(ind, ind + nnz);
        rmatval.assign(val, val + nnz);
    }

    void set_quadratic(const int* beg, const int* cnt, const int* ind, const double* val)
    {
        calls.emplace_back("set_quadratic");
        int n = static_cast<int>(obj.size());
        qmatbeg.assign(beg, beg + n);
        qmatcnt.assign(cnt, cnt + n);
        int nnz = n > 0 ? beg[n - 1] + cnt[n - 1] : 0;
        qmatind.assign(ind, ind + nnz);
        qmatval.assign(val, val + nnz);
    }

    double time()
    {
        calls.emplace_back("time");
        double now = clock;
        clock += tick;
        return now;
    }

    void solve()
    {
        calls.emplace_back("solve");
        if (fail_on_solve) {
            throw qpif::cplex::CplexError(1001, "CPXqpopt failed with error 1001: Out of memory.");
        }
    }

    int status() const { return status_code; }
    bool has_solution() const { return solution_available; }
    double objective_value() const { return obj_val; }
    int iterations() const { return iter; }

    void primal_values(double* out, int n) const { std::copy(x.begin(), x.begin() + n, out); }
    void dual_values(double* out, int rows) const { std::copy(pi.begin(), pi.begin() + rows, out); }
    void reduced_costs(double* out, int n) const { std::copy(dj.begin(), dj.begin() + n, out); }
};

#endif //QPIF_TESTS_RECORDING_LIBRARY_HPP
