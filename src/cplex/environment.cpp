// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#include <memory>
#include <string>

#include <ilcplex/cplex.h>

#include "qpif/fwd.hpp"
#include "qpif/cplex/environment.hpp"

namespace qpif
{

namespace cplex
{

struct Environment::Handle
{
    CPXENVptr env = nullptr;
    CPXLPptr lp = nullptr;
};

namespace
{

std::string error_message(CPXCENVptr env, int code, const char* function)
{
    char buffer[CPXMESSAGEBUFSIZE];
    CPXCCHARptr text = CPXgeterrorstring(env, code, buffer);
    std::string message(function);
    message += " failed with error ";
    message += std::to_string(code);
    if (text != nullptr) {
        message += ": ";
        message += text;
    }
    // CPLEX messages end with a newline
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
        message.pop_back();
    }
    return message;
}

void check(CPXCENVptr env, int code, const char* function)
{
    if (code != 0) {
        throw CplexError(code, error_message(env, code, function));
    }
}

int to_cplex_alg(QPMethod qp_method)
{
    switch (qp_method) {
        case QPMethod::automatic: return CPX_ALG_AUTOMATIC;
        case QPMethod::primal_simplex: return CPX_ALG_PRIMAL;
        case QPMethod::dual_simplex: return CPX_ALG_DUAL;
        case QPMethod::network: return CPX_ALG_NET;
        case QPMethod::barrier: return CPX_ALG_BARRIER;
        case QPMethod::concurrent: return CPX_ALG_CONCURRENT;
    }
    return CPX_ALG_AUTOMATIC;
}

} // namespace

Environment::Environment() : m_handle(std::make_unique<Handle>())
{
    int status = 0;
    m_handle->env = CPXopenCPLEX(&status);
    if (m_handle->env == nullptr) {
        throw CplexError(status, error_message(nullptr, status, "CPXopenCPLEX"));
    }
}

Environment::~Environment()
{
    if (m_handle->lp != nullptr) {
        int status = CPXfreeprob(m_handle->env, &m_handle->lp);
        if (status != 0) {
            qpif_eprint("%s\n", error_message(m_handle->env, status, "CPXfreeprob").c_str());
        }
    }
    if (m_handle->env != nullptr) {
        int status = CPXcloseCPLEX(&m_handle->env);
        if (status != 0) {
            qpif_eprint("%s\n", error_message(nullptr, status, "CPXcloseCPLEX").c_str());
        }
    }
}

double Environment::infinity() noexcept
{
    return CPX_INFBOUND;
}

void Environment::set_verbose(bool verbose)
{
    check(m_handle->env, CPXsetintparam(m_handle->env, CPXPARAM_ScreenOutput, verbose ? CPX_ON : CPX_OFF), "CPXsetintparam");
}

void Environment::set_threads(int threads)
{
    check(m_handle->env, CPXsetintparam(m_handle->env, CPXPARAM_Threads, threads), "CPXsetintparam");
}

void Environment::set_qp_method(QPMethod qp_method)
{
    check(m_handle->env, CPXsetintparam(m_handle->env, CPXPARAM_QPMethod, to_cplex_alg(qp_method)), "CPXsetintparam");
}

void Environment::new_problem()
{
    if (m_handle->lp != nullptr) {
        check(m_handle->env, CPXfreeprob(m_handle->env, &m_handle->lp), "CPXfreeprob");
    }

    int status = 0;
    m_handle->lp = CPXcreateprob(m_handle->env, &status, "qpif");
    if (m_handle->lp == nullptr) {
        throw CplexError(status, error_message(m_handle->env, status, "CPXcreateprob"));
    }

    check(m_handle->env, CPXchgobjsen(m_handle->env, m_handle->lp, CPX_MIN), "CPXchgobjsen");
}

void Environment::add_variables(int n, const double* obj, const double* lb, const double* ub)
{
    check(m_handle->env, CPXnewcols(m_handle->env, m_handle->lp, n, obj, lb, ub, nullptr, nullptr), "CPXnewcols");
}

void Environment::add_rows(int rows, int nnz, const double* rhs, const char* sense,
                           const int* beg, const int* ind, const double* val)
{
    check(m_handle->env, CPXaddrows(m_handle->env, m_handle->lp, 0, rows, nnz, rhs, sense,
                                    beg, ind, val, nullptr, nullptr), "CPXaddrows");
}

void Environment::set_quadratic(const int* beg, const int* cnt, const int* ind, const double* val)
{
    check(m_handle->env, CPXcopyquad(m_handle->env, m_handle->lp, beg, cnt, ind, val), "CPXcopyquad");
}

double Environment::time() const
{
    double timestamp = 0;
    check(m_handle->env, CPXgettime(m_handle->env, &timestamp), "CPXgettime");
    return timestamp;
}

void Environment::solve()
{
    check(m_handle->env, CPXqpopt(m_handle->env, m_handle->lp), "CPXqpopt");
}

int Environment::status() const
{
    return CPXgetstat(m_handle->env, m_handle->lp);
}

bool Environment::has_solution() const
{
    int method, type, primal_feasible, dual_feasible;
    check(m_handle->env, CPXsolninfo(m_handle->env, m_handle->lp, &method, &type, &primal_feasible, &dual_feasible), "CPXsolninfo");
    return type != CPX_NO_SOLN;
}

double Environment::objective_value() const
{
    double obj_val = 0;
    check(m_handle->env, CPXgetobjval(m_handle->env, m_handle->lp, &obj_val), "CPXgetobjval");
    return obj_val;
}

int Environment::iterations() const
{
    int method, type, primal_feasible, dual_feasible;
    check(m_handle->env, CPXsolninfo(m_handle->env, m_handle->lp, &method, &type, &primal_feasible, &dual_feasible), "CPXsolninfo");
    if (method == CPX_ALG_BARRIER) {
        return CPXgetbaritcnt(m_handle->env, m_handle->lp);
    }
    return CPXgetitcnt(m_handle->env, m_handle->lp);
}

void Environment::primal_values(double* x, int n) const
{
    check(m_handle->env, CPXgetx(m_handle->env, m_handle->lp, x, 0, n - 1), "CPXgetx");
}

void Environment::dual_values(double* pi, int rows) const
{
    check(m_handle->env, CPXgetpi(m_handle->env, m_handle->lp, pi, 0, rows - 1), "CPXgetpi");
}

void Environment::reduced_costs(double* dj, int n) const
{
    check(m_handle->env, CPXgetdj(m_handle->env, m_handle->lp, dj, 0, n - 1), "CPXgetdj");
}

} // namespace cplex

} // namespace qpif
