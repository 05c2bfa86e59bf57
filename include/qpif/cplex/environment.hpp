// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_CPLEX_ENVIRONMENT_HPP
#define QPIF_CPLEX_ENVIRONMENT_HPP

#include <limits>
#include <memory>

#include "qpif/settings.hpp"
#include "qpif/cplex/error.hpp"

namespace qpif
{

namespace cplex
{

/*
 * Owns a CPLEX environment and the problem object currently being built in it.
 * Every failing library call is raised as CplexError.
 *
 * Sparse rows and the quadratic objective use the Callable Library layout:
 * row i starts at beg[i] in (ind, val), quadratic column i holds cnt[i] entries.
 */
class Environment
{
protected:
    struct Handle;
    std::unique_ptr<Handle> m_handle;

public:
    Environment();
    ~Environment();

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    static double infinity() noexcept;

    // columns, rows and nonzeros are addressed with int
    int max_index() const noexcept { return std::numeric_limits<int>::max(); }

    void set_verbose(bool verbose);
    void set_threads(int threads);
    void set_qp_method(QPMethod qp_method);

    // discards the current problem and creates an empty minimization problem
    void new_problem();

    void add_variables(int n, const double* obj, const double* lb, const double* ub);
    void add_rows(int rows, int nnz, const double* rhs, const char* sense,
                  const int* beg, const int* ind, const double* val);
    void set_quadratic(const int* beg, const int* cnt, const int* ind, const double* val);

    double time() const;
    void solve();

    int status() const;
    bool has_solution() const;
    double objective_value() const;
    int iterations() const;
    void primal_values(double* x, int n) const;
    void dual_values(double* pi, int rows) const;
    void reduced_costs(double* dj, int n) const;
};

} // namespace cplex

} // namespace qpif

#endif //QPIF_CPLEX_ENVIRONMENT_HPP
