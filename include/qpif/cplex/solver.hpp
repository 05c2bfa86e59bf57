// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_CPLEX_SOLVER_HPP
#define QPIF_CPLEX_SOLVER_HPP

#include <string>

#include "qpif/fwd.hpp"
#include "qpif/typedefs.hpp"
#include "qpif/timer.hpp"
#include "qpif/bounds.hpp"
#include "qpif/problem.hpp"
#include "qpif/results.hpp"
#include "qpif/settings.hpp"
#include "qpif/solver_interface.hpp"
#include "qpif/sparse/utils.hpp"
#include "qpif/cplex/environment.hpp"
#include "qpif/cplex/status.hpp"

namespace qpif
{

/*
 * Solves a Problem with the CPLEX QP optimizer.
 *
 * Equality rows are passed to CPLEX before the inequality rows with senses 'E' and 'L'.
 * CPLEX reports equality duals with the opposite sign, they are negated in the result.
 * Bound duals are split from the reduced costs using settings().bound_dual_threshold.
 *
 * Library failures are raised by Library as cplex::CplexError and are not caught.
 */
template<typename T, typename I, typename Library = cplex::Environment>
class CplexSolver : public SolverInterface<T, I>
{
protected:
    Settings<T> m_settings;
    Library m_library;

public:
    Settings<T>& settings() { return m_settings; }

    Library& library() { return m_library; }

    const char* name() const override { return "cplex"; }

    Result<T> solve(Problem<T, I>& problem) override
    {
        Result<T> result;

        if (!m_settings.verify_settings())
        {
            qpif_eprint("settings are invalid\n");
            result.info.status = Status::QPIF_INVALID_SETTINGS;
            return result;
        }

        if (!problem.verify_dimensions() || !fits_library_index(problem))
        {
            result.info.status = Status::QPIF_INVALID_PROBLEM;
            return result;
        }

        Timer<T> setup_timer;
        if (m_settings.compute_timings)
        {
            setup_timer.start();
        }

        isize n = problem.n();
        isize p = problem.p();
        isize m = problem.m();

        const T inf = T(Library::infinity());
        remap_infinite_bounds<T>(problem.x_l, inf);
        remap_infinite_bounds<T>(problem.x_u, inf);

        sparse::RowSparse<T, I> rows = sparse::stack_rows(problem.A, problem.G);
        sparse::RowSparse<T, I> quad = sparse::to_row_sparse(problem.P);

        Vec<double> rhs(p + m);
        rhs.head(p) = problem.b.template cast<double>();
        rhs.tail(m) = problem.h.template cast<double>();
        std::string sense = std::string(static_cast<usize>(p), 'E') + std::string(static_cast<usize>(m), 'L');

        if (m_settings.verbose)
        {
            print_header(rows, quad, n, p, m);
        }

        m_library.new_problem();
        m_library.set_verbose(m_settings.verbose);
        m_library.set_threads(static_cast<int>(m_settings.threads));
        m_library.set_qp_method(m_settings.qp_method);

        if (n > 0)
        {
            Vec<double> obj = problem.c.template cast<double>();
            Vec<double> lb = problem.x_l.template cast<double>();
            Vec<double> ub = problem.x_u.template cast<double>();
            m_library.add_variables(static_cast<int>(n), obj.data(), lb.data(), ub.data());
        }

        if (p + m > 0)
        {
            Vec<int> rmatbeg = rows.beg.template cast<int>();
            Vec<int> rmatind = rows.ind.template cast<int>();
            Vec<double> rmatval = rows.val.template cast<double>();
            m_library.add_rows(static_cast<int>(p + m), static_cast<int>(rows.non_zeros()),
                               rhs.data(), sense.c_str(),
                               rmatbeg.data(), rmatind.data(), rmatval.data());
        }

        if (n > 0)
        {
            Vec<int> qmatbeg = quad.beg.template cast<int>();
            Vec<int> qmatcnt = sparse::row_counts(quad).template cast<int>();
            Vec<int> qmatind = quad.ind.template cast<int>();
            Vec<double> qmatval = quad.val.template cast<double>();
            m_library.set_quadratic(qmatbeg.data(), qmatcnt.data(), qmatind.data(), qmatval.data());
        }

        if (m_settings.compute_timings)
        {
            result.info.setup_time = setup_timer.elapsed();
        }

        double start = m_library.time();
        m_library.solve();
        double end = m_library.time();
        result.info.solve_time = T(end - start);
        result.info.run_time = result.info.setup_time + result.info.solve_time;

        result.info.raw_status = m_library.status();
        result.info.status = cplex::map_status(result.info.raw_status);

        result.resize(n, p, m);
        if (m_library.has_solution())
        {
            extract_solution(result, n, p, m);
        }
        else
        {
            result.set_nan();
        }

        if (m_settings.verbose)
        {
            print_summary(result);
        }

        return result;
    }

protected:
    bool fits_library_index(const Problem<T, I>& problem) const
    {
        isize max_index = static_cast<isize>(m_library.max_index());
        isize n = problem.n();
        isize rows = problem.p() + problem.m();
        isize nnz_rows = static_cast<isize>(problem.A.nonZeros() + problem.G.nonZeros());
        isize nnz_quad = static_cast<isize>(problem.P.nonZeros());
        if (n > max_index || rows > max_index || nnz_rows > max_index || nnz_quad > max_index)
        {
            qpif_eprint("problem exceeds the cplex index range %zd: n = %zd, p + m = %zd, nnz([A; G]) = %zd, nnz(P) = %zd\n",
                        max_index, n, rows, nnz_rows, nnz_quad);
            return false;
        }
        return true;
    }

    void extract_solution(Result<T>& result, isize n, isize p, isize m)
    {
        result.info.obj_val = T(m_library.objective_value());
        result.info.iter = m_library.iterations();

        Vec<double> x(n);
        Vec<double> pi(p + m);
        Vec<double> dj(n);
        if (n > 0)
        {
            m_library.primal_values(x.data(), static_cast<int>(n));
            m_library.reduced_costs(dj.data(), static_cast<int>(n));
        }
        if (p + m > 0)
        {
            m_library.dual_values(pi.data(), static_cast<int>(p + m));
        }

        result.x = x.template cast<T>();
        result.y_eq = -pi.head(p).template cast<T>();
        result.y_ineq = pi.tail(m).template cast<T>();

        result.z_l.setZero();
        result.z_u.setZero();
        for (isize i = 0; i < n; i++)
        {
            T d = T(dj(i));
            if (d >= m_settings.bound_dual_threshold) {
                result.z_l(i) = d;
            } else {
                result.z_u(i) = -d;
            }
        }
    }

    void print_header(const sparse::RowSparse<T, I>& rows, const sparse::RowSparse<T, I>& quad, isize n, isize p, isize m)
    {
        qpif_print("----------------------------------------------------------\n");
        qpif_print("                        QPIF v%s                       \n", QPIF_VERSION);
        qpif_print("----------------------------------------------------------\n");
        qpif_print("cplex backend (%s)\n", qp_method_to_string(m_settings.qp_method));
        qpif_print("variables n = %zd, nnz(P) = %zd\n", n, quad.non_zeros());
        qpif_print("equality constraints p = %zd\n", p);
        qpif_print("inequality constraints m = %zd\n", m);
        qpif_print("constraint rows p + m = %zd, nnz([A; G]) = %zd\n", p + m, rows.non_zeros());
        qpif_print("\n");
    }

    void print_summary(const Result<T>& result)
    {
        qpif_print("\n");
        qpif_print("status:               %s (cplex %d)\n", status_to_string(result.info.status), result.info.raw_status);
        qpif_print("number of iterations: %zd\n", result.info.iter);
        qpif_print("objective:            %.5e\n", static_cast<double>(result.info.obj_val));
        qpif_print("solve time:           %.3es\n", static_cast<double>(result.info.solve_time));
        if (m_settings.compute_timings)
        {
            qpif_print("setup time:           %.3es\n", static_cast<double>(result.info.setup_time));
            qpif_print("total run time:       %.3es\n", static_cast<double>(result.info.run_time));
        }
    }
};

#ifdef QPIF_WITH_TEMPLATE_INSTANTIATION
extern template class CplexSolver<double, int, cplex::Environment>;
#endif

} // namespace qpif

#endif //QPIF_CPLEX_SOLVER_HPP
