// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_UTILS_IO_UTILS_HPP
#define QPIF_UTILS_IO_UTILS_HPP

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <Eigen/Dense>
#include <Eigen/Sparse>

#include "matio.h"

#include "qpif/typedefs.hpp"
#include "qpif/problem.hpp"

namespace qpif
{

namespace io
{

// index and count types of mat_sparse_t differ between matio releases
using mat_index_t = std::remove_pointer_t<decltype(std::declval<mat_sparse_t>().ir)>;
using mat_count_t = decltype(std::declval<mat_sparse_t>().nzmax);

class MatFile
{
protected:
    mat_t* m_file = nullptr;
    std::string m_path;

public:
    MatFile(const std::string& path, bool write) : m_path(path)
    {
        if (write) {
            m_file = Mat_CreateVer(path.c_str(), nullptr, MAT_FT_MAT5);
        } else {
            m_file = Mat_Open(path.c_str(), MAT_ACC_RDONLY);
        }
        if (m_file == nullptr) {
            throw std::runtime_error("unable to open " + path);
        }
    }

    ~MatFile()
    {
        if (m_file != nullptr) {
            Mat_Close(m_file);
        }
    }

    MatFile(const MatFile&) = delete;
    MatFile& operator=(const MatFile&) = delete;

    template<typename T>
    void write_vec(const char* name, const Vec<T>& v)
    {
        Vec<double> data = v.template cast<double>();
        size_t dims[2] = {static_cast<size_t>(data.size()), 1};
        matvar_t* var = Mat_VarCreate(name, MAT_C_DOUBLE, MAT_T_DOUBLE, 2, dims, data.data(), MAT_F_DONT_COPY_DATA);
        write_var(name, var);
    }

    template<typename T, typename I>
    void write_sparse(const char* name, const SparseMat<T, I>& M)
    {
        SparseMat<double, I> M_compressed = M.template cast<double>();
        M_compressed.makeCompressed();

        Eigen::Matrix<mat_index_t, Eigen::Dynamic, 1> ir = Eigen::Map<const Vec<I>>(M_compressed.innerIndexPtr(), M_compressed.nonZeros()).template cast<mat_index_t>();
        Eigen::Matrix<mat_index_t, Eigen::Dynamic, 1> jc = Eigen::Map<const Vec<I>>(M_compressed.outerIndexPtr(), M_compressed.outerSize() + 1).template cast<mat_index_t>();

        mat_sparse_t sparse = {};
        sparse.nzmax = static_cast<mat_count_t>(M_compressed.nonZeros());
        sparse.nir = static_cast<decltype(sparse.nir)>(ir.size());
        sparse.ir = ir.data();
        sparse.njc = static_cast<decltype(sparse.njc)>(jc.size());
        sparse.jc = jc.data();
        sparse.ndata = static_cast<decltype(sparse.ndata)>(M_compressed.nonZeros());
        sparse.data = M_compressed.valuePtr();

        size_t dims[2] = {static_cast<size_t>(M.rows()), static_cast<size_t>(M.cols())};
        matvar_t* var = Mat_VarCreate(name, MAT_C_SPARSE, MAT_T_DOUBLE, 2, dims, &sparse, MAT_F_DONT_COPY_DATA);
        write_var(name, var);
    }

    template<typename T>
    Vec<T> read_vec(const char* name)
    {
        matvar_t* var = read_var(name);
        if (var->class_type != MAT_C_DOUBLE || var->data_type != MAT_T_DOUBLE || var->isComplex || var->rank != 2
            || (var->dims[0] > 1 && var->dims[1] > 1)) {
            Mat_VarFree(var);
            throw std::runtime_error(std::string(name) + " in " + m_path + " is not a real double vector");
        }

        isize size = static_cast<isize>(var->dims[0] * var->dims[1]);
        Vec<T> v(size);
        if (size > 0) {
            v = Eigen::Map<const Vec<double>>(static_cast<const double*>(var->data), size).template cast<T>();
        }
        Mat_VarFree(var);
        return v;
    }

    template<typename T, typename I>
    SparseMat<T, I> read_sparse(const char* name)
    {
        matvar_t* var = read_var(name);
        if (var->class_type != MAT_C_SPARSE || var->data_type != MAT_T_DOUBLE || var->isComplex || var->rank != 2) {
            Mat_VarFree(var);
            throw std::runtime_error(std::string(name) + " in " + m_path + " is not a real sparse matrix");
        }

        isize rows = static_cast<isize>(var->dims[0]);
        isize cols = static_cast<isize>(var->dims[1]);
        const mat_sparse_t* sparse = static_cast<const mat_sparse_t*>(var->data);

        SparseMat<T, I> M(rows, cols);
        if (sparse != nullptr) {
            if (!valid_sparse_format(sparse, rows, cols)) {
                Mat_VarFree(var);
                throw std::runtime_error(std::string(name) + " in " + m_path + " has a wrong sparse format");
            }
            isize nnz = static_cast<isize>(sparse->jc[cols]);
            M.resizeNonZeros(nnz);
            for (isize j = 0; j <= cols; j++) {
                M.outerIndexPtr()[j] = I(sparse->jc[j]);
            }
            const double* data = static_cast<const double*>(sparse->data);
            for (isize k = 0; k < nnz; k++) {
                M.innerIndexPtr()[k] = I(sparse->ir[k]);
                M.valuePtr()[k] = T(data[k]);
            }
        }
        Mat_VarFree(var);
        return M;
    }

protected:
    // column pointers start at zero and never decrease, row indices are
    // in range and strictly increasing within each column
    static bool valid_sparse_format(const mat_sparse_t* sparse, isize rows, isize cols)
    {
        if (sparse->nir != sparse->ndata || static_cast<isize>(sparse->njc) != cols + 1) {
            return false;
        }
        if (sparse->jc == nullptr || sparse->jc[0] != 0) {
            return false;
        }
        for (isize j = 0; j < cols; j++) {
            if (sparse->jc[j + 1] < sparse->jc[j]) {
                return false;
            }
        }
        isize nnz = static_cast<isize>(sparse->jc[cols]);
        if (nnz > static_cast<isize>(sparse->nir)) {
            return false;
        }
        if (nnz > 0 && (sparse->ir == nullptr || sparse->data == nullptr)) {
            return false;
        }
        for (isize j = 0; j < cols; j++) {
            isize begin = static_cast<isize>(sparse->jc[j]);
            isize end = static_cast<isize>(sparse->jc[j + 1]);
            for (isize k = begin; k < end; k++) {
                isize row = static_cast<isize>(sparse->ir[k]);
                if (row < 0 || row >= rows) {
                    return false;
                }
                if (k > begin && row <= static_cast<isize>(sparse->ir[k - 1])) {
                    return false;
                }
            }
        }
        return true;
    }

    void write_var(const char* name, matvar_t* var)
    {
        if (var == nullptr) {
            throw std::runtime_error("unable to create " + std::string(name) + " for " + m_path);
        }
        int status = Mat_VarWrite(m_file, var, MAT_COMPRESSION_NONE);
        Mat_VarFree(var);
        if (status != 0) {
            throw std::runtime_error("unable to write " + std::string(name) + " to " + m_path);
        }
    }

    matvar_t* read_var(const char* name)
    {
        matvar_t* var = Mat_VarRead(m_file, name);
        if (var == nullptr) {
            throw std::runtime_error("unable to read " + std::string(name) + " from " + m_path);
        }
        return var;
    }
};

} // namespace io

template<typename T, typename I>
void save_problem(const Problem<T, I>& problem, const std::string& path)
{
    io::MatFile file(path, true);
    file.write_sparse("P", problem.P);
    file.write_vec("c", problem.c);
    file.write_sparse("A", problem.A);
    file.write_vec("b", problem.b);
    file.write_sparse("G", problem.G);
    file.write_vec("h", problem.h);
    file.write_vec("x_l", problem.x_l);
    file.write_vec("x_u", problem.x_u);
}

template<typename T, typename I>
Problem<T, I> load_problem(const std::string& path)
{
    io::MatFile file(path, false);
    Problem<T, I> problem;
    problem.P = file.read_sparse<T, I>("P");
    problem.c = file.read_vec<T>("c");
    problem.A = file.read_sparse<T, I>("A");
    problem.b = file.read_vec<T>("b");
    problem.G = file.read_sparse<T, I>("G");
    problem.h = file.read_vec<T>("h");
    problem.x_l = file.read_vec<T>("x_l");
    problem.x_u = file.read_vec<T>("x_u");
    return problem;
}

} // namespace qpif

#endif //QPIF_UTILS_IO_UTILS_HPP
