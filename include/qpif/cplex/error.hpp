// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_CPLEX_ERROR_HPP
#define QPIF_CPLEX_ERROR_HPP

#include <stdexcept>
#include <string>

namespace qpif
{

namespace cplex
{

// raised for every nonzero return code of the CPLEX Callable Library
class CplexError : public std::runtime_error
{
protected:
    int m_code;

public:
    CplexError(int code, const std::string& message)
      : std::runtime_error(message), m_code(code) {}

    int code() const noexcept { return m_code; }
};

} // namespace cplex

} // namespace qpif

#endif //QPIF_CPLEX_ERROR_HPP
