// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#include "qpif/common.hpp"
#include "qpif/cplex/solver.hpp"

namespace qpif
{

template class CplexSolver<common::Scalar, common::StorageIndex, cplex::Environment>;

} // namespace qpif
