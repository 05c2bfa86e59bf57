// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_COMMON_HPP
#define QPIF_COMMON_HPP

#include "qpif/typedefs.hpp"

namespace qpif
{

namespace common
{

// types the CPLEX Callable Library works with
using Scalar = double;
using StorageIndex = int;

} // namespace common

} // namespace qpif

#endif //QPIF_COMMON_HPP
