// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_QPIF_HPP
#define QPIF_QPIF_HPP

#include "qpif/fwd.hpp"
#include "qpif/typedefs.hpp"
#include "qpif/common.hpp"
#include "qpif/problem.hpp"
#include "qpif/results.hpp"
#include "qpif/settings.hpp"
#include "qpif/solver_interface.hpp"
#include "qpif/cplex/solver.hpp"

#endif //QPIF_QPIF_HPP
