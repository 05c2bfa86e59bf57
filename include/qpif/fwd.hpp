// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_FWD_HPP
#define QPIF_FWD_HPP

#include <cstdio>
#include <Eigen/Core>

#define QPIF_VERSION "0.1.0"

#define qpif_print printf
#define qpif_eprint(...) fprintf(stderr, __VA_ARGS__)

#endif //QPIF_FWD_HPP
