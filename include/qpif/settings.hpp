// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_SETTINGS_HPP
#define QPIF_SETTINGS_HPP

#include "qpif/typedefs.hpp"

namespace qpif
{

enum class QPMethod
{
    automatic,
    primal_simplex,
    dual_simplex,
    network,
    barrier,
    concurrent
};

constexpr const char* qp_method_to_string(QPMethod qp_method)
{
    switch (qp_method)
    {
        case QPMethod::automatic: return "automatic";
        case QPMethod::primal_simplex: return "primal_simplex";
        case QPMethod::dual_simplex: return "dual_simplex";
        case QPMethod::network: return "network";
        case QPMethod::barrier: return "barrier";
        case QPMethod::concurrent: return "concurrent";
        default: return "unknown";
    }
}

template<typename T>
struct Settings
{
    // reduced costs at or above this value are reported as lower bound duals,
    // everything else as (negated) upper bound duals
    T bound_dual_threshold = 1e-7;

    QPMethod qp_method = QPMethod::automatic;
    isize threads = 0; // 0 lets the backend decide

    bool verbose = false;
    bool compute_timings = false;

    bool verify_settings() const noexcept
    {
        return bound_dual_threshold >= 0 &&
               threads >= 0;
    }
};

} // namespace qpif

#endif //QPIF_SETTINGS_HPP
