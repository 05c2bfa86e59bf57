// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_BOUNDS_HPP
#define QPIF_BOUNDS_HPP

#include <limits>

#include "qpif/typedefs.hpp"

namespace qpif
{

/*
 * Rewrites -inf entries of v to -inf_value and +inf entries to +inf_value in place.
 *
 * @param v          bound vector
 * @param inf_value  infinity sentinel of the backend library
 *
 * @return number of rewritten entries
 */
template<typename T>
isize remap_infinite_bounds(VecRef<T> v, const T& inf_value)
{
    isize count = 0;
    for (isize i = 0; i < v.size(); i++)
    {
        if (v(i) == -std::numeric_limits<T>::infinity()) {
            v(i) = -inf_value;
            count++;
        } else if (v(i) == std::numeric_limits<T>::infinity()) {
            v(i) = inf_value;
            count++;
        }
    }
    return count;
}

} // namespace qpif

#endif //QPIF_BOUNDS_HPP
