// This file is part of QPIF.
//
// Copyright (c) 2025 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef QPIF_TIMER_HPP
#define QPIF_TIMER_HPP

#include <chrono>

namespace qpif
{

// wall-clock timer for the work done outside the backend library
template<typename T>
class Timer
{
protected:
    std::chrono::time_point<std::chrono::steady_clock> m_start;

public:
    void start() noexcept
    {
        m_start = std::chrono::steady_clock::now();
    }

    T elapsed() const noexcept
    {
        auto now = std::chrono::steady_clock::now();
        return static_cast<T>(std::chrono::duration_cast<std::chrono::nanoseconds>(now - m_start).count()) * 1e-9;
    }
};

} // namespace qpif

#endif //QPIF_TIMER_HPP
