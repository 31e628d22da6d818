//
// Copyright (c) 2006-present Benjamin Kaufmann
//
// This file is part of Aspect.
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to
// deal in the Software without restriction, including without limitation the
// rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
// sell copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
//
#pragma once

#include <aspect/config.h>

/*!
 * \file
 * \brief Clocks and a simple stopwatch.
 */
namespace Aspect {

//! Wall clock time in seconds.
struct RealTime {
    static double getTime();
};
//! CPU time of the current process in seconds.
struct ProcessTime {
    static double getTime();
};
//! CPU time of the calling thread in seconds.
struct ThreadTime {
    static double getTime();
};

//! A stopwatch measuring time with the given clock.
template <typename TimeType>
class Timer {
public:
    Timer() = default;

    void start() { start_ = TimeType::getTime(); }
    void stop() { split(TimeType::getTime()); }
    void reset() { *this = Timer(); }
    //! Stops the current lap and starts a new one.
    void lap() {
        auto t = TimeType::getTime();
        split(t);
        start_ = t;
    }
    //! Time of the last lap.
    [[nodiscard]] double elapsed() const { return split_; }
    //! Accumulated time of all laps.
    [[nodiscard]] double total() const { return total_; }
    //! Time since the last start() without stopping the timer.
    [[nodiscard]] double current() const { return TimeType::getTime() - start_; }

private:
    void split(double t) {
        split_  = t - start_;
        total_ += split_;
    }
    double start_{0.0};
    double split_{0.0};
    double total_{0.0};
};

} // namespace Aspect
