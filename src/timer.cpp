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
#include <aspect/util/timer.h>

#include <chrono>
#include <ctime> // clock_gettime

namespace Aspect {
namespace {
double toSeconds(const timespec& t) {
    using S = std::chrono::duration<double>;
    return (S(t.tv_sec) + std::chrono::duration_cast<S>(std::chrono::nanoseconds(t.tv_nsec))).count();
}
double cpuTime(clockid_t clock) {
    timespec now = {};
    return clock_gettime(clock, &now) == 0 ? toSeconds(now) : 0.0;
}
} // namespace

double RealTime::getTime() {
    using S = std::chrono::duration<double>;
    return std::chrono::duration_cast<S>(std::chrono::steady_clock::now().time_since_epoch()).count();
}
double ProcessTime::getTime() { return cpuTime(CLOCK_PROCESS_CPUTIME_ID); }
double ThreadTime::getTime() { return cpuTime(CLOCK_THREAD_CPUTIME_ID); }

} // namespace Aspect
