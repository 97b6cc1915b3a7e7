//
// Copyright (c) 2026-present The bsat authors
//
// This file is part of bsat.
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
#include <bsat/util/timer.h>

#include <chrono>

#include <sys/resource.h> // getrusage

namespace Bsat {
namespace {
using Seconds = std::chrono::duration<double>;

double seconds(const timeval& tv) {
    return (Seconds(tv.tv_sec) + std::chrono::duration_cast<Seconds>(std::chrono::microseconds(tv.tv_usec))).count();
}
} // namespace

// Deadlines are derived from this clock, hence it must never go backwards.
double RealTime::getTime() {
    return std::chrono::duration_cast<Seconds>(std::chrono::steady_clock::now().time_since_epoch()).count();
}

double ProcessTime::getTime() {
    struct rusage ru = {};
    return getrusage(RUSAGE_SELF, &ru) == 0 ? seconds(ru.ru_utime) + seconds(ru.ru_stime) : 0.0;
}

} // namespace Bsat
