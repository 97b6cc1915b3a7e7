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
#pragma once

/*!
 * \file
 * \brief Functions for querying wall-clock and cpu time.
 */
namespace Bsat {

//! Wall-clock time in seconds since some unspecified starting point.
struct RealTime {
    static double getTime();
};
//! Cpu time (user + system) consumed by the current process in seconds.
struct ProcessTime {
    static double getTime();
};

//! A simple stop watch parameterized by a time source.
template <typename TimeSource>
class Timer {
public:
    Timer() = default;
    void start() { start_ = TimeSource::getTime(); }
    //! Stops the watch and adds the elapsed time to the total.
    void stop() { total_ += elapsed(); }
    [[nodiscard]] double elapsed() const { return TimeSource::getTime() - start_; }
    [[nodiscard]] double total() const { return total_; }

private:
    double start_{0.0};
    double total_{0.0};
};

} // namespace Bsat
