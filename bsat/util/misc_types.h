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

#include <bsat/config.h>

#include <algorithm>
#include <ranges>
#include <type_traits>
#include <vector>

/*!
 * \file
 * \brief Random numbers, running averages and the event base type.
 */
namespace Bsat {

/*!
 * \defgroup misc Miscellaneous
 * \brief Helpers that are not specific to SAT solving.
 */
//@{

//! Returns x/y or 0 if y is 0.
constexpr double ratio(uint64_t x, uint64_t y) { return y ? static_cast<double>(x) / static_cast<double>(y) : 0; }

//! Integers in [0, n).
template <std::integral T>
constexpr auto irange(T n) {
    return std::views::iota(T(0), n);
}
//! Integers in [lo, hi) or nothing if hi < lo.
template <std::integral T>
constexpr auto irange(T lo, T hi) {
    return std::views::iota(lo, std::max(lo, hi));
}

//! Linear congruential generator with 15-bit output.
/*!
 * The sequence only depends on the seed, so runs are reproducible across
 * platforms and standard library implementations.
 */
class Rng {
public:
    constexpr explicit Rng(uint32_t seed = 1) : seed_(seed) {}

    constexpr void                   srand(uint32_t seed) { seed_ = seed; }
    [[nodiscard]] constexpr uint32_t seed() const { return seed_; }

    //! Returns an integer in [0, 32767].
    constexpr uint32_t rand() {
        seed_ = (seed_ * mul) + inc;
        return (seed_ >> 16) & rand_max;
    }
    //! Returns a double in [0, 1).
    constexpr double drand() { return static_cast<double>(rand()) / (rand_max + 1.0); }
    //! Returns an integer in [0, max).
    constexpr uint32_t irand(uint32_t max) { return static_cast<uint32_t>(drand() * max); }

    constexpr uint32_t operator()(uint32_t max) { return irand(max); }

private:
    static constexpr uint32_t mul      = 214013u;
    static constexpr uint32_t inc      = 2531011u;
    static constexpr uint32_t rand_max = 0x7fffu;
    uint32_t                  seed_;
};

//! Running average over unsigned samples.
/*!
 * With window 0 the average is taken over all samples. Otherwise avg_sma averages
 * the last window samples and avg_ema weighs each new sample by 2/(window+1).
 * Both windowed variants return the plain average of all samples until the
 * window is filled.
 */
class MovingAvg {
public:
    enum Type { avg_sma = 0, avg_ema = 1 };

    MovingAvg(uint32_t window, Type type) : win_(window), ema_(type == avg_ema) {
        if (ema_) {
            alpha_ = 2.0 / (window + 1.0);
        }
        else {
            ring_.assign(window, 0u);
        }
    }

    static constexpr double ema(double avg, double x, double alpha) { return avg + (alpha * (x - avg)); }
    //! Average of n samples with average avg plus x.
    static constexpr double cma(double avg, double x, uint64_t n) {
        auto dn = static_cast<double>(n);
        return ((avg * dn) + x) / (dn + 1.0);
    }

    //! Adds val and returns valid().
    bool push(uint32_t val) {
        const double x = val;
        if (not valid() || win_ == 0) {
            avg_ = cma(avg_, x, num_);
        }
        else if (ema_) {
            avg_ = ema(avg_, x, alpha_);
        }
        else {
            avg_ += (x - ring_[slot()]) / win_;
        }
        if (not ring_.empty()) {
            ring_[slot()] = val;
        }
        ++num_;
        return valid();
    }

    void clear() {
        num_ = 0;
        avg_ = 0.0;
    }

    [[nodiscard]] double   get() const { return avg_; }
    [[nodiscard]] bool     valid() const { return num_ >= win_; }
    [[nodiscard]] uint32_t win() const { return win_; }
    [[nodiscard]] uint64_t samples() const { return num_; }

private:
    [[nodiscard]] uint32_t slot() const { return static_cast<uint32_t>(num_ % win_); }

    std::vector<uint32_t> ring_; // last win_ samples (sma only)
    double                avg_{0.0};
    double                alpha_{0.0};
    uint64_t              num_{0};
    uint32_t              win_;
    bool                  ema_;
};
//@}

//! Base of all events reported by a Solver.
/*!
 * Each concrete event type gets a unique id on first use, which allows
 * event_cast() to downcast without rtti.
 */
struct Event {
    enum Subsystem { subsystem_facade = 0, subsystem_load = 1, subsystem_solve = 2 };
    enum Verbosity { verbosity_quiet = 0, verbosity_low = 1, verbosity_high = 2, verbosity_max = 3 };

    template <typename SelfType>
    Event(SelfType*, Subsystem sys, Verbosity v) : system(sys), verb(v), op(0), id(eventId<SelfType>()) {
        static_assert(std::is_base_of_v<Event, SelfType>);
    }

    template <typename T>
    static uint32_t eventId() {
        static const uint32_t id_s = nextId();
        return id_s;
    }
    static uint32_t nextId();

    uint32_t system : 2;  //!< A Subsystem.
    uint32_t verb   : 2;  //!< A Verbosity.
    uint32_t op     : 8;  //!< Event specific operation code.
    uint32_t id     : 16; //!< Type id as returned by eventId().
};

template <typename ToType>
const ToType* event_cast(const Event& ev) {
    return ev.id == Event::eventId<ToType>() ? static_cast<const ToType*>(&ev) : nullptr;
}

} // namespace Bsat
