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
#include <bsat/solver_strategies.h>

#include <potassco/bits.h>
#include <potassco/error.h>

#include <cmath>

namespace Bsat {
/////////////////////////////////////////////////////////////////////////////////////////
// ScheduleStrategy
/////////////////////////////////////////////////////////////////////////////////////////
double growR(uint32_t idx, double g) { return std::pow(g, static_cast<double>(idx)); }
double addR(uint32_t idx, double a) { return a * idx; }

// The prefix of length 2^(k+1)-1 of the luby sequence consists of two copies of the
// prefix of length 2^k-1 followed by 2^k.
uint32_t lubyR(uint32_t idx) {
    uint32_t size = 1, exp = 0;
    while (size <= idx) {
        size = (size << 1) + 1;
        ++exp;
    }
    while (idx != size - 1) {
        size >>= 1;
        --exp;
        idx %= size;
    }
    return 1u << exp;
}

ScheduleStrategy::ScheduleStrategy(Type t, uint32_t b, double g, uint32_t outer)
    : base(b)
    , type(t)
    , idx(0)
    , len(outer)
    , grow(0.0f) {
    POTASSCO_CHECK_PRE(b < (1u << 30), "schedule base out of range");
    switch (t) {
        case sched_geom : grow = static_cast<float>(std::max(1.0, g)); break;
        case sched_arith: grow = static_cast<float>(std::max(0.0, g)); break;
        case sched_luby:
            // round the outer limit up to the length of a complete luby block
            if (outer > 1) {
                len = ((2u << Potassco::log2(outer - 1)) - 1) << 1;
            }
            else if (outer == 1) {
                len = 2;
            }
            break;
        default: POTASSCO_CHECK_PRE(false, "unknown schedule type");
    }
}

// An enabled schedule never yields a limit of 0.
static uint64_t toLimit(double d) {
    if (d < 1.0) {
        return 1;
    }
    return d < static_cast<double>(UINT64_MAX) ? static_cast<uint64_t>(d) : UINT64_MAX;
}

uint64_t ScheduleStrategy::current() const {
    if (disabled()) {
        return UINT64_MAX;
    }
    switch (type) {
        case sched_geom : return toLimit(growR(idx, grow) * base);
        case sched_arith: return toLimit(addR(idx, grow) + base);
        case sched_luby : return static_cast<uint64_t>(lubyR(idx)) * base;
        default         : POTASSCO_ASSERT_NOT_REACHED("unexpected schedule type");
    }
}

// Once idx reaches the outer limit, the sequence starts over with a longer limit.
static void nextRound(uint32_t& len, uint32_t type) {
    len = (len + 1) << static_cast<uint32_t>(type == ScheduleStrategy::sched_luby);
}

uint64_t ScheduleStrategy::next() {
    if (++idx == len) {
        idx = 0;
        nextRound(len, type);
    }
    return current();
}

void ScheduleStrategy::advanceTo(uint32_t n) {
    while (len && n >= len) {
        n -= len;
        nextRound(len, type);
    }
    idx = n;
}
/////////////////////////////////////////////////////////////////////////////////////////
// DynamicLimit and BlockLimit
/////////////////////////////////////////////////////////////////////////////////////////
static uint32_t checkWindow(uint32_t size) {
    POTASSCO_CHECK_PRE(size > 0, "window size must be > 0");
    return size;
}

DynamicLimit::DynamicLimit(float k, uint32_t window)
    : global_(0, MovingAvg::avg_sma)
    , avg_(checkWindow(window), MovingAvg::avg_sma)
    , num_(0)
    , rk_(k) {
    POTASSCO_CHECK_PRE(k > 0.0f, "lbd margin must be > 0");
}

void DynamicLimit::update(uint32_t, uint32_t lbd) {
    global_.push(lbd);
    avg_.push(lbd);
    ++num_;
}

void DynamicLimit::block() {
    avg_.clear();
    num_ = 0;
}

void DynamicLimit::restart() { block(); }

BlockLimit::BlockLimit(uint32_t windowSize, double rf, MovingAvg::Type t)
    : avg(checkWindow(windowSize), t)
    , next(windowSize)
    , n(0)
    , inc(50)
    , r(static_cast<float>(rf)) {}
/////////////////////////////////////////////////////////////////////////////////////////
// Events
/////////////////////////////////////////////////////////////////////////////////////////
uint32_t Event::nextId() {
    static uint32_t counter = 0;
    return counter++;
}

// verb_ holds one 4-bit verbosity per subsystem.
EventHandler::EventHandler(Event::Verbosity verbosity) : verb_(0) {
    for (auto sys : {Event::subsystem_facade, Event::subsystem_load, Event::subsystem_solve}) {
        setVerbosity(sys, verbosity);
    }
}

EventHandler::~EventHandler() = default;

void EventHandler::setVerbosity(Event::Subsystem sys, Event::Verbosity verb) {
    uint32_t shift = static_cast<uint32_t>(sys) << verb_shift;
    uint32_t bits  = verb_;
    Potassco::store_clear_mask(bits, verb_mask << shift);
    Potassco::store_set_mask(bits, static_cast<uint32_t>(verb) << shift);
    verb_ = static_cast<uint16_t>(bits);
}

} // namespace Bsat
