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
#include <bsat/solve_algorithms.h>

#include <bsat/util/timer.h>

#include <potassco/error.h>

#include <algorithm>

namespace Bsat {
/////////////////////////////////////////////////////////////////////////////////////////
// BasicSolve::State
/////////////////////////////////////////////////////////////////////////////////////////
namespace {
// Conflicts left until the next reduction, the next restart and the global limit.
struct Budget {
    [[nodiscard]] uint64_t next() const { return std::min({reduce, restart, global}); }
    // A search may overshoot its budget while it backjumps.
    void consume(uint64_t n) {
        reduce  -= std::min(n, reduce);
        restart -= std::min(n, restart);
        global  -= std::min(n, global);
    }
    uint64_t reduce;
    uint64_t restart;
    uint64_t global;
};
} // namespace

struct BasicSolve::State {
    State(const SolveParams& p, const SolveLimits& lim);
    Val_t solve(Solver& s, const SolveParams& p, SolveLimits& lim, SolveLimit& expired);
    void  initLimits(SearchLimits& out, ScheduleStrategy& rs, const SolveLimits& lim) const;

    ScheduleStrategy              reduceSched;
    std::unique_ptr<BlockLimit>   block;
    std::unique_ptr<DynamicLimit> dynamic;
    uint64_t                      reduceNext;
    double                        deadline;
    uint32_t                      restarts{0};
};

BasicSolve::State::State(const SolveParams& p, const SolveLimits& lim)
    : reduceSched(p.reduce.interval)
    , reduceNext(reduceSched.current())
    , deadline(SolveLimits::no_time) {
    POTASSCO_CHECK_PRE(lim.time >= 0.0, "time limit must be >= 0");
    if (lim.time != SolveLimits::no_time) {
        deadline = RealTime::getTime() + lim.time;
    }
    const auto& rp = p.restart;
    if (rp.dynamic()) {
        dynamic = std::make_unique<DynamicLimit>(rp.dyn.k, rp.dyn.window);
    }
    if (rp.block.window && rp.block.scale > 0.0f) {
        block       = std::make_unique<BlockLimit>(rp.block.window, rp.block.scale);
        block->next = std::max(rp.block.window, rp.block.first);
    }
}

void BasicSolve::State::initLimits(SearchLimits& out, ScheduleStrategy& rs, const SolveLimits& lim) const {
    if (dynamic) {
        out.restart.dynamic = dynamic.get();
    }
    else if (not rs.disabled()) {
        rs.advanceTo(restarts);
        out.restart.conflicts = rs.current();
    }
    out.restart.block = block.get();
    out.decisions     = lim.decisions;
    out.deadline      = deadline;
}

Val_t BasicSolve::State::solve(Solver& s, const SolveParams& p, SolveLimits& lim, SolveLimit& expired) {
    using Ev = BasicSolveEvent;
    expired  = SolveLimit::none;
    if (s.hasConflict() && s.decisionLevel() == 0) {
        return value_false;
    }
    SearchLimits     search;
    ScheduleStrategy rs = p.restart.sched;
    initLimits(search, rs, lim);

    Budget budget{.reduce = reduceNext, .restart = UINT64_MAX, .global = lim.conflicts};
    Ev     ev(s, Ev::event_restart, 0, 0);
    Val_t  res = value_free;
    while (budget.global != 0) {
        budget.restart   = search.restart.conflicts;
        search.used      = 0;
        search.conflicts = budget.next();
        assert(search.conflicts != 0);
        if (ev.op != Ev::event_none) {
            ev.cLimit = search.conflicts;
            ev.lLimit = s.numLearnts();
            s.report(ev);
            ev.op = Ev::event_none;
        }
        res            = s.search(search, p.randProb);
        uint64_t spent = search.used;
        budget.consume(spent);
        if (res != value_free || search.expired != SolveLimit::none) {
            expired   = search.expired;
            ev.op     = Ev::event_exit;
            ev.cLimit = search.conflicts;
            ev.lLimit = s.numLearnts();
            s.report(ev);
            break;
        }
        if (s.restartReached(search)) {
            ++restarts;
            if (auto* dyn = search.restart.dynamic) {
                dyn->restart();
                ++s.stats.dynRestarts;
            }
            else {
                search.restart.conflicts = rs.next();
            }
            s.restart();
            ev.op = Ev::event_restart;
        }
        else if (search.restart.conflicts != UINT64_MAX) {
            search.restart.conflicts -= std::min(spent, search.restart.conflicts);
        }
        if (budget.reduce == 0) {
            s.reduceLearnts(p.reduce.fraction, p.reduce.strategy);
            budget.reduce = reduceSched.next();
            if (ev.op != Ev::event_restart) {
                ev.op = Ev::event_deletion;
            }
        }
    }
    if (res == value_free && expired == SolveLimit::none && budget.global == 0) {
        expired = SolveLimit::conflicts;
        s.report(Ev(s, Ev::event_exit, 0, s.numLearnts()));
    }
    reduceNext = budget.reduce;
    if (lim.conflicts != UINT64_MAX) {
        lim.conflicts = budget.global;
    }
    return res;
}
/////////////////////////////////////////////////////////////////////////////////////////
// BasicSolve
/////////////////////////////////////////////////////////////////////////////////////////
BasicSolve::BasicSolve(Solver& s, const SolveParams& p, const SolveLimits& lim)
    : solver_(&s)
    , params_(&p)
    , limits_(lim) {}

BasicSolve::~BasicSolve() = default;

void BasicSolve::reset() { state_.reset(); }

Val_t BasicSolve::solve() {
    if (not state_) {
        state_ = std::make_unique<State>(*params_, limits_);
    }
    return state_->solve(*solver_, *params_, limits_, expired_);
}

} // namespace Bsat
