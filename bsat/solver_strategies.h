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

#include <bsat/solver_types.h>

#include <limits>

/*!
 * \file
 * \brief Parameter objects and small strategy types that steer the search.
 */
namespace Bsat {
class Solver;

/*!
 * \addtogroup solver
 */
//@{

//! A sequence of conflict limits used for restarts and learnt clause deletion.
/*!
 * For base b, growth g and index k the basic sequences are
 *  - sched_geom : b * g^k
 *  - sched_arith: b + g*k (a fixed sequence is arith with g = 0)
 *  - sched_luby : b * luby(k)
 *  .
 * A non-zero len turns the sequence into an inner/outer scheme: once idx reaches
 * len, idx starts over at 0 and len grows (by one, or to the next complete luby
 * block for luby sequences). A base of 0 disables the schedule.
 */
struct ScheduleStrategy {
    enum Type { sched_geom = 0, sched_arith = 1, sched_luby = 2 };

    ScheduleStrategy(Type t = sched_geom, uint32_t b = 100, double g = 1.5, uint32_t outer = 0);

    static ScheduleStrategy geom(uint32_t base, double grow, uint32_t outer = 0) {
        return {sched_geom, base, grow, outer};
    }
    static ScheduleStrategy arith(uint32_t base, double add, uint32_t outer = 0) {
        return {sched_arith, base, add, outer};
    }
    static ScheduleStrategy luby(uint32_t unit, uint32_t outer = 0) { return {sched_luby, unit, 0, outer}; }
    static ScheduleStrategy fixed(uint32_t base) { return arith(base, 0); }
    static ScheduleStrategy none() { return {sched_geom, 0}; }

    [[nodiscard]] bool disabled() const { return base == 0; }
    //! Returns the limit at idx or UINT64_MAX if disabled.
    [[nodiscard]] uint64_t current() const;
    //! Moves to the next index and returns its limit.
    uint64_t next();
    //! Sets the state to the one reached after n calls to next() on a fresh sequence.
    void advanceTo(uint32_t n);
    void reset() { idx = 0; }

    uint32_t base : 30;
    uint32_t type : 2;
    uint32_t idx;  // position in the current round
    uint32_t len;  // length of the current round or 0 for an unbounded sequence
    float    grow;
};

uint32_t lubyR(uint32_t idx);
double   growR(uint32_t idx, double g);
double   addR(uint32_t idx, double a);

enum class HeuristicType : uint32_t {
    vsids = 0, //!< Exponential VSIDS.
    none  = 1  //!< Smallest free variable first.
};

//! Options of a single Solver.
struct SolverParams {
    enum SignHeu {
        sign_pos   = 0,
        sign_neg   = 1,
        sign_saved = 2, //!< Phase saving, falling back to signFix.
    };
    enum CCMinType {
        cc_none      = 0,
        cc_local     = 1, //!< Drop literals whose reason is subsumed by the clause.
        cc_recursive = 2, //!< Drop literals implied by the clause through any chain of reasons.
    };

    HeuristicType heuId{HeuristicType::vsids};
    uint32_t      signDef{sign_saved};
    uint32_t      signFix{sign_neg};   //!< Sign for variables without saved phase.
    uint32_t      ccMin{cc_recursive};
    uint32_t      seed{1};
    double        varBump{1.0};       //!< Initial VSIDS increment.
    double        varDecay{0.95};     //!< VSIDS decay in (0, 1].
    double        clauseDecay{0.999}; //!< Learnt clause activity decay in (0, 1].
};

//! When to restart.
/*!
 * Either a conflict schedule (sched) or, if dyn.window is set, the lbd based
 * DynamicLimit. Both may be combined with blocking on the trail size.
 */
struct RestartParams {
    struct Dynamic {
        uint32_t window{0}; // 0: off
        float    k{0.8f};
    };
    struct Block {
        uint32_t window{0}; // 0: off
        uint32_t first{10000};
        float    scale{1.4f};
    };

    [[nodiscard]] bool dynamic() const { return dyn.window != 0; }
    [[nodiscard]] bool disabled() const { return sched.disabled() && not dynamic(); }
    void               disable() { *this = {.sched = ScheduleStrategy::none(), .dyn = {}, .block = {}}; }

    ScheduleStrategy sched{ScheduleStrategy::geom(100, 1.5)};
    Dynamic          dyn;
    Block            block;
};

//! Glucose-style restarts driven by the lbd of learnt clauses.
/*!
 * Keeps a cumulative lbd average over the whole search and a moving average over the
 * last window conflicts of the current run. A restart is due once the moving average
 * scaled by k exceeds the cumulative one.
 *
 * \see G. Audemard, L. Simon. "Refining Restarts Strategies for SAT and UNSAT"
 */
struct DynamicLimit {
    DynamicLimit(float k, uint32_t window);
    DynamicLimit(const DynamicLimit&)            = delete;
    DynamicLimit& operator=(const DynamicLimit&) = delete;

    //! Records the lbd of a new learnt clause.
    void update(uint32_t conflictLevel, uint32_t lbd);
    //! Starts a new run.
    void restart();
    //! Postpones the next restart by discarding the current run.
    void block();

    [[nodiscard]] uint32_t runLen() const { return num_; }
    [[nodiscard]] bool reached() const { return num_ >= avg_.win() && movingAverage() * rk_ > globalAverage(); }
    [[nodiscard]] double globalAverage() const { return global_.get(); }
    [[nodiscard]] double movingAverage() const { return avg_.get(); }

private:
    MovingAvg global_;
    MovingAvg avg_;
    uint32_t  num_;
    float     rk_;
};

//! Blocks a restart while the trail is much larger than usual.
/*!
 * \see A. Biere, A. Froehlich "Evaluating CDCL Restart Schemes"
 */
struct BlockLimit {
    explicit BlockLimit(uint32_t windowSize, double rf = 1.4, MovingAvg::Type t = MovingAvg::avg_ema);
    //! Records a trail size and returns whether blocking is active.
    bool push(uint32_t nAssign) {
        avg.push(nAssign);
        return ++n >= next;
    }
    [[nodiscard]] double scaled() const { return avg.get() * r; }

    MovingAvg avg;
    uint64_t  next; // first n at which blocking is active
    uint64_t  n;    // samples seen
    uint32_t  inc;  // conflicts added to the restart limit per blocked restart
    float     r;
};

//! How learnt clauses are ranked for deletion.
struct ReduceStrategy {
    enum Score {
        score_act  = 0, //!< By activity.
        score_lbd  = 1, //!< By lbd, lower is better.
        score_both = 2  //!< By lbd, ties broken by activity.
    };

    uint32_t glue{2};          //!< Clauses with lbd <= glue are never deleted.
    uint32_t score{score_lbd};
};

struct ReduceParams {
    ScheduleStrategy interval{ScheduleStrategy::arith(2000, 300)}; //!< Conflicts between two reductions.
    double           fraction{0.5};                               //!< Share of learnt clauses to delete.
    ReduceStrategy   strategy;
};

struct SolveParams {
    RestartParams restart;
    ReduceParams  reduce;
    double        randProb{0.0}; //!< Probability of a random decision in [0, 1].
};

//! Why a search stopped without a result.
enum class SolveLimit : uint32_t {
    none      = 0,
    decisions = 1,
    conflicts = 2,
    time      = 3,
};

//! Global limits of one solve call. UINT64_MAX and no_time mean unlimited.
struct SolveLimits {
    static constexpr double no_time = std::numeric_limits<double>::infinity();

    [[nodiscard]] bool enabled() const {
        return conflicts != UINT64_MAX || decisions != UINT64_MAX || time != no_time;
    }

    uint64_t conflicts{UINT64_MAX};
    uint64_t decisions{UINT64_MAX};
    double   time{no_time}; //!< Wall-clock seconds.
};

//! Limits of a single call to Solver::search().
/*!
 * The conflict limits are soft: search() returns once they are exceeded and it
 * is safe to stop. The decision and time limits are hard and set expired.
 */
struct SearchLimits {
    uint64_t used = 0; //!< Conflicts counted by search().
    struct {
        uint64_t      conflicts = UINT64_MAX;
        DynamicLimit* dynamic   = nullptr; //!< Replaces conflicts if set.
        BlockLimit*   block     = nullptr;
    } restart;
    uint64_t   conflicts = UINT64_MAX;
    uint64_t   decisions = UINT64_MAX;     //!< Compared against the solver's total decisions.
    double     deadline  = SolveLimits::no_time; //!< Absolute RealTime.
    SolveLimit expired   = SolveLimit::none;
};

///////////////////////////////////////////////////////////////////////////////
// Events
///////////////////////////////////////////////////////////////////////////////
//! Receives events whose verbosity does not exceed the level set for their subsystem.
class EventHandler {
public:
    explicit EventHandler(Event::Verbosity verbosity = Event::verbosity_quiet);
    virtual ~EventHandler();
    EventHandler(const EventHandler&)            = delete;
    EventHandler& operator=(const EventHandler&) = delete;

    void                   setVerbosity(Event::Subsystem sys, Event::Verbosity verb);
    [[nodiscard]] uint32_t verbosity(Event::Subsystem sys) const {
        return (static_cast<uint32_t>(verb_) >> (static_cast<uint32_t>(sys) << verb_shift)) & verb_mask;
    }
    void dispatch(const Event& ev) {
        if (ev.verb <= verbosity(static_cast<Event::Subsystem>(ev.system))) {
            onEvent(ev);
        }
    }
    virtual void onEvent(const Event& ev) { static_cast<void>(ev); }

private:
    static constexpr uint32_t verb_mask  = 15u;
    static constexpr uint32_t verb_shift = 2u;

    uint16_t verb_;
};

//! A text message or warning.
struct LogEvent : Event {
    enum Type { message = 'M', warning = 'W' };
    LogEvent(Subsystem sys, Verbosity v, Type t, const Solver* s, const char* what)
        : Event(this, sys, v)
        , solver(s)
        , msg(what) {
        op = static_cast<uint32_t>(t);
    }
    [[nodiscard]] bool isWarning() const { return op == static_cast<uint32_t>(warning); }

    const Solver* solver; // may be null
    const char*   msg;
};

//! Common base of events emitted during search.
struct SolveEvent : Event {
    template <typename DerivedT>
    SolveEvent(DerivedT* self, const Solver& s, Verbosity v)
        : Event(self, subsystem_solve, v)
        , solver(&s) {}
    const Solver* solver;
};

//@}
} // namespace Bsat
