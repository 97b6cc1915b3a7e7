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

#include <bsat/solver.h>

#include <memory>

/*!
 * \file
 * \brief The restart and reduction loop around Solver::search().
 */
namespace Bsat {

//! Drives a solver through a sequence of restarts and learnt clause reductions.
/*!
 * Each round calls Solver::search() with a conflict budget that is the minimum of
 * the next restart limit, the next reduction limit and what remains of the global
 * conflict limit. Progress is reported as BasicSolveEvent.
 *
 * \ingroup solver
 */
class BasicSolve {
public:
    /*!
     * \pre s.endInit() was called.
     * \note params must outlive this object.
     */
    BasicSolve(Solver& s, const SolveParams& params, const SolveLimits& lim = SolveLimits());
    ~BasicSolve();
    BasicSolve(BasicSolve&&) = delete;

    //! Runs the search until it finds a model, proves unsatisfiability or hits a limit.
    /*!
     * \return value_true on a model, value_false if no model exists and value_free
     *         if a limit stopped the search. In the last case expired() names the limit.
     *
     * Restart and reduction schedules as well as the remaining conflict budget carry
     * over to the next call.
     */
    Val_t solve();

    [[nodiscard]] SolveLimit expired() const { return expired_; }

    //! Forgets the schedules so that the next call to solve() starts them over.
    void reset();

private:
    struct State;
    Solver*                solver_;
    const SolveParams*     params_;
    SolveLimits            limits_;
    std::unique_ptr<State> state_;
    SolveLimit             expired_{SolveLimit::none};
};

//! Reports a restart ('R'), a reduction ('D') or the end of a solve call ('E').
struct BasicSolveEvent : SolveEvent {
    enum EventOp { event_none = 0, event_deletion = 'D', event_exit = 'E', event_restart = 'R' };
    BasicSolveEvent(const Solver& s, EventOp a_op, uint64_t cLim, uint32_t lLim)
        : SolveEvent(this, s, verbosity_max)
        , cLimit(cLim)
        , lLimit(lLim) {
        op = a_op;
    }
    uint64_t cLimit; //!< Conflict budget of the next round.
    uint32_t lLimit; //!< Learnt clauses in the database.
};

} // namespace Bsat
