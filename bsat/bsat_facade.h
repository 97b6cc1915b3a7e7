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

#include <bsat/formula.h>
#include <bsat/solve_algorithms.h>

#include <string>
#include <string_view>
#include <vector>

/*!
 * \file
 * \brief Provides a high-level interface for solving CNF formulas.
 */
namespace Bsat {

/*!
 * \defgroup facade Facade
 * \brief Facade and configuration related classes.
 */
//@{

//! Configuration object for one solve call.
/*!
 * Groups the parameters of the solver, the search and the global limits.
 * Besides direct access to the parameter structs, options can be set by key via setValue().
 */
struct BsatConfig {
    //! Sets the option with the given key to the value given as string.
    /*!
     * Supported keys:
     *  - heuristic       : vsids|first
     *  - sign            : pos|neg|saved
     *  - ccmin           : none|local|recursive
     *  - seed            : <n>
     *  - vsids.bump      : <d> (> 0)
     *  - vsids.decay     : <d> in (0, 1]
     *  - restart         : geom,<n>,<d>|arith,<n>,<d>|luby,<n>|fixed,<n>|dynamic,<n>,<k>|no
     *  - restart.base    : <n>
     *  - restart.grow    : <d> (>= 1 for geometric, >= 0 for arithmetic schedules)
     *  - restart.block   : <n>,<d> (window and scale) or no
     *  - reduce.interval : <n> (0 disables reduction)
     *  - reduce.grow     : <n> (arithmetic growth of the interval)
     *  - reduce.fraction : <d> in [0, 1]
     *  - reduce.glue     : <n>
     *  - reduce.score    : act|lbd|both
     *  - rand.prob       : <d> in [0, 1]
     *  - limit.decisions : <n>
     *  - limit.conflicts : <n>
     *  - limit.time      : <d> seconds (>= 0)
     *  .
     * \throws std::invalid_argument if the key is unknown or the value is not valid for the key.
     */
    void setValue(std::string_view key, std::string_view value);

    SolverParams solver; //!< Parameters of the solver.
    SolveParams  search; //!< Restart, reduce and randomization parameters.
    SolveLimits  limits; //!< Global limits on decisions, conflicts and time.
};

//! The result of a solve call.
struct SolveResult {
    enum Status {
        status_unknown = 0, //!< Search stopped because of a limit.
        status_sat     = 1, //!< Formula is satisfiable.
        status_unsat   = 2, //!< Formula is unsatisfiable.
        status_error   = 3, //!< Formula is malformed.
    };

    [[nodiscard]] bool sat() const { return status == status_sat; }
    [[nodiscard]] bool unsat() const { return status == status_unsat; }
    [[nodiscard]] bool unknown() const { return status == status_unknown; }
    [[nodiscard]] bool error() const { return status == status_error; }
    //! Returns the value of v in the model.
    /*!
     * \pre sat() and 0 < v < model.size()
     */
    [[nodiscard]] bool value(Var_t v) const {
        POTASSCO_CHECK_PRE(sat() && v != sent_var && v < model.size(), "no model or invalid variable");
        return model[v];
    }

    Status            status{status_unknown};
    SolveLimit        reason{SolveLimit::none}; //!< If unknown(), the limit that stopped the search.
    std::vector<bool> model;                    //!< If sat(), the model indexed by variable (index 0 unused).
    std::string       message;                  //!< If error(), a description of the error.
    SolverStats       stats;                    //!< Statistics of the solve call.
    double            time{0.0};                //!< Wall-clock time in seconds.
    double            cpuTime{0.0};             //!< Process cpu time in seconds.
};

//! Returns a short name for the given status.
const char* toString(SolveResult::Status st);
//! Returns a short name for the given limit.
const char* toString(SolveLimit lim);

//! Decides the satisfiability of f.
/*!
 * Loads f into a fresh Solver configured by config and runs BasicSolve until
 * a model is found, unsatisfiability is proven, or a limit in config.limits is reached.
 * Malformed formulas are reported as status_error.
 *
 * \param f       The formula to solve.
 * \param config  Configuration to use.
 * \param handler Optional handler for progress and log events.
 * \throws std::logic_error on violation of an internal invariant.
 */
SolveResult solve(const Formula& f, const BsatConfig& config = BsatConfig(), EventHandler* handler = nullptr);

//@}
} // namespace Bsat
