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

#include <bsat/literal.h>
#include <bsat/util/misc_types.h>

#include <potassco/error.h>

/*!
 * \file
 * \brief Types and functions used by a Solver
 */
namespace Bsat {

/*!
 * \addtogroup solver
 */
//@{
///////////////////////////////////////////////////////////////////////////////
// Statistics
///////////////////////////////////////////////////////////////////////////////
#define BSAT_STAT_SUM(L, R) (L) += (R)
#define BSAT_STAT_MAX(L, R) (L) = std::max((L), (R))
#define BSAT_STAT_DEFINE(m, k, accu) uint64_t m{};

//! A struct for holding the statistics of one solve invocation.
struct SolverStats {
#define BSAT_SOLVER_STATS(STAT)                                                                                       \
    STAT(decisions, "decisions", BSAT_STAT_SUM)               /* number of decisions             */                  \
    STAT(conflicts, "conflicts", BSAT_STAT_SUM)               /* number of conflicts             */                  \
    STAT(propagations, "propagations", BSAT_STAT_SUM)         /* number of forced literals       */                  \
    STAT(learnts, "learned_clauses", BSAT_STAT_SUM)           /* number of learnt clauses        */                  \
    STAT(restarts, "restarts", BSAT_STAT_SUM)                 /* number of restarts              */                  \
    STAT(backjumps, "backjumps", BSAT_STAT_SUM)               /* number of analyzed conflicts    */                  \
    STAT(jumpSum, "levels_jumped", BSAT_STAT_SUM)             /* levels removed by backjumps     */                  \
    STAT(maxLevel, "max_decision_level", BSAT_STAT_MAX)       /* max decision level reached      */                  \
    STAT(units, "learned_units", BSAT_STAT_SUM)               /* learnt clauses of size 1        */                  \
    STAT(glue, "learned_glue", BSAT_STAT_SUM)                 /* learnt clauses with lbd <= 2    */                  \
    STAT(litsLearnt, "learned_lits", BSAT_STAT_SUM)           /* sum of learnt clause sizes      */                  \
    STAT(litsMinimized, "minimized_lits", BSAT_STAT_SUM)      /* lits removed by minimization    */                  \
    STAT(deleted, "deleted_clauses", BSAT_STAT_SUM)           /* learnt clauses deleted          */                  \
    STAT(reductions, "reductions", BSAT_STAT_SUM)             /* number of db reductions         */                  \
    STAT(blockedRestarts, "restarts_blocked", BSAT_STAT_SUM)  /* number of blocked restarts      */                  \
    STAT(dynRestarts, "restarts_dynamic", BSAT_STAT_SUM)      /* restarts from dynamic limit     */

    constexpr SolverStats() = default;

    //! Updates stats for a conflict analyzed at level dl with backjump level jl and the given learnt clause.
    void addLearnt(uint32_t dl, uint32_t jl, uint32_t size, uint32_t lbd) {
        ++backjumps;
        ++learnts;
        jumpSum    += dl - jl;
        litsLearnt += size;
        units      += size == 1;
        glue       += lbd <= 2;
    }
    void addLevel(uint32_t dl) { maxLevel = std::max(maxLevel, static_cast<uint64_t>(dl)); }

    [[nodiscard]] double avgJump() const { return ratio(jumpSum, backjumps); }
    [[nodiscard]] double avgLearntSize() const { return ratio(litsLearnt, learnts); }
    [[nodiscard]] double avgRestart() const { return ratio(conflicts, restarts); }

    //! Adds the stats of o to this object.
    void accu(const SolverStats& o);
    //! Returns the number of statistic values.
    static uint32_t size();
    //! Returns the key of the i-th statistic value.
    static const char* key(uint32_t i);
    //! Returns the i-th statistic value.
    [[nodiscard]] uint64_t value(uint32_t i) const;
    //! Returns the statistic value with the given key.
    [[nodiscard]] uint64_t at(const char* key) const;

    BSAT_SOLVER_STATS(BSAT_STAT_DEFINE)
};
///////////////////////////////////////////////////////////////////////////////
// Clause references and watches
///////////////////////////////////////////////////////////////////////////////
//! Stable handle of a clause in a ClauseDB.
using ClauseRef = uint32_t;
//! Handle used for "no clause", e.g. for decisions and top-level facts.
constexpr ClauseRef clause_none = UINT32_MAX;

//! Watch of a clause on one of its two watched literals.
/*!
 * The blocker is some other literal of the clause. If the blocker is true,
 * the clause is satisfied and propagation can skip it without visiting the clause.
 */
struct ClauseWatch {
    ClauseRef ref;
    Literal   blocker;
};
using WatchList = PodVector_t<ClauseWatch>;

///////////////////////////////////////////////////////////////////////////////
// Assignment
///////////////////////////////////////////////////////////////////////////////
//! Stores assignment related information.
/*!
 * For each variable v, the class stores
 *  - v's current value (value_free if unassigned)
 *  - the decision level on which v was assigned (only valid if value(v) != value_free)
 *  - the reason why v is in the assignment (clause_none for decisions and top-level facts)
 *  - the value of v's last assignment (used for phase saving)
 *
 * Furthermore, the class stores the sequence of assignments as a set of true literals
 * in its trail-member together with the trail positions on which decision levels start.
 * The front of the trail that was not yet propagated forms the propagation queue.
 */
class Assignment {
public:
    Assignment() = default;
    Assignment(const Assignment&)            = delete;
    Assignment& operator=(const Assignment&) = delete;

    //! Resets this object to numVars unassigned variables.
    void reset(uint32_t numVars);

    [[nodiscard]] uint32_t numVars() const { return size32(value_) - 1; }
    [[nodiscard]] uint32_t assigned() const { return size32(trail_); }
    [[nodiscard]] uint32_t numFree() const { return numVars() - assigned(); }
    [[nodiscard]] bool     validVar(Var_t v) const { return v != sent_var && v < size32(value_); }

    [[nodiscard]] Val_t     value(Var_t v) const { return value_[v]; }
    [[nodiscard]] uint32_t  level(Var_t v) const { return level_[v]; }
    [[nodiscard]] ClauseRef reason(Var_t v) const { return reason_[v]; }
    [[nodiscard]] Val_t     saved(Var_t v) const { return saved_[v]; }

    //! Assigns p at the given decision level with the given reason.
    /*!
     * \pre value(p.var()) != falseValue(p)
     * \note Assigning an already true literal is a noop. Assigning a false literal
     *       is an internal error and throws std::logic_error.
     */
    bool assign(Literal p, uint32_t lev, ClauseRef r) {
        const Val_t val = value_[p.var()];
        if (val == trueValue(p)) {
            return true;
        }
        POTASSCO_ASSERT(val == value_free, "can't assign %d: variable already assigned the opposite value", toInt(p));
        value_[p.var()]  = trueValue(p);
        level_[p.var()]  = lev;
        reason_[p.var()] = r;
        trail_.push_back(p);
        return true;
    }
    //! Removes the last assignment from the trail and saves its phase.
    void undoLast() {
        Var_t v   = trail_.back().var();
        saved_[v] = value_[v];
        value_[v] = value_free;
        reason_[v] = clause_none;
        trail_.pop_back();
    }
    //! Changes the saved phase of v.
    void setSaved(Var_t v, Val_t val) { saved_[v] = val; }
    //! Returns the last assigned literal.
    [[nodiscard]] Literal last() const { return trail_.back(); }
    [[nodiscard]] LitView trail() const { return trail_; }

    // decision levels
    [[nodiscard]] uint32_t decisionLevel() const { return size32(levels_); }
    //! Returns the trail position of the first literal of decision level l > 0.
    [[nodiscard]] uint32_t levelStart(uint32_t l) const {
        assert(l > 0 && l <= decisionLevel());
        return levels_[l - 1];
    }
    void pushLevel() { levels_.push_back(assigned()); }
    //! Removes all literals above level l from the trail and the propagation queue.
    /*!
     * \return the number of removed literals.
     */
    uint32_t popLevels(uint32_t l) {
        assert(l < decisionLevel());
        uint32_t start = levelStart(l + 1), n = assigned() - start;
        while (assigned() != start) { undoLast(); }
        shrinkVecTo(levels_, l);
        front_ = std::min(front_, assigned());
        return n;
    }

    // propagation queue
    [[nodiscard]] bool qEmpty() const { return front_ == assigned(); }
    [[nodiscard]] uint32_t qSize() const { return assigned() - front_; }
    Literal                qPop() { return trail_[front_++]; }
    void                   qReset() { front_ = assigned(); }

private:
    using ReasonVec = PodVector_t<ClauseRef>;
    using LevelVec  = PodVector_t<uint32_t>;
    ValueVec  value_;   // current value of each var
    ValueVec  saved_;   // saved value of each var
    LevelVec  level_;   // decision level of each assigned var
    ReasonVec reason_;  // reason of each assigned var
    LevelVec  levels_;  // trail position where each decision level starts
    LitVec    trail_;   // assignment sequence
    uint32_t  front_{}; // "propagation queue"
};
//@}
} // namespace Bsat
