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

#include <bsat/solver_strategies.h>

/*!
 * \file
 * \brief Defines clauses and the database owning them.
 */
namespace Bsat {

/*!
 * \addtogroup constraint
 */
//@{

//! A clause of a ClauseDB.
/*!
 * The literals at positions 0 and 1 are the clause's watched literals.
 * If the clause is the reason for some assignment, the forced literal is stored at position 0.
 */
class Clause {
public:
    Clause(LitView lits, bool learnt, uint32_t lbd);

    [[nodiscard]] uint32_t size() const { return size32(lits_); }
    [[nodiscard]] LitView  lits() const { return lits_; }
    [[nodiscard]] bool     learnt() const { return learnt_ != 0; }
    [[nodiscard]] bool     deleted() const { return deleted_ != 0; }
    [[nodiscard]] uint32_t lbd() const { return lbd_; }
    [[nodiscard]] double   activity() const { return act_; }

    Literal&       operator[](uint32_t i) { return lits_[i]; }
    const Literal& operator[](uint32_t i) const { return lits_[i]; }
    Literal*       begin() { return lits_.data(); }
    Literal*       end() { return lits_.data() + lits_.size(); }

    void setLbd(uint32_t lbd) { lbd_ = std::min(lbd, lbd_max); }

    static constexpr uint32_t lbd_max = (1u << 30) - 1;

private:
    friend class ClauseDB;
    LitVec   lits_;
    double   act_{0.0};
    uint32_t lbd_     : 30;
    uint32_t learnt_  : 1;
    uint32_t deleted_ : 1;
};

//! Owns the problem and learnt clauses of one solver.
/*!
 * Clauses are addressed by stable references. Slots of deleted clauses are
 * reused only after releaseDeleted() was called, i.e. after all watches of
 * deleted clauses were removed.
 */
class ClauseDB {
public:
    //! Information about a learnt database after a reduction.
    struct DBInfo {
        uint32_t size;    //!< Number of learnt clauses kept.
        uint32_t locked;  //!< Number of kept clauses that are reasons for current assignments.
        uint32_t pinned;  //!< Number of kept glue clauses.
        uint32_t removed; //!< Number of deleted clauses.
    };
    using RefVec = PodVector_t<ClauseRef>;

    explicit ClauseDB(double clauseDecay = 0.999);
    ClauseDB(const ClauseDB&)            = delete;
    ClauseDB& operator=(const ClauseDB&) = delete;

    //! Adds a problem clause of at least two literals.
    ClauseRef addProblem(LitView lits);
    //! Adds a learnt clause of at least two literals with the given literal block distance.
    ClauseRef addLearnt(LitView lits, uint32_t lbd);

    Clause&       operator[](ClauseRef r) { return clauses_[r]; }
    const Clause& operator[](ClauseRef r) const { return clauses_[r]; }

    [[nodiscard]] uint32_t      numProblem() const { return numProblem_; }
    [[nodiscard]] uint32_t      numLearnts() const { return size32(learnts_); }
    [[nodiscard]] const RefVec& learnts() const { return learnts_; }
    [[nodiscard]] double        activityInc() const { return inc_; }

    //! Returns whether clause r is the reason of its first literal in the given assignment.
    [[nodiscard]] bool locked(ClauseRef r, const Assignment& a) const {
        const Clause& c = clauses_[r];
        return a.reason(c[0].var()) == r && a.value(c[0].var()) == trueValue(c[0]);
    }

    //! Bumps the activity of the learnt clause r.
    void bumpActivity(ClauseRef r);
    //! Decays the activity of all learnt clauses.
    void decayActivity() { inc_ *= decay_; }

    //! Deletes up to remFrac of the learnt clauses with the lowest score.
    /*!
     * Locked clauses and clauses with lbd <= rs.glue are never deleted.
     * Deleted clauses keep their slots until releaseDeleted() is called.
     */
    DBInfo reduce(double remFrac, const ReduceStrategy& rs, const Assignment& a);
    //! Deletes the learnt clause r.
    /*!
     * \pre not locked(r, a)
     * \note Deleting a locked clause is an internal error and throws std::logic_error.
     */
    void remove(ClauseRef r, const Assignment& a);
    //! Returns the slots of clauses deleted since the last call to releaseDeleted().
    [[nodiscard]] const RefVec& pending() const { return pending_; }
    //! Makes the slots of deleted clauses available for new clauses.
    void releaseDeleted();

private:
    using ClauseVec = PodVector_t<Clause>;
    ClauseRef alloc(LitView lits, bool learnt, uint32_t lbd);
    void      rescale();
    ClauseVec clauses_;       // clause slots
    RefVec    learnts_;       // live learnt clauses in creation order
    RefVec    pending_;       // deleted but not yet released
    RefVec    free_;          // free slots
    uint32_t  numProblem_{0}; // number of problem clauses
    double    inc_{1.0};      // activity increment
    double    decay_;         // 1/clauseDecay
};

//@}
} // namespace Bsat
