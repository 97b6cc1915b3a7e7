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
#include <bsat/util/indexed_priority_queue.h>

#include <memory>

/*!
 * \file
 * \brief Branching heuristics.
 */
namespace Bsat {

/*!
 * \defgroup heuristic Decision heuristics
 * \brief Choosing the next decision literal.
 * \ingroup solver
 */
//@{

//! Interface of the branching heuristic of a Solver.
/*!
 * Apart from select(), all functions are hooks with empty default implementations.
 * The solver calls them while it loads the problem, analyzes conflicts and backtracks.
 */
class DecisionHeuristic {
public:
    DecisionHeuristic() = default;
    virtual ~DecisionHeuristic();
    DecisionHeuristic(DecisionHeuristic&&) = delete;

    //! Called once the solver knows all variables.
    virtual void startInit(const Solver& s) { static_cast<void>(s); }
    //! Called once the solver knows all problem clauses.
    virtual void endInit(const Solver& s) { static_cast<void>(s); }
    //! Called with the literals that are unassigned by a backtrack.
    virtual void undo(const Solver& s, LitView undo) {
        static_cast<void>(s);
        static_cast<void>(undo);
    }
    //! Called for each clause visited during conflict analysis.
    /*!
     * The first call passes the conflicting clause and the sentinel literal.
     * Later calls pass the reason of resolveLit.
     */
    virtual void updateReason(const Solver& s, LitView lits, Literal resolveLit) {
        static_cast<void>(s);
        static_cast<void>(lits);
        static_cast<void>(resolveLit);
    }
    //! Called after a conflict was analyzed.
    virtual void newConflict(const Solver& s) { static_cast<void>(s); }

    //! Returns a free literal to branch on or the sentinel literal if all variables are assigned.
    Literal select(Solver& s);

    /*!
     * \pre s.numFreeVars() > 0
     */
    virtual Literal doSelect(Solver& s) = 0;

    //! Returns the literal of v preferred by the sign options of s.
    static Literal selectLiteral(const Solver& s, Var_t v);
};

//! Branches on the free variable with the smallest id.
class SelectFirst : public DecisionHeuristic {
public:
    Literal doSelect(Solver& s) override;
};

//! Variable activity heuristic in the exponential scheme.
/*!
 * Each variable seen during conflict analysis gains inc(). Instead of decaying all
 * scores after a conflict, inc() grows by 1/decay. Scores and inc() are scaled down
 * once a score exceeds score_limit. Ties go to the smaller variable id.
 *
 * \see M. W. Moskewicz, C. F. Madigan, Y. Zhao, L. Zhang, and S. Malik:
 * "Chaff: Engineering an Efficient SAT Solver"
 */
class Vsids : public DecisionHeuristic {
public:
    //! \throws std::invalid_argument if bump <= 0 or decay is not in (0, 1].
    explicit Vsids(double bump = 1.0, double decay = 0.95);
    void startInit(const Solver& s) override;
    void endInit(const Solver& s) override;
    void updateReason(const Solver& s, LitView lits, Literal resolveLit) override;
    void newConflict(const Solver& s) override;
    void undo(const Solver& s, LitView undo) override;

    Literal doSelect(Solver& s) override;

    [[nodiscard]] double score(Var_t v) const { return score_[v]; }
    [[nodiscard]] double inc() const { return inc_; }
    //! Adds inc() to the score of v.
    void bumpVar(Var_t v);

    static constexpr double score_limit = 1e100;

private:
    using ScoreVec = PodVector_t<double>;
    void normalize();
    // Orders by descending score, then by ascending id.
    struct Before {
        explicit Before(const ScoreVec& s) : score(&s) {}
        bool operator()(Var_t a, Var_t b) const {
            const auto& sc = *score;
            return sc[a] != sc[b] ? sc[a] > sc[b] : a < b;
        }
        const ScoreVec* score;
    };
    ScoreVec                            score_;
    IndexedPriorityQueue<Var_t, Before> vars_;
    double                              decay_; // 1/decay
    double                              inc_;
};

std::unique_ptr<DecisionHeuristic> createHeuristic(HeuristicType type, const SolverParams& params);

//@}
} // namespace Bsat
