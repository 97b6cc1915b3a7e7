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

#include <bsat/clause.h>
#include <bsat/heuristics.h>

namespace Bsat {

/**
 * \file
 * \defgroup solver Solver
 * \brief %Solver and related classes.
 */
//@{

//! bsat's Solver class.
/*!
 * A Solver-object maintains the state and provides the functions
 * necessary to implement a CDCL-algorithm for one CNF formula.
 *
 * A solver is set up in three steps: startInit() declares the variables,
 * addClause() adds the problem clauses, and endInit() propagates the
 * top-level facts. Afterwards, search() looks for a model until either a model
 * is found, the formula is proven unsatisfiable, or one of the given search limits
 * is reached.
 *
 * The decision level 0 is the top-level. Conflicts on the top-level are
 * non-resolvable and end a search.
 */
class Solver {
public:
    using DBInfo = ClauseDB::DBInfo;

    explicit Solver(const SolverParams& params = SolverParams());
    ~Solver();
    Solver(const Solver&)            = delete;
    Solver& operator=(const Solver&) = delete;

    //! Returns the solver's parameters.
    [[nodiscard]] const SolverParams& params() const { return params_; }

    /*!
     * \name Setup functions
     * Functions for setting up a solver.
     */
    //@{
    //! Prepares the solver for a problem over the variables [1, numVars].
    void startInit(uint32_t numVars);
    //! Adds the problem clause lits to the solver.
    /*!
     * The clause is simplified w.r.t the current top-level assignment:
     * duplicate and false literals are removed, and satisfied as well as
     * tautological clauses are dropped. An empty clause sets a top-level conflict,
     * a unit clause is assigned on the top-level.
     *
     * \pre decisionLevel() == 0 and all variables in lits are valid.
     * \return false if the solver is in a top-level conflict.
     */
    bool addClause(LitView lits);
    //! Finishes setup and propagates the top-level facts.
    /*!
     * Issues a warning if addClause() had to drop duplicate literals or
     * tautological clauses.
     * \return false if the problem is unsatisfiable on the top-level.
     */
    bool endInit();
    //@}

    /*!
     * \name CDCL functions
     * Low-level implementation of the CDCL algorithm.
     */
    //@{
    //! Searches for a model as long as the given limit is not reached.
    /*!
     * The search function implements the CDCL algorithm.
     * It searches for a model as long as none of the limits given by limit
     * is reached. The limits are updated during search.
     *
     * \param limit Imposed limits on conflicts and decisions.
     * \param randf Pick next decision variable randomly with a probability of randf.
     * \return
     *  - value_true: if the search stopped because a model was found.
     *  - value_false: if the search stopped because the top-level is conflicting.
     *  - value_free: if the search stopped because of a limit.
     *  .
     *
     * \note If limit.expired is set on return, a hard limit, i.e. a limit on decisions,
     *       conflicts or time, was reached. Otherwise, value_free signals a restart.
     */
    Val_t search(SearchLimits& limit, double randf = 0.0);

    //! Assigns p as new decision on a new decision level.
    /*!
     * \pre value(p.var()) == value_free
     * \return true
     */
    bool assume(Literal p);
    //! Selects and assumes the next branching literal by calling the active decision heuristic.
    /*!
     * \param randf Probability for selecting a random free variable instead.
     * \return false if the assignment is total, i.e. there are no free variables left.
     */
    bool decideNextBranch(double randf = 0.0);
    //! Assigns p on the current decision level with reason r.
    /*!
     * \return false if p is false in the current assignment. In that case, the conflict is
     *         stored and hasConflict() returns true.
     */
    bool force(Literal p, ClauseRef r = clause_none);
    //! Propagates all enqueued assignments until a fixpoint or a conflict is reached.
    /*!
     * \return false if a conflict was detected.
     * \post not hasConflict() || assignment is conflicting.
     */
    bool propagate();
    //! Resolves the active conflict using the selected strategy.
    /*!
     * Analyzes the conflict, learns the first-UIP clause, backjumps to the
     * clause's asserting level and assigns its UIP literal.
     * \pre hasConflict()
     * \return false if the conflict is on the top-level, i.e. the problem is unsatisfiable.
     */
    bool resolveConflict();
    //! Undoes all assignments on decision levels > dl.
    /*!
     * Unassigned variables save their phase and are returned to the decision heuristic.
     * \return The decision level after undoing.
     */
    uint32_t undoUntil(uint32_t dl);
    //! Returns to the top-level and increases the number of restarts.
    void restart();
    //! Removes up to remFrac of the learnt clauses but keeps those that are locked or glue clauses.
    /*!
     * Watches of removed clauses are removed immediately.
     */
    DBInfo reduceLearnts(double remFrac, const ReduceStrategy& rs = ReduceStrategy());
    //! Returns whether the restart limits in limits are reached.
    [[nodiscard]] bool restartReached(const SearchLimits& limits) const;
    //@}

    /*!
     * \name State inspection
     * Functions for inspecting the state of the solver.
     * \note Validity of variables is only checked in debug-builds.
     */
    //@{
    //! Returns the number of problem variables.
    [[nodiscard]] uint32_t numVars() const { return assign_.numVars(); }
    //! Returns the number of assigned variables.
    [[nodiscard]] uint32_t numAssignedVars() const { return assign_.assigned(); }
    //! Returns the number of free variables.
    [[nodiscard]] uint32_t numFreeVars() const { return assign_.numFree(); }
    //! Returns true if var represents a valid variable in this solver.
    [[nodiscard]] bool validVar(Var_t var) const { return assign_.validVar(var); }
    //! Returns the value of v w.r.t the current assignment.
    [[nodiscard]] Val_t value(Var_t v) const {
        assert(validVar(v));
        return assign_.value(v);
    }
    //! Returns the previous value of v.
    [[nodiscard]] Val_t savedValue(Var_t v) const { return assign_.saved(v); }
    //! Returns true if p is true w.r.t the current assignment.
    [[nodiscard]] bool isTrue(Literal p) const { return assign_.value(p.var()) == trueValue(p); }
    //! Returns true if p is false w.r.t the current assignment.
    [[nodiscard]] bool isFalse(Literal p) const { return assign_.value(p.var()) == falseValue(p); }
    //! Returns the decision level on which v was assigned.
    [[nodiscard]] uint32_t level(Var_t v) const { return assign_.level(v); }
    //! Returns the reason for v being assigned or clause_none if v is a decision or top-level fact.
    [[nodiscard]] ClauseRef reason(Var_t v) const { return assign_.reason(v); }
    //! Returns the current decision level.
    [[nodiscard]] uint32_t decisionLevel() const { return assign_.decisionLevel(); }
    //! Returns the decision literal of the decision level dl.
    [[nodiscard]] Literal decision(uint32_t dl) const {
        POTASSCO_CHECK_PRE(dl && dl <= decisionLevel(), "invalid decision level");
        return assign_.trail()[assign_.levelStart(dl)];
    }
    //! Returns the position on the trail of the first literal assigned on level dl.
    [[nodiscard]] uint32_t levelStart(uint32_t dl) const { return assign_.levelStart(dl); }
    //! Returns the current trail.
    [[nodiscard]] LitView trail() const { return assign_.trail(); }
    //! Returns true if the current assignment is conflicting.
    [[nodiscard]] bool hasConflict() const { return not conflict_.empty(); }
    //! Returns the literals of the current conflict, which are all false.
    [[nodiscard]] LitView conflict() const { return conflict_; }
    //! Returns the last learnt clause.
    /*!
     * The first literal is the asserting literal. If the clause has more than one literal,
     * the second literal is from the asserting level.
     */
    [[nodiscard]] LitView conflictClause() const { return cc_; }
    //! Returns true if v is part of the conflict clause currently under construction.
    [[nodiscard]] bool seen(Var_t v) const { return (seen_[v] & seen_cc) != 0; }
    //! Returns the watches of clauses watching p.
    [[nodiscard]] const WatchList& watches(Literal p) const { return watches_[p.id()]; }
    //! Returns the clause database of this solver.
    [[nodiscard]] const ClauseDB& clauses() const { return db_; }
    //! Returns the number of problem clauses of size >= 2.
    [[nodiscard]] uint32_t numProblemClauses() const { return db_.numProblem(); }
    //! Returns the number of learnt clauses of size >= 2.
    [[nodiscard]] uint32_t numLearnts() const { return db_.numLearnts(); }
    //! Returns the active decision heuristic.
    [[nodiscard]] DecisionHeuristic* heuristic() const { return heuristic_.get(); }
    //! Returns the last model found by search().
    [[nodiscard]] const ValueVec& model() const { return model_; }
    //@}

    //! Sets the handler to which events of this solver are dispatched.
    void setEventHandler(EventHandler* handler) { handler_ = handler; }
    //! Dispatches ev to the solver's event handler.
    void report(const Event& ev) const {
        if (handler_) {
            handler_->dispatch(ev);
        }
    }
    //! Reports a warning message.
    void warn(const char* what) const;

    SolverStats stats; //!< Stats of this solver.
    Rng         rng;   //!< Random number generator for this object.

private:
    enum SeenFlag : uint8_t { seen_cc = 1u, seen_removable = 2u, seen_poison = 4u };
    using Watches  = PodVector_t<WatchList>;
    using FlagVec  = PodVector_t<uint8_t>;
    using LevelVec = PodVector_t<uint32_t>;

    void     setStopConflict();
    void     watch(ClauseRef r);
    void     markSeen(Var_t v) { seen_[v] |= seen_cc; }
    void     clearSeen(Var_t v) { seen_[v] = 0; }
    void     markLevel(uint32_t dl) { ++levelMarks_[dl]; }
    bool     hasLevel(uint32_t dl) const { return levelMarks_[dl] != 0; }
    uint32_t analyzeConflict();
    uint32_t simplifyConflictClause(LitVec& cc);
    void     ccMinimize(LitVec& cc, LitVec& removed);
    bool     ccRemovable(Literal p);
    bool     ccPushReason(ClauseRef ante);
    uint32_t lbd(LitView cc);
    bool     deadlineReached(SearchLimits& limit) const;
    void     storeModel();

    SolverParams                       params_;         // strategies used by this object
    Assignment                         assign_;         // three-valued assignment and trail
    ClauseDB                           db_;             // problem and learnt clauses
    Watches                            watches_;        // watches of clauses indexed by literal id
    std::unique_ptr<DecisionHeuristic> heuristic_;      // active decision heuristic
    LitVec                             conflict_;       // literals of current conflict
    LitVec                             cc_;             // last learnt clause
    LitVec                             temp_;           // temporary: removed literals
    LitVec                             todo_;           // temporary: dfs stack for recursive minimization
    VarVec                             marked_;         // vars with removable or poison flags
    FlagVec                            seen_;           // per var flags for conflict analysis
    LevelVec                           levelMarks_;     // per level counter for conflict analysis
    LevelVec                           levelStamp_;     // per level stamp for lbd computation
    ValueVec                           model_;          // last model
    DynamicLimit*                      dynLimit_{};     // active dynamic restart limit (if any)
    EventHandler*                      handler_{};      // (optional) event handler
    ClauseRef                          conflictRef_{clause_none}; // clause of current conflict
    uint32_t                           ccLbd_{0};       // lbd of last learnt clause
    uint32_t                           stamp_{0};       // current lbd stamp
    uint32_t                           numDups_{0};     // clauses with duplicate literals seen by addClause()
    uint32_t                           numTauts_{0};    // tautologies seen by addClause()
};

//@}
} // namespace Bsat
