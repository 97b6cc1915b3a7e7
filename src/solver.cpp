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
#include <bsat/solver.h>

#include <bsat/util/timer.h>

#include <potassco/error.h>

#include <algorithm>
#include <cstdio>

namespace Bsat {
/////////////////////////////////////////////////////////////////////////////////////////
// Solver: Construction/Setup
/////////////////////////////////////////////////////////////////////////////////////////
Solver::Solver(const SolverParams& params)
    : rng(params.seed)
    , params_(params)
    , db_(params.clauseDecay)
    , heuristic_(createHeuristic(params.heuId, params)) {
    POTASSCO_CHECK_PRE(params.signDef <= SolverParams::sign_saved, "invalid sign heuristic");
    POTASSCO_CHECK_PRE(params.ccMin <= SolverParams::cc_recursive, "invalid minimization strategy");
}
Solver::~Solver() = default;

void Solver::startInit(uint32_t numVars) {
    assign_.reset(numVars);
    watches_.assign(static_cast<std::size_t>(numVars + 1) * 2, WatchList());
    seen_.assign(numVars + 1, 0u);
    levelMarks_.assign(numVars + 2, 0u);
    levelStamp_.assign(numVars + 2, 0u);
    conflict_.clear();
    model_.clear();
    numDups_  = 0;
    numTauts_ = 0;
    heuristic_->startInit(*this);
}

void Solver::setStopConflict() {
    if (not hasConflict()) {
        conflict_.push_back(Literal());
        conflictRef_ = clause_none;
    }
}

void Solver::watch(ClauseRef r) {
    const Clause& c = db_[r];
    watches_[c[0].id()].push_back(ClauseWatch{r, c[1]});
    watches_[c[1].id()].push_back(ClauseWatch{r, c[0]});
}

bool Solver::addClause(LitView lits) {
    POTASSCO_CHECK_PRE(decisionLevel() == 0, "clauses must be added on the top-level");
    if (hasConflict()) {
        return false;
    }
    temp_.assign(lits.begin(), lits.end());
    std::ranges::sort(temp_);
    auto j   = temp_.begin();
    bool dup = false;
    for (auto it = temp_.begin(), end = temp_.end(); it != end; ++it) {
        Literal p = *it;
        POTASSCO_CHECK_PRE(validVar(p.var()), "invalid variable %u in clause", p.var());
        if (it + 1 != end && *(it + 1) == ~p) {
            ++numTauts_;
            return true;
        }
        if (isTrue(p)) {
            return true;
        }
        if (it != temp_.begin() && *(it - 1) == p) {
            dup = true;
        }
        else if (not isFalse(p)) {
            *j++ = p;
        }
    }
    numDups_ += static_cast<uint32_t>(dup);
    temp_.erase(j, temp_.end());
    if (temp_.empty()) {
        setStopConflict();
        return false;
    }
    if (temp_.size() == 1) {
        return force(temp_[0]);
    }
    watch(db_.addProblem(temp_));
    return true;
}

bool Solver::endInit() {
    if (numDups_ || numTauts_) {
        char msg[128];
        std::snprintf(msg, sizeof(msg), "input simplified: %u clause(s) with duplicate literals, %u tautologies dropped",
                      numDups_, numTauts_);
        warn(msg);
    }
    heuristic_->endInit(*this);
    return not hasConflict() && propagate();
}

void Solver::warn(const char* what) const {
    report(LogEvent(Event::subsystem_solve, Event::verbosity_low, LogEvent::warning, this, what));
}
/////////////////////////////////////////////////////////////////////////////////////////
// Solver: Watch management and propagation
/////////////////////////////////////////////////////////////////////////////////////////
bool Solver::assume(Literal p) {
    POTASSCO_CHECK_PRE(value(p.var()) == value_free, "decision literal must be free");
    assign_.pushLevel();
    ++stats.decisions;
    stats.addLevel(decisionLevel());
    return assign_.assign(p, decisionLevel(), clause_none);
}

bool Solver::force(Literal p, ClauseRef r) {
    if (isTrue(p)) {
        return true;
    }
    if (isFalse(p)) {
        if (r != clause_none) {
            const Clause& c = db_[r];
            conflict_.assign(c.lits().begin(), c.lits().end());
            conflictRef_ = r;
        }
        else {
            // top-level fact contradicts current assignment
            conflict_.assign(1, p);
            conflictRef_ = clause_none;
        }
        return false;
    }
    ++stats.propagations;
    return assign_.assign(p, decisionLevel(), r);
}

// Visits the clauses watching the now false literal ~p.
// The watched literals of a clause are at positions 0 and 1. The false
// watch is moved to position 1 so that, if the clause becomes unit,
// the implied literal is at position 0.
bool Solver::propagate() {
    while (not assign_.qEmpty() && not hasConflict()) {
        Literal    p  = assign_.qPop();
        Literal    f  = ~p;
        WatchList& wl = watches_[f.id()];
        auto       j  = wl.begin();
        for (auto it = wl.begin(), end = wl.end(); it != end;) {
            ClauseWatch w = *it++;
            if (isTrue(w.blocker)) {
                *j++ = w;
                continue;
            }
            Clause& c = db_[w.ref];
            if (c[0] == f) {
                std::swap(c[0], c[1]);
            }
            assert(c[1] == f);
            Literal     other = c[0];
            ClauseWatch keep{w.ref, other};
            if (other != w.blocker && isTrue(other)) {
                *j++ = keep;
                continue;
            }
            // look for a new watch
            bool moved = false;
            for (uint32_t k = 2, size = c.size(); k != size; ++k) {
                if (not isFalse(c[k])) {
                    std::swap(c[1], c[k]);
                    watches_[c[1].id()].push_back(keep);
                    moved = true;
                    break;
                }
            }
            if (moved) {
                continue;
            }
            *j++ = keep;
            if (not force(other, w.ref)) {
                // keep remaining watches
                j = std::copy(it, end, j);
                break;
            }
        }
        wl.erase(j, wl.end());
    }
    if (hasConflict()) {
        assign_.qReset();
        return false;
    }
    return true;
}
/////////////////////////////////////////////////////////////////////////////////////////
// Solver: Conflict analysis and backtracking
/////////////////////////////////////////////////////////////////////////////////////////
uint32_t Solver::undoUntil(uint32_t dl) {
    if (dl >= decisionLevel()) {
        return decisionLevel();
    }
    conflict_.clear();
    conflictRef_ = clause_none;
    heuristic_->undo(*this, trail().subspan(assign_.levelStart(dl + 1)));
    assign_.popLevels(dl);
    return dl;
}

void Solver::restart() {
    undoUntil(0);
    ++stats.restarts;
}

bool Solver::resolveConflict() {
    assert(hasConflict());
    ++stats.conflicts;
    if (decisionLevel() == 0) {
        return false;
    }
    uint32_t dl = decisionLevel();
    uint32_t jl = analyzeConflict();
    stats.addLearnt(dl, jl, size32(cc_), ccLbd_);
    if (dynLimit_) {
        dynLimit_->update(dl, ccLbd_);
    }
    heuristic_->newConflict(*this);
    db_.decayActivity();
    undoUntil(jl);
    if (cc_.size() == 1) {
        return force(cc_[0]);
    }
    ClauseRef r = db_.addLearnt(cc_, ccLbd_);
    watch(r);
    return force(cc_[0], r);
}

// Derives the first-UIP clause into cc_ and returns the level to backjump to.
// On return, cc_[0] is the negated UIP and, if cc_ has more than one literal,
// cc_[1] is assigned on the backjump level.
uint32_t Solver::analyzeConflict() {
    // The loop below pops literals of the conflict level off the trail.
    heuristic_->undo(*this, trail().subspan(assign_.levelStart(decisionLevel())));
    const uint32_t dl      = decisionLevel();
    uint32_t       onLevel = 0; // number of literals from the current DL in resolvent
    Literal        p;           // literal to be resolved out next
    ClauseRef      ante = conflictRef_;
    LitView        lits = conflict_;
    cc_.assign(1, p); // will later be replaced with asserting literal
    for (;;) {
        if (ante != clause_none && db_[ante].learnt()) {
            db_.bumpActivity(ante);
        }
        heuristic_->updateReason(*this, lits, p);
        for (auto q : lits) {
            uint32_t cl = level(q.var());
            assert(isFalse(q));
            if (not seen(q.var()) && cl != 0) {
                markSeen(q.var());
                if (cl == dl) {
                    ++onLevel;
                }
                else {
                    cc_.push_back(q);
                    markLevel(cl);
                }
            }
        }
        assert(onLevel > 0);
        while (not seen(assign_.last().var())) { assign_.undoLast(); }
        p    = assign_.last();
        ante = reason(p.var());
        clearSeen(p.var());
        if (--onLevel == 0) {
            break;
        }
        POTASSCO_ASSERT(ante != clause_none, "decision %d must be the last literal of its level", toInt(p));
        lits = db_[ante].lits().subspan(1);
    }
    cc_[0] = ~p;
    assert(level(p.var()) == dl);
    return simplifyConflictClause(cc_);
}

// Minimizes cc, clears all marks set by analyzeConflict() and sets ccLbd_.
// Expects the variables and levels of cc[1..] to be marked.
uint32_t Solver::simplifyConflictClause(LitVec& cc) {
    temp_.clear();
    ccMinimize(cc, temp_);
    stats.litsMinimized += temp_.size();
    for (auto v : marked_) { seen_[v] &= seen_cc; }
    marked_.clear();
    for (auto x : temp_) {
        clearSeen(x.var());
        levelMarks_[level(x.var())] = 0;
    }
    for (auto x : std::ranges::subrange(cc.begin() + 1, cc.end())) {
        clearSeen(x.var());
        levelMarks_[level(x.var())] = 0;
    }
    temp_.clear();
    ccLbd_ = lbd(cc);
    return cc.size() > 1 ? level(cc[1].var()) : 0;
}

// Moves redundant literals of cc[1..] to removed and swaps a literal of the
// highest remaining level into cc[1].
void Solver::ccMinimize(LitVec& cc, LitVec& removed) {
    uint32_t maxLevel = 0, maxPos = 1, keep = 1;
    for (std::size_t i = 1, end = cc.size(); i != end; ++i) {
        Literal lit = cc[i];
        if (params_.ccMin != SolverParams::cc_none && ccRemovable(~lit)) {
            removed.push_back(lit);
            continue;
        }
        if (level(lit.var()) > maxLevel) {
            maxLevel = level(lit.var());
            maxPos   = keep;
        }
        cc[keep++] = lit;
    }
    shrinkVecTo(cc, keep);
    if (maxPos != 1) {
        std::swap(cc[1], cc[maxPos]);
    }
}

// Is p implied by the other literals of the conflict clause?
bool Solver::ccRemovable(Literal p) {
    ClauseRef ante = reason(p.var());
    if (ante == clause_none) {
        return false;
    }
    if (params_.ccMin == SolverParams::cc_local) {
        for (auto q : db_[ante].lits().subspan(1)) {
            if (not seen(q.var()) && level(q.var()) != 0) {
                return false;
            }
        }
        return true;
    }
    // Depth-first search over reasons. Flagged literals on todo_ are finished.
    assert(todo_.empty());
    uint8_t dfsState = seen_removable;
    todo_.push_back(p.unflag());
    for (Literal x;;) {
        x = todo_.back();
        todo_.pop_back();
        if (x.flagged()) {
            if (x == p) {
                return dfsState == seen_removable;
            }
            seen_[x.var()] |= dfsState;
            marked_.push_back(x.var());
        }
        else if (dfsState != seen_poison) {
            if ((seen_[x.var()] & seen_poison) != 0) {
                dfsState = seen_poison;
            }
            else if ((seen_[x.var()] & seen_removable) == 0) {
                assert(value(x.var()) != value_free && hasLevel(level(x.var())));
                todo_.push_back(x.flag());
                ClauseRef next = reason(x.var());
                if (next == clause_none || not ccPushReason(next)) {
                    dfsState = seen_poison;
                }
            }
        }
    }
}

// Schedules the unvisited literals of ante. Fails on a literal that cannot be redundant.
bool Solver::ccPushReason(ClauseRef ante) {
    for (auto q : db_[ante].lits().subspan(1)) {
        Var_t v = q.var();
        if (seen(v) || level(v) == 0 || (seen_[v] & seen_removable) != 0) {
            continue;
        }
        if ((seen_[v] & seen_poison) != 0 || not hasLevel(level(v))) {
            return false;
        }
        todo_.push_back(~q);
    }
    return true;
}

// Number of distinct decision levels in cc.
uint32_t Solver::lbd(LitView cc) {
    if (++stamp_ == 0) {
        std::ranges::fill(levelStamp_, 0u);
        stamp_ = 1;
    }
    uint32_t n = 0;
    for (auto x : cc) {
        if (uint32_t& st = levelStamp_[level(x.var())]; st != stamp_) {
            st = stamp_;
            ++n;
        }
    }
    return n;
}
/////////////////////////////////////////////////////////////////////////////////////////
// Solver: Search
/////////////////////////////////////////////////////////////////////////////////////////
bool Solver::decideNextBranch(double f) {
    Literal choice;
    if (f <= 0.0 || rng.drand() >= f || numFreeVars() == 0) {
        choice = heuristic_->select(*this);
    }
    else {
        // Random pick: scan forward from a random start, wrapping around to 1.
        Var_t v = rng.irand(numVars()) + 1;
        while (value(v) != value_free) { v = v == numVars() ? 1 : v + 1; }
        choice = DecisionHeuristic::selectLiteral(*this, v);
    }
    return not isSentinel(choice) && assume(choice);
}

Solver::DBInfo Solver::reduceLearnts(double remFrac, const ReduceStrategy& rs) {
    DBInfo r = db_.reduce(remFrac, rs, assign_);
    if (r.removed) {
        for (auto& wl : watches_) {
            std::erase_if(wl, [this](const ClauseWatch& w) { return db_[w.ref].deleted(); });
        }
        db_.releaseDeleted();
    }
    stats.deleted += r.removed;
    ++stats.reductions;
    return r;
}

bool Solver::restartReached(const SearchLimits& limits) const {
    return limits.used >= limits.restart.conflicts || (limits.restart.dynamic && limits.restart.dynamic->reached());
}

bool Solver::deadlineReached(SearchLimits& limit) const {
    if (stats.decisions >= limit.decisions) {
        limit.expired = SolveLimit::decisions;
    }
    else if (limit.deadline != SolveLimits::no_time && RealTime::getTime() >= limit.deadline) {
        limit.expired = SolveLimit::time;
    }
    return limit.expired != SolveLimit::none;
}

void Solver::storeModel() {
    model_.assign(numVars() + 1, value_free);
    for (auto v : irange(1u, numVars() + 1)) { model_[v] = value(v); }
}

Val_t Solver::search(SearchLimits& limit, double rf) {
    BlockLimit* blocker = limit.restart.block;
    rf                  = std::clamp(rf, 0.0, 1.0);
    dynLimit_           = limit.restart.dynamic;
    POTASSCO_SCOPE_EXIT({ dynLimit_ = nullptr; });
    bool conflict = hasConflict() || not propagate();
    for (;;) {
        if (conflict) {
            uint64_t conflicts = 0;
            do {
                ++conflicts;
                // A trail much larger than average indicates progress towards a model.
                if (uint32_t trail = numAssignedVars(); blocker && blocker->push(trail) && trail > blocker->scaled()) {
                    if (auto* dyn = limit.restart.dynamic) {
                        dyn->block();
                    }
                    else if (limit.restart.conflicts != UINT64_MAX) {
                        limit.restart.conflicts += blocker->inc;
                    }
                    blocker->next = blocker->n + blocker->inc;
                    ++stats.blockedRestarts;
                }
            } while (resolveConflict() && not propagate());
            limit.used += conflicts;
            if (hasConflict()) {
                return value_false;
            }
            if (numFreeVars() != 0 && (limit.used >= limit.conflicts || restartReached(limit))) {
                return value_free;
            }
        }
        if (numFreeVars() == 0) {
            storeModel();
            return value_true;
        }
        if (deadlineReached(limit)) {
            return value_free;
        }
        conflict = decideNextBranch(rf) && not propagate();
    }
}

} // namespace Bsat
