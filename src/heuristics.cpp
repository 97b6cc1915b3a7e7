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
#include <bsat/heuristics.h>

#include <bsat/solver.h>

#include <potassco/error.h>

#include <limits>

namespace Bsat {
/////////////////////////////////////////////////////////////////////////////////////////
// DecisionHeuristic
/////////////////////////////////////////////////////////////////////////////////////////
DecisionHeuristic::~DecisionHeuristic() = default;

Literal DecisionHeuristic::select(Solver& s) { return s.numFreeVars() != 0 ? doSelect(s) : Literal(); }

Literal DecisionHeuristic::selectLiteral(const Solver& s, Var_t v) {
    const SolverParams& p = s.params();
    switch (p.signDef) {
        case SolverParams::sign_pos: return posLit(v);
        case SolverParams::sign_neg: return negLit(v);
        default:
            if (Val_t saved = s.savedValue(v); saved != value_free) {
                return {v, valSign(saved)};
            }
            return {v, p.signFix != SolverParams::sign_pos};
    }
}
/////////////////////////////////////////////////////////////////////////////////////////
// SelectFirst
/////////////////////////////////////////////////////////////////////////////////////////
Literal SelectFirst::doSelect(Solver& s) {
    Var_t v = 1;
    while (v <= s.numVars() && s.value(v) != value_free) { ++v; }
    POTASSCO_ASSERT(v <= s.numVars(), "no free variable left");
    return selectLiteral(s, v);
}
/////////////////////////////////////////////////////////////////////////////////////////
// Vsids
/////////////////////////////////////////////////////////////////////////////////////////
Vsids::Vsids(double bump, double decay) : vars_(Before(score_)), decay_(1.0), inc_(bump) {
    POTASSCO_CHECK_PRE(bump > 0.0, "activity bump must be > 0");
    POTASSCO_CHECK_PRE(decay > 0.0 && decay <= 1.0, "activity decay must be in (0, 1]");
    decay_ = 1.0 / decay;
}

void Vsids::startInit(const Solver& s) {
    uint32_t n = s.numVars() + 1;
    score_.assign(n, 0.0);
    vars_.clear();
    vars_.reserve(n);
}

void Vsids::endInit(const Solver& s) {
    for (auto v : irange(1u, s.numVars() + 1)) {
        if (s.value(v) == value_free && not vars_.contains(v)) {
            vars_.push(v);
        }
    }
}

void Vsids::bumpVar(Var_t v) {
    if ((score_[v] += inc_) > score_limit) {
        normalize();
    }
    if (vars_.contains(v)) {
        vars_.increase(v);
    }
}

// Scales all scores down by score_limit. Positive scores are first lifted so that
// they stay above the smallest normal double.
void Vsids::normalize() {
    constexpr double scale = 1.0 / score_limit;
    constexpr double floor = std::numeric_limits<double>::min() * score_limit;
    for (double& d : score_) {
        if (d > 0.0) {
            d = (d + floor) * scale;
        }
    }
    inc_ *= scale;
}

void Vsids::updateReason(const Solver& s, LitView lits, Literal) {
    for (auto lit : lits) {
        if (not s.seen(lit.var()) && s.level(lit.var()) != 0) {
            bumpVar(lit.var());
        }
    }
}

void Vsids::newConflict(const Solver&) { inc_ *= decay_; }

void Vsids::undo(const Solver&, LitView undo) {
    for (auto lit : undo) {
        if (not vars_.contains(lit.var())) {
            vars_.push(lit.var());
        }
    }
}

// Assigned variables stay in the heap until they reach the top.
Literal Vsids::doSelect(Solver& s) {
    Var_t v = vars_.top();
    for (; s.value(v) != value_free; v = vars_.top()) { vars_.pop(); }
    return selectLiteral(s, v);
}
/////////////////////////////////////////////////////////////////////////////////////////
// Factory
/////////////////////////////////////////////////////////////////////////////////////////
std::unique_ptr<DecisionHeuristic> createHeuristic(HeuristicType type, const SolverParams& params) {
    switch (type) {
        case HeuristicType::vsids: return std::make_unique<Vsids>(params.varBump, params.varDecay);
        case HeuristicType::none : return std::make_unique<SelectFirst>();
        default                  : POTASSCO_ASSERT_NOT_REACHED("unknown heuristic type");
    }
}

} // namespace Bsat
