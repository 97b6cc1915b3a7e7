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
#include <bsat/clause.h>

namespace Bsat {
/////////////////////////////////////////////////////////////////////////////////////////
// Clause
/////////////////////////////////////////////////////////////////////////////////////////
Clause::Clause(LitView lits, bool learnt, uint32_t lbd)
    : lits_(lits.begin(), lits.end())
    , lbd_(std::min(lbd, lbd_max))
    , learnt_(static_cast<uint32_t>(learnt))
    , deleted_(0) {}
/////////////////////////////////////////////////////////////////////////////////////////
// ClauseDB
/////////////////////////////////////////////////////////////////////////////////////////
namespace {
constexpr double act_limit = 1e20;
}
ClauseDB::ClauseDB(double clauseDecay) : decay_(1.0) {
    POTASSCO_CHECK_PRE(clauseDecay > 0.0 && clauseDecay <= 1.0, "clause decay must be in (0, 1]");
    decay_ = 1.0 / clauseDecay;
}

ClauseRef ClauseDB::alloc(LitView lits, bool learnt, uint32_t lbd) {
    POTASSCO_CHECK_PRE(lits.size() > 1, "clauses must have at least two literals");
    if (free_.empty()) {
        POTASSCO_CHECK(clauses_.size() < clause_none, std::errc::not_enough_memory, "too many clauses");
        clauses_.emplace_back(lits, learnt, lbd);
        return size32(clauses_) - 1;
    }
    ClauseRef r = free_.back();
    free_.pop_back();
    clauses_[r] = Clause(lits, learnt, lbd);
    return r;
}

ClauseRef ClauseDB::addProblem(LitView lits) {
    ++numProblem_;
    return alloc(lits, false, size32(lits));
}

ClauseRef ClauseDB::addLearnt(LitView lits, uint32_t lbd) {
    ClauseRef r      = alloc(lits, true, lbd);
    clauses_[r].act_ = inc_;
    learnts_.push_back(r);
    return r;
}

void ClauseDB::bumpActivity(ClauseRef r) {
    Clause& c = clauses_[r];
    assert(c.learnt());
    if ((c.act_ += inc_) > act_limit) {
        rescale();
    }
}

void ClauseDB::rescale() {
    for (auto r : learnts_) { clauses_[r].act_ *= 1.0 / act_limit; }
    inc_ *= 1.0 / act_limit;
}

void ClauseDB::remove(ClauseRef r, const Assignment& a) {
    Clause& c = clauses_[r];
    POTASSCO_CHECK_PRE(c.learnt() && not c.deleted(), "only existing learnt clauses can be removed");
    POTASSCO_ASSERT(not locked(r, a), "can't remove clause that is reason for %d", toInt(c[0]));
    c.deleted_ = 1;
    pending_.push_back(r);
    std::erase(learnts_, r);
}

ClauseDB::DBInfo ClauseDB::reduce(double remFrac, const ReduceStrategy& rs, const Assignment& a) {
    DBInfo info{};
    RefVec cands;
    cands.reserve(learnts_.size());
    for (auto r : learnts_) {
        if (locked(r, a)) {
            ++info.locked;
        }
        else if (clauses_[r].lbd() <= rs.glue) {
            ++info.pinned;
        }
        else {
            cands.push_back(r);
        }
    }
    // Order candidates from worst to best.
    auto worse = [&](ClauseRef x, ClauseRef y) {
        const Clause& lhs = clauses_[x];
        const Clause& rhs = clauses_[y];
        switch (rs.score) {
            case ReduceStrategy::score_act : return lhs.activity() < rhs.activity();
            case ReduceStrategy::score_lbd :
                return lhs.lbd() > rhs.lbd() || (lhs.lbd() == rhs.lbd() && lhs.activity() < rhs.activity());
            default: return (lhs.activity() / std::max(lhs.lbd(), 1u)) < (rhs.activity() / std::max(rhs.lbd(), 1u));
        }
    };
    auto maxR = static_cast<uint32_t>(static_cast<double>(numLearnts()) * std::clamp(remFrac, 0.0, 1.0));
    maxR      = std::min(maxR, size32(cands));
    std::ranges::stable_sort(cands, worse);
    for (auto r : cands | std::views::take(maxR)) {
        POTASSCO_ASSERT(not locked(r, a), "reduce must not delete a reason");
        clauses_[r].deleted_ = 1;
        pending_.push_back(r);
    }
    std::erase_if(learnts_, [this](ClauseRef r) { return clauses_[r].deleted(); });
    info.removed = maxR;
    info.size    = numLearnts();
    return info;
}

void ClauseDB::releaseDeleted() {
    for (auto r : pending_) {
        Clause& c = clauses_[r];
        assert(c.deleted());
        LitVec().swap(c.lits_);
        free_.push_back(r);
    }
    pending_.clear();
}

} // namespace Bsat
