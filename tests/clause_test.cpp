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

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <stdexcept>

namespace Bsat::Test {
namespace {
LitVec makeLits(std::initializer_list<int32_t> lits) {
    LitVec out;
    for (auto x : lits) { out.push_back(toLit(x)); }
    return out;
}
} // namespace

TEST_CASE("Clause", "[clause]") {
    SECTION("test ctor") {
        auto   lits = makeLits({1, -2, 3});
        Clause c(lits, true, 2);
        REQUIRE(c.size() == 3u);
        REQUIRE(c.learnt());
        REQUIRE_FALSE(c.deleted());
        REQUIRE(c.lbd() == 2u);
        REQUIRE(c[1] == negLit(2));
        REQUIRE(std::ranges::equal(c.lits(), lits));
    }
    SECTION("test lbd is capped") {
        Clause c(makeLits({1, 2}), true, 2);
        c.setLbd(UINT32_MAX);
        REQUIRE(c.lbd() == Clause::lbd_max);
    }
}

TEST_CASE("ClauseDB", "[clause]") {
    ClauseDB   db;
    Assignment a;
    a.reset(10);

    SECTION("test add problem") {
        ClauseRef r = db.addProblem(makeLits({1, 2, 3}));
        REQUIRE(db.numProblem() == 1u);
        REQUIRE(db.numLearnts() == 0u);
        REQUIRE_FALSE(db[r].learnt());
        REQUIRE(db[r].lbd() == 3u);
    }
    SECTION("test clauses need two literals") {
        REQUIRE_THROWS_AS(db.addProblem(makeLits({1})), std::invalid_argument);
        REQUIRE_THROWS_AS(db.addLearnt(LitVec(), 0), std::invalid_argument);
    }
    SECTION("test add learnt") {
        ClauseRef r = db.addLearnt(makeLits({1, 2}), 2);
        REQUIRE(db.numLearnts() == 1u);
        REQUIRE(db[r].learnt());
        REQUIRE(db[r].activity() == db.activityInc());
        REQUIRE(db.learnts()[0] == r);
    }
    SECTION("test activity") {
        ClauseRef r1 = db.addLearnt(makeLits({1, 2}), 2);
        ClauseRef r2 = db.addLearnt(makeLits({3, 4}), 2);
        db.decayActivity();
        REQUIRE(db.activityInc() > 1.0);
        db.bumpActivity(r2);
        REQUIRE(db[r2].activity() > db[r1].activity());
        for (int i = 0; i != 100000 && db.activityInc() < 1e19; ++i) { db.decayActivity(); }
        for (int i = 0; i != 20; ++i) { db.bumpActivity(r2); }
        REQUIRE(db.activityInc() < 1.0);
        REQUIRE(db[r2].activity() <= 1e20);
        REQUIRE(db[r2].activity() > db[r1].activity());
    }
    SECTION("test locked") {
        ClauseRef r = db.addLearnt(makeLits({1, -2}), 2);
        REQUIRE_FALSE(db.locked(r, a));
        a.pushLevel();
        REQUIRE(a.assign(posLit(2), 1, clause_none));
        REQUIRE(a.assign(posLit(1), 1, r));
        REQUIRE(db.locked(r, a));
        REQUIRE_THROWS_AS(db.remove(r, a), std::logic_error);
        a.popLevels(0);
        REQUIRE_FALSE(db.locked(r, a));
        db.remove(r, a);
        REQUIRE(db[r].deleted());
        REQUIRE(db.numLearnts() == 0u);
        REQUIRE(db.pending().size() == 1u);
    }
    SECTION("test deleted slots are reused after release") {
        ClauseRef r1 = db.addLearnt(makeLits({1, 2}), 3);
        ClauseRef r2 = db.addLearnt(makeLits({3, 4}), 3);
        db.remove(r1, a);
        ClauseRef r3 = db.addLearnt(makeLits({5, 6}), 3);
        REQUIRE(r3 != r1);
        db.releaseDeleted();
        REQUIRE(db.pending().empty());
        ClauseRef r4 = db.addLearnt(makeLits({7, 8}), 3);
        REQUIRE(r4 == r1);
        REQUIRE_FALSE(db[r4].deleted());
        REQUIRE(db[r4][0] == posLit(7));
        REQUIRE(db[r2][0] == posLit(3));
    }
}

TEST_CASE("ClauseDB reduce", "[clause]") {
    ClauseDB   db;
    Assignment a;
    a.reset(20);
    // lbd: 5, 4, 3, 2 (glue)
    ClauseRef r5 = db.addLearnt(makeLits({1, 2, 3, 4, 5}), 5);
    ClauseRef r4 = db.addLearnt(makeLits({6, 7, 8, 9}), 4);
    ClauseRef r3 = db.addLearnt(makeLits({10, 11, 12}), 3);
    ClauseRef rg = db.addLearnt(makeLits({13, 14}), 2);
    ReduceStrategy rs;

    SECTION("test remove none") {
        auto info = db.reduce(0.0, rs, a);
        REQUIRE(info.removed == 0u);
        REQUIRE(info.size == 4u);
        REQUIRE(db.numLearnts() == 4u);
    }
    SECTION("test remove by lbd") {
        rs.score  = ReduceStrategy::score_lbd;
        auto info = db.reduce(0.5, rs, a);
        REQUIRE(info.removed == 2u);
        REQUIRE(info.pinned == 1u);
        REQUIRE(db[r5].deleted());
        REQUIRE(db[r4].deleted());
        REQUIRE_FALSE(db[r3].deleted());
        REQUIRE(db.numLearnts() == 2u);
        REQUIRE(db.pending().size() == 2u);
    }
    SECTION("test glue clauses are never removed") {
        auto info = db.reduce(1.0, rs, a);
        REQUIRE(info.removed == 3u);
        REQUIRE(info.pinned == 1u);
        REQUIRE_FALSE(db[rg].deleted());
        REQUIRE(db.learnts().size() == 1u);
    }
    SECTION("test remove by activity") {
        rs.score = ReduceStrategy::score_act;
        db.decayActivity();
        db.bumpActivity(r5);
        db.bumpActivity(r3);
        auto info = db.reduce(0.25, rs, a);
        REQUIRE(info.removed == 1u);
        REQUIRE(db[r4].deleted());
        REQUIRE_FALSE(db[r5].deleted());
    }
    SECTION("test locked clauses are kept") {
        a.pushLevel();
        for (auto x : db[r5].lits().subspan(1)) { REQUIRE(a.assign(~x, 1, clause_none)); }
        REQUIRE(a.assign(db[r5][0], 1, r5));
        auto info = db.reduce(1.0, rs, a);
        REQUIRE(info.locked == 1u);
        REQUIRE(info.removed == 2u);
        REQUIRE_FALSE(db[r5].deleted());
        REQUIRE(db[r4].deleted());
        REQUIRE(db[r3].deleted());
    }
}

} // namespace Bsat::Test
