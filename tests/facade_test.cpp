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
#include <bsat/bsat_facade.h>

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace Bsat::Test {
namespace {
Formula pigeonhole(int32_t holes) {
    int32_t pigeons = holes + 1;
    Formula f(static_cast<uint32_t>(pigeons * holes));
    auto    var = [holes](int32_t i, int32_t j) { return (i * holes) + j + 1; };
    std::vector<int32_t> clause;
    for (int32_t i = 0; i != pigeons; ++i) {
        clause.clear();
        for (int32_t j = 0; j != holes; ++j) { clause.push_back(var(i, j)); }
        f.addClause(clause);
    }
    for (int32_t j = 0; j != holes; ++j) {
        for (int32_t i = 0; i != pigeons; ++i) {
            for (int32_t k = i + 1; k != pigeons; ++k) { f.addClause({-var(i, j), -var(k, j)}); }
        }
    }
    return f;
}

Formula randomFormula(Rng& rng, uint32_t numVars, uint32_t numClauses, uint32_t len) {
    Formula              f(numVars);
    std::vector<int32_t> clause;
    for (uint32_t i = 0; i != numClauses; ++i) {
        clause.clear();
        for (uint32_t k = 0; k != len; ++k) {
            auto v = static_cast<int32_t>(rng.irand(numVars) + 1);
            clause.push_back(rng.irand(2) ? v : -v);
        }
        f.addClause(clause);
    }
    return f;
}

bool satisfiable(const Formula& f) {
    uint32_t n = f.numVars();
    for (uint32_t m = 0; m != (1u << n); ++m) {
        std::vector<Val_t> values(n + 1, value_false);
        for (uint32_t v = 1; v <= n; ++v) {
            if (m & (1u << (v - 1))) {
                values[v] = value_true;
            }
        }
        if (f.satisfiedBy(values)) {
            return true;
        }
    }
    return false;
}

bool satisfies(const SolveResult& res, const Formula& f) {
    std::vector<Val_t> values(f.numVars() + 1, value_free);
    for (Var_t v = 1; v <= f.numVars(); ++v) { values[v] = res.value(v) ? value_true : value_false; }
    return f.satisfiedBy(values);
}

struct EventRecorder : EventHandler {
    EventRecorder() : EventHandler(Event::verbosity_max) {}
    void onEvent(const Event& ev) override {
        if (const auto* log = event_cast<LogEvent>(ev)) {
            (log->isWarning() ? warnings : messages).emplace_back(log->msg);
        }
        else if (const auto* solve = event_cast<BasicSolveEvent>(ev)) {
            REQUIRE(solve->solver != nullptr);
            ops.push_back(static_cast<char>(solve->op));
        }
    }
    std::vector<std::string> messages;
    std::vector<std::string> warnings;
    std::string              ops;
};
} // namespace

TEST_CASE("Facade solve", "[facade]") {
    Formula f;
    SECTION("test forced variable") {
        f.addVars(2);
        f.addClause({1, 2}).addClause({-1, 2});
        auto res = solve(f);
        REQUIRE(res.sat());
        REQUIRE(res.value(2));
        REQUIRE(res.model.size() == 3u);
        REQUIRE(res.reason == SolveLimit::none);
        REQUIRE(res.message.empty());
    }
    SECTION("test pigeonhole is unsat") {
        f        = pigeonhole(4);
        auto res = solve(f);
        REQUIRE(res.unsat());
        REQUIRE(res.stats.conflicts > 0u);
        REQUIRE(res.stats.learnts > 0u);
        REQUIRE(res.model.empty());
        REQUIRE_THROWS_AS(res.value(1), std::invalid_argument);
    }
    SECTION("test empty clause is unsat") {
        f.addVars(3);
        f.addClause({1, 2}).addClause({}).addClause({-3});
        auto res = solve(f);
        REQUIRE(res.unsat());
        REQUIRE(res.stats.decisions == 0u);
    }
    SECTION("test unit clause") {
        f.addVar();
        f.addClause({1});
        auto res = solve(f);
        REQUIRE(res.sat());
        REQUIRE(res.value(1));
        REQUIRE(res.stats.propagations >= 1u);
        REQUIRE(res.stats.decisions == 0u);
    }
    SECTION("test exactly one of three") {
        f.addVars(3);
        f.addClause({1, 2, 3}).addClause({-1, -2}).addClause({-1, -3}).addClause({-2, -3});
        for (const char* sign : {"pos", "neg", "saved"}) {
            BsatConfig config;
            config.setValue("sign", sign);
            auto res = solve(f, config);
            REQUIRE(res.sat());
            REQUIRE(res.value(1) + res.value(2) + res.value(3) == 1);
        }
    }
    SECTION("test no clauses") {
        f.addVars(4);
        auto res = solve(f);
        REQUIRE(res.sat());
        REQUIRE(res.model.size() == 5u);
        REQUIRE(solve(Formula()).sat());
    }
    SECTION("test duplicate and complementary literals") {
        f.addVars(2);
        f.addClause({1, 1, -2}).addClause({2, -2}).addClause({-1, -1});
        EventRecorder recorder;
        auto          res = solve(f, BsatConfig(), &recorder);
        REQUIRE(res.sat());
        REQUIRE_FALSE(res.value(1));
        REQUIRE_FALSE(res.value(2));
        REQUIRE(recorder.warnings.size() == 1u);
        REQUIRE(recorder.warnings[0].find("1 tautologies") != std::string::npos);
    }
    SECTION("test long implication chain") {
        constexpr int32_t num = 2000;
        f.addVars(num);
        f.addClause({1});
        for (int32_t v = 1; v != num; ++v) { f.addClause({-v, v + 1}); }
        auto res = solve(f);
        REQUIRE(res.sat());
        REQUIRE(res.model.size() == static_cast<std::size_t>(num) + 1);
        for (int32_t v = 1; v <= num; ++v) { REQUIRE(res.value(static_cast<Var_t>(v))); }
        REQUIRE(res.stats.decisions == 0u);
    }
    SECTION("test large random formula") {
        Rng rng(13);
        f        = randomFormula(rng, 1000, 3000, 3);
        auto res = solve(f);
        REQUIRE(res.sat());
        REQUIRE(satisfies(res, f));
    }
}

TEST_CASE("Facade random formulas", "[facade]") {
    Rng rng(4711);
    for (int i = 0; i != 40; ++i) {
        Formula    f = randomFormula(rng, 10, 42, 3);
        BsatConfig config;
        config.setValue("seed", std::to_string(i));
        config.setValue("restart", i % 2 ? "luby,2" : "geom,4,1.2");
        config.setValue("reduce.interval", "10");
        config.setValue("reduce.grow", "5");
        config.setValue("rand.prob", i % 4 == 3 ? "0.1" : "0");
        config.setValue("heuristic", i % 5 == 4 ? "first" : "vsids");
        auto res = solve(f, config);
        INFO("formula " << i);
        REQUIRE((res.sat() || res.unsat()));
        REQUIRE(res.sat() == satisfiable(f));
        if (res.sat()) {
            REQUIRE(satisfies(res, f));
        }
    }
}

TEST_CASE("Facade limits", "[facade]") {
    Formula    f = pigeonhole(6);
    BsatConfig config;
    SECTION("test decision limit") {
        config.setValue("limit.decisions", "0");
        auto res = solve(f, config);
        REQUIRE(res.unknown());
        REQUIRE(res.reason == SolveLimit::decisions);
        REQUIRE(res.stats.decisions == 0u);
    }
    SECTION("test conflict limit") {
        config.setValue("limit.conflicts", "10");
        auto res = solve(f, config);
        REQUIRE(res.unknown());
        REQUIRE(res.reason == SolveLimit::conflicts);
        REQUIRE(res.stats.conflicts >= 10u);
        REQUIRE(std::strcmp(toString(res.reason), "conflict limit") == 0);
    }
    SECTION("test time limit") {
        config.setValue("limit.time", "0");
        auto res = solve(f, config);
        REQUIRE(res.unknown());
        REQUIRE(res.reason == SolveLimit::time);
    }
    SECTION("test limit not reached") {
        config.setValue("limit.conflicts", "1000000");
        config.setValue("limit.decisions", "1000000");
        f        = pigeonhole(4);
        auto res = solve(f, config);
        REQUIRE(res.unsat());
        REQUIRE(res.reason == SolveLimit::none);
    }
}

TEST_CASE("Facade errors", "[facade]") {
    Formula f(2);
    SECTION("test zero literal") {
        f.addClause({1, 0, 2});
        auto res = solve(f);
        REQUIRE(res.error());
        REQUIRE(res.message.find("literal 0") != std::string::npos);
        REQUIRE(std::strcmp(toString(res.status), "ERROR") == 0);
    }
    SECTION("test undeclared variable") {
        f.addClause({1, -2}).addClause({-3});
        auto res = solve(f);
        REQUIRE(res.error());
        REQUIRE(res.message.find("-3") != std::string::npos);
        REQUIRE(res.stats.decisions == 0u);
    }
    SECTION("test invalid solver parameters") {
        BsatConfig config;
        config.solver.signDef = 7;
        REQUIRE_THROWS_AS(solve(f, config), std::invalid_argument);
    }
}

TEST_CASE("Facade config", "[facade]") {
    BsatConfig config;
    SECTION("test defaults") {
        REQUIRE(config.solver.heuId == HeuristicType::vsids);
        REQUIRE(config.solver.ccMin == SolverParams::cc_recursive);
        REQUIRE(static_cast<uint32_t>(config.search.restart.sched.type) == ScheduleStrategy::sched_geom);
        REQUIRE(static_cast<uint32_t>(config.search.restart.sched.base) == 100u);
        REQUIRE(config.search.reduce.fraction == 0.5);
        REQUIRE_FALSE(config.limits.enabled());
    }
    SECTION("test solver options") {
        config.setValue("heuristic", "first");
        config.setValue("sign", "neg");
        config.setValue("ccmin", "local");
        config.setValue("seed", "123");
        config.setValue("vsids.decay", "0.8");
        config.setValue("vsids.bump", "2.5");
        REQUIRE(config.solver.heuId == HeuristicType::none);
        REQUIRE(config.solver.signDef == SolverParams::sign_neg);
        REQUIRE(config.solver.ccMin == SolverParams::cc_local);
        REQUIRE(config.solver.seed == 123u);
        REQUIRE(config.solver.varDecay == 0.8);
        REQUIRE(config.solver.varBump == 2.5);
    }
    SECTION("test restart schedules") {
        config.setValue("restart", "luby,64");
        REQUIRE(static_cast<uint32_t>(config.search.restart.sched.type) == ScheduleStrategy::sched_luby);
        REQUIRE(static_cast<uint32_t>(config.search.restart.sched.base) == 64u);
        config.setValue("restart", "arith,10,5");
        REQUIRE(static_cast<uint32_t>(config.search.restart.sched.type) == ScheduleStrategy::sched_arith);
        REQUIRE(config.search.restart.sched.current() == 10u);
        config.setValue("restart", "fixed,50");
        REQUIRE(config.search.restart.sched.current() == 50u);
        REQUIRE(config.search.restart.sched.grow == 0.0f);
        config.setValue("restart", "geom,20,2");
        REQUIRE(static_cast<uint32_t>(config.search.restart.sched.type) == ScheduleStrategy::sched_geom);
        REQUIRE(config.search.restart.sched.grow == 2.0f);
        config.setValue("restart", "dynamic,50,0.7");
        REQUIRE(config.search.restart.dynamic());
        REQUIRE(config.search.restart.dyn.window == 50u);
        config.setValue("restart", "no");
        REQUIRE(config.search.restart.disabled());
        config.setValue("restart.block", "5000,1.4");
        REQUIRE(config.search.restart.block.window == 5000u);
        config.setValue("restart.block", "no");
        REQUIRE(config.search.restart.block.window == 0u);
    }
    SECTION("test restart base and grow") {
        config.setValue("restart.base", "1");
        config.setValue("restart.grow", "1");
        REQUIRE(config.search.restart.sched.current() == 1u);
        REQUIRE_THROWS_AS(config.setValue("restart.grow", "0.5"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("restart.grow", "-1"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("restart.base", "1073741824"), std::invalid_argument);
        REQUIRE(config.search.restart.sched.grow == 1.0f);
        REQUIRE(static_cast<uint32_t>(config.search.restart.sched.base) == 1u);
        config.setValue("restart", "arith,10,5");
        config.setValue("restart.grow", "0");
        REQUIRE(config.search.restart.sched.grow == 0.0f);
        REQUIRE(config.search.restart.sched.current() == 10u);
    }
    SECTION("test restart on every conflict respects conflict limit") {
        config.setValue("restart.base", "1");
        config.setValue("restart.grow", "1");
        config.setValue("reduce.interval", "20");
        config.setValue("reduce.grow", "0");
        config.setValue("limit.conflicts", "50");
        auto res = solve(pigeonhole(6), config);
        REQUIRE(res.unknown());
        REQUIRE(res.reason == SolveLimit::conflicts);
        REQUIRE(res.stats.conflicts >= 50u);
        REQUIRE(res.stats.conflicts < 100u);
        REQUIRE(res.stats.restarts >= 25u);
        REQUIRE(res.stats.reductions >= 1u);
    }
    SECTION("test reduce and limits") {
        config.setValue("reduce.interval", "500");
        config.setValue("reduce.grow", "100");
        config.setValue("reduce.fraction", "0.75");
        config.setValue("reduce.glue", "3");
        config.setValue("reduce.score", "act");
        config.setValue("rand.prob", "0.02");
        config.setValue("limit.conflicts", "1000");
        config.setValue("limit.time", "2.5");
        REQUIRE(config.search.reduce.interval.current() == 500u);
        REQUIRE(config.search.reduce.interval.grow == 100.0f);
        REQUIRE(config.search.reduce.fraction == 0.75);
        REQUIRE(config.search.reduce.strategy.glue == 3u);
        REQUIRE(config.search.reduce.strategy.score == ReduceStrategy::score_act);
        REQUIRE(config.search.randProb == 0.02);
        REQUIRE(config.limits.conflicts == 1000u);
        REQUIRE(config.limits.time == 2.5);
        REQUIRE(config.limits.enabled());
    }
    SECTION("test invalid options") {
        REQUIRE_THROWS_AS(config.setValue("no-such-key", "1"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("sign", "up"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("seed", "-1x"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("vsids.decay", "1.5"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("vsids.bump", "0"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("restart", "luby"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("restart", "geom,100,0.5"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("restart", "fixed,100,2"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("restart", "no,1"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("restart.block", "100"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("reduce.fraction", "2"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("reduce.score", "glue"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("rand.prob", "-0.1"), std::invalid_argument);
        REQUIRE_THROWS_AS(config.setValue("limit.time", "-1"), std::invalid_argument);
        REQUIRE(static_cast<uint32_t>(config.search.restart.sched.base) == 100u);
        REQUIRE(config.solver.varDecay == 0.95);
    }
}

TEST_CASE("Facade events", "[facade]") {
    EventRecorder recorder;
    BsatConfig    config;
    config.setValue("restart", "fixed,20");
    config.setValue("reduce.interval", "50");
    auto res = solve(pigeonhole(5), config, &recorder);
    REQUIRE(res.unsat());
    REQUIRE(recorder.messages.size() == 2u);
    REQUIRE(recorder.messages[0].starts_with("Loading 30 variables"));
    REQUIRE(recorder.warnings.empty());
    REQUIRE_FALSE(recorder.ops.empty());
    REQUIRE(recorder.ops.front() == 'R');
    REQUIRE(recorder.ops.back() == 'E');
    REQUIRE(recorder.ops.find('D') != std::string::npos);

    SECTION("test verbosity filters progress") {
        EventRecorder quiet;
        quiet.setVerbosity(Event::subsystem_solve, Event::verbosity_low);
        static_cast<void>(solve(pigeonhole(5), config, &quiet));
        REQUIRE(quiet.messages.size() == 1u);
        REQUIRE(quiet.ops.empty());
    }
}

TEST_CASE("Facade statistics", "[facade]") {
    auto res = solve(pigeonhole(4));
    REQUIRE(res.unsat());
    const SolverStats& st = res.stats;
    REQUIRE(st.at("decisions") == st.decisions);
    REQUIRE(st.at("conflicts") == st.conflicts);
    REQUIRE(st.at("learned_clauses") == st.learnts);
    REQUIRE(st.at("restarts") == st.restarts);
    REQUIRE(st.at("propagations") == st.propagations);
    REQUIRE_THROWS_AS(st.at("no_such_stat"), std::invalid_argument);
    REQUIRE(SolverStats::size() == 16u);
    for (uint32_t i = 0; i != SolverStats::size(); ++i) { REQUIRE(st.at(SolverStats::key(i)) == st.value(i)); }
    REQUIRE(st.learnts <= st.conflicts);
    REQUIRE(st.backjumps <= st.conflicts);

    SolverStats sum;
    sum.accu(st);
    sum.accu(st);
    REQUIRE(sum.conflicts == 2 * st.conflicts);
    REQUIRE(sum.maxLevel == st.maxLevel);
    REQUIRE(res.time >= 0.0);
    REQUIRE(res.cpuTime >= 0.0);
}

} // namespace Bsat::Test
