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

#include <bsat/util/timer.h>

#include <potassco/error.h>
#include <potassco/program_opts/string_convert.h>

#include <cstdio>
#include <limits>

namespace Bsat {
/////////////////////////////////////////////////////////////////////////////////////////
// Primitive types/functions for string -> T conversions
/////////////////////////////////////////////////////////////////////////////////////////
namespace {
struct KeyVal {
    const char* key;
    uint32_t    value;
};
constexpr KeyVal heuristic_keys[] = {{"vsids", static_cast<uint32_t>(HeuristicType::vsids)},
                                     {"first", static_cast<uint32_t>(HeuristicType::none)}};
constexpr KeyVal sign_keys[]      = {{"pos", SolverParams::sign_pos},
                                     {"neg", SolverParams::sign_neg},
                                     {"saved", SolverParams::sign_saved}};
constexpr KeyVal ccmin_keys[]     = {{"none", SolverParams::cc_none},
                                     {"local", SolverParams::cc_local},
                                     {"recursive", SolverParams::cc_recursive}};
constexpr KeyVal score_keys[]     = {{"act", ReduceStrategy::score_act},
                                     {"lbd", ReduceStrategy::score_lbd},
                                     {"both", ReduceStrategy::score_both}};

template <std::size_t N>
bool findValue(const KeyVal (&map)[N], std::string_view key, uint32_t& out) {
    for (const auto& kv : map) {
        if (key == kv.key) {
            out = kv.value;
            return true;
        }
    }
    return false;
}

// Splits off the next comma-separated element of in.
std::string_view nextArg(std::string_view& in) {
    auto pos = in.find(',');
    auto arg = in.substr(0, pos);
    in       = pos == std::string_view::npos ? std::string_view() : in.substr(pos + 1);
    return arg;
}

template <typename T>
bool nextArg(std::string_view& in, T& out) {
    return not in.empty() && Potassco::stringTo(nextArg(in), out) == std::errc{};
}

// <type>,<n>[,<arg>]|no
bool parseSchedule(std::string_view in, RestartParams& res) {
    auto          type = nextArg(in);
    RestartParams out  = res;
    uint32_t      base = 0;
    double        arg  = 0.0;
    if (type == "no") {
        out.disable();
    }
    else if (not nextArg(in, base) || base == 0 || base >= (1u << 30)) {
        return false;
    }
    else if (type == "dynamic" && nextArg(in, arg) && arg > 0.0) {
        out.dyn = {.window = base, .k = static_cast<float>(arg)};
    }
    else {
        if (type == "geom" && nextArg(in, arg) && arg >= 1.0) {
            out.sched = ScheduleStrategy::geom(base, arg);
        }
        else if (type == "arith" && nextArg(in, arg) && arg >= 0.0) {
            out.sched = ScheduleStrategy::arith(base, arg);
        }
        else if (type == "luby") {
            out.sched = ScheduleStrategy::luby(base);
        }
        else if (type == "fixed") {
            out.sched = ScheduleStrategy::fixed(base);
        }
        else {
            return false;
        }
        out.dyn = {};
    }
    if (not in.empty()) {
        return false;
    }
    res = out;
    return true;
}

// <window>,<scale>|no
bool parseBlock(std::string_view in, RestartParams::Block& out) {
    if (in == "no") {
        out.window = 0;
        return true;
    }
    uint32_t window = 0;
    double   scale  = 0.0;
    if (not nextArg(in, window) || not nextArg(in, scale) || not in.empty() || scale <= 0.0) {
        return false;
    }
    out.window = window;
    out.scale  = static_cast<float>(scale);
    return true;
}

template <typename T>
bool store(std::string_view in, T& out) {
    return Potassco::stringTo(in, out) == std::errc{};
}
template <typename T>
bool storeRange(std::string_view in, T& out, T lo, T hi) {
    T temp;
    if (store(in, temp) && lo <= temp && temp <= hi) {
        out = temp;
        return true;
    }
    return false;
}
} // namespace
/////////////////////////////////////////////////////////////////////////////////////////
// BsatConfig
/////////////////////////////////////////////////////////////////////////////////////////
void BsatConfig::setValue(std::string_view key, std::string_view value) {
    bool     ok = false;
    uint32_t n  = 0;
    double   d  = 0.0;
    if (key == "heuristic") {
        ok = findValue(heuristic_keys, value, n);
        if (ok) {
            solver.heuId = static_cast<HeuristicType>(n);
        }
    }
    else if (key == "sign") {
        ok = findValue(sign_keys, value, solver.signDef);
    }
    else if (key == "ccmin") {
        ok = findValue(ccmin_keys, value, solver.ccMin);
    }
    else if (key == "seed") {
        ok = store(value, solver.seed);
    }
    else if (key == "vsids.bump") {
        ok = store(value, d) && d > 0.0;
        if (ok) {
            solver.varBump = d;
        }
    }
    else if (key == "vsids.decay") {
        ok = storeRange(value, solver.varDecay, std::numeric_limits<double>::min(), 1.0);
    }
    else if (key == "restart") {
        ok = parseSchedule(value, search.restart);
    }
    else if (key == "restart.base") {
        ok = store(value, n) && n < (1u << 30);
        if (ok) {
            search.restart.sched.base = n;
        }
    }
    else if (key == "restart.grow") {
        // geometric schedules must not shrink
        double minGrow = search.restart.sched.type == ScheduleStrategy::sched_geom ? 1.0 : 0.0;
        ok             = store(value, d) && d >= minGrow;
        if (ok) {
            search.restart.sched.grow = static_cast<float>(d);
        }
    }
    else if (key == "restart.block") {
        ok = parseBlock(value, search.restart.block);
    }
    else if (key == "reduce.interval" || key == "reduce.grow") {
        ok = store(value, n) && n < (1u << 30);
        if (ok) {
            ScheduleStrategy& sched = search.reduce.interval;
            sched = key == "reduce.interval" ? ScheduleStrategy::arith(n, sched.grow) : ScheduleStrategy::arith(sched.base, n);
        }
    }
    else if (key == "reduce.fraction") {
        ok = storeRange(value, search.reduce.fraction, 0.0, 1.0);
    }
    else if (key == "reduce.glue") {
        ok = store(value, search.reduce.strategy.glue);
    }
    else if (key == "reduce.score") {
        ok = findValue(score_keys, value, search.reduce.strategy.score);
    }
    else if (key == "rand.prob") {
        ok = storeRange(value, search.randProb, 0.0, 1.0);
    }
    else if (key == "limit.decisions") {
        ok = store(value, limits.decisions);
    }
    else if (key == "limit.conflicts") {
        ok = store(value, limits.conflicts);
    }
    else if (key == "limit.time") {
        ok = store(value, d) && d >= 0.0;
        if (ok) {
            limits.time = d;
        }
    }
    else {
        POTASSCO_CHECK(false, std::errc::invalid_argument, "unknown option '%.*s'", static_cast<int>(key.size()),
                       key.data());
    }
    POTASSCO_CHECK(ok, std::errc::invalid_argument, "'%.*s': invalid value '%.*s'", static_cast<int>(key.size()),
                   key.data(), static_cast<int>(value.size()), value.data());
}
/////////////////////////////////////////////////////////////////////////////////////////
// solve
/////////////////////////////////////////////////////////////////////////////////////////
const char* toString(SolveResult::Status st) {
    switch (st) {
        case SolveResult::status_sat  : return "SATISFIABLE";
        case SolveResult::status_unsat: return "UNSATISFIABLE";
        case SolveResult::status_error: return "ERROR";
        default                       : return "UNKNOWN";
    }
}

const char* toString(SolveLimit lim) {
    switch (lim) {
        case SolveLimit::decisions: return "decision limit";
        case SolveLimit::conflicts: return "conflict limit";
        case SolveLimit::time     : return "time limit";
        default                   : return "none";
    }
}

namespace {
// Loads f into s and returns false if f is trivially unsatisfiable.
bool load(Solver& s, const Formula& f) {
    s.startInit(f.numVars());
    LitVec clause;
    bool   ok = true;
    for (uint32_t i = 0; ok && i != f.numClauses(); ++i) {
        clause.clear();
        for (auto x : f.clause(i)) { clause.push_back(toLit(x)); }
        ok = s.addClause(clause);
    }
    return s.endInit() && ok;
}
} // namespace

SolveResult solve(const Formula& f, const BsatConfig& config, EventHandler* handler) {
    SolveResult        res;
    Timer<RealTime>    timer;
    Timer<ProcessTime> cpu;
    timer.start();
    cpu.start();
    if (auto err = f.validate(); err) {
        res.status  = SolveResult::status_error;
        res.message = err.message();
        res.time    = timer.elapsed();
        res.cpuTime = cpu.elapsed();
        return res;
    }
    Solver s(config.solver);
    s.setEventHandler(handler);
    char msg[128];
    snprintf(msg, sizeof(msg), "Loading %u variables and %u clauses", f.numVars(), f.numClauses());
    s.report(LogEvent(Event::subsystem_load, Event::verbosity_high, LogEvent::message, &s, msg));
    Val_t ret = value_false;
    if (load(s, f)) {
        snprintf(msg, sizeof(msg), "Solving with %u free variables and %u clauses", s.numFreeVars(),
                 s.numProblemClauses());
        s.report(LogEvent(Event::subsystem_solve, Event::verbosity_high, LogEvent::message, &s, msg));
        BasicSolve algo(s, config.search, config.limits);
        ret        = algo.solve();
        res.reason = algo.expired();
    }
    res.stats = s.stats;
    if (ret == value_true) {
#if BSAT_CHECK_MODELS
        POTASSCO_ASSERT(f.satisfiedBy(s.model()), "invalid model");
#endif
        res.status = SolveResult::status_sat;
        res.model.assign(s.model().size(), false);
        for (auto v : irange(1u, size32(s.model()))) { res.model[v] = s.model()[v] == value_true; }
    }
    else {
        res.status = ret == value_false ? SolveResult::status_unsat : SolveResult::status_unknown;
    }
    timer.stop();
    cpu.stop();
    res.time    = timer.total();
    res.cpuTime = cpu.total();
    return res;
}

} // namespace Bsat
