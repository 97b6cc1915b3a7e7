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
#include <bsat/cli/bsat_output.h>

#include <bsat/util/timer.h>

#include <potassco/platform.h>

#include <algorithm>
#include <cinttypes>
#include <cstdarg>
#include <cstdio>
#include <utility>

namespace Bsat::Cli {

namespace {
constexpr const char* separator  = "------------------------------------------------------------------------------|";
constexpr const char* header[]   = {"T      Vars          Clauses          Conflicts          Limits          Time     |",
                                    "  #free/#fixed   #problem/#learnt  #conflicts/ratio #conflict/#learnt              |"};
constexpr int         key_width  = 15;
constexpr int         stat_width = key_width + 5;
constexpr int         model_cols = 72;
constexpr int         page_rows  = 20;

// Limits that do not fit the column are shown as -1.
int64_t column(uint64_t x, uint64_t max) { return x <= max ? static_cast<int64_t>(x) : -1; }

int formatRow(char* out, std::size_t size, const BasicSolveEvent& ev) {
    const Solver& s     = *ev.solver;
    uint32_t      fixed = s.decisionLevel() != 0 ? s.levelStart(1) : s.numAssignedVars();
    return std::snprintf(out, size, "%c|%7u/%-7u|%8u/%-8u|%10" PRIu64 "/%-6.3f|%8" PRId64 "/%-10" PRId64 "|",
                         static_cast<char>(ev.op), s.numFreeVars(), fixed, s.numProblemClauses(), s.numLearnts(),
                         s.stats.conflicts, ratio(s.stats.conflicts, s.stats.decisions), column(ev.cLimit, UINT32_MAX),
                         column(ev.lLimit, UINT32_MAX - 1));
}
} // namespace

TextOutput::TextOutput(uint32_t verbosity)
    : start_(RealTime::getTime())
    , stTime_(start_)
    , verbose_(0)
    , state_(Event::subsystem_facade) {
    setVerbosity(verbosity);
    progress_.clear();
}

TextOutput::~TextOutput() = default;

void TextOutput::setVerbosity(uint32_t verb) {
    verbose_ = verb;
    auto ev  = static_cast<Event::Verbosity>(std::min(verb, static_cast<uint32_t>(Event::verbosity_max)));
    for (auto sys : {Event::subsystem_facade, Event::subsystem_load, Event::subsystem_solve}) {
        EventHandler::setVerbosity(sys, ev);
    }
}

double TextOutput::elapsedTime() const { return RealTime::getTime() - start_; }

void TextOutput::comment(uint32_t v, const char* fmt, ...) const {
    if (v > verbosity()) {
        return;
    }
    std::fputs("c ", stdout);
    va_list args;
    va_start(args, fmt);
    POTASSCO_WARNING_PUSH()
    POTASSCO_WARNING_IGNORE_CLANG("-Wformat-nonliteral")
    std::vfprintf(stdout, fmt, args);
    POTASSCO_WARNING_POP()
    va_end(args);
    std::fflush(stdout);
}

void TextOutput::run(const char* solver, const char* version) {
    if (solver) {
        comment(1, "%s version %s\n", solver, version ? version : "");
    }
}

void TextOutput::onEvent(const Event& ev) {
    if (ev.system == Event::subsystem_facade || ev.verb > verbosity()) {
        return;
    }
    const auto* log = event_cast<LogEvent>(ev);
    if (log && log->isWarning()) {
        comment(1, "Warning: %s\n", log->msg);
        return;
    }
    // Messages of the load subsystem label the following timing line.
    if (ev.system != state_ || (log && ev.system == Event::subsystem_load)) {
        setState(ev.system, ev.verb, log ? log->msg : nullptr);
    }
    if (ev.system == Event::subsystem_solve) {
        printSolveProgress(ev);
    }
}

void TextOutput::setState(uint32_t state, uint32_t verb, const char* m) {
    double now = RealTime::getTime();
    if (verb <= verbosity()) {
        if (state_ == Event::subsystem_load) {
            std::printf("%.3fs\n", now - stTime_);
        }
        switch (state) {
            case Event::subsystem_load : comment(2, "%-*s: ", key_width, m ? m : "Reading"); break;
            case Event::subsystem_solve: comment(2, "Solving...\n"); break;
            default                    : break;
        }
    }
    progress_.clear();
    stTime_ = now;
    state_  = state;
}

void TextOutput::printSolveProgress(const Event& ev) {
    char buf[128];
    int  n = -1;
    if (const auto* be = event_cast<BasicSolveEvent>(ev)) {
        n = formatRow(buf, sizeof(buf), *be);
    }
    else if (const auto* log = event_cast<LogEvent>(ev)) {
        char stamp[32];
        std::snprintf(stamp, sizeof(stamp), "[Solving+%.3fs]", RealTime::getTime() - stTime_);
        n = std::snprintf(buf, sizeof(buf), "L| %-20s %-41.41s |", stamp, log->msg);
    }
    if (n < 0 || static_cast<std::size_t>(n) >= sizeof(buf)) {
        return;
    }
    std::snprintf(buf + n, sizeof(buf) - static_cast<std::size_t>(n), " %10.3fs |", elapsedTime());

    auto type = static_cast<int>(ev.id);
    if (progress_.lines <= 0) {
        std::printf("c %s\nc %s\nc %s\nc %s\n", separator, header[0], header[1], separator);
        progress_.lines = page_rows;
        progress_.last  = type;
    }
    else if (type != progress_.last) {
        std::printf("c %s\n", separator);
        progress_.last = type;
    }
    --progress_.lines;
    std::printf("c %s\n", buf);
    std::fflush(stdout);
}

void TextOutput::printResult(const SolveResult& res) {
    if (progress_.last != -1) {
        comment(3, "%s\n", separator);
        progress_.clear();
    }
    if (res.error()) {
        comment(0, "Error: %s\n", res.message.c_str());
    }
    std::printf("s %s\n", toString(res.status));
    if (res.sat()) {
        printModel(res);
    }
    if (verbosity() != 0) {
        std::puts("c");
        if (res.unknown()) {
            comment(1, "%-*s: %s\n", key_width, "Interrupted", toString(res.reason));
        }
        const std::pair<const char*, uint64_t> summary[] = {
            {"Decisions", res.stats.decisions}, {"Conflicts", res.stats.conflicts}, {"Restarts", res.stats.restarts}};
        for (const auto& [key, val] : summary) { comment(1, "%-*s: %" PRIu64 "\n", key_width, key, val); }
        comment(1, "%-*s: %.3fs (CPU %.3fs)\n", key_width, "Time", res.time, res.cpuTime);
    }
    std::fflush(stdout);
}

void TextOutput::printModel(const SolveResult& res) const {
    int col = std::printf("v ");
    for (auto v : irange(1u, size32(res.model))) {
        if (col >= model_cols) {
            col = std::printf("\nv ") - 1;
        }
        col += std::printf("%s%u ", res.model[v] ? "" : "-", v);
    }
    std::printf("0\n");
}

void TextOutput::printStatistics(const SolveResult& res) const {
    const SolverStats& st = res.stats;
    std::printf("c\nc ============ Solver Stats ============\nc\n");
    for (auto i : irange(SolverStats::size())) {
        std::printf("c %-*s: %" PRIu64 "\n", stat_width, SolverStats::key(i), st.value(i));
    }
    const std::pair<const char*, double> averages[] = {
        {"avg_backjump", st.avgJump()}, {"avg_learnt_size", st.avgLearntSize()}, {"avg_restart", st.avgRestart()}};
    for (const auto& [key, val] : averages) { std::printf("c %-*s: %.3f\n", stat_width, key, val); }
    std::fflush(stdout);
}

} // namespace Bsat::Cli
