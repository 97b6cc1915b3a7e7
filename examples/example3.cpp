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
#include "example.h"

#include <bsat/cli/bsat_output.h>

namespace {
// Adds clauses stating that p pigeons fit into p - 1 holes.
Bsat::Formula pigeonhole(int32_t p) {
    Bsat::Formula f;
    int32_t       h = p - 1;
    f.addVars(static_cast<uint32_t>(p * h));
    auto var = [h](int32_t i, int32_t j) { return (i * h) + j + 1; };
    for (int32_t i = 0; i != p; ++i) {
        Bsat::PodVector_t<int32_t> clause;
        for (int32_t j = 0; j != h; ++j) { clause.push_back(var(i, j)); }
        f.addClause(clause);
    }
    for (int32_t j = 0; j != h; ++j) {
        for (int32_t i = 0; i != p; ++i) {
            for (int32_t k = i + 1; k != p; ++k) { f.addClause({-var(i, j), -var(k, j)}); }
        }
    }
    return f;
}
} // namespace

// This example solves a pigeonhole formula and uses a TextOutput object
// to print progress, the result and statistics.
void example3() {
    Bsat::Cli::TextOutput out(3);
    out.run("bsat", BSAT_VERSION);

    Bsat::BsatConfig config;
    config.setValue("restart", "fixed,50");
    config.setValue("reduce.interval", "100");
    config.setValue("limit.conflicts", "100000");

    Bsat::SolveResult res = Bsat::solve(pigeonhole(6), config, &out);
    out.printResult(res);
    out.printStatistics(res);
}
