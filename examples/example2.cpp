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

#include <bsat/bsat_facade.h>

// This example uses the facade function Bsat::solve() to decide
// the "exactly one of three" formula
//    (x | y | z) & (-x | -y) & (-x | -z) & (-y | -z)
void example2() {
    Bsat::Formula f;
    auto          x = static_cast<int32_t>(f.addVar());
    auto          y = static_cast<int32_t>(f.addVar());
    auto          z = static_cast<int32_t>(f.addVar());
    f.addClause({x, y, z}).addClause({-x, -y}).addClause({-x, -z}).addClause({-y, -z});

    // Options can be set directly on the config object or by key.
    Bsat::BsatConfig config;
    config.setValue("sign", "pos");
    config.setValue("restart", "luby,64");

    Bsat::SolveResult res = Bsat::solve(f, config);
    std::cout << Bsat::toString(res.status) << std::endl;
    if (res.sat()) {
        printModel(res);
    }
}
