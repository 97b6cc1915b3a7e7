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
// Add the bsat directory to the list of
// include directories of your build system.
#include <bsat/solve_algorithms.h> // for solving

// Decides the formula
//    (x1 | x2) & (-x1 | x2) & (-x2 | x3)
// directly on a Solver object.
void example1() {
    // Solver hosts the data and functions for CDCL search.
    // See solver.h for details.
    Bsat::Solver s;

    // startInit must be called once before clauses can be added.
    s.startInit(3);
    // addClause() returns false once the problem is unsatisfiable on the top-level.
    bool ok = s.addClause(Bsat::LitVec{Bsat::posLit(1), Bsat::posLit(2)}) &&
              s.addClause(Bsat::LitVec{Bsat::negLit(1), Bsat::posLit(2)}) &&
              s.addClause(Bsat::LitVec{Bsat::negLit(2), Bsat::posLit(3)});

    // We are done with problem setup.
    // endInit() initializes the heuristic and propagates top-level facts.
    if (not s.endInit() || not ok) {
        std::cout << "Conflict on top-level!" << std::endl;
        return;
    }

    // BasicSolve implements a basic search for a model.
    // It handles the various strategies like restarts, deletion, etc.
    Bsat::SolveParams params;
    Bsat::BasicSolve  solve(s, params);
    if (solve.solve() == Bsat::value_true) {
        std::cout << "Model: ";
        for (auto v : Bsat::irange(1u, s.numVars() + 1)) {
            std::cout << (s.model()[v] == Bsat::value_true ? static_cast<int>(v) : -static_cast<int>(v)) << " ";
        }
        std::cout << std::endl;
    }
    else {
        std::cout << "No model!" << std::endl;
    }
}
