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
#include <bsat/solver_types.h>

#include <cstring>
#include <iterator>

namespace Bsat {
/////////////////////////////////////////////////////////////////////////////////////////
// SolverStats
/////////////////////////////////////////////////////////////////////////////////////////
#define BSAT_STAT_KEY(m, k, accu)  k,
#define BSAT_STAT_ACCU(m, k, accu) accu(m, o.m);
#define BSAT_STAT_VALUE(m, k, accu)                                                                                    \
    if (i-- == 0)                                                                                                      \
        return m;

namespace {
constexpr const char* stat_keys[] = {BSAT_SOLVER_STATS(BSAT_STAT_KEY)};
}

void SolverStats::accu(const SolverStats& o) { BSAT_SOLVER_STATS(BSAT_STAT_ACCU) }
uint32_t    SolverStats::size() { return static_cast<uint32_t>(std::size(stat_keys)); }
const char* SolverStats::key(uint32_t i) {
    POTASSCO_CHECK_PRE(i < size(), "invalid stats index");
    return stat_keys[i];
}
uint64_t SolverStats::value(uint32_t i) const {
    POTASSCO_CHECK_PRE(i < size(), "invalid stats index");
    BSAT_SOLVER_STATS(BSAT_STAT_VALUE)
    POTASSCO_ASSERT_NOT_REACHED("unexpected stats index");
}
uint64_t SolverStats::at(const char* k) const {
    uint32_t i = 0;
    while (i != size() && std::strcmp(k, stat_keys[i]) != 0) { ++i; }
    POTASSCO_CHECK(i != size(), std::errc::invalid_argument, "unknown statistic '%s'", k);
    return value(i);
}
#undef BSAT_STAT_KEY
#undef BSAT_STAT_ACCU
#undef BSAT_STAT_VALUE
/////////////////////////////////////////////////////////////////////////////////////////
// Assignment
/////////////////////////////////////////////////////////////////////////////////////////
void Assignment::reset(uint32_t numVars) {
    POTASSCO_CHECK_PRE(numVars < var_max, "too many variables");
    value_.assign(numVars + 1, value_free);
    saved_.assign(numVars + 1, value_free);
    level_.assign(numVars + 1, 0u);
    reason_.assign(numVars + 1, clause_none);
    levels_.clear();
    trail_.clear();
    trail_.reserve(numVars);
    front_ = 0;
}

} // namespace Bsat
