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
#include <bsat/formula.h>
#include <bsat/util/misc_types.h>

#include <potassco/error.h>

#include <cstdio>

namespace Bsat {

std::string FormulaError::message() const {
    char buf[128];
    switch (type) {
        case error_none: return {};
        case error_zero_lit:
            snprintf(buf, sizeof(buf), "clause %u: literal 0 is not a valid literal", clause);
            break;
        case error_undeclared:
            snprintf(buf, sizeof(buf), "clause %u: literal %d references undeclared variable", clause, lit);
            break;
        default: POTASSCO_ASSERT_NOT_REACHED("unexpected formula error");
    }
    return buf;
}

Formula::Formula(uint32_t numVars) : offsets_(1, 0u), numVars_(0) { addVars(numVars); }

Var_t Formula::addVar() { return addVars(1); }

Var_t Formula::addVars(uint32_t n) {
    POTASSCO_CHECK_PRE(n < var_max - numVars_, "too many variables");
    Var_t first  = numVars_ + 1;
    numVars_    += n;
    return first;
}

Formula& Formula::addClause(ClauseView lits) {
    lits_.insert(lits_.end(), lits.begin(), lits.end());
    offsets_.push_back(size32(lits_));
    return *this;
}

Formula::ClauseView Formula::clause(uint32_t i) const {
    POTASSCO_CHECK_PRE(i < numClauses(), "clause index out of range");
    return {lits_.data() + offsets_[i], lits_.data() + offsets_[i + 1]};
}

bool Formula::hasEmptyClause() const {
    for (auto i : irange(numClauses())) {
        if (offsets_[i] == offsets_[i + 1]) {
            return true;
        }
    }
    return false;
}

FormulaError Formula::validate() const {
    for (auto i : irange(numClauses())) {
        for (auto x : clause(i)) {
            if (x == 0) {
                return {.type = FormulaError::error_zero_lit, .clause = i, .lit = x};
            }
            if (x == INT32_MIN || static_cast<uint32_t>(x < 0 ? -x : x) > numVars_) {
                return {.type = FormulaError::error_undeclared, .clause = i, .lit = x};
            }
        }
    }
    return {};
}

bool Formula::satisfiedBy(SpanView<Val_t> values) const {
    POTASSCO_CHECK_PRE(values.size() > numVars_, "assignment too small");
    for (auto i : irange(numClauses())) {
        bool sat = false;
        for (auto x : clause(i)) {
            Literal p = toLit(x);
            if (p.var() < values.size() && values[p.var()] == trueValue(p)) {
                sat = true;
                break;
            }
        }
        if (not sat) {
            return false;
        }
    }
    return true;
}

} // namespace Bsat
