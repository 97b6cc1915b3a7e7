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

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

namespace Bsat::Test {

TEST_CASE("Formula", "[formula]") {
    Formula f;
    SECTION("test add vars") {
        REQUIRE(f.numVars() == 0u);
        REQUIRE(f.addVar() == 1u);
        REQUIRE(f.addVars(3) == 2u);
        REQUIRE(f.numVars() == 4u);
        REQUIRE(Formula(5).numVars() == 5u);
    }
    SECTION("test clauses are stored as given") {
        f.addVars(3);
        f.addClause({1, -2, 1}).addClause({}).addClause({2, -2, 3});
        REQUIRE(f.numClauses() == 3u);
        REQUIRE(f.numLits() == 6u);
        REQUIRE(f.clause(0).size() == 3u);
        REQUIRE(f.clause(0)[2] == 1);
        REQUIRE(f.clause(1).empty());
        REQUIRE(f.hasEmptyClause());
        REQUIRE_THROWS_AS(f.clause(3), std::invalid_argument);
    }
    SECTION("test validate") {
        f.addVars(2);
        f.addClause({1, 2});
        REQUIRE_FALSE(f.validate());

        SECTION("zero literal") {
            f.addClause({-1, 0, 2});
            auto err = f.validate();
            REQUIRE(err);
            REQUIRE(err.type == FormulaError::error_zero_lit);
            REQUIRE(err.clause == 1u);
            REQUIRE(err.message().find("literal 0") != std::string::npos);
        }
        SECTION("undeclared variable") {
            f.addClause({-3});
            auto err = f.validate();
            REQUIRE(err.type == FormulaError::error_undeclared);
            REQUIRE(err.lit == -3);
            REQUIRE(err.message().find("-3") != std::string::npos);
        }
        SECTION("empty clause is valid") {
            f.addClause({});
            REQUIRE_FALSE(f.validate());
        }
    }
    SECTION("test satisfied by") {
        f.addVars(3);
        f.addClause({1, 2}).addClause({-1, 3});
        ValueVec vals(4, value_free);
        REQUIRE_FALSE(f.satisfiedBy(vals));
        vals[2] = value_true;
        vals[1] = value_false;
        REQUIRE(f.satisfiedBy(vals));
        vals[1] = value_true;
        REQUIRE_FALSE(f.satisfiedBy(vals));
        vals[3] = value_true;
        REQUIRE(f.satisfiedBy(vals));
        REQUIRE_THROWS_AS(f.satisfiedBy(ValueVec(3, value_true)), std::invalid_argument);
    }
}

} // namespace Bsat::Test
