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
#pragma once

#include <bsat/literal.h>

#include <initializer_list>
#include <string>

/*!
 * \file
 * \brief Defines the input representation of a CNF formula.
 */
namespace Bsat {

//! Describes the first malformed literal of a formula.
struct FormulaError {
    enum Type : uint32_t {
        error_none       = 0, //!< Formula is well-formed.
        error_zero_lit   = 1, //!< Clause contains the literal 0.
        error_undeclared = 2, //!< Clause references a variable > numVars().
    };
    [[nodiscard]] explicit operator bool() const { return type != error_none; }
    [[nodiscard]] std::string message() const;

    Type     type{error_none};
    uint32_t clause{0}; //!< Index of the offending clause.
    int32_t  lit{0};    //!< The offending literal.
};

//! A CNF formula over the variables 1..numVars().
/*!
 * Literals are given as non-zero signed integers where -v denotes the negation of variable v.
 * The formula stores clauses exactly as given. In particular, clauses may contain duplicate
 * or complementary literals, and literals are not checked until validate() is called.
 */
class Formula {
public:
    using ClauseView = SpanView<int32_t>;

    explicit Formula(uint32_t numVars = 0);

    //! Adds a new variable and returns its id.
    Var_t addVar();
    //! Adds n new variables and returns the id of the first.
    Var_t addVars(uint32_t n);
    //! Adds the clause lits. The empty clause is allowed and makes the formula unsatisfiable.
    Formula& addClause(ClauseView lits);
    Formula& addClause(std::initializer_list<int32_t> lits) { return addClause(ClauseView(lits.begin(), lits.size())); }

    [[nodiscard]] uint32_t   numVars() const { return numVars_; }
    [[nodiscard]] uint32_t   numClauses() const { return size32(offsets_) - 1; }
    [[nodiscard]] uint32_t   numLits() const { return size32(lits_); }
    [[nodiscard]] ClauseView clause(uint32_t i) const;
    [[nodiscard]] bool       hasEmptyClause() const;

    //! Checks that every literal is non-zero and references a declared variable.
    [[nodiscard]] FormulaError validate() const;

    //! Returns whether the assignment values (indexed by variable) satisfies every clause.
    /*!
     * \pre values.size() > numVars()
     */
    [[nodiscard]] bool satisfiedBy(SpanView<Val_t> values) const;

private:
    PodVector_t<int32_t>  lits_;
    PodVector_t<uint32_t> offsets_;
    uint32_t              numVars_;
};

} // namespace Bsat
