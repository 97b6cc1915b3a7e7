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

#include <bsat/pod_vector.h>

#include <compare>

/*!
 * \file
 * \brief Variables, literals and truth values.
 */
namespace Bsat {
/*!
 * \defgroup constraint Literals and clauses
 * \brief Basic building blocks of formulas.
 */
//@{

//! Variables are numbered from 1. Variable 0 is reserved.
using Var_t = uint32_t;

//! Upper bound (exclusive) on variable ids.
constexpr Var_t var_max = Var_t(1) << 30;

//! The reserved variable used by sentinel literals.
constexpr Var_t sent_var = 0;

//! A variable together with a sign.
/*!
 * The literal is packed into one word: the variable in bits 2..31, the sign in
 * bit 1 (set for negative literals) and a scratch flag in bit 0. The flag is
 * not part of the literal's identity. Conflict clause minimization uses it to
 * distinguish visited from pending literals.
 */
class Literal {
public:
    //! Creates the positive literal of the sentinel variable.
    constexpr Literal() = default;
    /*!
     * \pre var < var_max
     */
    constexpr Literal(Var_t var, bool negative) : rep_((var << var_shift) | (negative ? sign_bit : 0u)) {
        assert(var < var_max);
    }

    [[nodiscard]] constexpr Var_t var() const noexcept { return rep_ >> var_shift; }
    //! Returns true if this is the negative literal of var().
    [[nodiscard]] constexpr bool sign() const noexcept { return (rep_ & sign_bit) != 0; }
    //! Returns a dense index s.th. a literal and its complement occupy ids 2v and 2v+1.
    [[nodiscard]] constexpr uint32_t id() const noexcept { return rep_ >> 1; }
    static constexpr Literal fromId(uint32_t id) { return Literal(Raw{id << 1}); }

    constexpr Literal& flag() noexcept {
        rep_ |= flag_bit;
        return *this;
    }
    constexpr Literal& unflag() noexcept {
        rep_ &= ~flag_bit;
        return *this;
    }
    [[nodiscard]] constexpr bool flagged() const noexcept { return (rep_ & flag_bit) != 0; }

    //! Returns the unflagged complement of this literal.
    constexpr Literal operator~() const noexcept { return Literal(Raw{(rep_ ^ sign_bit) & ~flag_bit}); }

    friend constexpr bool operator==(Literal lhs, Literal rhs) noexcept { return lhs.id() == rhs.id(); }
    friend constexpr auto operator<=>(Literal lhs, Literal rhs) noexcept { return lhs.id() <=> rhs.id(); }

private:
    struct Raw {
        uint32_t rep;
    };
    static constexpr uint32_t var_shift = 2;
    static constexpr uint32_t sign_bit  = 2u;
    static constexpr uint32_t flag_bit  = 1u;
    constexpr explicit Literal(Raw r) : rep_(r.rep) {}
    uint32_t rep_{0};
};

constexpr Literal posLit(Var_t v) { return {v, false}; }
constexpr Literal negLit(Var_t v) { return {v, true}; }
//! Maps a signed integer in the usual DIMACS convention to a literal.
constexpr Literal toLit(int32_t x) { return x < 0 ? negLit(static_cast<Var_t>(-x)) : posLit(static_cast<Var_t>(x)); }
//! Inverse of toLit().
constexpr int32_t toInt(Literal p) {
    auto v = static_cast<int32_t>(p.var());
    return p.sign() ? -v : v;
}
constexpr bool isSentinel(Literal p) { return p.var() == sent_var; }

static_assert(posLit(1) < negLit(1) && negLit(1) < posLit(2));
static_assert(~negLit(3) == posLit(3) && (negLit(7).id() ^ 1u) == posLit(7).id());
static_assert(toLit(toInt(negLit(5))) == negLit(5));
static_assert(not(~Literal(12, false).flag()).flagged());

template <typename T>
using SpanView = std::span<const T>;
using VarVec   = PodVector_t<Var_t>;
using LitVec   = PodVector_t<Literal>;
using LitView  = SpanView<Literal>;

///////////////////////////////////////////////////////////////////////////////
// Truth values
///////////////////////////////////////////////////////////////////////////////
//! One of value_free, value_true or value_false.
using Val_t    = uint8_t;
using ValueVec = PodVector_t<Val_t>;

constexpr Val_t value_free  = 0;
constexpr Val_t value_true  = 1;
constexpr Val_t value_false = 2;

//! Value of var(p) under which p is true.
constexpr Val_t trueValue(Literal p) { return p.sign() ? value_false : value_true; }
//! Value of var(p) under which p is false.
constexpr Val_t falseValue(Literal p) { return p.sign() ? value_true : value_false; }
//! Sign of the literal that is true under value v.
constexpr bool valSign(Val_t v) { return v != value_true; }

static_assert(trueValue(negLit(1)) == value_false && falseValue(negLit(1)) == value_true);

//@}
} // namespace Bsat
