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

#include <bsat/config.h>

#include <algorithm>
#include <cassert>
#include <span>
#include <utility>
#include <vector>

namespace Bsat {

//! Vector type used for plain data such as literals, values and indices.
template <typename T>
using PodVector_t = std::vector<T>;

//! Returns the size of c as a 32-bit unsigned integer.
/*!
 * \pre c.size() fits into 32 bits.
 */
template <typename C>
constexpr uint32_t size32(const C& c) {
    assert(std::in_range<uint32_t>(c.size()));
    return static_cast<uint32_t>(c.size());
}

//! Drops all elements of vec at positions >= n.
template <typename V>
void shrinkVecTo(V& vec, typename V::size_type n) {
    assert(n <= vec.size());
    vec.resize(n);
}

//! Appends copies of val until vec has at least n elements.
template <typename V>
void growVecTo(V& vec, typename V::size_type n, const typename V::value_type& val = typename V::value_type()) {
    if (n > vec.size()) {
        if (vec.capacity() < n) {
            vec.reserve(n + (n / 2));
        }
        vec.resize(n, val);
    }
}

} // namespace Bsat
