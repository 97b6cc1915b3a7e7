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

#include <concepts>

namespace Bsat {

//! A binary max-heap over small unsigned keys that supports priority updates of contained keys.
/*!
 * \tparam T   Key type. Keys are used as indices into a position table.
 * \tparam Cmp Strict ordering: if Cmp(k1, k2) == true, k1 has higher priority than k2.
 */
template <std::unsigned_integral T, typename Cmp>
class IndexedPriorityQueue {
public:
    using key_type     = T;
    using compare_type = Cmp;

    explicit IndexedPriorityQueue(const compare_type& c) : compare_(c) {}

    [[nodiscard]] bool     empty() const { return heap_.empty(); }
    [[nodiscard]] uint32_t size() const { return size32(heap_); }
    [[nodiscard]] bool     contains(key_type k) const { return k < pos_.size() && pos_[k] != no_pos; }

    //! Returns the key with the highest priority.
    [[nodiscard]] key_type top() const {
        assert(not empty());
        return heap_[0];
    }

    void reserve(uint32_t n) { pos_.reserve(n); }

    void push(key_type k) {
        assert(not contains(k));
        growVecTo(pos_, static_cast<std::size_t>(k) + 1, no_pos);
        pos_[k] = size32(heap_);
        heap_.push_back(k);
        siftUp(pos_[k]);
    }

    void pop() {
        assert(not empty());
        key_type x     = heap_[0];
        heap_[0]       = heap_.back();
        pos_[heap_[0]] = 0;
        pos_[x]        = no_pos;
        heap_.pop_back();
        if (heap_.size() > 1) {
            siftDown(0);
        }
    }

    void remove(key_type k) {
        if (not contains(k)) {
            return;
        }
        uint32_t at        = pos_[k];
        heap_[at]          = heap_.back();
        pos_[heap_.back()] = at;
        heap_.pop_back();
        pos_[k] = no_pos;
        if (at < heap_.size()) {
            siftUp(at);
            siftDown(at);
        }
    }

    //! Inserts k or restores the heap property after an arbitrary change of k's priority.
    void update(key_type k) {
        if (not contains(k)) {
            push(k);
        }
        else {
            siftUp(pos_[k]);
            siftDown(pos_[k]);
        }
    }
    //! Call if priority of k has increased.
    void increase(key_type k) {
        assert(contains(k));
        siftUp(pos_[k]);
    }
    //! Call if priority of k has decreased.
    void decrease(key_type k) {
        assert(contains(k));
        siftDown(pos_[k]);
    }

    void clear() {
        heap_.clear();
        pos_.clear();
    }

private:
    static constexpr uint32_t no_pos = UINT32_MAX;
    static constexpr uint32_t parent(uint32_t i) { return (i - 1) >> 1; }
    static constexpr uint32_t left(uint32_t i) { return (i << 1) + 1; }
    static constexpr uint32_t right(uint32_t i) { return (i + 1) << 1; }

    void siftUp(uint32_t n) {
        key_type x = heap_[n];
        while (n != 0 && compare_(x, heap_[parent(n)])) {
            heap_[n]       = heap_[parent(n)];
            pos_[heap_[n]] = n;
            n              = parent(n);
        }
        heap_[n] = x;
        pos_[x]  = n;
    }

    void siftDown(uint32_t n) {
        key_type x = heap_[n];
        for (uint32_t child; left(n) < heap_.size(); n = child) {
            child = right(n) < heap_.size() && compare_(heap_[right(n)], heap_[left(n)]) ? right(n) : left(n);
            if (not compare_(heap_[child], x)) {
                break;
            }
            heap_[n]       = heap_[child];
            pos_[heap_[n]] = n;
        }
        heap_[n] = x;
        pos_[x]  = n;
    }

    PodVector_t<uint32_t> pos_;  // position of each key in heap_ or no_pos
    PodVector_t<key_type> heap_; // the heap
    compare_type          compare_;
};

} // namespace Bsat
