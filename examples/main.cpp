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

#include <exception>
#include <utility>

void printModel(const Bsat::SolveResult& res) {
    std::cout << "Model:";
    for (auto v : Bsat::irange(1u, Bsat::size32(res.model))) {
        auto x = static_cast<int>(v);
        std::cout << ' ' << (res.value(v) ? x : -x);
    }
    std::cout << " 0" << std::endl;
}

int main() {
    using Example           = std::pair<const char*, void (*)()>;
    constexpr Example all[] = {{"example1", &example1}, {"example2", &example2}, {"example3", &example3}};

    int failed = 0;
    for (const auto& [name, run] : all) {
        std::cout << "*** Running " << name << " ***" << std::endl;
        try {
            run();
        }
        catch (const std::exception& e) {
            std::cout << " *** ERROR: " << e.what() << std::endl;
            ++failed;
        }
    }
    return failed == 0 ? 0 : 1;
}
