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

#include <bsat/bsat_facade.h>

/*!
 * \file
 * \brief Event handler for printing progress, results and statistics in SAT competition format.
 */
namespace Bsat::Cli {

/*!
 * \addtogroup cli
 * @{ */
//! Prints solve progress, results and statistics to stdout.
/*!
 * Comment lines start with "c ", the result line with "s ", and the model
 * is printed in "v " lines terminated by 0.
 *
 * Verbosity levels:
 *  - 0: only result and model.
 *  - 1: in addition a short summary and warnings.
 *  - 2: in addition load and solve messages.
 *  - 3: in addition progress rows for restarts and deletions.
 */
class TextOutput : public EventHandler {
public:
    explicit TextOutput(uint32_t verbosity = 1);
    ~TextOutput() override;
    TextOutput(TextOutput&&) = delete;

    //! Active verbosity level.
    [[nodiscard]] uint32_t verbosity() const { return verbose_; }
    void                   setVerbosity(uint32_t verb);

    //! Prints a header line for the given solver name.
    void run(const char* solver, const char* version);
    //! Prints result line, model and a summary of res.
    void printResult(const SolveResult& res);
    //! Prints the statistics of res.
    void printStatistics(const SolveResult& res) const;

    void onEvent(const Event& ev) override;

    //! Prints the formatted string if verbosity() >= v.
    void comment(uint32_t v, const char* fmt, ...) const;

private:
    void   setState(uint32_t state, uint32_t verb, const char* m);
    void   printSolveProgress(const Event& ev);
    void   printModel(const SolveResult& res) const;
    double elapsedTime() const;
    struct Progress {
        void clear() {
            lines = 0;
            last  = -1;
        }
        int lines;
        int last;
    };
    double   start_;   // time of creation
    double   stTime_;  // time of last state change
    uint32_t verbose_; // verbosity level
    uint32_t state_;   // active subsystem
    Progress progress_;
};
//@}
} // namespace Bsat::Cli
