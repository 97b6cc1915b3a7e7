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
#include <bsat/solver_strategies.h>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace Bsat::Test {
namespace {
std::vector<uint64_t> take(ScheduleStrategy s, uint32_t n) {
    std::vector<uint64_t> res;
    res.push_back(s.current());
    while (res.size() < n) { res.push_back(s.next()); }
    return res;
}
struct TestEvent : Event {
    TestEvent(Subsystem sys, Verbosity v) : Event(this, sys, v) {}
};
struct RecordingHandler : EventHandler {
    explicit RecordingHandler(Event::Verbosity v) : EventHandler(v) {}
    void onEvent(const Event& ev) override {
        if (const auto* log = event_cast<LogEvent>(ev)) {
            messages.emplace_back(log->msg);
        }
        else if (event_cast<TestEvent>(ev)) {
            ++tests;
        }
    }
    std::vector<std::string> messages;
    uint32_t                 tests{0};
};
} // namespace

TEST_CASE("Schedule strategy", "[strategy]") {
    SECTION("test luby sequence") {
        std::vector<uint32_t> seq;
        for (uint32_t i = 0; i != 15; ++i) { seq.push_back(lubyR(i)); }
        REQUIRE(seq == std::vector<uint32_t>{1, 1, 2, 1, 1, 2, 4, 1, 1, 2, 1, 1, 2, 4, 8});
        REQUIRE(take(ScheduleStrategy::luby(32), 7) == std::vector<uint64_t>{32, 32, 64, 32, 32, 64, 128});
    }
    SECTION("test geometric") {
        REQUIRE(take(ScheduleStrategy::geom(10, 2.0), 4) == std::vector<uint64_t>{10, 20, 40, 80});
        REQUIRE(take(ScheduleStrategy::geom(10, 0.5), 3) == std::vector<uint64_t>{10, 10, 10});
    }
    SECTION("test enabled schedule never yields zero") {
        auto geom = ScheduleStrategy::geom(1, 1.0);
        geom.grow = 0.25f;
        REQUIRE(take(geom, 4) == std::vector<uint64_t>{1, 1, 1, 1});
        REQUIRE(take(ScheduleStrategy::geom(1, 1.0), 3) == std::vector<uint64_t>{1, 1, 1});
    }
    SECTION("test arithmetic") {
        REQUIRE(take(ScheduleStrategy::arith(10, 5), 4) == std::vector<uint64_t>{10, 15, 20, 25});
        REQUIRE(take(ScheduleStrategy::fixed(7), 3) == std::vector<uint64_t>{7, 7, 7});
    }
    SECTION("test none") {
        auto s = ScheduleStrategy::none();
        REQUIRE(s.disabled());
        REQUIRE(s.current() == UINT64_MAX);
        REQUIRE(s.next() == UINT64_MAX);
    }
    SECTION("test invalid base") {
        REQUIRE_THROWS_AS(ScheduleStrategy::fixed(1u << 30), std::invalid_argument);
    }
    SECTION("test outer limit") {
        REQUIRE(take(ScheduleStrategy::geom(1, 2.0, 3), 8) == std::vector<uint64_t>{1, 2, 4, 1, 2, 4, 8, 1});
        REQUIRE(take(ScheduleStrategy::luby(1, 4), 8) == std::vector<uint64_t>{1, 1, 2, 1, 1, 2, 1, 1});
    }
    SECTION("test advance to") {
        for (auto base : {ScheduleStrategy::geom(1, 2.0, 3), ScheduleStrategy::arith(2, 3, 2),
                          ScheduleStrategy::luby(1, 4), ScheduleStrategy::luby(1)}) {
            ScheduleStrategy step = base;
            for (uint32_t n = 0; n != 40; ++n, step.next()) {
                ScheduleStrategy jump = base;
                jump.advanceTo(n);
                INFO("type: " << static_cast<uint32_t>(base.type) << " n: " << n);
                REQUIRE(jump.idx == step.idx);
                REQUIRE(jump.len == step.len);
                REQUIRE(jump.current() == step.current());
            }
        }
    }
}

TEST_CASE("Moving average", "[strategy]") {
    SECTION("test simple") {
        MovingAvg avg(3, MovingAvg::avg_sma);
        REQUIRE_FALSE(avg.push(1));
        REQUIRE_FALSE(avg.push(2));
        REQUIRE(avg.push(3));
        REQUIRE(avg.get() == 2.0);
        avg.push(7);
        REQUIRE(avg.get() == 4.0);
        REQUIRE(avg.samples() == 4u);
        avg.clear();
        REQUIRE(avg.get() == 0.0);
        REQUIRE_FALSE(avg.valid());
    }
    SECTION("test exponential") {
        MovingAvg avg(3, MovingAvg::avg_ema);
        avg.push(2);
        avg.push(4);
        avg.push(6);
        REQUIRE(avg.get() == 4.0);
        avg.push(8);
        REQUIRE(avg.get() == 6.0);
    }
    SECTION("test cumulative") {
        MovingAvg avg(0, MovingAvg::avg_sma);
        for (uint32_t x : {1u, 2u, 3u, 4u}) { REQUIRE(avg.push(x)); }
        REQUIRE(avg.get() == 2.5);
    }
}

TEST_CASE("Restart limits", "[strategy]") {
    SECTION("test dynamic limit") {
        REQUIRE_THROWS_AS(DynamicLimit(1.0f, 0), std::invalid_argument);
        DynamicLimit lim(1.0f, 3);
        for (int i = 0; i != 3; ++i) {
            REQUIRE_FALSE(lim.reached());
            lim.update(1, 2);
        }
        REQUIRE(lim.runLen() == 3u);
        REQUIRE_FALSE(lim.reached());
        lim.restart();
        for (int i = 0; i != 3; ++i) { lim.update(1, 5); }
        REQUIRE(lim.globalAverage() == 3.5);
        REQUIRE(lim.movingAverage() == 5.0);
        REQUIRE(lim.reached());
        lim.restart();
        REQUIRE(lim.runLen() == 0u);
        REQUIRE_FALSE(lim.reached());
    }
    SECTION("test block limit") {
        BlockLimit block(2, 1.5);
        REQUIRE_FALSE(block.push(4));
        REQUIRE(block.push(4));
        REQUIRE(block.scaled() == 6.0);
    }
}

TEST_CASE("Rng", "[strategy]") {
    Rng a(42), b(42);
    for (int i = 0; i != 100; ++i) {
        REQUIRE(a.rand() == b.rand());
        auto x = a.irand(10);
        REQUIRE(x == b.irand(10));
        REQUIRE(x < 10u);
        double d = a.drand();
        REQUIRE(d == b.drand());
        REQUIRE((d >= 0.0 && d < 1.0));
    }
    a.srand(7);
    REQUIRE(a.seed() == 7u);
}

TEST_CASE("Event handler", "[strategy]") {
    RecordingHandler h(Event::verbosity_low);
    REQUIRE(h.verbosity(Event::subsystem_facade) == 1u);
    REQUIRE(h.verbosity(Event::subsystem_load) == 1u);
    REQUIRE(h.verbosity(Event::subsystem_solve) == 1u);

    SECTION("test set verbosity") {
        h.setVerbosity(Event::subsystem_solve, Event::verbosity_max);
        REQUIRE(h.verbosity(Event::subsystem_solve) == 3u);
        REQUIRE(h.verbosity(Event::subsystem_load) == 1u);
        h.setVerbosity(Event::subsystem_load, Event::verbosity_quiet);
        REQUIRE(h.verbosity(Event::subsystem_load) == 0u);
        REQUIRE(h.verbosity(Event::subsystem_facade) == 1u);
    }
    SECTION("test dispatch filters by verbosity") {
        h.dispatch(LogEvent(Event::subsystem_load, Event::verbosity_low, LogEvent::message, nullptr, "low"));
        h.dispatch(LogEvent(Event::subsystem_load, Event::verbosity_high, LogEvent::message, nullptr, "high"));
        h.dispatch(TestEvent(Event::subsystem_solve, Event::verbosity_max));
        REQUIRE(h.messages == std::vector<std::string>{"low"});
        REQUIRE(h.tests == 0u);
        h.setVerbosity(Event::subsystem_solve, Event::verbosity_max);
        h.dispatch(TestEvent(Event::subsystem_solve, Event::verbosity_max));
        REQUIRE(h.tests == 1u);
    }
    SECTION("test event cast") {
        LogEvent  log(Event::subsystem_facade, Event::verbosity_low, LogEvent::warning, nullptr, "w");
        TestEvent test(Event::subsystem_facade, Event::verbosity_low);
        REQUIRE(log.isWarning());
        REQUIRE(event_cast<LogEvent>(log) == &log);
        REQUIRE(event_cast<TestEvent>(log) == nullptr);
        REQUIRE(event_cast<LogEvent>(test) == nullptr);
        REQUIRE(static_cast<uint32_t>(log.id) != static_cast<uint32_t>(test.id));
    }
}

} // namespace Bsat::Test
