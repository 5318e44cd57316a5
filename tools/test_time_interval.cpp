// test_time_interval.cpp - Unit test for TimeInterval and IntervalStream
//
// Tests:
// 1. Interval construction, scaling and lengths
// 2. Overlap and containment rules (shared boundaries do not overlap)
// 3. IntervalStream on/off bookkeeping and toggle errors

#include "timeline/interval_stream.hpp"
#include "timeline/time_interval.hpp"
#include "tlan/tlan_error.hpp"
#include <iostream>
#include <string>

using namespace radex;
using namespace radex::timeline;

static int pass = 0, fail = 0;

static void check(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "  [PASS] " << what << "\n";
        pass++;
    } else {
        std::cout << "  [FAIL] " << what << "\n";
        fail++;
    }
}

template <typename E, typename F>
static bool throws(F f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

int main() {
    std::cout << "=== TimeInterval / IntervalStream Unit Test ===\n\n";

    // ========================================================================
    // TEST 1: Construction
    // ========================================================================
    std::cout << "TEST 1: Construction\n";
    {
        check(throws<std::invalid_argument>([] { TimeInterval(1, 0); }),
              "end before begin is rejected");

        TimeInterval null(0, 0);
        check(null == null * 2 && null == null * 20, "empty interval scales to itself");
        check(null.length() == 0.0, "empty interval has length 0");

        TimeInterval a(1, 2);
        check(a * 2 == TimeInterval(2, 4), "(1, 2) * 2 == (2, 4)");
        check(a * 0 == null, "(1, 2) * 0 == (0, 0)");
        check(TimeInterval(2, 4) / 2 == a, "(2, 4) / 2 == (1, 2)");
        check(a.asPair() == std::make_pair(1.0, 2.0), "asPair()");
        check(TimeInterval(0, 4).length() == 4, "length of (0, 4) is 4");
        check(a.toString() == "TimeInterval(1, 2)", "toString()");
    }

    // ========================================================================
    // TEST 2: Overlap rules
    // ========================================================================
    std::cout << "\nTEST 2: Overlap\n";
    {
        TimeInterval a(1, 2);
        TimeInterval b(0, 4);
        TimeInterval c(2, 4);
        TimeInterval null(0, 0);

        check(a.overlapsWith(b) && b.overlapsWith(a), "(1, 2) and (0, 4) overlap");
        check(!a.overlapsWith(c) && !c.overlapsWith(a), "shared boundary is no overlap");
        check(!a.overlapsWith(null) && !b.overlapsWith(null), "empty interval at 0 overlaps nothing");
        check(b.overlapsWith(c), "(0, 4) and (2, 4) overlap");

        check(throws<OverlapError>([&] { a.checkOverlap(b); }), "checkOverlap throws OverlapError");
        check(!throws<OverlapError>([&] { a.checkOverlap(c); }), "checkOverlap accepts neighbours");

        check(a.within(b) && !b.within(a), "(1, 2) within (0, 4)");
        check(c.within(b), "shared boundaries count as within");
        check(a.withinAny({c, b}) && !b.withinAny({a, c}), "withinAny()");
        check(a.overlapsAny({null, b}) && !a.overlapsAny({null, c}), "overlapsAny()");
    }

    // ========================================================================
    // TEST 3: IntervalStream
    // ========================================================================
    std::cout << "\nTEST 3: IntervalStream\n";
    {
        IntervalStream empty("empty");
        check(empty.name() == "empty" && empty.isOff() && empty.count() == 0,
              "new stream is off and empty");
        check(empty.intervals().empty(), "no intervals");
        check(throws<std::logic_error>([&] { empty.lastTurnOn(); }), "lastTurnOn() on empty stream");
        check(throws<std::logic_error>([&] { empty.lastTurnOff(); }), "lastTurnOff() on empty stream");

        IntervalStream open("open");
        open.turnOn(1, 1);
        check(open.isOn() && open.count() == 1, "open stream is on");
        check(throws<std::logic_error>([&] { open.intervals(); }), "intervals() of open stream");
        check(throws<std::logic_error>([&] { open.lastTurnOff(); }), "lastTurnOff() of open stream");
        check(open.lastTurnOn() == 1, "lastTurnOn() == 1");

        IntervalStream closed("closed");
        closed.turnOn(1, 1);
        closed.turnOff(2, 2);
        check(closed.isOff() && closed.count() == 1, "closed stream is off");
        check(closed.intervals() == TimeIntervalList{TimeInterval(1, 2)}, "intervals() == [(1, 2)]");
        check(closed.lastTurnOn() == 1 && closed.lastTurnOff() == 2, "last toggles");

        closed.turnOn(5, 3);
        check(closed.lastTurnOff() == 2, "lastTurnOff() while on again gives previous off");

        bool threw_on = false;
        try {
            closed.turnOn(6, 7);
        } catch (const tlan::TlanError& e) {
            threw_on = e.line() == 7;
        }
        check(threw_on, "turning on twice is a TlanError at its line");

        check(throws<tlan::TlanError>([&] { closed.turnOff(4, 8); }),
              "turning off before turning on is a TlanError");
        check(throws<tlan::TlanError>([&] { empty.turnOff(1, 9); }),
              "turning off an off stream is a TlanError");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All time interval tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
