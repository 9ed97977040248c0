#include <catch2/catch_test_macros.hpp>

#include "timer_queue.hpp"

#include <chrono>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("TimerQueue", "[timer]") {
    TimerQueue::TimePoint now{};
    TimerQueue timers([&] { return now; });
    std::vector<int> fired;

    SECTION("FiresInDeadlineOrder") {
        timers.schedule(300ms, [&] { fired.push_back(3); });
        timers.schedule(100ms, [&] { fired.push_back(1); });
        timers.schedule(200ms, [&] { fired.push_back(2); });

        now += 150ms;
        REQUIRE(timers.run_due() == 1);
        now += 1s;
        REQUIRE(timers.run_due() == 2);
        REQUIRE(fired == std::vector{1, 2, 3});
        REQUIRE(timers.size() == 0);
    }

    SECTION("EqualDeadlinesKeepSchedulingOrder") {
        timers.schedule(50ms, [&] { fired.push_back(1); });
        timers.schedule(50ms, [&] { fired.push_back(2); });
        now += 50ms;
        timers.run_due();
        REQUIRE(fired == std::vector{1, 2});
    }

    SECTION("Cancel") {
        auto id = timers.schedule(100ms, [&] { fired.push_back(1); });
        REQUIRE(timers.cancel(id));
        REQUIRE_FALSE(timers.cancel(id));
        now += 1s;
        REQUIRE(timers.run_due() == 0);
        REQUIRE(fired.empty());
    }

    SECTION("CallbackCanReschedule") {
        timers.schedule(10ms, [&] {
            fired.push_back(1);
            timers.schedule(0ms, [&] { fired.push_back(2); });
        });
        now += 10ms;
        REQUIRE(timers.run_due() == 2);
        REQUIRE(fired == std::vector{1, 2});
    }

    SECTION("NextTimeout") {
        REQUIRE(timers.next_timeout_ms() == -1);
        timers.schedule(5000ms, [] {});
        REQUIRE(timers.next_timeout_ms() == 5000);
        now += 4999ms + 500us;
        REQUIRE(timers.next_timeout_ms() == 1);
        now += 1s;
        REQUIRE(timers.next_timeout_ms() == 0);
    }
}
