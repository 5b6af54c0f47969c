// tests/test_timer_queue.cpp
// @brief Tests for the timer queue and keyed debouncer using a manual clock.
// @invariant Callbacks fire only from runDue() once their deadline passes.
// @ownership Test owns the clock value, queue, and debouncer.

#include <gtest/gtest.h>

#include "syndrql/highlight/timer_queue.hpp"

#include <string>
#include <vector>

using namespace syndrql::highlight;

namespace
{
struct ManualClock
{
    Millis now{0};

    Clock fn()
    {
        return [this] { return now; };
    }
};
} // namespace

TEST(TimerQueue, FiresInDeadlineOrder)
{
    ManualClock clock;
    TimerQueue queue(clock.fn());
    std::vector<std::string> fired;
    queue.schedule(Millis(30), [&] { fired.push_back("late"); });
    queue.schedule(Millis(10), [&] { fired.push_back("early"); });
    queue.schedule(Millis(10), [&] { fired.push_back("early2"); });

    clock.now = Millis(9);
    EXPECT_EQ(queue.runDue(), 0u);
    ASSERT_TRUE(queue.nextDeadline().has_value());
    EXPECT_EQ(*queue.nextDeadline(), Millis(10));

    clock.now = Millis(30);
    EXPECT_EQ(queue.runDue(), 3u);
    EXPECT_EQ(fired, (std::vector<std::string>{"early", "early2", "late"}));
    EXPECT_EQ(queue.pending(), 0u);
    EXPECT_FALSE(queue.nextDeadline().has_value());
}

TEST(TimerQueue, CancelledTimersNeverFire)
{
    ManualClock clock;
    TimerQueue queue(clock.fn());
    int count = 0;
    const TimerId id = queue.schedule(Millis(5), [&] { ++count; });
    EXPECT_NE(id, 0u);
    EXPECT_TRUE(queue.isPending(id));
    EXPECT_TRUE(queue.cancel(id));
    EXPECT_FALSE(queue.cancel(id));
    clock.now = Millis(100);
    EXPECT_EQ(queue.runDue(), 0u);
    EXPECT_EQ(count, 0);
}

TEST(TimerQueue, CallbacksMayReschedule)
{
    ManualClock clock;
    TimerQueue queue(clock.fn());
    int count = 0;
    queue.schedule(Millis(1),
                   [&]
                   {
                       ++count;
                       queue.schedule(Millis(1), [&] { ++count; });
                   });
    clock.now = Millis(1);
    EXPECT_EQ(queue.runDue(), 1u);
    EXPECT_EQ(queue.pending(), 1u);
    clock.now = Millis(2);
    EXPECT_EQ(queue.runDue(), 1u);
    EXPECT_EQ(count, 2);
}

TEST(Debouncer, RetriggerRestartsQuietPeriod)
{
    ManualClock clock;
    TimerQueue queue(clock.fn());
    Debouncer debounce(queue, Millis(200));
    int fired = 0;

    for (int i = 0; i < 5; ++i)
    {
        clock.now = Millis(i * 50);
        debounce.trigger("stmt", [&] { ++fired; });
        queue.runDue();
    }
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(debounce.pending(), 1u);

    clock.now = Millis(399);
    queue.runDue();
    EXPECT_EQ(fired, 0);

    clock.now = Millis(400);
    queue.runDue();
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(debounce.isPending("stmt"));
}

TEST(Debouncer, KeysAreIndependent)
{
    ManualClock clock;
    TimerQueue queue(clock.fn());
    Debouncer debounce(queue, Millis(100));
    std::vector<std::string> fired;
    debounce.trigger("a", [&] { fired.push_back("a"); });
    debounce.trigger("b", [&] { fired.push_back("b"); });
    EXPECT_EQ(debounce.pending(), 2u);
    EXPECT_TRUE(debounce.cancel("a"));
    EXPECT_FALSE(debounce.cancel("a"));

    clock.now = Millis(100);
    queue.runDue();
    EXPECT_EQ(fired, std::vector<std::string>{"b"});

    debounce.trigger("c", [&] { fired.push_back("c"); });
    debounce.cancelAll();
    clock.now = Millis(500);
    EXPECT_EQ(queue.runDue(), 0u);
}
