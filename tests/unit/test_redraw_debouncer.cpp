#include <chrono>
#include <gtest/gtest.h>

#include "anim/redraw_debouncer.hpp"

using namespace tracemark;
using namespace std::chrono_literals;

namespace
{

RedrawDebouncer::TimePoint at(int ms)
{
    return RedrawDebouncer::TimePoint(std::chrono::milliseconds(ms));
}

}   // namespace

TEST(RedrawDebouncer, NothingPendingInitially)
{
    RedrawDebouncer d;
    EXPECT_FALSE(d.pending());
    EXPECT_FALSE(d.poll(at(1000)));
    EXPECT_EQ(d.fire_count(), 0u);
}

TEST(RedrawDebouncer, FiresAfterDelay)
{
    RedrawDebouncer d(10ms);
    int             fired = 0;
    d.set_callback([&]() { ++fired; });

    d.request(at(0));
    EXPECT_TRUE(d.pending());
    EXPECT_FALSE(d.poll(at(9)));
    EXPECT_TRUE(d.poll(at(10)));
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(d.pending());
    EXPECT_FALSE(d.poll(at(50)));
}

TEST(RedrawDebouncer, BurstCollapsesIntoOneRedraw)
{
    RedrawDebouncer d(10ms);
    int             fired = 0;
    d.set_callback([&]() { ++fired; });

    for (int t = 0; t < 50; t += 5)
    {
        d.request(at(t));
        d.poll(at(t));
    }
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(d.request_count(), 10u);

    // Last request at 45 ms: deadline moved to 55 ms.
    EXPECT_FALSE(d.poll(at(54)));
    EXPECT_TRUE(d.poll(at(55)));
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(d.fire_count(), 1u);
}

TEST(RedrawDebouncer, CancelDropsPendingRedraw)
{
    RedrawDebouncer d(10ms);
    int             fired = 0;
    d.set_callback([&]() { ++fired; });
    d.request(at(0));
    d.cancel();
    EXPECT_FALSE(d.poll(at(100)));
    EXPECT_EQ(fired, 0);
}

TEST(RedrawDebouncer, DeadlineReflectsDelay)
{
    RedrawDebouncer d(25ms);
    d.request(at(100));
    ASSERT_TRUE(d.deadline().has_value());
    EXPECT_EQ(*d.deadline(), at(125));

    d.set_delay(5ms);
    d.request(at(200));
    EXPECT_EQ(*d.deadline(), at(205));
}

TEST(RedrawDebouncer, NoCallbackStillClears)
{
    RedrawDebouncer d(1ms);
    d.request(at(0));
    EXPECT_TRUE(d.poll(at(1)));
    EXPECT_FALSE(d.pending());
}
