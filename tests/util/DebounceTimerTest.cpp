#include <gtest/gtest.h>
#include <graphlens/util/DebounceTimer.h>

using namespace graphlens;

TEST(DebounceTimerTest, FiresAfterDelay) {
    DebounceTimer timer(80.0);
    int fired = 0;
    timer.schedule(100.0, [&] { ++fired; });

    EXPECT_FALSE(timer.poll(179.0));
    EXPECT_TRUE(timer.isPending());
    EXPECT_TRUE(timer.poll(180.0));
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(timer.isPending());
    EXPECT_FALSE(timer.poll(500.0));
    EXPECT_EQ(fired, 1);
}

TEST(DebounceTimerTest, RescheduleReplacesPendingCallback) {
    DebounceTimer timer(80.0);
    int first = 0;
    int second = 0;
    timer.schedule(0.0, [&] { ++first; });
    timer.schedule(50.0, [&] { ++second; });

    EXPECT_FALSE(timer.poll(100.0));
    EXPECT_TRUE(timer.poll(130.0));
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST(DebounceTimerTest, CancelPreventsFiring) {
    DebounceTimer timer(10.0);
    int fired = 0;
    timer.schedule(0.0, [&] { ++fired; });
    uint64_t generation = timer.generation();

    timer.cancel();

    EXPECT_GT(timer.generation(), generation);
    EXPECT_FALSE(timer.poll(100.0));
    EXPECT_EQ(fired, 0);
}

TEST(DebounceTimerTest, CallbackMayScheduleAgain) {
    DebounceTimer timer(10.0);
    int fired = 0;
    timer.schedule(0.0, [&] {
        ++fired;
        timer.schedule(10.0, [&] { ++fired; });
    });

    EXPECT_TRUE(timer.poll(10.0));
    EXPECT_TRUE(timer.isPending());
    EXPECT_TRUE(timer.poll(20.0));
    EXPECT_EQ(fired, 2);
}
