#include <gtest/gtest.h>
#include <graphlens/view/HitTester.h>

using namespace graphlens;

TEST(HitTesterTest, HitInsideDisc) {
    std::vector<float> positions{0, 0, 100, 0};
    std::vector<float> sizes{10, 10};

    EXPECT_EQ(hitTestNode({2, 2}, positions, sizes), 0u);
    EXPECT_EQ(hitTestNode({103, 0}, positions, sizes), 1u);
}

TEST(HitTesterTest, RimIsAMiss) {
    std::vector<float> positions{0, 0};
    std::vector<float> sizes{10};

    EXPECT_FALSE(hitTestNode({5, 0}, positions, sizes).has_value());
    EXPECT_TRUE(hitTestNode({4.99f, 0}, positions, sizes).has_value());
}

TEST(HitTesterTest, NearestOverlappingNodeWins) {
    std::vector<float> positions{0, 0, 6, 0};
    std::vector<float> sizes{20, 20};

    EXPECT_EQ(hitTestNode({4, 0}, positions, sizes), 1u);
    EXPECT_EQ(hitTestNode({2, 0}, positions, sizes), 0u);
}

TEST(HitTesterTest, RadiusScaleWidensTarget) {
    std::vector<float> positions{0, 0};
    std::vector<float> sizes{10};

    EXPECT_FALSE(hitTestNode({6, 0}, positions, sizes).has_value());
    EXPECT_EQ(hitTestNode({6, 0}, positions, sizes, HOVER_HIT_BUFFER), 0u);
}

TEST(HitTesterTest, ScansShorterArray) {
    std::vector<float> positions{0, 0, 50, 50};
    std::vector<float> sizes{10};

    EXPECT_FALSE(hitTestNode({50, 50}, positions, sizes).has_value());
    EXPECT_FALSE(hitTestNode({0, 0}, {}, sizes).has_value());
}
