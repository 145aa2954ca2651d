#include <gtest/gtest.h>
#include <graphlens/render/Palette.h>

using namespace graphlens;

namespace {

void expectColorNear(const Color& actual, const Color& expected) {
    EXPECT_NEAR(actual.r, expected.r, 1e-4f);
    EXPECT_NEAR(actual.g, expected.g, 1e-4f);
    EXPECT_NEAR(actual.b, expected.b, 1e-4f);
    EXPECT_NEAR(actual.a, expected.a, 1e-4f);
}

}  // namespace

TEST(PaletteTest, HslPrimaries) {
    expectColorNear(hsla(0, 100, 50), {1, 0, 0, 1});
    expectColorNear(hsla(120, 100, 50), {0, 1, 0, 1});
    expectColorNear(hsla(240, 100, 50, 0.5f), {0, 0, 1, 0.5f});
}

TEST(PaletteTest, HueWrapsAround) {
    expectColorNear(hsla(360 + 120, 100, 50), hsla(120, 100, 50));
    expectColorNear(hsla(-120, 100, 50), hsla(240, 100, 50));
}

TEST(PaletteTest, SaturationAndLightnessClamp) {
    expectColorNear(hsla(30, 150, 50), hsla(30, 100, 50));
    expectColorNear(hsla(30, 50, 120), {1, 1, 1, 1});
}

TEST(PaletteTest, GreyMatchesDimmedConstants) {
    expectColorNear(hsla(0, 0, 70, 0.1f), Colors::DIMMED_NODE);
    expectColorNear(hsla(0, 0, 20, 0.1f), Colors::DIMMED_EDGE);
}

TEST(PaletteTest, NodeHueHashesDecimalDigits) {
    EXPECT_EQ(nodeIdHash(0), 48u);
    EXPECT_EQ(nodeIdHash(12), 49u * 31u + 50u);
    EXPECT_FLOAT_EQ(nodeHue(12), static_cast<float>((49u * 31u + 50u) % 360u));
}

TEST(PaletteTest, NodeSaturationGrowsWithDegree) {
    GraphData graph({{"Hub", {0, 0}}, {"Leaf", {1, 0}}, {"Lonely", {2, 0}}},
                    {{0, 1, EdgeType::Derivative}}, 1);

    expectColorNear(nodeColour(graph, 0, 60), hsla(nodeHue(0), 100, 60));
    expectColorNear(nodeColour(graph, 2, 60), hsla(nodeHue(2), 20, 60));
    expectColorNear(nodeColour(graph, 2, 60, HOVER_SATURATION_BOOST), hsla(nodeHue(2), 30, 60));
}

TEST(PaletteTest, EdgeTypeHues) {
    EXPECT_FLOAT_EQ(edgeTypeHue(EdgeType::Derivative), 0.0f);
    EXPECT_FLOAT_EQ(edgeTypeHue(EdgeType::Subgenre), 120.0f);
    EXPECT_FLOAT_EQ(edgeTypeHue(EdgeType::FusionGenre), 240.0f);
    expectColorNear(edgeTypeColour(EdgeType::Subgenre, 70, 0.08f), hsla(120, 70, Lightness::EDGE, 0.08f));
}

TEST(PaletteTest, ThemeValues) {
    EXPECT_FLOAT_EQ(nodeLightness(Theme::Dark), Lightness::NODE_DARK);
    EXPECT_FLOAT_EQ(nodeLightness(Theme::Light), Lightness::NODE_LIGHT);
    EXPECT_EQ(backgroundColour(Theme::Dark), Colors::BACKGROUND_DARK);
    EXPECT_EQ(backgroundColour(Theme::Light), Colors::BACKGROUND_LIGHT);
}
