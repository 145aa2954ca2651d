#include <gtest/gtest.h>
#include <graphlens/render/FrameStyler.h>
#include <graphlens/render/Palette.h>

using namespace graphlens;

class FrameStylerTest : public ::testing::Test {
protected:
    // Chain 0 -> 1 -> 2 -> 3 plus 4 -> 3 (subgenre); max degree 2
    GraphData graph{
        {{"A", {0, 0}}, {"B", {10, 0}}, {"C", {20, 0}}, {"D", {30, 0}}, {"E", {30, 10}}},
        {{0, 1, EdgeType::Derivative},
         {1, 2, EdgeType::Derivative},
         {2, 3, EdgeType::Derivative},
         {4, 3, EdgeType::Subgenre}}};
    ViewSettings settings;
    HighlightState state;

    void select(NodeId id) {
        state.selected = id;
        state.selectionNet = computeCoverageNet(graph, id, settings.visibleTypes, settings.maxDistance());
    }

    void hover(NodeId id) {
        state.hovered = id;
        state.hoverNet = computeCoverageNet(graph, id, settings.visibleTypes, settings.maxDistance());
    }

    FrameStyle style() const { return FrameStyler(graph, settings, state).compute(); }
};

namespace {

void expectColorNear(const Color& actual, const Color& expected) {
    EXPECT_NEAR(actual.r, expected.r, 1e-4f);
    EXPECT_NEAR(actual.g, expected.g, 1e-4f);
    EXPECT_NEAR(actual.b, expected.b, 1e-4f);
    EXPECT_NEAR(actual.a, expected.a, 1e-4f);
}

}  // namespace

TEST_F(FrameStylerTest, BufferSizesFollowGraph) {
    FrameStyle s = style();

    EXPECT_EQ(s.nodeColors.size(), 5u * 4u);
    EXPECT_EQ(s.nodeSizes.size(), 5u);
    EXPECT_EQ(s.edgeColors.size(), 4u * 8u);
}

TEST_F(FrameStylerTest, IdleColoursAndSizes) {
    FrameStyler styler(graph, settings, state);

    expectColorNear(styler.nodeColor(1), nodeColour(graph, 1, Lightness::NODE_DARK));
    expectColorNear(styler.edgeColor(0), edgeTypeColour(EdgeType::Derivative, 70, 0.08f));
    EXPECT_FLOAT_EQ(styler.nodeSize(0), 9.0f);
    EXPECT_FLOAT_EQ(styler.nodeSize(1), 15.0f);
}

TEST_F(FrameStylerTest, LightThemeUsesLighterNodes) {
    settings.theme = Theme::Light;
    FrameStyler styler(graph, settings, state);

    expectColorNear(styler.nodeColor(2), nodeColour(graph, 2, Lightness::NODE_LIGHT));
}

TEST_F(FrameStylerTest, SelectionHighlightsNetWithinBudget) {
    select(0);
    FrameStyler styler(graph, settings, state);

    EXPECT_TRUE(styler.isHighlightedBySelection(0));
    EXPECT_TRUE(styler.isHighlightedBySelection(1));
    EXPECT_TRUE(styler.isHighlightedBySelection(2));
    // Distance 3 equals the hop budget and is not highlighted
    EXPECT_FALSE(styler.isHighlightedBySelection(3));
    EXPECT_FALSE(styler.isHighlightedBySelection(4));

    EXPECT_EQ(styler.nodeColor(3), Colors::DIMMED_NODE);
    EXPECT_FLOAT_EQ(styler.nodeSize(3), 15.0f - FrameStyler::DIMMED_SIZE_PENALTY);
    EXPECT_FLOAT_EQ(styler.nodeSize(4), 9.0f - FrameStyler::DIMMED_SIZE_PENALTY);
}

TEST_F(FrameStylerTest, SelectedEdgesByDirectionAndDistance) {
    select(1);
    FrameStyler styler(graph, settings, state);

    // Incoming to the selected node
    expectColorNear(styler.edgeColor(0), edgeTypeColour(EdgeType::Derivative, 40, 0.8f));
    // Outgoing from the selected node
    expectColorNear(styler.edgeColor(1), edgeTypeColour(EdgeType::Derivative, 90, 0.8f));
    // Two hops away: factor 1/3
    expectColorNear(styler.edgeColor(2),
                    edgeTypeColour(EdgeType::Derivative, 100.0f / 3.0f, 0.4f + 0.4f / 3.0f));
    EXPECT_EQ(styler.edgeColor(3), Colors::DIMMED_EDGE);
}

TEST_F(FrameStylerTest, EdgeAtHopBudgetIsDimmed) {
    select(0);
    FrameStyler styler(graph, settings, state);

    EXPECT_EQ(styler.edgeColor(2), Colors::DIMMED_EDGE);
}

TEST_F(FrameStylerTest, HoverWithoutSelection) {
    hover(1);
    FrameStyler styler(graph, settings, state);

    expectColorNear(styler.nodeColor(2), nodeColour(graph, 2, Lightness::NODE_DARK, HOVER_SATURATION_BOOST));
    expectColorNear(styler.nodeColor(0), nodeColour(graph, 0, Lightness::NODE_DARK));
    expectColorNear(styler.edgeColor(1),
                    edgeTypeColour(EdgeType::Derivative, 80.0f * 2.0f / 3.0f, 0.3f + 0.4f * 2.0f / 3.0f));
    expectColorNear(styler.edgeColor(0), edgeTypeColour(EdgeType::Derivative, 70, 0.08f));
    EXPECT_FLOAT_EQ(styler.nodeSize(1), 15.0f + FrameStyler::HOVERED_SIZE_BONUS);
}

TEST_F(FrameStylerTest, HoverNetPreviewedInsideSelection) {
    select(4);
    hover(0);
    FrameStyler styler(graph, settings, state);

    expectColorNear(styler.nodeColor(1), nodeColour(graph, 1, Lightness::NODE_DARK, HOVER_SATURATION_BOOST));
    // Hovered node keeps its normal colour even outside the selection
    expectColorNear(styler.nodeColor(0), nodeColour(graph, 0, Lightness::NODE_DARK));
    EXPECT_FLOAT_EQ(styler.nodeSize(1), 15.0f);
}

TEST_F(FrameStylerTest, FocusedNodeGrows) {
    state.focused = 2;
    FrameStyler styler(graph, settings, state);

    EXPECT_FLOAT_EQ(styler.nodeSize(2), 15.0f + FrameStyler::FOCUSED_SIZE_BONUS);
}

TEST_F(FrameStylerTest, PathHighlightsConsecutivePairsOnly) {
    select(0);
    state.path = std::vector<NodeId>{0, 1, 2};
    FrameStyler styler(graph, settings, state);

    EXPECT_TRUE(styler.isHighlightedBySelection(2));
    EXPECT_FALSE(styler.isHighlightedBySelection(3));
    expectColorNear(styler.edgeColor(0), edgeTypeColour(EdgeType::Derivative, 90, 0.8f));
    expectColorNear(styler.edgeColor(1), edgeTypeColour(EdgeType::Derivative, 90, 0.8f));
    EXPECT_EQ(styler.edgeColor(2), Colors::DIMMED_EDGE);
}

TEST_F(FrameStylerTest, HiddenTypeIsTransparentAndHasNoArrow) {
    settings.visibleTypes[edgeTypeIndex(EdgeType::Subgenre)] = false;
    FrameStyle s = style();

    EXPECT_FLOAT_EQ(s.edgeColors[3 * 8 + 3], 0.0f);
    EXPECT_EQ(s.arrows.count(), 3u);
}

TEST_F(FrameStylerTest, ArrowsPointAtTargets) {
    FrameStyle s = style();

    ASSERT_EQ(s.arrows.count(), 4u);
    EXPECT_FLOAT_EQ(s.arrows.targets[0], 10.0f);
    EXPECT_FLOAT_EQ(s.arrows.directions[0], 10.0f);
    EXPECT_FLOAT_EQ(s.arrows.directions[1], 0.0f);
    EXPECT_FLOAT_EQ(s.arrows.targetSizes[0], s.nodeSizes[1]);
    EXPECT_EQ(s.arrows.colors.size(), 16u);
}

TEST(FrameStylerEdgeCaseTest, UnresolvableAndZeroLengthEdges) {
    GraphData graph({{"A", {0, 0}}, {"B", {0, 0}}},
                    {{0, 1, EdgeType::Derivative}, {0, 9, EdgeType::Derivative}});
    ViewSettings settings;
    HighlightState state;
    FrameStyler styler(graph, settings, state);

    EXPECT_EQ(styler.edgeColor(1), Colors::TRANSPARENT);
    EXPECT_TRUE(styler.compute().arrows.empty());
}
