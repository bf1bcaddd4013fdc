#include <gtest/gtest.h>

#include <quay/stack_panel.hpp>
#include <quay/tab_panel.hpp>

#include "test_panels.hpp"

using namespace quay;
using quay::test::make_panel;
using quay::test::title_of;

namespace
{

std::shared_ptr<TabPanel> tabs_with(const std::string& title)
{
    auto tabs = TabPanel::create();
    tabs->add_panel(make_panel(title));
    return tabs;
}

}   // namespace

// ─── Insertion ──────────────────────────────────────────────────────────────

TEST(StackPanel, AddPanelAdoptsContainers)
{
    auto stack = StackPanel::create(Axis::Horizontal);
    auto tabs  = tabs_with("a");
    stack->add_panel(tabs);

    EXPECT_EQ(stack->panels_len(), 1u);
    EXPECT_EQ(tabs->parent(), stack);
    EXPECT_EQ(stack->group().count(), 1u);
}

TEST(StackPanel, DuplicateInsertIsIgnored)
{
    auto stack = StackPanel::create(Axis::Horizontal);
    auto tabs  = tabs_with("a");
    stack->add_panel(tabs);
    stack->add_panel(tabs);
    stack->add_panel(PanelView());
    EXPECT_EQ(stack->panels_len(), 1u);
    EXPECT_EQ(stack->group().count(), 1u);
}

TEST(StackPanel, AddPanelAtHonoursPlacementSide)
{
    auto stack  = StackPanel::create(Axis::Horizontal);
    auto middle = tabs_with("middle");
    auto left   = tabs_with("left");
    auto right  = tabs_with("right");
    stack->add_panel(middle);
    stack->add_panel_at(left, Placement::Left);
    stack->add_panel_at(right, Placement::Right);

    ASSERT_EQ(stack->panels_len(), 3u);
    EXPECT_EQ(stack->panels()[0], PanelView(left));
    EXPECT_EQ(stack->panels()[1], PanelView(middle));
    EXPECT_EQ(stack->panels()[2], PanelView(right));
}

TEST(StackPanel, InsertPanelAtIsRelativeToIndex)
{
    auto stack = StackPanel::create(Axis::Vertical);
    auto a     = tabs_with("a");
    auto b     = tabs_with("b");
    stack->add_panel(a);
    stack->add_panel(b);

    auto above_b = tabs_with("above b");
    auto below_a = tabs_with("below a");
    stack->insert_panel_at(above_b, 1, Placement::Top);
    stack->insert_panel_at(below_a, 0, Placement::Bottom);

    EXPECT_EQ(stack->index_of_panel(a), std::optional<size_t>(0));
    EXPECT_EQ(stack->index_of_panel(below_a), std::optional<size_t>(1));
    EXPECT_EQ(stack->index_of_panel(above_b), std::optional<size_t>(2));
    EXPECT_EQ(stack->index_of_panel(b), std::optional<size_t>(3));
}

TEST(StackPanel, StackCannotContainItself)
{
    auto stack = StackPanel::create(Axis::Horizontal);
    stack->add_panel(stack);
    EXPECT_EQ(stack->panels_len(), 0u);
}

// ─── Removal ────────────────────────────────────────────────────────────────

TEST(StackPanel, RemovePanelClearsParent)
{
    auto stack = StackPanel::create(Axis::Horizontal);
    auto a     = tabs_with("a");
    auto b     = tabs_with("b");
    stack->add_panel(a);
    stack->add_panel(b);

    EXPECT_TRUE(stack->remove_panel(a));
    EXPECT_EQ(a->parent(), nullptr);
    EXPECT_EQ(stack->panels_len(), 1u);
    EXPECT_FALSE(stack->remove_panel(a));
}

TEST(StackPanel, RootNeverRemovesItself)
{
    auto root = StackPanel::create(Axis::Horizontal);
    auto a    = make_panel("a");
    auto tabs = TabPanel::create();
    tabs->add_panel(a);
    root->add_panel(tabs);

    tabs->remove_panel(a);
    EXPECT_EQ(root->panels_len(), 0u);
    EXPECT_TRUE(root->is_root());
    EXPECT_EQ(root->left_top_tab_panel(), nullptr);
}

TEST(StackPanel, EmptyingNestedStacksPropagatesUp)
{
    // root: H[ tabsA, V[ tabsB, tabsC ] ]
    auto root  = StackPanel::create(Axis::Horizontal);
    auto a     = make_panel("A");
    auto b     = make_panel("B");
    auto c     = make_panel("C");
    auto tabsA = TabPanel::create();
    tabsA->add_panel(a);
    root->add_panel(tabsA);
    auto tabsB = tabsA->split_panel(b, Placement::Right);
    ASSERT_NE(tabsB, nullptr);
    auto tabsC = tabsB->split_panel(c, Placement::Bottom);
    ASSERT_NE(tabsC, nullptr);

    ASSERT_EQ(root->panels_len(), 2u);
    auto nested = root->panels()[1].downcast<StackPanel>();
    ASSERT_NE(nested, nullptr);
    EXPECT_EQ(nested->axis(), Axis::Vertical);
    EXPECT_EQ(nested->parent(), root);
    EXPECT_EQ(tabsB->parent(), nested);

    tabsC->remove_panel(c);
    EXPECT_EQ(nested->panels_len(), 1u);
    EXPECT_EQ(root->panels_len(), 2u);

    tabsB->remove_panel(b);
    EXPECT_EQ(nested->panels_len(), 0u);
    ASSERT_EQ(root->panels_len(), 1u);
    EXPECT_EQ(root->panels()[0], PanelView(tabsA));
}

TEST(StackPanel, ReplacePanelAdoptsNewChild)
{
    auto stack = StackPanel::create(Axis::Horizontal);
    auto a     = tabs_with("a");
    auto b     = tabs_with("b");
    stack->add_panel(a);

    EXPECT_TRUE(stack->replace_panel(a, b));
    EXPECT_EQ(stack->panels()[0], PanelView(b));
    EXPECT_EQ(b->parent(), stack);
    EXPECT_FALSE(stack->replace_panel(a, b));
}

// ─── Queries ────────────────────────────────────────────────────────────────

TEST(StackPanel, IsLastPanelWalksAncestors)
{
    auto root   = StackPanel::create(Axis::Horizontal);
    auto nested = StackPanel::create(Axis::Vertical);
    auto tabs   = tabs_with("a");
    nested->add_panel(tabs);
    root->add_panel(nested);
    EXPECT_TRUE(nested->is_last_panel());

    root->add_panel(tabs_with("b"));
    EXPECT_FALSE(nested->is_last_panel());
}

TEST(StackPanel, LeftTopAndRightTopTabPanels)
{
    auto root   = StackPanel::create(Axis::Horizontal);
    auto first  = tabs_with("first");
    auto nested = StackPanel::create(Axis::Vertical);
    auto top    = tabs_with("top");
    auto bottom = tabs_with("bottom");
    nested->add_panel(top);
    nested->add_panel(bottom);
    root->add_panel(first);
    root->add_panel(nested);

    EXPECT_EQ(root->left_top_tab_panel(), first);
    EXPECT_EQ(root->right_top_tab_panel(), top);
    EXPECT_EQ(nested->left_top_tab_panel(true), first);
}

TEST(StackPanel, ForEachLeafPanelVisitsInOrder)
{
    auto root   = StackPanel::create(Axis::Horizontal);
    auto nested = StackPanel::create(Axis::Vertical);
    auto t1     = tabs_with("1");
    t1->add_panel(make_panel("2"));
    nested->add_panel(tabs_with("3"));
    root->add_panel(t1);
    root->add_panel(nested);

    std::vector<std::string> seen;
    root->for_each_leaf_panel([&](const PanelView& p) { seen.push_back(title_of(p)); });
    EXPECT_EQ(seen, (std::vector<std::string>{"1", "2", "3"}));
}

// ─── Layout and dump ────────────────────────────────────────────────────────

TEST(StackPanel, LayoutSplitsBoundsAlongAxis)
{
    auto stack = StackPanel::create(Axis::Horizontal);
    auto a     = tabs_with("a");
    auto b     = tabs_with("b");
    stack->add_panel(a);
    stack->add_panel(b);
    stack->layout({0, 0, 800, 600});

    EXPECT_EQ(a->bounds(), (Rect{0, 0, 400, 600}));
    EXPECT_EQ(b->bounds(), (Rect{400, 0, 400, 600}));
}

TEST(StackPanel, DumpEmptyIsEmptyTabs)
{
    auto stack = StackPanel::create(Axis::Horizontal);
    EXPECT_EQ(stack->dump(), DockItemState::tabs({}));
}

TEST(StackPanel, DumpSingleChildSkipsSplit)
{
    auto stack = StackPanel::create(Axis::Horizontal);
    auto a     = tabs_with("a");
    stack->add_panel(a);
    EXPECT_EQ(stack->dump(), a->dump());
}

TEST(StackPanel, DumpThreeChildrenAsRightNestedChain)
{
    auto stack = StackPanel::create(Axis::Horizontal);
    stack->add_panel(tabs_with("a"));
    stack->add_panel(tabs_with("b"));
    stack->add_panel(tabs_with("c"));
    stack->layout({0, 0, 900, 300});

    DockItemState d = stack->dump();
    ASSERT_TRUE(d.is_split());
    EXPECT_EQ(d.info.axis, Axis::Horizontal);
    EXPECT_NEAR(d.info.fraction, 1.0f / 3.0f, 1e-5f);
    ASSERT_TRUE(d.first()->is_tabs());
    ASSERT_TRUE(d.second()->is_split());
    EXPECT_NEAR(d.second()->info.fraction, 0.5f, 1e-5f);
    EXPECT_EQ(d.second()->second()->children.front().info.panel_state, "\"c\"");
}

TEST(StackPanel, DumpSplicesSameAxisChildStacks)
{
    auto root  = StackPanel::create(Axis::Horizontal);
    auto inner = StackPanel::create(Axis::Horizontal);
    inner->add_panel(tabs_with("a"));
    inner->add_panel(tabs_with("b"));
    root->add_panel(inner);
    root->add_panel(tabs_with("c"));
    root->layout({0, 0, 1200, 300});   // a 300, b 300, c 600

    DockItemState d = root->dump();
    ASSERT_TRUE(d.is_split());
    EXPECT_NEAR(d.info.fraction, 0.25f, 1e-5f);
    ASSERT_TRUE(d.first()->is_tabs());
    EXPECT_EQ(d.first()->children.front().info.panel_state, "\"a\"");
    ASSERT_TRUE(d.second()->is_split());
    EXPECT_EQ(d.second()->info.axis, Axis::Horizontal);
    EXPECT_NEAR(d.second()->info.fraction, 1.0f / 3.0f, 1e-5f);
    EXPECT_EQ(d.second()->first()->children.front().info.panel_state, "\"b\"");
    EXPECT_EQ(d.second()->second()->children.front().info.panel_state, "\"c\"");
}

TEST(StackPanel, DumpSeesThroughSingleChildStacks)
{
    auto root = StackPanel::create(Axis::Horizontal);
    auto lone = StackPanel::create(Axis::Vertical);
    lone->add_panel(tabs_with("a"));
    root->add_panel(lone);
    root->add_panel(tabs_with("b"));
    root->layout({0, 0, 800, 300});

    DockItemState d = root->dump();
    ASSERT_TRUE(d.is_split());
    EXPECT_EQ(d.info.axis, Axis::Horizontal);
    EXPECT_NEAR(d.info.fraction, 0.5f, 1e-5f);
    ASSERT_TRUE(d.first()->is_tabs());
    EXPECT_EQ(d.first()->children.front().info.panel_state, "\"a\"");
}

TEST(StackPanel, DumpFollowsResizedShares)
{
    auto stack = StackPanel::create(Axis::Vertical);
    stack->add_panel(tabs_with("a"));
    stack->add_panel(tabs_with("b"));
    stack->layout({0, 0, 100, 1000});
    stack->group().resize_handle(0, -200.0f);   // 300 / 700

    DockItemState d = stack->dump();
    ASSERT_TRUE(d.is_split());
    EXPECT_EQ(d.info.axis, Axis::Vertical);
    EXPECT_NEAR(d.info.fraction, 0.3f, 1e-5f);
}

TEST(StackPanel, SetAxisKeepsChildren)
{
    auto stack = StackPanel::create(Axis::Horizontal);
    stack->add_panel(tabs_with("a"));
    stack->add_panel(tabs_with("b"));
    stack->set_axis(Axis::Vertical);
    EXPECT_EQ(stack->axis(), Axis::Vertical);
    EXPECT_EQ(stack->group().axis(), Axis::Vertical);
    EXPECT_EQ(stack->panels_len(), 2u);
}
