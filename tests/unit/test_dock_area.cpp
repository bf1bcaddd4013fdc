#include <gtest/gtest.h>

#include <quay/dock_area.hpp>
#include <quay/invalid_panel.hpp>
#include <quay/panel_registry.hpp>
#include <quay/stack_panel.hpp>
#include <quay/tab_panel.hpp>

#include "test_panels.hpp"

using namespace quay;
using quay::test::make_panel;
using quay::test::TestPanel;
using quay::test::title_of;

namespace
{

DockItemState tabs_of(std::initializer_list<const char*> titles, size_t active = 0)
{
    std::vector<DockItemState> children;
    for (const char* t : titles)
        children.push_back(DockItemState::panel(TestPanel::PANEL_NAME, std::string("\"") + t + "\""));
    return DockItemState::tabs(std::move(children), active);
}

std::vector<std::string> titles(const DockArea& area)
{
    std::vector<std::string> out;
    for (const auto& p : area.content_panels())
        out.push_back(title_of(p));
    return out;
}

// Same shape, axes, tab order and panels; fractions within tolerance.
void expect_same_layout(const DockItemState& a, const DockItemState& b)
{
    ASSERT_EQ(a.kind, b.kind);
    ASSERT_EQ(a.children.size(), b.children.size());
    switch (a.kind)
    {
        case DockItemState::Kind::Split:
            EXPECT_EQ(a.info.axis, b.info.axis);
            EXPECT_NEAR(a.info.fraction, b.info.fraction, 1e-4f);
            break;
        case DockItemState::Kind::Tabs:
            EXPECT_EQ(a.info.active_index, b.info.active_index);
            break;
        case DockItemState::Kind::Panel:
            EXPECT_EQ(a.panel_name, b.panel_name);
            EXPECT_EQ(a.info.panel_state, b.info.panel_state);
            break;
    }
    for (size_t i = 0; i < a.children.size(); ++i)
        expect_same_layout(a.children[i], b.children[i]);
}

// Loads `saved` into a fresh area of the same size and dumps it again.
DockItemState reload(const DockAreaState& saved, const Rect& bounds)
{
    auto copy = DockArea::create("copy");
    copy->load(saved);
    copy->layout(bounds);
    return copy->dump().root;
}

}   // namespace

class DockAreaTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        PanelRegistry::instance().clear();
        test::register_test_panels();
        area = DockArea::create("workspace");
        area->set_on_layout_changed([this] { ++changes; });
    }

    void TearDown() override { PanelRegistry::instance().clear(); }

    std::shared_ptr<DockArea> area;
    int                       changes = 0;
};

// ─── Center ─────────────────────────────────────────────────────────────────

TEST_F(DockAreaTest, StartsWithEmptyHorizontalRoot)
{
    ASSERT_NE(area->root(), nullptr);
    EXPECT_EQ(area->root()->axis(), Axis::Horizontal);
    EXPECT_EQ(area->root()->panels_len(), 0u);
    EXPECT_TRUE(area->content_panels().empty());
    EXPECT_EQ(area->dump().root, DockItemState::tabs({}));
}

TEST_F(DockAreaTest, AddPanelCenterSharesLeftTopTabs)
{
    auto a = make_panel("a");
    auto b = make_panel("b");
    area->add_panel(a);
    area->add_panel(b);

    ASSERT_EQ(area->root()->panels_len(), 1u);
    auto tabs = area->tab_panel_of(a);
    ASSERT_NE(tabs, nullptr);
    EXPECT_EQ(tabs, area->tab_panel_of(b));
    EXPECT_EQ(tabs->count(), 2u);
    EXPECT_GT(changes, 0);
}

TEST_F(DockAreaTest, SetCenterWrapsPlainPanel)
{
    auto a = make_panel("a");
    area->set_center(PanelView(a));
    ASSERT_EQ(area->root()->panels_len(), 1u);
    auto tabs = area->root()->panels()[0].downcast<TabPanel>();
    ASSERT_NE(tabs, nullptr);
    EXPECT_EQ(tabs->active_panel(), PanelView(a));
    EXPECT_TRUE(area->contains_panel(a));
}

TEST_F(DockAreaTest, SetCenterAdoptsStack)
{
    auto stack = StackPanel::create(Axis::Vertical);
    auto tabs  = TabPanel::create();
    tabs->add_panel(make_panel("a"));
    stack->add_panel(tabs);

    area->set_center(PanelView(stack));
    EXPECT_EQ(area->root(), stack);
    EXPECT_TRUE(area->root()->is_root());
    EXPECT_EQ(tabs->dock_area().lock(), area);
}

TEST_F(DockAreaTest, TreeSnapshotRoundTrip)
{
    auto x = make_panel("X");
    auto y = make_panel("Y");
    Tree<PanelView> tree({PanelView(x)});
    tree.split_right(NodeIndex::root(), 0.3f, {PanelView(y)});
    area->set_center(tree);

    DockAreaState state = area->dump();
    ASSERT_TRUE(state.root.is_split());
    EXPECT_EQ(state.root.info.axis, Axis::Horizontal);
    EXPECT_NEAR(state.root.info.fraction, 0.3f, 1e-5f);

    DockItemState expected = DockItemState::split(Axis::Horizontal, state.root.info.fraction, tabs_of({"X"}),
                                                  tabs_of({"Y"}));
    EXPECT_EQ(state.root, expected);

    auto restored = DockArea::create("copy");
    restored->load(state);
    EXPECT_EQ(titles(*restored), (std::vector<std::string>{"X", "Y"}));
    ASSERT_NE(restored->dump().root.first(), nullptr);
    EXPECT_EQ(*restored->dump().root.first(), tabs_of({"X"}));
    EXPECT_NEAR(restored->dump().root.info.fraction, 0.3f, 1e-5f);

    restored->layout({0, 0, 1000, 500});
    auto left  = restored->root()->panels()[0].downcast<TabPanel>();
    auto right = restored->root()->panels()[1].downcast<TabPanel>();
    ASSERT_NE(left, nullptr);
    ASSERT_NE(right, nullptr);
    EXPECT_NEAR(left->bounds().w, 300.0f, 0.01f);
    EXPECT_NEAR(right->bounds().w, 700.0f, 0.01f);
}

TEST_F(DockAreaTest, AddPanelAtTurnsAxisOfSingleChildRoot)
{
    area->add_panel(make_panel("a"));
    area->add_panel_at(make_panel("b"), Placement::Bottom);
    EXPECT_EQ(area->root()->axis(), Axis::Vertical);
    ASSERT_EQ(area->root()->panels_len(), 2u);
    EXPECT_EQ(titles(*area), (std::vector<std::string>{"a", "b"}));

    area->layout({0, 0, 1000, 500});
    const Rect center = area->center_bounds();
    for (const auto& slot : area->root()->group().children())
    {
        EXPECT_GE(slot.bounds.y, center.y);
        EXPECT_LE(slot.bounds.bottom(), center.bottom());
    }
    auto sizes = area->root()->group().sizes();
    EXPECT_FLOAT_EQ(sizes[0], sizes[1]);
}

TEST_F(DockAreaTest, AddPanelAtPromotesLoneNestedStack)
{
    auto t1 = make_panel("t1");
    auto t3 = make_panel("t3");
    area->add_panel_at(t1, Placement::Right);
    area->add_panel_at(make_panel("t2"), Placement::Right);
    area->add_panel_at(t3, Placement::Top);
    ASSERT_TRUE(area->tab_panel_of(t3)->remove_panel(PanelView(t3)));
    ASSERT_EQ(area->root()->panels_len(), 1u);

    area->add_panel_at(make_panel("t4"), Placement::Right);
    EXPECT_EQ(area->root()->axis(), Axis::Horizontal);
    EXPECT_TRUE(area->root()->is_root());
    ASSERT_EQ(area->root()->panels_len(), 3u);
    for (const auto& p : area->root()->panels())
        EXPECT_NE(p.downcast<TabPanel>(), nullptr);
    EXPECT_EQ(area->tab_panel_of(t1)->parent(), area->root());
    EXPECT_EQ(titles(*area), (std::vector<std::string>{"t1", "t2", "t4"}));
}

TEST_F(DockAreaTest, AddPanelAtReRootsWhenAxisDiffers)
{
    area->add_panel(make_panel("a"));
    area->add_panel_at(make_panel("b"), Placement::Right);
    auto old_root = area->root();
    ASSERT_EQ(old_root->panels_len(), 2u);

    area->add_panel_at(make_panel("c"), Placement::Bottom);
    EXPECT_EQ(area->root()->axis(), Axis::Vertical);
    ASSERT_EQ(area->root()->panels_len(), 2u);
    EXPECT_EQ(area->root()->panels()[0], PanelView(old_root));
    EXPECT_EQ(old_root->parent(), area->root());
    EXPECT_EQ(titles(*area), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(DockAreaTest, AddPanelAtLeftGoesFirst)
{
    area->add_panel(make_panel("a"));
    area->add_panel_at(make_panel("side"), Placement::Left, 150.0f);
    EXPECT_EQ(titles(*area), (std::vector<std::string>{"side", "a"}));
    EXPECT_FLOAT_EQ(*area->root()->group().child(0).size, 150.0f);
}

// ─── Docks ──────────────────────────────────────────────────────────────────

TEST_F(DockAreaTest, SideAddCreatesDock)
{
    EXPECT_FALSE(area->has_dock(DockPlacement::Left));
    area->add_panel(make_panel("files"), DockPlacement::Left);
    area->add_panel(make_panel("outline"), DockPlacement::Left);

    Dock* left = area->dock(DockPlacement::Left);
    ASSERT_NE(left, nullptr);
    EXPECT_TRUE(left->is_open());
    EXPECT_FLOAT_EQ(left->size(), Dock::DEFAULT_SIZE);
    EXPECT_EQ(left->axis(), Axis::Vertical);
    EXPECT_EQ(left->panel()->left_top_tab_panel()->count(), 2u);
    EXPECT_EQ(area->dock(DockPlacement::Center), nullptr);
}

TEST_F(DockAreaTest, LayoutReservesDockSpace)
{
    area->add_panel(make_panel("center"));
    area->set_dock(DockPlacement::Left, make_panel("l"), 200.0f);
    area->set_dock(DockPlacement::Right, make_panel("r"), 150.0f);
    area->set_dock(DockPlacement::Bottom, make_panel("b"), 120.0f);
    area->layout({0, 0, 1000, 600});

    EXPECT_EQ(area->center_bounds(), (Rect{200, 0, 650, 480}));
    EXPECT_EQ(area->dock(DockPlacement::Left)->bounds(), (Rect{0, 0, 200, 600}));
    EXPECT_EQ(area->dock(DockPlacement::Right)->bounds(), (Rect{850, 0, 150, 600}));
    EXPECT_EQ(area->dock(DockPlacement::Bottom)->bounds(), (Rect{200, 480, 650, 120}));
}

TEST_F(DockAreaTest, ClosedDocksGiveSpaceBack)
{
    area->set_dock(DockPlacement::Left, make_panel("l"));
    area->set_dock(DockPlacement::Bottom, make_panel("b"));
    area->set_dock_open(DockPlacement::Left, false);
    area->toggle_dock(DockPlacement::Bottom);
    area->layout({0, 0, 1000, 600});

    EXPECT_FALSE(area->is_dock_open(DockPlacement::Left));
    EXPECT_FALSE(area->is_dock_open(DockPlacement::Bottom));
    // The bottom dock keeps its tab strip.
    EXPECT_EQ(area->center_bounds(), (Rect{0, 0, 1000, 600 - Dock::COLLAPSED_BOTTOM_SIZE}));

    auto tabs = area->dock(DockPlacement::Bottom)->panel()->left_top_tab_panel();
    ASSERT_NE(tabs, nullptr);
    EXPECT_TRUE(tabs->is_collapsed());
}

TEST_F(DockAreaTest, NonCollapsibleDockStaysOpen)
{
    area->set_dock(DockPlacement::Right, make_panel("r"), std::nullopt, false);
    EXPECT_FALSE(area->is_dock_open(DockPlacement::Right));

    area->set_dock_collapsible(DockPlacement::Right, false);
    EXPECT_TRUE(area->is_dock_open(DockPlacement::Right));
    EXPECT_FALSE(area->is_dock_collapsible(DockPlacement::Right));

    area->set_dock_open(DockPlacement::Right, false);
    EXPECT_TRUE(area->is_dock_open(DockPlacement::Right));
}

TEST_F(DockAreaTest, ResizeDockFollowsPointerWithinLimits)
{
    area->set_dock(DockPlacement::Left, make_panel("l"));
    area->set_dock(DockPlacement::Right, make_panel("r"), 200.0f);
    area->layout({0, 0, 1000, 600});

    EXPECT_TRUE(area->resize_dock(DockPlacement::Left, 350.0f, 10.0f));
    EXPECT_FLOAT_EQ(area->dock(DockPlacement::Left)->size(), 350.0f);

    // Leaves PANEL_MIN_SIZE for the center next to the right dock.
    area->resize_dock(DockPlacement::Left, 5000.0f, 10.0f);
    EXPECT_FLOAT_EQ(area->dock(DockPlacement::Left)->size(), 700.0f);

    area->resize_dock(DockPlacement::Left, 5.0f, 10.0f);
    EXPECT_FLOAT_EQ(area->dock(DockPlacement::Left)->size(), ResizablePanelGroup::PANEL_MIN_SIZE);

    EXPECT_FALSE(area->resize_dock(DockPlacement::Bottom, 0.0f, 0.0f));
}

TEST_F(DockAreaTest, SetDockCenterReplacesCenter)
{
    auto a = make_panel("a");
    area->set_dock(DockPlacement::Center, PanelView(a));
    EXPECT_FALSE(area->has_dock(DockPlacement::Center));
    EXPECT_NE(area->tab_panel_of(a), nullptr);
}

// ─── Zoom ───────────────────────────────────────────────────────────────────

TEST_F(DockAreaTest, ToggleZoomTwiceRestores)
{
    auto a = make_panel("a");
    area->add_panel(a);
    PanelView view(a);

    area->toggle_zoom(view);
    EXPECT_TRUE(area->is_zoomed(view));
    area->toggle_zoom(view);
    EXPECT_FALSE(area->is_zoomed(view));
    EXPECT_FALSE(static_cast<bool>(area->zoomed_panel()));
}

TEST_F(DockAreaTest, ZoomingAnotherPanelReplacesZoom)
{
    auto a = make_panel("a");
    auto b = make_panel("b");
    area->add_panel(a);
    area->add_panel(b);

    area->toggle_zoom(PanelView(a));
    area->toggle_zoom(PanelView(b));
    EXPECT_FALSE(area->is_zoomed(PanelView(a)));
    EXPECT_TRUE(area->is_zoomed(PanelView(b)));
}

TEST_F(DockAreaTest, ZoomedPanelCoversWholeArea)
{
    auto a = make_panel("a");
    auto b = make_panel("b");
    area->add_panel(a);
    area->add_panel_at(b, Placement::Right);
    area->set_dock(DockPlacement::Left, make_panel("l"));

    auto tabs = area->tab_panel_of(b);
    ASSERT_NE(tabs, nullptr);
    tabs->toggle_zoom();
    area->layout({0, 0, 800, 600});
    EXPECT_EQ(tabs->bounds(), (Rect{0, 0, 800, 600}));

    area->draw();
    EXPECT_EQ(a->draw_count, 0);
    EXPECT_EQ(b->draw_count, 1);
}

TEST_F(DockAreaTest, SetCenterClearsZoom)
{
    auto a = make_panel("a");
    area->add_panel(a);
    area->toggle_zoom(PanelView(a));
    area->set_center(PanelView(make_panel("fresh")));
    EXPECT_FALSE(static_cast<bool>(area->zoomed_panel()));
}

// ─── Lookup and focus ───────────────────────────────────────────────────────

TEST_F(DockAreaTest, ContentPanelsCoverCenterThenDocks)
{
    area->add_panel(make_panel("center"));
    area->add_panel(make_panel("right"), DockPlacement::Right);
    area->add_panel(make_panel("left"), DockPlacement::Left);
    area->add_panel(make_panel("bottom"), DockPlacement::Bottom);
    EXPECT_EQ(titles(*area), (std::vector<std::string>{"center", "left", "bottom", "right"}));
}

TEST_F(DockAreaTest, FindPanelByType)
{
    auto a = make_panel("a");
    area->add_panel(a, DockPlacement::Bottom);
    EXPECT_EQ(area->panel<TestPanel>(), a);
    EXPECT_EQ(area->panel<InvalidPanel>(), nullptr);
}

TEST_F(DockAreaTest, FocusPanelActivatesItsTab)
{
    auto a = make_panel("a");
    auto b = make_panel("b");
    area->add_panel(a);
    area->add_panel(b);

    ASSERT_TRUE(area->focus_panel(a));
    EXPECT_EQ(area->tab_panel_of(a)->active_panel(), PanelView(a));
    EXPECT_EQ(area->focused_panel(), PanelView(a));
    EXPECT_FALSE(area->focus_panel(make_panel("stranger")));
}

// ─── Round trip ─────────────────────────────────────────────────────────────

TEST_F(DockAreaTest, LayoutBuiltThroughApiSurvivesReload)
{
    const Rect bounds{0, 0, 1200, 800};
    auto       t3 = make_panel("t3");
    area->add_panel_at(make_panel("t1"), Placement::Right);
    area->add_panel_at(make_panel("t2"), Placement::Right);
    area->add_panel_at(t3, Placement::Top);
    area->tab_panel_of(t3)->remove_panel(PanelView(t3));
    area->add_panel_at(make_panel("t4"), Placement::Right, 300.0f);
    area->layout(bounds);

    DockAreaState first = area->dump();
    ASSERT_TRUE(first.root.is_split());
    EXPECT_EQ(first.root.first()->kind, DockItemState::Kind::Tabs);
    expect_same_layout(reload(first, bounds), first.root);
}

TEST_F(DockAreaTest, SameAxisNestingDumpsAsOneChain)
{
    const Rect bounds{0, 0, 1200, 800};
    auto       b = make_panel("b");
    auto       c = make_panel("c");
    area->add_panel_at(make_panel("a"), Placement::Right);
    area->add_panel_at(b, Placement::Right);
    area->tab_panel_of(b)->split_panel(PanelView(c), Placement::Bottom);
    area->tab_panel_of(c)->remove_panel(PanelView(c));
    // b's stack holds b alone, so this split turns it horizontal inside the
    // horizontal root.
    area->tab_panel_of(b)->split_panel(PanelView(make_panel("d")), Placement::Right);
    area->layout(bounds);

    DockAreaState first = area->dump();
    ASSERT_TRUE(first.root.is_split());
    EXPECT_EQ(first.root.first()->kind, DockItemState::Kind::Tabs);
    const DockItemState* rest = first.root.second();
    ASSERT_TRUE(rest && rest->is_split());
    EXPECT_EQ(rest->info.axis, Axis::Horizontal);
    EXPECT_EQ(rest->first()->kind, DockItemState::Kind::Tabs);
    EXPECT_EQ(rest->second()->kind, DockItemState::Kind::Tabs);
    EXPECT_EQ(titles(*area), (std::vector<std::string>{"a", "b", "d"}));

    expect_same_layout(reload(first, bounds), first.root);
}

// ─── Load ───────────────────────────────────────────────────────────────────

TEST_F(DockAreaTest, LoadFlattensSameAxisChains)
{
    DockAreaState state;
    state.root = DockItemState::split(Axis::Horizontal,
                                      0.5f,
                                      tabs_of({"a"}),
                                      DockItemState::split(Axis::Horizontal, 0.5f, tabs_of({"b"}), tabs_of({"c"})));
    area->load(state);

    ASSERT_EQ(area->root()->panels_len(), 3u);
    auto f = area->root()->group().fractions();
    EXPECT_NEAR(f[0], 0.5f, 1e-5f);
    EXPECT_NEAR(f[1], 0.25f, 1e-5f);
    EXPECT_NEAR(f[2], 0.25f, 1e-5f);
}

TEST_F(DockAreaTest, LoadNestsCrossAxisSplits)
{
    DockAreaState state;
    state.root = DockItemState::split(Axis::Horizontal,
                                      0.4f,
                                      tabs_of({"a"}),
                                      DockItemState::split(Axis::Vertical, 0.5f, tabs_of({"b"}), tabs_of({"c"})));
    area->load(state);

    ASSERT_EQ(area->root()->panels_len(), 2u);
    auto nested = area->root()->panels()[1].downcast<StackPanel>();
    ASSERT_NE(nested, nullptr);
    EXPECT_EQ(nested->axis(), Axis::Vertical);
    EXPECT_EQ(nested->parent(), area->root());
    EXPECT_EQ(titles(*area), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(DockAreaTest, LoadDropsEmptySides)
{
    DockAreaState state;
    state.root = DockItemState::split(Axis::Vertical, 0.4f, DockItemState::tabs({}), tabs_of({"only"}));
    area->load(state);

    ASSERT_EQ(area->root()->panels_len(), 1u);
    EXPECT_NE(area->root()->panels()[0].downcast<TabPanel>(), nullptr);
    EXPECT_EQ(titles(*area), (std::vector<std::string>{"only"}));
}

TEST_F(DockAreaTest, LoadWrapsBarePanel)
{
    DockAreaState state;
    state.root = DockItemState::panel(TestPanel::PANEL_NAME, "\"solo\"");
    area->load(state);
    EXPECT_EQ(area->dump().root, tabs_of({"solo"}));
}

TEST_F(DockAreaTest, LoadClampsActiveIndex)
{
    DockAreaState state;
    state.root = tabs_of({"a", "b"}, 9);
    area->load(state);
    auto tabs = area->root()->left_top_tab_panel();
    ASSERT_NE(tabs, nullptr);
    EXPECT_EQ(tabs->active_ix(), 1u);
}

TEST_F(DockAreaTest, UnknownPanelsLoadAsInvalidAndDumpUnchanged)
{
    DockAreaState state;
    state.root = DockItemState::tabs({DockItemState::panel("Ghost", "{\"k\":2}")});
    area->load(state);

    auto panels = area->content_panels();
    ASSERT_EQ(panels.size(), 1u);
    auto invalid = panels[0].downcast<InvalidPanel>();
    ASSERT_NE(invalid, nullptr);
    EXPECT_EQ(invalid->missing_name(), "Ghost");
    EXPECT_EQ(area->dump().root, state.root);
}

TEST_F(DockAreaTest, LoadRestoresDocksAndVersion)
{
    DockAreaState state;
    state.version     = 3;
    state.root        = tabs_of({"main"});
    state.left_dock   = DockState{.placement = DockPlacement::Left, .size = 260.0f, .open = true, .panel = tabs_of({"tree"})};
    state.bottom_dock = DockState{.placement = DockPlacement::Bottom, .size = 180.0f, .open = false, .panel = tabs_of({"log"})};
    area->load(state);

    EXPECT_EQ(area->version(), std::optional<size_t>(3));
    ASSERT_TRUE(area->has_dock(DockPlacement::Left));
    EXPECT_FLOAT_EQ(area->dock(DockPlacement::Left)->size(), 260.0f);
    EXPECT_FALSE(area->is_dock_open(DockPlacement::Bottom));
    EXPECT_FALSE(area->has_dock(DockPlacement::Right));

    DockAreaState dumped = area->dump();
    ASSERT_TRUE(dumped.left_dock.has_value());
    EXPECT_EQ(dumped.left_dock->panel, tabs_of({"tree"}));
    ASSERT_TRUE(dumped.bottom_dock.has_value());
    EXPECT_FALSE(dumped.bottom_dock->open);
    EXPECT_EQ(dumped.version, std::optional<size_t>(3));
}

TEST_F(DockAreaTest, LoadRemovesDocksMissingFromState)
{
    area->set_dock(DockPlacement::Right, make_panel("r"));
    DockAreaState state;
    state.root = tabs_of({"main"});
    area->load(state);
    EXPECT_FALSE(area->has_dock(DockPlacement::Right));
}

TEST_F(DockAreaTest, LoadDoesNotNotify)
{
    DockAreaState state;
    state.root      = tabs_of({"a", "b"});
    state.left_dock = DockState{.placement = DockPlacement::Left, .size = 300.0f, .open = true, .panel = tabs_of({"c"})};
    changes         = 0;
    area->load(state);
    EXPECT_EQ(changes, 0);

    area->root()->left_top_tab_panel()->set_active_ix(1);
    EXPECT_EQ(changes, 1);
}

// ─── Hooks ──────────────────────────────────────────────────────────────────

TEST_F(DockAreaTest, DefaultStateHooks)
{
    bool                       read_called = false;
    std::optional<std::string> value       = "sentinel";
    area->read_state("k",
                     [&](std::optional<std::string> v)
                     {
                         read_called = true;
                         value       = std::move(v);
                     });
    EXPECT_TRUE(read_called);
    EXPECT_FALSE(value.has_value());

    bool ok = false;
    area->write_state("k", "{}", [&](bool r) { ok = r; });
    EXPECT_TRUE(ok);
}

TEST_F(DockAreaTest, CustomStateHooks)
{
    std::string stored;
    area->set_write_state_hook([&](const std::string&, const std::string& value, DockArea::WriteCallback done)
                               {
                                   stored = value;
                                   done(true);
                               });
    area->set_read_state_hook([&](const std::string&, DockArea::ReadCallback done) { done(stored); });

    area->write_state("k", "payload", [](bool) {});
    std::optional<std::string> read;
    area->read_state("k", [&](std::optional<std::string> v) { read = std::move(v); });
    EXPECT_EQ(read, std::optional<std::string>("payload"));
}
