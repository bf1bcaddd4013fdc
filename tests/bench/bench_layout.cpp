#include <benchmark/benchmark.h>
#include <quay/dock_area.hpp>
#include <quay/dock_state.hpp>
#include <quay/layout_tree.hpp>
#include <quay/panel_registry.hpp>
#include <quay/tree.hpp>
#include <string>

#include "test_panels.hpp"

using namespace quay;
using quay::test::TestPanel;

namespace
{

// Balanced layout with 2^depth tab groups of three tabs each.
DockItemState grid_item(int depth, int& counter)
{
    if (depth == 0)
    {
        std::vector<DockItemState> tabs;
        for (int i = 0; i < 3; ++i)
            tabs.push_back(DockItemState::panel(TestPanel::PANEL_NAME, "\"p" + std::to_string(counter++) + "\""));
        return DockItemState::tabs(std::move(tabs), 1);
    }
    const Axis axis = depth % 2 ? Axis::Horizontal : Axis::Vertical;
    return DockItemState::split(axis, 0.5f, grid_item(depth - 1, counter), grid_item(depth - 1, counter));
}

DockAreaState grid_state(int depth)
{
    int           counter = 0;
    DockAreaState s;
    s.version     = 1;
    s.root        = grid_item(depth, counter);
    s.left_dock   = DockState{.placement = DockPlacement::Left,
                              .size      = 240.0f,
                              .open      = true,
                              .panel     = grid_item(1, counter)};
    s.bottom_dock = DockState{.placement = DockPlacement::Bottom,
                              .size      = 180.0f,
                              .open      = true,
                              .panel     = grid_item(0, counter)};
    return s;
}

std::shared_ptr<DockArea> make_area(int depth)
{
    PanelRegistry::instance().clear();
    test::register_test_panels();
    auto area = DockArea::create("bench");
    area->load(grid_state(depth));
    return area;
}

}   // namespace

// ─── DockArea benchmarks ─────────────────────────────────────────────────────

static void BM_DockArea_Layout(benchmark::State& state)
{
    auto area = make_area(static_cast<int>(state.range(0)));
    for (auto _ : state)
    {
        area->layout(Rect{0.0f, 0.0f, 1920.0f, 1080.0f});
        benchmark::DoNotOptimize(area->center_bounds());
    }
}
BENCHMARK(BM_DockArea_Layout)->Arg(2)->Arg(4)->Arg(6)->Unit(benchmark::kMicrosecond);

static void BM_DockArea_Dump(benchmark::State& state)
{
    auto area = make_area(static_cast<int>(state.range(0)));
    for (auto _ : state)
    {
        DockAreaState s = area->dump();
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_DockArea_Dump)->Arg(2)->Arg(4)->Arg(6)->Unit(benchmark::kMicrosecond);

static void BM_DockArea_Load(benchmark::State& state)
{
    auto       area  = make_area(0);
    const auto saved = grid_state(static_cast<int>(state.range(0)));
    for (auto _ : state)
    {
        area->load(saved);
        benchmark::DoNotOptimize(area->root());
    }
}
BENCHMARK(BM_DockArea_Load)->Arg(2)->Arg(4)->Arg(6)->Unit(benchmark::kMicrosecond);

static void BM_DockArea_ContentPanels(benchmark::State& state)
{
    auto area = make_area(6);
    for (auto _ : state)
    {
        auto panels = area->content_panels();
        benchmark::DoNotOptimize(panels);
    }
}
BENCHMARK(BM_DockArea_ContentPanels)->Unit(benchmark::kMicrosecond);

// ─── JSON benchmarks ─────────────────────────────────────────────────────────

static void BM_Json_Serialize(benchmark::State& state)
{
    const auto saved = grid_state(static_cast<int>(state.range(0)));
    for (auto _ : state)
    {
        std::string json = serialize_json(saved);
        benchmark::DoNotOptimize(json);
    }
}
BENCHMARK(BM_Json_Serialize)->Arg(2)->Arg(6)->Unit(benchmark::kMicrosecond);

static void BM_Json_Deserialize(benchmark::State& state)
{
    const std::string json = serialize_json(grid_state(static_cast<int>(state.range(0))));
    for (auto _ : state)
    {
        DockAreaState parsed;
        bool          ok = deserialize_json(json, parsed);
        benchmark::DoNotOptimize(ok);
        benchmark::DoNotOptimize(parsed);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(json.size()));
}
BENCHMARK(BM_Json_Deserialize)->Arg(2)->Arg(6)->Unit(benchmark::kMicrosecond);

// ─── Tree benchmarks ─────────────────────────────────────────────────────────

static void BM_Tree_ComputeLayout(benchmark::State& state)
{
    int  counter = 0;
    auto tree    = to_layout_tree(grid_item(static_cast<int>(state.range(0)), counter));
    for (auto _ : state)
    {
        tree.compute_layout(Rect{0.0f, 0.0f, 1920.0f, 1080.0f}, 26.0f);
        benchmark::DoNotOptimize(tree.root().size());
    }
}
BENCHMARK(BM_Tree_ComputeLayout)->Arg(4)->Arg(8)->Unit(benchmark::kNanosecond);

static void BM_Tree_FindTab(benchmark::State& state)
{
    int         counter = 0;
    auto        tree    = to_layout_tree(grid_item(8, counter));
    std::string needle  = "\"p" + std::to_string(counter - 1) + "\"";
    for (auto _ : state)
    {
        auto hit = tree.find_tab_if([&](const DockItemState& s) { return s.info.panel_state == needle; });
        benchmark::DoNotOptimize(hit);
    }
}
BENCHMARK(BM_Tree_FindTab)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
