#include <algorithm>
#include <functional>
#include <quay/dock_area.hpp>
#include <quay/logger.hpp>
#include <quay/panel_registry.hpp>
#include <quay/stack_panel.hpp>
#include <quay/tab_panel.hpp>
#include <stdexcept>

namespace quay
{

namespace
{

struct Part
{
    PanelView view;
    float     share;
};

bool is_empty_container(const PanelView& v)
{
    if (!v)
        return true;
    if (auto tabs = v.downcast<TabPanel>())
        return tabs->empty();
    if (auto stack = v.downcast<StackPanel>())
        return stack->panels_len() == 0;
    return false;
}

// Collapses parts into one view: nothing, the single survivor, or a stack
// whose slots start at the parts' shares of the whole.
PanelView assemble(Axis axis, std::vector<Part> parts, const std::weak_ptr<DockArea>& area)
{
    std::erase_if(parts, [](const Part& p) { return is_empty_container(p.view); });
    if (parts.empty())
        return {};
    if (parts.size() == 1)
        return parts.front().view;

    float total = 0.0f;
    for (const auto& p : parts)
        total += p.share;

    auto stack = StackPanel::create(axis, area);
    for (const auto& p : parts)
        stack->add_panel(p.view);
    for (size_t i = 0; i < parts.size(); ++i)
    {
        float share = total > 0.0f ? parts[i].share / total : 1.0f / static_cast<float>(parts.size());
        stack->group().set_initial_fraction(i, share);
    }
    return PanelView(stack);
}

// Panel states in a subtree, in order. Used when a Tabs item holds
// something other than panels.
void collect_panel_states(const DockItemState& state, std::vector<const DockItemState*>& out)
{
    if (state.is_panel())
    {
        out.push_back(&state);
        return;
    }
    for (const auto& child : state.children)
        collect_panel_states(child, out);
}

// Walks a chain of same-axis splits and records each non-split item with
// its share of the whole chain.
void collect_split_chain(const DockItemState&                                 state,
                         Axis                                                 axis,
                         float                                                share,
                         std::vector<std::pair<const DockItemState*, float>>& out)
{
    const DockItemState* first  = state.first();
    const DockItemState* second = state.second();
    if (state.is_split() && state.info.axis == axis && first && second)
    {
        float f = state.info.fraction;
        collect_split_chain(*first, axis, share * f, out);
        collect_split_chain(*second, axis, share * (1.0f - f), out);
        return;
    }
    out.emplace_back(&state, share);
}

}   // namespace

// ─── Construction ───────────────────────────────────────────────────────────

std::shared_ptr<DockArea> DockArea::create(std::string id, std::optional<size_t> version)
{
    std::shared_ptr<DockArea> area(new DockArea(std::move(id), version));
    area->root_ = StackPanel::create(Axis::Horizontal, area);
    return area;
}

DockArea::DockArea(std::string id, std::optional<size_t> version)
    : id_(std::move(id)),
      version_(version),
      read_hook_([](const std::string&, ReadCallback done) { done(std::nullopt); }),
      write_hook_([](const std::string&, const std::string&, WriteCallback done) { done(true); })
{
}

// ─── Center ─────────────────────────────────────────────────────────────────

std::shared_ptr<StackPanel> DockArea::make_root_from(PanelView item, Axis axis)
{
    auto self = weak_from_this();
    if (auto stack = item.downcast<StackPanel>())
    {
        stack->set_parent({});
        stack->set_dock_area(self);
        return stack;
    }

    auto stack = StackPanel::create(axis, self);
    if (!item)
        return stack;

    auto tabs = item.downcast<TabPanel>();
    if (tabs)
    {
        tabs->set_dock_area(self);
    }
    else
    {
        tabs = TabPanel::create(self);
        tabs->add_panel(std::move(item));
    }
    stack->add_panel(PanelView(tabs));
    return stack;
}

void DockArea::set_center(PanelView item)
{
    {
        NotifyGuard guard(*this);
        root_ = make_root_from(std::move(item), Axis::Horizontal);
        zoom_.reset();
    }
    notify_layout_changed();
}

void DockArea::set_center(const Tree<PanelView>& tree)
{
    PanelView item;
    {
        NotifyGuard guard(*this);
        item = build_tree_node(tree, NodeIndex::root());
    }
    set_center(std::move(item));
}

PanelView DockArea::build_tree_node(const Tree<PanelView>& tree, NodeIndex ix)
{
    const auto& node = tree[ix];
    if (node.is_leaf())
    {
        auto tabs = TabPanel::create(weak_from_this());
        for (const auto& tab : node.tabs())
            tabs->add_panel(tab);
        tabs->set_active_ix(node.active());
        return PanelView(tabs);
    }
    if (!node.is_parent())
        return {};

    const Axis axis = node.is_horizontal() ? Axis::Horizontal : Axis::Vertical;

    std::vector<std::pair<NodeIndex, float>> chain;
    std::function<void(NodeIndex, float)>    collect = [&](NodeIndex i, float share)
    {
        const auto& n = tree[i];
        bool same_axis = axis == Axis::Horizontal ? n.is_horizontal() : n.is_vertical();
        if (same_axis)
        {
            collect(i.left(), share * n.fraction());
            collect(i.right(), share * (1.0f - n.fraction()));
            return;
        }
        chain.emplace_back(i, share);
    };
    collect(ix, 1.0f);

    std::vector<Part> parts;
    for (const auto& [child, share] : chain)
        parts.push_back({build_tree_node(tree, child), share});
    return assemble(axis, std::move(parts), weak_from_this());
}

void DockArea::add_panel(PanelView panel, DockPlacement placement)
{
    if (!panel)
        return;

    if (placement == DockPlacement::Center)
    {
        auto tabs = root_->left_top_tab_panel();
        if (!tabs)
        {
            tabs = TabPanel::create(weak_from_this());
            root_->add_panel(PanelView(tabs));
        }
        tabs->add_panel(std::move(panel));
        return;
    }

    auto& slot = dock_slot(placement);
    if (slot)
        slot->add_panel(std::move(panel));
    else
        set_dock(placement, std::move(panel));
}

void DockArea::add_panel_at(PanelView panel, Placement placement, std::optional<float> size)
{
    if (!panel)
        return;

    PanelView item = panel;
    if (!panel.downcast<TabPanel>() && !panel.downcast<StackPanel>())
    {
        auto tabs = TabPanel::create(weak_from_this());
        tabs->add_panel(std::move(panel));
        item = PanelView(tabs);
    }

    // A root holding nothing but another stack hands the root role to it,
    // so a stack never ends up nested in one on the same axis.
    while (root_->panels_len() == 1)
    {
        auto inner = root_->panels().front().downcast<StackPanel>();
        if (!inner)
            break;
        inner->set_parent({});
        root_ = inner;
    }

    const Axis axis = placement_axis(placement);
    if (root_->axis() != axis)
    {
        if (root_->panels_len() <= 1)
        {
            root_->set_axis(axis);
        }
        else
        {
            // The old root becomes the single child of a root on the new axis.
            auto old_root = root_;
            root_         = StackPanel::create(axis, weak_from_this());
            root_->add_panel(PanelView(old_root));
        }
    }
    root_->add_panel_at(std::move(item), placement, size);
}

// ─── Docks ──────────────────────────────────────────────────────────────────

std::unique_ptr<Dock>& DockArea::dock_slot(DockPlacement placement)
{
    switch (placement)
    {
        case DockPlacement::Left:
            return left_dock_;
        case DockPlacement::Bottom:
            return bottom_dock_;
        case DockPlacement::Right:
            return right_dock_;
        case DockPlacement::Center:
            break;
    }
    throw std::invalid_argument("quay::DockArea: the center is not a dock");
}

Dock* DockArea::dock(DockPlacement placement) const
{
    switch (placement)
    {
        case DockPlacement::Left:
            return left_dock_.get();
        case DockPlacement::Bottom:
            return bottom_dock_.get();
        case DockPlacement::Right:
            return right_dock_.get();
        case DockPlacement::Center:
            break;
    }
    return nullptr;
}

void DockArea::set_dock(DockPlacement placement, PanelView item, std::optional<float> size, bool open)
{
    if (placement == DockPlacement::Center)
    {
        set_center(std::move(item));
        return;
    }

    {
        NotifyGuard guard(*this);
        auto        d = std::make_unique<Dock>(placement, weak_from_this());
        d->set_panel(std::move(item));
        if (size)
            d->set_size(*size);
        d->set_open(open);
        dock_slot(placement) = std::move(d);
    }
    notify_layout_changed();
}

bool DockArea::is_dock_open(DockPlacement placement) const
{
    Dock* d = dock(placement);
    return d && d->is_open();
}

void DockArea::toggle_dock(DockPlacement placement)
{
    if (Dock* d = dock(placement))
        d->toggle_open();
}

void DockArea::set_dock_open(DockPlacement placement, bool open)
{
    if (Dock* d = dock(placement))
        d->set_open(open);
}

void DockArea::set_dock_collapsible(DockPlacement placement, bool collapsible)
{
    if (Dock* d = dock(placement))
        d->set_collapsible(collapsible);
}

bool DockArea::is_dock_collapsible(DockPlacement placement) const
{
    Dock* d = dock(placement);
    return d && d->collapsible();
}

bool DockArea::resize_dock(DockPlacement placement, float mouse_x, float mouse_y)
{
    Dock* d = dock(placement);
    if (!d)
        return false;
    float left  = placement != DockPlacement::Left && left_dock_ ? left_dock_->extent() : 0.0f;
    float right = placement != DockPlacement::Right && right_dock_ ? right_dock_->extent() : 0.0f;
    return d->resize(mouse_x, mouse_y, bounds_, left, right);
}

// ─── Zoom ───────────────────────────────────────────────────────────────────

void DockArea::toggle_zoom(const PanelView& panel)
{
    if (!panel)
        return;
    auto current = zoom_.lock();
    if (current && current == panel.view())
    {
        zoom_.reset();
        QUAY_LOG_DEBUG("dock", "zoom cleared");
        return;
    }
    zoom_ = panel.view();
    QUAY_LOG_DEBUG("dock", "zoomed '{}'", panel.title());
}

bool DockArea::is_zoomed(const PanelView& panel) const
{
    auto current = zoom_.lock();
    return current && current == panel.view();
}

// ─── Lookup ─────────────────────────────────────────────────────────────────

PanelView DockArea::find_panel(const std::function<bool(const PanelView&)>& pred) const
{
    std::function<PanelView(const PanelView&)> visit = [&](const PanelView& v) -> PanelView
    {
        if (pred(v))
            return v;
        const std::vector<PanelView>* children = nullptr;
        if (auto stack = v.downcast<StackPanel>())
            children = &stack->panels();
        else if (auto tabs = v.downcast<TabPanel>())
            children = &tabs->panels();
        if (children)
        {
            for (const auto& c : *children)
            {
                if (PanelView found = visit(c))
                    return found;
            }
        }
        return {};
    };

    if (PanelView found = visit(PanelView(root_)))
        return found;
    for (Dock* d : {left_dock_.get(), bottom_dock_.get(), right_dock_.get()})
    {
        if (!d)
            continue;
        if (PanelView found = visit(PanelView(d->panel())))
            return found;
    }
    return {};
}

std::vector<PanelView> DockArea::content_panels() const
{
    std::vector<PanelView> out;
    auto                   push = [&](const PanelView& p) { out.push_back(p); };
    root_->for_each_leaf_panel(push);
    for (Dock* d : {left_dock_.get(), bottom_dock_.get(), right_dock_.get()})
    {
        if (d)
            d->panel()->for_each_leaf_panel(push);
    }
    return out;
}

bool DockArea::contains_panel(const PanelView& panel) const
{
    return static_cast<bool>(find_panel([&](const PanelView& v) { return v == panel; }));
}

std::shared_ptr<TabPanel> DockArea::tab_panel_of(const PanelView& panel) const
{
    return find_panel(
               [&](const PanelView& v)
               {
                   auto tabs = v.downcast<TabPanel>();
                   return tabs && tabs->index_of_panel(panel).has_value();
               })
        .downcast<TabPanel>();
}

bool DockArea::focus_panel(const PanelView& panel)
{
    auto tabs = tab_panel_of(panel);
    if (!tabs)
        return false;
    tabs->set_active_panel(panel);
    focused_ = panel.view();
    return true;
}

// ─── Layout ─────────────────────────────────────────────────────────────────

void DockArea::layout(const Rect& bounds)
{
    bounds_ = bounds;

    float lw      = left_dock_ ? std::min(left_dock_->extent(), bounds.w) : 0.0f;
    float rw      = right_dock_ ? std::min(right_dock_->extent(), bounds.w - lw) : 0.0f;
    float inner_w = bounds.w - lw - rw;
    float bh      = bottom_dock_ ? std::min(bottom_dock_->extent(), bounds.h) : 0.0f;

    if (left_dock_)
        left_dock_->layout({bounds.x, bounds.y, lw, bounds.h});
    if (right_dock_)
        right_dock_->layout({bounds.right() - rw, bounds.y, rw, bounds.h});
    if (bottom_dock_)
        bottom_dock_->layout({bounds.x + lw, bounds.bottom() - bh, inner_w, bh});

    center_bounds_ = {bounds.x + lw, bounds.y, inner_w, bounds.h - bh};
    root_->layout(center_bounds_);

    // The zoomed panel is laid out over the whole area last.
    if (auto zoomed = zoom_.lock())
        zoomed->layout(bounds);
}

void DockArea::draw() const
{
    if (auto zoomed = zoom_.lock())
    {
        zoomed->draw(bounds_);
        return;
    }
    root_->draw(center_bounds_);
    for (Dock* d : {left_dock_.get(), bottom_dock_.get(), right_dock_.get()})
    {
        if (d)
            d->draw();
    }
}

// ─── State ──────────────────────────────────────────────────────────────────

DockAreaState DockArea::dump() const
{
    DockAreaState state;
    state.version = version_;
    state.root    = root_->dump();
    if (left_dock_)
        state.left_dock = left_dock_->dump();
    if (bottom_dock_)
        state.bottom_dock = bottom_dock_->dump();
    if (right_dock_)
        state.right_dock = right_dock_->dump();
    return state;
}

void DockArea::load(const DockAreaState& state)
{
    NotifyGuard guard(*this);

    version_ = state.version;
    zoom_.reset();
    focused_.reset();
    root_ = make_root_from(build_item(state.root), Axis::Horizontal);

    auto load_dock = [&](DockPlacement placement, const std::optional<DockState>& saved)
    {
        auto& slot = dock_slot(placement);
        if (!saved)
        {
            slot.reset();
            return;
        }
        auto d = std::make_unique<Dock>(placement, weak_from_this());
        d->set_panel(build_item(saved->panel));
        d->set_size(saved->size);
        d->set_open(saved->open);
        slot = std::move(d);
    };
    load_dock(DockPlacement::Left, state.left_dock);
    load_dock(DockPlacement::Bottom, state.bottom_dock);
    load_dock(DockPlacement::Right, state.right_dock);

    QUAY_LOG_DEBUG("dock.state", "loaded layout '{}' with {} panels", id_, content_panels().size());
}

// Always yields a container (or nothing): bare panels get a TabPanel.
PanelView DockArea::build_item(const DockItemState& state)
{
    switch (state.kind)
    {
        case DockItemState::Kind::Tabs:
            return PanelView(build_tabs(state));
        case DockItemState::Kind::Split:
            return build_split(state);
        case DockItemState::Kind::Panel:
            break;
    }
    auto tabs = TabPanel::create(weak_from_this());
    tabs->add_panel(PanelRegistry::instance().build(weak_from_this(), state));
    return PanelView(tabs);
}

std::shared_ptr<TabPanel> DockArea::build_tabs(const DockItemState& state)
{
    auto tabs = TabPanel::create(weak_from_this());

    std::vector<const DockItemState*> panels;
    collect_panel_states(state, panels);
    for (const DockItemState* p : panels)
        tabs->add_panel(PanelRegistry::instance().build(weak_from_this(), *p));

    if (!tabs->empty())
        tabs->set_active_ix(std::min(state.info.active_index, tabs->count() - 1));
    return tabs;
}

// Same-axis chains become one stack; a split that lost a side collapses to
// the survivor.
PanelView DockArea::build_split(const DockItemState& state)
{
    const Axis axis = state.info.axis;

    std::vector<std::pair<const DockItemState*, float>> chain;
    collect_split_chain(state, axis, 1.0f, chain);

    std::vector<Part> parts;
    for (const auto& [item, share] : chain)
        parts.push_back({build_item(*item), share});
    return assemble(axis, std::move(parts), weak_from_this());
}

// ─── Hooks ──────────────────────────────────────────────────────────────────

void DockArea::read_state(const std::string& key, ReadCallback done) const
{
    if (read_hook_)
        read_hook_(key, std::move(done));
    else
        done(std::nullopt);
}

void DockArea::write_state(const std::string& key, const std::string& value, WriteCallback done) const
{
    if (write_hook_)
        write_hook_(key, value, std::move(done));
    else
        done(true);
}

void DockArea::notify_layout_changed()
{
    if (suppress_notify_ > 0 || !on_layout_changed_)
        return;
    on_layout_changed_();
}

}   // namespace quay
