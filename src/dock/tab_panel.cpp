#include <algorithm>
#include <quay/dock_area.hpp>
#include <quay/logger.hpp>
#include <quay/stack_panel.hpp>
#include <quay/tab_panel.hpp>

namespace quay
{

std::shared_ptr<TabPanel> TabPanel::create(std::weak_ptr<DockArea> dock_area)
{
    return std::make_shared<TabPanel>(std::move(dock_area));
}

TabPanel::TabPanel(std::weak_ptr<DockArea> dock_area) : dock_area_(std::move(dock_area)) {}

std::string TabPanel::title() const
{
    PanelView active = active_panel();
    return active ? active.title() : Panel::title();
}

DockItemState TabPanel::dump() const
{
    std::vector<DockItemState> children;
    children.reserve(panels_.size());
    for (const auto& p : panels_)
        children.push_back(p.dump());
    return DockItemState::tabs(std::move(children), active_ix_);
}

void TabPanel::layout(const Rect& bounds)
{
    bounds_ = bounds;
    if (PanelView active = active_panel())
        active.layout(content_bounds());
}

void TabPanel::draw(const Rect& /*bounds*/)
{
    if (collapsed_)
        return;
    if (PanelView active = active_panel())
        active.draw(content_bounds());
}

Rect TabPanel::tab_bar_bounds() const
{
    return {bounds_.x, bounds_.y, bounds_.w, std::min(TAB_BAR_HEIGHT, bounds_.h)};
}

Rect TabPanel::content_bounds() const
{
    float bar = std::min(TAB_BAR_HEIGHT, bounds_.h);
    return {bounds_.x, bounds_.y + bar, bounds_.w, collapsed_ ? 0.0f : bounds_.h - bar};
}

// ─── Tabs ───────────────────────────────────────────────────────────────────

void TabPanel::add_panel(PanelView panel)
{
    insert_panel(std::move(panel), panels_.size());
}

void TabPanel::insert_panel(PanelView panel, size_t ix)
{
    if (!panel || panel == this)
        return;
    if (auto existing = index_of_panel(panel))
    {
        set_active_ix(*existing);
        return;
    }

    ix = std::min(ix, panels_.size());
    panels_.insert(panels_.begin() + static_cast<std::ptrdiff_t>(ix), std::move(panel));
    active_ix_ = ix;
    notify_layout_changed();
}

bool TabPanel::remove_panel(const PanelView& panel)
{
    auto ix = index_of_panel(panel);
    if (!ix)
        return false;

    panels_.erase(panels_.begin() + static_cast<std::ptrdiff_t>(*ix));
    if (*ix < active_ix_)
        --active_ix_;
    if (active_ix_ >= panels_.size())
        active_ix_ = panels_.empty() ? 0 : panels_.size() - 1;

    notify_layout_changed();
    remove_self_if_empty();
    return true;
}

bool TabPanel::close_panel(const PanelView& panel)
{
    if (!panel.closeable())
    {
        QUAY_LOG_DEBUG("dock.tabs", "panel '{}' refuses to close", panel.panel_name());
        return false;
    }
    return remove_panel(panel);
}

bool TabPanel::move_panel(size_t from, size_t to)
{
    if (from >= panels_.size() || to >= panels_.size())
        return false;
    if (from == to)
        return true;

    PanelView active = active_panel();
    PanelView moved  = std::move(panels_[from]);
    panels_.erase(panels_.begin() + static_cast<std::ptrdiff_t>(from));
    panels_.insert(panels_.begin() + static_cast<std::ptrdiff_t>(to), std::move(moved));
    active_ix_ = index_of_panel(active).value_or(0);
    notify_layout_changed();
    return true;
}

std::optional<size_t> TabPanel::index_of_panel(const PanelView& panel) const
{
    auto it = std::find(panels_.begin(), panels_.end(), panel);
    if (it == panels_.end())
        return std::nullopt;
    return static_cast<size_t>(it - panels_.begin());
}

bool TabPanel::set_active_ix(size_t ix)
{
    if (ix >= panels_.size())
        return false;
    if (ix != active_ix_)
    {
        active_ix_ = ix;
        notify_layout_changed();
    }
    return true;
}

bool TabPanel::set_active_panel(const PanelView& panel)
{
    auto ix = index_of_panel(panel);
    return ix && set_active_ix(*ix);
}

PanelView TabPanel::active_panel() const
{
    return active_ix_ < panels_.size() ? panels_[active_ix_] : PanelView();
}

// ─── Zoom ───────────────────────────────────────────────────────────────────

bool TabPanel::toggle_zoom()
{
    auto area = dock_area_.lock();
    if (!area)
        return false;
    PanelView active = active_panel();
    if (!active || !active.zoomable())
        return false;
    area->toggle_zoom(PanelView(self()));
    return true;
}

bool TabPanel::is_zoomed() const
{
    auto area = dock_area_.lock();
    auto me   = std::const_pointer_cast<Panel>(weak_from_this().lock());
    return area && me && area->is_zoomed(PanelView(me));
}

// ─── Drag and drop ──────────────────────────────────────────────────────────

std::optional<Placement> TabPanel::drop_placement_at(float x, float y) const
{
    const Rect& b = bounds_;
    if (b.w <= 0.0f || b.h <= 0.0f)
        return std::nullopt;

    const float lo = DROP_ZONE_FRACTION;
    const float hi = 1.0f - DROP_ZONE_FRACTION;
    if (x < b.x + b.w * lo)
        return Placement::Left;
    if (x > b.x + b.w * hi)
        return Placement::Right;
    if (y < b.y + b.h * lo)
        return Placement::Top;
    if (y > b.y + b.h * hi)
        return Placement::Bottom;
    return std::nullopt;
}

bool TabPanel::drop_panel(PanelView                        panel,
                          const std::shared_ptr<TabPanel>& source,
                          std::optional<Placement>         placement)
{
    if (!panel || locked())
        return false;

    const bool from_self = source.get() == this;
    if (!placement)
    {
        if (from_self)
            return false;
        if (source)
            source->remove_panel(panel);
        add_panel(std::move(panel));
        return true;
    }

    // Splitting off the only tab would leave this panel empty and detached.
    if (from_self && panels_.size() == 1)
        return false;

    if (source)
        source->remove_panel(panel);
    return split_panel(std::move(panel), *placement) != nullptr;
}

std::shared_ptr<TabPanel> TabPanel::split_panel(PanelView            panel,
                                                Placement            placement,
                                                std::optional<float> size)
{
    if (!panel || locked())
        return nullptr;

    auto parent = parent_.lock();
    if (!parent)
    {
        QUAY_LOG_WARN("dock.tabs", "cannot split '{}' outside a stack", panel.panel_name());
        return nullptr;
    }

    auto me = self();
    auto ix = parent->index_of_panel(PanelView(me));
    if (!ix)
        return nullptr;

    auto new_tabs = TabPanel::create(dock_area_);
    new_tabs->add_panel(std::move(panel));

    const Axis axis = placement_axis(placement);
    if (parent->axis() != axis && parent->panels_len() == 1)
        parent->set_axis(axis);

    if (parent->axis() == axis)
    {
        parent->insert_panel_at(PanelView(new_tabs), *ix, placement, size);
    }
    else
    {
        // Cross-axis split: this panel and the new one share a nested stack
        // that takes this panel's slot.
        auto stack = StackPanel::create(axis, dock_area_);
        parent->replace_panel(PanelView(me), PanelView(stack));
        stack->add_panel(PanelView(me));
        stack->insert_panel_at(PanelView(new_tabs), 0, placement, size);
    }
    return new_tabs;
}

// ─── Internals ──────────────────────────────────────────────────────────────

bool TabPanel::locked() const
{
    auto area = dock_area_.lock();
    return area && area->is_locked();
}

void TabPanel::remove_self_if_empty()
{
    if (!panels_.empty())
        return;
    auto parent = parent_.lock();
    if (!parent)
        return;
    auto me = weak_from_this().lock();
    if (!me)
        return;
    QUAY_LOG_DEBUG("dock.tabs", "empty tab panel removes itself from its parent");
    parent->remove_panel(PanelView(me));
}

void TabPanel::notify_layout_changed() const
{
    if (auto area = dock_area_.lock())
        area->notify_layout_changed();
}

}   // namespace quay
