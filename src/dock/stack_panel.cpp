#include <algorithm>
#include <quay/dock_area.hpp>
#include <quay/logger.hpp>
#include <quay/stack_panel.hpp>
#include <quay/tab_panel.hpp>

namespace quay
{

std::shared_ptr<StackPanel> StackPanel::create(Axis axis, std::weak_ptr<DockArea> dock_area)
{
    return std::make_shared<StackPanel>(axis, std::move(dock_area));
}

StackPanel::StackPanel(Axis axis, std::weak_ptr<DockArea> dock_area)
    : axis_(axis), group_(axis), dock_area_(std::move(dock_area))
{
    group_.set_on_resize([this] { notify_layout_changed(); });
}

// N children dump as a right-nested chain of binary splits; the fraction at
// each level is the child's share of what is left from it onwards. Same-axis
// descendants join the chain, as loading flattens them into one stack.
DockItemState StackPanel::dump() const
{
    if (panels_.empty())
        return DockItemState::tabs({});
    if (panels_.size() == 1)
        return panels_.front().dump();

    std::vector<std::pair<DockItemState, float>> parts;
    collect_chain(axis_, 1.0f, parts);

    DockItemState chain = std::move(parts.back().first);
    float         rest  = parts.back().second;
    for (size_t i = parts.size() - 1; i-- > 0;)
    {
        float share    = parts[i].second;
        float total    = share + rest;
        float fraction = total > 0.0f ? std::clamp(share / total, 0.0f, 1.0f) : 0.5f;
        chain          = DockItemState::split(axis_, fraction, std::move(parts[i].first), std::move(chain));
        rest           = total;
    }
    return chain;
}

void StackPanel::collect_chain(Axis axis, float scale, std::vector<std::pair<DockItemState, float>>& out) const
{
    std::vector<float> shares = group_.fractions();
    for (size_t i = 0; i < panels_.size(); ++i)
    {
        float share = scale * shares[i];
        auto  stack = panels_[i].downcast<StackPanel>();
        if (stack && !stack->panels_.empty() && (stack->axis_ == axis || stack->panels_.size() == 1))
            stack->collect_chain(axis, share, out);
        else
            out.emplace_back(panels_[i].dump(), share);
    }
}

void StackPanel::layout(const Rect& bounds)
{
    bounds_ = bounds;
    group_.layout(bounds);
}

void StackPanel::draw(const Rect& /*bounds*/)
{
    for (const auto& slot : group_.children())
        slot.content.draw(slot.bounds);
}

void StackPanel::set_axis(Axis axis)
{
    if (axis_ == axis)
        return;
    axis_ = axis;
    group_.set_axis(axis);
    notify_layout_changed();
}

void StackPanel::set_dock_area(std::weak_ptr<DockArea> dock_area)
{
    dock_area_ = std::move(dock_area);
    for (const auto& p : panels_)
    {
        if (auto tabs = p.downcast<TabPanel>())
            tabs->set_dock_area(dock_area_);
        else if (auto stack = p.downcast<StackPanel>())
            stack->set_dock_area(dock_area_);
    }
}

// ─── Insertion ──────────────────────────────────────────────────────────────

void StackPanel::add_panel(PanelView panel, std::optional<float> size)
{
    insert_panel(std::move(panel), panels_.size(), size);
}

void StackPanel::add_panel_at(PanelView panel, Placement placement, std::optional<float> size)
{
    if (placement_is_before(placement))
        insert_panel(std::move(panel), 0, size);
    else
        insert_panel(std::move(panel), panels_.size(), size);
}

void StackPanel::insert_panel_at(PanelView            panel,
                                 size_t               ix,
                                 Placement            placement,
                                 std::optional<float> size)
{
    if (placement_is_before(placement))
        insert_panel_before(std::move(panel), ix, size);
    else
        insert_panel_after(std::move(panel), ix, size);
}

void StackPanel::insert_panel_before(PanelView panel, size_t ix, std::optional<float> size)
{
    insert_panel(std::move(panel), ix, size);
}

void StackPanel::insert_panel_after(PanelView panel, size_t ix, std::optional<float> size)
{
    insert_panel(std::move(panel), ix + 1, size);
}

void StackPanel::insert_panel(PanelView panel, size_t ix, std::optional<float> size)
{
    if (!panel || panel == this)
        return;
    if (index_of_panel(panel))
        return;

    ix = std::min(ix, panels_.size());
    panels_.insert(panels_.begin() + static_cast<std::ptrdiff_t>(ix), panel);
    group_.insert_child(panel, ix, size);
    adopt(panel);

    QUAY_LOG_TRACE("dock.stack", "inserted '{}' at {} ({} children)", panel.panel_name(), ix, panels_.size());
    notify_layout_changed();
}

// Containers get this stack as their parent and share its DockArea.
void StackPanel::adopt(const PanelView& panel)
{
    auto me = std::static_pointer_cast<StackPanel>(weak_from_this().lock());
    if (auto tabs = panel.downcast<TabPanel>())
    {
        tabs->set_parent(me);
        if (!dock_area_.expired())
            tabs->set_dock_area(dock_area_);
    }
    else if (auto stack = panel.downcast<StackPanel>())
    {
        stack->set_parent(me);
        if (!dock_area_.expired())
            stack->set_dock_area(dock_area_);
    }
}

// ─── Removal ────────────────────────────────────────────────────────────────

bool StackPanel::remove_panel(const PanelView& panel)
{
    auto ix = index_of_panel(panel);
    if (!ix)
    {
        QUAY_LOG_WARN("dock.stack", "panel '{}' is not a child of this stack", panel.panel_name());
        return false;
    }

    if (auto tabs = panel.downcast<TabPanel>(); tabs && tabs->parent().get() == this)
        tabs->set_parent({});
    else if (auto stack = panel.downcast<StackPanel>(); stack && stack->parent().get() == this)
        stack->set_parent({});

    panels_.erase(panels_.begin() + static_cast<std::ptrdiff_t>(*ix));
    group_.remove_child(*ix);
    notify_layout_changed();
    remove_self_if_empty();
    return true;
}

bool StackPanel::replace_panel(const PanelView& old_panel, PanelView new_panel)
{
    auto ix = index_of_panel(old_panel);
    if (!ix || !new_panel)
        return false;

    panels_[*ix] = new_panel;
    group_.replace_child(*ix, new_panel);
    adopt(new_panel);
    notify_layout_changed();
    return true;
}

void StackPanel::remove_all_panels()
{
    panels_.clear();
    group_.remove_all_children();
    notify_layout_changed();
}

// The root never removes itself, and neither does a stack whose parent is
// gone.
void StackPanel::remove_self_if_empty()
{
    if (!panels_.empty())
        return;
    auto parent = parent_.lock();
    if (!parent)
        return;
    auto me = weak_from_this().lock();
    if (!me)
        return;
    QUAY_LOG_DEBUG("dock.stack", "empty stack removes itself from its parent");
    parent->remove_panel(PanelView(me));
}

// ─── Queries ────────────────────────────────────────────────────────────────

std::optional<size_t> StackPanel::index_of_panel(const PanelView& panel) const
{
    auto it = std::find(panels_.begin(), panels_.end(), panel);
    if (it == panels_.end())
        return std::nullopt;
    return static_cast<size_t>(it - panels_.begin());
}

bool StackPanel::is_last_panel() const
{
    if (panels_.size() > 1)
        return false;
    if (auto parent = parent_.lock())
        return parent->is_last_panel();
    return true;
}

std::shared_ptr<TabPanel> StackPanel::left_top_tab_panel(bool check_parent) const
{
    if (check_parent)
    {
        if (auto parent = parent_.lock())
        {
            if (auto found = parent->left_top_tab_panel(true))
                return found;
        }
    }

    if (panels_.empty())
        return nullptr;
    const PanelView& first = panels_.front();
    if (auto tabs = first.downcast<TabPanel>())
        return tabs;
    if (auto stack = first.downcast<StackPanel>())
        return stack->left_top_tab_panel(false);
    return nullptr;
}

std::shared_ptr<TabPanel> StackPanel::right_top_tab_panel(bool check_parent) const
{
    if (check_parent)
    {
        if (auto parent = parent_.lock())
        {
            if (auto found = parent->right_top_tab_panel(true))
                return found;
        }
    }

    if (panels_.empty())
        return nullptr;
    const PanelView& pick = axis_ == Axis::Vertical ? panels_.front() : panels_.back();
    if (auto tabs = pick.downcast<TabPanel>())
        return tabs;
    if (auto stack = pick.downcast<StackPanel>())
        return stack->right_top_tab_panel(false);
    return nullptr;
}

void StackPanel::for_each_leaf_panel(const std::function<void(const PanelView&)>& fn) const
{
    for (const auto& p : panels_)
    {
        if (auto stack = p.downcast<StackPanel>())
            stack->for_each_leaf_panel(fn);
        else if (auto tabs = p.downcast<TabPanel>())
            for (const auto& t : tabs->panels())
                fn(t);
        else
            fn(p);
    }
}

void StackPanel::notify_layout_changed() const
{
    if (auto area = dock_area_.lock())
        area->notify_layout_changed();
}

}   // namespace quay
