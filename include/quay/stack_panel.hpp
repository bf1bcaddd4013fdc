#pragma once

#include <memory>
#include <optional>
#include <quay/geometry.hpp>
#include <quay/panel.hpp>
#include <quay/resizable_panel_group.hpp>
#include <utility>
#include <vector>

namespace quay
{

class DockArea;
class TabPanel;

/**
 * StackPanel: an N-ary split along one axis.
 *
 * Children are TabPanels, nested StackPanels or plain panels, each sitting
 * in one slot of a ResizablePanelGroup. A StackPanel that loses its last
 * child removes itself from its parent; the root (no live parent) stays.
 */
class StackPanel : public Panel
{
   public:
    static constexpr const char* PANEL_NAME = "StackPanel";

    static std::shared_ptr<StackPanel> create(Axis axis, std::weak_ptr<DockArea> dock_area = {});

    explicit StackPanel(Axis axis, std::weak_ptr<DockArea> dock_area = {});

    std::string   panel_name() const override { return PANEL_NAME; }
    std::string   title() const override { return PANEL_NAME; }
    bool          closeable() const override { return false; }
    DockItemState dump() const override;
    void          layout(const Rect& bounds) override;
    void          draw(const Rect& bounds) override;

    Axis axis() const { return axis_; }
    void set_axis(Axis axis);

    const std::vector<PanelView>& panels() const { return panels_; }
    size_t                        panels_len() const { return panels_.size(); }
    ResizablePanelGroup&          group() { return group_; }
    const ResizablePanelGroup&    group() const { return group_; }

    void add_panel(PanelView panel, std::optional<float> size = std::nullopt);
    // Appends after the last child for Right/Bottom, before the first for Top/Left.
    void add_panel_at(PanelView panel, Placement placement, std::optional<float> size = std::nullopt);
    void insert_panel_at(PanelView            panel,
                         size_t               ix,
                         Placement            placement,
                         std::optional<float> size = std::nullopt);
    void insert_panel_before(PanelView panel, size_t ix, std::optional<float> size = std::nullopt);
    void insert_panel_after(PanelView panel, size_t ix, std::optional<float> size = std::nullopt);

    bool remove_panel(const PanelView& panel);
    bool replace_panel(const PanelView& old_panel, PanelView new_panel);
    void remove_all_panels();

    std::optional<size_t> index_of_panel(const PanelView& panel) const;

    // No live parent.
    bool is_root() const { return parent_.expired(); }
    // True when this stack and every ancestor hold a single child.
    bool is_last_panel() const;

    std::shared_ptr<StackPanel> parent() const { return parent_.lock(); }
    void                        set_parent(std::weak_ptr<StackPanel> parent) { parent_ = std::move(parent); }

    std::weak_ptr<DockArea> dock_area() const { return dock_area_; }
    void                    set_dock_area(std::weak_ptr<DockArea> dock_area);

    // First TabPanel reached by always taking the first child. With
    // check_parent the search starts from the outermost ancestor.
    std::shared_ptr<TabPanel> left_top_tab_panel(bool check_parent = false) const;
    // Like left_top_tab_panel but takes the last child of horizontal stacks.
    std::shared_ptr<TabPanel> right_top_tab_panel(bool check_parent = false) const;

    // Depth-first visit of every non-container panel below this stack.
    void for_each_leaf_panel(const std::function<void(const PanelView&)>& fn) const;

    std::shared_ptr<StackPanel> self() { return std::static_pointer_cast<StackPanel>(shared_from_this()); }

   private:
    void insert_panel(PanelView panel, size_t ix, std::optional<float> size);
    void collect_chain(Axis axis, float scale, std::vector<std::pair<DockItemState, float>>& out) const;
    void adopt(const PanelView& panel);
    void remove_self_if_empty();
    void notify_layout_changed() const;

    Axis                      axis_;
    std::vector<PanelView>    panels_;
    ResizablePanelGroup       group_;
    std::weak_ptr<StackPanel> parent_;
    std::weak_ptr<DockArea>   dock_area_;
};

}   // namespace quay
