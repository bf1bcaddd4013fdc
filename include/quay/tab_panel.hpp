#pragma once

#include <memory>
#include <optional>
#include <quay/geometry.hpp>
#include <quay/panel.hpp>
#include <vector>

namespace quay
{

class DockArea;
class StackPanel;

/**
 * TabPanel: leaf container showing one of several panels at a time.
 *
 * Owns its tabs through PanelViews and points weakly at its parent
 * StackPanel and its DockArea. Emptying a TabPanel removes it from its
 * parent.
 */
class TabPanel : public Panel
{
   public:
    static constexpr const char* PANEL_NAME         = "TabPanel";
    static constexpr float       TAB_BAR_HEIGHT     = 26.0f;
    static constexpr float       DROP_ZONE_FRACTION = 0.25f;

    static std::shared_ptr<TabPanel> create(std::weak_ptr<DockArea> dock_area = {});

    explicit TabPanel(std::weak_ptr<DockArea> dock_area = {});

    std::string   panel_name() const override { return PANEL_NAME; }
    std::string   title() const override;
    bool          closeable() const override { return false; }
    DockItemState dump() const override;
    void          layout(const Rect& bounds) override;
    void          draw(const Rect& bounds) override;

    const std::vector<PanelView>& panels() const { return panels_; }
    size_t                        count() const { return panels_.size(); }
    bool                          empty() const { return panels_.empty(); }

    // Both activate the inserted panel. A panel already present is only
    // activated.
    void add_panel(PanelView panel);
    void insert_panel(PanelView panel, size_t ix);

    bool remove_panel(const PanelView& panel);
    // remove_panel for panels that allow closing.
    bool close_panel(const PanelView& panel);
    bool move_panel(size_t from, size_t to);

    std::optional<size_t> index_of_panel(const PanelView& panel) const;

    size_t    active_ix() const { return active_ix_; }
    bool      set_active_ix(size_t ix);
    bool      set_active_panel(const PanelView& panel);
    PanelView active_panel() const;

    // Zooms this TabPanel in its DockArea, or clears the zoom when it is the
    // zoomed one. No-op when the active panel is not zoomable.
    bool toggle_zoom();
    bool is_zoomed() const;

    bool is_collapsed() const { return collapsed_; }
    void set_collapsed(bool collapsed) { collapsed_ = collapsed; }

    // Edge zone of the last layout bounds under (x, y); nullopt for the
    // middle, which means "add as a tab".
    std::optional<Placement> drop_placement_at(float x, float y) const;

    // Moves `panel` out of `source` and into this TabPanel, either as a tab
    // (no placement) or as a split beside it.
    bool drop_panel(PanelView                        panel,
                    const std::shared_ptr<TabPanel>& source,
                    std::optional<Placement>         placement);

    // Places `panel` in a new TabPanel on the given side of this one.
    std::shared_ptr<TabPanel> split_panel(PanelView            panel,
                                          Placement            placement,
                                          std::optional<float> size = std::nullopt);

    Rect tab_bar_bounds() const;
    Rect content_bounds() const;

    std::shared_ptr<StackPanel> parent() const { return parent_.lock(); }
    void                        set_parent(std::weak_ptr<StackPanel> parent) { parent_ = std::move(parent); }

    std::weak_ptr<DockArea> dock_area() const { return dock_area_; }
    void                    set_dock_area(std::weak_ptr<DockArea> dock_area) { dock_area_ = std::move(dock_area); }

    std::shared_ptr<TabPanel> self() { return std::static_pointer_cast<TabPanel>(shared_from_this()); }

   private:
    bool locked() const;
    void remove_self_if_empty();
    void notify_layout_changed() const;

    std::vector<PanelView>    panels_;
    size_t                    active_ix_ = 0;
    bool                      collapsed_ = false;
    std::weak_ptr<StackPanel> parent_;
    std::weak_ptr<DockArea>   dock_area_;
};

}   // namespace quay
