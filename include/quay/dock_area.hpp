#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <quay/dock.hpp>
#include <quay/dock_state.hpp>
#include <quay/geometry.hpp>
#include <quay/panel.hpp>
#include <quay/tree.hpp>
#include <string>
#include <vector>

namespace quay
{

class StackPanel;
class TabPanel;

/**
 * DockArea: root of a dockable layout.
 *
 * Owns the center StackPanel and up to three side docks, keeps the single
 * zoom slot, and converts the whole layout to and from DockAreaState.
 * Always held by shared_ptr (see create) because every container inside
 * points back at it weakly.
 */
class DockArea : public std::enable_shared_from_this<DockArea>
{
   public:
    using ReadCallback  = std::function<void(std::optional<std::string> value)>;
    using WriteCallback = std::function<void(bool ok)>;
    using ReadHook      = std::function<void(const std::string& key, ReadCallback done)>;
    using WriteHook =
        std::function<void(const std::string& key, const std::string& value, WriteCallback done)>;
    using LayoutChangedCallback = std::function<void()>;

    static std::shared_ptr<DockArea> create(std::string id, std::optional<size_t> version = std::nullopt);

    DockArea(const DockArea&)            = delete;
    DockArea& operator=(const DockArea&) = delete;

    const std::string&    id() const { return id_; }
    std::optional<size_t> version() const { return version_; }
    void                  set_version(std::optional<size_t> version) { version_ = version; }

    // ─── Center ─────────────────────────────────────────────────────────

    const std::shared_ptr<StackPanel>& root() const { return root_; }

    // A StackPanel becomes the root; anything else is placed in one.
    void set_center(PanelView item);
    void set_center(const Tree<PanelView>& tree);

    // Center adds a tab to the left-top TabPanel; side placements add to
    // that dock, creating it on first use.
    void add_panel(PanelView panel, DockPlacement placement = DockPlacement::Center);
    // Puts the panel in its own TabPanel along one edge of the center.
    void add_panel_at(PanelView panel, Placement placement, std::optional<float> size = std::nullopt);

    // ─── Docks ──────────────────────────────────────────────────────────

    void  set_dock(DockPlacement placement, PanelView item, std::optional<float> size = std::nullopt, bool open = true);
    Dock* dock(DockPlacement placement) const;
    bool  has_dock(DockPlacement placement) const { return dock(placement) != nullptr; }
    bool  is_dock_open(DockPlacement placement) const;
    void  toggle_dock(DockPlacement placement);
    void  set_dock_open(DockPlacement placement, bool open);
    void  set_dock_collapsible(DockPlacement placement, bool collapsible);
    bool  is_dock_collapsible(DockPlacement placement) const;
    bool  resize_dock(DockPlacement placement, float mouse_x, float mouse_y);

    // ─── Zoom ───────────────────────────────────────────────────────────

    // Zooms `panel`, or clears the zoom when `panel` is the zoomed one.
    void      toggle_zoom(const PanelView& panel);
    void      clear_zoom() { zoom_.reset(); }
    PanelView zoomed_panel() const { return PanelView(zoom_.lock()); }
    bool      is_zoomed(const PanelView& panel) const;

    // ─── Lookup ─────────────────────────────────────────────────────────

    // First panel (containers included) in depth-first order, center then
    // left, bottom and right docks, for which pred holds.
    PanelView find_panel(const std::function<bool(const PanelView&)>& pred) const;

    template <typename P>
    std::shared_ptr<P> panel() const
    {
        return find_panel([](const PanelView& p) { return p.downcast<P>() != nullptr; })
            .template downcast<P>();
    }

    // Every content panel (no containers), in the same order.
    std::vector<PanelView> content_panels() const;
    bool                   contains_panel(const PanelView& panel) const;
    // TabPanel holding `panel` as a tab.
    std::shared_ptr<TabPanel> tab_panel_of(const PanelView& panel) const;

    // Activates the tab holding `panel` and remembers it as focused.
    bool      focus_panel(const PanelView& panel);
    PanelView focused_panel() const { return PanelView(focused_.lock()); }

    // A locked area refuses drag/drop and splitting; resizing still works.
    void set_locked(bool locked) { locked_ = locked; }
    bool is_locked() const { return locked_; }

    // ─── Layout ─────────────────────────────────────────────────────────

    void        layout(const Rect& bounds);
    void        draw() const;
    const Rect& bounds() const { return bounds_; }
    const Rect& center_bounds() const { return center_bounds_; }

    // ─── State ──────────────────────────────────────────────────────────

    DockAreaState dump() const;
    // Replaces the whole layout. Unknown panel names load as InvalidPanel.
    void load(const DockAreaState& state);

    void set_read_state_hook(ReadHook hook) { read_hook_ = std::move(hook); }
    void set_write_state_hook(WriteHook hook) { write_hook_ = std::move(hook); }
    void read_state(const std::string& key, ReadCallback done) const;
    void write_state(const std::string& key, const std::string& value, WriteCallback done) const;

    void set_on_layout_changed(LayoutChangedCallback cb) { on_layout_changed_ = std::move(cb); }
    // Called by containers after every structural or size change.
    void notify_layout_changed();

   private:
    DockArea(std::string id, std::optional<size_t> version);

    std::unique_ptr<Dock>&       dock_slot(DockPlacement placement);
    std::shared_ptr<StackPanel>  make_root_from(PanelView item, Axis axis);
    PanelView                    build_item(const DockItemState& state);
    std::shared_ptr<TabPanel>    build_tabs(const DockItemState& state);
    PanelView                    build_split(const DockItemState& state);
    PanelView                    build_tree_node(const Tree<PanelView>& tree, NodeIndex ix);

    // Silences layout-changed callbacks while the tree is being rebuilt.
    struct NotifyGuard
    {
        explicit NotifyGuard(DockArea& a) : area(a) { ++area.suppress_notify_; }
        ~NotifyGuard() { --area.suppress_notify_; }
        DockArea& area;
    };

    std::string                 id_;
    std::optional<size_t>       version_;
    std::shared_ptr<StackPanel> root_;
    std::unique_ptr<Dock>       left_dock_;
    std::unique_ptr<Dock>       bottom_dock_;
    std::unique_ptr<Dock>       right_dock_;
    std::weak_ptr<Panel>        zoom_;
    std::weak_ptr<Panel>        focused_;
    bool                        locked_ = false;
    Rect                        bounds_;
    Rect                        center_bounds_;

    ReadHook              read_hook_;
    WriteHook             write_hook_;
    LayoutChangedCallback on_layout_changed_;
    int                   suppress_notify_ = 0;
};

}   // namespace quay
