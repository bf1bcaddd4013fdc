#pragma once

#include <cstddef>
#include <optional>
#include <quay/geometry.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace quay
{

// Per-item payload. Which fields matter depends on DockItemState::kind:
// Split uses axis/fraction, Tabs uses active_index, Panel uses panel_state.
struct DockItemInfo
{
    Axis        axis         = Axis::Horizontal;
    float       fraction     = 0.5f;
    size_t      active_index = 0;
    std::string panel_state  = "null";   // opaque JSON text owned by the panel

    bool operator==(const DockItemInfo&) const = default;
};

/**
 * DockItemState: serializable snapshot of one node of the layout.
 *
 *   Tabs   children are the tabs, info.active_index the active one
 *   Split  children are exactly {first, second}
 *   Panel  panel_name keys the PanelRegistry, info.panel_state is passed back
 */
struct DockItemState
{
    enum class Kind
    {
        Tabs,
        Split,
        Panel,
    };

    Kind                       kind = Kind::Panel;
    std::string                panel_name;
    std::vector<DockItemState> children;
    DockItemInfo               info;

    static DockItemState tabs(std::vector<DockItemState> children, size_t active_index = 0);
    static DockItemState split(Axis          axis,
                               float         fraction,
                               DockItemState first,
                               DockItemState second);
    static DockItemState panel(std::string name, std::string panel_state = "null");

    bool is_tabs() const { return kind == Kind::Tabs; }
    bool is_split() const { return kind == Kind::Split; }
    bool is_panel() const { return kind == Kind::Panel; }

    const DockItemState* first() const { return is_split() && children.size() == 2 ? &children[0] : nullptr; }
    const DockItemState* second() const { return is_split() && children.size() == 2 ? &children[1] : nullptr; }

    bool operator==(const DockItemState&) const = default;
};

struct DockState
{
    DockPlacement placement = DockPlacement::Left;
    float         size      = 0.0f;
    bool          open      = true;
    DockItemState panel;

    bool operator==(const DockState&) const = default;
};

struct DockAreaState
{
    std::optional<size_t>    version;
    DockItemState            root = DockItemState::tabs({});
    std::optional<DockState> left_dock;
    std::optional<DockState> bottom_dock;
    std::optional<DockState> right_dock;

    bool operator==(const DockAreaState&) const = default;
};

// ─── JSON codec ─────────────────────────────────────────────────────────────

std::string serialize_json(const DockAreaState& state);
std::string serialize_json(const DockItemState& item);

// On failure returns false, leaves `out` untouched and stores a message in
// *error when given.
bool deserialize_json(std::string_view json, DockAreaState& out, std::string* error = nullptr);
bool deserialize_json(std::string_view json, DockItemState& out, std::string* error = nullptr);

}   // namespace quay
