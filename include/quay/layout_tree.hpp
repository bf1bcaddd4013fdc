#pragma once

#include <quay/dock_state.hpp>
#include <quay/panel.hpp>
#include <quay/tree.hpp>

namespace quay
{

// Snapshot of a panel tree: leaves dump as Tabs, parents as binary Splits.
// A parent with one empty side collapses into the other side.
DockItemState to_item_state(const Tree<PanelView>& tree);

// Shape of a snapshot as a tree whose tabs are the Panel items. Tabs nested
// inside Tabs are flattened into the enclosing leaf.
Tree<DockItemState> to_layout_tree(const DockItemState& state);

}   // namespace quay
