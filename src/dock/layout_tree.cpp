#include <algorithm>
#include <quay/layout_tree.hpp>

namespace quay
{

namespace
{

bool is_empty_item(const DockItemState& item)
{
    return item.is_tabs() && item.children.empty();
}

DockItemState item_from_node(const Tree<PanelView>& tree, NodeIndex ix)
{
    const auto& node = tree[ix];
    if (node.is_leaf())
    {
        std::vector<DockItemState> children;
        children.reserve(node.tabs_count());
        for (const auto& tab : node.tabs())
            children.push_back(tab.dump());
        return DockItemState::tabs(std::move(children), node.active());
    }
    if (!node.is_parent())
        return DockItemState::tabs({});

    DockItemState first  = item_from_node(tree, ix.left());
    DockItemState second = item_from_node(tree, ix.right());
    if (is_empty_item(first))
        return second;
    if (is_empty_item(second))
        return first;
    const Axis axis = node.is_horizontal() ? Axis::Horizontal : Axis::Vertical;
    return DockItemState::split(axis, node.fraction(), std::move(first), std::move(second));
}

void collect_panels(const DockItemState& item, std::vector<DockItemState>& out)
{
    if (item.is_panel())
    {
        out.push_back(item);
        return;
    }
    for (const auto& child : item.children)
        collect_panels(child, out);
}

void fill_node(Tree<DockItemState>& tree, NodeIndex ix, const DockItemState& item)
{
    using NodeType = Tree<DockItemState>::NodeType;

    if (item.is_split() && item.first() && item.second())
    {
        const Split dir = item.info.axis == Axis::Horizontal ? Split::Right : Split::Bottom;
        auto [first_ix, second_ix] = tree.split(ix, dir, item.info.fraction, NodeType::empty());
        fill_node(tree, first_ix, *item.first());
        fill_node(tree, second_ix, *item.second());
        return;
    }

    std::vector<DockItemState> panels;
    collect_panels(item, panels);
    size_t active = 0;
    if (item.is_tabs() && !panels.empty())
        active = std::min(item.info.active_index, panels.size() - 1);
    tree.at(ix) = NodeType::leaf_with(std::move(panels), active);
}

}   // namespace

DockItemState to_item_state(const Tree<PanelView>& tree)
{
    return item_from_node(tree, NodeIndex::root());
}

Tree<DockItemState> to_layout_tree(const DockItemState& state)
{
    Tree<DockItemState> tree;
    fill_node(tree, NodeIndex::root(), state);
    tree.set_focused_node(std::nullopt);
    return tree;
}

}   // namespace quay
