#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <quay/geometry.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace quay
{

// Direction in which a node is split. Left/Right produce a Horizontal node,
// Top/Bottom a Vertical one.
enum class Split
{
    Left,
    Right,
    Top,
    Bottom,
};

inline bool split_is_horizontal(Split s)
{
    return s == Split::Left || s == Split::Right;
}

// Index into a Tree's node vector. Children of n live at 2n+1 and 2n+2.
struct NodeIndex
{
    size_t value = 0;

    static NodeIndex root() { return {0}; }

    NodeIndex left() const { return {value * 2 + 1}; }
    NodeIndex right() const { return {value * 2 + 2}; }
    NodeIndex parent() const { return {(value - 1) / 2}; }
    NodeIndex sibling() const { return is_left() ? NodeIndex{value + 1} : NodeIndex{value - 1}; }
    bool      is_root() const { return value == 0; }
    bool      is_left() const { return value % 2 == 1; }

    bool operator==(const NodeIndex&) const = default;
};

// ─── Node ───────────────────────────────────────────────────────────────────

template <typename Tab>
class Node
{
   public:
    enum class Kind
    {
        Empty,
        Leaf,
        Horizontal,
        Vertical,
    };

    Node() = default;

    static Node empty() { return Node(); }

    static Node leaf(Tab tab)
    {
        std::vector<Tab> tabs;
        tabs.push_back(std::move(tab));
        return leaf_with(std::move(tabs));
    }

    // An empty tab list yields an Empty node.
    static Node leaf_with(std::vector<Tab> tabs, size_t active = 0)
    {
        Node n;
        if (tabs.empty())
            return n;
        n.kind_   = Kind::Leaf;
        n.active_ = active < tabs.size() ? active : 0;
        n.tabs_   = std::move(tabs);
        return n;
    }

    static Node horizontal(float fraction) { return parent_node(Kind::Horizontal, fraction); }
    static Node vertical(float fraction) { return parent_node(Kind::Vertical, fraction); }

    Kind kind() const { return kind_; }
    bool is_empty() const { return kind_ == Kind::Empty; }
    bool is_leaf() const { return kind_ == Kind::Leaf; }
    bool is_horizontal() const { return kind_ == Kind::Horizontal; }
    bool is_vertical() const { return kind_ == Kind::Vertical; }
    bool is_parent() const { return is_horizontal() || is_vertical(); }

    // Share of the first (left or top) child. Zero for non-parent nodes.
    float fraction() const { return fraction_; }

    void set_fraction(float fraction)
    {
        check_fraction(fraction);
        if (!is_parent())
            throw std::logic_error("quay::Node: fraction set on a node that is not split");
        fraction_ = fraction;
    }

    // Turns this node into a Horizontal/Vertical parent and returns what it
    // held before. The caller is responsible for placing the returned node.
    Node split(Split direction, float fraction)
    {
        check_fraction(fraction);
        Node old = std::move(*this);
        *this    = split_is_horizontal(direction) ? horizontal(fraction) : vertical(fraction);
        return old;
    }

    // ─── Tabs ───────────────────────────────────────────────────────────

    const std::vector<Tab>& tabs() const { return tabs_; }
    size_t                  tabs_count() const { return tabs_.size(); }
    size_t                  active() const { return active_; }

    const Tab* active_tab() const
    {
        return is_leaf() && active_ < tabs_.size() ? &tabs_[active_] : nullptr;
    }

    bool set_active(size_t ix)
    {
        if (!is_leaf() || ix >= tabs_.size())
            return false;
        active_ = ix;
        return true;
    }

    // Appends and activates. An Empty node becomes a Leaf.
    void append_tab(Tab tab) { insert_tab(tabs_.size(), std::move(tab)); }

    // Inserts at ix (clamped to the tab count) and activates the new tab.
    void insert_tab(size_t ix, Tab tab)
    {
        if (is_parent())
            throw std::logic_error("quay::Node: tab inserted into a split node");
        kind_ = Kind::Leaf;
        if (ix > tabs_.size())
            ix = tabs_.size();
        tabs_.insert(tabs_.begin() + static_cast<std::ptrdiff_t>(ix), std::move(tab));
        active_ = ix;
    }

    std::optional<Tab> remove_tab(size_t ix)
    {
        if (!is_leaf() || ix >= tabs_.size())
            return std::nullopt;

        Tab removed = std::move(tabs_[ix]);
        tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(ix));
        if (ix == active_)
            active_ = 0;
        else if (ix < active_)
            --active_;
        normalize();
        return removed;
    }

    template <typename Pred>
    void retain_tabs(Pred&& pred)
    {
        if (!is_leaf())
            return;
        std::vector<Tab> kept;
        size_t           new_active  = 0;
        bool             active_kept = false;
        for (size_t i = 0; i < tabs_.size(); ++i)
        {
            if (!pred(tabs_[i]))
                continue;
            if (i == active_)
            {
                new_active  = kept.size();
                active_kept = true;
            }
            kept.push_back(std::move(tabs_[i]));
        }
        tabs_   = std::move(kept);
        active_ = active_kept ? new_active : 0;
        normalize();
    }

    // Builds a node of another tab type with the same shape. Tabs for which
    // fn returns nullopt are dropped; a leaf left with none becomes Empty.
    template <typename NewTab, typename Fn>
    Node<NewTab> filter_map_tabs(Fn&& fn) const
    {
        if (!is_leaf())
        {
            if (is_horizontal())
                return Node<NewTab>::horizontal(fraction_).with_bounds(size_, content_size_);
            if (is_vertical())
                return Node<NewTab>::vertical(fraction_).with_bounds(size_, content_size_);
            return Node<NewTab>::empty();
        }

        std::vector<NewTab> mapped;
        size_t              new_active = 0;
        for (size_t i = 0; i < tabs_.size(); ++i)
        {
            std::optional<NewTab> t = fn(tabs_[i]);
            if (!t)
                continue;
            if (i <= active_)
                new_active = mapped.size();
            mapped.push_back(std::move(*t));
        }
        return Node<NewTab>::leaf_with(std::move(mapped), new_active)
            .with_bounds(size_, content_size_);
    }

    template <typename NewTab, typename Fn>
    Node<NewTab> map_tabs(Fn&& fn) const
    {
        return filter_map_tabs<NewTab>([&](const Tab& t)
                                       { return std::optional<NewTab>(fn(t)); });
    }

    template <typename Pred>
    Node filter_tabs(Pred&& pred) const
    {
        return filter_map_tabs<Tab>(
            [&](const Tab& t) -> std::optional<Tab>
            {
                if (pred(t))
                    return t;
                return std::nullopt;
            });
    }

    // ─── Bounds ─────────────────────────────────────────────────────────

    // Last computed bounds; for hit-testing and debugging only.
    const Rect& size() const { return size_; }
    void        set_size(const Rect& r) { size_ = r; }
    const Rect& content_size() const { return content_size_; }
    void        set_content_size(const Rect& r) { content_size_ = r; }

    Node with_bounds(const Rect& size, const Rect& content) &&
    {
        size_         = size;
        content_size_ = content;
        return std::move(*this);
    }

   private:
    static Node parent_node(Kind kind, float fraction)
    {
        check_fraction(fraction);
        Node n;
        n.kind_     = kind;
        n.fraction_ = fraction;
        return n;
    }

    static void check_fraction(float fraction)
    {
        if (!(fraction >= 0.0f && fraction <= 1.0f))
            throw std::invalid_argument("quay::Node: split fraction " + std::to_string(fraction)
                                        + " outside [0, 1]");
    }

    void normalize()
    {
        if (kind_ == Kind::Leaf && tabs_.empty())
        {
            kind_   = Kind::Empty;
            active_ = 0;
        }
        else if (active_ >= tabs_.size() && !tabs_.empty())
        {
            active_ = tabs_.size() - 1;
        }
    }

    Kind             kind_ = Kind::Empty;
    std::vector<Tab> tabs_;
    size_t           active_   = 0;
    float            fraction_ = 0.0f;
    Rect             size_;
    Rect             content_size_;
};

// ─── Tree ───────────────────────────────────────────────────────────────────

/**
 * Tree: binary split tree stored in a flat vector.
 *
 * The root lives at index 0 and is always present (possibly Empty). For a
 * Horizontal node the left child is the left region; for a Vertical node the
 * left child is the top region.
 */
template <typename Tab>
class Tree
{
   public:
    using NodeType = Node<Tab>;

    Tree() : nodes_(1) {}

    explicit Tree(std::vector<Tab> tabs) : nodes_(1)
    {
        nodes_[0] = NodeType::leaf_with(std::move(tabs));
        if (nodes_[0].is_leaf())
            focused_ = NodeIndex::root();
    }

    size_t len() const { return nodes_.size(); }
    bool   is_empty() const { return nodes_[0].is_empty(); }

    const NodeType& root() const { return nodes_[0]; }

    // Out-of-range indices read as an Empty node.
    const NodeType& operator[](NodeIndex ix) const
    {
        static const NodeType empty_node;
        return ix.value < nodes_.size() ? nodes_[ix.value] : empty_node;
    }

    NodeType& at(NodeIndex ix)
    {
        if (ix.value >= nodes_.size())
            throw std::out_of_range("quay::Tree: node index out of range");
        return nodes_[ix.value];
    }

    const std::vector<NodeType>& nodes() const { return nodes_; }

    // ─── Focus ──────────────────────────────────────────────────────────

    std::optional<NodeIndex> focused_node() const { return focused_; }

    void set_focused_node(std::optional<NodeIndex> ix)
    {
        if (ix && !(*this)[*ix].is_leaf())
            ix.reset();
        focused_ = ix;
    }

    // ─── Splitting ──────────────────────────────────────────────────────

    // Splits `parent`. For Right/Bottom the previous content becomes the
    // first child and new_node the second; for Left/Top the order is
    // reversed. Returns {old_index, new_index} and focuses the new node.
    std::array<NodeIndex, 2> split(NodeIndex parent, Split direction, float fraction,
                                   NodeType new_node)
    {
        if (parent.value >= nodes_.size())
            throw std::out_of_range("quay::Tree: split of a node outside the tree");

        // Built first so a bad fraction leaves the tree untouched.
        NodeType split_node = split_is_horizontal(direction) ? NodeType::horizontal(fraction)
                                                             : NodeType::vertical(fraction);

        // The previous content may itself be a subtree; move it down as a whole.
        std::vector<std::optional<NodeType>> old_subtree;
        extract_subtree(parent, 0, old_subtree);
        nodes_[parent.value] = std::move(split_node);

        const bool old_first = direction == Split::Right || direction == Split::Bottom;
        NodeIndex  old_ix    = old_first ? parent.left() : parent.right();
        NodeIndex  new_ix    = old_first ? parent.right() : parent.left();

        ensure_size(parent.right().value + 1);
        place_subtree(old_ix, 0, old_subtree);
        nodes_[new_ix.value] = std::move(new_node);

        focused_ = nodes_[new_ix.value].is_leaf() ? std::optional<NodeIndex>(new_ix) : std::nullopt;
        return {old_ix, new_ix};
    }

    std::array<NodeIndex, 2> split_left(NodeIndex parent, float fraction, std::vector<Tab> tabs)
    {
        return split(parent, Split::Left, fraction, NodeType::leaf_with(std::move(tabs)));
    }

    std::array<NodeIndex, 2> split_right(NodeIndex parent, float fraction, std::vector<Tab> tabs)
    {
        return split(parent, Split::Right, fraction, NodeType::leaf_with(std::move(tabs)));
    }

    std::array<NodeIndex, 2> split_top(NodeIndex parent, float fraction, std::vector<Tab> tabs)
    {
        return split(parent, Split::Top, fraction, NodeType::leaf_with(std::move(tabs)));
    }

    std::array<NodeIndex, 2> split_bottom(NodeIndex parent, float fraction, std::vector<Tab> tabs)
    {
        return split(parent, Split::Bottom, fraction, NodeType::leaf_with(std::move(tabs)));
    }

    // ─── Tabs ───────────────────────────────────────────────────────────

    // Adds to the focused leaf, falling back to the first leaf.
    void push_to_focused_leaf(Tab tab)
    {
        if (focused_ && (*this)[*focused_].is_leaf())
        {
            nodes_[focused_->value].append_tab(std::move(tab));
            return;
        }
        push_to_first_leaf(std::move(tab));
    }

    // Adds to the first leaf in index order. An Empty root becomes a leaf.
    void push_to_first_leaf(Tab tab)
    {
        for (size_t i = 0; i < nodes_.size(); ++i)
        {
            if (nodes_[i].is_leaf())
            {
                nodes_[i].append_tab(std::move(tab));
                focused_ = NodeIndex{i};
                return;
            }
        }
        if (nodes_[0].is_empty())
        {
            nodes_[0].append_tab(std::move(tab));
            focused_ = NodeIndex::root();
            return;
        }
        // Every leaf was emptied out of a split tree; reuse the first empty slot.
        for (size_t i = 1; i < nodes_.size(); ++i)
        {
            if (nodes_[i].is_empty() && nodes_[NodeIndex{i}.parent().value].is_parent())
            {
                nodes_[i].append_tab(std::move(tab));
                focused_ = NodeIndex{i};
                return;
            }
        }
    }

    std::optional<std::pair<NodeIndex, size_t>> find_tab(const Tab& tab) const
    {
        return find_tab_if([&](const Tab& t) { return t == tab; });
    }

    template <typename Pred>
    std::optional<std::pair<NodeIndex, size_t>> find_tab_if(Pred&& pred) const
    {
        for (size_t i = 0; i < nodes_.size(); ++i)
        {
            const auto& tabs = nodes_[i].tabs();
            for (size_t t = 0; t < tabs.size(); ++t)
            {
                if (nodes_[i].is_leaf() && pred(tabs[t]))
                    return std::make_pair(NodeIndex{i}, t);
            }
        }
        return std::nullopt;
    }

    // Removes one tab. A non-root leaf left without tabs is removed and its
    // sibling takes the parent's place.
    std::optional<Tab> remove_tab(NodeIndex node, size_t ix)
    {
        if (node.value >= nodes_.size())
            return std::nullopt;
        std::optional<Tab> removed = nodes_[node.value].remove_tab(ix);
        if (removed && nodes_[node.value].is_empty() && !node.is_root())
            remove_leaf(node);
        return removed;
    }

    // Deletes a leaf (or empty slot) and collapses its parent into the sibling.
    void remove_leaf(NodeIndex node)
    {
        if (node.value >= nodes_.size() || nodes_[node.value].is_parent())
            return;

        if (node.is_root())
        {
            nodes_[0] = NodeType::empty();
            focused_.reset();
            return;
        }

        NodeIndex parent  = node.parent();
        NodeIndex sibling = node.sibling();

        nodes_[node.value] = NodeType::empty();
        std::vector<std::optional<NodeType>> kept;
        extract_subtree(sibling, 0, kept);
        place_subtree(parent, 0, kept);

        if (focused_ && !(*this)[*focused_].is_leaf())
            focused_.reset();
        if (!focused_)
        {
            auto l = leaves();
            if (!l.empty())
                focused_ = l.front();
        }
    }

    size_t num_tabs() const
    {
        size_t n = 0;
        for (const auto& node : nodes_)
            if (node.is_leaf())
                n += node.tabs_count();
        return n;
    }

    // Leaves reachable from the root, in depth-first (left to right) order.
    std::vector<NodeIndex> leaves() const
    {
        std::vector<NodeIndex> out;
        collect_leaves(NodeIndex::root(), out);
        return out;
    }

    template <typename Pred>
    void retain_tabs(Pred&& pred)
    {
        for (auto& node : nodes_)
            node.retain_tabs(pred);
    }

    template <typename NewTab, typename Fn>
    Tree<NewTab> filter_map_tabs(Fn&& fn) const
    {
        Tree<NewTab> out;
        out.nodes_.clear();
        out.nodes_.reserve(nodes_.size());
        for (const auto& node : nodes_)
            out.nodes_.push_back(node.template filter_map_tabs<NewTab>(fn));
        out.set_focused_node(focused_);
        return out;
    }

    template <typename NewTab, typename Fn>
    Tree<NewTab> map_tabs(Fn&& fn) const
    {
        return filter_map_tabs<NewTab>([&](const Tab& t) { return std::optional<NewTab>(fn(t)); });
    }

    template <typename Pred>
    Tree filter_tabs(Pred&& pred) const
    {
        return filter_map_tabs<Tab>(
            [&](const Tab& t) -> std::optional<Tab>
            {
                if (pred(t))
                    return t;
                return std::nullopt;
            });
    }

    // Records bounds top-down from the fractions. tab_bar_height is taken off
    // the top of each leaf's content rectangle.
    void compute_layout(const Rect& bounds, float tab_bar_height = 0.0f)
    {
        layout_node(NodeIndex::root(), bounds, tab_bar_height);
    }

   private:
    template <typename>
    friend class Tree;

    void ensure_size(size_t n)
    {
        if (nodes_.size() < n)
            nodes_.resize(n);
    }

    // Moves the subtree rooted at `ix` into `out` (indexed relative to the
    // subtree root) and leaves Empty nodes behind.
    void extract_subtree(NodeIndex ix, size_t local, std::vector<std::optional<NodeType>>& out)
    {
        if (ix.value >= nodes_.size())
            return;
        if (out.size() <= local)
            out.resize(local + 1);
        const bool parent = nodes_[ix.value].is_parent();
        out[local]        = std::move(nodes_[ix.value]);
        nodes_[ix.value]  = NodeType::empty();
        if (parent)
        {
            extract_subtree(ix.left(), local * 2 + 1, out);
            extract_subtree(ix.right(), local * 2 + 2, out);
        }
    }

    void place_subtree(NodeIndex ix, size_t local, std::vector<std::optional<NodeType>>& in)
    {
        if (local >= in.size() || !in[local])
            return;
        ensure_size(ix.value + 1);
        const bool parent = in[local]->is_parent();
        nodes_[ix.value]  = std::move(*in[local]);
        in[local].reset();
        if (parent)
        {
            ensure_size(ix.right().value + 1);
            place_subtree(ix.left(), local * 2 + 1, in);
            place_subtree(ix.right(), local * 2 + 2, in);
        }
    }

    void collect_leaves(NodeIndex ix, std::vector<NodeIndex>& out) const
    {
        const NodeType& node = (*this)[ix];
        if (node.is_leaf())
        {
            out.push_back(ix);
        }
        else if (node.is_parent())
        {
            collect_leaves(ix.left(), out);
            collect_leaves(ix.right(), out);
        }
    }

    void layout_node(NodeIndex ix, const Rect& r, float tab_bar_height)
    {
        if (ix.value >= nodes_.size())
            return;
        NodeType& node = nodes_[ix.value];
        node.set_size(r);
        if (node.is_horizontal())
        {
            float lw = r.w * node.fraction();
            layout_node(ix.left(), {r.x, r.y, lw, r.h}, tab_bar_height);
            layout_node(ix.right(), {r.x + lw, r.y, r.w - lw, r.h}, tab_bar_height);
        }
        else if (node.is_vertical())
        {
            float th = r.h * node.fraction();
            layout_node(ix.left(), {r.x, r.y, r.w, th}, tab_bar_height);
            layout_node(ix.right(), {r.x, r.y + th, r.w, r.h - th}, tab_bar_height);
        }
        else
        {
            float bar = tab_bar_height < r.h ? tab_bar_height : r.h;
            node.set_content_size({r.x, r.y + bar, r.w, r.h - bar});
        }
    }

    std::vector<NodeType>    nodes_;
    std::optional<NodeIndex> focused_;
};

}   // namespace quay
