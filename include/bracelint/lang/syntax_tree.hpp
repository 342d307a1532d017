#pragma once

#include <bracelint/lang/node_kind.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bracelint {

// Stable handle of a node inside its SyntaxTree
using NodeId = std::uint32_t;

struct Node {
    NodeKind kind = NodeKind::CompilationUnit;
    std::string text;
    int line = 1;  // 1-based
    int col = 0;   // 0-based
    std::optional<NodeId> parent;
    std::vector<NodeId> children;
    size_t index_in_parent = 0;
};

// Arena-allocated syntax tree of one compilation unit plus its source text.
// Parents own their children through index lists; the parent link is a
// plain back-reference. Nodes are never removed, so NodeIds stay valid for
// the lifetime of the tree.
class SyntaxTree {
public:
    // Start a new tree. Any previously added nodes are discarded.
    NodeId add_root(NodeKind kind, std::string text, int line, int col);

    // Append a child as the last child of `parent`.
    // Throws std::out_of_range if `parent` is not a node of this tree.
    NodeId add_child(NodeId parent, NodeKind kind, std::string text,
                     int line, int col);

    std::optional<NodeId> root() const { return root_; }
    size_t size() const { return nodes_.size(); }
    bool contains(NodeId id) const { return id < nodes_.size(); }

    const Node& node(NodeId id) const { return nodes_.at(id); }
    NodeKind kind(NodeId id) const { return nodes_.at(id).kind; }
    int line(NodeId id) const { return nodes_.at(id).line; }
    int column(NodeId id) const { return nodes_.at(id).col; }
    const std::string& text(NodeId id) const { return nodes_.at(id).text; }

    // -- Navigation ---------------------------------------------------------

    std::optional<NodeId> parent(NodeId id) const { return nodes_.at(id).parent; }
    const std::vector<NodeId>& children(NodeId id) const { return nodes_.at(id).children; }
    std::optional<NodeId> first_child(NodeId id) const;
    std::optional<NodeId> last_child(NodeId id) const;
    std::optional<NodeId> previous_sibling(NodeId id) const;
    std::optional<NodeId> next_sibling(NodeId id) const;

    // First direct child of the given kind
    std::optional<NodeId> find_first_child(NodeId id, NodeKind kind) const;

    // Lexically first node of the subtree rooted at `id` (smallest line,
    // then smallest column). Ties keep the shallower node.
    NodeId first_node_in_subtree(NodeId id) const;

    // First token following the whole subtree of `id`: the lexically first
    // node of the nearest next sibling of `id` or of one of its ancestors.
    // nullopt at the end of the compilation unit.
    std::optional<NodeId> next_lexical_token(NodeId id) const;

    // -- Source text --------------------------------------------------------

    void set_source(const std::string& source);

    // Raw text of a 1-based source line, without its line terminator.
    // Empty for lines outside the source.
    const std::string& source_line(int line) const;
    size_t line_count() const { return lines_.size(); }

private:
    std::vector<Node> nodes_;
    std::optional<NodeId> root_;
    std::vector<std::string> lines_;
};

} // namespace bracelint
