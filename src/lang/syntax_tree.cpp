#include <bracelint/lang/syntax_tree.hpp>
#include <stdexcept>
#include <utility>

namespace bracelint {

NodeId SyntaxTree::add_root(NodeKind kind, std::string text, int line, int col) {
    nodes_.clear();
    Node n;
    n.kind = kind;
    n.text = std::move(text);
    n.line = line;
    n.col = col;
    nodes_.push_back(std::move(n));
    root_ = 0;
    return 0;
}

NodeId SyntaxTree::add_child(NodeId parent, NodeKind kind, std::string text,
                             int line, int col) {
    if (!contains(parent)) {
        throw std::out_of_range("add_child: parent " + std::to_string(parent) +
                                " is not a node of this tree");
    }
    auto id = static_cast<NodeId>(nodes_.size());
    Node n;
    n.kind = kind;
    n.text = std::move(text);
    n.line = line;
    n.col = col;
    n.parent = parent;
    n.index_in_parent = nodes_[parent].children.size();
    nodes_.push_back(std::move(n));
    nodes_[parent].children.push_back(id);
    return id;
}

std::optional<NodeId> SyntaxTree::first_child(NodeId id) const {
    const auto& kids = nodes_.at(id).children;
    if (kids.empty()) return std::nullopt;
    return kids.front();
}

std::optional<NodeId> SyntaxTree::last_child(NodeId id) const {
    const auto& kids = nodes_.at(id).children;
    if (kids.empty()) return std::nullopt;
    return kids.back();
}

std::optional<NodeId> SyntaxTree::previous_sibling(NodeId id) const {
    const auto& n = nodes_.at(id);
    if (!n.parent || n.index_in_parent == 0) return std::nullopt;
    return nodes_[*n.parent].children[n.index_in_parent - 1];
}

std::optional<NodeId> SyntaxTree::next_sibling(NodeId id) const {
    const auto& n = nodes_.at(id);
    if (!n.parent) return std::nullopt;
    const auto& siblings = nodes_[*n.parent].children;
    if (n.index_in_parent + 1 >= siblings.size()) return std::nullopt;
    return siblings[n.index_in_parent + 1];
}

std::optional<NodeId> SyntaxTree::find_first_child(NodeId id, NodeKind kind) const {
    for (NodeId child : nodes_.at(id).children) {
        if (nodes_[child].kind == kind) return child;
    }
    return std::nullopt;
}

NodeId SyntaxTree::first_node_in_subtree(NodeId id) const {
    NodeId best = id;
    std::vector<NodeId> stack(nodes_.at(id).children.rbegin(),
                              nodes_.at(id).children.rend());
    while (!stack.empty()) {
        NodeId cur = stack.back();
        stack.pop_back();
        const auto& n = nodes_[cur];
        const auto& b = nodes_[best];
        if (n.line < b.line || (n.line == b.line && n.col < b.col)) {
            best = cur;
        }
        stack.insert(stack.end(), n.children.rbegin(), n.children.rend());
    }
    return best;
}

std::optional<NodeId> SyntaxTree::next_lexical_token(NodeId id) const {
    std::optional<NodeId> cur = id;
    while (cur) {
        if (auto next = next_sibling(*cur)) {
            return first_node_in_subtree(*next);
        }
        cur = nodes_[*cur].parent;
    }
    return std::nullopt;
}

void SyntaxTree::set_source(const std::string& source) {
    lines_.clear();
    size_t start = 0;
    while (start <= source.size()) {
        size_t end = source.find('\n', start);
        if (end == std::string::npos) {
            if (start < source.size()) {
                std::string last = source.substr(start);
                if (last.back() == '\r') last.pop_back();
                lines_.push_back(std::move(last));
            }
            break;
        }
        size_t len = end - start;
        if (len > 0 && source[end - 1] == '\r') --len;
        lines_.push_back(source.substr(start, len));
        start = end + 1;
    }
}

const std::string& SyntaxTree::source_line(int line) const {
    static const std::string empty;
    if (line < 1 || static_cast<size_t>(line) > lines_.size()) return empty;
    return lines_[static_cast<size_t>(line) - 1];
}

} // namespace bracelint
