#include <bracelint/lang/tree_dump.hpp>
#include <bracelint/log.hpp>
#include <cctype>
#include <fstream>
#include <sstream>

namespace bracelint {

namespace {

struct DumpEntry {
    int depth = 0;
    NodeKind kind = NodeKind::CompilationUnit;
    std::string text;
    int line = 1;
    int col = 0;
};

std::string escape_text(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\\': out += "\\\\"; break;
        default:   out += c; break;
        }
    }
    return out;
}

std::string unescape_text(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 == s.size()) {
            out += s[i];
            continue;
        }
        char c = s[++i];
        switch (c) {
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case '\\': out += '\\'; break;
        default:   out += '\\'; out += c; break;
        }
    }
    return out;
}

bool parse_int(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    int v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

Result<DumpEntry> parse_line(const std::string& raw, const std::string& filename,
                             int lineno) {
    auto fail = [&](const std::string& msg) {
        return BraceLintError{BraceLintError::Parse, msg,
            "expected '<prefix>KIND -> text [line:col]'", filename, lineno};
    };

    DumpEntry entry;
    size_t i = 0;
    while (raw.compare(i, 4, "|   ") == 0 || raw.compare(i, 4, "    ") == 0) {
        i += 4;
    }
    if (raw.compare(i, 3, "|--") == 0 || raw.compare(i, 3, "`--") == 0) {
        entry.depth = static_cast<int>(i / 4) + 1;
        i += 3;
    } else if (i != 0) {
        return fail("indentation without a '|--' or '`--' connector");
    }

    std::string rest = raw.substr(i);
    size_t arrow = rest.find(" -> ");
    if (arrow == std::string::npos) {
        return fail("missing ' -> ' separator");
    }
    std::string kind_name = rest.substr(0, arrow);
    auto kind = node_kind_from_name(kind_name);
    if (!kind) {
        return fail("unknown node kind '" + kind_name + "'");
    }
    entry.kind = *kind;

    size_t close = rest.find_last_not_of(" \t");
    size_t open = rest.rfind(" [");
    if (close == std::string::npos || rest[close] != ']' ||
        open == std::string::npos || open < arrow + 3) {
        return fail("missing [line:col] position");
    }
    std::string pos = rest.substr(open + 2, close - open - 2);
    size_t colon = pos.find(':');
    if (colon == std::string::npos ||
        !parse_int(pos.substr(0, colon), entry.line) ||
        !parse_int(pos.substr(colon + 1), entry.col)) {
        return fail("malformed position '[" + pos + "]'");
    }
    if (entry.line < 1) {
        return fail("line numbers are 1-based");
    }

    // The text may be empty, in which case the separator's trailing space
    // doubles as the position's leading space.
    size_t text_start = arrow + 4;
    entry.text = text_start <= open ? unescape_text(rest.substr(text_start, open - text_start))
                                    : std::string();
    return Result<DumpEntry>::ok(std::move(entry));
}

std::string read_all(std::ifstream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

Result<SyntaxTree> parse_tree_dump(const std::string& text, const std::string& filename) {
    std::vector<DumpEntry> entries;
    std::istringstream in(text);
    std::string raw;
    int lineno = 0;
    int top_level = 0;
    while (std::getline(in, raw)) {
        ++lineno;
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();
        if (raw.find_first_not_of(" \t") == std::string::npos) continue;

        auto entry = parse_line(raw, filename, lineno);
        BRACELINT_TRY(entry);
        int prev_depth = entries.empty() ? -1 : entries.back().depth;
        if (entry.value().depth > prev_depth + 1) {
            return BraceLintError{BraceLintError::Parse,
                "node nested more than one level below its predecessor",
                "", filename, lineno};
        }
        if (entry.value().depth == 0) ++top_level;
        entries.push_back(std::move(entry).value());
    }

    if (entries.empty()) {
        return BraceLintError{BraceLintError::Parse, "empty tree dump",
            "", filename, 0};
    }

    SyntaxTree tree;
    std::vector<NodeId> open;  // open[d] = most recent node at depth d
    if (top_level == 1 && entries.front().kind == NodeKind::CompilationUnit) {
        const auto& e = entries.front();
        open.push_back(tree.add_root(e.kind, e.text, e.line, e.col));
        entries.erase(entries.begin());
        for (auto& e2 : entries) --e2.depth;
    } else {
        open.push_back(tree.add_root(NodeKind::CompilationUnit, "", 1, 0));
    }

    for (const auto& e : entries) {
        open.resize(static_cast<size_t>(e.depth) + 1);
        NodeId id = tree.add_child(open[static_cast<size_t>(e.depth)],
                                   e.kind, e.text, e.line, e.col);
        open.push_back(id);
    }

    log::trace("loaded %zu nodes from %s", tree.size(), filename.c_str());
    return Result<SyntaxTree>::ok(std::move(tree));
}

Result<SyntaxTree> load_tree(const std::string& dump_path, const std::string& source_path) {
    std::ifstream dump(dump_path);
    if (!dump.is_open()) {
        return BraceLintError{BraceLintError::IO,
            "cannot open tree dump: " + dump_path};
    }
    std::ifstream source(source_path);
    if (!source.is_open()) {
        return BraceLintError{BraceLintError::IO,
            "cannot open source file: " + source_path};
    }

    auto tree = parse_tree_dump(read_all(dump), dump_path);
    BRACELINT_TRY(tree);
    tree.value().set_source(read_all(source));
    return tree;
}

std::string dump_tree(const SyntaxTree& tree) {
    std::string out;
    auto root = tree.root();
    if (!root) return out;

    // Pre-order walk; `prefix` holds the guide columns of the ancestors.
    struct Frame {
        NodeId id;
        int depth;
        std::string prefix;
    };
    std::vector<Frame> stack{{*root, 0, ""}};
    while (!stack.empty()) {
        Frame f = std::move(stack.back());
        stack.pop_back();

        bool last = !tree.next_sibling(f.id).has_value();
        std::string child_prefix;
        if (f.depth > 0) {
            out += f.prefix;
            out += last ? "`--" : "|--";
            child_prefix = f.prefix + (last ? "    " : "|   ");
        }
        out += node_kind_name(tree.kind(f.id));
        out += " -> ";
        out += escape_text(tree.text(f.id));
        out += " [";
        out += std::to_string(tree.line(f.id));
        out += ":";
        out += std::to_string(tree.column(f.id));
        out += "]\n";

        const auto& kids = tree.children(f.id);
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
            stack.push_back({*it, f.depth + 1, child_prefix});
        }
    }
    return out;
}

} // namespace bracelint
