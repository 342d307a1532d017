#include <bracelint/lint/brace_placement.hpp>
#include <algorithm>
#include <cctype>
#include <cstddef>

namespace bracelint {

namespace {

struct PlacementInput {
    const SyntaxTree& tree;
    BracePolicy policy;
    NodeId lcurly;
    NodeId rcurly;
    std::optional<NodeId> next_token;
    bool rcurly_ends_syntax;
    const std::string& line;
};

// Absent tokens are never on any line
bool same_line(const SyntaxTree& tree, NodeId a, std::optional<NodeId> b) {
    return b && tree.line(a) == tree.line(*b);
}

bool is_kind(const SyntaxTree& tree, std::optional<NodeId> id, NodeKind kind) {
    return id && tree.kind(*id) == kind;
}

std::optional<NodeId> next_token_after(const SyntaxTree& tree, std::optional<NodeId> id) {
    if (!id) return std::nullopt;
    return tree.next_lexical_token(*id);
}

bool whitespace_before(int col, const std::string& line) {
    auto end = std::min(static_cast<size_t>(std::max(col, 0)), line.size());
    return std::all_of(line.begin(), line.begin() + static_cast<std::ptrdiff_t>(end),
                       [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

bool has_line_break_before(const SyntaxTree& tree, NodeId rcurly) {
    auto previous = tree.previous_sibling(rcurly);
    if (!previous) previous = tree.parent(rcurly);
    return !same_line(tree, rcurly, previous);
}

// `new Foo() {{ ... }};` - the inner brace of the instance initializer may
// share its line with the outer brace and the statement terminator.
bool is_double_brace_init(const PlacementInput& in) {
    auto parent = in.tree.parent(in.rcurly);
    auto grandparent = parent ? in.tree.parent(*parent) : std::nullopt;
    if (!is_kind(in.tree, grandparent, NodeKind::InstanceInit) ||
        !is_kind(in.tree, in.next_token, NodeKind::Rcurly)) {
        return false;
    }
    auto after_outer = next_token_after(in.tree, in.next_token);
    return !same_line(in.tree, in.rcurly, next_token_after(in.tree, after_outer));
}

bool is_alone_on_line(const PlacementInput& in) {
    return (!same_line(in.tree, in.rcurly, in.next_token) || is_double_brace_init(in))
        && whitespace_before(in.tree.column(in.rcurly), in.line);
}

bool is_empty_block(const PlacementInput& in) {
    auto parent = in.tree.parent(in.lcurly);
    std::optional<NodeId> empty_rcurly;
    if (is_kind(in.tree, parent, NodeKind::ObjBlock)) {
        empty_rcurly = in.tree.next_sibling(in.lcurly);
    } else {
        empty_rcurly = in.tree.first_child(in.lcurly);
    }
    return empty_rcurly == in.rcurly;
}

// Block written on one line, with nothing but a statement terminator after
// it before the end of the whole statement.
bool is_block_alone_on_single_line(const PlacementInput& in) {
    auto next = in.next_token;
    while (is_kind(in.tree, next, NodeKind::LiteralElse)) {
        next = in.tree.next_lexical_token(*next);
    }
    if (is_kind(in.tree, next, NodeKind::DoWhile)) {
        auto do_stmt = in.tree.parent(*next);
        next = next_token_after(in.tree, do_stmt ? in.tree.last_child(*do_stmt) : std::nullopt);
    }
    return same_line(in.tree, in.rcurly, in.lcurly)
        && (!same_line(in.tree, in.rcurly, next)
            || is_kind(in.tree, in.next_token, NodeKind::Semi));
}

bool should_have_line_break_before(const PlacementInput& in) {
    return in.policy == BracePolicy::Same
        && !has_line_break_before(in.tree, in.rcurly)
        && !same_line(in.tree, in.lcurly, in.rcurly);
}

bool should_be_on_same_line(const PlacementInput& in) {
    return in.policy == BracePolicy::Same
        && !in.rcurly_ends_syntax
        && !same_line(in.tree, in.rcurly, in.next_token);
}

bool should_be_alone_on_line(const PlacementInput& in) {
    switch (in.policy) {
    case BracePolicy::Alone:
        return !is_alone_on_line(in);
    case BracePolicy::AloneOrEmpty:
        return !is_alone_on_line(in) && !is_empty_block(in);
    case BracePolicy::AloneOrSingleline:
        return !is_alone_on_line(in) && !is_block_alone_on_single_line(in);
    case BracePolicy::Same:
        return in.rcurly_ends_syntax
            && !is_alone_on_line(in)
            && !is_block_alone_on_single_line(in);
    }
    return false;
}

struct PlacementCheck {
    Violation violation;
    bool (*applies)(const PlacementInput&);
};

// Evaluated in order; the first matching check decides.
const PlacementCheck kCascade[] = {
    {Violation::LineBreakBefore, should_have_line_break_before},
    {Violation::LineSame,        should_be_on_same_line},
    {Violation::LineAlone,       should_be_alone_on_line},
};

} // namespace

Result<BracePolicy> parse_brace_policy(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    auto last = text.find_last_not_of(" \t\r\n");
    std::string lower;
    if (first != std::string::npos) {
        lower = text.substr(first, last - first + 1);
    }
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](char c) {
                       return static_cast<char>(
                           std::tolower(static_cast<unsigned char>(c)));
                   });

    for (auto policy : {BracePolicy::Same, BracePolicy::Alone,
                        BracePolicy::AloneOrEmpty, BracePolicy::AloneOrSingleline}) {
        if (lower == brace_policy_name(policy)) {
            return Result<BracePolicy>::ok(policy);
        }
    }
    return BraceLintError{BraceLintError::Config,
        "unknown brace policy '" + text + "'",
        "expected one of: same, alone, alone_or_empty, alone_or_singleline"};
}

const char* brace_policy_name(BracePolicy policy) {
    switch (policy) {
    case BracePolicy::Same:              return "same";
    case BracePolicy::Alone:             return "alone";
    case BracePolicy::AloneOrEmpty:      return "alone_or_empty";
    case BracePolicy::AloneOrSingleline: return "alone_or_singleline";
    }
    return "unknown";
}

const char* violation_key(Violation v) {
    switch (v) {
    case Violation::None:            return "";
    case Violation::LineBreakBefore: return "line.break.before";
    case Violation::LineAlone:       return "line.alone";
    case Violation::LineSame:        return "line.same";
    }
    return "";
}

Violation validate_placement(const SyntaxTree& tree, BracePolicy policy,
                             const BraceContext& ctx,
                             const std::string& rcurly_line) {
    if (!ctx.lcurly || !ctx.rcurly) return Violation::None;

    PlacementInput in{tree, policy, *ctx.lcurly, *ctx.rcurly,
                      ctx.next_token, ctx.rcurly_ends_syntax, rcurly_line};
    for (const auto& check : kCascade) {
        if (check.applies(in)) return check.violation;
    }
    return Violation::None;
}

} // namespace bracelint
