#include <bracelint/lint/brace_context.hpp>

namespace bracelint {

namespace {

std::optional<NodeId> last_child_of(const SyntaxTree& tree, std::optional<NodeId> id) {
    if (!id) return std::nullopt;
    return tree.last_child(*id);
}

// A chained continuation if one exists, otherwise the next lexical token.
void set_follower(const SyntaxTree& tree, NodeId construct,
                  std::optional<NodeId> continuation, BraceContext& ctx) {
    if (continuation) {
        ctx.next_token = continuation;
        ctx.rcurly_ends_syntax = false;
    } else {
        ctx.next_token = tree.next_lexical_token(construct);
        ctx.rcurly_ends_syntax = true;
    }
}

BraceContext try_catch_finally_context(const SyntaxTree& tree, NodeId ast) {
    BraceContext ctx;
    std::optional<NodeId> continuation;
    if (tree.kind(ast) == NodeKind::LiteralTry) {
        auto first = tree.first_child(ast);
        if (first && tree.kind(*first) == NodeKind::ResourceSpecification) {
            ctx.lcurly = tree.next_sibling(*first);
        } else {
            ctx.lcurly = first;
        }
        // The body is followed by the try's own catch / finally children
        if (ctx.lcurly) continuation = tree.next_sibling(*ctx.lcurly);
    } else {
        ctx.lcurly = tree.last_child(ast);
        continuation = tree.next_sibling(ast);
    }
    set_follower(tree, ast, continuation, ctx);
    ctx.rcurly = last_child_of(tree, ctx.lcurly);
    return ctx;
}

BraceContext if_else_context(const SyntaxTree& tree, NodeId ast) {
    BraceContext ctx;
    auto else_branch = tree.find_first_child(ast, NodeKind::LiteralElse);
    if (else_branch) {
        ctx.lcurly = tree.previous_sibling(*else_branch);
    } else {
        ctx.lcurly = tree.last_child(ast);
    }
    set_follower(tree, ast, else_branch, ctx);

    // A branch without braces has nothing to check
    if (ctx.lcurly && tree.kind(*ctx.lcurly) == NodeKind::Slist) {
        ctx.rcurly = tree.last_child(*ctx.lcurly);
    }
    return ctx;
}

BraceContext loop_context(const SyntaxTree& tree, NodeId ast) {
    BraceContext ctx;
    ctx.lcurly = tree.find_first_child(ast, NodeKind::Slist);
    if (tree.kind(ast) == NodeKind::LiteralDo) {
        ctx.next_token = tree.find_first_child(ast, NodeKind::DoWhile);
        ctx.rcurly_ends_syntax = false;
    } else {
        ctx.next_token = tree.next_lexical_token(ast);
        ctx.rcurly_ends_syntax = true;
    }
    ctx.rcurly = last_child_of(tree, ctx.lcurly);
    return ctx;
}

BraceContext type_body_context(const SyntaxTree& tree, NodeId ast) {
    BraceContext ctx;
    auto body = tree.last_child(ast);
    if (body) {
        ctx.lcurly = tree.first_child(*body);
        ctx.rcurly = tree.last_child(*body);
    }
    ctx.next_token = tree.next_lexical_token(ast);
    ctx.rcurly_ends_syntax = true;
    return ctx;
}

BraceContext code_body_context(const SyntaxTree& tree, NodeId ast) {
    BraceContext ctx;
    // SLIST is absent for abstract and native methods
    ctx.lcurly = tree.find_first_child(ast, NodeKind::Slist);
    ctx.rcurly = last_child_of(tree, ctx.lcurly);
    ctx.next_token = tree.next_lexical_token(ast);
    ctx.rcurly_ends_syntax = true;
    return ctx;
}

} // namespace

std::optional<ConstructCategory> construct_category(NodeKind kind) {
    switch (kind) {
    case NodeKind::LiteralTry:
    case NodeKind::LiteralCatch:
    case NodeKind::LiteralFinally:
        return ConstructCategory::TryCatchFinally;
    case NodeKind::LiteralIf:
    case NodeKind::LiteralElse:
        return ConstructCategory::IfElse;
    case NodeKind::LiteralFor:
    case NodeKind::LiteralWhile:
    case NodeKind::LiteralDo:
        return ConstructCategory::Loop;
    case NodeKind::ClassDef:
    case NodeKind::AnnotationDef:
        return ConstructCategory::TypeBody;
    case NodeKind::MethodDef:
    case NodeKind::CtorDef:
    case NodeKind::StaticInit:
    case NodeKind::InstanceInit:
        return ConstructCategory::CodeBody;
    default:
        return std::nullopt;
    }
}

BraceContext extract_brace_context(const SyntaxTree& tree, NodeId construct) {
    auto category = construct_category(tree.kind(construct));
    if (!category) return BraceContext{};

    switch (*category) {
    case ConstructCategory::TryCatchFinally: return try_catch_finally_context(tree, construct);
    case ConstructCategory::IfElse:          return if_else_context(tree, construct);
    case ConstructCategory::Loop:            return loop_context(tree, construct);
    case ConstructCategory::TypeBody:        return type_body_context(tree, construct);
    case ConstructCategory::CodeBody:        return code_body_context(tree, construct);
    }
    return BraceContext{};
}

} // namespace bracelint
