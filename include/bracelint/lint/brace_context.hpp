#pragma once

#include <bracelint/lang/syntax_tree.hpp>
#include <optional>

namespace bracelint {

// Lexical landmarks of one brace-bearing construct
struct BraceContext {
    std::optional<NodeId> lcurly;
    std::optional<NodeId> rcurly;
    // First token after the construct, or the chained continuation
    // (else / catch / finally / do-while condition). nullopt when the
    // construct is the last thing in the compilation unit.
    std::optional<NodeId> next_token;
    // False when a continuation must follow the closing brace
    bool rcurly_ends_syntax = true;
};

enum class ConstructCategory {
    TryCatchFinally,  // try, catch, finally
    IfElse,           // if, else
    Loop,             // for, while, do
    TypeBody,         // class, annotation definitions
    CodeBody          // method, constructor, static and instance initializers
};

// nullopt for kinds that carry no checked closing brace
std::optional<ConstructCategory> construct_category(NodeKind kind);

// Locate the braces and the following token of `construct`. Constructs
// without a braced body (abstract methods, `while (x);`, an if branch that
// is a single statement) yield a context without rcurly.
BraceContext extract_brace_context(const SyntaxTree& tree, NodeId construct);

} // namespace bracelint
