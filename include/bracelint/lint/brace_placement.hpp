#pragma once

#include <bracelint/lint/brace_context.hpp>
#include <bracelint/result.hpp>
#include <string>

namespace bracelint {

// Placement policy for closing braces
enum class BracePolicy {
    Same,               // on the line of the next part of a multi-block statement
    Alone,              // alone on its line
    AloneOrEmpty,       // alone, or closing an empty block
    AloneOrSingleline   // alone, or closing a block written on one line
};

// "same", "alone", "alone_or_empty", "alone_or_singleline";
// case-insensitive, surrounding whitespace ignored.
Result<BracePolicy> parse_brace_policy(const std::string& text);
const char* brace_policy_name(BracePolicy policy);

enum class Violation {
    None,
    LineBreakBefore,
    LineAlone,
    LineSame
};

// Message key of a violation ("line.alone", ...); empty for None.
const char* violation_key(Violation v);

// Decide whether the closing brace of `ctx` is misplaced. `rcurly_line` is
// the source text of the line holding the closing brace. Contexts without
// braces never produce a violation.
Violation validate_placement(const SyntaxTree& tree, BracePolicy policy,
                             const BraceContext& ctx,
                             const std::string& rcurly_line);

} // namespace bracelint
