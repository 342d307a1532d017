#pragma once

#include <bracelint/config.hpp>
#include <bracelint/lint/brace_placement.hpp>
#include <bracelint/lint/diagnostic.hpp>
#include <bracelint/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bracelint {

// Checks the placement of closing braces of if/else, try/catch/finally,
// loops, method, constructor, class and annotation definitions and
// initializer blocks.
//
// Immutable once built: check() keeps no state between calls and may run
// concurrently on distinct nodes of a tree that is not being modified.
class RightCurlyRule {
public:
    static constexpr const char* kId = "right-curly";

    // Policy Same on the default kinds
    RightCurlyRule();

    // Fails with Config/InvalidArg on an empty or unsupported kind list
    static Result<RightCurlyRule> create(BracePolicy policy,
                                         std::vector<NodeKind> kinds);

    // Policy and kinds by name (`option` / `tokens` settings)
    static Result<RightCurlyRule> configure(const std::string& option,
                                            const std::vector<std::string>& token_names);

    static Result<RightCurlyRule> from_config(const RuleConfig& cfg);

    // try, catch, finally, if, else
    static const std::vector<NodeKind>& default_kinds();
    static const std::vector<NodeKind>& acceptable_kinds();

    BracePolicy policy() const { return policy_; }
    const std::vector<NodeKind>& kinds() const { return kinds_; }
    bool applies_to(NodeKind kind) const;

    // Violation for one construct; nullopt when the placement is fine or the
    // construct has no braced body.
    std::optional<LintDiagnostic> check(const SyntaxTree& tree, NodeId construct) const;

private:
    RightCurlyRule(BracePolicy policy, std::vector<NodeKind> kinds)
        : policy_(policy), kinds_(std::move(kinds)) {}

    BracePolicy policy_;
    std::vector<NodeKind> kinds_;
};

} // namespace bracelint
