#include <bracelint/lint/checker.hpp>
#include <bracelint/log.hpp>
#include <algorithm>

namespace bracelint {

Result<Checker> Checker::from_config(const Config& cfg) {
    Checker checker;
    bool right_curly_seen = false;

    for (const auto& [id, rc] : cfg.rules) {
        if (id != RightCurlyRule::kId) {
            log::warn("unknown rule '%s' in config, ignoring", id.c_str());
            continue;
        }
        right_curly_seen = true;
        auto rule = RightCurlyRule::from_config(rc);
        BRACELINT_TRY(rule);
        checker.add_rule(std::move(rule).value(), rc.severity);
    }

    if (!right_curly_seen) {
        checker.add_rule(RightCurlyRule());
    }
    return Result<Checker>::ok(std::move(checker));
}

void Checker::add_rule(RightCurlyRule rule, Severity severity) {
    if (severity == Severity::Off) {
        log::debug("rule '%s' is off", RightCurlyRule::kId);
        return;
    }
    log::debug("rule '%s' enabled: option=%s, %zu kinds",
               RightCurlyRule::kId, brace_policy_name(rule.policy()),
               rule.kinds().size());
    rules_.push_back({std::move(rule), severity});
}

std::vector<LintDiagnostic> Checker::run(const SyntaxTree& tree,
                                         const std::string& file) const {
    std::vector<LintDiagnostic> out;
    auto root = tree.root();
    if (!root || rules_.empty()) return out;
    if (tree.line_count() == 0) {
        log::warn("%s: no source text attached, code before a closing brace "
                  "cannot be seen", file.c_str());
    }

    std::vector<NodeId> stack{*root};
    while (!stack.empty()) {
        NodeId id = stack.back();
        stack.pop_back();

        NodeKind kind = tree.kind(id);
        for (const auto& entry : rules_) {
            if (!entry.rule.applies_to(kind)) continue;
            auto diag = entry.rule.check(tree, id);
            if (!diag) continue;
            diag->file = file;
            diag->severity = entry.severity;
            log::trace("%s", diag->format().c_str());
            out.push_back(std::move(*diag));
        }

        const auto& kids = tree.children(id);
        stack.insert(stack.end(), kids.rbegin(), kids.rend());
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const LintDiagnostic& a, const LintDiagnostic& b) {
                         if (a.line != b.line) return a.line < b.line;
                         return a.col < b.col;
                     });
    log::debug("%s: %zu node(s), %zu diagnostic(s)",
               file.c_str(), tree.size(), out.size());
    return out;
}

} // namespace bracelint
