#pragma once

#include <bracelint/config.hpp>
#include <bracelint/lint/right_curly.hpp>
#include <bracelint/result.hpp>
#include <string>
#include <vector>

namespace bracelint {

// Runs configured rules over every node of a syntax tree
class Checker {
public:
    // Rules absent from the config run with their defaults at Warn.
    // Unknown rule ids are skipped with a warning.
    static Result<Checker> from_config(const Config& cfg);

    // Rules with Severity::Off are not added
    void add_rule(RightCurlyRule rule, Severity severity = Severity::Warn);
    size_t rule_count() const { return rules_.size(); }

    // Diagnostics ordered by line, then column. Warns when the tree has no
    // source text attached.
    std::vector<LintDiagnostic> run(const SyntaxTree& tree,
                                    const std::string& file = "<input>") const;

private:
    struct Entry {
        RightCurlyRule rule;
        Severity severity;
    };
    std::vector<Entry> rules_;
};

} // namespace bracelint
