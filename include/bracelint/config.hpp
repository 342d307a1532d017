#pragma once

#include <bracelint/lint/diagnostic.hpp>
#include <bracelint/result.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bracelint {

// [rules.<id>] table. Unset fields fall back to the rule's defaults.
struct RuleConfig {
    Severity severity = Severity::Warn;
    bool severity_set = false;
    std::optional<std::string> option;
    std::optional<std::vector<std::string>> tokens;

    // Fields set in `other` override this
    void merge(const RuleConfig& other);
};

// Layered configuration: global < project (project wins)
//
//     [rules]
//     right-curly = "error"          # severity shorthand
//
//     [rules.right-curly]
//     severity = "warn"
//     option = "alone"
//     tokens = ["LITERAL_IF", "METHOD_DEF"]
struct Config {
    std::unordered_map<std::string, RuleConfig> rules;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);
};

// ~/.bracelint/config.toml, or "" when no home directory is known
std::string global_config_path();

} // namespace bracelint
