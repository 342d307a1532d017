#include <bracelint/config.hpp>
#include <bracelint/log.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace bracelint {

namespace {

Result<RuleConfig> parse_rule_table(const std::string& id, const toml::table& tbl) {
    RuleConfig rc;
    for (const auto& [key, val] : tbl) {
        std::string k(key);
        if (k == "severity") {
            auto s = val.value<std::string>();
            if (!s) {
                return BraceLintError{BraceLintError::Config,
                    "rules." + id + ".severity must be a string"};
            }
            auto sev = parse_severity(*s);
            BRACELINT_TRY(sev);
            rc.severity = sev.value();
            rc.severity_set = true;
        } else if (k == "option") {
            auto s = val.value<std::string>();
            if (!s) {
                return BraceLintError{BraceLintError::Config,
                    "rules." + id + ".option must be a string"};
            }
            rc.option = *s;
        } else if (k == "tokens") {
            auto arr = val.as_array();
            if (!arr) {
                return BraceLintError{BraceLintError::Config,
                    "rules." + id + ".tokens must be an array of strings",
                    "e.g. tokens = [\"LITERAL_IF\", \"LITERAL_ELSE\"]"};
            }
            std::vector<std::string> tokens;
            for (const auto& el : *arr) {
                auto s = el.value<std::string>();
                if (!s) {
                    return BraceLintError{BraceLintError::Config,
                        "rules." + id + ".tokens must be an array of strings"};
                }
                tokens.push_back(*s);
            }
            rc.tokens = std::move(tokens);
        } else {
            log::warn("ignoring unknown key 'rules.%s.%s'", id.c_str(), k.c_str());
        }
    }
    return Result<RuleConfig>::ok(std::move(rc));
}

} // namespace

void RuleConfig::merge(const RuleConfig& other) {
    if (other.severity_set) {
        severity = other.severity;
        severity_set = true;
    }
    if (other.option) option = other.option;
    if (other.tokens) tokens = other.tokens;
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return BraceLintError{BraceLintError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;
    auto rules = doc["rules"].as_table();
    if (!rules) {
        return Result<Config>::ok(std::move(cfg));
    }

    for (const auto& [key, val] : *rules) {
        std::string id(key);
        if (auto tbl = val.as_table()) {
            auto rc = parse_rule_table(id, *tbl);
            BRACELINT_TRY(rc);
            cfg.rules[id] = std::move(rc).value();
        } else if (auto s = val.value<std::string>()) {
            auto sev = parse_severity(*s);
            BRACELINT_TRY(sev);
            RuleConfig rc;
            rc.severity = sev.value();
            rc.severity_set = true;
            cfg.rules[id] = std::move(rc);
        } else {
            return BraceLintError{BraceLintError::Config,
                "rules." + id + " must be a severity string or a table"};
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return BraceLintError{BraceLintError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err() && cfg.error().file.empty()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    for (const auto& [id, rc] : other.rules) {
        rules[id].merge(rc);
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.bracelint/config.toml";
}

} // namespace bracelint
