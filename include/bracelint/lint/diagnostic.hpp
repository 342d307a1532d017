#pragma once

#include <bracelint/result.hpp>
#include <string>
#include <vector>

namespace bracelint {

enum class Severity { Off, Warn, Error };

// "off", "warn", "error" (case-insensitive)
Result<Severity> parse_severity(const std::string& text);
const char* severity_name(Severity s);

// One reported placement problem
struct LintDiagnostic {
    std::string rule_id;
    std::string key;        // message key, e.g. "line.alone"
    Severity severity = Severity::Warn;
    std::string file;
    int line = 0;           // 1-based
    int col = 0;            // 0-based column of the offending token
    std::vector<std::string> args;

    // Message template filled with args
    std::string message() const;

    // file:line:col: severity: message [rule-id]   (col printed 1-based)
    std::string format() const;
};

// Template for a message key with {0}, {1}, ... placeholders; nullptr if unknown.
const char* message_template(const std::string& key);

std::string render_message(const std::string& key, const std::vector<std::string>& args);

} // namespace bracelint
