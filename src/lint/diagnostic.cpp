#include <bracelint/lint/diagnostic.hpp>
#include <algorithm>
#include <cctype>

namespace bracelint {

namespace {

struct MessageEntry {
    const char* key;
    const char* text;
};

const MessageEntry kMessages[] = {
    {"line.alone", "'{0}' at column {1} should be alone on a line."},
    {"line.break.before", "'{0}' at column {1} should have line break before."},
    {"line.same", "'{0}' at column {1} should be on the same line as the next part "
                  "of a multi-block statement (one that directly contains multiple "
                  "blocks: if/else-if/else, do/while or try/catch/finally)."},
};

} // namespace

Result<Severity> parse_severity(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](char c) {
                       return static_cast<char>(
                           std::tolower(static_cast<unsigned char>(c)));
                   });
    if (lower == "off") return Result<Severity>::ok(Severity::Off);
    if (lower == "warn" || lower == "warning") return Result<Severity>::ok(Severity::Warn);
    if (lower == "error") return Result<Severity>::ok(Severity::Error);
    return BraceLintError{BraceLintError::Config,
        "unknown severity '" + text + "'",
        "expected one of: off, warn, error"};
}

const char* severity_name(Severity s) {
    switch (s) {
        case Severity::Off:   return "off";
        case Severity::Warn:  return "warning";
        case Severity::Error: return "error";
    }
    return "unknown";
}

const char* message_template(const std::string& key) {
    for (const auto& m : kMessages) {
        if (key == m.key) return m.text;
    }
    return nullptr;
}

std::string render_message(const std::string& key, const std::vector<std::string>& args) {
    const char* tmpl = message_template(key);
    if (!tmpl) return key;

    std::string out;
    for (const char* p = tmpl; *p; ++p) {
        if (*p == '{' && std::isdigit(static_cast<unsigned char>(p[1])) && p[2] == '}') {
            size_t idx = static_cast<size_t>(p[1] - '0');
            if (idx < args.size()) out += args[idx];
            p += 2;
            continue;
        }
        out += *p;
    }
    return out;
}

std::string LintDiagnostic::message() const {
    return render_message(key, args);
}

std::string LintDiagnostic::format() const {
    std::string result = file.empty() ? "<input>" : file;
    result += ":";
    result += std::to_string(line);
    result += ":";
    result += std::to_string(col + 1);
    result += ": ";
    result += severity_name(severity);
    result += ": ";
    result += message();
    if (!rule_id.empty()) {
        result += " [";
        result += rule_id;
        result += "]";
    }
    return result;
}

} // namespace bracelint
