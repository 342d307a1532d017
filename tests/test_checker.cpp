#include <catch2/catch.hpp>
#include <bracelint/lang/tree_dump.hpp>
#include <bracelint/lint/checker.hpp>
#include <bracelint/log.hpp>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define dup _dup
#define dup2 _dup2
#define fileno _fileno
#define read _read
#define close _close
#define pipe(fds) _pipe(fds, 4096, 0)
#else
#include <unistd.h>
#endif

using namespace bracelint;

static std::string fixture_dir() {
    const char* src = std::getenv("BRACELINT_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

static SyntaxTree load_fixture() {
    auto r = load_tree(fixture_dir() + "/if_else.tree", fixture_dir() + "/IfElse.java");
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

static std::string capture_stderr(const std::function<void()>& fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));
    int pipefd[2];
    if (pipe(pipefd) != 0) return "";
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    long n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

static Checker checker_for(const std::string& toml) {
    auto cfg = Config::parse(toml);
    REQUIRE(cfg.is_ok());
    auto checker = Checker::from_config(cfg.value());
    REQUIRE(checker.is_ok());
    return std::move(checker).value();
}

static bool ordered(const std::vector<LintDiagnostic>& diags) {
    return std::is_sorted(diags.begin(), diags.end(),
                          [](const LintDiagnostic& a, const LintDiagnostic& b) {
                              if (a.line != b.line) return a.line < b.line;
                              return a.col < b.col;
                          });
}

// ===== Configuration =====

TEST_CASE("empty config enables right-curly with defaults", "[checker]") {
    auto checker = checker_for("");
    REQUIRE(checker.rule_count() == 1);
}

TEST_CASE("severity off disables the rule", "[checker]") {
    auto checker = checker_for(R"(
[rules]
right-curly = "off"
)");
    REQUIRE(checker.rule_count() == 0);
    REQUIRE(checker.run(load_fixture(), "IfElse.java").empty());
}

TEST_CASE("unknown rules in config are ignored", "[checker]") {
    auto checker = checker_for(R"(
[rules]
no-tabs = "error"
)");
    REQUIRE(checker.rule_count() == 1);
}

TEST_CASE("invalid option fails checker construction", "[checker]") {
    auto cfg = Config::parse(R"(
[rules.right-curly]
option = "sometimes"
)");
    REQUIRE(cfg.is_ok());
    auto checker = Checker::from_config(cfg.value());
    REQUIRE(checker.is_err());
    REQUIRE(checker.error().code == BraceLintError::Config);
}

TEST_CASE("unknown or unsupported tokens fail checker construction", "[checker]") {
    auto unknown = Config::parse(R"(
[rules.right-curly]
tokens = ["LITERAL_BOGUS"]
)");
    REQUIRE(unknown.is_ok());
    auto r1 = Checker::from_config(unknown.value());
    REQUIRE(r1.is_err());
    REQUIRE(r1.error().code == BraceLintError::InvalidArg);

    auto unsupported = Config::parse(R"(
[rules.right-curly]
tokens = ["IDENT"]
)");
    REQUIRE(unsupported.is_ok());
    auto r2 = Checker::from_config(unsupported.value());
    REQUIRE(r2.is_err());
    REQUIRE(r2.error().code == BraceLintError::InvalidArg);
}

TEST_CASE("empty token list fails checker construction", "[checker]") {
    auto cfg = Config::parse(R"(
[rules.right-curly]
tokens = []
)");
    REQUIRE(cfg.is_ok());
    auto checker = Checker::from_config(cfg.value());
    REQUIRE(checker.is_err());
    REQUIRE(checker.error().code == BraceLintError::Config);
}

// ===== Running =====

TEST_CASE("run on an empty tree", "[checker]") {
    Checker checker;
    checker.add_rule(RightCurlyRule());
    SyntaxTree tree;
    REQUIRE(checker.run(tree).empty());
}

TEST_CASE("default rule reports else and finally on their own lines", "[checker]") {
    auto checker = checker_for("");
    auto diags = checker.run(load_fixture(), "IfElse.java");

    REQUIRE(diags.size() == 2);
    REQUIRE(ordered(diags));

    CHECK(diags[0].line == 5);
    CHECK(diags[0].col == 8);
    CHECK(diags[0].key == "line.same");
    CHECK(diags[0].severity == Severity::Warn);
    CHECK(diags[0].file == "IfElse.java");
    CHECK(diags[0].rule_id == "right-curly");

    CHECK(diags[1].line == 9);
    CHECK(diags[1].col == 19);
    CHECK(diags[1].key == "line.same");
}

TEST_CASE("alone policy from a config file", "[checker]") {
    auto cfg = Config::load(fixture_dir() + "/alone.toml");
    REQUIRE(cfg.is_ok());
    auto checker = Checker::from_config(cfg.value());
    REQUIRE(checker.is_ok());

    auto diags = checker.value().run(load_fixture(), "IfElse.java");
    REQUIRE(diags.size() == 2);
    REQUIRE(ordered(diags));

    CHECK(diags[0].line == 9);
    CHECK(diags[0].col == 19);
    CHECK(diags[0].key == "line.alone");
    CHECK(diags[0].severity == Severity::Error);

    CHECK(diags[1].line == 10);
    CHECK(diags[1].col == 23);
    CHECK(diags[1].key == "line.alone");
}

TEST_CASE("add_rule skips rules that are off", "[checker]") {
    Checker checker;
    checker.add_rule(RightCurlyRule(), Severity::Off);
    REQUIRE(checker.rule_count() == 0);
    checker.add_rule(RightCurlyRule(), Severity::Error);
    REQUIRE(checker.rule_count() == 1);
}

TEST_CASE("run warns when the tree has no source text", "[checker]") {
    std::ifstream in(fixture_dir() + "/if_else.tree");
    REQUIRE(in.is_open());
    std::ostringstream ss;
    ss << in.rdbuf();
    auto bare = parse_tree_dump(ss.str(), "if_else.tree");
    REQUIRE(bare.is_ok());
    REQUIRE(bare.value().line_count() == 0);

    log::set_level(log::Warn);
    log::set_color_enabled(false);
    auto checker = checker_for("");

    std::vector<LintDiagnostic> diags;
    auto output = capture_stderr([&] {
        diags = checker.run(bare.value(), "IfElse.java");
    });
    REQUIRE(output.find("warn: IfElse.java: no source text attached") != std::string::npos);
    // Placement rules that do not look at the source still fire
    REQUIRE(diags.size() == 2);

    auto quiet = capture_stderr([&] {
        checker.run(load_fixture(), "IfElse.java");
    });
    REQUIRE(quiet.empty());
}

// ===== Formatting =====

TEST_CASE("diagnostic message and format", "[checker]") {
    auto checker = checker_for(R"(
[rules.right-curly]
severity = "error"
option = "alone"
tokens = ["LITERAL_TRY"]
)");
    auto diags = checker.run(load_fixture(), "IfElse.java");
    REQUIRE(diags.size() == 1);

    CHECK(diags[0].args == std::vector<std::string>{"}", "20"});
    CHECK(diags[0].message() == "'}' at column 20 should be alone on a line.");
    CHECK(diags[0].format() ==
          "IfElse.java:9:20: error: '}' at column 20 should be alone on a line. [right-curly]");
}

TEST_CASE("line.same message", "[checker]") {
    auto checker = checker_for("");
    auto diags = checker.run(load_fixture(), "IfElse.java");
    REQUIRE_FALSE(diags.empty());
    CHECK(diags[0].format() ==
          "IfElse.java:5:9: warning: '}' at column 9 should be on the same line as the "
          "next part of a multi-block statement (one that directly contains multiple "
          "blocks: if/else-if/else, do/while or try/catch/finally). [right-curly]");
}

TEST_CASE("render_message leaves unknown keys untouched", "[checker]") {
    CHECK(message_template("no.such.key") == nullptr);
    CHECK(render_message("no.such.key", {"}", "1"}) == "no.such.key");
    CHECK(render_message("line.break.before", {"}", "7"}) ==
          "'}' at column 7 should have line break before.");
}

TEST_CASE("parse_severity accepts the documented names", "[checker]") {
    CHECK(parse_severity("off").value() == Severity::Off);
    CHECK(parse_severity("WARN").value() == Severity::Warn);
    CHECK(parse_severity("warning").value() == Severity::Warn);
    CHECK(parse_severity("Error").value() == Severity::Error);
    auto bad = parse_severity("loud");
    REQUIRE(bad.is_err());
    CHECK(bad.error().code == BraceLintError::Config);
    CHECK(std::string(severity_name(Severity::Warn)) == "warning");
}
