#include <catch2/catch.hpp>
#include <bracelint/lint/brace_placement.hpp>
#include <bracelint/result.hpp>
#include <string>

using namespace bracelint;

// Chains two fallible steps the way rule construction does
static Result<std::string> normalized_policy(const std::string& option) {
    auto policy = parse_brace_policy(option);
    BRACELINT_TRY(policy);
    return Result<std::string>::ok(brace_policy_name(policy.value()));
}

static Status require_positive(int line) {
    if (line < 1) {
        return BraceLintError{BraceLintError::InvalidArg, "line must be >= 1"};
    }
    return ok_status();
}

static Result<int> checked_column(int line, int col) {
    BRACELINT_TRY(require_positive(line));
    return Result<int>::ok(col + 1);
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<int>::ok(7);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.value() == 7);
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(BraceLintError{BraceLintError::Parse, "no rcurly"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == BraceLintError::Parse);
    REQUIRE(r.error().message == "no rcurly");
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("Status carries no value", "[result]") {
    auto ok = require_positive(1);
    REQUIRE(ok.is_ok());
    REQUIRE(static_cast<bool>(ok));
    REQUIRE(ok_status().is_ok());

    auto bad = require_positive(0);
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == BraceLintError::InvalidArg);
    REQUIRE_THROWS_AS(bad.value(), std::bad_variant_access);
}

TEST_CASE("BRACELINT_TRY passes Ok through", "[result]") {
    auto r = normalized_policy("  ALONE_OR_EMPTY ");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "alone_or_empty");

    auto c = checked_column(3, 4);
    REQUIRE(c.is_ok());
    REQUIRE(c.value() == 5);
}

TEST_CASE("BRACELINT_TRY propagates errors across result types", "[result]") {
    auto r = normalized_policy("sideways");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == BraceLintError::Config);
    REQUIRE(r.error().message.find("sideways") != std::string::npos);
    REQUIRE_FALSE(r.error().hint.empty());

    auto c = checked_column(0, 4);
    REQUIRE(c.is_err());
    REQUIRE(c.error().code == BraceLintError::InvalidArg);
}

TEST_CASE("BraceLintError format() with hint and location", "[error]") {
    BraceLintError e{BraceLintError::Parse, "unknown node kind 'FOO'",
                     "names are token types such as LITERAL_IF", "if_else.tree", 3};
    auto formatted = e.format();
    REQUIRE(formatted ==
            "error[Parse]: unknown node kind 'FOO'\n"
            "  hint: names are token types such as LITERAL_IF\n"
            "  --> if_else.tree:3");
}

TEST_CASE("BraceLintError format() without hint or line", "[error]") {
    BraceLintError e{BraceLintError::IO, "cannot open config file"};
    REQUIRE(e.format() == "error[IO]: cannot open config file");

    e.file = "bracelint.toml";
    REQUIRE(e.format() == "error[IO]: cannot open config file\n  --> bracelint.toml");
}

TEST_CASE("BraceLintError code_name() for all codes", "[error]") {
    REQUIRE(std::string(BraceLintError::code_name(BraceLintError::IO)) == "IO");
    REQUIRE(std::string(BraceLintError::code_name(BraceLintError::Parse)) == "Parse");
    REQUIRE(std::string(BraceLintError::code_name(BraceLintError::Config)) == "Config");
    REQUIRE(std::string(BraceLintError::code_name(BraceLintError::InvalidArg)) == "InvalidArg");
}
