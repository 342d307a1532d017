// demo_check.cpp
//
// Runs the closing-brace rule over a syntax tree dump and the source file
// it was produced from:
//
//     ./demo_check tree.txt Foo.java               # default config
//     ./demo_check tree.txt Foo.java bracelint.toml
//     ./demo_check --dump tree.txt Foo.java        # print the loaded tree
//
// Exit status: 0 clean, 1 warnings only, 2 errors or failure.
// Set BRACELINT_LOG=debug to see what the checker is doing.

#include <bracelint/config.hpp>
#include <bracelint/lang/tree_dump.hpp>
#include <bracelint/lint/checker.hpp>
#include <bracelint/log.hpp>
#include <bracelint/result.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace bracelint;

struct Args {
    bool dump = false;
    std::string tree_path;
    std::string source_path;
    std::string config_path;
};

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--dump") {
            args.dump = true;
        } else {
            positional.push_back(a);
        }
    }
    if (positional.size() < 2 || positional.size() > 3) {
        return BraceLintError{
            BraceLintError::InvalidArg,
            "expected a tree dump and a source file",
            "usage: demo_check [--dump] <tree.txt> <source.java> [config.toml]"
        };
    }
    args.tree_path = positional[0];
    args.source_path = positional[1];
    if (positional.size() == 3) args.config_path = positional[2];
    return Result<Args>::ok(std::move(args));
}

// Global config, overlaid by the file given on the command line
Result<Config> load_config(const std::string& explicit_path) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto g = Config::load(global_path);
        BRACELINT_TRY(g);
        log::debug("loaded %s", global_path.c_str());
        global = std::move(g).value();
    }

    std::optional<Config> project;
    if (!explicit_path.empty()) {
        auto p = Config::load(explicit_path);
        BRACELINT_TRY(p);
        project = std::move(p).value();
    }
    return Result<Config>::ok(Config::effective(global, project));
}

Result<int> run(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    BRACELINT_TRY(args);
    const Args& a = args.value();

    auto tree = load_tree(a.tree_path, a.source_path);
    BRACELINT_TRY(tree);

    if (a.dump) {
        std::cout << dump_tree(tree.value());
        return Result<int>::ok(0);
    }

    auto cfg = load_config(a.config_path);
    BRACELINT_TRY(cfg);

    auto checker = Checker::from_config(cfg.value());
    BRACELINT_TRY(checker);

    auto diags = checker.value().run(tree.value(), a.source_path);
    int status = 0;
    for (const auto& d : diags) {
        std::cout << d.format() << "\n";
        status = std::max(status, d.severity == Severity::Error ? 2 : 1);
    }
    return Result<int>::ok(status);
}

int main(int argc, char** argv) {
    if (!log::init_from_env()) {
        log::warn("unknown BRACELINT_LOG level, keeping '%s'",
                  log::level_name(log::get_level()));
    }

    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 2;
    }
    return result.value();
}
