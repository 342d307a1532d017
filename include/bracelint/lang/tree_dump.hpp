#pragma once

#include <bracelint/lang/syntax_tree.hpp>
#include <bracelint/result.hpp>
#include <string>

namespace bracelint {

// Text form of a syntax tree, one node per line:
//
//     CLASS_DEF -> CLASS_DEF [1:0]
//     |--MODIFIERS -> MODIFIERS [1:0]
//     `--OBJBLOCK -> OBJBLOCK [1:10]
//         |--LCURLY -> { [1:10]
//         `--RCURLY -> } [2:0]
//
// Lines are 1-based, columns 0-based. Several top-level nodes are wrapped
// in a synthesized COMPILATION_UNIT root.
Result<SyntaxTree> parse_tree_dump(const std::string& text,
                                   const std::string& filename = "<input>");

// Load a dump file and attach the source text it was produced from.
Result<SyntaxTree> load_tree(const std::string& dump_path,
                             const std::string& source_path);

std::string dump_tree(const SyntaxTree& tree);

} // namespace bracelint
