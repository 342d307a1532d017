#include <catch2/catch.hpp>
#include <bracelint/lang/syntax_tree.hpp>
#include <stdexcept>

using namespace bracelint;

// a + b;  (operators are parents of their operands)
static SyntaxTree make_expr_stmt() {
    SyntaxTree t;
    auto root = t.add_root(NodeKind::CompilationUnit, "", 1, 0);
    auto expr = t.add_child(root, NodeKind::Expr, "EXPR", 1, 2);
    auto plus = t.add_child(expr, NodeKind::Plus, "+", 1, 2);
    t.add_child(plus, NodeKind::Ident, "a", 1, 0);
    t.add_child(plus, NodeKind::Ident, "b", 1, 4);
    t.add_child(root, NodeKind::Semi, ";", 1, 5);
    return t;
}

TEST_CASE("empty tree has no root", "[syntax-tree]") {
    SyntaxTree t;
    CHECK_FALSE(t.root().has_value());
    CHECK(t.size() == 0);
    CHECK_FALSE(t.contains(0));
}

TEST_CASE("add_child links parent and children in order", "[syntax-tree]") {
    auto t = make_expr_stmt();
    REQUIRE(t.root());
    NodeId root = *t.root();
    REQUIRE(t.children(root).size() == 2);

    NodeId expr = t.children(root)[0];
    NodeId semi = t.children(root)[1];
    CHECK(t.kind(expr) == NodeKind::Expr);
    CHECK(t.kind(semi) == NodeKind::Semi);
    CHECK(t.parent(expr) == root);
    CHECK_FALSE(t.parent(root).has_value());
    CHECK(t.first_child(root) == expr);
    CHECK(t.last_child(root) == semi);
    CHECK(t.text(semi) == ";");
    CHECK(t.line(semi) == 1);
    CHECK(t.column(semi) == 5);
}

TEST_CASE("sibling navigation", "[syntax-tree]") {
    auto t = make_expr_stmt();
    NodeId root = *t.root();
    NodeId expr = t.children(root)[0];
    NodeId semi = t.children(root)[1];

    CHECK(t.next_sibling(expr) == semi);
    CHECK(t.previous_sibling(semi) == expr);
    CHECK_FALSE(t.previous_sibling(expr).has_value());
    CHECK_FALSE(t.next_sibling(semi).has_value());
    CHECK_FALSE(t.next_sibling(root).has_value());
    CHECK_FALSE(t.first_child(semi).has_value());
    CHECK_FALSE(t.last_child(semi).has_value());
}

TEST_CASE("find_first_child by kind", "[syntax-tree]") {
    auto t = make_expr_stmt();
    NodeId root = *t.root();
    CHECK(t.find_first_child(root, NodeKind::Semi) == t.children(root)[1]);
    CHECK_FALSE(t.find_first_child(root, NodeKind::Slist).has_value());
}

TEST_CASE("first_node_in_subtree picks the lexically first node", "[syntax-tree]") {
    auto t = make_expr_stmt();
    NodeId expr = t.children(*t.root())[0];
    NodeId first = t.first_node_in_subtree(expr);
    CHECK(t.kind(first) == NodeKind::Ident);
    CHECK(t.text(first) == "a");

    NodeId semi = t.children(*t.root())[1];
    CHECK(t.first_node_in_subtree(semi) == semi);
}

TEST_CASE("first_node_in_subtree keeps the ancestor on ties", "[syntax-tree]") {
    SyntaxTree t;
    auto root = t.add_root(NodeKind::CompilationUnit, "", 1, 0);
    auto def = t.add_child(root, NodeKind::MethodDef, "METHOD_DEF", 2, 4);
    t.add_child(def, NodeKind::Modifiers, "MODIFIERS", 2, 4);
    CHECK(t.first_node_in_subtree(def) == def);
}

TEST_CASE("next_lexical_token climbs to the nearest ancestor sibling", "[syntax-tree]") {
    auto t = make_expr_stmt();
    NodeId root = *t.root();
    NodeId expr = t.children(root)[0];
    NodeId semi = t.children(root)[1];
    NodeId plus = t.children(expr)[0];
    NodeId b = t.children(plus)[1];

    CHECK(t.next_lexical_token(b) == semi);
    CHECK(t.next_lexical_token(expr) == semi);
    CHECK_FALSE(t.next_lexical_token(semi).has_value());
    CHECK_FALSE(t.next_lexical_token(root).has_value());
}

TEST_CASE("add_root starts a new tree", "[syntax-tree]") {
    auto t = make_expr_stmt();
    auto root = t.add_root(NodeKind::ClassDef, "CLASS_DEF", 3, 0);
    CHECK(t.size() == 1);
    CHECK(t.root() == root);
    CHECK(t.kind(root) == NodeKind::ClassDef);
}

TEST_CASE("add_child with a foreign parent throws", "[syntax-tree]") {
    SyntaxTree t;
    t.add_root(NodeKind::CompilationUnit, "", 1, 0);
    REQUIRE_THROWS_AS(t.add_child(42, NodeKind::Semi, ";", 1, 0), std::out_of_range);
}

TEST_CASE("source lines are 1-based without terminators", "[syntax-tree]") {
    SyntaxTree t;
    t.set_source("class A {\r\n    int x;\n}");
    REQUIRE(t.line_count() == 3);
    CHECK(t.source_line(1) == "class A {");
    CHECK(t.source_line(2) == "    int x;");
    CHECK(t.source_line(3) == "}");
    CHECK(t.source_line(0).empty());
    CHECK(t.source_line(4).empty());
}

TEST_CASE("source keeps blank lines", "[syntax-tree]") {
    SyntaxTree t;
    t.set_source("a\n\nb\n");
    REQUIRE(t.line_count() == 3);
    CHECK(t.source_line(2).empty());
    CHECK(t.source_line(3) == "b");
}

TEST_CASE("node kind names round-trip", "[syntax-tree]") {
    CHECK(std::string(node_kind_name(NodeKind::LiteralIf)) == "LITERAL_IF");
    CHECK(std::string(node_kind_name(NodeKind::InstanceInit)) == "INSTANCE_INIT");
    CHECK(node_kind_from_name("RCURLY") == NodeKind::Rcurly);
    CHECK(node_kind_from_name("GENERIC_END") == NodeKind::GenericEnd);
    CHECK_FALSE(node_kind_from_name("literal_if").has_value());
    CHECK_FALSE(node_kind_from_name("").has_value());
}
