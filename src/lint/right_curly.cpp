#include <bracelint/lint/right_curly.hpp>
#include <algorithm>

namespace bracelint {

RightCurlyRule::RightCurlyRule()
    : policy_(BracePolicy::Same), kinds_(default_kinds()) {}

const std::vector<NodeKind>& RightCurlyRule::default_kinds() {
    static const std::vector<NodeKind> kinds = {
        NodeKind::LiteralTry,
        NodeKind::LiteralCatch,
        NodeKind::LiteralFinally,
        NodeKind::LiteralIf,
        NodeKind::LiteralElse,
    };
    return kinds;
}

const std::vector<NodeKind>& RightCurlyRule::acceptable_kinds() {
    static const std::vector<NodeKind> kinds = {
        NodeKind::LiteralTry,
        NodeKind::LiteralCatch,
        NodeKind::LiteralFinally,
        NodeKind::LiteralIf,
        NodeKind::LiteralElse,
        NodeKind::ClassDef,
        NodeKind::MethodDef,
        NodeKind::CtorDef,
        NodeKind::LiteralFor,
        NodeKind::LiteralWhile,
        NodeKind::LiteralDo,
        NodeKind::StaticInit,
        NodeKind::InstanceInit,
        NodeKind::AnnotationDef,
    };
    return kinds;
}

namespace {

Status check_kinds(const std::vector<NodeKind>& kinds) {
    if (kinds.empty()) {
        return BraceLintError{BraceLintError::Config,
            std::string(RightCurlyRule::kId) + ": no node kinds to check",
            "omit 'tokens' to use the defaults, or set severity = \"off\""};
    }
    const auto& acceptable = RightCurlyRule::acceptable_kinds();
    for (NodeKind kind : kinds) {
        if (std::find(acceptable.begin(), acceptable.end(), kind) == acceptable.end()) {
            return BraceLintError{BraceLintError::InvalidArg,
                std::string(RightCurlyRule::kId) + ": unsupported node kind " +
                    node_kind_name(kind),
                "supported: LITERAL_TRY, LITERAL_CATCH, LITERAL_FINALLY, LITERAL_IF, "
                "LITERAL_ELSE, CLASS_DEF, METHOD_DEF, CTOR_DEF, LITERAL_FOR, "
                "LITERAL_WHILE, LITERAL_DO, STATIC_INIT, INSTANCE_INIT, ANNOTATION_DEF"};
        }
    }
    return ok_status();
}

} // namespace

Result<RightCurlyRule> RightCurlyRule::create(BracePolicy policy,
                                              std::vector<NodeKind> kinds) {
    BRACELINT_TRY(check_kinds(kinds));
    std::sort(kinds.begin(), kinds.end());
    kinds.erase(std::unique(kinds.begin(), kinds.end()), kinds.end());
    return Result<RightCurlyRule>::ok(RightCurlyRule(policy, std::move(kinds)));
}

Result<RightCurlyRule> RightCurlyRule::configure(const std::string& option,
                                                 const std::vector<std::string>& token_names) {
    auto policy = parse_brace_policy(option);
    BRACELINT_TRY(policy);

    std::vector<NodeKind> kinds;
    for (const auto& name : token_names) {
        auto kind = node_kind_from_name(name);
        if (!kind) {
            return BraceLintError{BraceLintError::InvalidArg,
                std::string(kId) + ": unknown token '" + name + "'"};
        }
        kinds.push_back(*kind);
    }
    return create(policy.value(), std::move(kinds));
}

Result<RightCurlyRule> RightCurlyRule::from_config(const RuleConfig& cfg) {
    std::vector<std::string> names;
    if (cfg.tokens) {
        names = *cfg.tokens;
    } else {
        for (NodeKind kind : default_kinds()) names.emplace_back(node_kind_name(kind));
    }
    return configure(cfg.option.value_or("same"), names);
}

bool RightCurlyRule::applies_to(NodeKind kind) const {
    return std::find(kinds_.begin(), kinds_.end(), kind) != kinds_.end();
}

std::optional<LintDiagnostic> RightCurlyRule::check(const SyntaxTree& tree,
                                                    NodeId construct) const {
    BraceContext ctx = extract_brace_context(tree, construct);
    if (!ctx.rcurly) return std::nullopt;

    NodeId rcurly = *ctx.rcurly;
    Violation v = validate_placement(tree, policy_, ctx,
                                     tree.source_line(tree.line(rcurly)));
    if (v == Violation::None) return std::nullopt;

    LintDiagnostic d;
    d.rule_id = kId;
    d.key = violation_key(v);
    d.line = tree.line(rcurly);
    d.col = tree.column(rcurly);
    d.args = {"}", std::to_string(tree.column(rcurly) + 1)};
    return d;
}

} // namespace bracelint
