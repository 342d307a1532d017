#include <bracelint/lang/node_kind.hpp>
#include <unordered_map>

namespace bracelint {

namespace {

struct KindName {
    NodeKind kind;
    const char* name;
};

// Indexed by the enum value; order must follow the NodeKind declaration.
const KindName kKindNames[] = {
    {NodeKind::CompilationUnit,       "COMPILATION_UNIT"},
    {NodeKind::PackageDef,            "PACKAGE_DEF"},
    {NodeKind::Import,                "IMPORT"},
    {NodeKind::Annotations,           "ANNOTATIONS"},
    {NodeKind::Annotation,            "ANNOTATION"},
    {NodeKind::ClassDef,              "CLASS_DEF"},
    {NodeKind::InterfaceDef,          "INTERFACE_DEF"},
    {NodeKind::EnumDef,               "ENUM_DEF"},
    {NodeKind::AnnotationDef,         "ANNOTATION_DEF"},
    {NodeKind::ObjBlock,              "OBJBLOCK"},
    {NodeKind::Modifiers,             "MODIFIERS"},
    {NodeKind::ExtendsClause,         "EXTENDS_CLAUSE"},
    {NodeKind::ImplementsClause,      "IMPLEMENTS_CLAUSE"},
    {NodeKind::MethodDef,             "METHOD_DEF"},
    {NodeKind::CtorDef,               "CTOR_DEF"},
    {NodeKind::VariableDef,           "VARIABLE_DEF"},
    {NodeKind::Parameters,            "PARAMETERS"},
    {NodeKind::ParameterDef,          "PARAMETER_DEF"},
    {NodeKind::StaticInit,            "STATIC_INIT"},
    {NodeKind::InstanceInit,          "INSTANCE_INIT"},
    {NodeKind::Type,                  "TYPE"},
    {NodeKind::TypeArguments,         "TYPE_ARGUMENTS"},
    {NodeKind::TypeArgument,          "TYPE_ARGUMENT"},
    {NodeKind::Slist,                 "SLIST"},
    {NodeKind::LiteralIf,             "LITERAL_IF"},
    {NodeKind::LiteralElse,           "LITERAL_ELSE"},
    {NodeKind::LiteralTry,            "LITERAL_TRY"},
    {NodeKind::LiteralCatch,          "LITERAL_CATCH"},
    {NodeKind::LiteralFinally,        "LITERAL_FINALLY"},
    {NodeKind::ResourceSpecification, "RESOURCE_SPECIFICATION"},
    {NodeKind::Resources,             "RESOURCES"},
    {NodeKind::Resource,              "RESOURCE"},
    {NodeKind::LiteralFor,            "LITERAL_FOR"},
    {NodeKind::ForInit,               "FOR_INIT"},
    {NodeKind::ForCondition,          "FOR_CONDITION"},
    {NodeKind::ForIterator,           "FOR_ITERATOR"},
    {NodeKind::ForEachClause,         "FOR_EACH_CLAUSE"},
    {NodeKind::LiteralWhile,          "LITERAL_WHILE"},
    {NodeKind::LiteralDo,             "LITERAL_DO"},
    {NodeKind::DoWhile,               "DO_WHILE"},
    {NodeKind::LiteralSwitch,         "LITERAL_SWITCH"},
    {NodeKind::CaseGroup,             "CASE_GROUP"},
    {NodeKind::LiteralCase,           "LITERAL_CASE"},
    {NodeKind::LiteralDefault,        "LITERAL_DEFAULT"},
    {NodeKind::LiteralReturn,         "LITERAL_RETURN"},
    {NodeKind::LiteralBreak,          "LITERAL_BREAK"},
    {NodeKind::LiteralContinue,       "LITERAL_CONTINUE"},
    {NodeKind::LiteralThrow,          "LITERAL_THROW"},
    {NodeKind::LiteralSynchronized,   "LITERAL_SYNCHRONIZED"},
    {NodeKind::EmptyStat,             "EMPTY_STAT"},
    {NodeKind::LabeledStat,           "LABELED_STAT"},
    {NodeKind::Expr,                  "EXPR"},
    {NodeKind::Elist,                 "ELIST"},
    {NodeKind::MethodCall,            "METHOD_CALL"},
    {NodeKind::LiteralNew,            "LITERAL_NEW"},
    {NodeKind::Assign,                "ASSIGN"},
    {NodeKind::Dot,                   "DOT"},
    {NodeKind::Ident,                 "IDENT"},
    {NodeKind::NumInt,                "NUM_INT"},
    {NodeKind::StringLiteral,         "STRING_LITERAL"},
    {NodeKind::LiteralTrue,           "LITERAL_TRUE"},
    {NodeKind::LiteralFalse,          "LITERAL_FALSE"},
    {NodeKind::LiteralNull,           "LITERAL_NULL"},
    {NodeKind::LiteralThis,           "LITERAL_THIS"},
    {NodeKind::Plus,                  "PLUS"},
    {NodeKind::Minus,                 "MINUS"},
    {NodeKind::Lt,                    "LT"},
    {NodeKind::Gt,                    "GT"},
    {NodeKind::Equal,                 "EQUAL"},
    {NodeKind::NotEqual,              "NOT_EQUAL"},
    {NodeKind::Lnot,                  "LNOT"},
    {NodeKind::Question,              "QUESTION"},
    {NodeKind::Lambda,                "LAMBDA"},
    {NodeKind::LiteralPublic,         "LITERAL_PUBLIC"},
    {NodeKind::LiteralProtected,      "LITERAL_PROTECTED"},
    {NodeKind::LiteralPrivate,        "LITERAL_PRIVATE"},
    {NodeKind::LiteralStatic,         "LITERAL_STATIC"},
    {NodeKind::Final,                 "FINAL"},
    {NodeKind::Abstract,              "ABSTRACT"},
    {NodeKind::LiteralClass,          "LITERAL_CLASS"},
    {NodeKind::LiteralInterface,      "LITERAL_INTERFACE"},
    {NodeKind::LiteralEnum,           "LITERAL_ENUM"},
    {NodeKind::At,                    "AT"},
    {NodeKind::LiteralVoid,           "LITERAL_VOID"},
    {NodeKind::LiteralInt,            "LITERAL_INT"},
    {NodeKind::LiteralBoolean,        "LITERAL_BOOLEAN"},
    {NodeKind::Lcurly,                "LCURLY"},
    {NodeKind::Rcurly,                "RCURLY"},
    {NodeKind::Lparen,                "LPAREN"},
    {NodeKind::Rparen,                "RPAREN"},
    {NodeKind::Semi,                  "SEMI"},
    {NodeKind::Comma,                 "COMMA"},
    {NodeKind::Colon,                 "COLON"},
    {NodeKind::GenericStart,          "GENERIC_START"},
    {NodeKind::GenericEnd,            "GENERIC_END"},
};

constexpr size_t kKindCount = sizeof(kKindNames) / sizeof(kKindNames[0]);

static_assert(kKindCount == static_cast<size_t>(NodeKind::GenericEnd) + 1,
              "kKindNames must list every NodeKind");

const std::unordered_map<std::string, NodeKind>& name_table() {
    static const std::unordered_map<std::string, NodeKind> table = [] {
        std::unordered_map<std::string, NodeKind> t;
        for (const auto& kn : kKindNames) {
            t.emplace(kn.name, kn.kind);
        }
        return t;
    }();
    return table;
}

} // namespace

const char* node_kind_name(NodeKind kind) {
    auto idx = static_cast<size_t>(kind);
    if (idx < kKindCount) return kKindNames[idx].name;
    return "UNKNOWN";
}

std::optional<NodeKind> node_kind_from_name(const std::string& name) {
    const auto& table = name_table();
    auto it = table.find(name);
    if (it == table.end()) return std::nullopt;
    return it->second;
}

} // namespace bracelint
