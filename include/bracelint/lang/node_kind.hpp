#pragma once

#include <optional>
#include <string>

namespace bracelint {

// Node kinds of a Java syntax tree. Names returned by node_kind_name()
// match the token-type names used in tree dumps (LITERAL_IF, SLIST, ...).
enum class NodeKind {
    CompilationUnit,
    PackageDef,
    Import,
    Annotations,
    Annotation,

    // Type definitions
    ClassDef,
    InterfaceDef,
    EnumDef,
    AnnotationDef,
    ObjBlock,
    Modifiers,
    ExtendsClause,
    ImplementsClause,

    // Members
    MethodDef,
    CtorDef,
    VariableDef,
    Parameters,
    ParameterDef,
    StaticInit,
    InstanceInit,
    Type,
    TypeArguments,
    TypeArgument,

    // Statements
    Slist,
    LiteralIf,
    LiteralElse,
    LiteralTry,
    LiteralCatch,
    LiteralFinally,
    ResourceSpecification,
    Resources,
    Resource,
    LiteralFor,
    ForInit,
    ForCondition,
    ForIterator,
    ForEachClause,
    LiteralWhile,
    LiteralDo,
    DoWhile,
    LiteralSwitch,
    CaseGroup,
    LiteralCase,
    LiteralDefault,
    LiteralReturn,
    LiteralBreak,
    LiteralContinue,
    LiteralThrow,
    LiteralSynchronized,
    EmptyStat,
    LabeledStat,

    // Expressions
    Expr,
    Elist,
    MethodCall,
    LiteralNew,
    Assign,
    Dot,
    Ident,
    NumInt,
    StringLiteral,
    LiteralTrue,
    LiteralFalse,
    LiteralNull,
    LiteralThis,
    Plus,
    Minus,
    Lt,
    Gt,
    Equal,
    NotEqual,
    Lnot,
    Question,
    Lambda,

    // Modifiers and keywords
    LiteralPublic,
    LiteralProtected,
    LiteralPrivate,
    LiteralStatic,
    Final,
    Abstract,
    LiteralClass,
    LiteralInterface,
    LiteralEnum,
    At,
    LiteralVoid,
    LiteralInt,
    LiteralBoolean,

    // Punctuation
    Lcurly,
    Rcurly,
    Lparen,
    Rparen,
    Semi,
    Comma,
    Colon,
    GenericStart,
    GenericEnd,
};

// Dump name for a kind (e.g. NodeKind::LiteralIf -> "LITERAL_IF")
const char* node_kind_name(NodeKind kind);

// Reverse lookup of node_kind_name(); nullopt for unknown names.
std::optional<NodeKind> node_kind_from_name(const std::string& name);

} // namespace bracelint
