#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace calcrun {

// Node kinds of the Python syntax tree. Operator and context nodes are not
// materialized; the operator text is kept on the owning node.
enum class NodeKind {
    // Module and statements
    Module,
    Expr,
    Assign,
    AugAssign,
    AnnAssign,
    Pass,
    Break,
    Continue,
    Return,
    Raise,
    Global,
    Nonlocal,
    Delete,
    Assert,
    Import,
    ImportFrom,
    Alias,
    If,
    While,
    For,
    AsyncFor,
    Try,
    TryStar,
    ExceptHandler,
    With,
    AsyncWith,
    WithItem,
    FunctionDef,
    AsyncFunctionDef,
    ClassDef,
    Arguments,
    Arg,
    Keyword,

    // Expressions
    BoolOp,
    NamedExpr,
    BinOp,
    UnaryOp,
    Lambda,
    IfExp,
    Dict,
    Set,
    ListComp,
    SetComp,
    DictComp,
    GeneratorExp,
    Comprehension,
    Await,
    Yield,
    YieldFrom,
    Compare,
    Call,
    FormattedValue,
    JoinedStr,
    Constant,
    Attribute,
    Subscript,
    Starred,
    Name,
    List,
    Tuple,
    Slice
};

// A syntax tree node. Children are stored in the field order of the
// corresponding CPython ast class so that a breadth-first walk visits nodes
// in the same order as ast.walk.
struct Node {
    NodeKind kind;
    int line;
    int column;

    // Identifier payload: Name id, Attribute attr, Alias name, Keyword arg,
    // def/class name, ImportFrom module, operator text.
    std::string name;
    // Secondary payload: Alias asname, Constant source text.
    std::string value;
    // ImportFrom relative level
    int level = 0;

    std::vector<std::unique_ptr<Node>> children;

    Node(NodeKind k, int l, int c) : kind(k), line(l), column(c) {}

    Node* add(std::unique_ptr<Node> child) {
        Node* raw = child.get();
        if (child) children.push_back(std::move(child));
        return raw;
    }
};

using NodePtr = std::unique_ptr<Node>;

inline NodePtr make_node(NodeKind kind, int line, int column) {
    return std::make_unique<Node>(kind, line, column);
}

// Breadth-first traversal; the visitor returns false to stop early.
void walk(const Node& root, const std::function<bool(const Node&)>& visitor);

// Number of nodes in the tree
size_t count_nodes(const Node& root);

} // namespace calcrun
