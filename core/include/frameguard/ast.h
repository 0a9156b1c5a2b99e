#pragma once

// FrameScript syntax tree. There are deliberately no nodes for import,
// function/class definition, lambda, with/try, or global statements.

#include "dataset.h"

#include <memory>
#include <string>
#include <vector>

namespace frameguard {

struct Expr {
    enum class Kind {
        LITERAL,
        NAME,
        ATTRIBUTE,
        SUBSCRIPT,
        CALL,
        UNARY,
        BINARY,
        COMPARE,
        BOOL_OP,
        CONDITIONAL,
        LIST,
        TUPLE,
        DICT,
    };

    explicit Expr(Kind k) : kind(k) {}
    virtual ~Expr() = default;

    Kind kind;
    int line{0};
    int col{0};
};

using ExprPtr = std::unique_ptr<Expr>;

struct LiteralExpr : Expr {
    LiteralExpr() : Expr(Kind::LITERAL) {}
    Cell value;  // literals are always scalars
};

struct NameExpr : Expr {
    NameExpr() : Expr(Kind::NAME) {}
    std::string id;
};

struct AttributeExpr : Expr {
    AttributeExpr() : Expr(Kind::ATTRIBUTE) {}
    ExprPtr object;
    std::string attr;
};

struct SubscriptExpr : Expr {
    SubscriptExpr() : Expr(Kind::SUBSCRIPT) {}
    ExprPtr object;
    ExprPtr index;
};

struct Keyword {
    std::string name;
    ExprPtr value;
};

struct CallExpr : Expr {
    CallExpr() : Expr(Kind::CALL) {}
    ExprPtr func;
    std::vector<ExprPtr> args;
    std::vector<Keyword> kwargs;
};

struct UnaryExpr : Expr {
    UnaryExpr() : Expr(Kind::UNARY) {}
    std::string op;  // "-", "+", "not", "~"
    ExprPtr operand;
};

struct BinaryExpr : Expr {
    BinaryExpr() : Expr(Kind::BINARY) {}
    std::string op;  // + - * / // % ** & |
    ExprPtr left;
    ExprPtr right;
};

// a < b <= c
struct CompareExpr : Expr {
    CompareExpr() : Expr(Kind::COMPARE) {}
    ExprPtr first;
    std::vector<std::string> ops;  // == != < <= > >= in "not in"
    std::vector<ExprPtr> rest;
};

struct BoolOpExpr : Expr {
    BoolOpExpr() : Expr(Kind::BOOL_OP) {}
    bool is_and{true};
    ExprPtr left;
    ExprPtr right;
};

struct ConditionalExpr : Expr {
    ConditionalExpr() : Expr(Kind::CONDITIONAL) {}
    ExprPtr cond;
    ExprPtr then_value;
    ExprPtr else_value;
};

struct ListExpr : Expr {
    explicit ListExpr(Kind k = Kind::LIST) : Expr(k) {}
    std::vector<ExprPtr> elems;
};

struct DictExpr : Expr {
    DictExpr() : Expr(Kind::DICT) {}
    std::vector<ExprPtr> keys;
    std::vector<ExprPtr> values;
};

struct Stmt;
using StmtPtr = std::unique_ptr<Stmt>;
using Block = std::vector<StmtPtr>;

struct Stmt {
    enum class Kind {
        EXPR,
        ASSIGN,
        AUG_ASSIGN,
        IF,
        WHILE,
        FOR,
        BREAK,
        CONTINUE,
        PASS,
    };

    explicit Stmt(Kind k) : kind(k) {}
    virtual ~Stmt() = default;

    Kind kind;
    int line{0};
    int col{0};
};

struct ExprStmt : Stmt {
    ExprStmt() : Stmt(Kind::EXPR) {}
    ExprPtr expr;
};

// target is a NameExpr, SubscriptExpr or AttributeExpr (the latter rejected at runtime)
struct AssignStmt : Stmt {
    AssignStmt() : Stmt(Kind::ASSIGN) {}
    ExprPtr target;
    ExprPtr value;
};

struct AugAssignStmt : Stmt {
    AugAssignStmt() : Stmt(Kind::AUG_ASSIGN) {}
    std::string op;  // binary operator without '='
    ExprPtr target;
    ExprPtr value;
};

struct IfStmt : Stmt {
    IfStmt() : Stmt(Kind::IF) {}
    ExprPtr cond;
    Block body;
    Block orelse;  // an elif is a nested IfStmt
};

struct WhileStmt : Stmt {
    WhileStmt() : Stmt(Kind::WHILE) {}
    ExprPtr cond;
    Block body;
};

struct ForStmt : Stmt {
    ForStmt() : Stmt(Kind::FOR) {}
    std::string var;
    ExprPtr iter;
    Block body;
};

struct SimpleStmt : Stmt {
    explicit SimpleStmt(Kind k) : Stmt(k) {}
};

struct Program {
    Block body;
};

} // namespace frameguard
