#pragma once

#include <memory>
#include <string>
#include <vector>

namespace sigscan {
namespace sandbox {

enum class ExprKind {
    Number,
    String,
    Bool,
    Null,
    Variable,       // slot
    ArrayLiteral,   // children
    ObjectLiteral,  // keys + children
    Unary,          // op, children[0]
    Binary,         // op, children[0..1]
    Logical,        // && / ||, short-circuit
    Call,           // name + children (args); builtin or user function
    Index,          // children[0][children[1]]
    Member          // children[0].name
};

enum class Op {
    Add, Sub, Mul, Div, Mod,
    Eq, NotEq, Less, LessEq, Greater, GreaterEq,
    And, Or,
    Neg, Not
};

struct Expr {
    ExprKind kind = ExprKind::Null;
    Op op = Op::Add;
    int line = 0;
    double number = 0.0;
    bool boolean = false;
    std::string name;                   // identifier, string literal, member name, callee
    std::vector<std::string> keys;      // object literal keys
    std::vector<std::unique_ptr<Expr>> children;

    // resolved at compile time
    int slot = -1;                      // Variable
    int builtin = -1;                   // Call: builtin index
    int function = -1;                  // Call: user function index
};

enum class StmtKind {
    Let,            // slot = expr
    Assign,         // target = expr (Variable / Index / Member)
    ExprStmt,
    If,             // expr, body, else_body
    While,          // expr, body
    ForRange,       // slot in expr..range_end, body
    ForEach,        // slot in expr, body
    Return,         // expr (optional)
    Break,
    Continue,
    Block           // body
};

struct Stmt {
    StmtKind kind = StmtKind::ExprStmt;
    int line = 0;
    std::string name;
    int slot = -1;
    std::unique_ptr<Expr> target;
    std::unique_ptr<Expr> expr;
    std::unique_ptr<Expr> range_end;
    std::vector<std::unique_ptr<Stmt>> body;
    std::vector<std::unique_ptr<Stmt>> else_body;
};

struct FunctionDef {
    std::string name;
    int line = 0;
    size_t param_count = 0;
    size_t slot_count = 0;
    std::vector<std::unique_ptr<Stmt>> body;
};

// Result of a successful compile. Immutable and shareable across threads.
struct CompiledScript {
    std::vector<std::unique_ptr<Stmt>> body;
    size_t slot_count = 0;
    std::vector<FunctionDef> functions;
};

} // namespace sandbox
} // namespace sigscan
