//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/AST.hpp
// Purpose: Defines the syntax tree for bilingual Pascal-S.
// Key invariants: All nodes have SourceLoc of their leading token; ownership
//                 via std::unique_ptr; no sharing, no back references.
// Ownership/Lifetime: Nodes are owned by their parent containers.
// Links: SPEC_FULL.md#3-data-model
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dwipa::frontends::pascal
{

//===----------------------------------------------------------------------===//
// Forward Declarations
//===----------------------------------------------------------------------===//

struct Expr;
struct Stmt;
struct Decl;
struct TypeNode;
struct BlockStmt;

//===----------------------------------------------------------------------===//
// Expression Nodes
//===----------------------------------------------------------------------===//

/// @brief Discriminator for expression node kinds.
enum class ExprKind
{
    IntLiteral,
    RealLiteral,
    StringLiteral,
    CharLiteral,
    BoolLiteral,
    Name,
    Unary,
    Binary,
    Call,
};

/// @brief Base class for all Pascal-S expressions.
struct Expr
{
    ExprKind kind;
    dwipa::support::SourceLoc loc;

    explicit Expr(ExprKind k, dwipa::support::SourceLoc l = {}) : kind(k), loc(l) {}
    virtual ~Expr() = default;
};

/// @brief Integer literal expression.
struct IntLiteralExpr : Expr
{
    int64_t value;

    explicit IntLiteralExpr(int64_t v, dwipa::support::SourceLoc l = {})
        : Expr(ExprKind::IntLiteral, l), value(v) {}
};

/// @brief Real (floating-point) literal expression.
struct RealLiteralExpr : Expr
{
    double value;
    std::string text; ///< Spelling as written, used by the printer.

    RealLiteralExpr(double v, std::string t, dwipa::support::SourceLoc l = {})
        : Expr(ExprKind::RealLiteral, l), value(v), text(std::move(t)) {}
};

/// @brief String literal expression; value has doubled quotes collapsed.
struct StringLiteralExpr : Expr
{
    std::string value;

    explicit StringLiteralExpr(std::string v, dwipa::support::SourceLoc l = {})
        : Expr(ExprKind::StringLiteral, l), value(std::move(v)) {}
};

/// @brief Character literal expression ('c').
struct CharLiteralExpr : Expr
{
    char value;

    explicit CharLiteralExpr(char v, dwipa::support::SourceLoc l = {})
        : Expr(ExprKind::CharLiteral, l), value(v) {}
};

/// @brief Boolean literal expression (true/false).
struct BoolLiteralExpr : Expr
{
    bool value;

    explicit BoolLiteralExpr(bool v, dwipa::support::SourceLoc l = {})
        : Expr(ExprKind::BoolLiteral, l), value(v) {}
};

/// @brief Name expression (variable, constant reference).
struct NameExpr : Expr
{
    std::string name;

    explicit NameExpr(std::string n, dwipa::support::SourceLoc l = {})
        : Expr(ExprKind::Name, l), name(std::move(n)) {}
};

/// @brief Unary operator expression.
struct UnaryExpr : Expr
{
    enum class Op
    {
        Neg,  ///< -x
        Not,  ///< not x
        Plus, ///< +x (identity)
    };

    Op op;
    std::unique_ptr<Expr> operand;

    UnaryExpr(Op o, std::unique_ptr<Expr> operand, dwipa::support::SourceLoc l = {})
        : Expr(ExprKind::Unary, l), op(o), operand(std::move(operand)) {}
};

/// @brief Binary operator expression.
struct BinaryExpr : Expr
{
    enum class Op
    {
        // Arithmetic
        Add,    ///< +
        Sub,    ///< -
        Mul,    ///< *
        Div,    ///< / (real division)
        IntDiv, ///< div (integer division)
        Mod,    ///< mod

        // Comparison
        Eq, ///< =
        Ne, ///< <>
        Lt, ///< <
        Le, ///< <=
        Gt, ///< >
        Ge, ///< >=

        // Logical
        And, ///< and
        Or,  ///< or
    };

    Op op;
    std::unique_ptr<Expr> left;
    std::unique_ptr<Expr> right;

    BinaryExpr(Op o, std::unique_ptr<Expr> l, std::unique_ptr<Expr> r,
               dwipa::support::SourceLoc loc = {})
        : Expr(ExprKind::Binary, loc), op(o), left(std::move(l)), right(std::move(r)) {}
};

/// @brief Function/procedure call expression.
struct CallExpr : Expr
{
    std::string callee;
    std::vector<std::unique_ptr<Expr>> args;

    CallExpr(std::string callee, std::vector<std::unique_ptr<Expr>> args,
             dwipa::support::SourceLoc l = {})
        : Expr(ExprKind::Call, l), callee(std::move(callee)), args(std::move(args)) {}
};

//===----------------------------------------------------------------------===//
// Type Nodes
//===----------------------------------------------------------------------===//

/// @brief Discriminator for type node kinds.
enum class TypeKind
{
    Named,
    Range,
    Array,
};

/// @brief Base class for all Pascal-S type nodes.
struct TypeNode
{
    TypeKind kind;
    dwipa::support::SourceLoc loc;

    explicit TypeNode(TypeKind k, dwipa::support::SourceLoc l = {}) : kind(k), loc(l) {}
    virtual ~TypeNode() = default;
};

/// @brief Named type reference (integer, real, Numbers).
struct NamedTypeNode : TypeNode
{
    std::string name;

    explicit NamedTypeNode(std::string n, dwipa::support::SourceLoc l = {})
        : TypeNode(TypeKind::Named, l), name(std::move(n)) {}
};

/// @brief Subrange type (low..high) with integer-literal bounds.
/// @details low <= high is not checked by the parser.
struct RangeTypeNode : TypeNode
{
    int64_t low;
    int64_t high;

    RangeTypeNode(int64_t low, int64_t high, dwipa::support::SourceLoc l = {})
        : TypeNode(TypeKind::Range, l), low(low), high(high) {}
};

/// @brief Array type: array[low..high] of elementType.
struct ArrayTypeNode : TypeNode
{
    int64_t low;
    int64_t high;
    std::unique_ptr<TypeNode> elementType;

    ArrayTypeNode(int64_t low, int64_t high, std::unique_ptr<TypeNode> elemType,
                  dwipa::support::SourceLoc l = {})
        : TypeNode(TypeKind::Array, l), low(low), high(high), elementType(std::move(elemType)) {}
};

//===----------------------------------------------------------------------===//
// Statement Nodes
//===----------------------------------------------------------------------===//

/// @brief Discriminator for statement node kinds.
enum class StmtKind
{
    Assign,
    Call,
    Block,
    If,
    For,
    While,
    Empty,
};

/// @brief Base class for all Pascal-S statements.
struct Stmt
{
    StmtKind kind;
    dwipa::support::SourceLoc loc;

    explicit Stmt(StmtKind k, dwipa::support::SourceLoc l = {}) : kind(k), loc(l) {}
    virtual ~Stmt() = default;
};

/// @brief Assignment statement (target := value).
struct AssignStmt : Stmt
{
    std::string target;
    std::unique_ptr<Expr> value;

    AssignStmt(std::string target, std::unique_ptr<Expr> value, dwipa::support::SourceLoc l = {})
        : Stmt(StmtKind::Assign, l), target(std::move(target)), value(std::move(value)) {}
};

/// @brief Procedure call statement (writeln('x'), doWork).
struct CallStmt : Stmt
{
    std::unique_ptr<CallExpr> call;

    explicit CallStmt(std::unique_ptr<CallExpr> call, dwipa::support::SourceLoc l = {})
        : Stmt(StmtKind::Call, l), call(std::move(call)) {}
};

/// @brief Block statement (begin...end).
struct BlockStmt : Stmt
{
    std::vector<std::unique_ptr<Stmt>> stmts;

    explicit BlockStmt(std::vector<std::unique_ptr<Stmt>> stmts = {},
                       dwipa::support::SourceLoc l = {})
        : Stmt(StmtKind::Block, l), stmts(std::move(stmts)) {}
};

/// @brief If statement.
struct IfStmt : Stmt
{
    std::unique_ptr<Expr> condition;
    std::unique_ptr<Stmt> thenBranch;
    std::unique_ptr<Stmt> elseBranch; ///< May be nullptr

    IfStmt(std::unique_ptr<Expr> cond, std::unique_ptr<Stmt> thenBr,
           std::unique_ptr<Stmt> elseBr = nullptr, dwipa::support::SourceLoc l = {})
        : Stmt(StmtKind::If, l), condition(std::move(cond)), thenBranch(std::move(thenBr)),
          elseBranch(std::move(elseBr)) {}
};

/// @brief For loop direction.
enum class ForDirection
{
    To,
    Downto
};

/// @brief For loop statement.
struct ForStmt : Stmt
{
    std::string loopVar;
    std::unique_ptr<Expr> start;
    std::unique_ptr<Expr> bound;
    ForDirection direction;
    std::unique_ptr<Stmt> body;

    ForStmt(std::string var, std::unique_ptr<Expr> start, std::unique_ptr<Expr> bound,
            ForDirection dir, std::unique_ptr<Stmt> body, dwipa::support::SourceLoc l = {})
        : Stmt(StmtKind::For, l), loopVar(std::move(var)), start(std::move(start)),
          bound(std::move(bound)), direction(dir), body(std::move(body)) {}
};

/// @brief While loop statement.
struct WhileStmt : Stmt
{
    std::unique_ptr<Expr> condition;
    std::unique_ptr<Stmt> body;

    WhileStmt(std::unique_ptr<Expr> cond, std::unique_ptr<Stmt> body,
              dwipa::support::SourceLoc l = {})
        : Stmt(StmtKind::While, l), condition(std::move(cond)), body(std::move(body)) {}
};

/// @brief Empty statement (between consecutive semicolons, before end).
struct EmptyStmt : Stmt
{
    explicit EmptyStmt(dwipa::support::SourceLoc l = {}) : Stmt(StmtKind::Empty, l) {}
};

//===----------------------------------------------------------------------===//
// Declaration Nodes
//===----------------------------------------------------------------------===//

/// @brief Discriminator for declaration node kinds.
enum class DeclKind
{
    Const,
    Var,
    Type,
    Procedure,
    Function,
};

/// @brief Base class for all Pascal-S declarations.
struct Decl
{
    DeclKind kind;
    dwipa::support::SourceLoc loc;

    explicit Decl(DeclKind k, dwipa::support::SourceLoc l = {}) : kind(k), loc(l) {}
    virtual ~Decl() = default;
};

/// @brief Constant declaration (name = literal).
struct ConstDecl : Decl
{
    std::string name;
    std::unique_ptr<Expr> value;

    ConstDecl(std::string name, std::unique_ptr<Expr> value, dwipa::support::SourceLoc l = {})
        : Decl(DeclKind::Const, l), name(std::move(name)), value(std::move(value)) {}
};

/// @brief Variable declaration group (a, b : integer).
struct VarDecl : Decl
{
    std::vector<std::string> names;
    std::unique_ptr<TypeNode> type;

    VarDecl(std::vector<std::string> names, std::unique_ptr<TypeNode> type,
            dwipa::support::SourceLoc l = {})
        : Decl(DeclKind::Var, l), names(std::move(names)), type(std::move(type)) {}
};

/// @brief Type declaration (name = type).
struct TypeDecl : Decl
{
    std::string name;
    std::unique_ptr<TypeNode> type;

    TypeDecl(std::string name, std::unique_ptr<TypeNode> type, dwipa::support::SourceLoc l = {})
        : Decl(DeclKind::Type, l), name(std::move(name)), type(std::move(type)) {}
};

/// @brief Formal parameter group for procedures/functions.
struct ParamDecl
{
    std::vector<std::string> names;
    std::unique_ptr<TypeNode> type;
    bool isVar{false};
    dwipa::support::SourceLoc loc;
};

/// @brief Procedure declaration.
struct ProcedureDecl : Decl
{
    std::string name;
    std::vector<ParamDecl> params;
    std::vector<std::unique_ptr<Decl>> localDecls;
    std::unique_ptr<BlockStmt> body;

    ProcedureDecl(std::string name, std::vector<ParamDecl> params, dwipa::support::SourceLoc l = {})
        : Decl(DeclKind::Procedure, l), name(std::move(name)), params(std::move(params)) {}
};

/// @brief Function declaration.
struct FunctionDecl : Decl
{
    std::string name;
    std::vector<ParamDecl> params;
    std::unique_ptr<TypeNode> returnType;
    std::vector<std::unique_ptr<Decl>> localDecls;
    std::unique_ptr<BlockStmt> body;

    FunctionDecl(std::string name, std::vector<ParamDecl> params,
                 std::unique_ptr<TypeNode> returnType, dwipa::support::SourceLoc l = {})
        : Decl(DeclKind::Function, l), name(std::move(name)), params(std::move(params)),
          returnType(std::move(returnType)) {}
};

//===----------------------------------------------------------------------===//
// Top-Level Structures
//===----------------------------------------------------------------------===//

/// @brief Pascal-S program.
struct Program
{
    std::string name;
    std::vector<std::unique_ptr<Decl>> decls;
    std::unique_ptr<BlockStmt> body; ///< May be nullptr after a syntax error
    dwipa::support::SourceLoc loc;
};

//===----------------------------------------------------------------------===//
// Helper Functions
//===----------------------------------------------------------------------===//

/// @brief Get the name of an ExprKind for debugging.
const char *exprKindToString(ExprKind kind);

/// @brief Get the name of a StmtKind for debugging.
const char *stmtKindToString(StmtKind kind);

/// @brief Get the name of a DeclKind for debugging.
const char *declKindToString(DeclKind kind);

/// @brief Get the name of a TypeKind for debugging.
const char *typeKindToString(TypeKind kind);

/// @brief Source spelling of a binary operator ("+", "div", "and", ...).
const char *binaryOpToString(BinaryExpr::Op op);

/// @brief Source spelling of a unary operator ("-", "+", "not").
const char *unaryOpToString(UnaryExpr::Op op);

} // namespace dwipa::frontends::pascal
