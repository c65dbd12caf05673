//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/AST.cpp
// Purpose: Implements helper functions for Pascal-S AST nodes.
// Key invariants: Kind-to-string functions cover all enum values.
// Ownership/Lifetime: N/A (stateless functions).
// Links: SPEC_FULL.md#3-data-model
//
//===----------------------------------------------------------------------===//

#include "frontends/pascal/AST.hpp"

namespace dwipa::frontends::pascal
{

const char *exprKindToString(ExprKind kind)
{
    switch (kind)
    {
        case ExprKind::IntLiteral:    return "IntLiteral";
        case ExprKind::RealLiteral:   return "RealLiteral";
        case ExprKind::StringLiteral: return "StringLiteral";
        case ExprKind::CharLiteral:   return "CharLiteral";
        case ExprKind::BoolLiteral:   return "BoolLiteral";
        case ExprKind::Name:          return "Name";
        case ExprKind::Unary:         return "Unary";
        case ExprKind::Binary:        return "Binary";
        case ExprKind::Call:          return "Call";
    }
    return "?";
}

const char *stmtKindToString(StmtKind kind)
{
    switch (kind)
    {
        case StmtKind::Assign: return "Assign";
        case StmtKind::Call:   return "Call";
        case StmtKind::Block:  return "Block";
        case StmtKind::If:     return "If";
        case StmtKind::For:    return "For";
        case StmtKind::While:  return "While";
        case StmtKind::Empty:  return "Empty";
    }
    return "?";
}

const char *declKindToString(DeclKind kind)
{
    switch (kind)
    {
        case DeclKind::Const:     return "Const";
        case DeclKind::Var:       return "Var";
        case DeclKind::Type:      return "Type";
        case DeclKind::Procedure: return "Procedure";
        case DeclKind::Function:  return "Function";
    }
    return "?";
}

const char *typeKindToString(TypeKind kind)
{
    switch (kind)
    {
        case TypeKind::Named: return "Named";
        case TypeKind::Range: return "Range";
        case TypeKind::Array: return "Array";
    }
    return "?";
}

const char *binaryOpToString(BinaryExpr::Op op)
{
    using Op = BinaryExpr::Op;
    switch (op)
    {
        case Op::Add:    return "+";
        case Op::Sub:    return "-";
        case Op::Mul:    return "*";
        case Op::Div:    return "/";
        case Op::IntDiv: return "div";
        case Op::Mod:    return "mod";
        case Op::Eq:     return "=";
        case Op::Ne:     return "<>";
        case Op::Lt:     return "<";
        case Op::Le:     return "<=";
        case Op::Gt:     return ">";
        case Op::Ge:     return ">=";
        case Op::And:    return "and";
        case Op::Or:     return "or";
    }
    return "?";
}

const char *unaryOpToString(UnaryExpr::Op op)
{
    switch (op)
    {
        case UnaryExpr::Op::Neg:  return "-";
        case UnaryExpr::Op::Not:  return "not";
        case UnaryExpr::Op::Plus: return "+";
    }
    return "?";
}

} // namespace dwipa::frontends::pascal
