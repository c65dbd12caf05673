//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.cpp
/// @brief Implements the Pascal-S tree-walking printer.
///
//===----------------------------------------------------------------------===//

#include "frontends/pascal/AstPrinter.hpp"

#include <sstream>

namespace dwipa::frontends::pascal
{

namespace
{

// ---------------------------------------------------------------------------
// Printer helper -- manages indentation and line output.
// ---------------------------------------------------------------------------

struct Printer
{
    std::ostream &os;
    int indent = 0;

    /// @brief Write @p text on a new line at the current indentation.
    void line(const std::string &text)
    {
        for (int i = 0; i < indent; ++i)
            os << "  ";
        os << text << '\n';
    }

    void push()
    {
        ++indent;
    }

    void pop()
    {
        --indent;
    }
};

void printDecl(const Decl &decl, Printer &p);
void printStmt(const Stmt &stmt, Printer &p);
void printExpr(const Expr &expr, Printer &p);

std::string quote(const std::string &value)
{
    std::string result = "'";
    for (char c : value)
    {
        result.push_back(c);
        if (c == '\'')
            result.push_back('\'');
    }
    result.push_back('\'');
    return result;
}

std::string joinNames(const std::vector<std::string> &names)
{
    std::string result;
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        if (i != 0)
            result += ", ";
        result += names[i];
    }
    return result;
}

std::string paramsToString(const std::vector<ParamDecl> &params)
{
    if (params.empty())
        return {};

    std::string result = "(";
    for (std::size_t i = 0; i < params.size(); ++i)
    {
        const ParamDecl &param = params[i];
        if (i != 0)
            result += "; ";
        if (param.isVar)
            result += "var ";
        result += joinNames(param.names);
        result += " : ";
        result += param.type ? typeToString(*param.type) : "?";
    }
    result += ")";
    return result;
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

void printExpr(const Expr &expr, Printer &p)
{
    switch (expr.kind)
    {
        case ExprKind::IntLiteral:
            p.line("Int " + std::to_string(static_cast<const IntLiteralExpr &>(expr).value));
            break;
        case ExprKind::RealLiteral:
            p.line("Real " + static_cast<const RealLiteralExpr &>(expr).text);
            break;
        case ExprKind::StringLiteral:
            p.line("String " + quote(static_cast<const StringLiteralExpr &>(expr).value));
            break;
        case ExprKind::CharLiteral:
            p.line("Char " +
                   quote(std::string(1, static_cast<const CharLiteralExpr &>(expr).value)));
            break;
        case ExprKind::BoolLiteral:
            p.line(std::string("Bool ") +
                   (static_cast<const BoolLiteralExpr &>(expr).value ? "true" : "false"));
            break;
        case ExprKind::Name:
            p.line("Name " + static_cast<const NameExpr &>(expr).name);
            break;
        case ExprKind::Unary:
        {
            const auto &u = static_cast<const UnaryExpr &>(expr);
            p.line(std::string("Unary ") + unaryOpToString(u.op));
            p.push();
            if (u.operand)
                printExpr(*u.operand, p);
            p.pop();
            break;
        }
        case ExprKind::Binary:
        {
            const auto &b = static_cast<const BinaryExpr &>(expr);
            p.line(std::string("Binary ") + binaryOpToString(b.op));
            p.push();
            if (b.left)
                printExpr(*b.left, p);
            if (b.right)
                printExpr(*b.right, p);
            p.pop();
            break;
        }
        case ExprKind::Call:
        {
            const auto &c = static_cast<const CallExpr &>(expr);
            p.line("Call " + c.callee);
            p.push();
            for (const auto &arg : c.args)
                printExpr(*arg, p);
            p.pop();
            break;
        }
    }
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

void printBranch(const char *label, const Stmt *stmt, Printer &p)
{
    if (!stmt)
        return;
    p.line(label);
    p.push();
    printStmt(*stmt, p);
    p.pop();
}

void printStmt(const Stmt &stmt, Printer &p)
{
    switch (stmt.kind)
    {
        case StmtKind::Assign:
        {
            const auto &a = static_cast<const AssignStmt &>(stmt);
            p.line("Assign " + a.target);
            p.push();
            if (a.value)
                printExpr(*a.value, p);
            p.pop();
            break;
        }
        case StmtKind::Call:
        {
            const auto &c = static_cast<const CallStmt &>(stmt);
            p.line("CallStmt " + c.call->callee);
            p.push();
            for (const auto &arg : c.call->args)
                printExpr(*arg, p);
            p.pop();
            break;
        }
        case StmtKind::Block:
        {
            const auto &b = static_cast<const BlockStmt &>(stmt);
            p.line("Block");
            p.push();
            for (const auto &s : b.stmts)
                printStmt(*s, p);
            p.pop();
            break;
        }
        case StmtKind::If:
        {
            const auto &i = static_cast<const IfStmt &>(stmt);
            p.line("If");
            p.push();
            printExpr(*i.condition, p);
            printBranch("Then", i.thenBranch.get(), p);
            printBranch("Else", i.elseBranch.get(), p);
            p.pop();
            break;
        }
        case StmtKind::While:
        {
            const auto &w = static_cast<const WhileStmt &>(stmt);
            p.line("While");
            p.push();
            printExpr(*w.condition, p);
            printBranch("Do", w.body.get(), p);
            p.pop();
            break;
        }
        case StmtKind::For:
        {
            const auto &f = static_cast<const ForStmt &>(stmt);
            p.line("For " + f.loopVar + (f.direction == ForDirection::To ? " to" : " downto"));
            p.push();
            printExpr(*f.start, p);
            printExpr(*f.bound, p);
            printBranch("Do", f.body.get(), p);
            p.pop();
            break;
        }
        case StmtKind::Empty:
            p.line("Empty");
            break;
    }
}

// ---------------------------------------------------------------------------
// Declarations
// ---------------------------------------------------------------------------

void printSubprogramParts(const std::vector<std::unique_ptr<Decl>> &locals,
                          const BlockStmt *body,
                          Printer &p)
{
    p.push();
    for (const auto &d : locals)
        printDecl(*d, p);
    if (body)
        printStmt(*body, p);
    p.pop();
}

void printDecl(const Decl &decl, Printer &p)
{
    switch (decl.kind)
    {
        case DeclKind::Const:
        {
            const auto &c = static_cast<const ConstDecl &>(decl);
            p.line("ConstDecl " + c.name);
            p.push();
            if (c.value)
                printExpr(*c.value, p);
            p.pop();
            break;
        }
        case DeclKind::Var:
        {
            const auto &v = static_cast<const VarDecl &>(decl);
            p.line("VarDecl " + joinNames(v.names) + " : " + typeToString(*v.type));
            break;
        }
        case DeclKind::Type:
        {
            const auto &t = static_cast<const TypeDecl &>(decl);
            p.line("TypeDecl " + t.name + " = " + typeToString(*t.type));
            break;
        }
        case DeclKind::Procedure:
        {
            const auto &proc = static_cast<const ProcedureDecl &>(decl);
            p.line("ProcedureDecl " + proc.name + paramsToString(proc.params));
            printSubprogramParts(proc.localDecls, proc.body.get(), p);
            break;
        }
        case DeclKind::Function:
        {
            const auto &func = static_cast<const FunctionDecl &>(decl);
            std::string header = "FunctionDecl " + func.name + paramsToString(func.params);
            if (func.returnType)
                header += " : " + typeToString(*func.returnType);
            p.line(header);
            printSubprogramParts(func.localDecls, func.body.get(), p);
            break;
        }
    }
}

} // namespace

std::string typeToString(const TypeNode &type)
{
    switch (type.kind)
    {
        case TypeKind::Named:
            return static_cast<const NamedTypeNode &>(type).name;
        case TypeKind::Range:
        {
            const auto &r = static_cast<const RangeTypeNode &>(type);
            return std::to_string(r.low) + ".." + std::to_string(r.high);
        }
        case TypeKind::Array:
        {
            const auto &a = static_cast<const ArrayTypeNode &>(type);
            return "array[" + std::to_string(a.low) + ".." + std::to_string(a.high) + "] of " +
                   (a.elementType ? typeToString(*a.elementType) : std::string("?"));
        }
    }
    return "?";
}

std::string AstPrinter::dump(const Program &program)
{
    std::ostringstream os;
    Printer p{os};
    p.line(program.name.empty() ? std::string("Program") : "Program " + program.name);
    p.push();
    for (const auto &d : program.decls)
        printDecl(*d, p);
    if (program.body)
        printStmt(*program.body, p);
    p.pop();
    return os.str();
}

std::string AstPrinter::dump(const Stmt &stmt)
{
    std::ostringstream os;
    Printer p{os};
    printStmt(stmt, p);
    return os.str();
}

std::string AstPrinter::dump(const Expr &expr)
{
    std::ostringstream os;
    Printer p{os};
    printExpr(expr, p);
    return os.str();
}

} // namespace dwipa::frontends::pascal
