//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/Parser_Decl.cpp
// Purpose: Declaration parsing for bilingual Pascal-S (const, type, var,
//          procedure, function).
// Key invariants: Errors inside a declaration group are recorded as
//                 MalformedDeclaration; subprogram bodies revert to
//                 UnexpectedToken.
// Ownership/Lifetime: Parser borrows tokens and DiagnosticEngine.
// Links: SPEC_FULL.md#45-parser
//
//===----------------------------------------------------------------------===//

#include "frontends/pascal/AST.hpp"
#include "frontends/pascal/Parser.hpp"

namespace dwipa::frontends::pascal
{

std::vector<std::unique_ptr<Decl>> Parser::parseDeclarations()
{
    std::vector<std::unique_ptr<Decl>> decls;

    while (true)
    {
        if (check(TokenKind::KwConst))
        {
            parseConstSection(decls);
        }
        else if (check(TokenKind::KwType))
        {
            parseTypeSection(decls);
        }
        else if (check(TokenKind::KwVar))
        {
            parseVarSection(decls);
        }
        else if (check(TokenKind::KwProcedure))
        {
            auto proc = parseProcedure();
            if (proc)
                decls.push_back(std::move(proc));
        }
        else if (check(TokenKind::KwFunction))
        {
            auto func = parseFunction();
            if (func)
                decls.push_back(std::move(func));
        }
        else
        {
            break;
        }
    }

    return decls;
}

void Parser::recoverDeclaration()
{
    resyncAfterError();
    match(TokenKind::Semicolon);
}

bool Parser::parseIdentList(std::vector<std::string> &names)
{
    do
    {
        if (!check(TokenKind::Identifier))
        {
            error(describe(TokenKind::Identifier));
            return false;
        }
        names.push_back(advance().text);
    } while (match(TokenKind::Comma));
    return true;
}

// Const value: ["+"|"-"] (int | real) | string | char | ident
std::unique_ptr<Expr> Parser::parseConstValue()
{
    auto loc = peek().loc;

    if (check(TokenKind::Plus) || check(TokenKind::Minus))
    {
        auto op = check(TokenKind::Minus) ? UnaryExpr::Op::Neg : UnaryExpr::Op::Plus;
        advance();
        if (!check(TokenKind::IntegerLiteral) && !check(TokenKind::RealLiteral))
        {
            error("number");
            return nullptr;
        }
        auto operand = parseLiteral();
        if (!operand)
            return nullptr;
        return std::make_unique<UnaryExpr>(op, std::move(operand), loc);
    }

    if (isLiteral(peek().kind))
        return parseLiteral();

    if (check(TokenKind::Identifier))
    {
        const Token &tok = advance();
        if (tok.canonical == "true" || tok.canonical == "false")
            return std::make_unique<BoolLiteralExpr>(tok.canonical == "true", loc);
        return std::make_unique<NameExpr>(tok.text, loc);
    }

    error("constant value");
    return nullptr;
}

// Const section: "const" { ident "=" const-value ";" }+
void Parser::parseConstSection(std::vector<std::unique_ptr<Decl>> &decls)
{
    ErrorKindScope scope(*this, SyntaxErrorKind::MalformedDeclaration);

    if (!expect(TokenKind::KwConst))
        return;

    if (!check(TokenKind::Identifier))
    {
        error("constant name");
        recoverDeclaration();
        return;
    }

    while (check(TokenKind::Identifier))
    {
        auto loc = peek().loc;
        std::string name = advance().text;

        if (!expect(TokenKind::Equal, "'='"))
        {
            recoverDeclaration();
            continue;
        }

        auto value = parseConstValue();
        if (!value)
        {
            recoverDeclaration();
            continue;
        }

        decls.push_back(std::make_unique<ConstDecl>(std::move(name), std::move(value), loc));

        if (!expect(TokenKind::Semicolon, "';'"))
            recoverDeclaration();
    }
}

// Type section: "type" { ident "=" type ";" }+
void Parser::parseTypeSection(std::vector<std::unique_ptr<Decl>> &decls)
{
    ErrorKindScope scope(*this, SyntaxErrorKind::MalformedDeclaration);

    if (!expect(TokenKind::KwType))
        return;

    if (!check(TokenKind::Identifier))
    {
        error("type name");
        recoverDeclaration();
        return;
    }

    while (check(TokenKind::Identifier))
    {
        auto loc = peek().loc;
        std::string name = advance().text;

        if (!expect(TokenKind::Equal, "'='"))
        {
            recoverDeclaration();
            continue;
        }

        auto type = parseType();
        if (!type)
        {
            recoverDeclaration();
            continue;
        }

        decls.push_back(std::make_unique<TypeDecl>(std::move(name), std::move(type), loc));

        if (!expect(TokenKind::Semicolon, "';'"))
            recoverDeclaration();
    }
}

// Var section: "var" { ident-list ":" type ";" }+
void Parser::parseVarSection(std::vector<std::unique_ptr<Decl>> &decls)
{
    ErrorKindScope scope(*this, SyntaxErrorKind::MalformedDeclaration);

    if (!expect(TokenKind::KwVar))
        return;

    if (!check(TokenKind::Identifier))
    {
        error("variable name");
        recoverDeclaration();
        return;
    }

    while (check(TokenKind::Identifier))
    {
        auto loc = peek().loc;
        std::vector<std::string> names;
        if (!parseIdentList(names))
        {
            recoverDeclaration();
            continue;
        }

        if (!expect(TokenKind::Colon, "':'"))
        {
            recoverDeclaration();
            continue;
        }

        auto type = parseType();
        if (!type)
        {
            recoverDeclaration();
            continue;
        }

        decls.push_back(std::make_unique<VarDecl>(std::move(names), std::move(type), loc));

        if (!expect(TokenKind::Semicolon, "';'"))
            recoverDeclaration();
    }
}

// Params: "(" group { ";" group } ")"   group: ["var"] ident-list ":" type
bool Parser::parseParams(std::vector<ParamDecl> &params)
{
    if (!expect(TokenKind::LParen, "'('"))
        return false;

    do
    {
        ParamDecl param;
        param.loc = peek().loc;
        param.isVar = match(TokenKind::KwVar);

        if (!parseIdentList(param.names))
            return false;
        if (!expect(TokenKind::Colon, "':'"))
            return false;
        param.type = parseType();
        if (!param.type)
            return false;

        params.push_back(std::move(param));
    } while (match(TokenKind::Semicolon));

    return expect(TokenKind::RParen, "';' or ')'");
}

// Procedure: "procedure" ident [params] ";" decl-part block ";"
std::unique_ptr<Decl> Parser::parseProcedure()
{
    auto loc = peek().loc;
    std::unique_ptr<ProcedureDecl> proc;

    {
        ErrorKindScope scope(*this, SyntaxErrorKind::MalformedDeclaration);

        if (!expect(TokenKind::KwProcedure))
            return nullptr;

        std::string name;
        std::vector<ParamDecl> params;
        bool headerOk = true;

        if (check(TokenKind::Identifier))
            name = advance().text;
        else
        {
            error("procedure name");
            headerOk = false;
        }

        if (headerOk && check(TokenKind::LParen))
            headerOk = parseParams(params);

        if (headerOk)
            headerOk = expect(TokenKind::Semicolon, "';'");

        if (!headerOk)
            recoverDeclaration();

        proc = std::make_unique<ProcedureDecl>(std::move(name), std::move(params), loc);
    }

    proc->localDecls = parseDeclarations();
    if (check(TokenKind::KwBegin))
        proc->body = parseBlock();
    else
        error(describe(TokenKind::KwBegin));

    if (!expect(TokenKind::Semicolon, "';'"))
        recoverDeclaration();

    return proc;
}

// Function: "function" ident [params] ":" type ";" decl-part block ";"
std::unique_ptr<Decl> Parser::parseFunction()
{
    auto loc = peek().loc;
    std::unique_ptr<FunctionDecl> func;

    {
        ErrorKindScope scope(*this, SyntaxErrorKind::MalformedDeclaration);

        if (!expect(TokenKind::KwFunction))
            return nullptr;

        std::string name;
        std::vector<ParamDecl> params;
        std::unique_ptr<TypeNode> returnType;
        bool headerOk = true;

        if (check(TokenKind::Identifier))
            name = advance().text;
        else
        {
            error("function name");
            headerOk = false;
        }

        if (headerOk && check(TokenKind::LParen))
            headerOk = parseParams(params);

        if (headerOk)
            headerOk = expect(TokenKind::Colon, "':'");

        if (headerOk)
        {
            returnType = parseType();
            headerOk = returnType != nullptr;
        }

        if (headerOk)
            headerOk = expect(TokenKind::Semicolon, "';'");

        if (!headerOk)
            recoverDeclaration();

        func = std::make_unique<FunctionDecl>(
            std::move(name), std::move(params), std::move(returnType), loc);
    }

    func->localDecls = parseDeclarations();
    if (check(TokenKind::KwBegin))
        func->body = parseBlock();
    else
        error(describe(TokenKind::KwBegin));

    if (!expect(TokenKind::Semicolon, "';'"))
        recoverDeclaration();

    return func;
}

} // namespace dwipa::frontends::pascal
