//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/Parser_Stmt.cpp
// Purpose: Statement parsing for bilingual Pascal-S.
// Key invariants: Dangling else binds to the nearest if; statement lists
//                 recover locally and always make progress.
// Ownership/Lifetime: Parser borrows tokens and DiagnosticEngine.
// Links: SPEC_FULL.md#45-parser
//
//===----------------------------------------------------------------------===//

#include "frontends/pascal/AST.hpp"
#include "frontends/pascal/Parser.hpp"

namespace dwipa::frontends::pascal
{

std::unique_ptr<Stmt> Parser::parseStatement()
{
    auto loc = peek().loc;

    // Empty statement (before ';', 'end', 'else', or a premature end)
    if (check(TokenKind::Semicolon) ||
        check(TokenKind::KwEnd) ||
        check(TokenKind::KwElse) ||
        check(TokenKind::Dot) ||
        check(TokenKind::Eof))
    {
        return std::make_unique<EmptyStmt>(loc);
    }

    if (check(TokenKind::KwIf))
        return parseIf();

    if (check(TokenKind::KwWhile))
        return parseWhile();

    if (check(TokenKind::KwFor))
        return parseFor();

    if (check(TokenKind::KwBegin))
        return parseBlock();

    if (check(TokenKind::Identifier))
        return parseAssignOrCall();

    error("statement");
    return nullptr;
}

std::unique_ptr<Stmt> Parser::parseAssignOrCall()
{
    const Token &name = advance();
    auto loc = name.loc;

    if (match(TokenKind::Assign))
    {
        auto value = parseExpression();
        if (!value)
            return nullptr;
        return std::make_unique<AssignStmt>(name.text, std::move(value), loc);
    }

    std::vector<std::unique_ptr<Expr>> args;
    if (match(TokenKind::LParen))
    {
        if (!parseArguments(args))
            return nullptr;
    }
    else if (!check(TokenKind::Semicolon) && !check(TokenKind::KwEnd) &&
             !check(TokenKind::KwElse) && !check(TokenKind::Dot) && !check(TokenKind::Eof))
    {
        error("':=' or '('");
        return nullptr;
    }

    auto call = std::make_unique<CallExpr>(name.text, std::move(args), loc);
    return std::make_unique<CallStmt>(std::move(call), loc);
}

std::unique_ptr<Stmt> Parser::parseIf()
{
    auto loc = peek().loc;

    if (!expect(TokenKind::KwIf))
        return nullptr;

    auto condition = parseExpression();
    if (!condition)
        return nullptr;

    if (!expect(TokenKind::KwThen))
        return nullptr;

    auto thenBranch = parseStatement();
    if (!thenBranch)
        return nullptr;

    // The innermost open 'if' claims the 'else'
    std::unique_ptr<Stmt> elseBranch;
    if (match(TokenKind::KwElse))
    {
        elseBranch = parseStatement();
        if (!elseBranch)
            return nullptr;
    }

    return std::make_unique<IfStmt>(
        std::move(condition), std::move(thenBranch), std::move(elseBranch), loc);
}

std::unique_ptr<Stmt> Parser::parseWhile()
{
    auto loc = peek().loc;

    if (!expect(TokenKind::KwWhile))
        return nullptr;

    auto condition = parseExpression();
    if (!condition)
        return nullptr;

    if (!expect(TokenKind::KwDo))
        return nullptr;

    auto body = parseStatement();
    if (!body)
        return nullptr;

    return std::make_unique<WhileStmt>(std::move(condition), std::move(body), loc);
}

std::unique_ptr<Stmt> Parser::parseFor()
{
    auto loc = peek().loc;

    if (!expect(TokenKind::KwFor))
        return nullptr;

    if (!check(TokenKind::Identifier))
    {
        error("loop variable");
        return nullptr;
    }
    std::string loopVar = advance().text;

    if (!expect(TokenKind::Assign, "':='"))
        return nullptr;

    auto start = parseExpression();
    if (!start)
        return nullptr;

    ForDirection direction;
    if (match(TokenKind::KwTo))
    {
        direction = ForDirection::To;
    }
    else if (match(TokenKind::KwDownto))
    {
        direction = ForDirection::Downto;
    }
    else
    {
        error("'to', 'ke', 'downto' or 'turun_ke'");
        return nullptr;
    }

    auto bound = parseExpression();
    if (!bound)
        return nullptr;

    if (!expect(TokenKind::KwDo))
        return nullptr;

    auto body = parseStatement();
    if (!body)
        return nullptr;

    return std::make_unique<ForStmt>(
        std::move(loopVar), std::move(start), std::move(bound), direction, std::move(body), loc);
}

std::unique_ptr<BlockStmt> Parser::parseBlock()
{
    auto loc = peek().loc;
    ErrorKindScope scope(*this, SyntaxErrorKind::UnexpectedToken);

    if (!expect(TokenKind::KwBegin))
        return nullptr;

    auto stmts = parseStatementList();

    if (!match(TokenKind::KwEnd))
    {
        // Statement lists only stop early at these tokens
        errorAt(SyntaxErrorKind::UnclosedBlock, peek(), describe(TokenKind::KwEnd));
    }

    return std::make_unique<BlockStmt>(std::move(stmts), loc);
}

std::vector<std::unique_ptr<Stmt>> Parser::parseStatementList()
{
    std::vector<std::unique_ptr<Stmt>> result;

    while (true)
    {
        std::size_t start = pos_;
        auto stmt = parseStatement();
        if (stmt)
        {
            if (stmt->kind != StmtKind::Empty)
                result.push_back(std::move(stmt));
        }
        else
        {
            if (pos_ == start)
                advance();
            resyncAfterError();
        }

        if (match(TokenKind::Semicolon))
            continue;

        if (check(TokenKind::KwEnd) || check(TokenKind::Dot) || check(TokenKind::Eof))
            break;

        // Missing separator: treat a statement start as if ';' were present,
        // otherwise skip to the next boundary.
        error("';' or " + describe(TokenKind::KwEnd));
        if (!isStatementStart(peek().kind))
        {
            advance();
            resyncAfterError();
            match(TokenKind::Semicolon);
        }
    }

    return result;
}

} // namespace dwipa::frontends::pascal
