//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/Parser_Expr.cpp
// Purpose: Expression parsing for bilingual Pascal-S.
// Key invariants: Precedence climbing for expressions; one-token lookahead.
// Ownership/Lifetime: Parser borrows tokens and DiagnosticEngine.
// Links: SPEC_FULL.md#45-parser
//
//===----------------------------------------------------------------------===//

#include "frontends/pascal/AST.hpp"
#include "frontends/pascal/Parser.hpp"
#include <cstdlib>

namespace dwipa::frontends::pascal
{

namespace
{

/// @brief Strip the surrounding quotes and collapse doubled quotes.
std::string unquote(const std::string &text)
{
    std::string result;
    if (text.size() < 2)
        return result;
    result.reserve(text.size() - 2);
    for (std::size_t i = 1; i + 1 < text.size(); ++i)
    {
        result.push_back(text[i]);
        if (text[i] == '\'' && i + 2 < text.size() && text[i + 1] == '\'')
            ++i;
    }
    return result;
}

bool relationalOp(TokenKind kind, BinaryExpr::Op &op)
{
    switch (kind)
    {
        case TokenKind::Equal:
            op = BinaryExpr::Op::Eq;
            return true;
        case TokenKind::NotEqual:
            op = BinaryExpr::Op::Ne;
            return true;
        case TokenKind::Less:
            op = BinaryExpr::Op::Lt;
            return true;
        case TokenKind::LessEqual:
            op = BinaryExpr::Op::Le;
            return true;
        case TokenKind::Greater:
            op = BinaryExpr::Op::Gt;
            return true;
        case TokenKind::GreaterEqual:
            op = BinaryExpr::Op::Ge;
            return true;
        default:
            return false;
    }
}

} // namespace

std::unique_ptr<Expr> Parser::parseExpression()
{
    return parseLogical();
}

// Logical: relation { (and | or) relation } (left-associative, lowest)
std::unique_ptr<Expr> Parser::parseLogical()
{
    auto left = parseRelation();
    if (!left)
        return nullptr;

    while (true)
    {
        BinaryExpr::Op op;
        if (check(TokenKind::KwAnd))
            op = BinaryExpr::Op::And;
        else if (check(TokenKind::KwOr))
            op = BinaryExpr::Op::Or;
        else
            break;

        auto loc = peek().loc;
        advance();
        auto right = parseRelation();
        if (!right)
            return nullptr;
        left = std::make_unique<BinaryExpr>(op, std::move(left), std::move(right), loc);
    }

    return left;
}

// Relation: simple [relop simple]; comparisons do not chain
std::unique_ptr<Expr> Parser::parseRelation()
{
    auto left = parseSimple();
    if (!left)
        return nullptr;

    BinaryExpr::Op op;
    if (!relationalOp(peek().kind, op))
        return left;

    auto loc = peek().loc;
    advance();
    auto right = parseSimple();
    if (!right)
        return nullptr;

    BinaryExpr::Op extra;
    if (relationalOp(peek().kind, extra))
    {
        error("at most one comparison");
        return nullptr;
    }

    return std::make_unique<BinaryExpr>(op, std::move(left), std::move(right), loc);
}

// Simple: term { (+ | -) term }
std::unique_ptr<Expr> Parser::parseSimple()
{
    auto left = parseTerm();
    if (!left)
        return nullptr;

    while (true)
    {
        BinaryExpr::Op op;
        if (check(TokenKind::Plus))
            op = BinaryExpr::Op::Add;
        else if (check(TokenKind::Minus))
            op = BinaryExpr::Op::Sub;
        else
            break;

        auto loc = peek().loc;
        advance();
        auto right = parseTerm();
        if (!right)
            return nullptr;
        left = std::make_unique<BinaryExpr>(op, std::move(left), std::move(right), loc);
    }

    return left;
}

// Term: factor { (* | / | div | mod) factor }
std::unique_ptr<Expr> Parser::parseTerm()
{
    auto left = parseFactor();
    if (!left)
        return nullptr;

    while (true)
    {
        BinaryExpr::Op op;
        if (check(TokenKind::Star))
            op = BinaryExpr::Op::Mul;
        else if (check(TokenKind::Slash))
            op = BinaryExpr::Op::Div;
        else if (check(TokenKind::KwDiv))
            op = BinaryExpr::Op::IntDiv;
        else if (check(TokenKind::KwMod))
            op = BinaryExpr::Op::Mod;
        else
            break;

        auto loc = peek().loc;
        advance();
        auto right = parseFactor();
        if (!right)
            return nullptr;
        left = std::make_unique<BinaryExpr>(op, std::move(left), std::move(right), loc);
    }

    return left;
}

// Factor: "not" factor | ["+"|"-"] factor | primary
std::unique_ptr<Expr> Parser::parseFactor()
{
    UnaryExpr::Op op;
    if (check(TokenKind::KwNot))
        op = UnaryExpr::Op::Not;
    else if (check(TokenKind::Minus))
        op = UnaryExpr::Op::Neg;
    else if (check(TokenKind::Plus))
        op = UnaryExpr::Op::Plus;
    else
        return parsePrimary();

    auto loc = peek().loc;
    advance();
    auto operand = parseFactor();
    if (!operand)
        return nullptr;
    return std::make_unique<UnaryExpr>(op, std::move(operand), loc);
}

std::unique_ptr<Expr> Parser::parseLiteral()
{
    const Token &tok = peek();
    auto loc = tok.loc;

    switch (tok.kind)
    {
        case TokenKind::IntegerLiteral:
        {
            int64_t value = integerValue(tok);
            advance();
            return std::make_unique<IntLiteralExpr>(value, loc);
        }
        case TokenKind::RealLiteral:
        {
            double value = std::strtod(tok.text.c_str(), nullptr);
            std::string text = tok.text;
            advance();
            return std::make_unique<RealLiteralExpr>(value, std::move(text), loc);
        }
        case TokenKind::StringLiteral:
        {
            std::string value = unquote(tok.text);
            advance();
            return std::make_unique<StringLiteralExpr>(std::move(value), loc);
        }
        case TokenKind::CharLiteral:
        {
            std::string value = unquote(tok.text);
            advance();
            return std::make_unique<CharLiteralExpr>(value.empty() ? '\0' : value.front(), loc);
        }
        default:
            break;
    }

    error("literal");
    return nullptr;
}

// Primary: literal | name | call | "(" expr ")"
std::unique_ptr<Expr> Parser::parsePrimary()
{
    auto loc = peek().loc;

    if (isLiteral(peek().kind))
        return parseLiteral();

    if (check(TokenKind::Identifier))
    {
        const Token &tok = advance();

        if (tok.canonical == "true" || tok.canonical == "false")
            return std::make_unique<BoolLiteralExpr>(tok.canonical == "true", loc);

        if (match(TokenKind::LParen))
        {
            std::vector<std::unique_ptr<Expr>> args;
            if (!parseArguments(args))
                return nullptr;
            return std::make_unique<CallExpr>(tok.text, std::move(args), loc);
        }

        return std::make_unique<NameExpr>(tok.text, loc);
    }

    if (match(TokenKind::LParen))
    {
        auto inner = parseExpression();
        if (!inner)
            return nullptr;
        if (!expect(TokenKind::RParen, "')'"))
            return nullptr;
        return inner;
    }

    error("expression");
    return nullptr;
}

// Arguments: [ expr { "," expr } ] ")"   (the "(" is already consumed)
bool Parser::parseArguments(std::vector<std::unique_ptr<Expr>> &args)
{
    if (match(TokenKind::RParen))
        return true;

    do
    {
        auto arg = parseExpression();
        if (!arg)
            return false;
        args.push_back(std::move(arg));
    } while (match(TokenKind::Comma));

    return expect(TokenKind::RParen, "',' or ')'");
}

} // namespace dwipa::frontends::pascal
