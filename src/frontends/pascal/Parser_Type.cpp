//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/Parser_Type.cpp
// Purpose: Type parsing for bilingual Pascal-S (named, subrange, array).
// Key invariants: Subrange bounds are signed integer literals; low <= high
//                 is left to a later phase.
// Ownership/Lifetime: Parser borrows tokens and DiagnosticEngine.
// Links: SPEC_FULL.md#45-parser
//
//===----------------------------------------------------------------------===//

#include "frontends/pascal/AST.hpp"
#include "frontends/pascal/Parser.hpp"

namespace dwipa::frontends::pascal
{

// Type: ident | subrange | array-type
std::unique_ptr<TypeNode> Parser::parseType()
{
    auto loc = peek().loc;

    if (check(TokenKind::KwArray))
        return parseArrayType();

    if (check(TokenKind::Identifier))
        return std::make_unique<NamedTypeNode>(advance().text, loc);

    if (check(TokenKind::IntegerLiteral) || check(TokenKind::Minus) || check(TokenKind::Plus))
    {
        int64_t low = 0;
        int64_t high = 0;
        if (!parseSubrange(low, high))
            return nullptr;
        return std::make_unique<RangeTypeNode>(low, high, loc);
    }

    error("type");
    return nullptr;
}

// Array: "array" "[" subrange "]" "of" type
std::unique_ptr<TypeNode> Parser::parseArrayType()
{
    auto loc = peek().loc;

    if (!expect(TokenKind::KwArray))
        return nullptr;

    if (!expect(TokenKind::LBracket, "'['"))
        return nullptr;

    int64_t low = 0;
    int64_t high = 0;
    if (!parseSubrange(low, high))
        return nullptr;

    if (!expect(TokenKind::RBracket, "']'"))
        return nullptr;

    if (!expect(TokenKind::KwOf))
        return nullptr;

    auto elementType = parseType();
    if (!elementType)
        return nullptr;

    return std::make_unique<ArrayTypeNode>(low, high, std::move(elementType), loc);
}

bool Parser::parseSubrange(int64_t &low, int64_t &high)
{
    if (!parseBound(low))
        return false;
    if (!expect(TokenKind::DotDot, "'..'"))
        return false;
    return parseBound(high);
}

bool Parser::parseBound(int64_t &value)
{
    bool negative = false;
    if (match(TokenKind::Minus))
        negative = true;
    else
        match(TokenKind::Plus);

    if (!check(TokenKind::IntegerLiteral))
    {
        error("integer bound");
        return false;
    }

    value = integerValue(advance());
    if (negative)
        value = -value;
    return true;
}

} // namespace dwipa::frontends::pascal
