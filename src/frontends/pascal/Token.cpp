//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/Token.cpp
// Purpose: Implements token kind names and category queries.
// Key invariants: Category ranges follow the enumerator order in Token.hpp.
// Ownership/Lifetime: Returned strings point to static storage.
// Links: SPEC_FULL.md#3-data-model
//
//===----------------------------------------------------------------------===//

#include "frontends/pascal/Token.hpp"

namespace dwipa::frontends::pascal
{

//===----------------------------------------------------------------------===//
// TokenKind to string conversion
//===----------------------------------------------------------------------===//

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "eof";
        case TokenKind::Invalid:
            return "invalid";
        case TokenKind::IntegerLiteral:
            return "integer";
        case TokenKind::RealLiteral:
            return "real";
        case TokenKind::StringLiteral:
            return "string";
        case TokenKind::CharLiteral:
            return "char";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::KwAnd:
            return "and";
        case TokenKind::KwArray:
            return "array";
        case TokenKind::KwBegin:
            return "begin";
        case TokenKind::KwConst:
            return "const";
        case TokenKind::KwDiv:
            return "div";
        case TokenKind::KwDo:
            return "do";
        case TokenKind::KwDownto:
            return "downto";
        case TokenKind::KwElse:
            return "else";
        case TokenKind::KwEnd:
            return "end";
        case TokenKind::KwFor:
            return "for";
        case TokenKind::KwFunction:
            return "function";
        case TokenKind::KwIf:
            return "if";
        case TokenKind::KwMod:
            return "mod";
        case TokenKind::KwNot:
            return "not";
        case TokenKind::KwOf:
            return "of";
        case TokenKind::KwOr:
            return "or";
        case TokenKind::KwProcedure:
            return "procedure";
        case TokenKind::KwProgram:
            return "program";
        case TokenKind::KwThen:
            return "then";
        case TokenKind::KwTo:
            return "to";
        case TokenKind::KwType:
            return "type";
        case TokenKind::KwVar:
            return "var";
        case TokenKind::KwWhile:
            return "while";
        case TokenKind::Assign:
            return ":=";
        case TokenKind::LessEqual:
            return "<=";
        case TokenKind::GreaterEqual:
            return ">=";
        case TokenKind::NotEqual:
            return "<>";
        case TokenKind::DotDot:
            return "..";
        case TokenKind::Plus:
            return "+";
        case TokenKind::Minus:
            return "-";
        case TokenKind::Star:
            return "*";
        case TokenKind::Slash:
            return "/";
        case TokenKind::Less:
            return "<";
        case TokenKind::Greater:
            return ">";
        case TokenKind::Equal:
            return "=";
        case TokenKind::Semicolon:
            return ";";
        case TokenKind::Comma:
            return ",";
        case TokenKind::Colon:
            return ":";
        case TokenKind::LParen:
            return "(";
        case TokenKind::RParen:
            return ")";
        case TokenKind::LBracket:
            return "[";
        case TokenKind::RBracket:
            return "]";
        case TokenKind::Dot:
            return ".";
        case TokenKind::Whitespace:
            return "whitespace";
        case TokenKind::Comment:
            return "comment";
    }
    return "unknown";
}

const char *tokenCategoryToString(TokenCategory category)
{
    switch (category)
    {
        case TokenCategory::EndOfFile:
            return "eof";
        case TokenCategory::Invalid:
            return "invalid";
        case TokenCategory::Literal:
            return "literal";
        case TokenCategory::Identifier:
            return "identifier";
        case TokenCategory::Keyword:
            return "keyword";
        case TokenCategory::Operator:
            return "operator";
        case TokenCategory::Delimiter:
            return "delimiter";
        case TokenCategory::Trivia:
            return "trivia";
    }
    return "unknown";
}

const char *lexErrorToString(LexError error)
{
    switch (error)
    {
        case LexError::UnterminatedString:
            return "UnterminatedString";
        case LexError::UnterminatedComment:
            return "UnterminatedComment";
        case LexError::InvalidCharacter:
            return "InvalidCharacter";
    }
    return "";
}

const char *lexErrorMessage(LexError error)
{
    switch (error)
    {
        case LexError::UnterminatedString:
            return "unterminated string literal";
        case LexError::UnterminatedComment:
            return "unterminated comment";
        case LexError::InvalidCharacter:
            return "invalid character";
    }
    return "";
}

//===----------------------------------------------------------------------===//
// Category queries
//===----------------------------------------------------------------------===//

bool isKeyword(TokenKind kind)
{
    return kind >= TokenKind::KwAnd && kind <= TokenKind::KwWhile;
}

bool isOperator(TokenKind kind)
{
    return kind >= TokenKind::Assign && kind <= TokenKind::Equal;
}

bool isDelimiter(TokenKind kind)
{
    return kind >= TokenKind::Semicolon && kind <= TokenKind::Dot;
}

bool isLiteral(TokenKind kind)
{
    return kind >= TokenKind::IntegerLiteral && kind <= TokenKind::CharLiteral;
}

bool isTrivia(TokenKind kind)
{
    return kind == TokenKind::Whitespace || kind == TokenKind::Comment;
}

TokenCategory tokenCategory(TokenKind kind)
{
    if (kind == TokenKind::Eof)
        return TokenCategory::EndOfFile;
    if (kind == TokenKind::Invalid)
        return TokenCategory::Invalid;
    if (kind == TokenKind::Identifier)
        return TokenCategory::Identifier;
    if (isLiteral(kind))
        return TokenCategory::Literal;
    if (isKeyword(kind))
        return TokenCategory::Keyword;
    if (isOperator(kind))
        return TokenCategory::Operator;
    if (isDelimiter(kind))
        return TokenCategory::Delimiter;
    return TokenCategory::Trivia;
}

} // namespace dwipa::frontends::pascal
