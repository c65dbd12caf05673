//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/Token.hpp
// Purpose: Declares token kinds and the immutable token record produced by
//          the Pascal-S lexer.
// Key invariants: Keyword kinds are language-neutral; both spellings of a
//                 reserved word share one kind. Only Eof has an empty lexeme.
// Ownership/Lifetime: Tokens are value types owned by the token vector.
// Links: SPEC_FULL.md#3-data-model
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include <optional>
#include <string>

namespace dwipa::frontends::pascal
{

/// @brief All token kinds recognized by the Pascal-S lexer.
/// @details The enumerators are grouped; range checks in the category helpers
///          depend on the grouping order below.
enum class TokenKind
{
    // Markers
    Eof,     ///< End of file
    Invalid, ///< Lexical error (see Token::lexError)

    // Literals
    IntegerLiteral, ///< 42
    RealLiteral,    ///< 3.14, 1e10
    StringLiteral,  ///< 'text' or ''
    CharLiteral,    ///< 'c'

    // Identifiers
    Identifier,

    // Keywords (reserved words, alphabetical by English spelling)
    KwAnd,
    KwArray,
    KwBegin,
    KwConst,
    KwDiv,
    KwDo,
    KwDownto,
    KwElse,
    KwEnd,
    KwFor,
    KwFunction,
    KwIf,
    KwMod,
    KwNot,
    KwOf,
    KwOr,
    KwProcedure,
    KwProgram,
    KwThen,
    KwTo,
    KwType,
    KwVar,
    KwWhile,

    // Operators
    Assign,       ///< :=
    LessEqual,    ///< <=
    GreaterEqual, ///< >=
    NotEqual,     ///< <>
    DotDot,       ///< ..
    Plus,         ///< +
    Minus,        ///< -
    Star,         ///< *
    Slash,        ///< /
    Less,         ///< <
    Greater,      ///< >
    Equal,        ///< =

    // Delimiters
    Semicolon, ///< ;
    Comma,     ///< ,
    Colon,     ///< :
    LParen,    ///< (
    RParen,    ///< )
    LBracket,  ///< [
    RBracket,  ///< ]
    Dot,       ///< .

    // Trivia accepted by the DFA but never emitted by the lexer
    Whitespace,
    Comment,
};

/// @brief Coarse grouping of token kinds used by listings and the parser.
enum class TokenCategory
{
    EndOfFile,
    Invalid,
    Literal,
    Identifier,
    Keyword,
    Operator,
    Delimiter,
    Trivia,
};

/// @brief Reasons a character run could not form a token.
enum class LexError
{
    UnterminatedString,  ///< Quote not closed before end of line or input
    UnterminatedComment, ///< '{' or '(*' not closed before end of input
    InvalidCharacter,    ///< Character cannot begin any token
};

/// @brief Convert TokenKind to its canonical spelling or descriptive name.
/// @details Keywords return the English spelling, which is the
///          language-neutral tag used in listings.
const char *tokenKindToString(TokenKind kind);

/// @brief Name of a token category for listings ("keyword", "operator", ...).
const char *tokenCategoryToString(TokenCategory category);

/// @brief Short identifier of a lexical error ("UnterminatedComment", ...).
const char *lexErrorToString(LexError error);

/// @brief Human-readable message for a lexical error.
const char *lexErrorMessage(LexError error);

/// @brief Classify a token kind.
TokenCategory tokenCategory(TokenKind kind);

/// @brief True for reserved-word kinds.
bool isKeyword(TokenKind kind);

/// @brief True for operator kinds (including '..' and ':=').
bool isOperator(TokenKind kind);

/// @brief True for delimiter kinds.
bool isDelimiter(TokenKind kind);

/// @brief True for literal kinds.
bool isLiteral(TokenKind kind);

/// @brief True for whitespace and comments.
bool isTrivia(TokenKind kind);

/// @brief A lexical token produced by the Pascal-S lexer.
struct Token
{
    /// @brief Classification of this token.
    TokenKind kind{TokenKind::Eof};

    /// @brief Exact spelling of the token in source.
    std::string text;

    /// @brief Case-folded (lowercase) form for case-insensitive comparison.
    std::string canonical;

    /// @brief Source location where the token begins.
    dwipa::support::SourceLoc loc;

    /// @brief Reason for an Invalid token; empty for every other kind.
    std::optional<LexError> lexError;
};

} // namespace dwipa::frontends::pascal
