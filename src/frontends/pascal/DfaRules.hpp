//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/DfaRules.hpp
// Purpose: Declares the state/transition table that recognizes Pascal-S
//          lexemes and the bilingual keyword table.
// Key invariants: The table is built once and never mutated afterwards; every
//                 (state, class) pair has at most one successor.
// Ownership/Lifetime: DfaTable::get() returns a process-wide immutable object.
// Links: SPEC_FULL.md#42-dfa-rule-set-dfarules
//
//===----------------------------------------------------------------------===//
#pragma once

#include "frontends/pascal/Token.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>

namespace dwipa::frontends::pascal
{

/// @brief Input character classes the transition table is keyed by.
enum class CharClass : uint8_t
{
    Letter,     ///< A-Z, a-z except e/E
    ExpLetter,  ///< e or E (exponent marker, also a letter)
    Digit,      ///< 0-9
    Underscore, ///< _
    Quote,      ///< '
    Plus,
    Minus,
    Star,
    Slash,
    Equal,
    Less,
    Greater,
    Colon,
    Semicolon,
    Comma,
    Dot,
    LParen,
    RParen,
    LBracket,
    RBracket,
    LBrace,
    RBrace,
    Blank,      ///< space, tab, CR, form feed, vertical tab
    Newline,    ///< \n
    Other,      ///< Any byte that cannot begin a token
    EndOfInput, ///< Sentinel for the position past the last byte
    Count
};

/// @brief Number of character classes.
inline constexpr std::size_t kCharClassCount = static_cast<std::size_t>(CharClass::Count);

/// @brief DFA state identifiers.
enum class DfaState : uint8_t
{
    Start,
    Whitespace,
    Ident,

    // Numbers
    Int,
    IntDot,
    Real,
    Exp,
    ExpSign,
    RealExp,

    // String and char literals
    StrOpen,
    StrOne,
    StrMany,
    EmptyStrClose,
    CharClose,
    StrClose,

    // Comments
    BraceComment,
    ParenComment,
    ParenCommentStar,
    CommentDone,

    // Operators and delimiters
    Colon,
    Assign,
    Less,
    LessEqual,
    NotEqual,
    Greater,
    GreaterEqual,
    Dot,
    DotDot,
    Plus,
    Minus,
    Star,
    Slash,
    Equal,
    Semicolon,
    Comma,
    LParen,
    RParen,
    LBracket,
    RBracket,

    Count
};

/// @brief Number of DFA states.
inline constexpr std::size_t kDfaStateCount = static_cast<std::size_t>(DfaState::Count);

/// @brief Immutable transition table plus per-state accept information.
class DfaTable
{
  public:
    /// @brief Process-wide table, built on first use.
    static const DfaTable &get();

    /// @brief Initial state of every run.
    [[nodiscard]] DfaState start() const
    {
        return DfaState::Start;
    }

    /// @brief Successor of @p state on @p cls, if any.
    [[nodiscard]] std::optional<DfaState> next(DfaState state, CharClass cls) const;

    /// @brief True when a run may stop in @p state and produce a token.
    [[nodiscard]] bool isAccepting(DfaState state) const;

    /// @brief Token kind produced by an accepting state.
    [[nodiscard]] TokenKind acceptKind(DfaState state) const;

    /// @brief Error reported when a run stalls in @p state.
    /// @details Set for states inside an open string literal or comment.
    [[nodiscard]] std::optional<LexError> stallError(DfaState state) const;

    /// @brief Map a byte to its character class.
    [[nodiscard]] static CharClass classify(char c);

    /// @brief Character class at the current stream position.
    [[nodiscard]] static CharClass classifyAt(char c, bool atEnd)
    {
        return atEnd ? CharClass::EndOfInput : classify(c);
    }

  private:
    DfaTable();

    struct StateInfo
    {
        bool accepting{false};
        TokenKind kind{TokenKind::Invalid};
        std::optional<LexError> stallError;
    };

    void edge(DfaState from, CharClass cls, DfaState to);
    void edgeAllExcept(DfaState from, std::initializer_list<CharClass> excluded, DfaState to);
    void accept(DfaState state, TokenKind kind);

    static constexpr uint8_t kNoEdge = 0xFF;

    std::array<std::array<uint8_t, kCharClassCount>, kDfaStateCount> edges_{};
    std::array<StateInfo, kDfaStateCount> states_{};
};

/// @brief Printable name of a DFA state for traces.
const char *dfaStateName(DfaState state);

/// @brief Reclassify a case-folded identifier as a keyword.
/// @param canonical Lowercase lexeme.
/// @return Keyword kind for either spelling, or nullopt for plain identifiers.
std::optional<TokenKind> lookupKeyword(std::string_view canonical);

/// @brief Vernacular spelling of a keyword, e.g. "mulai" for KwBegin.
/// @return nullptr when @p kind is not a keyword.
const char *vernacularSpelling(TokenKind kind);

} // namespace dwipa::frontends::pascal
