//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/Lexer.hpp
// Purpose: Declares the Pascal-S lexer that turns source text into tokens by
//          driving the DFA engine.
// Key invariants: Case-insensitive keywords in both spellings; whitespace and
//                 comments are never emitted; exactly one Eof ends the
//                 sequence.
// Ownership/Lifetime: Lexer owns its copy of the source; DiagnosticEngine
//                     borrowed.
// Links: SPEC_FULL.md#44-lexer
//
//===----------------------------------------------------------------------===//
#pragma once

#include "frontends/pascal/CharStream.hpp"
#include "frontends/pascal/DfaEngine.hpp"
#include "frontends/pascal/Token.hpp"
#include "support/diagnostics.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dwipa::frontends::pascal
{

/// @brief Tokenizes Pascal-S source text into a stream of tokens.
/// @details Construct with source buffer, file ID, and diagnostic engine.
/// Call next() repeatedly until Eof is returned. The sequence is single-pass;
/// a new Lexer must be built to scan the text again.
class Lexer
{
  public:
    /// @brief Create a lexer over the given source buffer.
    /// @param source Source text to tokenize.
    /// @param fileId Identifier of the source file for diagnostics.
    /// @param diag Diagnostic engine for reporting errors.
    /// @param trace Enable DFA run tracing.
    Lexer(std::string source, uint32_t fileId, dwipa::support::DiagnosticEngine &diag, bool trace = false);

    /// @brief Produce the next token in the source.
    /// @return The next token; once input is exhausted, Eof on every call.
    Token next();

    /// @brief Peek at the next token without consuming it.
    const Token &peek();

    /// @brief True once the Eof token has been handed out by next().
    [[nodiscard]] bool done() const
    {
        return eofEmitted_ && !peeked_.has_value();
    }

  private:
    /// @brief Skip trivia and lex one token from the stream.
    Token lexToken();

    /// @brief Build an Invalid token and report its diagnostic.
    Token makeInvalid(const DfaRun &run);

    /// @brief Report a lexical error diagnostic.
    void reportError(dwipa::support::SourceLoc loc, LexError error, const std::string &lexeme);

    CharStream stream_;                      ///< Source text and cursor.
    DfaEngine engine_;                       ///< Maximal-munch recognizer.
    dwipa::support::DiagnosticEngine &diag_; ///< Diagnostic engine for errors.
    std::optional<Token> peeked_;            ///< Cached lookahead token.
    bool eofEmitted_{false};                 ///< Eof has been produced.
};

/// @brief Diagnostic code for a lexical error ("L1001" ...).
const char *lexErrorCode(LexError error);

/// @brief Tokenize a whole buffer.
/// @return Every token up to and including the single trailing Eof.
std::vector<Token> tokenize(std::string source,
                            uint32_t fileId,
                            dwipa::support::DiagnosticEngine &diag,
                            bool trace = false);

} // namespace dwipa::frontends::pascal
