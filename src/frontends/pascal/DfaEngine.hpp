//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/DfaEngine.hpp
// Purpose: Declares the maximal-munch simulation loop over DfaTable.
// Key invariants: On acceptance the stream sits right after the longest
//                 accepted prefix; on NoTransition it has not moved.
// Ownership/Lifetime: The engine borrows the table and the stream.
// Links: SPEC_FULL.md#43-dfa-engine-dfaengine
//
//===----------------------------------------------------------------------===//
#pragma once

#include "frontends/pascal/CharStream.hpp"
#include "frontends/pascal/DfaRules.hpp"
#include <optional>

namespace dwipa::frontends::pascal
{

/// @brief Outcome of one DFA run.
enum class DfaStatus
{
    Accepted,     ///< A token kind was recognized.
    Stalled,      ///< Run stopped inside an open string or comment.
    NoTransition, ///< The first character cannot begin any token.
};

/// @brief Result of DfaEngine::run.
struct DfaRun
{
    DfaStatus status{DfaStatus::NoTransition};

    /// @brief Accepted token kind; Invalid unless status == Accepted.
    TokenKind kind{TokenKind::Invalid};

    /// @brief Cursor where the run started.
    Cursor begin;

    /// @brief Cursor one past the lexeme (accepted or partially consumed).
    Cursor end;

    /// @brief Reason for failure; empty when status == Accepted.
    std::optional<LexError> error;

    /// @brief Last state reached before the run stopped.
    DfaState lastState{DfaState::Start};

    [[nodiscard]] bool accepted() const
    {
        return status == DfaStatus::Accepted;
    }
};

/// @brief Drives a CharStream through the transition table.
class DfaEngine
{
  public:
    /// @param trace Print one "[dfa]" line per run to stderr; the
    ///              DWIPA_LEX_TRACE environment variable also enables it.
    explicit DfaEngine(bool trace = false);

    /// @brief Recognize the longest token starting at the stream cursor.
    /// @details Transitions while an edge exists, remembering the last
    ///          accepting state. A stall inside a string or comment reports
    ///          that construct as unterminated. Otherwise the stream is reset
    ///          to the last accept, or the run fails with InvalidCharacter
    ///          when nothing was accepted.
    DfaRun run(CharStream &stream) const;

  private:
    void traceRun(const CharStream &stream, const DfaRun &result) const;

    const DfaTable &table_;
    bool trace_;
};

} // namespace dwipa::frontends::pascal
