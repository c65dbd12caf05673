//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/CharStream.hpp
// Purpose: Declares the character stream the DFA engine drives over source
//          text.
// Key invariants: The cursor never moves past the end of the text; line and
//                 column are 1-based, offset is 0-based.
// Ownership/Lifetime: The stream owns its copy of the source; slices borrow
//                     from it and stay valid for the stream's lifetime.
// Links: SPEC_FULL.md#41-character-stream-charstream
//
//===----------------------------------------------------------------------===//
#pragma once

#include "support/source_location.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace dwipa::frontends::pascal
{

/// @brief Position of the stream cursor.
struct Cursor
{
    uint32_t offset{0}; ///< 0-based byte offset.
    uint32_t line{1};   ///< 1-based line number.
    uint32_t column{1}; ///< 1-based column number.
};

/// @brief Owns source text and a cursor over it.
/// @details Supports lookahead, single-character advance, and resetting the
///          cursor to a remembered position so the DFA engine can backtrack.
class CharStream
{
  public:
    /// @brief Create a stream over @p source for file @p fileId.
    CharStream(std::string source, uint32_t fileId);

    /// @brief Current character, or '\0' at end of input.
    [[nodiscard]] char peek() const;

    /// @brief Character @p n positions ahead, or '\0' beyond the end.
    [[nodiscard]] char peek(std::size_t n) const;

    /// @brief Consume and return the current character.
    /// @return The consumed character, or '\0' if already at end of input.
    char advance();

    /// @brief True once every character has been consumed.
    [[nodiscard]] bool atEnd() const;

    /// @brief Current cursor.
    [[nodiscard]] Cursor position() const
    {
        return cursor_;
    }

    /// @brief Move the cursor back to a previously recorded position.
    void reset(Cursor cursor);

    /// @brief View of the text between two offsets.
    [[nodiscard]] std::string_view slice(uint32_t begin, uint32_t end) const;

    /// @brief Source location for a cursor in this stream's file.
    [[nodiscard]] dwipa::support::SourceLoc locAt(Cursor cursor) const;

  private:
    std::string source_;
    uint32_t fileId_;
    Cursor cursor_;
};

} // namespace dwipa::frontends::pascal
