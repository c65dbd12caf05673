//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source position value type shared by tokens, syntax
//          nodes, and diagnostics.
// Key invariants: file_id == 0 denotes an unknown file; line/column are
//                 1-based when known; offset is the 0-based byte index.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: SPEC_FULL.md#3-data-model
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <iosfwd>

namespace dwipa::support
{

/// @brief A position inside one registered source buffer.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 denotes an unknown file.
    uint32_t file_id = 0;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column, counted in bytes; 0 when unknown.
    uint32_t column = 0;

    /// @brief Zero-based byte offset from the start of the buffer.
    uint32_t offset = 0;

    [[nodiscard]] bool hasFile() const
    {
        return file_id != 0;
    }

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }

    /// @brief True when both locations name the same byte of the same file.
    [[nodiscard]] bool samePlace(const SourceLoc &other) const;
};

/// @brief Writes "line:column", the form used by token listings and traces.
std::ostream &operator<<(std::ostream &os, const SourceLoc &loc);

} // namespace dwipa::support
