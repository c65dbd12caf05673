//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/CharStream.cpp
// Purpose: Implements cursor movement and line/column tracking.
// Key invariants: '\n' starts a new line; every other byte advances the column.
// Ownership/Lifetime: See CharStream.hpp.
// Links: SPEC_FULL.md#41-character-stream-charstream
//
//===----------------------------------------------------------------------===//

#include "frontends/pascal/CharStream.hpp"
#include <algorithm>
#include <utility>

namespace dwipa::frontends::pascal
{

CharStream::CharStream(std::string source, uint32_t fileId)
    : source_(std::move(source)), fileId_(fileId)
{
}

char CharStream::peek() const
{
    if (cursor_.offset >= source_.size())
    {
        return '\0';
    }
    return source_[cursor_.offset];
}

char CharStream::peek(std::size_t n) const
{
    if (cursor_.offset + n >= source_.size())
    {
        return '\0';
    }
    return source_[cursor_.offset + n];
}

char CharStream::advance()
{
    if (cursor_.offset >= source_.size())
    {
        return '\0';
    }
    char c = source_[cursor_.offset++];
    if (c == '\n')
    {
        ++cursor_.line;
        cursor_.column = 1;
    }
    else
    {
        ++cursor_.column;
    }
    return c;
}

bool CharStream::atEnd() const
{
    return cursor_.offset >= source_.size();
}

void CharStream::reset(Cursor cursor)
{
    cursor_ = cursor;
}

std::string_view CharStream::slice(uint32_t begin, uint32_t end) const
{
    const std::size_t size = source_.size();
    const std::size_t b = std::min<std::size_t>(begin, size);
    const std::size_t e = std::min<std::size_t>(std::max(begin, end), size);
    return std::string_view(source_).substr(b, e - b);
}

dwipa::support::SourceLoc CharStream::locAt(Cursor cursor) const
{
    return dwipa::support::SourceLoc{fileId_, cursor.line, cursor.column, cursor.offset};
}

} // namespace dwipa::frontends::pascal
