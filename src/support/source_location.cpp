//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line helpers for SourceLoc. Line and column are filled in by the
// character stream as it walks the buffer; the offset is what the parser
// compares when it suppresses repeated errors at one token.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

#include <ostream>

namespace dwipa::support
{

bool SourceLoc::samePlace(const SourceLoc &other) const
{
    return file_id == other.file_id && offset == other.offset;
}

std::ostream &operator<<(std::ostream &os, const SourceLoc &loc)
{
    return os << loc.line << ':' << loc.column;
}

} // namespace dwipa::support
