//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/SyntaxError.cpp
// Purpose: Implements syntax error rendering and code mapping.
// Key invariants: Codes are stable across releases.
// Ownership/Lifetime: N/A (stateless functions).
// Links: SPEC_FULL.md#6-error-taxonomies
//
//===----------------------------------------------------------------------===//

#include "frontends/pascal/SyntaxError.hpp"

namespace dwipa::frontends::pascal
{

namespace
{

std::string describeFound(const std::string &found)
{
    if (found.empty())
        return "end of file";
    return "'" + found + "'";
}

} // namespace

std::string SyntaxError::message() const
{
    switch (kind)
    {
        case SyntaxErrorKind::UnexpectedToken:
        case SyntaxErrorKind::MalformedDeclaration:
            return "expected " + expected + ", found " + describeFound(found);
        case SyntaxErrorKind::UnclosedBlock:
            return "unclosed block: expected " + expected + ", found " + describeFound(found);
        case SyntaxErrorKind::MissingProgram:
            return "no program header or block found";
        case SyntaxErrorKind::TooManyErrors:
            return "too many syntax errors; further errors suppressed";
    }
    return {};
}

const char *syntaxErrorKindToString(SyntaxErrorKind kind)
{
    switch (kind)
    {
        case SyntaxErrorKind::UnexpectedToken:
            return "UnexpectedToken";
        case SyntaxErrorKind::UnclosedBlock:
            return "UnclosedBlock";
        case SyntaxErrorKind::MalformedDeclaration:
            return "MalformedDeclaration";
        case SyntaxErrorKind::MissingProgram:
            return "MissingProgram";
        case SyntaxErrorKind::TooManyErrors:
            return "TooManyErrors";
    }
    return "?";
}

const char *syntaxErrorCode(SyntaxErrorKind kind)
{
    switch (kind)
    {
        case SyntaxErrorKind::UnexpectedToken:
            return "P2001";
        case SyntaxErrorKind::UnclosedBlock:
            return "P2002";
        case SyntaxErrorKind::MalformedDeclaration:
            return "P2003";
        case SyntaxErrorKind::MissingProgram:
            return "P2004";
        case SyntaxErrorKind::TooManyErrors:
            return "P2005";
    }
    return "P2000";
}

} // namespace dwipa::frontends::pascal
