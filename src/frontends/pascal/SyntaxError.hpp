//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pascal/SyntaxError.hpp
// Purpose: Declares the structured syntax error records returned by the
//          parser.
// Key invariants: found holds the raw lexeme; it is empty only for Eof.
// Ownership/Lifetime: Value type.
// Links: SPEC_FULL.md#6-error-taxonomies
//
//===----------------------------------------------------------------------===//
#pragma once

#include "support/source_location.hpp"
#include <string>

namespace dwipa::frontends::pascal
{

/// @brief Classes of syntax errors.
enum class SyntaxErrorKind
{
    UnexpectedToken,      ///< A token other than the expected one was found.
    UnclosedBlock,        ///< A block reached '.' or end of file without 'end'.
    MalformedDeclaration, ///< A declaration group is not well formed.
    MissingProgram,       ///< Neither a program header nor a block exists.
    TooManyErrors,        ///< Error limit reached; later errors are dropped.
};

/// @brief One syntax error with the expectation that failed.
struct SyntaxError
{
    SyntaxErrorKind kind{SyntaxErrorKind::UnexpectedToken};
    dwipa::support::SourceLoc loc;

    /// @brief Description of what the grammar allowed, e.g. "';'".
    std::string expected;

    /// @brief Lexeme of the offending token; empty at end of file.
    std::string found;

    /// @brief Render as "expected X, found 'y'" (or a fixed text for the
    ///        terminal kinds).
    [[nodiscard]] std::string message() const;
};

/// @brief Name of a syntax error kind ("UnexpectedToken", ...).
const char *syntaxErrorKindToString(SyntaxErrorKind kind);

/// @brief Diagnostic code for a syntax error kind ("P2001", ...).
const char *syntaxErrorCode(SyntaxErrorKind kind);

} // namespace dwipa::frontends::pascal
