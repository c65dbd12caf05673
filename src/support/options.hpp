//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the settings that configure one frontend run.
// Key invariants: maxErrors == 0 means "no limit".
// Ownership/Lifetime: Caller owns option values.
// Links: SPEC_FULL.md#23-configuration
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>

namespace dwipa::support
{

/// @brief Holds settings that influence lexing, parsing, and tool output.
/// @invariant Flags are independent booleans.
/// @ownership Value type.
struct Options
{
    /// @brief Enable verbose tracing of DFA runs and parser resynchronization.
    bool trace = false;

    /// @brief Maximum number of syntax errors recorded before the parser goes
    ///        quiet; 0 disables the limit.
    std::size_t maxErrors = 50;

    /// @brief Print the token listing.
    bool dumpTokens = false;

    /// @brief Print the syntax tree.
    bool dumpAst = false;
};
} // namespace dwipa::support
