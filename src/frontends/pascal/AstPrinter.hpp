//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.hpp
/// @brief Human-readable dump of a Pascal-S syntax tree.
///
/// @details Produces an indentation-based tree dump, two spaces per level.
/// Declarations print on one line with their type spelled inline;
/// statements and expressions print one node per line with their children
/// indented below.
///
/// Example output:
/// @code
///   Program Demo
///     VarDecl a, b : integer
///     TypeDecl Numbers = array[1..10] of integer
///     Block
///       Assign a
///         Binary +
///           Name b
///           Int 1
/// @endcode
///
/// @invariant Printing never mutates the AST.
/// @invariant Output is deterministic for reproducible test results.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/pascal/AST.hpp"
#include <string>

namespace dwipa::frontends::pascal
{

/// @brief Produces a human-readable dump of a Pascal-S program.
class AstPrinter
{
  public:
    /// @brief Dump the entire program tree.
    std::string dump(const Program &program);

    /// @brief Dump a single statement subtree (used by tests).
    std::string dump(const Stmt &stmt);

    /// @brief Dump a single expression subtree (used by tests).
    std::string dump(const Expr &expr);
};

/// @brief Inline spelling of a type, e.g. "array[1..10] of integer".
std::string typeToString(const TypeNode &type);

} // namespace dwipa::frontends::pascal
