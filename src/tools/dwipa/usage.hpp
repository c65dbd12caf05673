//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/dwipa/usage.hpp
// Purpose: Declarations for dwipa help and usage text.
// Key invariants: None.
// Ownership/Lifetime: N/A.
// Links: SPEC_FULL.md#49-cli-tool-dwipa
//
//===----------------------------------------------------------------------===//

#pragma once

namespace dwipa::tools
{

/// @brief Print usage information for the dwipa command-line tool.
void printUsage();

/// @brief Print version information for dwipa.
void printVersion();

} // namespace dwipa::tools
