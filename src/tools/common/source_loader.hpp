//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Reads a Pascal-S source file for the dwipa tool and registers it
//          with the SourceManager.
// Key invariants: On success the buffer holds the complete file contents and
//                 fileId is non-zero.
// Ownership/Lifetime: The caller owns the returned LoadedSource.
// Links: SPEC_FULL.md#49-cli-tool-dwipa
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace dwipa::tools::common
{

/// @brief Largest source file the tool agrees to read.
inline constexpr std::size_t kMaxSourceBytes = 64u * 1024u * 1024u;

/// @brief A source file held in memory.
struct LoadedSource
{
    std::string buffer; ///< Full contents of the source file.
    uint32_t fileId{0}; ///< Identifier assigned by the SourceManager.
};

/// @brief Read @p path and register it with @p sm.
///
/// Failures are returned as error diagnostics: the file cannot be opened,
/// exceeds kMaxSourceBytes, cannot be read completely, or the SourceManager
/// has run out of identifiers.
///
/// @param path Filesystem path to the source file.
/// @param sm Source manager tracking file identifiers for diagnostics.
dwipa::support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                        dwipa::support::SourceManager &sm);

} // namespace dwipa::tools::common
