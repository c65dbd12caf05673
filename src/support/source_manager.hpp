//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Maps the file ids carried by tokens and diagnostics back to the
//          paths they were loaded from.
// Key invariants: Ids are dense and start at 1; a normalized path is stored
//                 once; 0 is never handed out except to signal overflow.
// Ownership/Lifetime: Owns path strings; views returned by getPath() live as
//                     long as the manager.
// Links: SPEC_FULL.md#3-data-model
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dwipa::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// Registry of source paths for one tool invocation. The frontend never reads
/// files through it; it only needs ids to stamp on locations.
class SourceManager
{
  public:
    /// @brief Register @p path, returning its id.
    /// @return Existing id when the normalized path is already known, a fresh
    ///         id otherwise, or 0 once the id space is exhausted. Callers turn
    ///         0 into a diagnostic with kSourceManagerFileIdOverflowMessage.
    uint32_t addFile(std::string path);

    /// @brief Normalized path for @p file_id, or empty when unknown.
    [[nodiscard]] std::string_view getPath(uint32_t file_id) const;

    [[nodiscard]] std::size_t fileCount() const
    {
        return paths_.size();
    }

  private:
    // Element i holds the path of id i + 1; a deque keeps the keys of ids_
    // valid as paths are appended.
    std::deque<std::string> paths_;
    std::unordered_map<std::string_view, uint32_t> ids_;
};

} // namespace dwipa::support
