//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Path registration for SourceManager. Paths are normalized lexically so that
// "dir/./prog.pas" and "dir/prog.pas" share one id and print identically.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include <filesystem>
#include <limits>

namespace dwipa::support
{

namespace
{

std::string normalizePath(const std::string &path)
{
    return std::filesystem::path(path).lexically_normal().generic_string();
}

constexpr std::size_t kMaxFiles = std::numeric_limits<uint32_t>::max();

} // namespace

uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(path);

    auto known = ids_.find(normalized);
    if (known != ids_.end())
        return known->second;

    if (paths_.size() >= kMaxFiles)
        return 0;

    paths_.push_back(std::move(normalized));
    const auto id = static_cast<uint32_t>(paths_.size());
    ids_.emplace(paths_.back(), id);
    return id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > paths_.size())
        return {};
    return paths_[file_id - 1];
}

} // namespace dwipa::support
