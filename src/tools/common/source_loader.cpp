//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Load a source file into memory for the dwipa tool.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The returned LoadedSource owns its buffer.
// Links: src/tools/common/source_loader.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <iterator>

namespace dwipa::tools::common
{

namespace
{

dwipa::support::Diag ioError(const std::string &message)
{
    return dwipa::support::makeError({}, message);
}

} // namespace

dwipa::support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                        dwipa::support::SourceManager &sm)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return ioError("unable to open " + path);

    in.seekg(0, std::ios::end);
    const std::streamoff size = in.tellg();
    in.seekg(0, std::ios::beg);
    if (size < 0)
        return ioError("unable to determine size of " + path);
    if (static_cast<std::size_t>(size) > kMaxSourceBytes)
        return ioError("source file too large: " + path);

    LoadedSource source{};
    source.buffer.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad())
        return ioError("error while reading " + path);

    source.fileId = sm.addFile(path);
    if (source.fileId == 0)
        return ioError(std::string{dwipa::support::kSourceManagerFileIdOverflowMessage});

    return source;
}

} // namespace dwipa::tools::common
