//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Single-diagnostic formatting shared by DiagnosticEngine::printAll and the
// dwipa tool's early exits (file not found, file too large).
//
//===----------------------------------------------------------------------===//

#include "diag_expected.hpp"

#include <string_view>

namespace dwipa::support
{

namespace
{

void printLocationPrefix(const SourceLoc &loc, std::ostream &os, const SourceManager &sm)
{
    std::string_view path = sm.getPath(loc.file_id);
    if (path.empty())
        return;

    os << path;
    if (loc.hasLine())
    {
        os << ':' << loc.line;
        if (loc.hasColumn())
            os << ':' << loc.column;
    }
    os << ": ";
}

} // namespace

Diag makeError(SourceLoc loc, std::string msg, std::string code)
{
    return Diag{Severity::Error, std::move(msg), loc, std::move(code)};
}

void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.hasFile())
        printLocationPrefix(diag.loc, os, *sm);

    os << severityName(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';
}

} // namespace dwipa::support
