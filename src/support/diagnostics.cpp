//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/**
 * @file diagnostics.cpp
 * @brief Diagnostic engine storage and severity bookkeeping.
 * @details
 *     The lexer reports L1xxx codes and the parser P2xxx codes into the same
 *     engine, so a single printAll() call yields the whole run in the order
 *     problems were found.
 */

#include "diagnostics.hpp"
#include "diag_expected.hpp"
#include "source_manager.hpp"

namespace dwipa::support
{

const char *severityName(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "unknown";
}

void DiagnosticEngine::report(Diagnostic d)
{
    ++counts_[static_cast<std::size_t>(d.severity)];
    records_.push_back(std::move(d));
}

void DiagnosticEngine::error(SourceLoc loc, std::string message, std::string code)
{
    report(Diagnostic{Severity::Error, std::move(message), loc, std::move(code)});
}

void DiagnosticEngine::note(SourceLoc loc, std::string message, std::string code)
{
    report(Diagnostic{Severity::Note, std::move(message), loc, std::move(code)});
}

/**
 * @brief Writes every stored diagnostic through printDiag.
 *
 * @param os Output stream that receives the formatted diagnostics.
 * @param sm Optional source manager used to translate file identifiers.
 */
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : records_)
        printDiag(d, os, sm);
}

} // namespace dwipa::support
