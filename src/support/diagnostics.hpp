//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Diagnostic records and the engine that collects them for one
//          frontend run.
// Key invariants: count(s) equals the number of stored records with severity
//                 s; records keep report order.
// Ownership/Lifetime: Engine owns its records; callers own the engine.
// Links: SPEC_FULL.md#21-diagnostics-and-logging
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <array>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace dwipa::support
{

class SourceManager;

/// @brief Severity levels for diagnostics, least severe first.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Lowercase spelling used when printing ("note", "warning", "error").
const char *severityName(Severity severity);

/// @brief One reported problem.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional source location
    std::string code;    ///< Stable code such as "L1002"; may be empty
};

/// @brief Collects diagnostics in report order and counts them per severity.
///
/// The lexer and parser only ever append; nothing is printed until a tool
/// asks for it through printAll().
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Record an error-severity diagnostic.
    void error(SourceLoc loc, std::string message, std::string code = {});

    /// @brief Record a note-severity diagnostic.
    void note(SourceLoc loc, std::string message, std::string code = {});

    /// @brief Print every record as "path:line:col: severity[code]: message".
    /// @param sm Resolves file ids to paths; without it the location prefix is omitted.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    /// @brief Number of records with severity @p severity.
    [[nodiscard]] std::size_t count(Severity severity) const
    {
        return counts_[static_cast<std::size_t>(severity)];
    }

    [[nodiscard]] std::size_t errorCount() const
    {
        return count(Severity::Error);
    }

    [[nodiscard]] std::size_t warningCount() const
    {
        return count(Severity::Warning);
    }

    [[nodiscard]] bool hasErrors() const
    {
        return errorCount() != 0;
    }

    /// @brief All records in report order.
    [[nodiscard]] const std::vector<Diagnostic> &diagnostics() const
    {
        return records_;
    }

  private:
    std::vector<Diagnostic> records_;
    std::array<std::size_t, 3> counts_{};
};

} // namespace dwipa::support
