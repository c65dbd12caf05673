//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Result type for host-side operations (loading a source file) that
//          either produce a value or a single diagnostic, plus the printer
//          shared by every tool.
// Key invariants: An Expected holds exactly one of value or diagnostic.
// Ownership/Lifetime: Expected owns whichever alternative it holds.
// Links: SPEC_FULL.md#22-error-handling
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace dwipa::support
{
using Diag = Diagnostic;

/// @brief Either a @p T or the diagnostic explaining why there is none.
/// @note Covers the part of std::expected the tools need.
template <class T> class Expected
{
    static_assert(!std::is_same_v<T, Diag>, "Expected<Diag> is ambiguous");

  public:
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag>>>
    Expected(U &&value) : storage_(std::in_place_index<0>, std::forward<U>(value))
    {
    }

    Expected(Diag diag) : storage_(std::in_place_index<1>, std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return storage_.index() == 0;
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @pre hasValue()
    T &value()
    {
        return std::get<0>(storage_);
    }

    /// @pre hasValue()
    const T &value() const
    {
        return std::get<0>(storage_);
    }

    /// @pre !hasValue()
    const Diag &error() const
    {
        return std::get<1>(storage_);
    }

  private:
    std::variant<T, Diag> storage_;
};

/// @brief Success carries no payload; failure carries a diagnostic.
template <> class Expected<void>
{
  public:
    Expected() = default;

    Expected(Diag diag) : error_(std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return !error_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @pre !hasValue()
    const Diag &error() const
    {
        return *error_;
    }

  private:
    std::optional<Diag> error_;
};

/// @brief Build an error-severity diagnostic.
/// @param code Optional stable diagnostic code.
Diag makeError(SourceLoc loc, std::string msg, std::string code = {});

/// @brief Print one diagnostic followed by a newline.
/// @details The "path:line:col: " prefix appears only when @p sm resolves the
///          location's file id; line and column are dropped when zero.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);

} // namespace dwipa::support
