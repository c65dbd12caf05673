//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/KeywordTable.hpp
// Purpose: Compile-time keyword tables for the lexer. One table holds every
//          spelling of every reserved word, so the English and the
//          vernacular form of a keyword are two entries with the same kind.
// Key invariants: Tables are sorted by lexeme, free of duplicates and spelled
//                 in lowercase; all three are checked with static_assert.
// Ownership/Lifetime: Entries view string literals with static storage.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "frontends/common/CharUtils.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace dwipa::frontends::common::keyword_table
{

/// @brief One spelling of a reserved word.
template <typename TokenKind> struct KeywordEntry
{
    std::string_view lexeme; ///< Lowercase spelling.
    TokenKind kind;          ///< Token produced for this spelling.
};

/// @brief True when @p table is strictly ascending by lexeme.
template <typename TokenKind, std::size_t N>
[[nodiscard]] constexpr bool isKeywordTableSorted(const std::array<KeywordEntry<TokenKind>, N> &table)
{
    for (std::size_t i = 1; i < N; ++i)
    {
        if (!(table[i - 1].lexeme < table[i].lexeme))
            return false;
    }
    return true;
}

/// @brief True when no entry of @p table contains an uppercase letter.
template <typename TokenKind, std::size_t N>
[[nodiscard]] constexpr bool isKeywordTableFolded(const std::array<KeywordEntry<TokenKind>, N> &table)
{
    for (const auto &entry : table)
    {
        for (char c : entry.lexeme)
        {
            if (char_utils::toLower(c) != c)
                return false;
        }
    }
    return true;
}

/// @brief Find the kind for an already case-folded @p lexeme.
template <typename TokenKind, std::size_t N>
[[nodiscard]] std::optional<TokenKind> lookupKeywordBinary(
    const std::array<KeywordEntry<TokenKind>, N> &table, std::string_view lexeme)
{
    auto it = std::lower_bound(table.begin(),
                               table.end(),
                               lexeme,
                               [](const KeywordEntry<TokenKind> &entry, std::string_view key)
                               { return entry.lexeme < key; });
    if (it == table.end() || it->lexeme != lexeme)
        return std::nullopt;
    return it->kind;
}

} // namespace dwipa::frontends::common::keyword_table
