//===----------------------------------------------------------------------===//
//
// Part of the Dwipa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/CharUtils.hpp
// Purpose: ASCII character classification used to build the lexer's
//          character classes and to case-fold keywords.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace dwipa::frontends::common::char_utils
{

/// @brief Check if character is an ASCII letter (A-Z, a-z).
[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character is horizontal whitespace or a carriage return.
[[nodiscard]] constexpr bool isBlank(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

/// @brief Check if character is a line feed.
[[nodiscard]] constexpr bool isNewline(char c) noexcept
{
    return c == '\n';
}

/// @brief Byte length of the UTF-8 sequence introduced by @p lead.
/// @details Stray continuation bytes and bytes that never start a valid
///          sequence count as length 1.
[[nodiscard]] constexpr std::size_t utf8SequenceLength(char lead) noexcept
{
    const auto b = static_cast<unsigned char>(lead);
    if (b >= 0xC2 && b <= 0xDF)
        return 2;
    if (b >= 0xE0 && b <= 0xEF)
        return 3;
    if (b >= 0xF0 && b <= 0xF4)
        return 4;
    return 1;
}

/// @brief Check if @p c is a UTF-8 continuation byte (10xxxxxx).
[[nodiscard]] constexpr bool isUtf8Continuation(char c) noexcept
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/// @brief Convert ASCII character to lowercase.
[[nodiscard]] constexpr char toLower(char c) noexcept
{
    if (c >= 'A' && c <= 'Z')
        return static_cast<char>(c + ('a' - 'A'));
    return c;
}

/// @brief Convert string to lowercase (ASCII only).
[[nodiscard]] inline std::string toLowercase(std::string_view s)
{
    std::string result;
    result.reserve(s.size());
    for (char c : s)
    {
        result.push_back(toLower(c));
    }
    return result;
}

} // namespace dwipa::frontends::common::char_utils
