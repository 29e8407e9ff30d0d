#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string_view>
#include <utility>

namespace Script
{

enum class [[nodiscard]] TokenKind : std::uint8_t
{
    Identifier,
    Number,
    String,
    For,
    Define,     // ::
    Range,      // ..
    OpenParen,
    CloseParen,
    OpenBrace,
    CloseBrace,
    Comma,

    Count,
};

[[nodiscard]] constexpr auto token_kind_name(const TokenKind kind) -> std::string_view
{
    constexpr static std::array<std::string_view, std::to_underlying(TokenKind::Count)> NAMES = {
        "identifier", "number", "string", "`for`", "`::`", "`..`", "`(`", "`)`", "`{`", "`}`", "`,`",
    };

    return NAMES.at(std::to_underlying(kind));
}

// 1-based position of the first character of a token.
struct [[nodiscard]] Location final
{
    std::size_t line   = 1;
    std::size_t column = 1;
};

struct [[nodiscard]] Token final
{
    TokenKind        kind;
    std::string_view text; // String tokens exclude their quotes.
    Location         location;
};

} // namespace Script

template<>
struct std::formatter<Script::Location> : std::formatter<std::string_view>
{
    auto format(const Script::Location& location, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{}:{}", location.line, location.column);
    }
};

template<>
struct std::formatter<Script::Token> : std::formatter<std::string_view>
{
    auto format(const Script::Token& token, auto& ctx) const
    {
        return std::format_to(
          ctx.out(), "{} {} `{}`", token.location, Script::token_kind_name(token.kind), token.text
        );
    }
};
