#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "Token.hpp"

namespace Script
{

// Splits a workload script into tokens. `#` comments and whitespace are dropped.
class [[nodiscard]] Lexer final
{
  public:
    [[nodiscard]] static auto lex(std::string_view source) -> std::optional<std::vector<Token>>;

  private:
    explicit Lexer(std::string_view source);

    [[nodiscard]] auto next() -> std::optional<Token>;
    [[nodiscard]] auto scan_word() -> Token;
    [[nodiscard]] auto scan_number() -> std::optional<Token>;
    [[nodiscard]] auto scan_string() -> std::optional<Token>;
    [[nodiscard]] auto scan_pair(char second, TokenKind kind) -> std::optional<Token>;

    void skip_trivia();
    void advance();

    [[nodiscard]] auto at_end() const -> bool { return cursor >= source.size(); }
    [[nodiscard]] auto current() const -> char { return at_end() ? '\0' : source[cursor]; }
    [[nodiscard]] auto lookahead() const -> char { return cursor + 1 < source.size() ? source[cursor + 1] : '\0'; }
    [[nodiscard]] auto make(TokenKind kind, std::size_t begin, Location at) const -> Token;

    std::string_view source;
    std::size_t      cursor = 0;
    Location         location;
};

} // namespace Script
