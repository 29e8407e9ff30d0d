#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

#include "Ast.hpp"
#include "Token.hpp"

namespace Script
{

// Recursive descent over the token stream:
//
//   program   := statement*
//   statement := setting | call | loop
//   setting   := IDENTIFIER '::' literal
//   call      := IDENTIFIER '(' [literal (',' literal)*] ')'
//   loop      := 'for' NUMBER '..' NUMBER '{' statement* '}'
//   literal   := NUMBER | STRING | IDENTIFIER
class [[nodiscard]] Parser final
{
  public:
    [[nodiscard]] static auto parse(std::span<const Token> tokens) -> std::optional<Program>;

  private:
    explicit Parser(std::span<const Token> tokens);

    [[nodiscard]] auto statement() -> std::optional<Statement>;
    [[nodiscard]] auto setting(const Token& name) -> std::optional<Setting>;
    [[nodiscard]] auto call(const Token& callee) -> std::optional<Call>;
    [[nodiscard]] auto loop(const Token& keyword) -> std::optional<Loop>;
    [[nodiscard]] auto literal() -> std::optional<Literal>;

    [[nodiscard]] auto expect(TokenKind kind, std::string_view context) -> std::optional<Token>;
    [[nodiscard]] auto check(TokenKind kind) const -> bool;
    [[nodiscard]] auto at_end() const -> bool { return position >= tokens.size(); }
    auto take() -> const Token& { return tokens[position++]; }

    std::span<const Token> tokens;
    std::size_t            position = 0;
};

} // namespace Script
