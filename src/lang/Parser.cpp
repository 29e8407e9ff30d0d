#include "Parser.hpp"

#include <format>
#include <print>

#include "Util.hpp"

namespace Script
{

namespace
{

// Logs at `token` or, past the last token, at the end of input.
auto report(const Token* token, const std::string_view message) -> std::nullopt_t
{
    if (token == nullptr) {
        std::println(stderr, "[ERROR] (parser) end of input: {}", message);
    } else {
        std::println(stderr, "[ERROR] (parser) {}: {}, found {} `{}`", token->location, message,
                     token_kind_name(token->kind), token->text);
    }
    return std::nullopt;
}

} // namespace

auto Parser::parse(const std::span<const Token> tokens) -> std::optional<Program>
{
    Parser parser(tokens);

    Program program;
    while (!parser.at_end()) { program.statements.push_back(TRY(parser.statement())); }

    return program;
}

Parser::Parser(const std::span<const Token> tokens)
  : tokens { tokens }
{}

auto Parser::statement() -> std::optional<Statement>
{
    if (check(TokenKind::For)) { return Statement { TRY(loop(take())) }; }

    if (!check(TokenKind::Identifier)) {
        return report(at_end() ? nullptr : &tokens[position], "expected a setting, a call or a loop");
    }

    const auto& name = take();
    if (check(TokenKind::Define)) { return Statement { TRY(setting(name)) }; }
    if (check(TokenKind::OpenParen)) { return Statement { TRY(call(name)) }; }

    return report(at_end() ? nullptr : &tokens[position], "expected `::` or `(` after a name");
}

auto Parser::setting(const Token& name) -> std::optional<Setting>
{
    (void)take();
    return Setting { .name = name, .value = TRY(literal()) };
}

auto Parser::call(const Token& callee) -> std::optional<Call>
{
    (void)take();

    Call result { .callee = callee, .arguments = {} };
    if (!check(TokenKind::CloseParen)) {
        result.arguments.push_back(TRY(literal()));
        while (check(TokenKind::Comma)) {
            (void)take();
            result.arguments.push_back(TRY(literal()));
        }
    }

    (void)TRY(expect(TokenKind::CloseParen, "to close the argument list"));
    return result;
}

auto Parser::loop(const Token& keyword) -> std::optional<Loop>
{
    Loop result {
        .keyword = keyword,
        .from    = TRY(expect(TokenKind::Number, "as the start of the loop range")),
        .to      = {},
        .body    = {},
    };
    (void)TRY(expect(TokenKind::Range, "between the loop bounds"));
    result.to = TRY(expect(TokenKind::Number, "as the end of the loop range"));
    (void)TRY(expect(TokenKind::OpenBrace, "to open the loop body"));

    while (!check(TokenKind::CloseBrace)) {
        if (at_end()) { return report(nullptr, std::format("loop at {} is never closed", keyword.location)); }
        result.body.push_back(TRY(statement()));
    }
    (void)take();

    return result;
}

auto Parser::literal() -> std::optional<Literal>
{
    if (check(TokenKind::Number) || check(TokenKind::String) || check(TokenKind::Identifier)) {
        return Literal { take() };
    }

    return report(at_end() ? nullptr : &tokens[position], "expected a number, a string or a name");
}

auto Parser::expect(const TokenKind kind, const std::string_view context) -> std::optional<Token>
{
    if (check(kind)) { return take(); }

    return report(at_end() ? nullptr : &tokens[position],
                  std::format("expected {} {}", token_kind_name(kind), context));
}

auto Parser::check(const TokenKind kind) const -> bool { return !at_end() && tokens[position].kind == kind; }

} // namespace Script
