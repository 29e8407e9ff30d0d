#include "Lexer.hpp"

#include <cctype>
#include <print>

#include "Util.hpp"

namespace Script
{

namespace
{

auto is_word_start(const char c) -> bool
{
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto is_word_part(const char c) -> bool
{
    return is_word_start(c) || std::isdigit(static_cast<unsigned char>(c)) != 0;
}

auto is_digit(const char c) -> bool { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

} // namespace

auto Lexer::lex(const std::string_view source) -> std::optional<std::vector<Token>>
{
    Lexer lexer(source);

    std::vector<Token> tokens;
    for (lexer.skip_trivia(); !lexer.at_end(); lexer.skip_trivia()) { tokens.push_back(TRY(lexer.next())); }

    return tokens;
}

Lexer::Lexer(const std::string_view source)
  : source { source }
{}

auto Lexer::next() -> std::optional<Token>
{
    const auto c = current();
    if (is_word_start(c)) { return scan_word(); }
    if (is_digit(c)) { return scan_number(); }

    const auto single = [this](const TokenKind kind) {
        const auto begin = cursor;
        const auto at    = location;
        advance();
        return make(kind, begin, at);
    };

    switch (c) {
        case '"': return scan_string();
        case ':': return scan_pair(':', TokenKind::Define);
        case '.': return scan_pair('.', TokenKind::Range);
        case '(': return single(TokenKind::OpenParen);
        case ')': return single(TokenKind::CloseParen);
        case '{': return single(TokenKind::OpenBrace);
        case '}': return single(TokenKind::CloseBrace);
        case ',': return single(TokenKind::Comma);
        default:  break;
    }

    std::println(stderr, "[ERROR] (lexer) {}: unexpected character `{}`", location, c);
    return std::nullopt;
}

auto Lexer::scan_word() -> Token
{
    const auto begin = cursor;
    const auto at    = location;
    while (is_word_part(current())) { advance(); }

    const auto word = source.substr(begin, cursor - begin);
    return make(word == "for" ? TokenKind::For : TokenKind::Identifier, begin, at);
}

auto Lexer::scan_number() -> std::optional<Token>
{
    const auto begin = cursor;
    const auto at    = location;
    while (is_digit(current())) { advance(); }

    // "0..4" is a range, "0.4" is a real number the language does not have.
    if (current() == '.' && is_digit(lookahead())) {
        std::println(stderr, "[ERROR] (lexer) {}: only natural numbers are supported", at);
        return std::nullopt;
    }
    if (is_word_start(current())) {
        std::println(stderr, "[ERROR] (lexer) {}: malformed number", at);
        return std::nullopt;
    }

    return make(TokenKind::Number, begin, at);
}

auto Lexer::scan_string() -> std::optional<Token>
{
    const auto at = location;
    advance();

    const auto begin = cursor;
    while (!at_end() && current() != '"' && current() != '\n') { advance(); }

    if (current() != '"') {
        std::println(stderr, "[ERROR] (lexer) {}: unterminated string", at);
        return std::nullopt;
    }

    const auto token = Token { TokenKind::String, source.substr(begin, cursor - begin), at };
    advance();
    return token;
}

auto Lexer::scan_pair(const char second, const TokenKind kind) -> std::optional<Token>
{
    const auto begin = cursor;
    const auto at    = location;
    if (lookahead() != second) {
        std::println(stderr, "[ERROR] (lexer) {}: expected {}", at, token_kind_name(kind));
        return std::nullopt;
    }

    advance();
    advance();
    return make(kind, begin, at);
}

void Lexer::skip_trivia()
{
    while (!at_end()) {
        if (current() == '#') {
            while (!at_end() && current() != '\n') { advance(); }
        } else if (std::isspace(static_cast<unsigned char>(current())) != 0) {
            advance();
        } else {
            return;
        }
    }
}

void Lexer::advance()
{
    if (current() == '\n') {
        ++location.line;
        location.column = 1;
    } else {
        ++location.column;
    }
    ++cursor;
}

auto Lexer::make(const TokenKind kind, const std::size_t begin, const Location at) const -> Token
{
    return Token { kind, source.substr(begin, cursor - begin), at };
}

} // namespace Script
