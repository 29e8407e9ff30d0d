#pragma once

#include <string>
#include <variant>
#include <vector>

#include "Token.hpp"

namespace Script
{

// A number, a string or a bare name.
struct [[nodiscard]] Literal final
{
    Token token;
};

// name :: value
struct [[nodiscard]] Setting final
{
    Token   name;
    Literal value;
};

// callee(arguments...)
struct [[nodiscard]] Call final
{
    Token                callee;
    std::vector<Literal> arguments;
};

struct Statement;

// for from..to { body }, runs the body `to - from` times.
struct [[nodiscard]] Loop final
{
    Token                  keyword;
    Token                  from;
    Token                  to;
    std::vector<Statement> body;
};

struct [[nodiscard]] Statement final
{
    std::variant<Setting, Call, Loop> node;

    [[nodiscard]] auto location() const -> Location;
};

struct [[nodiscard]] Program final
{
    std::vector<Statement> statements;
};

// One statement per line, loop bodies indented.
[[nodiscard]] auto dump(const Program& program) -> std::string;

} // namespace Script
