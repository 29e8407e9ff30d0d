#include "Ast.hpp"

#include <format>
#include <iterator>
#include <variant>

#include "Util.hpp"

namespace Script
{

namespace
{

auto literal_text(const Literal& literal) -> std::string
{
    if (literal.token.kind == TokenKind::String) { return std::format("\"{}\"", literal.token.text); }
    return std::string(literal.token.text);
}

void dump_statement(const Statement& statement, const std::size_t depth, std::string& out)
{
    const auto indent = std::string(depth * 2, ' ');

    std::visit(
      Util::Overloaded {
        [&](const Setting& setting) {
            std::format_to(
              std::back_inserter(out), "{}{} :: {}\n", indent, setting.name.text, literal_text(setting.value)
            );
        },
        [&](const Call& call) {
            std::format_to(std::back_inserter(out), "{}{}(", indent, call.callee.text);
            for (std::size_t idx = 0; idx < call.arguments.size(); ++idx) {
                const auto* separator = idx == 0 ? "" : ", ";
                std::format_to(std::back_inserter(out), "{}{}", separator, literal_text(call.arguments[idx]));
            }
            out += ")\n";
        },
        [&](const Loop& loop) {
            std::format_to(std::back_inserter(out), "{}for {}..{}\n", indent, loop.from.text, loop.to.text);
            for (const auto& nested : loop.body) { dump_statement(nested, depth + 1, out); }
        },
      },
      statement.node
    );
}

} // namespace

auto Statement::location() const -> Location
{
    return std::visit(
      Util::Overloaded {
        [](const Setting& setting) { return setting.name.location; },
        [](const Call& call) { return call.callee.location; },
        [](const Loop& loop) { return loop.keyword.location; },
      },
      node
    );
}

auto dump(const Program& program) -> std::string
{
    std::string out;
    for (const auto& statement : program.statements) { dump_statement(statement, 0, out); }

    return out;
}

} // namespace Script
