#include <string_view>

#include <gtest/gtest.h>

#include "lang/Lexer.hpp"
#include "lang/Parser.hpp"

namespace
{

auto parse(const std::string_view source) -> std::optional<Script::Program>
{
    const auto tokens = Script::Lexer::lex(source);
    if (!tokens) { return std::nullopt; }

    return Script::Parser::parse(*tokens);
}

} // namespace

TEST(Parser, SettingWithNumber)
{
    const auto program = parse("quantum :: 3");
    ASSERT_TRUE(program.has_value());
    ASSERT_EQ(program->statements.size(), 1);

    const auto* setting = std::get_if<Script::Setting>(&program->statements[0].node);
    ASSERT_NE(setting, nullptr);
    EXPECT_EQ(setting->name.text, "quantum");
    EXPECT_EQ(setting->value.token.kind, Script::TokenKind::Number);
    EXPECT_EQ(setting->value.token.text, "3");
}

TEST(Parser, SettingWithName)
{
    const auto program = parse("policy :: shortest_job_first");
    ASSERT_TRUE(program.has_value());

    const auto& setting = std::get<Script::Setting>(program->statements[0].node);
    EXPECT_EQ(setting.value.token.kind, Script::TokenKind::Identifier);
    EXPECT_EQ(setting.value.token.text, "shortest_job_first");
}

TEST(Parser, CallCollectsArguments)
{
    const auto program = parse("spawn_process(4, 3, 2, 1)\nspawn_random_process()");
    ASSERT_TRUE(program.has_value());
    ASSERT_EQ(program->statements.size(), 2);

    const auto& call = std::get<Script::Call>(program->statements[0].node);
    EXPECT_EQ(call.callee.text, "spawn_process");
    ASSERT_EQ(call.arguments.size(), 4);
    EXPECT_EQ(call.arguments[0].token.text, "4");
    EXPECT_EQ(call.arguments[3].token.text, "1");

    EXPECT_TRUE(std::get<Script::Call>(program->statements[1].node).arguments.empty());
    EXPECT_EQ(program->statements[1].location().line, 2);
}

TEST(Parser, LoopHoldsBoundsAndBody)
{
    const auto program = parse("for 2..5 {\n  spawn_random_process()\n  for 0..1 { quantum :: 2 }\n}");
    ASSERT_TRUE(program.has_value());
    ASSERT_EQ(program->statements.size(), 1);

    const auto* loop = std::get_if<Script::Loop>(&program->statements[0].node);
    ASSERT_NE(loop, nullptr);
    EXPECT_EQ(loop->from.text, "2");
    EXPECT_EQ(loop->to.text, "5");
    ASSERT_EQ(loop->body.size(), 2);

    const auto& nested = std::get<Script::Loop>(loop->body[1].node);
    ASSERT_EQ(nested.body.size(), 1);
    EXPECT_TRUE(std::holds_alternative<Script::Setting>(nested.body[0].node));
}

TEST(Parser, DumpIndentsLoopBodies)
{
    const auto program = parse(R"(policy :: "rr" spawn_process(1, 0, 3) for 0..2 { spawn_random_process() })");
    ASSERT_TRUE(program.has_value());

    EXPECT_EQ(
      Script::dump(*program), "policy :: \"rr\"\nspawn_process(1, 0, 3)\nfor 0..2\n  spawn_random_process()\n"
    );
}

TEST(Parser, RejectsMalformedPrograms)
{
    EXPECT_FALSE(parse("spawn_process(1, 0, 3").has_value());
    EXPECT_FALSE(parse("spawn_process(1, 0,)").has_value());
    EXPECT_FALSE(parse("spawn_process(1 0)").has_value());
    EXPECT_FALSE(parse("for 0..3 { spawn_random_process()").has_value());
    EXPECT_FALSE(parse("for x..3 { }").has_value());
    EXPECT_FALSE(parse("for 3 { }").has_value());
    EXPECT_FALSE(parse("quantum ::").has_value());
    EXPECT_FALSE(parse("quantum").has_value());
    EXPECT_FALSE(parse("3 :: quantum").has_value());
    EXPECT_FALSE(parse(")").has_value());
}
