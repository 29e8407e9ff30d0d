#include <algorithm>
#include <memory>
#include <string_view>

#include <gtest/gtest.h>

#include "lang/Interpreter.hpp"

namespace
{

auto eval(const std::string_view source) -> std::pair<bool, std::shared_ptr<Scheduling::Workload>>
{
    auto workload = std::make_shared<Scheduling::Workload>();
    const auto ok = Script::Interpreter::eval(source, workload);
    return { ok, workload };
}

} // namespace

TEST(Interpreter, ConstantsConfigureWorkload)
{
    const auto [ok, workload] = eval(R"(
        policy :: round_robin
        quantum :: 4
        starvation_factor :: 5
        max_arrival_time :: 30
        max_burst_time :: 7
        max_priority :: 9
    )");
    ASSERT_TRUE(ok);

    EXPECT_EQ(workload->policy, Scheduling::SchedulePolicy::RoundRobin);
    EXPECT_EQ(workload->quantum, 4);
    EXPECT_EQ(workload->starvation_factor, 5);
    EXPECT_EQ(workload->max_arrival_time, 30);
    EXPECT_EQ(workload->max_burst_time, 7);
    EXPECT_EQ(workload->max_priority, 9);
    EXPECT_TRUE(workload->processes.empty());
}

TEST(Interpreter, PolicyAcceptsShortNames)
{
    const auto [ok, workload] = eval("policy :: sjf");
    ASSERT_TRUE(ok);
    EXPECT_EQ(workload->policy, Scheduling::SchedulePolicy::ShortestJobFirst);

    const auto [quoted_ok, quoted] = eval(R"(policy :: "priority")");
    ASSERT_TRUE(quoted_ok);
    EXPECT_EQ(quoted->policy, Scheduling::SchedulePolicy::Priority);
}

TEST(Interpreter, SpawnProcessDefaultsPriority)
{
    const auto [ok, workload] = eval("spawn_process(3, 1, 6)\nspawn_process(8, 0, 2, 4)");
    ASSERT_TRUE(ok);
    ASSERT_EQ(workload->processes.size(), 2);

    EXPECT_EQ(workload->processes[0], (Cpu::Process { .id = 3, .arrival = 1, .burst = 6, .priority = 1 }));
    EXPECT_EQ(workload->processes[1], (Cpu::Process { .id = 8, .arrival = 0, .burst = 2, .priority = 4 }));
}

TEST(Interpreter, ForLoopRepeatsBody)
{
    const auto [ok, workload] = eval(R"(
        max_arrival_time :: 6
        max_burst_time :: 4
        max_priority :: 3
        spawn_process(10, 0, 1)
        for 2..7 {
            spawn_random_process()
        }
    )");
    ASSERT_TRUE(ok);
    ASSERT_EQ(workload->processes.size(), 6);

    for (std::size_t idx = 1; idx < workload->processes.size(); ++idx) {
        const auto& process = workload->processes[idx];
        EXPECT_EQ(process.id, 10 + idx);
        EXPECT_LE(process.arrival, 6);
        EXPECT_GE(process.burst, 1);
        EXPECT_LE(process.burst, 4);
        EXPECT_GE(process.priority, 1);
        EXPECT_LE(process.priority, 3);
    }
}

TEST(Interpreter, ZeroMaxArrivalSpawnsAtTimeZero)
{
    const auto [ok, workload] = eval("max_arrival_time :: 0\nfor 0..8 { spawn_random_process() }");
    ASSERT_TRUE(ok);
    ASSERT_EQ(workload->processes.size(), 8);
    EXPECT_TRUE(std::ranges::all_of(workload->processes, [](const auto& process) { return process.arrival == 0; }));
}

TEST(Interpreter, EmptyRangeRunsNothing)
{
    const auto [ok, workload] = eval("for 3..3 { spawn_random_process() }");
    ASSERT_TRUE(ok);
    EXPECT_TRUE(workload->processes.empty());
}

TEST(Interpreter, ScriptDrivesSimulation)
{
    const auto [ok, workload] = eval(R"(
        policy :: shortest_job_first
        spawn_process(1, 0, 5)
        spawn_process(2, 2, 3)
        spawn_process(3, 4, 8)
        spawn_process(4, 6, 2)
    )");
    ASSERT_TRUE(ok);

    const auto output = workload->simulate();
    ASSERT_TRUE(output.has_value());
    ASSERT_EQ(output->timeline.size(), 4);
    EXPECT_EQ(output->timeline[2].process_id, 4);
}

TEST(Interpreter, RejectsInvalidScripts)
{
    EXPECT_FALSE(eval("time_slice :: 2").first);
    EXPECT_FALSE(eval("policy :: lottery").first);
    EXPECT_FALSE(eval("policy :: 3").first);
    EXPECT_FALSE(eval("quantum :: 0").first);
    EXPECT_FALSE(eval("max_burst_time :: 0").first);
    EXPECT_FALSE(eval(R"(quantum :: "two")").first);
    EXPECT_FALSE(eval("fork_process(1, 0, 3)").first);
    EXPECT_FALSE(eval("spawn_process(1, 0)").first);
    EXPECT_FALSE(eval("spawn_process(1, 0, 3, 1, 9)").first);
    EXPECT_FALSE(eval(R"(spawn_process(1, "zero", 3))").first);
    EXPECT_FALSE(eval("spawn_random_process(4)").first);
    EXPECT_FALSE(eval("for 5..2 { spawn_random_process() }").first);
    EXPECT_FALSE(eval("spawn_process(1, 0, 3").first);
}

TEST(Interpreter, StopsAtFirstError)
{
    const auto [ok, workload] = eval("spawn_process(1, 0, 3)\nunknown_constant :: 1\nspawn_process(2, 0, 3)");
    EXPECT_FALSE(ok);
    EXPECT_EQ(workload->processes.size(), 1);
}

TEST(Interpreter, NestedLoopsMultiplyIterations)
{
    const auto [ok, workload] = eval("for 0..2 {\n    for 1..4 { spawn_random_process() }\n}");
    ASSERT_TRUE(ok);
    EXPECT_EQ(workload->processes.size(), 6);
}

TEST(Interpreter, RejectsCollectionSyntax)
{
    EXPECT_FALSE(eval("values :: [1, 2]").first);
    EXPECT_FALSE(eval("spawn_process((1, 0), 3)").first);
    EXPECT_FALSE(eval("spawn_process(1, 0, 3, low)").first);
}
