#include <gtest/gtest.h>

#include "scheduling/Workload.hpp"

TEST(Workload, NextProcessIdFollowsLargestId)
{
    Scheduling::Workload workload;
    EXPECT_EQ(workload.next_process_id(), 1);

    workload.add_process({ .id = 4, .arrival = 0, .burst = 1 });
    workload.add_process({ .id = 2, .arrival = 0, .burst = 1 });
    EXPECT_EQ(workload.next_process_id(), 5);
}

TEST(Workload, ValidateReportsEveryProblem)
{
    Scheduling::Workload workload;
    workload.policy = Scheduling::SchedulePolicy::RoundRobin;
    workload.quantum = 0;

    auto errors = workload.validate();
    ASSERT_EQ(errors.size(), 2);
    EXPECT_EQ(errors[0], "No processes to schedule.");
    EXPECT_EQ(errors[1], "Time quantum must be greater than 0.");

    workload.add_process({ .id = 1, .arrival = 0, .burst = 0, .priority = 0 });
    workload.quantum = 2;
    errors           = workload.validate();
    ASSERT_EQ(errors.size(), 2);
    EXPECT_EQ(errors[0], "P1: Burst time must be greater than 0.");
    EXPECT_EQ(errors[1], "P1: Priority must be >= 1.");
}

TEST(Workload, QuantumOnlyMattersForRoundRobin)
{
    Scheduling::Workload workload;
    workload.quantum = 0;
    workload.add_process({ .id = 1, .arrival = 0, .burst = 3 });

    EXPECT_TRUE(workload.validate().empty());
    EXPECT_TRUE(workload.simulate().has_value());

    workload.policy = Scheduling::SchedulePolicy::RoundRobin;
    EXPECT_FALSE(workload.simulate().has_value());
}

TEST(Workload, SimulateUsesConfiguredPolicy)
{
    Scheduling::Workload workload;
    workload.add_process({ .id = 1, .arrival = 0, .burst = 5 });
    workload.add_process({ .id = 2, .arrival = 1, .burst = 2 });

    workload.policy  = Scheduling::SchedulePolicy::RoundRobin;
    workload.quantum = 3;
    const auto output = workload.simulate();
    ASSERT_TRUE(output.has_value());

    const std::vector<Cpu::ExecutionInterval> expected = {
        { .process_id = 1, .start = 0, .end = 3 },
        { .process_id = 2, .start = 3, .end = 5 },
        { .process_id = 1, .start = 5, .end = 7 },
    };
    EXPECT_EQ(output->timeline, expected);
    EXPECT_EQ(output, Scheduling::simulate(workload.policy, workload.processes, workload.options()));
}

TEST(Workload, StarvationFactorIsForwarded)
{
    Scheduling::Workload workload;
    workload.policy = Scheduling::SchedulePolicy::Priority;
    workload.add_process({ .id = 1, .arrival = 0, .burst = 8, .priority = 1 });
    workload.add_process({ .id = 2, .arrival = 0, .burst = 2, .priority = 2 });

    // P2 waits 8 against a burst of 2.
    ASSERT_TRUE(workload.simulate().has_value());
    EXPECT_TRUE(workload.simulate()->starvation_risk.value());

    workload.starvation_factor = 4;
    EXPECT_FALSE(workload.simulate()->starvation_risk.value());
}
