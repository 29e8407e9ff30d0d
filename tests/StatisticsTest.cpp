#include <gtest/gtest.h>

#include "scheduling/Statistics.hpp"

namespace
{

const std::vector<Cpu::Process> STAGGERED = {
    { .id = 1, .arrival = 0, .burst = 5 },
    { .id = 2, .arrival = 2, .burst = 3 },
    { .id = 3, .arrival = 4, .burst = 8 },
    { .id = 4, .arrival = 6, .burst = 2 },
};

} // namespace

TEST(Statistics, FirstComeFirstServedMetrics)
{
    const auto output = Scheduling::simulate(Scheduling::SchedulePolicy::FirstComeFirstServed, STAGGERED);
    ASSERT_TRUE(output.has_value());

    const auto statistics = Scheduling::compute_statistics(*output);
    EXPECT_DOUBLE_EQ(statistics.average_waiting_time, 4.25);
    EXPECT_DOUBLE_EQ(statistics.average_turnaround_time, 8.75);
    EXPECT_EQ(statistics.max_waiting_time, 10);
    EXPECT_EQ(statistics.max_turnaround_time, 12);
    EXPECT_EQ(statistics.makespan, 18);
    EXPECT_EQ(statistics.busy_time, 18);
    EXPECT_EQ(statistics.idle_time, 0);
    EXPECT_DOUBLE_EQ(statistics.cpu_utilization, 1.0);
    EXPECT_DOUBLE_EQ(statistics.throughput, 4.0 / 18.0);
    EXPECT_EQ(statistics.context_switches, 3);
}

TEST(Statistics, IdleTimeLowersUtilization)
{
    const std::vector<Cpu::Process> processes = {
        { .id = 1, .arrival = 0, .burst = 2 },
        { .id = 2, .arrival = 5, .burst = 3 },
    };
    const auto output = Scheduling::simulate(Scheduling::SchedulePolicy::FirstComeFirstServed, processes);
    ASSERT_TRUE(output.has_value());

    const auto statistics = Scheduling::compute_statistics(*output);
    EXPECT_EQ(statistics.makespan, 8);
    EXPECT_EQ(statistics.busy_time, 5);
    EXPECT_EQ(statistics.idle_time, 3);
    EXPECT_DOUBLE_EQ(statistics.cpu_utilization, 0.625);
    EXPECT_DOUBLE_EQ(statistics.throughput, 0.25);
    EXPECT_EQ(statistics.context_switches, 1);
}

TEST(Statistics, ConsecutiveSlicesOfOneProcessAreNotSwitches)
{
    const auto output = Scheduling::simulate(
      Scheduling::SchedulePolicy::RoundRobin, std::vector<Cpu::Process> { { .id = 1, .arrival = 0, .burst = 6 } }
    );
    ASSERT_TRUE(output.has_value());
    ASSERT_EQ(output->timeline.size(), 3);

    EXPECT_EQ(Scheduling::compute_statistics(*output).context_switches, 0);
}

TEST(Statistics, EmptyOutputIsAllZeros)
{
    const auto statistics = Scheduling::compute_statistics(Scheduling::SimulationOutput {});
    EXPECT_DOUBLE_EQ(statistics.average_waiting_time, 0.0);
    EXPECT_EQ(statistics.makespan, 0);
    EXPECT_DOUBLE_EQ(statistics.cpu_utilization, 0.0);
    EXPECT_DOUBLE_EQ(statistics.throughput, 0.0);
}

TEST(MetricsReport, WritesKeyValueLines)
{
    const auto output = Scheduling::simulate(Scheduling::SchedulePolicy::FirstComeFirstServed, STAGGERED);
    ASSERT_TRUE(output.has_value());

    const auto report = Scheduling::to_metrics_report("First Come First Served", Scheduling::compute_statistics(*output));
    EXPECT_TRUE(report.starts_with("schedule_policy = First Come First Served\nseparator\n"));
    EXPECT_NE(report.find("avg_waiting_time = 4.25\n"), std::string::npos);
    EXPECT_NE(report.find("cpu_utilization = 100.00\n"), std::string::npos);
    EXPECT_NE(report.find("throughput = 0.22\n"), std::string::npos);
    EXPECT_NE(report.find("context_switches = 3\n"), std::string::npos);
    EXPECT_NE(report.find("busy_time = 18\n"), std::string::npos);
}

TEST(MetricsReport, ParsesIntoDisplayKeys)
{
    const auto output = Scheduling::simulate(Scheduling::SchedulePolicy::ShortestJobFirst, STAGGERED);
    ASSERT_TRUE(output.has_value());

    const auto report = Scheduling::to_metrics_report("Shortest Job First", Scheduling::compute_statistics(*output));
    const auto table  = Scheduling::parse_metrics_report(report);

    EXPECT_EQ(table.size(), 11);
    EXPECT_EQ(table.at("Schedule Policy"), "Shortest Job First");
    EXPECT_EQ(table.at("Avg Waiting Time"), "2.75");
    EXPECT_EQ(table.at("Max Turnaround Time"), "14");
    EXPECT_EQ(table.at("Cpu Utilization"), "100.00");
    EXPECT_EQ(table.at("Busy Time"), "18");
    EXPECT_FALSE(table.contains("Separator"));
}

TEST(MetricsReport, ParserToleratesBlankLinesAndPadding)
{
    const auto table = Scheduling::parse_metrics_report("\n  makespan =   12  \n\nidle_time=0\r\nflag\n");
    EXPECT_EQ(table.at("Makespan"), "12");
    EXPECT_EQ(table.at("Idle Time"), "0");
    EXPECT_EQ(table.at("Flag"), "");
}
