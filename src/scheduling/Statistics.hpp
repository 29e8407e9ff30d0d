#pragma once

#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <unordered_map>

#include "scheduling/Scheduler.hpp"

namespace Scheduling
{

struct [[nodiscard]] Statistics final
{
    double      average_waiting_time    = 0.0;
    double      average_turnaround_time = 0.0;
    std::size_t max_waiting_time        = 0;
    std::size_t max_turnaround_time     = 0;
    std::size_t makespan                = 0;
    std::size_t busy_time               = 0;
    std::size_t idle_time               = 0;
    double      cpu_utilization         = 0.0;
    double      throughput              = 0.0;
    std::size_t context_switches        = 0;
};

[[nodiscard]] auto compute_statistics(const SimulationOutput& output) -> Statistics;

using MetricsTable = std::unordered_map<std::string, std::string>;

// Line oriented `key = value` report, read back by the comparator.
[[nodiscard]] auto to_metrics_report(std::string_view policy_name, const Statistics& statistics) -> std::string;
[[nodiscard]] auto parse_metrics_report(std::string_view content) -> MetricsTable;

} // namespace Scheduling

template<>
struct std::formatter<Scheduling::Statistics>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Scheduling::Statistics& statistics, auto& ctx) const
    {
        return std::format_to(
          ctx.out(),
          "Statistics {{\n    average waiting time: {:.2f},\n    average turnaround time: {:.2f},\n    max waiting "
          "time: {},\n    max turnaround time: {},\n    makespan: {},\n    busy time: {},\n    idle time: {},\n    "
          "cpu utilization: {:.1f}%,\n    throughput: {:.3f},\n    context switches: {}\n}}",
          statistics.average_waiting_time,
          statistics.average_turnaround_time,
          statistics.max_waiting_time,
          statistics.max_turnaround_time,
          statistics.makespan,
          statistics.busy_time,
          statistics.idle_time,
          statistics.cpu_utilization * 100,
          statistics.throughput,
          statistics.context_switches
        );
    }
};
