#include "Statistics.hpp"

#include <algorithm>
#include <array>
#include <ranges>
#include <sstream>

#include "Util.hpp"

[[nodiscard]] static auto split_key_value(const std::string_view line) -> std::pair<std::string_view, std::string_view>
{
    const auto separator = line.find('=');
    if (separator == std::string_view::npos) { return { Util::trim(line), std::string_view {} }; }

    return { Util::trim(line.substr(0, separator)), Util::trim(line.substr(separator + 1)) };
}

namespace Scheduling
{

auto compute_statistics(const SimulationOutput& output) -> Statistics
{
    Statistics statistics;
    if (output.results.empty()) { return statistics; }

    std::size_t total_waiting_time    = 0;
    std::size_t total_turnaround_time = 0;
    for (const auto& result : output.results) {
        total_waiting_time             += result.waiting_time;
        total_turnaround_time          += result.turnaround_time;
        statistics.max_waiting_time    = std::max(statistics.max_waiting_time, result.waiting_time);
        statistics.max_turnaround_time = std::max(statistics.max_turnaround_time, result.turnaround_time);
    }

    const auto process_count           = static_cast<double>(output.results.size());
    statistics.average_waiting_time    = static_cast<double>(total_waiting_time) / process_count;
    statistics.average_turnaround_time = static_cast<double>(total_turnaround_time) / process_count;

    if (output.timeline.empty()) { return statistics; }

    statistics.makespan = output.timeline.back().end;
    for (const auto& interval : output.timeline) { statistics.busy_time += interval.length(); }
    statistics.idle_time = statistics.makespan - statistics.busy_time;

    for (std::size_t idx = 1; idx < output.timeline.size(); ++idx) {
        if (output.timeline[idx].process_id != output.timeline[idx - 1].process_id) { ++statistics.context_switches; }
    }

    const auto makespan        = static_cast<double>(statistics.makespan);
    statistics.cpu_utilization = static_cast<double>(statistics.busy_time) / makespan;
    statistics.throughput      = process_count / makespan;

    return statistics;
}

auto to_metrics_report(std::string_view policy_name, const Statistics& statistics) -> std::string
{
    std::stringstream ss;
    ss << std::format("schedule_policy = {}\n", policy_name);

    ss << "separator\n";

    ss << std::format("avg_waiting_time = {:.2f}\n", statistics.average_waiting_time);
    ss << std::format("max_waiting_time = {}\n", statistics.max_waiting_time);
    ss << std::format("avg_turnaround_time = {:.2f}\n", statistics.average_turnaround_time);
    ss << std::format("max_turnaround_time = {}\n", statistics.max_turnaround_time);
    ss << std::format("makespan = {}\n", statistics.makespan);
    ss << std::format("busy_time = {}\n", statistics.busy_time);
    ss << std::format("idle_time = {}\n", statistics.idle_time);
    ss << std::format("cpu_utilization = {:.2f}\n", statistics.cpu_utilization * 100);
    ss << std::format("throughput = {:.2f}\n", statistics.throughput);
    ss << std::format("context_switches = {}\n", statistics.context_switches);

    return ss.str();
}

auto parse_metrics_report(std::string_view content) -> MetricsTable
{
    MetricsTable result = {};

    for (const auto& line_range : content | std::views::split('\n')) {
        const auto line = Util::trim(std::string_view { line_range.begin(), line_range.end() });
        if (line.empty() || line == "separator") { continue; }

        const auto [key, value] = split_key_value(line);
        if (key.empty()) { continue; }
        result.insert_or_assign(Util::snake_case_to_title(key), std::string(value));
    }

    return result;
}

} // namespace Scheduling
