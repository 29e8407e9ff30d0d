#include "Workload.hpp"

#include <algorithm>
#include <format>
#include <print>

namespace Scheduling
{

auto Workload::next_process_id() const -> std::size_t
{
    if (processes.empty()) { return 1; }

    return std::ranges::max(processes, {}, &Cpu::Process::id).id + 1;
}

auto Workload::validate() const -> std::vector<std::string>
{
    std::vector<std::string> errors;
    if (processes.empty()) { errors.emplace_back("No processes to schedule."); }

    // Arrival times are unsigned, so only burst and priority can be out of range.
    for (const auto& process : processes) {
        if (process.burst == 0) { errors.push_back(std::format("P{}: Burst time must be greater than 0.", process.id)); }
        if (process.priority < 1) { errors.push_back(std::format("P{}: Priority must be >= 1.", process.id)); }
    }

    if (policy == SchedulePolicy::RoundRobin && quantum == 0) {
        errors.emplace_back("Time quantum must be greater than 0.");
    }

    return errors;
}

auto Workload::simulate() const -> std::optional<SimulationOutput>
{
    const auto errors = validate();
    if (!errors.empty()) {
        for (const auto& error : errors) { std::println(stderr, "[ERROR] (workload) {}", error); }
        return std::nullopt;
    }

    return Scheduling::simulate(policy, processes, options());
}

} // namespace Scheduling
