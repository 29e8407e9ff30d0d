#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "cpu/Process.hpp"
#include "scheduling/Scheduler.hpp"

namespace Scheduling
{

// Everything a caller needs for one simulation: the input set, the selected policy and its knobs, and the
// bounds used to generate random processes.
struct [[nodiscard]] Workload final
{
    std::vector<Cpu::Process> processes;

    SchedulePolicy policy            = SchedulePolicy::FirstComeFirstServed;
    std::size_t    quantum           = DEFAULT_QUANTUM;
    std::size_t    starvation_factor = DEFAULT_STARVATION_FACTOR;

    std::size_t max_arrival_time = 20;
    std::size_t max_burst_time   = 10;
    std::size_t max_priority     = 5;

    void add_process(const Cpu::Process& process) { processes.push_back(process); }

    [[nodiscard]] auto next_process_id() const -> std::size_t;

    [[nodiscard]] auto validate() const -> std::vector<std::string>;

    [[nodiscard]] auto options() const -> SimulationOptions
    {
        return SimulationOptions { .quantum = quantum, .starvation_factor = starvation_factor };
    }

    [[nodiscard]] auto simulate() const -> std::optional<SimulationOutput>;
};

} // namespace Scheduling
