#include "Scheduler.hpp"

#include <algorithm>
#include <deque>
#include <numeric>
#include <tuple>

#include "Util.hpp"

namespace
{

// Ties are broken by earlier arrival, then smaller id. Input position only separates exact duplicates.
[[nodiscard]] auto tie_break_key(std::span<const Cpu::Process> processes, const std::size_t idx)
{
    return std::make_tuple(processes[idx].arrival, processes[idx].id, idx);
}

[[nodiscard]] auto arrival_order(std::span<const Cpu::Process> processes) -> std::vector<std::size_t>
{
    std::vector<std::size_t> order(processes.size());
    std::iota(order.begin(), order.end(), 0UL);
    std::ranges::sort(order, [&](const auto lhs, const auto rhs) {
        return tie_break_key(processes, lhs) < tie_break_key(processes, rhs);
    });

    return order;
}

class [[nodiscard]] SimulationState final
{
  public:
    explicit SimulationState(std::span<const Cpu::Process> processes)
      : processes { processes },
        states(processes.size(), Cpu::ProcessState::Waiting),
        remaining(processes.size(), 0),
        completion(processes.size(), 0)
    {
        std::ranges::transform(processes, remaining.begin(), [](const auto& process) { return process.burst; });
    }

    [[nodiscard]] auto clock() const -> std::size_t { return current_time; }

    [[nodiscard]] auto state(const std::size_t idx) const -> Cpu::ProcessState { return states[idx]; }

    [[nodiscard]] auto remaining_time(const std::size_t idx) const -> std::size_t { return remaining[idx]; }

    // Idle-time rule: the CPU stays idle until `time`, no interval is recorded for the gap.
    void advance_clock_to(const std::size_t time) { current_time = std::max(current_time, time); }

    void mark_ready(const std::size_t idx)
    {
        assert(states[idx] == Cpu::ProcessState::Waiting && "only waiting processes can become ready");
        states[idx] = Cpu::ProcessState::Ready;
    }

    void admit_arrivals()
    {
        for (std::size_t idx = 0; idx < processes.size(); ++idx) {
            if (states[idx] == Cpu::ProcessState::Waiting && processes[idx].arrival <= current_time) {
                mark_ready(idx);
            }
        }
    }

    [[nodiscard]] auto earliest_pending_arrival() const -> std::optional<std::size_t>
    {
        std::optional<std::size_t> earliest = std::nullopt;
        for (std::size_t idx = 0; idx < processes.size(); ++idx) {
            if (states[idx] != Cpu::ProcessState::Waiting) { continue; }
            if (!earliest || processes[idx].arrival < *earliest) { earliest = processes[idx].arrival; }
        }

        return earliest;
    }

    // Picks the ready process with the smallest `key`, ties resolved by arrival then id.
    template<typename Key>
    [[nodiscard]] auto pick_ready(Key&& key) const -> std::optional<std::size_t>
    {
        std::optional<std::size_t> selected = std::nullopt;
        for (std::size_t idx = 0; idx < processes.size(); ++idx) {
            if (states[idx] != Cpu::ProcessState::Ready) { continue; }

            const auto candidate = std::tuple_cat(std::make_tuple(key(processes[idx])), tie_break_key(processes, idx));
            if (!selected
                || candidate
                     < std::tuple_cat(std::make_tuple(key(processes[*selected])), tie_break_key(processes, *selected))) {
                selected = idx;
            }
        }

        return selected;
    }

    void run_slice(const std::size_t idx, const std::size_t length)
    {
        assert(states[idx] == Cpu::ProcessState::Ready && "only ready processes can be dispatched");
        assert(length > 0 && length <= remaining[idx] && "slice must fit the remaining burst");

        states[idx] = Cpu::ProcessState::Running;
        timeline.push_back(Cpu::ExecutionInterval {
          .process_id = processes[idx].id,
          .start      = current_time,
          .end        = current_time + length,
        });

        current_time   += length;
        remaining[idx] -= length;

        if (remaining[idx] == 0) {
            states[idx]     = Cpu::ProcessState::Completed;
            completion[idx] = current_time;
        } else {
            states[idx] = Cpu::ProcessState::Ready;
        }
    }

    [[nodiscard]] auto finish() && -> Scheduling::SimulationOutput
    {
        std::vector<Cpu::ProcessResult> results;
        results.reserve(processes.size());

        for (std::size_t idx = 0; idx < processes.size(); ++idx) {
            assert(states[idx] == Cpu::ProcessState::Completed && "simulation finished with pending work");

            const auto& process    = processes[idx];
            const auto  turnaround = completion[idx] - process.arrival;
            results.push_back(Cpu::ProcessResult {
              .id              = process.id,
              .arrival         = process.arrival,
              .burst           = process.burst,
              .priority        = process.priority,
              .waiting_time    = turnaround - process.burst,
              .turnaround_time = turnaround,
            });
        }

        return Scheduling::SimulationOutput { .timeline = std::move(timeline), .results = std::move(results) };
    }

  private:
    std::span<const Cpu::Process>       processes;
    std::vector<Cpu::ProcessState>      states;
    std::vector<std::size_t>            remaining;
    std::vector<std::size_t>            completion;
    std::vector<Cpu::ExecutionInterval> timeline;
    std::size_t                         current_time = 0;
};

// Shared loop of SJF and Priority: at every completion, run the best ready process to completion.
template<typename Key>
[[nodiscard]] auto run_non_preemptive(std::span<const Cpu::Process> processes, Key&& key) -> SimulationState
{
    SimulationState state(processes);

    std::size_t completed = 0;
    while (completed < processes.size()) {
        state.admit_arrivals();

        const auto next = state.pick_ready(key);
        if (!next) {
            const auto arrival = state.earliest_pending_arrival();
            assert(arrival.has_value() && "no ready process but nothing pending either");
            state.advance_clock_to(*arrival);
            continue;
        }

        state.run_slice(*next, state.remaining_time(*next));
        ++completed;
    }

    return state;
}

class [[nodiscard]] ReadyQueue final
{
  public:
    ReadyQueue(std::span<const Cpu::Process> processes, SimulationState& state)
      : processes { processes },
        state { state },
        order { arrival_order(processes) }
    {}

    [[nodiscard]] auto empty() const -> bool { return queue.empty(); }

    [[nodiscard]] auto has_pending_arrivals() const -> bool { return next_arrival < order.size(); }

    [[nodiscard]] auto next_arrival_time() const -> std::size_t
    {
        assert(has_pending_arrivals() && "no pending arrivals");
        return processes[order[next_arrival]].arrival;
    }

    // Phase one: everything that arrived up to the current clock joins the back, in arrival order.
    void absorb_arrivals()
    {
        while (has_pending_arrivals() && processes[order[next_arrival]].arrival <= state.clock()) {
            const auto idx = order[next_arrival++];
            state.mark_ready(idx);
            queue.push_back(idx);
        }
    }

    // Phase two: a preempted process goes behind the arrivals absorbed during its slice.
    void requeue(const std::size_t idx) { queue.push_back(idx); }

    [[nodiscard]] auto pop() -> std::size_t
    {
        const auto idx = queue.front();
        queue.pop_front();
        return idx;
    }

  private:
    std::span<const Cpu::Process> processes;
    SimulationState&              state;
    std::vector<std::size_t>      order;
    std::size_t                   next_arrival = 0;
    std::deque<std::size_t>       queue;
};

} // namespace

namespace Scheduling
{

auto schedule_policy_name(SchedulePolicy policy) -> std::string_view
{
    static_assert(
      std::to_underlying(SchedulePolicy::Count) == 4,
      "Exhaustive handling of all enum variants for SchedulePolicy is required."
    );

    switch (policy) {
        case SchedulePolicy::FirstComeFirstServed: {
            return FirstComeFirstServedPolicy::POLICY_NAME;
        }
        case SchedulePolicy::ShortestJobFirst: {
            return ShortestJobFirstPolicy::POLICY_NAME;
        }
        case SchedulePolicy::Priority: {
            return PriorityPolicy::POLICY_NAME;
        }
        case SchedulePolicy::RoundRobin: {
            return RoundRobinPolicy::POLICY_NAME;
        }
        default: {
            assert(false && "unreachable");
            return "unreachable";
        }
    }
}

auto schedule_policy_try_from_str(std::string_view str) -> std::optional<SchedulePolicy>
{
    static_assert(
      std::to_underlying(SchedulePolicy::Count) == 4,
      "Exhaustive handling of all enum variants for SchedulePolicy is required."
    );

    struct Alias
    {
        std::string_view name;
        SchedulePolicy   policy;
    };
    constexpr static Alias ALIASES[] = {
        { "first_come_first_served", SchedulePolicy::FirstComeFirstServed },
        { "fcfs", SchedulePolicy::FirstComeFirstServed },
        { "shortest_job_first", SchedulePolicy::ShortestJobFirst },
        { "sjf", SchedulePolicy::ShortestJobFirst },
        { "priority", SchedulePolicy::Priority },
        { "round_robin", SchedulePolicy::RoundRobin },
        { "rr", SchedulePolicy::RoundRobin },
    };

    for (const auto& alias : ALIASES) {
        if (Util::iequals(str, alias.name)) { return alias.policy; }
    }

    std::println(stderr, "[ERROR] (scheduler) unknown schedule policy `{}`", str);
    return std::nullopt;
}

auto FirstComeFirstServedPolicy::operator()(std::span<const Cpu::Process> processes) const -> SimulationOutput
{
    SimulationState state(processes);
    for (const auto idx : arrival_order(processes)) {
        state.advance_clock_to(processes[idx].arrival);
        state.mark_ready(idx);
        state.run_slice(idx, processes[idx].burst);
    }

    return std::move(state).finish();
}

auto ShortestJobFirstPolicy::operator()(std::span<const Cpu::Process> processes) const -> SimulationOutput
{
    return run_non_preemptive(processes, [](const Cpu::Process& process) { return process.burst; }).finish();
}

auto PriorityPolicy::operator()(std::span<const Cpu::Process> processes) const -> SimulationOutput
{
    auto output =
      run_non_preemptive(processes, [](const Cpu::Process& process) { return process.priority; }).finish();

    output.starvation_risk = std::ranges::any_of(output.results, [this](const auto& result) {
        return result.waiting_time > starvation_factor * result.burst;
    });

    return output;
}

auto RoundRobinPolicy::operator()(std::span<const Cpu::Process> processes) const -> SimulationOutput
{
    SimulationState state(processes);
    ReadyQueue      ready(processes, state);

    ready.absorb_arrivals();
    while (!ready.empty() || ready.has_pending_arrivals()) {
        if (ready.empty()) {
            state.advance_clock_to(ready.next_arrival_time());
            ready.absorb_arrivals();
            continue;
        }

        const auto idx = ready.pop();
        state.run_slice(idx, std::min(quantum, state.remaining_time(idx)));

        ready.absorb_arrivals();
        if (state.state(idx) != Cpu::ProcessState::Completed) { ready.requeue(idx); }
    }

    return std::move(state).finish();
}

auto ensure_well_formed(std::span<const Cpu::Process> processes) -> bool
{
    if (processes.empty()) {
        std::println(stderr, "[ERROR] (scheduler) cannot simulate an empty process list");
        return false;
    }

    for (const auto& process : processes) {
        if (process.burst == 0) {
            std::println(stderr, "[ERROR] (scheduler) process {} has a burst time of 0", process.id);
            return false;
        }
    }

    return true;
}

auto simulate(SchedulePolicy policy, std::span<const Cpu::Process> processes, const SimulationOptions& options)
  -> std::optional<SimulationOutput>
{
    static_assert(
      std::to_underlying(SchedulePolicy::Count) == 4,
      "Exhaustive handling of all enum variants for SchedulePolicy is required."
    );

    switch (policy) {
        case SchedulePolicy::FirstComeFirstServed: {
            return run(FirstComeFirstServedPolicy {}, processes);
        }
        case SchedulePolicy::ShortestJobFirst: {
            return run(ShortestJobFirstPolicy {}, processes);
        }
        case SchedulePolicy::Priority: {
            return run(PriorityPolicy { .starvation_factor = options.starvation_factor }, processes);
        }
        case SchedulePolicy::RoundRobin: {
            return run(RoundRobinPolicy { .quantum = options.quantum }, processes);
        }
        default: {
            std::println(stderr, "[ERROR] (scheduler) invalid schedule policy {}", std::to_underlying(policy));
            return std::nullopt;
        }
    }
}

} // namespace Scheduling
