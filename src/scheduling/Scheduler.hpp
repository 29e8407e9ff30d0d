#pragma once

#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <print>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "cpu/Process.hpp"

namespace Scheduling
{

// Waiting longer than this many times the own burst time flags a Priority run as starving.
// Heuristic only, no scheduling guarantee is derived from it.
constexpr static std::size_t DEFAULT_STARVATION_FACTOR = 3;
constexpr static std::size_t DEFAULT_QUANTUM           = 2;

enum class SchedulePolicy : std::uint8_t
{
    FirstComeFirstServed = 0,
    ShortestJobFirst,
    Priority,
    RoundRobin,
    Count,
};

[[nodiscard]] auto schedule_policy_name(SchedulePolicy policy) -> std::string_view;
[[nodiscard]] auto schedule_policy_try_from_str(std::string_view str) -> std::optional<SchedulePolicy>;

struct [[nodiscard]] SimulationOutput final
{
    std::vector<Cpu::ExecutionInterval> timeline;
    std::vector<Cpu::ProcessResult>     results;

    // Engaged only by the Priority policy.
    std::optional<bool> starvation_risk = std::nullopt;

    [[nodiscard]] auto operator==(const SimulationOutput&) const -> bool = default;
};

struct [[nodiscard]] FirstComeFirstServedPolicy final
{
    constexpr static auto POLICY_NAME = "First Come First Served";
    constexpr static auto KIND        = SchedulePolicy::FirstComeFirstServed;

    [[nodiscard]] auto ensure_well_formed() const -> bool { return true; }
    [[nodiscard]] auto operator()(std::span<const Cpu::Process> processes) const -> SimulationOutput;
};

struct [[nodiscard]] ShortestJobFirstPolicy final
{
    constexpr static auto POLICY_NAME = "Shortest Job First";
    constexpr static auto KIND        = SchedulePolicy::ShortestJobFirst;

    [[nodiscard]] auto ensure_well_formed() const -> bool { return true; }
    [[nodiscard]] auto operator()(std::span<const Cpu::Process> processes) const -> SimulationOutput;
};

struct [[nodiscard]] PriorityPolicy final
{
    constexpr static auto POLICY_NAME = "Priority";
    constexpr static auto KIND        = SchedulePolicy::Priority;

    [[nodiscard]] auto ensure_well_formed() const -> bool { return true; }
    [[nodiscard]] auto operator()(std::span<const Cpu::Process> processes) const -> SimulationOutput;

    std::size_t starvation_factor = DEFAULT_STARVATION_FACTOR;
};

struct [[nodiscard]] RoundRobinPolicy final
{
    constexpr static auto POLICY_NAME = "Round Robin";
    constexpr static auto KIND        = SchedulePolicy::RoundRobin;

    [[nodiscard]] auto ensure_well_formed() const -> bool
    {
        if (quantum == 0) {
            std::println(stderr, "[ERROR] (scheduler) round robin quantum must be greater than 0");
            return false;
        }

        return true;
    }

    [[nodiscard]] auto operator()(std::span<const Cpu::Process> processes) const -> SimulationOutput;

    std::size_t quantum = DEFAULT_QUANTUM;
};

template<typename Policy>
concept SchedulingPolicy = requires(const Policy& policy, std::span<const Cpu::Process> processes) {
    { policy(processes) } -> std::same_as<SimulationOutput>;
    { policy.ensure_well_formed() } -> std::same_as<bool>;
    { Policy::POLICY_NAME } -> std::convertible_to<std::string_view>;
};

[[nodiscard]] auto ensure_well_formed(std::span<const Cpu::Process> processes) -> bool;

// Rejects malformed input instead of producing a meaningless timeline. The policies' call operators
// assume input that already passed these checks.
template<SchedulingPolicy Policy>
[[nodiscard]] auto run(const Policy& policy, std::span<const Cpu::Process> processes)
  -> std::optional<SimulationOutput>
{
    if (!ensure_well_formed(processes) || !policy.ensure_well_formed()) { return std::nullopt; }

    return policy(processes);
}

struct [[nodiscard]] SimulationOptions final
{
    std::size_t quantum           = DEFAULT_QUANTUM;
    std::size_t starvation_factor = DEFAULT_STARVATION_FACTOR;
};

[[nodiscard]] auto simulate(
  SchedulePolicy                policy,
  std::span<const Cpu::Process> processes,
  const SimulationOptions&      options = {}
) -> std::optional<SimulationOutput>;

} // namespace Scheduling

template<>
struct std::formatter<Scheduling::SchedulePolicy>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Scheduling::SchedulePolicy policy, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{}", Scheduling::schedule_policy_name(policy));
    }
};
