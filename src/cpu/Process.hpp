#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string_view>
#include <utility>

namespace Cpu
{

struct [[nodiscard]] Process final
{
    std::size_t id;
    std::size_t arrival;
    std::size_t burst;
    std::size_t priority = 1;

    [[nodiscard]] auto operator==(const Process&) const -> bool = default;
};

// One contiguous run of a process on the CPU, [start, end).
struct [[nodiscard]] ExecutionInterval final
{
    std::size_t process_id;
    std::size_t start;
    std::size_t end;

    [[nodiscard]] constexpr auto length() const -> std::size_t { return end - start; }

    [[nodiscard]] auto operator==(const ExecutionInterval&) const -> bool = default;
};

struct [[nodiscard]] ProcessResult final
{
    std::size_t id;
    std::size_t arrival;
    std::size_t burst;
    std::size_t priority;
    std::size_t waiting_time;
    std::size_t turnaround_time;

    [[nodiscard]] auto operator==(const ProcessResult&) const -> bool = default;
};

enum class ProcessState : std::uint8_t
{
    Waiting = 0,
    Ready,
    Running,
    Completed,
    Count,
};

} // namespace Cpu

template<>
struct std::formatter<Cpu::ProcessState>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Cpu::ProcessState state, auto& ctx) const
    {
        constexpr static auto visitor = [](Cpu::ProcessState value) constexpr -> std::string_view {
            static_assert(
              std::to_underlying(Cpu::ProcessState::Count) == 4,
              "[ERROR] Exhaustive handling of all enum variants for ProcessState is required"
            );

            switch (value) {
                case Cpu::ProcessState::Waiting: {
                    return "Waiting";
                }
                case Cpu::ProcessState::Ready: {
                    return "Ready";
                }
                case Cpu::ProcessState::Running: {
                    return "Running";
                }
                case Cpu::ProcessState::Completed: {
                    return "Completed";
                }
                default: {
                    assert(false && "unreachable");
                    return "unreachable";
                }
            }
        };

        return std::format_to(ctx.out(), "{}", visitor(state));
    }
};

template<>
struct std::formatter<Cpu::Process>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Cpu::Process& process, auto& ctx) const
    {
        return std::format_to(
          ctx.out(),
          "Process {{ id: {}, arrival: {}, burst: {}, priority: {} }}",
          process.id,
          process.arrival,
          process.burst,
          process.priority
        );
    }
};

template<>
struct std::formatter<Cpu::ExecutionInterval>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Cpu::ExecutionInterval& interval, auto& ctx) const
    {
        return std::format_to(ctx.out(), "P{} [{}, {})", interval.process_id, interval.start, interval.end);
    }
};

template<>
struct std::formatter<Cpu::ProcessResult>
{
    constexpr auto parse(auto& ctx)
    {
        auto       it  = ctx.begin();
        const auto end = ctx.end();

        if (it != end && *it == 's') {
            line_mode = LineMode::SingleLine;
            ++it;
        } else if (it != end && *it == 'm') {
            line_mode = LineMode::Multiline;
            ++it;
        }

        if (it != end && *it != '}') { throw std::format_error("invalid format"); }

        return it;
    }

    auto format(const Cpu::ProcessResult& result, auto& ctx) const
    {
        switch (line_mode) {
            case LineMode::Multiline: {
                return std::format_to(
                  ctx.out(),
                  "ProcessResult {{\n    id: {},\n    arrival: {},\n    burst: {},\n    priority: {},\n    "
                  "waiting time: {},\n    turnaround time: {}\n}}",
                  result.id,
                  result.arrival,
                  result.burst,
                  result.priority,
                  result.waiting_time,
                  result.turnaround_time
                );
            }
            case LineMode::SingleLine: {
                return std::format_to(
                  ctx.out(),
                  "ProcessResult {{ id: {}, arrival: {}, burst: {}, priority: {}, waiting time: {}, turnaround "
                  "time: {} }}",
                  result.id,
                  result.arrival,
                  result.burst,
                  result.priority,
                  result.waiting_time,
                  result.turnaround_time
                );
            }
        }

        assert(false && "unreachable");
        return ctx.out();
    }

  private:
    enum class LineMode : std::uint8_t
    {
        SingleLine = 0,
        Multiline,
    };

    LineMode line_mode = LineMode::SingleLine;
};
