#pragma once

#include <cstddef>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <string_view>
#include <utility>

#include "Ast.hpp"
#include "scheduling/Workload.hpp"

namespace Script
{

// Runs a workload script (`.sl`) against a Scheduling::Workload. Settings configure the run, calls spawn
// processes, loops repeat their body. Evaluation stops at the first error, keeping what ran before it.
class [[nodiscard]] Interpreter final
{
  public:
    [[nodiscard]] static auto eval(std::string_view source, const std::shared_ptr<Scheduling::Workload>& workload)
      -> bool;

  private:
    explicit Interpreter(const std::shared_ptr<Scheduling::Workload>& workload);

    // Each returns the number of processes it spawned.
    [[nodiscard]] auto execute(const Statement& statement) -> std::optional<std::size_t>;
    [[nodiscard]] auto apply(const Setting& setting) -> std::optional<std::size_t>;
    [[nodiscard]] auto invoke(const Call& call) -> std::optional<std::size_t>;
    [[nodiscard]] auto repeat(const Loop& loop) -> std::optional<std::size_t>;

    [[nodiscard]] auto spawn_process(const Call& call) -> std::optional<std::size_t>;
    [[nodiscard]] auto spawn_random_process(const Call& call) -> std::optional<std::size_t>;

    [[nodiscard]] static auto number_of(const Literal& literal, std::string_view what) -> std::optional<std::size_t>;

    template<typename... Args>
    static auto report_error(std::format_string<Args...> fmt, Args&&... args) -> std::nullopt_t
    {
        std::println(stderr, "[ERROR] (interpreter) {}", std::format(fmt, std::forward<Args>(args)...));
        return std::nullopt;
    }

    template<typename... Args>
    static auto report_note(std::format_string<Args...> fmt, Args&&... args) -> std::nullopt_t
    {
        std::println(stderr, "[NOTE] (interpreter) {}", std::format(fmt, std::forward<Args>(args)...));
        return std::nullopt;
    }

    std::shared_ptr<Scheduling::Workload> workload;
};

} // namespace Script
