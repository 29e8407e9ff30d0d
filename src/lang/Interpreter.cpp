#include "Interpreter.hpp"

#include <algorithm>
#include <string>
#include <variant>

#include "Lexer.hpp"
#include "Parser.hpp"
#include "Util.hpp"

namespace Script
{

namespace
{

constexpr std::string_view SPAWN_PROCESS        = "spawn_process";
constexpr std::string_view SPAWN_RANDOM_PROCESS = "spawn_random_process";

struct NumericSetting
{
    std::string_view                    name;
    std::size_t Scheduling::Workload::* field;
    bool                                may_be_zero;
};

constexpr NumericSetting NUMERIC_SETTINGS[] = {
    { "quantum", &Scheduling::Workload::quantum, false },
    { "starvation_factor", &Scheduling::Workload::starvation_factor, false },
    { "max_arrival_time", &Scheduling::Workload::max_arrival_time, true },
    { "max_burst_time", &Scheduling::Workload::max_burst_time, false },
    { "max_priority", &Scheduling::Workload::max_priority, false },
};

} // namespace

auto Interpreter::eval(const std::string_view source, const std::shared_ptr<Scheduling::Workload>& workload) -> bool
{
    const auto tokens = Lexer::lex(source);
    if (!tokens) { return false; }

#ifdef CPU_SCHED_TRACE_SCRIPT
    for (const auto& token : *tokens) { std::println("{}", token); }
#endif

    const auto program = Parser::parse(*tokens);
    if (!program) { return false; }

#ifdef CPU_SCHED_TRACE_SCRIPT
    std::print("{}", dump(*program));
#endif

    Interpreter interpreter(workload);
    return std::ranges::all_of(program->statements, [&](const Statement& statement) {
        return interpreter.execute(statement).has_value();
    });
}

Interpreter::Interpreter(const std::shared_ptr<Scheduling::Workload>& workload)
  : workload { workload }
{}

auto Interpreter::execute(const Statement& statement) -> std::optional<std::size_t>
{
    return std::visit(
      Util::Overloaded {
        [this](const Setting& setting) { return apply(setting); },
        [this](const Call& call) { return invoke(call); },
        [this](const Loop& loop) { return repeat(loop); },
      },
      statement.node
    );
}

auto Interpreter::apply(const Setting& setting) -> std::optional<std::size_t>
{
    const auto name = setting.name.text;
    const auto& value = setting.value.token;

    if (name == "policy") {
        if (value.kind == TokenKind::Number) {
            return report_error("{}: setting `policy` expects a policy name, found `{}`", value.location, value.text);
        }

        const auto policy = Scheduling::schedule_policy_try_from_str(value.text);
        if (!policy) {
            (void)report_error("{}: unknown schedule policy `{}`", value.location, value.text);
            return report_note(
              "available policies are: first_come_first_served, shortest_job_first, priority, round_robin"
            );
        }

        workload->policy = *policy;
        return 0;
    }

    const auto* numeric = std::ranges::find(NUMERIC_SETTINGS, name, &NumericSetting::name);
    if (numeric == std::ranges::end(NUMERIC_SETTINGS)) {
        (void)report_error("{}: unknown setting `{}`", setting.name.location, name);
        std::string available = "policy";
        for (const auto& known : NUMERIC_SETTINGS) { available += std::format(", {}", known.name); }
        return report_note("available settings are: {}", available);
    }

    const auto number = TRY(number_of(setting.value, std::format("setting `{}`", name)));
    if (number == 0 && !numeric->may_be_zero) {
        return report_error("{}: setting `{}` must be greater than 0", value.location, name);
    }

    (*workload).*(numeric->field) = number;
    return 0;
}

auto Interpreter::invoke(const Call& call) -> std::optional<std::size_t>
{
    if (call.callee.text == SPAWN_PROCESS) { return spawn_process(call); }
    if (call.callee.text == SPAWN_RANDOM_PROCESS) { return spawn_random_process(call); }

    (void)report_error("{}: call to unknown function `{}`", call.callee.location, call.callee.text);
    return report_note("available functions are: {}, {}", SPAWN_PROCESS, SPAWN_RANDOM_PROCESS);
}

auto Interpreter::repeat(const Loop& loop) -> std::optional<std::size_t>
{
    const auto from = TRY(number_of(Literal { loop.from }, "loop start"));
    const auto to   = TRY(number_of(Literal { loop.to }, "loop end"));
    if (from > to) { return report_error("{}: range {}..{} runs backwards", loop.keyword.location, from, to); }

    std::size_t spawned = 0;
    for (auto iteration = from; iteration < to; ++iteration) {
        for (const auto& statement : loop.body) { spawned += TRY(execute(statement)); }
    }

    return spawned;
}

auto Interpreter::spawn_process(const Call& call) -> std::optional<std::size_t>
{
    const auto& args = call.arguments;
    if (args.size() != 3 && args.size() != 4) {
        (void)report_error(
          "{}: `{}` expects 3 or 4 arguments but got {}", call.callee.location, SPAWN_PROCESS, args.size()
        );
        return report_note("usage: {}(id, arrival, burst, priority = 1)", SPAWN_PROCESS);
    }

    auto process = Cpu::Process {
        .id      = TRY(number_of(args[0], "process id")),
        .arrival = TRY(number_of(args[1], "arrival time")),
        .burst   = TRY(number_of(args[2], "burst time")),
    };
    if (args.size() == 4) { process.priority = TRY(number_of(args[3], "priority")); }

    workload->add_process(process);
    return 1;
}

auto Interpreter::spawn_random_process(const Call& call) -> std::optional<std::size_t>
{
    if (!call.arguments.empty()) {
        return report_error(
          "{}: `{}` takes no arguments but got {}", call.callee.location, SPAWN_RANDOM_PROCESS, call.arguments.size()
        );
    }

    workload->add_process(Cpu::Process {
      .id       = workload->next_process_id(),
      .arrival  = Util::random_natural(0, workload->max_arrival_time),
      .burst    = Util::random_natural(1, workload->max_burst_time),
      .priority = Util::random_natural(1, workload->max_priority),
    });

    return 1;
}

auto Interpreter::number_of(const Literal& literal, const std::string_view what) -> std::optional<std::size_t>
{
    const auto& token = literal.token;
    if (token.kind != TokenKind::Number) {
        return report_error("{}: {} must be a number, found `{}`", token.location, what, token.text);
    }

    return Util::parse_natural(token.text);
}

} // namespace Script
