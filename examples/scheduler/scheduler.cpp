#include <memory>
#include <print>
#include <span>

#include "lang/Interpreter.hpp"
#include "scheduling/Statistics.hpp"
#include "scheduling/Workload.hpp"
#include "Util.hpp"

static void usage(const char* executable)
{
    std::println("usage: {} <file.sl> [policy] [quantum]", executable);
    std::println("    policy: first_come_first_served | shortest_job_first | priority | round_robin");
}

static void print_simulation(const Scheduling::Workload& workload, const Scheduling::SimulationOutput& output)
{
    if (workload.policy == Scheduling::SchedulePolicy::RoundRobin) {
        std::println("Policy: {} (quantum {})", workload.policy, workload.quantum);
    } else {
        std::println("Policy: {}", workload.policy);
    }

    std::println("Timeline:");
    for (const auto& interval : output.timeline) { std::println("    {}", interval); }

    std::println("Results:");
    for (const auto& result : output.results) { std::println("    {:s}", result); }

    std::println("{}", Scheduling::compute_statistics(output));

    if (output.starvation_risk.has_value()) {
        std::println(
          "Starvation risk: {} (factor {})", *output.starvation_risk ? "yes" : "no", workload.starvation_factor
        );
    }
}

auto main(int argc, const char** argv) -> int
{
    const std::span args(argv, static_cast<std::size_t>(argc));
    if (args.size() < 2 || args.size() > 4) {
        usage(args[0]);
        return 1;
    }

    const auto* const script_path          = args[1];
    const auto        maybe_script_content = Util::read_entire_file(script_path);
    if (!maybe_script_content) { return 1; }

    auto workload = std::make_shared<Scheduling::Workload>();
    if (!Script::Interpreter::eval(*maybe_script_content, workload)) {
        std::println(stderr, "[ERROR] could not evaluate script {}", script_path);
        return 1;
    }

    // Command line arguments override the script's constants.
    if (args.size() >= 3) {
        const auto policy = Scheduling::schedule_policy_try_from_str(args[2]);
        if (!policy) { return 1; }
        workload->policy = *policy;
    }

    if (args.size() == 4) {
        const auto quantum = Util::parse_natural(args[3]);
        if (!quantum) { return 1; }
        workload->quantum = *quantum;
    }

    const auto output = workload->simulate();
    if (!output) { return 1; }

    print_simulation(*workload, *output);
}
