#include <memory>
#include <print>
#include <span>

#include "Application.hpp"
#include "lang/Interpreter.hpp"
#include "scheduling/Workload.hpp"
#include "Util.hpp"

auto main(int argc, const char** argv) -> int
{
    const std::span args(argv, static_cast<std::size_t>(argc));
    if (args.size() < 2) {
        std::println(stderr, "[ERROR] expected file path to workload script");
        std::println("usage: {} <file.sl>", args[0]);
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

    auto app = Application::create(workload);
    if (!app) { return 1; }
    app->run();
}
