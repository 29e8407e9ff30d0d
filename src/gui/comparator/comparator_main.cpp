#include <filesystem>
#include <print>
#include <span>
#include <string>
#include <vector>

#include "Application.hpp"
#include "scheduling/Statistics.hpp"
#include "Util.hpp"

static void usage(const char* executable)
{
    std::println("usage: {} <file1.met> <file2.met> [<fileN.met>...]", executable);
}

[[nodiscard]] static auto read_reports(const std::span<const std::filesystem::path> paths)
  -> std::optional<std::vector<Scheduling::MetricsTable>>
{
    std::vector<Scheduling::MetricsTable> reports;
    reports.reserve(paths.size());
    for (const auto& path : paths) {
        const auto content = TRY(Util::read_entire_file(path));
        reports.push_back(Scheduling::parse_metrics_report(content));
    }

    return reports;
}

auto main(int argc, const char** argv) -> int
{
    const std::span args(argv, static_cast<std::size_t>(argc));
    if (args.size() < 3) {
        usage(args[0]);
        return 1;
    }

    std::vector<std::filesystem::path> file_paths;
    std::vector<std::string>           file_stems;
    for (std::size_t idx = 1; idx < args.size(); ++idx) {
        file_paths.emplace_back(args[idx]);
        file_stems.push_back(file_paths.back().stem().string());
    }

    const auto reports = read_reports(file_paths);
    if (!reports) { return 1; }

    auto app = Application::create(file_stems, *reports);
    if (!app) { return 1; }
    app->run();
}
