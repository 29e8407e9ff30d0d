#include "Application.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <map>
#include <utility>
#include <vector>

#include "Util.hpp"

auto Application::create(const std::shared_ptr<Scheduling::Workload>& workload) -> std::unique_ptr<Application>
{
    auto window = Gui::Window::open("cpu-sched: scheduler", 1600, 900);
    if (!window) { return nullptr; }

    auto icon = Gui::Texture::from_file(CPU_SCHED_RESOURCES_DIR "/save.png");
    auto app  = std::unique_ptr<Application>(new Application { std::move(window), workload, std::move(icon) });
    app->simulate();
    return app;
}

Application::Application(
  std::unique_ptr<Gui::Window>                 window,
  const std::shared_ptr<Scheduling::Workload>& workload,
  std::optional<Gui::Texture>                  save_icon
)
  : window { std::move(window) }
  , workload { workload }
  , save_icon { std::move(save_icon) }
{}

void Application::run()
{
    window->run(BACKGROUND, [this] {
        draw_toolbar();
        draw_panels();
    });
}

void Application::simulate()
{
    output     = workload->simulate();
    statistics = output.transform(Scheduling::compute_statistics);
}

void Application::save_metrics(const std::string& path) const
{
    if (!statistics) { return; }
    if (path.empty()) {
        Gui::notify(Gui::Severity::Error, "Nothing saved: the path is empty");
        return;
    }

    const auto report = Scheduling::to_metrics_report(Scheduling::schedule_policy_name(workload->policy), *statistics);
    if (!Util::write_to_file(path, report)) {
        Gui::notify(Gui::Severity::Error, std::format("Could not write {}", path));
        return;
    }

    Gui::notify(Gui::Severity::Info, std::format("Metrics saved to {}", path));
}

void Application::draw_toolbar()
{
    constexpr static auto POLICIES = std::array {
        Scheduling::SchedulePolicy::FirstComeFirstServed,
        Scheduling::SchedulePolicy::ShortestJobFirst,
        Scheduling::SchedulePolicy::Priority,
        Scheduling::SchedulePolicy::RoundRobin,
    };
    static_assert(POLICIES.size() == std::to_underlying(Scheduling::SchedulePolicy::Count));

    const auto can_save = statistics.has_value();
    Gui::with_enabled(can_save, [&] {
        if (Gui::icon_button(save_icon, "Save metrics (Ctrl+S)", ImVec2(16, 16))) { saving = true; }
    });
    if (can_save && ImGui::GetIO().KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_S, false)) { saving = true; }

    if (const auto path = Gui::path_prompt("Save metrics to", saving)) { save_metrics(*path); }

    ImGui::SameLine();
    ImGui::SetNextItemWidth(220.0F);
    if (Gui::combo("##policy", POLICIES, workload->policy)) { simulate(); }

    ImGui::SameLine();
    Gui::with_enabled(workload->policy == Scheduling::SchedulePolicy::RoundRobin, [&] {
        ImGui::SetNextItemWidth(120.0F);
        if (Gui::input_number("Quantum", workload->quantum, 1)) { simulate(); }
    });
}

void Application::draw_panels() const
{
    using Draw = void (Application::*)(const ImVec2&) const;
    constexpr static std::array<std::pair<const char*, Draw>, 4> PANELS = { {
      { "Timeline", &Application::draw_timeline },
      { "Results", &Application::draw_results },
      { "Statistics", &Application::draw_statistics },
      { "Processes", &Application::draw_processes },
    } };

    Gui::grid(PANELS.size(), 2, ImGui::GetContentRegionAvail(), [this](const ImVec2& size, const std::size_t idx) {
        const auto& [label, draw] = PANELS[idx];
        Gui::panel(label, size, [&](const ImVec2& body) { std::invoke(draw, this, body); });
    });
}

void Application::draw_timeline(const ImVec2& size) const
{
    if (!output) {
        for (const auto& problem : workload->validate()) { Gui::coloured_text(WARNING, "{}", problem); }
        return;
    }

    // One lane per distinct id, in input order.
    std::vector<std::string>           lanes;
    std::map<std::size_t, std::size_t> lane_of;
    for (const auto& process : workload->processes) {
        if (lane_of.try_emplace(process.id, lanes.size()).second) { lanes.push_back(std::format("P{}", process.id)); }
    }

    std::vector<Gui::Plotting::GanttBar> bars;
    bars.reserve(output->timeline.size());
    for (const auto& slice : output->timeline) {
        const auto lane = lane_of.at(slice.process_id);
        bars.push_back({ lane, static_cast<double>(slice.start), static_cast<double>(slice.end) });
    }

    Gui::Plotting::gantt_chart("##timeline", size, lanes, bars, static_cast<double>(statistics->makespan));
}

void Application::draw_results(const ImVec2&) const
{
    constexpr static std::array HEADERS = { "PID", "Arrival", "Burst", "Priority", "Waiting", "Turnaround" };

    if (!output) { return; }

    Gui::table("##results", HEADERS, [&] {
        for (const auto& result : output->results) {
            Gui::table_row(
              std::format("P{}", result.id),
              result.arrival,
              result.burst,
              result.priority,
              result.waiting_time,
              result.turnaround_time
            );
        }

        Gui::table_row(
          "Average",
          "",
          "",
          "",
          std::format("{:.2f}", statistics->average_waiting_time),
          std::format("{:.2f}", statistics->average_turnaround_time)
        );
    });
}

void Application::draw_statistics(const ImVec2&) const
{
    constexpr static std::array HEADERS = { "Metric", "Value" };

    Gui::table("##run", HEADERS, [&] {
        Gui::table_row("Policy", workload->policy);
        if (workload->policy == Scheduling::SchedulePolicy::RoundRobin) {
            Gui::table_row("Quantum", workload->quantum);
        }
        Gui::table_row("Processes", workload->processes.size());
    });

    if (!statistics) { return; }

    if (output->starvation_risk.value_or(false)) {
        Gui::coloured_text(
          WARNING, "Starvation risk: a process waited more than {}x its burst time", workload->starvation_factor
        );
    }

    Gui::table("##metrics", HEADERS, [&] {
        const auto& stats = *statistics;
        Gui::table_row("Average waiting time", std::format("{:.2f}", stats.average_waiting_time));
        Gui::table_row("Max waiting time", stats.max_waiting_time);
        Gui::table_row("Average turnaround time", std::format("{:.2f}", stats.average_turnaround_time));
        Gui::table_row("Max turnaround time", stats.max_turnaround_time);
        Gui::table_row("Makespan", stats.makespan);
        Gui::table_row("Busy time", stats.busy_time);
        Gui::table_row("Idle time", stats.idle_time);
        Gui::table_row("CPU utilization", std::format("{:.1f}%", stats.cpu_utilization * 100));
        Gui::table_row("Throughput", std::format("{:.3f}", stats.throughput));
        Gui::table_row("Context switches", stats.context_switches);
    });
}

void Application::draw_processes(const ImVec2&) const
{
    constexpr static std::array HEADERS = { "PID", "Arrival", "Burst", "Priority" };

    Gui::table("##processes", HEADERS, [&] {
        for (const auto& process : workload->processes) {
            Gui::table_row(std::format("P{}", process.id), process.arrival, process.burst, process.priority);
        }
    });
}
