#include "Application.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <print>
#include <utility>

#include "Util.hpp"

[[nodiscard]] static auto is_ignored_key(const std::string_view key) -> bool
{
    constexpr static std::string_view TO_IGNORE[] = { "Schedule Policy" };
    return std::ranges::find(TO_IGNORE, key) != std::ranges::end(TO_IGNORE);
}

auto Application::group_reports_by_key(const std::span<const Scheduling::MetricsTable> reports)
  -> std::optional<MetricSeries>
{
    if (reports.empty()) { return std::nullopt; }

    MetricSeries result;
    for (const auto& [key, _] : reports.front()) {
        if (is_ignored_key(key)) { continue; }

        std::vector<double> values;
        values.reserve(reports.size());
        for (std::size_t idx = 0; idx < reports.size(); ++idx) {
            const auto entry = reports[idx].find(key);
            if (entry == reports[idx].end()) {
                std::println(stderr, "[ERROR] (comparator) report #{} has no `{}` entry", idx + 1, key);
                return std::nullopt;
            }

            const auto value = Util::parse_real(entry->second);
            if (!value) {
                std::println(
                  stderr, "[ERROR] (comparator) `{}` of report #{} is not a number: {}", key, idx + 1, entry->second
                );
                return std::nullopt;
            }
            values.push_back(*value);
        }

        result.emplace(key, std::move(values));
    }

    return result;
}

auto Application::create(
  const std::vector<std::string>&                 labels,
  const std::span<const Scheduling::MetricsTable> reports
) -> std::unique_ptr<Application>
{
    auto series = group_reports_by_key(reports);
    if (!series) { return nullptr; }

    auto window = Gui::Window::open("cpu-sched: comparator", 1600, 900);
    if (!window) { return nullptr; }

    return std::unique_ptr<Application>(new Application { std::move(window), labels, std::move(*series) });
}

Application::Application(
  std::unique_ptr<Gui::Window>    window,
  const std::vector<std::string>& labels,
  MetricSeries                    series
)
  : window { std::move(window) }
  , labels { labels }
  , series { std::move(series) }
{}

void Application::run()
{
    window->run(BACKGROUND, [this] { draw_charts(); });
}

void Application::draw_charts() const
{
    std::vector<const MetricSeries::value_type*> metrics;
    for (const auto& entry : series) { metrics.push_back(&entry); }

    // As close to square as the metric count allows.
    const auto columns = static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<double>(metrics.size()))));

    const auto draw_cell = [&](const ImVec2& size, const std::size_t idx) {
        const auto& [key, values] = *metrics[idx];
        Gui::panel(key.c_str(), size, [&](const ImVec2& body) {
            Gui::Plotting::bar_chart("##bars", body, labels, values);
        });
    };
    Gui::grid(metrics.size(), columns, ImGui::GetContentRegionAvail(), draw_cell);
}
