#pragma once

#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "gui/Gui.hpp"
#include "scheduling/Statistics.hpp"

// Side by side bar charts of saved metrics reports, one chart per metric and one bar per report.
class [[nodiscard]] Application final
{
  public:
    using MetricSeries = std::map<std::string, std::vector<double>>;

    [[nodiscard]] static auto create(
      const std::vector<std::string>&                 labels,
      const std::span<const Scheduling::MetricsTable> reports
    ) -> std::unique_ptr<Application>;

    // One series per metric key, one value per report. Fails when a report misses a key or holds a
    // non-numeric value.
    [[nodiscard]] static auto group_reports_by_key(const std::span<const Scheduling::MetricsTable> reports)
      -> std::optional<MetricSeries>;

    void run();

  private:
    Application(std::unique_ptr<Gui::Window> window, const std::vector<std::string>& labels, MetricSeries series);

    void draw_charts() const;

    constexpr static auto BACKGROUND = Gui::rgb(0x181818);

    std::unique_ptr<Gui::Window> window;
    std::vector<std::string>     labels;
    MetricSeries                 series;
};
