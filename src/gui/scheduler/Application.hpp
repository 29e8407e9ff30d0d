#pragma once

#include <memory>
#include <optional>
#include <string>

#include <imgui.h>

#include "gui/Gui.hpp"
#include "scheduling/Statistics.hpp"
#include "scheduling/Workload.hpp"

// Interactive view of one workload: pick a policy, tune the quantum and inspect the resulting schedule.
class [[nodiscard]] Application final
{
  public:
    [[nodiscard]] static auto create(const std::shared_ptr<Scheduling::Workload>& workload)
      -> std::unique_ptr<Application>;

    void run();

  private:
    Application(
      std::unique_ptr<Gui::Window>                 window,
      const std::shared_ptr<Scheduling::Workload>& workload,
      std::optional<Gui::Texture>                  save_icon
    );

    void simulate();
    void save_metrics(const std::string& path) const;

    void draw_toolbar();
    void draw_panels() const;
    void draw_timeline(const ImVec2& size) const;
    void draw_results(const ImVec2& size) const;
    void draw_statistics(const ImVec2& size) const;
    void draw_processes(const ImVec2& size) const;

    constexpr static auto BACKGROUND = Gui::rgb(0x181818);
    constexpr static auto WARNING    = Gui::rgb(0xF59E0B);

    // Declared first so the GL context outlives the texture.
    std::unique_ptr<Gui::Window>                window;
    std::shared_ptr<Scheduling::Workload>       workload;
    std::optional<Scheduling::SimulationOutput> output;
    std::optional<Scheduling::Statistics>       statistics;
    std::optional<Gui::Texture>                 save_icon;
    bool                                        saving = false;
};
