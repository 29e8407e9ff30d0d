#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>

#include <GL/gl.h>
#include <GLFW/glfw3.h>
#include <imgui.h>

namespace Gui
{

[[nodiscard]] constexpr auto rgb(const std::uint32_t hex, const float alpha = 1.0F) -> ImVec4
{
    const auto channel = [hex](const unsigned shift) { return static_cast<float>((hex >> shift) & 0xFFU) / 255.0F; };
    return { channel(16U), channel(8U), channel(0U), alpha };
}

// Owns the GLFW window together with the ImGui and ImPlot contexts that draw into it.
class [[nodiscard]] Window final
{
  public:
    [[nodiscard]] static auto open(const std::string& title, int width, int height) -> std::unique_ptr<Window>;

    // Calls `draw` once per frame inside a borderless window that covers the viewport, until the user closes
    // the window.
    template<std::invocable Draw>
    void run(const ImVec4& clear_colour, Draw&& draw)
    {
        while (begin_frame()) {
            std::invoke(draw);
            end_frame(clear_colour);
        }
    }

    ~Window();
    Window(const Window&)            = delete;
    Window& operator=(const Window&) = delete;
    Window(Window&&)                 = delete;
    Window& operator=(Window&&)      = delete;

  private:
    Window(GLFWwindow* handle, std::string title);

    [[nodiscard]] auto begin_frame() -> bool;
    void end_frame(const ImVec4& clear_colour);

    GLFWwindow* handle;
    std::string title;
};

// An RGBA OpenGL texture. Needs a live Window.
class [[nodiscard]] Texture final
{
  public:
    [[nodiscard]] static auto from_file(const std::filesystem::path& path) -> std::optional<Texture>;

    [[nodiscard]] auto id() const -> ImTextureID;

    ~Texture();
    Texture(const Texture&)            = delete;
    Texture& operator=(const Texture&) = delete;
    Texture(Texture&& other) noexcept;
    Texture& operator=(Texture&&) = delete;

  private:
    explicit Texture(GLuint name);

    GLuint name;
};

template<typename... Args>
void text(std::format_string<Args...> fmt, Args&&... args)
{
    ImGui::TextUnformatted(std::format(fmt, std::forward<Args>(args)...).c_str());
}

template<typename... Args>
void coloured_text(const ImVec4& colour, std::format_string<Args...> fmt, Args&&... args)
{
    ImGui::PushStyleColor(ImGuiCol_Text, colour);
    Gui::text(fmt, std::forward<Args>(args)...);
    ImGui::PopStyleColor();
}

void heading(const char* label);

// Bordered region with a heading; `body` receives the space left under it.
template<std::invocable<ImVec2> Body>
void panel(const char* label, const ImVec2& size, Body&& body)
{
    if (ImGui::BeginChild(label, size, ImGuiChildFlags_Border)) {
        Gui::heading(label);
        std::invoke(std::forward<Body>(body), ImGui::GetContentRegionAvail());
    }
    ImGui::EndChild();
}

template<std::invocable Rows>
void table(const char* id, const std::span<const char* const> headers, Rows&& rows)
{
    constexpr static auto FLAGS = ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollY;

    if (!ImGui::BeginTable(id, static_cast<int>(headers.size()), FLAGS)) { return; }

    ImGui::TableSetupScrollFreeze(0, 1);
    for (const auto* header : headers) { ImGui::TableSetupColumn(header); }
    ImGui::TableHeadersRow();

    std::invoke(std::forward<Rows>(rows));
    ImGui::EndTable();
}

// One cell per argument, each shown through its std::formatter.
template<typename... Cells>
void table_row(const Cells&... cells)
{
    ImGui::TableNextRow();
    ((ImGui::TableNextColumn(), Gui::text("{}", cells)), ...);
}

// Lays `count` cells out row-major, `columns` per row, sharing `area` evenly.
template<std::invocable<ImVec2, std::size_t> Cell>
void grid(const std::size_t count, const std::size_t columns, const ImVec2& area, Cell&& cell)
{
    if (count == 0 || columns == 0) { return; }

    const auto rows    = (count + columns - 1) / columns;
    const auto spacing = ImGui::GetStyle().ItemSpacing;
    const auto size    = ImVec2(
      (area.x - (spacing.x * static_cast<float>(columns - 1))) / static_cast<float>(columns),
      (area.y - (spacing.y * static_cast<float>(rows - 1))) / static_cast<float>(rows)
    );

    for (std::size_t idx = 0; idx < count; ++idx) {
        if (idx % columns != 0) { ImGui::SameLine(); }

        ImGui::PushID(static_cast<int>(idx));
        std::invoke(cell, size, idx);
        ImGui::PopID();
    }
}

template<std::invocable Body>
void with_enabled(const bool enabled, Body&& body)
{
    ImGui::BeginDisabled(!enabled);
    std::invoke(std::forward<Body>(body));
    ImGui::EndDisabled();
}

// Items are labelled through their std::formatter. Returns true when `selected` changed.
template<typename Item>
[[nodiscard]] auto combo(const char* id, std::span<const std::type_identity_t<Item>> items, Item& selected) -> bool
{
    if (!ImGui::BeginCombo(id, std::format("{}", selected).c_str())) { return false; }

    bool changed = false;
    for (const auto& item : items) {
        const auto current = item == selected;
        if (ImGui::Selectable(std::format("{}", item).c_str(), current) && !current) {
            selected = item;
            changed  = true;
        }
    }

    ImGui::EndCombo();
    return changed;
}

// Returns true when the user committed a new value, never below `min`.
[[nodiscard]] auto input_number(const char* label, std::size_t& value, std::size_t min) -> bool;

// Modal asking for a file path while `open` holds; yields the path once confirmed.
[[nodiscard]] auto path_prompt(const char* label, bool& open) -> std::optional<std::string>;

// Falls back to a text button without an icon.
[[nodiscard]] auto icon_button(const std::optional<Texture>& icon, const char* label, const ImVec2& size) -> bool;

enum class [[nodiscard]] Severity : std::uint8_t
{
    Info,
    Error,
};

// Short-lived message stacked in the bottom right corner.
void notify(Severity severity, std::string message);

namespace Plotting
{

struct [[nodiscard]] GanttBar final
{
    std::size_t row;
    double      start;
    double      end;
};

// One row per label, top to bottom; the time axis spans [0, horizon].
void gantt_chart(
  const char*                  id,
  const ImVec2&                size,
  std::span<const std::string> rows,
  std::span<const GanttBar>    bars,
  double                       horizon
);

// One labelled bar per value, its value printed above it.
void bar_chart(const char* id, const ImVec2& size, std::span<const std::string> labels, std::span<const double> values);

} // namespace Plotting

} // namespace Gui
