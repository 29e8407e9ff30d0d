#include "Gui.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <deque>
#include <print>
#include <utility>
#include <vector>

#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>
#include <implot.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace Gui
{

namespace
{

using Clock = std::chrono::steady_clock;

struct Notification
{
    std::string       message;
    Severity          severity;
    Clock::time_point expires_at;
};

std::deque<Notification> notifications;

ImFont* heading_font = nullptr;

constexpr auto BACKGROUND = rgb(0x181818);
constexpr auto SURFACE    = rgb(0x242424);
constexpr auto OUTLINE    = rgb(0x363636);
constexpr auto HIGHLIGHT  = rgb(0x4A4A4A);
constexpr auto ACCENT     = rgb(0x8B1A1A);
constexpr auto ACCENT_HOT = rgb(0xB22222);
constexpr auto FOREGROUND = rgb(0xE8E8E8);
constexpr auto STRIPE     = rgb(0x2C2C2C);

void report_glfw_error(const int code, const char* description)
{
    std::println(stderr, "[ERROR] (glfw) {}: {}", code, description);
}

void load_fonts()
{
    constexpr static auto REGULAR = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
    constexpr static auto BOLD    = "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf";

    auto& fonts = *ImGui::GetIO().Fonts;

    std::error_code error;
    if (!std::filesystem::exists(REGULAR, error) || !std::filesystem::exists(BOLD, error)) {
        std::println(stderr, "[WARN] (gui) DejaVu fonts not found, falling back to the built-in font");
        heading_font = fonts.AddFontDefault();
        return;
    }

    ImGui::GetIO().FontDefault = fonts.AddFontFromFileTTF(REGULAR, 16.0F);
    heading_font               = fonts.AddFontFromFileTTF(BOLD, 17.0F);
}

void apply_theme()
{
    auto& style            = ImGui::GetStyle();
    style.WindowRounding   = 0.0F;
    style.WindowBorderSize = 0.0F;
    style.ChildRounding    = 3.0F;
    style.FrameRounding    = 3.0F;
    style.FramePadding     = ImVec2(6.0F, 4.0F);

    const std::pair<ImGuiCol, ImVec4> palette[] = {
        { ImGuiCol_Text, FOREGROUND },
        { ImGuiCol_WindowBg, BACKGROUND },
        { ImGuiCol_ChildBg, SURFACE },
        { ImGuiCol_PopupBg, SURFACE },
        { ImGuiCol_Border, OUTLINE },
        { ImGuiCol_Separator, OUTLINE },
        { ImGuiCol_FrameBg, OUTLINE },
        { ImGuiCol_FrameBgHovered, HIGHLIGHT },
        { ImGuiCol_FrameBgActive, HIGHLIGHT },
        { ImGuiCol_Button, ACCENT },
        { ImGuiCol_ButtonHovered, ACCENT_HOT },
        { ImGuiCol_ButtonActive, ACCENT_HOT },
        { ImGuiCol_Header, ACCENT },
        { ImGuiCol_HeaderHovered, ACCENT_HOT },
        { ImGuiCol_HeaderActive, ACCENT_HOT },
        { ImGuiCol_TableHeaderBg, OUTLINE },
        { ImGuiCol_TableRowBgAlt, STRIPE },
    };
    for (const auto& [slot, colour] : palette) { style.Colors[slot] = colour; }

    auto& plot_style                     = ImPlot::GetStyle();
    plot_style.Colors[ImPlotCol_FrameBg] = BACKGROUND;
    plot_style.Colors[ImPlotCol_PlotBg]  = SURFACE;
    plot_style.Colormap                  = ImPlotColormap_Deep;
}

void draw_notifications()
{
    constexpr static auto MARGIN = 12.0F;
    constexpr static auto FLAGS  = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize
                                  | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoFocusOnAppearing
                                  | ImGuiWindowFlags_NoNav;

    const auto now = Clock::now();
    std::erase_if(notifications, [now](const Notification& notification) { return notification.expires_at <= now; });

    const auto* viewport = ImGui::GetMainViewport();
    auto        anchor   = ImVec2(
      viewport->WorkPos.x + viewport->WorkSize.x - MARGIN, viewport->WorkPos.y + viewport->WorkSize.y - MARGIN
    );

    for (std::size_t idx = 0; idx < notifications.size(); ++idx) {
        const auto& notification = notifications[idx];
        const auto  colour       = notification.severity == Severity::Error ? rgb(0xEF4444) : rgb(0x60A5FA);

        ImGui::SetNextWindowPos(anchor, ImGuiCond_Always, ImVec2(1.0F, 1.0F));
        if (ImGui::Begin(std::format("##notification{}", idx).c_str(), nullptr, FLAGS)) {
            Gui::coloured_text(colour, "{}", notification.message);
            anchor.y -= ImGui::GetWindowHeight() + MARGIN;
        }
        ImGui::End();
    }
}

} // namespace

auto Window::open(const std::string& title, const int width, const int height) -> std::unique_ptr<Window>
{
    glfwSetErrorCallback(report_glfw_error);
    if (glfwInit() == GLFW_FALSE) {
        std::println(stderr, "[ERROR] (gui) could not initialise GLFW");
        return nullptr;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    auto* handle = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (handle == nullptr) {
        std::println(stderr, "[ERROR] (gui) could not create a {}x{} window", width, height);
        glfwTerminate();
        return nullptr;
    }

    glfwMakeContextCurrent(handle);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImPlot::CreateContext();
    ImGui::GetIO().ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::GetIO().IniFilename = nullptr;

    ImGui_ImplGlfw_InitForOpenGL(handle, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    load_fonts();
    apply_theme();

    return std::unique_ptr<Window>(new Window { handle, title });
}

Window::Window(GLFWwindow* handle, std::string title)
  : handle { handle }
  , title { std::move(title) }
{}

Window::~Window()
{
    notifications.clear();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImPlot::DestroyContext();
    ImGui::DestroyContext();

    glfwDestroyWindow(handle);
    glfwTerminate();
}

auto Window::begin_frame() -> bool
{
    constexpr static auto FLAGS = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
                                | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus;

    glfwPollEvents();
    while (glfwGetWindowAttrib(handle, GLFW_ICONIFIED) != 0 && glfwWindowShouldClose(handle) == GLFW_FALSE) {
        glfwWaitEvents();
    }
    if (glfwWindowShouldClose(handle) != GLFW_FALSE) { return false; }

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    const auto* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    ImGui::Begin(title.c_str(), nullptr, FLAGS);
    return true;
}

void Window::end_frame(const ImVec4& clear_colour)
{
    ImGui::End();
    draw_notifications();
    ImGui::Render();

    int width  = 0;
    int height = 0;
    glfwGetFramebufferSize(handle, &width, &height);
    glViewport(0, 0, width, height);
    glClearColor(clear_colour.x, clear_colour.y, clear_colour.z, clear_colour.w);
    glClear(GL_COLOR_BUFFER_BIT);

    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(handle);
}

auto Texture::from_file(const std::filesystem::path& path) -> std::optional<Texture>
{
    int   width  = 0;
    int   height = 0;
    auto* pixels = stbi_load(path.string().c_str(), &width, &height, nullptr, STBI_rgb_alpha);
    if (pixels == nullptr) {
        std::println(stderr, "[WARN] (gui) cannot load {}: {}", path.string(), stbi_failure_reason());
        return std::nullopt;
    }

    GLuint name = 0;
    glGenTextures(1, &name);
    glBindTexture(GL_TEXTURE_2D, name);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, width, height, 0, GL_RGBA, GL_UNSIGNED_BYTE, pixels);
    stbi_image_free(pixels);

    return Texture(name);
}

Texture::Texture(const GLuint name)
  : name { name }
{}

Texture::Texture(Texture&& other) noexcept
  : name { std::exchange(other.name, 0) }
{}

Texture::~Texture()
{
    if (name != 0) { glDeleteTextures(1, &name); }
}

auto Texture::id() const -> ImTextureID
{
    // ImTextureID is a pointer in older ImGui releases and an integer in newer ones.
    return (ImTextureID)(static_cast<std::uintptr_t>(name)); // NOLINT
}

void heading(const char* label)
{
    if (heading_font != nullptr) { ImGui::PushFont(heading_font); }
    ImGui::TextUnformatted(label);
    if (heading_font != nullptr) { ImGui::PopFont(); }
    ImGui::Separator();
}

auto input_number(const char* label, std::size_t& value, const std::size_t min) -> bool
{
    constexpr static ImU64 STEP      = 1;
    constexpr static ImU64 FAST_STEP = 5;

    auto edited = static_cast<ImU64>(value);
    if (!ImGui::InputScalar(label, ImGuiDataType_U64, &edited, &STEP, &FAST_STEP)) { return false; }

    const auto committed = std::max(static_cast<std::size_t>(edited), min);
    if (committed == value) { return false; }

    value = committed;
    return true;
}

auto path_prompt(const char* label, bool& open) -> std::optional<std::string>
{
    static std::array<char, 512> buffer {};

    if (open && !ImGui::IsPopupOpen(label)) { ImGui::OpenPopup(label); }

    ImGui::SetNextWindowPos(ImGui::GetMainViewport()->GetCenter(), ImGuiCond_Appearing, ImVec2(0.5F, 0.5F));
    if (!ImGui::BeginPopupModal(label, &open, ImGuiWindowFlags_AlwaysAutoResize)) { return std::nullopt; }

    if (ImGui::IsWindowAppearing()) { ImGui::SetKeyboardFocusHere(); }
    ImGui::SetNextItemWidth(320.0F);
    const auto entered
      = ImGui::InputText("##path", buffer.data(), buffer.size(), ImGuiInputTextFlags_EnterReturnsTrue);

    const auto confirmed = ImGui::Button("Save") || entered;
    ImGui::SameLine();
    const auto cancelled = ImGui::Button("Cancel") || ImGui::IsKeyPressed(ImGuiKey_Escape);

    std::optional<std::string> path;
    if (confirmed) { path = std::string(buffer.data()); }
    if (confirmed || cancelled) {
        buffer.fill('\0');
        open = false;
        ImGui::CloseCurrentPopup();
    }

    ImGui::EndPopup();
    return path;
}

auto icon_button(const std::optional<Texture>& icon, const char* label, const ImVec2& size) -> bool
{
    if (!icon) { return ImGui::Button(label); }

    const auto pressed = ImGui::ImageButton(label, icon->id(), size);
    if (ImGui::IsItemHovered(ImGuiHoveredFlags_DelayNormal)) { ImGui::SetTooltip("%s", label); }
    return pressed;
}

void notify(const Severity severity, std::string message)
{
    const auto lifetime = severity == Severity::Error ? std::chrono::seconds(4) : std::chrono::seconds(2);
    notifications.push_back(Notification {
      .message    = std::move(message),
      .severity   = severity,
      .expires_at = Clock::now() + lifetime,
    });
}

namespace Plotting
{

namespace
{

// ImPlot wants C strings for tick labels, placed at 0, 1, 2...
struct Ticks
{
    explicit Ticks(const std::span<const std::string> labels)
    {
        for (const auto& label : labels) {
            positions.push_back(static_cast<double>(names.size()));
            names.push_back(label.c_str());
        }
    }

    void apply(const ImAxis axis) const
    {
        if (names.empty()) { return; }
        ImPlot::SetupAxisTicks(axis, positions.data(), static_cast<int>(names.size()), names.data());
    }

    std::vector<double>      positions;
    std::vector<const char*> names;
};

} // namespace

void gantt_chart(
  const char*                        id,
  const ImVec2&                      size,
  const std::span<const std::string> rows,
  const std::span<const GanttBar>    bars,
  const double                       horizon
)
{
    constexpr static auto THICKNESS = 0.6;

    if (!ImPlot::BeginPlot(id, size, ImPlotFlags_NoLegend | ImPlotFlags_NoMenus)) { return; }

    const Ticks ticks(rows);
    ImPlot::SetupAxes("time", nullptr, ImPlotAxisFlags_None, ImPlotAxisFlags_Invert);
    ImPlot::SetupAxisLimits(ImAxis_X1, 0.0, std::max(horizon, 1.0), ImGuiCond_Always);
    ImPlot::SetupAxisLimits(ImAxis_Y1, -0.5, static_cast<double>(rows.size()) - 0.5, ImGuiCond_Always);
    ticks.apply(ImAxis_Y1);
    ImPlot::SetupFinish();

    auto*      draw_list = ImPlot::GetPlotDrawList();
    const auto mouse     = ImPlot::GetPlotMousePos();
    const auto hovering  = ImPlot::IsPlotHovered();

    ImPlot::PushPlotClipRect();
    for (const auto& bar : bars) {
        const auto  lane   = static_cast<double>(bar.row);
        const auto  corner = ImPlot::PlotToPixels(bar.start, lane - (THICKNESS / 2));
        const auto  across = ImPlot::PlotToPixels(bar.end, lane + (THICKNESS / 2));
        const auto  min    = ImVec2(std::min(corner.x, across.x), std::min(corner.y, across.y));
        const auto  max    = ImVec2(std::max(corner.x, across.x), std::max(corner.y, across.y));
        const auto& label  = rows[bar.row];

        const auto fill = ImPlot::GetColormapColor(static_cast<int>(bar.row));
        draw_list->AddRectFilled(min, max, ImGui::GetColorU32(fill), 2.0F);

        const auto label_size = ImGui::CalcTextSize(label.c_str());
        if (label_size.x + 4.0F < max.x - min.x) {
            const auto origin = ImVec2((min.x + max.x - label_size.x) / 2, (min.y + max.y - label_size.y) / 2);
            draw_list->AddText(origin, IM_COL32_WHITE, label.c_str());
        }

        if (hovering && mouse.x >= bar.start && mouse.x < bar.end && std::abs(mouse.y - lane) <= THICKNESS / 2) {
            ImGui::SetTooltip("%s", std::format("{}: {} to {}", label, bar.start, bar.end).c_str());
        }
    }
    ImPlot::PopPlotClipRect();

    ImPlot::EndPlot();
}

void bar_chart(
  const char*                        id,
  const ImVec2&                      size,
  const std::span<const std::string> labels,
  const std::span<const double>      values
)
{
    constexpr static auto WIDTH = 0.6;

    if (!ImPlot::BeginPlot(id, size, ImPlotFlags_NoLegend | ImPlotFlags_NoMenus | ImPlotFlags_NoMouseText)) {
        return;
    }

    const auto  tallest = values.empty() ? 0.0 : std::ranges::max(values);
    const Ticks ticks(labels);
    ImPlot::SetupAxes(nullptr, nullptr, ImPlotAxisFlags_NoGridLines, ImPlotAxisFlags_None);
    ImPlot::SetupAxisLimits(ImAxis_X1, -0.5, static_cast<double>(labels.size()) - 0.5, ImGuiCond_Always);
    ImPlot::SetupAxisLimits(ImAxis_Y1, 0.0, std::max(tallest * 1.15, 1.0), ImGuiCond_Always);
    ticks.apply(ImAxis_X1);

    for (std::size_t idx = 0; idx < values.size(); ++idx) {
        ImPlot::SetNextFillStyle(ImPlot::GetColormapColor(static_cast<int>(idx)));
        ImPlot::PlotBars(ticks.names[idx], &ticks.positions[idx], &values[idx], 1, WIDTH);
        const auto caption = std::format("{:.2f}", values[idx]);
        ImPlot::PlotText(caption.c_str(), ticks.positions[idx], values[idx], ImVec2(0, -10));
    }

    ImPlot::EndPlot();
}

} // namespace Plotting

} // namespace Gui
