/**
 * @file    main_window.cpp
 * @brief   Main Window UI Implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "gui/widgets/main_window.hpp"
#include "gui/resources/style.hpp"
#include "core/types.hpp"
#include "core/viewport_mapper.hpp"
#include "io/image_codec.hpp"
#include "utils/path_formatter.hpp"

#include <imgui.h>
#include <SDL3/SDL.h>
#include <nfd.h>

#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace loupe::gui {

// =============================================================================
// File Dialog Helpers (Cross-platform via nativefiledialog-extended)
// With Linux fallback to zenity/kdialog when portal is unavailable
// =============================================================================

namespace {

constexpr int kZoomStep = 10;

// "png,jpg,jpeg,..." for NFD, "*.png *.jpg ..." for the shell dialogs
std::string extension_list(bool glob) {
    std::string list;
    for (const auto& ext : supported_extensions()) {
        if (!list.empty()) {
            list += glob ? " " : ",";
        }
        list += glob ? "*" + ext : ext.substr(1);
    }
    return list;
}

#ifdef __linux__
// =============================================================================
// Linux Fallback: zenity / kdialog
// =============================================================================
enum class LinuxDialogTool {
    None,
    Zenity,
    Kdialog
};

// Detect available dialog tool (cached on first call)
LinuxDialogTool detect_dialog_tool() {
    static LinuxDialogTool cached = []() {
        if (std::system("which zenity > /dev/null 2>&1") == 0)
            return LinuxDialogTool::Zenity;
        if (std::system("which kdialog > /dev/null 2>&1") == 0)
            return LinuxDialogTool::Kdialog;
        return LinuxDialogTool::None;
    }();
    return cached;
}

// Run a shell command and capture its stdout as a file path
std::optional<std::filesystem::path> run_command_dialog(const std::string& cmd) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return std::nullopt;

    char buffer[4096];
    std::string result;
    while (fgets(buffer, sizeof(buffer), pipe)) {
        result += buffer;
    }

    int status = pclose(pipe);
    if (status != 0 || result.empty()) return std::nullopt;

    while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
        result.pop_back();
    }

    if (result.empty()) return std::nullopt;
    return path_from_utf8(result);
}

std::optional<std::filesystem::path> fallback_open_file_dialog() {
    auto tool = detect_dialog_tool();
    const std::string patterns = extension_list(true);

    if (tool == LinuxDialogTool::Zenity) {
        return run_command_dialog(
            "zenity --file-selection --title='Open Image' "
            "--file-filter='Image Files|" + patterns + "' "
            "--file-filter='All Files|*' 2>/dev/null"
        );
    }
    if (tool == LinuxDialogTool::Kdialog) {
        return run_command_dialog(
            "kdialog --getopenfilename . 'Image Files (" + patterns + ")' 2>/dev/null"
        );
    }

    spdlog::error("No file dialog available. Install zenity or kdialog.");
    return std::nullopt;
}

std::optional<std::filesystem::path> fallback_pick_folder_dialog() {
    auto tool = detect_dialog_tool();

    if (tool == LinuxDialogTool::Zenity) {
        return run_command_dialog(
            "zenity --file-selection --directory --title='Open Folder' 2>/dev/null"
        );
    }
    if (tool == LinuxDialogTool::Kdialog) {
        return run_command_dialog("kdialog --getexistingdirectory . 2>/dev/null");
    }

    spdlog::error("No file dialog available. Install zenity or kdialog.");
    return std::nullopt;
}
#endif  // __linux__

// =============================================================================
// Cross-platform file dialogs (NFD with Linux fallback)
// =============================================================================
std::optional<std::filesystem::path> open_file_dialog() {
    NFD_Init();

    const std::string extensions = extension_list(false);
    nfdchar_t* out_path = nullptr;
    nfdfilteritem_t filters[] = {
        {"Image Files", extensions.c_str()}
    };

    nfdresult_t result = NFD_OpenDialog(&out_path, filters, 1, nullptr);

    std::optional<std::filesystem::path> path;
    if (result == NFD_OKAY && out_path) {
        path = path_from_utf8(out_path);
        NFD_FreePath(out_path);
    } else if (result == NFD_ERROR) {
        spdlog::debug("NFD dialog failed: {}", NFD_GetError());
#ifdef __linux__
        spdlog::info("Falling back to zenity/kdialog...");
        NFD_Quit();
        return fallback_open_file_dialog();
#endif
    }
    // NFD_CANCEL means user cancelled, no error

    NFD_Quit();
    return path;
}

std::optional<std::filesystem::path> pick_folder_dialog() {
    NFD_Init();

    nfdchar_t* out_path = nullptr;
    nfdresult_t result = NFD_PickFolder(&out_path, nullptr);

    std::optional<std::filesystem::path> path;
    if (result == NFD_OKAY && out_path) {
        path = path_from_utf8(out_path);
        NFD_FreePath(out_path);
    } else if (result == NFD_ERROR) {
        spdlog::debug("NFD dialog failed: {}", NFD_GetError());
#ifdef __linux__
        spdlog::info("Falling back to zenity/kdialog...");
        NFD_Quit();
        return fallback_pick_folder_dialog();
#endif
    }

    NFD_Quit();
    return path;
}

}  // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

MainWindow::MainWindow(AppController& controller, SDL_Window* window)
    : m_controller(controller)
    , m_window(window)
    , m_image_preview(std::make_unique<ImagePreview>(controller))
{
    spdlog::debug("MainWindow created");
}

MainWindow::~MainWindow() = default;

// =============================================================================
// Main Render
// =============================================================================

void MainWindow::render() {
    m_controller.update();

    const auto& state = m_controller.state();
    const float scale = state.dpi_scale;

    ImGuiWindowFlags window_flags =
        ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoNavFocus;

    if (!state.fullscreen) {
        window_flags |= ImGuiWindowFlags_MenuBar;
    }

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGui::Begin("MainWindow", nullptr, window_flags);

    if (state.fullscreen) {
        // Image only
        m_image_preview->render();
        ImGui::End();
        apply_pending();
        return;
    }

    render_menu_bar();

    float status_bar_height = ImGui::GetFrameHeight() + 8.0f * scale;
    float content_height = std::max(1.0f, ImGui::GetContentRegionAvail().y - status_bar_height);

    float control_panel_width = 260.0f * scale;
    ImGui::BeginChild("ControlPanel", ImVec2(control_panel_width, content_height), true);
    render_browser();
    render_control_panel();
    ImGui::EndChild();

    ImGui::SameLine();

    ImGui::BeginChild("ContentArea", ImVec2(0, content_height), false);
    {
        float gallery_height = state.show_gallery ? (kThumbnailSize + 36.0f) * scale : 0.0f;
        float image_height = std::max(1.0f, ImGui::GetContentRegionAvail().y - gallery_height);

        ImGui::BeginChild("ImageArea", ImVec2(0, image_height), true,
                          ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
        m_image_preview->render();
        ImGui::EndChild();

        if (state.show_gallery) {
            render_gallery();
        }
    }
    ImGui::EndChild();

    ImGui::End();

    render_status_bar();

    if (m_controller.state().show_about_dialog) {
        render_about_dialog();
    }

    apply_pending();
}

void MainWindow::apply_pending() {
    if (m_pending_toggle) {
        m_controller.tree().toggle(*m_pending_toggle);
        m_pending_toggle.reset();
    }
    if (m_pending_load) {
        m_controller.load_image(*m_pending_load);
        m_pending_load.reset();
    }
}

// =============================================================================
// Event Handling
// =============================================================================

bool MainWindow::handle_event(const SDL_Event& event) {
    if (event.type == SDL_EVENT_KEY_DOWN) {
        // Leave keys to focused text widgets
        if (ImGui::GetIO().WantTextInput) {
            return false;
        }

        bool ctrl = (event.key.mod & SDL_KMOD_CTRL) != 0;
        bool shift = (event.key.mod & SDL_KMOD_SHIFT) != 0;

        if (ctrl && !shift) {
            switch (event.key.key) {
                case SDLK_O: action_open_file(); return true;
                case SDLK_EQUALS: action_zoom_step(kZoomStep); return true;
                case SDLK_MINUS: action_zoom_step(-kZoomStep); return true;
                case SDLK_0: action_zoom_reset(); return true;
            }
        } else if (!ctrl && !shift) {
            switch (event.key.key) {
                case SDLK_LEFT: m_controller.previous_image(); return true;
                case SDLK_RIGHT: m_controller.next_image(); return true;
                case SDLK_H: action_toggle_hand_tool(); return true;
                case SDLK_F11: action_set_fullscreen(!m_controller.state().fullscreen); return true;
                case SDLK_ESCAPE:
                    if (m_controller.state().fullscreen) {
                        action_set_fullscreen(false);
                        return true;
                    }
                    break;
            }
        }
    }

    // Handle drag & drop
    if (event.type == SDL_EVENT_DROP_FILE && event.drop.data) {
        const auto path = path_from_utf8(event.drop.data);
        if (std::filesystem::is_directory(path)) {
            m_controller.open_folder(path);
            return true;
        }
        if (is_supported_extension(path)) {
            m_controller.load_image(path);
            return true;
        }
        spdlog::warn("Ignoring dropped file: {}", path);
    }

    return false;
}

// =============================================================================
// UI Components
// =============================================================================

void MainWindow::render_menu_bar() {
    auto& session = m_controller.session();

    if (ImGui::BeginMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("Open...", "Ctrl+O")) {
                action_open_file();
            }
            if (ImGui::MenuItem("Open Folder...")) {
                action_open_folder();
            }
            if (ImGui::MenuItem("Recents", nullptr, false, !session.recents().empty())) {
                m_controller.show_recents();
            }

            ImGui::Separator();

            if (ImGui::MenuItem("Exit", "Alt+F4")) {
                SDL_Event quit_event = {};
                quit_event.type = SDL_EVENT_QUIT;
                SDL_PushEvent(&quit_event);
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("View")) {
            const bool has_image = session.has_image();

            if (ImGui::MenuItem("Zoom In", "Ctrl++", false, has_image)) {
                action_zoom_step(kZoomStep);
            }
            if (ImGui::MenuItem("Zoom Out", "Ctrl+-", false, has_image)) {
                action_zoom_step(-kZoomStep);
            }
            if (ImGui::MenuItem("Reset Zoom", "Ctrl+0", false, has_image)) {
                action_zoom_reset();
            }

            ImGui::Separator();

            if (ImGui::MenuItem("Hand Tool", "H", session.hand_tool())) {
                action_toggle_hand_tool();
            }
            ImGui::MenuItem("Gallery", nullptr, &m_controller.state().show_gallery);
            if (ImGui::MenuItem("Fullscreen", "F11", m_controller.state().fullscreen)) {
                action_set_fullscreen(!m_controller.state().fullscreen);
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("Help")) {
            if (ImGui::MenuItem("About")) {
                m_controller.state().show_about_dialog = true;
            }
            ImGui::EndMenu();
        }

        ImGui::EndMenuBar();
    }
}

void MainWindow::render_browser() {
    ImGui::Text("Browser");
    ImGui::Separator();

    const float height = ImGui::GetContentRegionAvail().y * 0.55f;
    ImGui::BeginChild("Browser", ImVec2(0, height), false, ImGuiWindowFlags_HorizontalScrollbar);

    for (NodeId root : m_controller.tree().roots()) {
        render_tree_node(root);
    }

    ImGui::EndChild();
    ImGui::Spacing();
}

void MainWindow::render_tree_node(NodeId id) {
    const auto& tree = m_controller.tree();
    const TreeNode& node = tree.node(id);

    ImGui::PushID(static_cast<int>(id));

    if (node.is_directory) {
        ImGuiTreeNodeFlags flags = ImGuiTreeNodeFlags_OpenOnArrow | ImGuiTreeNodeFlags_OpenOnDoubleClick;
        ImGui::SetNextItemOpen(node.expanded, ImGuiCond_Always);

        const bool open = ImGui::TreeNodeEx(node.name.c_str(), flags);

        if (ImGui::IsItemToggledOpen()) {
            m_pending_toggle = id;
        }
        if (ImGui::IsItemClicked() && !ImGui::IsItemToggledOpen()) {
            if (node.is_virtual) {
                m_controller.show_recents();
            } else {
                m_controller.open_folder(node.path);
            }
        }

        if (open) {
            for (NodeId child : tree.children(id)) {
                render_tree_node(child);
            }
            ImGui::TreePop();
        }
    } else {
        const bool selected = node.path == m_controller.session().current_path();
        ImGuiTreeNodeFlags flags = ImGuiTreeNodeFlags_Leaf | ImGuiTreeNodeFlags_NoTreePushOnOpen;
        if (selected) {
            flags |= ImGuiTreeNodeFlags_Selected;
        }

        ImGui::TreeNodeEx(node.name.c_str(), flags);
        if (ImGui::IsItemClicked()) {
            m_pending_load = node.path;
        }
    }

    ImGui::PopID();
}

void MainWindow::render_control_panel() {
    auto& session = m_controller.session();

    ImGui::Text("Resampling");
    ImGui::Separator();

    for (ResamplingAlgorithm algorithm : kAllAlgorithms) {
        const std::string label(to_string(algorithm));
        if (ImGui::RadioButton(label.c_str(), session.algorithm() == algorithm)) {
            session.set_algorithm(algorithm);
        }
    }

    ImGui::Spacing();
    ImGui::Text("Zoom: %.0f%%", session.zoom() * 100.0f);
    ImGui::Separator();

    ImGui::BeginDisabled(!session.has_image());

    int slider = session.slider_value();
    ImGui::SetNextItemWidth(-1);
    if (ImGui::SliderInt("##zoom", &slider, kSliderMin, kSliderMax, "")) {
        session.on_slider_moved(slider);
    }
    if (ImGui::IsItemDeactivatedAfterEdit()) {
        session.on_slider_released();
    }

    if (ImGui::Button("-")) action_zoom_step(-kZoomStep);
    ImGui::SameLine();
    if (ImGui::Button("1:1")) action_zoom_reset();
    ImGui::SameLine();
    if (ImGui::Button("+")) action_zoom_step(kZoomStep);

    ImGui::Spacing();

    bool hand_tool = session.hand_tool();
    if (ImGui::Checkbox("Hand Tool (H)", &hand_tool)) {
        session.set_hand_tool(hand_tool);
    }

    ImGui::EndDisabled();

    ImGui::Spacing();
    ImGui::Separator();
    ImGui::TextColored(palette::kMuted, "Shortcuts");

    if (ImGui::BeginTable("shortcuts", 2)) {
        ImGui::TableSetupColumn("Key", ImGuiTableColumnFlags_WidthFixed, 70.0f * m_controller.state().dpi_scale);
        ImGui::TableSetupColumn("Action", ImGuiTableColumnFlags_WidthStretch);

        auto row = [](const char* key, const char* desc) {
            ImGui::TableNextRow();
            ImGui::TableNextColumn();
            ImGui::TextColored(palette::kMuted, "%s", key);
            ImGui::TableNextColumn();
            ImGui::TextColored(palette::kTextDim, "%s", desc);
        };

        row("Ctrl+O", "Open image");
        row("Left/Right", "Previous / next");
        row("H", "Hand tool");
        row("Wheel", "Zoom");
        row("F11", "Fullscreen");
        ImGui::EndTable();
    }
}

void MainWindow::render_gallery() {
    auto& session = m_controller.session();
    const float scale = m_controller.state().dpi_scale;
    const float thumb = kThumbnailSize * scale;

    ImGui::BeginChild("Gallery", ImVec2(0, 0), true, ImGuiWindowFlags_HorizontalScrollbar);

    const auto& collection = session.collection();
    if (collection.empty()) {
        ImGui::TextDisabled("Open a folder to browse its images");
        ImGui::EndChild();
        return;
    }

    if (ImGui::ArrowButton("##prev", ImGuiDir_Left)) {
        m_controller.previous_image();
    }
    ImGui::SameLine();

    const auto current = session.current_index();
    for (std::size_t i = 0; i < collection.size(); ++i) {
        const auto& path = collection[i];
        ImGui::PushID(static_cast<int>(i));

        const bool selected = current && *current == i;
        if (selected) {
            ImGui::PushStyleColor(ImGuiCol_Button, ImGui::GetStyleColorVec4(ImGuiCol_ButtonActive));
        }

        bool clicked = false;
        if (void* tex = m_controller.get_thumbnail_texture_id(path)) {
            clicked = ImGui::ImageButton("##thumb", reinterpret_cast<ImTextureID>(tex), ImVec2(thumb, thumb));
        } else {
            clicked = ImGui::Button("...", ImVec2(thumb, thumb));
            if (ImGui::IsItemVisible()) {
                session.request_thumbnail(path);   // Evicted from the cache
            }
        }

        if (selected) {
            ImGui::PopStyleColor();
        }
        if (ImGui::IsItemHovered()) {
            ImGui::SetTooltip("%s", filename_utf8(path).c_str());
        }
        if (clicked) {
            m_pending_load = path;
        }

        ImGui::PopID();
        ImGui::SameLine();
    }

    if (ImGui::ArrowButton("##next", ImGuiDir_Right)) {
        m_controller.next_image();
    }

    ImGui::EndChild();
}

void MainWindow::render_status_bar() {
    const auto& state = m_controller.state();
    const auto& session = m_controller.session();
    const float scale = state.dpi_scale;

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoDecoration |
        ImGuiWindowFlags_NoInputs |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoSavedSettings;

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    float height = ImGui::GetFrameHeight() + ImGui::GetStyle().FramePadding.y * scale;

    ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x, viewport->WorkPos.y + viewport->WorkSize.y - height));
    ImGui::SetNextWindowSize(ImVec2(viewport->WorkSize.x, height));

    ImGui::Begin("StatusBar", nullptr, flags);

    float text_height = ImGui::GetTextLineHeight();
    float padding_y = (height - text_height) * 0.5f - ImGui::GetStyle().WindowPadding.y;
    if (padding_y > 0) {
        ImGui::SetCursorPosY(ImGui::GetCursorPosY() + padding_y);
    }

    if (!state.error_message.empty()) {
        ImGui::TextColored(palette::kError, "%s", state.error_message.c_str());
    } else {
        ImGui::Text("%s", state.status_message.c_str());
    }

    if (auto source = session.source()) {
        std::string info = fmt::format("{}x{} | {:.0f}% | {} | {}",
                                       source->width(), source->height(),
                                       session.zoom() * 100.0f,
                                       to_string(session.algorithm()),
                                       to_string(session.throttle().phase()));
        if (auto index = session.current_index()) {
            info += fmt::format(" | {}/{}", *index + 1, session.collection().size());
        }

        float text_width = ImGui::CalcTextSize(info.c_str()).x;
        ImGui::SameLine(ImGui::GetWindowWidth() - text_width - 10.0f * scale);
        ImGui::Text("%s", info.c_str());
    }

    ImGui::End();
}

void MainWindow::render_about_dialog() {
    ImGui::OpenPopup("About");

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));

    if (ImGui::BeginPopupModal("About", &m_controller.state().show_about_dialog,
                                ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Loupe");
        ImGui::Text("Version %s", APP_VERSION);
        ImGui::Separator();
        ImGui::Text("Zoomable image viewer with selectable resampling.");
        ImGui::Text("Fast previews while dragging, full quality on release.");
        ImGui::Spacing();
        ImGui::Text("License: MIT");
        ImGui::Spacing();

        float ok_width = 120.0f * m_controller.state().dpi_scale;
        if (ImGui::Button("OK", ImVec2(ok_width, 0))) {
            m_controller.state().show_about_dialog = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

// =============================================================================
// Actions
// =============================================================================

void MainWindow::action_open_file() {
    if (auto path = open_file_dialog()) {
        m_controller.load_image(*path);
    }
}

void MainWindow::action_open_folder() {
    if (auto path = pick_folder_dialog()) {
        m_controller.open_folder(*path);
    }
}

void MainWindow::action_zoom_step(int delta) {
    auto& session = m_controller.session();
    session.on_slider_moved(session.slider_value() + delta);
    session.on_slider_released();
}

void MainWindow::action_zoom_reset() {
    auto& session = m_controller.session();
    session.on_slider_moved(kSliderNeutral);
    session.on_slider_released();
}

void MainWindow::action_toggle_hand_tool() {
    auto& session = m_controller.session();
    session.set_hand_tool(!session.hand_tool());
}

void MainWindow::action_set_fullscreen(bool fullscreen) {
    if (m_window && !SDL_SetWindowFullscreen(m_window, fullscreen)) {
        spdlog::error("Failed to change fullscreen mode: {}", SDL_GetError());
        return;
    }
    m_controller.state().fullscreen = fullscreen;
}

}  // namespace loupe::gui
