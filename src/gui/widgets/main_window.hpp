/**
 * @file    main_window.hpp
 * @brief   Main Window UI
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "gui/app/app_controller.hpp"
#include "gui/widgets/image_preview.hpp"
#include "io/directory_tree.hpp"

#include <filesystem>
#include <memory>
#include <optional>

struct SDL_Window;
union SDL_Event;

namespace loupe::gui {

class MainWindow {
public:
    MainWindow(AppController& controller, SDL_Window* window);
    ~MainWindow();

    // Non-copyable
    MainWindow(const MainWindow&) = delete;
    MainWindow& operator=(const MainWindow&) = delete;

    /**
     * Render one frame of UI
     */
    void render();

    /**
     * Handle SDL events (shortcuts, drag & drop)
     * @return  true if event was consumed
     */
    bool handle_event(const SDL_Event& event);

private:
    AppController& m_controller;
    SDL_Window* m_window;
    std::unique_ptr<ImagePreview> m_image_preview;

    // Tree / gallery clicks are applied after the widgets finish iterating
    std::optional<NodeId> m_pending_toggle;
    std::optional<std::filesystem::path> m_pending_load;

    // UI components
    void render_menu_bar();
    void render_browser();
    void render_tree_node(NodeId id);
    void render_control_panel();
    void render_gallery();
    void render_status_bar();
    void render_about_dialog();
    void apply_pending();

    // Actions
    void action_open_file();
    void action_open_folder();
    void action_zoom_step(int delta);
    void action_zoom_reset();
    void action_toggle_hand_tool();
    void action_set_fullscreen(bool fullscreen);
};

}  // namespace loupe::gui
