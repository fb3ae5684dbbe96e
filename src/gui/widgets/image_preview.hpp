/**
 * @file    image_preview.hpp
 * @brief   Image Preview Widget
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "gui/app/app_controller.hpp"
#include <imgui.h>

namespace loupe::gui {

class ImagePreview {
public:
    explicit ImagePreview(AppController& controller);
    ~ImagePreview() = default;

    // Non-copyable
    ImagePreview(const ImagePreview&) = delete;
    ImagePreview& operator=(const ImagePreview&) = delete;

    /**
     * Render the preview
     * Call within ImGui context
     */
    void render();

private:
    AppController& m_controller;
    bool m_dragging{false};

    void render_image();
    void render_placeholder();
    void handle_input();
    [[nodiscard]] ImVec2 to_image(const ImVec2& screen) const;
};

}  // namespace loupe::gui
