/**
 * @file    image_preview.cpp
 * @brief   Image Preview Widget Implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * The rendered buffer always has the source dimensions, so the widget
 * only fits it to the available area. Zoom and pan happen in the render
 * pipeline; pointer motion is converted back to image pixels before it is
 * handed to the session.
 */

#include "gui/widgets/image_preview.hpp"

#include <imgui.h>
#include <algorithm>

namespace loupe::gui {

namespace {

constexpr int kWheelSliderStep = 5;

}  // anonymous namespace

ImagePreview::ImagePreview(AppController& controller)
    : m_controller(controller)
{
}

void ImagePreview::render() {
    if (!m_controller.session().has_image() || !m_controller.state().view.valid()) {
        render_placeholder();
        return;
    }

    render_image();
}

void ImagePreview::render_placeholder() {
    ImVec2 avail = ImGui::GetContentRegionAvail();
    ImVec2 content_start = ImGui::GetCursorScreenPos();

    const char* text = m_controller.session().has_image()
        ? "Rendering..."
        : "Drop an image here or press Ctrl+O";
    ImVec2 text_size = ImGui::CalcTextSize(text);

    ImVec2 text_pos(
        content_start.x + (avail.x - text_size.x) * 0.5f,
        content_start.y + (avail.y - text_size.y) * 0.5f
    );

    ImGui::SetCursorScreenPos(text_pos);
    ImGui::TextDisabled("%s", text);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();

    float margin = 10.0f;
    ImVec2 p_min(content_start.x + margin, content_start.y + margin);
    ImVec2 p_max(content_start.x + avail.x - margin, content_start.y + avail.y - margin);

    draw_list->AddRect(p_min, p_max, IM_COL32(128, 128, 128, 128), 0, 0, 1.0f);
}

void ImagePreview::render_image() {
    auto& state = m_controller.state();
    const auto& session = m_controller.session();

    void* tex_id = m_controller.get_view_texture_id();
    if (!tex_id) return;

    ImVec2 viewport_size = ImGui::GetContentRegionAvail();
    ImVec2 viewport_start = ImGui::GetCursorScreenPos();

    float img_w = static_cast<float>(state.view.desc.width);
    float img_h = static_cast<float>(state.view.desc.height);

    // Fit to viewport
    float fit_scale = std::min(viewport_size.x / img_w, viewport_size.y / img_h);
    fit_scale = std::max(fit_scale, 0.01f);

    float display_w = img_w * fit_scale;
    float display_h = img_h * fit_scale;

    ImVec2 image_pos(
        viewport_start.x + (viewport_size.x - display_w) * 0.5f,
        viewport_start.y + (viewport_size.y - display_h) * 0.5f
    );

    ImGui::InvisibleButton("##image_area", viewport_size,
                           ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonMiddle);

    state.layout.origin_x = image_pos.x;
    state.layout.origin_y = image_pos.y;
    state.layout.fit_scale = fit_scale;
    state.layout.hovered = ImGui::IsItemHovered();

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    draw_list->AddImage(
        reinterpret_cast<ImTextureID>(tex_id),
        image_pos,
        ImVec2(image_pos.x + display_w, image_pos.y + display_h),
        ImVec2(0, 0), ImVec2(1, 1), IM_COL32_WHITE
    );

    handle_input();

    // Info overlay
    ImGui::SetCursorScreenPos(ImVec2(viewport_start.x + 5, viewport_start.y + 5));
    ImGui::Text("%.0f%% | %s%s",
                session.zoom() * 100.0f,
                to_string(state.view.tier).data(),
                session.gesture_active() ? " | ..." : "");
}

ImVec2 ImagePreview::to_image(const ImVec2& screen) const {
    const auto& layout = m_controller.state().layout;
    return ImVec2(
        (screen.x - layout.origin_x) / layout.fit_scale,
        (screen.y - layout.origin_y) / layout.fit_scale
    );
}

void ImagePreview::handle_input() {
    auto& session = m_controller.session();
    const auto& layout = m_controller.state().layout;
    ImGuiIO& io = ImGui::GetIO();

    // Mouse wheel zoom: one wheel notch is a complete slider gesture
    if (layout.hovered && io.MouseWheel != 0.0f && !io.KeyCtrl) {
        const int step = io.MouseWheel > 0.0f ? kWheelSliderStep : -kWheelSliderStep;
        session.on_slider_moved(session.slider_value() + step);
        session.on_slider_released();
    }

    if (!session.hand_tool()) {
        if (m_dragging) {
            m_dragging = false;
            session.on_pointer_released();
        }
        return;
    }

    if (layout.hovered) {
        ImGui::SetMouseCursor(m_dragging ? ImGuiMouseCursor_ResizeAll : ImGuiMouseCursor_Hand);
    }

    if (ImGui::IsItemActivated() && ImGui::IsMouseDown(ImGuiMouseButton_Left)) {
        const ImVec2 pos = to_image(io.MousePos);
        session.on_pointer_pressed(pos.x, pos.y);
        m_dragging = true;
    }

    if (m_dragging) {
        if (io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f) {
            const ImVec2 pos = to_image(io.MousePos);
            session.on_pointer_moved(pos.x, pos.y);
        }
        if (ImGui::IsMouseReleased(ImGuiMouseButton_Left)) {
            session.on_pointer_released();
            m_dragging = false;
        }
    }
}

}  // namespace loupe::gui
