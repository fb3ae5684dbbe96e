/**
 * @file    app_state.hpp
 * @brief   Application State for GUI
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * UI-only state shared by the GUI components. Everything about the image,
 * the view and the render slots lives in the ViewerSession; this struct
 * only holds what the widgets need between frames.
 */

#pragma once

#include "core/types.hpp"
#include "gui/backend/render_backend.hpp"

#include <cstdint>
#include <string>

namespace loupe::gui {

// =============================================================================
// View Texture
// =============================================================================

/**
 * GPU copy of the session's displayed buffer
 */
struct ViewTexture {
    TextureHandle handle;
    TextureDesc desc;
    uint64_t sequence{0};           // Sequence of the uploaded buffer
    RenderTier tier{RenderTier::Final};

    [[nodiscard]] bool valid() const noexcept { return handle.valid(); }
};

// =============================================================================
// Image Area Layout
// =============================================================================

/**
 * Where the image was drawn last frame (screen coordinates)
 */
struct ViewLayout {
    float origin_x{0.0f};
    float origin_y{0.0f};
    float fit_scale{1.0f};          // Screen pixels per image pixel
    bool hovered{false};
};

// =============================================================================
// Main Application State
// =============================================================================

struct AppState {
    std::string status_message{"Ready"};
    std::string error_message;

    ViewTexture view;
    ViewLayout layout;

    // UI state
    bool show_about_dialog{false};
    bool fullscreen{false};
    bool show_gallery{true};

    // Display scaling
    float dpi_scale{1.0f};

    /**
     * Scale a pixel value by DPI
     */
    [[nodiscard]] float scaled(float pixels) const noexcept {
        return pixels * dpi_scale;
    }
};

}  // namespace loupe::gui
