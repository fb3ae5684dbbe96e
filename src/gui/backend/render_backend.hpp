/**
 * @file    render_backend.hpp
 * @brief   Texture and frame interface used by the viewer UI
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * The viewer draws everything through Dear ImGui. A backend owns the
 * graphics context, drives the ImGui platform/renderer pair and keeps the
 * textures for the displayed render and the gallery thumbnails.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

struct SDL_Window;

namespace loupe::gui {

enum class BackendError {
    None,
    InitFailed,
    ContextCreationFailed,
    TextureCreationFailed,
    TextureUpdateFailed
};

[[nodiscard]] constexpr std::string_view to_string(BackendError error) noexcept {
    switch (error) {
        case BackendError::None:                  return "none";
        case BackendError::InitFailed:            return "backend not initialized";
        case BackendError::ContextCreationFailed: return "no graphics context";
        case BackendError::TextureCreationFailed: return "texture allocation failed";
        case BackendError::TextureUpdateFailed:   return "texture upload rejected";
        default:                                  return "unknown";
    }
}

// =============================================================================
// Textures
// =============================================================================

struct TextureHandle {
    uint64_t id{0};

    [[nodiscard]] constexpr bool valid() const noexcept { return id != 0; }
    explicit constexpr operator bool() const noexcept { return valid(); }

    constexpr bool operator==(const TextureHandle&) const noexcept = default;
};

enum class TextureFormat {
    RGB8,
    RGBA8
};

[[nodiscard]] constexpr std::size_t bytes_per_pixel(TextureFormat format) noexcept {
    return format == TextureFormat::RGB8 ? 3 : 4;
}

enum class TextureFilter {
    Linear,     // Thumbnails
    Nearest     // Rendered view; the resampler already chose the look
};

struct TextureDesc {
    uint32_t width{0};
    uint32_t height{0};
    TextureFormat format{TextureFormat::RGBA8};
    TextureFilter filter{TextureFilter::Linear};

    [[nodiscard]] constexpr std::size_t byte_size() const noexcept {
        return static_cast<std::size_t>(width) * height * bytes_per_pixel(format);
    }

    constexpr bool operator==(const TextureDesc&) const noexcept = default;
};

// =============================================================================
// Backend
// =============================================================================

class IRenderBackend {
public:
    virtual ~IRenderBackend() = default;

    IRenderBackend(const IRenderBackend&) = delete;
    IRenderBackend& operator=(const IRenderBackend&) = delete;

    /**
     * Attach to a window created with window_flags()
     * @return  false on failure, reason in last_error()
     */
    [[nodiscard]] virtual bool init(SDL_Window* window) = 0;
    virtual void shutdown() = 0;

    [[nodiscard]] virtual uint64_t window_flags() const noexcept = 0;

    virtual void imgui_init() = 0;
    virtual void imgui_shutdown() = 0;
    virtual void imgui_new_frame() = 0;
    virtual void imgui_render() = 0;

    virtual void begin_frame() = 0;
    virtual void end_frame() = 0;
    virtual void present() = 0;
    virtual void on_resize(int width, int height) = 0;

    /**
     * Allocate a texture
     * @param data  Tightly packed rows, desc.byte_size() bytes, or empty
     * @return      Invalid handle on failure
     */
    [[nodiscard]] virtual TextureHandle
    create_texture(const TextureDesc& desc, std::span<const uint8_t> data = {}) = 0;

    /**
     * Overwrite a texture with a same-sized image
     * @return  false for unknown handles or a size mismatch
     */
    virtual bool update_texture(TextureHandle handle, std::span<const uint8_t> data) = 0;

    virtual void destroy_texture(TextureHandle handle) = 0;

    // nullptr for unknown handles
    [[nodiscard]] virtual void* get_imgui_texture_id(TextureHandle handle) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] BackendError last_error() const noexcept { return m_last_error; }

protected:
    IRenderBackend() = default;

    void set_error(BackendError error) noexcept { m_last_error = error; }
    void clear_error() noexcept { m_last_error = BackendError::None; }

    BackendError m_last_error{BackendError::None};
};

[[nodiscard]] std::unique_ptr<IRenderBackend> create_backend();

}  // namespace loupe::gui
