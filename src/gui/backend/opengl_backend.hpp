/**
 * @file    opengl_backend.hpp
 * @brief   OpenGL implementation of the viewer backend
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "gui/backend/render_backend.hpp"

#include <SDL3/SDL.h>

#include <cstdint>
#include <unordered_map>

namespace loupe::gui {

class OpenGLBackend final : public IRenderBackend {
public:
    OpenGLBackend() = default;
    ~OpenGLBackend() override;

    [[nodiscard]] bool init(SDL_Window* window) override;
    void shutdown() override;
    [[nodiscard]] uint64_t window_flags() const noexcept override { return SDL_WINDOW_OPENGL; }

    void imgui_init() override;
    void imgui_shutdown() override;
    void imgui_new_frame() override;
    void imgui_render() override;

    void begin_frame() override;
    void end_frame() override {}
    void present() override;
    void on_resize(int width, int height) override;

    [[nodiscard]] TextureHandle
    create_texture(const TextureDesc& desc, std::span<const uint8_t> data = {}) override;
    bool update_texture(TextureHandle handle, std::span<const uint8_t> data) override;
    void destroy_texture(TextureHandle handle) override;

    [[nodiscard]] void* get_imgui_texture_id(TextureHandle handle) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "OpenGL"; }

private:
    struct GlTexture {
        uint32_t name{0};
        TextureDesc desc;
    };

    SDL_Window* m_window{nullptr};
    SDL_GLContext m_context{nullptr};

    std::unordered_map<uint64_t, GlTexture> m_textures;
    uint64_t m_next_id{1};

    int m_viewport_width{0};
    int m_viewport_height{0};

    [[nodiscard]] bool ready() const noexcept { return m_context != nullptr; }

    static void upload(const GlTexture& texture, const void* pixels, bool allocate);
    static void release(GlTexture& texture);
};

}  // namespace loupe::gui
