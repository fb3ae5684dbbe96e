/**
 * @file    opengl_backend.cpp
 * @brief   OpenGL implementation of the viewer backend
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Texture work only uses OpenGL 1.1 entry points, which every platform
 * GL library exports directly, so no function loader is needed here.
 * The ImGui OpenGL3 renderer carries its own loader for the rest.
 */

#include "gui/backend/opengl_backend.hpp"
#include "gui/resources/style.hpp"

#include <SDL3/SDL.h>
#include <SDL3/SDL_opengl.h>
#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_opengl3.h>

#include <spdlog/spdlog.h>

namespace loupe::gui {

namespace {

const char* gl_string(GLenum name) {
    const auto* value = reinterpret_cast<const char*>(glGetString(name));
    return value ? value : "?";
}

GLenum gl_pixel_format(TextureFormat format) {
    return format == TextureFormat::RGB8 ? GL_RGB : GL_RGBA;
}

}  // anonymous namespace

OpenGLBackend::~OpenGLBackend() {
    shutdown();
}

bool OpenGLBackend::init(SDL_Window* window) {
    if (ready()) {
        return true;
    }
    if (!window) {
        set_error(BackendError::InitFailed);
        return false;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    m_context = SDL_GL_CreateContext(window);
    if (!m_context) {
        spdlog::error("SDL_GL_CreateContext: {}", SDL_GetError());
        set_error(BackendError::ContextCreationFailed);
        return false;
    }

    m_window = window;
    SDL_GL_MakeCurrent(window, m_context);
    SDL_GL_SetSwapInterval(1);
    SDL_GetWindowSizeInPixels(window, &m_viewport_width, &m_viewport_height);

    spdlog::info("GL {} on {} ({})", gl_string(GL_VERSION), gl_string(GL_RENDERER), gl_string(GL_VENDOR));

    clear_error();
    return true;
}

void OpenGLBackend::shutdown() {
    if (!ready()) {
        return;
    }

    for (auto& [id, texture] : m_textures) {
        release(texture);
    }
    m_textures.clear();

    SDL_GL_DestroyContext(m_context);
    m_context = nullptr;
    m_window = nullptr;
}

// =============================================================================
// ImGui
// =============================================================================

void OpenGLBackend::imgui_init() {
    if (!ready()) {
        return;
    }

    ImGui_ImplSDL3_InitForOpenGL(m_window, m_context);
#if defined(__APPLE__)
    ImGui_ImplOpenGL3_Init("#version 150");
#else
    ImGui_ImplOpenGL3_Init("#version 130");
#endif
}

void OpenGLBackend::imgui_shutdown() {
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
}

void OpenGLBackend::imgui_new_frame() {
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL3_NewFrame();
}

void OpenGLBackend::imgui_render() {
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

// =============================================================================
// Frame
// =============================================================================

void OpenGLBackend::begin_frame() {
    const ImVec4& bg = palette::kBackground;
    glViewport(0, 0, m_viewport_width, m_viewport_height);
    glClearColor(bg.x, bg.y, bg.z, bg.w);
    glClear(GL_COLOR_BUFFER_BIT);
}

void OpenGLBackend::present() {
    SDL_GL_SwapWindow(m_window);
}

void OpenGLBackend::on_resize(int width, int height) {
    m_viewport_width = width;
    m_viewport_height = height;
}

// =============================================================================
// Textures
// =============================================================================

void OpenGLBackend::upload(const GlTexture& texture, const void* pixels, bool allocate) {
    const TextureDesc& desc = texture.desc;
    const GLenum format = gl_pixel_format(desc.format);
    const auto width = static_cast<GLsizei>(desc.width);
    const auto height = static_cast<GLsizei>(desc.height);

    glBindTexture(GL_TEXTURE_2D, texture.name);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);   // RGB rows are not 4-byte aligned

    if (allocate) {
        const GLint filter = desc.filter == TextureFilter::Nearest ? GL_NEAREST : GL_LINEAR;
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, filter);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, filter);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        glTexImage2D(GL_TEXTURE_2D, 0, static_cast<GLint>(format), width, height, 0,
                     format, GL_UNSIGNED_BYTE, pixels);
    } else {
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, width, height, format, GL_UNSIGNED_BYTE, pixels);
    }

    glBindTexture(GL_TEXTURE_2D, 0);
}

void OpenGLBackend::release(GlTexture& texture) {
    if (texture.name) {
        GLuint gl_name = texture.name;
        glDeleteTextures(1, &gl_name);
        texture.name = 0;
    }
}

TextureHandle
OpenGLBackend::create_texture(const TextureDesc& desc, std::span<const uint8_t> data) {
    if (!ready()) {
        set_error(BackendError::InitFailed);
        return {};
    }
    if (desc.width == 0 || desc.height == 0 || (!data.empty() && data.size() != desc.byte_size())) {
        spdlog::warn("Rejected {}x{} texture with {} bytes", desc.width, desc.height, data.size());
        set_error(BackendError::TextureCreationFailed);
        return {};
    }

    GLuint gl_name = 0;
    glGenTextures(1, &gl_name);
    if (!gl_name) {
        set_error(BackendError::TextureCreationFailed);
        return {};
    }

    GlTexture texture{gl_name, desc};
    upload(texture, data.empty() ? nullptr : data.data(), true);

    const TextureHandle handle{m_next_id++};
    m_textures.emplace(handle.id, texture);

    clear_error();
    return handle;
}

bool OpenGLBackend::update_texture(TextureHandle handle, std::span<const uint8_t> data) {
    auto it = m_textures.find(handle.id);
    if (it == m_textures.end() || data.size() != it->second.desc.byte_size()) {
        set_error(BackendError::TextureUpdateFailed);
        return false;
    }

    upload(it->second, data.data(), false);
    return true;
}

void OpenGLBackend::destroy_texture(TextureHandle handle) {
    auto it = m_textures.find(handle.id);
    if (it == m_textures.end()) {
        return;
    }
    release(it->second);
    m_textures.erase(it);
}

void* OpenGLBackend::get_imgui_texture_id(TextureHandle handle) const {
    auto it = m_textures.find(handle.id);
    if (it == m_textures.end()) {
        return nullptr;
    }
    return reinterpret_cast<void*>(static_cast<intptr_t>(it->second.name));
}

}  // namespace loupe::gui
