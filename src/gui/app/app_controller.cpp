/**
 * @file    app_controller.cpp
 * @brief   Application Controller Implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "gui/app/app_controller.hpp"
#include "io/image_codec.hpp"
#include "utils/path_formatter.hpp"

#include <SDL3/SDL.h>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <span>
#include <vector>

namespace loupe::gui {

namespace {

cv::Mat prepare_texture_data(const cv::Mat& rgb) {
    cv::Mat rgba;
    if (rgb.channels() == 3) {
        cv::cvtColor(rgb, rgba, cv::COLOR_RGB2RGBA);
    } else if (rgb.channels() == 1) {
        cv::cvtColor(rgb, rgba, cv::COLOR_GRAY2RGBA);
    } else {
        rgba = rgb.clone();
    }
    return rgba;
}

std::span<const uint8_t> pixel_span(const cv::Mat& image) {
    return {image.data, image.total() * image.elemSize()};
}

std::filesystem::path home_directory() {
    if (const char* home = SDL_GetUserFolder(SDL_FOLDER_HOME)) {
        return path_from_utf8(home);
    }
    return std::filesystem::current_path();
}

}  // anonymous namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

AppController::AppController(IRenderBackend& backend, ViewerSession& session)
    : m_backend(backend)
    , m_session(session)
{
    m_recents_node = m_tree.add_virtual_root("Recents", {});
    refresh_recents_node();

    const NodeId home = m_tree.add_root(home_directory());
    m_tree.toggle(home);

    spdlog::debug("AppController initialized");
}

AppController::~AppController() {
    if (m_state.view.handle.valid()) {
        m_backend.destroy_texture(m_state.view.handle);
    }
    for (const auto& [path, handle] : m_thumbnail_textures) {
        m_backend.destroy_texture(handle);
    }
}

// =============================================================================
// Actions
// =============================================================================

bool AppController::load_image(const std::filesystem::path& path) {
    if (!m_session.load_image(path)) {
        m_state.error_message = m_session.last_error();
        m_state.status_message = "Load failed";
        return false;
    }

    m_state.error_message.clear();
    m_state.status_message = fmt::format("Loaded: {}", filename_utf8(path));
    refresh_recents_node();
    return true;
}

void AppController::open_folder(const std::filesystem::path& dir) {
    const std::size_t count = m_session.open_directory(dir);
    m_session.request_thumbnails();
    m_state.status_message = fmt::format("{}: {} images", filename_utf8(dir), count);
}

void AppController::show_recents() {
    m_session.show_recents();
    m_session.request_thumbnails();
    m_state.status_message = "Recent images";
}

void AppController::next_image() {
    if (m_session.next_image()) {
        refresh_recents_node();
        m_state.error_message.clear();
    } else if (!m_session.collection().empty()) {
        m_state.error_message = m_session.last_error();
    }
}

void AppController::previous_image() {
    if (m_session.previous_image()) {
        refresh_recents_node();
        m_state.error_message.clear();
    } else if (!m_session.collection().empty()) {
        m_state.error_message = m_session.last_error();
    }
}

void AppController::refresh_recents_node() {
    std::vector<std::filesystem::path> paths;
    const auto& items = m_session.recents().items();
    for (auto it = items.rbegin(); it != items.rend(); ++it) {
        paths.push_back(it->path);
    }
    m_tree.set_virtual_children(m_recents_node, paths);
}

// =============================================================================
// Frame
// =============================================================================

void AppController::update() {
    if (m_session.pump()) {
        prune_thumbnail_textures();
    }
    update_view_texture();

    if (!m_session.last_error().empty() && m_state.error_message.empty()) {
        m_state.error_message = m_session.last_error();
    }
}

void* AppController::get_view_texture_id() const {
    return m_backend.get_imgui_texture_id(m_state.view.handle);
}

void* AppController::get_thumbnail_texture_id(const std::filesystem::path& path) {
    if (auto it = m_thumbnail_textures.find(path); it != m_thumbnail_textures.end()) {
        return m_backend.get_imgui_texture_id(it->second);
    }

    const auto thumbnail = m_session.thumbnail(path);
    if (!thumbnail || thumbnail->pixels.empty()) {
        return nullptr;
    }

    const cv::Mat rgba = prepare_texture_data(thumbnail->pixels);

    TextureDesc desc;
    desc.width = static_cast<uint32_t>(rgba.cols);
    desc.height = static_cast<uint32_t>(rgba.rows);

    const TextureHandle handle = m_backend.create_texture(desc, pixel_span(rgba));
    if (!handle.valid()) {
        spdlog::error("Failed to create thumbnail texture: {}", to_string(m_backend.last_error()));
        return nullptr;
    }

    m_thumbnail_textures.emplace(path, handle);
    return m_backend.get_imgui_texture_id(handle);
}

void AppController::update_view_texture() {
    const RenderedBuffer* buffer = m_session.displayed_buffer();
    if (!buffer) {
        return;
    }
    if (m_state.view.valid() && m_state.view.sequence == buffer->sequence) {
        return;
    }

    const cv::Mat rgb = decode_png(buffer->bytes);
    if (rgb.empty()) {
        spdlog::error("Rendered buffer #{} could not be decoded", buffer->sequence);
        m_state.view.sequence = buffer->sequence;   // Do not retry every frame
        return;
    }

    const cv::Mat rgba = prepare_texture_data(rgb);

    TextureDesc desc;
    desc.width = static_cast<uint32_t>(rgba.cols);
    desc.height = static_cast<uint32_t>(rgba.rows);
    desc.filter = TextureFilter::Nearest;

    const bool reused = m_state.view.valid() && m_state.view.desc == desc
        && m_backend.update_texture(m_state.view.handle, pixel_span(rgba));

    if (!reused) {
        if (m_state.view.valid()) {
            m_backend.destroy_texture(m_state.view.handle);
        }
        m_state.view.handle = m_backend.create_texture(desc, pixel_span(rgba));
        m_state.view.desc = desc;
        if (!m_state.view.valid()) {
            spdlog::error("Failed to create texture: {}", to_string(m_backend.last_error()));
        }
    }

    m_state.view.sequence = buffer->sequence;
    m_state.view.tier = buffer->tier;
}

void AppController::prune_thumbnail_textures() {
    // Textures follow the cache; evicted thumbnails release their texture
    const auto& cache = m_session.thumbnails();
    for (auto it = m_thumbnail_textures.begin(); it != m_thumbnail_textures.end();) {
        if (!cache.contains(it->first)) {
            m_backend.destroy_texture(it->second);
            it = m_thumbnail_textures.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace loupe::gui
