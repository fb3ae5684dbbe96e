/**
 * @file    app_controller.hpp
 * @brief   Application Controller
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Coordinates between the View layer and the ViewerSession.
 * Forwards user actions, pumps the session once per frame and keeps the
 * GPU textures (view and thumbnails) in sync with its results.
 */

#pragma once

#include "app/viewer_session.hpp"
#include "gui/app/app_state.hpp"
#include "gui/backend/render_backend.hpp"
#include "io/directory_tree.hpp"

#include <filesystem>
#include <unordered_map>

namespace loupe::gui {

class AppController {
public:
    /**
     * @param backend  Render backend (must outlive controller)
     * @param session  Viewer session (must outlive controller)
     */
    AppController(IRenderBackend& backend, ViewerSession& session);

    ~AppController();

    // Non-copyable, non-movable (holds references)
    AppController(const AppController&) = delete;
    AppController& operator=(const AppController&) = delete;
    AppController(AppController&&) = delete;
    AppController& operator=(AppController&&) = delete;

    // ==========================================================================
    // State Access
    // ==========================================================================

    [[nodiscard]] const AppState& state() const noexcept { return m_state; }
    [[nodiscard]] AppState& state() noexcept { return m_state; }

    [[nodiscard]] ViewerSession& session() noexcept { return m_session; }
    [[nodiscard]] const ViewerSession& session() const noexcept { return m_session; }

    [[nodiscard]] DirectoryTree& tree() noexcept { return m_tree; }
    [[nodiscard]] NodeId recents_node() const noexcept { return m_recents_node; }

    // ==========================================================================
    // Actions
    // ==========================================================================

    bool load_image(const std::filesystem::path& path);

    /**
     * Browse a folder: its images become the gallery collection
     */
    void open_folder(const std::filesystem::path& dir);

    /**
     * Show the recent list in the gallery
     */
    void show_recents();

    void next_image();
    void previous_image();

    // ==========================================================================
    // Frame
    // ==========================================================================

    /**
     * Pump the session and refresh textures; call once per frame
     */
    void update();

    [[nodiscard]] void* get_view_texture_id() const;

    /**
     * Texture of a cached thumbnail, nullptr while it is being built
     */
    [[nodiscard]] void* get_thumbnail_texture_id(const std::filesystem::path& path);

private:
    struct PathHash {
        std::size_t operator()(const std::filesystem::path& p) const noexcept {
            return std::filesystem::hash_value(p);
        }
    };

    AppState m_state;
    IRenderBackend& m_backend;
    ViewerSession& m_session;

    DirectoryTree m_tree;
    NodeId m_recents_node{kInvalidNode};

    std::unordered_map<std::filesystem::path, TextureHandle, PathHash> m_thumbnail_textures;

    void refresh_recents_node();
    void update_view_texture();
    void prune_thumbnail_textures();
};

}  // namespace loupe::gui
