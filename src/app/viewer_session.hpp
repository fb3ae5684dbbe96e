/**
 * @file    viewer_session.hpp
 * @brief   Interactive viewing session: state, dispatch and result apply
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * The session is driven from a single thread (the UI loop). Input handlers
 * update zoom / pan / algorithm, consult the interaction throttle and
 * dispatch render jobs to an executor. Completed jobs come back through an
 * event queue that pump() drains; nothing a worker produces touches the
 * session state directly.
 *
 * Every render result carries:
 *   - generation: bumped on image load and algorithm change, results from
 *     an older generation are dropped
 *   - sequence:   monotonically increasing per dispatch, an older result
 *     never replaces a newer one in the same slot
 */

#pragma once

#include "app/task_pool.hpp"
#include "core/interaction_throttle.hpp"
#include "core/raster.hpp"
#include "core/render_pipeline.hpp"
#include "core/thumbnail_cache.hpp"
#include "core/types.hpp"
#include "core/viewport_mapper.hpp"
#include "io/image_codec.hpp"
#include "io/recent_list.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace loupe {

struct SessionConfig {
    ThrottleConfig throttle{};
    std::size_t thumbnail_capacity{kDefaultThumbnailCapacity};
    int thumbnail_size{kThumbnailSize};
    std::size_t recent_capacity{kDefaultRecentCapacity};
    ResamplingAlgorithm default_algorithm{ResamplingAlgorithm::Lanczos3};
};

// =============================================================================
// Worker Events
// =============================================================================

struct RenderCompleted {
    uint64_t generation{0};
    uint64_t sequence{0};
    RenderTier tier{RenderTier::Final};
    std::optional<RenderedBuffer> buffer;   // Empty on failure
    std::string error;
};

struct ThumbnailCompleted {
    std::filesystem::path path;
    Thumbnail thumbnail;
};

using SessionEvent = std::variant<RenderCompleted, ThumbnailCompleted>;

// =============================================================================
// Viewer Session
// =============================================================================

class ViewerSession {
public:
    using TimeSource = std::function<Clock::time_point()>;

    ViewerSession(
        std::shared_ptr<const IImageSource> images,
        ITaskExecutor& executor,
        SessionConfig config = {},
        TimeSource clock = [] { return Clock::now(); }
    );

    ViewerSession(const ViewerSession&) = delete;
    ViewerSession& operator=(const ViewerSession&) = delete;

    // -------------------------------------------------------------------------
    // Image
    // -------------------------------------------------------------------------

    /**
     * Decode and show an image
     *
     * Resets zoom, pan and the interaction state and dispatches one Final
     * render. On failure the previous image stays loaded.
     *
     * @return  true if the image was loaded
     */
    bool load_image(const std::filesystem::path& path);

    [[nodiscard]] bool has_image() const noexcept { return m_source != nullptr; }
    [[nodiscard]] const std::filesystem::path& current_path() const noexcept { return m_current_path; }
    [[nodiscard]] std::shared_ptr<const SourceRaster> source() const noexcept { return m_source; }

    // -------------------------------------------------------------------------
    // Input
    // -------------------------------------------------------------------------

    void on_slider_moved(int value);
    void on_slider_released();

    /**
     * Pointer events in image pixels; they only pan while the hand tool is on
     */
    void on_pointer_pressed(float x, float y);
    void on_pointer_moved(float x, float y);
    void on_pointer_released();

    void set_hand_tool(bool enabled);
    void set_algorithm(ResamplingAlgorithm algorithm);

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------

    /**
     * Apply finished jobs, then fire a due Final render
     * @return  true if the displayed buffer or a thumbnail changed
     */
    bool pump();

    /**
     * Buffer the view should show, or nullptr before the first render lands
     */
    [[nodiscard]] const RenderedBuffer* displayed_buffer() const noexcept;

    [[nodiscard]] const std::optional<RenderedBuffer>& preview_buffer() const noexcept { return m_preview; }
    [[nodiscard]] const std::optional<RenderedBuffer>& final_buffer() const noexcept { return m_final; }

    // -------------------------------------------------------------------------
    // Collection / gallery
    // -------------------------------------------------------------------------

    /**
     * Use the images of a directory as the navigation collection
     * @return  Number of images found
     */
    std::size_t open_directory(const std::filesystem::path& directory);

    /**
     * Use the recent list as the navigation collection
     */
    std::size_t show_recents();

    /**
     * Load the next / previous collection entry, wrapping around
     * @return  false if the collection is empty or the load failed
     */
    bool next_image();
    bool previous_image();

    /**
     * Queue thumbnail builds for collection entries not cached or in flight
     * @return  Number of jobs dispatched
     */
    std::size_t request_thumbnails();

    /**
     * Queue one thumbnail build unless it is cached or already in flight
     * @return  true if a job was dispatched
     */
    bool request_thumbnail(const std::filesystem::path& path);

    /**
     * Cached thumbnail (marks it recently used), nullptr if not ready
     */
    [[nodiscard]] ThumbnailCache::Entry thumbnail(const std::filesystem::path& path);

    [[nodiscard]] const std::vector<std::filesystem::path>& collection() const noexcept { return m_collection; }
    [[nodiscard]] std::optional<std::size_t> current_index() const noexcept { return m_index; }
    [[nodiscard]] const RecentList& recents() const noexcept { return m_recents; }
    [[nodiscard]] const ThumbnailCache& thumbnails() const noexcept { return m_thumbnails; }

    // -------------------------------------------------------------------------
    // State
    // -------------------------------------------------------------------------

    [[nodiscard]] int slider_value() const noexcept { return m_slider; }
    [[nodiscard]] float zoom() const noexcept { return m_zoom; }
    [[nodiscard]] PanOffset pan() const noexcept { return m_pan; }
    [[nodiscard]] ResamplingAlgorithm algorithm() const noexcept { return m_algorithm; }
    [[nodiscard]] bool hand_tool() const noexcept { return m_hand_tool; }
    [[nodiscard]] uint64_t generation() const noexcept { return m_generation; }
    [[nodiscard]] const InteractionThrottle& throttle() const noexcept { return m_throttle; }
    [[nodiscard]] bool gesture_active() const noexcept { return m_throttle.gesture_active(); }
    [[nodiscard]] const std::string& last_error() const noexcept { return m_last_error; }

    /**
     * Request the current view would be rendered with
     */
    [[nodiscard]] RenderRequest current_request(RenderTier tier) const noexcept;

private:
    struct PathHash {
        std::size_t operator()(const std::filesystem::path& p) const noexcept {
            return std::filesystem::hash_value(p);
        }
    };

    std::shared_ptr<const IImageSource> m_images;
    ITaskExecutor& m_executor;
    SessionConfig m_config;
    TimeSource m_clock;
    std::shared_ptr<EventQueue<SessionEvent>> m_events;

    // Image
    std::filesystem::path m_current_path;
    std::shared_ptr<const SourceRaster> m_source;

    // View
    int m_slider{kSliderNeutral};
    float m_zoom{kNeutralZoom};
    PanOffset m_pan{};
    ResamplingAlgorithm m_algorithm;
    InteractionThrottle m_throttle;

    // Hand tool
    bool m_hand_tool{false};
    bool m_pointer_down{false};
    std::optional<PanOffset> m_pointer_anchor;

    // Render slots
    std::optional<RenderedBuffer> m_preview;
    std::optional<RenderedBuffer> m_final;
    uint64_t m_generation{0};
    uint64_t m_sequence{0};

    // Gallery
    ThumbnailCache m_thumbnails;
    std::unordered_set<std::filesystem::path, PathHash> m_thumbnails_pending;
    RecentList m_recents;
    std::vector<std::filesystem::path> m_collection;
    std::optional<std::size_t> m_index;

    std::string m_last_error;

    void dispatch_render(RenderTier tier);
    void dispatch_for(ThrottleDecision decision);
    bool apply(RenderCompleted&& event);
    bool apply(ThumbnailCompleted&& event);
    void sync_index();
    bool step(bool forward);
};

}  // namespace loupe
