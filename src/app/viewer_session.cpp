/**
 * @file    viewer_session.cpp
 * @brief   Interactive viewing session: state, dispatch and result apply
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "app/viewer_session.hpp"
#include "io/directory_tree.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace loupe {

ViewerSession::ViewerSession(
    std::shared_ptr<const IImageSource> images,
    ITaskExecutor& executor,
    SessionConfig config,
    TimeSource clock)
    : m_images(std::move(images))
    , m_executor(executor)
    , m_config(config)
    , m_clock(std::move(clock))
    , m_events(std::make_shared<EventQueue<SessionEvent>>())
    , m_algorithm(config.default_algorithm)
    , m_throttle(config.throttle)
    , m_thumbnails(config.thumbnail_capacity)
    , m_recents(config.recent_capacity)
{
    if (!m_images) {
        throw std::invalid_argument("ViewerSession requires an image source");
    }
    if (!m_clock) {
        m_clock = [] { return Clock::now(); };
    }
}

// =============================================================================
// Image
// =============================================================================

bool ViewerSession::load_image(const std::filesystem::path& path) {
    DecodeResult decoded = m_images->decode(path);
    if (!decoded.ok()) {
        m_last_error = fmt::format("{}: {}", filename_utf8(path), decoded.message);
        spdlog::error("Failed to load {}: {} ({})", path, decoded.message, to_string(decoded.code));
        return false;
    }

    spdlog::info("Loaded {} ({}x{})", path, decoded.raster.width(), decoded.raster.height());

    m_source = std::make_shared<const SourceRaster>(std::move(decoded.raster));
    m_current_path = path;
    m_recents.record(path);

    ++m_generation;
    m_throttle.reset();
    m_slider = kSliderNeutral;
    m_zoom = kNeutralZoom;
    m_pan = {};
    m_pointer_down = false;
    m_pointer_anchor.reset();
    m_preview.reset();
    m_final.reset();
    m_last_error.clear();

    sync_index();
    dispatch_render(RenderTier::Final);
    return true;
}

// =============================================================================
// Input
// =============================================================================

void ViewerSession::on_slider_moved(int value) {
    m_slider = std::clamp(value, kSliderMin, kSliderMax);
    m_zoom = zoom_from_slider(m_slider);

    if (!has_image()) {
        return;
    }
    dispatch_for(m_throttle.on_move(InputSource::Slider, m_clock()));
}

void ViewerSession::on_slider_released() {
    if (!has_image()) {
        return;
    }
    m_throttle.on_release(m_clock());
}

void ViewerSession::on_pointer_pressed(float /*x*/, float /*y*/) {
    if (!m_hand_tool || !has_image()) {
        return;
    }
    m_pointer_down = true;
    m_pointer_anchor.reset();   // Anchored by the first move
}

void ViewerSession::on_pointer_moved(float x, float y) {
    if (!m_hand_tool || !m_pointer_down) {
        return;
    }

    const PanOffset position{x, y};
    if (!m_pointer_anchor) {
        m_pointer_anchor = position;
        return;
    }

    m_pan += PanOffset{position.x - m_pointer_anchor->x, position.y - m_pointer_anchor->y};
    m_pointer_anchor = position;

    dispatch_for(m_throttle.on_move(InputSource::Pointer, m_clock()));
}

void ViewerSession::on_pointer_released() {
    if (!m_pointer_down) {
        return;
    }
    m_pointer_down = false;
    m_pointer_anchor.reset();
    m_throttle.on_release(m_clock());
}

void ViewerSession::set_hand_tool(bool enabled) {
    if (m_hand_tool == enabled) {
        return;
    }
    m_hand_tool = enabled;

    // Dropping the tool mid-drag behaves like a release
    if (!enabled && m_pointer_down) {
        on_pointer_released();
    }
}

void ViewerSession::set_algorithm(ResamplingAlgorithm algorithm) {
    if (m_algorithm == algorithm) {
        return;
    }

    m_algorithm = algorithm;
    ++m_generation;
    spdlog::debug("Algorithm -> {} (generation {})", to_string(algorithm), m_generation);

    if (has_image()) {
        dispatch_for(m_throttle.on_algorithm_changed());
    }
}

// =============================================================================
// Event loop
// =============================================================================

bool ViewerSession::pump() {
    bool changed = false;

    while (auto event = m_events->try_pop()) {
        changed |= std::visit([this](auto&& e) { return apply(std::move(e)); }, std::move(*event));
    }

    if (has_image()) {
        dispatch_for(m_throttle.poll(m_clock()));
    }
    return changed;
}

const RenderedBuffer* ViewerSession::displayed_buffer() const noexcept {
    const RenderedBuffer* preview = m_preview ? &*m_preview : nullptr;
    const RenderedBuffer* final_buffer = m_final ? &*m_final : nullptr;

    if (m_throttle.gesture_active()) {
        return preview ? preview : final_buffer;
    }

    // Keep the last preview up until the Final that supersedes it lands
    if (preview && (!final_buffer || preview->sequence > final_buffer->sequence)) {
        return preview;
    }
    return final_buffer;
}

RenderRequest ViewerSession::current_request(RenderTier tier) const noexcept {
    RenderRequest request;
    request.zoom = m_zoom;
    request.pan = m_pan;
    request.algorithm = m_algorithm;
    request.tier = tier;
    return request;
}

void ViewerSession::dispatch_for(ThrottleDecision decision) {
    switch (decision) {
        case ThrottleDecision::RenderPreview:
            dispatch_render(RenderTier::Preview);
            break;
        case ThrottleDecision::RenderFinal:
            dispatch_render(RenderTier::Final);
            break;
        case ThrottleDecision::None:
        default:
            break;
    }
}

void ViewerSession::dispatch_render(RenderTier tier) {
    if (!m_source) {
        return;
    }

    const uint64_t generation = m_generation;
    const uint64_t sequence = ++m_sequence;
    const RenderRequest request = current_request(tier);

    spdlog::trace("Dispatch {} render #{} (zoom {:.2f}, pan {:.1f},{:.1f})",
                  to_string(tier), sequence, request.zoom, request.pan.x, request.pan.y);

    m_executor.submit(
        [source = m_source, events = m_events, request, generation, sequence]() {
            RenderCompleted completed;
            completed.generation = generation;
            completed.sequence = sequence;
            completed.tier = request.tier;

            try {
                RenderedBuffer buffer = render(*source, request);
                buffer.generation = generation;
                buffer.sequence = sequence;
                completed.buffer = std::move(buffer);
            } catch (const std::exception& e) {
                completed.error = e.what();
            }

            events->push(std::move(completed));
        });
}

bool ViewerSession::apply(RenderCompleted&& event) {
    if (event.generation != m_generation) {
        spdlog::trace("Drop stale {} render #{} (generation {} != {})",
                      to_string(event.tier), event.sequence, event.generation, m_generation);
        return false;
    }

    if (!event.buffer) {
        m_last_error = event.error;
        spdlog::error("{} render #{} failed: {}", to_string(event.tier), event.sequence, event.error);
        return false;
    }

    std::optional<RenderedBuffer>& slot = event.tier == RenderTier::Preview ? m_preview : m_final;

    if (event.tier == RenderTier::Preview && !m_throttle.gesture_active()) {
        return false;
    }
    if (slot && slot->sequence >= event.sequence) {
        return false;
    }

    slot = std::move(event.buffer);
    return true;
}

bool ViewerSession::apply(ThumbnailCompleted&& event) {
    m_thumbnails_pending.erase(event.path);
    m_thumbnails.insert(event.path, std::move(event.thumbnail));
    return true;
}

// =============================================================================
// Collection / gallery
// =============================================================================

std::size_t ViewerSession::open_directory(const std::filesystem::path& directory) {
    m_collection = list_images(directory);
    sync_index();
    spdlog::info("Opened {} ({} images)", directory, m_collection.size());
    return m_collection.size();
}

std::size_t ViewerSession::show_recents() {
    // Newest first for browsing
    const auto& items = m_recents.items();
    m_collection.clear();
    for (auto it = items.rbegin(); it != items.rend(); ++it) {
        m_collection.push_back(it->path);
    }
    sync_index();
    return m_collection.size();
}

bool ViewerSession::next_image() {
    return step(true);
}

bool ViewerSession::previous_image() {
    return step(false);
}

bool ViewerSession::step(bool forward) {
    const std::size_t count = m_collection.size();
    if (count == 0) {
        return false;
    }

    std::size_t target;
    if (!m_index) {
        target = forward ? 0 : count - 1;
    } else if (forward) {
        target = (*m_index + 1) % count;
    } else {
        target = (*m_index + count - 1) % count;
    }

    // Move even if the load fails so a broken file can be stepped over
    m_index = target;
    return load_image(m_collection[target]);
}

void ViewerSession::sync_index() {
    auto it = std::find(m_collection.begin(), m_collection.end(), m_current_path);
    if (it != m_collection.end() && !m_current_path.empty()) {
        m_index = static_cast<std::size_t>(it - m_collection.begin());
    } else {
        m_index.reset();
    }
}

std::size_t ViewerSession::request_thumbnails() {
    std::size_t dispatched = 0;
    for (const auto& path : m_collection) {
        if (request_thumbnail(path)) {
            ++dispatched;
        }
    }

    if (dispatched > 0) {
        spdlog::debug("Queued {} thumbnail jobs", dispatched);
    }
    return dispatched;
}

bool ViewerSession::request_thumbnail(const std::filesystem::path& path) {
    if (m_thumbnails.contains(path) || m_thumbnails_pending.contains(path)) {
        return false;
    }
    m_thumbnails_pending.insert(path);

    m_executor.submit(
        [images = m_images, events = m_events, path, size = m_config.thumbnail_size]() {
            ThumbnailCompleted completed;
            completed.path = path;
            try {
                completed.thumbnail = make_thumbnail(path, *images, size);
            } catch (const std::exception& e) {
                spdlog::warn("Thumbnail for {} failed: {}", path, e.what());
                completed.thumbnail = make_placeholder(ThumbnailKind::DecodeFailed, size);
            }
            events->push(std::move(completed));
        });
    return true;
}

ThumbnailCache::Entry ViewerSession::thumbnail(const std::filesystem::path& path) {
    return m_thumbnails.find(path);
}

}  // namespace loupe
