/**
 * @file    viewport_mapper.hpp
 * @brief   Zoom / pan to source crop rectangle mapping
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * The viewer always renders at the source resolution: the visible window is
 * a crop of the source that gets scaled back up to full size. Zoom shrinks
 * the crop, pan moves it.
 *
 *   crop size   = (W / z, H / z), clamped to [1, W] x [1, H]
 *   crop origin = center - size / 2 - pan / z, clamped to the source
 *
 * Dragging content to the right moves the crop window to the left.
 */

#pragma once

#include <opencv2/core.hpp>

namespace loupe {

// Zoom factor domain
inline constexpr float kMinZoom = 0.5f;
inline constexpr float kMaxZoom = 3.0f;
inline constexpr float kNeutralZoom = 1.0f;

// Zoom slider: integer value divided by kSliderScale
inline constexpr int kSliderScale = 50;
inline constexpr int kSliderMin = 25;
inline constexpr int kSliderMax = 150;
inline constexpr int kSliderNeutral = 50;

/**
 * Pan offset in display pixels, accumulated across drag events
 */
struct PanOffset {
    float x{0.0f};
    float y{0.0f};

    PanOffset& operator+=(const PanOffset& other) noexcept {
        x += other.x;
        y += other.y;
        return *this;
    }

    constexpr bool operator==(const PanOffset&) const noexcept = default;
};

/**
 * Clamp a zoom factor into [kMinZoom, kMaxZoom]
 */
[[nodiscard]] float clamp_zoom(float zoom) noexcept;

/**
 * Map a slider position to a zoom factor (value / 50, clamped)
 */
[[nodiscard]] float zoom_from_slider(int slider_value) noexcept;

/**
 * Map a zoom factor back to the nearest slider position
 */
[[nodiscard]] int slider_from_zoom(float zoom) noexcept;

/**
 * Compute the source crop rectangle for a zoom / pan state
 *
 * The result always satisfies 0 <= x, 0 <= y, x + width <= source_width,
 * y + height <= source_height, width >= 1, height >= 1.
 *
 * @param source_width   Source width (> 0)
 * @param source_height  Source height (> 0)
 * @param zoom           Zoom factor (finite, > 0)
 * @param pan            Pan offset in display pixels (non-finite components count as 0)
 * @throws std::invalid_argument on an empty source or invalid zoom
 */
[[nodiscard]] cv::Rect compute_crop_rect(
    int source_width,
    int source_height,
    float zoom,
    const PanOffset& pan
);

[[nodiscard]] inline cv::Rect compute_crop_rect(cv::Size source, float zoom, const PanOffset& pan) {
    return compute_crop_rect(source.width, source.height, zoom, pan);
}

}  // namespace loupe
