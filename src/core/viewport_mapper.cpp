/**
 * @file    viewport_mapper.cpp
 * @brief   Zoom / pan to source crop rectangle mapping
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/viewport_mapper.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace loupe {

float clamp_zoom(float zoom) noexcept {
    if (!std::isfinite(zoom)) return kNeutralZoom;
    return std::clamp(zoom, kMinZoom, kMaxZoom);
}

float zoom_from_slider(int slider_value) noexcept {
    const int value = std::clamp(slider_value, kSliderMin, kSliderMax);
    return clamp_zoom(static_cast<float>(value) / static_cast<float>(kSliderScale));
}

int slider_from_zoom(float zoom) noexcept {
    const int value = static_cast<int>(std::lround(clamp_zoom(zoom) * kSliderScale));
    return std::clamp(value, kSliderMin, kSliderMax);
}

cv::Rect compute_crop_rect(
    int source_width,
    int source_height,
    float zoom,
    const PanOffset& pan)
{
    if (source_width <= 0 || source_height <= 0) {
        throw std::invalid_argument(
            fmt::format("Invalid source size {}x{}", source_width, source_height));
    }
    if (!std::isfinite(zoom) || zoom <= 0.0f) {
        throw std::invalid_argument(fmt::format("Invalid zoom factor {}", zoom));
    }

    const double w = source_width;
    const double h = source_height;
    const double z = zoom;

    // Logical window size, truncated to whole pixels; zoom < 1 clamps to source
    const int crop_w = std::clamp(static_cast<int>(std::max(1.0, w / z)), 1, source_width);
    const int crop_h = std::clamp(static_cast<int>(std::max(1.0, h / z)), 1, source_height);

    const double pan_x = std::isfinite(pan.x) ? pan.x : 0.0;
    const double pan_y = std::isfinite(pan.y) ? pan.y : 0.0;

    // Centered origin, shifted opposite to the drag direction
    const double origin_x = (w - crop_w) / 2.0 - pan_x / z;
    const double origin_y = (h - crop_h) / 2.0 - pan_y / z;

    const double max_x = w - crop_w;
    const double max_y = h - crop_h;

    const int x = static_cast<int>(std::floor(std::clamp(origin_x, 0.0, max_x)));
    const int y = static_cast<int>(std::floor(std::clamp(origin_y, 0.0, max_y)));

    return cv::Rect(x, y, crop_w, crop_h);
}

}  // namespace loupe
