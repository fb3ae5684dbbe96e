/**
 * @file    raster.hpp
 * @brief   Immutable 8-bit RGB source raster
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * SourceRaster wraps a continuous CV_8UC3 matrix in RGB channel order.
 * It only hands out const access, so copies share the same pixel storage
 * and can be passed to worker threads while the owner keeps going.
 * A new image replaces the raster wholesale.
 */

#pragma once

#include <opencv2/core.hpp>

#include <cstddef>
#include <utility>

namespace loupe {

class SourceRaster {
public:
    SourceRaster() = default;

    /**
     * Wrap an RGB image
     *
     * @param rgb  CV_8UC3 image in RGB order (always copied)
     * @throws std::invalid_argument if empty or not CV_8UC3
     */
    [[nodiscard]] static SourceRaster from_rgb(const cv::Mat& rgb);

    /**
     * Convert and wrap an OpenCV-native image
     *
     * Accepts 1, 3 or 4 channel 8-bit images in BGR(A) order, as produced
     * by cv::imread / cv::imdecode.
     *
     * @throws std::invalid_argument if empty or of an unsupported type
     */
    [[nodiscard]] static SourceRaster from_bgr(const cv::Mat& bgr);

    [[nodiscard]] int width() const noexcept { return m_pixels.cols; }
    [[nodiscard]] int height() const noexcept { return m_pixels.rows; }
    [[nodiscard]] cv::Size size() const noexcept { return m_pixels.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_pixels.empty(); }

    /**
     * Buffer length in bytes (always width * height * 3)
     */
    [[nodiscard]] std::size_t byte_size() const noexcept {
        return m_pixels.total() * m_pixels.elemSize();
    }

    /**
     * Read-only pixel access (RGB order)
     */
    [[nodiscard]] const cv::Mat& pixels() const noexcept { return m_pixels; }

    /**
     * Sub-region view sharing the raster storage
     */
    [[nodiscard]] cv::Mat view(const cv::Rect& region) const { return m_pixels(region); }

private:
    explicit SourceRaster(cv::Mat pixels) : m_pixels(std::move(pixels)) {}

    cv::Mat m_pixels;
};

}  // namespace loupe
