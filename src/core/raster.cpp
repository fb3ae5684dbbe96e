/**
 * @file    raster.cpp
 * @brief   Source raster construction
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/raster.hpp"

#include <opencv2/imgproc.hpp>

#include <stdexcept>

namespace loupe {

SourceRaster SourceRaster::from_rgb(const cv::Mat& rgb) {
    if (rgb.empty()) {
        throw std::invalid_argument("Empty image provided");
    }
    if (rgb.type() != CV_8UC3) {
        throw std::invalid_argument("Source raster must be 8-bit RGB");
    }

    // Own the pixels; the caller's Mat may be written after this returns
    return SourceRaster(rgb.clone());
}

SourceRaster SourceRaster::from_bgr(const cv::Mat& bgr) {
    if (bgr.empty()) {
        throw std::invalid_argument("Empty image provided");
    }
    if (bgr.depth() != CV_8U) {
        throw std::invalid_argument("Source raster must be 8 bits per channel");
    }

    cv::Mat rgb;
    switch (bgr.channels()) {
        case 1: cv::cvtColor(bgr, rgb, cv::COLOR_GRAY2RGB); break;
        case 3: cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);  break;
        case 4: cv::cvtColor(bgr, rgb, cv::COLOR_BGRA2RGB); break;
        default:
            throw std::invalid_argument("Unsupported channel count");
    }

    return SourceRaster(std::move(rgb));
}

}  // namespace loupe
