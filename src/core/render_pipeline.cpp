/**
 * @file    render_pipeline.cpp
 * @brief   Zoom / pan / resample / encode pipeline
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/render_pipeline.hpp"
#include "core/resampler.hpp"
#include "io/image_codec.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace loupe {

cv::Mat render_raster(
    const SourceRaster& source,
    const RenderRequest& request,
    cv::Rect* crop)
{
    if (source.empty()) {
        throw std::invalid_argument("No image loaded");
    }

    const cv::Rect region = compute_crop_rect(source.size(), request.zoom, request.pan);
    if (crop) {
        *crop = region;
    }

    const ResamplingAlgorithm algorithm = effective_algorithm(request.algorithm, request.tier);

    // Scale the visible window back up to full resolution
    return resample(source.view(region), source.size(), algorithm);
}

RenderedBuffer render(
    const SourceRaster& source,
    const RenderRequest& request)
{
    const auto start = std::chrono::steady_clock::now();

    RenderedBuffer buffer;
    buffer.tier = request.tier;
    buffer.algorithm = effective_algorithm(request.algorithm, request.tier);

    const cv::Mat scaled = render_raster(source, request, &buffer.crop);
    buffer.size = scaled.size();

    const int compression = (request.tier == RenderTier::Preview)
        ? kPreviewPngCompression
        : kFinalPngCompression;
    buffer.bytes = encode_png(scaled, compression);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    spdlog::debug("Rendered {} pass: crop ({}, {}, {}x{}) -> {}x{} with {} in {} ms ({} bytes)",
                  to_string(buffer.tier),
                  buffer.crop.x, buffer.crop.y, buffer.crop.width, buffer.crop.height,
                  buffer.size.width, buffer.size.height,
                  to_string(buffer.algorithm), elapsed.count(), buffer.bytes.size());

    return buffer;
}

}  // namespace loupe
