/**
 * @file    render_pipeline.hpp
 * @brief   Zoom / pan / resample / encode pipeline
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * render(source, request):
 *   1. compute the crop rectangle for (zoom, pan)
 *   2. take a view of that region of the source
 *   3. pick the algorithm: nearest neighbor for Preview, the selected one for Final
 *   4. resample the region back up to the full source size
 *   5. encode the result as PNG
 *
 * The pipeline is a pure function of its inputs; storing the result in the
 * Preview or Final slot is the caller's job.
 */

#pragma once

#include "core/raster.hpp"
#include "core/types.hpp"
#include "core/viewport_mapper.hpp"

#include <opencv2/core.hpp>

#include <cstdint>
#include <vector>

namespace loupe {

// PNG compression levels per tier (Preview favors speed)
inline constexpr int kPreviewPngCompression = 1;
inline constexpr int kFinalPngCompression = 3;

/**
 * Parameters of one render pass
 */
struct RenderRequest {
    float zoom{kNeutralZoom};
    PanOffset pan{};
    ResamplingAlgorithm algorithm{ResamplingAlgorithm::Lanczos3};
    RenderTier tier{RenderTier::Final};
};

/**
 * Encoded output of a render pass
 */
struct RenderedBuffer {
    std::vector<uint8_t> bytes;         // PNG
    RenderTier tier{RenderTier::Final};
    ResamplingAlgorithm algorithm{ResamplingAlgorithm::NearestNeighbor};  // Effective algorithm
    cv::Size size;                      // Output dimensions
    cv::Rect crop;                      // Source region that was scaled

    // Session bookkeeping (0 when rendered outside a session)
    uint64_t generation{0};
    uint64_t sequence{0};

    [[nodiscard]] bool empty() const noexcept { return bytes.empty(); }
};

/**
 * Algorithm actually used for a tier
 */
[[nodiscard]] constexpr ResamplingAlgorithm effective_algorithm(
    ResamplingAlgorithm selected, RenderTier tier) noexcept
{
    return tier == RenderTier::Preview ? ResamplingAlgorithm::NearestNeighbor : selected;
}

/**
 * Steps 1-4: crop and resample, without encoding
 *
 * @param source  Loaded, non-empty raster
 * @param request Zoom / pan / algorithm / tier
 * @param crop    Optional out parameter receiving the crop rectangle
 * @return        RGB image of the source's full size
 * @throws std::invalid_argument if the source is empty
 */
[[nodiscard]] cv::Mat render_raster(
    const SourceRaster& source,
    const RenderRequest& request,
    cv::Rect* crop = nullptr
);

/**
 * Full pipeline: crop, resample and encode
 *
 * @throws std::invalid_argument if the source is empty
 * @throws EncodeError if PNG encoding fails
 */
[[nodiscard]] RenderedBuffer render(
    const SourceRaster& source,
    const RenderRequest& request
);

}  // namespace loupe
