/**
 * @file    resampler.hpp
 * @brief   Algorithm-selectable 2D image resampling
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Nearest neighbor maps every destination pixel to the closest source
 * sample. The other algorithms are separable convolutions:
 *
 *   Triangle   support 1   (1 - |x|)
 *   Catrom     support 2   Mitchell-Netravali cubic, B = 0,   C = 1/2
 *   Mitchell   support 2   Mitchell-Netravali cubic, B = 1/3, C = 1/3
 *   Lanczos3   support 3   sinc(x) * sinc(x / 3)
 *
 * When shrinking, the kernel is stretched by the scale ratio so every
 * source pixel contributes (area-correct downsampling).
 */

#pragma once

#include "core/types.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace loupe {

/**
 * Per-destination-pixel filter taps along one axis
 */
struct AxisWeights {
    int first{0};                 // First contributing source index
    std::vector<float> weights;   // Normalized weights (sum == 1)
};

/**
 * Support radius (in source pixels at scale 1) of an algorithm's kernel
 */
[[nodiscard]] double filter_support(ResamplingAlgorithm algorithm) noexcept;

/**
 * Evaluate an algorithm's kernel at distance x
 */
[[nodiscard]] double filter_kernel(ResamplingAlgorithm algorithm, double x) noexcept;

/**
 * Precompute the taps mapping src_length samples onto dst_length samples
 *
 * Pixel centers are aligned: destination i samples source position
 * (i + 0.5) * src_length / dst_length.
 */
[[nodiscard]] std::vector<AxisWeights> compute_axis_weights(
    int src_length,
    int dst_length,
    ResamplingAlgorithm algorithm
);

/**
 * Resample an image to an exact target size
 *
 * @param src        8-bit image with 1-4 channels (ROI views allowed)
 * @param dst_size   Target size (both dimensions >= 1)
 * @param algorithm  Interpolation to use
 * @return           New image of dst_size with the source type
 * @throws std::invalid_argument on empty source, zero target or unsupported type
 */
[[nodiscard]] cv::Mat resample(
    const cv::Mat& src,
    cv::Size dst_size,
    ResamplingAlgorithm algorithm
);

}  // namespace loupe
